/// @file config.cpp
/// @brief EngineConfig environment parsing.

#include "core/config.hpp"

#include "core/logger.hpp"

#include <charconv>
#include <cstdlib>
#include <optional>
#include <string_view>

namespace helioport::core
{

namespace
{

std::optional<std::string_view> env_value(const char* name)
{
    const char* raw = std::getenv(name);
    if (raw == nullptr || *raw == '\0')
    {
        return std::nullopt;
    }
    return std::string_view{raw};
}

void apply_size(const char* name, std::size_t& target)
{
    const auto value = env_value(name);
    if (!value.has_value())
    {
        return;
    }

    std::size_t parsed = 0;
    const auto [ptr, ec] = std::from_chars(value->data(), value->data() + value->size(), parsed);
    if (ec != std::errc{} || ptr != value->data() + value->size() || parsed == 0)
    {
        HPT_CORE_WARN("Config: ignoring {}='{}' (expected a positive integer)", name, *value);
        return;
    }
    target = parsed;
}

} // anonymous namespace

EngineConfig EngineConfig::from_environment()
{
    EngineConfig config;

    apply_size("HELIOPORT_CACHE_CAPACITY", config.cache_capacity);
    apply_size("HELIOPORT_MAX_BUILDINGS", config.max_buildings);

    if (const auto level = env_value("HELIOPORT_LOG_LEVEL"))
    {
        const auto parsed = spdlog::level::from_str(std::string{*level});
        // from_str maps unknown names to "off"
        if (parsed == spdlog::level::off && *level != "off")
        {
            HPT_CORE_WARN("Config: ignoring HELIOPORT_LOG_LEVEL='{}'", *level);
        }
        else
        {
            config.log_level = parsed;
        }
    }

    if (const auto log_file = env_value("HELIOPORT_LOG_FILE"))
    {
        config.log_file = std::filesystem::path{std::string{*log_file}};
    }

    if (const auto data_dir = env_value("HELIOPORT_DATA_DIR"))
    {
        config.data_dir = std::filesystem::path{std::string{*data_dir}};
    }

    return config;
}

} // namespace helioport::core
