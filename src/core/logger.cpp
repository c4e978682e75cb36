/// @file logger.cpp
/// @brief Logger implementation: dual spdlog loggers with console + rotating file sinks.

#include "core/logger.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>
#include <vector>

namespace helioport::core
{

namespace
{

constexpr const char* kCoreLoggerName = "HELIOPORT";
constexpr const char* kAppLoggerName = "APP";
constexpr const char* kPattern = "[%T.%e] [%n] [%^%l%$] %v";

std::once_flag s_fallback_once;

} // anonymous namespace

// Installed by init() or the console fallback
std::shared_ptr<spdlog::logger> Logger::s_core_logger;
std::shared_ptr<spdlog::logger> Logger::s_app_logger;

void Logger::init(const std::filesystem::path& log_file, spdlog::level::level_enum level)
{
    // -----------------------------------------------------------------
    // Shared sinks: both loggers write to the same console and file
    // -----------------------------------------------------------------

    // Colored stdout
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_pattern(kPattern);

    // Log file rotates at 5 MB, keeping 3 files
    constexpr std::size_t kMaxFileSize = 5 * 1024 * 1024; // 5 MB
    constexpr std::size_t kMaxFiles = 3;
    auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        log_file.string(), kMaxFileSize, kMaxFiles);
    file_sink->set_pattern(kPattern);

    spdlog::drop(kCoreLoggerName);
    spdlog::drop(kAppLoggerName);

    // -----------------------------------------------------------------
    // Core logger ("HELIOPORT"): engine internals
    // -----------------------------------------------------------------
    std::vector<spdlog::sink_ptr> core_sinks{console_sink, file_sink};
    s_core_logger = std::make_shared<spdlog::logger>(kCoreLoggerName, core_sinks.begin(), core_sinks.end());
    s_core_logger->set_level(level);
    s_core_logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(s_core_logger);

    // -----------------------------------------------------------------
    // App logger ("APP"): command-line tool
    // -----------------------------------------------------------------
    std::vector<spdlog::sink_ptr> app_sinks{console_sink, file_sink};
    s_app_logger = std::make_shared<spdlog::logger>(kAppLoggerName, app_sinks.begin(), app_sinks.end());
    s_app_logger->set_level(level);
    s_app_logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(s_app_logger);
}

void Logger::shutdown()
{
    s_core_logger.reset();
    s_app_logger.reset();
    spdlog::drop_all();
    spdlog::shutdown();
}

void Logger::set_level(spdlog::level::level_enum level)
{
    get_core_logger()->set_level(level);
    get_app_logger()->set_level(level);
}

std::shared_ptr<spdlog::logger>& Logger::get_core_logger()
{
    std::call_once(s_fallback_once, &Logger::init_console_fallback);
    return s_core_logger;
}

std::shared_ptr<spdlog::logger>& Logger::get_app_logger()
{
    std::call_once(s_fallback_once, &Logger::init_console_fallback);
    return s_app_logger;
}

// -----------------------------------------------------------------
// Console-only loggers for library use without init()
// Runs at most once; leaves loggers installed by init() untouched.
// Not registered with spdlog so a later init() can claim the names.
// -----------------------------------------------------------------

void Logger::init_console_fallback()
{
    if (s_core_logger && s_app_logger)
    {
        return;
    }

    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_pattern(kPattern);

    if (!s_core_logger)
    {
        s_core_logger = std::make_shared<spdlog::logger>(kCoreLoggerName, console_sink);
        s_core_logger->set_level(spdlog::level::warn);
    }
    if (!s_app_logger)
    {
        s_app_logger = std::make_shared<spdlog::logger>(kAppLoggerName, console_sink);
        s_app_logger->set_level(spdlog::level::warn);
    }
}

} // namespace helioport::core
