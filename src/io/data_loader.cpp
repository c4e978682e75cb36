/// @file data_loader.cpp
/// @brief Implementation of the CSV input loaders.

#include "io/data_loader.hpp"

#include "airport/airport_registry.hpp"
#include "core/logger.hpp"

#include <cctype>
#include <charconv>
#include <cmath>
#include <fstream>
#include <sstream>
#include <string>
#include <utility>

namespace helioport::io
{

// -----------------------------------------------------------------
// Airports CSV: code,name,city,state,lat,lon
// -----------------------------------------------------------------

std::optional<std::vector<airport::Airport>>
DataLoader::load_airports_csv(const std::filesystem::path& path)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        HPT_CORE_ERROR("DataLoader: Failed to open file: {}", path.string());
        return std::nullopt;
    }

    std::vector<airport::Airport> airports;
    std::string line;

    // Skip header line
    if (!std::getline(file, line))
    {
        HPT_CORE_ERROR("DataLoader: File is empty: {}", path.string());
        return std::nullopt;
    }

    u32 line_number = 1;
    u32 skipped = 0;

    while (std::getline(file, line))
    {
        ++line_number;

        if (trim(line).empty())
        {
            continue;
        }

        std::istringstream stream(line);
        std::string code_str;
        std::string name_str;
        std::string city_str;
        std::string state_str;
        std::string lat_str;
        std::string lon_str;

        if (!std::getline(stream, code_str, ',') ||
            !std::getline(stream, name_str, ',') ||
            !std::getline(stream, city_str, ',') ||
            !std::getline(stream, state_str, ',') ||
            !std::getline(stream, lat_str, ',') ||
            !std::getline(stream, lon_str))
        {
            HPT_CORE_WARN("DataLoader: Malformed line {}: {}", line_number, line);
            ++skipped;
            continue;
        }

        const auto lat = parse_f64(trim(lat_str));
        const auto lon = parse_f64(trim(lon_str));
        const std::string code = airport::normalize_code(trim(code_str));

        if (code.empty() || !lat || !lon ||
            std::abs(*lat) > 90.0 || std::abs(*lon) > 180.0)
        {
            HPT_CORE_WARN("DataLoader: Failed to parse values on line {}: {}", line_number, line);
            ++skipped;
            continue;
        }

        airports.push_back(airport::Airport{
            .code     = code,
            .name     = std::string{trim(name_str)},
            .city     = std::string{trim(city_str)},
            .state    = std::string{trim(state_str)},
            .location = geo::Coordinate{.lat = *lat, .lon = *lon},
        });
    }

    if (airports.empty())
    {
        HPT_CORE_ERROR("DataLoader: No valid airports found in: {}", path.string());
        return std::nullopt;
    }

    if (skipped > 0)
    {
        HPT_CORE_WARN("DataLoader: Skipped {} malformed lines", skipped);
    }

    HPT_CORE_INFO("DataLoader: Loaded {} airports from {}", airports.size(), path.string());

    return airports;
}

// -----------------------------------------------------------------
// Footprints CSV: state,source,ring
// -----------------------------------------------------------------

std::optional<footprints::InMemoryFootprintProvider>
DataLoader::load_footprints_csv(const std::filesystem::path& path)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        HPT_CORE_ERROR("DataLoader: Failed to open file: {}", path.string());
        return std::nullopt;
    }

    footprints::InMemoryFootprintProvider provider;
    std::string line;

    // Skip header line
    if (!std::getline(file, line))
    {
        HPT_CORE_ERROR("DataLoader: File is empty: {}", path.string());
        return std::nullopt;
    }

    u32 line_number = 1;
    u32 skipped = 0;
    u32 loaded = 0;

    while (std::getline(file, line))
    {
        ++line_number;

        if (trim(line).empty())
        {
            continue;
        }

        std::istringstream stream(line);
        std::string state_str;
        std::string source_str;
        std::string ring_str;

        if (!std::getline(stream, state_str, ',') ||
            !std::getline(stream, source_str, ',') ||
            !std::getline(stream, ring_str))
        {
            HPT_CORE_WARN("DataLoader: Malformed line {}: {}", line_number, line);
            ++skipped;
            continue;
        }

        const std::string state{trim(state_str)};
        const std::string source = airport::normalize_code(trim(source_str));
        auto ring = parse_ring(ring_str);

        if (state.empty() || (source != "PRIMARY" && source != "SECONDARY") || !ring)
        {
            HPT_CORE_WARN("DataLoader: Failed to parse values on line {}: {}", line_number, line);
            ++skipped;
            continue;
        }

        provider.add(state, footprints::Footprint{
            .geometry = std::move(*ring),
            .source   = source == "PRIMARY" ? footprints::FootprintSource::Primary
                                            : footprints::FootprintSource::Secondary,
        });
        ++loaded;
    }

    if (loaded == 0)
    {
        HPT_CORE_ERROR("DataLoader: No valid footprints found in: {}", path.string());
        return std::nullopt;
    }

    if (skipped > 0)
    {
        HPT_CORE_WARN("DataLoader: Skipped {} malformed lines", skipped);
    }

    HPT_CORE_INFO("DataLoader: Loaded {} footprints from {}", loaded, path.string());

    return provider;
}

// -----------------------------------------------------------------
// Ring: "lat lon;lat lon;..."
// -----------------------------------------------------------------

std::optional<geo::Polygon> DataLoader::parse_ring(std::string_view text)
{
    geo::Polygon polygon;

    while (!text.empty())
    {
        const auto sep = text.find(';');
        const std::string_view pair = trim(text.substr(0, sep));
        text = sep == std::string_view::npos ? std::string_view{} : text.substr(sep + 1);

        // Tolerate a trailing separator
        if (pair.empty() && text.empty())
        {
            break;
        }

        const auto space = pair.find_first_of(" \t");
        if (space == std::string_view::npos)
        {
            return std::nullopt;
        }

        const auto lat = parse_f64(trim(pair.substr(0, space)));
        const auto lon = parse_f64(trim(pair.substr(space + 1)));
        if (!lat || !lon)
        {
            return std::nullopt;
        }
        polygon.ring.push_back(geo::Coordinate{.lat = *lat, .lon = *lon});
    }

    if (polygon.ring.empty())
    {
        return std::nullopt;
    }
    return polygon;
}

// -----------------------------------------------------------------
// Helpers
// -----------------------------------------------------------------

std::string_view DataLoader::trim(std::string_view sv)
{
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front())))
    {
        sv.remove_prefix(1);
    }
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back())))
    {
        sv.remove_suffix(1);
    }
    return sv;
}

std::optional<f64> DataLoader::parse_f64(std::string_view sv)
{
    if (sv.empty())
    {
        return std::nullopt;
    }

    f64 value = 0.0;
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);
    if (ec != std::errc{} || ptr != sv.data() + sv.size() || !std::isfinite(value))
    {
        return std::nullopt;
    }
    return value;
}

} // namespace helioport::io
