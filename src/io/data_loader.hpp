#pragma once

/// @file data_loader.hpp
/// @brief Loads airports and building footprints from the common CSV formats.

#include "airport/airport.hpp"
#include "core/types.hpp"
#include "footprints/footprint_provider.hpp"
#include "geo/geometry.hpp"

#include <filesystem>
#include <optional>
#include <string_view>
#include <vector>

namespace helioport::io
{
    /// @brief Static utility class for reading on-disk engine inputs.
    class DataLoader
    {
    public:
        DataLoader() = delete;

        /// @brief Load airports from a CSV file.
        ///
        /// Expected CSV columns (header row required):
        ///   code, name, city, state, lat, lon
        ///
        /// Codes are upper-cased. Rows with a missing column, an unparsable
        /// or out-of-range coordinate are skipped with a warning.
        ///
        /// @param path Path to the CSV file.
        /// @return Airports in file order, std::nullopt if the file cannot be
        ///         read or yields no airport.
        [[nodiscard]] static std::optional<std::vector<airport::Airport>>
            load_airports_csv(const std::filesystem::path& path);

        /// @brief Load footprints from a CSV file into a provider.
        ///
        /// Expected CSV columns (header row required):
        ///   state, source, ring
        ///
        /// source is "primary" or "secondary" (case-insensitive); ring is
        /// "lat lon;lat lon;...". Open rings are kept as-is, the merger closes
        /// them. Geometry validity is not checked here.
        ///
        /// @param path Path to the CSV file.
        /// @return Provider holding every parsed footprint, std::nullopt if the
        ///         file cannot be read or yields no footprint.
        [[nodiscard]] static std::optional<footprints::InMemoryFootprintProvider>
            load_footprints_csv(const std::filesystem::path& path);

        /// @brief Parse a "lat lon;lat lon;..." ring.
        /// @return The vertices, or std::nullopt if any pair is malformed.
        [[nodiscard]] static std::optional<geo::Polygon> parse_ring(std::string_view text);

    private:
        /// @brief Trim leading and trailing whitespace from a string_view.
        [[nodiscard]] static std::string_view trim(std::string_view sv);

        /// @brief Parse a single f64 value from a trimmed string_view.
        /// @return The parsed value, or std::nullopt on failure.
        [[nodiscard]] static std::optional<f64> parse_f64(std::string_view sv);
    };

} // namespace helioport::io
