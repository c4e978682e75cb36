#pragma once

/// @file airport_registry.hpp
/// @brief Immutable code → airport mapping.

#include "airport/airport.hpp"

#include <cstddef>
#include <string_view>
#include <vector>

namespace helioport::airport
{
    /// @brief Ordered set of airports, looked up by IATA code.
    ///
    /// Registration order is preserved for listing. A later add() with a code
    /// already present replaces the earlier record in place.
    class AirportRegistry
    {
    public:
        AirportRegistry() = default;
        explicit AirportRegistry(std::vector<Airport> airports);

        void add(Airport airport);

        /// @brief Airport by code (case-insensitive), or nullptr if unknown.
        [[nodiscard]] const Airport* find(std::string_view code) const;

        [[nodiscard]] const std::vector<Airport>& airports() const { return m_airports; }
        [[nodiscard]] std::size_t size() const { return m_airports.size(); }
        [[nodiscard]] bool empty() const { return m_airports.empty(); }

        /// @brief The 30 busiest US airports by passenger traffic.
        [[nodiscard]] static const AirportRegistry& builtin();

    private:
        std::vector<Airport> m_airports;
    };

    /// @brief Upper-cased copy of an airport code.
    [[nodiscard]] std::string normalize_code(std::string_view code);

} // namespace helioport::airport
