#pragma once

/// @file airport.hpp
/// @brief Airport reference record.

#include "geo/geometry.hpp"

#include <string>

namespace helioport::airport
{
    /// @brief Reference point and region of one airport.
    struct Airport
    {
        std::string code;           ///< IATA code, upper case ("ATL")
        std::string name;
        std::string city;
        std::string state;          ///< Full state name, key into the region table
        geo::Coordinate location;   ///< Airport reference point

        bool operator==(const Airport&) const = default;
    };

} // namespace helioport::airport
