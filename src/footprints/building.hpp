#pragma once

/// @file building.hpp
/// @brief Source footprints and the building records derived from them.

#include "core/types.hpp"
#include "geo/geometry.hpp"

#include <string_view>

namespace helioport::footprints
{
    /// @brief Provenance of a footprint. PRIMARY wins duplicate ties.
    enum class FootprintSource
    {
        Primary,    ///< e.g. ML-derived footprints
        Secondary,  ///< e.g. community-mapped footprints
    };

    inline std::string_view footprint_source_name(FootprintSource source)
    {
        switch (source)
        {
            case FootprintSource::Primary:   return "primary";
            case FootprintSource::Secondary: return "secondary";
            default:                         return "unknown";
        }
    }

    /// @brief Raw footprint as supplied by an upstream source.
    struct Footprint
    {
        geo::Polygon geometry;
        FootprintSource source = FootprintSource::Primary;
    };

    /// @brief One rooftop candidate resolved for an airport query.
    ///
    /// Every derived field is computed from @c geometry during the merge;
    /// upstream area metadata is never trusted. Immutable once built.
    struct BuildingRecord
    {
        u32 id = 0;                 ///< Position in merge output, stable per query
        geo::Polygon geometry;
        f64 area_m2 = 0.0;          ///< Equal-area projected roof area
        geo::Coordinate centroid;
        f64 distance_km = 0.0;      ///< Centroid to airport reference point
        FootprintSource source = FootprintSource::Primary;

        bool operator==(const BuildingRecord&) const = default;
    };

} // namespace helioport::footprints
