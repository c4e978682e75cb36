#pragma once
// tests/test_helpers.hpp - shared footprint builders for unit tests

#include "footprints/building.hpp"
#include "geo/geometry.hpp"

#include <initializer_list>
#include <utility>

namespace test {

// Hartsfield-Jackson reference point
inline constexpr helioport::geo::Coordinate kAtl{33.6407, -84.4277};

/// Closed axis-aligned rectangle with its south-west corner offset from @p origin.
inline helioport::geo::Polygon rect(const helioport::geo::Coordinate& origin,
                                    double dlat_off, double dlon_off,
                                    double height_deg, double width_deg) {
    const double lat = origin.lat + dlat_off;
    const double lon = origin.lon + dlon_off;
    return helioport::geo::Polygon{{
        {lat, lon},
        {lat, lon + width_deg},
        {lat + height_deg, lon + width_deg},
        {lat + height_deg, lon},
        {lat, lon},
    }};
}

inline helioport::footprints::Footprint footprint(helioport::geo::Polygon polygon,
                                                  helioport::footprints::FootprintSource source) {
    return helioport::footprints::Footprint{std::move(polygon), source};
}

/// Self-intersecting "bowtie" ring with non-zero shoelace area.
inline helioport::geo::Polygon bowtie(const helioport::geo::Coordinate& origin) {
    const double lat = origin.lat;
    const double lon = origin.lon;
    return helioport::geo::Polygon{{
        {lat, lon},
        {lat + 0.002, lon + 0.002},
        {lat + 0.002, lon},
        {lat + 0.001, lon + 0.003},
        {lat, lon},
    }};
}

} // namespace test
