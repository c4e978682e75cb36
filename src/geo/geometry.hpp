#pragma once

/// @file geometry.hpp
/// @brief Geodetic points, footprint polygons and projection-aware measurements.

#include "core/types.hpp"

#include <vector>

namespace helioport::geo
{
    /// @brief WGS84 position in degrees.
    struct Coordinate
    {
        f64 lat = 0.0;  ///< Latitude (degrees, north positive)
        f64 lon = 0.0;  ///< Longitude (degrees, east positive)

        bool operator==(const Coordinate&) const = default;
    };

    /// @brief Simple polygon as a closed ring (first == last). No holes.
    struct Polygon
    {
        std::vector<Coordinate> ring;

        bool operator==(const Polygon&) const = default;
    };

    /// @brief Axis-aligned lat/lon box.
    struct BoundingBox
    {
        f64 min_lat = 0.0;
        f64 min_lon = 0.0;
        f64 max_lat = 0.0;
        f64 max_lon = 0.0;

        [[nodiscard]] bool intersects(const BoundingBox& other) const
        {
            return min_lat <= other.max_lat && other.min_lat <= max_lat &&
                   min_lon <= other.max_lon && other.min_lon <= max_lon;
        }
    };

    /// @brief Static utility class for footprint measurements.
    ///
    /// Areas are computed in a local equirectangular plane centred on the
    /// polygon (scale cos(mean latitude) on longitude), which is accurate to
    /// well under 0.1% at building scale. Malformed input never throws:
    /// degenerate rings measure zero.
    class Geometry
    {
    public:
        Geometry() = delete;

        /// @brief Planar roof area in square metres (>= 0).
        /// Returns 0 for rings with fewer than 3 distinct vertices.
        [[nodiscard]] static f64 area_m2(const Polygon& polygon);

        /// @brief Arithmetic mean of the ring vertices (closing vertex excluded).
        [[nodiscard]] static Coordinate centroid(const Polygon& polygon);

        /// @brief Great-circle distance on a 6371 km sphere.
        [[nodiscard]] static f64 haversine_km(const Coordinate& a, const Coordinate& b);

        /// @brief Intersection area over the smaller polygon's area, in [0, 1].
        ///
        /// Both rings are projected into one shared plane. Returns 0 when
        /// either polygon has zero area or the intersection cannot be computed.
        [[nodiscard]] static f64 overlap_ratio(const Polygon& a, const Polygon& b);

        /// @brief True for rings with >= 3 distinct vertices, non-zero area
        /// and no self-intersection.
        [[nodiscard]] static bool is_valid_footprint(const Polygon& polygon);

        /// @brief Lat/lon extent of the ring. Zero box for an empty ring.
        [[nodiscard]] static BoundingBox bounding_box(const Polygon& polygon);

        /// @brief Copy of the polygon with the closing vertex appended if missing.
        [[nodiscard]] static Polygon close_ring(Polygon polygon);

    private:
        /// @brief Number of distinct vertices (closing vertex not double counted).
        [[nodiscard]] static std::size_t distinct_vertex_count(const Polygon& polygon);

        /// @brief Equirectangular projection about an origin, in metres.
        /// x = R·Δlon·cos(lat_ref), y = R·Δlat.
        [[nodiscard]] static std::vector<Vec2d> project(const Polygon& polygon,
                                                        const Coordinate& origin,
                                                        f64 cos_lat_ref);

        /// @brief Shoelace area of a projected ring (absolute value).
        [[nodiscard]] static f64 shoelace(const std::vector<Vec2d>& ring);
    };

} // namespace helioport::geo
