/// @file geometry.cpp
/// @brief Footprint area, centroid, distance and overlap computations.

#include "geo/geometry.hpp"

#include "core/logger.hpp"

#include <boost/geometry.hpp>
#include <boost/geometry/geometries/multi_polygon.hpp>
#include <boost/geometry/geometries/point_xy.hpp>
#include <boost/geometry/geometries/polygon.hpp>

#include <algorithm>
#include <cmath>

namespace helioport::geo
{

namespace
{

namespace bg = boost::geometry;

using PlanePoint = bg::model::d2::point_xy<f64>;
using PlanePolygon = bg::model::polygon<PlanePoint>;
using PlaneMultiPolygon = bg::model::multi_polygon<PlanePolygon>;

PlanePolygon to_plane_polygon(const std::vector<Vec2d>& ring)
{
    PlanePolygon polygon;
    polygon.outer().reserve(ring.size() + 1);
    for (const Vec2d& p : ring)
    {
        polygon.outer().emplace_back(p.x, p.y);
    }
    // Fix orientation and closure to what Boost.Geometry expects
    bg::correct(polygon);
    return polygon;
}

bool has_closing_vertex(const std::vector<Coordinate>& ring)
{
    return ring.size() > 1 && ring.front() == ring.back();
}

} // anonymous namespace

// -----------------------------------------------------------------
// Area: equirectangular projection at the ring's mean latitude, then
// shoelace:  A = ½ |Σ (x_i · y_{i+1} − x_{i+1} · y_i)|
// -----------------------------------------------------------------

f64 Geometry::area_m2(const Polygon& polygon)
{
    if (distinct_vertex_count(polygon) < 3)
    {
        return 0.0;
    }

    const Coordinate origin = centroid(polygon);
    const f64 cos_lat_ref = std::cos(origin.lat * geo_constants::kDegToRad);
    const f64 area = shoelace(project(polygon, origin, cos_lat_ref));

    return std::isfinite(area) ? area : 0.0;
}

Coordinate Geometry::centroid(const Polygon& polygon)
{
    const auto& ring = polygon.ring;
    std::size_t count = ring.size();
    if (has_closing_vertex(ring))
    {
        --count;
    }
    if (count == 0)
    {
        return Coordinate{};
    }

    f64 sum_lat = 0.0;
    f64 sum_lon = 0.0;
    for (std::size_t i = 0; i < count; ++i)
    {
        sum_lat += ring[i].lat;
        sum_lon += ring[i].lon;
    }

    const auto n = static_cast<f64>(count);
    return Coordinate{
        .lat = sum_lat / n,
        .lon = sum_lon / n,
    };
}

// -----------------------------------------------------------------
// Haversine:
//   h = sin²(Δφ/2) + cos φ1 · cos φ2 · sin²(Δλ/2)
//   d = 2R · asin(√h)
// -----------------------------------------------------------------

f64 Geometry::haversine_km(const Coordinate& a, const Coordinate& b)
{
    const f64 lat1 = a.lat * geo_constants::kDegToRad;
    const f64 lat2 = b.lat * geo_constants::kDegToRad;
    const f64 dlat = (b.lat - a.lat) * geo_constants::kDegToRad;
    const f64 dlon = (b.lon - a.lon) * geo_constants::kDegToRad;

    const f64 sin_dlat = std::sin(dlat * 0.5);
    const f64 sin_dlon = std::sin(dlon * 0.5);
    const f64 h = sin_dlat * sin_dlat + std::cos(lat1) * std::cos(lat2) * sin_dlon * sin_dlon;

    return 2.0 * geo_constants::kEarthRadiusKm * std::asin(std::sqrt(std::clamp(h, 0.0, 1.0)));
}

// -----------------------------------------------------------------
// Overlap ratio: |A ∩ B| / min(|A|, |B|) in a plane shared by both rings
// -----------------------------------------------------------------

f64 Geometry::overlap_ratio(const Polygon& a, const Polygon& b)
{
    if (distinct_vertex_count(a) < 3 || distinct_vertex_count(b) < 3)
    {
        return 0.0;
    }

    const Coordinate ca = centroid(a);
    const Coordinate cb = centroid(b);
    const Coordinate origin{
        .lat = 0.5 * (ca.lat + cb.lat),
        .lon = 0.5 * (ca.lon + cb.lon),
    };
    const f64 cos_lat_ref = std::cos(origin.lat * geo_constants::kDegToRad);

    const PlanePolygon pa = to_plane_polygon(project(a, origin, cos_lat_ref));
    const PlanePolygon pb = to_plane_polygon(project(b, origin, cos_lat_ref));

    const f64 smaller = std::min(bg::area(pa), bg::area(pb));
    if (!(smaller > 0.0))
    {
        return 0.0;
    }

    PlaneMultiPolygon intersection;
    try
    {
        bg::intersection(pa, pb, intersection);
    }
    catch (const bg::exception& e)
    {
        // Invalid input rings are treated as non-overlapping
        HPT_CORE_DEBUG("Geometry: intersection failed ({}), treating as no overlap", e.what());
        return 0.0;
    }

    const f64 ratio = bg::area(intersection) / smaller;
    if (!std::isfinite(ratio))
    {
        return 0.0;
    }
    return std::clamp(ratio, 0.0, 1.0);
}

bool Geometry::is_valid_footprint(const Polygon& polygon)
{
    if (distinct_vertex_count(polygon) < 3)
    {
        return false;
    }

    const Coordinate origin = centroid(polygon);
    const f64 cos_lat_ref = std::cos(origin.lat * geo_constants::kDegToRad);
    const std::vector<Vec2d> projected = project(polygon, origin, cos_lat_ref);

    if (!(shoelace(projected) > 0.0))
    {
        return false;
    }

    // Rejects self-intersections; duplicate consecutive vertices are tolerated
    return bg::is_valid(to_plane_polygon(projected));
}

BoundingBox Geometry::bounding_box(const Polygon& polygon)
{
    if (polygon.ring.empty())
    {
        return BoundingBox{};
    }

    BoundingBox box{
        .min_lat = polygon.ring.front().lat,
        .min_lon = polygon.ring.front().lon,
        .max_lat = polygon.ring.front().lat,
        .max_lon = polygon.ring.front().lon,
    };
    for (const Coordinate& c : polygon.ring)
    {
        box.min_lat = std::min(box.min_lat, c.lat);
        box.min_lon = std::min(box.min_lon, c.lon);
        box.max_lat = std::max(box.max_lat, c.lat);
        box.max_lon = std::max(box.max_lon, c.lon);
    }
    return box;
}

Polygon Geometry::close_ring(Polygon polygon)
{
    if (!polygon.ring.empty() && !has_closing_vertex(polygon.ring))
    {
        polygon.ring.push_back(polygon.ring.front());
    }
    return polygon;
}

// -----------------------------------------------------------------
// Private helpers
// -----------------------------------------------------------------

std::size_t Geometry::distinct_vertex_count(const Polygon& polygon)
{
    // Non-finite vertices make the whole ring degenerate
    for (const Coordinate& c : polygon.ring)
    {
        if (!std::isfinite(c.lat) || !std::isfinite(c.lon))
        {
            return 0;
        }
    }

    std::vector<Coordinate> vertices = polygon.ring;
    std::sort(vertices.begin(), vertices.end(), [](const Coordinate& lhs, const Coordinate& rhs) {
        return lhs.lat < rhs.lat || (lhs.lat == rhs.lat && lhs.lon < rhs.lon);
    });
    const auto last = std::unique(vertices.begin(), vertices.end());
    return static_cast<std::size_t>(std::distance(vertices.begin(), last));
}

std::vector<Vec2d> Geometry::project(const Polygon& polygon, const Coordinate& origin, f64 cos_lat_ref)
{
    constexpr f64 kMetresPerRad = geo_constants::kEarthRadiusM;

    std::vector<Vec2d> projected;
    projected.reserve(polygon.ring.size());
    for (const Coordinate& c : polygon.ring)
    {
        projected.emplace_back(
            kMetresPerRad * (c.lon - origin.lon) * geo_constants::kDegToRad * cos_lat_ref,
            kMetresPerRad * (c.lat - origin.lat) * geo_constants::kDegToRad);
    }
    return projected;
}

f64 Geometry::shoelace(const std::vector<Vec2d>& ring)
{
    if (ring.size() < 3)
    {
        return 0.0;
    }

    f64 twice_area = 0.0;
    for (std::size_t i = 0; i < ring.size(); ++i)
    {
        const Vec2d& p = ring[i];
        const Vec2d& q = ring[(i + 1) % ring.size()];
        twice_area += p.x * q.y - q.x * p.y;
    }
    return std::abs(twice_area) * 0.5;
}

} // namespace helioport::geo
