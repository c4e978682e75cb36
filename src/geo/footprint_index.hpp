#pragma once
// geo/footprint_index.hpp - Uniform lat/lon grid over polygon bounding boxes
//
// Each polygon is registered in every cell its bounding box touches.
// Queries return the indices of polygons whose boxes intersect the query box,
// in ascending insertion order so callers see a deterministic candidate list.

#include "geo/geometry.hpp"

#include <cmath>
#include <cstddef>
#include <unordered_map>
#include <utility>
#include <vector>

namespace helioport::geo {

// -----------------------------------------------------------------------
// FootprintIndex
// -----------------------------------------------------------------------
class FootprintIndex {
public:
    // Resolution of the spatial grid (degrees per cell, ~1.1 km of latitude)
    static constexpr double kDefaultCellSizeDeg = 0.01;
    // Boxes wider than this many cells on either axis skip the grid
    static constexpr int kMaxCellsPerAxis = 64;

    explicit FootprintIndex(double cell_size_deg = kDefaultCellSizeDeg);

    /// Register a polygon's bounding box; returns its index.
    std::size_t insert(const BoundingBox& box);

    /// Indices of registered boxes intersecting @p box, ascending, no duplicates.
    std::vector<std::size_t> query(const BoundingBox& box) const;

    /// Number of registered boxes.
    std::size_t size() const { return m_boxes.size(); }

    double cellSizeDeg() const { return m_cell_size_deg; }

private:
    double m_cell_size_deg;
    std::vector<BoundingBox> m_boxes;

    // Spatial grid: key = (lat_cell, lon_cell) packed into 64 bits
    using CellKey = uint64_t;
    std::unordered_map<CellKey, std::vector<std::size_t>> m_grid;

    // Oversized boxes, scanned linearly on every query
    std::vector<std::size_t> m_oversized;

    static CellKey cellKey(int lat_cell, int lon_cell) {
        return (static_cast<uint64_t>(static_cast<uint32_t>(lat_cell)) << 32) |
               static_cast<uint64_t>(static_cast<uint32_t>(lon_cell));
    }

    std::pair<int,int> cellFor(double lat, double lon) const {
        int lat_c = static_cast<int>(std::floor(lat / m_cell_size_deg));
        int lon_c = static_cast<int>(std::floor(lon / m_cell_size_deg));
        return {lat_c, lon_c};
    }
};

} // namespace helioport::geo
