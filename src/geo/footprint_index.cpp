// geo/footprint_index.cpp
#include "footprint_index.hpp"

#include <algorithm>

namespace helioport::geo {

FootprintIndex::FootprintIndex(double cell_size_deg)
    : m_cell_size_deg(cell_size_deg > 0.0 ? cell_size_deg : kDefaultCellSizeDeg) {}

// -----------------------------------------------------------------------
// insert
// -----------------------------------------------------------------------
std::size_t FootprintIndex::insert(const BoundingBox& box) {
    std::size_t idx = m_boxes.size();
    m_boxes.push_back(box);

    auto [lat_lo, lon_lo] = cellFor(box.min_lat, box.min_lon);
    auto [lat_hi, lon_hi] = cellFor(box.max_lat, box.max_lon);

    if (lat_hi - lat_lo >= kMaxCellsPerAxis || lon_hi - lon_lo >= kMaxCellsPerAxis) {
        m_oversized.push_back(idx);
        return idx;
    }

    for (int lat_c = lat_lo; lat_c <= lat_hi; ++lat_c) {
        for (int lon_c = lon_lo; lon_c <= lon_hi; ++lon_c) {
            m_grid[cellKey(lat_c, lon_c)].push_back(idx);
        }
    }
    return idx;
}

// -----------------------------------------------------------------------
// query
// -----------------------------------------------------------------------
std::vector<std::size_t> FootprintIndex::query(const BoundingBox& box) const {
    std::vector<std::size_t> result;

    auto [lat_lo, lon_lo] = cellFor(box.min_lat, box.min_lon);
    auto [lat_hi, lon_hi] = cellFor(box.max_lat, box.max_lon);

    if (lat_hi - lat_lo >= kMaxCellsPerAxis || lon_hi - lon_lo >= kMaxCellsPerAxis) {
        // Oversized query: a linear scan beats walking the cells
        for (std::size_t idx = 0; idx < m_boxes.size(); ++idx) {
            if (m_boxes[idx].intersects(box)) {
                result.push_back(idx);
            }
        }
        return result;
    }

    for (std::size_t idx : m_oversized) {
        if (m_boxes[idx].intersects(box)) {
            result.push_back(idx);
        }
    }

    for (int lat_c = lat_lo; lat_c <= lat_hi; ++lat_c) {
        for (int lon_c = lon_lo; lon_c <= lon_hi; ++lon_c) {
            auto it = m_grid.find(cellKey(lat_c, lon_c));
            if (it == m_grid.end()) continue;

            for (std::size_t idx : it->second) {
                if (m_boxes[idx].intersects(box)) {
                    result.push_back(idx);
                }
            }
        }
    }

    // A box spanning several cells is listed once per cell
    std::sort(result.begin(), result.end());
    result.erase(std::unique(result.begin(), result.end()), result.end());
    return result;
}

} // namespace helioport::geo
