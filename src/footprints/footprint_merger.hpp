#pragma once

/// @file footprint_merger.hpp
/// @brief Combines two footprint sources into one deduplicated building list.

#include "core/types.hpp"
#include "footprints/building.hpp"
#include "geo/geometry.hpp"

#include <cstddef>
#include <span>
#include <vector>

namespace helioport::footprints
{
    /// @brief Counters describing what the merge kept and dropped.
    struct MergeStats
    {
        std::size_t primary_in = 0;
        std::size_t secondary_in = 0;
        std::size_t out_of_radius = 0;     ///< Centroid farther than the radius
        std::size_t invalid = 0;           ///< Zero-area, degenerate or self-intersecting
        std::size_t duplicates = 0;        ///< Secondary footprints matched to a primary one
        std::size_t primary_kept = 0;
        std::size_t secondary_kept = 0;

        bool operator==(const MergeStats&) const = default;
    };

    struct MergeResult
    {
        std::vector<BuildingRecord> buildings;  ///< Primary (input order), then secondary
        MergeStats stats;
    };

    /// @brief Spatial filter + overlap-based deduplication of two sources.
    ///
    /// 1. Keep footprints whose centroid lies within the radius.
    /// 2. Drop invalid footprints before indexing.
    /// 3. Grid-index the primary survivors.
    /// 4. Discard a secondary footprint when any primary candidate covers
    ///    at least kDuplicateOverlapRatio of the smaller polygon.
    /// An empty source is not an error; the merge runs with the other one.
    class FootprintMerger
    {
    public:
        FootprintMerger() = delete;

        /// Overlap at or above which two footprints are the same building
        static constexpr f64 kDuplicateOverlapRatio = 0.90;

        [[nodiscard]] static MergeResult merge(std::span<const Footprint> primary,
                                               std::span<const Footprint> secondary,
                                               const geo::Coordinate& center,
                                               f64 radius_km);

    private:
        /// @brief Radius + validity filter; appends survivors with derived fields.
        static void collect(std::span<const Footprint> source,
                            FootprintSource tag,
                            const geo::Coordinate& center,
                            f64 radius_km,
                            std::vector<BuildingRecord>& out,
                            MergeStats& stats);
    };

} // namespace helioport::footprints
