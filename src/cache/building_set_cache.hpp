#pragma once

/// @file building_set_cache.hpp
/// @brief Memoized merged and size-filtered building sets per airport footprint query.

#include "cache/single_flight_cache.hpp"
#include "core/types.hpp"
#include "footprints/building.hpp"
#include "footprints/footprint_merger.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace helioport::cache
{
    /// @brief The query fields that shape the building set. Financial and
    /// panel parameters only affect estimates and are not part of the key.
    struct BuildingSetKey
    {
        std::string airport_code;           ///< Registry code (upper case)
        f64 radius_km = 0.0;
        f64 min_building_area_m2 = 0.0;

        bool operator==(const BuildingSetKey&) const = default;
    };

    /// @brief Deduplicated buildings within the radius, at or above the minimum size.
    struct BuildingSet
    {
        std::vector<footprints::BuildingRecord> buildings;     ///< Merge order
        footprints::MergeStats merge_stats;
        std::size_t below_min_size = 0;

        bool operator==(const BuildingSet&) const = default;
    };

    struct BuildingSetKeyHash
    {
        [[nodiscard]] std::size_t operator()(const BuildingSetKey& key) const noexcept;
    };

    /// @brief Canonical-bit equality, consistent with BuildingSetKeyHash.
    struct BuildingSetKeyEqual
    {
        [[nodiscard]] bool operator()(const BuildingSetKey& a, const BuildingSetKey& b) const noexcept;
    };

    using BuildingSetCache = SingleFlightCache<BuildingSetKey, BuildingSet,
                                               BuildingSetKeyHash, BuildingSetKeyEqual>;

} // namespace helioport::cache
