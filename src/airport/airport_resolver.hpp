#pragma once

/// @file airport_resolver.hpp
/// @brief Airport query → deduplicated buildings with solar estimates and totals.

#include "airport/airport.hpp"
#include "airport/airport_query.hpp"
#include "airport/airport_registry.hpp"
#include "cache/building_set_cache.hpp"
#include "footprints/building.hpp"
#include "footprints/footprint_merger.hpp"
#include "footprints/footprint_provider.hpp"
#include "solar/region_table.hpp"
#include "solar/solar_estimator.hpp"

#include <cstddef>
#include <span>
#include <vector>

namespace helioport::airport
{
    /// @brief A resolved building and its solar metrics.
    struct EstimatedBuilding
    {
        footprints::BuildingRecord building;
        solar::SolarEstimate solar;

        bool operator==(const EstimatedBuilding&) const = default;
    };

    /// @brief Complete answer to an AirportQuery.
    struct AirportResult
    {
        Airport airport;
        AirportQuery query;
        std::vector<EstimatedBuilding> buildings;   ///< Merge order, no implicit sort
        solar::SolarTotals totals;
        footprints::MergeStats merge_stats;
        std::size_t below_min_size = 0;             ///< Dropped by the size filter

        bool operator==(const AirportResult&) const = default;
    };

    /// @brief Totals over any subset of estimated buildings.
    [[nodiscard]] solar::SolarTotals totals_of(std::span<const EstimatedBuilding> buildings,
                                               const solar::SolarParams& params);

    /// @brief Pipeline: merge → size filter → estimate → aggregate.
    ///
    /// Holds references to its immutable collaborators, which must outlive it.
    /// The merged, size-filtered building set is memoized per
    /// (airport, radius, min size), so queries that change only panel or
    /// financial parameters skip the merge and re-run the estimates alone.
    /// resolve() is safe to call from several threads at once.
    class AirportResolver
    {
    public:
        static constexpr std::size_t kDefaultBuildingSetCapacity = 64;

        AirportResolver(const AirportRegistry& airports,
                        const solar::RegionTable& regions,
                        const footprints::FootprintProvider& footprints,
                        std::size_t building_set_capacity = kDefaultBuildingSetCapacity);

        // The building-set cache calls back into this instance
        AirportResolver(const AirportResolver&) = delete;
        AirportResolver& operator=(const AirportResolver&) = delete;

        /// @brief Resolve one query.
        /// @throws UnknownAirportError if the code is not registered.
        /// @throws DataUnavailableError if neither footprint source covers the state.
        [[nodiscard]] AirportResult resolve(const AirportQuery& query) const;

        [[nodiscard]] cache::CacheStats building_set_stats() const { return m_building_sets.stats(); }

    private:
        /// @brief Merge both sources around the airport and apply the size filter.
        [[nodiscard]] cache::BuildingSet build_set(const cache::BuildingSetKey& key) const;

        const AirportRegistry& m_airports;
        const solar::RegionTable& m_regions;
        const footprints::FootprintProvider& m_footprints;
        mutable cache::BuildingSetCache m_building_sets;
    };

} // namespace helioport::airport
