/// @file airport_resolver.cpp
/// @brief Airport resolution pipeline.

#include "airport/airport_resolver.hpp"

#include "core/errors.hpp"
#include "core/logger.hpp"

#include <memory>
#include <utility>

namespace helioport::airport
{

solar::SolarTotals totals_of(std::span<const EstimatedBuilding> buildings,
                             const solar::SolarParams& params)
{
    return solar::fold_totals(buildings,
                              [](const EstimatedBuilding& b) -> const solar::SolarEstimate& { return b.solar; },
                              params);
}

AirportResolver::AirportResolver(const AirportRegistry& airports,
                                 const solar::RegionTable& regions,
                                 const footprints::FootprintProvider& footprints,
                                 std::size_t building_set_capacity)
    : m_airports{airports}
    , m_regions{regions}
    , m_footprints{footprints}
    , m_building_sets{[this](const cache::BuildingSetKey& key) { return build_set(key); },
                      building_set_capacity, "BuildingSetCache"}
{
}

AirportResult AirportResolver::resolve(const AirportQuery& query) const
{
    // -----------------------------------------------------------------
    // Lookup
    // -----------------------------------------------------------------
    const Airport* airport = m_airports.find(query.airport_code);
    if (airport == nullptr)
    {
        throw UnknownAirportError(query.airport_code);
    }

    AirportResult result;
    result.airport = *airport;
    result.query = query;

    // -----------------------------------------------------------------
    // Filtering + merging + size filter (memoized)
    // -----------------------------------------------------------------
    const auto set = m_building_sets.get_or_compute_shared(cache::BuildingSetKey{
        .airport_code = airport->code,
        .radius_km = query.radius_km,
        .min_building_area_m2 = query.min_building_area_m2,
    });
    result.merge_stats = set->merge_stats;
    result.below_min_size = set->below_min_size;

    // -----------------------------------------------------------------
    // Estimating
    // -----------------------------------------------------------------
    const solar::RegionFactors region = m_regions.lookup(airport->state);
    const solar::SolarParams params = query.solar_params();

    HPT_CORE_DEBUG("Resolver[{}]: estimating {} buildings (CF {:.3f}, CO2 {:.3f} kg/kWh)",
                   airport->code, set->buildings.size(), region.capacity_factor,
                   region.co2_rate_kg_per_kwh);

    result.buildings.reserve(set->buildings.size());
    for (const footprints::BuildingRecord& building : set->buildings)
    {
        solar::SolarEstimate estimate = solar::SolarEstimator::estimate(
            building.area_m2, region.capacity_factor, region.co2_rate_kg_per_kwh, params);
        result.buildings.push_back(EstimatedBuilding{building, std::move(estimate)});
    }

    // -----------------------------------------------------------------
    // Aggregating
    // -----------------------------------------------------------------
    result.totals = totals_of(result.buildings, params);

    HPT_CORE_INFO("Resolver[{}]: {} buildings ({} below {:.0f} m2), {:.1f} MWh/yr",
                  airport->code, result.buildings.size(), result.below_min_size,
                  query.min_building_area_m2, result.totals.annual_mwh());

    return result;
}

cache::BuildingSet AirportResolver::build_set(const cache::BuildingSetKey& key) const
{
    const Airport* airport = m_airports.find(key.airport_code);
    if (airport == nullptr)
    {
        throw UnknownAirportError(key.airport_code);
    }

    HPT_CORE_DEBUG("Resolver[{}]: filtering footprints for {} within {:.1f} km",
                   airport->code, airport->state, key.radius_km);

    const auto primary = m_footprints.footprints(airport->state, footprints::FootprintSource::Primary);
    const auto secondary = m_footprints.footprints(airport->state, footprints::FootprintSource::Secondary);
    if (!primary && !secondary)
    {
        throw DataUnavailableError(airport->code, airport->state, ResolveStage::Filtering);
    }
    if (!primary || !secondary)
    {
        HPT_CORE_WARN("Resolver[{}]: {} source unavailable for {}, continuing with one source",
                      airport->code, primary ? "secondary" : "primary", airport->state);
    }

    const footprints::FootprintSet empty;
    footprints::MergeResult merged = footprints::FootprintMerger::merge(
        primary ? *primary : empty,
        secondary ? *secondary : empty,
        airport->location,
        key.radius_km);

    cache::BuildingSet set;
    set.merge_stats = merged.stats;
    set.buildings.reserve(merged.buildings.size());
    for (footprints::BuildingRecord& building : merged.buildings)
    {
        if (building.area_m2 < key.min_building_area_m2)
        {
            ++set.below_min_size;
            continue;
        }
        set.buildings.push_back(std::move(building));
    }
    return set;
}

} // namespace helioport::airport
