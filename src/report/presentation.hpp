#pragma once

/// @file presentation.hpp
/// @brief Output-boundary helpers: rounding, ordering, capping and hiding.
///
/// None of these run inside the resolver; engine values stay full precision.

#include "airport/airport_resolver.hpp"
#include "core/types.hpp"
#include "solar/solar_estimator.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <vector>

namespace helioport::report
{
    constexpr std::size_t kDefaultMaxBuildings = 5000;

    /// @brief Round half away from zero to @p decimals places.
    [[nodiscard]] f64 round_to(f64 value, int decimals);

    /// @brief Copy with every metric rounded to its display precision:
    ///   areas, capacity kW, annual MWh, payback, annual CO2 → 1 decimal
    ///   kWh, money, lifetime MWh, lifetime CO2, homes      → 0 decimals
    ///   yearly MWh series                                   → 1 decimal
    [[nodiscard]] solar::SolarEstimate present(const solar::SolarEstimate& estimate);

    /// @brief Capacity in MW at display precision (3 decimals).
    [[nodiscard]] f64 present_capacity_mw(const solar::SolarEstimate& estimate);

    /// @brief Annual output in MWh at display precision (1 decimal).
    [[nodiscard]] f64 present_annual_mwh(const solar::SolarEstimate& estimate);

    /// @brief Largest roof first; ties keep merge order.
    void sort_by_area_desc(std::vector<airport::EstimatedBuilding>& buildings);

    /// @brief Number of buildings to list for a user-supplied count.
    /// @return @p requested truncated and capped at @p max_count, or
    ///         std::nullopt when it is negative or not finite.
    [[nodiscard]] std::optional<std::size_t> listing_limit(f64 requested,
                                                           std::size_t max_count = kDefaultMaxBuildings);

    /// @brief Keep at most @p max_count leading buildings.
    void limit(std::vector<airport::EstimatedBuilding>& buildings,
               std::size_t max_count = kDefaultMaxBuildings);

    /// @brief Buildings whose id is not in @p hidden_ids, order preserved.
    /// Recompute totals on the subset with airport::totals_of().
    [[nodiscard]] std::vector<airport::EstimatedBuilding> exclude(
        std::span<const airport::EstimatedBuilding> buildings,
        std::span<const u32> hidden_ids);

} // namespace helioport::report
