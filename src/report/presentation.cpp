/// @file presentation.cpp
/// @brief Display rounding and list shaping.

#include "report/presentation.hpp"

#include <algorithm>
#include <cmath>
#include <unordered_set>

namespace helioport::report
{

f64 round_to(f64 value, int decimals)
{
    if (!std::isfinite(value))
    {
        return value;
    }
    const f64 scale = std::pow(10.0, decimals);
    return std::round(value * scale) / scale;
}

solar::SolarEstimate present(const solar::SolarEstimate& estimate)
{
    solar::SolarEstimate out = estimate;

    out.roof_area_m2 = round_to(estimate.roof_area_m2, 1);
    out.usable_area_m2 = round_to(estimate.usable_area_m2, 1);
    out.capacity_kw = round_to(estimate.capacity_kw, 1);
    out.annual_kwh = round_to(estimate.annual_kwh, 0);
    out.lifetime_mwh = round_to(estimate.lifetime_mwh, 0);
    for (f64& mwh : out.yearly_generation_mwh)
    {
        mwh = round_to(mwh, 1);
    }

    out.gross_cost_usd = round_to(estimate.gross_cost_usd, 0);
    out.itc_savings_usd = round_to(estimate.itc_savings_usd, 0);
    out.install_cost_usd = round_to(estimate.install_cost_usd, 0);
    out.annual_revenue_usd = round_to(estimate.annual_revenue_usd, 0);
    out.annual_om_usd = round_to(estimate.annual_om_usd, 0);
    out.npv_25yr_usd = round_to(estimate.npv_25yr_usd, 0);
    out.payback_years = round_to(estimate.payback_years, 1);

    out.co2_avoided_tons_yr = round_to(estimate.co2_avoided_tons_yr, 1);
    out.co2_avoided_lifetime_tons = round_to(estimate.co2_avoided_lifetime_tons, 0);
    out.homes_powered = round_to(estimate.homes_powered, 0);

    return out;
}

f64 present_capacity_mw(const solar::SolarEstimate& estimate)
{
    return round_to(estimate.capacity_mw(), 3);
}

f64 present_annual_mwh(const solar::SolarEstimate& estimate)
{
    return round_to(estimate.annual_mwh(), 1);
}

void sort_by_area_desc(std::vector<airport::EstimatedBuilding>& buildings)
{
    std::stable_sort(buildings.begin(), buildings.end(),
                     [](const airport::EstimatedBuilding& a, const airport::EstimatedBuilding& b) {
                         return a.building.area_m2 > b.building.area_m2;
                     });
}

std::optional<std::size_t> listing_limit(f64 requested, std::size_t max_count)
{
    if (!std::isfinite(requested) || requested < 0.0)
    {
        return std::nullopt;
    }
    // Compare in floating point first: the cast is only defined below the cap
    if (requested >= static_cast<f64>(max_count))
    {
        return max_count;
    }
    return static_cast<std::size_t>(requested);
}

void limit(std::vector<airport::EstimatedBuilding>& buildings, std::size_t max_count)
{
    if (buildings.size() > max_count)
    {
        buildings.resize(max_count);
    }
}

std::vector<airport::EstimatedBuilding> exclude(std::span<const airport::EstimatedBuilding> buildings,
                                                std::span<const u32> hidden_ids)
{
    const std::unordered_set<u32> hidden(hidden_ids.begin(), hidden_ids.end());

    std::vector<airport::EstimatedBuilding> kept;
    kept.reserve(buildings.size());
    for (const airport::EstimatedBuilding& entry : buildings)
    {
        if (hidden.count(entry.building.id) == 0)
        {
            kept.push_back(entry);
        }
    }
    return kept;
}

} // namespace helioport::report
