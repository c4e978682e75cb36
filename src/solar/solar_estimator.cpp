/// @file solar_estimator.cpp
/// @brief Rooftop PV generation, economics and emissions model.

#include "solar/solar_estimator.hpp"

#include <algorithm>
#include <cmath>

namespace helioport::solar
{

namespace
{

f64 finite_or_zero(f64 value)
{
    return std::isfinite(value) ? value : 0.0;
}

SolarEstimate zero_estimate(f64 capacity_factor, f64 co2_rate_kg_per_kwh)
{
    SolarEstimate estimate;
    estimate.capacity_factor = finite_or_zero(capacity_factor);
    estimate.co2_rate_kg_per_kwh = finite_or_zero(co2_rate_kg_per_kwh);
    estimate.yearly_generation_mwh.assign(solar_constants::kLifetimeYears, 0.0);
    return estimate;
}

// Replace any non-finite metric produced by pathological inputs
void sanitize(SolarEstimate& e)
{
    for (f64* field : {&e.usable_area_m2, &e.capacity_kw, &e.annual_kwh, &e.lifetime_mwh,
                       &e.gross_cost_usd, &e.itc_savings_usd, &e.install_cost_usd,
                       &e.annual_revenue_usd, &e.annual_om_usd, &e.npv_25yr_usd,
                       &e.co2_avoided_tons_yr, &e.co2_avoided_lifetime_tons, &e.homes_powered})
    {
        *field = finite_or_zero(*field);
    }
    for (f64& mwh : e.yearly_generation_mwh)
    {
        mwh = finite_or_zero(mwh);
    }
    if (!std::isfinite(e.payback_years))
    {
        e.payback_years = solar_constants::kNoPaybackYears;
    }
}

} // anonymous namespace

// -----------------------------------------------------------------
// Single-roof estimate
// -----------------------------------------------------------------

SolarEstimate SolarEstimator::estimate(f64 area_m2,
                                       f64 capacity_factor,
                                       f64 co2_rate_kg_per_kwh,
                                       const SolarParams& params)
{
    // Negated comparisons also catch NaN
    if (!(area_m2 > 0.0) || !(capacity_factor > 0.0))
    {
        return zero_estimate(capacity_factor, co2_rate_kg_per_kwh);
    }

    SolarEstimate e;
    e.roof_area_m2 = area_m2;
    e.capacity_factor = capacity_factor;
    e.co2_rate_kg_per_kwh = co2_rate_kg_per_kwh;

    // --- Generation ---
    e.usable_area_m2 = area_m2 * params.usable_fraction;
    e.capacity_kw = e.usable_area_m2 * params.panel_efficiency_w_m2 / 1000.0;
    e.annual_kwh = e.capacity_kw * solar_constants::kHoursPerYear * capacity_factor;

    // --- Costs ---
    e.gross_cost_usd = e.capacity_kw * 1000.0 * solar_constants::kCostPerWattUsd;
    e.itc_savings_usd = params.include_itc ? e.gross_cost_usd * solar_constants::kItcRate : 0.0;
    e.install_cost_usd = e.gross_cost_usd - e.itc_savings_usd;
    e.annual_om_usd = e.capacity_kw * solar_constants::kOmUsdPerKwYear;
    e.annual_revenue_usd = e.annual_kwh * params.electricity_price_usd_kwh;

    // --- Lifetime cash flow ---
    CashFlowProjection flow = project(e.annual_kwh, e.install_cost_usd, e.annual_om_usd,
                                      params.electricity_price_usd_kwh);
    e.payback_years = flow.simple_payback_years;
    e.cumulative_payback_year = flow.cumulative_payback_year;
    e.npv_25yr_usd = flow.npv_usd;
    e.lifetime_mwh = flow.lifetime_kwh / 1000.0;
    e.yearly_generation_mwh.reserve(flow.yearly_kwh.size());
    for (f64 kwh : flow.yearly_kwh)
    {
        e.yearly_generation_mwh.push_back(kwh / 1000.0);
    }

    // --- Environment ---
    e.co2_avoided_tons_yr = e.annual_kwh * co2_rate_kg_per_kwh / 1000.0;
    e.co2_avoided_lifetime_tons = flow.lifetime_kwh * co2_rate_kg_per_kwh / 1000.0;
    e.homes_powered = e.annual_kwh / solar_constants::kHomeAnnualKwh;

    sanitize(e);
    return e;
}

// -----------------------------------------------------------------
// Cash flow over the lifetime with linear-compounded degradation:
//   kWh(n)  = kWh(1) × (1 − d)^(n−1)
//   CF(n)   = kWh(n) × price − O&M
//   NPV     = −cost + Σ CF(n) / (1 + r)^n
// -----------------------------------------------------------------

CashFlowProjection SolarEstimator::project(f64 annual_kwh_yr1,
                                           f64 install_cost_usd,
                                           f64 annual_om_usd,
                                           f64 price_usd_kwh)
{
    CashFlowProjection flow;
    flow.simple_payback_years =
        simple_payback(install_cost_usd, annual_kwh_yr1 * price_usd_kwh - annual_om_usd);
    flow.npv_usd = -install_cost_usd;
    flow.yearly_kwh.reserve(solar_constants::kLifetimeYears);

    f64 cumulative_cash = -install_cost_usd;
    for (i32 year = 1; year <= solar_constants::kLifetimeYears; ++year)
    {
        const f64 year_kwh =
            annual_kwh_yr1 * std::pow(1.0 - solar_constants::kDegradationPerYear, year - 1);
        const f64 year_cash = year_kwh * price_usd_kwh - annual_om_usd;

        flow.npv_usd += year_cash / std::pow(1.0 + solar_constants::kDiscountRate, year);
        flow.lifetime_kwh += year_kwh;
        flow.yearly_kwh.push_back(year_kwh);

        cumulative_cash += year_cash;
        if (flow.cumulative_payback_year == 0 && cumulative_cash >= 0.0)
        {
            flow.cumulative_payback_year = year;
        }
    }
    return flow;
}

f64 SolarEstimator::simple_payback(f64 install_cost_usd, f64 net_annual_usd)
{
    if (!(net_annual_usd > 0.0))
    {
        return solar_constants::kNoPaybackYears;
    }
    const f64 years = install_cost_usd / net_annual_usd;
    if (!std::isfinite(years) || years > solar_constants::kNoPaybackYears)
    {
        return solar_constants::kNoPaybackYears;
    }
    return years;
}

// -----------------------------------------------------------------
// Totals fold
// -----------------------------------------------------------------

namespace detail
{

void TotalsSum::add(const SolarEstimate& estimate)
{
    ++count;
    roof_area_m2 += estimate.roof_area_m2;
    usable_area_m2 += estimate.usable_area_m2;
    capacity_kw += estimate.capacity_kw;
    annual_kwh += estimate.annual_kwh;
    gross_cost_usd += estimate.gross_cost_usd;
    itc_savings_usd += estimate.itc_savings_usd;
    install_cost_usd += estimate.install_cost_usd;
    annual_revenue_usd += estimate.annual_revenue_usd;
    annual_om_usd += estimate.annual_om_usd;
    co2_avoided_tons_yr += estimate.co2_avoided_tons_yr;
    co2_avoided_lifetime_tons += estimate.co2_avoided_lifetime_tons;
}

SolarTotals TotalsSum::finish(const SolarParams& params) const
{
    SolarTotals totals;
    totals.building_count = count;
    totals.roof_area_m2 = roof_area_m2;
    totals.usable_area_m2 = usable_area_m2;
    totals.capacity_kw = capacity_kw;
    totals.annual_kwh = annual_kwh;
    totals.gross_cost_usd = gross_cost_usd;
    totals.itc_savings_usd = itc_savings_usd;
    totals.install_cost_usd = install_cost_usd;
    totals.annual_revenue_usd = annual_revenue_usd;
    totals.annual_om_usd = annual_om_usd;
    totals.co2_avoided_tons_yr = co2_avoided_tons_yr;
    totals.co2_avoided_lifetime_tons = co2_avoided_lifetime_tons;
    totals.homes_powered = annual_kwh / solar_constants::kHomeAnnualKwh;

    // Effective inputs of the combined system
    if (capacity_kw > 0.0)
    {
        totals.capacity_factor = annual_kwh / (capacity_kw * solar_constants::kHoursPerYear);
    }
    if (annual_kwh > 0.0)
    {
        totals.co2_rate_kg_per_kwh = co2_avoided_tons_yr * 1000.0 / annual_kwh;
    }

    // Non-additive metrics come from the summed cash flows
    const CashFlowProjection flow = SolarEstimator::project(
        annual_kwh, install_cost_usd, annual_om_usd, params.electricity_price_usd_kwh);
    totals.payback_years = flow.simple_payback_years;
    totals.cumulative_payback_year = flow.cumulative_payback_year;
    totals.npv_25yr_usd = count > 0 ? flow.npv_usd : 0.0;
    totals.lifetime_mwh = flow.lifetime_kwh / 1000.0;
    totals.yearly_generation_mwh.reserve(flow.yearly_kwh.size());
    for (f64 kwh : flow.yearly_kwh)
    {
        totals.yearly_generation_mwh.push_back(kwh / 1000.0);
    }

    return totals;
}

} // namespace detail

} // namespace helioport::solar
