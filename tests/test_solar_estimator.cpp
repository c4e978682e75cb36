/// @file test_solar_estimator.cpp
/// @brief Unit tests for helioport::solar::SolarEstimator and fold_totals.
///
/// Verifies the reference 10,000 m² scenario, degenerate inputs, ITC toggle,
/// monotonicity and the non-additive re-derivation of aggregate payback/NPV.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "solar/solar_estimator.hpp"
#include "solar/solar_params.hpp"

#include <cmath>
#include <vector>

using namespace helioport;
using namespace helioport::solar;

static constexpr f64 kCapacityFactor = 0.158;
static constexpr f64 kCo2Rate = 0.386;

// =================================================================
// Reference scenario
// =================================================================

TEST_CASE("10,000 m2 roof with default parameters")
{
    const SolarEstimate e = SolarEstimator::estimate(10000.0, kCapacityFactor, kCo2Rate, SolarParams{});

    CHECK(e.roof_area_m2 == 10000.0);
    CHECK(e.usable_area_m2 == doctest::Approx(6500.0));
    CHECK(e.capacity_kw == doctest::Approx(1300.0));
    CHECK(e.capacity_mw() == doctest::Approx(1.3));
    CHECK(e.annual_kwh == doctest::Approx(1300.0 * 8760.0 * 0.158));
    CHECK(e.annual_kwh == doctest::Approx(1799640.0).epsilon(1e-3));
    CHECK(e.gross_cost_usd == doctest::Approx(1820000.0));
    CHECK(e.itc_savings_usd == doctest::Approx(546000.0));
    CHECK(e.install_cost_usd == doctest::Approx(1274000.0));
    CHECK(e.annual_revenue_usd == doctest::Approx(215957.0).epsilon(1e-3));
    CHECK(e.annual_om_usd == doctest::Approx(19500.0));
    CHECK(e.payback_years == doctest::Approx(6.5).epsilon(0.01));
    CHECK(e.cumulative_payback_year == 7);
    CHECK(e.homes_powered == doctest::Approx(e.annual_kwh / 10500.0));
    CHECK(e.co2_avoided_tons_yr == doctest::Approx(e.annual_kwh * kCo2Rate / 1000.0));
    CHECK(e.capacity_factor == kCapacityFactor);
    CHECK(e.co2_rate_kg_per_kwh == kCo2Rate);
}

TEST_CASE("Lifetime series applies 0.5% yearly degradation and discounting")
{
    const SolarParams params;
    const SolarEstimate e = SolarEstimator::estimate(10000.0, kCapacityFactor, kCo2Rate, params);

    REQUIRE(e.yearly_generation_mwh.size() == 25);
    CHECK(e.yearly_generation_mwh.front() == doctest::Approx(e.annual_kwh / 1000.0));
    CHECK(e.yearly_generation_mwh.back() ==
          doctest::Approx(e.annual_kwh * std::pow(0.995, 24) / 1000.0));

    f64 lifetime_kwh = 0.0;
    f64 npv = -e.install_cost_usd;
    for (int n = 1; n <= 25; ++n)
    {
        const f64 kwh = e.annual_kwh * std::pow(0.995, n - 1);
        lifetime_kwh += kwh;
        npv += (kwh * params.electricity_price_usd_kwh - e.annual_om_usd) / std::pow(1.06, n);
    }

    CHECK(e.lifetime_mwh == doctest::Approx(lifetime_kwh / 1000.0));
    CHECK(e.npv_25yr_usd == doctest::Approx(npv));
    CHECK(e.npv_25yr_usd > 0.0);
    CHECK(e.co2_avoided_lifetime_tons == doctest::Approx(lifetime_kwh * kCo2Rate / 1000.0));
}

// =================================================================
// Degenerate inputs
// =================================================================

TEST_CASE("Zero area yields zero metrics and the no-payback sentinel")
{
    const SolarEstimate e = SolarEstimator::estimate(0.0, kCapacityFactor, kCo2Rate, SolarParams{});

    CHECK(e.capacity_kw == 0.0);
    CHECK(e.annual_kwh == 0.0);
    CHECK(e.install_cost_usd == 0.0);
    CHECK(e.annual_revenue_usd == 0.0);
    CHECK(e.npv_25yr_usd == 0.0);
    CHECK(e.co2_avoided_tons_yr == 0.0);
    CHECK(e.homes_powered == 0.0);
    CHECK(e.payback_years == solar_constants::kNoPaybackYears);
    CHECK(e.cumulative_payback_year == 0);
    CHECK(e.yearly_generation_mwh.size() == 25);
}

TEST_CASE("Negative area, zero capacity factor and NaN never throw")
{
    CHECK(SolarEstimator::estimate(-50.0, kCapacityFactor, kCo2Rate, SolarParams{}).annual_kwh == 0.0);
    CHECK(SolarEstimator::estimate(1000.0, 0.0, kCo2Rate, SolarParams{}).payback_years == 999.0);
    CHECK(SolarEstimator::estimate(std::nan(""), kCapacityFactor, kCo2Rate, SolarParams{}).capacity_kw == 0.0);
}

TEST_CASE("Unprofitable systems report no payback")
{
    SolarParams params;
    params.electricity_price_usd_kwh = 0.001;   // revenue below O&M

    const SolarEstimate e = SolarEstimator::estimate(5000.0, kCapacityFactor, kCo2Rate, params);

    CHECK(e.payback_years == 999.0);
    CHECK(e.cumulative_payback_year == 0);
    CHECK(e.npv_25yr_usd < 0.0);
}

TEST_CASE("simple_payback caps at the sentinel")
{
    CHECK(SolarEstimator::simple_payback(1000.0, 100.0) == doctest::Approx(10.0));
    CHECK(SolarEstimator::simple_payback(1000.0, 0.0) == 999.0);
    CHECK(SolarEstimator::simple_payback(1000.0, -5.0) == 999.0);
    CHECK(SolarEstimator::simple_payback(1e12, 1.0) == 999.0);
}

// =================================================================
// Parameters
// =================================================================

TEST_CASE("Disabling the ITC charges the gross cost")
{
    SolarParams params;
    params.include_itc = false;

    const SolarEstimate with_itc = SolarEstimator::estimate(10000.0, kCapacityFactor, kCo2Rate, SolarParams{});
    const SolarEstimate without = SolarEstimator::estimate(10000.0, kCapacityFactor, kCo2Rate, params);

    CHECK(without.itc_savings_usd == 0.0);
    CHECK(without.install_cost_usd == doctest::Approx(without.gross_cost_usd));
    CHECK(without.payback_years > with_itc.payback_years);
    CHECK(without.payback_years == doctest::Approx(1820000.0 / (with_itc.annual_revenue_usd - 19500.0)));
    CHECK(without.npv_25yr_usd < with_itc.npv_25yr_usd);
    CHECK(without.annual_kwh == with_itc.annual_kwh);
}

TEST_CASE("Capacity, output and revenue grow with the usable fraction")
{
    SolarEstimate previous;
    for (f64 fraction = 0.30; fraction <= 0.80 + 1e-9; fraction += 0.05)
    {
        SolarParams params;
        params.usable_fraction = fraction;
        const SolarEstimate e = SolarEstimator::estimate(8000.0, kCapacityFactor, kCo2Rate, params);

        CHECK(e.capacity_kw > previous.capacity_kw);
        CHECK(e.annual_mwh() > previous.annual_mwh());
        CHECK(e.annual_revenue_usd > previous.annual_revenue_usd);
        previous = e;
    }
}

TEST_CASE("Metrics are non-negative across the parameter ranges")
{
    for (f64 area : {100.0, 500.0, 2500.0, 50000.0})
    {
        for (f64 panel : {150.0, 200.0, 250.0})
        {
            for (f64 price : {0.06, 0.12, 0.25})
            {
                SolarParams params;
                params.panel_efficiency_w_m2 = panel;
                params.electricity_price_usd_kwh = price;
                const SolarEstimate e = SolarEstimator::estimate(area, 0.14, 0.2, params);

                CHECK(e.capacity_kw >= 0.0);
                CHECK(e.annual_kwh >= 0.0);
                CHECK(e.install_cost_usd >= 0.0);
                CHECK(e.annual_om_usd >= 0.0);
                CHECK(e.co2_avoided_tons_yr >= 0.0);
                CHECK(e.payback_years > 0.0);
                CHECK(e.payback_years <= 999.0);
            }
        }
    }
}

// =================================================================
// Totals
// =================================================================

TEST_CASE("fold_totals sums additive metrics and re-derives payback")
{
    const SolarParams params;
    const std::vector<SolarEstimate> roofs{
        SolarEstimator::estimate(1200.0, 0.17, 0.40, params),
        SolarEstimator::estimate(5400.0, 0.17, 0.40, params),
        SolarEstimator::estimate(800.0, 0.17, 0.40, params),
    };

    const SolarTotals totals = fold_totals(roofs, [](const SolarEstimate& e) { return e; }, params);

    f64 capacity = 0.0;
    f64 kwh = 0.0;
    f64 cost = 0.0;
    f64 revenue = 0.0;
    f64 om = 0.0;
    f64 npv = 0.0;
    for (const SolarEstimate& e : roofs)
    {
        capacity += e.capacity_kw;
        kwh += e.annual_kwh;
        cost += e.install_cost_usd;
        revenue += e.annual_revenue_usd;
        om += e.annual_om_usd;
        npv += e.npv_25yr_usd;
    }

    CHECK(totals.building_count == 3);
    CHECK(totals.capacity_kw == doctest::Approx(capacity));
    CHECK(totals.annual_kwh == doctest::Approx(kwh));
    CHECK(totals.install_cost_usd == doctest::Approx(cost));
    CHECK(totals.payback_years == doctest::Approx(cost / (revenue - om)));
    // NPV is linear in the cash flows for a shared price
    CHECK(totals.npv_25yr_usd == doctest::Approx(npv));
    CHECK(totals.capacity_factor == doctest::Approx(0.17));
    CHECK(totals.co2_rate_kg_per_kwh == doctest::Approx(0.40));
    CHECK(totals.homes_powered == doctest::Approx(kwh / 10500.0));
    CHECK(totals.yearly_generation_mwh.size() == 25);
}

TEST_CASE("fold_totals of an empty range is all zero")
{
    const std::vector<SolarEstimate> none;
    const SolarTotals totals = fold_totals(none, [](const SolarEstimate& e) { return e; }, SolarParams{});

    CHECK(totals.building_count == 0);
    CHECK(totals.capacity_kw == 0.0);
    CHECK(totals.npv_25yr_usd == 0.0);
    CHECK(totals.payback_years == 999.0);
    CHECK(totals.cumulative_payback_year == 0);
}

TEST_CASE("Estimates are deterministic")
{
    const SolarEstimate a = SolarEstimator::estimate(3210.5, 0.171, 0.379, SolarParams{});
    const SolarEstimate b = SolarEstimator::estimate(3210.5, 0.171, 0.379, SolarParams{});
    CHECK(a == b);
}
