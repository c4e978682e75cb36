#pragma once

/// @file solar_estimator.hpp
/// @brief Roof area → generation, 25-year economics and emissions.

#include "core/types.hpp"
#include "solar/solar_params.hpp"

#include <cstddef>
#include <vector>

namespace helioport::solar
{
    /// @brief Per-building (or summed) solar metrics. Full double precision;
    /// rounding is a presentation concern.
    struct SolarEstimate
    {
        // Inputs echoed for transparency
        f64 roof_area_m2 = 0.0;
        f64 capacity_factor = 0.0;
        f64 co2_rate_kg_per_kwh = 0.0;

        // Generation
        f64 usable_area_m2 = 0.0;
        f64 capacity_kw = 0.0;                  ///< DC nameplate
        f64 annual_kwh = 0.0;                   ///< Year-1 output
        f64 lifetime_mwh = 0.0;                 ///< Degraded output summed over the lifetime
        std::vector<f64> yearly_generation_mwh; ///< One entry per lifetime year

        // Economics
        f64 gross_cost_usd = 0.0;
        f64 itc_savings_usd = 0.0;
        f64 install_cost_usd = 0.0;             ///< Net of ITC
        f64 annual_revenue_usd = 0.0;           ///< Year 1
        f64 annual_om_usd = 0.0;
        f64 payback_years = solar_constants::kNoPaybackYears;  ///< Simple payback on year-1 cash flow
        i32 cumulative_payback_year = 0;        ///< First year cumulative cash flow >= 0; 0 = never
        f64 npv_25yr_usd = 0.0;

        // Environment
        f64 co2_avoided_tons_yr = 0.0;
        f64 co2_avoided_lifetime_tons = 0.0;
        f64 homes_powered = 0.0;

        [[nodiscard]] f64 annual_mwh() const { return annual_kwh / 1000.0; }
        [[nodiscard]] f64 capacity_mw() const { return capacity_kw / 1000.0; }

        bool operator==(const SolarEstimate&) const = default;
    };

    /// @brief Airport-level aggregate: summed quantities, re-derived payback and NPV.
    struct SolarTotals : SolarEstimate
    {
        std::size_t building_count = 0;

        bool operator==(const SolarTotals&) const = default;
    };

    /// @brief Discounted cash flow over the system lifetime.
    struct CashFlowProjection
    {
        f64 npv_usd = 0.0;
        f64 simple_payback_years = solar_constants::kNoPaybackYears;
        i32 cumulative_payback_year = 0;
        f64 lifetime_kwh = 0.0;
        std::vector<f64> yearly_kwh;
    };

    /// @brief Static utility class implementing the rooftop PV model.
    ///
    ///   usable   = area × usable_fraction
    ///   kW       = usable × W/m² / 1000
    ///   kWh(1)   = kW × 8760 × CF
    ///   kWh(n)   = kWh(1) × (1 − d)^(n−1)
    ///   cost     = kW × 1000 × $/W × (1 − ITC)
    ///   NPV      = −cost + Σ (kWh(n) × price − O&M) / (1 + r)^n
    class SolarEstimator
    {
    public:
        SolarEstimator() = delete;

        /// @brief Metrics for one roof.
        ///
        /// Degenerate inputs (area <= 0 or capacity factor <= 0) produce
        /// all-zero metrics with the no-payback sentinel, never an error.
        [[nodiscard]] static SolarEstimate estimate(f64 area_m2,
                                                    f64 capacity_factor,
                                                    f64 co2_rate_kg_per_kwh,
                                                    const SolarParams& params);

        /// @brief Lifetime cash flow for a year-1 output and fixed annual O&M.
        [[nodiscard]] static CashFlowProjection project(f64 annual_kwh_yr1,
                                                        f64 install_cost_usd,
                                                        f64 annual_om_usd,
                                                        f64 price_usd_kwh);

        /// @brief Simple payback, or the sentinel when net cash flow <= 0 or
        /// the quotient is not finite.
        [[nodiscard]] static f64 simple_payback(f64 install_cost_usd, f64 net_annual_usd);
    };

    namespace detail
    {
        /// @brief Scratch sums used by fold_totals; lives only for one fold.
        struct TotalsSum
        {
            std::size_t count = 0;
            f64 roof_area_m2 = 0.0;
            f64 usable_area_m2 = 0.0;
            f64 capacity_kw = 0.0;
            f64 annual_kwh = 0.0;
            f64 gross_cost_usd = 0.0;
            f64 itc_savings_usd = 0.0;
            f64 install_cost_usd = 0.0;
            f64 annual_revenue_usd = 0.0;
            f64 annual_om_usd = 0.0;
            f64 co2_avoided_tons_yr = 0.0;
            f64 co2_avoided_lifetime_tons = 0.0;

            void add(const SolarEstimate& estimate);
            [[nodiscard]] SolarTotals finish(const SolarParams& params) const;
        };
    }

    /// @brief Pure fold of per-building estimates into airport totals.
    ///
    /// Additive quantities are summed; payback and NPV are re-derived from the
    /// summed cash flows since neither is additive. Works on any subset, e.g.
    /// after a caller hides some buildings.
    template <typename Range, typename EstimateOf>
    [[nodiscard]] SolarTotals fold_totals(const Range& items, EstimateOf estimate_of, const SolarParams& params)
    {
        detail::TotalsSum sum;
        for (const auto& item : items)
        {
            sum.add(estimate_of(item));
        }
        return sum.finish(params);
    }

} // namespace helioport::solar
