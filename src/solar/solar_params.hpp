#pragma once

/// @file solar_params.hpp
/// @brief Tunable inputs and fixed economic constants for rooftop PV estimates.

#include "core/types.hpp"

namespace helioport::solar
{
    /// @brief User-tunable estimation parameters.
    ///
    /// Ranges below are enforced by the request layer, not here; every formula
    /// stays well-defined for any positive value.
    struct SolarParams
    {
        f64 usable_fraction = 0.65;             ///< Roof share that can carry panels [0.30, 0.80]
        f64 panel_efficiency_w_m2 = 200.0;      ///< Peak DC watts per m² of panel [150, 250]
        f64 electricity_price_usd_kwh = 0.12;   ///< Retail price offset per kWh [0.06, 0.25]
        bool include_itc = true;                ///< Apply the federal Investment Tax Credit

        bool operator==(const SolarParams&) const = default;
    };

    // Commercial rooftop PV assumptions
    // (NREL 2023 ATB, SEIA/Wood Mackenzie 2025, EPA eGRID 2022, EIA 2022)
    namespace solar_constants
    {
        constexpr f64 kCostPerWattUsd       = 1.40;
        constexpr f64 kItcRate              = 0.30;
        constexpr f64 kOmUsdPerKwYear       = 15.0;
        constexpr f64 kDegradationPerYear   = 0.005;
        constexpr f64 kDiscountRate         = 0.06;
        constexpr i32 kLifetimeYears        = 25;
        constexpr f64 kHomeAnnualKwh        = 10500.0;
        constexpr f64 kHoursPerYear         = 8760.0;
        constexpr f64 kNoPaybackYears       = 999.0;   // sentinel: net annual cash flow <= 0
    }

} // namespace helioport::solar
