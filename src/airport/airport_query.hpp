#pragma once

/// @file airport_query.hpp
/// @brief Parameters of one airport resolution request.

#include "core/types.hpp"
#include "solar/solar_params.hpp"

#include <string>

namespace helioport::airport
{
    /// @brief Full input of a resolution; also the result cache key.
    struct AirportQuery
    {
        std::string airport_code;
        f64 radius_km = 5.0;
        f64 min_building_area_m2 = 500.0;
        f64 usable_fraction = 0.65;
        f64 panel_efficiency_w_m2 = 200.0;
        f64 electricity_price_usd_kwh = 0.12;
        bool include_itc = true;

        [[nodiscard]] solar::SolarParams solar_params() const
        {
            return solar::SolarParams{
                .usable_fraction = usable_fraction,
                .panel_efficiency_w_m2 = panel_efficiency_w_m2,
                .electricity_price_usd_kwh = electricity_price_usd_kwh,
                .include_itc = include_itc,
            };
        }

        bool operator==(const AirportQuery&) const = default;
    };

    // Accepted ranges for user-supplied query parameters
    namespace query_limits
    {
        constexpr f64 kMinRadiusKm          = 1.0;
        constexpr f64 kMaxRadiusKm          = 20.0;
        constexpr f64 kMinBuildingAreaM2    = 100.0;
        constexpr f64 kMaxBuildingAreaM2    = 10000.0;
        constexpr f64 kMinUsableFraction    = 0.30;
        constexpr f64 kMaxUsableFraction    = 0.80;
        constexpr f64 kMinPanelWm2          = 150.0;
        constexpr f64 kMaxPanelWm2          = 250.0;
        constexpr f64 kMinPriceUsdKwh       = 0.06;
        constexpr f64 kMaxPriceUsdKwh       = 0.25;
    }

    /// @brief Copy of @p query with every numeric field clamped into its range
    /// and the code upper-cased. Non-finite values fall back to the defaults.
    [[nodiscard]] AirportQuery clamp_query(const AirportQuery& query);

} // namespace helioport::airport
