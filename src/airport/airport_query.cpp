/// @file airport_query.cpp
/// @brief Query range clamping.

#include "airport/airport_query.hpp"

#include "airport/airport_registry.hpp"

#include <algorithm>
#include <cmath>

namespace helioport::airport
{

namespace
{

f64 clamp_or_default(f64 value, f64 lo, f64 hi, f64 fallback)
{
    if (!std::isfinite(value))
    {
        return fallback;
    }
    return std::clamp(value, lo, hi);
}

} // anonymous namespace

AirportQuery clamp_query(const AirportQuery& query)
{
    using namespace query_limits;
    const AirportQuery defaults;

    AirportQuery clamped = query;
    clamped.airport_code = normalize_code(query.airport_code);
    clamped.radius_km = clamp_or_default(query.radius_km, kMinRadiusKm, kMaxRadiusKm,
                                         defaults.radius_km);
    clamped.min_building_area_m2 = clamp_or_default(query.min_building_area_m2, kMinBuildingAreaM2,
                                                    kMaxBuildingAreaM2, defaults.min_building_area_m2);
    clamped.usable_fraction = clamp_or_default(query.usable_fraction, kMinUsableFraction,
                                               kMaxUsableFraction, defaults.usable_fraction);
    clamped.panel_efficiency_w_m2 = clamp_or_default(query.panel_efficiency_w_m2, kMinPanelWm2,
                                                     kMaxPanelWm2, defaults.panel_efficiency_w_m2);
    clamped.electricity_price_usd_kwh = clamp_or_default(query.electricity_price_usd_kwh,
                                                         kMinPriceUsdKwh, kMaxPriceUsdKwh,
                                                         defaults.electricity_price_usd_kwh);
    return clamped;
}

} // namespace helioport::airport
