/// @file result_cache.cpp
/// @brief Full-query key hashing for the result cache.

#include "cache/result_cache.hpp"

#include "cache/key_hash.hpp"

namespace helioport::cache
{

std::size_t AirportQueryHash::operator()(const airport::AirportQuery& query) const noexcept
{
    using key_hash::canonical_bits;

    u64 h = key_hash::kFnvOffset;
    key_hash::mix(h, query.airport_code);
    key_hash::mix(h, canonical_bits(query.radius_km));
    key_hash::mix(h, canonical_bits(query.min_building_area_m2));
    key_hash::mix(h, canonical_bits(query.usable_fraction));
    key_hash::mix(h, canonical_bits(query.panel_efficiency_w_m2));
    key_hash::mix(h, canonical_bits(query.electricity_price_usd_kwh));
    key_hash::mix(h, u64{query.include_itc ? 1u : 0u});
    return static_cast<std::size_t>(h);
}

bool AirportQueryKeyEqual::operator()(const airport::AirportQuery& a,
                                      const airport::AirportQuery& b) const noexcept
{
    using key_hash::canonical_bits;

    return a.airport_code == b.airport_code &&
           canonical_bits(a.radius_km) == canonical_bits(b.radius_km) &&
           canonical_bits(a.min_building_area_m2) == canonical_bits(b.min_building_area_m2) &&
           canonical_bits(a.usable_fraction) == canonical_bits(b.usable_fraction) &&
           canonical_bits(a.panel_efficiency_w_m2) == canonical_bits(b.panel_efficiency_w_m2) &&
           canonical_bits(a.electricity_price_usd_kwh) == canonical_bits(b.electricity_price_usd_kwh) &&
           a.include_itc == b.include_itc;
}

} // namespace helioport::cache
