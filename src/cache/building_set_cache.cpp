/// @file building_set_cache.cpp
/// @brief Key hashing for the building-set cache.

#include "cache/building_set_cache.hpp"

#include "cache/key_hash.hpp"

namespace helioport::cache
{

std::size_t BuildingSetKeyHash::operator()(const BuildingSetKey& key) const noexcept
{
    u64 h = key_hash::kFnvOffset;
    key_hash::mix(h, key.airport_code);
    key_hash::mix(h, key_hash::canonical_bits(key.radius_km));
    key_hash::mix(h, key_hash::canonical_bits(key.min_building_area_m2));
    return static_cast<std::size_t>(h);
}

bool BuildingSetKeyEqual::operator()(const BuildingSetKey& a, const BuildingSetKey& b) const noexcept
{
    return a.airport_code == b.airport_code &&
           key_hash::canonical_bits(a.radius_km) == key_hash::canonical_bits(b.radius_km) &&
           key_hash::canonical_bits(a.min_building_area_m2) == key_hash::canonical_bits(b.min_building_area_m2);
}

} // namespace helioport::cache
