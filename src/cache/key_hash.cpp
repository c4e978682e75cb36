/// @file key_hash.cpp
/// @brief FNV-1a helpers shared by the cache key hashes.

#include "cache/key_hash.hpp"

#include <bit>
#include <cmath>
#include <limits>

namespace helioport::cache::key_hash
{

u64 canonical_bits(f64 value)
{
    if (value == 0.0)
    {
        return 0;
    }
    if (std::isnan(value))
    {
        return std::bit_cast<u64>(std::numeric_limits<f64>::quiet_NaN());
    }
    return std::bit_cast<u64>(value);
}

void mix(u64& h, u64 x)
{
    for (int i = 0; i < 8; ++i)
    {
        h ^= (x >> (i * 8)) & 0xffULL;
        h *= kFnvPrime;
    }
}

void mix(u64& h, std::string_view text)
{
    for (unsigned char c : text)
    {
        h ^= c;
        h *= kFnvPrime;
    }
}

} // namespace helioport::cache::key_hash
