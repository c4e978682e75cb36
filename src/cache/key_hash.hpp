#pragma once

/// @file key_hash.hpp
/// @brief FNV-1a building blocks for cache keys made of strings and doubles.

#include "core/types.hpp"

#include <string_view>

namespace helioport::cache::key_hash
{
    constexpr u64 kFnvOffset = 0xcbf29ce484222325ULL;
    constexpr u64 kFnvPrime  = 0x100000001b3ULL;

    /// @brief Bit pattern with one encoding for zero and one for NaN, so
    /// -0.0 matches 0.0 and every NaN matches every other NaN.
    [[nodiscard]] u64 canonical_bits(f64 value);

    /// @brief Fold the eight bytes of @p x into @p h.
    void mix(u64& h, u64 x);

    /// @brief Fold every byte of @p text into @p h.
    void mix(u64& h, std::string_view text);

} // namespace helioport::cache::key_hash
