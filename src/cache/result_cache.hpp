#pragma once

/// @file result_cache.hpp
/// @brief Single-flight LRU memoization of airport resolutions.

#include "airport/airport_query.hpp"
#include "airport/airport_resolver.hpp"
#include "cache/single_flight_cache.hpp"

#include <cstddef>

namespace helioport::cache
{
    /// @brief Hash over every field of the query (FNV-1a over canonical bits).
    struct AirportQueryHash
    {
        [[nodiscard]] std::size_t operator()(const airport::AirportQuery& query) const noexcept;
    };

    /// @brief Key equality on canonical bits: -0.0 equals 0.0 and NaN equals NaN,
    /// so every stored key can be found again.
    struct AirportQueryKeyEqual
    {
        [[nodiscard]] bool operator()(const airport::AirportQuery& a,
                                      const airport::AirportQuery& b) const noexcept;
    };

    /// @brief Cache in front of the resolver, keyed by the full query.
    /// Queries differing only in financial parameters are distinct entries;
    /// the resolver's building-set cache makes those misses cheap.
    using ResultCache = SingleFlightCache<airport::AirportQuery, airport::AirportResult,
                                          AirportQueryHash, AirportQueryKeyEqual>;

} // namespace helioport::cache
