#pragma once

/// @file comparison.hpp
/// @brief Multi-airport comparison and the all-airport aggregate.

#include "airport/airport.hpp"
#include "airport/airport_query.hpp"
#include "airport/airport_registry.hpp"
#include "cache/result_cache.hpp"
#include "solar/solar_estimator.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace helioport::report
{
    /// @brief One airport's row: totals on success, a message on failure.
    struct AirportSummary
    {
        std::string code;
        std::optional<airport::Airport> airport;    ///< Empty when the code is unknown
        solar::SolarTotals totals;
        std::size_t building_count = 0;
        std::optional<std::string> error;

        [[nodiscard]] bool ok() const { return !error.has_value(); }
    };

    /// @brief Sums across every successful airport.
    struct GrandTotals
    {
        std::size_t airport_count = 0;
        std::size_t building_count = 0;
        f64 capacity_mw = 0.0;
        f64 annual_mwh = 0.0;
        f64 annual_revenue_usd = 0.0;
        f64 co2_avoided_tons_yr = 0.0;
        u64 homes_powered = 0;      ///< Whole homes: floor(MWh × 1000 / 10500)
    };

    struct AggregateReport
    {
        std::vector<AirportSummary> airports;   ///< Annual MWh, descending
        GrandTotals totals;
        std::vector<std::string> skipped;       ///< Codes that failed or had no buildings
    };

    /// @brief Runs cached resolutions for several airports.
    ///
    /// A failing airport never fails the whole request: compare() records an
    /// error row, aggregate_all() skips it with a warning.
    class AirportComparator
    {
    public:
        static constexpr std::size_t kMaxCompared = 8;

        AirportComparator(cache::ResultCache& cache, const airport::AirportRegistry& airports);

        /// @brief Up to kMaxCompared distinct codes, in request order.
        /// Blank or malformed codes are ignored. The code field of
        /// @p base is replaced per airport.
        [[nodiscard]] std::vector<AirportSummary> compare(std::span<const std::string> codes,
                                                          const airport::AirportQuery& base);

        /// @brief Every registered airport that resolves to at least one building.
        [[nodiscard]] AggregateReport aggregate_all(const airport::AirportQuery& base);

    private:
        [[nodiscard]] AirportSummary summarize(const std::string& code, const airport::AirportQuery& base);

        cache::ResultCache& m_cache;
        const airport::AirportRegistry& m_airports;
    };

} // namespace helioport::report
