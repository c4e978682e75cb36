#pragma once

/// @file region_table.hpp
/// @brief Per-state capacity factor and grid CO2 intensity.

#include "core/types.hpp"

#include <map>
#include <string>
#include <string_view>

namespace helioport::solar
{
    /// @brief Regional inputs for the estimator.
    struct RegionFactors
    {
        f64 capacity_factor = 0.0;          ///< Average AC output / DC nameplate
        f64 co2_rate_kg_per_kwh = 0.0;      ///< Grid emissions displaced per kWh

        bool operator==(const RegionFactors&) const = default;
    };

    /// @brief Immutable state → factors mapping with national fallbacks.
    ///
    /// The two factors are looked up independently: a state may carry a
    /// capacity factor but no CO2 rate, in which case the default rate applies.
    /// Keys are full state names ("Georgia"), matched exactly.
    class RegionTable
    {
    public:
        RegionTable(std::map<std::string, f64, std::less<>> capacity_factors,
                    std::map<std::string, f64, std::less<>> co2_rates,
                    RegionFactors defaults);

        [[nodiscard]] RegionFactors lookup(std::string_view state) const;

        [[nodiscard]] bool has_capacity_factor(std::string_view state) const;
        [[nodiscard]] const RegionFactors& defaults() const { return m_defaults; }

        /// @brief NREL 2023 ATB capacity factors and EPA eGRID 2022 CO2 rates.
        /// Defaults: US mean CF 0.158 and 0.386 kg/kWh.
        [[nodiscard]] static const RegionTable& builtin();

    private:
        std::map<std::string, f64, std::less<>> m_capacity_factors;
        std::map<std::string, f64, std::less<>> m_co2_rates;
        RegionFactors m_defaults;
    };

} // namespace helioport::solar
