/// @file region_table.cpp
/// @brief Region factor lookup and the built-in US table.

#include "solar/region_table.hpp"

#include <utility>

namespace helioport::solar
{

RegionTable::RegionTable(std::map<std::string, f64, std::less<>> capacity_factors,
                         std::map<std::string, f64, std::less<>> co2_rates,
                         RegionFactors defaults)
    : m_capacity_factors{std::move(capacity_factors)}
    , m_co2_rates{std::move(co2_rates)}
    , m_defaults{defaults}
{
}

RegionFactors RegionTable::lookup(std::string_view state) const
{
    RegionFactors factors = m_defaults;

    if (auto it = m_capacity_factors.find(state); it != m_capacity_factors.end())
    {
        factors.capacity_factor = it->second;
    }
    if (auto it = m_co2_rates.find(state); it != m_co2_rates.end())
    {
        factors.co2_rate_kg_per_kwh = it->second;
    }
    return factors;
}

bool RegionTable::has_capacity_factor(std::string_view state) const
{
    return m_capacity_factors.find(state) != m_capacity_factors.end();
}

// -----------------------------------------------------------------
// Built-in table (NREL 2023 ATB resource classes, EPA eGRID 2022)
// -----------------------------------------------------------------

const RegionTable& RegionTable::builtin()
{
    static const RegionTable table{
        {
            // Sunny Southwest
            {"Arizona", 0.198},
            {"Nevada", 0.191},
            {"New Mexico", 0.198},
            {"California", 0.185},
            // Texas and South
            {"Texas", 0.175},
            {"Florida", 0.171},
            {"Louisiana", 0.168},
            {"Hawaii", 0.180},
            // Mountain West
            {"Colorado", 0.171},
            {"Utah", 0.175},
            // Southeast
            {"Georgia", 0.168},
            {"North Carolina", 0.163},
            {"South Carolina", 0.168},
            {"Tennessee", 0.161},
            {"Alabama", 0.168},
            // Mid-Atlantic
            {"Virginia", 0.161},
            {"Maryland", 0.158},
            {"New Jersey", 0.158},
            {"Pennsylvania", 0.153},
            {"Delaware", 0.158},
            // Northeast
            {"New York", 0.153},
            {"Massachusetts", 0.153},
            {"Connecticut", 0.153},
            {"Rhode Island", 0.153},
            // Midwest
            {"Illinois", 0.153},
            {"Michigan", 0.146},
            {"Minnesota", 0.153},
            {"Ohio", 0.146},
            {"Indiana", 0.153},
            {"Wisconsin", 0.146},
            // Pacific Northwest
            {"Washington", 0.140},
            {"Oregon", 0.146},
        },
        {
            {"Arizona", 0.397},
            {"California", 0.211},
            {"Colorado", 0.525},
            {"Florida", 0.379},
            {"Georgia", 0.404},
            {"Hawaii", 0.531},
            {"Illinois", 0.301},
            {"Maryland", 0.297},
            {"Massachusetts", 0.270},
            {"Michigan", 0.428},
            {"Minnesota", 0.351},
            {"Nevada", 0.307},
            {"New Jersey", 0.217},
            {"New York", 0.190},
            {"North Carolina", 0.343},
            {"Ohio", 0.489},
            {"Pennsylvania", 0.336},
            {"Tennessee", 0.302},
            {"Texas", 0.380},
            {"Virginia", 0.298},
            {"Washington", 0.076},
        },
        RegionFactors{.capacity_factor = 0.158, .co2_rate_kg_per_kwh = 0.386},
    };
    return table;
}

} // namespace helioport::solar
