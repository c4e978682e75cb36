/// @file comparison.cpp
/// @brief Compare and aggregate views over cached resolutions.

#include "report/comparison.hpp"

#include "core/errors.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace helioport::report
{

namespace
{

// IATA (3) or ICAO (4) letters
bool is_airport_code(const std::string& code)
{
    if (code.size() < 3 || code.size() > 4)
    {
        return false;
    }
    return std::all_of(code.begin(), code.end(),
                       [](unsigned char c) { return std::isalpha(c) != 0; });
}

std::string trimmed(const std::string& text)
{
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos)
    {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

} // anonymous namespace

AirportComparator::AirportComparator(cache::ResultCache& cache, const airport::AirportRegistry& airports)
    : m_cache{cache}
    , m_airports{airports}
{
}

std::vector<AirportSummary> AirportComparator::compare(std::span<const std::string> codes,
                                                       const airport::AirportQuery& base)
{
    std::vector<std::string> selected;
    for (const std::string& raw : codes)
    {
        const std::string code = airport::normalize_code(trimmed(raw));
        if (!is_airport_code(code))
        {
            if (!code.empty())
            {
                HPT_CORE_WARN("Compare: ignoring malformed airport code '{}'", code);
            }
            continue;
        }
        if (std::find(selected.begin(), selected.end(), code) != selected.end())
        {
            continue;
        }
        if (selected.size() == kMaxCompared)
        {
            HPT_CORE_WARN("Compare: more than {} airports requested, ignoring {}", kMaxCompared, code);
            continue;
        }
        selected.push_back(code);
    }

    std::vector<AirportSummary> summaries;
    summaries.reserve(selected.size());
    for (const std::string& code : selected)
    {
        summaries.push_back(summarize(code, base));
    }
    return summaries;
}

AggregateReport AirportComparator::aggregate_all(const airport::AirportQuery& base)
{
    AggregateReport report;

    for (const airport::Airport& airport : m_airports.airports())
    {
        AirportSummary summary = summarize(airport.code, base);
        if (!summary.ok())
        {
            HPT_CORE_WARN("Aggregate: skipping {}: {}", airport.code, *summary.error);
            report.skipped.push_back(airport.code);
            continue;
        }

        GrandTotals& grand = report.totals;
        ++grand.airport_count;
        grand.building_count += summary.building_count;
        grand.capacity_mw += summary.totals.capacity_mw();
        grand.annual_mwh += summary.totals.annual_mwh();
        grand.annual_revenue_usd += summary.totals.annual_revenue_usd;
        grand.co2_avoided_tons_yr += summary.totals.co2_avoided_tons_yr;
        report.airports.push_back(std::move(summary));
    }

    std::stable_sort(report.airports.begin(), report.airports.end(),
                     [](const AirportSummary& a, const AirportSummary& b) {
                         return a.totals.annual_mwh() > b.totals.annual_mwh();
                     });

    report.totals.homes_powered = static_cast<u64>(
        std::floor(report.totals.annual_mwh * 1000.0 / solar::solar_constants::kHomeAnnualKwh));

    HPT_CORE_INFO("Aggregate: {} airports, {} buildings, {:.1f} MWh/yr ({} skipped)",
                  report.totals.airport_count, report.totals.building_count,
                  report.totals.annual_mwh, report.skipped.size());

    return report;
}

AirportSummary AirportComparator::summarize(const std::string& code, const airport::AirportQuery& base)
{
    AirportSummary summary;
    summary.code = code;
    if (const airport::Airport* known = m_airports.find(code))
    {
        summary.airport = *known;
    }

    airport::AirportQuery query = base;
    query.airport_code = code;

    try
    {
        const airport::AirportResult result = m_cache.get_or_compute(query);
        summary.building_count = result.buildings.size();
        summary.totals = result.totals;
        if (result.buildings.empty())
        {
            summary.error = "No buildings";
        }
    }
    catch (const UnknownAirportError& e)
    {
        summary.error = "Airport " + code + " not found";
        HPT_CORE_DEBUG("Compare: {}", e.what());
    }
    catch (const HelioportError& e)
    {
        summary.error = e.what();
        HPT_CORE_WARN("Compare: failed for {} at {}: {}", code, resolve_stage_name(e.stage()), e.what());
    }

    return summary;
}

} // namespace helioport::report
