// src/main.cpp - Helioport command-line estimator
//
// Drives the engine over files in the common on-disk format:
//  1. Load configuration and start logging
//  2. Load airports (built-in table or CSV) and building footprints
//  3. Resolve one airport, compare several, or aggregate all of them
//  4. Print results to the terminal

#include "airport/airport_query.hpp"
#include "airport/airport_registry.hpp"
#include "airport/airport_resolver.hpp"
#include "cache/result_cache.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "io/data_loader.hpp"
#include "report/comparison.hpp"
#include "report/presentation.hpp"
#include "solar/region_table.hpp"

#include <algorithm>
#include <charconv>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

using namespace helioport;

namespace {

struct CliOptions {
    std::optional<std::filesystem::path> airports_csv;
    std::optional<std::filesystem::path> footprints_csv;
    std::vector<std::string> codes;
    airport::AirportQuery query;
    std::size_t top = 10;
    bool aggregate = false;
    bool help = false;
};

void printUsage(std::ostream& os) {
    os << "Usage: helioport [options] CODE [CODE...]\n"
       << "       helioport [options] --aggregate\n\n"
       << "Options:\n"
       << "  --airports FILE     airports CSV (code,name,city,state,lat,lon); default built-in\n"
       << "  --footprints FILE   footprints CSV (state,source,ring);\n"
       << "                      default <data dir>/footprints/sample_footprints.csv\n"
       << "  --radius KM         search radius, 1-20 (default 5)\n"
       << "  --min-size M2       minimum roof area, 100-10000 (default 500)\n"
       << "  --usable F          usable roof fraction, 0.30-0.80 (default 0.65)\n"
       << "  --panel W           panel density in W/m2, 150-250 (default 200)\n"
       << "  --price USD         electricity price per kWh, 0.06-0.25 (default 0.12)\n"
       << "  --no-itc            exclude the 30% federal tax credit\n"
       << "  --top N             buildings listed for a single airport (default 10)\n"
       << "  --aggregate         summarize every registered airport\n";
}

bool parseNumber(std::string_view text, double& out) {
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    return ec == std::errc{} && ptr == text.data() + text.size();
}

std::optional<CliOptions> parseArgs(int argc, char** argv, std::size_t maxBuildings) {
    CliOptions opts;
    opts.top = std::min(opts.top, maxBuildings);
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        auto value = [&]() -> std::optional<std::string_view> {
            if (i + 1 >= argc) {
                HPT_ERROR("Missing value for {}", arg);
                return std::nullopt;
            }
            return std::string_view{argv[++i]};
        };
        auto number = [&](double& target) {
            const auto v = value();
            if (!v) return false;
            if (!parseNumber(*v, target)) {
                HPT_ERROR("Invalid number for {}: '{}'", arg, *v);
                return false;
            }
            return true;
        };

        if (arg == "-h" || arg == "--help") {
            opts.help = true;
        } else if (arg == "--airports") {
            const auto v = value();
            if (!v) return std::nullopt;
            opts.airports_csv = std::filesystem::path{std::string{*v}};
        } else if (arg == "--footprints") {
            const auto v = value();
            if (!v) return std::nullopt;
            opts.footprints_csv = std::filesystem::path{std::string{*v}};
        } else if (arg == "--radius") {
            if (!number(opts.query.radius_km)) return std::nullopt;
        } else if (arg == "--min-size") {
            if (!number(opts.query.min_building_area_m2)) return std::nullopt;
        } else if (arg == "--usable") {
            if (!number(opts.query.usable_fraction)) return std::nullopt;
        } else if (arg == "--panel") {
            if (!number(opts.query.panel_efficiency_w_m2)) return std::nullopt;
        } else if (arg == "--price") {
            if (!number(opts.query.electricity_price_usd_kwh)) return std::nullopt;
        } else if (arg == "--no-itc") {
            opts.query.include_itc = false;
        } else if (arg == "--top") {
            double top = 0.0;
            if (!number(top)) return std::nullopt;
            const auto limit = report::listing_limit(top, maxBuildings);
            if (!limit) {
                HPT_ERROR("Invalid value for --top: {}", top);
                return std::nullopt;
            }
            opts.top = *limit;
        } else if (arg == "--aggregate") {
            opts.aggregate = true;
        } else if (!arg.empty() && arg.front() == '-') {
            HPT_ERROR("Unknown option: {}", arg);
            return std::nullopt;
        } else {
            opts.codes.emplace_back(arg);
        }
    }
    return opts;
}

void printTotals(std::ostream& os, const solar::SolarTotals& t) {
    const solar::SolarEstimate shown = report::present(t);
    os << std::fixed
       << "  Buildings:        " << t.building_count << "\n"
       << "  Roof area:        " << std::setprecision(0) << shown.roof_area_m2 << " m2\n"
       << "  Capacity:         " << std::setprecision(3) << report::present_capacity_mw(t) << " MW\n"
       << "  Annual output:    " << std::setprecision(1) << report::present_annual_mwh(t) << " MWh\n"
       << "  Lifetime output:  " << std::setprecision(0) << shown.lifetime_mwh << " MWh\n"
       << "  Install cost:     $" << shown.install_cost_usd
       << " (gross $" << shown.gross_cost_usd << ", ITC $" << shown.itc_savings_usd << ")\n"
       << "  Annual revenue:   $" << shown.annual_revenue_usd << "\n"
       << "  Annual O&M:       $" << shown.annual_om_usd << "\n"
       << "  Payback:          " << std::setprecision(1) << shown.payback_years << " years";
    if (t.cumulative_payback_year > 0) {
        os << " (cash positive in year " << t.cumulative_payback_year << ")";
    }
    os << "\n"
       << "  25-year NPV:      $" << std::setprecision(0) << shown.npv_25yr_usd << "\n"
       << "  CO2 avoided:      " << std::setprecision(1) << shown.co2_avoided_tons_yr << " t/yr, "
       << std::setprecision(0) << shown.co2_avoided_lifetime_tons << " t lifetime\n"
       << "  Homes powered:    " << shown.homes_powered << "\n";
}

void printAirport(std::ostream& os, const airport::AirportResult& result, std::size_t top) {
    const auto& a = result.airport;
    os << a.code << " - " << a.name << " (" << a.city << ", " << a.state << ")\n"
       << std::fixed << std::setprecision(1)
       << "  Radius " << result.query.radius_km << " km, min roof "
       << std::setprecision(0) << result.query.min_building_area_m2 << " m2\n"
       << "  Merge: " << result.merge_stats.primary_kept << " primary + "
       << result.merge_stats.secondary_kept << " secondary kept, "
       << result.merge_stats.duplicates << " duplicates, "
       << result.merge_stats.invalid << " invalid, "
       << result.below_min_size << " below min size\n\n";

    printTotals(os, result.totals);

    std::vector<airport::EstimatedBuilding> listed = result.buildings;
    report::sort_by_area_desc(listed);
    report::limit(listed, top);
    if (listed.empty()) return;

    os << "\n  Largest roofs:\n"
       << "    " << std::left << std::setw(6) << "id" << std::right
       << std::setw(12) << "area m2" << std::setw(10) << "kW"
       << std::setw(12) << "MWh/yr" << std::setw(10) << "km"
       << std::setw(11) << "source" << "\n";
    for (const auto& entry : listed) {
        const solar::SolarEstimate shown = report::present(entry.solar);
        os << "    " << std::left << std::setw(6) << entry.building.id << std::right
           << std::setw(12) << std::setprecision(0) << entry.building.area_m2
           << std::setw(10) << std::setprecision(1) << shown.capacity_kw
           << std::setw(12) << report::present_annual_mwh(entry.solar)
           << std::setw(10) << std::setprecision(2) << entry.building.distance_km
           << std::setw(11) << footprints::footprint_source_name(entry.building.source) << "\n";
    }
}

void printSummaryTable(std::ostream& os, const std::vector<report::AirportSummary>& rows) {
    os << std::left << std::setw(6) << "code" << std::right
       << std::setw(10) << "bldgs" << std::setw(12) << "MW"
       << std::setw(14) << "MWh/yr" << std::setw(10) << "payback"
       << std::setw(16) << "NPV $" << "\n";
    for (const auto& row : rows) {
        os << std::left << std::setw(6) << row.code << std::right;
        if (!row.ok()) {
            os << "  " << *row.error << "\n";
            continue;
        }
        os << std::fixed
           << std::setw(10) << row.building_count
           << std::setw(12) << std::setprecision(3) << report::present_capacity_mw(row.totals)
           << std::setw(14) << std::setprecision(1) << report::present_annual_mwh(row.totals)
           << std::setw(10) << report::round_to(row.totals.payback_years, 1)
           << std::setw(16) << std::setprecision(0) << report::round_to(row.totals.npv_25yr_usd, 0)
           << "\n";
    }
}

} // namespace

int main(int argc, char** argv) {
    // -----------------------------------------------------------------------
    // 1. Configuration and logging
    // -----------------------------------------------------------------------
    const core::EngineConfig config = core::EngineConfig::from_environment();
    core::Logger::init(config.log_file, config.log_level);

    const auto parsed = parseArgs(argc, argv, config.max_buildings);
    if (!parsed) {
        printUsage(std::cerr);
        core::Logger::shutdown();
        return 2;
    }
    const CliOptions& opts = *parsed;
    if (opts.help || (opts.codes.empty() && !opts.aggregate)) {
        printUsage(opts.help ? std::cout : std::cerr);
        core::Logger::shutdown();
        return opts.help ? 0 : 2;
    }

    // -----------------------------------------------------------------------
    // 2. Inputs
    // -----------------------------------------------------------------------
    airport::AirportRegistry airports = airport::AirportRegistry::builtin();
    if (opts.airports_csv) {
        auto loaded = io::DataLoader::load_airports_csv(*opts.airports_csv);
        if (!loaded) {
            HPT_CRITICAL("Cannot load airports from {}", opts.airports_csv->string());
            core::Logger::shutdown();
            return 1;
        }
        airports = airport::AirportRegistry{std::move(*loaded)};
    }

    const std::filesystem::path footprints_path = opts.footprints_csv.value_or(
        config.data_dir / "footprints" / "sample_footprints.csv");
    auto footprints = io::DataLoader::load_footprints_csv(footprints_path);
    if (!footprints) {
        HPT_CRITICAL("Cannot load footprints from {}", footprints_path.string());
        core::Logger::shutdown();
        return 1;
    }

    HPT_INFO("{} airports, {} footprints", airports.size(), footprints->size());

    // -----------------------------------------------------------------------
    // 3. Engine
    // -----------------------------------------------------------------------
    const airport::AirportResolver resolver(airports, solar::RegionTable::builtin(), *footprints,
                                            config.cache_capacity);
    cache::ResultCache cache(
        [&resolver](const airport::AirportQuery& q) { return resolver.resolve(q); },
        config.cache_capacity);

    const airport::AirportQuery base = airport::clamp_query(opts.query);

    std::cout << "================================================================\n"
              << "  HELIOPORT - Rooftop Solar Potential Near Airports\n"
              << "================================================================\n\n";

    int status = 0;
    if (opts.aggregate) {
        report::AirportComparator comparator(cache, airports);
        const report::AggregateReport agg = comparator.aggregate_all(base);
        printSummaryTable(std::cout, agg.airports);
        const auto& g = agg.totals;
        std::cout << "\nAll airports: " << g.airport_count << " airports, "
                  << g.building_count << " buildings\n" << std::fixed
                  << "  Capacity:      " << std::setprecision(1) << g.capacity_mw << " MW\n"
                  << "  Annual output: " << std::setprecision(0) << g.annual_mwh << " MWh\n"
                  << "  Revenue:       $" << g.annual_revenue_usd << "/yr\n"
                  << "  CO2 avoided:   " << g.co2_avoided_tons_yr << " t/yr\n"
                  << "  Homes powered: " << g.homes_powered << "\n";
        if (!agg.skipped.empty()) {
            std::cout << "  Skipped:       " << agg.skipped.size() << " airports\n";
        }
    } else if (opts.codes.size() == 1) {
        airport::AirportQuery query = base;
        query.airport_code = airport::normalize_code(opts.codes.front());
        try {
            printAirport(std::cout, cache.get_or_compute(query), opts.top);
        } catch (const HelioportError& e) {
            HPT_ERROR("{} failed at {}: {}", e.airport_code(), resolve_stage_name(e.stage()), e.what());
            status = 1;
        }
    } else {
        report::AirportComparator comparator(cache, airports);
        printSummaryTable(std::cout, comparator.compare(opts.codes, base));
    }

    const cache::CacheStats stats = cache.stats();
    const cache::CacheStats sets = resolver.building_set_stats();
    HPT_INFO("Cache: {} hits, {} misses, {} evictions; building sets: {} merged, {} reused",
             stats.hits, stats.misses, stats.evictions, sets.computations, sets.hits);

    core::Logger::shutdown();
    return status;
}
