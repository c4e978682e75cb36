/// @file test_comparison.cpp
/// @brief Unit tests for helioport::report::AirportComparator.
///
/// Covers code selection for compare(), per-airport error rows and the
/// ordering, skipping and totals of aggregate_all().

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "airport/airport_resolver.hpp"
#include "cache/result_cache.hpp"
#include "footprints/footprint_provider.hpp"
#include "report/comparison.hpp"
#include "solar/region_table.hpp"
#include "test_helpers.hpp"

#include <cmath>
#include <string>
#include <vector>

using namespace helioport;
using namespace helioport::report;
using helioport::airport::Airport;
using helioport::airport::AirportQuery;
using helioport::footprints::FootprintSource;

// =================================================================
// Fixture: small and large airport, one region without data, one
// airport with no roofs nearby
// =================================================================

namespace
{

constexpr geo::Coordinate kBig{test::kAtl.lat + 1.0, test::kAtl.lon};
constexpr geo::Coordinate kEmpty{test::kAtl.lat - 1.0, test::kAtl.lon};

struct ComparatorFixture
{
    airport::AirportRegistry airports;
    solar::RegionTable regions{{{"Georgia", 0.2}}, {{"Georgia", 0.5}},
                               solar::RegionFactors{.capacity_factor = 0.15, .co2_rate_kg_per_kwh = 0.4}};
    footprints::InMemoryFootprintProvider provider;
    airport::AirportResolver resolver{airports, regions, provider};
    cache::ResultCache cache{[this](const AirportQuery& q) { return resolver.resolve(q); }};
    AirportComparator comparator{cache, airports};

    ComparatorFixture()
    {
        airports.add(Airport{.code = "TST", .name = "Small Field", .city = "Atlanta",
                             .state = "Georgia", .location = test::kAtl});
        airports.add(Airport{.code = "BIG", .name = "Big Field", .city = "Rome",
                             .state = "Georgia", .location = kBig});
        airports.add(Airport{.code = "DRY", .name = "No Data", .city = "Nowhere",
                             .state = "Atlantis", .location = test::kAtl});
        airports.add(Airport{.code = "EMP", .name = "Empty Field", .city = "Macon",
                             .state = "Georgia", .location = kEmpty});

        provider.add("Georgia", test::footprint(test::rect(test::kAtl, 0.010, 0.010, 0.001, 0.001),
                                                FootprintSource::Primary));
        for (int i = 0; i < 3; ++i)
        {
            provider.add("Georgia", test::footprint(test::rect(kBig, 0.005 * i, 0.005, 0.001, 0.001),
                                                    FootprintSource::Primary));
        }
    }
};

} // anonymous namespace

// =================================================================
// compare()
// =================================================================

TEST_CASE("Compare normalizes, deduplicates and keeps request order")
{
    ComparatorFixture fx;
    const std::vector<std::string> codes{" tst", "ZZZ", "TST", " ", "big"};

    const std::vector<AirportSummary> rows = fx.comparator.compare(codes, AirportQuery{});

    REQUIRE(rows.size() == 3);
    CHECK(rows[0].code == "TST");
    CHECK(rows[1].code == "ZZZ");
    CHECK(rows[2].code == "BIG");

    CHECK(rows[0].ok());
    CHECK(rows[0].building_count == 1);
    REQUIRE(rows[0].airport.has_value());
    CHECK(rows[0].airport->name == "Small Field");

    CHECK_FALSE(rows[1].ok());
    CHECK(*rows[1].error == "Airport ZZZ not found");
    CHECK_FALSE(rows[1].airport.has_value());

    CHECK(rows[2].ok());
    CHECK(rows[2].building_count == 3);
}

TEST_CASE("Compare reports data and empty-result failures per airport")
{
    ComparatorFixture fx;
    const std::vector<std::string> codes{"DRY", "EMP", "TST"};

    const std::vector<AirportSummary> rows = fx.comparator.compare(codes, AirportQuery{});

    REQUIRE(rows.size() == 3);
    REQUIRE_FALSE(rows[0].ok());
    CHECK(rows[0].error->find("Atlantis") != std::string::npos);
    REQUIRE_FALSE(rows[1].ok());
    CHECK(*rows[1].error == "No buildings");
    CHECK(rows[2].ok());
}

TEST_CASE("Compare ignores malformed codes and caps the selection")
{
    ComparatorFixture fx;
    const std::vector<std::string> codes{"A1B", "TOOLONG", "AA",  "AAA", "BBB", "CCC", "DDD",
                                         "EEE", "FFF",     "GGG", "HHH", "III", "JJJ"};

    const std::vector<AirportSummary> rows = fx.comparator.compare(codes, AirportQuery{});

    REQUIRE(rows.size() == AirportComparator::kMaxCompared);
    CHECK(rows.front().code == "AAA");
    CHECK(rows.back().code == "HHH");
}

TEST_CASE("Compare applies the base query parameters")
{
    ComparatorFixture fx;
    AirportQuery with_itc;
    AirportQuery without_itc;
    without_itc.include_itc = false;

    const std::vector<std::string> codes{"TST"};
    const AirportSummary a = fx.comparator.compare(codes, with_itc).front();
    const AirportSummary b = fx.comparator.compare(codes, without_itc).front();

    CHECK(a.totals.itc_savings_usd > 0.0);
    CHECK(b.totals.itc_savings_usd == 0.0);
    CHECK(b.totals.install_cost_usd > a.totals.install_cost_usd);
    CHECK(fx.cache.stats().computations == 2);
}

// =================================================================
// aggregate_all()
// =================================================================

TEST_CASE("Aggregate sorts by output and skips failing airports")
{
    ComparatorFixture fx;
    const AggregateReport report = fx.comparator.aggregate_all(AirportQuery{});

    REQUIRE(report.airports.size() == 2);
    CHECK(report.airports[0].code == "BIG");
    CHECK(report.airports[1].code == "TST");
    CHECK(report.airports[0].totals.annual_mwh() > report.airports[1].totals.annual_mwh());

    CHECK(report.skipped == std::vector<std::string>{"DRY", "EMP"});

    CHECK(report.totals.airport_count == 2);
    CHECK(report.totals.building_count == 4);
    CHECK(report.totals.annual_mwh ==
          doctest::Approx(report.airports[0].totals.annual_mwh() + report.airports[1].totals.annual_mwh()));
    CHECK(report.totals.capacity_mw ==
          doctest::Approx(report.airports[0].totals.capacity_mw() + report.airports[1].totals.capacity_mw()));
    CHECK(report.totals.homes_powered ==
          static_cast<u64>(std::floor(report.totals.annual_mwh * 1000.0 / 10500.0)));
}

TEST_CASE("Aggregate reuses cached resolutions")
{
    ComparatorFixture fx;
    const std::vector<std::string> codes{"TST", "BIG"};
    (void)fx.comparator.compare(codes, AirportQuery{});
    const std::size_t before = fx.cache.stats().computations;

    (void)fx.comparator.aggregate_all(AirportQuery{});

    // TST and BIG were cached; DRY and EMP are computed now
    CHECK(fx.cache.stats().computations == before + 2);
}
