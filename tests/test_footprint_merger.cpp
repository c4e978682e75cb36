/// @file test_footprint_merger.cpp
/// @brief Unit tests for helioport::footprints::FootprintMerger.
///
/// Verifies radius and validity filtering, overlap-based deduplication with
/// PRIMARY precedence, output ordering and derived building fields.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "footprints/footprint_merger.hpp"
#include "geo/geometry.hpp"
#include "test_helpers.hpp"

#include <vector>

using namespace helioport;
using namespace helioport::footprints;
using helioport::geo::Geometry;
using helioport::geo::Polygon;

static constexpr f64 kRadiusKm = 5.0;

static Footprint primary(Polygon p) { return test::footprint(std::move(p), FootprintSource::Primary); }
static Footprint secondary(Polygon p) { return test::footprint(std::move(p), FootprintSource::Secondary); }

// =================================================================
// Deduplication
// =================================================================

TEST_CASE("Identical primary and secondary footprints yield one primary building")
{
    const Polygon roof = test::rect(test::kAtl, 0.01, 0.01, 0.001, 0.001);
    const std::vector<Footprint> p{primary(roof)};
    const std::vector<Footprint> s{secondary(roof)};

    const MergeResult result = FootprintMerger::merge(p, s, test::kAtl, kRadiusKm);

    REQUIRE(result.buildings.size() == 1);
    CHECK(result.buildings[0].source == FootprintSource::Primary);
    CHECK(result.stats.duplicates == 1);
    CHECK(result.stats.primary_kept == 1);
    CHECK(result.stats.secondary_kept == 0);
}

TEST_CASE("Overlap at or above 90% drops the secondary regardless of input order")
{
    const Polygon a = test::rect(test::kAtl, 0.010, 0.010, 0.001, 0.001);
    const Polygon b = test::rect(test::kAtl, -0.010, 0.020, 0.001, 0.001);
    // 5% shift north: 95% of the smaller polygon overlaps
    const Polygon a_shifted = test::rect(test::kAtl, 0.01005, 0.010, 0.001, 0.001);
    const Polygon b_copy = b;

    const std::vector<Footprint> p{primary(a), primary(b)};

    SUBCASE("Secondaries in primary order")
    {
        const std::vector<Footprint> s{secondary(a_shifted), secondary(b_copy)};
        const MergeResult result = FootprintMerger::merge(p, s, test::kAtl, kRadiusKm);
        CHECK(result.buildings.size() == 2);
        CHECK(result.stats.duplicates == 2);
    }

    SUBCASE("Secondaries reversed")
    {
        const std::vector<Footprint> s{secondary(b_copy), secondary(a_shifted)};
        const MergeResult result = FootprintMerger::merge(p, s, test::kAtl, kRadiusKm);
        CHECK(result.buildings.size() == 2);
        CHECK(result.stats.duplicates == 2);
        for (const BuildingRecord& b : result.buildings)
        {
            CHECK(b.source == FootprintSource::Primary);
        }
    }
}

TEST_CASE("Overlap below 90% keeps both footprints")
{
    const Polygon a = test::rect(test::kAtl, 0.010, 0.010, 0.001, 0.001);
    // 20% shift: 80% overlap
    const Polygon partial = test::rect(test::kAtl, 0.0102, 0.010, 0.001, 0.001);

    const std::vector<Footprint> p{primary(a)};
    const std::vector<Footprint> s{secondary(partial)};
    const MergeResult result = FootprintMerger::merge(p, s, test::kAtl, kRadiusKm);

    REQUIRE(result.buildings.size() == 2);
    CHECK(result.buildings[0].source == FootprintSource::Primary);
    CHECK(result.buildings[1].source == FootprintSource::Secondary);
    CHECK(result.stats.duplicates == 0);
}

TEST_CASE("Small secondary inside a large primary is a duplicate")
{
    const Polygon hangar = test::rect(test::kAtl, 0.010, 0.010, 0.002, 0.002);
    const Polygon inner = test::rect(test::kAtl, 0.0105, 0.0105, 0.0005, 0.0005);

    const std::vector<Footprint> p{primary(hangar)};
    const std::vector<Footprint> s{secondary(inner)};
    const MergeResult result = FootprintMerger::merge(p, s, test::kAtl, kRadiusKm);

    CHECK(result.buildings.size() == 1);
    CHECK(result.stats.duplicates == 1);
}

// =================================================================
// Single source
// =================================================================

TEST_CASE("Merger proceeds when one source is empty")
{
    const std::vector<Footprint> roofs{
        primary(test::rect(test::kAtl, 0.010, 0.010, 0.001, 0.001)),
        primary(test::rect(test::kAtl, -0.010, -0.010, 0.001, 0.001)),
    };
    const std::vector<Footprint> none;

    SUBCASE("Primary only")
    {
        const MergeResult result = FootprintMerger::merge(roofs, none, test::kAtl, kRadiusKm);
        CHECK(result.buildings.size() == 2);
        CHECK(result.stats.secondary_in == 0);
    }

    SUBCASE("Secondary only")
    {
        const MergeResult result = FootprintMerger::merge(none, roofs, test::kAtl, kRadiusKm);
        REQUIRE(result.buildings.size() == 2);
        CHECK(result.buildings[0].source == FootprintSource::Secondary);
        CHECK(result.stats.secondary_kept == 2);
    }

    SUBCASE("Both empty")
    {
        const MergeResult result = FootprintMerger::merge(none, none, test::kAtl, kRadiusKm);
        CHECK(result.buildings.empty());
    }
}

// =================================================================
// Filtering
// =================================================================

TEST_CASE("Footprints outside the radius are rejected")
{
    const std::vector<Footprint> p{
        primary(test::rect(test::kAtl, 0.010, 0.010, 0.001, 0.001)),    // ~1.5 km
        primary(test::rect(test::kAtl, 0.100, 0.100, 0.001, 0.001)),    // ~14 km
    };
    const MergeResult result = FootprintMerger::merge(p, {}, test::kAtl, kRadiusKm);

    REQUIRE(result.buildings.size() == 1);
    CHECK(result.stats.out_of_radius == 1);
    CHECK(result.buildings[0].distance_km <= kRadiusKm);
}

TEST_CASE("Invalid footprints are dropped and counted")
{
    const Polygon line{{test::kAtl, {test::kAtl.lat + 0.001, test::kAtl.lon}, test::kAtl}};
    const std::vector<Footprint> p{
        primary(test::rect(test::kAtl, 0.010, 0.010, 0.001, 0.001)),
        primary(test::bowtie(test::kAtl)),
    };
    const std::vector<Footprint> s{secondary(line)};

    const MergeResult result = FootprintMerger::merge(p, s, test::kAtl, kRadiusKm);

    CHECK(result.buildings.size() == 1);
    CHECK(result.stats.invalid == 2);
}

// =================================================================
// Output shape
// =================================================================

TEST_CASE("Output is primaries then secondaries, ids in output order")
{
    const std::vector<Footprint> p{
        primary(test::rect(test::kAtl, 0.010, 0.010, 0.001, 0.001)),
        primary(test::rect(test::kAtl, 0.020, 0.010, 0.001, 0.001)),
    };
    const std::vector<Footprint> s{
        secondary(test::rect(test::kAtl, -0.010, 0.010, 0.001, 0.001)),
        secondary(test::rect(test::kAtl, -0.020, 0.010, 0.001, 0.001)),
    };

    const MergeResult result = FootprintMerger::merge(p, s, test::kAtl, kRadiusKm);

    REQUIRE(result.buildings.size() == 4);
    for (std::size_t i = 0; i < result.buildings.size(); ++i)
    {
        CHECK(result.buildings[i].id == i);
    }
    CHECK(result.buildings[0].centroid.lat == doctest::Approx(test::kAtl.lat + 0.0105));
    CHECK(result.buildings[1].centroid.lat == doctest::Approx(test::kAtl.lat + 0.0205));
    CHECK(result.buildings[2].source == FootprintSource::Secondary);
    CHECK(result.buildings[2].centroid.lat == doctest::Approx(test::kAtl.lat - 0.0095));
    CHECK(result.buildings[3].centroid.lat == doctest::Approx(test::kAtl.lat - 0.0195));
}

TEST_CASE("Derived fields are recomputed from geometry and rings are closed")
{
    Polygon open = test::rect(test::kAtl, 0.010, 0.010, 0.001, 0.001);
    open.ring.pop_back();
    const std::vector<Footprint> p{primary(open)};

    const MergeResult result = FootprintMerger::merge(p, {}, test::kAtl, kRadiusKm);

    REQUIRE(result.buildings.size() == 1);
    const BuildingRecord& b = result.buildings[0];
    CHECK(b.geometry.ring.size() == 5);
    CHECK(b.geometry.ring.front() == b.geometry.ring.back());
    CHECK(b.area_m2 == doctest::Approx(Geometry::area_m2(b.geometry)));
    CHECK(b.distance_km == doctest::Approx(Geometry::haversine_km(b.centroid, test::kAtl)));
}

TEST_CASE("Merging is deterministic")
{
    const std::vector<Footprint> p{
        primary(test::rect(test::kAtl, 0.010, 0.010, 0.001, 0.001)),
        primary(test::rect(test::kAtl, 0.012, 0.010, 0.0005, 0.0008)),
    };
    const std::vector<Footprint> s{
        secondary(test::rect(test::kAtl, 0.0101, 0.010, 0.001, 0.001)),
        secondary(test::rect(test::kAtl, -0.010, 0.010, 0.001, 0.001)),
    };

    const MergeResult first = FootprintMerger::merge(p, s, test::kAtl, kRadiusKm);
    const MergeResult second = FootprintMerger::merge(p, s, test::kAtl, kRadiusKm);

    CHECK(first.buildings == second.buildings);
    CHECK(first.stats == second.stats);
}
