/// @file test_footprint_index.cpp
/// @brief Unit tests for helioport::geo::FootprintIndex.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "geo/footprint_index.hpp"
#include "geo/geometry.hpp"

#include <vector>

using namespace helioport;
using namespace helioport::geo;

static BoundingBox box(f64 min_lat, f64 min_lon, f64 max_lat, f64 max_lon)
{
    return BoundingBox{.min_lat = min_lat, .min_lon = min_lon, .max_lat = max_lat, .max_lon = max_lon};
}

TEST_CASE("Empty index returns no candidates")
{
    const FootprintIndex index;
    CHECK(index.size() == 0);
    CHECK(index.query(box(33.0, -84.0, 33.1, -83.9)).empty());
}

TEST_CASE("Insert returns sequential indices")
{
    FootprintIndex index;
    CHECK(index.insert(box(33.000, -84.000, 33.001, -83.999)) == 0);
    CHECK(index.insert(box(33.010, -84.000, 33.011, -83.999)) == 1);
    CHECK(index.size() == 2);
}

TEST_CASE("Query finds only intersecting boxes")
{
    FootprintIndex index;
    index.insert(box(33.6400, -84.4300, 33.6410, -84.4290));   // 0
    index.insert(box(33.6405, -84.4295, 33.6415, -84.4285));   // 1, overlaps 0
    index.insert(box(33.7000, -84.3000, 33.7010, -84.2990));   // 2, far away

    const std::vector<std::size_t> hits = index.query(box(33.6402, -84.4298, 33.6406, -84.4294));
    CHECK(hits == std::vector<std::size_t>{0, 1});

    CHECK(index.query(box(33.7005, -84.2995, 33.7006, -84.2994)) == std::vector<std::size_t>{2});
    CHECK(index.query(box(34.0, -85.0, 34.001, -84.999)).empty());
}

TEST_CASE("Boxes spanning several cells are reported once")
{
    FootprintIndex index(0.001);
    index.insert(box(33.6400, -84.4300, 33.6450, -84.4250));

    const auto hits = index.query(box(33.6390, -84.4310, 33.6460, -84.4240));
    CHECK(hits == std::vector<std::size_t>{0});
}

TEST_CASE("Boxes on a cell boundary are found from both sides")
{
    FootprintIndex index(0.01);
    index.insert(box(33.995, -84.005, 34.005, -83.995));

    CHECK(index.query(box(33.990, -84.010, 33.996, -84.004)).size() == 1);
    CHECK(index.query(box(34.004, -83.996, 34.010, -83.990)).size() == 1);
}

TEST_CASE("Oversized boxes bypass the grid but stay queryable")
{
    FootprintIndex index(0.001);
    const std::size_t huge = index.insert(box(30.0, -90.0, 35.0, -80.0));
    const std::size_t small = index.insert(box(33.6400, -84.4300, 33.6410, -84.4290));

    SUBCASE("Small query sees the oversized box")
    {
        const auto hits = index.query(box(33.6401, -84.4299, 33.6402, -84.4298));
        CHECK(hits == std::vector<std::size_t>{huge, small});
    }

    SUBCASE("Oversized query scans every box")
    {
        const auto hits = index.query(box(20.0, -100.0, 40.0, -70.0));
        CHECK(hits == std::vector<std::size_t>{huge, small});
    }
}

TEST_CASE("Non-positive cell size falls back to the default")
{
    const FootprintIndex index(0.0);
    CHECK(index.cellSizeDeg() == FootprintIndex::kDefaultCellSizeDeg);
}
