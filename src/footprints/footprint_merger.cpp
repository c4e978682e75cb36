/// @file footprint_merger.cpp
/// @brief Footprint merge and duplicate removal.

#include "footprints/footprint_merger.hpp"

#include "core/logger.hpp"
#include "geo/footprint_index.hpp"

#include <utility>

namespace helioport::footprints
{

MergeResult FootprintMerger::merge(std::span<const Footprint> primary,
                                   std::span<const Footprint> secondary,
                                   const geo::Coordinate& center,
                                   f64 radius_km)
{
    MergeResult result;
    result.stats.primary_in = primary.size();
    result.stats.secondary_in = secondary.size();

    // -----------------------------------------------------------------
    // Filter both sources: radius first, then geometry validity
    // -----------------------------------------------------------------
    std::vector<BuildingRecord> primary_kept;
    std::vector<BuildingRecord> secondary_kept;
    collect(primary, FootprintSource::Primary, center, radius_km, primary_kept, result.stats);
    collect(secondary, FootprintSource::Secondary, center, radius_km, secondary_kept, result.stats);

    // -----------------------------------------------------------------
    // Index primary survivors by bounding box
    // -----------------------------------------------------------------
    geo::FootprintIndex index;
    for (const BuildingRecord& building : primary_kept)
    {
        index.insert(geo::Geometry::bounding_box(building.geometry));
    }

    // -----------------------------------------------------------------
    // Output: every primary, then secondaries with no matching primary
    // -----------------------------------------------------------------
    result.buildings = std::move(primary_kept);
    result.stats.primary_kept = result.buildings.size();

    for (BuildingRecord& candidate : secondary_kept)
    {
        bool duplicate = false;
        for (std::size_t idx : index.query(geo::Geometry::bounding_box(candidate.geometry)))
        {
            const f64 ratio = geo::Geometry::overlap_ratio(result.buildings[idx].geometry, candidate.geometry);
            if (ratio >= kDuplicateOverlapRatio)
            {
                duplicate = true;
                break;
            }
        }

        if (duplicate)
        {
            ++result.stats.duplicates;
            continue;
        }

        result.buildings.push_back(std::move(candidate));
        ++result.stats.secondary_kept;
    }

    for (std::size_t i = 0; i < result.buildings.size(); ++i)
    {
        result.buildings[i].id = static_cast<u32>(i);
    }

    HPT_CORE_DEBUG("FootprintMerger: {} primary + {} secondary in, {} out of radius, {} invalid, "
                   "{} duplicates, {} buildings out",
                   result.stats.primary_in, result.stats.secondary_in, result.stats.out_of_radius,
                   result.stats.invalid, result.stats.duplicates, result.buildings.size());

    return result;
}

void FootprintMerger::collect(std::span<const Footprint> source,
                              FootprintSource tag,
                              const geo::Coordinate& center,
                              f64 radius_km,
                              std::vector<BuildingRecord>& out,
                              MergeStats& stats)
{
    for (const Footprint& footprint : source)
    {
        geo::Polygon ring = geo::Geometry::close_ring(footprint.geometry);

        const geo::Coordinate centroid = geo::Geometry::centroid(ring);
        const f64 distance_km = geo::Geometry::haversine_km(centroid, center);
        // Negated so a NaN distance is rejected too
        if (!(distance_km <= radius_km))
        {
            ++stats.out_of_radius;
            continue;
        }

        if (!geo::Geometry::is_valid_footprint(ring))
        {
            ++stats.invalid;
            continue;
        }

        BuildingRecord building;
        building.area_m2 = geo::Geometry::area_m2(ring);
        building.geometry = std::move(ring);
        building.centroid = centroid;
        building.distance_km = distance_km;
        building.source = tag;
        out.push_back(std::move(building));
    }
}

} // namespace helioport::footprints
