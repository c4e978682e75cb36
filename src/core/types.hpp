#pragma once

#include <glm/glm.hpp>
#include <glm/gtc/constants.hpp>

#include <cstdint>

namespace helioport
{
    // Precision aliases
    using f32 = float;
    using f64 = double;
    using u8  = uint8_t;
    using u16 = uint16_t;
    using u32 = uint32_t;
    using u64 = uint64_t;
    using i32 = int32_t;
    using i64 = int64_t;

    // Projected plane coordinates (metres, double precision)
    using Vec2d = glm::dvec2;

    // Geodetic constants
    namespace geo_constants
    {
        constexpr f64 kPi              = glm::pi<f64>();
        constexpr f64 kDegToRad        = kPi / 180.0;
        constexpr f64 kRadToDeg        = 180.0 / kPi;
        constexpr f64 kEarthRadiusKm   = 6371.0;
        constexpr f64 kEarthRadiusM    = kEarthRadiusKm * 1000.0;
        constexpr f64 kKmPerDegreeLat  = kEarthRadiusKm * kDegToRad;  // ~111.19 km
    }
}
