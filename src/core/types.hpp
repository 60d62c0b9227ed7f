#pragma once

#include <glm/glm.hpp>
#include <glm/gtc/constants.hpp>

#include <cstdint>

namespace telesite
{
    // Precision aliases
    using f64 = double;
    using u32 = uint32_t;
    using i32 = int32_t;
    using i64 = int64_t;

    // Meridian-plane vectors (x toward the equator, y toward the pole)
    using Vec2d = glm::dvec2;

    // Astronomical constants
    namespace astro_constants
    {
        constexpr f64 kPi          = glm::pi<f64>();
        constexpr f64 kHalfPi      = kPi / 2.0;
        constexpr f64 kDegToRad    = kPi / 180.0;
        constexpr f64 kRadToDeg    = 180.0 / kPi;
        constexpr f64 kHourToRad   = kPi / 12.0;
        constexpr f64 kRadToHour   = 12.0 / kPi;
        constexpr f64 kArcSecToRad = kPi / (180.0 * 3600.0);
        constexpr f64 kRadToArcSec = (180.0 * 3600.0) / kPi;
    }

    // Oblate-spheroid Earth model
    namespace geodetic_constants
    {
        constexpr f64 kEquatorialRadiusM = 6378100.0;
        constexpr f64 kE                 = 0.996647186;   // 1 - flattening
        constexpr f64 kEps               = 0.081819221;   // first eccentricity
        constexpr f64 kEquatorialRadiusSqM = kEquatorialRadiusM * kEquatorialRadiusM;
    }
}
