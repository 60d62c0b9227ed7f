/// @file angle_format.cpp
/// @brief Implementation of angle display conversions.

#include "astro/angle_format.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cmath>

namespace telesite::astro
{

f64 AngleFormat::to_degrees(f64 radians)
{
    return radians * astro_constants::kRadToDeg;
}

// -----------------------------------------------------------------
// Radians → (sign, d, m, s, fraction)
//
// Work in integer units of 10^-decimals arcsec so the rounding
// carries naturally: 59.996" at 2 decimals becomes 1' 00.00".
// -----------------------------------------------------------------

Sexagesimal AngleFormat::to_sexagesimal(f64 radians, i32 decimals)
{
    decimals = std::clamp(decimals, 0, kMaxDecimals);

    i64 scale = 1;
    for (i32 i = 0; i < decimals; ++i)
    {
        scale *= 10;
    }

    const f64 arcsec = std::abs(radians) * astro_constants::kRadToArcSec;
    const auto units = static_cast<i64>(std::llround(arcsec * static_cast<f64>(scale)));

    const i64 whole_seconds = units / scale;

    return Sexagesimal{
        .sign     = (radians < 0.0) ? '-' : '+',
        .degrees  = whole_seconds / 3600,
        .minutes  = static_cast<i32>((whole_seconds / 60) % 60),
        .seconds  = static_cast<i32>(whole_seconds % 60),
        .fraction = units % scale,
        .decimals = decimals,
    };
}

std::string AngleFormat::format_sexagesimal(f64 radians, std::string_view separator, i32 decimals)
{
    const Sexagesimal dms = to_sexagesimal(radians, decimals);

    std::string out = fmt::format("{}{}{}{}{}{}",
                                  dms.sign == '-' ? "-" : "",
                                  dms.degrees, separator,
                                  dms.minutes, separator,
                                  dms.seconds);
    if (dms.decimals > 0)
    {
        out += fmt::format(".{:0{}d}", dms.fraction, dms.decimals);
    }
    return out;
}

} // namespace telesite::astro
