/// @file pointing_limits.cpp
/// @brief Default pointing limits for known telescopes.

#include "observatory/pointing_limits.hpp"

#include "core/types.hpp"

#include <array>

namespace telesite
{

namespace
{
    using namespace astro_constants;

    struct LimitsEntry
    {
        std::string_view mnemonic;
        PointingLimits limits;
    };

    const std::array kLimits = {
        LimitsEntry{"JCMT",  PointingLimits::azel({5.0 * kDegToRad, 88.0 * kDegToRad})},
        LimitsEntry{"UKIRT", PointingLimits::hadec({-4.5 * kHourToRad, 4.5 * kHourToRad},
                                                   {-42.0 * kDegToRad, 60.0 * kDegToRad})},
    };
} // namespace

std::string_view to_string(MountType type)
{
    switch (type)
    {
    case MountType::AzEl:  return "AZEL";
    case MountType::HaDec: return "HADEC";
    case MountType::None:  break;
    }
    return "NONE";
}

PointingLimits PointingLimits::azel(AxisRange el)
{
    PointingLimits limits;
    limits.type = MountType::AzEl;
    limits.el = el;
    return limits;
}

PointingLimits PointingLimits::hadec(AxisRange ha, AxisRange dec)
{
    PointingLimits limits;
    limits.type = MountType::HaDec;
    limits.ha = ha;
    limits.dec = dec;
    return limits;
}

PointingLimits PointingLimits::horizon()
{
    return azel({0.0, astro_constants::kHalfPi});
}

PointingLimits LimitsTable::lookup(std::string_view mnemonic)
{
    for (const auto& entry : kLimits)
    {
        if (entry.mnemonic == mnemonic)
        {
            return entry.limits;
        }
    }
    return PointingLimits::none();
}

PointingLimits LimitsTable::default_for(std::string_view mnemonic)
{
    PointingLimits limits = lookup(mnemonic);
    if (limits.type == MountType::None)
    {
        return PointingLimits::horizon();
    }
    return limits;
}

} // namespace telesite
