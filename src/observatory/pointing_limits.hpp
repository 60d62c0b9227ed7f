#pragma once

/// @file pointing_limits.hpp
/// @brief Mount pointing limits and the table of per-telescope defaults.

#include "core/types.hpp"

#include <optional>
#include <string_view>

namespace telesite
{
    /// @brief Mount geometry the limits apply to.
    enum class MountType
    {
        None,
        AzEl,
        HaDec,
    };

    [[nodiscard]] std::string_view to_string(MountType type);

    /// @brief Closed interval on one axis (radians).
    struct AxisRange
    {
        f64 min;
        f64 max;

        [[nodiscard]] bool contains(f64 value) const { return value >= min && value <= max; }

        bool operator==(const AxisRange&) const = default;
    };

    /// @brief Pointing-limit policy for a mount.
    ///
    /// AzEl mounts constrain elevation; HaDec mounts constrain hour angle
    /// and declination. Axes that do not apply are unset.
    struct PointingLimits
    {
        MountType type{MountType::None};
        std::optional<AxisRange> el;
        std::optional<AxisRange> ha;
        std::optional<AxisRange> dec;

        [[nodiscard]] static PointingLimits none() { return {}; }
        [[nodiscard]] static PointingLimits azel(AxisRange el);
        [[nodiscard]] static PointingLimits hadec(AxisRange ha, AxisRange dec);

        /// @brief Elevation 0..90 degrees.
        [[nodiscard]] static PointingLimits horizon();

        bool operator==(const PointingLimits&) const = default;
    };

    /// @brief Static table of default limits for telescopes with known mounts.
    class LimitsTable
    {
    public:
        LimitsTable() = delete;

        /// @brief Limits for a mnemonic; a None-typed spec when the telescope is not listed.
        [[nodiscard]] static PointingLimits lookup(std::string_view mnemonic);

        /// @brief Limits applied to a freshly resolved telescope: the table
        /// entry, or horizon() when there is none.
        [[nodiscard]] static PointingLimits default_for(std::string_view mnemonic);
    };

} // namespace telesite
