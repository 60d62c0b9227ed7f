#pragma once

/// @file angle_format.hpp
/// @brief Display conversions for angles: decimal degrees and sexagesimal strings.

#include "core/types.hpp"

#include <string>
#include <string_view>

namespace telesite::astro
{
    /// @brief Requested unit for angle accessors.
    enum class AngleUnit
    {
        Radians,
        Degrees,
        Sexagesimal,
    };

    /// @brief An angle split into sign, degrees, arcminutes, arcseconds and
    /// the decimal fraction of an arcsecond.
    struct Sexagesimal
    {
        char sign;          ///< '+' or '-'
        i64  degrees;
        i32  minutes;
        i32  seconds;
        i64  fraction;      ///< Fraction of a second, in units of 10^-decimals
        i32  decimals;
    };

    /// @brief Static angle formatting helpers.
    class AngleFormat
    {
    public:
        AngleFormat() = delete;

        /// @brief Largest supported number of arcsecond decimals; larger requests are clamped.
        static constexpr i32 kMaxDecimals = 9;

        /// @brief Radians → decimal degrees.
        [[nodiscard]] static f64 to_degrees(f64 radians);

        /// @brief Radians → degrees, arcminutes, arcseconds and fraction.
        ///
        /// The value is rounded to @p decimals places of an arcsecond
        /// (clamped to 0..kMaxDecimals) and the rounding carries into the
        /// higher fields.
        [[nodiscard]] static Sexagesimal to_sexagesimal(f64 radians, i32 decimals = 2);

        /// @brief Radians → "[-]D<sep>M<sep>S.FF".
        ///
        /// The sign is omitted for non-negative angles. Degrees, minutes and
        /// whole seconds are not zero padded; the fraction is padded to
        /// @p decimals digits.
        [[nodiscard]] static std::string format_sexagesimal(f64 radians,
                                                            std::string_view separator = " ",
                                                            i32 decimals = 2);
    };

} // namespace telesite::astro
