#pragma once

/// @file telescope_resolver.hpp
/// @brief Resolves telescope identifiers against the observatory catalogs.

#include "astro/geodesy.hpp"
#include "core/types.hpp"
#include "observatory/telescope.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace telesite
{
    /// @brief Caller-supplied description of a site.
    ///
    /// Requires name and longitude plus one coordinate alternative:
    /// latitude (with optional altitude), geocentric latitude and distance,
    /// or parallax constants. When several are present the first in that
    /// order is native.
    struct ExplicitFields
    {
        std::optional<std::string> name;
        std::optional<std::string> full_name;
        std::optional<std::string> obs_code;
        std::optional<f64> longitude;               ///< East positive (radians)
        std::optional<f64> latitude;                ///< Geodetic (radians)
        std::optional<f64> altitude;                ///< Metres; 0 when omitted with a latitude
        std::optional<f64> geocentric_latitude;     ///< Radians
        std::optional<f64> geocentric_distance;     ///< Metres
        std::optional<astro::ParallaxConstants> parallax;
    };

    /// @brief Static facade over the observatory catalog, the MPC table and
    /// explicit field sets.
    ///
    /// Unknown identifiers and incomplete field sets yield std::nullopt;
    /// nothing here throws.
    class TelescopeResolver
    {
    public:
        TelescopeResolver() = delete;

        /// @brief Resolve a name: the observatory catalog first, then the
        /// identifier as an MPC code. The name is upper-cased.
        [[nodiscard]] static std::optional<Telescope> resolve_by_name(std::string_view name);

        /// @brief Resolve an MPC observatory code against the MPC table only.
        [[nodiscard]] static std::optional<Telescope> resolve_by_code(std::string_view code);

        /// @brief Resolve an explicit field set, deriving the missing representations.
        [[nodiscard]] static std::optional<Telescope> resolve(const ExplicitFields& fields);

        /// @brief All observatory catalog mnemonics, sorted ascending.
        [[nodiscard]] static std::vector<std::string> tel_names();
    };

} // namespace telesite
