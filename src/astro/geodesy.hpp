#pragma once

/// @file geodesy.hpp
/// @brief Geodetic, geocentric and parallax-constant representations of a site.

#include "core/types.hpp"

#include <optional>

namespace telesite::astro
{
    /// @brief Position relative to the reference ellipsoid.
    struct GeodeticCoord
    {
        f64 latitude;   ///< Geodetic latitude (radians, north positive)
        f64 altitude;   ///< Height above the ellipsoid (metres)
    };

    /// @brief Position relative to the Earth's centre in the meridian plane.
    struct GeocentricCoord
    {
        f64 latitude;   ///< Geocentric latitude (radians)
        f64 distance;   ///< Distance from the Earth's centre (metres)
    };

    /// @brief Normalized geocentric position in Earth equatorial radii.
    struct ParallaxConstants
    {
        f64 c;          ///< rho * sin(geocentric latitude)
        f64 s;          ///< rho * cos(geocentric latitude)
    };

    /// @brief Static conversions over the oblate-spheroid Earth model in
    /// geodetic_constants.
    ///
    /// The four conversions form two inverse pairs. The optional overloads
    /// return std::nullopt when their input is unset, so a missing native
    /// representation leaves the derived ones undefined instead of failing.
    class Geodesy
    {
    public:
        Geodesy() = delete;

        /// @brief Geodetic (latitude, altitude) → geocentric (latitude, distance).
        [[nodiscard]] static GeocentricCoord geodetic_to_geocentric(const GeodeticCoord& geod);

        /// @brief Geocentric (latitude, distance) → geodetic (latitude, altitude).
        ///
        /// Closed-form single step; agrees with geodetic_to_geocentric() to
        /// better than 1e-9 rad and 1e-6 m for terrestrial sites.
        [[nodiscard]] static GeodeticCoord geocentric_to_geodetic(const GeocentricCoord& geoc);

        /// @brief Geocentric → parallax constants (C, S).
        [[nodiscard]] static ParallaxConstants geocentric_to_parallax(const GeocentricCoord& geoc);

        /// @brief Parallax constants (C, S) → geocentric.
        [[nodiscard]] static GeocentricCoord parallax_to_geocentric(const ParallaxConstants& par);

        [[nodiscard]] static std::optional<GeocentricCoord>
            geodetic_to_geocentric(const std::optional<GeodeticCoord>& geod);

        [[nodiscard]] static std::optional<GeodeticCoord>
            geocentric_to_geodetic(const std::optional<GeocentricCoord>& geoc);

        [[nodiscard]] static std::optional<ParallaxConstants>
            geocentric_to_parallax(const std::optional<GeocentricCoord>& geoc);

        [[nodiscard]] static std::optional<GeocentricCoord>
            parallax_to_geocentric(const std::optional<ParallaxConstants>& par);

        /// @brief Sea-level radius of the ellipsoid at a geocentric latitude (metres).
        [[nodiscard]] static f64 sea_level_radius(f64 geocentric_latitude);
    };

} // namespace telesite::astro
