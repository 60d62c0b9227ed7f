#pragma once

/// @file telescope.hpp
/// @brief Telescope site record: identity, coordinates in three representations, pointing limits.

#include "astro/angle_format.hpp"
#include "astro/geodesy.hpp"
#include "core/types.hpp"
#include "observatory/pointing_limits.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace telesite
{
    /// @brief Where a telescope record was resolved from.
    enum class SiteSource
    {
        PrimaryCatalog,     ///< Built-in observatory catalog
        MpcCatalog,         ///< MPC observatory-code table
        Explicit,           ///< Caller-supplied fields
    };

    /// @brief Coordinate representation supplied natively by the source.
    enum class Representation
    {
        Geodetic,
        Geocentric,
        Parallax,
    };

    [[nodiscard]] std::string_view to_string(SiteSource source);
    [[nodiscard]] std::string_view to_string(Representation representation);

    /// @brief A fully resolved site. One representation is native, the
    /// other two are derived from it with astro::Geodesy.
    struct SiteDescription
    {
        std::string name;                       ///< Mnemonic (or MPC site name)
        std::string full_name;
        std::optional<std::string> obs_code;    ///< MPC observatory code
        f64 longitude;                          ///< East positive (radians)
        astro::GeodeticCoord geodetic;
        astro::GeocentricCoord geocentric;
        astro::ParallaxConstants parallax;
        SiteSource source;
        Representation native;
    };

    /// @brief A telescope resolved from a catalog or from explicit fields.
    ///
    /// Instances are created by TelescopeResolver. Pointing limits start at
    /// the default for the telescope's name and may be overridden; any
    /// successful re-resolution (set_name / set_code) replaces every
    /// coordinate and resets the limits. A failed re-resolution leaves the
    /// record untouched.
    class Telescope
    {
    public:
        explicit Telescope(SiteDescription site);

        // -----------------------------------------------------------------
        // Identity
        // -----------------------------------------------------------------

        [[nodiscard]] const std::string& name() const { return m_site.name; }
        [[nodiscard]] const std::string& full_name() const { return m_site.full_name; }
        [[nodiscard]] const std::optional<std::string>& obs_code() const { return m_site.obs_code; }
        [[nodiscard]] SiteSource source() const { return m_site.source; }
        [[nodiscard]] Representation native() const { return m_site.native; }
        [[nodiscard]] const SiteDescription& site() const { return m_site; }

        /// @brief Stringified form: the name.
        [[nodiscard]] std::string to_string() const { return m_site.name; }

        // -----------------------------------------------------------------
        // Coordinates
        // -----------------------------------------------------------------

        /// @brief Longitude, east positive (radians).
        [[nodiscard]] f64 longitude() const { return m_site.longitude; }
        [[nodiscard]] f64 longitude_deg() const;
        [[nodiscard]] std::string longitude_string(astro::AngleUnit unit = astro::AngleUnit::Sexagesimal) const;

        /// @brief Geodetic latitude (radians).
        [[nodiscard]] f64 latitude() const { return m_site.geodetic.latitude; }
        [[nodiscard]] f64 latitude_deg() const;
        [[nodiscard]] std::string latitude_string(astro::AngleUnit unit = astro::AngleUnit::Sexagesimal) const;

        /// @brief Height above the ellipsoid (metres).
        [[nodiscard]] f64 altitude() const { return m_site.geodetic.altitude; }

        [[nodiscard]] const astro::GeodeticCoord& geodetic() const { return m_site.geodetic; }
        [[nodiscard]] const astro::GeocentricCoord& geocentric() const { return m_site.geocentric; }
        [[nodiscard]] const astro::ParallaxConstants& parallax() const { return m_site.parallax; }

        // -----------------------------------------------------------------
        // Pointing limits
        // -----------------------------------------------------------------

        [[nodiscard]] const PointingLimits& limits() const { return m_limits; }

        /// @brief Override the limits until the next re-resolution.
        void set_limits(const PointingLimits& limits) { m_limits = limits; }

        // -----------------------------------------------------------------
        // Re-resolution
        // -----------------------------------------------------------------

        /// @brief New record for another catalog name; std::nullopt when unknown.
        [[nodiscard]] std::optional<Telescope> renamed(std::string_view name) const;

        /// @brief New record for an MPC observatory code; std::nullopt when unknown.
        [[nodiscard]] std::optional<Telescope> recoded(std::string_view code) const;

        /// @brief Re-resolve in place by name. Returns false and keeps the current state on failure.
        bool set_name(std::string_view name);

        /// @brief Re-resolve in place by MPC code. Returns false and keeps the current state on failure.
        bool set_code(std::string_view code);

    private:
        bool replace_with(std::optional<Telescope> resolved);

        SiteDescription m_site;
        PointingLimits m_limits;
    };

} // namespace telesite
