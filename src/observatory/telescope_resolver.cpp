/// @file telescope_resolver.cpp
/// @brief Identifier resolution for the three site sources.

#include "observatory/telescope_resolver.hpp"

#include "catalog/mpc_catalog.hpp"
#include "catalog/observatory_catalog.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <utility>

namespace telesite
{

using astro::GeocentricCoord;
using astro::GeodeticCoord;
using astro::Geodesy;
using astro::ParallaxConstants;

namespace
{
    std::string to_upper(std::string_view text)
    {
        std::string out(text);
        std::transform(out.begin(), out.end(), out.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return out;
    }

    struct Coordinates
    {
        GeodeticCoord geodetic;
        GeocentricCoord geocentric;
        ParallaxConstants parallax;
    };

    // -----------------------------------------------------------------
    // Fill the two derived representations from the native one.
    //
    //   geodetic   → geocentric → parallax
    //   geocentric → geodetic, parallax
    //   parallax   → geocentric → geodetic
    //
    // An unset native input leaves the derived values unset and the
    // site unresolvable.
    // -----------------------------------------------------------------
    std::optional<Coordinates> complete(Representation native,
                                        std::optional<GeodeticCoord> geod,
                                        std::optional<GeocentricCoord> geoc,
                                        std::optional<ParallaxConstants> par)
    {
        switch (native)
        {
        case Representation::Geodetic:
            geoc = Geodesy::geodetic_to_geocentric(geod);
            par  = Geodesy::geocentric_to_parallax(geoc);
            break;
        case Representation::Geocentric:
            geod = Geodesy::geocentric_to_geodetic(geoc);
            par  = Geodesy::geocentric_to_parallax(geoc);
            break;
        case Representation::Parallax:
            geoc = Geodesy::parallax_to_geocentric(par);
            geod = Geodesy::geocentric_to_geodetic(geoc);
            break;
        }

        if (!geod || !geoc || !par)
        {
            TSITE_WARN("TelescopeResolver: Cannot derive coordinates from missing {} values",
                       to_string(native));
            return std::nullopt;
        }

        return Coordinates{
            .geodetic   = *geod,
            .geocentric = *geoc,
            .parallax   = *par,
        };
    }

    // -----------------------------------------------------------------
    // Source variants
    // -----------------------------------------------------------------

    std::optional<SiteDescription> from_catalog_entry(const catalog::ObservatoryEntry& entry)
    {
        const auto coords = complete(Representation::Geodetic,
                                     GeodeticCoord{.latitude = entry.latitude, .altitude = entry.altitude},
                                     std::nullopt, std::nullopt);
        if (!coords)
        {
            return std::nullopt;
        }

        return SiteDescription{
            .name       = entry.mnemonic,
            .full_name  = entry.full_name,
            .obs_code   = catalog::ObservatoryCatalog::mpc_code(entry.mnemonic),
            .longitude  = -entry.west_longitude,
            .geodetic   = coords->geodetic,
            .geocentric = coords->geocentric,
            .parallax   = coords->parallax,
            .source     = SiteSource::PrimaryCatalog,
            .native     = Representation::Geodetic,
        };
    }

    std::optional<SiteDescription> from_mpc_site(const std::string& code, const catalog::MpcSite& site)
    {
        const auto coords = complete(Representation::Parallax, std::nullopt, std::nullopt,
                                     ParallaxConstants{.c = site.parallax_c, .s = site.parallax_s});
        if (!coords)
        {
            return std::nullopt;
        }

        return SiteDescription{
            .name       = site.name,
            .full_name  = site.name,
            .obs_code   = code,
            .longitude  = site.longitude,
            .geodetic   = coords->geodetic,
            .geocentric = coords->geocentric,
            .parallax   = coords->parallax,
            .source     = SiteSource::MpcCatalog,
            .native     = Representation::Parallax,
        };
    }

    std::optional<SiteDescription> from_fields(const ExplicitFields& fields)
    {
        if (!fields.name || !fields.longitude)
        {
            TSITE_WARN("TelescopeResolver: Explicit fields need both a name and a longitude");
            return std::nullopt;
        }

        std::optional<GeodeticCoord> geod;
        std::optional<GeocentricCoord> geoc;
        std::optional<ParallaxConstants> par;
        Representation native = Representation::Geodetic;

        if (fields.latitude)
        {
            f64 altitude = 0.0;
            if (fields.altitude)
            {
                altitude = *fields.altitude;
            }
            else
            {
                TSITE_WARN("TelescopeResolver: No altitude given for {}, assuming 0 m", *fields.name);
            }
            geod = GeodeticCoord{.latitude = *fields.latitude, .altitude = altitude};
            native = Representation::Geodetic;
        }
        else if (fields.geocentric_latitude && fields.geocentric_distance)
        {
            if (!(*fields.geocentric_distance > 0.0))
            {
                TSITE_WARN("TelescopeResolver: Geocentric distance for {} must be positive", *fields.name);
                return std::nullopt;
            }
            geoc = GeocentricCoord{.latitude = *fields.geocentric_latitude,
                                   .distance = *fields.geocentric_distance};
            native = Representation::Geocentric;
        }
        else if (fields.parallax)
        {
            const f64 rho = std::hypot(fields.parallax->c, fields.parallax->s);
            if (!(rho > 0.0))
            {
                TSITE_WARN("TelescopeResolver: Parallax constants for {} place the site at the geocentre",
                           *fields.name);
                return std::nullopt;
            }
            par = *fields.parallax;
            native = Representation::Parallax;
        }
        else
        {
            TSITE_WARN("TelescopeResolver: No coordinates supplied for {}", *fields.name);
            return std::nullopt;
        }

        const auto coords = complete(native, geod, geoc, par);
        if (!coords)
        {
            return std::nullopt;
        }

        const std::string name = to_upper(*fields.name);
        return SiteDescription{
            .name       = name,
            .full_name  = fields.full_name.value_or(*fields.name),
            .obs_code   = fields.obs_code,
            .longitude  = *fields.longitude,
            .geodetic   = coords->geodetic,
            .geocentric = coords->geocentric,
            .parallax   = coords->parallax,
            .source     = SiteSource::Explicit,
            .native     = native,
        };
    }
} // namespace

// -----------------------------------------------------------------
// Public entry points
// -----------------------------------------------------------------

std::optional<Telescope> TelescopeResolver::resolve_by_name(std::string_view name)
{
    const std::string upper = to_upper(name);

    if (const auto entry = catalog::ObservatoryCatalog::find(upper))
    {
        if (auto site = from_catalog_entry(*entry))
        {
            TSITE_DEBUG("TelescopeResolver: {} found in observatory catalog", upper);
            return Telescope(std::move(*site));
        }
    }

    return resolve_by_code(upper);
}

std::optional<Telescope> TelescopeResolver::resolve_by_code(std::string_view code)
{
    const std::string upper = to_upper(code);

    const auto site = catalog::MpcCatalog::shared().find(upper);
    if (!site)
    {
        TSITE_DEBUG("TelescopeResolver: {} not recognized", upper);
        return std::nullopt;
    }

    auto description = from_mpc_site(upper, *site);
    if (!description)
    {
        return std::nullopt;
    }

    TSITE_DEBUG("TelescopeResolver: {} found in MPC table as {}", upper, site->name);
    return Telescope(std::move(*description));
}

std::optional<Telescope> TelescopeResolver::resolve(const ExplicitFields& fields)
{
    auto description = from_fields(fields);
    if (!description)
    {
        return std::nullopt;
    }
    return Telescope(std::move(*description));
}

std::vector<std::string> TelescopeResolver::tel_names()
{
    std::vector<std::string> names;
    for (i32 i = 1;; ++i)
    {
        catalog::ObservatoryEntry entry = catalog::ObservatoryCatalog::entry(i);
        if (entry.is_sentinel())
        {
            break;
        }
        names.push_back(std::move(entry.mnemonic));
    }
    std::sort(names.begin(), names.end());
    return names;
}

} // namespace telesite
