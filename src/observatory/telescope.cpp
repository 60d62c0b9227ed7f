/// @file telescope.cpp
/// @brief Telescope record accessors and re-resolution.

#include "observatory/telescope.hpp"

#include "core/config.hpp"
#include "core/logger.hpp"
#include "observatory/telescope_resolver.hpp"

#include <spdlog/fmt/fmt.h>

#include <utility>

namespace telesite
{

namespace
{
    std::string format_angle(f64 radians, astro::AngleUnit unit)
    {
        switch (unit)
        {
        case astro::AngleUnit::Radians:
            return fmt::format("{:.9f}", radians);
        case astro::AngleUnit::Degrees:
            return fmt::format("{:.6f}", astro::AngleFormat::to_degrees(radians));
        case astro::AngleUnit::Sexagesimal:
            break;
        }
        return astro::AngleFormat::format_sexagesimal(radians, core::Config::get().separator);
    }
} // namespace

std::string_view to_string(SiteSource source)
{
    switch (source)
    {
    case SiteSource::PrimaryCatalog: return "catalog";
    case SiteSource::MpcCatalog:     return "mpc";
    case SiteSource::Explicit:       return "explicit";
    }
    return "unknown";
}

std::string_view to_string(Representation representation)
{
    switch (representation)
    {
    case Representation::Geodetic:   return "geodetic";
    case Representation::Geocentric: return "geocentric";
    case Representation::Parallax:   return "parallax";
    }
    return "unknown";
}

Telescope::Telescope(SiteDescription site)
    : m_site(std::move(site))
    , m_limits(LimitsTable::default_for(m_site.name))
{
}

f64 Telescope::longitude_deg() const
{
    return astro::AngleFormat::to_degrees(m_site.longitude);
}

std::string Telescope::longitude_string(astro::AngleUnit unit) const
{
    return format_angle(m_site.longitude, unit);
}

f64 Telescope::latitude_deg() const
{
    return astro::AngleFormat::to_degrees(m_site.geodetic.latitude);
}

std::string Telescope::latitude_string(astro::AngleUnit unit) const
{
    return format_angle(m_site.geodetic.latitude, unit);
}

std::optional<Telescope> Telescope::renamed(std::string_view name) const
{
    return TelescopeResolver::resolve_by_name(name);
}

std::optional<Telescope> Telescope::recoded(std::string_view code) const
{
    return TelescopeResolver::resolve_by_code(code);
}

bool Telescope::set_name(std::string_view name)
{
    return replace_with(renamed(name));
}

bool Telescope::set_code(std::string_view code)
{
    return replace_with(recoded(code));
}

bool Telescope::replace_with(std::optional<Telescope> resolved)
{
    if (!resolved)
    {
        TSITE_DEBUG("Telescope: Keeping {} after failed re-resolution", m_site.name);
        return false;
    }
    *this = std::move(*resolved);
    return true;
}

} // namespace telesite
