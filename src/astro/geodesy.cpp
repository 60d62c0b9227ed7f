/// @file geodesy.cpp
/// @brief Implementation of the geodetic / geocentric / parallax conversions.

#include "astro/geodesy.hpp"

#include "core/types.hpp"

#include <algorithm>
#include <cmath>

namespace telesite::astro
{

using namespace geodetic_constants;

// -----------------------------------------------------------------
// Sea-level radius at geocentric latitude λ
//
//   r² = R_eq² / (1 + (1/E² - 1) × sin²λ)
// -----------------------------------------------------------------

f64 Geodesy::sea_level_radius(f64 geocentric_latitude)
{
    const f64 sin_lambda = std::sin(geocentric_latitude);
    return std::sqrt(kEquatorialRadiusSqM /
                     (1.0 + (1.0 / (kE * kE) - 1.0) * sin_lambda * sin_lambda));
}

// -----------------------------------------------------------------
// Geodetic → Geocentric
//
// λ_sl = atan(E² × tan(φ))         sea-level geocentric latitude
// r_sl = sea_level_radius(λ_sl)
// p    = r_sl × (cos λ_sl, sin λ_sl) + h × (cos φ, sin φ)
// -----------------------------------------------------------------

GeocentricCoord Geodesy::geodetic_to_geocentric(const GeodeticCoord& geod)
{
    const f64 lambda_sl = std::atan2(kE * kE * std::tan(geod.latitude), 1.0);
    const f64 r_sl = sea_level_radius(lambda_sl);

    const Vec2d surface = r_sl * Vec2d{std::cos(lambda_sl), std::sin(lambda_sl)};
    const Vec2d normal{std::cos(geod.latitude), std::sin(geod.latitude)};
    const Vec2d p = surface + geod.altitude * normal;

    return GeocentricCoord{
        .latitude = std::atan2(p.y, p.x),
        .distance = glm::length(p),
    };
}

// -----------------------------------------------------------------
// Geocentric → Geodetic
//
// x_α  = E × R_eq / sqrt(tan²λ + E²)     surface point under the radius vector
// μ_α  = atan2(sqrt(R_eq² - x_α²), E × x_α), sign of λ
// l    = d - x_α / cos λ                 excess along the radius vector
// h₀   = l × cos(μ_α - λ)
// ρ_α  = R_eq (1 - ε²) / (1 - ε² sin²μ_α)^(3/2)   meridian radius of curvature
// φ    = μ_α - atan2(l × sin(μ_α - λ), ρ_α + h₀)
//
// The altitude is then the projection of the point onto the normal at φ.
// -----------------------------------------------------------------

GeodeticCoord Geodesy::geocentric_to_geodetic(const GeocentricCoord& geoc)
{
    const f64 lat_geoc = geoc.latitude;

    const f64 t_lat = std::tan(lat_geoc);
    const f64 x_alpha = kE * kEquatorialRadiusM / std::sqrt(t_lat * t_lat + kE * kE);

    f64 mu_alpha = std::atan2(std::sqrt(std::max(kEquatorialRadiusSqM - x_alpha * x_alpha, 0.0)),
                              kE * x_alpha);
    if (lat_geoc < 0.0)
    {
        mu_alpha = -mu_alpha;
    }

    const f64 sin_mu_a = std::sin(mu_alpha);
    const f64 delt_lambda = mu_alpha - lat_geoc;
    const f64 r_alpha = x_alpha / std::cos(lat_geoc);
    const f64 l_point = geoc.distance - r_alpha;
    const f64 alt_estimate = l_point * std::cos(delt_lambda);

    const f64 denom = std::sqrt(1.0 - kEps * kEps * sin_mu_a * sin_mu_a);
    const f64 rho_alpha = kEquatorialRadiusM * (1.0 - kEps * kEps) / (denom * denom * denom);
    const f64 delt_mu = std::atan2(l_point * std::sin(delt_lambda), rho_alpha + alt_estimate);
    const f64 lat_geod = mu_alpha - delt_mu;

    // Height along the local normal
    const f64 lambda_sl = std::atan2(kE * kE * std::tan(lat_geod), 1.0);
    const Vec2d surface = sea_level_radius(lambda_sl) * Vec2d{std::cos(lambda_sl), std::sin(lambda_sl)};
    const Vec2d p = geoc.distance * Vec2d{std::cos(lat_geoc), std::sin(lat_geoc)};
    const Vec2d normal{std::cos(lat_geod), std::sin(lat_geod)};

    return GeodeticCoord{
        .latitude = lat_geod,
        .altitude = glm::dot(p - surface, normal),
    };
}

// -----------------------------------------------------------------
// Geocentric ↔ Parallax constants
//
// ρ = d / R_eq,  C = ρ sin λ,  S = ρ cos λ
// -----------------------------------------------------------------

ParallaxConstants Geodesy::geocentric_to_parallax(const GeocentricCoord& geoc)
{
    const f64 rho = geoc.distance / kEquatorialRadiusM;
    return ParallaxConstants{
        .c = rho * std::sin(geoc.latitude),
        .s = rho * std::cos(geoc.latitude),
    };
}

GeocentricCoord Geodesy::parallax_to_geocentric(const ParallaxConstants& par)
{
    return GeocentricCoord{
        .latitude = std::atan2(par.c, par.s),
        .distance = std::sqrt(par.s * par.s + par.c * par.c) * kEquatorialRadiusM,
    };
}

// -----------------------------------------------------------------
// Optional overloads: unset input → unset output
// -----------------------------------------------------------------

std::optional<GeocentricCoord>
Geodesy::geodetic_to_geocentric(const std::optional<GeodeticCoord>& geod)
{
    if (!geod)
    {
        return std::nullopt;
    }
    return geodetic_to_geocentric(*geod);
}

std::optional<GeodeticCoord>
Geodesy::geocentric_to_geodetic(const std::optional<GeocentricCoord>& geoc)
{
    if (!geoc)
    {
        return std::nullopt;
    }
    return geocentric_to_geodetic(*geoc);
}

std::optional<ParallaxConstants>
Geodesy::geocentric_to_parallax(const std::optional<GeocentricCoord>& geoc)
{
    if (!geoc)
    {
        return std::nullopt;
    }
    return geocentric_to_parallax(*geoc);
}

std::optional<GeocentricCoord>
Geodesy::parallax_to_geocentric(const std::optional<ParallaxConstants>& par)
{
    if (!par)
    {
        return std::nullopt;
    }
    return parallax_to_geocentric(*par);
}

} // namespace telesite::astro
