/// @file mpc_catalog.cpp
/// @brief Fixed-width MPC observatory-code parser and process-wide cache.

#include "catalog/mpc_catalog.hpp"

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <fstream>
#include <istream>
#include <memory>
#include <mutex>
#include <utility>

namespace telesite::catalog
{

namespace
{
    constexpr std::size_t kCodeWidth = 3;
    constexpr std::size_t kLongWidth = 10;
    constexpr std::size_t kCosWidth  = 8;
    constexpr std::size_t kSinWidth  = 9;

    constexpr std::size_t kLongStart = kCodeWidth;
    constexpr std::size_t kCosStart  = kLongStart + kLongWidth;
    constexpr std::size_t kSinStart  = kCosStart + kCosWidth;
    constexpr std::size_t kNameStart = kSinStart + kSinWidth;

    // Substring clipped to the line length
    std::string_view field(std::string_view line, std::size_t start, std::size_t width)
    {
        if (start >= line.size())
        {
            return {};
        }
        return line.substr(start, width);
    }

    std::string_view trim(std::string_view sv)
    {
        while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front())))
        {
            sv.remove_prefix(1);
        }
        while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back())))
        {
            sv.remove_suffix(1);
        }
        return sv;
    }

    std::optional<f64> parse_f64(std::string_view sv)
    {
        sv = trim(sv);

        // from_chars rejects an explicit '+'
        if (!sv.empty() && sv.front() == '+')
        {
            sv.remove_prefix(1);
        }
        if (sv.empty())
        {
            return std::nullopt;
        }

        f64 value = 0.0;
        const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);
        if (ec != std::errc{} || ptr != sv.data() + sv.size())
        {
            return std::nullopt;
        }
        return value;
    }

    bool has_digit(std::string_view sv)
    {
        return std::any_of(sv.begin(), sv.end(),
                           [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; });
    }
} // namespace

// -----------------------------------------------------------------
// Single line
// -----------------------------------------------------------------

std::optional<std::pair<std::string, MpcSite>> MpcCatalog::parse_line(std::string_view line)
{
    if (!line.empty() && line.back() == '\r')
    {
        line.remove_suffix(1);
    }

    const std::string_view code = trim(field(line, 0, kCodeWidth));
    if (code.empty())
    {
        return std::nullopt;
    }

    // Space-based observatories have no longitude
    const std::string_view long_field = field(line, kLongStart, kLongWidth);
    if (!has_digit(long_field))
    {
        TSITE_CORE_TRACE("MpcCatalog: Skipping non-terrestrial site {}", code);
        return std::nullopt;
    }

    const auto longitude_deg = parse_f64(long_field);
    const auto rho_cos = parse_f64(field(line, kCosStart, kCosWidth));
    const auto rho_sin = parse_f64(field(line, kSinStart, kSinWidth));

    if (!longitude_deg || !rho_cos || !rho_sin)
    {
        TSITE_CORE_WARN("MpcCatalog: Malformed entry: {}", line);
        return std::nullopt;
    }

    return std::make_pair(std::string(code), MpcSite{
        .name       = std::string(trim(field(line, kNameStart, std::string_view::npos))),
        .longitude  = *longitude_deg * astro_constants::kDegToRad,
        .parallax_c = *rho_sin,
        .parallax_s = *rho_cos,
    });
}

// -----------------------------------------------------------------
// Whole table
// -----------------------------------------------------------------

MpcSiteMap MpcCatalog::parse_table(std::istream& input)
{
    MpcSiteMap sites;
    std::string line;
    u32 line_number = 0;
    u32 skipped = 0;

    while (std::getline(input, line))
    {
        ++line_number;

        if (trim(line).empty())
        {
            continue;
        }

        auto parsed = parse_line(line);
        if (!parsed)
        {
            ++skipped;
            continue;
        }

        sites.insert_or_assign(std::move(parsed->first), std::move(parsed->second));
    }

    TSITE_CORE_DEBUG("MpcCatalog: Parsed {} sites from {} lines ({} skipped)",
                     sites.size(), line_number, skipped);

    return sites;
}

MpcCatalog MpcCatalog::load(const std::filesystem::path& path)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        TSITE_CORE_ERROR("MpcCatalog: Failed to open file: {}", path.string());
        return MpcCatalog(MpcSiteMap{});
    }

    MpcCatalog catalog(parse_table(file));
    TSITE_CORE_INFO("MpcCatalog: Loaded {} sites from {}", catalog.size(), path.string());
    return catalog;
}

// -----------------------------------------------------------------
// Process-wide cache
// -----------------------------------------------------------------

const MpcCatalog& MpcCatalog::shared()
{
    static std::once_flag s_once;
    static std::unique_ptr<MpcCatalog> s_catalog;

    std::call_once(s_once, []
    {
        s_catalog = std::make_unique<MpcCatalog>(load(core::Config::get().mpc_table_path));
    });

    return *s_catalog;
}

MpcCatalog::MpcCatalog(MpcSiteMap sites)
    : m_sites(std::move(sites))
{
}

std::optional<MpcSite> MpcCatalog::find(std::string_view code) const
{
    const auto it = m_sites.find(code);
    if (it == m_sites.end())
    {
        return std::nullopt;
    }
    return it->second;
}

} // namespace telesite::catalog
