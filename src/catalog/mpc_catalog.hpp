#pragma once

/// @file mpc_catalog.hpp
/// @brief Minor Planet Center observatory-code table.

#include "core/types.hpp"

#include <filesystem>
#include <functional>
#include <iosfwd>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace telesite::catalog
{
    /// @brief One ground-based site from the MPC table.
    struct MpcSite
    {
        std::string name;       ///< Free-text site name
        f64 longitude;          ///< East longitude (radians, 0..2π)
        f64 parallax_c;         ///< rho * sin(geocentric latitude), Earth radii
        f64 parallax_s;         ///< rho * cos(geocentric latitude), Earth radii

        bool operator==(const MpcSite&) const = default;
    };

    using MpcSiteMap = std::map<std::string, MpcSite, std::less<>>;

    /// @brief Parsed MPC observatory codes, keyed by 3-character code.
    ///
    /// Table layout, one site per line, fixed width:
    ///   code [0,3)  longitude deg [3,13)  rho cos [13,21)  rho sin [21,30)  name [30,)
    ///
    /// Lines without a digit in the longitude field (space-based
    /// observatories) are skipped.
    class MpcCatalog
    {
    public:
        /// @brief Parse a table from a stream. Pure: no shared state is touched.
        [[nodiscard]] static MpcSiteMap parse_table(std::istream& input);

        /// @brief Parse a single table line.
        /// @return The code and site, or std::nullopt for skipped or malformed lines.
        [[nodiscard]] static std::optional<std::pair<std::string, MpcSite>>
            parse_line(std::string_view line);

        /// @brief Process-wide catalog, loaded from Config::get().mpc_table_path on first use.
        ///
        /// Loading happens at most once per process; concurrent first callers
        /// block until the single loading pass completes.
        [[nodiscard]] static const MpcCatalog& shared();

        /// @brief Build a catalog directly from a file (not cached).
        /// A file that cannot be opened yields an empty catalog.
        [[nodiscard]] static MpcCatalog load(const std::filesystem::path& path);

        explicit MpcCatalog(MpcSiteMap sites);

        /// @brief Look up a site by MPC code.
        [[nodiscard]] std::optional<MpcSite> find(std::string_view code) const;

        [[nodiscard]] std::size_t size() const { return m_sites.size(); }
        [[nodiscard]] const MpcSiteMap& sites() const { return m_sites; }

    private:
        MpcSiteMap m_sites;
    };

} // namespace telesite::catalog
