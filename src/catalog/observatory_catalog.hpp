#pragma once

/// @file observatory_catalog.hpp
/// @brief Well-known observatories from the Starlink PAL astrometry library.

#include "core/types.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace telesite::catalog
{
    /// @brief One observatory as stored in the astrometric catalog.
    ///
    /// Longitude follows the catalog's west-positive convention.
    struct ObservatoryEntry
    {
        std::string mnemonic;       ///< Short identifier, upper case (e.g. "JCMT")
        std::string full_name;      ///< Descriptive name, or kSentinel past the end
        f64 west_longitude;         ///< Longitude (radians, west positive)
        f64 latitude;               ///< Geodetic latitude (radians)
        f64 altitude;               ///< Height above the ellipsoid (metres)

        [[nodiscard]] bool is_sentinel() const;
    };

    /// @brief Read-only access to the PAL observatory table (palObs).
    ///
    /// Enumeration follows a 1-based index protocol: entry(i) for
    /// i = 1, 2, ... yields records until one whose full name is the
    /// sentinel "?". There is no index; find() is a sequential scan.
    class ObservatoryCatalog
    {
    public:
        ObservatoryCatalog() = delete;

        /// @brief Terminator stored in ObservatoryEntry::full_name.
        static constexpr std::string_view kSentinel = "?";

        /// @brief Fetch the entry at a 1-based index.
        /// @return The entry, or a sentinel entry once the index runs past the table.
        [[nodiscard]] static ObservatoryEntry entry(i32 index);

        /// @brief Find an entry by exact (case-sensitive) mnemonic.
        [[nodiscard]] static std::optional<ObservatoryEntry> find(std::string_view mnemonic);

        /// @brief MPC observatory code for a catalog mnemonic, when the site has one.
        [[nodiscard]] static std::optional<std::string> mpc_code(std::string_view mnemonic);
    };

} // namespace telesite::catalog
