#pragma once

/// @file config.hpp
/// @brief Process configuration: data paths, display options, logging.

#include <spdlog/common.h>

#include <filesystem>
#include <string>

namespace telesite::core
{
    /// @brief Runtime settings shared by the catalogs, the display accessors and the CLI.
    ///
    /// Defaults come from the build (data directory) and are overridden by
    /// environment variables in from_environment(), then by CLI flags.
    struct Config
    {
        std::filesystem::path mpc_table_path;           ///< MPC observatory code table
        std::string separator{" "};                     ///< Sexagesimal field separator
        spdlog::level::level_enum log_level{spdlog::level::info};
        std::string log_file;                           ///< Empty disables file logging

        /// @brief Built-in defaults.
        [[nodiscard]] static Config defaults();

        /// @brief Defaults overridden by TELESITE_MPC_TABLE, TELESITE_SEPARATOR,
        /// TELESITE_LOG_LEVEL and TELESITE_LOG_FILE.
        [[nodiscard]] static Config from_environment();

        /// @brief Process-wide current configuration (from_environment() until set()).
        [[nodiscard]] static const Config& get();

        /// @brief Replace the process-wide configuration.
        /// The MPC table path only takes effect before the table is first loaded.
        static void set(const Config& config);
    };

} // namespace telesite::core
