#pragma once

/// @file logger.hpp
/// @brief Dual-logger system wrapping spdlog (core + application loggers).

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace telesite::core
{
    /// @brief Centralized logging facility for Telesite.
    ///
    /// Provides two separate loggers:
    /// - **TELESITE** (core): catalog loading, table parsing
    /// - **APP**: resolution results, user-facing advisories
    ///
    /// Both write to colored console output, and to a rotating log file when
    /// one is configured. If the program did not call init(), the first
    /// access from any thread initializes the loggers exactly once.
    class Logger
    {
    public:
        /// @brief Initialize both loggers with a console sink and an optional file sink.
        /// @param level Minimum level for both loggers.
        /// @param log_file Rotating log file path; empty disables the file sink.
        static void init(spdlog::level::level_enum level = spdlog::level::info,
                         const std::string& log_file = {});

        /// @brief Flush and tear down all loggers.
        static void shutdown();

        /// @brief Access the core logger ("TELESITE").
        [[nodiscard]] static std::shared_ptr<spdlog::logger>& get_core_logger();

        /// @brief Access the application-level logger ("APP").
        [[nodiscard]] static std::shared_ptr<spdlog::logger>& get_app_logger();

    private:
        static void create_loggers(spdlog::level::level_enum level, const std::string& log_file);

        static std::shared_ptr<spdlog::logger> s_core_logger;
        static std::shared_ptr<spdlog::logger> s_app_logger;
    };

} // namespace telesite::core

// -----------------------------------------------------------------
// Core log macros
// -----------------------------------------------------------------
// NOLINTBEGIN(cppcoreguidelines-macro-usage)
#define TSITE_CORE_TRACE(...)    ::telesite::core::Logger::get_core_logger()->trace(__VA_ARGS__)
#define TSITE_CORE_DEBUG(...)    ::telesite::core::Logger::get_core_logger()->debug(__VA_ARGS__)
#define TSITE_CORE_INFO(...)     ::telesite::core::Logger::get_core_logger()->info(__VA_ARGS__)
#define TSITE_CORE_WARN(...)     ::telesite::core::Logger::get_core_logger()->warn(__VA_ARGS__)
#define TSITE_CORE_ERROR(...)    ::telesite::core::Logger::get_core_logger()->error(__VA_ARGS__)

// -----------------------------------------------------------------
// Application log macros
// -----------------------------------------------------------------
#define TSITE_TRACE(...)         ::telesite::core::Logger::get_app_logger()->trace(__VA_ARGS__)
#define TSITE_DEBUG(...)         ::telesite::core::Logger::get_app_logger()->debug(__VA_ARGS__)
#define TSITE_INFO(...)          ::telesite::core::Logger::get_app_logger()->info(__VA_ARGS__)
#define TSITE_WARN(...)          ::telesite::core::Logger::get_app_logger()->warn(__VA_ARGS__)
#define TSITE_ERROR(...)         ::telesite::core::Logger::get_app_logger()->error(__VA_ARGS__)
// NOLINTEND(cppcoreguidelines-macro-usage)
