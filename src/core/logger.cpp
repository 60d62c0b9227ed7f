/// @file logger.cpp
/// @brief Logger implementation: dual spdlog loggers with console + optional rotating file sinks.

#include "core/logger.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>
#include <vector>

namespace telesite::core
{

// ---- Static member definitions ----
std::shared_ptr<spdlog::logger> Logger::s_core_logger;
std::shared_ptr<spdlog::logger> Logger::s_app_logger;

namespace
{
    std::mutex s_init_mutex;
    std::once_flag s_lazy_init;

    void ensure_initialized(const std::shared_ptr<spdlog::logger>& logger)
    {
        std::call_once(s_lazy_init, [&logger]
        {
            if (!logger)
            {
                Logger::init();
            }
        });
    }
} // namespace

void Logger::init(spdlog::level::level_enum level, const std::string& log_file)
{
    std::lock_guard<std::mutex> lock(s_init_mutex);
    create_loggers(level, log_file);
}

void Logger::create_loggers(spdlog::level::level_enum level, const std::string& log_file)
{
    // Re-initialisation replaces the registered loggers
    spdlog::drop("TELESITE");
    spdlog::drop("APP");

    // -----------------------------------------------------------------
    // Shared sinks: both loggers write to the same console and file
    // -----------------------------------------------------------------

    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_pattern("[%T.%e] [%n] [%^%l%$] %v");

    std::vector<spdlog::sink_ptr> sinks{console_sink};

    if (!log_file.empty())
    {
        // Rotating file sink: 5 MB max size, 3 rotated files
        constexpr std::size_t kMaxFileSize = 5 * 1024 * 1024; // 5 MB
        constexpr std::size_t kMaxFiles = 3;
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_file, kMaxFileSize, kMaxFiles);
        file_sink->set_pattern("[%Y-%m-%d %T.%e] [%n] [%l] %v");
        sinks.push_back(file_sink);
    }

    // -----------------------------------------------------------------
    // Core logger ("TELESITE"): catalogs and parsing
    // -----------------------------------------------------------------
    s_core_logger = std::make_shared<spdlog::logger>("TELESITE", sinks.begin(), sinks.end());
    s_core_logger->set_level(level);
    s_core_logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(s_core_logger);

    // -----------------------------------------------------------------
    // App logger ("APP"): resolution and user-facing messages
    // -----------------------------------------------------------------
    s_app_logger = std::make_shared<spdlog::logger>("APP", sinks.begin(), sinks.end());
    s_app_logger->set_level(level);
    s_app_logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(s_app_logger);
}

void Logger::shutdown()
{
    std::lock_guard<std::mutex> lock(s_init_mutex);
    s_core_logger.reset();
    s_app_logger.reset();
    spdlog::drop_all();
    spdlog::shutdown();
}

std::shared_ptr<spdlog::logger>& Logger::get_core_logger()
{
    ensure_initialized(s_core_logger);
    return s_core_logger;
}

std::shared_ptr<spdlog::logger>& Logger::get_app_logger()
{
    ensure_initialized(s_app_logger);
    return s_app_logger;
}

} // namespace telesite::core
