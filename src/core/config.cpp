/// @file config.cpp
/// @brief Config defaults and environment overrides.

#include "core/config.hpp"

#include "core/logger.hpp"

#include <cstdlib>

#ifndef TELESITE_DATA_DIR
#define TELESITE_DATA_DIR "data"
#endif

namespace telesite::core
{

namespace
{
    Config& current()
    {
        static Config s_config = Config::from_environment();
        return s_config;
    }

    const char* env(const char* name)
    {
        const char* value = std::getenv(name);
        return (value != nullptr && *value != '\0') ? value : nullptr;
    }
} // namespace

Config Config::defaults()
{
    Config config;
    config.mpc_table_path = std::filesystem::path(TELESITE_DATA_DIR) / "MPC.dat";
    return config;
}

Config Config::from_environment()
{
    Config config = defaults();

    if (const char* path = env("TELESITE_MPC_TABLE"))
    {
        config.mpc_table_path = path;
    }

    if (const char* sep = env("TELESITE_SEPARATOR"))
    {
        config.separator = sep;
    }

    if (const char* file = env("TELESITE_LOG_FILE"))
    {
        config.log_file = file;
    }

    if (const char* level = env("TELESITE_LOG_LEVEL"))
    {
        const std::string name(level);
        const auto parsed = spdlog::level::from_str(name);
        if (parsed == spdlog::level::off && name != "off")
        {
            TSITE_CORE_WARN("Config: Unknown TELESITE_LOG_LEVEL '{}', keeping default", name);
        }
        else
        {
            config.log_level = parsed;
        }
    }

    return config;
}

const Config& Config::get()
{
    return current();
}

void Config::set(const Config& config)
{
    current() = config;
}

} // namespace telesite::core
