// src/main.cpp - telesite command-line entry point
//
// Resolves telescope identifiers and prints the site description:
//  1. Apply configuration (environment, then flags)
//  2. Resolve each identifier by name, or by MPC code with --code
//  3. Print coordinates in all three representations and the pointing limits

#include "astro/angle_format.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "observatory/pointing_limits.hpp"
#include "observatory/telescope.hpp"
#include "observatory/telescope_resolver.hpp"

#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

using namespace telesite;

namespace {

constexpr int kExitOk       = 0;
constexpr int kExitNotFound = 1;
constexpr int kExitUsage    = 2;

void printUsage(std::ostream& os) {
    os << "Usage: telesite [options] [IDENT...]\n"
       << "\n"
       << "Resolve telescope mnemonics or MPC observatory codes.\n"
       << "\n"
       << "Options:\n"
       << "  --code CODE    resolve CODE against the MPC table only\n"
       << "  --list         list the observatory catalog mnemonics\n"
       << "  --mpc PATH     MPC observatory code table\n"
       << "  --sep STR      sexagesimal separator (default: space)\n"
       << "  --units U      angle display: r(adians), d(egrees), s(exagesimal)\n"
       << "  --verbose      debug logging\n"
       << "  --help         show this help\n";
}

void printRange(std::ostream& os, std::string_view axis, const std::optional<AxisRange>& range,
                double scale, std::string_view unit) {
    if (!range) return;
    os << "    " << axis << ": [" << range->min * scale << ", "
       << range->max * scale << "] " << unit << "\n";
}

void printTelescope(std::ostream& os, const Telescope& tel, astro::AngleUnit units) {
    using namespace astro_constants;

    os << tel.name() << "\n"
       << "  Full name:       " << tel.full_name() << "\n"
       << "  MPC code:        " << tel.obs_code().value_or("-") << "\n"
       << "  Source:          " << telesite::to_string(tel.source())
       << " (" << telesite::to_string(tel.native()) << ")\n"
       << "  Longitude:       " << tel.longitude_string(units) << "\n"
       << "  Latitude:        " << tel.latitude_string(units) << "\n"
       << std::fixed << std::setprecision(1)
       << "  Altitude:        " << tel.altitude() << " m\n"
       << std::setprecision(9)
       << "  Geocentric lat:  " << tel.geocentric().latitude << " rad\n"
       << std::setprecision(1)
       << "  Geocentric dist: " << tel.geocentric().distance << " m\n"
       << std::setprecision(6)
       << "  Parallax C, S:   " << tel.parallax().c << ", " << tel.parallax().s << "\n";

    const PointingLimits& limits = tel.limits();
    os << "  Limits:          " << telesite::to_string(limits.type) << "\n"
       << std::setprecision(2);
    printRange(os, "el", limits.el, kRadToDeg, "deg");
    printRange(os, "ha", limits.ha, kRadToHour, "h");
    printRange(os, "dec", limits.dec, kRadToDeg, "deg");
    os << std::defaultfloat;
}

std::optional<astro::AngleUnit> parseUnits(std::string_view text) {
    if (text.empty()) return std::nullopt;
    switch (text.front()) {
        case 'r': return astro::AngleUnit::Radians;
        case 'd': return astro::AngleUnit::Degrees;
        case 's': return astro::AngleUnit::Sexagesimal;
        default:  return std::nullopt;
    }
}

} // namespace

int main(int argc, char** argv) {
    core::Config config = core::Config::from_environment();

    std::vector<std::string> names;
    std::vector<std::string> codes;
    bool list = false;
    astro::AngleUnit units = astro::AngleUnit::Sexagesimal;

    // -----------------------------------------------------------------------
    // 1. Command line
    // -----------------------------------------------------------------------
    const std::vector<std::string_view> args(argv + 1, argv + argc);
    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string_view arg = args[i];
        const bool has_value = i + 1 < args.size();

        if (arg == "--help" || arg == "-h") {
            printUsage(std::cout);
            return kExitOk;
        } else if (arg == "--list") {
            list = true;
        } else if (arg == "--verbose" || arg == "-v") {
            config.log_level = spdlog::level::debug;
        } else if (arg == "--code" && has_value) {
            codes.emplace_back(args[++i]);
        } else if (arg == "--mpc" && has_value) {
            config.mpc_table_path = std::string(args[++i]);
        } else if (arg == "--sep" && has_value) {
            config.separator = std::string(args[++i]);
        } else if (arg == "--units" && has_value) {
            const auto parsed = parseUnits(args[++i]);
            if (!parsed) {
                std::cerr << "telesite: unknown units '" << args[i] << "'\n";
                return kExitUsage;
            }
            units = *parsed;
        } else if (!arg.empty() && arg.front() == '-') {
            std::cerr << "telesite: unknown or incomplete option '" << arg << "'\n";
            printUsage(std::cerr);
            return kExitUsage;
        } else {
            names.emplace_back(arg);
        }
    }

    if (!list && names.empty() && codes.empty()) {
        printUsage(std::cerr);
        return kExitUsage;
    }

    core::Config::set(config);
    core::Logger::init(config.log_level, config.log_file);

    // -----------------------------------------------------------------------
    // 2. Catalog listing
    // -----------------------------------------------------------------------
    if (list) {
        for (const auto& name : TelescopeResolver::tel_names()) {
            std::cout << name << "\n";
        }
    }

    // -----------------------------------------------------------------------
    // 3. Resolution
    // -----------------------------------------------------------------------
    int status = kExitOk;
    auto report = [&](const std::string& ident, const std::optional<Telescope>& tel) {
        if (!tel) {
            TSITE_ERROR("Telescope '{}' not recognized", ident);
            status = kExitNotFound;
            return;
        }
        printTelescope(std::cout, *tel, units);
    };

    for (const auto& name : names) {
        report(name, TelescopeResolver::resolve_by_name(name));
    }
    for (const auto& code : codes) {
        report(code, TelescopeResolver::resolve_by_code(code));
    }

    core::Logger::shutdown();
    return status;
}
