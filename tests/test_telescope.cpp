/// @file test_telescope.cpp
/// @brief Unit tests for telesite::Telescope and telesite::TelescopeResolver.
///
/// Resolution through the observatory catalog, the MPC table and explicit
/// field sets, in-place re-resolution and pointing-limit defaults.

#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "astro/geodesy.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "observatory/telescope.hpp"
#include "observatory/telescope_resolver.hpp"

#include <spdlog/sinks/ringbuffer_sink.h>

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <memory>
#include <string>

using namespace telesite;
using astro::AngleUnit;
using astro::Geodesy;

// =================================================================
// Custom main: initialize logger and point the MPC table at the test data
// =================================================================

int main(int argc, char** argv)
{
    core::Logger::init(spdlog::level::warn);

    core::Config config = core::Config::defaults();
    config.mpc_table_path = std::filesystem::path(TELESITE_TEST_DATA_DIR) / "MPC.dat";
    core::Config::set(config);

    const int result = doctest::Context(argc, argv).run();
    core::Logger::shutdown();
    return result;
}

static constexpr f64 kDeg = astro_constants::kDegToRad;

namespace
{
    void check_consistent(const Telescope& tel)
    {
        const auto geod = Geodesy::geocentric_to_geodetic(tel.geocentric());
        CHECK(std::abs(geod.latitude - tel.latitude()) < 1e-6);
        CHECK(std::abs(geod.altitude - tel.altitude()) < 1.0);

        const auto geoc = Geodesy::parallax_to_geocentric(tel.parallax());
        CHECK(std::abs(geoc.latitude - tel.geocentric().latitude) < 1e-6);
        CHECK(std::abs(geoc.distance - tel.geocentric().distance) < 1.0);
    }
}

// =================================================================
// Observatory catalog
// =================================================================

TEST_CASE("JCMT from the observatory catalog")
{
    const auto tel = TelescopeResolver::resolve_by_name("JCMT");
    REQUIRE(tel.has_value());

    CHECK(tel->name() == "JCMT");
    CHECK(tel->to_string() == "JCMT");
    CHECK(tel->full_name() == "JCMT 15 metre");
    CHECK(tel->latitude_string() == "19 49 22.11");
    CHECK(tel->longitude_string() == "-155 28 37.20");
    CHECK(tel->altitude() == doctest::Approx(4111.0));
    CHECK(tel->obs_code() == "568");
    CHECK(tel->source() == SiteSource::PrimaryCatalog);
    CHECK(tel->native() == Representation::Geodetic);

    CHECK(tel->limits().type == MountType::AzEl);
    REQUIRE(tel->limits().el.has_value());
    CHECK(tel->limits().el->min == doctest::Approx(5.0 * kDeg));
    CHECK(tel->limits().el->max == doctest::Approx(88.0 * kDeg));

    check_consistent(*tel);
}

TEST_CASE("UKIRT geocentric latitude and equatorial limits")
{
    const auto tel = TelescopeResolver::resolve_by_name("UKIRT");
    REQUIRE(tel.has_value());

    CHECK(std::abs(tel->geocentric().latitude - 0.343830843) < 1e-9);
    CHECK(tel->limits().type == MountType::HaDec);
    CHECK_FALSE(tel->limits().el.has_value());
    CHECK(tel->limits().ha.has_value());
    CHECK(tel->limits().dec.has_value());

    check_consistent(*tel);
}

TEST_CASE("Names are upper-cased before lookup")
{
    const auto tel = TelescopeResolver::resolve_by_name("jcmt");
    REQUIRE(tel.has_value());
    CHECK(tel->name() == "JCMT");
}

TEST_CASE("Unknown names do not resolve")
{
    CHECK_FALSE(TelescopeResolver::resolve_by_name("blah").has_value());
    CHECK_FALSE(TelescopeResolver::resolve_by_name("").has_value());
}

TEST_CASE("Angle display units")
{
    const auto tel = TelescopeResolver::resolve_by_name("JCMT");
    REQUIRE(tel.has_value());

    const f64 lat_deg = 19.0 + 49.0 / 60.0 + 22.11 / 3600.0;
    CHECK(tel->latitude_deg() == doctest::Approx(lat_deg));
    CHECK(tel->longitude_deg() < 0.0);
    CHECK(tel->latitude_string(AngleUnit::Degrees) == "19.822808");
    CHECK(tel->latitude_string(AngleUnit::Radians).rfind("0.345", 0) == 0);
}

TEST_CASE("Separator comes from the configuration")
{
    const core::Config saved = core::Config::get();

    core::Config colon = saved;
    colon.separator = ":";
    core::Config::set(colon);

    const auto tel = TelescopeResolver::resolve_by_name("JCMT");
    REQUIRE(tel.has_value());
    CHECK(tel->latitude_string() == "19:49:22.11");

    core::Config::set(saved);
    CHECK(tel->latitude_string() == "19 49 22.11");
}

TEST_CASE("Catalog mnemonics are sorted and resolvable")
{
    const auto names = TelescopeResolver::tel_names();

    CHECK(names.size() > 50);
    CHECK(std::is_sorted(names.begin(), names.end()));
    CHECK(std::find(names.begin(), names.end(), "JCMT") != names.end());

    for (const auto& name : names)
    {
        CAPTURE(name);
        const auto tel = TelescopeResolver::resolve_by_name(name);
        REQUIRE(tel.has_value());
        CHECK(tel->source() == SiteSource::PrimaryCatalog);
    }
}

// =================================================================
// MPC table
// =================================================================

TEST_CASE("Wetzikon by MPC code")
{
    const auto tel = TelescopeResolver::resolve_by_code("011");
    REQUIRE(tel.has_value());

    CHECK(tel->name() == "Wetzikon");
    CHECK(tel->full_name() == "Wetzikon");
    CHECK(tel->obs_code() == "011");
    CHECK(tel->source() == SiteSource::MpcCatalog);
    CHECK(tel->native() == Representation::Parallax);
    CHECK(tel->longitude_deg() == doctest::Approx(8.7967));
    CHECK(tel->parallax().c == doctest::Approx(0.73162));
    CHECK(tel->parallax().s == doctest::Approx(0.67919));
    CHECK(tel->latitude_deg() > 47.2);
    CHECK(tel->latitude_deg() < 47.5);
    CHECK(tel->altitude() > 0.0);
    CHECK(tel->altitude() < 1500.0);

    CHECK(tel->limits().type == MountType::AzEl);
    REQUIRE(tel->limits().el.has_value());
    CHECK(tel->limits().el->min == 0.0);

    check_consistent(*tel);
}

TEST_CASE("Names fall back to MPC codes")
{
    const auto by_name = TelescopeResolver::resolve_by_name("011");
    const auto by_code = TelescopeResolver::resolve_by_code("011");
    REQUIRE(by_name.has_value());
    REQUIRE(by_code.has_value());

    CHECK(by_name->name() == by_code->name());
    CHECK(by_name->longitude() == by_code->longitude());
    CHECK(by_name->latitude() == by_code->latitude());
}

TEST_CASE("Codes only consult the MPC table")
{
    CHECK_FALSE(TelescopeResolver::resolve_by_code("JCMT").has_value());
    CHECK_FALSE(TelescopeResolver::resolve_by_code("250").has_value());
    CHECK_FALSE(TelescopeResolver::resolve_by_name("250").has_value());

    const auto lower = TelescopeResolver::resolve_by_code("f51");
    REQUIRE(lower.has_value());
    CHECK(lower->obs_code() == "F51");
}

// =================================================================
// Re-resolution
// =================================================================

TEST_CASE("set_name replaces the site and resets limits")
{
    auto tel = TelescopeResolver::resolve_by_name("UKIRT");
    REQUIRE(tel.has_value());

    tel->set_limits(PointingLimits::none());
    CHECK(tel->limits().type == MountType::None);

    CHECK(tel->set_name("JCMT"));
    CHECK(tel->name() == "JCMT");
    CHECK(tel->full_name() == "JCMT 15 metre");
    CHECK(tel->limits() == LimitsTable::lookup("JCMT"));
}

TEST_CASE("Failed set_name leaves the record unchanged")
{
    auto tel = TelescopeResolver::resolve_by_name("JCMT");
    REQUIRE(tel.has_value());

    const PointingLimits custom = PointingLimits::azel({.min = 0.1, .max = 0.2});
    tel->set_limits(custom);
    const f64 latitude = tel->latitude();

    CHECK_FALSE(tel->set_name("blah"));
    CHECK(tel->name() == "JCMT");
    CHECK(tel->latitude() == latitude);
    CHECK(tel->limits() == custom);

    CHECK_FALSE(tel->set_code("250"));
    CHECK(tel->name() == "JCMT");
}

TEST_CASE("set_code switches to an MPC site")
{
    auto tel = TelescopeResolver::resolve_by_name("JCMT");
    REQUIRE(tel.has_value());

    CHECK(tel->set_code("568"));
    CHECK(tel->name() == "Mauna Kea");
    CHECK(tel->obs_code() == "568");
    CHECK(tel->source() == SiteSource::MpcCatalog);
    CHECK(tel->limits() == PointingLimits::horizon());
}

TEST_CASE("renamed returns a new record and leaves the original alone")
{
    const auto tel = TelescopeResolver::resolve_by_name("JCMT");
    REQUIRE(tel.has_value());

    const auto other = tel->renamed("UKIRT");
    REQUIRE(other.has_value());
    CHECK(other->name() == "UKIRT");
    CHECK(tel->name() == "JCMT");

    CHECK_FALSE(tel->renamed("blah").has_value());
    CHECK_FALSE(tel->recoded("250").has_value());

    const auto recoded = tel->recoded("011");
    REQUIRE(recoded.has_value());
    CHECK(recoded->name() == "Wetzikon");
}

// =================================================================
// Explicit fields
// =================================================================

TEST_CASE("Explicit geodetic fields")
{
    ExplicitFields fields;
    fields.name = "mysite";
    fields.longitude = 10.0 * kDeg;
    fields.latitude = 45.0 * kDeg;
    fields.altitude = 250.0;

    const auto tel = TelescopeResolver::resolve(fields);
    REQUIRE(tel.has_value());

    CHECK(tel->name() == "MYSITE");
    CHECK(tel->full_name() == "mysite");
    CHECK_FALSE(tel->obs_code().has_value());
    CHECK(tel->source() == SiteSource::Explicit);
    CHECK(tel->native() == Representation::Geodetic);
    CHECK(tel->longitude() == doctest::Approx(10.0 * kDeg));
    CHECK(tel->latitude() == doctest::Approx(45.0 * kDeg));
    CHECK(tel->altitude() == doctest::Approx(250.0));
    CHECK(tel->limits() == PointingLimits::horizon());

    check_consistent(*tel);
}

TEST_CASE("Explicit fields keep a supplied full name and code")
{
    ExplicitFields fields;
    fields.name = "jcmt";
    fields.full_name = "Maxwell telescope";
    fields.obs_code = "568";
    fields.longitude = -155.0 * kDeg;
    fields.latitude = 19.8 * kDeg;
    fields.altitude = 4000.0;

    const auto tel = TelescopeResolver::resolve(fields);
    REQUIRE(tel.has_value());

    CHECK(tel->name() == "JCMT");
    CHECK(tel->full_name() == "Maxwell telescope");
    CHECK(tel->obs_code() == "568");
    CHECK(tel->limits() == LimitsTable::lookup("JCMT"));
}

TEST_CASE("Missing altitude defaults to sea level with a warning")
{
    auto sink = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(16);
    auto& app_logger = core::Logger::get_app_logger();
    app_logger->sinks().push_back(sink);

    ExplicitFields fields;
    fields.name = "flat";
    fields.longitude = 0.0;
    fields.latitude = 30.0 * kDeg;

    const auto tel = TelescopeResolver::resolve(fields);
    app_logger->sinks().pop_back();

    REQUIRE(tel.has_value());
    CHECK(tel->altitude() == 0.0);
    CHECK(tel->latitude() == doctest::Approx(30.0 * kDeg));
    CHECK(tel->geocentric().distance > 0.0);
    CHECK(tel->geocentric().latitude < tel->latitude());
    CHECK(tel->parallax().c > 0.0);
    CHECK(tel->parallax().s > 0.0);
    check_consistent(*tel);

    i32 warnings = 0;
    for (const auto& record : sink->last_raw())
    {
        const std::string payload(record.payload.data(), record.payload.size());
        if (record.level == spdlog::level::warn && payload.find("flat") != std::string::npos)
        {
            ++warnings;
        }
    }
    CHECK(warnings == 1);
}

TEST_CASE("Supplied altitude does not warn")
{
    auto sink = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(16);
    auto& app_logger = core::Logger::get_app_logger();
    app_logger->sinks().push_back(sink);

    ExplicitFields fields;
    fields.name = "hill";
    fields.longitude = 0.0;
    fields.latitude = 30.0 * kDeg;
    fields.altitude = 120.0;

    const auto tel = TelescopeResolver::resolve(fields);
    app_logger->sinks().pop_back();

    REQUIRE(tel.has_value());
    CHECK(sink->last_raw().empty());
}

TEST_CASE("Explicit geocentric fields")
{
    const auto reference = Geodesy::geodetic_to_geocentric(
        astro::GeodeticCoord{.latitude = -30.0 * kDeg, .altitude = 2000.0});

    ExplicitFields fields;
    fields.name = "south";
    fields.longitude = -70.0 * kDeg;
    fields.geocentric_latitude = reference.latitude;
    fields.geocentric_distance = reference.distance;

    const auto tel = TelescopeResolver::resolve(fields);
    REQUIRE(tel.has_value());

    CHECK(tel->native() == Representation::Geocentric);
    CHECK(std::abs(tel->latitude() + 30.0 * kDeg) < 1e-9);
    CHECK(std::abs(tel->altitude() - 2000.0) < 1e-3);
    check_consistent(*tel);
}

TEST_CASE("Explicit parallax fields")
{
    ExplicitFields fields;
    fields.name = "mk";
    fields.longitude = 204.5278 * kDeg;
    fields.parallax = astro::ParallaxConstants{.c = 0.33725, .s = 0.94171};

    const auto tel = TelescopeResolver::resolve(fields);
    REQUIRE(tel.has_value());

    CHECK(tel->native() == Representation::Parallax);
    CHECK(tel->parallax().c == doctest::Approx(0.33725));
    CHECK(tel->parallax().s == doctest::Approx(0.94171));
    check_consistent(*tel);
}

TEST_CASE("Geodetic fields take precedence over other alternatives")
{
    ExplicitFields fields;
    fields.name = "both";
    fields.longitude = 0.0;
    fields.latitude = 10.0 * kDeg;
    fields.altitude = 0.0;
    fields.parallax = astro::ParallaxConstants{.c = 0.5, .s = 0.8};

    const auto tel = TelescopeResolver::resolve(fields);
    REQUIRE(tel.has_value());
    CHECK(tel->native() == Representation::Geodetic);
    CHECK(tel->latitude() == doctest::Approx(10.0 * kDeg));
}

TEST_CASE("Incomplete explicit fields do not resolve")
{
    ExplicitFields no_name;
    no_name.longitude = 0.0;
    no_name.latitude = 0.0;
    CHECK_FALSE(TelescopeResolver::resolve(no_name).has_value());

    ExplicitFields no_longitude;
    no_longitude.name = "x";
    no_longitude.latitude = 0.0;
    CHECK_FALSE(TelescopeResolver::resolve(no_longitude).has_value());

    ExplicitFields no_coordinates;
    no_coordinates.name = "x";
    no_coordinates.longitude = 0.0;
    CHECK_FALSE(TelescopeResolver::resolve(no_coordinates).has_value());

    ExplicitFields at_centre;
    at_centre.name = "x";
    at_centre.longitude = 0.0;
    at_centre.geocentric_latitude = 0.0;
    at_centre.geocentric_distance = 0.0;
    CHECK_FALSE(TelescopeResolver::resolve(at_centre).has_value());

    ExplicitFields negative_distance = at_centre;
    negative_distance.geocentric_distance = -6378100.0;
    CHECK_FALSE(TelescopeResolver::resolve(negative_distance).has_value());

    ExplicitFields zero_parallax;
    zero_parallax.name = "x";
    zero_parallax.longitude = 0.0;
    zero_parallax.parallax = astro::ParallaxConstants{.c = 0.0, .s = 0.0};
    CHECK_FALSE(TelescopeResolver::resolve(zero_parallax).has_value());

    ExplicitFields half_geocentric;
    half_geocentric.name = "x";
    half_geocentric.longitude = 0.0;
    half_geocentric.geocentric_latitude = 0.3;
    CHECK_FALSE(TelescopeResolver::resolve(half_geocentric).has_value());
}
