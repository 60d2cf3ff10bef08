/// @file test_telescope_profile.cpp
/// @brief Unit tests for neoplan::observatory::TelescopeProfile.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "observatory/telescope_profile.hpp"

#include <limits>

using namespace neoplan;
using namespace neoplan::observatory;

TEST_CASE("Defaults describe a valid generic site")
{
    const TelescopeProfile profile;
    CHECK_FALSE(validate_profile(profile).has_value());
    CHECK(profile.min_altitude_deg == doctest::Approx(20.0));
    CHECK(profile.max_sun_alt_deg == doctest::Approx(-12.0));
    CHECK(profile.min_moon_sep_deg == doctest::Approx(30.0));
    CHECK(profile.limiting_mag == doctest::Approx(18.0));
}

TEST_CASE("Wallace preset")
{
    const TelescopeProfile wallace = make_wallace_profile();
    CHECK_FALSE(validate_profile(wallace).has_value());
    CHECK(wallace.code == "244");
    CHECK(wallace.lat_deg == doctest::Approx(42.6138));
    CHECK(wallace.lon_deg == doctest::Approx(-71.4889));
    CHECK(wallace.limiting_mag == doctest::Approx(19.5));
    REQUIRE(wallace.aperture_m.has_value());
    CHECK(*wallace.aperture_m == doctest::Approx(0.6));
}

TEST_CASE("Backyard preset is valid")
{
    CHECK_FALSE(validate_profile(make_backyard_profile()).has_value());
}

TEST_CASE("Location converts to radians")
{
    const auto loc = make_wallace_profile().location();
    CHECK(loc.latitude_rad == doctest::Approx(42.6138 * astro_constants::kDegToRad));
    CHECK(loc.longitude_rad == doctest::Approx(-71.4889 * astro_constants::kDegToRad));
    CHECK(loc.height_m == doctest::Approx(180.0));
}

TEST_CASE("Out-of-domain values are reported, never clamped")
{
    TelescopeProfile p = make_wallace_profile();

    SUBCASE("latitude") { p.lat_deg = 91.0; }
    SUBCASE("longitude") { p.lon_deg = 360.0; }
    SUBCASE("altitude") { p.alt_m = 12000.0; }
    SUBCASE("limiting magnitude") { p.limiting_mag = std::numeric_limits<f64>::infinity(); }
    SUBCASE("aperture") { p.aperture_m = 0.0; }
    SUBCASE("field of view") { p.fov_arcmin = -5.0; }
    SUBCASE("minimum altitude") { p.min_altitude_deg = 90.0; }
    SUBCASE("sun altitude above horizon") { p.max_sun_alt_deg = 5.0; }
    SUBCASE("moon separation") { p.min_moon_sep_deg = 181.0; }

    CHECK(validate_profile(p).has_value());
}

TEST_CASE("Boundary values are accepted")
{
    TelescopeProfile p = make_wallace_profile();
    p.lat_deg = -90.0;
    p.lon_deg = 359.9;
    p.alt_m = -500.0;
    p.min_altitude_deg = 0.0;
    p.max_sun_alt_deg = 0.0;
    p.min_moon_sep_deg = 180.0;
    p.aperture_m.reset();
    p.fov_arcmin.reset();
    CHECK_FALSE(validate_profile(p).has_value());
}
