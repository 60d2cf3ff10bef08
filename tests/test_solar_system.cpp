/// @file test_solar_system.cpp
/// @brief Unit tests for neoplan::astro::SolarSystem.
///
/// Checks the low-precision Sun and Moon against equinoxes, solstices
/// and the eclipses of 2026.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "astro/coordinates.hpp"
#include "astro/solar_system.hpp"
#include "astro/time_system.hpp"
#include "core/types.hpp"

#include <cmath>

using namespace neoplan;
using namespace neoplan::astro;

static constexpr f64 kRad = astro_constants::kRadToDeg;

static f64 jd_of(i32 year, i32 month, i32 day, i32 hour, i32 minute)
{
    return TimeSystem::to_julian_date(DateTime{
        .year = year, .month = month, .day = day, .hour = hour, .minute = minute, .second = 0.0});
}

static const ObserverLocation kWallace = {
    .latitude_rad  = 42.6138 * astro_constants::kDegToRad,
    .longitude_rad = -71.4889 * astro_constants::kDegToRad,
    .height_m      = 180.0,
};

// =================================================================
// Sun
// =================================================================

TEST_CASE("Sun at the March 2026 equinox sits on the celestial equator")
{
    // Equinox: 2026-03-20 14:46 UTC
    const EquatorialCoord sun = SolarSystem::sun_position(jd_of(2026, 3, 20, 14, 46));
    CHECK(std::abs(sun.dec * kRad) < 0.05);

    const f64 ra_deg = sun.ra * kRad;
    CHECK((ra_deg < 0.1 || ra_deg > 359.9));
}

TEST_CASE("Sun at the June 2026 solstice reaches the obliquity")
{
    // Solstice: 2026-06-21 08:24 UTC
    const EquatorialCoord sun = SolarSystem::sun_position(jd_of(2026, 6, 21, 8, 24));
    CHECK(sun.dec * kRad == doctest::Approx(23.44).epsilon(0.001));
    CHECK(sun.ra * kRad == doctest::Approx(90.0).epsilon(0.001));
}

TEST_CASE("Sun altitude at Wallace: up at local noon, down at local midnight")
{
    // Local noon ≈ 16:45 UTC, midnight ≈ 04:45 UTC
    CHECK(SolarSystem::sun_altitude_deg(jd_of(2026, 2, 15, 16, 45), kWallace) > 25.0);
    CHECK(SolarSystem::sun_altitude_deg(jd_of(2026, 2, 16, 4, 45), kWallace) < -40.0);
}

// =================================================================
// Moon
// =================================================================

TEST_CASE("Moon distance stays between perigee and apogee")
{
    for (f64 jd = 2461040.5; jd < 2461070.5; jd += 0.5)
    {
        const MoonPosition moon = SolarSystem::moon_position(jd);
        CHECK(moon.distance_earth_radii > 54.5);
        CHECK(moon.distance_earth_radii < 65.5);
        CHECK(std::abs(moon.equatorial.dec * kRad) < 30.0);
    }
}

TEST_CASE("Annular eclipse 2026-02-17: Moon in front of the Sun")
{
    const f64 jd = jd_of(2026, 2, 17, 12, 12);
    const f64 sep = Coordinates::angular_separation(SolarSystem::sun_position(jd),
                                                    SolarSystem::moon_position(jd).equatorial);
    CHECK(sep * kRad < 2.0);
}

TEST_CASE("Total lunar eclipse 2026-03-03: Moon opposite the Sun")
{
    const f64 jd = jd_of(2026, 3, 3, 11, 33);
    const f64 sep = Coordinates::angular_separation(SolarSystem::sun_position(jd),
                                                    SolarSystem::moon_position(jd).equatorial);
    CHECK(sep * kRad > 178.5);
}

TEST_CASE("Topocentric parallax shifts the Moon by under 1.1°")
{
    const f64 jd = jd_of(2026, 2, 16, 2, 0);
    const EquatorialCoord geo = SolarSystem::moon_position(jd).equatorial;
    const EquatorialCoord topo = SolarSystem::moon_topocentric(jd, kWallace);

    const f64 shift = Coordinates::angular_separation(geo, topo) * kRad;
    CHECK(shift > 0.0);
    CHECK(shift < 1.1);
}

TEST_CASE("Observer vector has roughly unit length")
{
    const Vec3d v = SolarSystem::observer_vector(2461087.5, kWallace);
    const f64 r = std::sqrt(v.x * v.x + v.y * v.y + v.z * v.z);
    CHECK(r == doctest::Approx(1.0 + 180.0 / astro_constants::kEarthRadiusM).epsilon(1e-12));
    CHECK(std::asin(v.z / r) == doctest::Approx(kWallace.latitude_rad).epsilon(1e-12));
}
