/// @file solar_system.cpp
/// @brief Implementation of the low-precision Sun and Moon ephemerides.

#include "astro/solar_system.hpp"

#include "astro/time_system.hpp"

#include <cmath>

namespace neoplan::astro
{

namespace
{

constexpr f64 kDeg = astro_constants::kDegToRad;

/// sin/cos of an argument given in degrees
f64 sind(f64 deg) { return std::sin(deg * kDeg); }
f64 cosd(f64 deg) { return std::cos(deg * kDeg); }

} // anonymous namespace

// -----------------------------------------------------------------
// Sun: Astronomical Almanac, "Low precision formulas for the Sun"
//
//   n = JD − 2451545.0
//   L = 280.460° + 0.9856474° n          (mean longitude)
//   g = 357.528° + 0.9856003° n          (mean anomaly)
//   λ = L + 1.915° sin g + 0.020° sin 2g (ecliptic longitude, β = 0)
//   ε = 23.439° − 0.0000004° n
// -----------------------------------------------------------------

EquatorialCoord SolarSystem::sun_position(f64 jd)
{
    const f64 n = jd - astro_constants::kJ2000;

    const f64 mean_lon = 280.460 + 0.9856474 * n;
    const f64 mean_anomaly = 357.528 + 0.9856003 * n;
    const f64 ecl_lon = mean_lon + 1.915 * sind(mean_anomaly) + 0.020 * sind(2.0 * mean_anomaly);
    const f64 obliquity = 23.439 - 0.0000004 * n;

    return Coordinates::ecliptic_to_equatorial(
        EclipticCoord{.lon = Coordinates::normalize_radians(ecl_lon * kDeg), .lat = 0.0},
        obliquity * kDeg);
}

// -----------------------------------------------------------------
// Moon: Astronomical Almanac, "Low precision formulae for the Moon"
//
// Longitude, latitude and horizontal parallax as short periodic series
// in T (Julian centuries from J2000.0). Distance r = 1 / sin(π).
// -----------------------------------------------------------------

MoonPosition SolarSystem::moon_position(f64 jd)
{
    const f64 t = TimeSystem::julian_centuries(jd);

    const f64 lon = 218.32 + 481267.881 * t
                  + 6.29 * sind(135.0 + 477198.87 * t)
                  - 1.27 * sind(259.3 - 413335.36 * t)
                  + 0.66 * sind(235.7 + 890534.22 * t)
                  + 0.21 * sind(269.9 + 954397.74 * t)
                  - 0.19 * sind(357.5 + 35999.05 * t)
                  - 0.11 * sind(186.5 + 966404.03 * t);

    const f64 lat = 5.13 * sind(93.3 + 483202.02 * t)
                  + 0.28 * sind(228.2 + 960400.89 * t)
                  - 0.28 * sind(318.3 + 6003.15 * t)
                  - 0.17 * sind(217.6 - 407332.21 * t);

    const f64 parallax = 0.9508
                       + 0.0518 * cosd(135.0 + 477198.87 * t)
                       + 0.0095 * cosd(259.3 - 413335.36 * t)
                       + 0.0078 * cosd(235.7 + 890534.22 * t)
                       + 0.0028 * cosd(269.9 + 954397.74 * t);

    const EquatorialCoord eq = Coordinates::ecliptic_to_equatorial(
        EclipticCoord{.lon = Coordinates::normalize_radians(lon * kDeg), .lat = lat * kDeg},
        Coordinates::mean_obliquity(jd));

    return MoonPosition{
        .equatorial = eq,
        .distance_earth_radii = 1.0 / sind(parallax),
    };
}

EquatorialCoord SolarSystem::moon_topocentric(f64 jd, const ObserverLocation& observer)
{
    const MoonPosition moon = moon_position(jd);

    const Vec3d geocentric = Coordinates::to_unit_vector(moon.equatorial) * moon.distance_earth_radii;
    const Vec3d topocentric = geocentric - observer_vector(jd, observer);

    return Coordinates::from_vector(topocentric);
}

f64 SolarSystem::sun_altitude_deg(f64 jd, const ObserverLocation& observer)
{
    const EquatorialCoord sun = sun_position(jd);
    const f64 lst = TimeSystem::lmst(jd, observer.longitude_rad);
    const HorizontalCoord hz = Coordinates::equatorial_to_horizontal(sun, observer, lst);
    return hz.alt * astro_constants::kRadToDeg;
}

Vec3d SolarSystem::observer_vector(f64 jd, const ObserverLocation& observer)
{
    const f64 rho = 1.0 + observer.height_m / astro_constants::kEarthRadiusM;
    const f64 lst = TimeSystem::lmst(jd, observer.longitude_rad);
    const f64 cos_lat = std::cos(observer.latitude_rad);

    return Vec3d{rho * cos_lat * std::cos(lst),
                 rho * cos_lat * std::sin(lst),
                 rho * std::sin(observer.latitude_rad)};
}

} // namespace neoplan::astro
