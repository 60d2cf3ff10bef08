/// @file coordinates.cpp
/// @brief Implementation of astronomical coordinate transformations.

#include "astro/coordinates.hpp"

#include "astro/time_system.hpp"
#include "core/types.hpp"

#include <glm/geometric.hpp>

#include <algorithm>
#include <cmath>

namespace neoplan::astro
{

// -----------------------------------------------------------------
// Equatorial (RA/Dec) → Horizontal (Alt/Az)
//
// Hour angle: H = LST - RA
//
// sin(alt) = sin(dec) × sin(lat) + cos(dec) × cos(lat) × cos(H)
//
// Azimuth (north-based):
//   az = atan2(-cos(dec)×sin(H), sin(dec)×cos(lat) - cos(dec)×sin(lat)×cos(H))
// -----------------------------------------------------------------

HorizontalCoord Coordinates::equatorial_to_horizontal(
    const EquatorialCoord& eq,
    const ObserverLocation& observer,
    f64 local_sidereal_time_rad)
{
    const f64 hour_angle = local_sidereal_time_rad - eq.ra;

    const f64 sin_dec = std::sin(eq.dec);
    const f64 cos_dec = std::cos(eq.dec);
    const f64 sin_lat = std::sin(observer.latitude_rad);
    const f64 cos_lat = std::cos(observer.latitude_rad);
    const f64 cos_ha  = std::cos(hour_angle);
    const f64 sin_ha  = std::sin(hour_angle);

    const f64 sin_alt = sin_dec * sin_lat + cos_dec * cos_lat * cos_ha;
    const f64 alt = std::asin(std::clamp(sin_alt, -1.0, 1.0));

    const f64 az_y = -cos_dec * sin_ha;
    const f64 az_x = sin_dec * cos_lat - cos_dec * sin_lat * cos_ha;

    return HorizontalCoord{
        .alt = alt,
        .az  = normalize_radians(std::atan2(az_y, az_x)),
    };
}

// -----------------------------------------------------------------
// Ecliptic (λ, β) → Equatorial (α, δ)
//
//   sin(δ) = sin(β)cos(ε) + cos(β)sin(ε)sin(λ)
//   α = atan2(sin(λ)cos(ε) - tan(β)sin(ε), cos(λ))
// -----------------------------------------------------------------

EquatorialCoord Coordinates::ecliptic_to_equatorial(
    const EclipticCoord& ecl,
    f64 obliquity_rad)
{
    const f64 sin_eps = std::sin(obliquity_rad);
    const f64 cos_eps = std::cos(obliquity_rad);
    const f64 sin_lon = std::sin(ecl.lon);
    const f64 cos_lon = std::cos(ecl.lon);
    const f64 sin_lat = std::sin(ecl.lat);
    const f64 cos_lat = std::cos(ecl.lat);

    const f64 sin_dec = sin_lat * cos_eps + cos_lat * sin_eps * sin_lon;
    const f64 ra = std::atan2(sin_lon * cos_lat * cos_eps - sin_lat * sin_eps,
                              cos_lon * cos_lat);

    return EquatorialCoord{
        .ra  = normalize_radians(ra),
        .dec = std::asin(std::clamp(sin_dec, -1.0, 1.0)),
    };
}

f64 Coordinates::mean_obliquity(f64 jd)
{
    const f64 t = TimeSystem::julian_centuries(jd);
    const f64 eps_deg = 23.439291 - 0.0130042 * t;
    return eps_deg * astro_constants::kDegToRad;
}

// -----------------------------------------------------------------
// Precession J2000 → mean equator of date (IAU 1976, Lieske)
//
//   ζ = 2306.2181″T + 0.30188″T² + 0.017998″T³
//   z = 2306.2181″T + 1.09468″T² + 0.018203″T³
//   θ = 2004.3109″T − 0.42665″T² − 0.041833″T³
//
//   A = cos δ sin(α + ζ)
//   B = cos θ cos δ cos(α + ζ) − sin θ sin δ
//   C = sin θ cos δ cos(α + ζ) + cos θ sin δ
//   α' = atan2(A, B) + z,  δ' = atan2(C, √(A² + B²))
// -----------------------------------------------------------------

EquatorialCoord Coordinates::precess_from_j2000(const EquatorialCoord& eq, f64 jd)
{
    const f64 t = TimeSystem::julian_centuries(jd);

    const f64 zeta  = (2306.2181 * t + 0.30188 * t * t + 0.017998 * t * t * t) * astro_constants::kArcSecToRad;
    const f64 z     = (2306.2181 * t + 1.09468 * t * t + 0.018203 * t * t * t) * astro_constants::kArcSecToRad;
    const f64 theta = (2004.3109 * t - 0.42665 * t * t - 0.041833 * t * t * t) * astro_constants::kArcSecToRad;

    const f64 cos_dec = std::cos(eq.dec);
    const f64 sin_dec = std::sin(eq.dec);
    const f64 cos_theta = std::cos(theta);
    const f64 sin_theta = std::sin(theta);

    const f64 a = cos_dec * std::sin(eq.ra + zeta);
    const f64 b = cos_theta * cos_dec * std::cos(eq.ra + zeta) - sin_theta * sin_dec;
    const f64 c = sin_theta * cos_dec * std::cos(eq.ra + zeta) + cos_theta * sin_dec;

    return EquatorialCoord{
        .ra  = normalize_radians(std::atan2(a, b) + z),
        .dec = std::atan2(c, std::sqrt(a * a + b * b)),
    };
}

// -----------------------------------------------------------------
// Vector form
// -----------------------------------------------------------------

Vec3d Coordinates::to_unit_vector(const EquatorialCoord& eq)
{
    const f64 cos_dec = std::cos(eq.dec);
    return Vec3d{cos_dec * std::cos(eq.ra), cos_dec * std::sin(eq.ra), std::sin(eq.dec)};
}

EquatorialCoord Coordinates::from_vector(const Vec3d& v)
{
    const f64 len = glm::length(v);
    if (len <= 0.0)
    {
        return EquatorialCoord{.ra = 0.0, .dec = 0.0};
    }

    return EquatorialCoord{
        .ra  = normalize_radians(std::atan2(v.y, v.x)),
        .dec = std::asin(std::clamp(v.z / len, -1.0, 1.0)),
    };
}

// -----------------------------------------------------------------
// Great-circle separation (Vincenty)
//
//   num = sqrt((cos δ2 sin Δα)² + (cos δ1 sin δ2 − sin δ1 cos δ2 cos Δα)²)
//   den = sin δ1 sin δ2 + cos δ1 cos δ2 cos Δα
//   sep = atan2(num, den)
// -----------------------------------------------------------------

f64 Coordinates::angular_separation(const EquatorialCoord& a, const EquatorialCoord& b)
{
    const f64 delta_ra = b.ra - a.ra;

    const f64 sin_d1 = std::sin(a.dec);
    const f64 cos_d1 = std::cos(a.dec);
    const f64 sin_d2 = std::sin(b.dec);
    const f64 cos_d2 = std::cos(b.dec);
    const f64 sin_dra = std::sin(delta_ra);
    const f64 cos_dra = std::cos(delta_ra);

    const f64 term1 = cos_d2 * sin_dra;
    const f64 term2 = cos_d1 * sin_d2 - sin_d1 * cos_d2 * cos_dra;

    const f64 num = std::sqrt(term1 * term1 + term2 * term2);
    const f64 den = sin_d1 * sin_d2 + cos_d1 * cos_d2 * cos_dra;

    return std::atan2(num, den);
}

f64 Coordinates::angular_separation_deg(f64 ra1_deg, f64 dec1_deg, f64 ra2_deg, f64 dec2_deg)
{
    const EquatorialCoord a{.ra = ra1_deg * astro_constants::kDegToRad,
                            .dec = dec1_deg * astro_constants::kDegToRad};
    const EquatorialCoord b{.ra = ra2_deg * astro_constants::kDegToRad,
                            .dec = dec2_deg * astro_constants::kDegToRad};
    return angular_separation(a, b) * astro_constants::kRadToDeg;
}

// -----------------------------------------------------------------
// Pickering (2002): X = 1 / sin(h + 244 / (165 + 47 h^1.1)), h in degrees
// -----------------------------------------------------------------

f64 Coordinates::airmass_pickering(f64 alt_deg)
{
    constexpr f64 kHorizonAirmass = 40.0;

    if (alt_deg <= 0.0)
    {
        return kHorizonAirmass;
    }

    const f64 h = std::min(alt_deg, 90.0);
    const f64 x = 1.0 / std::sin((h + 244.0 / (165.0 + 47.0 * std::pow(h, 1.1)))
                                 * astro_constants::kDegToRad);
    return std::clamp(x, 1.0, kHorizonAirmass);
}

// -----------------------------------------------------------------
// Normalize angle to [0, 2π)
// -----------------------------------------------------------------

f64 Coordinates::normalize_radians(f64 angle)
{
    angle = std::fmod(angle, astro_constants::kTwoPi);
    if (angle < 0.0)
    {
        angle += astro_constants::kTwoPi;
    }
    return angle;
}

} // namespace neoplan::astro
