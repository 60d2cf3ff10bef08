#pragma once

/// @file coordinates.hpp
/// @brief Astronomical coordinate transforms: Equatorial, Ecliptic, Horizontal, separations, airmass.

#include "core/types.hpp"

namespace neoplan::astro
{
    /// @brief Equatorial coordinate (J2000 / ICRS).
    struct EquatorialCoord
    {
        f64 ra;     ///< Right ascension (radians, 0..2π)
        f64 dec;    ///< Declination (radians, -π/2..+π/2)
    };

    /// @brief Horizontal (topocentric) coordinate.
    struct HorizontalCoord
    {
        f64 alt;    ///< Altitude (radians, -π/2..+π/2, negative = below horizon)
        f64 az;     ///< Azimuth (radians, 0..2π, 0=North, π/2=East)
    };

    /// @brief Geocentric ecliptic coordinate (of date).
    struct EclipticCoord
    {
        f64 lon;    ///< Ecliptic longitude (radians, 0..2π)
        f64 lat;    ///< Ecliptic latitude (radians)
    };

    /// @brief Observer geographic location.
    struct ObserverLocation
    {
        f64 latitude_rad;   ///< Geographic latitude (radians, north positive)
        f64 longitude_rad;  ///< Geographic longitude (radians, east positive)
        f64 height_m = 0.0; ///< Height above sea level (metres)
    };

    /// @brief Static utility class for astronomical coordinate transformations.
    ///
    /// All angular inputs and outputs are in radians unless a function name says degrees.
    /// Double precision (f64) is used throughout for arcsecond-level accuracy.
    class Coordinates
    {
    public:
        Coordinates() = delete;

        /// @brief Equatorial (RA/Dec) → Horizontal (Alt/Az).
        /// @param eq Equatorial coordinates of the object.
        /// @param observer Observer geographic location.
        /// @param local_sidereal_time_rad Local Mean Sidereal Time (radians).
        [[nodiscard]] static HorizontalCoord equatorial_to_horizontal(
            const EquatorialCoord& eq,
            const ObserverLocation& observer,
            f64 local_sidereal_time_rad
        );

        /// @brief Ecliptic (lon/lat) → Equatorial (RA/Dec) for a given obliquity.
        [[nodiscard]] static EquatorialCoord ecliptic_to_equatorial(
            const EclipticCoord& ecl,
            f64 obliquity_rad
        );

        /// @brief Mean obliquity of the ecliptic (radians) at a Julian Date.
        [[nodiscard]] static f64 mean_obliquity(f64 jd);

        /// @brief Precess a J2000 mean position to the mean equator and equinox of a date.
        ///
        /// IAU 1976 precession angles (ζ, z, θ). Good to well under an arcsecond
        /// within a few centuries of J2000.
        [[nodiscard]] static EquatorialCoord precess_from_j2000(const EquatorialCoord& eq, f64 jd);

        /// @brief Unit vector in the equatorial frame (x → RA 0, z → north pole).
        [[nodiscard]] static Vec3d to_unit_vector(const EquatorialCoord& eq);

        /// @brief Equatorial coordinate of a (not necessarily unit) direction vector.
        [[nodiscard]] static EquatorialCoord from_vector(const Vec3d& v);

        /// @brief Great-circle separation between two equatorial positions (radians).
        ///
        /// Uses the Vincenty form of the haversine so that arcsecond-scale
        /// separations keep full precision.
        [[nodiscard]] static f64 angular_separation(
            const EquatorialCoord& a,
            const EquatorialCoord& b
        );

        /// @brief Great-circle separation between two RA/Dec pairs given in degrees.
        /// @return Separation in degrees.
        [[nodiscard]] static f64 angular_separation_deg(
            f64 ra1_deg, f64 dec1_deg,
            f64 ra2_deg, f64 dec2_deg
        );

        /// @brief Airmass from altitude, Pickering (2002) empirical formula.
        ///
        /// Valid down to the horizon. Always >= 1.0; clamped to 40 at or below
        /// the horizon.
        /// @param alt_deg Apparent altitude in degrees.
        [[nodiscard]] static f64 airmass_pickering(f64 alt_deg);

        /// @brief Normalize an angle to the range [0, 2π).
        [[nodiscard]] static f64 normalize_radians(f64 angle);
    };

} // namespace neoplan::astro
