#pragma once

/// @file solar_system.hpp
/// @brief Low-precision Sun and Moon ephemerides for twilight and Moon-avoidance checks.

#include "astro/coordinates.hpp"
#include "core/types.hpp"

namespace neoplan::astro
{
    /// @brief Geocentric Moon position plus distance.
    struct MoonPosition
    {
        EquatorialCoord equatorial;   ///< Geocentric RA/Dec (radians)
        f64 distance_earth_radii;     ///< Geocentric distance (Earth equatorial radii)
    };

    /// @brief Analytic Sun and Moon positions.
    ///
    /// Sun: Astronomical Almanac low-precision formula, ~0.01° over 1950–2050.
    /// Moon: truncated ELP series (Astronomical Almanac), ~0.3° in longitude,
    /// with horizontal parallax so the topocentric position is available.
    /// Both are far more accurate than the dark-window and Moon-gate thresholds need.
    class SolarSystem
    {
    public:
        SolarSystem() = delete;

        /// @brief Apparent geocentric equatorial position of the Sun.
        [[nodiscard]] static EquatorialCoord sun_position(f64 jd);

        /// @brief Geocentric equatorial position and distance of the Moon.
        [[nodiscard]] static MoonPosition moon_position(f64 jd);

        /// @brief Moon position as seen from the observer (parallax applied).
        [[nodiscard]] static EquatorialCoord moon_topocentric(f64 jd, const ObserverLocation& observer);

        /// @brief Altitude of the Sun's centre above the observer's horizon (degrees).
        [[nodiscard]] static f64 sun_altitude_deg(f64 jd, const ObserverLocation& observer);

        /// @brief Observer position in the equatorial frame (Earth radii), spherical Earth.
        [[nodiscard]] static Vec3d observer_vector(f64 jd, const ObserverLocation& observer);
    };

} // namespace neoplan::astro
