#pragma once

/// @file telescope_profile.hpp
/// @brief Caller-supplied site and sensitivity description used to filter and rank targets.

#include "astro/coordinates.hpp"
#include "core/types.hpp"

#include <optional>
#include <string>

namespace neoplan::observatory
{
    /// @brief A follow-up telescope and its observing constraints.
    ///
    /// Immutable for the duration of one query. Use designated initializers:
    /// TelescopeProfile{.name = "Backyard", .lat_deg = 51.5, .lon_deg = -0.1}.
    struct TelescopeProfile
    {
        // ---- Identity ----
        std::string                name = "My Telescope";
        std::optional<std::string> code;            ///< MPC observatory code, e.g. "244"

        // ---- Location ----
        f64 lat_deg = 0.0;      ///< Geodetic latitude, north positive
        f64 lon_deg = 0.0;      ///< Longitude, east positive
        f64 alt_m   = 0.0;      ///< Height above sea level (metres)

        // ---- Optics ----
        f64                limiting_mag = 18.0;
        std::optional<f64> aperture_m;
        std::optional<f64> fov_arcmin;

        // ---- Observing constraints ----
        f64 min_altitude_deg = 20.0;
        f64 max_sun_alt_deg  = -12.0;   ///< Sun must be below this for "dark"
        f64 min_moon_sep_deg = 30.0;

        /// @brief Observer location in radians for the coordinate transforms.
        [[nodiscard]] astro::ObserverLocation location() const;
    };

    /// @brief Check every field against its domain.
    /// @return A description of the first violation, or std::nullopt if valid.
    [[nodiscard]] std::optional<std::string> validate_profile(const TelescopeProfile& profile);

    // -----------------------------------------------------------------
    // Presets
    // -----------------------------------------------------------------

    /// Wallace Astrophysical Observatory (MIT), MPC code 244.
    [[nodiscard]] TelescopeProfile make_wallace_profile();

    /// Typical suburban backyard setup: 20 cm aperture, bright sky.
    [[nodiscard]] TelescopeProfile make_backyard_profile();

} // namespace neoplan::observatory
