/// @file telescope_profile.cpp
/// @brief TelescopeProfile validation and preset sites.

#include "observatory/telescope_profile.hpp"

#include <spdlog/fmt/fmt.h>

#include <cmath>

namespace neoplan::observatory
{

astro::ObserverLocation TelescopeProfile::location() const
{
    return astro::ObserverLocation{
        .latitude_rad  = lat_deg * astro_constants::kDegToRad,
        .longitude_rad = lon_deg * astro_constants::kDegToRad,
        .height_m      = alt_m,
    };
}

std::optional<std::string> validate_profile(const TelescopeProfile& profile)
{
    const auto in_range = [](f64 v, f64 lo, f64 hi) {
        return std::isfinite(v) && v >= lo && v <= hi;
    };

    if (!in_range(profile.lat_deg, -90.0, 90.0))
    {
        return fmt::format("lat_deg {} outside [-90, 90]", profile.lat_deg);
    }
    if (!std::isfinite(profile.lon_deg) || profile.lon_deg < -180.0 || profile.lon_deg >= 360.0)
    {
        return fmt::format("lon_deg {} outside [-180, 360)", profile.lon_deg);
    }
    if (!in_range(profile.alt_m, -500.0, 10000.0))
    {
        return fmt::format("alt_m {} outside [-500, 10000]", profile.alt_m);
    }
    if (!std::isfinite(profile.limiting_mag))
    {
        return "limiting_mag must be finite";
    }
    if (profile.aperture_m && (!std::isfinite(*profile.aperture_m) || *profile.aperture_m <= 0.0))
    {
        return "aperture_m must be positive";
    }
    if (profile.fov_arcmin && (!std::isfinite(*profile.fov_arcmin) || *profile.fov_arcmin <= 0.0))
    {
        return "fov_arcmin must be positive";
    }
    if (!std::isfinite(profile.min_altitude_deg)
        || profile.min_altitude_deg < 0.0 || profile.min_altitude_deg >= 90.0)
    {
        return fmt::format("min_altitude_deg {} outside [0, 90)", profile.min_altitude_deg);
    }
    if (!in_range(profile.max_sun_alt_deg, -90.0, 0.0))
    {
        return fmt::format("max_sun_alt_deg {} outside [-90, 0]", profile.max_sun_alt_deg);
    }
    if (!in_range(profile.min_moon_sep_deg, 0.0, 180.0))
    {
        return fmt::format("min_moon_sep_deg {} outside [0, 180]", profile.min_moon_sep_deg);
    }
    return std::nullopt;
}

// -----------------------------------------------------------------
// Presets
// -----------------------------------------------------------------

TelescopeProfile make_wallace_profile()
{
    return TelescopeProfile{
        .name             = "Wallace Astrophysical Observatory",
        .code             = "244",
        .lat_deg          = 42.6138,
        .lon_deg          = -71.4889,
        .alt_m            = 180.0,
        .limiting_mag     = 19.5,
        .aperture_m       = 0.6,
        .fov_arcmin       = 20.0,
        .min_altitude_deg = 20.0,
        .max_sun_alt_deg  = -12.0,
        .min_moon_sep_deg = 30.0,
    };
}

TelescopeProfile make_backyard_profile()
{
    return TelescopeProfile{
        .name         = "Backyard Observatory",
        .lat_deg      = 51.5,
        .lon_deg      = -0.1,
        .alt_m        = 10.0,
        .limiting_mag = 16.5,
        .aperture_m   = 0.2,
        .fov_arcmin   = 30.0,
    };
}

} // namespace neoplan::observatory
