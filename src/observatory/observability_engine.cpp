/// @file observability_engine.cpp
/// @brief Dark window, altitude scan, Moon and brightness gates, airmass.

#include "observatory/observability_engine.hpp"

#include "astro/coordinates.hpp"
#include "astro/solar_system.hpp"
#include "astro/time_system.hpp"

#include <utility>
#include <vector>

namespace neoplan::observatory
{

namespace
{

using astro::Coordinates;
using astro::SolarSystem;
using astro::TimeSystem;

/// Index range [first, last] of a run of accepted samples.
struct Run
{
    std::size_t first = 0;
    std::size_t last  = 0;

    [[nodiscard]] std::size_t size() const { return last - first + 1; }
};

/// Longest contiguous run of true flags; the earliest wins ties.
std::optional<Run> longest_run(const std::vector<bool>& flags)
{
    std::optional<Run> best;
    std::optional<std::size_t> open;

    for (std::size_t i = 0; i <= flags.size(); ++i)
    {
        const bool on = i < flags.size() && flags[i];
        if (on && !open)
        {
            open = i;
        }
        else if (!on && open)
        {
            const Run run{.first = *open, .last = i - 1};
            if (!best || run.size() > best->size())
            {
                best = run;
            }
            open.reset();
        }
    }
    return best;
}

/// Sample instants from start to end every step; end is always the last sample.
std::vector<Instant> sample_grid(Instant start, Instant end, Duration step)
{
    std::vector<Instant> times;
    for (Instant t = start; t < end; t += step)
    {
        times.push_back(t);
    }
    times.push_back(end);
    return times;
}

astro::EquatorialCoord j2000(f64 ra_deg, f64 dec_deg)
{
    return astro::EquatorialCoord{
        .ra  = ra_deg * astro_constants::kDegToRad,
        .dec = dec_deg * astro_constants::kDegToRad,
    };
}

} // anonymous namespace

f64 ObservabilityEngine::altitude_deg(f64 ra_deg, f64 dec_deg,
                                      const astro::ObserverLocation& observer,
                                      Instant when)
{
    const f64 jd = TimeSystem::to_julian_date(when);
    const f64 lst = TimeSystem::lmst(jd, observer.longitude_rad);
    const astro::EquatorialCoord of_date = Coordinates::precess_from_j2000(j2000(ra_deg, dec_deg), jd);
    return Coordinates::equatorial_to_horizontal(of_date, observer, lst).alt * astro_constants::kRadToDeg;
}

// -----------------------------------------------------------------
// Stage 1: dark window
//
// Samples t_i = now + i·step, i = 0..horizon/step. The dark window spans
// the first and last sample of the longest run with Sun alt < max_sun_alt.
// -----------------------------------------------------------------

std::optional<TimeWindow> ObservabilityEngine::dark_window(const TelescopeProfile& profile,
                                                           Instant now,
                                                           const core::ObservabilityConfig& config)
{
    const astro::ObserverLocation observer = profile.location();
    const Duration step = config.sun_step;
    const auto count = static_cast<std::size_t>(config.horizon / config.sun_step);

    std::vector<Instant> times;
    std::vector<bool> dark;
    times.reserve(count + 1);
    dark.reserve(count + 1);

    for (std::size_t i = 0; i <= count; ++i)
    {
        const Instant t = now + step * static_cast<i64>(i);
        const f64 sun_alt = SolarSystem::sun_altitude_deg(TimeSystem::to_julian_date(t), observer);
        times.push_back(t);
        dark.push_back(sun_alt < profile.max_sun_alt_deg);
    }

    const auto run = longest_run(dark);
    if (!run)
    {
        return std::nullopt;
    }
    return TimeWindow{.start = times[run->first], .end = times[run->last]};
}

ObservabilityResult ObservabilityEngine::evaluate(const target::Target& target,
                                                  const TelescopeProfile& profile,
                                                  Instant now,
                                                  const core::ObservabilityConfig& config)
{
    return evaluate_in_window(target, profile, dark_window(profile, now, config), config);
}

ObservabilityResult ObservabilityEngine::evaluate_in_window(const target::Target& target,
                                                            const TelescopeProfile& profile,
                                                            const std::optional<TimeWindow>& dark,
                                                            const core::ObservabilityConfig& config)
{
    ObservabilityResult result;

    if (!dark)
    {
        result.reason = ObservabilityReason::NoDarkWindow;
        return result;
    }
    result.dark_window = dark;

    // ---- Stage 2: altitude scan inside the dark window ----
    const astro::ObserverLocation observer = profile.location();
    const std::vector<Instant> times = sample_grid(dark->start, dark->end, config.target_step);

    std::vector<f64> altitudes;
    std::vector<bool> above;
    altitudes.reserve(times.size());
    above.reserve(times.size());
    for (const Instant t : times)
    {
        const f64 alt = altitude_deg(target.ra_deg, target.dec_deg, observer, t);
        altitudes.push_back(alt);
        above.push_back(alt > profile.min_altitude_deg);
    }

    const auto run = longest_run(above);
    if (!run)
    {
        result.reason = ObservabilityReason::NeverAboveMinAltitude;
        return result;
    }

    std::size_t best_index = run->first;
    for (std::size_t i = run->first; i <= run->last; ++i)
    {
        if (altitudes[i] > altitudes[best_index])
        {
            best_index = i;
        }
    }

    result.obs_window = TimeWindow{.start = times[run->first], .end = times[run->last]};
    result.obs_window_hours = TimeSystem::to_hours(result.obs_window->length());
    result.best_altitude_deg = altitudes[best_index];

    // ---- Stage 3: Moon separation at the dark-window midpoint, both of date ----
    const f64 mid_jd = TimeSystem::to_julian_date(dark->midpoint());
    const astro::EquatorialCoord moon = SolarSystem::moon_topocentric(mid_jd, observer);
    const astro::EquatorialCoord target_of_date =
        Coordinates::precess_from_j2000(j2000(target.ra_deg, target.dec_deg), mid_jd);
    result.moon_sep_deg = Coordinates::angular_separation(target_of_date, moon) * astro_constants::kRadToDeg;

    if (*result.moon_sep_deg < profile.min_moon_sep_deg)
    {
        result.reason = ObservabilityReason::MoonTooClose;
        return result;
    }

    // ---- Stage 4: brightness gate ----
    if (!target.mag_v)
    {
        result.reason = ObservabilityReason::MagnitudeUnknown;
        return result;
    }
    result.magnitude_margin = profile.limiting_mag - *target.mag_v;
    if (*target.mag_v > profile.limiting_mag)
    {
        result.reason = ObservabilityReason::TooFaint;
        return result;
    }

    // ---- Stage 5: airmass ----
    std::size_t airmass_index = run->first;
    f64 best_airmass = Coordinates::airmass_pickering(altitudes[run->first]);
    for (std::size_t i = run->first + 1; i <= run->last; ++i)
    {
        const f64 x = Coordinates::airmass_pickering(altitudes[i]);
        if (x < best_airmass)
        {
            best_airmass = x;
            airmass_index = i;
        }
    }

    result.best_airmass = best_airmass;
    result.transit_time = times[airmass_index];
    result.observable = true;
    result.reason = ObservabilityReason::Observable;
    return result;
}

} // namespace neoplan::observatory
