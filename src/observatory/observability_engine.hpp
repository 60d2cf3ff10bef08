#pragma once

/// @file observability_engine.hpp
/// @brief Decides whether and when a target can be observed tonight from a given site.

#include "core/config.hpp"
#include "core/types.hpp"
#include "observatory/telescope_profile.hpp"
#include "target/target.hpp"

#include <optional>

namespace neoplan::observatory
{
    /// @brief Closed interval of UTC instants.
    struct TimeWindow
    {
        Instant start;
        Instant end;

        [[nodiscard]] Duration length() const { return end - start; }
        [[nodiscard]] Instant midpoint() const { return start + (end - start) / 2; }
        [[nodiscard]] bool contains(const TimeWindow& other) const
        {
            return other.start >= start && other.end <= end;
        }

        bool operator==(const TimeWindow&) const = default;
    };

    /// @brief Why a target was (not) accepted. Gates are evaluated in this order.
    enum class ObservabilityReason
    {
        Observable,
        NoDarkWindow,
        NeverAboveMinAltitude,
        MoonTooClose,
        MagnitudeUnknown,
        TooFaint,
    };

    inline const char* reason_name(ObservabilityReason reason)
    {
        switch (reason)
        {
            case ObservabilityReason::Observable:            return "observable";
            case ObservabilityReason::NoDarkWindow:          return "no dark window";
            case ObservabilityReason::NeverAboveMinAltitude: return "never above minimum altitude";
            case ObservabilityReason::MoonTooClose:          return "moon too close";
            case ObservabilityReason::MagnitudeUnknown:      return "magnitude unknown";
            case ObservabilityReason::TooFaint:              return "too faint";
            default:                                         return "unknown";
        }
    }

    /// @brief Derived per-query visibility of one target. Never stored.
    ///
    /// Optional fields stay absent when the stage computing them did not run.
    struct ObservabilityResult
    {
        bool                observable = false;
        ObservabilityReason reason     = ObservabilityReason::NoDarkWindow;

        std::optional<TimeWindow> dark_window;
        std::optional<TimeWindow> obs_window;
        f64                       obs_window_hours = 0.0;

        std::optional<f64>     best_altitude_deg;
        std::optional<f64>     best_airmass;
        std::optional<Instant> transit_time;    ///< Instant of best airmass inside obs_window
        std::optional<f64>     moon_sep_deg;
        std::optional<f64>     magnitude_margin; ///< limiting_mag − mag_v
    };

    /// @brief Pure observability computation.
    ///
    /// 1. Dark window: Sun altitude sampled every `sun_step` over `horizon` from `now`
    ///    (both ends inclusive); longest run below max_sun_alt_deg, earliest on ties.
    /// 2. Altitude scan inside the dark window every `target_step` (end always sampled);
    ///    obs_window is the longest run above min_altitude_deg.
    /// 3. Topocentric Moon separation at the dark-window midpoint.
    /// 4. Brightness gate against limiting_mag.
    /// 5. Pickering airmass over obs_window; minimum and its instant.
    ///
    /// No shared state; safe to call concurrently.
    class ObservabilityEngine
    {
    public:
        ObservabilityEngine() = delete;

        /// @brief Run all stages for one target.
        [[nodiscard]] static ObservabilityResult evaluate(
            const target::Target& target,
            const TelescopeProfile& profile,
            Instant now,
            const core::ObservabilityConfig& config = {}
        );

        /// @brief Run stages 2–5 against a dark window computed earlier with dark_window().
        ///
        /// Lets callers ranking many targets for the same site and instant scan
        /// the Sun once.
        [[nodiscard]] static ObservabilityResult evaluate_in_window(
            const target::Target& target,
            const TelescopeProfile& profile,
            const std::optional<TimeWindow>& dark,
            const core::ObservabilityConfig& config = {}
        );

        /// @brief Stage 1 alone: tonight's dark window, or std::nullopt if the Sun never sets far enough.
        [[nodiscard]] static std::optional<TimeWindow> dark_window(
            const TelescopeProfile& profile,
            Instant now,
            const core::ObservabilityConfig& config = {}
        );

        /// @brief Topocentric altitude (degrees) of a J2000 position at an instant.
        ///
        /// The position is precessed to the equator of date before the hour angle is formed.
        [[nodiscard]] static f64 altitude_deg(
            f64 ra_deg, f64 dec_deg,
            const astro::ObserverLocation& observer,
            Instant when
        );
    };

} // namespace neoplan::observatory
