#pragma once

/// @file time_system.hpp
/// @brief Astronomical time utilities: Julian Date, sidereal time, UTC instants.

#include "core/types.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace neoplan::astro
{
    /// @brief Civil date/time representation (UTC).
    struct DateTime
    {
        i32 year;
        i32 month;
        i32 day;
        i32 hour;
        i32 minute;
        f64 second;
    };

    /// @brief Static utility class for astronomical time computations.
    ///
    /// Provides Julian Date conversion (Meeus algorithm, Astronomical Algorithms Ch. 7),
    /// Greenwich/Local Mean Sidereal Time (IAU 1982), and conversions between
    /// Julian Dates and std::chrono UTC instants.
    /// All angular results are in radians unless noted otherwise.
    class TimeSystem
    {
    public:
        TimeSystem() = delete;

        /// @brief Convert civil date/time (UTC) to Julian Date.
        /// @param dt Civil date/time. Month in [1,12], day in [1,31].
        [[nodiscard]] static f64 to_julian_date(const DateTime& dt);

        /// @brief Convert a UTC instant to Julian Date.
        [[nodiscard]] static f64 to_julian_date(Instant instant);

        /// @brief Convert Julian Date back to civil date/time (UTC).
        /// @param jd Julian Date (must be positive).
        [[nodiscard]] static DateTime from_julian_date(f64 jd);

        /// @brief Convert civil date/time (UTC) to an instant.
        [[nodiscard]] static Instant to_instant(const DateTime& dt);

        /// @brief Compute Julian centuries elapsed since J2000.0.
        /// @return T = (JD - 2451545.0) / 36525.0
        [[nodiscard]] static f64 julian_centuries(f64 jd);

        /// @brief Greenwich Mean Sidereal Time (radians), IAU 1982 formula.
        /// @return GMST in radians, normalized to [0, 2π).
        [[nodiscard]] static f64 gmst(f64 jd);

        /// @brief Local Mean Sidereal Time (radians).
        /// @param jd Julian Date (UTC).
        /// @param longitude_rad Observer longitude in radians (east positive).
        [[nodiscard]] static f64 lmst(f64 jd, f64 longitude_rad);

        /// @brief Format an instant as ISO-8601 UTC, minute or second precision.
        /// Example: "2026-02-15T23:30:00Z".
        [[nodiscard]] static std::string format_iso8601(Instant instant);

        /// @brief Parse "YYYY-MM-DDTHH:MM[:SS[.fff]][Z]" (a space may replace the 'T').
        /// @return The instant, or std::nullopt if the text is not a valid UTC timestamp.
        [[nodiscard]] static std::optional<Instant> parse_iso8601(std::string_view text);

        /// @brief Convert a duration to fractional hours.
        [[nodiscard]] static f64 to_hours(Duration duration);

    private:
        /// @brief Normalize an angle to the range [0, 2π).
        [[nodiscard]] static f64 normalize_radians(f64 angle);
    };

} // namespace neoplan::astro
