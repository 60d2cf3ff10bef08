/// @file time_system.cpp
/// @brief Implementation of astronomical time utilities.

#include "astro/time_system.hpp"

#include "core/types.hpp"

#include <spdlog/fmt/fmt.h>

#include <charconv>
#include <chrono>
#include <cmath>

namespace neoplan::astro
{

namespace
{

/// Parse exactly `width` decimal digits starting at `pos`.
std::optional<i32> parse_fixed_int(std::string_view text, std::size_t pos, std::size_t width)
{
    if (pos + width > text.size())
    {
        return std::nullopt;
    }

    i32 value = 0;
    const char* first = text.data() + pos;
    const char* last = first + width;
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last)
    {
        return std::nullopt;
    }
    return value;
}

} // anonymous namespace

// -----------------------------------------------------------------
// Julian Date: Meeus algorithm (Astronomical Algorithms, Ch. 7)
// -----------------------------------------------------------------

f64 TimeSystem::to_julian_date(const DateTime& dt)
{
    i32 y = dt.year;
    i32 m = dt.month;

    // Jan and Feb are treated as months 13 and 14 of the previous year
    if (m <= 2)
    {
        y -= 1;
        m += 12;
    }

    // Gregorian calendar correction
    const i32 a = y / 100;
    const i32 b = 2 - a + (a / 4);

    const f64 day_fraction = (static_cast<f64>(dt.hour)
                            + static_cast<f64>(dt.minute) / 60.0
                            + dt.second / 3600.0) / 24.0;

    return std::floor(365.25 * static_cast<f64>(y + 4716))
         + std::floor(30.6001 * static_cast<f64>(m + 1))
         + static_cast<f64>(dt.day)
         + day_fraction
         + static_cast<f64>(b)
         - 1524.5;
}

f64 TimeSystem::to_julian_date(Instant instant)
{
    using namespace std::chrono;

    const auto total_seconds = duration_cast<duration<f64>>(instant.time_since_epoch()).count();
    return astro_constants::kUnixEpochJd + total_seconds / astro_constants::kSecondsPerDay;
}

// -----------------------------------------------------------------
// Julian Date → civil date/time (Meeus, Ch. 7)
// -----------------------------------------------------------------

DateTime TimeSystem::from_julian_date(f64 jd)
{
    // Add 0.5 to shift from noon-based to midnight-based
    const f64 jd_plus = jd + 0.5;
    const i32 z = static_cast<i32>(std::floor(jd_plus));
    const f64 f = jd_plus - static_cast<f64>(z);

    i32 a = z;
    if (z >= 2299161)
    {
        const i32 alpha = static_cast<i32>(std::floor(
            (static_cast<f64>(z) - 1867216.25) / 36524.25));
        a = z + 1 + alpha - (alpha / 4);
    }

    const i32 b = a + 1524;
    const i32 c = static_cast<i32>(std::floor((static_cast<f64>(b) - 122.1) / 365.25));
    const i32 d = static_cast<i32>(std::floor(365.25 * static_cast<f64>(c)));
    const i32 e = static_cast<i32>(std::floor(static_cast<f64>(b - d) / 30.6001));

    const f64 day_with_fraction = static_cast<f64>(b - d)
                                - std::floor(30.6001 * static_cast<f64>(e))
                                + f;

    const i32 day = static_cast<i32>(std::floor(day_with_fraction));
    const f64 day_frac = day_with_fraction - static_cast<f64>(day);

    const i32 month = (e < 14) ? (e - 1) : (e - 13);
    const i32 year = (month > 2) ? (c - 4716) : (c - 4715);

    const f64 hours_total = day_frac * 24.0;
    const i32 hour = static_cast<i32>(std::floor(hours_total));

    const f64 minutes_total = (hours_total - static_cast<f64>(hour)) * 60.0;
    const i32 minute = static_cast<i32>(std::floor(minutes_total));

    const f64 second = (minutes_total - static_cast<f64>(minute)) * 60.0;

    return DateTime{
        .year   = year,
        .month  = month,
        .day    = day,
        .hour   = hour,
        .minute = minute,
        .second = second,
    };
}

Instant TimeSystem::to_instant(const DateTime& dt)
{
    using namespace std::chrono;

    const sys_days date{year{dt.year} / month{static_cast<unsigned>(dt.month)}
                        / day{static_cast<unsigned>(dt.day)}};
    const auto micros = microseconds{static_cast<i64>(std::llround(dt.second * 1.0e6))};

    return Instant{duration_cast<Duration>(date.time_since_epoch())}
         + hours{dt.hour} + minutes{dt.minute}
         + duration_cast<Duration>(micros);
}

// -----------------------------------------------------------------
// Julian centuries since J2000.0
// -----------------------------------------------------------------

f64 TimeSystem::julian_centuries(f64 jd)
{
    return (jd - astro_constants::kJ2000) / 36525.0;
}

// -----------------------------------------------------------------
// GMST: IAU 1982 formula
//
// GMST (degrees) = 280.46061837
//                + 360.98564736629 × (JD − 2451545.0)
//                + 0.000387933 × T²
//                − T³ / 38710000
// -----------------------------------------------------------------

f64 TimeSystem::gmst(f64 jd)
{
    const f64 t = julian_centuries(jd);
    const f64 d = jd - astro_constants::kJ2000;

    f64 gmst_deg = 280.46061837
                 + 360.98564736629 * d
                 + 0.000387933 * t * t
                 - (t * t * t) / 38710000.0;

    gmst_deg = std::fmod(gmst_deg, 360.0);
    if (gmst_deg < 0.0)
    {
        gmst_deg += 360.0;
    }

    return gmst_deg * astro_constants::kDegToRad;
}

// -----------------------------------------------------------------
// LMST = GMST + observer longitude
// -----------------------------------------------------------------

f64 TimeSystem::lmst(f64 jd, f64 longitude_rad)
{
    return normalize_radians(gmst(jd) + longitude_rad);
}

// -----------------------------------------------------------------
// ISO-8601 formatting and parsing (UTC only)
// -----------------------------------------------------------------

std::string TimeSystem::format_iso8601(Instant instant)
{
    using namespace std::chrono;

    const auto secs = floor<seconds>(instant);
    const auto day_point = floor<days>(secs);
    const year_month_day ymd{day_point};
    const hh_mm_ss hms{secs - day_point};

    return fmt::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}Z",
                       static_cast<int>(ymd.year()),
                       static_cast<unsigned>(ymd.month()),
                       static_cast<unsigned>(ymd.day()),
                       hms.hours().count(),
                       hms.minutes().count(),
                       hms.seconds().count());
}

std::optional<Instant> TimeSystem::parse_iso8601(std::string_view text)
{
    // Minimum form: YYYY-MM-DDTHH:MM
    if (text.size() < 16 || text[4] != '-' || text[7] != '-' || text[13] != ':'
        || (text[10] != 'T' && text[10] != ' '))
    {
        return std::nullopt;
    }

    if (text.back() == 'Z')
    {
        text.remove_suffix(1);
    }

    const auto yr  = parse_fixed_int(text, 0, 4);
    const auto mo  = parse_fixed_int(text, 5, 2);
    const auto dy  = parse_fixed_int(text, 8, 2);
    const auto hr  = parse_fixed_int(text, 11, 2);
    const auto mi  = parse_fixed_int(text, 14, 2);

    if (!yr || !mo || !dy || !hr || !mi)
    {
        return std::nullopt;
    }

    f64 second = 0.0;
    if (text.size() > 16)
    {
        if (text[16] != ':')
        {
            return std::nullopt;
        }
        const char* first = text.data() + 17;
        const char* last = text.data() + text.size();
        const auto [ptr, ec] = std::from_chars(first, last, second);
        if (ec != std::errc{} || ptr != last)
        {
            return std::nullopt;
        }
    }

    const std::chrono::year_month_day ymd{std::chrono::year{*yr},
                                          std::chrono::month{static_cast<unsigned>(*mo)},
                                          std::chrono::day{static_cast<unsigned>(*dy)}};
    if (!ymd.ok() || *hr > 23 || *mi > 59 || second < 0.0 || second >= 61.0)
    {
        return std::nullopt;
    }

    return to_instant(DateTime{
        .year   = *yr,
        .month  = *mo,
        .day    = *dy,
        .hour   = *hr,
        .minute = *mi,
        .second = second,
    });
}

f64 TimeSystem::to_hours(Duration duration)
{
    return std::chrono::duration_cast<std::chrono::duration<f64, std::ratio<3600>>>(duration).count();
}

// -----------------------------------------------------------------
// Normalize angle to [0, 2π)
// -----------------------------------------------------------------

f64 TimeSystem::normalize_radians(f64 angle)
{
    angle = std::fmod(angle, astro_constants::kTwoPi);
    if (angle < 0.0)
    {
        angle += astro_constants::kTwoPi;
    }
    return angle;
}

} // namespace neoplan::astro
