/// @file time_system.cpp
/// @brief Implementation of astronomical time utilities.

#include "astro/time_system.hpp"

#include "core/types.hpp"

#include <charconv>
#include <chrono>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace almanac::astro
{

namespace
{

std::optional<i32> parse_i32(std::string_view sv)
{
    if (sv.empty())
    {
        return std::nullopt;
    }

    i32 value = 0;
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);

    if (ec != std::errc{} || ptr != sv.data() + sv.size())
    {
        return std::nullopt;
    }
    return value;
}

std::optional<f64> parse_seconds(std::string_view sv)
{
    if (sv.empty())
    {
        return std::nullopt;
    }

    f64 value = 0.0;
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);

    if (ec != std::errc{} || ptr != sv.data() + sv.size() || !std::isfinite(value))
    {
        return std::nullopt;
    }
    return value;
}

} // namespace

// -----------------------------------------------------------------
// Julian Date — Meeus algorithm (Astronomical Algorithms, Ch. 7)
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

    // Day fraction from hours, minutes, seconds
    const f64 day_fraction = (static_cast<f64>(dt.hour)
                            + static_cast<f64>(dt.minute) / 60.0
                            + dt.second / 3600.0) / 24.0;

    const f64 jd = std::floor(365.25 * static_cast<f64>(y + 4716))
                 + std::floor(30.6001 * static_cast<f64>(m + 1))
                 + static_cast<f64>(dt.day)
                 + day_fraction
                 + static_cast<f64>(b)
                 - 1524.5;

    return jd;
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
    const i32 c = static_cast<i32>(std::floor(
        (static_cast<f64>(b) - 122.1) / 365.25));
    const i32 d = static_cast<i32>(std::floor(
        365.25 * static_cast<f64>(c)));
    const i32 e = static_cast<i32>(std::floor(
        static_cast<f64>(b - d) / 30.6001));

    // Day (with fractional part)
    const f64 day_with_fraction = static_cast<f64>(b - d)
                                - std::floor(30.6001 * static_cast<f64>(e))
                                + f;

    const i32 day = static_cast<i32>(std::floor(day_with_fraction));
    const f64 day_frac = day_with_fraction - static_cast<f64>(day);

    const i32 month = (e < 14) ? (e - 1) : (e - 13);
    const i32 year = (month > 2) ? (c - 4716) : (c - 4715);

    const f64 seconds_of_day = day_frac * astro_constants::kSecondsPerDay;
    const i32 whole_minutes = static_cast<i32>(std::floor(seconds_of_day / 60.0));
    const i32 hour = whole_minutes / 60;
    const i32 minute = whole_minutes % 60;
    const f64 second = seconds_of_day - 60.0 * static_cast<f64>(whole_minutes);

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
    return Instant::from_jd(to_julian_date(dt));
}

// -----------------------------------------------------------------
// Julian centuries since J2000.0
// -----------------------------------------------------------------

f64 TimeSystem::julian_centuries(f64 jd)
{
    return (jd - astro_constants::kJ2000) / 36525.0;
}

// -----------------------------------------------------------------
// GMST — IAU 1982 formula
//
// GMST (degrees) = 280.46061837
//                + 360.98564736629 × (JD − 2451545.0)
//                + 0.000387933 × T²
//                − T³ / 38710000
//
// Where T = Julian centuries from J2000.0
// Result normalized to [0, 360°), then converted to radians.
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
// Current system time → Instant
// -----------------------------------------------------------------

Instant TimeSystem::now()
{
    using namespace std::chrono;

    const auto since_epoch = system_clock::now().time_since_epoch();
    const auto total_seconds = duration_cast<duration<f64>>(since_epoch).count();

    // Unix epoch (1970-01-01 00:00 UTC) as Julian Date
    constexpr f64 kUnixEpochJd = 2440587.5;

    return Instant::from_jd(kUnixEpochJd + total_seconds / astro_constants::kSecondsPerDay);
}

// -----------------------------------------------------------------
// ISO-8601 formatting
//
// Rounds to whole milliseconds on the integer day grid first so a
// value like 12:59:59.9999 prints as 13:00:00.000.
// -----------------------------------------------------------------

std::string TimeSystem::to_iso_string(Instant t)
{
    constexpr i64 kMsPerDay = 86'400'000;

    const f64 shifted = t.jd + 0.5;
    f64 day_number = std::floor(shifted);
    i64 ms = std::llround((shifted - day_number) * static_cast<f64>(kMsPerDay));
    if (ms >= kMsPerDay)
    {
        ms -= kMsPerDay;
        day_number += 1.0;
    }

    const DateTime midnight = from_julian_date(day_number - 0.5);

    const i64 hour   = ms / 3'600'000;
    const i64 minute = (ms / 60'000) % 60;
    const i64 second = (ms / 1000) % 60;
    const i64 milli  = ms % 1000;

    std::ostringstream out;
    out << std::setfill('0')
        << std::setw(4) << midnight.year << '-'
        << std::setw(2) << midnight.month << '-'
        << std::setw(2) << midnight.day << 'T'
        << std::setw(2) << hour << ':'
        << std::setw(2) << minute << ':'
        << std::setw(2) << second << '.'
        << std::setw(3) << milli << 'Z';
    return out.str();
}

// -----------------------------------------------------------------
// ISO-8601 parsing
// -----------------------------------------------------------------

std::optional<Instant> TimeSystem::parse_iso(std::string_view text)
{
    if (!text.empty() && (text.back() == 'Z' || text.back() == 'z'))
    {
        text.remove_suffix(1);
    }

    const auto split = text.find_first_of("Tt ");
    const std::string_view date_part = text.substr(0, split);
    const std::string_view time_part =
        (split == std::string_view::npos) ? std::string_view{} : text.substr(split + 1);

    // Date: YYYY-MM-DD (a leading '-' would be a negative year; not supported)
    const auto d1 = date_part.find('-');
    const auto d2 = (d1 == std::string_view::npos) ? d1 : date_part.find('-', d1 + 1);
    if (d1 == std::string_view::npos || d2 == std::string_view::npos)
    {
        return std::nullopt;
    }

    const auto year  = parse_i32(date_part.substr(0, d1));
    const auto month = parse_i32(date_part.substr(d1 + 1, d2 - d1 - 1));
    const auto day   = parse_i32(date_part.substr(d2 + 1));
    if (!year || !month || !day || *month < 1 || *month > 12 || *day < 1 || *day > 31)
    {
        return std::nullopt;
    }

    DateTime dt{
        .year   = *year,
        .month  = *month,
        .day    = *day,
        .hour   = 0,
        .minute = 0,
        .second = 0.0,
    };

    if (split != std::string_view::npos)
    {
        const auto t1 = time_part.find(':');
        if (t1 == std::string_view::npos)
        {
            return std::nullopt;
        }
        const auto t2 = time_part.find(':', t1 + 1);

        const auto hour = parse_i32(time_part.substr(0, t1));
        const auto minute = parse_i32(time_part.substr(
            t1 + 1, (t2 == std::string_view::npos) ? std::string_view::npos : t2 - t1 - 1));
        if (!hour || !minute || *hour < 0 || *hour > 23 || *minute < 0 || *minute > 59)
        {
            return std::nullopt;
        }
        dt.hour = *hour;
        dt.minute = *minute;

        if (t2 != std::string_view::npos)
        {
            const auto second = parse_seconds(time_part.substr(t2 + 1));
            if (!second || *second < 0.0 || *second >= 61.0)
            {
                return std::nullopt;
            }
            dt.second = *second;
        }
    }

    return to_instant(dt);
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

} // namespace almanac::astro
