#pragma once

/// @file time_system.hpp
/// @brief Astronomical time utilities: instants, durations, Julian Date, sidereal time.

#include "core/types.hpp"

#include <compare>
#include <optional>
#include <string>
#include <string_view>

namespace almanac::astro
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

    /// @brief Signed time span in fractional days.
    struct Duration
    {
        f64 days{0.0};

        [[nodiscard]] static constexpr Duration from_days(f64 d) { return Duration{d}; }
        [[nodiscard]] static constexpr Duration from_hours(f64 h) { return Duration{h / 24.0}; }
        [[nodiscard]] static constexpr Duration from_minutes(f64 m) { return Duration{m / 1440.0}; }
        [[nodiscard]] static constexpr Duration from_seconds(f64 s)
        {
            return Duration{s / astro_constants::kSecondsPerDay};
        }

        [[nodiscard]] constexpr f64 seconds() const { return days * astro_constants::kSecondsPerDay; }
        [[nodiscard]] constexpr f64 minutes() const { return days * 1440.0; }

        constexpr Duration operator+(Duration o) const { return Duration{days + o.days}; }
        constexpr Duration operator-(Duration o) const { return Duration{days - o.days}; }
        constexpr Duration operator*(f64 s) const { return Duration{days * s}; }
        constexpr Duration operator/(f64 s) const { return Duration{days / s}; }
        constexpr Duration operator-() const { return Duration{-days}; }

        constexpr auto operator<=>(const Duration&) const = default;
    };

    /// @brief Absolute instant, held as a UTC Julian Date.
    ///
    /// Double precision keeps ~50 µs resolution for present-day dates,
    /// far below the refinement accuracy of the event finder.
    struct Instant
    {
        f64 jd{astro_constants::kJ2000};

        [[nodiscard]] static constexpr Instant from_jd(f64 jd) { return Instant{jd}; }

        constexpr Instant operator+(Duration d) const { return Instant{jd + d.days}; }
        constexpr Instant operator-(Duration d) const { return Instant{jd - d.days}; }
        constexpr Duration operator-(Instant o) const { return Duration{jd - o.jd}; }

        constexpr auto operator<=>(const Instant&) const = default;
    };

    /// @brief Static utility class for astronomical time computations.
    ///
    /// Provides Julian Date conversion (Meeus algorithm, Astronomical Algorithms Ch. 7),
    /// Greenwich/Local Mean Sidereal Time (IAU 1982), ISO-8601 formatting and
    /// parsing, and system clock access.
    /// All angular results are in radians unless noted otherwise.
    class TimeSystem
    {
    public:
        TimeSystem() = delete;

        /// @brief Convert civil date/time (UTC) to Julian Date.
        /// @param dt Civil date/time. Month in [1,12], day in [1,31].
        /// @return Julian Date as a double-precision floating-point number.
        [[nodiscard]] static f64 to_julian_date(const DateTime& dt);

        /// @brief Convert Julian Date back to civil date/time (UTC).
        /// @param jd Julian Date (must be positive).
        /// @return Corresponding civil date/time.
        [[nodiscard]] static DateTime from_julian_date(f64 jd);

        /// @brief Civil date/time (UTC) to Instant.
        [[nodiscard]] static Instant to_instant(const DateTime& dt);

        /// @brief Compute Julian centuries elapsed since J2000.0.
        /// @param jd Julian Date.
        /// @return T = (JD - 2451545.0) / 36525.0
        [[nodiscard]] static f64 julian_centuries(f64 jd);

        /// @brief Greenwich Mean Sidereal Time (radians).
        /// @param jd Julian Date (UTC).
        /// @return GMST in radians, normalized to [0, 2π).
        /// Uses the IAU 1982 formula (accurate to ~0.1 second of time).
        [[nodiscard]] static f64 gmst(f64 jd);

        /// @brief Local Mean Sidereal Time (radians).
        /// @param jd Julian Date (UTC).
        /// @param longitude_rad Observer longitude in radians (east positive).
        /// @return LMST in radians, normalized to [0, 2π).
        [[nodiscard]] static f64 lmst(f64 jd, f64 longitude_rad);

        /// @brief Get current system time as an Instant.
        [[nodiscard]] static Instant now();

        /// @brief Format as "YYYY-MM-DDTHH:MM:SS.sssZ" (millisecond resolution).
        [[nodiscard]] static std::string to_iso_string(Instant t);

        /// @brief Parse "YYYY-MM-DD", "YYYY-MM-DDTHH:MM", "YYYY-MM-DDTHH:MM:SS[.fff]",
        /// optionally followed by 'Z'. A space may replace the 'T'.
        /// @return The instant, or std::nullopt if the text is malformed.
        [[nodiscard]] static std::optional<Instant> parse_iso(std::string_view text);

    private:
        /// @brief Normalize an angle to the range [0, 2π).
        [[nodiscard]] static f64 normalize_radians(f64 angle);
    };

} // namespace almanac::astro
