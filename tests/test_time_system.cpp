/// @file test_time_system.cpp
/// @brief Unit tests for almanac::astro::TimeSystem, Instant and Duration.
///
/// Verifies Julian Date conversion (Meeus algorithm), GMST (IAU 1982),
/// LMST, instant arithmetic and ISO-8601 formatting/parsing.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "astro/time_system.hpp"
#include "core/types.hpp"

#include <cmath>

using namespace almanac;
using namespace almanac::astro;

// =================================================================
// Tolerances (absolute)
// =================================================================

static constexpr f64 kJdTolerance  = 1e-8;   // ~1 ms
static constexpr f64 kAngleTolDeg  = 0.01;   // Degrees

// =================================================================
// Julian Date conversion tests
// =================================================================

TEST_CASE("J2000.0 epoch gives JD 2451545.0")
{
    const DateTime j2000 = {
        .year   = 2000,
        .month  = 1,
        .day    = 1,
        .hour   = 12,
        .minute = 0,
        .second = 0.0,
    };

    CHECK(std::abs(TimeSystem::to_julian_date(j2000) - 2451545.0) < kJdTolerance);
}

TEST_CASE("Known date: 2024-06-15 22:30:00 UTC → JD 2460477.4375")
{
    const DateTime dt = {
        .year   = 2024,
        .month  = 6,
        .day    = 15,
        .hour   = 22,
        .minute = 30,
        .second = 0.0,
    };

    CHECK(std::abs(TimeSystem::to_julian_date(dt) - 2460477.4375) < kJdTolerance);
}

TEST_CASE("Meeus example 7.a: 1957-10-04.81 → JD 2436116.31")
{
    // 1957 Oct 4.81 = 19:26:24 UTC
    const DateTime dt = {
        .year   = 1957,
        .month  = 10,
        .day    = 4,
        .hour   = 19,
        .minute = 26,
        .second = 24.0,
    };

    CHECK(std::abs(TimeSystem::to_julian_date(dt) - 2436116.31) < kJdTolerance);
}

TEST_CASE("from_julian_date inverts to_julian_date")
{
    const DateTime dt = {
        .year   = 1999,
        .month  = 2,
        .day    = 28,
        .hour   = 23,
        .minute = 59,
        .second = 30.0,
    };

    const DateTime back = TimeSystem::from_julian_date(TimeSystem::to_julian_date(dt));
    CHECK(back.year == 1999);
    CHECK(back.month == 2);
    CHECK(back.day == 28);
    CHECK(back.hour == 23);
    CHECK(back.minute == 59);
    CHECK(back.second == doctest::Approx(30.0).epsilon(1e-3));
}

TEST_CASE("Julian centuries: one century after J2000")
{
    const f64 t = TimeSystem::julian_centuries(astro_constants::kJ2000 + 36525.0);
    CHECK(t == doctest::Approx(1.0));
}

// =================================================================
// Sidereal time
// =================================================================

TEST_CASE("GMST at J2000.0 ≈ 280.46°")
{
    const f64 gmst_deg = TimeSystem::gmst(astro_constants::kJ2000) * astro_constants::kRadToDeg;
    CHECK(std::abs(gmst_deg - 280.46061837) < kAngleTolDeg);
}

TEST_CASE("Meeus example 12.a: GMST 1987-04-10 0h UT = 13h10m46.3668s")
{
    const f64 gmst_hours = TimeSystem::gmst(2446895.5) * astro_constants::kRadToHour;
    const f64 expected = 13.0 + 10.0 / 60.0 + 46.3668 / 3600.0;
    CHECK(std::abs(gmst_hours - expected) < 1e-5);
}

TEST_CASE("LMST shifts east by longitude and stays in [0, 2π)")
{
    const f64 jd = 2460000.0;
    const f64 lon = -155.4681 * astro_constants::kDegToRad;

    const f64 lmst_val = TimeSystem::lmst(jd, lon);
    CHECK(lmst_val >= 0.0);
    CHECK(lmst_val < astro_constants::kTwoPi);

    f64 expected = std::fmod(TimeSystem::gmst(jd) + lon, astro_constants::kTwoPi);
    if (expected < 0.0)
    {
        expected += astro_constants::kTwoPi;
    }
    CHECK(lmst_val == doctest::Approx(expected).epsilon(1e-12));
}

TEST_CASE("now() returns a present-day instant")
{
    const Instant now = TimeSystem::now();
    CHECK(now.jd > 2458849.5);  // after 2020-01-01
    CHECK(now.jd < 2488070.0);  // before 2100
}

// =================================================================
// Instant / Duration arithmetic
// =================================================================

TEST_CASE("Instant arithmetic with durations")
{
    const Instant t = Instant::from_jd(2460000.0);

    const Instant later = t + Duration::from_hours(6.0);
    CHECK(later.jd == doctest::Approx(2460000.25));
    CHECK((later - t).days == doctest::Approx(0.25));
    CHECK((later - t).minutes() == doctest::Approx(360.0));
    CHECK((t - Duration::from_seconds(86400.0)).jd == doctest::Approx(2459999.0));

    CHECK(t < later);
    CHECK(later > t);
    CHECK(t == Instant::from_jd(2460000.0));
}

TEST_CASE("Duration conversions are consistent")
{
    const Duration d = Duration::from_minutes(90.0);
    CHECK(d.days == doctest::Approx(1.5 / 24.0));
    CHECK(d.seconds() == doctest::Approx(5400.0));
    CHECK((d * 2.0).minutes() == doctest::Approx(180.0));
    CHECK((d / 3.0).minutes() == doctest::Approx(30.0));
    CHECK((-d).days < 0.0);
    CHECK(Duration::from_hours(1.0) < Duration::from_minutes(61.0));
}

// =================================================================
// ISO-8601
// =================================================================

TEST_CASE("to_iso_string formats with millisecond resolution")
{
    CHECK(TimeSystem::to_iso_string(Instant::from_jd(astro_constants::kJ2000)) == "2000-01-01T12:00:00.000Z");
    CHECK(TimeSystem::to_iso_string(Instant::from_jd(2460477.4375)) == "2024-06-15T22:30:00.000Z");
}

TEST_CASE("to_iso_string rounds up across a day boundary")
{
    // 0.2 ms before midnight rounds to the next day
    const Instant t = Instant::from_jd(2460477.5) - Duration::from_seconds(0.0002);
    CHECK(TimeSystem::to_iso_string(t) == "2024-06-16T00:00:00.000Z");
}

TEST_CASE("parse_iso accepts the supported forms")
{
    const auto full = TimeSystem::parse_iso("2024-11-15T18:00:00Z");
    REQUIRE(full.has_value());
    CHECK(std::abs(full->jd - TimeSystem::to_julian_date({2024, 11, 15, 18, 0, 0.0})) < kJdTolerance);

    const auto fractional = TimeSystem::parse_iso("2024-11-15 18:00:30.5");
    REQUIRE(fractional.has_value());
    CHECK((*fractional - *full).seconds() == doctest::Approx(30.5).epsilon(1e-6));

    const auto minutes_only = TimeSystem::parse_iso("2024-11-15T18:00");
    REQUIRE(minutes_only.has_value());
    CHECK(std::abs(minutes_only->jd - full->jd) < kJdTolerance);

    const auto date_only = TimeSystem::parse_iso("2024-11-15");
    REQUIRE(date_only.has_value());
    CHECK((*full - *date_only).days == doctest::Approx(0.75));
}

TEST_CASE("parse_iso rejects malformed text")
{
    CHECK_FALSE(TimeSystem::parse_iso("").has_value());
    CHECK_FALSE(TimeSystem::parse_iso("2024-13-01").has_value());
    CHECK_FALSE(TimeSystem::parse_iso("2024-11-15T25:00").has_value());
    CHECK_FALSE(TimeSystem::parse_iso("2024-11-15T18").has_value());
    CHECK_FALSE(TimeSystem::parse_iso("2024/11/15").has_value());
    CHECK_FALSE(TimeSystem::parse_iso("2024-11-15T18:00:xx").has_value());
    CHECK_FALSE(TimeSystem::parse_iso("2024-01-01T00:00:nan").has_value());
    CHECK_FALSE(TimeSystem::parse_iso("2024-01-01T00:00:inf").has_value());
}

TEST_CASE("ISO formatting and parsing agree")
{
    const Instant t = Instant::from_jd(2460630.2500115741);  // 2024-11-15T18:00:01.000Z
    const auto parsed = TimeSystem::parse_iso(TimeSystem::to_iso_string(t));
    REQUIRE(parsed.has_value());
    CHECK(std::abs((*parsed - t).seconds()) < 0.001);
}
