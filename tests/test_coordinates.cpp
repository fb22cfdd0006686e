/// @file test_coordinates.cpp
/// @brief Unit tests for almanac::astro::Coordinates.
///
/// Verifies equatorial-to-horizontal transforms, inverse round-trips,
/// J2000 precession and sexagesimal parsing against reference values.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "astro/coordinates.hpp"
#include "astro/time_system.hpp"
#include "core/types.hpp"

#include <cmath>

using namespace almanac;
using namespace almanac::astro;

// =================================================================
// Tolerance constants (absolute, radians)
// =================================================================

/// 1 arcminute
static constexpr f64 kArcMinRad = astro_constants::kDegToRad / 60.0;

/// 1 arcsecond
static constexpr f64 kArcSecRad = astro_constants::kArcSecToRad;

/// Half a degree, for azimuth checks near singular geometry
static constexpr f64 kDegTol = 0.5 * astro_constants::kDegToRad;

static f64 angular_gap(f64 a, f64 b)
{
    f64 diff = std::abs(a - b);
    if (diff > astro_constants::kPi)
    {
        diff = astro_constants::kTwoPi - diff;
    }
    return diff;
}

// =================================================================
// Equatorial → Horizontal tests
// =================================================================

TEST_CASE("Polaris near zenith from North Pole")
{
    const EquatorialCoord polaris = {
        .ra  = 37.954 * astro_constants::kDegToRad,
        .dec = 89.264 * astro_constants::kDegToRad,
    };

    const ObserverLocation north_pole = {
        .latitude_rad  = 90.0 * astro_constants::kDegToRad,
        .longitude_rad = 0.0,
    };

    // At the pole altitude equals declination for any LST
    for (f64 lst_h = 0.0; lst_h < 24.0; lst_h += 6.0)
    {
        const auto hz = Coordinates::equatorial_to_horizontal(
            polaris, north_pole, lst_h * astro_constants::kHourToRad);
        CHECK(std::abs(hz.alt - polaris.dec) < kArcMinRad);
    }
}

TEST_CASE("Star transiting at zenith: RA=LST, Dec=Lat → alt≈90°")
{
    const f64 lat = 45.0 * astro_constants::kDegToRad;
    const f64 lst = 6.0 * astro_constants::kHourToRad;

    const EquatorialCoord eq = {.ra = lst, .dec = lat};
    const ObserverLocation observer = {.latitude_rad = lat, .longitude_rad = 0.0};

    const auto hz = Coordinates::equatorial_to_horizontal(eq, observer, lst);
    CHECK(std::abs(hz.alt - astro_constants::kHalfPi) < kArcSecRad);
}

TEST_CASE("Star on celestial equator due south at transit")
{
    const f64 lat = 45.0 * astro_constants::kDegToRad;
    const f64 lst = 3.0 * astro_constants::kHourToRad;

    const EquatorialCoord eq = {.ra = lst, .dec = 0.0};
    const ObserverLocation observer = {.latitude_rad = lat, .longitude_rad = 0.0};

    const auto hz = Coordinates::equatorial_to_horizontal(eq, observer, lst);

    CHECK(std::abs(hz.alt - 45.0 * astro_constants::kDegToRad) < kArcSecRad);
    CHECK(std::abs(hz.az - astro_constants::kPi) < kDegTol);
}

TEST_CASE("Equatorial star rises due east six hours before transit")
{
    const f64 lat = 30.0 * astro_constants::kDegToRad;
    const f64 ra  = 10.0 * astro_constants::kHourToRad;

    const EquatorialCoord eq = {.ra = ra, .dec = 0.0};
    const ObserverLocation observer = {.latitude_rad = lat, .longitude_rad = 0.0};

    // Hour angle −6h
    const auto hz = Coordinates::equatorial_to_horizontal(eq, observer, ra - 6.0 * astro_constants::kHourToRad);

    CHECK(std::abs(hz.alt) < kArcSecRad);
    CHECK(std::abs(hz.az - astro_constants::kHalfPi) < kArcMinRad);
}

TEST_CASE("Star below horizon has negative altitude")
{
    const f64 lat = 45.0 * astro_constants::kDegToRad;

    const EquatorialCoord eq = {.ra = 0.0, .dec = -60.0 * astro_constants::kDegToRad};
    const ObserverLocation observer = {.latitude_rad = lat, .longitude_rad = 0.0};

    // Even at upper culmination: alt = 90° − (45° + 60°) = −15°
    const auto hz = Coordinates::equatorial_to_horizontal(eq, observer, 0.0);
    CHECK(hz.alt < 0.0);
    CHECK(std::abs(hz.alt + 15.0 * astro_constants::kDegToRad) < kArcSecRad);
}

TEST_CASE("Altitude is always in [-π/2, π/2]")
{
    const ObserverLocation observer = {
        .latitude_rad  = 30.0 * astro_constants::kDegToRad,
        .longitude_rad = 0.0,
    };

    const f64 lst = 12.0 * astro_constants::kHourToRad;

    for (f64 ra_deg = 0.0; ra_deg < 360.0; ra_deg += 45.0)
    {
        for (f64 dec_deg = -80.0; dec_deg <= 80.0; dec_deg += 40.0)
        {
            const EquatorialCoord eq = {
                .ra  = ra_deg * astro_constants::kDegToRad,
                .dec = dec_deg * astro_constants::kDegToRad,
            };

            const auto hz = Coordinates::equatorial_to_horizontal(eq, observer, lst);

            CHECK(hz.alt >= -astro_constants::kHalfPi - 1e-10);
            CHECK(hz.alt <=  astro_constants::kHalfPi + 1e-10);
            CHECK(hz.az  >= 0.0);
            CHECK(hz.az  <  astro_constants::kTwoPi + 1e-10);
        }
    }
}

// =================================================================
// Inverse transform
// =================================================================

TEST_CASE("Horizontal → equatorial recovers Vega from London")
{
    const ObserverLocation observer = {
        .latitude_rad  = 51.48 * astro_constants::kDegToRad,
        .longitude_rad = -0.0077 * astro_constants::kDegToRad,
    };

    const f64 lst = 18.0 * astro_constants::kHourToRad;

    const EquatorialCoord vega = {
        .ra  = 279.235 * astro_constants::kDegToRad,
        .dec = 38.784 * astro_constants::kDegToRad,
    };

    const auto hz = Coordinates::equatorial_to_horizontal(vega, observer, lst);
    const auto back = Coordinates::horizontal_to_equatorial(hz, observer, lst);

    CHECK(angular_gap(back.ra, vega.ra) < 10.0 * kArcSecRad);
    CHECK(std::abs(back.dec - vega.dec) < 10.0 * kArcSecRad);
}

// =================================================================
// Precession
// =================================================================

TEST_CASE("Precession to J2000.0 itself is the identity")
{
    const EquatorialCoord eq = {
        .ra  = 101.287 * astro_constants::kDegToRad,
        .dec = -16.716 * astro_constants::kDegToRad,
    };

    const auto out = Coordinates::precess_from_j2000(eq, astro_constants::kJ2000);
    CHECK(angular_gap(out.ra, eq.ra) < 1e-12);
    CHECK(std::abs(out.dec - eq.dec) < 1e-12);
}

TEST_CASE("Meeus example 21.b: θ Persei to 2028 Nov 13.19")
{
    // Mean J2000 place with 28.86705 years of proper motion applied
    // (μα = +0.03425 s/yr, μδ = −0.0895″/yr).
    const f64 years = 28.86705;
    const f64 ra0_deg  = 41.054063 + 0.03425 * 15.0 * years / 3600.0;
    const f64 dec0_deg = 49.227750 - 0.0895 * years / 3600.0;

    const EquatorialCoord j2000 = {
        .ra  = ra0_deg * astro_constants::kDegToRad,
        .dec = dec0_deg * astro_constants::kDegToRad,
    };

    const auto of_date = Coordinates::precess_from_j2000(j2000, 2462088.69);

    CHECK(std::abs(of_date.ra * astro_constants::kRadToDeg - 41.547214) < 2e-4);
    CHECK(std::abs(of_date.dec * astro_constants::kRadToDeg - 49.348483) < 2e-4);
}

TEST_CASE("Precession shifts Sirius a few tenths of a degree over 25 years")
{
    const EquatorialCoord sirius = {
        .ra  = 101.287 * astro_constants::kDegToRad,
        .dec = -16.716 * astro_constants::kDegToRad,
    };

    const auto moved = Coordinates::precess_from_j2000(sirius, astro_constants::kJ2000 + 25.0 * 365.25);
    const f64 shift = angular_gap(moved.ra, sirius.ra) * astro_constants::kRadToDeg;

    // 25 years of general precession: a few tenths of a degree, never more
    CHECK(shift > 0.1);
    CHECK(shift < 0.5);
}

// =================================================================
// Sexagesimal parsing
// =================================================================

TEST_CASE("parse_hours accepts h/m/s, colon, space and decimal forms")
{
    const f64 expected = (6.0 + 45.0 / 60.0 + 8.9 / 3600.0) * astro_constants::kHourToRad;

    for (const char* text : {"6h45m08.9s", "6:45:08.9", "6 45 8.9", " 06h 45m 08.9s"})
    {
        CAPTURE(text);
        const auto ra = Coordinates::parse_hours(text);
        REQUIRE(ra.has_value());
        CHECK(std::abs(*ra - expected) < 1e-12);
    }

    const auto decimal = Coordinates::parse_hours("6.5");
    REQUIRE(decimal.has_value());
    CHECK(std::abs(*decimal - 6.5 * astro_constants::kHourToRad) < 1e-12);
}

TEST_CASE("parse_degrees handles sign and degree symbols")
{
    const f64 expected = -(16.0 + 42.0 / 60.0 + 58.0 / 3600.0) * astro_constants::kDegToRad;

    for (const char* text : {"-16d42m58s", "-16:42:58", "-16°42'58\"", "-16 42 58"})
    {
        CAPTURE(text);
        const auto dec = Coordinates::parse_degrees(text);
        REQUIRE(dec.has_value());
        CHECK(std::abs(*dec - expected) < 1e-12);
    }

    // Sign applies to the whole value even with a zero degree field
    const auto small = Coordinates::parse_degrees("-0:30");
    REQUIRE(small.has_value());
    CHECK(std::abs(*small + 0.5 * astro_constants::kDegToRad) < 1e-12);

    const auto plus = Coordinates::parse_degrees("+89.264");
    REQUIRE(plus.has_value());
    CHECK(std::abs(*plus - 89.264 * astro_constants::kDegToRad) < 1e-12);
}

TEST_CASE("Sexagesimal parser rejects malformed input")
{
    CHECK_FALSE(Coordinates::parse_hours("").has_value());
    CHECK_FALSE(Coordinates::parse_hours("   ").has_value());
    CHECK_FALSE(Coordinates::parse_hours("6h75m").has_value());
    CHECK_FALSE(Coordinates::parse_degrees("10:20:60").has_value());
    CHECK_FALSE(Coordinates::parse_degrees("1:2:3:4").has_value());
    CHECK_FALSE(Coordinates::parse_degrees("12x30").has_value());
    CHECK_FALSE(Coordinates::parse_degrees("10 -20").has_value());
    CHECK_FALSE(Coordinates::parse_degrees("nan").has_value());
    CHECK_FALSE(Coordinates::parse_degrees("inf").has_value());
    CHECK_FALSE(Coordinates::parse_hours("-inf").has_value());
    CHECK_FALSE(Coordinates::parse_hours("inf:30").has_value());
}

TEST_CASE("normalize_radians wraps into [0, 2π)")
{
    CHECK(Coordinates::normalize_radians(-astro_constants::kHalfPi)
          == doctest::Approx(1.5 * astro_constants::kPi));
    CHECK(Coordinates::normalize_radians(5.0 * astro_constants::kPi)
          == doctest::Approx(astro_constants::kPi));
    CHECK(Coordinates::normalize_radians(0.0) == 0.0);
}
