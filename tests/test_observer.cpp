// tests/test_observer.cpp - Unit tests for Observer and horizon presets

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "astro/coordinates.hpp"
#include "astro/solar_ephemeris.hpp"
#include "astro/time_system.hpp"
#include "observatory/atmosphere.hpp"
#include "observatory/observer.hpp"

#include <cmath>

using namespace almanac;
using namespace almanac::observatory;

// ===================================================================
// Horizon presets
// ===================================================================

TEST_CASE("Horizon presets are ordered from the geometric horizon down") {
    CHECK(horizon::kGeometric == 0.0);
    CHECK(horizon::kStandardRefraction == doctest::Approx(-0.5667).epsilon(1e-3));
    CHECK(horizon::kSunUpperLimb == doctest::Approx(-0.8333).epsilon(1e-3));

    CHECK(horizon::kGeometric > horizon::kStandardRefraction);
    CHECK(horizon::kStandardRefraction > horizon::kSunUpperLimb);
    CHECK(horizon::kSunUpperLimb > horizon::kCivilTwilight);
    CHECK(horizon::kCivilTwilight > horizon::kNauticalTwilight);
    CHECK(horizon::kNauticalTwilight > horizon::kAstronomicalTwilight);
}

// ===================================================================
// Refraction at the horizon
// ===================================================================

TEST_CASE("Standard horizon refraction is about 34 arcminutes") {
    const AtmosphericConditions standard;
    const double r = horizon_refraction_deg(standard);
    CHECK(r == doctest::Approx(0.5747).epsilon(1e-3));
    CHECK(std::abs(r + horizon::kStandardRefraction) < 0.02);
}

TEST_CASE("Refraction scales with pressure and temperature") {
    const AtmosphericConditions standard;
    const AtmosphericConditions summit{.temperature_c = 0.0, .pressure_hPa = 615.0};
    const AtmosphericConditions cold{.temperature_c = -20.0, .pressure_hPa = 1010.0};
    const AtmosphericConditions vacuum{.temperature_c = 10.0, .pressure_hPa = 0.0};

    CHECK(horizon_refraction_deg(summit) < horizon_refraction_deg(standard));
    CHECK(horizon_refraction_deg(cold) > horizon_refraction_deg(standard));
    CHECK(horizon_refraction_deg(vacuum) == 0.0);
}

TEST_CASE("Sun horizon offset adds the semi-diameter") {
    const AtmosphericConditions standard;
    const double offset = horizon_offset_deg(standard, astro::SolarEphemeris::kSemiDiameterDeg);
    CHECK(offset < 0.0);
    CHECK(offset == doctest::Approx(-(0.5747 + 16.0 / 60.0)).epsilon(1e-3));
    CHECK(std::abs(offset - horizon::kSunUpperLimb) < 0.02);
    CHECK(horizon::kSunUpperLimb == doctest::Approx(-50.0 / 60.0));
}

// ===================================================================
// Observer
// ===================================================================

TEST_CASE("Observer exposes its construction values") {
    const Observer obs("Test Site", GeographicLocation{-33.9, 18.4, 20.0}, -0.5);

    CHECK(obs.name() == "Test Site");
    CHECK(obs.location().lat_deg == -33.9);
    CHECK(obs.location().lon_deg == 18.4);
    CHECK(obs.location().elevation_m == 20.0);
    CHECK(obs.horizon_offset_deg() == -0.5);

    const auto rad = obs.location_rad();
    CHECK(rad.latitude_rad == doctest::Approx(-33.9 * astro_constants::kDegToRad));
    CHECK(rad.longitude_rad == doctest::Approx(18.4 * astro_constants::kDegToRad));
}

TEST_CASE("Default horizon is geometric") {
    const Observer obs("Plain", GeographicLocation{10.0, 20.0, 0.0});
    CHECK(obs.horizon_offset_deg() == horizon::kGeometric);
}

TEST_CASE("with_horizon_offset returns a new observer and leaves the original alone") {
    const Observer base = make_backyard_site();
    const Observer refracted = base.with_horizon_offset(horizon::kStandardRefraction);

    CHECK(base.horizon_offset_deg() == horizon::kGeometric);
    CHECK(refracted.horizon_offset_deg() == horizon::kStandardRefraction);
    CHECK(refracted.name() == base.name());
    CHECK(refracted.location().lat_deg == base.location().lat_deg);
    CHECK(refracted.location().lon_deg == base.location().lon_deg);
}

TEST_CASE("Site factories") {
    const Observer mk = make_mauna_kea_site();
    CHECK(mk.location().lat_deg == doctest::Approx(19.8207));
    CHECK(mk.location().lon_deg == doctest::Approx(-155.4681));
    CHECK(mk.location().elevation_m == doctest::Approx(4205.0));
    CHECK(mk.horizon_offset_deg() == horizon::kStandardRefraction);

    const Observer by = make_backyard_site();
    CHECK(by.location().lat_deg == doctest::Approx(51.5));
    CHECK(by.horizon_offset_deg() == horizon::kGeometric);
}

TEST_CASE("Observer LMST and horizontal transform agree with astro::Coordinates") {
    const Observer obs = make_mauna_kea_site();
    const astro::Instant t = astro::Instant::from_jd(2460630.25);

    const double expected_lmst = astro::TimeSystem::lmst(t.jd, obs.location_rad().longitude_rad);
    CHECK(obs.lmst(t) == doctest::Approx(expected_lmst));

    const astro::EquatorialCoord eq{.ra = 1.0, .dec = 0.3};
    const auto direct = astro::Coordinates::equatorial_to_horizontal(eq, obs.location_rad(), expected_lmst);
    const auto via_observer = obs.to_horizontal(eq, t);
    CHECK(via_observer.alt == doctest::Approx(direct.alt));
    CHECK(via_observer.az == doctest::Approx(direct.az));
}
