/// @file solar_ephemeris.cpp
/// @brief Meeus low-precision solar coordinates.

#include "astro/solar_ephemeris.hpp"

#include "core/error.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace almanac::astro
{

namespace
{

struct SolarAngles
{
    f64 apparent_longitude;  ///< λ (radians)
    f64 omega;               ///< Longitude of the Moon's ascending node (radians)
    f64 t;                   ///< Julian centuries since J2000.0
};

// -----------------------------------------------------------------
// L0 = 280.46646 + 36000.76983 T + 0.0003032 T²
// M  = 357.52911 + 35999.05029 T − 0.0001537 T²
// C  = (1.914602 − 0.004817 T − 0.000014 T²) sin M
//    + (0.019993 − 0.000101 T) sin 2M + 0.000289 sin 3M
// λ  = L0 + C − 0.00569 − 0.00478 sin Ω
// -----------------------------------------------------------------

SolarAngles solar_angles(f64 jd)
{
    using namespace astro_constants;

    const f64 t = TimeSystem::julian_centuries(jd);

    const f64 l0 = 280.46646 + 36000.76983 * t + 0.0003032 * t * t;
    const f64 m  = (357.52911 + 35999.05029 * t - 0.0001537 * t * t) * kDegToRad;

    const f64 c = (1.914602 - 0.004817 * t - 0.000014 * t * t) * std::sin(m)
                + (0.019993 - 0.000101 * t) * std::sin(2.0 * m)
                + 0.000289 * std::sin(3.0 * m);

    const f64 omega = (125.04 - 1934.136 * t) * kDegToRad;
    const f64 lambda = (l0 + c - 0.00569 - 0.00478 * std::sin(omega)) * kDegToRad;

    return SolarAngles{
        .apparent_longitude = Coordinates::normalize_radians(lambda),
        .omega              = omega,
        .t                  = t,
    };
}

} // namespace

f64 SolarEphemeris::apparent_longitude(Instant t)
{
    return solar_angles(t.jd).apparent_longitude;
}

EquatorialCoord SolarEphemeris::position_at(Instant t)
{
    if (t < kValidFrom || t > kValidUntil)
    {
        throw core::EvaluationError("solar ephemeris is undefined at " + TimeSystem::to_iso_string(t)
                                    + " (supported range 1800-2200)");
    }

    using namespace astro_constants;

    const SolarAngles angles = solar_angles(t.jd);

    // Obliquity: ε0 = 23°26′21.448″ − 46.8150″ T, corrected by 0.00256° cos Ω
    const f64 eps0 = 23.0 + 26.0 / 60.0 + (21.448 - 46.8150 * angles.t) / 3600.0;
    const f64 eps = (eps0 + 0.00256 * std::cos(angles.omega)) * kDegToRad;

    const f64 sin_lambda = std::sin(angles.apparent_longitude);
    const f64 ra = std::atan2(std::cos(eps) * sin_lambda, std::cos(angles.apparent_longitude));
    const f64 dec = std::asin(std::clamp(std::sin(eps) * sin_lambda, -1.0, 1.0));

    return EquatorialCoord{
        .ra  = Coordinates::normalize_radians(ra),
        .dec = dec,
    };
}

} // namespace almanac::astro
