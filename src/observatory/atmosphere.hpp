#pragma once
// observatory/atmosphere.hpp - Horizon depression constants
//
// The event finder treats the atmosphere as a single fixed offset of the
// operative horizon. This header provides the usual presets and a
// pressure/temperature-scaled refraction at the apparent horizon.

#include "astro/solar_ephemeris.hpp"
#include "core/types.hpp"

#include <algorithm>
#include <cmath>

namespace almanac::observatory {

// -----------------------------------------------------------------------
// Horizon offset presets [degrees]; negative = below the geometric horizon
// -----------------------------------------------------------------------
namespace horizon {
    constexpr double kGeometric          =   0.0;
    constexpr double kStandardRefraction = -34.0 / 60.0;  ///< Point source, mean refraction
    constexpr double kSunUpperLimb       = kStandardRefraction
                                         - astro::SolarEphemeris::kSemiDiameterDeg;  ///< -50 arcmin
    constexpr double kCivilTwilight      =  -6.0;
    constexpr double kNauticalTwilight   = -12.0;
    constexpr double kAstronomicalTwilight = -18.0;
} // namespace horizon

// -----------------------------------------------------------------------
// AtmosphericConditions - surface state used to scale horizon refraction
// -----------------------------------------------------------------------
struct AtmosphericConditions {
    double temperature_c{10.0};   ///< Air temperature [°C]
    double pressure_hPa{1010.0};  ///< Atmospheric pressure [hPa]
};

/// Refraction at apparent altitude 0° [degrees].
/// Bennett (1982): R = cot(h + 7.31 / (h + 4.4)) arcmin, scaled by
/// (P / 1010) × (283 / (273 + T)). About 0.575° at standard conditions.
inline double horizon_refraction_deg(const AtmosphericConditions& cond) {
    constexpr double kApparentAlt = 0.0;
    const double r_arcmin = 1.0 / std::tan((kApparentAlt + 7.31 / (kApparentAlt + 4.4))
                                           * astro_constants::kDegToRad);
    const double f = (cond.pressure_hPa / 1010.0)
                   * (283.0 / (273.0 + cond.temperature_c));
    return std::max(r_arcmin * f / 60.0, 0.0);
}

/// Horizon offset for a body of the given angular semi-diameter: the
/// altitude of its centre at the instant its upper limb touches the
/// refracted horizon.
inline double horizon_offset_deg(const AtmosphericConditions& cond,
                                 double semi_diameter_deg = 0.0) {
    return -(horizon_refraction_deg(cond) + semi_diameter_deg);
}

} // namespace almanac::observatory
