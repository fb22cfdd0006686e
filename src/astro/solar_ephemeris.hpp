#pragma once

/// @file solar_ephemeris.hpp
/// @brief Low-precision apparent position of the Sun (Meeus, Ch. 25).

#include "astro/coordinates.hpp"
#include "astro/time_system.hpp"
#include "core/types.hpp"

namespace almanac::astro
{
    /// @brief Analytical Sun position, accurate to ~0.01°.
    ///
    /// Geocentric apparent RA/Dec of date, including aberration and the
    /// dominant nutation term. UT is used in place of TT; the ~70 s
    /// difference moves sunrise by well under a second.
    class SolarEphemeris
    {
    public:
        SolarEphemeris() = delete;

        /// First instant of the supported range (1800-01-01 00:00 UTC).
        static constexpr Instant kValidFrom{2378496.5};

        /// Last instant of the supported range (2200-01-01 00:00 UTC).
        static constexpr Instant kValidUntil{2524593.5};

        /// @brief Apparent equatorial position of the Sun.
        /// @throws core::EvaluationError if @p t lies outside [kValidFrom, kValidUntil].
        [[nodiscard]] static EquatorialCoord position_at(Instant t);

        /// @brief Apparent ecliptic longitude of the Sun (radians, [0, 2π)).
        [[nodiscard]] static f64 apparent_longitude(Instant t);

        /// Mean angular semi-diameter of the solar disc (degrees).
        static constexpr f64 kSemiDiameterDeg = 16.0 / 60.0;
    };

} // namespace almanac::astro
