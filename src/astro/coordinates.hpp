#pragma once

/// @file coordinates.hpp
/// @brief Astronomical coordinate transforms: Equatorial, Horizontal, precession.

#include "core/types.hpp"

#include <optional>
#include <string_view>

namespace almanac::astro
{
    /// @brief Equatorial coordinate.
    struct EquatorialCoord
    {
        f64 ra;     ///< Right ascension (radians, 0..2π)
        f64 dec;    ///< Declination (radians, -π/2..+π/2)
    };

    /// @brief Horizontal (topocentric) coordinate.
    struct HorizontalCoord
    {
        f64 alt;    ///< Altitude (radians, -π/2..+π/2, negative = below horizon)
        f64 az;     ///< Azimuth (radians, 0..2π, 0=North, π/2=East)
    };

    /// @brief Observer geographic location.
    struct ObserverLocation
    {
        f64 latitude_rad;   ///< Geographic latitude (radians, north positive)
        f64 longitude_rad;  ///< Geographic longitude (radians, east positive)
    };

    /// @brief Static utility class for astronomical coordinate transformations.
    ///
    /// All angular inputs and outputs are in radians.
    /// Double precision (f64) is used throughout for arcsecond-level accuracy.
    class Coordinates
    {
    public:
        Coordinates() = delete;

        /// @brief Equatorial (RA/Dec of date) → Horizontal (Alt/Az).
        /// @param eq Equatorial coordinates of the object.
        /// @param observer Observer geographic location.
        /// @param local_sidereal_time_rad Local Mean Sidereal Time (radians).
        /// @return Horizontal coordinates (altitude and azimuth).
        [[nodiscard]] static HorizontalCoord equatorial_to_horizontal(
            const EquatorialCoord& eq,
            const ObserverLocation& observer,
            f64 local_sidereal_time_rad
        );

        /// @brief Horizontal (Alt/Az) → Equatorial (RA/Dec).
        /// @param hz Horizontal coordinates of the object.
        /// @param observer Observer geographic location.
        /// @param local_sidereal_time_rad Local Mean Sidereal Time (radians).
        /// @return Equatorial coordinates (right ascension and declination).
        [[nodiscard]] static EquatorialCoord horizontal_to_equatorial(
            const HorizontalCoord& hz,
            const ObserverLocation& observer,
            f64 local_sidereal_time_rad
        );

        /// @brief Precess J2000.0 mean coordinates to the mean equinox of date.
        ///
        /// Rigorous method of Meeus (Astronomical Algorithms, Ch. 21) with the
        /// IAU 1976 angles ζ, z, θ, applied as the rotation R3(−z)·R2(θ)·R3(−ζ).
        /// @param eq J2000.0 coordinates.
        /// @param jd Julian Date of the target equinox.
        [[nodiscard]] static EquatorialCoord precess_from_j2000(const EquatorialCoord& eq, f64 jd);

        /// @brief Parse a sexagesimal hour angle ("6h45m08.9s", "6:45:08.9",
        /// "6 45 8.9" or decimal "6.7525") into radians.
        [[nodiscard]] static std::optional<f64> parse_hours(std::string_view text);

        /// @brief Parse sexagesimal degrees ("-16d42m58s", "-16:42:58",
        /// "-16°42'58\"" or decimal "-16.716") into radians.
        [[nodiscard]] static std::optional<f64> parse_degrees(std::string_view text);

        /// @brief Normalize an angle to the range [0, 2π).
        [[nodiscard]] static f64 normalize_radians(f64 angle);

    private:
        /// @brief Shared sexagesimal reader: value in the input's own unit.
        [[nodiscard]] static std::optional<f64> parse_sexagesimal(std::string_view text);
    };

} // namespace almanac::astro
