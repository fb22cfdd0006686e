/// @file coordinates.cpp
/// @brief Implementation of astronomical coordinate transformations.

#include "astro/coordinates.hpp"

#include "core/types.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <cmath>

namespace almanac::astro
{

namespace
{

// Frame rotations about the x/y/z axes (passive convention), built row by row.
Mat3d rotation_y(f64 angle)
{
    const f64 c = std::cos(angle);
    const f64 s = std::sin(angle);
    return glm::transpose(Mat3d(
        Vec3d(c,   0.0, -s),
        Vec3d(0.0, 1.0, 0.0),
        Vec3d(s,   0.0, c)));
}

Mat3d rotation_z(f64 angle)
{
    const f64 c = std::cos(angle);
    const f64 s = std::sin(angle);
    return glm::transpose(Mat3d(
        Vec3d(c,   s,   0.0),
        Vec3d(-s,  c,   0.0),
        Vec3d(0.0, 0.0, 1.0)));
}

bool is_separator(unsigned char ch)
{
    switch (ch)
    {
    case ' ': case '\t': case ':':
    case 'h': case 'H': case 'd': case 'D':
    case 'm': case 'M': case 's': case 'S':
    case '\'': case '"':
    case 0xC2: case 0xB0:   // UTF-8 degree sign
        return true;
    default:
        return false;
    }
}

} // namespace

// -----------------------------------------------------------------
// Equatorial (RA/Dec) → Horizontal (Alt/Az)
//
// Hour angle: H = LST - RA
//
// sin(alt) = sin(dec) × sin(lat) + cos(dec) × cos(lat) × cos(H)
//
// Azimuth (north-based):
//   az = atan2(-cos(dec)×sin(H), sin(dec)×cos(lat) - cos(dec)×sin(lat)×cos(H))
// -----------------------------------------------------------------

HorizontalCoord Coordinates::equatorial_to_horizontal(
    const EquatorialCoord& eq,
    const ObserverLocation& observer,
    f64 local_sidereal_time_rad)
{
    const f64 hour_angle = local_sidereal_time_rad - eq.ra;

    const f64 sin_dec = std::sin(eq.dec);
    const f64 cos_dec = std::cos(eq.dec);
    const f64 sin_lat = std::sin(observer.latitude_rad);
    const f64 cos_lat = std::cos(observer.latitude_rad);
    const f64 cos_ha  = std::cos(hour_angle);
    const f64 sin_ha  = std::sin(hour_angle);

    const f64 sin_alt = sin_dec * sin_lat + cos_dec * cos_lat * cos_ha;
    const f64 alt = std::asin(std::clamp(sin_alt, -1.0, 1.0));

    const f64 az_y = -cos_dec * sin_ha;
    const f64 az_x = sin_dec * cos_lat - cos_dec * sin_lat * cos_ha;
    const f64 az = normalize_radians(std::atan2(az_y, az_x));

    return HorizontalCoord{
        .alt = alt,
        .az  = az,
    };
}

// -----------------------------------------------------------------
// Horizontal (Alt/Az) → Equatorial (RA/Dec)
//
//   sin(dec) = sin(alt) × sin(lat) + cos(alt) × cos(lat) × cos(az)
//   H = atan2(-cos(alt)×sin(az), sin(alt)×cos(lat) - cos(alt)×sin(lat)×cos(az))
//   RA = LST - H, normalized to [0, 2π)
// -----------------------------------------------------------------

EquatorialCoord Coordinates::horizontal_to_equatorial(
    const HorizontalCoord& hz,
    const ObserverLocation& observer,
    f64 local_sidereal_time_rad)
{
    const f64 sin_alt = std::sin(hz.alt);
    const f64 cos_alt = std::cos(hz.alt);
    const f64 sin_az  = std::sin(hz.az);
    const f64 cos_az  = std::cos(hz.az);
    const f64 sin_lat = std::sin(observer.latitude_rad);
    const f64 cos_lat = std::cos(observer.latitude_rad);

    const f64 sin_dec = sin_alt * sin_lat + cos_alt * cos_lat * cos_az;
    const f64 dec = std::asin(std::clamp(sin_dec, -1.0, 1.0));

    const f64 ha_y = -cos_alt * sin_az;
    const f64 ha_x = sin_alt * cos_lat - cos_alt * sin_lat * cos_az;
    const f64 hour_angle = std::atan2(ha_y, ha_x);

    const f64 ra = normalize_radians(local_sidereal_time_rad - hour_angle);

    return EquatorialCoord{
        .ra  = ra,
        .dec = dec,
    };
}

// -----------------------------------------------------------------
// Precession J2000.0 → date (Meeus eq. 21.2, starting epoch J2000 so T = 0)
//
// ζ = 2306.2181″ t + 0.30188″ t² + 0.017998″ t³
// z = 2306.2181″ t + 1.09468″ t² + 0.018203″ t³
// θ = 2004.3109″ t − 0.42665″ t² − 0.041833″ t³
// -----------------------------------------------------------------

EquatorialCoord Coordinates::precess_from_j2000(const EquatorialCoord& eq, f64 jd)
{
    const f64 t  = (jd - astro_constants::kJ2000) / 36525.0;
    const f64 t2 = t * t;
    const f64 t3 = t2 * t;

    const f64 zeta  = (2306.2181 * t + 0.30188 * t2 + 0.017998 * t3) * astro_constants::kArcSecToRad;
    const f64 z     = (2306.2181 * t + 1.09468 * t2 + 0.018203 * t3) * astro_constants::kArcSecToRad;
    const f64 theta = (2004.3109 * t - 0.42665 * t2 - 0.041833 * t3) * astro_constants::kArcSecToRad;

    const Mat3d precession = rotation_z(-z) * rotation_y(theta) * rotation_z(-zeta);

    const f64 cos_dec = std::cos(eq.dec);
    const Vec3d v0(cos_dec * std::cos(eq.ra), cos_dec * std::sin(eq.ra), std::sin(eq.dec));
    const Vec3d v = precession * v0;

    return EquatorialCoord{
        .ra  = normalize_radians(std::atan2(v.y, v.x)),
        .dec = std::asin(std::clamp(v.z, -1.0, 1.0)),
    };
}

// -----------------------------------------------------------------
// Sexagesimal parsing
// -----------------------------------------------------------------

std::optional<f64> Coordinates::parse_hours(std::string_view text)
{
    const auto hours = parse_sexagesimal(text);
    if (!hours)
    {
        return std::nullopt;
    }
    return *hours * astro_constants::kHourToRad;
}

std::optional<f64> Coordinates::parse_degrees(std::string_view text)
{
    const auto degrees = parse_sexagesimal(text);
    if (!degrees)
    {
        return std::nullopt;
    }
    return *degrees * astro_constants::kDegToRad;
}

std::optional<f64> Coordinates::parse_sexagesimal(std::string_view text)
{
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t'))
    {
        text.remove_prefix(1);
    }

    f64 sign = 1.0;
    if (!text.empty() && (text.front() == '-' || text.front() == '+'))
    {
        sign = (text.front() == '-') ? -1.0 : 1.0;
        text.remove_prefix(1);
    }

    std::array<f64, 3> fields{};
    std::size_t count = 0;
    std::size_t pos = 0;

    while (pos < text.size())
    {
        const auto ch = static_cast<unsigned char>(text[pos]);
        if (is_separator(ch))
        {
            ++pos;
            continue;
        }
        if (count == fields.size())
        {
            return std::nullopt;
        }

        f64 value = 0.0;
        const char* begin = text.data() + pos;
        const auto [ptr, ec] = std::from_chars(begin, text.data() + text.size(), value);
        if (ec != std::errc{} || ptr == begin || !std::isfinite(value) || value < 0.0)
        {
            return std::nullopt;
        }
        fields[count++] = value;
        pos += static_cast<std::size_t>(ptr - begin);
    }

    if (count == 0 || fields[1] >= 60.0 || fields[2] >= 60.0)
    {
        return std::nullopt;
    }

    return sign * (fields[0] + fields[1] / 60.0 + fields[2] / 3600.0);
}

// -----------------------------------------------------------------
// Normalize angle to [0, 2π)
// -----------------------------------------------------------------

f64 Coordinates::normalize_radians(f64 angle)
{
    angle = std::fmod(angle, astro_constants::kTwoPi);
    if (angle < 0.0)
    {
        angle += astro_constants::kTwoPi;
    }
    return angle;
}

} // namespace almanac::astro
