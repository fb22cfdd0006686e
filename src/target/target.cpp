/// @file target.cpp
/// @brief Fixed, ephemeris-driven and altitude-curve targets.

#include "target/target.hpp"

#include "astro/solar_ephemeris.hpp"
#include "core/error.hpp"

#include <utility>

namespace almanac::target
{

// -----------------------------------------------------------------
// FixedTarget
// -----------------------------------------------------------------

FixedTarget::FixedTarget(std::string name, const astro::EquatorialCoord& j2000, bool precess)
    : m_name(std::move(name))
    , m_j2000(j2000)
    , m_precess(precess)
{
}

astro::HorizontalCoord FixedTarget::horizontal_at(
    const observatory::Observer& observer, astro::Instant t) const
{
    const astro::EquatorialCoord of_date =
        m_precess ? astro::Coordinates::precess_from_j2000(m_j2000, t.jd) : m_j2000;
    return observer.to_horizontal(of_date, t);
}

// -----------------------------------------------------------------
// EphemerisTarget
// -----------------------------------------------------------------

EphemerisTarget::EphemerisTarget(std::string name, PositionProvider provider,
                                 std::optional<ValidityRange> validity)
    : m_name(std::move(name))
    , m_provider(std::move(provider))
    , m_validity(validity)
{
}

astro::EquatorialCoord EphemerisTarget::position_at(astro::Instant t) const
{
    if (m_validity && (t < m_validity->from || t > m_validity->until))
    {
        throw core::EvaluationError("ephemeris for '" + m_name + "' is not valid at "
                                    + astro::TimeSystem::to_iso_string(t));
    }
    return m_provider(t);
}

astro::HorizontalCoord EphemerisTarget::horizontal_at(
    const observatory::Observer& observer, astro::Instant t) const
{
    return observer.to_horizontal(position_at(t), t);
}

// -----------------------------------------------------------------
// AltitudeCurveTarget
// -----------------------------------------------------------------

AltitudeCurveTarget::AltitudeCurveTarget(std::string name, AltitudeFunction altitude_deg)
    : m_name(std::move(name))
    , m_altitude_deg(std::move(altitude_deg))
{
}

astro::HorizontalCoord AltitudeCurveTarget::horizontal_at(
    const observatory::Observer& /*observer*/, astro::Instant t) const
{
    return astro::HorizontalCoord{
        .alt = m_altitude_deg(t) * astro_constants::kDegToRad,
        .az  = 0.0,
    };
}

// -----------------------------------------------------------------
// Sun
// -----------------------------------------------------------------

EphemerisTarget make_sun()
{
    return EphemerisTarget(
        "Sun",
        [](astro::Instant t) { return astro::SolarEphemeris::position_at(t); },
        EphemerisTarget::ValidityRange{
            .from  = astro::SolarEphemeris::kValidFrom,
            .until = astro::SolarEphemeris::kValidUntil,
        });
}

} // namespace almanac::target
