/// @file almanac.cpp
/// @brief Named queries on top of the event locator.

#include "events/almanac.hpp"

#include "events/altitude_sampler.hpp"
#include "observatory/atmosphere.hpp"

namespace almanac::events
{

f64 twilight_altitude_deg(Twilight twilight)
{
    switch (twilight)
    {
    case Twilight::kCivil:        return observatory::horizon::kCivilTwilight;
    case Twilight::kNautical:     return observatory::horizon::kNauticalTwilight;
    case Twilight::kAstronomical: return observatory::horizon::kAstronomicalTwilight;
    }
    return observatory::horizon::kAstronomicalTwilight;
}

Almanac::Almanac(SearchConfig config)
    : m_locator(config)
    , m_sun(target::make_sun())
{
}

// -----------------------------------------------------------------
// Target events
// -----------------------------------------------------------------

EventResult Almanac::rise(const observatory::Observer& observer, const target::Target& target,
                          astro::Instant t, SearchDirection direction) const
{
    return m_locator.find_event(observer, target, t, EventKind::kRise, direction);
}

EventResult Almanac::set(const observatory::Observer& observer, const target::Target& target,
                         astro::Instant t, SearchDirection direction) const
{
    return m_locator.find_event(observer, target, t, EventKind::kSet, direction);
}

EventResult Almanac::transit(const observatory::Observer& observer, const target::Target& target,
                             astro::Instant t, SearchDirection direction) const
{
    return m_locator.find_event(observer, target, t, EventKind::kTransit, direction);
}

EventResult Almanac::antitransit(const observatory::Observer& observer, const target::Target& target,
                                 astro::Instant t, SearchDirection direction) const
{
    return m_locator.find_event(observer, target, t, EventKind::kAntitransit, direction);
}

// -----------------------------------------------------------------
// Sun and twilight: fixed solar horizons, independent of the
// observer's own offset.
// -----------------------------------------------------------------

EventResult Almanac::sunrise(const observatory::Observer& observer, astro::Instant t,
                             SearchDirection direction) const
{
    return m_locator.find_event(observer, m_sun, t, EventKind::kRise, direction,
                                observatory::horizon::kSunUpperLimb);
}

EventResult Almanac::sunset(const observatory::Observer& observer, astro::Instant t,
                            SearchDirection direction) const
{
    return m_locator.find_event(observer, m_sun, t, EventKind::kSet, direction,
                                observatory::horizon::kSunUpperLimb);
}

EventResult Almanac::twilight_morning(const observatory::Observer& observer, astro::Instant t,
                                      Twilight twilight, SearchDirection direction) const
{
    return m_locator.find_event(observer, m_sun, t, EventKind::kRise, direction,
                                twilight_altitude_deg(twilight));
}

EventResult Almanac::twilight_evening(const observatory::Observer& observer, astro::Instant t,
                                      Twilight twilight, SearchDirection direction) const
{
    return m_locator.find_event(observer, m_sun, t, EventKind::kSet, direction,
                                twilight_altitude_deg(twilight));
}

// -----------------------------------------------------------------
// Instantaneous predicates
// -----------------------------------------------------------------

bool Almanac::is_up(const observatory::Observer& observer, const target::Target& target, astro::Instant t)
{
    return altitude(observer, target, t) >= 0.0;
}

bool Almanac::is_night(const observatory::Observer& observer, astro::Instant t, Twilight twilight) const
{
    const AltitudeSampler sampler(observer, m_sun, twilight_altitude_deg(twilight));
    return sampler.altitude_deg(t) < 0.0;
}

} // namespace almanac::events
