#pragma once

/// @file almanac.hpp
/// @brief Convenience queries built on EventLocator: target events, Sun, twilight.

#include "astro/time_system.hpp"
#include "core/types.hpp"
#include "events/event_locator.hpp"
#include "events/event_types.hpp"
#include "observatory/observer.hpp"
#include "target/target.hpp"

namespace almanac::events
{
    enum class Twilight : u8
    {
        kCivil,         ///< Sun 6° below the horizon
        kNautical,      ///< Sun 12° below the horizon
        kAstronomical,  ///< Sun 18° below the horizon
    };

    /// @brief Solar altitude that bounds the given twilight [degrees, negative].
    [[nodiscard]] f64 twilight_altitude_deg(Twilight twilight);

    /// @brief Named rise/set/transit queries for targets and for the Sun.
    class Almanac
    {
    public:
        explicit Almanac(SearchConfig config = {});

        // ---- Target events (observer's horizon offset, or the configured override) ----
        [[nodiscard]] EventResult rise(const observatory::Observer& observer, const target::Target& target,
                                       astro::Instant t, SearchDirection direction = SearchDirection::kNearest) const;
        [[nodiscard]] EventResult set(const observatory::Observer& observer, const target::Target& target,
                                      astro::Instant t, SearchDirection direction = SearchDirection::kNearest) const;
        [[nodiscard]] EventResult transit(const observatory::Observer& observer, const target::Target& target,
                                          astro::Instant t, SearchDirection direction = SearchDirection::kNearest) const;
        [[nodiscard]] EventResult antitransit(const observatory::Observer& observer, const target::Target& target,
                                              astro::Instant t, SearchDirection direction = SearchDirection::kNearest) const;

        // ---- Sun: upper limb on the refracted horizon ----
        [[nodiscard]] EventResult sunrise(const observatory::Observer& observer, astro::Instant t,
                                          SearchDirection direction = SearchDirection::kNearest) const;
        [[nodiscard]] EventResult sunset(const observatory::Observer& observer, astro::Instant t,
                                         SearchDirection direction = SearchDirection::kNearest) const;

        /// Start of morning twilight: Sun rising through the twilight altitude.
        [[nodiscard]] EventResult twilight_morning(const observatory::Observer& observer, astro::Instant t,
                                                   Twilight twilight,
                                                   SearchDirection direction = SearchDirection::kNearest) const;

        /// End of evening twilight: Sun setting through the twilight altitude.
        [[nodiscard]] EventResult twilight_evening(const observatory::Observer& observer, astro::Instant t,
                                                   Twilight twilight,
                                                   SearchDirection direction = SearchDirection::kNearest) const;

        /// @brief Is the target at or above the observer's operative horizon at t?
        [[nodiscard]] static bool is_up(const observatory::Observer& observer, const target::Target& target,
                                        astro::Instant t);

        /// @brief Is the Sun below the given twilight altitude at t?
        [[nodiscard]] bool is_night(const observatory::Observer& observer, astro::Instant t,
                                    Twilight twilight = Twilight::kAstronomical) const;

        [[nodiscard]] const EventLocator& locator() const { return m_locator; }
        [[nodiscard]] const target::Target& sun() const { return m_sun; }

    private:
        EventLocator            m_locator;
        target::EphemerisTarget m_sun;
    };

} // namespace almanac::events
