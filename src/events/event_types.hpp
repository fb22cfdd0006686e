#pragma once

/// @file event_types.hpp
/// @brief Query and result types shared by the event finder.

#include "astro/time_system.hpp"
#include "core/types.hpp"

#include <optional>
#include <string_view>

namespace almanac::events
{
    /// @brief Which horizon event to look for.
    enum class EventKind : u8
    {
        kRise,         ///< Altitude crosses the operative horizon upward
        kSet,          ///< Altitude crosses the operative horizon downward
        kTransit,      ///< Upper culmination (local altitude maximum)
        kAntitransit,  ///< Lower culmination (local altitude minimum)
    };

    /// @brief Where the event may lie relative to the reference time.
    enum class SearchDirection : u8
    {
        kNearest,   ///< Window centred on the reference, closest event wins
        kNext,      ///< Window starts at the reference, first event after it
        kPrevious,  ///< Window ends at the reference, last event before it
    };

    /// @brief Outcome of a query. Only kFound carries a usable time.
    enum class EventStatus : u8
    {
        kFound,
        kCircumpolar,   ///< Stayed at or above the horizon for the whole window
        kNeverRises,    ///< Stayed at or below the horizon for the whole window
        kNotInWindow,   ///< Altitude varies but no event of this kind/direction is in the window
    };

    struct EventResult
    {
        EventStatus    status{EventStatus::kNotInWindow};
        astro::Instant time{};

        [[nodiscard]] bool found() const { return status == EventStatus::kFound; }

        [[nodiscard]] static EventResult at(astro::Instant t)
        {
            return EventResult{.status = EventStatus::kFound, .time = t};
        }

        [[nodiscard]] static EventResult sentinel(EventStatus status)
        {
            return EventResult{.status = status, .time = {}};
        }
    };

    /// @brief Tunables of the coarse-sample → bracket → refine pipeline.
    struct SearchConfig
    {
        /// Total window length. kNearest spans ±window/2 around the reference.
        astro::Duration window{astro::Duration::from_days(1.0)};

        /// Upper bound on the coarse grid spacing. The window is split into
        /// ceil(window / sample_interval) equal steps.
        astro::Duration sample_interval{astro::Duration::from_minutes(2.0)};

        /// Threads used to evaluate the coarse grid (1 = caller's thread).
        u32 worker_threads{1};

        /// Overrides the observer's horizon offset when set [degrees].
        std::optional<f64> horizon_offset_deg{};
    };

    [[nodiscard]] constexpr std::string_view to_string(EventKind kind)
    {
        switch (kind)
        {
        case EventKind::kRise:        return "rise";
        case EventKind::kSet:         return "set";
        case EventKind::kTransit:     return "transit";
        case EventKind::kAntitransit: return "antitransit";
        }
        return "unknown";
    }

    [[nodiscard]] constexpr std::string_view to_string(SearchDirection direction)
    {
        switch (direction)
        {
        case SearchDirection::kNearest:  return "nearest";
        case SearchDirection::kNext:     return "next";
        case SearchDirection::kPrevious: return "previous";
        }
        return "unknown";
    }

    [[nodiscard]] constexpr std::string_view to_string(EventStatus status)
    {
        switch (status)
        {
        case EventStatus::kFound:       return "found";
        case EventStatus::kCircumpolar: return "circumpolar";
        case EventStatus::kNeverRises:  return "never rises";
        case EventStatus::kNotInWindow: return "not in window";
        }
        return "unknown";
    }

} // namespace almanac::events
