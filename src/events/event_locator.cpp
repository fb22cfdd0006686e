/// @file event_locator.cpp
/// @brief Coarse sampling, bracket detection and refinement of horizon events.

#include "events/event_locator.hpp"

#include "core/error.hpp"
#include "core/logger.hpp"
#include "events/altitude_sampler.hpp"

#include <algorithm>
#include <cmath>
#include <optional>
#include <string>

namespace almanac::events
{

namespace
{

// Ratio slack so that e.g. a 1-day window over 2-minute steps gives
// exactly 720 steps despite rounding in the division.
constexpr f64 kStepCountSlack = 1e-9;

// Upper bound on grid steps per query (one sample per second over ~11.6 days).
constexpr f64 kMaxStepsPerQuery = 1.0e6;

} // namespace

EventLocator::EventLocator(SearchConfig config)
    : m_config(config)
{
}

EventResult EventLocator::find_event(const observatory::Observer& observer,
                                     const target::Target& target,
                                     astro::Instant reference,
                                     EventKind kind,
                                     SearchDirection direction) const
{
    const f64 offset = m_config.horizon_offset_deg.value_or(observer.horizon_offset_deg());
    return find_event(observer, target, reference, kind, direction, offset);
}

EventResult EventLocator::find_event(const observatory::Observer& observer,
                                     const target::Target& target,
                                     astro::Instant reference,
                                     EventKind kind,
                                     SearchDirection direction,
                                     f64 horizon_offset_deg) const
{
    validate();

    ALM_CORE_TRACE("find_event: {} {} of '{}' for '{}' around {} (horizon {:.4f} deg)",
                   to_string(direction), to_string(kind), target.name(), observer.name(),
                   astro::TimeSystem::to_iso_string(reference), horizon_offset_deg);

    // -----------------------------------------------------------------
    // 1. Coarse sampling
    // -----------------------------------------------------------------
    const std::vector<astro::Instant> grid = build_grid(reference, direction);
    const AltitudeSampler sampler(observer, target, horizon_offset_deg);
    const std::vector<f64> altitudes = sampler.sample(grid, m_config.worker_threads);

    // -----------------------------------------------------------------
    // 2 + 3. Bracket detection and refinement
    // -----------------------------------------------------------------
    std::vector<astro::Instant> candidates;
    switch (kind)
    {
    case EventKind::kRise:
        candidates = find_crossings(grid, altitudes, true);
        break;
    case EventKind::kSet:
        candidates = find_crossings(grid, altitudes, false);
        break;
    case EventKind::kTransit:
        candidates = find_extrema(grid, altitudes, true);
        break;
    case EventKind::kAntitransit:
        candidates = find_extrema(grid, altitudes, false);
        break;
    }

    // -----------------------------------------------------------------
    // 4. No crossing at all: classify the whole window
    // -----------------------------------------------------------------
    if (candidates.empty() && (kind == EventKind::kRise || kind == EventKind::kSet))
    {
        const auto [lowest, highest] = std::minmax_element(altitudes.begin(), altitudes.end());

        EventStatus status = EventStatus::kNotInWindow;
        if (*highest <= 0.0)
        {
            status = EventStatus::kNeverRises;
        }
        else if (*lowest >= 0.0)
        {
            status = EventStatus::kCircumpolar;
        }

        ALM_CORE_DEBUG("find_event: no {} of '{}' in window, altitude range [{:.4f}, {:.4f}] deg -> {}",
                       to_string(kind), target.name(), *lowest, *highest, to_string(status));
        return EventResult::sentinel(status);
    }

    const EventResult result = select(candidates, reference, direction);
    if (result.found())
    {
        ALM_CORE_TRACE("find_event: {} of '{}' at {} ({} candidates)", to_string(kind), target.name(),
                       astro::TimeSystem::to_iso_string(result.time), candidates.size());
    }
    else
    {
        ALM_CORE_DEBUG("find_event: no {} {} of '{}' in window ({} candidates)",
                       to_string(direction), to_string(kind), target.name(), candidates.size());
    }
    return result;
}

void EventLocator::validate() const
{
    const f64 window = m_config.window.days;
    const f64 interval = m_config.sample_interval.days;

    if (!std::isfinite(window) || !std::isfinite(interval) || window <= 0.0 || interval <= 0.0)
    {
        throw core::AmbiguousWindowError(
            "search window (" + std::to_string(window) + " d) and sample interval ("
            + std::to_string(interval) + " d) must be positive and finite");
    }
    if (window < interval)
    {
        throw core::AmbiguousWindowError(
            "search window (" + std::to_string(m_config.window.minutes())
            + " min) is shorter than one sampling interval ("
            + std::to_string(m_config.sample_interval.minutes()) + " min)");
    }

    const f64 ratio = window / interval;
    if (!std::isfinite(ratio) || ratio - kStepCountSlack > kMaxStepsPerQuery)
    {
        throw core::AmbiguousWindowError(
            "search window (" + std::to_string(window) + " d) over sample interval ("
            + std::to_string(interval) + " d) exceeds " + std::to_string(static_cast<u64>(kMaxStepsPerQuery))
            + " grid steps per query");
    }
}

std::vector<astro::Instant> EventLocator::build_grid(astro::Instant reference,
                                                     SearchDirection direction) const
{
    const astro::Duration window = m_config.window;

    astro::Instant start = reference;
    switch (direction)
    {
    case SearchDirection::kNearest:
        start = reference - window / 2.0;
        break;
    case SearchDirection::kNext:
        start = reference;
        break;
    case SearchDirection::kPrevious:
        start = reference - window;
        break;
    }
    const astro::Instant end = start + window;

    const f64 ratio = window.days / m_config.sample_interval.days;
    const auto steps = std::max<std::size_t>(
        1, static_cast<std::size_t>(std::ceil(ratio - kStepCountSlack)));
    const f64 step_days = window.days / static_cast<f64>(steps);

    std::vector<astro::Instant> grid;
    grid.reserve(steps + 1);
    for (std::size_t i = 0; i < steps; ++i)
    {
        grid.push_back(astro::Instant::from_jd(start.jd + step_days * static_cast<f64>(i)));
    }
    grid.push_back(end);
    return grid;
}

// -----------------------------------------------------------------
// Rise/set brackets
//
// Zero samples are skipped: a crossing is a sign change between
// consecutive non-zero samples. A curve that only touches zero
// (…, −, 0, −, …) therefore never brackets.
//
// Refinement: t = t_a + (t_b − t_a) × a_a / (a_a − a_b)
// -----------------------------------------------------------------

std::vector<astro::Instant> EventLocator::find_crossings(
    std::span<const astro::Instant> grid, std::span<const f64> altitudes, bool rising)
{
    std::vector<astro::Instant> crossings;
    std::optional<std::size_t> previous;

    for (std::size_t i = 0; i < altitudes.size(); ++i)
    {
        const f64 current = altitudes[i];
        if (current == 0.0)
        {
            continue;
        }

        if (previous)
        {
            const f64 before = altitudes[*previous];
            const bool crosses = rising ? (before < 0.0 && current > 0.0)
                                        : (before > 0.0 && current < 0.0);
            if (crosses)
            {
                const astro::Instant ta = grid[*previous];
                const astro::Duration span = grid[i] - ta;
                const f64 fraction = before / (before - current);
                crossings.push_back(ta + span * fraction);
            }
        }
        previous = i;
    }

    return crossings;
}

// -----------------------------------------------------------------
// Transit/antitransit brackets
//
// Middle sample of a triple is an extremum when it is >= its left
// neighbour and strictly > its right one (mirrored for minima), so a
// flat run yields a single bracket at its trailing edge.
//
// Refinement: vertex of the parabola through (−1, a₋), (0, a₀), (+1, a₊)
//   x = (a₋ − a₊) / (2 (a₋ − 2a₀ + a₊)), clamped to [−1, 1]
// -----------------------------------------------------------------

std::vector<astro::Instant> EventLocator::find_extrema(
    std::span<const astro::Instant> grid, std::span<const f64> altitudes, bool maximum)
{
    std::vector<astro::Instant> extrema;
    const f64 sign = maximum ? 1.0 : -1.0;

    for (std::size_t i = 1; i + 1 < altitudes.size(); ++i)
    {
        const f64 left   = sign * altitudes[i - 1];
        const f64 middle = sign * altitudes[i];
        const f64 right  = sign * altitudes[i + 1];

        if (!(middle >= left && middle > right))
        {
            continue;
        }

        const f64 curvature = left - 2.0 * middle + right;
        f64 offset = 0.0;
        if (curvature != 0.0)
        {
            offset = std::clamp(0.5 * (left - right) / curvature, -1.0, 1.0);
        }

        const astro::Duration half_span = offset >= 0.0 ? grid[i + 1] - grid[i] : grid[i] - grid[i - 1];
        extrema.push_back(grid[i] + half_span * offset);
    }

    return extrema;
}

// -----------------------------------------------------------------
// Candidate selection. Candidates arrive in ascending time order.
// -----------------------------------------------------------------

EventResult EventLocator::select(std::span<const astro::Instant> candidates,
                                 astro::Instant reference,
                                 SearchDirection direction)
{
    std::optional<astro::Instant> chosen;

    switch (direction)
    {
    case SearchDirection::kNearest:
        for (const astro::Instant& t : candidates)
        {
            // Strict comparison keeps the earliest of two equidistant events.
            if (!chosen || std::abs((t - reference).days) < std::abs((*chosen - reference).days))
            {
                chosen = t;
            }
        }
        break;

    case SearchDirection::kNext:
        for (const astro::Instant& t : candidates)
        {
            if (t > reference)
            {
                chosen = t;
                break;
            }
        }
        break;

    case SearchDirection::kPrevious:
        for (const astro::Instant& t : candidates)
        {
            if (t < reference)
            {
                chosen = t;
            }
        }
        break;
    }

    return chosen ? EventResult::at(*chosen) : EventResult::sentinel(EventStatus::kNotInWindow);
}

} // namespace almanac::events
