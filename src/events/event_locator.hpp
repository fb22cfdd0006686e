#pragma once

/// @file event_locator.hpp
/// @brief Rise / set / transit / antitransit finder.

#include "astro/time_system.hpp"
#include "core/types.hpp"
#include "events/event_types.hpp"
#include "observatory/observer.hpp"
#include "target/target.hpp"

#include <span>
#include <vector>

namespace almanac::events
{
    /// @brief Locates horizon events by coarse sampling, bracketing and local refinement.
    ///
    /// Pipeline for each query:
    /// 1. Sample altitude (relative to the operative horizon) on an even grid
    ///    spanning the search window.
    /// 2. Bracket: sign changes in the requested direction for rise/set,
    ///    local maxima/minima of sample triples for transit/antitransit.
    /// 3. Refine: linear interpolation to zero for rise/set (curvature between
    ///    samples is deliberately not corrected, leaving an arcsecond-level
    ///    residual), parabola vertex for extrema.
    ///
    /// The locator holds only its configuration; find_event() is const and
    /// safe to call concurrently for independent queries. It logs through
    /// the core logger, which falls back to spdlog's default logger when
    /// core::Logger::init() was never called.
    ///
    /// A query evaluates at most one million grid steps; finer sampling of
    /// the window raises core::AmbiguousWindowError.
    class EventLocator
    {
    public:
        explicit EventLocator(SearchConfig config = {});

        /// @brief Find an event using the configured horizon offset override,
        /// or the observer's own offset when none is configured.
        /// @throws core::AmbiguousWindowError if the window cannot hold one sampling interval
        ///         or needs more than one million grid steps.
        /// @throws core::EvaluationError propagated unchanged from the target.
        [[nodiscard]] EventResult find_event(const observatory::Observer& observer,
                                             const target::Target& target,
                                             astro::Instant reference,
                                             EventKind kind,
                                             SearchDirection direction = SearchDirection::kNearest) const;

        /// @brief As above with an explicit horizon offset [degrees].
        [[nodiscard]] EventResult find_event(const observatory::Observer& observer,
                                             const target::Target& target,
                                             astro::Instant reference,
                                             EventKind kind,
                                             SearchDirection direction,
                                             f64 horizon_offset_deg) const;

        [[nodiscard]] const SearchConfig& config() const { return m_config; }

    private:
        /// Evenly spaced grid covering the window for this direction.
        [[nodiscard]] std::vector<astro::Instant> build_grid(astro::Instant reference,
                                                             SearchDirection direction) const;

        [[nodiscard]] static std::vector<astro::Instant> find_crossings(
            std::span<const astro::Instant> grid, std::span<const f64> altitudes, bool rising);

        [[nodiscard]] static std::vector<astro::Instant> find_extrema(
            std::span<const astro::Instant> grid, std::span<const f64> altitudes, bool maximum);

        [[nodiscard]] static EventResult select(std::span<const astro::Instant> candidates,
                                                astro::Instant reference,
                                                SearchDirection direction);

        void validate() const;

        SearchConfig m_config;
    };

} // namespace almanac::events
