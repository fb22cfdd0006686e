#pragma once

/// @file altitude_sampler.hpp
/// @brief Uniform altitude(t) view of an observer/target pair.

#include "astro/time_system.hpp"
#include "core/types.hpp"
#include "observatory/observer.hpp"
#include "target/target.hpp"

#include <span>
#include <vector>

namespace almanac::events
{
    /// @brief Altitude of a target relative to the operative horizon.
    ///
    /// The reported value is (true altitude − horizon offset) in degrees,
    /// so it is zero at the nominal rise/set instant. Holds references to
    /// its inputs; it lives for the duration of a single query.
    class AltitudeSampler
    {
    public:
        AltitudeSampler(const observatory::Observer& observer,
                        const target::Target& target,
                        f64 horizon_offset_deg);

        /// @brief Altitude above the operative horizon at @p t [degrees].
        /// @throws core::EvaluationError from the target, unchanged.
        [[nodiscard]] f64 altitude_deg(astro::Instant t) const;

        /// @brief Evaluate a grid of instants, result[i] belongs to times[i].
        ///
        /// With worker_threads > 1 the grid is split into contiguous chunks
        /// evaluated concurrently. The first failure is rethrown after all
        /// chunks have finished.
        [[nodiscard]] std::vector<f64> sample(std::span<const astro::Instant> times,
                                              u32 worker_threads = 1) const;

        [[nodiscard]] f64 horizon_offset_deg() const { return m_horizon_offset_deg; }

    private:
        const observatory::Observer& m_observer;
        const target::Target&        m_target;
        f64                          m_horizon_offset_deg;
    };

    /// @brief One-shot altitude above the observer's own horizon offset [degrees].
    [[nodiscard]] f64 altitude(const observatory::Observer& observer,
                               const target::Target& target,
                               astro::Instant t);

} // namespace almanac::events
