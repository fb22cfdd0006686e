/// @file altitude_sampler.cpp
/// @brief Altitude evaluation, serial and chunked across worker threads.

#include "events/altitude_sampler.hpp"

#include <algorithm>
#include <future>

namespace almanac::events
{

AltitudeSampler::AltitudeSampler(const observatory::Observer& observer,
                                 const target::Target& target,
                                 f64 horizon_offset_deg)
    : m_observer(observer)
    , m_target(target)
    , m_horizon_offset_deg(horizon_offset_deg)
{
}

f64 AltitudeSampler::altitude_deg(astro::Instant t) const
{
    const astro::HorizontalCoord hz = m_target.horizontal_at(m_observer, t);
    return hz.alt * astro_constants::kRadToDeg - m_horizon_offset_deg;
}

std::vector<f64> AltitudeSampler::sample(std::span<const astro::Instant> times,
                                         u32 worker_threads) const
{
    std::vector<f64> altitudes(times.size());
    if (times.empty())
    {
        return altitudes;
    }

    const std::size_t workers = std::clamp<std::size_t>(worker_threads, 1, times.size());
    if (workers == 1)
    {
        for (std::size_t i = 0; i < times.size(); ++i)
        {
            altitudes[i] = altitude_deg(times[i]);
        }
        return altitudes;
    }

    // -----------------------------------------------------------------
    // Each job owns a disjoint [begin, end) slice of the output, so no
    // locking is needed and the merge order is the grid order.
    // -----------------------------------------------------------------
    const std::size_t chunk = (times.size() + workers - 1) / workers;

    std::vector<std::future<void>> jobs;
    jobs.reserve(workers);
    for (std::size_t begin = 0; begin < times.size(); begin += chunk)
    {
        const std::size_t end = std::min(begin + chunk, times.size());
        jobs.push_back(std::async(std::launch::async, [this, times, &altitudes, begin, end]
        {
            for (std::size_t i = begin; i < end; ++i)
            {
                altitudes[i] = altitude_deg(times[i]);
            }
        }));
    }

    for (auto& job : jobs)
    {
        job.wait();
    }
    for (auto& job : jobs)
    {
        job.get();
    }

    return altitudes;
}

f64 altitude(const observatory::Observer& observer,
             const target::Target& target,
             astro::Instant t)
{
    return AltitudeSampler(observer, target, observer.horizon_offset_deg()).altitude_deg(t);
}

} // namespace almanac::events
