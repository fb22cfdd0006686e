#pragma once

/// @file error.hpp
/// @brief Exception taxonomy of the event finder.
///
/// Geometric outcomes such as "circumpolar" are not errors and are
/// reported through events::EventStatus instead.

#include <stdexcept>
#include <string>

namespace almanac::core
{
    /// @brief Common base so callers can catch every Almanac failure at once.
    class AlmanacError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    /// @brief A target position could not be computed for a requested instant
    /// (e.g. outside the ephemeris' supported range). Never retried.
    class EvaluationError : public AlmanacError
    {
    public:
        using AlmanacError::AlmanacError;
    };

    /// @brief The search configuration cannot hold a single coarse
    /// sampling interval (window too short, non-positive or non-finite).
    class AmbiguousWindowError : public AlmanacError
    {
    public:
        using AlmanacError::AlmanacError;
    };

} // namespace almanac::core
