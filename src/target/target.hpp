#pragma once

/// @file target.hpp
/// @brief Celestial targets: anything with a horizontal position at time t.

#include "astro/coordinates.hpp"
#include "astro/time_system.hpp"
#include "core/types.hpp"
#include "observatory/observer.hpp"

#include <functional>
#include <optional>
#include <string>

namespace almanac::target
{
    /// @brief Capability interface used by the event finder.
    ///
    /// Implementations must be deterministic and free of side effects:
    /// the locator evaluates them many times per query, possibly from
    /// several threads at once. Failure to evaluate is reported by
    /// throwing core::EvaluationError.
    class Target
    {
    public:
        virtual ~Target() = default;

        /// @brief Apparent horizontal position seen by @p observer at @p t.
        [[nodiscard]] virtual astro::HorizontalCoord horizontal_at(
            const observatory::Observer& observer, astro::Instant t) const = 0;

        [[nodiscard]] virtual const std::string& name() const = 0;
    };

    /// @brief Target at fixed J2000 equatorial coordinates (a star).
    class FixedTarget final : public Target
    {
    public:
        /// @param precess Rotate the J2000 position to the equinox of each
        /// evaluated instant before the horizontal transform.
        FixedTarget(std::string name, const astro::EquatorialCoord& j2000, bool precess = true);

        [[nodiscard]] astro::HorizontalCoord horizontal_at(
            const observatory::Observer& observer, astro::Instant t) const override;

        [[nodiscard]] const std::string& name() const override { return m_name; }

    private:
        std::string            m_name;
        astro::EquatorialCoord m_j2000;
        bool                   m_precess;
    };

    /// @brief Target whose equatorial position (of date) comes from an
    /// external ephemeris, e.g. a solar system body.
    class EphemerisTarget final : public Target
    {
    public:
        using PositionProvider = std::function<astro::EquatorialCoord(astro::Instant)>;

        /// Inclusive time range in which the provider is valid.
        struct ValidityRange
        {
            astro::Instant from;
            astro::Instant until;
        };

        EphemerisTarget(std::string name, PositionProvider provider,
                        std::optional<ValidityRange> validity = std::nullopt);

        /// @throws core::EvaluationError outside the validity range; exceptions
        /// raised by the provider pass through unchanged.
        [[nodiscard]] astro::HorizontalCoord horizontal_at(
            const observatory::Observer& observer, astro::Instant t) const override;

        [[nodiscard]] const std::string& name() const override { return m_name; }

        /// @brief Raw provider output at @p t, after the validity check.
        [[nodiscard]] astro::EquatorialCoord position_at(astro::Instant t) const;

    private:
        std::string                  m_name;
        PositionProvider             m_provider;
        std::optional<ValidityRange> m_validity;
    };

    /// @brief Target defined directly by its altitude as a function of time.
    ///
    /// Useful for synthetic profiles and for bodies whose altitude is
    /// produced by another system. Azimuth is reported as 0.
    class AltitudeCurveTarget final : public Target
    {
    public:
        /// Altitude in degrees at the given instant; independent of the observer.
        using AltitudeFunction = std::function<f64(astro::Instant)>;

        AltitudeCurveTarget(std::string name, AltitudeFunction altitude_deg);

        [[nodiscard]] astro::HorizontalCoord horizontal_at(
            const observatory::Observer& observer, astro::Instant t) const override;

        [[nodiscard]] const std::string& name() const override { return m_name; }

    private:
        std::string      m_name;
        AltitudeFunction m_altitude_deg;
    };

    /// @brief The Sun, backed by astro::SolarEphemeris (valid 1800-2200).
    [[nodiscard]] EphemerisTarget make_sun();

} // namespace almanac::target
