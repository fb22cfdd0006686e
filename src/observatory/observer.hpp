#pragma once
// observatory/observer.hpp - Observer and observatory site description
//
// An Observer is a named geodetic location plus the horizon offset that
// defines "rise" and "set" for it. Instances are immutable; derive a
// variant with with_horizon_offset().

#include "astro/coordinates.hpp"
#include "astro/time_system.hpp"
#include "core/types.hpp"
#include "observatory/atmosphere.hpp"

#include <string>
#include <utility>

namespace almanac::observatory {

// -----------------------------------------------------------------------
// Geographic location of the observer
// -----------------------------------------------------------------------
struct GeographicLocation {
    double lat_deg{0.0};     // Geodetic latitude [degrees, N positive]
    double lon_deg{0.0};     // Longitude [degrees, E positive]
    double elevation_m{0.0}; // Elevation above sea level [meters]
};

// -----------------------------------------------------------------------
// Observer
// -----------------------------------------------------------------------
class Observer {
public:
    Observer(std::string name, const GeographicLocation& location,
             double horizon_offset_deg = horizon::kGeometric)
        : m_name(std::move(name)), m_location(location),
          m_horizon_offset_deg(horizon_offset_deg) {}

    const std::string&        name()               const { return m_name; }
    const GeographicLocation& location()           const { return m_location; }
    double                    horizon_offset_deg() const { return m_horizon_offset_deg; }

    /// Same site, different operative horizon.
    Observer with_horizon_offset(double offset_deg) const {
        return Observer(m_name, m_location, offset_deg);
    }

    /// Location in the radian form used by astro::Coordinates.
    astro::ObserverLocation location_rad() const {
        return astro::ObserverLocation{
            .latitude_rad  = m_location.lat_deg * astro_constants::kDegToRad,
            .longitude_rad = m_location.lon_deg * astro_constants::kDegToRad,
        };
    }

    /// Local Mean Sidereal Time [radians] at instant t.
    double lmst(astro::Instant t) const {
        return astro::TimeSystem::lmst(t.jd, location_rad().longitude_rad);
    }

    /// Equatorial (of date) -> horizontal at instant t.
    astro::HorizontalCoord to_horizontal(const astro::EquatorialCoord& eq,
                                         astro::Instant t) const {
        return astro::Coordinates::equatorial_to_horizontal(eq, location_rad(), lmst(t));
    }

private:
    std::string        m_name;
    GeographicLocation m_location;
    double             m_horizon_offset_deg{0.0};
};

// -----------------------------------------------------------------------
// Factory helpers
// -----------------------------------------------------------------------

/// High-altitude Hawaiian site, horizon at standard refraction.
inline Observer make_mauna_kea_site() {
    return Observer("Mauna Kea Observatory",
                    GeographicLocation{19.8207, -155.4681, 4205.0},
                    horizon::kStandardRefraction);
}

/// Suburban London-like site with the geometric horizon.
inline Observer make_backyard_site() {
    return Observer("Backyard Observatory",
                    GeographicLocation{51.5, -0.1, 10.0},
                    horizon::kGeometric);
}

} // namespace almanac::observatory
