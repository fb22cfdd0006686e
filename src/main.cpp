// src/main.cpp - Almanac command-line entry point
//
// Usage: almanac [config-file] [reference-time]
//
//  1. Load site/search settings (built-in defaults without a file)
//  2. Resolve the reference time (argument, config, or now)
//  3. Rise / transit / set / antitransit of a Sirius-like star
//  4. Sunrise, sunset and twilight for the site

#include "astro/coordinates.hpp"
#include "astro/time_system.hpp"
#include "config/config_loader.hpp"
#include "core/error.hpp"
#include "core/logger.hpp"
#include "events/almanac.hpp"
#include "events/event_types.hpp"
#include "observatory/observer.hpp"
#include "target/target.hpp"

#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

using namespace almanac;

namespace {

void printEvent(std::string_view label, const events::EventResult& result) {
    std::cout << "  " << std::left << std::setw(24) << label << ": ";
    if (result.found()) {
        std::cout << astro::TimeSystem::to_iso_string(result.time);
    } else {
        std::cout << "(" << events::to_string(result.status) << ")";
    }
    std::cout << "\n";
}

} // namespace

int main(int argc, char** argv) {
    core::Logger::init();

    // -----------------------------------------------------------------------
    // 1. Configuration
    // -----------------------------------------------------------------------
    config::AlmanacConfig cfg;
    if (argc > 1) {
        auto loaded = config::ConfigLoader::load(argv[1]);
        if (!loaded) {
            ALM_ERROR("Could not load configuration from {}", argv[1]);
            core::Logger::shutdown();
            return 1;
        }
        cfg = *loaded;
    }
    core::Logger::set_level(cfg.log_level);

    // -----------------------------------------------------------------------
    // 2. Reference time
    // -----------------------------------------------------------------------
    astro::Instant reference = cfg.reference_time.value_or(astro::TimeSystem::now());
    if (argc > 2) {
        const auto parsed = astro::TimeSystem::parse_iso(argv[2]);
        if (!parsed) {
            ALM_ERROR("Invalid reference time '{}' (expected e.g. 2024-11-15T18:00:00Z)", argv[2]);
            core::Logger::shutdown();
            return 1;
        }
        reference = *parsed;
    }

    const observatory::Observer site = cfg.make_observer();
    const events::Almanac finder(cfg.search_config());

    std::cout << "================================================================\n"
              << "  ALMANAC - horizon events\n"
              << "================================================================\n\n"
              << "Site: " << site.name() << "\n"
              << std::fixed << std::setprecision(4)
              << "  Lat: " << site.location().lat_deg << " deg N\n"
              << "  Lon: " << site.location().lon_deg << " deg E\n"
              << "  Elevation: " << std::setprecision(0) << site.location().elevation_m << " m\n"
              << "  Horizon offset: " << std::setprecision(4) << site.horizon_offset_deg() << " deg\n"
              << "Reference: " << astro::TimeSystem::to_iso_string(reference) << "\n\n";

    try {
        // -------------------------------------------------------------------
        // 3. Sirius-like fixed star
        // -------------------------------------------------------------------
        const auto ra  = astro::Coordinates::parse_hours("6h45m08.9s");
        const auto dec = astro::Coordinates::parse_degrees("-16d42m58s");
        const target::FixedTarget sirius("Sirius", astro::EquatorialCoord{.ra = *ra, .dec = *dec});

        std::cout << "Sirius (RA 6h45m08.9s, Dec -16d42m58s), nearest events:\n";
        printEvent("rise",        finder.rise(site, sirius, reference));
        printEvent("transit",     finder.transit(site, sirius, reference));
        printEvent("set",         finder.set(site, sirius, reference));
        printEvent("antitransit", finder.antitransit(site, sirius, reference));
        std::cout << "  currently " << (events::Almanac::is_up(site, sirius, reference) ? "up" : "down")
                  << "\n\n";

        // -------------------------------------------------------------------
        // 4. Sun and twilight
        // -------------------------------------------------------------------
        using events::SearchDirection;
        using events::Twilight;

        std::cout << "Sun, next events:\n";
        printEvent("sunset", finder.sunset(site, reference, SearchDirection::kNext));
        printEvent("civil dusk", finder.twilight_evening(site, reference, Twilight::kCivil, SearchDirection::kNext));
        printEvent("nautical dusk", finder.twilight_evening(site, reference, Twilight::kNautical, SearchDirection::kNext));
        printEvent("astronomical dusk",
                   finder.twilight_evening(site, reference, Twilight::kAstronomical, SearchDirection::kNext));
        printEvent("astronomical dawn",
                   finder.twilight_morning(site, reference, Twilight::kAstronomical, SearchDirection::kNext));
        printEvent("nautical dawn", finder.twilight_morning(site, reference, Twilight::kNautical, SearchDirection::kNext));
        printEvent("civil dawn", finder.twilight_morning(site, reference, Twilight::kCivil, SearchDirection::kNext));
        printEvent("sunrise", finder.sunrise(site, reference, SearchDirection::kNext));
        std::cout << "  astronomical night now: " << (finder.is_night(site, reference) ? "yes" : "no") << "\n\n";
    } catch (const core::AlmanacError& e) {
        ALM_CRITICAL("{}", e.what());
        core::Logger::shutdown();
        return 1;
    }

    core::Logger::shutdown();
    return 0;
}
