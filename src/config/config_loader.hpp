#pragma once

/// @file config_loader.hpp
/// @brief Loads site and search settings from a "key = value" text file.

#include "astro/time_system.hpp"
#include "core/types.hpp"
#include "events/event_types.hpp"
#include "observatory/atmosphere.hpp"
#include "observatory/observer.hpp"

#include <spdlog/common.h>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace almanac::config
{
    /// @brief Settings of one almanac run. Defaults describe Mauna Kea with
    /// a one-day window sampled every two minutes.
    struct AlmanacConfig
    {
        std::string                     site_name{"Mauna Kea Observatory"};
        observatory::GeographicLocation location{19.8207, -155.4681, 4205.0};
        f64                             horizon_offset_deg{observatory::horizon::kStandardRefraction};
        f64                             window_days{1.0};
        f64                             samples_per_day{720.0};
        u32                             worker_threads{1};
        std::optional<astro::Instant>   reference_time{};
        spdlog::level::level_enum       log_level{spdlog::level::info};

        [[nodiscard]] events::SearchConfig search_config() const;
        [[nodiscard]] observatory::Observer make_observer() const;
    };

    /// @brief Static utility class for reading AlmanacConfig files.
    ///
    /// Format: one "key = value" (or "key: value") per line; '#' starts a
    /// comment; blank lines are ignored; values may be quoted. Recognized keys:
    ///   site_name, latitude_deg, longitude_deg, elevation_m, horizon_offset_deg,
    ///   window_days, samples_per_day, worker_threads, reference_time, log_level
    ///
    /// Unknown keys are logged and skipped. Any malformed or out-of-range
    /// value fails the whole load.
    class ConfigLoader
    {
    public:
        ConfigLoader() = delete;

        /// @brief Load a configuration file.
        /// @return The configuration, or std::nullopt on failure (reason is logged).
        [[nodiscard]] static std::optional<AlmanacConfig> load(const std::filesystem::path& path);

        /// @brief Parse configuration text; @p source names it in log messages.
        [[nodiscard]] static std::optional<AlmanacConfig> parse(std::string_view text,
                                                                std::string_view source = "<memory>");

    private:
        /// @brief Trim leading and trailing whitespace from a string_view.
        [[nodiscard]] static std::string_view trim(std::string_view sv);

        /// @brief Strip one pair of matching surrounding quotes.
        [[nodiscard]] static std::string_view unquote(std::string_view sv);

        /// @brief Parse a single f64 value from a trimmed string_view.
        [[nodiscard]] static std::optional<f64> parse_f64(std::string_view sv);

        /// @brief Parse a single u32 value from a trimmed string_view.
        [[nodiscard]] static std::optional<u32> parse_u32(std::string_view sv);

        /// @brief Parse an spdlog level name ("trace" … "critical", "off").
        [[nodiscard]] static std::optional<spdlog::level::level_enum> parse_level(std::string_view sv);

        /// @brief Apply one key/value pair; false if the value is invalid.
        [[nodiscard]] static bool apply(AlmanacConfig& cfg, std::string_view key, std::string_view value,
                                        std::string_view source, u32 line_number);
    };

} // namespace almanac::config
