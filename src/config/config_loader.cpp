/// @file config_loader.cpp
/// @brief Implementation of the "key = value" configuration reader.

#include "config/config_loader.hpp"

#include "core/logger.hpp"
#include "core/types.hpp"

#include <charconv>
#include <cmath>
#include <fstream>
#include <sstream>
#include <string>

namespace almanac::config
{

// -----------------------------------------------------------------
// AlmanacConfig → core inputs
// -----------------------------------------------------------------

events::SearchConfig AlmanacConfig::search_config() const
{
    return events::SearchConfig{
        .window             = astro::Duration::from_days(window_days),
        .sample_interval    = astro::Duration::from_days(1.0 / samples_per_day),
        .worker_threads     = worker_threads,
        .horizon_offset_deg = std::nullopt,
    };
}

observatory::Observer AlmanacConfig::make_observer() const
{
    return observatory::Observer(site_name, location, horizon_offset_deg);
}

// -----------------------------------------------------------------
// File loading
// -----------------------------------------------------------------

std::optional<AlmanacConfig> ConfigLoader::load(const std::filesystem::path& path)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        ALM_CORE_ERROR("ConfigLoader: Failed to open file: {}", path.string());
        return std::nullopt;
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    return parse(contents.str(), path.string());
}

std::optional<AlmanacConfig> ConfigLoader::parse(std::string_view text, std::string_view source)
{
    AlmanacConfig cfg;
    u32 line_number = 0;
    u32 applied = 0;

    while (!text.empty())
    {
        const auto eol = text.find('\n');
        std::string_view line = text.substr(0, eol);
        text = (eol == std::string_view::npos) ? std::string_view{} : text.substr(eol + 1);
        ++line_number;

        if (const auto hash = line.find('#'); hash != std::string_view::npos)
        {
            line = line.substr(0, hash);
        }
        line = trim(line);
        if (line.empty())
        {
            continue;
        }

        const auto delim = line.find_first_of("=:");
        if (delim == std::string_view::npos)
        {
            ALM_CORE_ERROR("ConfigLoader: Malformed line {} in {}: '{}'", line_number, source, line);
            return std::nullopt;
        }

        const std::string_view key = trim(line.substr(0, delim));
        const std::string_view value = unquote(trim(line.substr(delim + 1)));

        if (!apply(cfg, key, value, source, line_number))
        {
            return std::nullopt;
        }
        ++applied;
    }

    ALM_CORE_INFO("ConfigLoader: Read {} settings from {}", applied, source);
    return cfg;
}

// -----------------------------------------------------------------
// Per-key handling
// -----------------------------------------------------------------

bool ConfigLoader::apply(AlmanacConfig& cfg, std::string_view key, std::string_view value,
                         std::string_view source, u32 line_number)
{
    const auto invalid = [&](std::string_view why)
    {
        ALM_CORE_ERROR("ConfigLoader: Invalid {} on line {} in {}: '{}' ({})",
                       key, line_number, source, value, why);
        return false;
    };

    if (key == "site_name")
    {
        if (value.empty())
        {
            return invalid("empty name");
        }
        cfg.site_name = std::string(value);
    }
    else if (key == "latitude_deg")
    {
        const auto v = parse_f64(value);
        if (!v || *v < -90.0 || *v > 90.0)
        {
            return invalid("expected degrees in [-90, 90]");
        }
        cfg.location.lat_deg = *v;
    }
    else if (key == "longitude_deg")
    {
        const auto v = parse_f64(value);
        if (!v || *v < -180.0 || *v > 360.0)
        {
            return invalid("expected degrees in [-180, 360]");
        }
        cfg.location.lon_deg = *v;
    }
    else if (key == "elevation_m")
    {
        const auto v = parse_f64(value);
        if (!v)
        {
            return invalid("expected meters");
        }
        cfg.location.elevation_m = *v;
    }
    else if (key == "horizon_offset_deg")
    {
        const auto v = parse_f64(value);
        if (!v || std::abs(*v) >= 90.0)
        {
            return invalid("expected degrees in (-90, 90)");
        }
        cfg.horizon_offset_deg = *v;
    }
    else if (key == "window_days")
    {
        const auto v = parse_f64(value);
        if (!v || *v <= 0.0)
        {
            return invalid("expected a positive number of days");
        }
        cfg.window_days = *v;
    }
    else if (key == "samples_per_day")
    {
        const auto v = parse_f64(value);
        if (!v || *v <= 0.0)
        {
            return invalid("expected a positive sample rate");
        }
        cfg.samples_per_day = *v;
    }
    else if (key == "worker_threads")
    {
        const auto v = parse_u32(value);
        if (!v || *v == 0)
        {
            return invalid("expected a positive integer");
        }
        cfg.worker_threads = *v;
    }
    else if (key == "reference_time")
    {
        const auto t = astro::TimeSystem::parse_iso(value);
        if (!t)
        {
            return invalid("expected ISO-8601 UTC, e.g. 2024-11-15T18:00:00Z");
        }
        cfg.reference_time = *t;
    }
    else if (key == "log_level")
    {
        const auto level = parse_level(value);
        if (!level)
        {
            return invalid("expected trace, debug, info, warn, error, critical or off");
        }
        cfg.log_level = *level;
    }
    else
    {
        ALM_CORE_WARN("ConfigLoader: Ignoring unknown key '{}' on line {} in {}", key, line_number, source);
    }
    return true;
}

// -----------------------------------------------------------------
// Utility: trim whitespace
// -----------------------------------------------------------------

std::string_view ConfigLoader::trim(std::string_view sv)
{
    while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t' || sv.front() == '\r'))
    {
        sv.remove_prefix(1);
    }
    while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t' || sv.back() == '\r'))
    {
        sv.remove_suffix(1);
    }
    return sv;
}

std::string_view ConfigLoader::unquote(std::string_view sv)
{
    if (sv.size() >= 2 && (sv.front() == '"' || sv.front() == '\'') && sv.back() == sv.front())
    {
        sv.remove_prefix(1);
        sv.remove_suffix(1);
    }
    return sv;
}

// -----------------------------------------------------------------
// Utility: parse numbers from string_view
// -----------------------------------------------------------------

std::optional<f64> ConfigLoader::parse_f64(std::string_view sv)
{
    if (sv.empty())
    {
        return std::nullopt;
    }

    f64 value = 0.0;
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);

    if (ec != std::errc{} || ptr != sv.data() + sv.size() || !std::isfinite(value))
    {
        return std::nullopt;
    }

    return value;
}

std::optional<u32> ConfigLoader::parse_u32(std::string_view sv)
{
    if (sv.empty())
    {
        return std::nullopt;
    }

    u32 value = 0;
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);

    if (ec != std::errc{} || ptr != sv.data() + sv.size())
    {
        return std::nullopt;
    }

    return value;
}

std::optional<spdlog::level::level_enum> ConfigLoader::parse_level(std::string_view sv)
{
    const std::string name(sv);
    const auto level = spdlog::level::from_str(name);

    // from_str() maps every unknown name to "off"
    if (level == spdlog::level::off && name != "off")
    {
        return std::nullopt;
    }
    return level;
}

} // namespace almanac::config
