#pragma once

/// @file logger.hpp
/// @brief Dual-logger system wrapping spdlog (core library + application loggers).

#include <spdlog/spdlog.h>

#include <memory>

namespace almanac::core
{
    /// @brief Centralized logging facility for Almanac.
    ///
    /// Provides two separate loggers:
    /// - **ALMANAC** (core): event finder, ephemerides, configuration loading
    /// - **APP**: the command-line caller and its user-facing messages
    ///
    /// Both write to colored console output and a rotating log file.
    /// Call init() once from main() (or a test main). Until then the macros
    /// write through spdlog's default logger, so library calls are safe
    /// without it. No logging may happen after shutdown().
    class Logger
    {
    public:
        /// @brief Initialize both loggers with console + file sinks.
        /// Calling it again only updates the level.
        /// @param level Minimum level passed through to the sinks.
        static void init(spdlog::level::level_enum level = spdlog::level::info);

        /// @brief Change the level of both loggers after init().
        static void set_level(spdlog::level::level_enum level);

        /// @brief Flush and tear down all loggers.
        /// Call once at shutdown after all logging is complete.
        static void shutdown();

        /// @brief Access the core library logger ("ALMANAC"), or spdlog's
        /// default logger before init().
        [[nodiscard]] static spdlog::logger* get_core_logger();

        /// @brief Access the application-level logger ("APP"), or spdlog's
        /// default logger before init().
        [[nodiscard]] static spdlog::logger* get_app_logger();

    private:
        static std::shared_ptr<spdlog::logger> s_core_logger;
        static std::shared_ptr<spdlog::logger> s_app_logger;
    };

} // namespace almanac::core

// -----------------------------------------------------------------
// Core library log macros
// -----------------------------------------------------------------
// NOLINTBEGIN(cppcoreguidelines-macro-usage)
#define ALM_CORE_TRACE(...)    ::almanac::core::Logger::get_core_logger()->trace(__VA_ARGS__)
#define ALM_CORE_DEBUG(...)    ::almanac::core::Logger::get_core_logger()->debug(__VA_ARGS__)
#define ALM_CORE_INFO(...)     ::almanac::core::Logger::get_core_logger()->info(__VA_ARGS__)
#define ALM_CORE_WARN(...)     ::almanac::core::Logger::get_core_logger()->warn(__VA_ARGS__)
#define ALM_CORE_ERROR(...)    ::almanac::core::Logger::get_core_logger()->error(__VA_ARGS__)
#define ALM_CORE_CRITICAL(...) ::almanac::core::Logger::get_core_logger()->critical(__VA_ARGS__)

// -----------------------------------------------------------------
// Application log macros
// -----------------------------------------------------------------
#define ALM_TRACE(...)         ::almanac::core::Logger::get_app_logger()->trace(__VA_ARGS__)
#define ALM_INFO(...)          ::almanac::core::Logger::get_app_logger()->info(__VA_ARGS__)
#define ALM_WARN(...)          ::almanac::core::Logger::get_app_logger()->warn(__VA_ARGS__)
#define ALM_ERROR(...)         ::almanac::core::Logger::get_app_logger()->error(__VA_ARGS__)
#define ALM_CRITICAL(...)      ::almanac::core::Logger::get_app_logger()->critical(__VA_ARGS__)
// NOLINTEND(cppcoreguidelines-macro-usage)
