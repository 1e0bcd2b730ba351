#pragma once

/// @file logger.hpp
/// @brief Dual-logger system wrapping spdlog (core + application loggers).

#include <spdlog/spdlog.h>

#include <memory>

namespace natal::core
{
    /// @brief Centralized logging facility for Natal.
    ///
    /// Provides two separate loggers:
    /// - **NATAL** (core): table loading, ephemeris and chart computation
    /// - **APP**: command line front end and reading sessions
    ///
    /// Both write to colored console output and a rotating log file.
    /// Call init() once from main() before any logging or worker threads
    /// start. Until then, and again after shutdown(), both loggers are silent
    /// so library code can run unconfigured.
    class Logger
    {
    public:
        /// @brief Initialize both loggers with console + file sinks.
        static void init();

        /// @brief Flush and tear down all loggers.
        /// Call once at shutdown after all logging is complete.
        static void shutdown();

        /// @brief Access the core logger ("NATAL").
        [[nodiscard]] static std::shared_ptr<spdlog::logger>& get_core_logger();

        /// @brief Access the application-level logger ("APP").
        [[nodiscard]] static std::shared_ptr<spdlog::logger>& get_app_logger();

    private:
        [[nodiscard]] static std::shared_ptr<spdlog::logger> make_silent(const char* name);

        static std::shared_ptr<spdlog::logger> s_core_logger;
        static std::shared_ptr<spdlog::logger> s_app_logger;
    };

} // namespace natal::core

// -----------------------------------------------------------------
// Core log macros
// -----------------------------------------------------------------
// NOLINTBEGIN(cppcoreguidelines-macro-usage)
#define NATAL_CORE_TRACE(...)    ::natal::core::Logger::get_core_logger()->trace(__VA_ARGS__)
#define NATAL_CORE_INFO(...)     ::natal::core::Logger::get_core_logger()->info(__VA_ARGS__)
#define NATAL_CORE_WARN(...)     ::natal::core::Logger::get_core_logger()->warn(__VA_ARGS__)
#define NATAL_CORE_ERROR(...)    ::natal::core::Logger::get_core_logger()->error(__VA_ARGS__)
#define NATAL_CORE_CRITICAL(...) ::natal::core::Logger::get_core_logger()->critical(__VA_ARGS__)

// -----------------------------------------------------------------
// Application log macros
// -----------------------------------------------------------------
#define NATAL_TRACE(...)         ::natal::core::Logger::get_app_logger()->trace(__VA_ARGS__)
#define NATAL_INFO(...)          ::natal::core::Logger::get_app_logger()->info(__VA_ARGS__)
#define NATAL_WARN(...)          ::natal::core::Logger::get_app_logger()->warn(__VA_ARGS__)
#define NATAL_ERROR(...)         ::natal::core::Logger::get_app_logger()->error(__VA_ARGS__)
#define NATAL_CRITICAL(...)      ::natal::core::Logger::get_app_logger()->critical(__VA_ARGS__)
// NOLINTEND(cppcoreguidelines-macro-usage)
