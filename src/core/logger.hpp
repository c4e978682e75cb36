#pragma once

/// @file logger.hpp
/// @brief Engine and application loggers on top of spdlog.

#include <spdlog/spdlog.h>

#include <filesystem>
#include <memory>

namespace helioport::core
{
    /// @brief Centralized logging facility for Helioport.
    ///
    /// Two named loggers:
    /// - **HELIOPORT** (core): merger, estimator, resolver, cache internals
    /// - **APP**: command-line tool and user-facing messages
    ///
    /// After init() both share a colored console sink and a rotating file sink.
    /// Call init() once from main() before any logging. Library code used
    /// without init() (unit tests, embedding) falls back to console-only loggers.
    class Logger
    {
    public:
        /// @brief Install both loggers on console and file sinks.
        /// @param log_file Path of the rotating log file.
        /// @param level Minimum level for both loggers.
        static void init(const std::filesystem::path& log_file = "helioport.log",
                         spdlog::level::level_enum level = spdlog::level::trace);

        /// @brief Flush and tear down all loggers.
        /// Nothing may log afterwards.
        static void shutdown();

        /// @brief Change the level of both loggers at runtime.
        static void set_level(spdlog::level::level_enum level);

        /// @brief Access the engine-internal logger ("HELIOPORT").
        [[nodiscard]] static std::shared_ptr<spdlog::logger>& get_core_logger();

        /// @brief Access the application-level logger ("APP").
        [[nodiscard]] static std::shared_ptr<spdlog::logger>& get_app_logger();

    private:
        static void init_console_fallback();

        static std::shared_ptr<spdlog::logger> s_core_logger;
        static std::shared_ptr<spdlog::logger> s_app_logger;
    };

} // namespace helioport::core

// -----------------------------------------------------------------
// Core engine log macros
// -----------------------------------------------------------------
// NOLINTBEGIN(cppcoreguidelines-macro-usage)
#define HPT_CORE_TRACE(...)    ::helioport::core::Logger::get_core_logger()->trace(__VA_ARGS__)
#define HPT_CORE_DEBUG(...)    ::helioport::core::Logger::get_core_logger()->debug(__VA_ARGS__)
#define HPT_CORE_INFO(...)     ::helioport::core::Logger::get_core_logger()->info(__VA_ARGS__)
#define HPT_CORE_WARN(...)     ::helioport::core::Logger::get_core_logger()->warn(__VA_ARGS__)
#define HPT_CORE_ERROR(...)    ::helioport::core::Logger::get_core_logger()->error(__VA_ARGS__)
#define HPT_CORE_CRITICAL(...) ::helioport::core::Logger::get_core_logger()->critical(__VA_ARGS__)

// -----------------------------------------------------------------
// Application log macros
// -----------------------------------------------------------------
#define HPT_TRACE(...)         ::helioport::core::Logger::get_app_logger()->trace(__VA_ARGS__)
#define HPT_INFO(...)          ::helioport::core::Logger::get_app_logger()->info(__VA_ARGS__)
#define HPT_WARN(...)          ::helioport::core::Logger::get_app_logger()->warn(__VA_ARGS__)
#define HPT_ERROR(...)         ::helioport::core::Logger::get_app_logger()->error(__VA_ARGS__)
#define HPT_CRITICAL(...)      ::helioport::core::Logger::get_app_logger()->critical(__VA_ARGS__)
// NOLINTEND(cppcoreguidelines-macro-usage)
