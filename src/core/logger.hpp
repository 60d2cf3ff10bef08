#pragma once

/// @file logger.hpp
/// @brief Dual-logger system wrapping spdlog (pipeline + application loggers).

#include <spdlog/spdlog.h>

#include <memory>

namespace neoplan::core
{
    /// @brief Centralized logging facility for neoplan.
    ///
    /// Provides two separate loggers:
    /// - **NEOPLAN** (core): refresh cycles, providers, deduplication diagnostics
    /// - **APP**: demo output, query rejections, user-facing messages
    ///
    /// Both write to colored console output and a rotating log file.
    /// Call init() once from main() before any logging.
    class Logger
    {
    public:
        /// @brief Initialize both loggers with console + file sinks.
        /// Calling it again while the loggers are alive is a no-op.
        static void init();

        /// @brief Flush and tear down all loggers.
        /// Call once at shutdown after all logging is complete; worker threads
        /// must be joined or quiescent by then.
        static void shutdown();

        /// @brief Access the pipeline-internal logger ("NEOPLAN").
        /// Valid between init() and shutdown() only.
        [[nodiscard]] static std::shared_ptr<spdlog::logger>& get_core_logger();

        /// @brief Access the application-level logger ("APP").
        [[nodiscard]] static std::shared_ptr<spdlog::logger>& get_app_logger();

    private:
        static std::shared_ptr<spdlog::logger> s_core_logger;
        static std::shared_ptr<spdlog::logger> s_app_logger;
    };

} // namespace neoplan::core

// -----------------------------------------------------------------
// Core pipeline log macros
// -----------------------------------------------------------------
// NOLINTBEGIN(cppcoreguidelines-macro-usage)
#define NPL_CORE_TRACE(...)    ::neoplan::core::Logger::get_core_logger()->trace(__VA_ARGS__)
#define NPL_CORE_DEBUG(...)    ::neoplan::core::Logger::get_core_logger()->debug(__VA_ARGS__)
#define NPL_CORE_INFO(...)     ::neoplan::core::Logger::get_core_logger()->info(__VA_ARGS__)
#define NPL_CORE_WARN(...)     ::neoplan::core::Logger::get_core_logger()->warn(__VA_ARGS__)
#define NPL_CORE_ERROR(...)    ::neoplan::core::Logger::get_core_logger()->error(__VA_ARGS__)
#define NPL_CORE_CRITICAL(...) ::neoplan::core::Logger::get_core_logger()->critical(__VA_ARGS__)

// -----------------------------------------------------------------
// Application log macros
// -----------------------------------------------------------------
#define NPL_TRACE(...)         ::neoplan::core::Logger::get_app_logger()->trace(__VA_ARGS__)
#define NPL_INFO(...)          ::neoplan::core::Logger::get_app_logger()->info(__VA_ARGS__)
#define NPL_WARN(...)          ::neoplan::core::Logger::get_app_logger()->warn(__VA_ARGS__)
#define NPL_ERROR(...)         ::neoplan::core::Logger::get_app_logger()->error(__VA_ARGS__)
#define NPL_CRITICAL(...)      ::neoplan::core::Logger::get_app_logger()->critical(__VA_ARGS__)
// NOLINTEND(cppcoreguidelines-macro-usage)
