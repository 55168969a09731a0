// =============================================================================
// guidfix - Logger Module
// =============================================================================
// One process-wide Quill logger for the guidfix CLI. Messages go to the
// console and, with --log-file, to a file as well. TBB workers in
// processGuidColumn log through the same logger.
//
// The identifier codec and resolver never log. Library code that does log
// (table processing, shared-parameter generation) goes through the
// GUIDFIX_LOG_* macros, which are no-ops until init() has been called.
//
// Usage:
//   guidfix::log::Config config;
//   config.level = guidfix::log::levelFromVerbosity(verbosity, quiet);
//   guidfix::log::init(config);
//   GUIDFIX_LOG_INFO("Resolved {} of {} identifiers", resolved, rows);
// =============================================================================

#ifndef GUIDFIX_COMMON_LOGGER_H
#define GUIDFIX_COMMON_LOGGER_H

#include <string>
#include <string_view>

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>

namespace guidfix::log {

// =============================================================================
// Levels
// =============================================================================

enum class Level {
    kTrace = 0,
    kDebug,
    kInfo,
    kWarning,
    kError,
    kCritical
};

/// @brief Level selected by the command-line verbosity flags.
/// @param verbosity Number of -v flags (1 = debug, 2+ = trace).
/// @param quiet -q given; wins over any -v.
[[nodiscard]] Level levelFromVerbosity(int verbosity, bool quiet) noexcept;

/// @brief Map to Quill's level.
[[nodiscard]] quill::LogLevel toQuillLevel(Level level) noexcept;

// =============================================================================
// Logger Configuration
// =============================================================================

struct Config {
    /// @brief Additional log file, truncated on open. Empty disables it.
    std::string logFile;

    Level level = Level::kInfo;

    /// @brief Write to the console. Without a log file the console is used anyway.
    bool enableConsole = true;

    std::string loggerName = "guidfix";
};

// =============================================================================
// Lifecycle
// =============================================================================

/// @brief Start the backend and create the logger.
/// @note Called once from main() before any worker threads start.
///       Later calls are ignored until shutdown().
void init(const Config& config);

/// @brief The logger, nullptr before init().
[[nodiscard]] quill::Logger* logger() noexcept;

[[nodiscard]] bool isInitialized() noexcept;

/// @brief Block until queued messages reach the sinks.
void flush();

/// @brief Flush and stop the logging backend.
void shutdown();

}  // namespace guidfix::log

// =============================================================================
// Convenience Macros
// =============================================================================
// These macros provide a convenient interface for logging with automatic
// source location information. They skip the call entirely while the logger
// is uninitialized (unit tests, library use without the CLI).

#define GUIDFIX_LOG_IMPL(MACRO, fmt, ...)                                        \
    do {                                                                         \
        if (::guidfix::log::isInitialized()) {                                   \
            MACRO(::guidfix::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__);     \
        }                                                                        \
    } while (false)

/// @brief Log a trace message.
#define GUIDFIX_LOG_TRACE(fmt, ...) GUIDFIX_LOG_IMPL(LOG_TRACE_L1, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a debug message.
#define GUIDFIX_LOG_DEBUG(fmt, ...) GUIDFIX_LOG_IMPL(LOG_DEBUG, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log an info message.
#define GUIDFIX_LOG_INFO(fmt, ...) GUIDFIX_LOG_IMPL(LOG_INFO, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a warning message.
#define GUIDFIX_LOG_WARNING(fmt, ...) GUIDFIX_LOG_IMPL(LOG_WARNING, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log an error message.
#define GUIDFIX_LOG_ERROR(fmt, ...) GUIDFIX_LOG_IMPL(LOG_ERROR, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a critical message.
#define GUIDFIX_LOG_CRITICAL(fmt, ...) \
    GUIDFIX_LOG_IMPL(LOG_CRITICAL, fmt __VA_OPT__(, ) __VA_ARGS__)

#endif  // GUIDFIX_COMMON_LOGGER_H
