// =============================================================================
// sendstream-upgrade - Logger Module
// =============================================================================
// Low-latency asynchronous logging using the Quill library.
//
// One process-wide logger with console and optional file output.
// Worker threads log through the same frontend; Quill queues are per thread.
//
// Usage:
//   ssu::log::init("upgrade.log", ssu::log::Level::kInfo);
//   SSU_LOG_INFO("Spawned {} constructors", count);
//
// The SSU_LOG_* macros are no-ops until init() has been called, so library
// code and unit tests can log unconditionally.
// =============================================================================

#ifndef SSU_COMMON_LOGGER_H
#define SSU_COMMON_LOGGER_H

#include <string>
#include <string_view>

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>

namespace ssu::log {

// =============================================================================
// Log Level Enumeration
// =============================================================================

/// @brief Log level enumeration matching Quill's log levels.
enum class Level {
    kTrace = 0,
    kDebug,
    kInfo,
    kWarning,
    kError,
    kCritical
};

// =============================================================================
// Logger Configuration
// =============================================================================

/// @brief Configuration options for logger initialization.
struct Config {
    /// @brief Log file path. Empty string disables file logging.
    std::string logFile;

    /// @brief Minimum log level to output.
    Level level = Level::kInfo;

    /// @brief Enable console output.
    /// @note Must be off when the upgraded stream is written to stdout.
    bool enableConsole = true;

    /// @brief Logger name for identification.
    std::string loggerName = "ssu";
};

// =============================================================================
// Logger Initialization and Access
// =============================================================================

/// @brief Initialize the global logger with the specified configuration.
/// @note Called once from main() before any worker thread is spawned.
void init(const Config& config);

/// @brief Initialize the global logger with default settings.
void init(std::string_view logFile = "", Level level = Level::kInfo);

/// @brief Get the global logger instance.
/// @return Pointer to the global Quill logger, nullptr before init().
[[nodiscard]] quill::Logger* logger() noexcept;

[[nodiscard]] bool isInitialized() noexcept;

/// @brief Flush all pending log messages.
void flush();

/// @brief Flush pending messages and stop the backend thread.
void shutdown();

// =============================================================================
// Level Conversion Utilities
// =============================================================================

[[nodiscard]] quill::LogLevel toQuillLevel(Level level) noexcept;

/// @brief Convert string to log level (case-insensitive).
/// @return Corresponding log level, kInfo for unknown strings.
[[nodiscard]] Level levelFromString(std::string_view levelStr) noexcept;

[[nodiscard]] std::string_view levelToString(Level level) noexcept;

}  // namespace ssu::log

// =============================================================================
// Convenience Macros
// =============================================================================

#define SSU_LOG_IMPL(quillMacro, fmt, ...)                                  \
    do {                                                                    \
        if (quill::Logger* ssuLogger = ::ssu::log::logger()) {              \
            quillMacro(ssuLogger, fmt __VA_OPT__(, ) __VA_ARGS__);          \
        }                                                                   \
    } while (false)

/// @brief Log a trace message.
#define SSU_LOG_TRACE(fmt, ...) SSU_LOG_IMPL(LOG_TRACE_L1, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a debug message.
#define SSU_LOG_DEBUG(fmt, ...) SSU_LOG_IMPL(LOG_DEBUG, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log an info message.
#define SSU_LOG_INFO(fmt, ...) SSU_LOG_IMPL(LOG_INFO, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a warning message.
#define SSU_LOG_WARNING(fmt, ...) SSU_LOG_IMPL(LOG_WARNING, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log an error message.
#define SSU_LOG_ERROR(fmt, ...) SSU_LOG_IMPL(LOG_ERROR, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a critical message.
#define SSU_LOG_CRITICAL(fmt, ...) SSU_LOG_IMPL(LOG_CRITICAL, fmt __VA_OPT__(, ) __VA_ARGS__)

#endif  // SSU_COMMON_LOGGER_H
