// =============================================================================
// remio - Logger Module
// =============================================================================
// Low-latency asynchronous logging using Quill library.
//
// This module provides a global logger instance with support for:
// - Multiple log levels (trace, debug, info, warning, error, critical)
// - Console and file output
// - Thread-safe logging from pool threads (Quill is inherently thread-safe)
//
// The library logs before the host application has configured anything, so
// logger() installs a console logger on first use. The default level is read
// from REMIO_LOG_LEVEL and falls back to warning.
//
// Usage:
//   remio::log::init("remio.log", remio::log::Level::kInfo);
//   REMIO_LOG_INFO("opened {} ({} bytes)", name, size);
// =============================================================================

#ifndef REMIO_COMMON_LOGGER_H
#define REMIO_COMMON_LOGGER_H

#include <string>
#include <string_view>

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>

namespace remio::log {

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
    Level level = Level::kWarning;

    /// @brief Enable console (stdout) output.
    bool enableConsole = true;

    /// @brief Logger name for identification.
    std::string loggerName = "remio";
};

// =============================================================================
// Logger Initialization and Access
// =============================================================================

/// @brief Initialize the global logger with the specified configuration.
/// @note A second call only adjusts the log level.
void init(const Config& config);

/// @brief Initialize the global logger with default settings.
/// @param logFile Path to log file. Empty string disables file logging.
/// @param level Minimum log level to output.
void init(std::string_view logFile, Level level);

/// @brief Get the global logger instance, initializing defaults if needed.
[[nodiscard]] quill::Logger* logger();

/// @brief Check if the logger has been initialized.
[[nodiscard]] bool isInitialized() noexcept;

/// @brief Change the minimum level of the global logger.
void setLevel(Level level);

/// @brief Flush all pending log messages.
void flush();

/// @brief Shutdown the logging system.
void shutdown();

// =============================================================================
// Level Conversion Utilities
// =============================================================================

[[nodiscard]] quill::LogLevel toQuillLevel(Level level) noexcept;

/// @brief Convert string to log level (case-insensitive, defaults to kInfo).
[[nodiscard]] Level levelFromString(std::string_view levelStr) noexcept;

[[nodiscard]] std::string_view levelToString(Level level) noexcept;

/// @brief Level taken from REMIO_LOG_LEVEL, or kWarning when unset.
[[nodiscard]] Level levelFromEnvironment() noexcept;

}  // namespace remio::log

// =============================================================================
// Convenience Macros
// =============================================================================

#define REMIO_LOG_TRACE(fmt, ...) \
    LOG_TRACE_L1(remio::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define REMIO_LOG_DEBUG(fmt, ...) \
    LOG_DEBUG(remio::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define REMIO_LOG_INFO(fmt, ...) \
    LOG_INFO(remio::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define REMIO_LOG_WARNING(fmt, ...) \
    LOG_WARNING(remio::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define REMIO_LOG_ERROR(fmt, ...) \
    LOG_ERROR(remio::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define REMIO_LOG_CRITICAL(fmt, ...) \
    LOG_CRITICAL(remio::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#endif  // REMIO_COMMON_LOGGER_H
