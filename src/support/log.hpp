//===----------------------------------------------------------------------===//
//
// File: src/support/log.hpp
// Purpose: Simple leveled logging for the audit core, writing timestamped
// messages to stderr with DEBUG/INFO/WARN/ERROR levels and a configurable
// minimum level filter.
//
// Key invariants:
//   - Log levels are ordered: Debug(0) < Info(1) < Warn(2) < Error(3) < Off(4).
//   - Messages below the current minimum level are discarded before formatting.
//   - Output format is: [LEVEL] HH:MM:SS [component] message
//   - The default minimum level is Info.
//
// Ownership/Lifetime:
//   - Log functions do not retain input strings.
//   - The minimum level and sink are process-wide; updates are thread-safe.
//
// Links: src/support/log.cpp
//
//===----------------------------------------------------------------------===//
#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace vigil::support
{

/// Log level constants
enum class LogLevel : int
{
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
    Off = 4,
};

/// @brief Receives fully formatted log lines (without trailing newline).
using LogSink = std::function<void(LogLevel level, std::string_view line)>;

/// @brief Get the current minimum log level.
LogLevel logLevel();

/// @brief Set the minimum log level.
void setLogLevel(LogLevel level);

/// @brief Check if messages at @p level would be emitted.
bool logEnabled(LogLevel level);

/// @brief Replace the output sink; an empty sink restores stderr output.
/// @note The sink runs under the logger lock and must not log itself.
/// @return The previously installed sink.
LogSink setLogSink(LogSink sink);

/// @brief Emit @p message at @p level on behalf of @p component.
void logMessage(LogLevel level, std::string_view component, std::string_view message);

/// @brief Parse a level name ("debug", "info", "warn"/"warning", "error", "off").
/// @return Parsed level, or std::nullopt for unknown spellings.
std::optional<LogLevel> parseLogLevel(std::string_view text);

/// @brief Upper-case label used in formatted lines.
std::string_view logLevelName(LogLevel level);

inline void logDebug(std::string_view component, std::string_view message)
{
    logMessage(LogLevel::Debug, component, message);
}

inline void logInfo(std::string_view component, std::string_view message)
{
    logMessage(LogLevel::Info, component, message);
}

inline void logWarn(std::string_view component, std::string_view message)
{
    logMessage(LogLevel::Warn, component, message);
}

inline void logError(std::string_view component, std::string_view message)
{
    logMessage(LogLevel::Error, component, message);
}

} // namespace vigil::support
