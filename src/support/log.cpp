//===----------------------------------------------------------------------===//
//
// Part of the Vigil project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/support/log.cpp
// Purpose: Implements the leveled logger declared in support/log.hpp.
// Key invariants: Level checks are lock-free; sink replacement and emission
//                 are serialised so lines never interleave.
// Ownership/Lifetime: The sink is owned by the logger until replaced.
// Links: src/support/log.hpp
//
//===----------------------------------------------------------------------===//

#include "support/log.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <mutex>
#include <utility>

namespace vigil::support
{
namespace
{
std::atomic<int> &levelStorage()
{
    static std::atomic<int> level{static_cast<int>(LogLevel::Info)};
    return level;
}

std::mutex &sinkMutex()
{
    static std::mutex mtx;
    return mtx;
}

LogSink &sinkStorage()
{
    static LogSink sink;
    return sink;
}

/// @brief Format the wall-clock time as HH:MM:SS.
std::string timestamp()
{
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm parts{};
#if defined(_WIN32)
    localtime_s(&parts, &now);
#else
    localtime_r(&now, &parts);
#endif
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%02d:%02d:%02d", parts.tm_hour, parts.tm_min, parts.tm_sec);
    return buf;
}
} // namespace

LogLevel logLevel()
{
    return static_cast<LogLevel>(levelStorage().load(std::memory_order_relaxed));
}

void setLogLevel(LogLevel level)
{
    levelStorage().store(static_cast<int>(level), std::memory_order_relaxed);
}

bool logEnabled(LogLevel level)
{
    return level != LogLevel::Off && static_cast<int>(level) >= static_cast<int>(logLevel());
}

LogSink setLogSink(LogSink sink)
{
    std::lock_guard<std::mutex> lock(sinkMutex());
    return std::exchange(sinkStorage(), std::move(sink));
}

std::string_view logLevelName(LogLevel level)
{
    switch (level)
    {
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Warn:
            return "WARN";
        case LogLevel::Error:
            return "ERROR";
        case LogLevel::Off:
            return "OFF";
    }
    return "INFO";
}

/// @brief Format and emit one log line.
///
/// @details The level filter runs before any formatting so disabled levels
///          cost one relaxed atomic load.  Lines go to the installed sink or,
///          when none is installed, to stderr followed by a newline.
void logMessage(LogLevel level, std::string_view component, std::string_view message)
{
    if (!logEnabled(level))
        return;

    std::string line;
    line.reserve(message.size() + component.size() + 24);
    line += '[';
    line += logLevelName(level);
    line += "] ";
    line += timestamp();
    if (!component.empty())
    {
        line += " [";
        line += component;
        line += ']';
    }
    line += ' ';
    line += message;

    std::lock_guard<std::mutex> lock(sinkMutex());
    if (const LogSink &sink = sinkStorage())
    {
        sink(level, line);
        return;
    }
    std::fprintf(stderr, "%s\n", line.c_str());
}

std::optional<LogLevel> parseLogLevel(std::string_view text)
{
    std::string lowered(text);
    std::transform(lowered.begin(),
                   lowered.end(),
                   lowered.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });

    if (lowered == "debug")
        return LogLevel::Debug;
    if (lowered == "info")
        return LogLevel::Info;
    if (lowered == "warn" || lowered == "warning")
        return LogLevel::Warn;
    if (lowered == "error")
        return LogLevel::Error;
    if (lowered == "off" || lowered == "none")
        return LogLevel::Off;
    return std::nullopt;
}

} // namespace vigil::support
