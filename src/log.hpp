#pragma once

#include <sstream>
#include <string>
#include <utility>

namespace winnow {

enum class LogLevel { Quiet = 0, Info = 1, Debug = 2, Trace = 3 };

void setLogLevel(LogLevel level);
LogLevel logLevel();

// Writes one complete line to stderr. Concurrent callers never interleave.
void writeLogLine(const std::string& line);

namespace detail {

template <typename... Args>
std::string concat(Args&&... args) {
    std::ostringstream oss;
    (oss << ... << std::forward<Args>(args));
    return oss.str();
}

}  // namespace detail

template <typename... Args>
void logError(Args&&... args) {
    writeLogLine("ERROR: " + detail::concat(std::forward<Args>(args)...));
}

template <typename... Args>
void logWarn(Args&&... args) {
    if (logLevel() >= LogLevel::Info)
        writeLogLine("Warning: " +
                     detail::concat(std::forward<Args>(args)...));
}

template <typename... Args>
void logInfo(Args&&... args) {
    if (logLevel() >= LogLevel::Info)
        writeLogLine(detail::concat(std::forward<Args>(args)...));
}

template <typename... Args>
void logDebug(Args&&... args) {
    if (logLevel() >= LogLevel::Debug)
        writeLogLine(detail::concat(std::forward<Args>(args)...));
}

template <typename... Args>
void logTrace(Args&&... args) {
    if (logLevel() >= LogLevel::Trace)
        writeLogLine(detail::concat(std::forward<Args>(args)...));
}

}  // namespace winnow
