#ifndef AUXON_LOG_H
#define AUXON_LOG_H

#include <string>
#include <utility>

#include <fmt/format.h>

namespace auxon {

enum class LogLevel { Debug = 0, Info, Warn, Error, Off };

void setLogLevel(LogLevel level);
LogLevel logLevel();

// Accepts "debug", "info", "warn", "error", "off". Returns false on anything else.
bool parseLogLevel(const std::string& name, LogLevel& out);

// Writes one timestamped line to stderr.
void writeLogLine(LogLevel level, const std::string& message);

template <typename... Args>
void logAt(LogLevel level, fmt::format_string<Args...> format, Args&&... args) {
    if (level < logLevel()) return;
    writeLogLine(level, fmt::format(format, std::forward<Args>(args)...));
}

template <typename... Args>
void logDebug(fmt::format_string<Args...> format, Args&&... args) {
    logAt(LogLevel::Debug, format, std::forward<Args>(args)...);
}

template <typename... Args>
void logInfo(fmt::format_string<Args...> format, Args&&... args) {
    logAt(LogLevel::Info, format, std::forward<Args>(args)...);
}

template <typename... Args>
void logWarn(fmt::format_string<Args...> format, Args&&... args) {
    logAt(LogLevel::Warn, format, std::forward<Args>(args)...);
}

template <typename... Args>
void logError(fmt::format_string<Args...> format, Args&&... args) {
    logAt(LogLevel::Error, format, std::forward<Args>(args)...);
}

} // namespace auxon

#endif // AUXON_LOG_H
