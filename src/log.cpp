#include "auxon/log.h"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>

namespace auxon {

namespace {

std::atomic<LogLevel> gLevel{LogLevel::Info};

const char* levelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info:  return "info";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Error: return "error";
        case LogLevel::Off:   return "off";
    }
    return "?";
}

} // namespace

void setLogLevel(LogLevel level) { gLevel.store(level); }

LogLevel logLevel() { return gLevel.load(); }

bool parseLogLevel(const std::string& name, LogLevel& out) {
    for (auto level : {LogLevel::Debug, LogLevel::Info, LogLevel::Warn, LogLevel::Error, LogLevel::Off}) {
        if (name == levelName(level)) {
            out = level;
            return true;
        }
    }
    return false;
}

void writeLogLine(LogLevel level, const std::string& message) {
    using namespace std::chrono;
    auto now = system_clock::now();
    std::time_t seconds = system_clock::to_time_t(now);
    auto millis = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;

    std::tm tm{};
    localtime_r(&seconds, &tm);
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &tm);

    // single call so concurrent lines do not interleave
    fmt::print(stderr, "{}.{:03d} [{}] {}\n", stamp, static_cast<int>(millis), levelName(level), message);
}

} // namespace auxon
