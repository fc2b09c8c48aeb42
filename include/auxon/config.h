#ifndef AUXON_CONFIG_H
#define AUXON_CONFIG_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "auxon/log.h"
#include "auxon/modem_adapter.h"
#include "auxon/pipeline.h"
#include "auxon/profile.h"

namespace auxon {

struct Config {
    std::string address = "0.0.0.0";
    std::uint16_t port = 8000;
    unsigned threads = 4;
    std::size_t modemInstances = 2;
    std::size_t maxPayloadBytes = 256;
    std::size_t maxUploadBytes = 16 * 1024 * 1024;
    std::size_t maxJsonBytes = 64 * 1024;
    unsigned decodeTimeoutMs = 10000;
    unsigned modemWaitMs = 2000;
    Band defaultBand = Band::Audible;
    std::vector<std::string> allowedOrigins{"http://localhost:5173", "http://127.0.0.1:5173"};
    LogLevel logLevel = LogLevel::Info;

    // Command line, then AUXON_* environment variables, then the --config
    // file. Returns nullopt after --help/--version or on invalid input;
    // exitCode tells the caller which.
    static std::optional<Config> parse(int argc, const char* const argv[], int& exitCode);

    PipelineLimits pipelineLimits() const;
    ModemAdapterOptions modemOptions() const;
};

// Comma-separated list, blanks dropped.
std::vector<std::string> splitList(const std::string& value);

} // namespace auxon

#endif // AUXON_CONFIG_H
