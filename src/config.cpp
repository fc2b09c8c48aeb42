#include "auxon/config.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <string>

#include <boost/program_options.hpp>

#include "auxon/version.h"

namespace auxon {

namespace po = boost::program_options;

std::vector<std::string> splitList(const std::string& value) {
    std::vector<std::string> items;
    std::size_t start = 0;
    while (start <= value.size()) {
        std::size_t comma = value.find(',', start);
        if (comma == std::string::npos) comma = value.size();

        std::string item = value.substr(start, comma - start);
        auto notSpace = [](unsigned char c) { return !std::isspace(c); };
        item.erase(item.begin(), std::find_if(item.begin(), item.end(), notSpace));
        item.erase(std::find_if(item.rbegin(), item.rend(), notSpace).base(), item.end());
        if (!item.empty()) items.push_back(item);

        start = comma + 1;
    }
    return items;
}

std::optional<Config> Config::parse(int argc, const char* const argv[], int& exitCode) {
    Config result;
    exitCode = 0;

    std::string configFile;
    std::string band = bandName(result.defaultBand);
    std::string origins = "http://localhost:5173,http://127.0.0.1:5173";
    std::string level = "info";

    po::options_description generic("Program options");
    generic.add_options()
        ("help,h", "Print this help message and exit.")
        ("version,V", "Print the application version and exit.")
        ("config,c", po::value<std::string>(&configFile), "read options from this file");

    po::options_description settings("Gateway settings");
    settings.add_options()
        ("address", po::value<std::string>(&result.address)->default_value(result.address),
            "address to listen on")
        ("port,p", po::value<std::uint16_t>(&result.port)->default_value(result.port),
            "TCP port to listen on")
        ("threads,t", po::value<unsigned>(&result.threads)->default_value(result.threads),
            "worker threads serving connections")
        ("modem-instances", po::value<std::size_t>(&result.modemInstances)->default_value(result.modemInstances),
            "independent modem instances in the pool")
        ("max-payload-bytes", po::value<std::size_t>(&result.maxPayloadBytes)->default_value(result.maxPayloadBytes),
            "largest text accepted by /encode")
        ("max-upload-bytes", po::value<std::size_t>(&result.maxUploadBytes)->default_value(result.maxUploadBytes),
            "largest WAV upload accepted by /decode")
        ("max-json-bytes", po::value<std::size_t>(&result.maxJsonBytes)->default_value(result.maxJsonBytes),
            "largest JSON body accepted by /encode")
        ("decode-timeout-ms", po::value<unsigned>(&result.decodeTimeoutMs)->default_value(result.decodeTimeoutMs),
            "time limit for one demodulation")
        ("modem-wait-ms", po::value<unsigned>(&result.modemWaitMs)->default_value(result.modemWaitMs),
            "how long a request waits for a free modem instance")
        ("default-band", po::value<std::string>(&band)->default_value(band),
            "profile band used when a request names no profile (audible|ultrasound)")
        ("allowed-origins", po::value<std::string>(&origins)->default_value(origins),
            "comma-separated CORS origins, * for any")
        ("log-level", po::value<std::string>(&level)->default_value(level),
            "debug, info, warn, error or off");

    po::options_description all;
    all.add(generic).add(settings);

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, all), vm);

        // AUXON_MAX_UPLOAD_BYTES -> max-upload-bytes
        po::store(po::parse_environment(settings, [&settings](const std::string& var) -> std::string {
            const std::string prefix = "AUXON_";
            if (var.compare(0, prefix.size(), prefix) != 0) return "";
            std::string name = var.substr(prefix.size());
            std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) {
                return c == '_' ? '-' : static_cast<char>(std::tolower(c));
            });
            return settings.find_nothrow(name, false) ? name : "";
        }), vm);

        if (vm.count("help")) {
            std::cout << "Serve text-to-audio encoding and audio-to-text decoding over HTTP\n"
                      << all << std::endl;
            return std::nullopt;
        }

        if (vm.count("version")) {
            std::cout << argv[0] << ": " << AUXON_VERSION << std::endl;
            return std::nullopt;
        }

        if (vm.count("config")) {
            const std::string path = vm["config"].as<std::string>();
            std::ifstream file(path);
            if (!file) {
                std::cerr << "Failed to open config file: " << path << std::endl;
                exitCode = 1;
                return std::nullopt;
            }
            po::store(po::parse_config_file(file, settings), vm);
        }

        po::notify(vm);
    } catch (std::exception& ex) {
        std::cerr << ex.what() << std::endl;
        std::cerr << all << std::endl;
        exitCode = 1;
        return std::nullopt;
    }

    auto invalid = [&exitCode](const std::string& message) -> std::optional<Config> {
        std::cerr << message << std::endl;
        exitCode = 1;
        return std::nullopt;
    };

    if (result.port == 0) return invalid("Port must be nonzero.");
    if (result.threads == 0) return invalid("At least one worker thread is required.");
    if (result.modemInstances == 0) return invalid("At least one modem instance is required.");
    if (result.maxPayloadBytes > kMaxFramePayload) {
        return invalid("max-payload-bytes cannot exceed " + std::to_string(kMaxFramePayload) + ".");
    }
    if (!parseBand(band, result.defaultBand)) return invalid("Unknown band: " + band);
    if (!parseLogLevel(level, result.logLevel)) return invalid("Unknown log level: " + level);
    result.allowedOrigins = splitList(origins);

    return result;
}

PipelineLimits Config::pipelineLimits() const {
    PipelineLimits limits;
    limits.maxPayloadBytes = maxPayloadBytes;
    limits.maxUploadBytes = maxUploadBytes;
    limits.defaultBand = defaultBand;
    return limits;
}

ModemAdapterOptions Config::modemOptions() const {
    ModemAdapterOptions options;
    options.instances = modemInstances;
    options.maxPayload = maxPayloadBytes;
    options.waitTimeout = std::chrono::milliseconds(modemWaitMs);
    options.decodeTimeout = std::chrono::milliseconds(decodeTimeoutMs);
    return options;
}

} // namespace auxon
