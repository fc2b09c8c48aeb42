#include <cstdint>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include <boost/program_options.hpp>

#include "auxon/audio.h"
#include "auxon/fsk_modem.h"
#include "auxon/profile.h"
#include "auxon/version.h"
#include "auxon/wav_codec.h"

// ----------------------------------
// MAIN
// ----------------------------------
int main(int argc, char* argv[])
{
    namespace po = boost::program_options;

    std::string profileName;
    std::string output;

    po::options_description desc("Program options");
    desc.add_options()
        ("help,h", "Print this help message and exit.")
        ("version,V", "Print the application version and exit.")
        ("profile,p", po::value<std::string>(&profileName)->default_value("audible_normal"),
            "transmission profile")
        ("output,o", po::value<std::string>(&output), "write the WAV here instead of STDOUT");

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);
    } catch (std::exception& ex) {
        std::cerr << ex.what() << "\n" << desc << std::endl;
        return 1;
    }

    if (vm.count("help"))
    {
        std::cerr << "Read one line of text from STDIN and write it as FSK audio (WAV)\n" << desc << std::endl;
        return 0;
    }
    if (vm.count("version"))
    {
        std::cerr << argv[0] << ": " << AUXON_VERSION << std::endl;
        return 0;
    }

    auxon::TransmissionProfile profile;
    if (!auxon::parseProfile(profileName, profile))
    {
        std::cerr << "Unknown profile: " << profileName << "\n";
        return 1;
    }

    std::string message;
    std::getline(std::cin, message);

    const auto& params = auxon::profileParams(profile);
    if (message.size() > params.maxPayload)
    {
        std::cerr << "Message is " << message.size() << " bytes; " << params.name
                  << " carries at most " << params.maxPayload << "\n";
        return 1;
    }

    std::cerr << "Encoding: " << message << " (" << params.name << ")\n";

    auxon::SampleBuffer samples = auxon::fskEncode(message, params);

    std::vector<std::uint8_t> wav;
    auxon::Status status = auxon::encodeWav(samples, auxon::kSampleRate, auxon::kBitsPerSample, wav);
    if (!status.ok())
    {
        std::cerr << status.detail << "\n";
        return 1;
    }

    if (output.empty())
    {
        std::cout.write(reinterpret_cast<const char*>(wav.data()), static_cast<std::streamsize>(wav.size()));
        std::cout.flush();
        return std::cout ? 0 : 1;
    }

    std::ofstream file(output, std::ios::binary);
    file.write(reinterpret_cast<const char*>(wav.data()), static_cast<std::streamsize>(wav.size()));
    if (!file)
    {
        std::cerr << "Failed to write " << output << "\n";
        return 1;
    }

    std::cerr << "Saved as " << output << "\n";
    return 0;
}
