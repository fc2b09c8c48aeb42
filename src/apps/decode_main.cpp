#include <cstdint>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

#include "auxon/audio.h"
#include "auxon/fsk_modem.h"
#include "auxon/wav_codec.h"

// ----------------------
// MAIN DECODER
// ----------------------
int main(int argc, char* argv[]) {
    if (argc != 2) {
        std::cerr << "usage: " << argv[0] << " FILE.wav\n";
        return 1;
    }

    const std::string inputFile = argv[1];
    std::ifstream file(inputFile, std::ios::binary);
    if (!file) {
        std::cerr << "Failed to open WAV file: " << inputFile << "\n";
        return 1;
    }
    std::vector<std::uint8_t> bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

    auxon::WavData wav;
    auxon::Status status = auxon::decodeWav(bytes, wav);
    if (!status.ok()) {
        std::cerr << status.detail << "\n";
        return 1;
    }

    std::cerr << "Loaded WAV with " << wav.samples.size() << " samples.\n";
    std::cerr << "Sample rate: " << wav.sampleRate << " Hz\n";

    auxon::SampleBuffer samples = auxon::resampleLinear(wav.samples, wav.sampleRate, auxon::kSampleRate);

    auxon::FskDecoder decoder;
    auto message = decoder.feed(samples.data(), samples.size());
    if (!message) {
        std::cerr << "SYNC WORD NOT FOUND – noise or bad signal.\n";
        return 1;
    }

    std::cout << "Decoded message with length " << message->size() << ": '" << *message << "'\n";
    return 0;
}
