#ifndef AUXON_WAV_CODEC_H
#define AUXON_WAV_CODEC_H

#include <cstddef>
#include <cstdint>
#include <vector>

#include "auxon/audio.h"
#include "auxon/status.h"

namespace auxon {

constexpr std::size_t kWavHeaderSize = 44;

struct WavData {
    int sampleRate = 0;
    SampleBuffer samples;
};

// Canonical 44-byte RIFF/WAVE PCM, mono. Supported depths: 8 (unsigned),
// 16, 24 and 32 bits. Fails with InvalidArgument on a zero sample rate or an
// unsupported depth.
Status encodeWav(const SampleBuffer& samples, int sampleRate, int bitDepth,
                 std::vector<std::uint8_t>& out);

// Parses a RIFF/WAVE container held in memory. Unknown chunks are skipped.
// PCM 8/16/24/32-bit and IEEE float 32-bit are converted to 16-bit samples.
Status decodeWav(const std::uint8_t* data, std::size_t size, WavData& out);

inline Status decodeWav(const std::vector<std::uint8_t>& bytes, WavData& out) {
    return decodeWav(bytes.data(), bytes.size(), out);
}

} // namespace auxon

#endif // AUXON_WAV_CODEC_H
