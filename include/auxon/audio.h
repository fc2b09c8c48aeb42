#ifndef AUXON_AUDIO_H
#define AUXON_AUDIO_H

#include <cstdint>
#include <vector>

namespace auxon {

// Operating format shared by the container codec and the modem.
constexpr int kSampleRate = 48000;
constexpr int kBitsPerSample = 16;

// Capture rates accepted before resampling.
constexpr int kSampleRateMin = 1000;
constexpr int kSampleRateMax = 96000;

using SampleBuffer = std::vector<std::int16_t>;

// Linear interpolation from inputRate to outputRate. Returns the input
// unchanged when the rates match.
SampleBuffer resampleLinear(const SampleBuffer& input, int inputRate, int outputRate);

} // namespace auxon

#endif // AUXON_AUDIO_H
