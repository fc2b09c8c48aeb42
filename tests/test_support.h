#ifndef AUXON_TEST_SUPPORT_H
#define AUXON_TEST_SUPPORT_H

#include <cstdint>
#include <string>
#include <vector>

#include "auxon/audio.h"
#include "auxon/fsk_modem.h"
#include "auxon/profile.h"
#include "auxon/wav_codec.h"

namespace auxon {
namespace test {

inline SampleBuffer signalFor(const std::string& text,
                              TransmissionProfile profile = TransmissionProfile::AudibleFastest) {
    return fskEncode(text, profileParams(profile));
}

inline std::vector<std::uint8_t> wavFor(const SampleBuffer& samples, int sampleRate = kSampleRate) {
    std::vector<std::uint8_t> out;
    encodeWav(samples, sampleRate, kBitsPerSample, out);
    return out;
}

inline std::string asString(const std::vector<std::uint8_t>& bytes) {
    return std::string(bytes.begin(), bytes.end());
}

} // namespace test
} // namespace auxon

#endif // AUXON_TEST_SUPPORT_H
