#include "auxon/profile.h"

#include <cmath>

#include "auxon/audio.h"

namespace auxon {

// Tones sit on exact FFT bins: each frequency is a multiple of
// kSampleRate / samplesPerBit.
const std::vector<ProfileParams>& allProfiles() {
    static const std::vector<ProfileParams> profiles = {
        {TransmissionProfile::AudibleNormal,     "audible_normal",     Band::Audible,    1800.0,  2400.0,  0.010,  256},
        {TransmissionProfile::AudibleFast,       "audible_fast",       Band::Audible,    2000.0,  3000.0,  0.005,  512},
        {TransmissionProfile::AudibleFastest,    "audible_fastest",    Band::Audible,    2400.0,  4000.0,  0.0025, 1024},
        {TransmissionProfile::UltrasoundNormal,  "ultrasound_normal",  Band::Ultrasound, 18500.0, 19500.0, 0.010,  256},
        {TransmissionProfile::UltrasoundFast,    "ultrasound_fast",    Band::Ultrasound, 18400.0, 19600.0, 0.005,  512},
        {TransmissionProfile::UltrasoundFastest, "ultrasound_fastest", Band::Ultrasound, 18400.0, 19600.0, 0.0025, 1024},
    };
    return profiles;
}

const ProfileParams& profileParams(TransmissionProfile profile) {
    for (const auto& p : allProfiles()) {
        if (p.id == profile) return p;
    }
    return allProfiles().front();
}

bool parseProfile(const std::string& name, TransmissionProfile& out) {
    for (const auto& p : allProfiles()) {
        if (name == p.name) {
            out = p.id;
            return true;
        }
    }
    return false;
}

bool parseBand(const std::string& name, Band& out) {
    if (name == "audible") {
        out = Band::Audible;
        return true;
    }
    if (name == "ultrasound") {
        out = Band::Ultrasound;
        return true;
    }
    return false;
}

const char* bandName(Band band) {
    return band == Band::Audible ? "audible" : "ultrasound";
}

bool selectProfile(std::size_t payloadSize, Band band, TransmissionProfile& out) {
    for (const auto& p : allProfiles()) {
        if (p.band == band && payloadSize <= p.maxPayload) {
            out = p.id;
            return true;
        }
    }
    return false;
}

int samplesPerBit(const ProfileParams& params) {
    return static_cast<int>(std::lround(params.bitDuration * kSampleRate));
}

} // namespace auxon
