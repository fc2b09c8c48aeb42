#ifndef AUXON_PROFILE_H
#define AUXON_PROFILE_H

#include <cstddef>
#include <string>
#include <vector>

namespace auxon {

enum class TransmissionProfile {
    AudibleNormal,
    AudibleFast,
    AudibleFastest,
    UltrasoundNormal,
    UltrasoundFast,
    UltrasoundFastest,
};

enum class Band { Audible, Ultrasound };

struct ProfileParams {
    TransmissionProfile id;
    const char* name;
    Band band;
    double f0;              // tone for bit 0 [Hz]
    double f1;              // tone for bit 1 [Hz]
    double bitDuration;     // [s]
    std::size_t maxPayload; // [bytes]
};

// All profiles, most robust first within each band.
const std::vector<ProfileParams>& allProfiles();

const ProfileParams& profileParams(TransmissionProfile profile);

bool parseProfile(const std::string& name, TransmissionProfile& out);
bool parseBand(const std::string& name, Band& out);
const char* bandName(Band band);

// Most robust profile of the band whose ceiling holds payloadSize bytes.
// Returns false if none does.
bool selectProfile(std::size_t payloadSize, Band band, TransmissionProfile& out);

// Samples per bit at the modem sample rate.
int samplesPerBit(const ProfileParams& params);

} // namespace auxon

#endif // AUXON_PROFILE_H
