#ifndef AUXON_FSK_MODEM_H
#define AUXON_FSK_MODEM_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "auxon/audio.h"
#include "auxon/profile.h"

namespace auxon {

// ----------------------------------
// FRAME LAYOUT
// ----------------------------------
// preamble | sync word | 16-bit length | payload | CRC-16/CCITT-FALSE
// All fields MSB first.
extern const char* const kPreambleBits;
extern const char* const kSyncWordBits;
constexpr std::size_t kLengthBits = 16;
constexpr std::size_t kCrcBits = 16;
constexpr std::size_t kMaxFramePayload = 65535;
constexpr double kToneAmplitude = 0.5;

std::string textToBits(const std::string& text);
std::string bitsToText(const std::string& bits);
std::uint32_t bitsToValue(const std::string& bits, std::size_t pos, std::size_t count);
std::uint16_t crc16(const std::string& data);

// Full bit sequence for one frame carrying payload.
std::string buildFrameBits(const std::string& payload);

// Modulates one frame followed by two bit-durations of silence.
SampleBuffer fskEncode(const std::string& payload, const ProfileParams& params);

// ----------------------------------
// FSK DECODER
// ----------------------------------
// Incremental demodulator. Samples are accumulated across feed() calls; every
// profile is sliced by four phase-offset lanes that each search their own
// bitstream for a complete, CRC-valid frame. Not thread-safe.
class FskDecoder {
public:
    explicit FskDecoder(std::size_t maxPayload = kMaxFramePayload);
    ~FskDecoder();

    FskDecoder(const FskDecoder&) = delete;
    FskDecoder& operator=(const FskDecoder&) = delete;

    // Returns the payload of the first valid frame completed by these samples.
    std::optional<std::string> feed(const std::int16_t* samples, std::size_t count);

    void reset();

    // Total samples passed to feed() since construction or the last reset().
    std::size_t samplesFed() const { return base_ + buffer_.size(); }

private:
    struct Detector;

    void trimBuffer();

    std::size_t maxPayload_;
    std::size_t base_ = 0; // absolute index of buffer_[0]
    SampleBuffer buffer_;
    std::vector<std::unique_ptr<Detector>> detectors_;
};

// ----------------------------------
// FSK MODEM
// ----------------------------------
// One modem instance: a stateless modulator plus one decoder state.
class FskModem {
public:
    explicit FskModem(std::size_t maxPayload = kMaxFramePayload) : decoder_(maxPayload) {}

    SampleBuffer modulate(const std::string& payload, TransmissionProfile profile) const {
        return fskEncode(payload, profileParams(profile));
    }

    std::optional<std::string> feed(const std::int16_t* samples, std::size_t count) {
        return decoder_.feed(samples, count);
    }

    void reset() { decoder_.reset(); }

private:
    FskDecoder decoder_;
};

} // namespace auxon

#endif // AUXON_FSK_MODEM_H
