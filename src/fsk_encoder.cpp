#include "auxon/fsk_modem.h"

#include <cmath>

namespace auxon {

const char* const kPreambleBits = "10101010";
const char* const kSyncWordBits = "1111000011110000";

namespace {

constexpr double PI = 3.14159265358979323846;

std::string valueToBits(std::uint32_t value, std::size_t count) {
    std::string bits;
    for (std::size_t i = count; i-- > 0;) {
        bits += ((value >> i) & 1) ? '1' : '0';
    }
    return bits;
}

// ----------------------------------
// THIS GENERATES SIN WAVES
// ----------------------------------
void appendSineWave(SampleBuffer& out, double freq, int totalSamples)
{
    for (int i = 0; i < totalSamples; i++)
    {
        double t = static_cast<double>(i) / kSampleRate;
        double s = kToneAmplitude * std::sin(2.0 * PI * freq * t);
        out.push_back(static_cast<std::int16_t>(std::lround(s * 32767)));
    }
}

} // namespace

// ----------------------------------
// CONVERTS TEXT TO A BINARY STRING
// ----------------------------------
std::string textToBits(const std::string& text)
{
    std::string bits;
    bits.reserve(text.size() * 8);
    for (unsigned char c : text)
    {
        for (int i = 7; i >= 0; i--)
        {
            bits += ((c >> i) & 1) ? '1' : '0';
        }
    }
    return bits;
}

// CRC-16/CCITT-FALSE: poly 0x1021, init 0xFFFF
std::uint16_t crc16(const std::string& data)
{
    std::uint16_t crc = 0xFFFF;
    for (unsigned char c : data)
    {
        crc ^= static_cast<std::uint16_t>(c << 8);
        for (int i = 0; i < 8; i++)
        {
            crc = (crc & 0x8000) ? static_cast<std::uint16_t>((crc << 1) ^ 0x1021)
                                 : static_cast<std::uint16_t>(crc << 1);
        }
    }
    return crc;
}

std::string buildFrameBits(const std::string& payload)
{
    std::string bits = kPreambleBits;
    bits += kSyncWordBits;
    bits += valueToBits(static_cast<std::uint32_t>(payload.size()), kLengthBits);
    bits += textToBits(payload);
    bits += valueToBits(crc16(payload), kCrcBits);
    return bits;
}

// ----------------------------------
// FSK ENCODER
// ----------------------------------
SampleBuffer fskEncode(const std::string& payload, const ProfileParams& params)
{
    const std::string bits = buildFrameBits(payload);
    const int n = samplesPerBit(params);

    SampleBuffer waveData;
    waveData.reserve((bits.size() + 2) * n);

    for (char bit : bits)
    {
        double freq = (bit == '1') ? params.f1 : params.f0;
        appendSineWave(waveData, freq, n);
    }

    // tail lets every phase lane complete its last window
    waveData.insert(waveData.end(), 2 * static_cast<std::size_t>(n), 0);

    return waveData;
}

} // namespace auxon
