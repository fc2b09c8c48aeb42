#include "auxon/wav_codec.h"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <string>
#include <utility>

#include <fmt/format.h>

namespace auxon {

namespace {

constexpr std::uint16_t kFormatPcm = 1;
constexpr std::uint16_t kFormatFloat = 3;
constexpr std::uint16_t kFormatExtensible = 0xFFFE;

bool supportedDepth(int bits) {
    return bits == 8 || bits == 16 || bits == 24 || bits == 32;
}

// ----------------------------------
// LITTLE-ENDIAN WRITERS
// ----------------------------------
void put16(std::vector<std::uint8_t>& out, std::uint16_t v) {
    out.push_back(static_cast<std::uint8_t>(v & 0xFF));
    out.push_back(static_cast<std::uint8_t>(v >> 8));
}

void put32(std::vector<std::uint8_t>& out, std::uint32_t v) {
    for (int i = 0; i < 4; ++i) {
        out.push_back(static_cast<std::uint8_t>((v >> (8 * i)) & 0xFF));
    }
}

void putTag(std::vector<std::uint8_t>& out, const char* tag) {
    out.insert(out.end(), tag, tag + 4);
}

std::uint16_t get16(const std::uint8_t* p) {
    return static_cast<std::uint16_t>(p[0] | (p[1] << 8));
}

std::uint32_t get32(const std::uint8_t* p) {
    return static_cast<std::uint32_t>(p[0]) | (static_cast<std::uint32_t>(p[1]) << 8) |
           (static_cast<std::uint32_t>(p[2]) << 16) | (static_cast<std::uint32_t>(p[3]) << 24);
}

std::int16_t readSample(const std::uint8_t* p, std::uint16_t format, int bits) {
    if (format == kFormatFloat) {
        std::uint32_t raw = get32(p);
        float f;
        std::memcpy(&f, &raw, sizeof(f));
        if (std::isnan(f)) return 0;
        double v = std::round(std::clamp(static_cast<double>(f), -1.0, 1.0) * 32767.0);
        return static_cast<std::int16_t>(v);
    }

    switch (bits) {
        case 8:
            return static_cast<std::int16_t>((static_cast<int>(p[0]) - 128) * 256);
        case 16:
            return static_cast<std::int16_t>(get16(p));
        case 24:
            // top 16 bits of the 24-bit sample
            return static_cast<std::int16_t>(get16(p + 1));
        default:
            return static_cast<std::int16_t>(get16(p + 2));
    }
}

} // namespace

// ----------------------------------
// WAV WRITER
// ----------------------------------
Status encodeWav(const SampleBuffer& samples, int sampleRate, int bitDepth,
                 std::vector<std::uint8_t>& out) {
    if (sampleRate <= 0) {
        return Status::failure(ErrorKind::InvalidArgument,
                               fmt::format("invalid sample rate {}", sampleRate));
    }
    if (!supportedDepth(bitDepth)) {
        return Status::failure(ErrorKind::InvalidArgument,
                               fmt::format("unsupported bit depth {}", bitDepth));
    }

    const std::uint16_t numChannels = 1;
    const std::uint16_t blockAlign = numChannels * bitDepth / 8;
    const std::uint32_t byteRate = static_cast<std::uint32_t>(sampleRate) * blockAlign;
    const std::uint32_t dataSize = static_cast<std::uint32_t>(samples.size() * blockAlign);

    out.clear();
    out.reserve(kWavHeaderSize + dataSize);

    putTag(out, "RIFF");
    put32(out, 36 + dataSize);
    putTag(out, "WAVE");

    putTag(out, "fmt ");
    put32(out, 16);
    put16(out, kFormatPcm);
    put16(out, numChannels);
    put32(out, static_cast<std::uint32_t>(sampleRate));
    put32(out, byteRate);
    put16(out, blockAlign);
    put16(out, static_cast<std::uint16_t>(bitDepth));

    putTag(out, "data");
    put32(out, dataSize);

    for (std::int16_t s : samples) {
        switch (bitDepth) {
            case 8:
                out.push_back(static_cast<std::uint8_t>((s >> 8) + 128));
                break;
            case 16:
                put16(out, static_cast<std::uint16_t>(s));
                break;
            case 24:
                out.push_back(0);
                put16(out, static_cast<std::uint16_t>(s));
                break;
            default:
                put16(out, 0);
                put16(out, static_cast<std::uint16_t>(s));
                break;
        }
    }

    return Status::success();
}

// ----------------------------------
// WAV LOADER
// ----------------------------------
Status decodeWav(const std::uint8_t* data, std::size_t size, WavData& out) {
    auto malformed = [](std::string detail) {
        return Status::failure(ErrorKind::MalformedContainer, std::move(detail));
    };

    if (size < 12) {
        return malformed("WAV header is truncated");
    }
    if (std::memcmp(data, "RIFF", 4) != 0) {
        return malformed("Not a RIFF file");
    }
    if (std::memcmp(data + 8, "WAVE", 4) != 0) {
        return malformed("Not a WAVE file");
    }

    bool fmtFound = false;
    bool dataFound = false;
    const std::uint8_t* sampleData = nullptr;
    std::uint32_t dataSize = 0;
    std::uint16_t audioFormat = 0;
    std::uint16_t numChannels = 0;
    std::uint32_t sampleRate = 0;
    std::uint16_t blockAlign = 0;
    std::uint16_t bitsPerSample = 0;

    std::size_t pos = 12;
    while (pos + 8 <= size && !dataFound) {
        const std::uint8_t* header = data + pos;
        std::uint32_t chunkSize = get32(header + 4);
        pos += 8;
        std::size_t remaining = size - pos;

        if (std::memcmp(header, "fmt ", 4) == 0) {
            if (chunkSize < 16 || chunkSize > remaining) {
                return malformed("WAV fmt chunk is truncated");
            }
            const std::uint8_t* body = data + pos;
            audioFormat = get16(body);
            numChannels = get16(body + 2);
            sampleRate = get32(body + 4);
            blockAlign = get16(body + 12);
            bitsPerSample = get16(body + 14);

            if (audioFormat == kFormatExtensible) {
                // cbSize(2) validBits(2) channelMask(4) then the sub-format GUID,
                // whose first two bytes carry the real format tag
                if (chunkSize < 40) {
                    return malformed("WAV extensible fmt chunk is truncated");
                }
                audioFormat = get16(body + 24);
            }
            fmtFound = true;
        } else if (std::memcmp(header, "data", 4) == 0) {
            if (!fmtFound) {
                return malformed("Invalid WAV: data chunk before fmt chunk");
            }
            if (chunkSize > remaining) {
                return malformed(fmt::format("WAV data chunk declares {} bytes but only {} remain",
                                             chunkSize, remaining));
            }
            sampleData = data + pos;
            dataSize = chunkSize;
            dataFound = true;
            break;
        }

        // unknown chunks are skipped; odd sizes carry a pad byte
        std::size_t skip = static_cast<std::size_t>(chunkSize) + (chunkSize & 1u);
        if (skip > remaining) {
            pos = size;
            break;
        }
        pos += skip;
    }

    if (!fmtFound || !dataFound) {
        return malformed("Invalid WAV: missing fmt or data chunk");
    }

    if (audioFormat != kFormatPcm && audioFormat != kFormatFloat) {
        return malformed(fmt::format("Unsupported WAV format tag {}", audioFormat));
    }
    if (numChannels != 1) {
        return Status::failure(ErrorKind::UnsupportedChannelLayout,
                               fmt::format("Only mono WAV supported, got {} channels", numChannels));
    }
    if (audioFormat == kFormatFloat ? bitsPerSample != 32 : !supportedDepth(bitsPerSample)) {
        return malformed(fmt::format("Unsupported bit depth {}", bitsPerSample));
    }
    if (blockAlign != bitsPerSample / 8) {
        return malformed(fmt::format("Invalid block alignment {}", blockAlign));
    }
    if (sampleRate < static_cast<std::uint32_t>(kSampleRateMin) ||
        sampleRate > static_cast<std::uint32_t>(kSampleRateMax)) {
        return malformed(fmt::format("Unsupported sample rate {} Hz", sampleRate));
    }

    const std::size_t numSamples = dataSize / blockAlign;
    out.samples.resize(numSamples);
    for (std::size_t i = 0; i < numSamples; ++i) {
        out.samples[i] = readSample(sampleData + i * blockAlign, audioFormat, bitsPerSample);
    }

    out.sampleRate = static_cast<int>(sampleRate);
    return Status::success();
}

} // namespace auxon
