#include "auxon/fsk_modem.h"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <stdexcept>
#include <type_traits>

#include "kiss_fft.h"

namespace auxon {

namespace {

constexpr double PI = 3.14159265358979323846;
constexpr int kLanes = 4;

// Windows whose stronger tone is below this fraction of the window length
// are treated as silence.
constexpr double kEnergyFloor = 0.002;

struct FftConfigDeleter {
    void operator()(kiss_fft_cfg cfg) const { kiss_fft_free(cfg); }
};

using FftConfig = std::unique_ptr<std::remove_pointer_t<kiss_fft_cfg>, FftConfigDeleter>;

} // namespace

// ----------------------
// BITS → TEXT
// ----------------------
std::uint32_t bitsToValue(const std::string& bits, std::size_t pos, std::size_t count) {
    std::uint32_t value = 0;
    for (std::size_t i = 0; i < count; ++i) {
        value = (value << 1) | (bits[pos + i] == '1' ? 1u : 0u);
    }
    return value;
}

std::string bitsToText(const std::string& bits) {
    std::string result;
    result.reserve(bits.size() / 8);
    for (std::size_t i = 0; i + 7 < bits.size(); i += 8) {
        result.push_back(static_cast<char>(bitsToValue(bits, i, 8)));
    }
    return result;
}

// ----------------------
// PER-PROFILE DETECTOR
// ----------------------
struct FskDecoder::Detector {
    struct Lane {
        std::size_t offset = 0;
        std::size_t nextStart = 0; // absolute sample index of the next window
        std::string bits;
        std::size_t searchFrom = 0;
    };

    explicit Detector(const ProfileParams& p) : params(p), n(samplesPerBit(p)) {
        cfg.reset(kiss_fft_alloc(n, 0, nullptr, nullptr));
        if (!cfg) {
            throw std::runtime_error("Failed to allocate KissFFT config");
        }

        bin0 = static_cast<int>(std::round(p.f0 * n / kSampleRate));
        bin1 = static_cast<int>(std::round(p.f1 * n / kSampleRate));

        window.resize(n);
        for (int i = 0; i < n; ++i) {
            window[i] = 0.5 * (1.0 - std::cos(2.0 * PI * i / (n - 1)));
        }
        fftIn.resize(n);
        fftOut.resize(n);

        for (int k = 0; k < kLanes; ++k) {
            lanes[k].offset = static_cast<std::size_t>(k) * n / kLanes;
        }
        reset();
    }

    void reset() {
        for (auto& lane : lanes) {
            lane.nextStart = lane.offset;
            lane.bits.clear();
            lane.searchFrom = 0;
        }
    }

    // FSK BIT DETECTION USING FFT
    char detectBit(const std::int16_t* samples) {
        for (int i = 0; i < n; ++i) {
            fftIn[i].r = static_cast<kiss_fft_scalar>(samples[i] / 32768.0 * window[i]);
            fftIn[i].i = 0;
        }

        kiss_fft(cfg.get(), fftIn.data(), fftOut.data());

        double mag0 = std::hypot(fftOut[bin0].r, fftOut[bin0].i);
        double mag1 = std::hypot(fftOut[bin1].r, fftOut[bin1].i);

        if (std::max(mag0, mag1) < kEnergyFloor * n) {
            return '0';
        }
        return (mag1 > mag0) ? '1' : '0';
    }

    // Looks for a complete frame in the lane's bitstream. Candidates that
    // cannot complete yet are revisited on the next call.
    std::optional<std::string> scan(Lane& lane, std::size_t maxPayload) {
        const std::string& bits = lane.bits;
        const std::size_t syncLen = std::strlen(kSyncWordBits);
        std::size_t firstPending = std::string::npos;

        std::size_t pos = lane.searchFrom;
        while ((pos = bits.find(kSyncWordBits, pos)) != std::string::npos) {
            std::size_t lenStart = pos + syncLen;
            if (lenStart + kLengthBits > bits.size()) {
                if (firstPending == std::string::npos) firstPending = pos;
                break;
            }

            std::size_t msgLen = bitsToValue(bits, lenStart, kLengthBits);
            if (msgLen > maxPayload) {
                ++pos;
                continue;
            }

            std::size_t payloadStart = lenStart + kLengthBits;
            std::size_t payloadBits = msgLen * 8;
            if (payloadStart + payloadBits + kCrcBits > bits.size()) {
                if (firstPending == std::string::npos) firstPending = pos;
                ++pos;
                continue;
            }

            std::string message = bitsToText(bits.substr(payloadStart, payloadBits));
            auto crc = static_cast<std::uint16_t>(bitsToValue(bits, payloadStart + payloadBits, kCrcBits));
            if (crc == crc16(message)) {
                return message;
            }
            ++pos;
        }

        if (firstPending != std::string::npos) {
            lane.searchFrom = firstPending;
        } else {
            lane.searchFrom = bits.size() >= syncLen ? bits.size() - syncLen + 1 : 0;
        }
        return std::nullopt;
    }

    ProfileParams params;
    int n;
    int bin0 = 0;
    int bin1 = 0;
    FftConfig cfg;
    std::vector<double> window;
    std::vector<kiss_fft_cpx> fftIn;
    std::vector<kiss_fft_cpx> fftOut;
    Lane lanes[kLanes];
};

// ----------------------
// MAIN DECODER
// ----------------------
FskDecoder::FskDecoder(std::size_t maxPayload)
    : maxPayload_(std::min(maxPayload, kMaxFramePayload)) {
    for (const auto& p : allProfiles()) {
        detectors_.push_back(std::make_unique<Detector>(p));
    }
}

FskDecoder::~FskDecoder() = default;

std::optional<std::string> FskDecoder::feed(const std::int16_t* samples, std::size_t count) {
    buffer_.insert(buffer_.end(), samples, samples + count);
    const std::size_t end = base_ + buffer_.size();

    for (auto& detector : detectors_) {
        const std::size_t n = static_cast<std::size_t>(detector->n);
        for (auto& lane : detector->lanes) {
            bool progressed = false;
            while (lane.nextStart + n <= end) {
                lane.bits.push_back(detector->detectBit(buffer_.data() + (lane.nextStart - base_)));
                lane.nextStart += n;
                progressed = true;
            }
            if (!progressed) continue;

            auto message = detector->scan(lane, maxPayload_);
            if (message) {
                return message;
            }
        }
    }

    trimBuffer();
    return std::nullopt;
}

void FskDecoder::reset() {
    buffer_.clear();
    base_ = 0;
    for (auto& detector : detectors_) {
        detector->reset();
    }
}

// Drops samples every lane has already sliced.
void FskDecoder::trimBuffer() {
    std::size_t keepFrom = base_ + buffer_.size();
    for (const auto& detector : detectors_) {
        for (const auto& lane : detector->lanes) {
            keepFrom = std::min(keepFrom, lane.nextStart);
        }
    }
    if (keepFrom <= base_) return;

    buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(keepFrom - base_));
    base_ = keepFrom;
}

} // namespace auxon
