#ifndef AUXON_PIPELINE_H
#define AUXON_PIPELINE_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "auxon/modem_adapter.h"
#include "auxon/profile.h"
#include "auxon/status.h"

namespace auxon {

constexpr const char* kWavContentType = "audio/wav";

struct PipelineLimits {
    std::size_t maxPayloadBytes = 256;
    std::size_t maxUploadBytes = 16 * 1024 * 1024;
    Band defaultBand = Band::Audible;
};

struct EncodeRequest {
    std::string text;
    std::optional<TransmissionProfile> profile; // automatic when empty
};

struct EncodedAudio {
    std::vector<std::uint8_t> container;
    std::string contentType = kWavContentType;
    TransmissionProfile profile = TransmissionProfile::AudibleNormal;
};

// Text -> modulated samples -> WAV container. Stateless; the same request
// always produces the same bytes.
class EncodePipeline {
public:
    EncodePipeline(ModemAdapter& adapter, const PipelineLimits& limits)
        : adapter_(adapter), limits_(limits) {}

    Status run(const EncodeRequest& request, EncodedAudio& out) const;

    // Profile that would carry a payload of this size, or PayloadTooLarge.
    Status resolveProfile(std::size_t payloadSize, const std::optional<TransmissionProfile>& requested,
                          TransmissionProfile& out) const;

private:
    ModemAdapter& adapter_;
    PipelineLimits limits_;
};

// Uploaded WAV -> samples -> demodulation. A NoSignal outcome carries a
// NoSignalDetected status for the caller to report.
class DecodePipeline {
public:
    DecodePipeline(ModemAdapter& adapter, const PipelineLimits& limits)
        : adapter_(adapter), limits_(limits) {}

    DecodeResult run(const std::uint8_t* data, std::size_t size) const;

    DecodeResult run(const std::string& upload) const {
        return run(reinterpret_cast<const std::uint8_t*>(upload.data()), upload.size());
    }

private:
    ModemAdapter& adapter_;
    PipelineLimits limits_;
};

} // namespace auxon

#endif // AUXON_PIPELINE_H
