#include "auxon/pipeline.h"

#include <algorithm>

#include <fmt/format.h>

#include "auxon/audio.h"
#include "auxon/log.h"
#include "auxon/wav_codec.h"

namespace auxon {

// ----------------------------------
// ENCODE
// ----------------------------------
Status EncodePipeline::resolveProfile(std::size_t payloadSize,
                                      const std::optional<TransmissionProfile>& requested,
                                      TransmissionProfile& out) const {
    if (requested) {
        const ProfileParams& params = profileParams(*requested);
        std::size_t ceiling = std::min(limits_.maxPayloadBytes, params.maxPayload);
        if (payloadSize > ceiling) {
            return Status::failure(ErrorKind::PayloadTooLarge,
                                   fmt::format("Text is {} bytes; profile '{}' carries at most {} bytes.",
                                               payloadSize, params.name, ceiling));
        }
        out = *requested;
        return Status::success();
    }

    if (payloadSize > limits_.maxPayloadBytes ||
        !selectProfile(payloadSize, limits_.defaultBand, out)) {
        return Status::failure(ErrorKind::PayloadTooLarge,
                               fmt::format("Text is {} bytes; at most {} bytes can be encoded.",
                                           payloadSize, limits_.maxPayloadBytes));
    }
    return Status::success();
}

Status EncodePipeline::run(const EncodeRequest& request, EncodedAudio& out) const {
    TransmissionProfile profile;
    Status status = resolveProfile(request.text.size(), request.profile, profile);
    if (!status.ok()) {
        return status;
    }

    SampleBuffer samples;
    status = adapter_.modulate(request.text, profile, samples);
    if (!status.ok()) {
        return status;
    }

    status = encodeWav(samples, kSampleRate, kBitsPerSample, out.container);
    if (!status.ok()) {
        logError("container encode failed: {}", status.detail);
        return Status::failure(ErrorKind::InternalError, "Internal server error");
    }

    out.contentType = kWavContentType;
    out.profile = profile;
    logDebug("encoded {} bytes with {} into {} samples", request.text.size(),
             profileParams(profile).name, samples.size());
    return Status::success();
}

// ----------------------------------
// DECODE
// ----------------------------------
DecodeResult DecodePipeline::run(const std::uint8_t* data, std::size_t size) const {
    if (size > limits_.maxUploadBytes) {
        return DecodeResult::failed(Status::failure(
            ErrorKind::UploadTooLarge,
            fmt::format("Uploaded file is {} bytes; the limit is {} bytes.", size, limits_.maxUploadBytes)));
    }
    if (size == 0) {
        return DecodeResult::failed(Status::failure(ErrorKind::EmptyUpload, "Uploaded WAV file was empty."));
    }

    WavData wav;
    Status status = decodeWav(data, size, wav);
    if (!status.ok()) {
        return DecodeResult::failed(status);
    }

    if (wav.sampleRate != kSampleRate) {
        // a low-rate capture grows by up to 48x; cap it at what a 48 kHz
        // 16-bit upload of the same byte limit would hold
        const std::uint64_t resampled =
            static_cast<std::uint64_t>(wav.samples.size()) * kSampleRate / static_cast<std::uint64_t>(wav.sampleRate);
        const std::uint64_t ceiling = limits_.maxUploadBytes / (kBitsPerSample / 8);
        if (resampled > ceiling) {
            return DecodeResult::failed(Status::failure(
                ErrorKind::UploadTooLarge,
                fmt::format("Audio at {} Hz resamples to {} samples; the limit is {} samples.",
                            wav.sampleRate, resampled, ceiling)));
        }
        logDebug("resampling {} samples from {} Hz", wav.samples.size(), wav.sampleRate);
        wav.samples = resampleLinear(wav.samples, wav.sampleRate, kSampleRate);
    }

    DecodeResult result = adapter_.demodulate(wav.samples);
    if (result.outcome == DecodeResult::Outcome::NoSignal) {
        result.error = Status::failure(ErrorKind::NoSignalDetected,
                                       "Could not decode a message from the provided audio.");
    }
    return result;
}

} // namespace auxon
