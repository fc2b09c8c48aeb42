#include <gtest/gtest.h>

#include "auxon/pipeline.h"
#include "test_support.h"

using namespace auxon;
using namespace std::chrono_literals;

namespace {

class PipelineTest : public ::testing::Test {
protected:
    PipelineTest() : adapter_(adapterOptions()), encode_(adapter_, limits()), decode_(adapter_, limits()) {}

    static ModemAdapterOptions adapterOptions() {
        ModemAdapterOptions o;
        o.instances = 1;
        o.maxPayload = 1024;
        o.waitTimeout = 50ms;
        return o;
    }

    static PipelineLimits limits() {
        PipelineLimits l;
        l.maxPayloadBytes = 1024;
        l.maxUploadBytes = 4 * 1024 * 1024;
        l.defaultBand = Band::Audible;
        return l;
    }

    EncodedAudio encode(const std::string& text,
                        std::optional<TransmissionProfile> profile = TransmissionProfile::AudibleFastest) {
        EncodedAudio audio;
        Status status = encode_.run(EncodeRequest{text, profile}, audio);
        EXPECT_TRUE(status.ok()) << status.detail;
        return audio;
    }

    ModemAdapter adapter_;
    EncodePipeline encode_;
    DecodePipeline decode_;
};

} // namespace

TEST_F(PipelineTest, HelloRoundTrip) {
    EncodedAudio audio = encode("Hello", std::nullopt);
    EXPECT_EQ(audio.contentType, "audio/wav");
    EXPECT_EQ(audio.profile, TransmissionProfile::AudibleNormal);

    DecodeResult result = decode_.run(audio.container.data(), audio.container.size());
    ASSERT_EQ(result.outcome, DecodeResult::Outcome::Decoded);
    EXPECT_EQ(result.payload, "Hello");
}

TEST_F(PipelineTest, EncodingIsIdempotent) {
    EXPECT_EQ(encode("same text").container, encode("same text").container);
}

TEST_F(PipelineTest, EmptyTextDecodesToEmptyString) {
    EncodedAudio audio = encode("");
    ASSERT_GT(audio.container.size(), kWavHeaderSize);

    DecodeResult result = decode_.run(audio.container.data(), audio.container.size());
    EXPECT_EQ(result.outcome, DecodeResult::Outcome::Decoded);
    EXPECT_EQ(result.payload, "");
    EXPECT_TRUE(result.error.ok());
}

TEST_F(PipelineTest, OversizedPayloadRejectedBeforeModem) {
    PipelineLimits small = limits();
    small.maxPayloadBytes = 8;
    EncodePipeline pipeline(adapter_, small);

    // with the only instance held, any modem call would fail differently
    ModemPool::Lease held = adapter_.pool().acquire(0ms);
    ASSERT_TRUE(held);

    EncodedAudio audio;
    Status status = pipeline.run(EncodeRequest{"123456789", std::nullopt}, audio);
    EXPECT_EQ(status.kind, ErrorKind::PayloadTooLarge);
    EXPECT_TRUE(audio.container.empty());
}

TEST_F(PipelineTest, ProfileCeilingApplies) {
    EncodedAudio audio;
    Status status = encode_.run(EncodeRequest{std::string(300, 'x'), TransmissionProfile::AudibleNormal}, audio);
    EXPECT_EQ(status.kind, ErrorKind::PayloadTooLarge);
}

TEST_F(PipelineTest, AutomaticSelectionFollowsPayloadSize) {
    TransmissionProfile profile;
    ASSERT_TRUE(encode_.resolveProfile(300, std::nullopt, profile).ok());
    EXPECT_EQ(profile, TransmissionProfile::AudibleFast);

    ASSERT_TRUE(encode_.resolveProfile(10, std::nullopt, profile).ok());
    EXPECT_EQ(profile, TransmissionProfile::AudibleNormal);

    EXPECT_EQ(encode_.resolveProfile(2000, std::nullopt, profile).kind, ErrorKind::PayloadTooLarge);
}

TEST_F(PipelineTest, EmptyUpload) {
    DecodeResult result = decode_.run(std::string());
    EXPECT_EQ(result.outcome, DecodeResult::Outcome::Failed);
    EXPECT_EQ(result.error.kind, ErrorKind::EmptyUpload);
}

TEST_F(PipelineTest, OversizedUpload) {
    PipelineLimits small = limits();
    small.maxUploadBytes = 100;
    DecodePipeline pipeline(adapter_, small);

    DecodeResult result = pipeline.run(std::string(200, 'x'));
    EXPECT_EQ(result.error.kind, ErrorKind::UploadTooLarge);
}

TEST_F(PipelineTest, GarbageUploadIsMalformed) {
    DecodeResult result = decode_.run(std::string("RIFF\x04\x00\x00\x00WA", 10));
    EXPECT_EQ(result.outcome, DecodeResult::Outcome::Failed);
    EXPECT_EQ(result.error.kind, ErrorKind::MalformedContainer);
}

TEST_F(PipelineTest, TruncatedHeaderIsMalformed) {
    EncodedAudio audio = encode("Hello");
    DecodeResult result = decode_.run(audio.container.data(), 24);
    EXPECT_EQ(result.error.kind, ErrorKind::MalformedContainer);
}

TEST_F(PipelineTest, SilenceIsNoSignalDetected) {
    auto wav = test::wavFor(SampleBuffer(48000, 0));
    DecodeResult result = decode_.run(wav.data(), wav.size());
    EXPECT_EQ(result.outcome, DecodeResult::Outcome::NoSignal);
    EXPECT_EQ(result.error.kind, ErrorKind::NoSignalDetected);
}

TEST_F(PipelineTest, ResampledCaptureDecodes) {
    SampleBuffer signal = test::signalFor("resampled", TransmissionProfile::AudibleNormal);
    auto wav = test::wavFor(resampleLinear(signal, kSampleRate, 22050), 22050);

    DecodeResult result = decode_.run(wav.data(), wav.size());
    ASSERT_EQ(result.outcome, DecodeResult::Outcome::Decoded);
    EXPECT_EQ(result.payload, "resampled");
}

TEST_F(PipelineTest, LowRateCaptureOverResampleCeiling) {
    PipelineLimits small = limits();
    small.maxUploadBytes = 64 * 1024;
    DecodePipeline pipeline(adapter_, small);

    // 12 KB on the wire, 36000 samples at 48 kHz against a 32768 sample ceiling
    auto wav = test::wavFor(SampleBuffer(6000, 0), 8000);
    ASSERT_LT(wav.size(), small.maxUploadBytes);

    DecodeResult result = pipeline.run(wav.data(), wav.size());
    EXPECT_EQ(result.outcome, DecodeResult::Outcome::Failed);
    EXPECT_EQ(result.error.kind, ErrorKind::UploadTooLarge);

    // the same capture under the ceiling is decoded as usual
    auto shorter = test::wavFor(SampleBuffer(4000, 0), 8000);
    EXPECT_EQ(pipeline.run(shorter.data(), shorter.size()).error.kind, ErrorKind::NoSignalDetected);
}
