#include <gtest/gtest.h>

#include <algorithm>
#include <thread>

#include "auxon/modem_adapter.h"
#include "test_support.h"

using namespace auxon;
using namespace std::chrono_literals;

namespace {

ModemAdapterOptions options(std::size_t instances = 1) {
    ModemAdapterOptions o;
    o.instances = instances;
    o.maxPayload = 1024;
    o.waitTimeout = 5000ms;
    o.decodeTimeout = 10000ms;
    return o;
}

} // namespace

TEST(ModemAdapterTest, ModulateThenDemodulateRoundTrips) {
    ModemAdapter adapter(options());

    SampleBuffer samples;
    ASSERT_TRUE(adapter.modulate("Hello", TransmissionProfile::AudibleFastest, samples).ok());

    DecodeResult result = adapter.demodulate(samples);
    ASSERT_EQ(result.outcome, DecodeResult::Outcome::Decoded);
    EXPECT_EQ(result.payload, "Hello");
    EXPECT_TRUE(result.error.ok());
}

TEST(ModemAdapterTest, SilenceIsNoSignalNotFailure) {
    ModemAdapter adapter(options());
    DecodeResult result = adapter.demodulate(SampleBuffer(20000, 0));
    EXPECT_EQ(result.outcome, DecodeResult::Outcome::NoSignal);
    EXPECT_TRUE(result.error.ok());
}

TEST(ModemAdapterTest, EmptyBufferIsNoSignal) {
    ModemAdapter adapter(options());
    EXPECT_EQ(adapter.demodulate({}).outcome, DecodeResult::Outcome::NoSignal);
}

TEST(ModemAdapterTest, EmptyPayloadIsDistinctFromNoSignal) {
    ModemAdapter adapter(options());
    SampleBuffer samples;
    ASSERT_TRUE(adapter.modulate("", TransmissionProfile::AudibleNormal, samples).ok());

    DecodeResult result = adapter.demodulate(samples);
    EXPECT_EQ(result.outcome, DecodeResult::Outcome::Decoded);
    EXPECT_EQ(result.payload, "");
}

TEST(ModemAdapterTest, SessionAcceptsStreamedSamples) {
    ModemAdapter adapter(options());
    SampleBuffer samples = test::signalFor("chunked");

    DecodeSession session = adapter.openSession();
    for (std::size_t pos = 0; pos < samples.size() && !session.done(); pos += 1000) {
        session.feed(samples.data() + pos, std::min<std::size_t>(1000, samples.size() - pos));
    }
    DecodeResult result = session.finish();
    ASSERT_EQ(result.outcome, DecodeResult::Outcome::Decoded);
    EXPECT_EQ(result.payload, "chunked");
    EXPECT_EQ(adapter.pool().available(), 1u);
}

TEST(ModemAdapterTest, ExhaustedPoolReportsModemUnavailable) {
    ModemAdapterOptions o = options();
    o.waitTimeout = 20ms;
    ModemAdapter adapter(o);

    SampleBuffer samples = test::signalFor("busy");
    {
        ModemPool::Lease held = adapter.pool().acquire(0ms);
        ASSERT_TRUE(held);
        EXPECT_EQ(adapter.pool().available(), 0u);

        DecodeResult result = adapter.demodulate(samples);
        EXPECT_EQ(result.outcome, DecodeResult::Outcome::Failed);
        EXPECT_EQ(result.error.kind, ErrorKind::ModemUnavailable);

        SampleBuffer out;
        EXPECT_EQ(adapter.modulate("x", TransmissionProfile::AudibleNormal, out).kind,
                  ErrorKind::ModemUnavailable);
    }

    EXPECT_EQ(adapter.pool().available(), 1u);
    EXPECT_EQ(adapter.demodulate(samples).payload, "busy");
}

TEST(ModemAdapterTest, TimeoutLeavesInstanceClean) {
    ModemAdapterOptions o = options();
    o.decodeTimeout = 0ms;
    ModemAdapter adapter(o);

    SampleBuffer first = test::signalFor("first");
    DecodeResult result = adapter.demodulate(first);
    EXPECT_EQ(result.outcome, DecodeResult::Outcome::Failed);
    EXPECT_EQ(result.error.kind, ErrorKind::DecodeTimeout);
    ASSERT_EQ(adapter.pool().available(), 1u);

    // the instance went back reset: a fresh signal decodes on its own
    ModemPool::Lease lease = adapter.pool().acquire(0ms);
    ASSERT_TRUE(lease);
    SampleBuffer second = test::signalFor("second");
    auto message = lease->feed(second.data(), second.size());
    ASSERT_TRUE(message.has_value());
    EXPECT_EQ(*message, "second");
}

TEST(ModemAdapterTest, ConcurrentDecodesDoNotInterleave) {
    ModemAdapter adapter(options(2));

    constexpr int kRequests = 8;
    std::vector<SampleBuffer> signals;
    for (int i = 0; i < kRequests; ++i) {
        signals.push_back(test::signalFor("message-" + std::to_string(i)));
    }

    std::vector<DecodeResult> results(kRequests);
    std::vector<std::thread> threads;
    for (int i = 0; i < kRequests; ++i) {
        threads.emplace_back([&, i] { results[i] = adapter.demodulate(signals[i]); });
    }
    for (auto& t : threads) t.join();

    for (int i = 0; i < kRequests; ++i) {
        ASSERT_EQ(results[i].outcome, DecodeResult::Outcome::Decoded) << i;
        EXPECT_EQ(results[i].payload, "message-" + std::to_string(i));
    }
    EXPECT_EQ(adapter.pool().available(), 2u);
}
