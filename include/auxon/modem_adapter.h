#ifndef AUXON_MODEM_ADAPTER_H
#define AUXON_MODEM_ADAPTER_H

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "auxon/audio.h"
#include "auxon/fsk_modem.h"
#include "auxon/profile.h"
#include "auxon/status.h"

namespace auxon {

// Tagged outcome of a demodulation. NoSignal is not a failure: the audio was
// consumed completely without a valid frame.
struct DecodeResult {
    enum class Outcome { Decoded, NoSignal, Failed };

    Outcome outcome = Outcome::NoSignal;
    std::string payload;
    Status error;

    static DecodeResult decoded(std::string payload) {
        DecodeResult r;
        r.outcome = Outcome::Decoded;
        r.payload = std::move(payload);
        return r;
    }

    static DecodeResult noSignal() { return DecodeResult{}; }

    static DecodeResult failed(Status status) {
        DecodeResult r;
        r.outcome = Outcome::Failed;
        r.error = std::move(status);
        return r;
    }
};

// ----------------------------------
// MODEM POOL
// ----------------------------------
// Fixed set of independent modem instances. A lease grants exclusive use of
// one instance; the instance is reset and returned when the lease ends.
class ModemPool {
public:
    class Lease {
    public:
        Lease() = default;
        Lease(ModemPool* pool, std::unique_ptr<FskModem> modem)
            : pool_(pool), modem_(std::move(modem)) {}
        ~Lease() { release(); }

        Lease(Lease&& other) noexcept = default;
        Lease& operator=(Lease&& other) noexcept {
            if (this != &other) {
                release();
                pool_ = other.pool_;
                modem_ = std::move(other.modem_);
            }
            return *this;
        }

        explicit operator bool() const { return modem_ != nullptr; }
        FskModem* operator->() const { return modem_.get(); }
        FskModem& operator*() const { return *modem_; }

        void release();

    private:
        ModemPool* pool_ = nullptr;
        std::unique_ptr<FskModem> modem_;
    };

    ModemPool(std::size_t instances, std::size_t maxPayload);

    ModemPool(const ModemPool&) = delete;
    ModemPool& operator=(const ModemPool&) = delete;

    // Waits at most timeout for a free instance. The returned lease is empty
    // if none became free in time.
    Lease acquire(std::chrono::milliseconds timeout);

    std::size_t size() const { return size_; }
    std::size_t available() const;

private:
    void giveBack(std::unique_ptr<FskModem> modem);

    std::size_t size_;
    mutable std::mutex mutex_;
    std::condition_variable available_;
    std::vector<std::unique_ptr<FskModem>> idle_;
};

struct ModemAdapterOptions {
    std::size_t instances = 2;
    std::size_t maxPayload = kMaxFramePayload;
    std::chrono::milliseconds waitTimeout{2000};
    std::chrono::milliseconds decodeTimeout{10000};
    std::size_t chunkSize = 4096;
};

// ----------------------------------
// DECODE SESSION
// ----------------------------------
// Streaming demodulation bound to one leased modem instance. Samples may be
// pushed in any number of calls; finish() reports the outcome.
class DecodeSession {
public:
    DecodeSession(ModemPool::Lease lease, const ModemAdapterOptions& options);
    explicit DecodeSession(Status error);

    DecodeSession(DecodeSession&&) noexcept = default;
    DecodeSession& operator=(DecodeSession&&) noexcept = default;

    // Feeds samples in chunks. Input after a decoded frame or a failure is
    // ignored.
    void feed(const std::int16_t* samples, std::size_t count);

    bool done() const { return payload_.has_value() || !error_.ok(); }

    // Ends the session and returns the modem instance to the pool.
    DecodeResult finish();

private:
    ModemPool::Lease lease_;
    std::size_t chunkSize_ = 4096;
    std::chrono::milliseconds timeout_{0};
    std::chrono::steady_clock::time_point deadline_;
    std::optional<std::string> payload_;
    Status error_;
};

// ----------------------------------
// MODEM ADAPTER
// ----------------------------------
class ModemAdapter {
public:
    explicit ModemAdapter(const ModemAdapterOptions& options);

    Status modulate(const std::string& payload, TransmissionProfile profile, SampleBuffer& out);

    DecodeResult demodulate(const SampleBuffer& samples);

    // Leases an instance for incremental decoding. A session that could not
    // get an instance reports ModemUnavailable from finish().
    DecodeSession openSession();

    const ModemAdapterOptions& options() const { return options_; }
    ModemPool& pool() { return pool_; }

private:
    ModemAdapterOptions options_;
    ModemPool pool_;
};

} // namespace auxon

#endif // AUXON_MODEM_ADAPTER_H
