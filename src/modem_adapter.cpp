#include "auxon/modem_adapter.h"

#include <algorithm>
#include <exception>

#include "auxon/log.h"

namespace auxon {

namespace {

const char* const kInternalDetail = "Internal server error";

} // namespace

// ----------------------------------
// MODEM POOL
// ----------------------------------
void ModemPool::Lease::release() {
    if (!modem_) return;
    modem_->reset();
    if (pool_) {
        pool_->giveBack(std::move(modem_));
    }
    modem_.reset();
}

ModemPool::ModemPool(std::size_t instances, std::size_t maxPayload)
    : size_(std::max<std::size_t>(instances, 1)) {
    idle_.reserve(size_);
    for (std::size_t i = 0; i < size_; ++i) {
        idle_.push_back(std::make_unique<FskModem>(maxPayload));
    }
}

ModemPool::Lease ModemPool::acquire(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!available_.wait_for(lock, timeout, [this] { return !idle_.empty(); })) {
        return Lease{};
    }
    std::unique_ptr<FskModem> modem = std::move(idle_.back());
    idle_.pop_back();
    return Lease{this, std::move(modem)};
}

std::size_t ModemPool::available() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return idle_.size();
}

void ModemPool::giveBack(std::unique_ptr<FskModem> modem) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        idle_.push_back(std::move(modem));
    }
    available_.notify_one();
}

// ----------------------------------
// DECODE SESSION
// ----------------------------------
DecodeSession::DecodeSession(ModemPool::Lease lease, const ModemAdapterOptions& options)
    : lease_(std::move(lease)),
      chunkSize_(std::max<std::size_t>(options.chunkSize, 1)),
      timeout_(options.decodeTimeout),
      deadline_(std::chrono::steady_clock::now() + options.decodeTimeout) {}

DecodeSession::DecodeSession(Status error) : error_(std::move(error)) {}

void DecodeSession::feed(const std::int16_t* samples, std::size_t count) {
    if (done() || !lease_) return;

    try {
        for (std::size_t pos = 0; pos < count; pos += chunkSize_) {
            if (std::chrono::steady_clock::now() >= deadline_) {
                logWarn("decode timed out after {} ms", timeout_.count());
                error_ = Status::failure(ErrorKind::DecodeTimeout,
                                         "Decoding did not finish within the time limit.");
                return;
            }
            std::size_t n = std::min(chunkSize_, count - pos);
            payload_ = lease_->feed(samples + pos, n);
            if (payload_) {
                return;
            }
        }
    } catch (const std::exception& ex) {
        logError("modem decode failure: {}", ex.what());
        error_ = Status::failure(ErrorKind::InternalError, kInternalDetail);
    }
}

DecodeResult DecodeSession::finish() {
    lease_.release();

    if (payload_) {
        return DecodeResult::decoded(std::move(*payload_));
    }
    if (!error_.ok()) {
        return DecodeResult::failed(error_);
    }
    return DecodeResult::noSignal();
}

// ----------------------------------
// MODEM ADAPTER
// ----------------------------------
ModemAdapter::ModemAdapter(const ModemAdapterOptions& options)
    : options_(options), pool_(options.instances, options.maxPayload) {}

Status ModemAdapter::modulate(const std::string& payload, TransmissionProfile profile,
                              SampleBuffer& out) {
    ModemPool::Lease lease = pool_.acquire(options_.waitTimeout);
    if (!lease) {
        logWarn("no modem instance free within {} ms", options_.waitTimeout.count());
        return Status::failure(ErrorKind::ModemUnavailable, "All modem instances are busy, retry later.");
    }

    try {
        out = lease->modulate(payload, profile);
    } catch (const std::exception& ex) {
        logError("modem encode failure: {}", ex.what());
        return Status::failure(ErrorKind::InternalError, kInternalDetail);
    }
    return Status::success();
}

DecodeSession ModemAdapter::openSession() {
    ModemPool::Lease lease = pool_.acquire(options_.waitTimeout);
    if (!lease) {
        logWarn("no modem instance free within {} ms", options_.waitTimeout.count());
        return DecodeSession(Status::failure(ErrorKind::ModemUnavailable,
                                             "All modem instances are busy, retry later."));
    }
    return DecodeSession(std::move(lease), options_);
}

DecodeResult ModemAdapter::demodulate(const SampleBuffer& samples) {
    DecodeSession session = openSession();
    session.feed(samples.data(), samples.size());
    return session.finish();
}

} // namespace auxon
