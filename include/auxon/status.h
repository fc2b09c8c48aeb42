#ifndef AUXON_STATUS_H
#define AUXON_STATUS_H

#include <string>
#include <utility>

namespace auxon {

enum class ErrorKind {
    Ok,
    BadRequest,
    InvalidArgument,
    PayloadTooLarge,
    UploadTooLarge,
    EmptyUpload,
    MalformedContainer,
    UnsupportedChannelLayout,
    NoSignalDetected,
    DecodeTimeout,
    ModemUnavailable,
    InternalError,
};

// Stable snake_case identifier, used in the "error" field of responses.
const char* errorCode(ErrorKind kind);

// Outcome of a fallible call. Functions return a Status instead of throwing
// across module boundaries.
struct Status {
    ErrorKind kind = ErrorKind::Ok;
    std::string detail;

    bool ok() const { return kind == ErrorKind::Ok; }

    static Status success() { return Status{}; }
    static Status failure(ErrorKind k, std::string d) { return Status{k, std::move(d)}; }
};

} // namespace auxon

#endif // AUXON_STATUS_H
