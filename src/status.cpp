#include "auxon/status.h"

namespace auxon {

const char* errorCode(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Ok:                       return "ok";
        case ErrorKind::BadRequest:               return "bad_request";
        case ErrorKind::InvalidArgument:          return "internal_error";
        case ErrorKind::PayloadTooLarge:          return "payload_too_large";
        case ErrorKind::UploadTooLarge:           return "upload_too_large";
        case ErrorKind::EmptyUpload:              return "empty_upload";
        case ErrorKind::MalformedContainer:       return "malformed_container";
        case ErrorKind::UnsupportedChannelLayout: return "unsupported_channel_layout";
        case ErrorKind::NoSignalDetected:         return "no_signal";
        case ErrorKind::DecodeTimeout:            return "decode_timeout";
        case ErrorKind::ModemUnavailable:         return "modem_unavailable";
        case ErrorKind::InternalError:            return "internal_error";
    }
    return "internal_error";
}

} // namespace auxon
