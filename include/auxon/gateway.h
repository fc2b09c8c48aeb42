#ifndef AUXON_GATEWAY_H
#define AUXON_GATEWAY_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include <boost/beast/core/string.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/status.hpp>
#include <boost/beast/http/string_body.hpp>

#include "auxon/modem_adapter.h"
#include "auxon/pipeline.h"
#include "auxon/status.h"

namespace auxon {

namespace http = boost::beast::http;

using Request = http::request<http::string_body>;
using Response = http::response<http::string_body>;

// Multipart framing allowance on top of max upload size.
constexpr std::size_t kMultipartOverhead = 64 * 1024;

struct GatewayOptions {
    std::size_t maxJsonBytes = 64 * 1024;
    std::size_t maxUploadBytes = 16 * 1024 * 1024;
    std::vector<std::string> allowedOrigins;
};

http::status statusFor(ErrorKind kind);

// Routes HTTP requests to the encode and decode pipelines and maps every
// outcome to a response. Safe to call from many threads at once.
class Gateway {
public:
    Gateway(ModemAdapter& adapter, const PipelineLimits& limits, GatewayOptions options);

    Response handle(const Request& request) const;

    // Largest body accepted for this target. Checked against Content-Length
    // before the body is read.
    std::uint64_t bodyLimit(boost::beast::string_view target) const;

    // 413 for a request whose body exceeds bodyLimit(). Only the headers
    // of request are used.
    Response rejectOversized(const Request& request) const;

    // JSON error response in reply to request, with CORS headers applied.
    Response errorResponse(const Request& request, const Status& status) const;

private:
    Response route(const Request& request) const;
    Response handleEncode(const Request& request) const;
    Response handleDecode(const Request& request) const;
    Response handleHealth(const Request& request) const;
    Response handleProfiles(const Request& request) const;
    Response handleRoutes(const Request& request) const;
    Response handlePreflight(const Request& request) const;

    Response errorBody(const Request& request, http::status code, const char* error,
                       const std::string& detail) const;
    Response jsonResponse(const Request& request, http::status status, const std::string& body) const;
    void applyCors(const Request& request, Response& response) const;

    EncodePipeline encode_;
    DecodePipeline decode_;
    PipelineLimits limits_;
    GatewayOptions options_;
};

} // namespace auxon

#endif // AUXON_GATEWAY_H
