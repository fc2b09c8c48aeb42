#include "auxon/gateway.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <exception>
#include <sstream>
#include <string>
#include <utility>

#include <boost/beast/http/field.hpp>
#include <boost/beast/http/verb.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include "auxon/log.h"
#include "auxon/multipart.h"
#include "auxon/profile.h"

namespace auxon {

namespace pt = boost::property_tree;

namespace {

const char* const kInternalDetail = "Internal server error";

std::string str(boost::beast::string_view v) {
    return std::string(v.data(), v.size());
}

std::string path(boost::beast::string_view target) {
    std::string p = str(target);
    std::size_t query = p.find('?');
    if (query != std::string::npos) p.resize(query);
    return p;
}

std::string toJson(const pt::ptree& tree) {
    std::ostringstream os;
    pt::write_json(os, tree, false);
    return os.str();
}

// PropertyTree keeps every JSON scalar as text, so whether a top-level member
// held a string is read from its raw token.
bool memberIsString(const std::string& body, const std::string& key) {
    int depth = 0;
    for (std::size_t i = 0; i < body.size(); ++i) {
        const char c = body[i];
        if (c == '{' || c == '[') {
            ++depth;
        } else if (c == '}' || c == ']') {
            --depth;
        } else if (c == '"') {
            const std::size_t start = i + 1;
            for (i = start; i < body.size() && body[i] != '"'; ++i) {
                if (body[i] == '\\') ++i;
            }
            if (i >= body.size()) return false;
            if (depth != 1) continue;

            // a key is the only string followed by ':'
            std::size_t next = body.find_first_not_of(" \t\r\n", i + 1);
            if (next == std::string::npos || body[next] != ':') continue;
            if (body.compare(start, i - start, key) != 0) continue;

            std::size_t value = body.find_first_not_of(" \t\r\n", next + 1);
            return value != std::string::npos && body[value] == '"';
        }
    }
    return false;
}

bool isWavType(boost::beast::string_view contentType) {
    std::string media = str(contentType);
    media = media.substr(0, media.find(';'));
    std::transform(media.begin(), media.end(), media.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    media.erase(media.find_last_not_of(" \t") + 1);
    return media == "audio/wav" || media == "audio/x-wav" || media == "audio/wave" ||
           media == "application/octet-stream";
}

} // namespace

http::status statusFor(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Ok:                       return http::status::ok;
        case ErrorKind::BadRequest:               return http::status::bad_request;
        case ErrorKind::PayloadTooLarge:          return http::status::payload_too_large;
        case ErrorKind::UploadTooLarge:           return http::status::payload_too_large;
        case ErrorKind::EmptyUpload:              return http::status::bad_request;
        case ErrorKind::MalformedContainer:       return http::status::bad_request;
        case ErrorKind::UnsupportedChannelLayout: return http::status::unsupported_media_type;
        case ErrorKind::NoSignalDetected:         return http::status::unprocessable_entity;
        case ErrorKind::DecodeTimeout:            return http::status::gateway_timeout;
        case ErrorKind::ModemUnavailable:         return http::status::service_unavailable;
        case ErrorKind::InvalidArgument:
        case ErrorKind::InternalError:            return http::status::internal_server_error;
    }
    return http::status::internal_server_error;
}

Gateway::Gateway(ModemAdapter& adapter, const PipelineLimits& limits, GatewayOptions options)
    : encode_(adapter, limits),
      decode_(adapter, limits),
      limits_(limits),
      options_(std::move(options)) {}

std::uint64_t Gateway::bodyLimit(boost::beast::string_view target) const {
    std::string p = path(target);
    if (p == "/decode") {
        return options_.maxUploadBytes + kMultipartOverhead;
    }
    return options_.maxJsonBytes;
}

Response Gateway::rejectOversized(const Request& request) const {
    const std::uint64_t limit = bodyLimit(request.target());
    const std::string p = path(request.target());
    Status status = p == "/decode"
        ? Status::failure(ErrorKind::UploadTooLarge,
                          "Uploaded file exceeds the limit of " + std::to_string(options_.maxUploadBytes) + " bytes.")
        : Status::failure(ErrorKind::PayloadTooLarge,
                          "Request body exceeds the limit of " + std::to_string(limit) + " bytes.");
    logInfo("{} {} {} (body over {} bytes)", str(request.method_string()), str(request.target()),
            static_cast<unsigned>(statusFor(status.kind)), limit);
    return errorResponse(request, status);
}

Response Gateway::handle(const Request& request) const {
    auto started = std::chrono::steady_clock::now();

    Response response;
    try {
        response = route(request);
    } catch (const std::exception& ex) {
        logError("unhandled error for {} {}: {}", str(request.method_string()), str(request.target()),
                 ex.what());
        response = errorResponse(request, Status::failure(ErrorKind::InternalError, kInternalDetail));
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    logInfo("{} {} {} {}ms", str(request.method_string()), str(request.target()), response.result_int(),
            elapsed.count());
    return response;
}

Response Gateway::route(const Request& request) const {
    const std::string p = path(request.target());
    const bool known = p == "/encode" || p == "/decode" || p == "/health" || p == "/profiles" ||
                       p == "/__routes";

    if (!known) {
        return errorBody(request, http::status::not_found, "not_found", "Not Found");
    }
    if (request.method() == http::verb::options) {
        return handlePreflight(request);
    }

    if (p == "/encode" && request.method() == http::verb::post) return handleEncode(request);
    if (p == "/decode" && request.method() == http::verb::post) return handleDecode(request);
    if (p == "/health" && request.method() == http::verb::get) return handleHealth(request);
    if (p == "/profiles" && request.method() == http::verb::get) return handleProfiles(request);
    if (p == "/__routes" && request.method() == http::verb::get) return handleRoutes(request);

    Response response = errorBody(request, http::status::method_not_allowed, "method_not_allowed",
                                  "Method Not Allowed");
    response.set(http::field::allow, (p == "/encode" || p == "/decode") ? "POST, OPTIONS" : "GET, OPTIONS");
    return response;
}

// ----------------------------------
// POST /encode
// ----------------------------------
Response Gateway::handleEncode(const Request& request) const {
    pt::ptree tree;
    try {
        std::istringstream in(request.body());
        pt::read_json(in, tree);
    } catch (const pt::json_parser_error& ex) {
        logDebug("rejected encode body: {}", ex.what());
        return errorResponse(request, Status::failure(ErrorKind::BadRequest, "Request body must be a JSON object."));
    }

    auto text = tree.get_child_optional("text");
    if (!text || !text->empty() || !memberIsString(request.body(), "text")) {
        return errorResponse(request, Status::failure(ErrorKind::BadRequest, "Field 'text' must be a string."));
    }

    EncodeRequest encodeRequest;
    encodeRequest.text = text->data();

    auto profileName = tree.get_optional<std::string>("profile");
    if (profileName && !profileName->empty() && *profileName != "auto") {
        TransmissionProfile profile;
        if (!parseProfile(*profileName, profile)) {
            return errorResponse(request, Status::failure(ErrorKind::BadRequest,
                                                          "Unknown profile '" + *profileName + "'."));
        }
        encodeRequest.profile = profile;
    }

    EncodedAudio audio;
    Status status = encode_.run(encodeRequest, audio);
    if (!status.ok()) {
        return errorResponse(request, status);
    }

    Response response{http::status::ok, request.version()};
    response.set(http::field::content_type, audio.contentType);
    response.set(http::field::content_disposition, "attachment; filename=\"link.wav\"");
    response.set("X-Auxon-Profile", profileParams(audio.profile).name);
    response.body().assign(audio.container.begin(), audio.container.end());
    response.keep_alive(request.keep_alive());
    applyCors(request, response);
    response.prepare_payload();
    return response;
}

// ----------------------------------
// POST /decode
// ----------------------------------
Response Gateway::handleDecode(const Request& request) const {
    const auto contentType = request[http::field::content_type];

    std::string boundary;
    std::vector<MultipartPart> parts;
    DecodeResult result;

    if (parseBoundary(std::string_view(contentType.data(), contentType.size()), boundary)) {
        Status status = parseMultipart(request.body(), boundary, parts);
        if (!status.ok()) {
            return errorResponse(request, status);
        }
        const MultipartPart* file = findFilePart(parts, "file");
        if (!file) {
            return errorResponse(request, Status::failure(ErrorKind::BadRequest,
                                                          "Multipart body has no 'file' field."));
        }
        result = decode_.run(reinterpret_cast<const std::uint8_t*>(file->body.data()), file->body.size());
    } else if (isWavType(contentType)) {
        result = decode_.run(request.body());
    } else {
        return errorResponse(request, Status::failure(ErrorKind::BadRequest,
                                                      "Expected a multipart/form-data upload with a 'file' field."));
    }

    switch (result.outcome) {
        case DecodeResult::Outcome::Decoded: {
            Response response{http::status::ok, request.version()};
            response.set(http::field::content_type, "text/plain; charset=utf-8");
            response.body() = std::move(result.payload);
            response.keep_alive(request.keep_alive());
            applyCors(request, response);
            response.prepare_payload();
            return response;
        }
        case DecodeResult::Outcome::NoSignal:
            return errorResponse(request, result.error);
        case DecodeResult::Outcome::Failed:
            break;
    }
    return errorResponse(request, result.error);
}

// ----------------------------------
// GET /health, GET /profiles, GET /__routes
// ----------------------------------
Response Gateway::handleHealth(const Request& request) const {
    pt::ptree tree;
    tree.put("status", "ok");
    return jsonResponse(request, http::status::ok, toJson(tree));
}

Response Gateway::handleProfiles(const Request& request) const {
    pt::ptree list;
    for (const auto& p : allProfiles()) {
        pt::ptree item;
        item.put("name", p.name);
        item.put("band", bandName(p.band));
        item.put("f0_hz", p.f0);
        item.put("f1_hz", p.f1);
        item.put("bit_ms", p.bitDuration * 1000.0);
        item.put("max_payload_bytes", std::min(p.maxPayload, limits_.maxPayloadBytes));
        list.push_back(std::make_pair("", item));
    }

    pt::ptree tree;
    tree.put("default_band", bandName(limits_.defaultBand));
    tree.add_child("profiles", list);
    return jsonResponse(request, http::status::ok, toJson(tree));
}

Response Gateway::handleRoutes(const Request& request) const {
    pt::ptree list;
    for (const char* route : {"/encode", "/decode", "/health", "/profiles", "/__routes"}) {
        pt::ptree item;
        item.put_value(route);
        list.push_back(std::make_pair("", item));
    }

    pt::ptree tree;
    tree.add_child("routes", list);
    return jsonResponse(request, http::status::ok, toJson(tree));
}

Response Gateway::handlePreflight(const Request& request) const {
    Response response{http::status::no_content, request.version()};
    response.keep_alive(request.keep_alive());
    applyCors(request, response);
    response.set(http::field::access_control_allow_methods, "GET, POST, OPTIONS");
    const auto requested = request[http::field::access_control_request_headers];
    response.set(http::field::access_control_allow_headers,
                 requested.empty() ? boost::beast::string_view("Content-Type") : requested);
    response.set(http::field::access_control_max_age, "600");
    response.prepare_payload();
    return response;
}

// ----------------------------------
// RESPONSE HELPERS
// ----------------------------------
Response Gateway::errorResponse(const Request& request, const Status& status) const {
    const http::status code = statusFor(status.kind);
    const std::string method = str(request.method_string());
    const std::string target = str(request.target());

    if (code == http::status::internal_server_error) {
        logError("{} {} failed: {}", method, target, status.detail);
    } else {
        logDebug("{} {} rejected ({}): {}", method, target, errorCode(status.kind), status.detail);
    }

    // internal causes stay in the log
    const std::string detail = code == http::status::internal_server_error ? kInternalDetail : status.detail;
    Response response = errorBody(request, code, errorCode(status.kind), detail);
    if (status.kind == ErrorKind::ModemUnavailable) {
        response.set(http::field::retry_after, "1");
    }
    return response;
}

Response Gateway::errorBody(const Request& request, http::status code, const char* error,
                            const std::string& detail) const {
    pt::ptree tree;
    tree.put("detail", detail);
    tree.put("error", error);
    return jsonResponse(request, code, toJson(tree));
}

Response Gateway::jsonResponse(const Request& request, http::status status, const std::string& body) const {
    Response response{status, request.version()};
    response.set(http::field::content_type, "application/json");
    response.body() = body;
    response.keep_alive(request.keep_alive());
    applyCors(request, response);
    response.prepare_payload();
    return response;
}

void Gateway::applyCors(const Request& request, Response& response) const {
    const auto origin = request[http::field::origin];
    if (origin.empty()) return;

    const std::string value = str(origin);
    const auto& allowed = options_.allowedOrigins;
    const bool any = std::find(allowed.begin(), allowed.end(), "*") != allowed.end();
    const bool listed = std::find(allowed.begin(), allowed.end(), value) != allowed.end();

    if (listed) {
        response.set(http::field::access_control_allow_origin, value);
        response.set(http::field::access_control_allow_credentials, "true");
        response.set(http::field::vary, "Origin");
    } else if (any) {
        response.set(http::field::access_control_allow_origin, "*");
    }
}

} // namespace auxon
