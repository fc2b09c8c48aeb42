#include "auxon/multipart.h"

#include <utility>

#include <boost/beast/core/string.hpp>
#include <boost/beast/http/rfc7230.hpp>

namespace auxon {

namespace http = boost::beast::http;

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r')) s.remove_suffix(1);
    return s;
}

std::string unquote(boost::beast::string_view v) {
    std::string s(v.data(), v.size());
    if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
        std::string out;
        for (std::size_t i = 1; i + 1 < s.size(); ++i) {
            if (s[i] == '\\' && i + 2 < s.size()) ++i;
            out.push_back(s[i]);
        }
        return out;
    }
    return s;
}

// "form-data; name=..." -> media type "form-data" and the ";"-list after it
std::string_view splitParams(std::string_view value, std::string_view& params) {
    std::size_t semi = value.find(';');
    if (semi == std::string_view::npos) {
        params = {};
        return trim(value);
    }
    params = value.substr(semi);
    return trim(value.substr(0, semi));
}

void parseDisposition(std::string_view value, MultipartPart& part) {
    std::string_view params;
    splitParams(value, params);
    for (auto const& param : http::param_list(boost::beast::string_view(params.data(), params.size()))) {
        if (boost::beast::iequals(param.first, "name")) {
            part.name = unquote(param.second);
        } else if (boost::beast::iequals(param.first, "filename")) {
            part.filename = unquote(param.second);
        }
    }
}

Status badRequest(const char* detail) {
    return Status::failure(ErrorKind::BadRequest, detail);
}

} // namespace

bool parseBoundary(std::string_view contentType, std::string& boundary) {
    std::string_view params;
    std::string_view media = splitParams(contentType, params);
    if (!boost::beast::iequals(boost::beast::string_view(media.data(), media.size()), "multipart/form-data")) {
        return false;
    }
    for (auto const& param : http::param_list(boost::beast::string_view(params.data(), params.size()))) {
        if (boost::beast::iequals(param.first, "boundary")) {
            boundary = unquote(param.second);
            return !boundary.empty() && boundary.size() <= 70;
        }
    }
    return false;
}

Status parseMultipart(std::string_view body, const std::string& boundary,
                      std::vector<MultipartPart>& parts) {
    const std::string delimiter = "--" + boundary;
    const std::string separator = "\r\n" + delimiter;

    std::size_t pos = body.find(delimiter);
    if (pos == std::string_view::npos) {
        return badRequest("Multipart body does not contain the declared boundary.");
    }
    pos += delimiter.size();

    while (true) {
        if (body.substr(pos, 2) == "--") {
            return Status::success();
        }
        // rest of the delimiter line
        std::size_t lineEnd = body.find("\r\n", pos);
        if (lineEnd == std::string_view::npos) {
            return badRequest("Multipart body is truncated.");
        }
        pos = lineEnd + 2;

        // a part may omit its headers entirely
        const bool noHeaders = body.substr(pos, 2) == "\r\n";
        std::size_t headersEnd = noHeaders ? pos : body.find("\r\n\r\n", pos);
        if (headersEnd == std::string_view::npos) {
            return badRequest("Multipart part headers are truncated.");
        }

        MultipartPart part;
        std::string_view headers = body.substr(pos, headersEnd - pos);
        while (!headers.empty()) {
            std::size_t eol = headers.find("\r\n");
            std::string_view line = headers.substr(0, eol);
            headers = eol == std::string_view::npos ? std::string_view{} : headers.substr(eol + 2);

            std::size_t colon = line.find(':');
            if (colon == std::string_view::npos) continue;
            std::string_view name = trim(line.substr(0, colon));
            std::string_view value = trim(line.substr(colon + 1));
            boost::beast::string_view bname(name.data(), name.size());
            if (boost::beast::iequals(bname, "Content-Disposition")) {
                parseDisposition(value, part);
            } else if (boost::beast::iequals(bname, "Content-Type")) {
                part.contentType = std::string(value);
            }
        }

        std::size_t bodyStart = noHeaders ? pos + 2 : headersEnd + 4;
        std::size_t next = body.find(separator, bodyStart);
        if (next == std::string_view::npos) {
            return badRequest("Multipart body is missing its closing boundary.");
        }
        part.body = body.substr(bodyStart, next - bodyStart);
        parts.push_back(std::move(part));

        pos = next + separator.size();
    }
}

const MultipartPart* findFilePart(const std::vector<MultipartPart>& parts, const std::string& field) {
    for (const auto& part : parts) {
        if (part.name == field) return &part;
    }
    for (const auto& part : parts) {
        if (!part.filename.empty()) return &part;
    }
    return nullptr;
}

} // namespace auxon
