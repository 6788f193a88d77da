#pragma once

#include <tern/http/http_common.hpp>
#include <tern/http/request.hpp>

#include <fmt/format.h>

#include <iterator>
#include <string>
#include <string_view>

namespace tern::http {

/// How the request body goes on the wire
enum class request_framing {
    none,
    content_length,
    chunked
};

inline request_framing request_framing_for(const request_descriptor& req) {
    switch (req.body.type()) {
        case request_body::kind::empty:
            return request_framing::none;
        case request_body::kind::fixed:
            return request_framing::content_length;
        case request_body::kind::streaming:
            return req.body.length() ? request_framing::content_length : request_framing::chunked;
    }
    return request_framing::none;
}

/// Methods whose empty body is still announced with Content-Length: 0
inline bool expects_body(const method& m) noexcept {
    switch (m.kind()) {
        case verb::POST:
        case verb::PUT:
        case verb::PATCH:
            return true;
        default:
            return false;
    }
}

/// Request line and header block, terminated by the blank line.
///
/// Caller headers keep their order. Host is added when absent; framing
/// headers are always derived from the body, never taken from the caller.
inline std::string serialize_request_head(const request_descriptor& req) {
    std::string out;
    out.reserve(256);
    fmt::format_to(std::back_inserter(out), "{} {} HTTP/1.1\r\n", req.method.name(), req.target.target());

    if (!req.headers.contains("Host")) {
        fmt::format_to(std::back_inserter(out), "Host: {}\r\n", req.target.authority());
    }
    for (const auto& [name, value] : req.headers) {
        if (iequals(name, "Content-Length") || iequals(name, "Transfer-Encoding")) {
            continue;
        }
        fmt::format_to(std::back_inserter(out), "{}: {}\r\n", name, value);
    }

    switch (request_framing_for(req)) {
        case request_framing::none:
            if (expects_body(req.method)) {
                out += "Content-Length: 0\r\n";
            }
            break;
        case request_framing::content_length:
            fmt::format_to(std::back_inserter(out), "Content-Length: {}\r\n", *req.body.length());
            break;
        case request_framing::chunked:
            out += "Transfer-Encoding: chunked\r\n";
            break;
    }
    out += "\r\n";
    return out;
}

/// One chunk of a chunked body. Empty input yields nothing (an empty
/// chunk would end the body).
inline std::string encode_chunk(std::string_view data) {
    if (data.empty()) {
        return {};
    }
    std::string out = fmt::format("{:x}\r\n", data.size());
    out.reserve(out.size() + data.size() + 2);
    out += data;
    out += "\r\n";
    return out;
}

inline constexpr std::string_view last_chunk = "0\r\n\r\n";

} // namespace tern::http
