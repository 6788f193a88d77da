#pragma once

#include <tern/errors/error.hpp>

#include <string>
#include <string_view>

namespace tern::errors {

/// Error vocabulary of the host library's default transport. A host
/// binding raises its own exception type per kind.
enum class host_kind : uint8_t {
    timeout,     ///< the host's timeout exception
    connect,     ///< the host's connection error
    io,          ///< the host's I/O error
    value,       ///< the host's invalid value error
    cancelled,   ///< the host's cancellation
    runtime      ///< the host's generic runtime error
};

constexpr std::string_view host_kind_name(host_kind k) noexcept {
    switch (k) {
        case host_kind::timeout:   return "TimeoutError";
        case host_kind::connect:   return "ConnectionError";
        case host_kind::io:        return "IOError";
        case host_kind::value:     return "ValueError";
        case host_kind::cancelled: return "CancelledError";
        case host_kind::runtime:   return "RuntimeError";
    }
    return "RuntimeError";
}

struct host_error {
    host_kind kind = host_kind::runtime;
    std::string message;
    error source;
};

/// Map a transport error to the host vocabulary, keeping the message
/// prefixes the host's own transport produces.
inline host_error to_host_error(const error& e) {
    host_error h;
    h.source = e;
    switch (e.kind) {
        case error_kind::timeout:
            switch (e.phase) {
                case timeout_phase::connect:
                    h.kind = host_kind::connect;
                    h.message = "Connect timeout: " + e.message;
                    break;
                case timeout_phase::read:
                    h.kind = host_kind::timeout;
                    h.message = "Read timeout: " + e.message;
                    break;
                case timeout_phase::write:
                    h.kind = host_kind::timeout;
                    h.message = "Write timeout: " + e.message;
                    break;
                default:
                    h.kind = host_kind::timeout;
                    h.message = "Request timeout: " + e.message;
                    break;
            }
            break;
        case error_kind::connection:
            h.kind = host_kind::connect;
            h.message = (e.stage == connect_stage::tls ? "SSL error: " : "Connect error: ") + e.message;
            break;
        case error_kind::transport:
            h.kind = host_kind::io;
            h.message = (e.direction == io_direction::write ? "Write error: " : "Read error: ") + e.message;
            break;
        case error_kind::protocol:
            h.kind = host_kind::value;
            h.message = "Remote protocol error: " + e.message;
            break;
        case error_kind::invalid_request:
            h.kind = host_kind::value;
            h.message = (e.field == "url" ? "Invalid URL: " : "Local protocol error: ") + e.message;
            break;
        case error_kind::cancelled:
            h.kind = host_kind::cancelled;
            h.message = "Request cancelled";
            break;
        case error_kind::internal:
            h.kind = host_kind::runtime;
            h.message = "Internal error: " + e.message;
            break;
    }
    if (e.attempts > 1) {
        h.message += " (after " + std::to_string(e.attempts) + " attempts)";
    }
    return h;
}

} // namespace tern::errors
