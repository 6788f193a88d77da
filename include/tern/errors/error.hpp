#pragma once

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <expected>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tern::errors {

/// Failure taxonomy of the transport
enum class error_kind : uint8_t {
    connection,       ///< DNS, TCP connect or TLS handshake failed; nothing was sent
    timeout,          ///< a phase deadline passed (see timeout_phase)
    transport,        ///< read/write failed on an established connection
    protocol,         ///< malformed response framing
    cancelled,        ///< the caller abandoned the request
    internal,         ///< unexpected failure inside the engine
    invalid_request   ///< the request was rejected before any I/O
};

enum class timeout_phase : uint8_t {
    none,
    connect,
    write,
    read,
    total
};

/// Which step of connection establishment failed
enum class connect_stage : uint8_t {
    none,
    dns,
    tcp,
    tls
};

/// Which direction a transport error happened in
enum class io_direction : uint8_t {
    none,
    read,
    write
};

constexpr std::string_view kind_name(error_kind k) noexcept {
    switch (k) {
        case error_kind::connection:      return "ConnectionError";
        case error_kind::timeout:         return "TimeoutError";
        case error_kind::transport:       return "TransportError";
        case error_kind::protocol:        return "ProtocolError";
        case error_kind::cancelled:       return "CancelledError";
        case error_kind::internal:        return "InternalError";
        case error_kind::invalid_request: return "InvalidRequest";
    }
    return "InternalError";
}

constexpr std::string_view phase_name(timeout_phase p) noexcept {
    switch (p) {
        case timeout_phase::none:    return "none";
        case timeout_phase::connect: return "connect";
        case timeout_phase::write:   return "write";
        case timeout_phase::read:    return "read";
        case timeout_phase::total:   return "total";
    }
    return "none";
}

/// A classified transport failure.
///
/// Stages never change `kind`; they may append to `context`. The retry
/// stage stamps `attempts` on the error it finally gives up with.
struct error {
    error_kind kind = error_kind::internal;
    std::string message;
    timeout_phase phase = timeout_phase::none;
    connect_stage stage = connect_stage::none;
    io_direction direction = io_direction::none;
    int sys_errno = 0;
    uint32_t attempts = 0;
    /// False while no byte of the response has been received. A request
    /// whose pooled connection was reset before answering can be replayed.
    bool response_started = false;
    /// For invalid_request: the offending part ("url", "method", "headers",
    /// "body", "extensions")
    std::string field;
    std::vector<std::string> context;

    error& with_context(std::string note) & {
        context.push_back(std::move(note));
        return *this;
    }

    error&& with_context(std::string note) && {
        context.push_back(std::move(note));
        return std::move(*this);
    }

    /// "TimeoutError(read): no data for 5000ms [attempt 2; via retry]"
    std::string describe() const {
        std::string out(kind_name(kind));
        if (kind == error_kind::timeout) {
            out += '(';
            out += phase_name(phase);
            out += ')';
        }
        out += ": ";
        out += message;
        if (attempts > 0 || !context.empty()) {
            out += " [";
            bool first = true;
            if (attempts > 0) {
                out += "attempts=" + std::to_string(attempts);
                first = false;
            }
            for (const auto& c : context) {
                if (!first) out += "; ";
                out += c;
                first = false;
            }
            out += ']';
        }
        return out;
    }
};

template<typename T>
using result = std::expected<T, error>;

inline error connection_error(connect_stage stage, std::string message, int err = 0) {
    error e;
    e.kind = error_kind::connection;
    e.stage = stage;
    e.message = std::move(message);
    e.sys_errno = err;
    return e;
}

inline error timeout_error(timeout_phase phase, std::string message) {
    error e;
    e.kind = error_kind::timeout;
    e.phase = phase;
    e.message = std::move(message);
    e.sys_errno = ETIMEDOUT;
    return e;
}

inline error transport_error(io_direction dir, int err, bool response_started) {
    error e;
    e.kind = error_kind::transport;
    e.direction = dir;
    e.sys_errno = err;
    e.response_started = response_started;
    if (err == 0) {
        e.message = "connection closed by peer";
    } else {
        e.message = strerror(err);
    }
    return e;
}

inline error protocol_error(std::string message) {
    error e;
    e.kind = error_kind::protocol;
    e.message = std::move(message);
    e.response_started = true;
    return e;
}

inline error cancelled_error(std::string message = "request cancelled") {
    error e;
    e.kind = error_kind::cancelled;
    e.message = std::move(message);
    e.sys_errno = ECANCELED;
    return e;
}

inline error internal_error(std::string message) {
    error e;
    e.kind = error_kind::internal;
    e.message = std::move(message);
    return e;
}

inline error invalid_request(std::string field, std::string message) {
    error e;
    e.kind = error_kind::invalid_request;
    e.field = std::move(field);
    e.message = std::move(message);
    e.sys_errno = EINVAL;
    return e;
}

} // namespace tern::errors
