#pragma once

#include <tern/coro/cancel_token.hpp>
#include <tern/errors/error.hpp>
#include <tern/http/request.hpp>
#include <tern/http/response.hpp>
#include <tern/io/io_backend.hpp>
#include <tern/observe/tracing.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <vector>

namespace tern::pipeline {

/// Default deadlines. Per-phase values are unset unless configured.
struct timeouts {
    std::chrono::milliseconds total{30000};
    std::optional<std::chrono::milliseconds> connect;
    std::optional<std::chrono::milliseconds> read;
    std::optional<std::chrono::milliseconds> write;
};

/// Retry settings; per-request overrides and extensions win over these
struct retry_policy {
    uint32_t max_attempts = 3;
    std::chrono::milliseconds base_backoff{100};
    std::chrono::milliseconds max_backoff{2000};
    /// Response statuses retried like failures (e.g. 502, 503, 504)
    std::vector<int> retry_statuses;
    bool allow_non_idempotent = false;
};

/// Per-request state threaded through the stages. Never shared between
/// requests.
struct pipeline_context {
    uint32_t attempt = 0;
    io::clock::time_point started = io::clock::now();
    /// Set by the timeout stage
    std::optional<io::clock::time_point> deadline;
    /// Cancelled by the caller, or by the timeout stage with
    /// cancel_reason::timeout
    coro::cancel_token token;
    /// Phase deadlines the engine arms
    timeouts phase_timeouts;
    observe::span root_span;
    /// Bytes sent in request bodies over all attempts
    uint64_t request_bytes = 0;

    std::optional<std::chrono::milliseconds> remaining() const {
        if (!deadline) return std::nullopt;
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - io::clock::now());
        return left.count() > 0 ? left : std::chrono::milliseconds(0);
    }
};

using stage_result = errors::result<http::response>;

} // namespace tern::pipeline
