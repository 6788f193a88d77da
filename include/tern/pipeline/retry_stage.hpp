#pragma once

#include <tern/coro/task.hpp>
#include <tern/errors/error.hpp>
#include <tern/http/extensions.hpp>
#include <tern/io/io_context.hpp>
#include <tern/log/macros.hpp>
#include <tern/pipeline/context.hpp>
#include <tern/time/timer.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <utility>

namespace tern::pipeline {

/// Re-runs the inner chain on retryable failures and configured statuses.
class retry_stage {
public:
    retry_stage(io::io_context& io, retry_policy policy)
        : io_(io), policy_(std::move(policy)) {}

    const retry_policy& policy() const noexcept { return policy_; }

    uint32_t max_attempts_for(const http::request_descriptor& req) const {
        if (req.overrides.max_attempts) {
            return std::max<uint32_t>(1, *req.overrides.max_attempts);
        }
        if (auto n = http::ext_int(req.extensions, http::ext::retry_max_attempts); n && *n >= 1) {
            return static_cast<uint32_t>(*n);
        }
        return std::max<uint32_t>(1, policy_.max_attempts);
    }

    /// Idempotent methods, or others when the request allows it
    bool may_replay(const http::request_descriptor& req) const {
        if (req.method.is_idempotent()) {
            return true;
        }
        if (req.overrides.allow_non_idempotent_retry) {
            return *req.overrides.allow_non_idempotent_retry;
        }
        if (auto allowed = http::ext_bool(req.extensions, http::ext::retry_allow_non_idempotent)) {
            return *allowed;
        }
        return policy_.allow_non_idempotent;
    }

    /// Failures worth another attempt. The caller still checks may_replay().
    static bool is_retryable(const errors::error& e) noexcept {
        switch (e.kind) {
            case errors::error_kind::connection:
                return true;
            case errors::error_kind::timeout:
                return e.phase != errors::timeout_phase::total;
            case errors::error_kind::transport:
                return !e.response_started;
            default:
                return false;
        }
    }

    bool is_retry_status(int status) const {
        return std::find(policy_.retry_statuses.begin(), policy_.retry_statuses.end(), status) !=
               policy_.retry_statuses.end();
    }

    /// base * 2^(attempt-1), capped, scaled by a random factor in [0.5, 1.0]
    std::chrono::milliseconds backoff(uint32_t attempt) const {
        auto base = policy_.base_backoff.count();
        auto cap = policy_.max_backoff.count();
        int64_t delay = base;
        for (uint32_t i = 1; i < attempt && delay < cap; ++i) {
            delay *= 2;
        }
        delay = std::min<int64_t>(delay, cap);
        thread_local std::mt19937 rng{std::random_device{}()};
        double factor = std::uniform_real_distribution<double>(0.5, 1.0)(rng);
        return std::chrono::milliseconds(static_cast<int64_t>(static_cast<double>(delay) * factor));
    }

    /// Retry-After in delta-seconds; HTTP dates are not honoured
    static std::optional<std::chrono::milliseconds> retry_after(const http::header_list& headers) {
        auto value = headers.get("Retry-After");
        while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) value.remove_prefix(1);
        while (!value.empty() && (value.back() == ' ' || value.back() == '\t')) value.remove_suffix(1);
        if (value.empty()) {
            return std::nullopt;
        }
        int64_t secs = 0;
        auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), secs);
        if (ec != std::errc{} || ptr != value.data() + value.size() || secs < 0) {
            return std::nullopt;
        }
        return std::chrono::milliseconds(secs * 1000);
    }

    template<typename Next>
    coro::task<stage_result> handle(const http::request_descriptor& req, pipeline_context& ctx, Next next) {
        const uint32_t max_attempts = max_attempts_for(req);
        const bool replayable = may_replay(req);

        for (uint32_t attempt = 1;; ++attempt) {
            ctx.attempt = attempt;
            auto result = co_await next(req, ctx);

            std::optional<std::chrono::milliseconds> delay;
            std::string reason;
            bool wants_retry = false;
            if (result) {
                if (is_retry_status(result->status)) {
                    wants_retry = true;
                    reason = fmt::format("status {}", result->status);
                    delay = retry_after(result->headers);
                }
            } else if (is_retryable(result.error())) {
                wants_retry = true;
                reason = result.error().describe();
            }

            bool retry = wants_retry && replayable && attempt < max_attempts &&
                         !ctx.token.is_cancelled();
            if (retry && !req.body.rewind()) {
                TERN_LOG_DEBUG("not retrying {} {}: request body producer cannot restart",
                               req.method.name(), req.target.authority());
                retry = false;
            }
            if (retry) {
                if (!delay) {
                    delay = backoff(attempt);
                }
                if (auto left = ctx.remaining(); left && *delay >= *left) {
                    TERN_LOG_DEBUG("not retrying {} {}: backoff {}ms exceeds remaining {}ms",
                                   req.method.name(), req.target.authority(), delay->count(), left->count());
                    retry = false;
                }
            }

            if (!retry) {
                if (result) {
                    result->extensions[std::string(http::ext::attempts)] = static_cast<int64_t>(attempt);
                } else {
                    result.error().attempts = attempt;
                    if (attempt > 1) {
                        result.error().with_context(fmt::format("gave up after {} attempts", attempt));
                    }
                }
                co_return result;
            }

            if (result) {
                result->body.close();
            }
            TERN_LOG_WARNING("retrying {} {} (attempt {}/{}) in {}ms after {}",
                             req.method.name(), req.target.authority(), attempt + 1, max_attempts,
                             delay->count(), reason);
            auto slept = co_await time::sleep_for(io_, *delay, ctx.token);
            if (slept == coro::cancel_result::cancelled) {
                auto e = errors::cancelled_error("request cancelled during retry backoff");
                e.attempts = attempt;
                co_return std::unexpected(std::move(e));
            }
        }
    }

private:
    io::io_context& io_;
    retry_policy policy_;
};

} // namespace tern::pipeline
