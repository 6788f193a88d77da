#pragma once

#include <tern/coro/cancel_token.hpp>
#include <tern/coro/task.hpp>
#include <tern/errors/error.hpp>
#include <tern/http/extensions.hpp>
#include <tern/io/io_context.hpp>
#include <tern/pipeline/context.hpp>
#include <tern/time/timer.hpp>

#include <fmt/format.h>

#include <chrono>
#include <utility>

namespace tern::pipeline {

/// Total deadline of a request, covering every attempt up to the response
/// head.
///
/// Inner stages run on a token linked to the caller's; when the deadline
/// passes that token is cancelled with cancel_reason::timeout and whatever
/// the chain reports is turned into TimeoutError(total).
class timeout_stage {
public:
    timeout_stage(io::io_context& io, std::chrono::milliseconds default_total)
        : io_(io), default_total_(default_total) {}

    /// Override, then the `timeout` extension (seconds), then the default
    std::chrono::milliseconds total_for(const http::request_descriptor& req) const {
        if (req.overrides.total_timeout) {
            return *req.overrides.total_timeout;
        }
        if (auto secs = http::ext_number(req.extensions, http::ext::timeout); secs && *secs > 0) {
            return http::seconds_to_ms(*secs);
        }
        return default_total_;
    }

    template<typename Next>
    coro::task<stage_result> handle(const http::request_descriptor& req, pipeline_context& ctx, Next next) {
        auto total = total_for(req);
        if (ctx.token.is_cancelled()) {
            co_return std::unexpected(errors::cancelled_error());
        }

        auto caller = ctx.token;
        coro::cancel_source attempt = coro::cancel_source::linked(caller);
        ctx.deadline = io::clock::now() + total;
        time::deadline_guard guard(io_, *ctx.deadline, attempt);
        ctx.token = attempt.get_token();

        auto result = co_await next(req, ctx);

        guard.disarm();
        ctx.token = caller;

        if (!result && guard.expired() && !caller.is_cancelled()) {
            auto& e = result.error();
            if (e.kind != errors::error_kind::timeout || e.phase != errors::timeout_phase::total) {
                auto converted = errors::timeout_error(errors::timeout_phase::total,
                    fmt::format("no response within {}ms", total.count()));
                converted.attempts = e.attempts;
                converted.context = std::move(e.context);
                converted.with_context(fmt::format("interrupted {}", errors::kind_name(e.kind)));
                co_return std::unexpected(std::move(converted));
            }
        }
        co_return result;
    }

private:
    io::io_context& io_;
    std::chrono::milliseconds default_total_;
};

} // namespace tern::pipeline
