#pragma once

#include <tern/coro/cancel_token.hpp>
#include <tern/coro/task.hpp>
#include <tern/io/io_context.hpp>
#include <tern/log/macros.hpp>
#include <tern/observe/metrics.hpp>
#include <tern/observe/tracing.hpp>
#include <tern/pipeline/chain.hpp>
#include <tern/pipeline/context.hpp>
#include <tern/pipeline/metrics_stage.hpp>
#include <tern/pipeline/pool_engine.hpp>
#include <tern/pipeline/retry_stage.hpp>
#include <tern/pipeline/timeout_stage.hpp>
#include <tern/pipeline/trace_stage.hpp>
#include <tern/pool/connection_pool.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <utility>

namespace tern::pipeline {

struct pipeline_options {
    pipeline::timeouts timeouts;
    retry_policy retry;
};

using transport_chain = chain<timeout_stage, retry_stage, trace_stage, metrics_stage, pool_engine>;

/// The request path: root span, context, then the stage chain.
class request_pipeline {
public:
    request_pipeline(io::io_context& io, std::shared_ptr<pool::connection_pool> pool, pipeline_options opts,
                     std::shared_ptr<observe::tracer> tracer, std::shared_ptr<observe::metrics_sink> metrics)
        : timeouts_(opts.timeouts)
        , tracer_(std::move(tracer))
        , chain_(timeout_stage(io, opts.timeouts.total),
                 retry_stage(io, std::move(opts.retry)),
                 trace_stage(tracer_),
                 metrics_stage(std::move(metrics)),
                 pool_engine(io, std::move(pool))) {}

    request_pipeline(const request_pipeline&) = delete;
    request_pipeline& operator=(const request_pipeline&) = delete;

    transport_chain& chain() noexcept { return chain_; }
    const pipeline::timeouts& timeouts() const noexcept { return timeouts_; }

    /// Total deadline that applies to `req`
    std::chrono::milliseconds total_for(const http::request_descriptor& req) {
        return chain_.stage<timeout_stage>().total_for(req);
    }

    /// Run `req` to a response head. The returned body is still open.
    coro::task<stage_result> run(http::request_descriptor req, coro::cancel_token token = {}) {
        pipeline_context ctx;
        ctx.token = token;
        ctx.phase_timeouts = timeouts_;

        std::optional<observe::trace_context> incoming;
        if (auto tp = req.headers.get("traceparent"); !tp.empty()) {
            incoming = observe::trace_context::parse(tp);
        }
        ctx.root_span = tracer_->start_root(std::string("tern ") + std::string(req.method.name()), incoming);
        ctx.root_span.set_attribute("url.full", req.target.to_string());

        auto result = co_await chain_.run(req, ctx);

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(io::clock::now() - ctx.started);
        if (result) {
            result->extensions[std::string(http::ext::elapsed_ms)] = static_cast<int64_t>(elapsed.count());
            tracer_->end(ctx.root_span, result->status >= 500 ? observe::span_status::error
                                                              : observe::span_status::ok);
        } else {
            TERN_LOG_DEBUG("{} {} failed after {}ms: {}", req.method.name(), req.target.authority(),
                           elapsed.count(), result.error().describe());
            tracer_->end(ctx.root_span, observe::span_status::error, result.error().describe());
        }
        co_return result;
    }

private:
    pipeline::timeouts timeouts_;
    std::shared_ptr<observe::tracer> tracer_;
    transport_chain chain_;
};

} // namespace tern::pipeline
