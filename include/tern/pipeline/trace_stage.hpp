#pragma once

#include <tern/coro/task.hpp>
#include <tern/errors/error.hpp>
#include <tern/observe/tracing.hpp>
#include <tern/pipeline/context.hpp>

#include <memory>
#include <string>
#include <utility>

namespace tern::pipeline {

/// One child span per attempt, propagated to the server as traceparent
class trace_stage {
public:
    explicit trace_stage(std::shared_ptr<observe::tracer> tracer)
        : tracer_(std::move(tracer)) {}

    const observe::tracer& tracer() const noexcept { return *tracer_; }

    template<typename Next>
    coro::task<stage_result> handle(const http::request_descriptor& req, pipeline_context& ctx, Next next) {
        observe::span attempt_span = ctx.root_span.valid()
            ? tracer_->start_child(ctx.root_span, std::string("HTTP ") + std::string(req.method.name()))
            : tracer_->start_root(std::string("HTTP ") + std::string(req.method.name()));
        attempt_span.set_attribute("http.method", std::string(req.method.name()));
        attempt_span.set_attribute("server.address", req.target.host);
        attempt_span.set_attribute("url.path", req.target.path.empty() ? std::string("/") : req.target.path);
        attempt_span.set_attribute("tern.attempt", std::to_string(ctx.attempt));

        auto traced = req.with_header("traceparent", attempt_span.context.traceparent());
        auto result = co_await next(traced, ctx);

        if (result) {
            attempt_span.set_attribute("http.status_code", std::to_string(result->status));
            if (result->status >= 500) {
                tracer_->end(attempt_span, observe::span_status::error,
                             "status " + std::to_string(result->status));
            } else {
                tracer_->end(attempt_span, observe::span_status::ok);
            }
            result->extensions[std::string(http::ext::trace_id)] = attempt_span.context.trace_id_hex();
        } else {
            attempt_span.set_attribute("error.type", std::string(errors::kind_name(result.error().kind)));
            tracer_->end(attempt_span, observe::span_status::error, result.error().describe());
        }
        co_return result;
    }

private:
    std::shared_ptr<observe::tracer> tracer_;
};

} // namespace tern::pipeline
