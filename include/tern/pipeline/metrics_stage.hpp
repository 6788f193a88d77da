#pragma once

#include <tern/coro/task.hpp>
#include <tern/errors/error.hpp>
#include <tern/io/io_backend.hpp>
#include <tern/observe/metrics.hpp>
#include <tern/pipeline/context.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <utility>

namespace tern::pipeline {

/// Records every attempt and counts response bytes as they are pulled
class metrics_stage {
public:
    explicit metrics_stage(std::shared_ptr<observe::metrics_sink> sink)
        : sink_(std::move(sink)) {}

    const std::shared_ptr<observe::metrics_sink>& sink() const noexcept { return sink_; }

    template<typename Next>
    coro::task<stage_result> handle(const http::request_descriptor& req, pipeline_context& ctx, Next next) {
        auto start = io::clock::now();
        uint64_t bytes_before = ctx.request_bytes;

        auto result = co_await next(req, ctx);

        if (!sink_) {
            co_return result;
        }
        observe::attempt_record rec;
        rec.method = std::string(req.method.name());
        rec.host = req.target.host;
        rec.outcome = result ? std::string(http::status_class(result->status))
                             : std::string(errors::kind_name(result.error().kind));
        rec.latency = std::chrono::duration_cast<std::chrono::microseconds>(io::clock::now() - start);
        rec.request_bytes = ctx.request_bytes - bytes_before;
        rec.attempt = ctx.attempt;
        sink_->record_attempt(rec);

        if (result) {
            result->body.set_observer([sink = sink_, host = req.target.host](size_t n) {
                sink->record_response_bytes(host, n);
            });
        }
        co_return result;
    }

private:
    std::shared_ptr<observe::metrics_sink> sink_;
};

} // namespace tern::pipeline
