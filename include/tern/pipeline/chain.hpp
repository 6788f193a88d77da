#pragma once

#include <tern/coro/task.hpp>
#include <tern/pipeline/context.hpp>

#include <cstddef>
#include <tuple>
#include <utility>

namespace tern::pipeline {

/// Compile-time middleware chain.
///
/// Every stage but the last provides
/// `coro::task<stage_result> handle(const http::request_descriptor&, pipeline_context&, Next)`
/// and calls `co_await next(req, ctx)` zero or more times; the last one
/// (the engine) provides `handle(req, ctx)`. The request passed to next
/// must outlive the awaited call.
template<typename... Stages>
class chain {
    static_assert(sizeof...(Stages) > 0, "a chain needs at least a terminal stage");

public:
    explicit chain(Stages... stages) : stages_(std::move(stages)...) {}

    coro::task<stage_result> run(const http::request_descriptor& req, pipeline_context& ctx) {
        return invoke<0>(req, ctx);
    }

    template<size_t I>
    auto& stage() noexcept { return std::get<I>(stages_); }

    template<typename S>
    S& stage() noexcept { return std::get<S>(stages_); }

private:
    template<size_t I>
    struct next_fn {
        chain* self;

        coro::task<stage_result> operator()(const http::request_descriptor& req, pipeline_context& ctx) const {
            return self->template invoke<I>(req, ctx);
        }
    };

    template<size_t I>
    coro::task<stage_result> invoke(const http::request_descriptor& req, pipeline_context& ctx) {
        if constexpr (I + 1 == sizeof...(Stages)) {
            return std::get<I>(stages_).handle(req, ctx);
        } else {
            return std::get<I>(stages_).handle(req, ctx, next_fn<I + 1>{this});
        }
    }

    std::tuple<Stages...> stages_;
};

} // namespace tern::pipeline
