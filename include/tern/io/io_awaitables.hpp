#pragma once

#include "io_context.hpp"

#include <tern/coro/cancel_token.hpp>
#include <tern/runtime/scheduler.hpp>

#include <cerrno>
#include <coroutine>

namespace tern::io {

/// Base class for reactor awaitables.
///
/// The cancel callback only carries the wait id, never `this`: once the
/// completion has handed the coroutine back to the scheduler the frame may
/// be gone, and a late cancel must find nothing to do.
class io_awaitable_base {
public:
    io_awaitable_base(io_context& ctx, coro::cancel_token token) noexcept
        : ctx_(ctx), token_(std::move(token)) {}

    bool await_ready() noexcept {
        if (token_.is_cancelled()) {
            result_ = io_result{-ECANCELED};
            return true;
        }
        return false;
    }

    io_result await_resume() noexcept {
        reg_.unregister();
        return result_;
    }

protected:
    completion_fn resume_with(std::coroutine_handle<> awaiter) {
        return [this, awaiter](int res) {
            result_ = io_result{res};
            runtime::schedule_handle(awaiter);
        };
    }

    wait_id arm_cancel() {
        wait_id id = ctx_.backend().next_id();
        io_backend* backend = &ctx_.backend();
        reg_ = token_.on_cancel([backend, id] { backend->cancel(id); });
        return id;
    }

    io_context& ctx_;
    coro::cancel_token token_;
    coro::cancel_registration reg_;
    io_result result_{0};
};

/// Suspend until fd is readable or writable.
class poll_awaitable : public io_awaitable_base {
public:
    poll_awaitable(io_context& ctx, int fd, readiness dir, coro::cancel_token token = {}) noexcept
        : io_awaitable_base(ctx, std::move(token)), fd_(fd), dir_(dir) {}

    void await_suspend(std::coroutine_handle<> awaiter) {
        wait_id id = arm_cancel();
        ctx_.backend().submit_wait(id, fd_, dir_, token_, resume_with(awaiter));
    }

private:
    int fd_;
    readiness dir_;
};

/// Suspend until a steady-clock deadline.
class timer_awaitable : public io_awaitable_base {
public:
    timer_awaitable(io_context& ctx, clock::time_point deadline, coro::cancel_token token = {}) noexcept
        : io_awaitable_base(ctx, std::move(token)), deadline_(deadline) {}

    void await_suspend(std::coroutine_handle<> awaiter) {
        wait_id id = arm_cancel();
        ctx_.backend().submit_timer(id, deadline_, token_, resume_with(awaiter));
    }

private:
    clock::time_point deadline_;
};

inline poll_awaitable poll_read(io_context& ctx, int fd, coro::cancel_token token = {}) {
    return poll_awaitable(ctx, fd, readiness::readable, std::move(token));
}

inline poll_awaitable poll_write(io_context& ctx, int fd, coro::cancel_token token = {}) {
    return poll_awaitable(ctx, fd, readiness::writable, std::move(token));
}

} // namespace tern::io
