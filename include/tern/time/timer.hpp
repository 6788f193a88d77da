#pragma once

#include <tern/io/io_awaitables.hpp>
#include <tern/coro/cancel_token.hpp>

#include <atomic>
#include <chrono>
#include <memory>

namespace tern::time {

/// Cancellable sleep. Resolves to cancel_result::cancelled if the token
/// fires before the duration elapses.
class sleep_awaitable {
public:
    template<typename Rep, typename Period>
    sleep_awaitable(io::io_context& ctx, std::chrono::duration<Rep, Period> duration,
                    coro::cancel_token token = {})
        : inner_(ctx,
                 io::clock::now() + std::chrono::duration_cast<io::clock::duration>(duration),
                 std::move(token))
        , zero_(duration <= std::chrono::duration<Rep, Period>::zero()) {}

    bool await_ready() noexcept {
        return zero_ || inner_.await_ready();
    }

    void await_suspend(std::coroutine_handle<> h) {
        inner_.await_suspend(h);
    }

    coro::cancel_result await_resume() noexcept {
        if (zero_) {
            return coro::cancel_result::completed;
        }
        return inner_.await_resume().success() ? coro::cancel_result::completed
                                               : coro::cancel_result::cancelled;
    }

private:
    io::timer_awaitable inner_;
    bool zero_;
};

template<typename Rep, typename Period>
sleep_awaitable sleep_for(io::io_context& ctx, std::chrono::duration<Rep, Period> d,
                          coro::cancel_token token = {}) {
    return sleep_awaitable(ctx, d, std::move(token));
}

/// Cancels a source with cancel_reason::timeout when a deadline passes.
///
/// Destroying (or disarm()ing) the guard before the deadline removes the
/// timer. expired() reports whether the deadline won the race.
class deadline_guard {
public:
    deadline_guard() = default;

    deadline_guard(io::io_context& ctx, io::clock::time_point deadline, coro::cancel_source target)
        : backend_(&ctx.backend())
        , state_(std::make_shared<shared>()) {
        state_->target = std::move(target);
        id_ = backend_->next_id();
        auto st = state_;
        backend_->submit_timer(id_, deadline, {}, [st](int res) {
            if (res == 0) {
                st->expired.store(true, std::memory_order_release);
                st->target.cancel(coro::cancel_reason::timeout);
            }
        });
    }

    template<typename Rep, typename Period>
    deadline_guard(io::io_context& ctx, std::chrono::duration<Rep, Period> timeout, coro::cancel_source target)
        : deadline_guard(ctx,
                         io::clock::now() + std::chrono::duration_cast<io::clock::duration>(timeout),
                         std::move(target)) {}

    deadline_guard(deadline_guard&& other) noexcept
        : backend_(std::exchange(other.backend_, nullptr))
        , state_(std::move(other.state_))
        , id_(std::exchange(other.id_, 0)) {}

    deadline_guard& operator=(deadline_guard&& other) noexcept {
        if (this != &other) {
            disarm();
            backend_ = std::exchange(other.backend_, nullptr);
            state_ = std::move(other.state_);
            id_ = std::exchange(other.id_, 0);
        }
        return *this;
    }

    deadline_guard(const deadline_guard&) = delete;
    deadline_guard& operator=(const deadline_guard&) = delete;

    ~deadline_guard() { disarm(); }

    void disarm() {
        if (backend_ && id_ != 0) {
            backend_->cancel(id_);
        }
        id_ = 0;
    }

    [[nodiscard]] bool armed() const noexcept { return state_ != nullptr; }

    [[nodiscard]] bool expired() const noexcept {
        return state_ && state_->expired.load(std::memory_order_acquire);
    }

private:
    struct shared {
        std::atomic<bool> expired{false};
        coro::cancel_source target;
    };

    io::io_backend* backend_ = nullptr;
    std::shared_ptr<shared> state_;
    io::wait_id id_ = 0;
};

} // namespace tern::time
