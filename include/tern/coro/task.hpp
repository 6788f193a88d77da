#pragma once

#include <atomic>
#include <coroutine>
#include <exception>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

namespace tern::runtime {
class scheduler;
scheduler* get_current_scheduler() noexcept;
void schedule_handle(std::coroutine_handle<> handle) noexcept;
}

namespace tern::coro {

template<typename T = void>
class task;

template<typename T = void>
class join_handle;

namespace detail {

struct final_awaiter {
    [[nodiscard]] bool await_ready() const noexcept { return false; }

    template<typename Promise>
    [[nodiscard]] std::coroutine_handle<> await_suspend(std::coroutine_handle<Promise> h) noexcept {
        auto& p = h.promise();
        if (p.continuation_) {
            return p.continuation_;
        }
        if (p.detached_) {
            h.destroy();
        }
        return std::noop_coroutine();
    }

    void await_resume() const noexcept {}
};

/// State shared by every task promise: continuation, captured exception
/// and the detached flag set by release().
struct promise_base {
    std::coroutine_handle<> continuation_;
    std::exception_ptr exception_;
    bool detached_ = false;

    [[nodiscard]] std::suspend_always initial_suspend() noexcept { return {}; }
    [[nodiscard]] final_awaiter final_suspend() noexcept { return {}; }

    void unhandled_exception() noexcept {
        exception_ = std::current_exception();
    }

    void rethrow_if_failed() const {
        if (exception_) {
            std::rethrow_exception(exception_);
        }
    }
};

template<typename T>
struct promise_value : promise_base {
    std::optional<T> value_;

    template<typename U>
    void return_value(U&& value) {
        value_.emplace(std::forward<U>(value));
    }

    T take() {
        rethrow_if_failed();
        return std::move(*value_);
    }
};

template<>
struct promise_value<void> : promise_base {
    void return_void() noexcept {}

    void take() {
        rethrow_if_failed();
    }
};

/// Result slot shared between a spawned task and its join_handle.
template<typename T>
struct join_state {
    using slot_type = std::conditional_t<std::is_void_v<T>, std::monostate, T>;

    std::optional<slot_type> value_;
    std::exception_ptr exception_;
    std::atomic<void*> waiter_{nullptr};
    std::atomic<bool> completed_{false};

    template<typename... U>
    void set_value(U&&... value) {
        value_.emplace(std::forward<U>(value)...);
        complete();
    }

    void set_exception(std::exception_ptr ex) {
        exception_ = std::move(ex);
        complete();
    }

    void complete() {
        completed_.store(true, std::memory_order_release);
        if (void* addr = waiter_.exchange(nullptr, std::memory_order_acq_rel)) {
            runtime::schedule_handle(std::coroutine_handle<>::from_address(addr));
        }
    }

    [[nodiscard]] bool is_completed() const noexcept {
        return completed_.load(std::memory_order_acquire);
    }

    /// Returns false if the task finished while the waiter was being stored.
    bool set_waiter(std::coroutine_handle<> h) noexcept {
        void* expected = nullptr;
        if (!waiter_.compare_exchange_strong(expected, h.address(),
                std::memory_order_release, std::memory_order_acquire)) {
            return false;
        }
        if (completed_.load(std::memory_order_acquire)) {
            // complete() may have missed the waiter; whoever takes it back resumes it
            if (waiter_.exchange(nullptr, std::memory_order_acq_rel)) {
                return false;
            }
        }
        return true;
    }

    T get() {
        if (exception_) {
            std::rethrow_exception(exception_);
        }
        if constexpr (!std::is_void_v<T>) {
            return std::move(*value_);
        }
    }
};

} // namespace detail

/// Awaitable handle to a task started with task<T>::spawn().
template<typename T>
class join_handle {
public:
    explicit join_handle(std::shared_ptr<detail::join_state<T>> state) noexcept
        : state_(std::move(state)) {}

    join_handle(join_handle&&) noexcept = default;
    join_handle& operator=(join_handle&&) noexcept = default;
    join_handle(const join_handle&) = delete;
    join_handle& operator=(const join_handle&) = delete;

    [[nodiscard]] bool await_ready() const noexcept { return state_->is_completed(); }
    bool await_suspend(std::coroutine_handle<> awaiter) noexcept { return state_->set_waiter(awaiter); }
    T await_resume() { return state_->get(); }

    [[nodiscard]] bool is_ready() const noexcept { return state_->is_completed(); }

private:
    std::shared_ptr<detail::join_state<T>> state_;
};

/// Lazily started coroutine. Awaiting it starts it and transfers control
/// back to the awaiter when it finishes.
template<typename T>
class task {
public:
    struct promise_type : detail::promise_value<T> {
        [[nodiscard]] task get_return_object() noexcept {
            return task{std::coroutine_handle<promise_type>::from_promise(*this)};
        }
    };

    using handle_type = std::coroutine_handle<promise_type>;

    explicit task(handle_type handle) noexcept : handle_(handle) {}
    task(task&& other) noexcept : handle_(std::exchange(other.handle_, nullptr)) {}

    task& operator=(task&& other) noexcept {
        if (this != &other) {
            if (handle_) handle_.destroy();
            handle_ = std::exchange(other.handle_, nullptr);
        }
        return *this;
    }

    ~task() { if (handle_) handle_.destroy(); }

    task(const task&) = delete;
    task& operator=(const task&) = delete;

    [[nodiscard]] handle_type handle() const noexcept { return handle_; }

    /// Give up ownership; the frame destroys itself when it completes.
    [[nodiscard]] handle_type release() noexcept {
        if (handle_) handle_.promise().detached_ = true;
        return std::exchange(handle_, nullptr);
    }

    /// Fire-and-forget on the current scheduler.
    void go() {
        runtime::schedule_handle(release());
    }

    [[nodiscard]] join_handle<T> spawn();

    [[nodiscard]] bool await_ready() const noexcept { return false; }

    [[nodiscard]] std::coroutine_handle<> await_suspend(std::coroutine_handle<> awaiter) noexcept {
        handle_.promise().continuation_ = awaiter;
        return handle_;
    }

    T await_resume() {
        return handle_.promise().take();
    }

private:
    handle_type handle_;
};

namespace detail {

template<typename T>
task<void> join_wrapper(task<T> t, std::shared_ptr<join_state<T>> state) {
    try {
        if constexpr (std::is_void_v<T>) {
            co_await std::move(t);
            state->set_value();
        } else {
            state->set_value(co_await std::move(t));
        }
    } catch (...) {
        state->set_exception(std::current_exception());
    }
}

} // namespace detail

template<typename T>
join_handle<T> task<T>::spawn() {
    auto state = std::make_shared<detail::join_state<T>>();
    detail::join_wrapper(std::move(*this), state).go();
    return join_handle<T>(std::move(state));
}

} // namespace tern::coro
