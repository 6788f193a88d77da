#pragma once

#include <tern/coro/cancel_token.hpp>
#include <tern/errors/error.hpp>
#include <tern/errors/host_error.hpp>
#include <tern/log/macros.hpp>

#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <cstring>
#include <expected>
#include <functional>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <sys/eventfd.h>
#include <unistd.h>

namespace tern::bridge {

/// Outcome of an operation handed to a foreign caller, resolved exactly
/// once: with a value, with an error, or by the caller's cancel().
///
/// A foreign runtime waits in whichever way suits it:
/// - blocking: wait() / wait_for()
/// - callback: on_complete(), invoked on the resolving thread
/// - event loop: notify_fd() becomes readable once resolved
///
/// Resolving after cancel() is refused; the late value is handed to the
/// discard hook (a response gets its body closed) and never delivered.
template<typename T>
class pending_result {
public:
    using value_type = std::expected<T, errors::host_error>;

    pending_result() = default;

    ~pending_result() {
        if (event_fd_ >= 0) {
            ::close(event_fd_);
        }
    }

    pending_result(const pending_result&) = delete;
    pending_result& operator=(const pending_result&) = delete;

    bool ready() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_ != state::pending;
    }

    bool cancelled() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_ == state::cancelled;
    }

    /// Cancelled when the caller calls cancel(); the engine work behind this
    /// result runs on it.
    coro::cancel_token token() const noexcept { return cancel_.get_token(); }

    /// Block until resolved, then take the outcome.
    value_type wait() {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return state_ != state::pending; });
        }
        return take();
    }

    /// False if still pending after `timeout`
    template<typename Rep, typename Period>
    bool wait_for(std::chrono::duration<Rep, Period> timeout) const {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this] { return state_ != state::pending; });
    }

    /// Run `cb` once resolved; immediately if that already happened.
    void on_complete(std::function<void()> cb) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_ == state::pending) {
                callbacks_.push_back(std::move(cb));
                return;
            }
        }
        cb();
    }

    /// An eventfd readable once resolved. Owned by this object.
    int notify_fd() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (event_fd_ < 0) {
            event_fd_ = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
            if (event_fd_ < 0) {
                TERN_LOG_ERROR("eventfd() failed: {}", strerror(errno));
                throw std::runtime_error(std::string("eventfd() failed: ") + strerror(errno));
            }
            if (state_ != state::pending) {
                signal_fd_locked();
            }
        }
        return event_fd_;
    }

    /// Stop waiting. Cancels the engine work and resolves with a cancelled
    /// error unless a result is already there.
    bool cancel() {
        std::vector<std::function<void()>> callbacks;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_ != state::pending) {
                return false;
            }
            state_ = state::cancelled;
            result_ = std::unexpected(errors::to_host_error(errors::cancelled_error()));
            callbacks = resolve_locked();
        }
        cancel_.cancel(coro::cancel_reason::caller);
        run(callbacks);
        return true;
    }

    /// Take the outcome. Only the first call gets it.
    value_type take() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == state::pending) {
            return std::unexpected(errors::to_host_error(errors::internal_error("result is not ready")));
        }
        if (!result_) {
            return std::unexpected(errors::to_host_error(errors::internal_error("result was already taken")));
        }
        value_type out = std::move(*result_);
        result_.reset();
        return out;
    }

    /// Engine side. False if the caller cancelled first.
    bool complete(T value) {
        return resolve(value_type(std::move(value)));
    }

    bool fail(const errors::error& e) {
        return resolve(std::unexpected(errors::to_host_error(e)));
    }

    /// Called with a value that arrived after cancel()
    void set_discard(std::function<void(T&)> fn) {
        std::lock_guard<std::mutex> lock(mutex_);
        discard_ = std::move(fn);
    }

private:
    enum class state { pending, completed, cancelled };

    bool resolve(value_type outcome) {
        std::vector<std::function<void()>> callbacks;
        std::function<void(T&)> discard;
        bool accepted = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_ == state::pending) {
                accepted = true;
                state_ = state::completed;
                result_ = std::move(outcome);
                callbacks = resolve_locked();
            } else {
                discard = discard_;
            }
        }
        if (accepted) {
            run(callbacks);
            return true;
        }
        if (discard && outcome) {
            discard(*outcome);
        }
        return false;
    }

    std::vector<std::function<void()>> resolve_locked() {
        signal_fd_locked();
        cv_.notify_all();
        return std::exchange(callbacks_, {});
    }

    void signal_fd_locked() {
        if (event_fd_ >= 0) {
            uint64_t one = 1;
            if (::write(event_fd_, &one, sizeof(one)) < 0 && errno != EAGAIN) {
                TERN_LOG_ERROR("eventfd write failed: {}", strerror(errno));
            }
        }
    }

    static void run(std::vector<std::function<void()>>& callbacks) {
        for (auto& cb : callbacks) {
            cb();
        }
    }

    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    state state_ = state::pending;
    std::optional<value_type> result_;
    std::vector<std::function<void()>> callbacks_;
    std::function<void(T&)> discard_;
    coro::cancel_source cancel_;
    int event_fd_ = -1;
};

/// One pulled body chunk; std::nullopt is end of stream
using chunk_pending = pending_result<std::optional<std::string>>;

} // namespace tern::bridge
