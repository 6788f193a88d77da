#pragma once

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace tern::coro {

/// Result of a cancellable wait
enum class cancel_result {
    completed,
    cancelled
};

/// Who asked for cancellation. Lets a timeout be told apart from a caller
/// abandoning the request when both end up cancelling the same attempt.
enum class cancel_reason : uint8_t {
    none = 0,
    caller,
    timeout,
    shutdown
};

namespace detail {

struct cancel_state {
    std::atomic<bool> cancelled{false};
    std::atomic<cancel_reason> reason{cancel_reason::none};
    std::mutex mutex;
    std::vector<std::pair<uint64_t, std::function<void()>>> callbacks;
    uint64_t next_id = 1;

    /// Returns 0 if the state was already cancelled; the callback has then
    /// been invoked on the calling thread.
    uint64_t add_callback(std::function<void()> cb) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (!cancelled.load(std::memory_order_relaxed)) {
                uint64_t id = next_id++;
                callbacks.emplace_back(id, std::move(cb));
                return id;
            }
        }
        cb();
        return 0;
    }

    void remove_callback(uint64_t id) {
        std::lock_guard<std::mutex> lock(mutex);
        std::erase_if(callbacks, [id](const auto& p) { return p.first == id; });
    }

    void trigger(cancel_reason why) {
        std::vector<std::pair<uint64_t, std::function<void()>>> to_invoke;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (cancelled.load(std::memory_order_relaxed)) {
                return;
            }
            reason.store(why, std::memory_order_relaxed);
            cancelled.store(true, std::memory_order_release);
            to_invoke.swap(callbacks);
        }
        for (auto& entry : to_invoke) {
            entry.second();
        }
    }
};

} // namespace detail

/// Unregisters its callback on destruction.
class cancel_registration {
public:
    cancel_registration() = default;
    cancel_registration(cancel_registration&& other) noexcept
        : state_(std::move(other.state_)), id_(std::exchange(other.id_, 0)) {}

    cancel_registration& operator=(cancel_registration&& other) noexcept {
        if (this != &other) {
            unregister();
            state_ = std::move(other.state_);
            id_ = std::exchange(other.id_, 0);
        }
        return *this;
    }

    ~cancel_registration() { unregister(); }

    cancel_registration(const cancel_registration&) = delete;
    cancel_registration& operator=(const cancel_registration&) = delete;

    void unregister() {
        if (state_ && id_ != 0) {
            state_->remove_callback(id_);
        }
        id_ = 0;
        state_.reset();
    }

private:
    friend class cancel_token;

    cancel_registration(std::shared_ptr<detail::cancel_state> state, uint64_t id)
        : state_(std::move(state)), id_(id) {}

    std::shared_ptr<detail::cancel_state> state_;
    uint64_t id_ = 0;
};

/// Copyable view on a cancellation state. A default constructed token is
/// never cancelled.
class cancel_token {
public:
    using registration = cancel_registration;

    cancel_token() = default;

    bool is_cancelled() const noexcept {
        return state_ && state_->cancelled.load(std::memory_order_acquire);
    }

    cancel_reason reason() const noexcept {
        return is_cancelled() ? state_->reason.load(std::memory_order_relaxed)
                              : cancel_reason::none;
    }

    /// True if this token can ever become cancelled.
    bool can_be_cancelled() const noexcept { return state_ != nullptr; }

    explicit operator bool() const noexcept {
        return !is_cancelled();
    }

    /// Invoke callback on cancellation (immediately if already cancelled).
    /// The callback may run on any thread.
    template<typename F>
    [[nodiscard]] registration on_cancel(F&& callback) const {
        if (!state_) {
            return registration{};
        }
        uint64_t id = state_->add_callback(std::function<void()>(std::forward<F>(callback)));
        return registration{state_, id};
    }

private:
    friend class cancel_source;

    explicit cancel_token(std::shared_ptr<detail::cancel_state> state)
        : state_(std::move(state)) {}

    std::shared_ptr<detail::cancel_state> state_;
};

/// Owner of a cancellation state.
///
/// A linked source also becomes cancelled when its parent token does, with
/// the parent's reason, while cancelling the linked source leaves the
/// parent untouched:
/// ```cpp
/// cancel_source attempt = cancel_source::linked(caller_token);
/// attempt.cancel(cancel_reason::timeout);   // caller_token unaffected
/// ```
class cancel_source {
public:
    cancel_source()
        : state_(std::make_shared<detail::cancel_state>()) {}

    static cancel_source linked(const cancel_token& parent) {
        cancel_source child;
        child.link(parent);
        return child;
    }

    /// Cancelled by whichever parent fires first
    static cancel_source linked(const cancel_token& first, const cancel_token& second) {
        cancel_source child;
        child.link(first);
        child.link(second);
        return child;
    }

    cancel_token get_token() const noexcept {
        return cancel_token{state_};
    }

    void cancel(cancel_reason why = cancel_reason::caller) {
        if (state_) {
            state_->trigger(why);
        }
    }

    bool is_cancelled() const noexcept {
        return state_ && state_->cancelled.load(std::memory_order_acquire);
    }

    cancel_reason reason() const noexcept {
        return get_token().reason();
    }

private:
    void link(const cancel_token& parent) {
        if (!parent.state_) {
            return;
        }
        std::weak_ptr<detail::cancel_state> weak = state_;
        std::weak_ptr<detail::cancel_state> parent_weak = parent.state_;
        auto reg = std::make_shared<cancel_registration>(
            parent.on_cancel([weak, parent_weak]() {
                auto s = weak.lock();
                auto p = parent_weak.lock();
                if (s) {
                    s->trigger(p ? p->reason.load(std::memory_order_relaxed) : cancel_reason::caller);
                }
            }));
        parent_links_.push_back(std::move(reg));
    }

    std::shared_ptr<detail::cancel_state> state_;
    std::vector<std::shared_ptr<cancel_registration>> parent_links_;
};

} // namespace tern::coro
