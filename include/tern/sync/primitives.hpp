#pragma once

#include <tern/coro/cancel_token.hpp>

#include <atomic>
#include <coroutine>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace tern::runtime {
void schedule_handle(std::coroutine_handle<> handle) noexcept;
}

namespace tern::sync {

/// Coroutine-aware event (manual reset)
class event {
public:
    event() = default;

    event(const event&) = delete;
    event& operator=(const event&) = delete;

    class wait_awaitable {
    public:
        explicit wait_awaitable(event& e) : event_(e) {}

        bool await_ready() const noexcept {
            return event_.signaled_.load(std::memory_order_acquire);
        }

        bool await_suspend(std::coroutine_handle<> awaiter) {
            std::lock_guard<std::mutex> guard(event_.mutex_);
            if (event_.signaled_.load(std::memory_order_relaxed)) {
                return false;
            }
            event_.waiters_.push_back(awaiter);
            return true;
        }

        void await_resume() const noexcept {}

    private:
        event& event_;
    };

    auto wait() {
        return wait_awaitable(*this);
    }

    void set() {
        std::vector<std::coroutine_handle<>> to_resume;
        {
            std::lock_guard<std::mutex> guard(mutex_);
            signaled_.store(true, std::memory_order_release);
            to_resume.swap(waiters_);
        }
        for (auto h : to_resume) {
            runtime::schedule_handle(h);
        }
    }

    void reset() {
        signaled_.store(false, std::memory_order_release);
    }

    bool is_set() const noexcept {
        return signaled_.load(std::memory_order_acquire);
    }

private:
    std::mutex mutex_;
    std::atomic<bool> signaled_{false};
    std::vector<std::coroutine_handle<>> waiters_;
};

/// Multi-producer multi-consumer channel.
///
/// Values are handed directly to a suspended receiver, so a woken receiver
/// always owns its value. A capacity of 0 means unbounded. Both send and
/// recv accept a cancel token; a cancelled recv yields std::nullopt and a
/// cancelled send yields false. After close() receivers drain what is
/// queued and then get std::nullopt; senders get false.
template<typename T>
class channel {
    struct core;

public:
    class send_awaitable;
    class recv_awaitable;

    explicit channel(size_t capacity = 0)
        : core_(std::make_shared<core>()) {
        core_->capacity = capacity;
    }

    ~channel() {
        close();
    }

    channel(const channel&) = delete;
    channel& operator=(const channel&) = delete;

    class send_awaitable {
    public:
        send_awaitable(std::shared_ptr<core> c, T value, coro::cancel_token token)
            : core_(std::move(c)), value_(std::move(value)), token_(std::move(token)) {}

        bool await_ready() {
            std::lock_guard<std::mutex> guard(core_->mutex);
            return try_complete_locked();
        }

        bool await_suspend(std::coroutine_handle<> awaiter) {
            handle_ = awaiter;
            id_ = core_->next_id.fetch_add(1, std::memory_order_relaxed);
            std::weak_ptr<core> weak = core_;
            uint64_t id = id_;
            // registered before queueing: once queued the frame may resume elsewhere
            reg_ = token_.on_cancel([weak, id] {
                if (auto c = weak.lock()) c->cancel_sender(id);
            });
            std::lock_guard<std::mutex> guard(core_->mutex);
            if (try_complete_locked()) {
                return false;
            }
            core_->senders.push_back(sender{id_, this});
            return true;
        }

        bool await_resume() {
            reg_.unregister();
            core_->flush_wakes();
            return ok_;
        }

    private:
        friend class channel;
        friend struct core;
        friend class recv_awaitable;

        // mutex held
        bool try_complete_locked() {
            if (core_->closed || token_.is_cancelled()) {
                ok_ = false;
                return true;
            }
            if (!core_->receivers.empty()) {
                auto r = core_->receivers.front();
                core_->receivers.pop_front();
                r.waiter->slot_.emplace(std::move(value_));
                core_->pending_wake.push_back(r.waiter->handle_);
                ok_ = true;
                return true;
            }
            if (core_->capacity == 0 || core_->queue.size() < core_->capacity) {
                core_->queue.push_back(std::move(value_));
                ok_ = true;
                return true;
            }
            return false;
        }

        std::shared_ptr<core> core_;
        T value_;
        coro::cancel_token token_;
        coro::cancel_registration reg_;
        std::coroutine_handle<> handle_;
        uint64_t id_ = 0;
        bool ok_ = false;
    };

    class recv_awaitable {
    public:
        recv_awaitable(std::shared_ptr<core> c, coro::cancel_token token)
            : core_(std::move(c)), token_(std::move(token)) {}

        bool await_ready() {
            std::lock_guard<std::mutex> guard(core_->mutex);
            return try_complete_locked();
        }

        bool await_suspend(std::coroutine_handle<> awaiter) {
            handle_ = awaiter;
            id_ = core_->next_id.fetch_add(1, std::memory_order_relaxed);
            std::weak_ptr<core> weak = core_;
            uint64_t id = id_;
            // registered before queueing: once queued the frame may resume elsewhere
            reg_ = token_.on_cancel([weak, id] {
                if (auto c = weak.lock()) c->cancel_receiver(id);
            });
            std::lock_guard<std::mutex> guard(core_->mutex);
            if (try_complete_locked()) {
                return false;
            }
            core_->receivers.push_back(receiver{id_, this});
            return true;
        }

        std::optional<T> await_resume() {
            reg_.unregister();
            core_->flush_wakes();
            return std::move(slot_);
        }

    private:
        friend class channel;
        friend struct core;
        friend class send_awaitable;

        // mutex held
        bool try_complete_locked() {
            if (!core_->queue.empty()) {
                slot_.emplace(std::move(core_->queue.front()));
                core_->queue.pop_front();
                core_->admit_sender_locked();
                return true;
            }
            if (core_->closed || token_.is_cancelled()) {
                return true;
            }
            if (!core_->senders.empty()) {
                auto s = core_->senders.front();
                core_->senders.pop_front();
                slot_.emplace(std::move(s.waiter->value_));
                s.waiter->ok_ = true;
                core_->pending_wake.push_back(s.waiter->handle_);
                return true;
            }
            return false;
        }

        std::shared_ptr<core> core_;
        coro::cancel_token token_;
        coro::cancel_registration reg_;
        std::coroutine_handle<> handle_;
        std::optional<T> slot_;
        uint64_t id_ = 0;
    };

    auto send(T value, coro::cancel_token token = {}) {
        return send_awaitable(core_, std::move(value), std::move(token));
    }

    auto recv(coro::cancel_token token = {}) {
        return recv_awaitable(core_, std::move(token));
    }

    bool try_send(T value) {
        std::coroutine_handle<> wake;
        {
            std::lock_guard<std::mutex> guard(core_->mutex);
            if (core_->closed) {
                return false;
            }
            if (!core_->receivers.empty()) {
                auto r = core_->receivers.front();
                core_->receivers.pop_front();
                r.waiter->slot_.emplace(std::move(value));
                wake = r.waiter->handle_;
            } else if (core_->capacity == 0 || core_->queue.size() < core_->capacity) {
                core_->queue.push_back(std::move(value));
            } else {
                return false;
            }
        }
        if (wake) {
            runtime::schedule_handle(wake);
        }
        return true;
    }

    std::optional<T> try_recv() {
        std::optional<T> out;
        {
            std::lock_guard<std::mutex> guard(core_->mutex);
            if (core_->queue.empty()) {
                return std::nullopt;
            }
            out.emplace(std::move(core_->queue.front()));
            core_->queue.pop_front();
            core_->admit_sender_locked();
        }
        core_->flush_wakes();
        return out;
    }

    void close() {
        std::vector<std::coroutine_handle<>> wake;
        {
            std::lock_guard<std::mutex> guard(core_->mutex);
            if (core_->closed) {
                return;
            }
            core_->closed = true;
            for (auto& r : core_->receivers) wake.push_back(r.waiter->handle_);
            for (auto& s : core_->senders) {
                s.waiter->ok_ = false;
                wake.push_back(s.waiter->handle_);
            }
            core_->receivers.clear();
            core_->senders.clear();
        }
        for (auto h : wake) {
            runtime::schedule_handle(h);
        }
    }

    bool is_closed() const {
        std::lock_guard<std::mutex> guard(core_->mutex);
        return core_->closed;
    }

    size_t size() const {
        std::lock_guard<std::mutex> guard(core_->mutex);
        return core_->queue.size();
    }

    size_t capacity() const noexcept { return core_->capacity; }

private:
    struct receiver {
        uint64_t id;
        recv_awaitable* waiter;
    };

    struct sender {
        uint64_t id;
        send_awaitable* waiter;
    };

    struct core {
        mutable std::mutex mutex;
        std::deque<T> queue;
        std::deque<receiver> receivers;
        std::deque<sender> senders;
        std::vector<std::coroutine_handle<>> pending_wake;
        size_t capacity = 0;
        bool closed = false;
        std::atomic<uint64_t> next_id{1};

        // mutex held: a slot was freed, move one blocked sender in.
        void admit_sender_locked() {
            if (senders.empty()) {
                return;
            }
            auto s = senders.front();
            senders.pop_front();
            queue.push_back(std::move(s.waiter->value_));
            s.waiter->ok_ = true;
            pending_wake.push_back(s.waiter->handle_);
        }

        void flush_wakes() {
            std::vector<std::coroutine_handle<>> wake;
            {
                std::lock_guard<std::mutex> guard(mutex);
                wake.swap(pending_wake);
            }
            for (auto h : wake) {
                runtime::schedule_handle(h);
            }
        }

        void cancel_receiver(uint64_t id) {
            std::coroutine_handle<> h;
            {
                std::lock_guard<std::mutex> guard(mutex);
                for (auto it = receivers.begin(); it != receivers.end(); ++it) {
                    if (it->id == id) {
                        h = it->waiter->handle_;
                        receivers.erase(it);
                        break;
                    }
                }
            }
            if (h) runtime::schedule_handle(h);
        }

        void cancel_sender(uint64_t id) {
            std::coroutine_handle<> h;
            {
                std::lock_guard<std::mutex> guard(mutex);
                for (auto it = senders.begin(); it != senders.end(); ++it) {
                    if (it->id == id) {
                        it->waiter->ok_ = false;
                        h = it->waiter->handle_;
                        senders.erase(it);
                        break;
                    }
                }
            }
            if (h) runtime::schedule_handle(h);
        }
    };

    std::shared_ptr<core> core_;
};

} // namespace tern::sync
