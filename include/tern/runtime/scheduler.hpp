#pragma once

#include <tern/coro/task.hpp>
#include <tern/log/macros.hpp>

#include <atomic>
#include <condition_variable>
#include <coroutine>
#include <deque>
#include <exception>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

namespace tern::runtime {

/// Fixed pool of worker threads resuming coroutine handles from one shared
/// run queue.
///
/// Coroutines resumed from a thread that is not a worker (the reactor, a
/// foreign caller) are routed back here through schedule_handle(), so
/// request code only ever runs on workers.
class scheduler {
public:
    explicit scheduler(size_t num_threads = std::thread::hardware_concurrency())
        : num_threads_(num_threads == 0 ? 1 : num_threads) {}

    ~scheduler() {
        shutdown();
    }

    scheduler(const scheduler&) = delete;
    scheduler& operator=(const scheduler&) = delete;

    void start() {
        bool expected = false;
        if (!running_.compare_exchange_strong(expected, true)) {
            return;
        }
        auto st = std::make_shared<run_state>();
        state_.store(st, std::memory_order_release);
        workers_.reserve(num_threads_);
        for (size_t i = 0; i < num_threads_; ++i) {
            workers_.emplace_back([this, st] { worker_loop(this, st); });
        }
        scheduler* none = nullptr;
        default_scheduler_.compare_exchange_strong(none, this);
        TERN_LOG_DEBUG("scheduler started with {} workers", num_threads_);
    }

    /// Stop the workers. Handles still queued are dropped without being
    /// resumed; their owners are expected to have been cancelled first.
    ///
    /// Called from one of its own workers, that worker is detached and
    /// leaves once the handle it is running returns. It only touches the
    /// shared run state from then on, so the scheduler may be destroyed
    /// underneath it.
    void shutdown() {
        bool expected = true;
        if (!running_.compare_exchange_strong(expected, false)) {
            return;
        }
        auto st = state_.load(std::memory_order_acquire);
        {
            std::lock_guard<std::mutex> lock(st->mutex);
            st->stopping = true;
        }
        st->cv.notify_all();
        for (auto& t : workers_) {
            if (t.joinable()) {
                if (t.get_id() == std::this_thread::get_id()) {
                    t.detach();
                    current_scheduler_ = nullptr;
                } else {
                    t.join();
                }
            }
        }
        workers_.clear();
        scheduler* self = this;
        default_scheduler_.compare_exchange_strong(self, nullptr);
        std::lock_guard<std::mutex> lock(st->mutex);
        if (!st->queue.empty()) {
            TERN_LOG_DEBUG("scheduler shutdown dropped {} queued handles", st->queue.size());
            st->queue.clear();
        }
    }

    /// Queue a handle. False once shutdown has begun (or before start());
    /// the handle is then left to the caller.
    bool spawn(std::coroutine_handle<> handle) {
        if (!handle) {
            return false;
        }
        auto st = state_.load(std::memory_order_acquire);
        if (!st) {
            return false;
        }
        {
            std::lock_guard<std::mutex> lock(st->mutex);
            if (st->stopping) {
                return false;
            }
            st->queue.push_back(handle);
        }
        st->cv.notify_one();
        return true;
    }

    [[nodiscard]] bool is_running() const noexcept {
        return running_.load(std::memory_order_acquire);
    }

    [[nodiscard]] size_t num_threads() const noexcept { return num_threads_; }

    [[nodiscard]] size_t pending_tasks() const {
        auto st = state_.load(std::memory_order_acquire);
        if (!st) {
            return 0;
        }
        std::lock_guard<std::mutex> lock(st->mutex);
        return st->queue.size();
    }

    /// Scheduler owning the calling worker thread, or nullptr.
    static scheduler* current() noexcept { return current_scheduler_; }

    /// First started scheduler still running; target for resumptions that
    /// originate outside any worker.
    static scheduler* fallback() noexcept {
        return default_scheduler_.load(std::memory_order_acquire);
    }

private:
    /// Shared by the scheduler and its worker threads
    struct run_state {
        std::mutex mutex;
        std::condition_variable cv;
        std::deque<std::coroutine_handle<>> queue;
        bool stopping = false;
    };

    static void worker_loop(scheduler* owner, std::shared_ptr<run_state> st) {
        current_scheduler_ = owner;
        for (;;) {
            std::coroutine_handle<> h;
            {
                std::unique_lock<std::mutex> lock(st->mutex);
                st->cv.wait(lock, [&st] { return st->stopping || !st->queue.empty(); });
                if (st->stopping) {
                    break;
                }
                h = st->queue.front();
                st->queue.pop_front();
            }
            if (!h.done()) {
                h.resume();
            }
        }
        current_scheduler_ = nullptr;
    }

    size_t num_threads_;
    std::atomic<bool> running_{false};
    std::atomic<std::shared_ptr<run_state>> state_;
    std::vector<std::thread> workers_;

    static inline thread_local scheduler* current_scheduler_ = nullptr;
    static inline std::atomic<scheduler*> default_scheduler_{nullptr};
};

inline scheduler* get_current_scheduler() noexcept {
    return scheduler::current();
}

/// Resume a handle on a worker: the calling worker's scheduler if any,
/// otherwise the fallback scheduler, otherwise inline.
inline void schedule_handle(std::coroutine_handle<> handle) noexcept {
    if (!handle) {
        return;
    }
    scheduler* sched = scheduler::current();
    if (!sched) {
        sched = scheduler::fallback();
    }
    if (sched && sched->is_running() && sched->spawn(handle)) {
        return;
    }
    handle.resume();
}

namespace detail {

template<typename T>
coro::task<void> block_on_wrapper(coro::task<T> t, std::promise<T>& out) {
    try {
        if constexpr (std::is_void_v<T>) {
            co_await std::move(t);
            out.set_value();
        } else {
            out.set_value(co_await std::move(t));
        }
    } catch (...) {
        out.set_exception(std::current_exception());
    }
}

} // namespace detail

/// Run a task on the scheduler and block the calling (non-worker) thread
/// until it finishes. Exceptions are rethrown here.
template<typename T>
T block_on(scheduler& sched, coro::task<T> t) {
    std::promise<T> out;
    auto fut = out.get_future();
    auto h = detail::block_on_wrapper(std::move(t), out).release();
    if (!sched.spawn(h)) {
        h.destroy();
        throw std::runtime_error("block_on: scheduler is not running");
    }
    return fut.get();
}

} // namespace tern::runtime
