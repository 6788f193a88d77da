#pragma once

#include "io_backend.hpp"
#include "epoll_backend.hpp"

#include <tern/log/macros.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

namespace tern::io {

/// Owns the readiness backend and the reactor thread that polls it.
///
/// Completions run on the reactor thread; awaitables only use them to hand
/// the coroutine back to the scheduler, so nothing blocks the reactor.
class io_context {
public:
    io_context() : backend_(std::make_unique<epoll_backend>()) {}

    explicit io_context(std::unique_ptr<io_backend> backend)
        : backend_(std::move(backend)) {}

    ~io_context() {
        stop();
        io_context* self = this;
        default_context_.compare_exchange_strong(self, nullptr);
    }

    io_context(const io_context&) = delete;
    io_context& operator=(const io_context&) = delete;

    /// Start the reactor thread. The first started context becomes the
    /// process default (see current_io_context()).
    void start() {
        bool expected = false;
        if (!running_.compare_exchange_strong(expected, true)) {
            return;
        }
        reactor_ = std::thread([this] {
            while (running_.load(std::memory_order_acquire)) {
                backend_->poll(std::chrono::milliseconds(-1));
            }
        });
        io_context* none = nullptr;
        default_context_.compare_exchange_strong(none, this);
        TERN_LOG_DEBUG("io_context reactor started");
    }

    void stop() {
        bool expected = true;
        if (!running_.compare_exchange_strong(expected, false)) {
            return;
        }
        backend_->notify();
        if (reactor_.joinable()) {
            reactor_.join();
        }
        TERN_LOG_DEBUG("io_context reactor stopped");
    }

    [[nodiscard]] bool is_running() const noexcept {
        return running_.load(std::memory_order_acquire);
    }

    /// Poll once from the calling thread (for contexts without a reactor).
    int poll(std::chrono::milliseconds timeout) {
        return backend_->poll(timeout);
    }

    [[nodiscard]] io_backend& backend() noexcept { return *backend_; }

    [[nodiscard]] size_t pending() const { return backend_->pending(); }

    /// Release reactor bookkeeping for an fd before closing it.
    void forget(int fd) { backend_->forget(fd); }

    static io_context* current() noexcept {
        return default_context_.load(std::memory_order_acquire);
    }

private:
    std::unique_ptr<io_backend> backend_;
    std::atomic<bool> running_{false};
    std::thread reactor_;

    static inline std::atomic<io_context*> default_context_{nullptr};
};

/// The process default io_context. Only valid once a context was started.
inline io_context& current_io_context() {
    io_context* ctx = io_context::current();
    if (!ctx) {
        throw std::runtime_error("no io_context is running");
    }
    return *ctx;
}

} // namespace tern::io
