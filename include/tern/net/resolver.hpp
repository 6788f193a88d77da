#pragma once

#include <tern/coro/cancel_token.hpp>
#include <tern/log/macros.hpp>
#include <tern/runtime/scheduler.hpp>

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <atomic>
#include <condition_variable>
#include <coroutine>
#include <cstring>
#include <deque>
#include <expected>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace tern::net {

/// IPv4 or IPv6 socket address
struct socket_address {
    sockaddr_storage storage{};
    socklen_t length = 0;

    int family() const noexcept { return storage.ss_family; }

    const sockaddr* data() const noexcept {
        return reinterpret_cast<const sockaddr*>(&storage);
    }

    uint16_t port() const noexcept {
        if (family() == AF_INET6) {
            return ntohs(reinterpret_cast<const sockaddr_in6*>(&storage)->sin6_port);
        }
        return ntohs(reinterpret_cast<const sockaddr_in*>(&storage)->sin_port);
    }

    std::string to_string() const {
        char buf[INET6_ADDRSTRLEN] = {};
        if (family() == AF_INET6) {
            inet_ntop(AF_INET6, &reinterpret_cast<const sockaddr_in6*>(&storage)->sin6_addr, buf, sizeof(buf));
            return std::string("[") + buf + "]:" + std::to_string(port());
        }
        inet_ntop(AF_INET, &reinterpret_cast<const sockaddr_in*>(&storage)->sin_addr, buf, sizeof(buf));
        return std::string(buf) + ":" + std::to_string(port());
    }

    static socket_address from(const sockaddr* sa, socklen_t len) {
        socket_address a;
        std::memcpy(&a.storage, sa, len);
        a.length = len;
        return a;
    }
};

/// Outcome of a lookup: addresses, or a getaddrinfo error code (EAI_*).
using resolve_result = std::expected<std::vector<socket_address>, int>;

namespace detail {

inline resolve_result blocking_lookup(const std::string& host, uint16_t port, int extra_flags) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_ADDRCONFIG | extra_flags;

    std::string h = host;
    // bracketed IPv6 literal as it appears in URLs
    if (h.size() > 2 && h.front() == '[' && h.back() == ']') {
        h = h.substr(1, h.size() - 2);
    }
    std::string service = std::to_string(port);
    addrinfo* res = nullptr;
    int rc = getaddrinfo(h.c_str(), service.c_str(), &hints, &res);
    if (rc != 0) {
        return std::unexpected(rc);
    }
    std::vector<socket_address> out;
    for (addrinfo* ai = res; ai; ai = ai->ai_next) {
        out.push_back(socket_address::from(ai->ai_addr, ai->ai_addrlen));
    }
    freeaddrinfo(res);
    if (out.empty()) {
        return std::unexpected(EAI_NONAME);
    }
    return out;
}

struct lookup_job {
    std::string host;
    uint16_t port = 0;
    resolve_result result{std::unexpected(EAI_AGAIN)};
    std::atomic<bool> claimed{false};
    std::coroutine_handle<> waiter;
};

} // namespace detail

/// Runs getaddrinfo on helper threads so a lookup suspends the request
/// instead of a scheduler worker. Numeric hosts complete inline.
class resolver {
public:
    explicit resolver(size_t threads = 2) {
        for (size_t i = 0; i < (threads == 0 ? 1 : threads); ++i) {
            threads_.emplace_back([this] { run(); });
        }
    }

    ~resolver() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopping_ = true;
        }
        cv_.notify_all();
        for (auto& t : threads_) {
            if (t.joinable()) t.join();
        }
        // unfinished jobs resume their waiters with EAI_CANCELED
        for (auto& job : queue_) {
            finish(job, std::unexpected(EAI_CANCELED));
        }
    }

    resolver(const resolver&) = delete;
    resolver& operator=(const resolver&) = delete;

    class resolve_awaitable {
    public:
        resolve_awaitable(resolver& r, std::string host, uint16_t port, coro::cancel_token token)
            : resolver_(r), token_(std::move(token)), job_(std::make_shared<detail::lookup_job>()) {
            job_->host = std::move(host);
            job_->port = port;
        }

        bool await_ready() {
            if (token_.is_cancelled()) {
                job_->result = std::unexpected(EAI_CANCELED);
                return true;
            }
            auto numeric = detail::blocking_lookup(job_->host, job_->port, AI_NUMERICHOST);
            if (numeric) {
                job_->result = std::move(numeric);
                return true;
            }
            return false;
        }

        void await_suspend(std::coroutine_handle<> h) {
            job_->waiter = h;
            std::weak_ptr<detail::lookup_job> weak = job_;
            reg_ = token_.on_cancel([weak] {
                if (auto job = weak.lock()) {
                    resolver::finish(job, std::unexpected(EAI_CANCELED));
                }
            });
            resolver_.enqueue(job_);
        }

        resolve_result await_resume() {
            reg_.unregister();
            return std::move(job_->result);
        }

    private:
        resolver& resolver_;
        coro::cancel_token token_;
        coro::cancel_registration reg_;
        std::shared_ptr<detail::lookup_job> job_;
    };

    resolve_awaitable resolve(std::string host, uint16_t port, coro::cancel_token token = {}) {
        return resolve_awaitable(*this, std::move(host), port, std::move(token));
    }

private:
    static void finish(const std::shared_ptr<detail::lookup_job>& job, resolve_result result) {
        if (job->claimed.exchange(true, std::memory_order_acq_rel)) {
            return;
        }
        job->result = std::move(result);
        runtime::schedule_handle(job->waiter);
    }

    void enqueue(std::shared_ptr<detail::lookup_job> job) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            queue_.push_back(std::move(job));
        }
        cv_.notify_one();
    }

    void run() {
        for (;;) {
            std::shared_ptr<detail::lookup_job> job;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
                if (stopping_) {
                    return;
                }
                job = std::move(queue_.front());
                queue_.pop_front();
            }
            if (job->claimed.load(std::memory_order_acquire)) {
                continue;  // cancelled while queued
            }
            auto result = detail::blocking_lookup(job->host, job->port, 0);
            if (!result) {
                TERN_LOG_DEBUG("resolve {} failed: {}", job->host, gai_strerror(result.error()));
            }
            finish(job, std::move(result));
        }
    }

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::shared_ptr<detail::lookup_job>> queue_;
    std::vector<std::thread> threads_;
    bool stopping_ = false;
};

} // namespace tern::net
