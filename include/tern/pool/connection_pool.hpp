#pragma once

#include <tern/coro/cancel_token.hpp>
#include <tern/coro/task.hpp>
#include <tern/errors/error.hpp>
#include <tern/http/http2_session.hpp>
#include <tern/http/http_common.hpp>
#include <tern/io/io_context.hpp>
#include <tern/log/macros.hpp>
#include <tern/net/resolver.hpp>
#include <tern/net/stream.hpp>
#include <tern/net/tcp.hpp>
#include <tern/runtime/scheduler.hpp>
#include <tern/time/timer.hpp>
#include <tern/tls/tls_context.hpp>
#include <tern/tls/tls_stream.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <iterator>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <netdb.h>

namespace tern::pool {

/// Connection pool settings
struct pool_config {
    size_t max_idle_per_host = 64;
    std::chrono::milliseconds idle_timeout{90000};
    std::chrono::milliseconds reap_interval{5000};
    bool http2 = true;                     ///< offer h2 in ALPN
    bool http2_prior_knowledge = false;    ///< speak HTTP/2 on cleartext connections
    tls::tls_options tls;
    net::tcp_options tcp;
    size_t resolver_threads = 2;
    http::h2_session::options h2;
};

/// Connections are shared only between requests with the same key
struct pool_key {
    std::string scheme;
    std::string host;
    uint16_t port = 0;

    static pool_key from(const http::url& u) {
        return pool_key{u.scheme, u.host, u.effective_port()};
    }

    bool secure() const noexcept { return scheme == "https"; }

    std::string to_string() const {
        std::string h = host.find(':') != std::string::npos ? "[" + host + "]" : host;
        return scheme + "://" + h + ":" + std::to_string(port);
    }

    bool operator==(const pool_key&) const = default;
};

struct pool_key_hash {
    size_t operator()(const pool_key& k) const noexcept {
        size_t h = std::hash<std::string>{}(k.scheme);
        h ^= std::hash<std::string>{}(k.host) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
        h ^= std::hash<uint16_t>{}(k.port) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
        return h;
    }
};

/// An HTTP/1.1 connection owned by the pool
struct pooled_connection {
    uint64_t id = 0;
    pool_key key;
    net::stream stream;
    /// Bytes received past what the current exchange consumed
    std::string buffer;
    io::clock::time_point created = io::clock::now();
    io::clock::time_point idle_since = io::clock::now();
    uint32_t requests = 0;
};

/// Per-host counters
struct pool_stats {
    size_t idle = 0;
    size_t lent = 0;
    size_t h2_sessions = 0;
    size_t h2_streams = 0;
};

namespace detail {

struct host_bucket {
    std::deque<std::unique_ptr<pooled_connection>> idle;   ///< most recently used at the back
    size_t lent = 0;
    std::vector<std::shared_ptr<http::h2_session>> h2;
};

struct pool_core {
    explicit pool_core(pool_config c) : config(std::move(c)) {}

    pool_config config;
    std::mutex mutex;
    std::unordered_map<pool_key, host_bucket, pool_key_hash> buckets;
    bool closed = false;

    std::condition_variable reaper_cv;
    bool reaper_running = false;

    // Take a lent connection back. Closing happens outside the lock.
    void give_back(std::unique_ptr<pooled_connection> conn, bool reusable, bool abortive) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            auto& bucket = buckets[conn->key];
            if (bucket.lent > 0) --bucket.lent;
            if (reusable && !closed && conn->buffer.empty() &&
                bucket.idle.size() < config.max_idle_per_host) {
                conn->idle_since = io::clock::now();
                TERN_LOG_DEBUG("connection #{} to {} back to idle ({} idle)",
                               conn->id, conn->key.to_string(), bucket.idle.size() + 1);
                bucket.idle.push_back(std::move(conn));
                return;
            }
        }
        TERN_LOG_DEBUG("connection #{} to {} discarded", conn->id, conn->key.to_string());
        if (abortive) {
            conn->stream.abort();
        } else {
            conn->stream.close();
        }
    }

    // Close idle entries past idle_timeout; returns how many.
    size_t reap() {
        std::vector<std::unique_ptr<pooled_connection>> expired;
        std::vector<std::shared_ptr<http::h2_session>> idle_sessions;
        auto now = io::clock::now();
        {
            std::lock_guard<std::mutex> lock(mutex);
            for (auto& [key, bucket] : buckets) {
                auto stale = std::stable_partition(bucket.idle.begin(), bucket.idle.end(), [&](const auto& conn) {
                    return now - conn->idle_since <= config.idle_timeout;
                });
                std::move(stale, bucket.idle.end(), std::back_inserter(expired));
                bucket.idle.erase(stale, bucket.idle.end());

                auto done = std::stable_partition(bucket.h2.begin(), bucket.h2.end(), [&](const auto& s) {
                    return s->is_alive() &&
                           (s->active_streams() > 0 || now - s->idle_since() <= config.idle_timeout);
                });
                for (auto it = done; it != bucket.h2.end(); ++it) {
                    if ((*it)->is_alive()) {
                        idle_sessions.push_back(std::move(*it));
                    }
                }
                bucket.h2.erase(done, bucket.h2.end());
            }
        }
        for (auto& conn : expired) {
            conn->stream.close();
        }
        for (auto& s : idle_sessions) {
            s->shutdown();
        }
        size_t n = expired.size() + idle_sessions.size();
        if (n > 0) {
            TERN_LOG_DEBUG("reaper closed {} idle connections", n);
        }
        return n;
    }
};

} // namespace detail

/// Move-only loan of one HTTP/1.1 connection to one request.
///
/// The connection goes back to the idle set only through release(true);
/// every other way of ending the lease (discard, destruction, pool gone)
/// closes it.
class connection_lease {
public:
    connection_lease() = default;

    connection_lease(std::weak_ptr<detail::pool_core> core, std::unique_ptr<pooled_connection> conn, bool reused)
        : core_(std::move(core)), conn_(std::move(conn)), reused_(reused) {}

    connection_lease(connection_lease&& other) noexcept
        : core_(std::move(other.core_)), conn_(std::move(other.conn_)), reused_(other.reused_) {}

    connection_lease& operator=(connection_lease&& other) noexcept {
        if (this != &other) {
            discard();
            core_ = std::move(other.core_);
            conn_ = std::move(other.conn_);
            reused_ = other.reused_;
        }
        return *this;
    }

    connection_lease(const connection_lease&) = delete;
    connection_lease& operator=(const connection_lease&) = delete;

    ~connection_lease() { discard(); }

    pooled_connection* operator->() const noexcept { return conn_.get(); }
    pooled_connection& operator*() const noexcept { return *conn_; }
    pooled_connection* get() const noexcept { return conn_.get(); }
    explicit operator bool() const noexcept { return conn_ != nullptr; }

    /// True if the connection came from the idle set
    bool reused() const noexcept { return reused_; }

    /// End the loan. Only a connection whose exchange completed cleanly
    /// may be released as reusable.
    void release(bool reusable) noexcept {
        if (!conn_) return;
        if (auto core = core_.lock()) {
            core->give_back(std::move(conn_), reusable, !reusable);
        } else {
            conn_->stream.close();
            conn_.reset();
        }
    }

    /// Close with a reset; used when the exchange was cut short.
    void discard() noexcept {
        if (!conn_) return;
        if (auto core = core_.lock()) {
            core->give_back(std::move(conn_), false, true);
        } else {
            conn_->stream.abort();
            conn_.reset();
        }
    }

private:
    std::weak_ptr<detail::pool_core> core_;
    std::unique_ptr<pooled_connection> conn_;
    bool reused_ = false;
};

/// What acquire() hands out: an exclusive HTTP/1.1 lease or a shared
/// HTTP/2 session to open a stream on.
struct acquired_connection {
    connection_lease h1;
    std::shared_ptr<http::h2_session> h2;

    bool is_h2() const noexcept { return h2 != nullptr; }
    bool reused() const noexcept { return h2 ? true : h1.reused(); }
};

/// Keep-alive pool keyed by (scheme, host, port).
///
/// Idle bookkeeping is guarded by one mutex: an acquire either removes one
/// idle entry or reserves a slot for a new connection, never both. Idle
/// connections past idle_timeout or closed by the peer are dropped on
/// acquire and by a background reaper.
class connection_pool {
public:
    connection_pool(io::io_context& ctx, pool_config config)
        : ctx_(ctx)
        , resolver_(config.resolver_threads)
        , tls_ctx_(tls_options_for(config))
        , core_(std::make_shared<detail::pool_core>(std::move(config))) {}

    ~connection_pool() {
        drain();
    }

    connection_pool(const connection_pool&) = delete;
    connection_pool& operator=(const connection_pool&) = delete;

    const pool_config& config() const noexcept { return core_->config; }

    /// A connection ready to carry one request to `target`.
    ///
    /// Failures before a connection exists are connection errors carrying
    /// the failed stage; cancellation yields a cancelled error.
    coro::task<errors::result<acquired_connection>> acquire(const http::url& target, coro::cancel_token token = {}) {
        pool_key key = pool_key::from(target);
        std::vector<std::unique_ptr<pooled_connection>> stale;
        acquired_connection out;
        {
            std::lock_guard<std::mutex> lock(core_->mutex);
            if (core_->closed) {
                co_return std::unexpected(errors::cancelled_error("connection pool is closed"));
            }
            auto& bucket = core_->buckets[key];
            std::erase_if(bucket.h2, [](const auto& s) { return !s->is_alive(); });
            for (auto& s : bucket.h2) {
                if (s->can_take_stream()) {
                    out.h2 = s;
                    break;
                }
            }
            if (!out.h2) {
                auto now = io::clock::now();
                while (!bucket.idle.empty()) {
                    auto conn = std::move(bucket.idle.back());
                    bucket.idle.pop_back();
                    if (now - conn->idle_since > core_->config.idle_timeout ||
                        conn->stream.peer_closed_or_dirty()) {
                        stale.push_back(std::move(conn));
                        continue;
                    }
                    ++bucket.lent;
                    out.h1 = connection_lease(core_, std::move(conn), true);
                    break;
                }
                if (!out.h1) {
                    ++bucket.lent;  // reserved for the connection about to be made
                }
            }
        }
        for (auto& conn : stale) {
            TERN_LOG_DEBUG("dropping stale idle connection #{} to {}", conn->id, key.to_string());
            conn->stream.close();
        }
        if (out.h2 || out.h1) {
            co_return out;
        }

        auto made = co_await connect(key, token);
        if (!made) {
            unreserve(key);
            co_return std::unexpected(std::move(made.error()));
        }
        co_return std::move(*made);
    }

    pool_stats stats(const http::url& target) const {
        return stats(pool_key::from(target));
    }

    pool_stats stats(const pool_key& key) const {
        pool_stats s;
        std::lock_guard<std::mutex> lock(core_->mutex);
        auto it = core_->buckets.find(key);
        if (it == core_->buckets.end()) return s;
        s.idle = it->second.idle.size();
        s.lent = it->second.lent;
        for (const auto& session : it->second.h2) {
            if (session->is_alive()) {
                ++s.h2_sessions;
                s.h2_streams += session->active_streams();
            }
        }
        return s;
    }

    /// Close idle connections past idle_timeout and idle HTTP/2 sessions.
    /// Returns how many were closed.
    size_t reap() { return core_->reap(); }

    /// Start the background reaper on `sched`.
    void start_reaper(runtime::scheduler& sched) {
        {
            std::lock_guard<std::mutex> lock(core_->mutex);
            if (core_->reaper_running || core_->closed) return;
            core_->reaper_running = true;
        }
        auto h = reaper_loop(ctx_, core_, reaper_stop_.get_token()).release();
        if (!sched.spawn(h)) {
            h.destroy();
            std::lock_guard<std::mutex> lock(core_->mutex);
            core_->reaper_running = false;
            TERN_LOG_WARNING("pool reaper not started: scheduler is not running");
        }
    }

    /// Close everything idle, stop the reaper and refuse further acquires.
    /// Lent connections are closed when their lease ends.
    void drain() {
        std::vector<std::unique_ptr<pooled_connection>> idle;
        std::vector<std::shared_ptr<http::h2_session>> sessions;
        {
            std::lock_guard<std::mutex> lock(core_->mutex);
            if (core_->closed) return;
            core_->closed = true;
            for (auto& [key, bucket] : core_->buckets) {
                for (auto& conn : bucket.idle) idle.push_back(std::move(conn));
                bucket.idle.clear();
                for (auto& s : bucket.h2) sessions.push_back(s);
                bucket.h2.clear();
            }
        }
        reaper_stop_.cancel(coro::cancel_reason::shutdown);
        for (auto& conn : idle) {
            conn->stream.close();
        }
        for (auto& s : sessions) {
            s->close();
        }
        std::unique_lock<std::mutex> lock(core_->mutex);
        core_->reaper_cv.wait_for(lock, std::chrono::seconds(1), [this] { return !core_->reaper_running; });
        TERN_LOG_DEBUG("connection pool drained ({} idle, {} HTTP/2 sessions closed)", idle.size(), sessions.size());
    }

private:
    static tls::tls_options tls_options_for(const pool_config& config) {
        tls::tls_options opts = config.tls;
        opts.alpn = config.http2 ? "h2,http/1.1" : "http/1.1";
        return opts;
    }

    static coro::task<void> reaper_loop(io::io_context& ctx, std::shared_ptr<detail::pool_core> core,
                                        coro::cancel_token stop) {
        while (!stop.is_cancelled()) {
            auto r = co_await time::sleep_for(ctx, core->config.reap_interval, stop);
            if (r == coro::cancel_result::cancelled) {
                break;
            }
            core->reap();
        }
        std::lock_guard<std::mutex> lock(core->mutex);
        core->reaper_running = false;
        core->reaper_cv.notify_all();
    }

    void unreserve(const pool_key& key) {
        std::lock_guard<std::mutex> lock(core_->mutex);
        auto& bucket = core_->buckets[key];
        if (bucket.lent > 0) --bucket.lent;
    }

    // DNS, TCP, TLS. The lent slot for `key` is already reserved.
    coro::task<errors::result<acquired_connection>> connect(const pool_key& key, coro::cancel_token token) {
        auto addresses = co_await resolver_.resolve(key.host, key.port, token);
        if (!addresses) {
            if (addresses.error() == EAI_CANCELED) {
                co_return std::unexpected(errors::cancelled_error());
            }
            TERN_LOG_ERROR("failed to resolve {}: {}", key.host, gai_strerror(addresses.error()));
            co_return std::unexpected(errors::connection_error(errors::connect_stage::dns,
                fmt::format("failed to resolve host {}: {}", key.host, gai_strerror(addresses.error()))));
        }

        auto tcp = co_await net::tcp_connect(ctx_, std::move(*addresses), core_->config.tcp, token);
        if (!tcp) {
            if (tcp.error() == ECANCELED) {
                co_return std::unexpected(errors::cancelled_error());
            }
            TERN_LOG_ERROR("failed to connect to {}: {}", key.to_string(), strerror(tcp.error()));
            co_return std::unexpected(errors::connection_error(errors::connect_stage::tcp,
                fmt::format("failed to connect to {}:{}: {}", key.host, key.port, strerror(tcp.error())),
                tcp.error()));
        }

        net::stream stream;
        bool use_h2 = false;
        if (key.secure()) {
            auto tls = co_await tls::tls_connect(tls_ctx_, std::move(*tcp), key.host, token);
            if (!tls) {
                if (tls.error().code == ECANCELED) {
                    co_return std::unexpected(errors::cancelled_error());
                }
                co_return std::unexpected(errors::connection_error(errors::connect_stage::tls,
                    tls.error().message, tls.error().code));
            }
            use_h2 = tls->alpn_protocol() == "h2";
            stream = net::stream(std::move(*tls));
        } else {
            use_h2 = core_->config.http2_prior_knowledge;
            stream = net::stream(std::move(*tcp));
        }

        uint64_t id = next_id_.fetch_add(1, std::memory_order_relaxed);
        acquired_connection out;
        if (use_h2) {
            auto session = std::make_shared<http::h2_session>(std::move(stream), key.to_string(), core_->config.h2);
            {
                std::lock_guard<std::mutex> lock(core_->mutex);
                auto& bucket = core_->buckets[key];
                if (bucket.lent > 0) --bucket.lent;
                if (!core_->closed) {
                    bucket.h2.push_back(session);
                }
            }
            session->start();
            TERN_LOG_DEBUG("HTTP/2 session #{} to {} established", id, key.to_string());
            out.h2 = std::move(session);
            co_return out;
        }

        auto conn = std::make_unique<pooled_connection>();
        conn->id = id;
        conn->key = key;
        conn->stream = std::move(stream);
        TERN_LOG_DEBUG("connection #{} to {} established", id, key.to_string());
        out.h1 = connection_lease(core_, std::move(conn), false);
        co_return out;
    }

    io::io_context& ctx_;
    net::resolver resolver_;
    tls::tls_context tls_ctx_;
    std::shared_ptr<detail::pool_core> core_;
    coro::cancel_source reaper_stop_;
    std::atomic<uint64_t> next_id_{1};
};

} // namespace tern::pool
