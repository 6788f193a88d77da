#pragma once

#include <tern/coro/cancel_token.hpp>
#include <tern/coro/task.hpp>
#include <tern/errors/error.hpp>
#include <tern/http/extensions.hpp>
#include <tern/http/http_common.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace tern::http {

using chunk_result = errors::result<std::optional<std::string>>;

/// Producer side of a response body (one per protocol).
///
/// read_chunk() returns the next non-empty chunk, std::nullopt at end of
/// body, or an error. Once it returned end or an error the source has
/// already released its connection. abandon() is called instead when the
/// consumer stops early; it must leave the connection in a state that is
/// safe for the protocol (discard for HTTP/1.1, RST_STREAM for HTTP/2).
class body_source {
public:
    virtual ~body_source() = default;
    virtual coro::task<chunk_result> read_chunk(coro::cancel_token token) = 0;
    virtual void abandon() noexcept = 0;
};

/// Body kept in memory (buffered responses, tests)
class buffered_source : public body_source {
public:
    explicit buffered_source(std::string data) : data_(std::move(data)) {}

    coro::task<chunk_result> read_chunk(coro::cancel_token) override {
        if (done_ || data_.empty()) {
            done_ = true;
            co_return std::optional<std::string>{};
        }
        done_ = true;
        co_return std::optional<std::string>{std::move(data_)};
    }

    void abandon() noexcept override { done_ = true; }

private:
    std::string data_;
    bool done_ = false;
};

/// Single-pass, single-consumer response body.
///
/// After end of body, an error or close(), every further pull yields end
/// of stream. Dropping an unfinished stream abandons it.
class body_stream {
public:
    using byte_observer = std::function<void(size_t)>;

    body_stream() = default;
    explicit body_stream(std::unique_ptr<body_source> source) : source_(std::move(source)) {}

    static body_stream from_string(std::string data) {
        return body_stream(std::make_unique<buffered_source>(std::move(data)));
    }

    body_stream(body_stream&& other) noexcept
        : source_(std::move(other.source_))
        , finished_(other.finished_.load(std::memory_order_relaxed))
        , delivered_(other.delivered_)
        , observer_(std::move(other.observer_)) {
        other.finished_.store(true, std::memory_order_relaxed);
    }

    body_stream& operator=(body_stream&& other) noexcept {
        if (this != &other) {
            close();
            source_ = std::move(other.source_);
            finished_.store(other.finished_.load(std::memory_order_relaxed), std::memory_order_relaxed);
            delivered_ = other.delivered_;
            observer_ = std::move(other.observer_);
            other.finished_.store(true, std::memory_order_relaxed);
        }
        return *this;
    }

    body_stream(const body_stream&) = delete;
    body_stream& operator=(const body_stream&) = delete;

    ~body_stream() { close(); }

    /// Next chunk, std::nullopt at end. A second pull while one is in
    /// flight fails with an internal error.
    coro::task<chunk_result> next(coro::cancel_token token = {}) {
        if (!source_ || finished_.load(std::memory_order_acquire)) {
            co_return std::optional<std::string>{};
        }
        if (busy_.exchange(true, std::memory_order_acq_rel)) {
            co_return std::unexpected(errors::internal_error("body stream already has a reader"));
        }
        auto r = co_await source_->read_chunk(std::move(token));
        busy_.store(false, std::memory_order_release);
        if (!r || !*r) {
            finished_.store(true, std::memory_order_release);
            source_.reset();
            co_return r;
        }
        delivered_ += (*r)->size();
        if (observer_) {
            observer_((*r)->size());
        }
        co_return r;
    }

    /// Drain the rest of the body into one buffer
    coro::task<errors::result<std::string>> read_all(coro::cancel_token token = {}) {
        std::string out;
        for (;;) {
            auto r = co_await next(token);
            if (!r) {
                co_return std::unexpected(std::move(r.error()));
            }
            if (!*r) {
                co_return out;
            }
            out += **r;
        }
    }

    /// Stop consuming. Safe to call repeatedly and on finished streams.
    void close() noexcept {
        if (finished_.exchange(true, std::memory_order_acq_rel)) {
            source_.reset();
            return;
        }
        if (source_) {
            source_->abandon();
            source_.reset();
        }
    }

    bool is_finished() const noexcept { return finished_.load(std::memory_order_acquire); }
    uint64_t bytes_delivered() const noexcept { return delivered_; }

    /// Called with the size of every delivered chunk (metrics byte counts)
    void set_observer(byte_observer obs) { observer_ = std::move(obs); }

private:
    std::unique_ptr<body_source> source_;
    std::atomic<bool> finished_{false};
    std::atomic<bool> busy_{false};
    uint64_t delivered_ = 0;
    byte_observer observer_;
};

/// A completed response head with its open body
struct response {
    int status = 0;
    std::string http_version;   ///< "HTTP/1.1", "HTTP/1.0" or "HTTP/2"
    header_list headers;
    body_stream body;
    http::extensions extensions;
};

} // namespace tern::http
