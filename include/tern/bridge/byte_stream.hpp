#pragma once

#include <tern/bridge/pending.hpp>
#include <tern/coro/cancel_token.hpp>
#include <tern/coro/task.hpp>
#include <tern/errors/error.hpp>
#include <tern/errors/host_error.hpp>
#include <tern/http/response.hpp>
#include <tern/log/macros.hpp>
#include <tern/runtime/scheduler.hpp>

#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

namespace tern::bridge {

/// A response body handed to a foreign caller.
///
/// Lazy: nothing is read from the connection until a chunk is asked for,
/// and each read performs exactly one pull. One pull at a time; a second
/// concurrent read is rejected. close() during a pull takes effect when
/// that pull completes.
class byte_stream : public std::enable_shared_from_this<byte_stream> {
public:
    using chunk = std::expected<std::optional<std::string>, errors::host_error>;

    /// `owner` is kept alive as long as the stream; it must own `sched`.
    byte_stream(runtime::scheduler& sched, http::body_stream body, std::shared_ptr<void> owner = {})
        : owner_(std::move(owner)), sched_(sched), body_(std::move(body)) {}

    ~byte_stream() { body_.close(); }

    byte_stream(const byte_stream&) = delete;
    byte_stream& operator=(const byte_stream&) = delete;

    /// Blocking pull, for synchronous callers. Must not be called from a
    /// scheduler worker.
    chunk read_chunk() {
        return read_chunk_async()->wait();
    }

    /// Start one pull and return its pending result.
    std::shared_ptr<chunk_pending> read_chunk_async() {
        auto out = std::make_shared<chunk_pending>();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_ || body_.is_finished()) {
                out->complete(std::nullopt);
                return out;
            }
            if (busy_) {
                out->fail(errors::internal_error("byte stream already has a read in progress"));
                return out;
            }
            busy_ = true;
        }
        auto h = pull(shared_from_this(), out).release();
        if (!sched_.spawn(h)) {
            h.destroy();
            {
                std::lock_guard<std::mutex> lock(mutex_);
                busy_ = false;
            }
            out->fail(errors::cancelled_error("client is shut down"));
        }
        return out;
    }

    /// Stop iterating. Unread data is abandoned: an HTTP/1.1 connection is
    /// discarded unless the body was fully read, an HTTP/2 stream is reset.
    void close() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return;
        closed_ = true;
        if (busy_) {
            return;  // the pull in flight closes the body when it returns
        }
        body_.close();
    }

    bool is_closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_ || body_.is_finished();
    }

    uint64_t bytes_read() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return body_.bytes_delivered();
    }

private:
    static coro::task<void> pull(std::shared_ptr<byte_stream> self, std::shared_ptr<chunk_pending> out) {
        http::chunk_result r;
        try {
            r = co_await self->body_.next(out->token());
        } catch (const std::exception& e) {
            TERN_LOG_ERROR("body read raised: {}", e.what());
            r = std::unexpected(errors::internal_error(e.what()));
        }
        bool deliver_end = false;
        {
            std::lock_guard<std::mutex> lock(self->mutex_);
            self->busy_ = false;
            if (self->closed_) {
                self->body_.close();
                deliver_end = true;
            }
        }
        if (deliver_end) {
            out->complete(std::nullopt);
        } else if (!r) {
            out->fail(r.error());
        } else {
            out->complete(std::move(*r));
        }
    }

    std::shared_ptr<void> owner_;
    runtime::scheduler& sched_;
    mutable std::mutex mutex_;
    http::body_stream body_;
    bool busy_ = false;
    bool closed_ = false;
};

} // namespace tern::bridge
