#pragma once

#include <tern/bridge/pending.hpp>
#include <tern/coro/cancel_token.hpp>
#include <tern/coro/task.hpp>
#include <tern/errors/error.hpp>
#include <tern/http/response.hpp>
#include <tern/runtime/scheduler.hpp>
#include <tern/sync/primitives.hpp>

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace tern::bridge {

/// Body forwarded ahead of the consumer into a bounded channel, for
/// foreign runtimes that cannot drive a pull.
///
/// The forwarding task stays at most `capacity` chunks ahead and stops as
/// soon as the receiving side is closed.
class prefetch_stream : public std::enable_shared_from_this<prefetch_stream> {
    struct private_tag {};

public:
    static constexpr size_t default_capacity = 32;

    using item = http::chunk_result;
    using chunk = std::expected<std::optional<std::string>, errors::host_error>;

    /// `owner` is kept alive as long as the stream; it must own `sched`.
    static std::shared_ptr<prefetch_stream> start(runtime::scheduler& sched, http::body_stream body,
                                                  size_t capacity = default_capacity,
                                                  std::shared_ptr<void> owner = {}) {
        auto self = std::make_shared<prefetch_stream>(private_tag{}, sched, capacity, std::move(owner));
        auto h = forward(self->channel_, std::move(body), self->stop_.get_token()).release();
        if (!sched.spawn(h)) {
            h.destroy();
            self->channel_->close();
        }
        return self;
    }

    prefetch_stream(private_tag, runtime::scheduler& sched, size_t capacity, std::shared_ptr<void> owner)
        : owner_(std::move(owner))
        , sched_(sched)
        , channel_(std::make_shared<sync::channel<item>>(capacity)) {}

    ~prefetch_stream() { close(); }

    prefetch_stream(const prefetch_stream&) = delete;
    prefetch_stream& operator=(const prefetch_stream&) = delete;

    chunk read_chunk() {
        return read_chunk_async()->wait();
    }

    /// End of stream once closed, even with chunks still buffered
    std::shared_ptr<chunk_pending> read_chunk_async() {
        auto out = std::make_shared<chunk_pending>();
        if (closed_.load(std::memory_order_acquire)) {
            out->complete(std::nullopt);
            return out;
        }
        auto h = receive(shared_from_this(), out).release();
        if (!sched_.spawn(h)) {
            h.destroy();
            out->fail(errors::cancelled_error("client is shut down"));
        }
        return out;
    }

    /// Stop the forwarding task and drop whatever it buffered
    void close() {
        closed_.store(true, std::memory_order_release);
        stop_.cancel(coro::cancel_reason::caller);
        channel_->close();
    }

    bool is_closed() const noexcept { return closed_.load(std::memory_order_acquire); }

private:
    static coro::task<void> forward(std::shared_ptr<sync::channel<item>> ch, http::body_stream body,
                                    coro::cancel_token stop) {
        for (;;) {
            auto r = co_await body.next(stop);
            bool last = !r || !*r;
            if (!co_await ch->send(std::move(r), stop)) {
                break;  // receiver gone
            }
            if (last) {
                break;
            }
        }
        body.close();
        ch->close();
    }

    static coro::task<void> receive(std::shared_ptr<prefetch_stream> self, std::shared_ptr<chunk_pending> out) {
        auto r = co_await self->channel_->recv(out->token());
        if (!r || self->closed_.load(std::memory_order_acquire)) {
            out->complete(std::nullopt);   // closed or drained
        } else if (!*r) {
            out->fail(r->error());
        } else {
            out->complete(std::move(**r));
        }
    }

    std::shared_ptr<void> owner_;
    runtime::scheduler& sched_;
    std::shared_ptr<sync::channel<item>> channel_;
    coro::cancel_source stop_;
    std::atomic<bool> closed_{false};
};

} // namespace tern::bridge
