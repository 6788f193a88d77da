#pragma once

#include <tern/coro/cancel_token.hpp>

#include <chrono>
#include <cstdint>
#include <functional>

namespace tern::io {

/// Result of an I/O wait or syscall. Negative values are -errno.
struct io_result {
    int32_t result;

    bool success() const noexcept { return result >= 0; }
    int bytes_transferred() const noexcept { return result >= 0 ? result : 0; }
    int error_code() const noexcept { return result < 0 ? -result : 0; }
};

/// Direction of an fd readiness wait
enum class readiness : uint8_t {
    readable,
    writable
};

/// Completion callback. Receives 0 when the fd became ready or the timer
/// expired, -ECANCELED when the wait was cancelled. Invoked exactly once,
/// outside any backend lock, on the reactor thread or the cancelling thread.
using completion_fn = std::function<void(int)>;

using wait_id = uint64_t;
using clock = std::chrono::steady_clock;

/// Readiness reactor interface. The only implementation is epoll_backend;
/// the seam keeps io_context independent of it.
class io_backend {
public:
    virtual ~io_backend() = default;

    virtual wait_id next_id() noexcept = 0;

    /// Wait until fd is ready in the given direction. If token is already
    /// cancelled once the wait is queued, it completes with -ECANCELED.
    virtual void submit_wait(wait_id id, int fd, readiness dir,
                             const coro::cancel_token& token, completion_fn fn) = 0;

    /// Complete at deadline (or -ECANCELED on cancellation).
    virtual void submit_timer(wait_id id, clock::time_point deadline,
                              const coro::cancel_token& token, completion_fn fn) = 0;

    /// Cancel a pending wait or timer. Returns false if it already completed.
    virtual bool cancel(wait_id id) = 0;

    /// Drop bookkeeping for an fd that is about to be closed. Pending waits
    /// on it complete with -ECANCELED.
    virtual void forget(int fd) = 0;

    /// Dispatch ready events. Returns the number of completions.
    virtual int poll(std::chrono::milliseconds max_wait) = 0;

    /// Interrupt a blocking poll() from another thread.
    virtual void notify() = 0;

    virtual size_t pending() const = 0;
};

} // namespace tern::io
