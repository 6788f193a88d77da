#pragma once

#include <tern/coro/task.hpp>
#include <tern/io/io_awaitables.hpp>
#include <tern/log/macros.hpp>
#include <tern/net/resolver.hpp>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <expected>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <unistd.h>

namespace tern::net {

/// Socket options applied to outgoing connections
struct tcp_options {
    bool no_delay = true;
    bool keep_alive = true;
    int recv_buffer = 0;   ///< 0 = system default
    int send_buffer = 0;
};

/// Non-blocking TCP connection bound to an io_context.
///
/// Every read and write first tries the syscall and only suspends on
/// EAGAIN, so a socket with buffered data never round-trips the reactor.
class tcp_stream {
public:
    tcp_stream() = default;

    tcp_stream(io::io_context& ctx, int fd, socket_address peer = {})
        : fd_(fd), ctx_(&ctx), peer_(peer) {}

    tcp_stream(tcp_stream&& other) noexcept
        : fd_(std::exchange(other.fd_, -1)), ctx_(other.ctx_), peer_(other.peer_) {}

    tcp_stream& operator=(tcp_stream&& other) noexcept {
        if (this != &other) {
            close();
            fd_ = std::exchange(other.fd_, -1);
            ctx_ = other.ctx_;
            peer_ = other.peer_;
        }
        return *this;
    }

    ~tcp_stream() { close(); }

    tcp_stream(const tcp_stream&) = delete;
    tcp_stream& operator=(const tcp_stream&) = delete;

    bool is_valid() const noexcept { return fd_ >= 0; }
    int fd() const noexcept { return fd_; }
    io::io_context& context() const noexcept { return *ctx_; }
    const socket_address& peer_address() const noexcept { return peer_; }

    /// One non-blocking recv. -EAGAIN when nothing is buffered.
    io::io_result try_read(void* buffer, size_t length) noexcept {
        ssize_t n = ::recv(fd_, buffer, length, MSG_DONTWAIT);
        return io::io_result{n >= 0 ? static_cast<int32_t>(n) : -errno};
    }

    /// One non-blocking send. -EAGAIN when the socket buffer is full.
    io::io_result try_write(const void* buffer, size_t length) noexcept {
        ssize_t n = ::send(fd_, buffer, length, MSG_DONTWAIT | MSG_NOSIGNAL);
        return io::io_result{n >= 0 ? static_cast<int32_t>(n) : -errno};
    }

    auto wait_readable(coro::cancel_token token = {}) {
        return io::poll_read(*ctx_, fd_, std::move(token));
    }

    auto wait_writable(coro::cancel_token token = {}) {
        return io::poll_write(*ctx_, fd_, std::move(token));
    }

    /// Read at least one byte (0 on orderly shutdown by the peer).
    coro::task<io::io_result> read(void* buffer, size_t length, coro::cancel_token token = {}) {
        for (;;) {
            auto r = try_read(buffer, length);
            if (r.result != -EAGAIN && r.result != -EINTR) {
                co_return r;
            }
            auto w = co_await wait_readable(token);
            if (!w.success()) {
                co_return w;
            }
        }
    }

    coro::task<io::io_result> write(const void* buffer, size_t length, coro::cancel_token token = {}) {
        for (;;) {
            auto r = try_write(buffer, length);
            if (r.result != -EAGAIN && r.result != -EINTR) {
                co_return r;
            }
            auto w = co_await wait_writable(token);
            if (!w.success()) {
                co_return w;
            }
        }
    }

    /// Idle-connection probe: true if the peer closed the socket or sent
    /// bytes nobody asked for. Either way the connection is unusable.
    bool peer_closed_or_dirty() const noexcept {
        char probe;
        ssize_t n = ::recv(fd_, &probe, 1, MSG_PEEK | MSG_DONTWAIT);
        if (n == 0 || n > 0) {
            return true;
        }
        return errno != EAGAIN && errno != EWOULDBLOCK;
    }

    /// Abortive close: the peer sees a reset instead of a FIN.
    void reset() noexcept {
        if (fd_ >= 0) {
            linger lg{1, 0};
            setsockopt(fd_, SOL_SOCKET, SO_LINGER, &lg, sizeof(lg));
            close();
        }
    }

    void close() noexcept {
        if (fd_ >= 0) {
            if (ctx_) {
                ctx_->forget(fd_);
            }
            ::close(fd_);
            fd_ = -1;
        }
    }

private:
    int fd_ = -1;
    io::io_context* ctx_ = nullptr;
    socket_address peer_{};
};

namespace detail {

inline void apply_options(int fd, const tcp_options& opts) {
    int one = 1;
    if (opts.no_delay) {
        setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
    }
    if (opts.keep_alive) {
        setsockopt(fd, SOL_SOCKET, SO_KEEPALIVE, &one, sizeof(one));
    }
    if (opts.recv_buffer > 0) {
        setsockopt(fd, SOL_SOCKET, SO_RCVBUF, &opts.recv_buffer, sizeof(opts.recv_buffer));
    }
    if (opts.send_buffer > 0) {
        setsockopt(fd, SOL_SOCKET, SO_SNDBUF, &opts.send_buffer, sizeof(opts.send_buffer));
    }
}

} // namespace detail

/// Connect to the first reachable address. Returns the errno of the last
/// failed attempt (ECANCELED if the token fired).
inline coro::task<std::expected<tcp_stream, int>>
tcp_connect(io::io_context& ctx, std::vector<socket_address> addresses,
            tcp_options opts = {}, coro::cancel_token token = {}) {
    int last_error = EHOSTUNREACH;
    for (const auto& addr : addresses) {
        if (token.is_cancelled()) {
            co_return std::unexpected(ECANCELED);
        }
        int fd = ::socket(addr.family(), SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
        if (fd < 0) {
            last_error = errno;
            TERN_LOG_ERROR("socket() failed: {}", strerror(last_error));
            continue;
        }
        detail::apply_options(fd, opts);
        tcp_stream stream(ctx, fd, addr);

        if (::connect(fd, addr.data(), addr.length) == 0) {
            co_return stream;
        }
        if (errno != EINPROGRESS) {
            last_error = errno;
            TERN_LOG_DEBUG("connect {} failed: {}", addr.to_string(), strerror(last_error));
            continue;
        }

        auto w = co_await stream.wait_writable(token);
        if (!w.success()) {
            last_error = w.error_code();
            if (last_error == ECANCELED) {
                co_return std::unexpected(ECANCELED);
            }
            continue;
        }
        int so_error = 0;
        socklen_t len = sizeof(so_error);
        getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len);
        if (so_error != 0) {
            last_error = so_error;
            TERN_LOG_DEBUG("connect {} failed: {}", addr.to_string(), strerror(so_error));
            continue;
        }
        co_return stream;
    }
    co_return std::unexpected(last_error);
}

} // namespace tern::net
