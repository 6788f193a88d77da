#pragma once

#include <tern/coro/task.hpp>
#include <tern/net/tcp.hpp>
#include <tern/tls/tls_stream.hpp>

#include <string_view>
#include <variant>

namespace tern::net {

/// Plain TCP or TLS connection behind one interface.
class stream {
public:
    using variant_type = std::variant<std::monostate, tcp_stream, tls::tls_stream>;

    stream() = default;
    explicit stream(tcp_stream tcp) : stream_(std::move(tcp)) {}
    explicit stream(tls::tls_stream tls) : stream_(std::move(tls)) {}

    stream(stream&&) = default;
    stream& operator=(stream&&) = default;
    stream(const stream&) = delete;
    stream& operator=(const stream&) = delete;

    bool is_connected() const noexcept {
        return std::visit([](const auto& s) {
            if constexpr (std::is_same_v<std::decay_t<decltype(s)>, std::monostate>) {
                return false;
            } else if constexpr (std::is_same_v<std::decay_t<decltype(s)>, tcp_stream>) {
                return s.is_valid();
            } else {
                return s.tcp().is_valid();
            }
        }, stream_);
    }

    bool is_secure() const noexcept {
        return std::holds_alternative<tls::tls_stream>(stream_);
    }

    /// Negotiated ALPN protocol, empty for plain TCP
    std::string_view alpn_protocol() const {
        if (auto* t = std::get_if<tls::tls_stream>(&stream_)) {
            return t->alpn_protocol();
        }
        return {};
    }

    io::io_result try_read(void* buffer, size_t length) {
        if (auto* t = std::get_if<tcp_stream>(&stream_)) return t->try_read(buffer, length);
        if (auto* s = std::get_if<tls::tls_stream>(&stream_)) return s->try_read(buffer, length);
        return io::io_result{-ENOTCONN};
    }

    io::io_result try_write(const void* buffer, size_t length) {
        if (auto* t = std::get_if<tcp_stream>(&stream_)) return t->try_write(buffer, length);
        if (auto* s = std::get_if<tls::tls_stream>(&stream_)) return s->try_write(buffer, length);
        return io::io_result{-ENOTCONN};
    }

    coro::task<io::io_result> wait_readable(coro::cancel_token token = {}) {
        if (auto* t = std::get_if<tcp_stream>(&stream_)) co_return co_await t->wait_readable(std::move(token));
        if (auto* s = std::get_if<tls::tls_stream>(&stream_)) co_return co_await s->wait_readable(std::move(token));
        co_return io::io_result{-ENOTCONN};
    }

    coro::task<io::io_result> wait_writable(coro::cancel_token token = {}) {
        if (auto* t = std::get_if<tcp_stream>(&stream_)) co_return co_await t->wait_writable(std::move(token));
        if (auto* s = std::get_if<tls::tls_stream>(&stream_)) co_return co_await s->wait_writable(std::move(token));
        co_return io::io_result{-ENOTCONN};
    }

    /// Read at least one byte; 0 means the peer closed.
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

    /// Write every byte or fail.
    coro::task<io::io_result> write_all(std::string_view data, coro::cancel_token token = {}) {
        size_t written = 0;
        while (written < data.size()) {
            auto r = try_write(data.data() + written, data.size() - written);
            if (r.result == -EAGAIN || r.result == -EINTR) {
                auto w = co_await wait_writable(token);
                if (!w.success()) {
                    co_return w;
                }
                continue;
            }
            if (!r.success()) {
                co_return r;
            }
            written += static_cast<size_t>(r.result);
        }
        co_return io::io_result{static_cast<int32_t>(written)};
    }

    bool peer_closed_or_dirty() const noexcept {
        if (auto* t = std::get_if<tcp_stream>(&stream_)) return t->peer_closed_or_dirty();
        if (auto* s = std::get_if<tls::tls_stream>(&stream_)) return s->tcp().peer_closed_or_dirty();
        return true;
    }

    int fd() const noexcept {
        if (auto* t = std::get_if<tcp_stream>(&stream_)) return t->fd();
        if (auto* s = std::get_if<tls::tls_stream>(&stream_)) return s->tcp().fd();
        return -1;
    }

    void close() noexcept {
        if (auto* t = std::get_if<tcp_stream>(&stream_)) t->close();
        else if (auto* s = std::get_if<tls::tls_stream>(&stream_)) s->close();
        stream_ = std::monostate{};
    }

    /// Close with RST so the peer cannot mistake a half-read response for
    /// a completed exchange.
    void abort() noexcept {
        if (auto* t = std::get_if<tcp_stream>(&stream_)) t->reset();
        else if (auto* s = std::get_if<tls::tls_stream>(&stream_)) s->tcp().reset();
        stream_ = std::monostate{};
    }

private:
    variant_type stream_;
};

} // namespace tern::net
