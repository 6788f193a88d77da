#pragma once

#include <tern/coro/task.hpp>
#include <tern/log/macros.hpp>
#include <tern/net/tcp.hpp>
#include <tern/tls/tls_context.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509v3.h>
#include <arpa/inet.h>

#include <expected>
#include <string>
#include <string_view>
#include <utility>

namespace tern::tls {

/// Why a handshake failed
struct tls_error {
    int code = 0;           ///< errno for socket failures, 0 for protocol/verify failures
    std::string message;
};

/// TLS client session over a non-blocking tcp_stream.
///
/// try_read/try_write never block; when OpenSSL needs the socket in the
/// other direction (renegotiation, key update) the matching wait_* call
/// waits for that direction instead.
class tls_stream {
public:
    tls_stream(net::tcp_stream tcp, tls_context& ctx)
        : tcp_(std::move(tcp)) {
        ssl_ = SSL_new(ctx.native_handle());
        if (!ssl_) {
            throw std::runtime_error("Failed to create SSL object: " + last_ssl_error());
        }
        SSL_set_fd(ssl_, tcp_.fd());
        SSL_set_connect_state(ssl_);
    }

    ~tls_stream() {
        if (ssl_) {
            SSL_free(ssl_);
        }
    }

    tls_stream(const tls_stream&) = delete;
    tls_stream& operator=(const tls_stream&) = delete;

    tls_stream(tls_stream&& other) noexcept
        : tcp_(std::move(other.tcp_))
        , ssl_(std::exchange(other.ssl_, nullptr))
        , hostname_(std::move(other.hostname_))
        , read_wants_(other.read_wants_)
        , write_wants_(other.write_wants_) {}

    tls_stream& operator=(tls_stream&& other) noexcept {
        if (this != &other) {
            if (ssl_) SSL_free(ssl_);
            tcp_ = std::move(other.tcp_);
            ssl_ = std::exchange(other.ssl_, nullptr);
            hostname_ = std::move(other.hostname_);
            read_wants_ = other.read_wants_;
            write_wants_ = other.write_wants_;
        }
        return *this;
    }

    /// SNI plus hostname verification
    void set_hostname(std::string_view hostname) {
        hostname_ = std::string(hostname);
        X509_VERIFY_PARAM* param = SSL_get0_param(ssl_);
        in6_addr probe{};
        if (inet_pton(AF_INET, hostname_.c_str(), &probe) == 1 ||
            inet_pton(AF_INET6, hostname_.c_str(), &probe) == 1) {
            // IP literals get no SNI and are checked against the SAN IP entries
            X509_VERIFY_PARAM_set1_ip_asc(param, hostname_.c_str());
            return;
        }
        SSL_set_tlsext_host_name(ssl_, hostname_.c_str());
        X509_VERIFY_PARAM_set_hostflags(param, X509_CHECK_FLAG_NO_PARTIAL_WILDCARDS);
        X509_VERIFY_PARAM_set1_host(param, hostname_.c_str(), hostname_.size());
    }

    coro::task<std::expected<void, tls_error>> handshake(coro::cancel_token token = {}) {
        for (;;) {
            ERR_clear_error();
            int ret = SSL_connect(ssl_);
            if (ret == 1) {
                TERN_LOG_DEBUG("TLS handshake with {} complete ({}, {}, alpn={})",
                               hostname_, SSL_get_version(ssl_), SSL_get_cipher_name(ssl_),
                               alpn_protocol());
                co_return std::expected<void, tls_error>{};
            }
            int err = SSL_get_error(ssl_, ret);
            io::io_result w{0};
            if (err == SSL_ERROR_WANT_READ) {
                w = co_await tcp_.wait_readable(token);
            } else if (err == SSL_ERROR_WANT_WRITE) {
                w = co_await tcp_.wait_writable(token);
            } else {
                tls_error failure;
                long verify = SSL_get_verify_result(ssl_);
                if (verify != X509_V_OK) {
                    failure.message = std::string("certificate verify failed: ") +
                                      X509_verify_cert_error_string(verify);
                } else if (err == SSL_ERROR_SYSCALL && errno != 0) {
                    failure.code = errno;
                    failure.message = std::string("handshake I/O error: ") + strerror(errno);
                } else {
                    failure.message = "handshake failed: " + last_ssl_error();
                }
                TERN_LOG_ERROR("TLS handshake with {} failed: {}", hostname_, failure.message);
                co_return std::unexpected(std::move(failure));
            }
            if (!w.success()) {
                co_return std::unexpected(tls_error{w.error_code(), strerror(w.error_code())});
            }
        }
    }

    io::io_result try_read(void* buffer, size_t length) {
        ERR_clear_error();
        int ret = SSL_read(ssl_, buffer, static_cast<int>(length));
        if (ret > 0) {
            return io::io_result{ret};
        }
        int err = SSL_get_error(ssl_, ret);
        switch (err) {
            case SSL_ERROR_ZERO_RETURN:
                return io::io_result{0};
            case SSL_ERROR_WANT_READ:
                read_wants_ = io::readiness::readable;
                return io::io_result{-EAGAIN};
            case SSL_ERROR_WANT_WRITE:
                read_wants_ = io::readiness::writable;
                return io::io_result{-EAGAIN};
            case SSL_ERROR_SYSCALL:
                // EOF without close_notify reads as a reset
                return io::io_result{errno != 0 ? -errno : -ECONNRESET};
            default:
                TERN_LOG_ERROR("TLS read error: {}", last_ssl_error());
                return io::io_result{-EPROTO};
        }
    }

    io::io_result try_write(const void* buffer, size_t length) {
        ERR_clear_error();
        int ret = SSL_write(ssl_, buffer, static_cast<int>(length));
        if (ret > 0) {
            return io::io_result{ret};
        }
        int err = SSL_get_error(ssl_, ret);
        switch (err) {
            case SSL_ERROR_WANT_WRITE:
                write_wants_ = io::readiness::writable;
                return io::io_result{-EAGAIN};
            case SSL_ERROR_WANT_READ:
                write_wants_ = io::readiness::readable;
                return io::io_result{-EAGAIN};
            case SSL_ERROR_SYSCALL:
                return io::io_result{errno != 0 ? -errno : -EPIPE};
            default:
                TERN_LOG_ERROR("TLS write error: {}", last_ssl_error());
                return io::io_result{-EPROTO};
        }
    }

    auto wait_readable(coro::cancel_token token = {}) {
        return io::poll_awaitable(tcp_.context(), tcp_.fd(), read_wants_, std::move(token));
    }

    auto wait_writable(coro::cancel_token token = {}) {
        return io::poll_awaitable(tcp_.context(), tcp_.fd(), write_wants_, std::move(token));
    }

    std::string_view alpn_protocol() const {
        const unsigned char* proto = nullptr;
        unsigned int len = 0;
        SSL_get0_alpn_selected(ssl_, &proto, &len);
        if (proto && len > 0) {
            return std::string_view(reinterpret_cast<const char*>(proto), len);
        }
        return {};
    }

    const char* version() const { return SSL_get_version(ssl_); }

    net::tcp_stream& tcp() noexcept { return tcp_; }
    const net::tcp_stream& tcp() const noexcept { return tcp_; }

    /// Best-effort close_notify, then close the socket. Never waits.
    void close() noexcept {
        if (ssl_ && tcp_.is_valid()) {
            ERR_clear_error();
            SSL_shutdown(ssl_);
            ERR_clear_error();
        }
        tcp_.close();
    }

private:
    net::tcp_stream tcp_;
    SSL* ssl_ = nullptr;
    std::string hostname_;
    io::readiness read_wants_ = io::readiness::readable;
    io::readiness write_wants_ = io::readiness::writable;
};

/// TCP stream → TLS client handshake with SNI/hostname verification.
inline coro::task<std::expected<tls_stream, tls_error>>
tls_connect(tls_context& ctx, net::tcp_stream tcp, std::string hostname,
            coro::cancel_token token = {}) {
    tls_stream stream(std::move(tcp), ctx);
    stream.set_hostname(hostname);
    auto hs = co_await stream.handshake(token);
    if (!hs) {
        co_return std::unexpected(std::move(hs.error()));
    }
    co_return std::move(stream);
}

} // namespace tern::tls
