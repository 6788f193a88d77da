// In-process HTTP/1.1 servers for integration tests.
//
// Blocking sockets, one thread per connection. Handlers write raw bytes so
// tests control framing, pauses and resets exactly.

#ifndef TERN_TEST_SERVER_HPP
#define TERN_TEST_SERVER_HPP

#include <tern/http/http_common.hpp>
#include <tern/http/http_parser.hpp>

#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>

#include <atomic>
#include <cstdio>
#include <cstring>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace tern::test {

/// A request as the server saw it
struct received_request {
    std::string method;
    std::string target;
    http::header_list headers;
    std::string body;
    bool chunked = false;
};

/// Server side of one accepted connection
class server_connection {
public:
    server_connection(int fd, SSL* ssl) : fd_(fd), ssl_(ssl) {}

    ~server_connection() {
        if (ssl_) {
            SSL_free(ssl_);
        }
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }

    server_connection(const server_connection&) = delete;
    server_connection& operator=(const server_connection&) = delete;

    bool send(std::string_view data) {
        while (!data.empty()) {
            ssize_t n = ssl_ ? SSL_write(ssl_, data.data(), static_cast<int>(data.size()))
                             : ::send(fd_, data.data(), data.size(), MSG_NOSIGNAL);
            if (n <= 0) {
                return false;
            }
            data.remove_prefix(static_cast<size_t>(n));
        }
        return true;
    }

    /// Full response with a Content-Length body
    bool respond(int status, std::string_view body, std::string_view extra_headers = {}) {
        std::string out = "HTTP/1.1 " + std::to_string(status) + " " + std::string(reason(status)) + "\r\n";
        out += "Content-Length: " + std::to_string(body.size()) + "\r\n";
        out += extra_headers;
        out += "\r\n";
        out += body;
        return send(out);
    }

    /// Close with RST instead of FIN
    void reset() {
        linger l{1, 0};
        ::setsockopt(fd_, SOL_SOCKET, SO_LINGER, &l, sizeof(l));
        ::shutdown(fd_, SHUT_RDWR);
        ::close(fd_);
        fd_ = -1;
    }

    /// Next request, std::nullopt once the client closed or sent garbage
    std::optional<received_request> read_request() {
        size_t head_end;
        while ((head_end = buffer_.find("\r\n\r\n")) == std::string::npos) {
            if (!fill()) return std::nullopt;
        }
        received_request req;
        std::string_view head(buffer_.data(), head_end);
        auto line_end = head.find("\r\n");
        std::string_view line = head.substr(0, line_end);
        auto sp1 = line.find(' ');
        auto sp2 = line.rfind(' ');
        if (sp1 == std::string_view::npos || sp2 == sp1) return std::nullopt;
        req.method = std::string(line.substr(0, sp1));
        req.target = std::string(line.substr(sp1 + 1, sp2 - sp1 - 1));

        std::string_view rest = line_end == std::string_view::npos ? std::string_view{} : head.substr(line_end + 2);
        while (!rest.empty()) {
            auto eol = rest.find("\r\n");
            auto h = rest.substr(0, eol);
            auto colon = h.find(':');
            if (colon != std::string_view::npos) {
                auto value = h.substr(colon + 1);
                while (!value.empty() && value.front() == ' ') value.remove_prefix(1);
                req.headers.add(h.substr(0, colon), value);
            }
            rest = eol == std::string_view::npos ? std::string_view{} : rest.substr(eol + 2);
        }
        buffer_.erase(0, head_end + 4);

        http::body_decoder decoder;
        if (req.headers.is_chunked()) {
            req.chunked = true;
            decoder = http::body_decoder(http::body_framing::chunked);
        } else if (auto len = req.headers.content_length(); len && *len > 0) {
            decoder = http::body_decoder(http::body_framing::content_length, *len);
        }
        for (;;) {
            auto r = decoder.decode(buffer_, req.body, 1 << 20);
            if (r == http::parse_result::complete) break;
            if (r == http::parse_result::error || !fill()) return std::nullopt;
        }
        return req;
    }

    int fd() const noexcept { return fd_; }

    static std::string_view reason(int status) {
        switch (status) {
            case 200: return "OK";
            case 201: return "Created";
            case 204: return "No Content";
            case 404: return "Not Found";
            case 500: return "Internal Server Error";
            case 503: return "Service Unavailable";
            default:  return "Status";
        }
    }

private:
    bool fill() {
        char buf[16384];
        ssize_t n = ssl_ ? SSL_read(ssl_, buf, sizeof(buf)) : ::recv(fd_, buf, sizeof(buf), 0);
        if (n <= 0) return false;
        buffer_.append(buf, static_cast<size_t>(n));
        return true;
    }

    int fd_;
    SSL* ssl_;
    std::string buffer_;
};

/// Returns false to close the connection after this request
using request_handler = std::function<bool(server_connection&, const received_request&)>;

/// Self-signed certificate for 127.0.0.1 and localhost
class test_certificate {
public:
    test_certificate() {
        key_ = EVP_RSA_gen(2048);
        cert_ = X509_new();
        if (!key_ || !cert_) {
            throw std::runtime_error("failed to allocate test certificate");
        }
        ASN1_INTEGER_set(X509_get_serialNumber(cert_), 1);
        X509_set_version(cert_, 2);
        X509_gmtime_adj(X509_getm_notBefore(cert_), -3600);
        X509_gmtime_adj(X509_getm_notAfter(cert_), 24 * 3600);
        X509_set_pubkey(cert_, key_);
        X509_NAME* name = X509_get_subject_name(cert_);
        X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC,
                                   reinterpret_cast<const unsigned char*>("localhost"), -1, -1, 0);
        X509_set_issuer_name(cert_, name);

        X509V3_CTX v3;
        X509V3_set_ctx_nodb(&v3);
        X509V3_set_ctx(&v3, cert_, cert_, nullptr, nullptr, 0);
        if (X509_EXTENSION* ext = X509V3_EXT_conf_nid(nullptr, &v3, NID_subject_alt_name,
                                                      "IP:127.0.0.1,DNS:localhost")) {
            X509_add_ext(cert_, ext, -1);
            X509_EXTENSION_free(ext);
        }
        if (X509_sign(cert_, key_, EVP_sha256()) == 0) {
            throw std::runtime_error("failed to sign test certificate");
        }
    }

    ~test_certificate() {
        X509_free(cert_);
        EVP_PKEY_free(key_);
        if (!pem_path_.empty()) {
            std::remove(pem_path_.c_str());
        }
    }

    test_certificate(const test_certificate&) = delete;
    test_certificate& operator=(const test_certificate&) = delete;

    /// Server context presenting this certificate
    SSL_CTX* make_server_context(const char* alpn = nullptr) const {
        SSL_CTX* ctx = SSL_CTX_new(TLS_server_method());
        if (!ctx || SSL_CTX_use_certificate(ctx, cert_) != 1 || SSL_CTX_use_PrivateKey(ctx, key_) != 1) {
            throw std::runtime_error("failed to set up server TLS context");
        }
        if (alpn) {
            SSL_CTX_set_alpn_select_cb(ctx, select_alpn, const_cast<char*>(alpn));
        }
        return ctx;
    }

    /// The certificate as a PEM file, usable as a CA file
    const std::string& pem_file() {
        if (pem_path_.empty()) {
            char path[] = "/tmp/tern-test-ca-XXXXXX";
            int fd = ::mkstemp(path);
            if (fd < 0) throw std::runtime_error("mkstemp failed");
            FILE* f = ::fdopen(fd, "w");
            PEM_write_X509(f, cert_);
            std::fclose(f);
            pem_path_ = path;
        }
        return pem_path_;
    }

private:
    static int select_alpn(SSL*, const unsigned char** out, unsigned char* outlen,
                           const unsigned char* in, unsigned int inlen, void* arg) {
        std::string_view wanted(static_cast<const char*>(arg));
        for (unsigned int i = 0; i < inlen;) {
            unsigned char len = in[i];
            std::string_view proto(reinterpret_cast<const char*>(in + i + 1), len);
            if (proto == wanted) {
                *out = in + i + 1;
                *outlen = len;
                return SSL_TLSEXT_ERR_OK;
            }
            i += 1 + len;
        }
        return SSL_TLSEXT_ERR_NOACK;
    }

    EVP_PKEY* key_ = nullptr;
    X509* cert_ = nullptr;
    std::string pem_path_;
};

/// Listening socket on 127.0.0.1 with a thread per connection
class test_server {
public:
    explicit test_server(request_handler handler, SSL_CTX* tls = nullptr)
        : handler_(std::move(handler)), tls_(tls) {
        listen_fd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
        if (listen_fd_ < 0) throw std::runtime_error("socket() failed");
        int one = 1;
        ::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        if (::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 ||
            ::listen(listen_fd_, 64) != 0) {
            throw std::runtime_error(std::string("bind/listen failed: ") + strerror(errno));
        }
        socklen_t len = sizeof(addr);
        ::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);
        acceptor_ = std::thread([this] { accept_loop(); });
    }

    ~test_server() {
        stop();
        if (tls_) {
            SSL_CTX_free(tls_);
        }
    }

    test_server(const test_server&) = delete;
    test_server& operator=(const test_server&) = delete;

    void stop() {
        if (stopping_.exchange(true)) return;
        if (acceptor_.joinable()) acceptor_.join();
        ::close(listen_fd_);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (int fd : open_fds_) {
                ::shutdown(fd, SHUT_RDWR);
            }
        }
        for (auto& t : workers_) {
            if (t.joinable()) t.join();
        }
    }

    uint16_t port() const noexcept { return port_; }

    std::string url(std::string_view path = "/") const {
        return std::string(tls_ ? "https" : "http") + "://127.0.0.1:" + std::to_string(port_) + std::string(path);
    }

    size_t connections() const noexcept { return connections_.load(); }
    size_t requests() const noexcept { return requests_.load(); }

    /// Requests seen so far, in arrival order
    std::vector<received_request> received() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return received_;
    }

private:
    void accept_loop() {
        while (!stopping_.load()) {
            pollfd p{listen_fd_, POLLIN, 0};
            if (::poll(&p, 1, 20) <= 0) continue;
            int fd = ::accept4(listen_fd_, nullptr, nullptr, SOCK_CLOEXEC);
            if (fd < 0) continue;
            int one = 1;
            ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
            ++connections_;
            std::lock_guard<std::mutex> lock(mutex_);
            open_fds_.push_back(fd);
            workers_.emplace_back([this, fd] { serve(fd); });
        }
    }

    void serve(int fd) {
        SSL* ssl = nullptr;
        if (tls_) {
            ssl = SSL_new(tls_);
            SSL_set_fd(ssl, fd);
            if (SSL_accept(ssl) != 1) {
                SSL_free(ssl);
                forget(fd);
                ::close(fd);
                return;
            }
        }
        server_connection conn(fd, ssl);
        while (auto req = conn.read_request()) {
            ++requests_;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                received_.push_back(*req);
            }
            if (!handler_(conn, *req) || conn.fd() < 0) break;
        }
        forget(fd);
    }

    void forget(int fd) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::erase(open_fds_, fd);
    }

    request_handler handler_;
    SSL_CTX* tls_;
    int listen_fd_ = -1;
    uint16_t port_ = 0;
    std::atomic<bool> stopping_{false};
    std::atomic<size_t> connections_{0};
    std::atomic<size_t> requests_{0};
    std::thread acceptor_;
    mutable std::mutex mutex_;
    std::vector<int> open_fds_;
    std::vector<std::thread> workers_;
    std::vector<received_request> received_;
};

} // namespace tern::test

#endif // TERN_TEST_SERVER_HPP
