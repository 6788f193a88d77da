#pragma once

#include <tern/log/macros.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>
#include <openssl/x509_vfy.h>

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace tern::tls {

/// Drain the OpenSSL error queue into one message
inline std::string last_ssl_error() {
    std::string out;
    unsigned long err;
    while ((err = ERR_get_error()) != 0) {
        char buf[256];
        ERR_error_string_n(err, buf, sizeof(buf));
        if (!out.empty()) out += "; ";
        out += buf;
    }
    return out.empty() ? std::string("unknown TLS error") : out;
}

/// Encode a comma separated protocol list ("h2,http/1.1") in ALPN wire
/// format: each name prefixed by its length byte.
inline std::string alpn_wire_format(std::string_view protocols) {
    std::string wire;
    size_t start = 0;
    while (start < protocols.size()) {
        size_t end = protocols.find(',', start);
        if (end == std::string_view::npos) end = protocols.size();
        size_t len = end - start;
        if (len > 0 && len <= 255) {
            wire += static_cast<char>(len);
            wire += protocols.substr(start, len);
        }
        start = end + 1;
    }
    return wire;
}

/// Client-side TLS settings
struct tls_options {
    bool verify_peer = true;
    std::string ca_file;      ///< empty = system trust store
    std::string alpn = "h2,http/1.1";
};

/// Client SSL_CTX shared by every connection of the pool. Sessions are
/// cached on the context so reconnects to the same host can resume.
class tls_context {
public:
    explicit tls_context(const tls_options& opts = {}) {
        OPENSSL_init_ssl(OPENSSL_INIT_LOAD_SSL_STRINGS | OPENSSL_INIT_LOAD_CRYPTO_STRINGS, nullptr);

        ctx_ = SSL_CTX_new(TLS_client_method());
        if (!ctx_) {
            throw std::runtime_error("Failed to create SSL context: " + last_ssl_error());
        }
        SSL_CTX_set_min_proto_version(ctx_, TLS1_2_VERSION);
        SSL_CTX_set_options(ctx_, SSL_OP_NO_COMPRESSION);
        SSL_CTX_set_session_cache_mode(ctx_, SSL_SESS_CACHE_CLIENT);
        SSL_CTX_set_mode(ctx_, SSL_MODE_ENABLE_PARTIAL_WRITE | SSL_MODE_ACCEPT_MOVING_WRITE_BUFFER);

        if (opts.verify_peer) {
            if (!opts.ca_file.empty()) {
                if (SSL_CTX_load_verify_locations(ctx_, opts.ca_file.c_str(), nullptr) != 1) {
                    std::string err = last_ssl_error();
                    SSL_CTX_free(ctx_);
                    throw std::runtime_error("Failed to load CA file " + opts.ca_file + ": " + err);
                }
            } else if (!use_default_verify_paths()) {
                TERN_LOG_WARNING("no system CA certificates found; peer verification will fail");
            }
            SSL_CTX_set_verify(ctx_, SSL_VERIFY_PEER, nullptr);
            SSL_CTX_set_verify_depth(ctx_, 10);
        } else {
            SSL_CTX_set_verify(ctx_, SSL_VERIFY_NONE, nullptr);
        }

        if (!opts.alpn.empty()) {
            std::string wire = alpn_wire_format(opts.alpn);
            // SSL_CTX_set_alpn_protos returns 0 on success
            if (SSL_CTX_set_alpn_protos(ctx_, reinterpret_cast<const unsigned char*>(wire.data()),
                                        static_cast<unsigned int>(wire.size())) != 0) {
                SSL_CTX_free(ctx_);
                throw std::runtime_error("Failed to set ALPN protocols: " + last_ssl_error());
            }
        }
        verify_ = opts.verify_peer;
        TERN_LOG_DEBUG("TLS client context created (verify={}, alpn={})", verify_, opts.alpn);
    }

    ~tls_context() {
        if (ctx_) {
            SSL_CTX_free(ctx_);
        }
    }

    tls_context(const tls_context&) = delete;
    tls_context& operator=(const tls_context&) = delete;

    SSL_CTX* native_handle() const noexcept { return ctx_; }
    bool verifies_peer() const noexcept { return verify_; }

private:
    bool use_default_verify_paths() {
        static const struct {
            const char* file;
            const char* dir;
        } ca_locations[] = {
            {"/etc/ssl/certs/ca-certificates.crt", "/etc/ssl/certs"},
            {"/etc/pki/tls/certs/ca-bundle.crt", "/etc/pki/tls/certs"},
            {"/etc/ssl/ca-bundle.pem", "/etc/ssl/certs"},
            {"/etc/ssl/cert.pem", "/etc/ssl/certs"},
        };
        for (const auto& loc : ca_locations) {
            if (SSL_CTX_load_verify_locations(ctx_, loc.file, loc.dir) == 1) {
                return true;
            }
        }
        ERR_clear_error();
        return SSL_CTX_set_default_verify_paths(ctx_) == 1;
    }

    SSL_CTX* ctx_ = nullptr;
    bool verify_ = true;
};

} // namespace tern::tls
