#pragma once

#include <tern/coro/cancel_token.hpp>
#include <tern/coro/task.hpp>
#include <tern/errors/error.hpp>
#include <tern/http/extensions.hpp>
#include <tern/http/http1_codec.hpp>
#include <tern/http/http2_session.hpp>
#include <tern/http/http_parser.hpp>
#include <tern/http/response.hpp>
#include <tern/io/io_context.hpp>
#include <tern/log/macros.hpp>
#include <tern/pipeline/context.hpp>
#include <tern/pool/connection_pool.hpp>
#include <tern/time/timer.hpp>

#include <fmt/format.h>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace tern::pipeline {

namespace detail {

inline constexpr size_t read_chunk_size = 16 * 1024;
inline constexpr size_t max_body_chunk = 64 * 1024;

/// A cancel source linked to the attempt token, cancelled with
/// cancel_reason::timeout if the phase outlives its limit.
class phase_scope {
public:
    phase_scope(io::io_context& io, const coro::cancel_token& parent,
                std::optional<std::chrono::milliseconds> limit)
        : source_(coro::cancel_source::linked(parent)), parent_(parent) {
        if (limit) {
            guard_ = time::deadline_guard(io, *limit, source_);
        }
    }

    coro::cancel_token token() const noexcept { return source_.get_token(); }

    /// Turn an interrupted wait into the matching error
    errors::error interrupted(errors::timeout_phase phase,
                              std::optional<std::chrono::milliseconds> limit) const {
        if (guard_.expired()) {
            return errors::timeout_error(phase,
                fmt::format("{} phase exceeded {}ms", errors::phase_name(phase), limit ? limit->count() : 0));
        }
        if (parent_.reason() == coro::cancel_reason::timeout) {
            return errors::timeout_error(errors::timeout_phase::total, "total deadline passed");
        }
        return errors::cancelled_error();
    }

private:
    coro::cancel_source source_;
    coro::cancel_token parent_;
    time::deadline_guard guard_;
};

/// HTTP/1.1 body. Owns the lease until the body ends, then gives the
/// connection back (reusable only after a clean, keep-alive exchange).
class h1_body_source : public http::body_source {
public:
    h1_body_source(io::io_context& io, pool::connection_lease lease, http::body_decoder decoder,
                   bool keep_alive, std::optional<std::chrono::milliseconds> read_timeout)
        : io_(io)
        , lease_(std::move(lease))
        , decoder_(std::move(decoder))
        , keep_alive_(keep_alive)
        , read_timeout_(read_timeout)
        , buf_(read_chunk_size) {}

    coro::task<http::chunk_result> read_chunk(coro::cancel_token token) override {
        if (done_) {
            co_return std::optional<std::string>{};
        }
        std::string out;
        for (;;) {
            auto st = decoder_.decode(lease_->buffer, out, max_body_chunk);
            if (st == http::parse_result::error) {
                co_return fail(errors::protocol_error(std::string(decoder_.error_message())));
            }
            if (st == http::parse_result::complete) {
                finish(keep_alive_);
            }
            if (!out.empty()) {
                co_return std::optional<std::string>{std::move(out)};
            }
            if (done_) {
                co_return std::optional<std::string>{};
            }

            phase_scope scope(io_, token, read_timeout_);
            auto r = co_await lease_->stream.read(buf_.data(), buf_.size(), scope.token());
            if (r.result == 0) {
                if (decoder_.finish_on_eof() == http::parse_result::complete) {
                    finish(false);
                    co_return std::optional<std::string>{};
                }
                auto e = errors::transport_error(errors::io_direction::read, 0, true);
                e.message = std::string(decoder_.error_message());
                co_return fail(std::move(e));
            }
            if (r.result < 0) {
                if (r.error_code() == ECANCELED) {
                    co_return fail(scope.interrupted(errors::timeout_phase::read, read_timeout_));
                }
                TERN_LOG_ERROR("response body read failed: {}", strerror(r.error_code()));
                co_return fail(errors::transport_error(errors::io_direction::read, r.error_code(), true));
            }
            lease_->buffer.append(buf_.data(), static_cast<size_t>(r.result));
        }
    }

    void abandon() noexcept override {
        if (!done_) {
            done_ = true;
            lease_.discard();
        }
    }

private:
    void finish(bool reusable) {
        done_ = true;
        lease_.release(reusable && lease_->buffer.empty());
    }

    http::chunk_result fail(errors::error e) {
        done_ = true;
        lease_.discard();
        return std::unexpected(std::move(e));
    }

    io::io_context& io_;
    pool::connection_lease lease_;
    http::body_decoder decoder_;
    bool keep_alive_;
    std::optional<std::chrono::milliseconds> read_timeout_;
    std::vector<char> buf_;
    bool done_ = false;
};

/// HTTP/2 body. DATA is credited back to the peer as it is pulled.
class h2_body_source : public http::body_source {
public:
    h2_body_source(io::io_context& io, std::shared_ptr<http::h2_session> session,
                   std::shared_ptr<http::h2_stream> stream,
                   std::optional<std::chrono::milliseconds> read_timeout)
        : io_(io)
        , session_(std::move(session))
        , stream_(std::move(stream))
        , read_timeout_(read_timeout) {}

    ~h2_body_source() override { abandon(); }

    coro::task<http::chunk_result> read_chunk(coro::cancel_token token) override {
        while (!done_) {
            phase_scope scope(io_, token, read_timeout_);
            auto ev = co_await stream_->next_event(scope.token());
            if (!ev) {
                auto e = token.is_cancelled() || scope.token().is_cancelled()
                    ? scope.interrupted(errors::timeout_phase::read, read_timeout_)
                    : errors::transport_error(errors::io_direction::read, ECONNRESET, true);
                abandon();
                co_return std::unexpected(std::move(e));
            }
            switch (ev->kind) {
                case http::h2_event::type::data:
                    session_->consume(*stream_, ev->data.size());
                    if (!ev->data.empty()) {
                        co_return std::optional<std::string>{std::move(ev->data)};
                    }
                    break;
                case http::h2_event::type::end:
                    done_ = true;
                    co_return std::optional<std::string>{};
                case http::h2_event::type::error:
                    done_ = true;
                    co_return std::unexpected(std::move(ev->failure));
                default:
                    break;  // trailers and late `sent` notifications
            }
        }
        co_return std::optional<std::string>{};
    }

    void abandon() noexcept override {
        if (!done_) {
            done_ = true;
            session_->reset_stream(*stream_);
        }
    }

private:
    io::io_context& io_;
    std::shared_ptr<http::h2_session> session_;
    std::shared_ptr<http::h2_stream> stream_;
    std::optional<std::chrono::milliseconds> read_timeout_;
    bool done_ = false;
};

inline std::optional<std::chrono::milliseconds> phase_limit(
        const std::optional<std::chrono::milliseconds>& override_value,
        const http::extensions& ext, std::string_view key,
        const std::optional<std::chrono::milliseconds>& configured) {
    if (override_value) {
        return override_value;
    }
    if (auto secs = http::ext_number(ext, key); secs && *secs > 0) {
        return http::seconds_to_ms(*secs);
    }
    return configured;
}

} // namespace detail

/// Innermost stage: takes a connection from the pool and runs one
/// exchange on it. Per-phase timeouts are armed here.
class pool_engine {
public:
    pool_engine(io::io_context& io, std::shared_ptr<pool::connection_pool> pool)
        : io_(io), pool_(std::move(pool)) {}

    pool::connection_pool& pool() noexcept { return *pool_; }

    coro::task<stage_result> handle(const http::request_descriptor& req, pipeline_context& ctx) {
        if ((req.target.scheme != "http" && req.target.scheme != "https") || req.target.host.empty()) {
            co_return std::unexpected(errors::invalid_request("url", "absolute http or https URL required"));
        }
        if (ctx.token.is_cancelled()) {
            co_return std::unexpected(cancelled_for(ctx.token));
        }

        limits lim{
            detail::phase_limit(req.overrides.connect_timeout, req.extensions, http::ext::connect_timeout,
                                ctx.phase_timeouts.connect),
            detail::phase_limit(req.overrides.write_timeout, req.extensions, http::ext::write_timeout,
                                ctx.phase_timeouts.write),
            detail::phase_limit(req.overrides.read_timeout, req.extensions, http::ext::read_timeout,
                                ctx.phase_timeouts.read),
        };

        errors::result<pool::acquired_connection> conn;
        {
            detail::phase_scope scope(io_, ctx.token, lim.connect);
            conn = co_await pool_->acquire(req.target, scope.token());
            if (!conn && conn.error().kind == errors::error_kind::cancelled) {
                co_return std::unexpected(scope.interrupted(errors::timeout_phase::connect, lim.connect));
            }
        }
        if (!conn) {
            co_return std::unexpected(std::move(conn.error()));
        }

        if (conn->is_h2()) {
            co_return co_await exchange_h2(req, ctx, std::move(conn->h2), lim);
        }
        co_return co_await exchange_h1(req, ctx, std::move(conn->h1), lim);
    }

private:
    struct limits {
        std::optional<std::chrono::milliseconds> connect;
        std::optional<std::chrono::milliseconds> write;
        std::optional<std::chrono::milliseconds> read;
    };

    static errors::error cancelled_for(const coro::cancel_token& token) {
        if (token.reason() == coro::cancel_reason::timeout) {
            return errors::timeout_error(errors::timeout_phase::total, "total deadline passed");
        }
        return errors::cancelled_error();
    }

    // Request head and body. Returns the error to fail the attempt with.
    coro::task<std::optional<errors::error>> write_h1(const http::request_descriptor& req, pipeline_context& ctx,
                                                      pool::pooled_connection& conn, const limits& lim) {
        detail::phase_scope scope(io_, ctx.token, lim.write);
        auto failed = [&](io::io_result w) {
            if (w.error_code() == ECANCELED) {
                return scope.interrupted(errors::timeout_phase::write, lim.write);
            }
            TERN_LOG_ERROR("request write to {} failed: {}", conn.key.to_string(), strerror(w.error_code()));
            return errors::transport_error(errors::io_direction::write, w.error_code(), false);
        };

        std::string head = http::serialize_request_head(req);
        auto framing = http::request_framing_for(req);
        if (req.body.type() == http::request_body::kind::fixed) {
            head.append(req.body.bytes());
            ctx.request_bytes += req.body.bytes().size();
        }
        auto w = co_await conn.stream.write_all(head, scope.token());
        if (!w.success()) {
            co_return failed(w);
        }
        if (req.body.type() != http::request_body::kind::streaming) {
            co_return std::nullopt;
        }

        auto expected_len = req.body.length();
        uint64_t sent = 0;
        for (;;) {
            auto chunk = req.body.producer()->next_chunk();
            if (!chunk) {
                break;
            }
            if (chunk->empty()) {
                continue;
            }
            sent += chunk->size();
            if (expected_len && sent > *expected_len) {
                co_return errors::invalid_request("body", "request body longer than its announced length");
            }
            std::string framed = framing == http::request_framing::chunked ? http::encode_chunk(*chunk)
                                                                           : std::move(*chunk);
            w = co_await conn.stream.write_all(framed, scope.token());
            if (!w.success()) {
                co_return failed(w);
            }
            ctx.request_bytes += framed.size();
        }
        if (expected_len && sent != *expected_len) {
            co_return errors::invalid_request("body", "request body shorter than its announced length");
        }
        if (framing == http::request_framing::chunked) {
            w = co_await conn.stream.write_all(http::last_chunk, scope.token());
            if (!w.success()) {
                co_return failed(w);
            }
        }
        co_return std::nullopt;
    }

    coro::task<stage_result> exchange_h1(const http::request_descriptor& req, pipeline_context& ctx,
                                         pool::connection_lease lease, limits lim) {
        ++lease->requests;
        const bool reused = lease.reused();
        if (auto err = co_await write_h1(req, ctx, *lease, lim)) {
            lease.discard();
            if (reused && err->kind == errors::error_kind::transport) {
                err->with_context("on a reused connection");
            }
            co_return std::unexpected(std::move(*err));
        }

        http::response_head_parser parser;
        std::vector<char> buf(detail::read_chunk_size);
        bool received = false;
        {
            detail::phase_scope scope(io_, ctx.token, lim.read);
            for (;;) {
                auto st = parser.parse(lease->buffer);
                if (st == http::parse_result::error) {
                    lease.discard();
                    co_return std::unexpected(errors::protocol_error(std::string(parser.error_message())));
                }
                if (st == http::parse_result::complete) {
                    if (parser.status() >= 100 && parser.status() < 200) {
                        if (parser.status() == 101) {
                            lease.discard();
                            co_return std::unexpected(errors::protocol_error("unexpected 101 Switching Protocols"));
                        }
                        parser.reset();
                        continue;
                    }
                    break;
                }
                auto r = co_await lease->stream.read(buf.data(), buf.size(), scope.token());
                if (r.result == 0) {
                    lease.discard();
                    auto e = errors::transport_error(errors::io_direction::read, 0, received);
                    if (!received) {
                        e.message = "connection closed before response";
                    }
                    co_return std::unexpected(std::move(e));
                }
                if (r.result < 0) {
                    lease.discard();
                    if (r.error_code() == ECANCELED) {
                        co_return std::unexpected(scope.interrupted(errors::timeout_phase::read, lim.read));
                    }
                    TERN_LOG_ERROR("response read from {} failed: {}", lease->key.to_string(),
                                   strerror(r.error_code()));
                    co_return std::unexpected(
                        errors::transport_error(errors::io_direction::read, r.error_code(), received));
                }
                received = true;
                lease->buffer.append(buf.data(), static_cast<size_t>(r.result));
            }
        }

        http::response resp;
        resp.status = parser.status();
        resp.http_version = parser.version_minor() == 0 ? "HTTP/1.0" : "HTTP/1.1";
        resp.headers = parser.take_headers();
        resp.extensions[std::string(http::ext::http_version)] = resp.http_version;

        auto framing = http::framing_for(req.method, resp.status, resp.headers);
        bool keep_alive = framing != http::body_framing::until_close &&
                          resp.headers.keep_alive(parser.version_minor());
        if (framing == http::body_framing::until_close && resp.headers.contains("Content-Length") &&
            !resp.headers.contains("Transfer-Encoding")) {
            lease.discard();
            co_return std::unexpected(errors::protocol_error("invalid Content-Length"));
        }
        if (framing == http::body_framing::none) {
            lease.release(keep_alive && lease->buffer.empty());
            co_return resp;
        }
        http::body_decoder decoder(framing, resp.headers.content_length().value_or(0));
        resp.body = http::body_stream(std::make_unique<detail::h1_body_source>(
            io_, std::move(lease), std::move(decoder), keep_alive, lim.read));
        co_return resp;
    }

    coro::task<stage_result> exchange_h2(const http::request_descriptor& req, pipeline_context& ctx,
                                         std::shared_ptr<http::h2_session> session, limits lim) {
        auto submitted = session->submit(req);
        if (!submitted) {
            co_return std::unexpected(std::move(submitted.error()));
        }
        auto stream = std::move(*submitted);
        if (auto len = req.body.length()) {
            ctx.request_bytes += *len;
        }

        // Write phase until END_STREAM went out, then read phase until the
        // final head. A server may answer before the upload is done.
        bool sent = false;
        for (;;) {
            auto phase = sent ? errors::timeout_phase::read : errors::timeout_phase::write;
            auto limit = sent ? lim.read : lim.write;
            detail::phase_scope scope(io_, ctx.token, limit);
            auto ev = co_await stream->next_event(scope.token());
            if (!ev) {
                session->reset_stream(*stream);
                if (scope.token().is_cancelled()) {
                    co_return std::unexpected(scope.interrupted(phase, limit));
                }
                co_return std::unexpected(errors::transport_error(errors::io_direction::read, ECONNRESET, false));
            }
            switch (ev->kind) {
                case http::h2_event::type::sent:
                    sent = true;
                    continue;
                case http::h2_event::type::headers: {
                    http::response resp;
                    resp.status = ev->status;
                    resp.http_version = "HTTP/2";
                    resp.headers = std::move(ev->headers);
                    resp.extensions[std::string(http::ext::http_version)] = resp.http_version;
                    resp.body = http::body_stream(std::make_unique<detail::h2_body_source>(
                        io_, std::move(session), std::move(stream), lim.read));
                    co_return resp;
                }
                case http::h2_event::type::error:
                    co_return std::unexpected(std::move(ev->failure));
                default:
                    session->reset_stream(*stream);
                    co_return std::unexpected(errors::protocol_error("HTTP/2 stream ended before response head"));
            }
        }
    }

    io::io_context& io_;
    std::shared_ptr<pool::connection_pool> pool_;
};

} // namespace tern::pipeline
