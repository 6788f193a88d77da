#pragma once

#include <tern/coro/cancel_token.hpp>
#include <tern/coro/task.hpp>
#include <tern/errors/error.hpp>
#include <tern/http/http_common.hpp>
#include <tern/http/request.hpp>
#include <tern/io/io_backend.hpp>
#include <tern/log/macros.hpp>
#include <tern/net/stream.hpp>
#include <tern/sync/primitives.hpp>

#include <nghttp2/nghttp2.h>

#include <algorithm>
#include <charconv>
#include <cstring>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace tern::http {

/// HTTP/2 error codes
enum class h2_error {
    none = 0,
    protocol_error = NGHTTP2_PROTOCOL_ERROR,
    internal_error = NGHTTP2_INTERNAL_ERROR,
    flow_control_error = NGHTTP2_FLOW_CONTROL_ERROR,
    settings_timeout = NGHTTP2_SETTINGS_TIMEOUT,
    stream_closed = NGHTTP2_STREAM_CLOSED,
    frame_size_error = NGHTTP2_FRAME_SIZE_ERROR,
    refused_stream = NGHTTP2_REFUSED_STREAM,
    cancel = NGHTTP2_CANCEL,
    compression_error = NGHTTP2_COMPRESSION_ERROR,
    connect_error = NGHTTP2_CONNECT_ERROR,
    enhance_your_calm = NGHTTP2_ENHANCE_YOUR_CALM,
    inadequate_security = NGHTTP2_INADEQUATE_SECURITY,
    http_1_1_required = NGHTTP2_HTTP_1_1_REQUIRED
};

/// What a stream reports to the request that owns it
struct h2_event {
    enum class type {
        sent,       ///< request fully written (END_STREAM went out)
        headers,    ///< final response head
        data,
        end,
        error
    };

    type kind = type::end;
    int status = 0;
    header_list headers;
    std::string data;
    errors::error failure;
};

class h2_session;

/// One request/response exchange on a shared session.
///
/// Events are queued without bound on the session side; the peer cannot
/// run ahead because received DATA is only credited back (WINDOW_UPDATE)
/// when the consumer calls h2_session::consume().
class h2_stream {
public:
    h2_stream() = default;
    h2_stream(const h2_stream&) = delete;
    h2_stream& operator=(const h2_stream&) = delete;

    int32_t id() const noexcept { return id_; }

    auto next_event(coro::cancel_token token = {}) {
        return events_.recv(std::move(token));
    }

private:
    friend class h2_session;

    // Data provider side: fill an outgoing DATA frame (session mutex held)
    ssize_t fill_body(uint8_t* buf, size_t length, uint32_t* flags) {
        if (body_.type() == request_body::kind::fixed) {
            auto bytes = body_.bytes();
            size_t n = std::min(length, bytes.size() - body_offset_);
            std::memcpy(buf, bytes.data() + body_offset_, n);
            body_offset_ += n;
            if (body_offset_ == bytes.size()) {
                *flags |= NGHTTP2_DATA_FLAG_EOF;
            }
            return static_cast<ssize_t>(n);
        }
        while (body_offset_ == pending_.size() && !body_eof_) {
            auto chunk = body_.producer()->next_chunk();
            if (!chunk) {
                body_eof_ = true;
                break;
            }
            pending_ = std::move(*chunk);
            body_offset_ = 0;
        }
        size_t n = std::min(length, pending_.size() - body_offset_);
        std::memcpy(buf, pending_.data() + body_offset_, n);
        body_offset_ += n;
        if (body_eof_ && body_offset_ == pending_.size()) {
            *flags |= NGHTTP2_DATA_FLAG_EOF;
        }
        return static_cast<ssize_t>(n);
    }

    int32_t id_ = -1;
    sync::channel<h2_event> events_{0};

    request_body body_;
    std::string pending_;
    size_t body_offset_ = 0;
    bool body_eof_ = false;

    int status_ = 0;
    header_list headers_;
    bool headers_done_ = false;
    bool finished_ = false;
    bool abandoned_ = false;
    size_t unconsumed_ = 0;
};

/// Client HTTP/2 session over one connection, shared by many requests.
///
/// A single driver coroutine owns every read and write on the connection
/// (an SSL object must not be used from two threads at once). Requests
/// interact with nghttp2 under the session mutex and "kick" the driver
/// when they produced output, e.g. a new HEADERS frame or a
/// WINDOW_UPDATE after a body pull.
class h2_session : public std::enable_shared_from_this<h2_session> {
public:
    struct options {
        uint32_t initial_window_size = 256 * 1024;
        uint32_t max_concurrent_streams = 100;
    };

    h2_session(net::stream stream, std::string peer)
        : h2_session(std::move(stream), std::move(peer), options{}) {}

    h2_session(net::stream stream, std::string peer, options opts)
        : stream_(std::move(stream)), peer_(std::move(peer)) {
        nghttp2_session_callbacks* callbacks = nullptr;
        if (nghttp2_session_callbacks_new(&callbacks) != 0) {
            throw std::runtime_error("Failed to allocate nghttp2 callbacks");
        }
        nghttp2_session_callbacks_set_on_frame_recv_callback(callbacks, on_frame_recv_callback);
        nghttp2_session_callbacks_set_on_frame_send_callback(callbacks, on_frame_send_callback);
        nghttp2_session_callbacks_set_on_frame_not_send_callback(callbacks, on_frame_not_send_callback);
        nghttp2_session_callbacks_set_on_data_chunk_recv_callback(callbacks, on_data_chunk_recv_callback);
        nghttp2_session_callbacks_set_on_stream_close_callback(callbacks, on_stream_close_callback);
        nghttp2_session_callbacks_set_on_header_callback(callbacks, on_header_callback);

        nghttp2_option* option = nullptr;
        nghttp2_option_new(&option);
        // flow control is driven by the consumer, see consume()
        nghttp2_option_set_no_auto_window_update(option, 1);

        int rv = nghttp2_session_client_new2(&session_, callbacks, this, option);
        nghttp2_option_del(option);
        nghttp2_session_callbacks_del(callbacks);
        if (rv != 0) {
            throw std::runtime_error(std::string("Failed to create HTTP/2 session: ") + nghttp2_strerror(rv));
        }

        nghttp2_settings_entry settings[] = {
            {NGHTTP2_SETTINGS_MAX_CONCURRENT_STREAMS, opts.max_concurrent_streams},
            {NGHTTP2_SETTINGS_INITIAL_WINDOW_SIZE, opts.initial_window_size},
            {NGHTTP2_SETTINGS_ENABLE_PUSH, 0}
        };
        nghttp2_submit_settings(session_, NGHTTP2_FLAG_NONE, settings,
                                sizeof(settings) / sizeof(settings[0]));
        kick_ = coro::cancel_source::linked(io_cancel_.get_token());
        idle_since_ = io::clock::now();
    }

    ~h2_session() {
        if (session_) {
            nghttp2_session_del(session_);
        }
    }

    h2_session(const h2_session&) = delete;
    h2_session& operator=(const h2_session&) = delete;

    /// Launch the driver. The driver keeps the session alive until the
    /// connection ends.
    void start() {
        run(shared_from_this()).go();
    }

    /// Open a stream for `req`. Fails without touching the connection if
    /// the session no longer takes streams.
    errors::result<std::shared_ptr<h2_stream>> submit(const request_descriptor& req) {
        auto st = std::make_shared<h2_stream>();
        st->body_ = req.body;

        std::vector<std::pair<std::string, std::string>> fields;
        fields.reserve(req.headers.size() + 5);
        fields.emplace_back(":method", std::string(req.method.name()));
        fields.emplace_back(":scheme", req.target.scheme);
        std::string authority = req.headers.contains("Host") ? std::string(req.headers.get("Host"))
                                                             : req.target.authority();
        fields.emplace_back(":authority", std::move(authority));
        fields.emplace_back(":path", req.target.target());
        for (const auto& [name, value] : req.headers) {
            std::string lower = to_lower(name);
            if (lower == "host" || lower == "connection" || lower == "keep-alive" ||
                lower == "proxy-connection" || lower == "transfer-encoding" ||
                lower == "upgrade" || lower == "content-length") {
                continue;
            }
            if (lower == "te" && !iequals(value, "trailers")) {
                continue;
            }
            fields.emplace_back(std::move(lower), value);
        }
        if (auto len = req.body.length(); len && !req.body.empty()) {
            fields.emplace_back("content-length", std::to_string(*len));
        }

        std::vector<nghttp2_nv> nva;
        nva.reserve(fields.size());
        for (auto& [name, value] : fields) {
            nva.push_back(nghttp2_nv{
                reinterpret_cast<uint8_t*>(name.data()),
                reinterpret_cast<uint8_t*>(value.data()),
                name.size(), value.size(), NGHTTP2_NV_FLAG_NONE});
        }

        nghttp2_data_provider provider{};
        provider.source.ptr = st.get();
        provider.read_callback = read_body_callback;

        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!accepting_locked()) {
                auto e = errors::transport_error(errors::io_direction::write, ECONNRESET, false);
                e.message = "HTTP/2 session is closing";
                return std::unexpected(std::move(e));
            }
            int32_t id = nghttp2_submit_request(session_, nullptr, nva.data(), nva.size(),
                                                req.body.empty() ? nullptr : &provider, st.get());
            if (id < 0) {
                TERN_LOG_ERROR("HTTP/2 submit to {} failed: {}", peer_, nghttp2_strerror(id));
                auto e = errors::transport_error(errors::io_direction::write, EPROTO, false);
                e.message = std::string("HTTP/2 submit failed: ") + nghttp2_strerror(id);
                return std::unexpected(std::move(e));
            }
            st->id_ = id;
            streams_.emplace(id, st);
        }
        kick();
        return st;
    }

    /// The consumer took `n` bytes of DATA off the stream; let the peer
    /// send that much more.
    void consume(h2_stream& st, size_t n) {
        if (n == 0) return;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (dead_) return;
            n = std::min(n, st.unconsumed_);
            st.unconsumed_ -= n;
            nghttp2_session_consume(session_, st.id_, n);
        }
        kick();
    }

    /// Abandon a stream: RST_STREAM(CANCEL) if still open, and credit back
    /// whatever was received but never read. The session is unaffected.
    void reset_stream(h2_stream& st) noexcept {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (dead_ || st.abandoned_) return;
            st.abandoned_ = true;
            if (st.unconsumed_ > 0) {
                nghttp2_session_consume(session_, st.id_, st.unconsumed_);
                st.unconsumed_ = 0;
            }
            if (!st.finished_) {
                nghttp2_submit_rst_stream(session_, NGHTTP2_FLAG_NONE, st.id_, NGHTTP2_CANCEL);
                TERN_LOG_DEBUG("HTTP/2 stream {} on {} reset (cancel)", st.id_, peer_);
            }
        }
        kick();
    }

    /// Healthy, not draining and below the peer's concurrent-stream limit
    bool can_take_stream() const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!accepting_locked()) return false;
        uint32_t limit = nghttp2_session_get_remote_settings(session_, NGHTTP2_SETTINGS_MAX_CONCURRENT_STREAMS);
        return streams_.size() < limit;
    }

    bool is_alive() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return !dead_;
    }

    size_t active_streams() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return streams_.size();
    }

    io::clock::time_point idle_since() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return idle_since_;
    }

    const std::string& peer() const noexcept { return peer_; }

    /// Send GOAWAY; the connection closes once open streams finish.
    void shutdown() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closing_ || dead_) return;
            closing_ = true;
            nghttp2_submit_goaway(session_, NGHTTP2_FLAG_NONE,
                                  nghttp2_session_get_last_proc_stream_id(session_),
                                  NGHTTP2_NO_ERROR, nullptr, 0);
        }
        kick();
    }

    /// Tear the connection down now; open streams fail.
    void close() {
        shutdown();
        io_cancel_.cancel(coro::cancel_reason::shutdown);
    }

private:
    using outbox = std::vector<std::pair<std::shared_ptr<h2_stream>, h2_event>>;

    bool accepting_locked() const {
        return !dead_ && !closing_ && !goaway_ &&
               nghttp2_session_get_next_stream_id(session_) < (1u << 31) - 1;
    }

    void kick() {
        coro::cancel_source src;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            kicked_ = true;
            src = kick_;
        }
        src.cancel();
    }

    static coro::task<void> run(std::shared_ptr<h2_session> self) {
        co_await self->drive();
    }

    coro::task<void> drive() {
        std::vector<char> buf(16384);
        auto io_token = io_cancel_.get_token();
        for (;;) {
            std::string out;
            bool done = false;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (dead_) {
                    break;
                }
                for (;;) {
                    const uint8_t* data = nullptr;
                    ssize_t len = nghttp2_session_mem_send(session_, &data);
                    if (len < 0) {
                        TERN_LOG_ERROR("HTTP/2 send error on {}: {}", peer_,
                                       nghttp2_strerror(static_cast<int>(len)));
                        fail_locked(errors::protocol_error(
                            std::string("HTTP/2 send error: ") + nghttp2_strerror(static_cast<int>(len))));
                        break;
                    }
                    if (len == 0) break;
                    out.append(reinterpret_cast<const char*>(data), static_cast<size_t>(len));
                }
                done = dead_ || (!nghttp2_session_want_read(session_) && !nghttp2_session_want_write(session_)) ||
                       (closing_ && streams_.empty());
            }
            deliver();

            if (!out.empty()) {
                auto w = co_await stream_.write_all(out, io_token);
                if (!w.success()) {
                    fail_io(errors::io_direction::write, w.error_code());
                    break;
                }
                continue;
            }
            if (done) {
                break;
            }

            auto r = stream_.try_read(buf.data(), buf.size());
            if (r.result > 0) {
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    ssize_t rv = nghttp2_session_mem_recv(session_, reinterpret_cast<const uint8_t*>(buf.data()),
                                                          static_cast<size_t>(r.result));
                    if (rv < 0) {
                        TERN_LOG_ERROR("HTTP/2 recv error on {}: {}", peer_,
                                       nghttp2_strerror(static_cast<int>(rv)));
                        fail_locked(errors::protocol_error(
                            std::string("HTTP/2 framing error: ") + nghttp2_strerror(static_cast<int>(rv))));
                    }
                }
                deliver();
                continue;
            }
            if (r.result == 0) {
                fail_io(errors::io_direction::read, 0);
                break;
            }
            if (r.result != -EAGAIN && r.result != -EINTR) {
                fail_io(errors::io_direction::read, -r.result);
                break;
            }

            coro::cancel_token wake;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (kicked_) {
                    kicked_ = false;
                    continue;
                }
                wake = kick_.get_token();
            }
            auto w = co_await stream_.wait_readable(wake);
            if (io_token.is_cancelled()) {
                std::lock_guard<std::mutex> lock(mutex_);
                fail_locked(errors::cancelled_error("HTTP/2 session closed"));
                break;
            }
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (kick_.is_cancelled()) {
                    kick_ = coro::cancel_source::linked(io_token);
                }
                kicked_ = false;
            }
            if (!w.success() && w.error_code() != ECANCELED) {
                fail_io(errors::io_direction::read, w.error_code());
                break;
            }
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            dead_ = true;
        }
        deliver();
        stream_.close();
        TERN_LOG_DEBUG("HTTP/2 session to {} ended", peer_);
    }

    void fail_io(errors::io_direction dir, int err) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!dead_) {
                TERN_LOG_DEBUG("HTTP/2 connection to {} lost: {}", peer_, err ? strerror(err) : "closed by peer");
            }
            fail_locked(errors::transport_error(dir, err == 0 ? ECONNRESET : err, false));
        }
        deliver();
    }

    // mutex held: every open stream fails with `e`
    void fail_locked(errors::error e) {
        dead_ = true;
        for (auto& [id, st] : streams_) {
            if (st->finished_) continue;
            st->finished_ = true;
            h2_event ev;
            ev.kind = h2_event::type::error;
            ev.failure = e;
            ev.failure.response_started = st->headers_done_;
            outbox_.emplace_back(st, std::move(ev));
        }
        streams_.clear();
    }

    // Events are handed over outside the mutex; a woken consumer may call
    // straight back into the session.
    void deliver() {
        outbox pending;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            pending.swap(outbox_);
        }
        for (auto& [st, ev] : pending) {
            st->events_.try_send(std::move(ev));
        }
    }

    void emit(h2_stream* st, h2_event ev) {
        auto it = streams_.find(st->id_);
        if (it == streams_.end()) return;
        outbox_.emplace_back(it->second, std::move(ev));
    }

    h2_stream* get_stream(int32_t stream_id) {
        auto it = streams_.find(stream_id);
        return it != streams_.end() ? it->second.get() : nullptr;
    }

    static ssize_t read_body_callback(nghttp2_session*, int32_t, uint8_t* buf, size_t length,
                                      uint32_t* data_flags, nghttp2_data_source* source, void*) {
        auto* st = static_cast<h2_stream*>(source->ptr);
        try {
            return st->fill_body(buf, length, data_flags);
        } catch (const std::exception& e) {
            TERN_LOG_ERROR("request body producer failed: {}", e.what());
            return NGHTTP2_ERR_TEMPORAL_CALLBACK_FAILURE;
        }
    }

    static int on_header_callback(nghttp2_session*, const nghttp2_frame* frame,
                                  const uint8_t* name, size_t namelen,
                                  const uint8_t* value, size_t valuelen,
                                  uint8_t, void* user_data) {
        auto* self = static_cast<h2_session*>(user_data);
        if (frame->hd.type != NGHTTP2_HEADERS) return 0;
        auto* st = self->get_stream(frame->hd.stream_id);
        if (!st || st->headers_done_) {
            return 0;  // trailers are dropped
        }
        std::string_view n(reinterpret_cast<const char*>(name), namelen);
        std::string_view v(reinterpret_cast<const char*>(value), valuelen);
        if (n == ":status") {
            int code = 0;
            auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), code);
            if (ec == std::errc{}) st->status_ = code;
        } else if (!n.starts_with(":")) {
            st->headers_.add(n, v);
        }
        return 0;
    }

    static int on_frame_recv_callback(nghttp2_session*, const nghttp2_frame* frame, void* user_data) {
        auto* self = static_cast<h2_session*>(user_data);
        switch (frame->hd.type) {
            case NGHTTP2_HEADERS: {
                auto* st = self->get_stream(frame->hd.stream_id);
                if (!st) break;
                if ((frame->hd.flags & NGHTTP2_FLAG_END_HEADERS) && !st->headers_done_) {
                    if (st->status_ >= 100 && st->status_ < 200) {
                        // interim response, the final head follows
                        st->status_ = 0;
                        st->headers_.clear();
                    } else {
                        st->headers_done_ = true;
                        h2_event ev;
                        ev.kind = h2_event::type::headers;
                        ev.status = st->status_;
                        ev.headers = std::move(st->headers_);
                        self->emit(st, std::move(ev));
                    }
                }
                if ((frame->hd.flags & NGHTTP2_FLAG_END_STREAM) && !st->finished_) {
                    st->finished_ = true;
                    self->emit(st, h2_event{});
                }
                break;
            }
            case NGHTTP2_DATA: {
                auto* st = self->get_stream(frame->hd.stream_id);
                if (st && (frame->hd.flags & NGHTTP2_FLAG_END_STREAM) && !st->finished_) {
                    st->finished_ = true;
                    self->emit(st, h2_event{});
                }
                break;
            }
            case NGHTTP2_GOAWAY:
                self->goaway_ = true;
                TERN_LOG_DEBUG("GOAWAY from {} (last stream {}, code {})", self->peer_,
                               frame->goaway.last_stream_id, frame->goaway.error_code);
                break;
            default:
                break;
        }
        return 0;
    }

    static int on_frame_send_callback(nghttp2_session*, const nghttp2_frame* frame, void* user_data) {
        auto* self = static_cast<h2_session*>(user_data);
        if ((frame->hd.type == NGHTTP2_HEADERS || frame->hd.type == NGHTTP2_DATA) &&
            (frame->hd.flags & NGHTTP2_FLAG_END_STREAM)) {
            if (auto* st = self->get_stream(frame->hd.stream_id)) {
                h2_event ev;
                ev.kind = h2_event::type::sent;
                self->emit(st, std::move(ev));
            }
        }
        return 0;
    }

    static int on_frame_not_send_callback(nghttp2_session*, const nghttp2_frame* frame,
                                          int lib_error_code, void* user_data) {
        auto* self = static_cast<h2_session*>(user_data);
        if (frame->hd.type != NGHTTP2_HEADERS) return 0;
        auto* st = self->get_stream(frame->hd.stream_id);
        if (!st || st->finished_) return 0;
        st->finished_ = true;
        h2_event ev;
        ev.kind = h2_event::type::error;
        ev.failure = errors::transport_error(errors::io_direction::write, EPROTO, false);
        ev.failure.message = std::string("request HEADERS not sent: ") + nghttp2_strerror(lib_error_code);
        self->emit(st, std::move(ev));
        return 0;
    }

    static int on_data_chunk_recv_callback(nghttp2_session* session, uint8_t, int32_t stream_id,
                                           const uint8_t* data, size_t len, void* user_data) {
        auto* self = static_cast<h2_session*>(user_data);
        auto* st = self->get_stream(stream_id);
        if (!st || st->abandoned_) {
            nghttp2_session_consume(session, stream_id, len);
            return 0;
        }
        st->unconsumed_ += len;
        h2_event ev;
        ev.kind = h2_event::type::data;
        ev.data.assign(reinterpret_cast<const char*>(data), len);
        self->emit(st, std::move(ev));
        return 0;
    }

    static int on_stream_close_callback(nghttp2_session*, int32_t stream_id,
                                        uint32_t error_code, void* user_data) {
        auto* self = static_cast<h2_session*>(user_data);
        auto* st = self->get_stream(stream_id);
        if (!st) return 0;
        if (!st->finished_) {
            st->finished_ = true;
            h2_event ev;
            if (error_code == NGHTTP2_NO_ERROR) {
                ev.kind = h2_event::type::end;
            } else {
                ev.kind = h2_event::type::error;
                ev.failure = errors::transport_error(errors::io_direction::read, ECONNRESET,
                                                     st->headers_done_ &&
                                                         error_code != NGHTTP2_REFUSED_STREAM);
                ev.failure.message = std::string("stream reset by peer: ") +
                                     nghttp2_http2_strerror(error_code);
            }
            self->emit(st, std::move(ev));
        }
        self->streams_.erase(stream_id);
        if (self->streams_.empty()) {
            self->idle_since_ = io::clock::now();
        }
        return 0;
    }

    net::stream stream_;
    std::string peer_;
    nghttp2_session* session_ = nullptr;

    mutable std::mutex mutex_;
    std::unordered_map<int32_t, std::shared_ptr<h2_stream>> streams_;
    outbox outbox_;
    coro::cancel_source io_cancel_;
    coro::cancel_source kick_;
    bool kicked_ = false;
    bool dead_ = false;
    bool closing_ = false;
    bool goaway_ = false;
    io::clock::time_point idle_since_;
};

} // namespace tern::http
