#include <catch2/catch_test_macros.hpp>
#include <tern/http/http2_session.hpp>
#include <tern/io/io_context.hpp>
#include <tern/net/stream.hpp>
#include <tern/net/tcp.hpp>
#include <tern/runtime/scheduler.hpp>
#include "../test_main.cpp"  // For scaled timeouts

#include <atomic>
#include <cstring>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

using namespace tern;
using namespace tern::http;
using namespace tern::test;

TEST_CASE("HTTP/2 error codes", "[http2]") {
    SECTION("Error code values match nghttp2") {
        REQUIRE(static_cast<int>(h2_error::none) == 0);
        REQUIRE(static_cast<int>(h2_error::protocol_error) == NGHTTP2_PROTOCOL_ERROR);
        REQUIRE(static_cast<int>(h2_error::internal_error) == NGHTTP2_INTERNAL_ERROR);
        REQUIRE(static_cast<int>(h2_error::flow_control_error) == NGHTTP2_FLOW_CONTROL_ERROR);
        REQUIRE(static_cast<int>(h2_error::stream_closed) == NGHTTP2_STREAM_CLOSED);
        REQUIRE(static_cast<int>(h2_error::refused_stream) == NGHTTP2_REFUSED_STREAM);
        REQUIRE(static_cast<int>(h2_error::cancel) == NGHTTP2_CANCEL);
        REQUIRE(static_cast<int>(h2_error::http_1_1_required) == NGHTTP2_HTTP_1_1_REQUIRED);
    }
}

TEST_CASE("HTTP/2 event defaults", "[http2]") {
    h2_event ev;
    REQUIRE(ev.kind == h2_event::type::end);
    REQUIRE(ev.status == 0);
    REQUIRE(ev.headers.empty());
    REQUIRE(ev.data.empty());
}

namespace {

using field_list = std::vector<std::pair<std::string, std::string>>;

/// What the peer answers to every request
struct scripted_reply {
    field_list interim;   ///< a 1xx head sent before the final one, if not empty
    field_list head;      ///< final head, ":status" first
    std::string body;
    field_list trailers;
};

/// nghttp2 server session on one end of a socketpair, run by its own thread
class scripted_peer {
public:
    scripted_peer(int fd, scripted_reply reply) : fd_(fd), reply_(std::move(reply)) {
        thread_ = std::thread([this] { serve(); });
    }

    ~scripted_peer() {
        stop_ = true;
        if (thread_.joinable()) thread_.join();
        ::close(fd_);
    }

    scripted_peer(const scripted_peer&) = delete;
    scripted_peer& operator=(const scripted_peer&) = delete;

    /// Body bytes handed to nghttp2 so far, across all streams
    size_t body_sent() const noexcept { return sent_.load(); }

private:
    static std::vector<nghttp2_nv> to_nv(const field_list& fields) {
        std::vector<nghttp2_nv> out;
        for (const auto& [name, value] : fields) {
            out.push_back(nghttp2_nv{
                reinterpret_cast<uint8_t*>(const_cast<char*>(name.data())),
                reinterpret_cast<uint8_t*>(const_cast<char*>(value.data())),
                name.size(), value.size(), NGHTTP2_NV_FLAG_NONE});
        }
        return out;
    }

    static ssize_t send_cb(nghttp2_session*, const uint8_t* data, size_t length, int, void* user) {
        auto* self = static_cast<scripted_peer*>(user);
        ssize_t n = ::send(self->fd_, data, length, MSG_NOSIGNAL);
        return n < 0 ? NGHTTP2_ERR_CALLBACK_FAILURE : n;
    }

    static int on_frame_recv(nghttp2_session* session, const nghttp2_frame* frame, void* user) {
        auto* self = static_cast<scripted_peer*>(user);
        if ((frame->hd.type == NGHTTP2_HEADERS || frame->hd.type == NGHTTP2_DATA) &&
            (frame->hd.flags & NGHTTP2_FLAG_END_STREAM)) {
            self->answer(session, frame->hd.stream_id);
        }
        return 0;
    }

    static ssize_t read_body(nghttp2_session* session, int32_t stream_id, uint8_t* buf, size_t length,
                             uint32_t* flags, nghttp2_data_source*, void* user) {
        auto* self = static_cast<scripted_peer*>(user);
        auto& offset = self->offsets_[stream_id];
        const auto& body = self->reply_.body;
        size_t n = std::min(length, body.size() - offset);
        std::memcpy(buf, body.data() + offset, n);
        offset += n;
        self->sent_ += n;
        if (offset == body.size()) {
            *flags |= NGHTTP2_DATA_FLAG_EOF;
            if (!self->reply_.trailers.empty()) {
                *flags |= NGHTTP2_DATA_FLAG_NO_END_STREAM;
                auto nva = to_nv(self->reply_.trailers);
                nghttp2_submit_trailer(session, stream_id, nva.data(), nva.size());
            }
        }
        return static_cast<ssize_t>(n);
    }

    void answer(nghttp2_session* session, int32_t stream_id) {
        if (!reply_.interim.empty()) {
            auto nva = to_nv(reply_.interim);
            nghttp2_submit_headers(session, NGHTTP2_FLAG_NONE, stream_id, nullptr, nva.data(), nva.size(), nullptr);
        }
        auto nva = to_nv(reply_.head);
        nghttp2_data_provider provider{};
        provider.read_callback = &scripted_peer::read_body;
        nghttp2_submit_response(session, stream_id, nva.data(), nva.size(), &provider);
    }

    void serve() {
        nghttp2_session_callbacks* cbs = nullptr;
        nghttp2_session_callbacks_new(&cbs);
        nghttp2_session_callbacks_set_send_callback(cbs, &scripted_peer::send_cb);
        nghttp2_session_callbacks_set_on_frame_recv_callback(cbs, &scripted_peer::on_frame_recv);
        nghttp2_session* session = nullptr;
        nghttp2_session_server_new(&session, cbs, this);
        nghttp2_session_callbacks_del(cbs);
        nghttp2_submit_settings(session, NGHTTP2_FLAG_NONE, nullptr, 0);

        uint8_t buf[16384];
        while (!stop_.load()) {
            if (nghttp2_session_send(session) != 0) break;
            pollfd p{fd_, POLLIN, 0};
            int r = ::poll(&p, 1, 20);
            if (r < 0) break;
            if (r == 0) continue;
            ssize_t n = ::recv(fd_, buf, sizeof(buf), 0);
            if (n <= 0) break;
            if (nghttp2_session_mem_recv(session, buf, static_cast<size_t>(n)) < 0) break;
        }
        nghttp2_session_del(session);
    }

    int fd_;
    scripted_reply reply_;
    std::map<int32_t, size_t> offsets_;
    std::atomic<size_t> sent_{0};
    std::atomic<bool> stop_{false};
    std::thread thread_;
};

/// A client session talking to a scripted peer over a socketpair
struct session_fixture {
    explicit session_fixture(scripted_reply reply, h2_session::options opts = {}) {
        int fds[2];
        REQUIRE(::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds) == 0);
        int flags = ::fcntl(fds[0], F_GETFL, 0);
        ::fcntl(fds[0], F_SETFL, flags | O_NONBLOCK);

        sched.start();
        io.start();
        peer = std::make_unique<scripted_peer>(fds[1], std::move(reply));
        session = std::make_shared<h2_session>(net::stream(net::tcp_stream(io, fds[0])), "scripted-peer", opts);
        session->start();
    }

    ~session_fixture() {
        session->close();
        eventually([&] { return !session->is_alive(); });
        peer.reset();
        sched.shutdown();
        io.stop();
    }

    std::shared_ptr<h2_stream> open(const std::string& path) {
        request_descriptor req;
        req.method = verb::GET;
        req.target = *url::parse("http://scripted.test" + path);
        auto st = session->submit(req);
        REQUIRE(st);
        return *st;
    }

    /// Next event that is not the request-sent notice
    std::optional<h2_event> next(h2_stream& st) {
        for (;;) {
            auto ev = runtime::block_on(sched, [](h2_stream& s) -> coro::task<std::optional<h2_event>> {
                co_return co_await s.next_event();
            }(st));
            if (!ev || ev->kind != h2_event::type::sent) {
                return ev;
            }
        }
    }

    runtime::scheduler sched{2};
    io::io_context io;
    std::unique_ptr<scripted_peer> peer;
    std::shared_ptr<h2_session> session;
};

} // namespace

TEST_CASE("HTTP/2 interim responses are skipped", "[http2][session]") {
    scripted_reply reply;
    reply.interim = {{":status", "103"}, {"link", "</style.css>; rel=preload"}};
    reply.head = {{":status", "200"}, {"x-final", "yes"}};
    reply.body = "final";
    session_fixture f(reply);

    auto st = f.open("/early-hints");
    auto head = f.next(*st);
    REQUIRE(head);
    REQUIRE(head->kind == h2_event::type::headers);
    REQUIRE(head->status == 200);
    REQUIRE(head->headers.get("x-final") == "yes");
    REQUIRE_FALSE(head->headers.contains("link"));

    std::string body;
    for (;;) {
        auto ev = f.next(*st);
        REQUIRE(ev);
        if (ev->kind == h2_event::type::end) break;
        REQUIRE(ev->kind == h2_event::type::data);
        body += ev->data;
        f.session->consume(*st, ev->data.size());
    }
    REQUIRE(body == "final");
}

TEST_CASE("HTTP/2 trailers are dropped", "[http2][session]") {
    scripted_reply reply;
    reply.head = {{":status", "200"}};
    reply.body = "abc";
    reply.trailers = {{"x-checksum", "900150983cd24fb0"}};
    session_fixture f(reply);

    auto st = f.open("/with-trailers");
    auto head = f.next(*st);
    REQUIRE(head);
    REQUIRE(head->kind == h2_event::type::headers);
    REQUIRE_FALSE(head->headers.contains("x-checksum"));

    std::string body;
    int heads = 0;
    for (;;) {
        auto ev = f.next(*st);
        REQUIRE(ev);
        if (ev->kind == h2_event::type::end) break;
        if (ev->kind == h2_event::type::headers) ++heads;
        body += ev->data;
        f.session->consume(*st, ev->data.size());
    }
    REQUIRE(body == "abc");
    REQUIRE(heads == 0);
    REQUIRE(f.session->is_alive());
}

TEST_CASE("HTTP/2 window is credited only by consume", "[http2][session][flow]") {
    constexpr size_t window = 16384;
    scripted_reply reply;
    reply.head = {{":status", "200"}};
    reply.body = std::string(4 * window, 'w');
    h2_session::options opts;
    opts.initial_window_size = window;
    session_fixture f(reply, opts);

    auto st = f.open("/large");
    auto head = f.next(*st);
    REQUIRE(head);
    REQUIRE(head->kind == h2_event::type::headers);

    size_t received = 0;
    while (received < window) {
        auto ev = f.next(*st);
        REQUIRE(ev);
        REQUIRE(ev->kind == h2_event::type::data);
        received += ev->data.size();
    }
    REQUIRE(received == window);

    // nothing consumed: the peer is held at the stream window
    std::this_thread::sleep_for(scaled_ms(100));
    REQUIRE(f.peer->body_sent() == window);

    f.session->consume(*st, received);
    REQUIRE(eventually([&] { return f.peer->body_sent() > window; }));

    for (;;) {
        auto ev = f.next(*st);
        REQUIRE(ev);
        if (ev->kind == h2_event::type::end) break;
        REQUIRE(ev->kind == h2_event::type::data);
        received += ev->data.size();
        f.session->consume(*st, ev->data.size());
    }
    REQUIRE(received == 4 * window);
    REQUIRE(f.peer->body_sent() == 4 * window);
}
