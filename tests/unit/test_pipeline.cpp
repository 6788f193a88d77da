#include <catch2/catch_test_macros.hpp>
#include <tern/pipeline/chain.hpp>
#include <tern/pipeline/metrics_stage.hpp>
#include <tern/pipeline/retry_stage.hpp>
#include <tern/pipeline/timeout_stage.hpp>
#include <tern/pipeline/trace_stage.hpp>
#include <tern/io/io_context.hpp>
#include <tern/runtime/scheduler.hpp>
#include <tern/time/timer.hpp>
#include "../test_main.cpp"  // For scaled timeouts

#include <algorithm>
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

using namespace tern;
using namespace tern::pipeline;
using namespace tern::test;
using namespace std::chrono_literals;

namespace {

/// What the scripted engine does on one attempt
struct step {
    enum class kind { respond, fail, hang };

    kind what = kind::respond;
    int status = 200;
    std::string body;
    http::header_list headers;
    errors::error failure;
};

step respond(int status, std::string body = {}) {
    step s;
    s.status = status;
    s.body = std::move(body);
    return s;
}

step fail(errors::error e) {
    step s;
    s.what = step::kind::fail;
    s.failure = std::move(e);
    return s;
}

step hang() {
    step s;
    s.what = step::kind::hang;
    return s;
}

/// Body that records whether it was abandoned before the end
class tracking_source : public http::body_source {
public:
    tracking_source(std::string data, std::shared_ptr<std::atomic<int>> abandoned)
        : data_(std::move(data)), abandoned_(std::move(abandoned)) {}

    coro::task<http::chunk_result> read_chunk(coro::cancel_token) override {
        if (done_) {
            co_return std::optional<std::string>{};
        }
        done_ = true;
        co_return std::optional<std::string>{data_};
    }

    void abandon() noexcept override { ++*abandoned_; }

private:
    std::string data_;
    std::shared_ptr<std::atomic<int>> abandoned_;
    bool done_ = false;
};

struct engine_script {
    std::mutex mutex;
    std::vector<step> steps;
    size_t calls = 0;
    std::vector<uint32_t> attempts;
    std::vector<std::string> traceparents;
    std::shared_ptr<std::atomic<int>> abandoned = std::make_shared<std::atomic<int>>(0);
};

/// Terminal stage replaying a script instead of doing I/O
class scripted_engine {
public:
    scripted_engine(io::io_context& io, std::shared_ptr<engine_script> script)
        : io_(io), script_(std::move(script)) {}

    coro::task<stage_result> handle(const http::request_descriptor& req, pipeline_context& ctx) {
        step s;
        {
            std::lock_guard<std::mutex> lock(script_->mutex);
            size_t i = std::min(script_->calls, script_->steps.size() - 1);
            s = script_->steps[i];
            ++script_->calls;
            script_->attempts.push_back(ctx.attempt);
            script_->traceparents.emplace_back(req.headers.get("traceparent"));
        }
        ctx.request_bytes += req.body.bytes().size();

        switch (s.what) {
            case step::kind::respond: {
                http::response resp;
                resp.status = s.status;
                resp.http_version = "HTTP/1.1";
                resp.headers = s.headers;
                resp.body = http::body_stream(std::make_unique<tracking_source>(s.body, script_->abandoned));
                co_return std::move(resp);
            }
            case step::kind::fail:
                co_return std::unexpected(s.failure);
            case step::kind::hang:
                co_await time::sleep_for(io_, 30s, ctx.token);
                co_return std::unexpected(errors::cancelled_error());
        }
        co_return std::unexpected(errors::internal_error("bad step"));
    }

private:
    io::io_context& io_;
    std::shared_ptr<engine_script> script_;
};

class recording_sink : public observe::trace_sink {
public:
    void on_span_end(const observe::span& s) override {
        std::lock_guard<std::mutex> lock(mutex);
        spans.push_back(s);
    }
    std::mutex mutex;
    std::vector<observe::span> spans;
};

using test_chain = chain<timeout_stage, retry_stage, trace_stage, metrics_stage, scripted_engine>;

struct pipeline_fixture {
    runtime::scheduler sched{2};
    io::io_context io;
    std::shared_ptr<engine_script> script = std::make_shared<engine_script>();
    std::shared_ptr<recording_sink> spans = std::make_shared<recording_sink>();
    std::shared_ptr<observe::tracer> tracer = std::make_shared<observe::tracer>(spans);
    std::shared_ptr<observe::metrics_registry> metrics = std::make_shared<observe::metrics_registry>();

    pipeline_fixture() {
        sched.start();
        io.start();
    }

    ~pipeline_fixture() {
        io.stop();
        sched.shutdown();
    }

    test_chain make_chain(retry_policy policy = fast_policy(), std::chrono::milliseconds total = 5s) {
        return test_chain(timeout_stage(io, total), retry_stage(io, std::move(policy)), trace_stage(tracer),
                          metrics_stage(metrics), scripted_engine(io, script));
    }

    static retry_policy fast_policy() {
        retry_policy p;
        p.max_attempts = 3;
        p.base_backoff = 1ms;
        p.max_backoff = 5ms;
        return p;
    }

    stage_result run(test_chain& c, http::request_descriptor req, coro::cancel_token token = {}) {
        auto driver = [&]() -> coro::task<stage_result> {
            pipeline_context ctx;
            ctx.token = token;
            ctx.root_span = tracer->start_root("test");
            co_return co_await c.run(req, ctx);
        };
        return runtime::block_on(sched, driver());
    }
};

http::request_descriptor make_request(http::verb v = http::verb::GET) {
    http::request_descriptor req;
    req.method = v;
    req.target = *http::url::parse("http://example.com/items");
    return req;
}

} // namespace

TEST_CASE_METHOD(pipeline_fixture, "single successful attempt", "[pipeline]") {
    script->steps = {respond(200, "ok")};
    auto c = make_chain();
    auto resp = run(c, make_request());

    REQUIRE(resp);
    REQUIRE(resp->status == 200);
    REQUIRE(http::ext_int(resp->extensions, http::ext::attempts) == 1);
    REQUIRE(std::holds_alternative<std::string>(resp->extensions[std::string(http::ext::trace_id)]));
    REQUIRE(script->calls == 1);
    REQUIRE(script->attempts == std::vector<uint32_t>{1});
    REQUIRE(observe::trace_context::parse(script->traceparents[0]));
    REQUIRE(metrics->counter("tern_attempts_total", {{"method", "GET"}, {"outcome", "2xx"}}) == 1);
}

TEST_CASE_METHOD(pipeline_fixture, "unanswered transport failure is retried", "[pipeline][retry]") {
    script->steps = {fail(errors::transport_error(errors::io_direction::read, ECONNRESET, false)),
                     respond(200)};
    auto c = make_chain();
    auto resp = run(c, make_request());

    REQUIRE(resp);
    REQUIRE(http::ext_int(resp->extensions, http::ext::attempts) == 2);
    REQUIRE(script->attempts == std::vector<uint32_t>{1, 2});
    REQUIRE(script->traceparents[0] != script->traceparents[1]);
    REQUIRE(metrics->counter("tern_retries_total", {{"host", "example.com"}}) == 1);
    REQUIRE(metrics->counter("tern_attempts_total", {{"method", "GET"}, {"outcome", "TransportError"}}) == 1);
}

TEST_CASE_METHOD(pipeline_fixture, "failure after the response started is final", "[pipeline][retry]") {
    script->steps = {fail(errors::transport_error(errors::io_direction::read, ECONNRESET, true)),
                     respond(200)};
    auto c = make_chain();
    auto resp = run(c, make_request());

    REQUIRE_FALSE(resp);
    REQUIRE(resp.error().kind == errors::error_kind::transport);
    REQUIRE(resp.error().attempts == 1);
    REQUIRE(script->calls == 1);
}

TEST_CASE_METHOD(pipeline_fixture, "protocol errors are not retried", "[pipeline][retry]") {
    script->steps = {fail(errors::protocol_error("bad framing")), respond(200)};
    auto c = make_chain();
    auto resp = run(c, make_request());
    REQUIRE_FALSE(resp);
    REQUIRE(resp.error().kind == errors::error_kind::protocol);
    REQUIRE(script->calls == 1);
}

TEST_CASE_METHOD(pipeline_fixture, "non-idempotent methods are replayed only when allowed", "[pipeline][retry]") {
    script->steps = {fail(errors::connection_error(errors::connect_stage::tcp, "refused", ECONNREFUSED)),
                     respond(201)};

    SECTION("POST is not retried by default") {
        auto c = make_chain();
        auto resp = run(c, make_request(http::verb::POST));
        REQUIRE_FALSE(resp);
        REQUIRE(resp.error().kind == errors::error_kind::connection);
        REQUIRE(script->calls == 1);
    }

    SECTION("extension allows it") {
        auto c = make_chain();
        auto req = make_request(http::verb::POST);
        req.extensions[std::string(http::ext::retry_allow_non_idempotent)] = true;
        auto resp = run(c, req);
        REQUIRE(resp);
        REQUIRE(resp->status == 201);
        REQUIRE(script->calls == 2);
    }

    SECTION("policy allows it") {
        auto policy = fast_policy();
        policy.allow_non_idempotent = true;
        auto c = make_chain(policy);
        REQUIRE(run(c, make_request(http::verb::POST)));
        REQUIRE(script->calls == 2);
    }
}

TEST_CASE_METHOD(pipeline_fixture, "exhausted retries report the attempt count", "[pipeline][retry]") {
    script->steps = {fail(errors::connection_error(errors::connect_stage::tcp, "refused", ECONNREFUSED))};
    auto c = make_chain();
    auto resp = run(c, make_request());

    REQUIRE_FALSE(resp);
    REQUIRE(resp.error().attempts == 3);
    REQUIRE(script->calls == 3);
    REQUIRE(resp.error().describe().find("gave up after 3 attempts") != std::string::npos);
}

TEST_CASE_METHOD(pipeline_fixture, "max attempts can be lowered per request", "[pipeline][retry]") {
    script->steps = {fail(errors::connection_error(errors::connect_stage::dns, "no such host"))};
    auto c = make_chain();

    SECTION("override") {
        auto req = make_request();
        req.overrides.max_attempts = 1;
        REQUIRE_FALSE(run(c, req));
        REQUIRE(script->calls == 1);
    }

    SECTION("extension") {
        auto req = make_request();
        req.extensions[std::string(http::ext::retry_max_attempts)] = int64_t{2};
        REQUIRE_FALSE(run(c, req));
        REQUIRE(script->calls == 2);
    }
}

TEST_CASE_METHOD(pipeline_fixture, "configured statuses are retried and the old body closed", "[pipeline][retry]") {
    auto busy = respond(503, "busy");
    busy.headers.add("Retry-After", "0");
    script->steps = {busy, respond(200, "ok")};
    auto policy = fast_policy();
    policy.retry_statuses = {502, 503};
    auto c = make_chain(policy);

    auto resp = run(c, make_request());
    REQUIRE(resp);
    REQUIRE(resp->status == 200);
    REQUIRE(http::ext_int(resp->extensions, http::ext::attempts) == 2);
    REQUIRE(*script->abandoned == 1);
}

TEST_CASE_METHOD(pipeline_fixture, "last retryable status is returned as a response", "[pipeline][retry]") {
    script->steps = {respond(503)};
    auto policy = fast_policy();
    policy.retry_statuses = {503};
    policy.max_attempts = 2;
    auto c = make_chain(policy);

    auto resp = run(c, make_request());
    REQUIRE(resp);
    REQUIRE(resp->status == 503);
    REQUIRE(http::ext_int(resp->extensions, http::ext::attempts) == 2);
}

TEST_CASE_METHOD(pipeline_fixture, "one-shot request bodies are not replayed", "[pipeline][retry]") {
    script->steps = {fail(errors::transport_error(errors::io_direction::write, EPIPE, false)), respond(200)};
    auto c = make_chain();
    auto req = make_request(http::verb::PUT);
    int produced = 0;
    req.body = http::request_body::from_producer(std::make_shared<http::function_producer>(
        [&]() -> std::optional<std::string> {
            if (produced++ == 0) return std::string("x");
            return std::nullopt;
        }));

    REQUIRE_FALSE(run(c, req));
    REQUIRE(script->calls == 1);
}

TEST_CASE_METHOD(pipeline_fixture, "total deadline turns a stalled attempt into a timeout", "[pipeline][timeout]") {
    script->steps = {hang()};
    auto c = make_chain(fast_policy(), scaled_ms(100));

    auto start = std::chrono::steady_clock::now();
    auto resp = run(c, make_request());
    auto took = std::chrono::steady_clock::now() - start;

    REQUIRE_FALSE(resp);
    REQUIRE(resp.error().kind == errors::error_kind::timeout);
    REQUIRE(resp.error().phase == errors::timeout_phase::total);
    REQUIRE(resp.error().message == fmt::format("no response within {}ms", scaled_ms(100).count()));
    REQUIRE(script->calls == 1);
    REQUIRE(took < scaled_sec(5));
}

TEST_CASE_METHOD(pipeline_fixture, "timeout extension sets the total deadline", "[pipeline][timeout]") {
    script->steps = {hang()};
    auto c = make_chain(fast_policy(), 30s);
    auto req = make_request();
    req.extensions[std::string(http::ext::timeout)] = 0.05 * timeout_scale_factor();

    REQUIRE(c.stage<timeout_stage>().total_for(req) == scaled_ms(50));
    auto resp = run(c, req);
    REQUIRE_FALSE(resp);
    REQUIRE(resp.error().phase == errors::timeout_phase::total);
}

TEST_CASE_METHOD(pipeline_fixture, "caller cancellation is reported as cancelled", "[pipeline][cancel]") {
    script->steps = {hang()};
    auto c = make_chain();
    coro::cancel_source caller;

    std::thread canceller([&] {
        std::this_thread::sleep_for(scaled_ms(50));
        caller.cancel();
    });
    auto resp = run(c, make_request(), caller.get_token());
    canceller.join();

    REQUIRE_FALSE(resp);
    REQUIRE(resp.error().kind == errors::error_kind::cancelled);
}

TEST_CASE_METHOD(pipeline_fixture, "already cancelled request does not reach the engine", "[pipeline][cancel]") {
    script->steps = {respond(200)};
    auto c = make_chain();
    coro::cancel_source caller;
    caller.cancel();

    auto resp = run(c, make_request(), caller.get_token());
    REQUIRE_FALSE(resp);
    REQUIRE(resp.error().kind == errors::error_kind::cancelled);
    REQUIRE(script->calls == 0);
}

TEST_CASE_METHOD(pipeline_fixture, "attempt spans are children of the request span", "[pipeline][trace]") {
    script->steps = {respond(500)};
    auto c = make_chain();
    auto resp = run(c, make_request());
    REQUIRE(resp);

    std::lock_guard<std::mutex> lock(spans->mutex);
    REQUIRE(spans->spans.size() == 1);
    const auto& s = spans->spans[0];
    REQUIRE(s.name == "HTTP GET");
    REQUIRE(s.status == observe::span_status::error);
    REQUIRE(s.parent.has_value());
    REQUIRE(observe::trace_context::parse(script->traceparents[0])->span == s.context.span);
}

TEST_CASE_METHOD(pipeline_fixture, "response bytes are counted as the body is read", "[pipeline][metrics]") {
    script->steps = {respond(200, "0123456789")};
    auto c = make_chain();
    auto resp = run(c, make_request());
    REQUIRE(resp);
    REQUIRE(metrics->counter("tern_response_bytes_total", {{"host", "example.com"}}) == 0);

    auto body = runtime::block_on(sched, resp->body.read_all());
    REQUIRE(body);
    REQUIRE(*body == "0123456789");
    REQUIRE(metrics->counter("tern_response_bytes_total", {{"host", "example.com"}}) == 10);
}

TEST_CASE_METHOD(pipeline_fixture, "request bytes are attributed per attempt", "[pipeline][metrics]") {
    script->steps = {fail(errors::transport_error(errors::io_direction::read, 0, false)), respond(200)};
    auto c = make_chain();
    auto req = make_request(http::verb::PUT);
    req.body = http::request_body::from_bytes("abcd");

    REQUIRE(run(c, req));
    REQUIRE(metrics->counter("tern_request_bytes_total", {{"host", "example.com"}}) == 8);
}

TEST_CASE("retry backoff grows and stays capped", "[pipeline][retry]") {
    io::io_context io;
    retry_policy policy;
    policy.base_backoff = 100ms;
    policy.max_backoff = 1000ms;
    retry_stage stage(io, policy);

    for (int i = 0; i < 20; ++i) {
        auto first = stage.backoff(1);
        REQUIRE(first >= 50ms);
        REQUIRE(first <= 100ms);

        auto third = stage.backoff(3);
        REQUIRE(third >= 200ms);
        REQUIRE(third <= 400ms);

        REQUIRE(stage.backoff(30) <= 1000ms);
        REQUIRE(stage.backoff(30) >= 500ms);
    }
}

TEST_CASE("retry classification", "[pipeline][retry]") {
    using namespace errors;
    REQUIRE(retry_stage::is_retryable(connection_error(connect_stage::tls, "handshake")));
    REQUIRE(retry_stage::is_retryable(timeout_error(timeout_phase::connect, "x")));
    REQUIRE(retry_stage::is_retryable(timeout_error(timeout_phase::read, "x")));
    REQUIRE_FALSE(retry_stage::is_retryable(timeout_error(timeout_phase::total, "x")));
    REQUIRE_FALSE(retry_stage::is_retryable(cancelled_error()));
    REQUIRE_FALSE(retry_stage::is_retryable(invalid_request("url", "x")));
    REQUIRE_FALSE(retry_stage::is_retryable(internal_error("x")));
}

TEST_CASE("Retry-After accepts delta seconds only", "[pipeline][retry]") {
    REQUIRE(retry_stage::retry_after(http::header_list{{"Retry-After", " 2 "}}) == 2000ms);
    REQUIRE(retry_stage::retry_after(http::header_list{{"Retry-After", "0"}}) == 0ms);
    REQUIRE_FALSE(retry_stage::retry_after(http::header_list{{"Retry-After", "-1"}}));
    REQUIRE_FALSE(retry_stage::retry_after(http::header_list{{"Retry-After", "Wed, 21 Oct 2015 07:28:00 GMT"}}));
    REQUIRE_FALSE(retry_stage::retry_after(http::header_list{}));
}
