#include <catch2/catch_test_macros.hpp>
#include <tern/client/client.hpp>
#include "../test_main.cpp"  // For scaled timeouts
#include "test_server.hpp"

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace tern;
using namespace tern::test;
using namespace std::chrono_literals;

TEST_CASE("many concurrent calls complete independently", "[integration][concurrency]") {
    test_server server([](server_connection& conn, const received_request& req) {
        return conn.respond(200, req.target);
    });
    config::client_config cfg;
    cfg.worker_threads = 4;
    cfg.http2 = false;
    auto made = client::client::create(cfg);
    REQUIRE(made);
    auto c = *made;

    const int num_calls = 50;
    std::vector<std::shared_ptr<bridge::pending_call>> calls;
    for (int i = 0; i < num_calls; ++i) {
        bridge::foreign_request req;
        req.method = "GET";
        req.url = server.url("/n/" + std::to_string(i));
        calls.push_back(c->handle_async(std::move(req)));
    }

    int ok = 0;
    for (int i = 0; i < num_calls; ++i) {
        REQUIRE(calls[i]->wait_for(scaled_sec(10)));
        auto r = calls[i]->wait();
        REQUIRE(r);
        REQUIRE(r->content == "/n/" + std::to_string(i));
        ++ok;
    }
    REQUIRE(ok == num_calls);
    REQUIRE(server.requests() == num_calls);
    REQUIRE(server.connections() <= num_calls);

    auto stats = c->pool().stats(*http::url::parse(server.url()));
    REQUIRE(stats.lent == 0);
    REQUIRE(stats.idle == static_cast<size_t>(server.connections()));
}

TEST_CASE("calls from several host threads", "[integration][concurrency]") {
    test_server server([](server_connection& conn, const received_request&) {
        return conn.respond(200, "ok");
    });
    config::client_config cfg;
    cfg.worker_threads = 2;
    cfg.http2 = false;
    auto made = client::client::create(cfg);
    REQUIRE(made);
    auto c = *made;

    std::atomic<int> succeeded{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 10; ++i) {
                bridge::foreign_request req;
                req.method = "GET";
                req.url = server.url();
                if (auto r = c->handle_request(std::move(req)); r && r->content == "ok") {
                    succeeded.fetch_add(1);
                }
            }
        });
    }
    for (auto& t : threads) t.join();
    REQUIRE(succeeded.load() == 40);
    REQUIRE(server.connections() <= 4);
}

TEST_CASE("exception from a body iterator becomes a runtime error", "[integration][exception]") {
    test_server server([](server_connection& conn, const received_request&) {
        return conn.respond(200, "unreachable");
    });
    config::client_config cfg;
    cfg.worker_threads = 2;
    cfg.http2 = false;
    auto made = client::client::create(cfg);
    REQUIRE(made);
    auto c = *made;

    bridge::foreign_request req;
    req.method = "PUT";
    req.url = server.url("/explode");
    req.body = bridge::chunk_iterator([]() -> std::optional<std::string> {
        throw std::runtime_error("iterator exploded");
    });
    auto r = c->handle_request(std::move(req));
    REQUIRE_FALSE(r);
    REQUIRE(r.error().kind == errors::host_kind::runtime);
    REQUIRE(r.error().message.find("iterator exploded") != std::string::npos);

    // the client keeps working afterwards
    bridge::foreign_request again;
    again.method = "GET";
    again.url = server.url("/fine");
    REQUIRE(c->handle_request(std::move(again)));
}
