#include <catch2/catch_test_macros.hpp>
#include <tern/client/client.hpp>
#include "test_server.hpp"

#include <chrono>
#include <string>

using namespace tern;
using namespace tern::test;
using namespace std::chrono_literals;

namespace {

config::client_config tls_config() {
    config::client_config cfg;
    cfg.worker_threads = 2;
    cfg.http2 = false;
    cfg.retry.max_attempts = 1;
    return cfg;
}

bridge::foreign_request get(const std::string& url) {
    bridge::foreign_request req;
    req.method = "GET";
    req.url = url;
    return req;
}

request_handler echo_path() {
    return [](server_connection& conn, const received_request& req) {
        return conn.respond(200, "secure " + req.target);
    };
}

} // namespace

TEST_CASE("untrusted certificate fails the handshake", "[integration][tls]") {
    test_certificate cert;
    test_server server(echo_path(), cert.make_server_context());
    auto c = client::client::create(tls_config());
    REQUIRE(c);

    auto resp = (*c)->handle_request(get(server.url("/x")));
    REQUIRE_FALSE(resp);
    REQUIRE(resp.error().kind == errors::host_kind::connect);
    REQUIRE(resp.error().message.starts_with("SSL error: "));
    REQUIRE(resp.error().source.stage == errors::connect_stage::tls);
    REQUIRE(server.requests() == 0);
}

TEST_CASE("verification can be turned off", "[integration][tls]") {
    test_certificate cert;
    test_server server(echo_path(), cert.make_server_context());
    auto cfg = tls_config();
    cfg.verify_certificates = false;
    auto c = client::client::create(cfg);
    REQUIRE(c);

    auto resp = (*c)->handle_request(get(server.url("/open")));
    REQUIRE(resp);
    REQUIRE(resp->status == 200);
    REQUIRE(resp->content == "secure /open");
}

TEST_CASE("custom CA file is trusted", "[integration][tls]") {
    test_certificate cert;
    test_server server(echo_path(), cert.make_server_context());
    auto cfg = tls_config();
    cfg.ca_file = cert.pem_file();
    auto c = client::client::create(cfg);
    REQUIRE(c);

    for (int i = 0; i < 2; ++i) {
        auto resp = (*c)->handle_request(get(server.url("/trusted")));
        REQUIRE(resp);
        REQUIRE(resp->content == "secure /trusted");
    }
    // TLS connections are pooled like plain ones
    REQUIRE(server.connections() == 1);
    REQUIRE((*c)->pool().stats(*http::url::parse(server.url())).idle == 1);
}

TEST_CASE("unreadable CA file fails client creation", "[integration][tls]") {
    auto cfg = tls_config();
    cfg.ca_file = "/nonexistent/ca.pem";
    auto c = client::client::create(cfg);
    REQUIRE_FALSE(c);
    REQUIRE(c.error().kind == errors::error_kind::internal);
    REQUIRE(c.error().message.find("/nonexistent/ca.pem") != std::string::npos);
}
