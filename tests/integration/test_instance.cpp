#include <catch2/catch_test_macros.hpp>
#include <tern/tern.hpp>
#include "test_server.hpp"

#include <cstdlib>
#include <string>

#include <sys/wait.h>
#include <unistd.h>

using namespace tern;
using namespace tern::test;

// One test case: the shared instance lives for the rest of the process.
TEST_CASE("shared client lifecycle", "[integration][client][instance]") {
    test_server server([](server_connection& conn, const received_request&) {
        return conn.respond(200, "shared");
    });

    // a failed initialization is reported and not cached
    ::setenv("TERN_TLS_BACKEND", "rustls", 1);
    auto failed = client::client::try_instance();
    REQUIRE_FALSE(failed);
    REQUIRE(failed.error().kind == errors::error_kind::invalid_request);
    REQUIRE(client::client::last_init_error().find("rustls") != std::string::npos);
    auto info = version_info();
    REQUIRE_FALSE(info.available);
    REQUIRE(info.version == "0.1.0");
    REQUIRE_FALSE(info.init_error.empty());

    ::unsetenv("TERN_TLS_BACKEND");
    ::setenv("TERN_WORKER_THREADS", "2", 1);
    ::setenv("TERN_HTTP2", "false", 1);
    auto first = client::client::try_instance();
    REQUIRE(first);
    REQUIRE(is_available());
    REQUIRE(client::client::last_init_error().empty());
    REQUIRE((*first)->config().worker_threads == 2);
    REQUIRE_FALSE((*first)->config().http2);

    auto second = client::client::try_instance();
    REQUIRE(second);
    REQUIRE(first->get() == second->get());

    // close() on the shared client keeps it usable
    (*first)->close();
    bridge::foreign_request req;
    req.method = "GET";
    req.url = server.url();
    auto resp = (*second)->handle_request(req);
    REQUIRE(resp);
    REQUIRE(resp->content == "shared");

    SECTION("a forked child gets its own client") {
        pid_t pid = ::fork();
        REQUIRE(pid >= 0);
        if (pid == 0) {
            auto child = client::client::try_instance();
            int code = 0;
            if (!child) {
                code = 1;
            } else if (child->get() == first->get()) {
                code = 2;
            } else {
                auto r = (*child)->handle_request(req);
                code = (r && r->content == "shared") ? 0 : 3;
            }
            ::_exit(code);
        }
        int status = 0;
        REQUIRE(::waitpid(pid, &status, 0) == pid);
        REQUIRE(WIFEXITED(status));
        REQUIRE(WEXITSTATUS(status) == 0);
    }

    ::unsetenv("TERN_WORKER_THREADS");
    ::unsetenv("TERN_HTTP2");
}
