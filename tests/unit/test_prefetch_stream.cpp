#include <catch2/catch_test_macros.hpp>
#include <tern/bridge/prefetch_stream.hpp>
#include <tern/runtime/scheduler.hpp>
#include "../test_main.cpp"  // For scaled timeouts
#include "body_sources.hpp"

#include <memory>
#include <string>
#include <thread>

using namespace tern;
using namespace tern::bridge;
using namespace tern::test;

TEST_CASE("prefetch_stream forwards the whole body in order", "[body][prefetch]") {
    runtime::scheduler sched(2);
    sched.start();

    auto stats = std::make_shared<source_stats>();
    auto stream = prefetch_stream::start(sched, make_body(5, stats), 2);
    std::string all;
    for (;;) {
        auto r = stream->read_chunk();
        REQUIRE(r);
        if (!*r) break;
        all += **r;
    }
    REQUIRE(all == "chunk-0chunk-1chunk-2chunk-3chunk-4");
    sched.shutdown();
}

TEST_CASE("prefetch_stream stays within its capacity", "[body][prefetch]") {
    runtime::scheduler sched(2);
    sched.start();

    auto stats = std::make_shared<source_stats>();
    auto stream = prefetch_stream::start(sched, make_body(100, stats), 4);
    std::this_thread::sleep_for(scaled_ms(50));
    // capacity queued plus the one blocked in send
    REQUIRE(stats->pulls <= 5);

    stream->close();
    for (int i = 0; i < 100 && stats->abandoned == 0; ++i) {
        std::this_thread::sleep_for(scaled_ms(5));
    }
    REQUIRE(stats->abandoned == 1);
    REQUIRE(stats->pulls < 100);
    sched.shutdown();
}

TEST_CASE("prefetch_stream delivers errors after the data", "[body][prefetch]") {
    runtime::scheduler sched(2);
    sched.start();

    auto stats = std::make_shared<source_stats>();
    auto stream = prefetch_stream::start(sched, make_body(1, stats, true));
    auto first = stream->read_chunk();
    REQUIRE(first);
    REQUIRE(**first == "chunk-0");
    auto second = stream->read_chunk();
    REQUIRE_FALSE(second);
    REQUIRE(second.error().kind == errors::host_kind::io);

    auto after = stream->read_chunk();
    REQUIRE(after);
    REQUIRE_FALSE(after->has_value());
    sched.shutdown();
}

TEST_CASE("prefetch_stream delivers nothing after close", "[body][prefetch]") {
    runtime::scheduler sched(2);
    sched.start();

    auto stats = std::make_shared<source_stats>();
    auto stream = prefetch_stream::start(sched, make_body(10, stats), 32);
    REQUIRE(**stream->read_chunk() == "chunk-0");
    REQUIRE(**stream->read_chunk() == "chunk-1");
    // the rest of the body is already buffered
    REQUIRE(eventually([&] { return stats->pulls.load() == 11; }));

    stream->close();
    REQUIRE(stream->is_closed());
    auto next = stream->read_chunk();
    REQUIRE(next);
    REQUIRE_FALSE(next->has_value());
    auto again = stream->read_chunk_async();
    REQUIRE(again->wait_for(scaled_ms(500)));
    auto r = again->wait();
    REQUIRE(r);
    REQUIRE_FALSE(r->has_value());
    sched.shutdown();
}

TEST_CASE("prefetch_stream closed before the first read", "[body][prefetch]") {
    runtime::scheduler sched(2);
    sched.start();

    auto stats = std::make_shared<source_stats>();
    auto stream = prefetch_stream::start(sched, make_body(3, stats), 1);
    stream->close();
    auto r = stream->read_chunk();
    REQUIRE(r);
    REQUIRE_FALSE(r->has_value());
    REQUIRE(eventually([&] { return stats->abandoned.load() == 1; }));
    sched.shutdown();
}
