#include <catch2/catch_test_macros.hpp>
#include <tern/sync/primitives.hpp>
#include <tern/runtime/scheduler.hpp>
#include <tern/coro/task.hpp>
#include "../test_main.cpp"  // For scaled timeouts

#include <atomic>
#include <optional>
#include <string>
#include <vector>

using namespace tern;
using namespace tern::sync;
using namespace tern::test;

TEST_CASE("event wakes every waiter", "[sync][event]") {
    runtime::scheduler sched(2);
    sched.start();

    event ev;
    std::atomic<int> woke{0};
    auto waiter = [&]() -> coro::task<void> {
        co_await ev.wait();
        ++woke;
    };
    for (int i = 0; i < 3; ++i) {
        waiter().go();
    }
    std::this_thread::sleep_for(scaled_ms(20));
    REQUIRE(woke == 0);

    ev.set();
    for (int i = 0; i < 100 && woke < 3; ++i) {
        std::this_thread::sleep_for(scaled_ms(5));
    }
    REQUIRE(woke == 3);
    REQUIRE(ev.is_set());
    sched.shutdown();
}

TEST_CASE("channel try operations respect capacity", "[sync][channel]") {
    channel<int> ch(2);
    REQUIRE(ch.capacity() == 2);
    REQUIRE(ch.try_send(1));
    REQUIRE(ch.try_send(2));
    REQUIRE_FALSE(ch.try_send(3));
    REQUIRE(ch.size() == 2);

    REQUIRE(ch.try_recv() == 1);
    REQUIRE(ch.try_recv() == 2);
    REQUIRE_FALSE(ch.try_recv().has_value());
}

TEST_CASE("closed channel drains then reports end", "[sync][channel]") {
    channel<std::string> ch(0);
    REQUIRE(ch.try_send("a"));
    ch.close();
    REQUIRE(ch.is_closed());
    REQUIRE_FALSE(ch.try_send("b"));
    REQUIRE(ch.try_recv() == std::optional<std::string>("a"));
    REQUIRE_FALSE(ch.try_recv().has_value());
}

TEST_CASE("channel passes items between coroutines in order", "[sync][channel]") {
    runtime::scheduler sched(2);
    sched.start();

    channel<int> ch(1);
    auto producer = [&]() -> coro::task<void> {
        for (int i = 0; i < 20; ++i) {
            bool ok = co_await ch.send(i);
            if (!ok) co_return;
        }
        ch.close();
    };
    auto consumer = [&]() -> coro::task<std::vector<int>> {
        std::vector<int> got;
        while (auto v = co_await ch.recv()) {
            got.push_back(*v);
        }
        co_return got;
    };

    producer().go();
    auto got = runtime::block_on(sched, consumer());
    REQUIRE(got.size() == 20);
    for (int i = 0; i < 20; ++i) {
        REQUIRE(got[i] == i);
    }
    sched.shutdown();
}

TEST_CASE("blocked recv is released by cancellation", "[sync][channel][cancel]") {
    runtime::scheduler sched(2);
    sched.start();

    channel<int> ch(1);
    coro::cancel_source source;
    std::atomic<bool> done{false};
    std::optional<int> result{-1};
    auto consumer = [&]() -> coro::task<void> {
        result = co_await ch.recv(source.get_token());
        done = true;
    };
    consumer().go();
    std::this_thread::sleep_for(scaled_ms(20));
    REQUIRE_FALSE(done);

    source.cancel();
    for (int i = 0; i < 100 && !done; ++i) {
        std::this_thread::sleep_for(scaled_ms(5));
    }
    REQUIRE(done);
    REQUIRE_FALSE(result.has_value());
    sched.shutdown();
}

TEST_CASE("blocked send fails when the channel closes", "[sync][channel]") {
    runtime::scheduler sched(2);
    sched.start();

    channel<int> ch(1);
    REQUIRE(ch.try_send(0));
    std::atomic<int> outcome{-1};
    auto producer = [&]() -> coro::task<void> {
        bool ok = co_await ch.send(1);
        outcome = ok ? 1 : 0;
    };
    producer().go();
    std::this_thread::sleep_for(scaled_ms(20));
    REQUIRE(outcome == -1);

    ch.close();
    for (int i = 0; i < 100 && outcome == -1; ++i) {
        std::this_thread::sleep_for(scaled_ms(5));
    }
    REQUIRE(outcome == 0);
    sched.shutdown();
}
