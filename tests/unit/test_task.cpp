#include <catch2/catch_test_macros.hpp>
#include <tern/coro/task.hpp>
#include <tern/runtime/scheduler.hpp>
#include <atomic>
#include <stdexcept>
#include <string>
#include "../test_main.cpp"  // For scaled timeouts

using namespace tern::coro;
using namespace tern::runtime;
using namespace tern::test;

task<int> simple_return_value() {
    co_return 42;
}

task<int> throwing_coroutine() {
    throw std::runtime_error("test error");
    co_return 0;
}

task<int> nested_inner() {
    co_return 10;
}

task<int> nested_outer() {
    int value = co_await nested_inner();
    co_return value * 2;
}

TEST_CASE("task move semantics", "[task]") {
    auto t1 = simple_return_value();
    auto h1 = t1.handle();
    REQUIRE(h1 != nullptr);

    auto t2 = std::move(t1);
    REQUIRE(t1.handle() == nullptr);
    REQUIRE(t2.handle() == h1);
}

TEST_CASE("task is lazy until resumed", "[task]") {
    bool started = false;
    auto coro = [&]() -> task<void> {
        started = true;
        co_return;
    };
    auto t = coro();
    REQUIRE_FALSE(started);
    t.handle().resume();
    REQUIRE(started);
    REQUIRE(t.handle().done());
}

TEST_CASE("block_on returns nested results", "[task][block_on]") {
    scheduler sched(2);
    sched.start();
    REQUIRE(block_on(sched, nested_outer()) == 20);
    sched.shutdown();
}

TEST_CASE("block_on rethrows coroutine exceptions", "[task][block_on]") {
    scheduler sched(1);
    sched.start();
    REQUIRE_THROWS_AS(block_on(sched, throwing_coroutine()), std::runtime_error);
    sched.shutdown();
}

TEST_CASE("exception propagates through co_await", "[task]") {
    scheduler sched(1);
    sched.start();

    auto catcher = []() -> task<std::string> {
        try {
            co_await throwing_coroutine();
        } catch (const std::runtime_error& e) {
            co_return std::string(e.what());
        }
        co_return std::string("no exception");
    };
    REQUIRE(block_on(sched, catcher()) == "test error");
    sched.shutdown();
}

TEST_CASE("task::go() runs detached on the scheduler", "[task][spawn]") {
    scheduler sched(2);
    sched.start();

    std::atomic<bool> executed{false};
    auto coro = [&]() -> task<void> {
        executed.store(true);
        co_return;
    };
    coro().go();

    for (int i = 0; i < 100 && !executed.load(); ++i) {
        std::this_thread::sleep_for(scaled_ms(5));
    }
    REQUIRE(executed.load());
    sched.shutdown();
}

TEST_CASE("spawn() returns an awaitable join_handle", "[task][spawn][join_handle]") {
    scheduler sched(2);
    sched.start();

    auto compute = []() -> task<int> {
        co_return 100;
    };
    auto driver = [&]() -> task<int> {
        auto a = compute().spawn();
        auto b = compute().spawn();
        int x = co_await a;
        int y = co_await b;
        co_return x + y;
    };
    REQUIRE(block_on(sched, driver()) == 200);
    sched.shutdown();
}

TEST_CASE("join_handle propagates exceptions", "[task][spawn][join_handle]") {
    scheduler sched(2);
    sched.start();

    auto driver = []() -> task<bool> {
        auto h = throwing_coroutine().spawn();
        try {
            co_await h;
        } catch (const std::runtime_error&) {
            co_return true;
        }
        co_return false;
    };
    REQUIRE(block_on(sched, driver()));
    sched.shutdown();
}
