#include <catch2/catch_test_macros.hpp>
#include "../../librehost/include/thread_pool.hpp"
#include <atomic>
#include <stdexcept>

TEST_CASE("ThreadPool runs tasks and returns results", "[ThreadPool]") {
    ThreadPool pool(4);
    REQUIRE(pool.size() == 4);

    std::vector<std::future<int>> futures;
    for (int i = 0; i < 32; ++i) {
        futures.push_back(pool.enqueue([i](std::stop_token) { return i * i; }));
    }
    for (int i = 0; i < 32; ++i) {
        REQUIRE(futures[i].get() == i * i);
    }
}

TEST_CASE("ThreadPool propagates exceptions through futures", "[ThreadPool]") {
    ThreadPool pool(2);
    auto future = pool.enqueue([](std::stop_token) -> int { throw std::runtime_error("task failed"); });
    REQUIRE_THROWS_AS(future.get(), std::runtime_error);
}

TEST_CASE("ThreadPool wait_idle waits for every task", "[ThreadPool]") {
    ThreadPool pool(3);
    std::atomic<int> done{0};
    for (int i = 0; i < 50; ++i) {
        (void)pool.enqueue([&done](std::stop_token) { done.fetch_add(1); });
    }
    pool.wait_idle();
    REQUIRE(done.load() == 50);
}

TEST_CASE("ThreadPool rejects work after request_stop", "[ThreadPool]") {
    ThreadPool pool(0);
    REQUIRE(pool.size() == 1);
    pool.request_stop();
    REQUIRE_THROWS_AS(pool.enqueue([](std::stop_token) { return 1; }), std::runtime_error);
}
