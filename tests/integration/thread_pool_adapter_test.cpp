/**
 * @file thread_pool_adapter_test.cpp
 * @brief Tests for the thread_system backed delivery pool
 */

#include <boxlink/integration/thread_pool_adapter.hpp>

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace boxlink::integration;

TEST_CASE("thread_pool_adapter keeps at least one worker", "[thread_pool][config]") {
    thread_pool_config config;
    config.worker_count = 0;

    thread_pool_adapter pool(config);
    CHECK(pool.config().worker_count == 1);
    CHECK_FALSE(pool.is_running());
    CHECK(pool.worker_count() == 0);
    CHECK(pool.outstanding_jobs() == 0);
}

TEST_CASE("thread_pool_adapter runs submitted jobs", "[thread_pool][submit]") {
    thread_pool_config config;
    config.worker_count = 2;
    thread_pool_adapter pool(config);
    REQUIRE(pool.start());
    CHECK(pool.is_running());
    CHECK(pool.worker_count() == 2);

    std::atomic<int> counter{0};
    std::vector<std::future<void>> futures;
    for (int i = 0; i < 20; ++i) {
        futures.push_back(pool.submit([&counter] { ++counter; }));
    }
    for (auto& f : futures) {
        REQUIRE(f.wait_for(std::chrono::seconds{5}) == std::future_status::ready);
        f.get();
    }
    CHECK(counter.load() == 20);

    SECTION("exceptions reach the future") {
        auto failing = pool.submit([] { throw std::runtime_error("send failed"); });
        REQUIRE(failing.wait_for(std::chrono::seconds{5}) == std::future_status::ready);
        CHECK_THROWS_AS(failing.get(), std::runtime_error);
    }

    pool.shutdown(true);
    CHECK_FALSE(pool.is_running());
}

TEST_CASE("outstanding_jobs counts a job until it returns", "[thread_pool][submit]") {
    thread_pool_adapter pool(thread_pool_config{});

    std::promise<void> release;
    auto gate = release.get_future().share();
    auto done = pool.submit([gate] { gate.wait(); });
    CHECK(pool.outstanding_jobs() == 1);

    release.set_value();
    REQUIRE(done.wait_for(std::chrono::seconds{5}) == std::future_status::ready);

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds{5};
    while (pool.outstanding_jobs() != 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::yield();
    }
    CHECK(pool.outstanding_jobs() == 0);
}

TEST_CASE("submit starts a stopped pool", "[thread_pool][submit]") {
    thread_pool_adapter pool(thread_pool_config{});
    auto done = pool.submit([] {});
    REQUIRE(done.wait_for(std::chrono::seconds{5}) == std::future_status::ready);
    CHECK(pool.is_running());
}
