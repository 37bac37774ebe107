/**
 * @file liveness_tracker_test.cpp
 * @brief Unit tests for liveness_tracker
 */

#include <boxlink/client/liveness_tracker.hpp>
#include <boxlink/storage/box_database.hpp>
#include <boxlink/storage/box_repository.hpp>

#include "../mocks/mock_logger.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <memory>
#include <thread>
#include <vector>

using namespace boxlink;
using namespace boxlink::client;
using namespace std::chrono_literals;

namespace {

struct liveness_fixture {
    std::shared_ptr<storage::box_database> db;
    std::shared_ptr<storage::box_repository> boxes;

    liveness_fixture() {
        auto opened = storage::box_database::open(":memory:");
        REQUIRE(opened.is_ok());
        db = opened.value();
        boxes = std::make_shared<storage::box_repository>(db);
    }

    std::int64_t add_box(const std::string& name, send_method method, bool online) {
        box b;
        b.name = name;
        b.token = "tok-" + name;
        b.base_url = "http://localhost:8080/api/box/" + b.token;
        b.method = method;
        b.online = online;
        auto id = boxes->insert(b);
        REQUIRE(id.is_ok());
        return id.value();
    }
};

}  // namespace

TEST_CASE("sweep flips online status at the 15 second threshold", "[client][liveness]") {
    liveness_fixture f;
    auto id = f.add_box("polling-peer", send_method::poll, false);

    auto logger = std::make_shared<testing::MockLogger>();
    liveness_tracker tracker(f.boxes, liveness_config{}, logger);
    tracker.track(id);

    std::vector<std::pair<std::int64_t, bool>> changes;
    tracker.set_status_callback(
        [&](std::int64_t box_id, bool online) { changes.emplace_back(box_id, online); });

    const auto t0 = liveness_tracker::clock::now();
    tracker.record_contact(id, t0);

    SECTION("recent contact marks the box online") {
        CHECK(tracker.sweep(t0 + 14999ms) == 1);
        CHECK(f.boxes->find_by_id(id)->online);
        REQUIRE(changes.size() == 1);
        CHECK(changes[0].second);
        CHECK(logger->contains("Box polling-peer is now online"));

        // Unchanged status is not persisted again
        CHECK(tracker.sweep(t0 + 15ms) == 0);
        CHECK(changes.size() == 1);
    }

    SECTION("stale contact leaves an offline box offline") {
        CHECK(tracker.sweep(t0 + 15000ms) == 0);
        CHECK_FALSE(f.boxes->find_by_id(id)->online);
        CHECK(changes.empty());
    }

    SECTION("online box goes offline once contact is stale") {
        REQUIRE(tracker.sweep(t0 + 1s) == 1);
        CHECK(tracker.sweep(t0 + 16s) == 1);
        CHECK_FALSE(f.boxes->find_by_id(id)->online);
        REQUIRE(changes.size() == 2);
        CHECK_FALSE(changes[1].second);
    }
}

TEST_CASE("never-contacted boxes start offline", "[client][liveness]") {
    liveness_fixture f;
    auto id = f.add_box("silent-peer", send_method::poll, true);

    liveness_tracker tracker(f.boxes);
    tracker.track(id);
    CHECK(tracker.last_contact(id) == liveness_tracker::clock::time_point{});

    CHECK(tracker.sweep() == 1);
    CHECK_FALSE(f.boxes->find_by_id(id)->online);
}

TEST_CASE("PUSH boxes and removed boxes are ignored", "[client][liveness]") {
    liveness_fixture f;
    auto push_id = f.add_box("push-peer", send_method::push, false);

    liveness_tracker tracker(f.boxes);
    tracker.track(push_id);
    tracker.record_contact(push_id);
    CHECK(tracker.sweep() == 0);
    CHECK_FALSE(f.boxes->find_by_id(push_id)->online);

    tracker.record_contact(9999);
    CHECK(tracker.sweep() == 0);

    CHECK(tracker.tracked_count() == 2);
    tracker.untrack(9999);
    CHECK(tracker.tracked_count() == 1);
}

TEST_CASE("the background sweep runs after start()", "[client][liveness]") {
    liveness_fixture f;
    auto id = f.add_box("polling-peer", send_method::poll, false);

    liveness_config config;
    config.interval = 20ms;
    config.initial_delay = 1ms;
    liveness_tracker tracker(f.boxes, config);
    tracker.track(id);
    tracker.record_contact(id);

    tracker.start();
    CHECK(tracker.is_running());

    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (!f.boxes->find_by_id(id)->online &&
           std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    CHECK(f.boxes->find_by_id(id)->online);

    tracker.stop();
    CHECK_FALSE(tracker.is_running());
}
