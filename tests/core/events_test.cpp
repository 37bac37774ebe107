/**
 * @file events_test.cpp
 * @brief Unit tests for transfer event types and event bus integration
 */

#include <catch2/catch_test_macros.hpp>
#include <atomic>
#include <chrono>
#include <thread>

#include "boxlink/client/outbox_manager.hpp"
#include "boxlink/core/events.hpp"
#include "boxlink/storage/box_database.hpp"
#include "boxlink/storage/box_repository.hpp"
#include "boxlink/storage/outbox_repository.hpp"
#include <kcenon/common/patterns/event_bus.h>

using namespace boxlink;
using namespace boxlink::events;

// ============================================================================
// Event Type Construction Tests
// ============================================================================

TEST_CASE("transfer_completed_event construction", "[events][transfer]") {
    transfer_completed_event event{7, "hospital-b", 42, 3};

    CHECK(event.box_id == 7);
    CHECK(event.box_name == "hospital-b");
    CHECK(event.transaction_id == 42);
    CHECK(event.total_image_count == 3);
    CHECK(event.timestamp.time_since_epoch().count() > 0);
}

TEST_CASE("peer_send_failed_event construction", "[events][transfer]") {
    peer_send_failed_event event{7, "hospital-b", 42, 404, "Not Found"};

    CHECK(event.status_code == 404);
    CHECK(event.message == "Not Found");
}

TEST_CASE("box_status_changed_event construction", "[events][liveness]") {
    box_status_changed_event event{3, true};
    CHECK(event.box_id == 3);
    CHECK(event.online);
}

// ============================================================================
// Event Bus Integration
// ============================================================================

TEST_CASE("Event bus publish and subscribe", "[events][integration]") {
    auto& bus = kcenon::common::get_event_bus();

    std::atomic<int> event_count{0};
    std::string received_box;

    auto sub_id = bus.subscribe<receive_completed_event>(
        [&](const receive_completed_event& evt) {
            event_count++;
            received_box = evt.box_name;
        }
    );

    bus.publish(receive_completed_event{1, "clinic", 99, 4});

    // Give time for async processing if any
    std::this_thread::sleep_for(std::chrono::milliseconds{10});

    CHECK(event_count == 1);
    CHECK(received_box == "clinic");

    bus.unsubscribe(sub_id);
}

TEST_CASE("Completing a transaction publishes one event", "[events][integration]") {
    auto opened = storage::box_database::open(":memory:");
    REQUIRE(opened.is_ok());
    auto db = opened.value();
    auto boxes = std::make_shared<storage::box_repository>(db);
    auto outbox = std::make_shared<storage::outbox_repository>(db);
    client::outbox_manager manager(db, boxes, outbox);

    client::box peer;
    peer.name = "hospital-b";
    peer.token = "tok-events";
    peer.base_url = "http://peer.example/api/box/tok-events";
    auto box_id = boxes->insert(peer);
    REQUIRE(box_id.is_ok());

    auto& bus = kcenon::common::get_event_bus();
    std::atomic<int> completed{0};
    std::atomic<std::int64_t> images{0};
    auto sub_id = bus.subscribe<transfer_completed_event>(
        [&](const transfer_completed_event& evt) {
            if (evt.box_id == box_id.value()) {
                completed++;
                images = evt.total_image_count;
            }
        }
    );

    auto tx = manager.enqueue_transfer(box_id.value(), {1, 2});
    REQUIRE(tx.is_ok());
    while (auto next = manager.next_pending_entry(box_id.value())) {
        REQUIRE(manager.acknowledge_delivered(*next).is_ok());
    }

    std::this_thread::sleep_for(std::chrono::milliseconds{10});
    CHECK(completed == 1);
    CHECK(images == 2);

    bus.unsubscribe(sub_id);
}
