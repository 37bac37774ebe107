/**
 * @file poll_service_test.cpp
 * @brief Unit tests for the peer-facing poll endpoint
 */

#include <boxlink/client/liveness_tracker.hpp>
#include <boxlink/client/outbox_manager.hpp>
#include <boxlink/client/poll_service.hpp>

#include "box_service_fixture.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>

using namespace boxlink;
using namespace boxlink::client;

TEST_CASE("poll_service serves the outbox of a POLL box", "[client][poll_service]") {
    testing::box_service_fixture f;
    auto endpoint = f.service->poll_endpoint();

    auto peer = f.service->generate_base_url("clinic");
    REQUIRE(peer.is_ok());
    const auto& token = peer.value().token;

    f.images->put(5, testing::bytes_of("IMG5"));
    f.images->put(6, testing::bytes_of("IMG6"));

    SECTION("empty outbox") {
        auto polled = endpoint->poll_outbox(token);
        REQUIRE(polled.is_ok());
        CHECK_FALSE(polled.value().has_value());
    }

    SECTION("full pull cycle") {
        int completions = 0;
        f.service->set_transfer_callback(
            [&](const box&, std::int64_t, std::int64_t) { ++completions; });

        auto tx = f.service->send_images(peer.value().id, {5, 6});
        REQUIRE(tx.is_ok());

        for (std::int64_t seq = 1; seq <= 2; ++seq) {
            auto polled = endpoint->poll_outbox(token);
            REQUIRE(polled.is_ok());
            REQUIRE(polled.value().has_value());
            const auto& entry = *polled.value();
            CHECK(entry.transaction_id == tx.value());
            CHECK(entry.sequence_number == seq);

            auto payload = endpoint->fetch_entry_payload(token, tx.value(), seq);
            REQUIRE(payload.is_ok());
            auto plain = f.codec->decompress(payload.value());
            REQUIRE(plain.is_ok());
            CHECK(plain.value() == testing::bytes_of("IMG" + std::to_string(4 + seq)));

            REQUIRE(endpoint->delete_entry(token, tx.value(), seq).is_ok());
            // Deleting twice is harmless
            REQUIRE(endpoint->delete_entry(token, tx.value(), seq).is_ok());
        }

        CHECK(completions == 1);
        auto polled = endpoint->poll_outbox(token);
        REQUIRE(polled.is_ok());
        CHECK_FALSE(polled.value().has_value());
    }

    SECTION("unknown sequence") {
        auto tx = f.service->send_images(peer.value().id, {5});
        REQUIRE(tx.is_ok());
        auto payload = endpoint->fetch_entry_payload(token, tx.value(), 2);
        REQUIRE(payload.is_err());
        CHECK(payload.error().code == error_codes::outbox_entry_not_found);
    }

    SECTION("missing dataset") {
        auto tx = f.service->send_images(peer.value().id, {404});
        REQUIRE(tx.is_ok());
        auto payload = endpoint->fetch_entry_payload(token, tx.value(), 1);
        REQUIRE(payload.is_err());
        CHECK(payload.error().code == error_codes::dataset_not_found);
    }

    SECTION("polling counts as contact") {
        auto before = f.service->liveness()->last_contact(peer.value().id);
        REQUIRE(before);
        CHECK(*before == liveness_tracker::clock::time_point{});

        REQUIRE(endpoint->poll_outbox(token).is_ok());
        auto after = f.service->liveness()->last_contact(peer.value().id);
        REQUIRE(after);
        CHECK(*after > liveness_tracker::clock::time_point{});
    }
}

TEST_CASE("poll_service rejects unknown tokens", "[client][poll_service]") {
    testing::box_service_fixture f;
    auto endpoint = f.service->poll_endpoint();
    const std::string stranger = "00000000-0000-4000-8000-000000000000";

    auto polled = endpoint->poll_outbox(stranger);
    REQUIRE(polled.is_err());
    CHECK(polled.error().code == error_codes::unknown_token);

    CHECK(endpoint->fetch_entry_payload(stranger, 1, 1).is_err());
    CHECK(endpoint->delete_entry(stranger, 1, 1).is_err());

    auto stored = endpoint->receive_image(stranger, 1, 1, 1,
                                          f.codec->compress(testing::bytes_of("x")).value());
    REQUIRE(stored.is_err());
    CHECK(stored.error().code == error_codes::unknown_token);
    CHECK(f.images->stored().empty());

    // Inbox reports from strangers are acknowledged but ignored
    auto reported = endpoint->report_inbox_progress(stranger, 9, 1, 1);
    REQUIRE(reported.is_ok());
    CHECK(reported.value() == inbox_report_outcome::unknown_token);
    CHECK(f.logger->warn_count() >= 1);
    CHECK(f.service->inbox_info().empty());
}

TEST_CASE("PUSH box tokens cannot poll", "[client][poll_service]") {
    testing::box_service_fixture f;
    auto remote = f.service->add_remote_box(
        "upstream", "http://node-b.example/api/box/11111111-2222-4333-8444-555555555555");
    REQUIRE(remote.is_ok());

    auto polled = f.service->poll_endpoint()->poll_outbox(remote.value().token);
    REQUIRE(polled.is_err());
    CHECK(polled.error().code == error_codes::unknown_token);
}

TEST_CASE("poll_service accepts pushed images", "[client][poll_service]") {
    testing::box_service_fixture f;
    auto endpoint = f.service->poll_endpoint();
    auto peer = f.service->generate_base_url("sender");
    REQUIRE(peer.is_ok());
    const auto& token = peer.value().token;

    int completions = 0;
    f.service->set_receive_callback(
        [&](const box& b, std::int64_t, std::int64_t count) {
            CHECK(b.name == "sender");
            CHECK(count == 2);
            ++completions;
        });

    for (std::int64_t seq = 1; seq <= 2; ++seq) {
        auto payload = f.codec->compress(testing::bytes_of("PUSHED" + std::to_string(seq)));
        REQUIRE(payload.is_ok());
        auto stored = endpoint->receive_image(token, 88, seq, 2, payload.value());
        REQUIRE(stored.is_ok());
    }

    auto stored = f.images->stored();
    REQUIRE(stored.size() == 2);
    CHECK(stored[1] == testing::bytes_of("PUSHED2"));
    CHECK(completions == 1);

    auto inbox = f.service->inbox_info();
    REQUIRE(inbox.size() == 1);
    CHECK(inbox[0].remote_box_name == "sender");
    CHECK(inbox[0].entry.received_image_count == 2);

    SECTION("corrupt payload") {
        auto bad = endpoint->receive_image(token, 89, 1, 1, testing::bytes_of("junk"));
        REQUIRE(bad.is_err());
        CHECK(bad.error().code == error_codes::decompression_error);
        CHECK(f.images->stored().size() == 2);
    }

    SECTION("sender reports progress on its own") {
        auto reported = endpoint->report_inbox_progress(token, 90, 1, 3);
        REQUIRE(reported.is_ok());
        CHECK(reported.value() == inbox_report_outcome::recorded);
        CHECK(f.service->inbox_info().size() == 2);
    }
}
