/**
 * @file box_service_test.cpp
 * @brief Unit tests for the box registry and worker lifecycle
 */

#include <boxlink/client/box_service.hpp>

#include "box_service_fixture.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <mutex>
#include <set>
#include <string>
#include <thread>

using namespace boxlink;
using namespace boxlink::client;
using namespace std::chrono_literals;

namespace {

constexpr const char* remote_url =
    "http://node-b.example/api/box/6f1c2d3e-4a5b-4c6d-8e7f-8091a2b3c4d5";

}  // namespace

// =============================================================================
// Tokens
// =============================================================================

TEST_CASE("generated tokens are lowercase version 4 UUIDs", "[client][box_service]") {
    testing::box_service_fixture f;

    std::set<std::string> seen;
    for (int i = 0; i < 64; ++i) {
        auto token = f.service->generate_token();
        CHECK(box_service::is_valid_token(token));
        CHECK(token[14] == '4');
        CHECK(std::string("89ab").find(token[19]) != std::string::npos);
        for (char c : token) {
            CHECK_FALSE((c >= 'A' && c <= 'F'));
        }
        seen.insert(token);
    }
    CHECK(seen.size() == 64);
}

TEST_CASE("token validation and extraction", "[client][box_service]") {
    CHECK(box_service::is_valid_token("6f1c2d3e-4a5b-4c6d-8e7f-8091a2b3c4d5"));
    CHECK_FALSE(box_service::is_valid_token("6f1c2d3e4a5b4c6d8e7f8091a2b3c4d5"));
    CHECK_FALSE(box_service::is_valid_token("6f1c2d3e-4a5b-4c6d-8e7f-8091a2b3c4dz"));
    CHECK_FALSE(box_service::is_valid_token(""));

    auto token = box_service::extract_token(std::string(remote_url) + "/");
    REQUIRE(token.is_ok());
    CHECK(token.value() == "6f1c2d3e-4a5b-4c6d-8e7f-8091a2b3c4d5");

    auto bad = box_service::extract_token("http://node-b.example/api/box/not-a-token");
    REQUIRE(bad.is_err());
    CHECK(bad.error().code == error_codes::malformed_base_url);
}

// =============================================================================
// Registry
// =============================================================================

TEST_CASE("generate_base_url registers a POLL box", "[client][box_service]") {
    testing::box_service_fixture f;

    auto b = f.service->generate_base_url("clinic");
    REQUIRE(b.is_ok());
    CHECK(b.value().method == send_method::poll);
    CHECK_FALSE(b.value().online);
    CHECK(b.value().base_url == "http://node-a.example/api/box/" + b.value().token);

    auto stored = f.service->get_box(b.value().id);
    REQUIRE(stored);
    CHECK(stored->token == b.value().token);

    auto empty = f.service->generate_base_url("");
    REQUIRE(empty.is_err());
    CHECK(empty.error().code == error_codes::invalid_box_name);
}

TEST_CASE("add_remote_box registers a PUSH box once", "[client][box_service]") {
    testing::box_service_fixture f;

    auto first = f.service->add_remote_box("hospital-b", std::string(remote_url) + "/");
    REQUIRE(first.is_ok());
    CHECK(first.value().method == send_method::push);
    CHECK(first.value().base_url == remote_url);
    CHECK(first.value().token == "6f1c2d3e-4a5b-4c6d-8e7f-8091a2b3c4d5");

    auto again = f.service->add_remote_box("renamed", remote_url);
    REQUIRE(again.is_ok());
    CHECK(again.value().id == first.value().id);
    CHECK(again.value().name == "hospital-b");
    CHECK(f.service->list_boxes().size() == 1);

    auto malformed = f.service->add_remote_box("x", "http://node-b.example/api/box");
    REQUIRE(malformed.is_err());
    CHECK(malformed.error().code == error_codes::malformed_base_url);

    CHECK(f.service->add_remote_box("", remote_url).is_err());
}

TEST_CASE("remove_box drops the box and its queued work", "[client][box_service]") {
    testing::box_service_fixture f;
    f.http->respond_with(503);

    auto b = f.service->add_remote_box("hospital-b", remote_url);
    REQUIRE(b.is_ok());
    f.images->put(1, testing::bytes_of("one"));
    REQUIRE(f.service->send_images(b.value().id, {1}).is_ok());

    f.service->start();
    CHECK(f.service->has_workers(b.value().id));

    REQUIRE(f.service->remove_box(b.value().id).is_ok());
    CHECK_FALSE(f.service->has_workers(b.value().id));
    CHECK_FALSE(f.service->get_box(b.value().id));
    CHECK(f.service->outbox_info().empty());
    CHECK(f.service->transactions().empty());

    auto missing = f.service->remove_box(b.value().id);
    REQUIRE(missing.is_err());
    CHECK(missing.error().code == error_codes::box_not_found);

    f.service->stop();
}

// =============================================================================
// Lifecycle
// =============================================================================

TEST_CASE("started service pushes queued images", "[client][box_service]") {
    testing::box_service_fixture f;
    auto b = f.service->add_remote_box("hospital-b", remote_url);
    REQUIRE(b.is_ok());
    f.images->put(1, testing::bytes_of("one"));
    f.images->put(2, testing::bytes_of("two"));

    int completions = 0;
    std::mutex m;
    f.service->set_transfer_callback([&](const box&, std::int64_t, std::int64_t) {
        std::lock_guard<std::mutex> lock(m);
        ++completions;
    });

    // The peer has nothing for us
    f.http->set_handler([](const testing::recorded_request& r) {
        return ok(network::http_response{r.method == "GET" ? 204 : 200, {}});
    });

    f.service->start();
    CHECK(f.service->is_running());
    auto tx = f.service->send_images(b.value().id, {1, 2});
    REQUIRE(tx.is_ok());

    auto deadline = std::chrono::steady_clock::now() + 3s;
    while (!f.service->outbox_info().empty() &&
           std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    f.service->stop();
    CHECK_FALSE(f.service->is_running());

    CHECK(f.service->outbox_info().empty());
    std::lock_guard<std::mutex> lock(m);
    CHECK(completions == 1);
}

TEST_CASE("retry_transaction requeues a failed transfer", "[client][box_service]") {
    testing::box_service_fixture f;
    auto b = f.service->add_remote_box("hospital-b", remote_url);
    REQUIRE(b.is_ok());
    auto tx = f.service->send_images(b.value().id, {1});
    REQUIRE(tx.is_ok());

    REQUIRE(f.service->outbox()->mark_transaction_failed(b.value().id, tx.value()).is_ok());
    auto summaries = f.service->transactions();
    REQUIRE(summaries.size() == 1);
    CHECK(summaries[0].status == transaction_status::failed);

    REQUIRE(f.service->retry_transaction(b.value().id, tx.value()).is_ok());
    CHECK(f.service->transactions()[0].status == transaction_status::pending);

    auto outbox = f.service->outbox_info();
    REQUIRE(outbox.size() == 1);
    CHECK(outbox[0].remote_box_name == "hospital-b");
    REQUIRE(f.service->remove_outbox_entry(outbox[0].entry.id).is_ok());
    CHECK(f.service->outbox_info().empty());
}
