/**
 * @file box_push_engine_test.cpp
 * @brief Unit tests for the push delivery state machine
 */

#include <boxlink/client/box_push_engine.hpp>
#include <boxlink/client/outbox_manager.hpp>
#include <boxlink/client/transfer_payload_builder.hpp>
#include <boxlink/codec/zlib_compressor.hpp>
#include <boxlink/storage/box_database.hpp>
#include <boxlink/storage/box_repository.hpp>
#include <boxlink/storage/outbox_repository.hpp>

#include "../mocks/mock_collaborators.hpp"
#include "../mocks/mock_logger.hpp"
#include "../mocks/mock_thread_pool.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <thread>

using namespace boxlink;
using namespace boxlink::client;
using namespace std::chrono_literals;
using boxlink::integration::testing::mock_thread_pool;

namespace {

struct push_fixture {
    std::shared_ptr<storage::box_database> db;
    std::shared_ptr<storage::box_repository> boxes;
    std::shared_ptr<storage::outbox_repository> outbox_repo;
    std::shared_ptr<outbox_manager> outbox;
    std::shared_ptr<testing::memory_image_storage> images =
        std::make_shared<testing::memory_image_storage>();
    std::shared_ptr<transfer_payload_builder> payloads;
    std::shared_ptr<testing::mock_http_client> http =
        std::make_shared<testing::mock_http_client>();
    std::shared_ptr<mock_thread_pool> pool = std::make_shared<mock_thread_pool>();
    std::shared_ptr<testing::MockLogger> logger = std::make_shared<testing::MockLogger>();
    box peer;

    push_fixture() {
        auto opened = storage::box_database::open(":memory:");
        REQUIRE(opened.is_ok());
        db = opened.value();
        boxes = std::make_shared<storage::box_repository>(db);
        outbox_repo = std::make_shared<storage::outbox_repository>(db);
        outbox = std::make_shared<outbox_manager>(db, boxes, outbox_repo);
        payloads = std::make_shared<transfer_payload_builder>(
            images, std::make_shared<passthrough_anonymizer>(),
            std::make_shared<codec::zlib_compressor>(), outbox_repo);

        peer.name = "hospital-b";
        peer.token = "tok-b";
        peer.base_url = "http://peer.example/api/box/tok-b";
        peer.method = send_method::push;
        auto id = boxes->insert(peer);
        REQUIRE(id.is_ok());
        peer.id = id.value();

        images->put(1, testing::bytes_of("first"));
        images->put(2, testing::bytes_of("second"));
        REQUIRE(pool->start());
    }

    std::unique_ptr<box_push_engine> make_engine(push_engine_config config = {}) {
        return std::make_unique<box_push_engine>(peer, outbox, payloads, http, pool,
                                                 config, logger);
    }

    std::int64_t enqueue(const std::vector<std::int64_t>& image_ids) {
        auto tx = outbox->enqueue_transfer(peer.id, image_ids);
        REQUIRE(tx.is_ok());
        return tx.value();
    }
};

}  // namespace

// =============================================================================
// Delivery Outcomes
// =============================================================================

TEST_CASE("push engine delivers entries in sequence order", "[client][push]") {
    push_fixture f;
    auto tx = f.enqueue({1, 2});
    auto engine = f.make_engine();

    CHECK(engine->run_cycle() == push_outcome::delivered);
    CHECK(engine->run_cycle() == push_outcome::delivered);
    CHECK(engine->run_cycle() == push_outcome::no_work);
    CHECK(engine->attempt_count() == 2);
    CHECK(engine->state() == push_state::idle);

    auto requests = f.http->requests();
    REQUIRE(requests.size() == 2);
    CHECK(requests[0].method == "POST");
    CHECK(requests[0].url == "http://peer.example/api/box/tok-b/image?transactionid=" +
                                 std::to_string(tx) +
                                 "&sequencenumber=1&totalimagecount=2");
    CHECK(requests[1].url.find("sequencenumber=2") != std::string::npos);

    codec::zlib_compressor codec;
    auto body = codec.decompress(requests[0].body);
    REQUIRE(body.is_ok());
    CHECK(body.value() == testing::bytes_of("first"));

    CHECK(f.outbox->list_entries().empty());
}

TEST_CASE("5xx puts the transaction in WAITING without an error log", "[client][push]") {
    push_fixture f;
    auto tx = f.enqueue({1, 2});
    auto engine = f.make_engine();
    f.http->respond_with(503);

    CHECK(engine->run_cycle() == push_outcome::soft_failed);
    CHECK(f.outbox->get_transaction_status(f.peer.id, tx) == transaction_status::waiting);
    CHECK(f.outbox->list_entries().size() == 2);
    CHECK(f.logger->error_count() == 0);

    // WAITING entries are retried on the next tick
    f.http->respond_with(200);
    CHECK(engine->run_cycle() == push_outcome::delivered);
    CHECK(f.outbox->get_transaction_status(f.peer.id, tx) == transaction_status::pending);
}

TEST_CASE("transport errors are transient", "[client][push]") {
    push_fixture f;
    auto tx = f.enqueue({1});
    auto engine = f.make_engine();
    f.http->set_handler([](const testing::recorded_request&) {
        return make_error<network::http_response>(error_codes::http_transport_error,
                                                  "connection refused", "test");
    });

    CHECK(engine->run_cycle() == push_outcome::soft_failed);
    CHECK(f.outbox->get_transaction_status(f.peer.id, tx) == transaction_status::waiting);
}

TEST_CASE("other statuses fail the transaction", "[client][push]") {
    push_fixture f;
    auto tx = f.enqueue({1, 2});
    auto engine = f.make_engine();
    f.http->set_handler([](const testing::recorded_request&) {
        return ok(network::http_response{404, testing::bytes_of("no such box")});
    });

    CHECK(engine->run_cycle() == push_outcome::hard_failed);
    CHECK(f.outbox->get_transaction_status(f.peer.id, tx) == transaction_status::failed);
    CHECK(f.logger->contains("Cannot send file to box hospital-b: no such box"));

    // Held until an operator retries it
    CHECK(engine->run_cycle() == push_outcome::no_work);
    CHECK(f.http->request_count() == 1);
}

TEST_CASE("a missing dataset fails without contacting the peer", "[client][push]") {
    push_fixture f;
    auto tx = f.enqueue({99});
    auto engine = f.make_engine();

    CHECK(engine->run_cycle() == push_outcome::hard_failed);
    CHECK(f.http->request_count() == 0);
    CHECK(f.outbox->get_transaction_status(f.peer.id, tx) == transaction_status::failed);
}

TEST_CASE("a pool rejection counts as a transient fault", "[client][push]") {
    push_fixture f;
    auto tx = f.enqueue({1});
    auto engine = f.make_engine();
    f.pool->set_reject_submissions(true);

    CHECK(engine->run_cycle() == push_outcome::soft_failed);
    CHECK(f.outbox->get_transaction_status(f.peer.id, tx) == transaction_status::waiting);
}

// =============================================================================
// Concurrency
// =============================================================================

TEST_CASE("only one attempt per peer is in flight", "[client][push]") {
    push_fixture f;
    f.enqueue({1});
    auto engine = f.make_engine();

    push_outcome nested = push_outcome::no_work;
    f.http->set_handler([&](const testing::recorded_request&) {
        nested = engine->run_cycle();
        CHECK(engine->state() == push_state::sending);
        return ok(network::http_response{200, {}});
    });

    CHECK(engine->run_cycle() == push_outcome::delivered);
    CHECK(nested == push_outcome::busy);
}

TEST_CASE("a send that never finishes times out and leaves the entry", "[client][push]") {
    push_fixture f;
    auto tx = f.enqueue({1});
    f.pool->set_dispatch(mock_thread_pool::dispatch::hold);

    push_engine_config config;
    config.receive_timeout = 50ms;
    auto engine = f.make_engine(config);

    CHECK(engine->run_cycle() == push_outcome::timed_out);
    CHECK(f.logger->error_count() == 1);
    CHECK(f.outbox->get_transaction_status(f.peer.id, tx) == transaction_status::pending);
    CHECK(engine->state() == push_state::idle);

    // The abandoned job still holds its worker
    CHECK(engine->run_cycle() == push_outcome::busy);

    // Released late, it neither posts nor applies a result
    CHECK(f.pool->release_held() == 1);
    CHECK(f.http->request_count() == 0);
    CHECK(f.outbox->list_entries().size() == 1);

    CHECK(engine->run_cycle() == push_outcome::delivered);
    CHECK(f.http->request_count() == 1);
}

TEST_CASE("a slow peer never sees two sends at once", "[client][push]") {
    push_fixture f;
    f.enqueue({1});
    f.pool->set_dispatch(mock_thread_pool::dispatch::background);

    std::atomic<int> in_flight{0};
    std::atomic<int> peak{0};
    f.http->set_handler([&](const testing::recorded_request&) {
        int now = ++in_flight;
        int seen = peak.load();
        while (now > seen && !peak.compare_exchange_weak(seen, now)) {
        }
        std::this_thread::sleep_for(300ms);
        --in_flight;
        return ok(network::http_response{200, {}});
    });

    push_engine_config config;
    config.receive_timeout = 50ms;
    auto engine = f.make_engine(config);

    CHECK(engine->run_cycle() == push_outcome::timed_out);
    CHECK(engine->run_cycle() == push_outcome::busy);
    CHECK(f.pool->submitted_count() == 1);

    REQUIRE(f.pool->drain());
    CHECK(f.outbox->list_entries().size() == 1);

    config.receive_timeout = 5s;
    auto patient = f.make_engine(config);
    CHECK(patient->run_cycle() == push_outcome::delivered);
    CHECK(f.http->request_count() == 2);
    CHECK(peak.load() == 1);
}

TEST_CASE("stop() abandons an in-flight send", "[client][push]") {
    push_fixture f;
    auto tx = f.enqueue({1});
    f.pool->set_dispatch(mock_thread_pool::dispatch::background);

    std::promise<void> entered;
    std::promise<void> release;
    auto release_future = release.get_future().share();
    f.http->set_handler([&, release_future](const testing::recorded_request&) {
        entered.set_value();
        release_future.wait();
        return ok(network::http_response{200, {}});
    });

    auto engine = f.make_engine();
    auto outcome = std::async(std::launch::async, [&] { return engine->run_cycle(); });

    entered.get_future().wait();
    engine->stop();
    CHECK(outcome.get() == push_outcome::cancelled);

    release.set_value();
    CHECK(f.pool->drain());
    CHECK(f.outbox->get_transaction_status(f.peer.id, tx) == transaction_status::pending);
    CHECK(f.outbox->list_entries().size() == 1);
}

TEST_CASE("the background loop drains the outbox", "[client][push]") {
    push_fixture f;
    f.enqueue({1, 2});

    push_engine_config config;
    config.poll_interval = 20ms;
    auto engine = f.make_engine(config);
    engine->start();
    CHECK(engine->is_running());

    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (!f.outbox->list_entries().empty() &&
           std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    CHECK(f.outbox->list_entries().empty());

    engine->stop();
    CHECK_FALSE(engine->is_running());
    CHECK(f.http->request_count() == 2);
}
