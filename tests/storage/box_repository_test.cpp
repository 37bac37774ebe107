/**
 * @file box_repository_test.cpp
 * @brief Unit tests for the box, outbox and inbox repositories
 */

#include <catch2/catch_test_macros.hpp>

#include <boxlink/storage/box_database.hpp>
#include <boxlink/storage/box_repository.hpp>
#include <boxlink/storage/inbox_repository.hpp>
#include <boxlink/storage/outbox_repository.hpp>

#include <memory>
#include <string>

using namespace boxlink;
using namespace boxlink::storage;

namespace {

std::shared_ptr<box_database> open_memory_db() {
    auto db = box_database::open(":memory:");
    REQUIRE(db.is_ok());
    return db.value();
}

client::box make_box(const std::string& name,
                     const std::string& token,
                     client::send_method method) {
    client::box b;
    b.name = name;
    b.token = token;
    b.base_url = "http://peer.example/api/box/" + token;
    b.method = method;
    return b;
}

client::outbox_entry make_entry(std::int64_t box_id, std::int64_t tx,
                                std::int64_t seq, std::int64_t total,
                                std::int64_t image_id) {
    client::outbox_entry e;
    e.remote_box_id = box_id;
    e.transaction_id = tx;
    e.sequence_number = seq;
    e.total_image_count = total;
    e.image_id = image_id;
    return e;
}

}  // namespace

// =============================================================================
// Box Repository
// =============================================================================

TEST_CASE("box_repository stores and finds boxes", "[storage][box]") {
    auto db = open_memory_db();
    box_repository repo(db);

    auto id = repo.insert(make_box("hospital-a", "tok-a", client::send_method::push));
    REQUIRE(id.is_ok());
    CHECK(id.value() > 0);

    SECTION("find by id") {
        auto b = repo.find_by_id(id.value());
        REQUIRE(b.has_value());
        CHECK(b->name == "hospital-a");
        CHECK(b->token == "tok-a");
        CHECK(b->method == client::send_method::push);
        CHECK_FALSE(b->online);
    }

    SECTION("find by token") {
        CHECK(repo.find_by_token("tok-a").has_value());
        CHECK_FALSE(repo.find_by_token("tok-b").has_value());
    }

    SECTION("find by base url respects the method") {
        auto url = "http://peer.example/api/box/tok-a";
        CHECK(repo.find_by_base_url(url, client::send_method::push).has_value());
        CHECK_FALSE(repo.find_by_base_url(url, client::send_method::poll).has_value());
    }

    SECTION("duplicate token is rejected") {
        auto dup = repo.insert(make_box("other", "tok-a", client::send_method::poll));
        CHECK(dup.is_err());
        CHECK(repo.count() == 1);
    }

    SECTION("online flag persists") {
        REQUIRE(repo.update_online(id.value(), true).is_ok());
        CHECK(repo.find_by_id(id.value())->online);
    }

    SECTION("find by method") {
        REQUIRE(repo.insert(make_box("b", "tok-b", client::send_method::poll)).is_ok());
        CHECK(repo.find_by_method(client::send_method::poll).size() == 1);
        CHECK(repo.find_by_method(client::send_method::push).size() == 1);
        CHECK(repo.find_all().size() == 2);
    }
}

TEST_CASE("box_repository remove cascades to entries", "[storage][box]") {
    auto db = open_memory_db();
    auto boxes = std::make_shared<box_repository>(db);
    outbox_repository outbox(db);
    inbox_repository inbox(db);

    auto id = boxes->insert(make_box("peer", "tok", client::send_method::push));
    REQUIRE(id.is_ok());

    REQUIRE(outbox.insert(make_entry(id.value(), 7, 1, 1, 42)).is_ok());
    REQUIRE(outbox.insert_tag_value({id.value(), 7, 42, 0x00100010, "ANON"}).is_ok());
    REQUIRE(inbox.upsert_progress(id.value(), 9, 1, 2).is_ok());

    REQUIRE(boxes->remove(id.value()).is_ok());

    CHECK(boxes->count() == 0);
    CHECK(outbox.count() == 0);
    CHECK(outbox.find_tag_values(7, 42).empty());
    CHECK(inbox.count() == 0);
}

// =============================================================================
// Outbox Repository
// =============================================================================

TEST_CASE("outbox_repository ordering and lookup", "[storage][outbox]") {
    auto db = open_memory_db();
    box_repository boxes(db);
    outbox_repository outbox(db);

    auto box_id = boxes.insert(make_box("peer", "tok", client::send_method::push)).value();
    auto other_id = boxes.insert(make_box("other", "tok2", client::send_method::push)).value();

    REQUIRE(outbox.insert(make_entry(box_id, 100, 1, 2, 5)).is_ok());
    REQUIRE(outbox.insert(make_entry(other_id, 300, 1, 1, 9)).is_ok());
    REQUIRE(outbox.insert(make_entry(box_id, 100, 2, 2, 6)).is_ok());
    REQUIRE(outbox.insert(make_entry(box_id, 200, 1, 1, 7)).is_ok());

    SECTION("next pending is the oldest row of the box") {
        auto next = outbox.find_next_pending(box_id);
        REQUIRE(next.has_value());
        CHECK(next->transaction_id == 100);
        CHECK(next->sequence_number == 1);
        CHECK(next->image_id == 5);
    }

    SECTION("failed transactions are skipped") {
        REQUIRE(outbox.update_transaction_status(box_id, 100,
                                                 client::transaction_status::failed)
                    .is_ok());
        auto next = outbox.find_next_pending(box_id);
        REQUIRE(next.has_value());
        CHECK(next->transaction_id == 200);
    }

    SECTION("waiting transactions are still picked") {
        REQUIRE(outbox.update_transaction_status(box_id, 100,
                                                 client::transaction_status::waiting)
                    .is_ok());
        auto next = outbox.find_next_pending(box_id);
        REQUIRE(next.has_value());
        CHECK(next->transaction_id == 100);
        CHECK(next->status == client::transaction_status::waiting);
    }

    SECTION("lookup by transaction and sequence") {
        auto e = outbox.find_by_transaction_and_sequence(box_id, 100, 2);
        REQUIRE(e.has_value());
        CHECK(e->image_id == 6);
        CHECK_FALSE(outbox.find_by_transaction_and_sequence(other_id, 100, 2).has_value());
    }

    SECTION("rows of a transaction come in sequence order") {
        auto rows = outbox.find_by_transaction(box_id, 100);
        REQUIRE(rows.size() == 2);
        CHECK(rows[0].sequence_number == 1);
        CHECK(rows[1].sequence_number == 2);
    }

    SECTION("remove is idempotent") {
        auto e = outbox.find_next_pending(box_id);
        REQUIRE(e.has_value());
        CHECK(outbox.remove(e->id).is_ok());
        CHECK(outbox.remove(e->id).is_ok());
        CHECK(outbox.count() == 3);
    }

    SECTION("duplicate sequence is rejected") {
        CHECK(outbox.insert(make_entry(box_id, 100, 2, 2, 8)).is_err());
    }
}

TEST_CASE("outbox_repository tag values", "[storage][outbox]") {
    auto db = open_memory_db();
    box_repository boxes(db);
    outbox_repository outbox(db);
    auto box_id = boxes.insert(make_box("peer", "tok", client::send_method::push)).value();

    REQUIRE(outbox.insert_tag_value({box_id, 1, 5, 0x00100020, "ID-1"}).is_ok());
    REQUIRE(outbox.insert_tag_value({box_id, 1, 5, 0x00100010, "NAME"}).is_ok());
    REQUIRE(outbox.insert_tag_value({box_id, 1, 6, 0x00100010, "OTHER"}).is_ok());

    SECTION("values are per image, ordered by tag") {
        auto values = outbox.find_tag_values(1, 5);
        REQUIRE(values.size() == 2);
        CHECK(values[0].tag == 0x00100010);
        CHECK(values[0].value == "NAME");
        CHECK(values[1].tag == 0x00100020);
    }

    SECTION("a repeated tag replaces the value") {
        REQUIRE(outbox.insert_tag_value({box_id, 1, 5, 0x00100010, "NEW"}).is_ok());
        auto values = outbox.find_tag_values(1, 5);
        REQUIRE(values.size() == 2);
        CHECK(values[0].value == "NEW");
    }

    SECTION("values are purged per transaction") {
        REQUIRE(outbox.remove_tag_values(box_id, 1).is_ok());
        CHECK(outbox.find_tag_values(1, 5).empty());
        CHECK(outbox.find_tag_values(1, 6).empty());
    }
}

// =============================================================================
// Inbox Repository
// =============================================================================

TEST_CASE("inbox_repository progress upsert", "[storage][inbox]") {
    auto db = open_memory_db();
    box_repository boxes(db);
    inbox_repository inbox(db);
    auto box_id = boxes.insert(make_box("peer", "tok", client::send_method::poll)).value();

    SECTION("first report creates the row") {
        auto e = inbox.upsert_progress(box_id, 11, 1, 3);
        REQUIRE(e.is_ok());
        CHECK(e.value().received_image_count == 1);
        CHECK(e.value().total_image_count == 3);
        CHECK_FALSE(e.value().is_complete());
        CHECK(inbox.count() == 1);
    }

    SECTION("later reports update the same row") {
        REQUIRE(inbox.upsert_progress(box_id, 11, 1, 3).is_ok());
        REQUIRE(inbox.upsert_progress(box_id, 11, 2, 3).is_ok());
        auto e = inbox.upsert_progress(box_id, 11, 3, 3);
        REQUIRE(e.is_ok());
        CHECK(e.value().is_complete());
        CHECK(inbox.count() == 1);
    }

    SECTION("received count never decreases") {
        REQUIRE(inbox.upsert_progress(box_id, 11, 3, 5).is_ok());
        auto e = inbox.upsert_progress(box_id, 11, 2, 5);
        REQUIRE(e.is_ok());
        CHECK(e.value().received_image_count == 3);
    }

    SECTION("remove") {
        auto e = inbox.upsert_progress(box_id, 11, 1, 1);
        REQUIRE(e.is_ok());
        REQUIRE(inbox.remove(e.value().id).is_ok());
        CHECK_FALSE(inbox.find_by_id(e.value().id).has_value());
        CHECK(inbox.remove(e.value().id).is_ok());
    }
}
