/**
 * @file box_wire_format_test.cpp
 * @brief Unit tests for the peer protocol encodings and URL parsing
 */

#include <boxlink/network/box_wire_format.hpp>
#include <boxlink/network/httplib_http_client.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>

using namespace boxlink;
using namespace boxlink::network;

TEST_CASE("outbox entry JSON", "[network][wire]") {
    client::outbox_entry entry;
    entry.id = 17;
    entry.remote_box_id = 3;
    entry.transaction_id = 4611686018427387904;  // 2^62
    entry.sequence_number = 2;
    entry.total_image_count = 3;
    entry.image_id = 6;

    auto json = outbox_entry_to_json(entry);
    CHECK(json.find("\"transactionId\":4611686018427387904") != std::string::npos);
    CHECK(json.find("\"failed\":false") != std::string::npos);

    auto parsed = outbox_entry_from_json(json);
    REQUIRE(parsed.is_ok());
    CHECK(parsed.value().id == 17);
    CHECK(parsed.value().transaction_id == entry.transaction_id);
    CHECK(parsed.value().sequence_number == 2);
    CHECK(parsed.value().total_image_count == 3);
    CHECK(parsed.value().image_id == 6);
    CHECK_FALSE(parsed.value().failed());
}

TEST_CASE("outbox entry JSON rejects incomplete bodies", "[network][wire]") {
    CHECK(outbox_entry_from_json("not json").is_err());
    CHECK(outbox_entry_from_json("[1,2,3]").is_err());

    auto missing = outbox_entry_from_json(
        R"({"id":1,"transactionId":2,"sequenceNumber":1,"totalImageCount":1,"failed":false})");
    REQUIRE(missing.is_err());
    CHECK(missing.error().code == error_codes::wire_format_error);
    CHECK(missing.error().message.find("imageId") != std::string::npos);
}

TEST_CASE("transfer parameters", "[network][wire]") {
    SECTION("valid") {
        auto p = parse_transfer_parameters("99", "2", "3");
        REQUIRE(p.is_ok());
        CHECK(p.value().transaction_id == 99);
        CHECK(p.value().sequence_number == 2);
        CHECK(p.value().total_image_count == 3);
        CHECK(to_query_string(p.value()) ==
              "transactionid=99&sequencenumber=2&totalimagecount=3");
    }

    SECTION("missing parameter") {
        auto p = parse_transfer_parameters("99", nullptr, "3");
        REQUIRE(p.is_err());
        CHECK(p.error().code == error_codes::invalid_transfer_parameters);
    }

    SECTION("not a number") {
        CHECK(parse_transfer_parameters("99", "two", "3").is_err());
        CHECK(parse_transfer_parameters("99", "2x", "3").is_err());
        CHECK(parse_transfer_parameters("", "1", "1").is_err());
    }

    SECTION("out of range") {
        CHECK(parse_transfer_parameters("0", "1", "1").is_err());
        CHECK(parse_transfer_parameters("5", "0", "1").is_err());
        CHECK(parse_transfer_parameters("5", "4", "3").is_err());
    }
}

TEST_CASE("parse_url splits host and path", "[network][http]") {
    SECTION("with path and query") {
        auto u = parse_url("http://peer.example:8080/api/box/abc/image?transactionid=1");
        REQUIRE(u.is_ok());
        CHECK(u.value().scheme_host_port == "http://peer.example:8080");
        CHECK(u.value().path_and_query == "/api/box/abc/image?transactionid=1");
    }

    SECTION("host only") {
        auto u = parse_url("https://peer.example");
        REQUIRE(u.is_ok());
        CHECK(u.value().scheme_host_port == "https://peer.example");
        CHECK(u.value().path_and_query == "/");
    }

    SECTION("invalid") {
        CHECK(parse_url("peer.example/api").is_err());
        CHECK(parse_url("ftp://peer.example/x").is_err());
        CHECK(parse_url("http:///path").is_err());
    }
}
