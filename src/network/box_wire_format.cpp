/**
 * @file box_wire_format.cpp
 * @brief JSON and query-string codec of the peer protocol
 */

// IMPORTANT: Include Crow FIRST before any boxlink headers to avoid forward
// declaration conflicts
#include "crow.h"

#include <boxlink/network/box_wire_format.hpp>

#include <charconv>

namespace boxlink::network {

namespace {

constexpr const char* module_name = "box_wire_format";

[[nodiscard]] bool parse_int64(const char* text, std::int64_t& out) {
    if (text == nullptr || *text == '\0') {
        return false;
    }
    std::string_view sv(text);
    auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), out);
    return ec == std::errc{} && ptr == sv.data() + sv.size();
}

}  // namespace

std::string outbox_entry_to_json(const client::outbox_entry& entry) {
    crow::json::wvalue json;
    json["id"] = entry.id;
    json["transactionId"] = entry.transaction_id;
    json["sequenceNumber"] = entry.sequence_number;
    json["totalImageCount"] = entry.total_image_count;
    json["imageId"] = entry.image_id;
    json["failed"] = entry.failed();
    return json.dump();
}

Result<client::outbox_entry> outbox_entry_from_json(std::string_view body) {
    auto json = crow::json::load(body.data(), body.size());
    if (!json || json.t() != crow::json::type::Object) {
        return make_error<client::outbox_entry>(error_codes::wire_format_error,
                                                "Outbox entry is not a JSON object",
                                                module_name);
    }

    for (const char* key : {"id", "transactionId", "sequenceNumber", "totalImageCount",
                            "imageId", "failed"}) {
        if (!json.has(key)) {
            return make_error<client::outbox_entry>(
                error_codes::wire_format_error,
                std::string("Outbox entry is missing \"") + key + "\"", module_name);
        }
    }

    client::outbox_entry entry;
    try {
        entry.id = json["id"].i();
        entry.transaction_id = json["transactionId"].i();
        entry.sequence_number = json["sequenceNumber"].i();
        entry.total_image_count = json["totalImageCount"].i();
        entry.image_id = json["imageId"].i();
        entry.status = json["failed"].b() ? client::transaction_status::failed
                                          : client::transaction_status::pending;
    } catch (const std::exception& e) {
        return make_error<client::outbox_entry>(
            error_codes::wire_format_error,
            std::string("Malformed outbox entry: ") + e.what(), module_name);
    }

    return ok(std::move(entry));
}

Result<transfer_parameters> parse_transfer_parameters(const char* transaction_id,
                                                      const char* sequence_number,
                                                      const char* total_image_count) {
    transfer_parameters params;
    if (!parse_int64(transaction_id, params.transaction_id) ||
        !parse_int64(sequence_number, params.sequence_number) ||
        !parse_int64(total_image_count, params.total_image_count)) {
        return make_error<transfer_parameters>(
            error_codes::invalid_transfer_parameters,
            "transactionid, sequencenumber and totalimagecount must be integers",
            module_name);
    }

    if (params.transaction_id <= 0 || params.sequence_number < 1 ||
        params.sequence_number > params.total_image_count) {
        return make_error<transfer_parameters>(
            error_codes::invalid_transfer_parameters,
            "Sequence number out of range", module_name);
    }

    return ok(params);
}

std::string to_query_string(const transfer_parameters& params) {
    return "transactionid=" + std::to_string(params.transaction_id) +
           "&sequencenumber=" + std::to_string(params.sequence_number) +
           "&totalimagecount=" + std::to_string(params.total_image_count);
}

}  // namespace boxlink::network
