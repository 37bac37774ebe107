/**
 * @file admin_endpoints.cpp
 * @brief Administration endpoints implementation
 */

// IMPORTANT: Include Crow FIRST before any boxlink headers to avoid forward
// declaration conflicts
#include "crow.h"

// Workaround for Windows: DELETE is defined as a macro in <winnt.h>
// which conflicts with crow::HTTPMethod::DELETE
#ifdef DELETE
#undef DELETE
#endif

#include "boxlink/client/box_service.hpp"
#include "boxlink/client/box_types.hpp"
#include "boxlink/web/endpoints/admin_endpoints.hpp"
#include "boxlink/web/endpoints/box_endpoints.hpp"
#include "boxlink/web/rest_config.hpp"
#include "boxlink/web/rest_types.hpp"

#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace boxlink::web::endpoints {

namespace {

void add_cors_headers(crow::response& res, const rest_server_context& ctx) {
    if (ctx.config && ctx.config->enable_cors &&
        !ctx.config->cors_allowed_origins.empty()) {
        res.add_header("Access-Control-Allow-Origin",
                       ctx.config->cors_allowed_origins);
    }
}

void set_error(crow::response& res, const error_info& error) {
    auto status = to_http_status(error);
    res.code = static_cast<int>(status);
    res.body = make_error_json(to_error_code(status), error.message);
}

[[nodiscard]] bool service_available(crow::response& res,
                                     const rest_server_context& ctx) {
    if (ctx.box_service) {
        return true;
    }
    res.code = 503;
    res.body = make_error_json("SERVICE_UNAVAILABLE", "Box service not configured");
    return false;
}

// =============================================================================
// JSON Output
// =============================================================================

std::string box_to_json(const client::box& b) {
    std::ostringstream oss;
    oss << R"({"id":)" << b.id
        << R"(,"name":")" << json_escape(b.name)
        << R"(","baseUrl":")" << json_escape(b.base_url)
        << R"(","sendMethod":")" << client::to_string(b.method)
        << R"(","online":)" << (b.online ? "true" : "false") << '}';
    return oss.str();
}

std::string boxes_to_json(const std::vector<client::box>& boxes) {
    std::ostringstream oss;
    oss << R"({"boxes":[)";
    for (size_t i = 0; i < boxes.size(); ++i) {
        if (i > 0) {
            oss << ',';
        }
        oss << box_to_json(boxes[i]);
    }
    oss << R"(],"total":)" << boxes.size() << '}';
    return oss.str();
}

std::string outbox_to_json(const std::vector<client::outbox_entry_info>& entries) {
    std::ostringstream oss;
    oss << R"({"entries":[)";
    for (size_t i = 0; i < entries.size(); ++i) {
        const auto& e = entries[i].entry;
        if (i > 0) {
            oss << ',';
        }
        oss << R"({"id":)" << e.id
            << R"(,"remoteBoxId":)" << e.remote_box_id
            << R"(,"remoteBoxName":")" << json_escape(entries[i].remote_box_name)
            << R"(","transactionId":)" << e.transaction_id
            << R"(,"sequenceNumber":)" << e.sequence_number
            << R"(,"totalImageCount":)" << e.total_image_count
            << R"(,"imageId":)" << e.image_id
            << R"(,"status":")" << client::to_string(e.status) << R"("})";
    }
    oss << R"(],"total":)" << entries.size() << '}';
    return oss.str();
}

std::string inbox_to_json(const std::vector<client::inbox_entry_info>& entries) {
    std::ostringstream oss;
    oss << R"({"entries":[)";
    for (size_t i = 0; i < entries.size(); ++i) {
        const auto& e = entries[i].entry;
        if (i > 0) {
            oss << ',';
        }
        oss << R"({"id":)" << e.id
            << R"(,"remoteBoxId":)" << e.remote_box_id
            << R"(,"remoteBoxName":")" << json_escape(entries[i].remote_box_name)
            << R"(","transactionId":)" << e.transaction_id
            << R"(,"receivedImageCount":)" << e.received_image_count
            << R"(,"totalImageCount":)" << e.total_image_count
            << R"(,"complete":)" << (e.is_complete() ? "true" : "false") << '}';
    }
    oss << R"(],"total":)" << entries.size() << '}';
    return oss.str();
}

std::string transactions_to_json(
    const std::vector<client::outbox_transaction_summary>& transactions) {
    std::ostringstream oss;
    oss << R"({"transactions":[)";
    for (size_t i = 0; i < transactions.size(); ++i) {
        const auto& t = transactions[i];
        if (i > 0) {
            oss << ',';
        }
        oss << R"({"remoteBoxId":)" << t.remote_box_id
            << R"(,"remoteBoxName":")" << json_escape(t.remote_box_name)
            << R"(","transactionId":)" << t.transaction_id
            << R"(,"totalImageCount":)" << t.total_image_count
            << R"(,"imagesLeft":)" << t.images_left
            << R"(,"progress":)" << t.progress_percent()
            << R"(,"status":")" << client::to_string(t.status) << R"("})";
    }
    oss << R"(],"total":)" << transactions.size() << '}';
    return oss.str();
}

// =============================================================================
// JSON Input
// =============================================================================

[[nodiscard]] bool has_member(const crow::json::rvalue& json, const char* key,
                              crow::json::type expected) {
    return json.has(key) && json[key].t() == expected;
}

/**
 * @brief Parse the body of POST /api/boxes/<id>/send
 *
 * {"imageIds":[1,2,3],"tagValues":[{"imageId":1,"tag":1048592,"value":"X"}]}
 */
std::optional<std::vector<std::int64_t>> parse_send_request(
    const std::string& body,
    std::int64_t box_id,
    std::vector<client::outbox_tag_value>& tag_values,
    std::string& error_message) {
    auto json = crow::json::load(body);
    if (!json || json.t() != crow::json::type::Object || !json.has("imageIds") ||
        json["imageIds"].t() != crow::json::type::List) {
        error_message = "Body must be an object with an imageIds array";
        return std::nullopt;
    }

    std::vector<std::int64_t> image_ids;
    for (const auto& id : json["imageIds"]) {
        if (id.t() != crow::json::type::Number ||
            id.nt() == crow::json::num_type::Floating_point) {
            error_message = "imageIds must contain integers";
            return std::nullopt;
        }
        image_ids.push_back(id.i());
    }

    if (json.has("tagValues")) {
        if (json["tagValues"].t() != crow::json::type::List) {
            error_message = "tagValues must be an array";
            return std::nullopt;
        }
        for (const auto& item : json["tagValues"]) {
            if (item.t() != crow::json::type::Object ||
                !has_member(item, "imageId", crow::json::type::Number) ||
                !has_member(item, "tag", crow::json::type::Number) ||
                !has_member(item, "value", crow::json::type::String)) {
                error_message = "tagValues entries need imageId, tag and a string value";
                return std::nullopt;
            }
            if (item["tag"].nt() != crow::json::num_type::Unsigned_integer ||
                item["tag"].u() > 0xFFFFFFFFULL) {
                error_message = "tag must be an unsigned 32-bit number";
                return std::nullopt;
            }
            client::outbox_tag_value value;
            value.remote_box_id = box_id;
            value.image_id = item["imageId"].i();
            value.tag = static_cast<std::uint32_t>(item["tag"].u());
            value.value = std::string(item["value"].s());
            tag_values.push_back(std::move(value));
        }
    }

    return image_ids;
}

}  // namespace

void register_admin_endpoints_impl(crow::SimpleApp& app,
                                   std::shared_ptr<rest_server_context> ctx) {
    // GET /api/boxes - List boxes
    CROW_ROUTE(app, "/api/boxes")
        .methods(crow::HTTPMethod::GET)([ctx](const crow::request& /*req*/) {
            crow::response res;
            res.add_header("Content-Type", "application/json");
            add_cors_headers(res, *ctx);

            if (!service_available(res, *ctx)) {
                return res;
            }

            res.code = 200;
            res.body = boxes_to_json(ctx->box_service->list_boxes());
            return res;
        });

    // POST /api/boxes - {"name"} generates a POLL box,
    // {"name","baseUrl"} adopts a peer's URL as a PUSH box
    CROW_ROUTE(app, "/api/boxes")
        .methods(crow::HTTPMethod::POST)([ctx](const crow::request& req) {
            crow::response res;
            res.add_header("Content-Type", "application/json");
            add_cors_headers(res, *ctx);

            if (!service_available(res, *ctx)) {
                return res;
            }

            auto json = crow::json::load(req.body);
            if (!json || json.t() != crow::json::type::Object ||
                !has_member(json, "name", crow::json::type::String)) {
                res.code = 400;
                res.body = make_error_json("INVALID_REQUEST", "name must be a string");
                return res;
            }
            if (json.has("baseUrl") &&
                json["baseUrl"].t() != crow::json::type::String) {
                res.code = 400;
                res.body = make_error_json("INVALID_REQUEST", "baseUrl must be a string");
                return res;
            }

            auto name = std::string(json["name"].s());
            auto created = json.has("baseUrl")
                ? ctx->box_service->add_remote_box(name, std::string(json["baseUrl"].s()))
                : ctx->box_service->generate_base_url(name);
            if (created.is_err()) {
                set_error(res, created.error());
                return res;
            }

            res.code = 201;
            res.body = box_to_json(created.value());
            return res;
        });

    // GET /api/boxes/<id> - Get one box
    CROW_ROUTE(app, "/api/boxes/<int>")
        .methods(crow::HTTPMethod::GET)(
            [ctx](const crow::request& /*req*/, std::int64_t box_id) {
                crow::response res;
                res.add_header("Content-Type", "application/json");
                add_cors_headers(res, *ctx);

                if (!service_available(res, *ctx)) {
                    return res;
                }

                auto b = ctx->box_service->get_box(box_id);
                if (!b) {
                    res.code = 404;
                    res.body = make_error_json("NOT_FOUND", "Box not found");
                    return res;
                }

                res.code = 200;
                res.body = box_to_json(*b);
                return res;
            });

    // DELETE /api/boxes/<id> - Remove a box and its entries
    CROW_ROUTE(app, "/api/boxes/<int>")
        .methods(crow::HTTPMethod::DELETE)(
            [ctx](const crow::request& /*req*/, std::int64_t box_id) {
                crow::response res;
                res.add_header("Content-Type", "application/json");
                add_cors_headers(res, *ctx);

                if (!service_available(res, *ctx)) {
                    return res;
                }

                auto removed = ctx->box_service->remove_box(box_id);
                if (removed.is_err()) {
                    set_error(res, removed.error());
                    return res;
                }

                res.code = 204;
                return res;
            });

    // POST /api/boxes/<id>/send - Queue images for the box
    CROW_ROUTE(app, "/api/boxes/<int>/send")
        .methods(crow::HTTPMethod::POST)(
            [ctx](const crow::request& req, std::int64_t box_id) {
                crow::response res;
                res.add_header("Content-Type", "application/json");
                add_cors_headers(res, *ctx);

                if (!service_available(res, *ctx)) {
                    return res;
                }

                std::string error_message;
                std::vector<client::outbox_tag_value> tag_values;
                auto image_ids = parse_send_request(req.body, box_id, tag_values,
                                                    error_message);
                if (!image_ids) {
                    res.code = 400;
                    res.body = make_error_json("INVALID_REQUEST", error_message);
                    return res;
                }

                auto tx = ctx->box_service->send_images(box_id, *image_ids, tag_values);
                if (tx.is_err()) {
                    set_error(res, tx.error());
                    return res;
                }

                res.code = 202;
                res.body = R"({"transactionId":)" + std::to_string(tx.value()) +
                           R"(,"totalImageCount":)" +
                           std::to_string(image_ids->size()) + "}";
                return res;
            });

    // GET /api/outbox - List outbox entries
    CROW_ROUTE(app, "/api/outbox")
        .methods(crow::HTTPMethod::GET)([ctx](const crow::request& /*req*/) {
            crow::response res;
            res.add_header("Content-Type", "application/json");
            add_cors_headers(res, *ctx);

            if (!service_available(res, *ctx)) {
                return res;
            }

            res.code = 200;
            res.body = outbox_to_json(ctx->box_service->outbox_info());
            return res;
        });

    // DELETE /api/outbox/<id> - Drop one outbox entry
    CROW_ROUTE(app, "/api/outbox/<int>")
        .methods(crow::HTTPMethod::DELETE)(
            [ctx](const crow::request& /*req*/, std::int64_t id) {
                crow::response res;
                res.add_header("Content-Type", "application/json");
                add_cors_headers(res, *ctx);

                if (!service_available(res, *ctx)) {
                    return res;
                }

                auto removed = ctx->box_service->remove_outbox_entry(id);
                if (removed.is_err()) {
                    set_error(res, removed.error());
                    return res;
                }

                res.code = 204;
                return res;
            });

    // GET /api/inbox - List inbox entries
    CROW_ROUTE(app, "/api/inbox")
        .methods(crow::HTTPMethod::GET)([ctx](const crow::request& /*req*/) {
            crow::response res;
            res.add_header("Content-Type", "application/json");
            add_cors_headers(res, *ctx);

            if (!service_available(res, *ctx)) {
                return res;
            }

            res.code = 200;
            res.body = inbox_to_json(ctx->box_service->inbox_info());
            return res;
        });

    // DELETE /api/inbox/<id> - Drop one inbox entry
    CROW_ROUTE(app, "/api/inbox/<int>")
        .methods(crow::HTTPMethod::DELETE)(
            [ctx](const crow::request& /*req*/, std::int64_t id) {
                crow::response res;
                res.add_header("Content-Type", "application/json");
                add_cors_headers(res, *ctx);

                if (!service_available(res, *ctx)) {
                    return res;
                }

                auto removed = ctx->box_service->remove_inbox_entry(id);
                if (removed.is_err()) {
                    set_error(res, removed.error());
                    return res;
                }

                res.code = 204;
                return res;
            });

    // GET /api/transactions - Per-transaction outbox progress
    CROW_ROUTE(app, "/api/transactions")
        .methods(crow::HTTPMethod::GET)([ctx](const crow::request& /*req*/) {
            crow::response res;
            res.add_header("Content-Type", "application/json");
            add_cors_headers(res, *ctx);

            if (!service_available(res, *ctx)) {
                return res;
            }

            res.code = 200;
            res.body = transactions_to_json(ctx->box_service->transactions());
            return res;
        });

    // POST /api/transactions/<box>/<tx>/retry - Requeue a stalled transaction
    CROW_ROUTE(app, "/api/transactions/<int>/<int>/retry")
        .methods(crow::HTTPMethod::POST)(
            [ctx](const crow::request& /*req*/, std::int64_t box_id,
                  std::int64_t transaction_id) {
                crow::response res;
                res.add_header("Content-Type", "application/json");
                add_cors_headers(res, *ctx);

                if (!service_available(res, *ctx)) {
                    return res;
                }

                auto retried = ctx->box_service->retry_transaction(box_id, transaction_id);
                if (retried.is_err()) {
                    set_error(res, retried.error());
                    return res;
                }

                res.code = 200;
                res.body = R"({"status":"success","message":"Transaction requeued"})";
                return res;
            });
}

}  // namespace boxlink::web::endpoints
