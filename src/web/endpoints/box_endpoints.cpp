/**
 * @file box_endpoints.cpp
 * @brief Peer wire endpoints implementation
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
#include "boxlink/client/poll_service.hpp"
#include "boxlink/network/box_wire_format.hpp"
#include "boxlink/web/endpoints/box_endpoints.hpp"
#include "boxlink/web/rest_config.hpp"
#include "boxlink/web/rest_types.hpp"

#include <string>

namespace boxlink::web::endpoints {

namespace {

/**
 * @brief Add CORS headers to response
 */
void add_cors_headers(crow::response& res, const rest_server_context& ctx) {
    if (ctx.config && ctx.config->enable_cors &&
        !ctx.config->cors_allowed_origins.empty()) {
        res.add_header("Access-Control-Allow-Origin",
                       ctx.config->cors_allowed_origins);
    }
}

/**
 * @brief Fill @p res with the JSON error for a failed operation
 */
void set_error(crow::response& res, const error_info& error) {
    auto status = to_http_status(error);
    res.code = static_cast<int>(status);
    res.add_header("Content-Type", "application/json");
    res.body = make_error_json(to_error_code(status), error.message);
}

[[nodiscard]] bool service_available(crow::response& res,
                                     const rest_server_context& ctx) {
    if (ctx.box_service) {
        return true;
    }
    res.code = 503;
    res.add_header("Content-Type", "application/json");
    res.body = make_error_json("SERVICE_UNAVAILABLE", "Box service not configured");
    return false;
}

[[nodiscard]] Result<network::transfer_parameters> query_parameters(
    const crow::request& req) {
    return network::parse_transfer_parameters(req.url_params.get("transactionid"),
                                              req.url_params.get("sequencenumber"),
                                              req.url_params.get("totalimagecount"));
}

}  // namespace

void register_box_endpoints_impl(crow::SimpleApp& app,
                                 std::shared_ptr<rest_server_context> ctx) {
    // POST /api/box/<token>/image - Receive an image pushed by the peer
    CROW_ROUTE(app, "/api/box/<string>/image")
        .methods(crow::HTTPMethod::POST)(
            [ctx](const crow::request& req, const std::string& token) {
                crow::response res;
                add_cors_headers(res, *ctx);

                if (!service_available(res, *ctx)) {
                    return res;
                }

                auto params = query_parameters(req);
                if (params.is_err()) {
                    set_error(res, params.error());
                    return res;
                }

                if (ctx->config && req.body.size() > ctx->config->max_body_size) {
                    res.code = 400;
                    res.add_header("Content-Type", "application/json");
                    res.body = make_error_json("BAD_REQUEST", "Request body too large");
                    return res;
                }

                const auto& p = params.value();
                client::byte_buffer payload(req.body.begin(), req.body.end());
                auto stored = ctx->box_service->poll_endpoint()->receive_image(
                    token, p.transaction_id, p.sequence_number, p.total_image_count,
                    payload);
                if (stored.is_err()) {
                    set_error(res, stored.error());
                    return res;
                }

                res.code = 200;
                return res;
            });

    // GET /api/box/<token>/outbox - Next entry addressed to the peer
    CROW_ROUTE(app, "/api/box/<string>/outbox")
        .methods(crow::HTTPMethod::GET)(
            [ctx](const crow::request& /*req*/, const std::string& token) {
                crow::response res;
                add_cors_headers(res, *ctx);

                if (!service_available(res, *ctx)) {
                    return res;
                }

                auto next = ctx->box_service->poll_endpoint()->poll_outbox(token);
                if (next.is_err()) {
                    set_error(res, next.error());
                    return res;
                }

                if (!next.value()) {
                    res.code = 204;
                    return res;
                }

                res.code = 200;
                res.add_header("Content-Type", "application/json");
                res.body = network::outbox_entry_to_json(*next.value());
                return res;
            });

    // GET /api/box/<token>/outbox/<tx>/<seq> - Payload of one entry
    CROW_ROUTE(app, "/api/box/<string>/outbox/<int>/<int>")
        .methods(crow::HTTPMethod::GET)(
            [ctx](const crow::request& /*req*/, const std::string& token,
                  std::int64_t transaction_id, std::int64_t sequence_number) {
                crow::response res;
                add_cors_headers(res, *ctx);

                if (!service_available(res, *ctx)) {
                    return res;
                }

                auto payload = ctx->box_service->poll_endpoint()->fetch_entry_payload(
                    token, transaction_id, sequence_number);
                if (payload.is_err()) {
                    set_error(res, payload.error());
                    return res;
                }

                const auto& bytes = payload.value();
                res.code = 200;
                res.add_header("Content-Type", "application/octet-stream");
                res.body.assign(bytes.begin(), bytes.end());
                return res;
            });

    // DELETE /api/box/<token>/outbox/<tx>/<seq> - Confirm receipt of an entry
    CROW_ROUTE(app, "/api/box/<string>/outbox/<int>/<int>")
        .methods(crow::HTTPMethod::DELETE)(
            [ctx](const crow::request& /*req*/, const std::string& token,
                  std::int64_t transaction_id, std::int64_t sequence_number) {
                crow::response res;
                add_cors_headers(res, *ctx);

                if (!service_available(res, *ctx)) {
                    return res;
                }

                auto removed = ctx->box_service->poll_endpoint()->delete_entry(
                    token, transaction_id, sequence_number);
                if (removed.is_err()) {
                    set_error(res, removed.error());
                    return res;
                }

                res.code = 204;
                return res;
            });

    // POST /api/box/<token>/inbox - Receive progress reported by the peer
    CROW_ROUTE(app, "/api/box/<string>/inbox")
        .methods(crow::HTTPMethod::POST)(
            [ctx](const crow::request& req, const std::string& token) {
                crow::response res;
                add_cors_headers(res, *ctx);

                if (!service_available(res, *ctx)) {
                    return res;
                }

                auto params = query_parameters(req);
                if (params.is_err()) {
                    set_error(res, params.error());
                    return res;
                }

                // An unknown token is acknowledged like a recorded report
                const auto& p = params.value();
                auto reported = ctx->box_service->poll_endpoint()->report_inbox_progress(
                    token, p.transaction_id, p.sequence_number, p.total_image_count);
                if (reported.is_err()) {
                    set_error(res, reported.error());
                    return res;
                }

                res.code = 200;
                return res;
            });
}

}  // namespace boxlink::web::endpoints
