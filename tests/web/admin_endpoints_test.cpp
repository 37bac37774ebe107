/**
 * @file admin_endpoints_test.cpp
 * @brief Unit tests for the administration endpoints served over Crow
 */

#include "crow.h"

#ifdef DELETE
#undef DELETE
#endif

#include <catch2/catch_test_macros.hpp>

#include "boxlink/client/box_service.hpp"
#include "boxlink/client/box_types.hpp"
#include "boxlink/web/endpoints/admin_endpoints.hpp"
#include "boxlink/web/endpoints/box_endpoints.hpp"
#include "boxlink/web/rest_config.hpp"

#include "client/box_service_fixture.hpp"

#include <memory>
#include <string>

namespace boxlink::web::endpoints {
void register_admin_endpoints_impl(crow::SimpleApp &app,
                                   std::shared_ptr<rest_server_context> ctx);
} // namespace boxlink::web::endpoints

using namespace boxlink;
using namespace boxlink::web;

namespace {

constexpr const char *remote_url =
    "http://node-b.example/api/box/0a1b2c3d-4e5f-4a6b-9c8d-7e6f5a4b3c2d";

struct admin_endpoints_fixture {
  testing::box_service_fixture services;
  rest_server_config config;
  crow::SimpleApp app;

  explicit admin_endpoints_fixture(bool with_service = true) {
    auto ctx = std::make_shared<rest_server_context>();
    ctx->config = &config;
    if (with_service) {
      ctx->box_service = services.service;
    }
    endpoints::register_admin_endpoints_impl(app, ctx);
    app.validate();
  }

  crow::response call(crow::HTTPMethod method, const std::string &url,
                      std::string body = {}) {
    crow::request req;
    req.method = method;
    req.raw_url = url;
    req.url = url;
    req.body = std::move(body);

    crow::response res;
    app.handle_full(req, res);
    return res;
  }
};

std::string error_code_of(const crow::response &res) {
  auto json = crow::json::load(res.body);
  REQUIRE(json);
  return std::string(json["error"]["code"].s());
}

} // namespace

// =============================================================================
// Box registry
// =============================================================================

TEST_CASE("boxes are created, listed and removed", "[web][admin]") {
  admin_endpoints_fixture f;

  auto empty = f.call(crow::HTTPMethod::GET, "/api/boxes");
  REQUIRE(empty.code == 200);
  auto listed = crow::json::load(empty.body);
  REQUIRE(listed);
  CHECK(listed["total"].i() == 0);

  SECTION("a name alone generates a POLL box") {
    auto res = f.call(crow::HTTPMethod::POST, "/api/boxes", R"({"name":"clinic"})");
    REQUIRE(res.code == 201);
    auto json = crow::json::load(res.body);
    REQUIRE(json);
    CHECK(std::string(json["name"].s()) == "clinic");
    CHECK(std::string(json["sendMethod"].s()) == client::to_string(client::send_method::poll));
    CHECK(std::string(json["baseUrl"].s()).rfind("http://node-a.example/api/box/", 0) == 0);
    CHECK(json["online"].b() == false);

    const auto id = json["id"].i();
    auto fetched = f.call(crow::HTTPMethod::GET, "/api/boxes/" + std::to_string(id));
    CHECK(fetched.code == 200);

    CHECK(f.call(crow::HTTPMethod::DELETE, "/api/boxes/" + std::to_string(id)).code == 204);
    CHECK(f.call(crow::HTTPMethod::GET, "/api/boxes/" + std::to_string(id)).code == 404);
  }

  SECTION("a name and baseUrl adopt a PUSH box") {
    auto res = f.call(crow::HTTPMethod::POST, "/api/boxes",
                      std::string(R"({"name":"hospital-b","baseUrl":")") + remote_url +
                          R"("})");
    REQUIRE(res.code == 201);
    auto json = crow::json::load(res.body);
    REQUIRE(json);
    CHECK(std::string(json["sendMethod"].s()) == client::to_string(client::send_method::push));
    CHECK(std::string(json["baseUrl"].s()) == remote_url);

    auto all = crow::json::load(f.call(crow::HTTPMethod::GET, "/api/boxes").body);
    REQUIRE(all);
    CHECK(all["total"].i() == 1);
  }

  SECTION("a malformed baseUrl answers 400") {
    auto res = f.call(crow::HTTPMethod::POST, "/api/boxes",
                      R"({"name":"x","baseUrl":"http://node-b.example/api/box"})");
    CHECK(res.code == 400);
  }

  SECTION("unknown box answers 404") {
    auto res = f.call(crow::HTTPMethod::GET, "/api/boxes/404");
    CHECK(res.code == 404);
    CHECK(error_code_of(res) == "NOT_FOUND");
  }
}

TEST_CASE("box creation rejects ill-typed fields", "[web][admin]") {
  admin_endpoints_fixture f;

  for (const char *body :
       {R"({"name":42})", R"({"name":null})", R"({"name":["clinic"]})",
        R"({"name":"clinic","baseUrl":7})", R"({"name":"clinic","baseUrl":{}})",
        R"({"baseUrl":"http://node-b.example/"})", R"(["clinic"])", "not json"}) {
    CAPTURE(body);
    auto res = f.call(crow::HTTPMethod::POST, "/api/boxes", body);
    CHECK(res.code == 400);
    CHECK(error_code_of(res) == "INVALID_REQUEST");
  }
  CHECK(f.services.service->list_boxes().empty());
}

// =============================================================================
// Sending
// =============================================================================

TEST_CASE("send queues images for a box", "[web][admin][send]") {
  admin_endpoints_fixture f;
  auto target = f.services.service->generate_base_url("clinic");
  REQUIRE(target.is_ok());
  const auto send_path = "/api/boxes/" + std::to_string(target.value().id) + "/send";

  SECTION("accepted with a transaction id") {
    auto res = f.call(crow::HTTPMethod::POST, send_path, R"({"imageIds":[3,4,5]})");
    REQUIRE(res.code == 202);
    auto json = crow::json::load(res.body);
    REQUIRE(json);
    CHECK(json["transactionId"].i() > 0);
    CHECK(json["totalImageCount"].i() == 3);

    auto outbox = f.services.service->outbox_info();
    REQUIRE(outbox.size() == 3);
    for (const auto &info : outbox) {
      CHECK(info.entry.transaction_id == json["transactionId"].i());
      CHECK(info.remote_box_name == "clinic");
    }

    auto listed = crow::json::load(f.call(crow::HTTPMethod::GET, "/api/outbox").body);
    REQUIRE(listed);
    CHECK(listed["total"].i() == 3);

    auto transactions =
        crow::json::load(f.call(crow::HTTPMethod::GET, "/api/transactions").body);
    REQUIRE(transactions);
    CHECK(transactions["total"].i() == 1);
  }

  SECTION("tag values travel with the entries") {
    auto res = f.call(
        crow::HTTPMethod::POST, send_path,
        R"({"imageIds":[3],"tagValues":[{"imageId":3,"tag":1048592,"value":"ANON"}]})");
    CHECK(res.code == 202);
  }

  SECTION("an empty list answers 400") {
    auto res = f.call(crow::HTTPMethod::POST, send_path, R"({"imageIds":[]})");
    CHECK(res.code == 400);
    CHECK(f.services.service->outbox_info().empty());
  }

  SECTION("an unknown box answers 404") {
    auto res = f.call(crow::HTTPMethod::POST, "/api/boxes/999/send", R"({"imageIds":[1]})");
    CHECK(res.code == 404);
    CHECK(error_code_of(res) == "NOT_FOUND");
  }

  SECTION("malformed bodies answer 400") {
    for (const char *body :
         {"", "not json", R"({"imageIds":"1,2"})", R"({"imageIds":["1"]})",
          R"({"imageIds":[1.5]})", R"({"imageIds":[1],"tagValues":{}})",
          R"({"imageIds":[1],"tagValues":[{"imageId":1,"tag":"0010","value":"X"}]})",
          R"({"imageIds":[1],"tagValues":[{"imageId":1,"tag":1048592,"value":7}]})",
          R"({"imageIds":[1],"tagValues":[{"imageId":"1","tag":1048592,"value":"X"}]})",
          R"({"imageIds":[1],"tagValues":[{"imageId":1,"tag":-1,"value":"X"}]})",
          R"({"imageIds":[1],"tagValues":[{"imageId":1,"tag":4294967296,"value":"X"}]})"}) {
      CAPTURE(body);
      auto res = f.call(crow::HTTPMethod::POST, send_path, body);
      CHECK(res.code == 400);
      CHECK(error_code_of(res) == "INVALID_REQUEST");
    }
    CHECK(f.services.service->outbox_info().empty());
  }
}

TEST_CASE("outbox and inbox entries can be dropped", "[web][admin]") {
  admin_endpoints_fixture f;
  auto target = f.services.service->generate_base_url("clinic");
  REQUIRE(target.is_ok());
  REQUIRE(f.services.service->send_images(target.value().id, {1}).is_ok());

  auto outbox = f.services.service->outbox_info();
  REQUIRE(outbox.size() == 1);
  auto res = f.call(crow::HTTPMethod::DELETE,
                    "/api/outbox/" + std::to_string(outbox.front().entry.id));
  CHECK(res.code == 204);
  CHECK(f.services.service->outbox_info().empty());

  auto inbox = crow::json::load(f.call(crow::HTTPMethod::GET, "/api/inbox").body);
  REQUIRE(inbox);
  CHECK(inbox["total"].i() == 0);
}

TEST_CASE("admin endpoints without a box service answer 503", "[web][admin]") {
  admin_endpoints_fixture f(false);

  auto res = f.call(crow::HTTPMethod::GET, "/api/boxes");
  CHECK(res.code == 503);
  CHECK(error_code_of(res) == "SERVICE_UNAVAILABLE");

  CHECK(f.call(crow::HTTPMethod::POST, "/api/boxes", R"({"name":"clinic"})").code == 503);
  CHECK(f.call(crow::HTTPMethod::POST, "/api/boxes/1/send", R"({"imageIds":[1]})").code ==
        503);
  CHECK(f.call(crow::HTTPMethod::GET, "/api/transactions").code == 503);
}
