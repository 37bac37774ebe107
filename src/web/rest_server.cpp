/**
 * @file rest_server.cpp
 * @brief Crow application setup and server lifecycle
 */

// Crow must come first; it conflicts with forward declarations otherwise
#include "crow.h"

#include "boxlink/client/box_service.hpp"
#include "boxlink/integration/logger_adapter.hpp"
#include "boxlink/web/endpoints/admin_endpoints.hpp"
#include "boxlink/web/endpoints/box_endpoints.hpp"
#include "boxlink/web/rest_config.hpp"
#include "boxlink/web/rest_server.hpp"
#include "boxlink/web/rest_types.hpp"

#include <algorithm>
#include <atomic>
#include <mutex>
#include <thread>

namespace boxlink::web {

namespace endpoints {
void register_box_endpoints_impl(crow::SimpleApp &app,
                                 std::shared_ptr<rest_server_context> ctx);
void register_admin_endpoints_impl(crow::SimpleApp &app,
                                   std::shared_ptr<rest_server_context> ctx);
} // namespace endpoints

using integration::logger_adapter;

namespace {

void add_cors_preflight(crow::SimpleApp &app, const std::string &origins) {
  CROW_ROUTE(app, "/api/<path>")
      .methods(crow::HTTPMethod::OPTIONS)(
          [origins](const crow::request & /*req*/,
                    const std::string & /*path*/) {
            crow::response res(204);
            res.add_header("Access-Control-Allow-Origin", origins);
            res.add_header("Access-Control-Allow-Methods",
                           "GET, POST, DELETE, OPTIONS");
            res.add_header("Access-Control-Allow-Headers", "Content-Type");
            res.add_header("Access-Control-Max-Age", "86400");
            return res;
          });
}

void add_not_found_handler(crow::SimpleApp &app) {
  CROW_CATCHALL_ROUTE(app)([](const crow::request &req) {
    crow::response res(404);
    res.add_header("Content-Type", "application/json");
    res.body = make_error_json("NOT_FOUND", "No route for " + req.url);
    return res;
  });
}

} // namespace

struct rest_server::impl {
  rest_server_config config;
  std::shared_ptr<rest_server_context> context =
      std::make_shared<rest_server_context>();
  std::unique_ptr<crow::SimpleApp> app;
  std::thread server_thread;
  std::atomic<bool> running{false};
  std::atomic<std::uint16_t> bound_port{0};
  std::mutex mutex;

  impl() { context->config = &config; }

  explicit impl(const rest_server_config &cfg) : config(cfg) {
    context->config = &config;
  }

  void prepare() {
    app = std::make_unique<crow::SimpleApp>();
    endpoints::register_box_endpoints_impl(*app, context);
    endpoints::register_admin_endpoints_impl(*app, context);
    if (config.enable_cors) {
      add_cors_preflight(*app, config.cors_allowed_origins);
    }
    add_not_found_handler(*app);

    // Crow's idle timeout is a single byte
    const auto timeout = static_cast<std::uint8_t>(
        std::min<std::uint32_t>(config.request_timeout_seconds, 255));
    app->bindaddr(config.bind_address)
        .port(config.port)
        .concurrency(static_cast<std::uint16_t>(std::max<std::size_t>(
            config.concurrency, 1)))
        .timeout(timeout);
  }

  void serve() {
    logger_adapter::info("REST server starting on {}:{}", config.bind_address,
                         config.port);
    app->run();
    bound_port = 0;
    running = false;
    logger_adapter::info("REST server stopped");
  }
};

rest_server::rest_server() : impl_(std::make_unique<impl>()) {}

rest_server::rest_server(const rest_server_config &config)
    : impl_(std::make_unique<impl>(config)) {}

rest_server::~rest_server() {
  if (impl_) {
    stop();
  }
}

rest_server::rest_server(rest_server &&other) noexcept = default;
rest_server &rest_server::operator=(rest_server &&other) noexcept = default;

const rest_server_config &rest_server::config() const noexcept {
  return impl_->config;
}

void rest_server::set_config(const rest_server_config &config) {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  impl_->config = config;
}

void rest_server::set_box_service(
    std::shared_ptr<client::box_service> service) {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  impl_->context->box_service = std::move(service);
}

void rest_server::start() {
  if (impl_->running.exchange(true)) {
    return;
  }
  impl_->prepare();
  impl_->bound_port = impl_->config.port;
  impl_->serve();
}

void rest_server::start_async() {
  if (impl_->running.exchange(true)) {
    return;
  }
  impl_->prepare();
  impl_->server_thread = std::thread([this]() { impl_->serve(); });

  impl_->app->wait_for_server_start();
  impl_->bound_port = impl_->app->port();
}

void rest_server::stop() {
  if (impl_->app) {
    impl_->app->stop();
  }
  if (impl_->server_thread.joinable()) {
    impl_->server_thread.join();
  }
  impl_->running = false;
  impl_->bound_port = 0;
}

bool rest_server::is_running() const noexcept { return impl_->running; }

void rest_server::wait() {
  if (impl_->server_thread.joinable()) {
    impl_->server_thread.join();
  }
}

std::uint16_t rest_server::port() const noexcept {
  return impl_->running ? impl_->bound_port.load() : 0;
}

} // namespace boxlink::web
