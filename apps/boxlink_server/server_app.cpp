/**
 * @file server_app.cpp
 * @brief boxlink server application implementation
 */

#include "server_app.hpp"

#include <boxlink/client/image_anonymizer.hpp>
#include <boxlink/codec/zlib_compressor.hpp>
#include <boxlink/di/ilogger.hpp>
#include <boxlink/integration/logger_adapter.hpp>
#include <boxlink/integration/thread_pool_adapter.hpp>
#include <boxlink/network/httplib_http_client.hpp>
#include <boxlink/storage/file_image_storage.hpp>

#include <chrono>
#include <iostream>
#include <thread>

namespace boxlink::app {

using integration::logger_adapter;

boxlink_server_app::boxlink_server_app(const boxlink_server_config& config)
    : config_(config) {}

boxlink_server_app::~boxlink_server_app() {
    stop();
    logger_adapter::shutdown();
}

// =============================================================================
// Lifecycle Management
// =============================================================================

bool boxlink_server_app::initialize() {
    if (initialized_) {
        return true;
    }

    integration::logger_config log_config;
    log_config.log_directory = config_.logging.directory;
    log_config.min_level = integration::log_level_from_string(config_.logging.level);
    log_config.enable_console = config_.logging.console;
    logger_adapter::initialize(log_config);

    if (!setup_database() || !setup_services()) {
        return false;
    }

    initialized_ = true;
    logger_adapter::info("boxlink server initialized (api base url {})",
                         config_.server.api_base_url);
    return true;
}

bool boxlink_server_app::start() {
    if (!initialized_) {
        std::cerr << "Server not initialized\n";
        return false;
    }
    if (running_) {
        return true;
    }

    if (!thread_pool_->start()) {
        logger_adapter::error("Failed to start delivery thread pool");
        return false;
    }

    service_->start();

    web::rest_server_config rest_config;
    rest_config.bind_address = config_.server.bind_address;
    rest_config.port = config_.server.port;

    rest_server_ = std::make_unique<web::rest_server>(rest_config);
    rest_server_->set_box_service(service_);
    rest_server_->start_async();

    running_ = true;
    logger_adapter::info("boxlink server listening on {}:{}",
                         config_.server.bind_address, config_.server.port);
    return true;
}

void boxlink_server_app::stop() {
    if (!running_) {
        return;
    }

    if (rest_server_) {
        rest_server_->stop();
    }
    if (service_) {
        service_->stop();
    }
    if (thread_pool_) {
        thread_pool_->shutdown(true);
    }

    running_ = false;
    logger_adapter::info("boxlink server stopped");
    logger_adapter::flush();
}

void boxlink_server_app::wait_for_shutdown() {
    while (!shutdown_requested_.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    stop();
}

void boxlink_server_app::request_shutdown() noexcept {
    shutdown_requested_ = true;
}

bool boxlink_server_app::is_running() const noexcept {
    return running_;
}

void boxlink_server_app::print_statistics() const {
    if (!service_) {
        return;
    }

    std::cout << "\n=== boxlink Statistics ===\n"
              << "Boxes:           " << service_->list_boxes().size() << "\n"
              << "Outbox entries:  " << service_->outbox_info().size() << "\n"
              << "Inbox entries:   " << service_->inbox_info().size() << "\n"
              << "Transactions:    " << service_->transactions().size() << "\n";
}

// =============================================================================
// Setup
// =============================================================================

bool boxlink_server_app::setup_database() {
    storage::database_config db_config;
    db_config.wal_mode = config_.database.wal_mode;

    auto db = storage::box_database::open(config_.database.path.string(), db_config);
    if (db.is_err()) {
        logger_adapter::error("Failed to open database {}: {}",
                              config_.database.path.string(), db.error().message);
        std::cerr << "Failed to open database: " << db.error().message << "\n";
        return false;
    }

    database_ = db.value();
    return true;
}

bool boxlink_server_app::setup_services() {
    storage::file_image_storage_config storage_config;
    storage_config.root_path = config_.storage.directory;

    integration::thread_pool_config pool_config;
    pool_config.worker_count = config_.transfer.workers;
    thread_pool_ = std::make_shared<integration::thread_pool_adapter>(pool_config);

    client::box_service_dependencies deps;
    deps.database = database_;
    deps.thread_pool = thread_pool_;
    deps.anonymizer = std::make_shared<client::passthrough_anonymizer>();
    deps.compressor = std::make_shared<codec::zlib_compressor>();
    deps.http = std::make_shared<network::httplib_http_client>();

    deps.storage = std::make_shared<storage::file_image_storage>(storage_config);

    client::box_service_config service_config;
    service_config.api_base_url = config_.server.api_base_url;
    service_config.push.poll_interval = config_.transfer.poll_interval;
    service_config.poll.poll_interval = config_.transfer.poll_interval;

    service_ = std::make_shared<client::box_service>(
        std::move(deps), service_config, std::make_shared<di::LoggerService>("box_service"));
    return true;
}

}  // namespace boxlink::app
