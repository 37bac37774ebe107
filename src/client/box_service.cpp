/**
 * @file box_service.cpp
 * @brief Implementation of the box Coordinator
 */

#include <boxlink/client/box_service.hpp>

#include <boxlink/client/image_anonymizer.hpp>
#include <boxlink/client/inbox_manager.hpp>
#include <boxlink/client/outbox_manager.hpp>
#include <boxlink/client/poll_service.hpp>
#include <boxlink/client/transfer_payload_builder.hpp>
#include <boxlink/integration/logger_adapter.hpp>
#include <boxlink/storage/box_database.hpp>
#include <boxlink/storage/box_repository.hpp>
#include <boxlink/storage/inbox_repository.hpp>
#include <boxlink/storage/outbox_repository.hpp>

#include <array>
#include <cctype>

namespace boxlink::client {

namespace {

constexpr const char* module_name = "box_service";

constexpr std::size_t uuid_length = 36;

}  // namespace

// =============================================================================
// Construction / Destruction
// =============================================================================

box_service::box_service(box_service_dependencies deps,
                         box_service_config config,
                         std::shared_ptr<di::ILogger> logger)
    : deps_(std::move(deps)),
      config_(std::move(config)),
      logger_(logger ? std::move(logger) : di::null_logger()),
      token_rng_(std::random_device{}()) {
    boxes_ = std::make_shared<storage::box_repository>(deps_.database);
    outbox_repo_ = std::make_shared<storage::outbox_repository>(deps_.database);
    inbox_repo_ = std::make_shared<storage::inbox_repository>(deps_.database);

    outbox_ = std::make_shared<outbox_manager>(deps_.database, boxes_, outbox_repo_,
                                               logger_);
    inbox_ = std::make_shared<inbox_manager>(deps_.database, inbox_repo_, logger_);
    liveness_ = std::make_shared<liveness_tracker>(boxes_, config_.liveness, logger_);
    payloads_ = std::make_shared<transfer_payload_builder>(
        deps_.storage, deps_.anonymizer, deps_.compressor, outbox_repo_);
    poll_service_ = std::make_shared<poll_service>(boxes_, outbox_, inbox_, liveness_,
                                                   payloads_, deps_.storage,
                                                   deps_.compressor, logger_);

    for (const auto& b : boxes_->find_by_method(send_method::poll)) {
        liveness_->track(b.id);
    }
}

box_service::~box_service() {
    stop();
}

// =============================================================================
// Lifecycle
// =============================================================================

void box_service::start() {
    if (running_.exchange(true)) {
        return;
    }

    for (const auto& b : boxes_->find_by_method(send_method::push)) {
        start_workers(b);
    }
    liveness_->start();

    logger_->info_fmt("Box service started with {} boxes", boxes_->count());
}

void box_service::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    liveness_->stop();

    std::map<std::int64_t, box_workers> stopping;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        stopping.swap(workers_);
    }
    for (auto& [id, w] : stopping) {
        w.push->stop();
        w.poll->stop();
    }

    logger_->info("Box service stopped");
}

bool box_service::is_running() const noexcept {
    return running_.load();
}

// =============================================================================
// Box Registry
// =============================================================================

Result<box> box_service::generate_base_url(std::string_view name) {
    if (name.empty()) {
        return make_error<box>(error_codes::invalid_box_name, "Box name cannot be empty",
                               module_name);
    }

    box b;
    b.name = std::string(name);
    b.token = generate_token();
    b.base_url = config_.api_base_url + "/box/" + b.token;
    b.method = send_method::poll;
    b.online = false;

    auto inserted = boxes_->insert(b);
    if (inserted.is_err()) {
        return Result<box>(inserted.error());
    }
    b.id = inserted.value();

    liveness_->track(b.id);

    logger_->info_fmt("Generated base URL {} for box {}", b.base_url, b.name);
    integration::logger_adapter::log_box_registration(b.name, to_string(b.method), true);
    return ok(std::move(b));
}

Result<box> box_service::add_remote_box(std::string_view name, std::string_view base_url) {
    if (name.empty()) {
        return make_error<box>(error_codes::invalid_box_name, "Box name cannot be empty",
                               module_name);
    }

    std::string url(base_url);
    if (!url.empty() && url.back() == '/') {
        url.pop_back();
    }

    auto token = extract_token(url);
    if (token.is_err()) {
        return Result<box>(token.error());
    }

    if (auto existing = boxes_->find_by_base_url(url, send_method::push)) {
        if (running_.load()) {
            start_workers(*existing);
        }
        return ok(*existing);
    }

    box b;
    b.name = std::string(name);
    b.token = token.value();
    b.base_url = url;
    b.method = send_method::push;
    b.online = false;

    auto inserted = boxes_->insert(b);
    if (inserted.is_err()) {
        return Result<box>(inserted.error());
    }
    b.id = inserted.value();

    if (running_.load()) {
        start_workers(b);
    }

    logger_->info_fmt("Added remote box {} at {}", b.name, b.base_url);
    integration::logger_adapter::log_box_registration(b.name, to_string(b.method), true);
    return ok(std::move(b));
}

VoidResult box_service::remove_box(std::int64_t box_id) {
    auto b = boxes_->find_by_id(box_id);
    if (!b) {
        return boxlink_void_error(error_codes::box_not_found,
                                  "Unknown box id " + std::to_string(box_id));
    }

    stop_workers(box_id);
    liveness_->untrack(box_id);

    auto removed = boxes_->remove(box_id);
    if (removed.is_err()) {
        return removed;
    }

    logger_->info_fmt("Removed box {}", b->name);
    integration::logger_adapter::log_box_registration(b->name, to_string(b->method), false);
    return ok();
}

std::vector<box> box_service::list_boxes() const {
    return boxes_->find_all();
}

std::optional<box> box_service::get_box(std::int64_t box_id) const {
    return boxes_->find_by_id(box_id);
}

// =============================================================================
// Transfers
// =============================================================================

Result<std::int64_t> box_service::send_images(std::int64_t box_id,
                                              const std::vector<std::int64_t>& image_ids,
                                              const std::vector<outbox_tag_value>& tag_values) {
    auto transaction_id = outbox_->enqueue_transfer(box_id, image_ids, tag_values);
    if (transaction_id.is_err()) {
        return transaction_id;
    }

    std::lock_guard<std::mutex> lock(workers_mutex_);
    auto it = workers_.find(box_id);
    if (it != workers_.end()) {
        it->second.push->wake();
    }
    return transaction_id;
}

std::vector<outbox_entry_info> box_service::outbox_info() const {
    std::vector<outbox_entry_info> result;
    for (auto& entry : outbox_->list_entries()) {
        auto name = box_display_name(entry.remote_box_id);
        result.push_back({std::move(entry), std::move(name)});
    }
    return result;
}

std::vector<inbox_entry_info> box_service::inbox_info() const {
    std::vector<inbox_entry_info> result;
    for (auto& entry : inbox_->list_entries()) {
        auto name = box_display_name(entry.remote_box_id);
        result.push_back({std::move(entry), std::move(name)});
    }
    return result;
}

std::vector<outbox_transaction_summary> box_service::transactions() const {
    return outbox_->transactions();
}

VoidResult box_service::remove_outbox_entry(std::int64_t id) {
    return outbox_->remove_entry(id);
}

VoidResult box_service::remove_inbox_entry(std::int64_t id) {
    return inbox_->remove_entry(id);
}

VoidResult box_service::retry_transaction(std::int64_t box_id, std::int64_t transaction_id) {
    auto result = outbox_->retry_transaction(box_id, transaction_id);
    if (result.is_err()) {
        return result;
    }

    std::lock_guard<std::mutex> lock(workers_mutex_);
    auto it = workers_.find(box_id);
    if (it != workers_.end()) {
        it->second.push->wake();
    }
    return result;
}

// =============================================================================
// Components
// =============================================================================

std::shared_ptr<poll_service> box_service::poll_endpoint() const {
    return poll_service_;
}

std::shared_ptr<outbox_manager> box_service::outbox() const {
    return outbox_;
}

std::shared_ptr<inbox_manager> box_service::inbox() const {
    return inbox_;
}

std::shared_ptr<liveness_tracker> box_service::liveness() const {
    return liveness_;
}

bool box_service::has_workers(std::int64_t box_id) const {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    return workers_.count(box_id) > 0;
}

// =============================================================================
// Callbacks
// =============================================================================

void box_service::set_transfer_callback(transfer_callback callback) {
    outbox_->set_transfer_callback(std::move(callback));
}

void box_service::set_receive_callback(transfer_callback callback) {
    inbox_->set_receive_callback(std::move(callback));
}

void box_service::set_status_callback(box_status_callback callback) {
    liveness_->set_status_callback(std::move(callback));
}

// =============================================================================
// Tokens
// =============================================================================

std::string box_service::generate_token() {
    std::array<std::uint8_t, 16> bytes{};
    {
        std::lock_guard<std::mutex> lock(token_mutex_);
        for (std::size_t i = 0; i < bytes.size(); i += 8) {
            auto value = token_rng_();
            for (std::size_t j = 0; j < 8; ++j) {
                bytes[i + j] = static_cast<std::uint8_t>(value >> (8 * j));
            }
        }
    }

    bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0x0F) | 0x40);  // version 4
    bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0x3F) | 0x80);  // RFC 4122 variant

    static constexpr char hex[] = "0123456789abcdef";
    std::string token;
    token.reserve(uuid_length);
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            token.push_back('-');
        }
        token.push_back(hex[bytes[i] >> 4]);
        token.push_back(hex[bytes[i] & 0x0F]);
    }
    return token;
}

bool box_service::is_valid_token(std::string_view token) {
    if (token.size() != uuid_length) {
        return false;
    }
    for (std::size_t i = 0; i < token.size(); ++i) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (token[i] != '-') {
                return false;
            }
        } else if (!std::isxdigit(static_cast<unsigned char>(token[i]))) {
            return false;
        }
    }
    return true;
}

Result<std::string> box_service::extract_token(std::string_view base_url) {
    if (!base_url.empty() && base_url.back() == '/') {
        base_url.remove_suffix(1);
    }

    auto slash = base_url.rfind('/');
    auto token = slash == std::string_view::npos ? base_url : base_url.substr(slash + 1);

    if (!is_valid_token(token)) {
        return make_error<std::string>(
            error_codes::malformed_base_url,
            "Base URL must end with a UUID token: " + std::string(base_url),
            module_name);
    }
    return ok(std::string(token));
}

// =============================================================================
// Private Helpers
// =============================================================================

void box_service::start_workers(const box& b) {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    if (workers_.count(b.id) > 0) {
        return;
    }

    box_workers w;
    w.push = std::make_unique<box_push_engine>(b, outbox_, payloads_, deps_.http,
                                               deps_.thread_pool, config_.push, logger_);
    w.poll = std::make_unique<box_poll_client>(b, deps_.http, deps_.compressor,
                                               deps_.storage, inbox_, config_.poll,
                                               logger_);
    w.push->start();
    w.poll->start();

    workers_.emplace(b.id, std::move(w));
}

void box_service::stop_workers(std::int64_t box_id) {
    box_workers w;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        auto it = workers_.find(box_id);
        if (it == workers_.end()) {
            return;
        }
        w = std::move(it->second);
        workers_.erase(it);
    }

    w.push->stop();
    w.poll->stop();
}

std::string box_service::box_display_name(std::int64_t box_id) const {
    auto b = boxes_->find_by_id(box_id);
    return b ? b->name : std::to_string(box_id);
}

}  // namespace boxlink::client
