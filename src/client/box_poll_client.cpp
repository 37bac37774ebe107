/**
 * @file box_poll_client.cpp
 * @brief Implementation of the remote poll client
 */

#include <boxlink/client/box_poll_client.hpp>

#include <boxlink/client/inbox_manager.hpp>
#include <boxlink/codec/payload_compressor.hpp>
#include <boxlink/network/box_wire_format.hpp>
#include <boxlink/network/http_client.hpp>
#include <boxlink/storage/image_storage.hpp>

namespace boxlink::client {

namespace {

constexpr int status_ok = 200;
constexpr int status_no_content = 204;
constexpr int status_not_found = 404;

}  // namespace

// =============================================================================
// Construction / Destruction
// =============================================================================

box_poll_client::box_poll_client(box remote_box,
                                 std::shared_ptr<network::http_client> http,
                                 std::shared_ptr<codec::payload_compressor> compressor,
                                 std::shared_ptr<storage::image_storage> storage,
                                 std::shared_ptr<inbox_manager> inbox,
                                 poll_client_config config,
                                 std::shared_ptr<di::ILogger> logger)
    : box_(std::move(remote_box)),
      http_(std::move(http)),
      compressor_(std::move(compressor)),
      storage_(std::move(storage)),
      inbox_(std::move(inbox)),
      config_(config),
      logger_(logger ? std::move(logger) : di::null_logger()) {}

box_poll_client::~box_poll_client() {
    stop();
}

// =============================================================================
// Lifecycle
// =============================================================================

void box_poll_client::start() {
    if (running_.exchange(true)) {
        return;
    }

    cancelled_.store(false);
    worker_ = std::thread([this]() { run_loop(); });
    logger_->debug_fmt("Started poll client for box {}", box_.name);
}

void box_poll_client::stop() {
    cancelled_.store(true);

    if (!running_.exchange(false)) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(cv_mutex_);
        wake_requested_ = true;
    }
    cv_.notify_all();

    if (worker_.joinable()) {
        worker_.join();
    }
    logger_->debug_fmt("Stopped poll client for box {}", box_.name);
}

void box_poll_client::wake() {
    {
        std::lock_guard<std::mutex> lock(cv_mutex_);
        wake_requested_ = true;
    }
    cv_.notify_all();
}

bool box_poll_client::is_running() const noexcept {
    return running_.load();
}

const box& box_poll_client::remote_box() const {
    return box_;
}

// =============================================================================
// Cycle
// =============================================================================

poll_outcome box_poll_client::run_cycle() {
    if (cancelled_.load()) {
        return poll_outcome::cancelled;
    }

    bool expected = false;
    if (!busy_.compare_exchange_strong(expected, true)) {
        return poll_outcome::busy;
    }

    auto outcome = receive_one();
    busy_.store(false);
    return outcome;
}

poll_outcome box_poll_client::receive_one() {
    auto polled = http_->get(box_.base_url + "/outbox");
    if (polled.is_err()) {
        logger_->warn_fmt("Polling box {} failed: {}", box_.name, polled.error().message);
        return poll_outcome::failed;
    }
    if (polled.value().status_code == status_no_content) {
        return poll_outcome::no_work;
    }
    if (polled.value().status_code != status_ok) {
        logger_->warn_fmt("Polling box {} returned status {}", box_.name,
                          polled.value().status_code);
        return poll_outcome::failed;
    }

    auto entry = network::outbox_entry_from_json(polled.value().body_text());
    if (entry.is_err()) {
        logger_->warn_fmt("Box {} sent an unreadable outbox entry: {}", box_.name,
                          entry.error().message);
        return poll_outcome::failed;
    }
    const auto& e = entry.value();

    if (cancelled_.load()) {
        return poll_outcome::cancelled;
    }

    auto fetched = http_->get(entry_url(e));
    if (fetched.is_err()) {
        logger_->warn_fmt("Fetching image from box {} failed: {}", box_.name,
                          fetched.error().message);
        return poll_outcome::failed;
    }
    if (fetched.value().status_code == status_not_found) {
        logger_->debug_fmt("Entry {}/{} vanished from box {}", e.transaction_id,
                           e.sequence_number, box_.name);
        return poll_outcome::no_work;
    }
    if (fetched.value().status_code != status_ok) {
        logger_->warn_fmt("Fetching image from box {} returned status {}", box_.name,
                          fetched.value().status_code);
        return poll_outcome::failed;
    }

    auto dataset = compressor_->decompress(fetched.value().body);
    if (dataset.is_err()) {
        logger_->warn_fmt("Cannot decompress image from box {}: {}", box_.name,
                          dataset.error().message);
        return poll_outcome::failed;
    }

    if (cancelled_.load()) {
        return poll_outcome::cancelled;
    }

    auto stored = storage_->store_dataset(dataset.value());
    if (stored.is_err()) {
        logger_->warn_fmt("Cannot store image from box {}: {}", box_.name,
                          stored.error().message);
        return poll_outcome::failed;
    }

    auto recorded = inbox_->record_progress(box_, e.transaction_id, e.sequence_number,
                                            e.total_image_count);
    if (recorded.is_err()) {
        logger_->warn_fmt("Cannot record inbox progress for box {}: {}", box_.name,
                          recorded.error().message);
    }

    auto deleted = http_->del(entry_url(e));
    if (deleted.is_err() || !deleted.value().is_success()) {
        logger_->warn_fmt("Cannot confirm entry {}/{} on box {}", e.transaction_id,
                          e.sequence_number, box_.name);
        return poll_outcome::failed;
    }

    return poll_outcome::received;
}

std::string box_poll_client::entry_url(const outbox_entry& entry) const {
    return box_.base_url + "/outbox/" + std::to_string(entry.transaction_id) + "/" +
           std::to_string(entry.sequence_number);
}

void box_poll_client::run_loop() {
    while (running_.load()) {
        auto outcome = run_cycle();
        if (outcome == poll_outcome::cancelled) {
            break;
        }
        if (outcome == poll_outcome::received) {
            continue;
        }

        std::unique_lock<std::mutex> lock(cv_mutex_);
        cv_.wait_for(lock, config_.poll_interval,
                     [this] { return !running_.load() || wake_requested_; });
        wake_requested_ = false;
    }
}

}  // namespace boxlink::client
