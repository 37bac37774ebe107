/**
 * @file box_push_engine.cpp
 * @brief Implementation of the Push Delivery Engine
 */

#include <boxlink/client/box_push_engine.hpp>

#include <boxlink/client/outbox_manager.hpp>
#include <boxlink/client/transfer_payload_builder.hpp>
#include <boxlink/core/events.hpp>
#include <boxlink/integration/logger_adapter.hpp>
#include <boxlink/integration/thread_pool_interface.hpp>
#include <boxlink/network/box_wire_format.hpp>
#include <boxlink/network/http_client.hpp>

#include <kcenon/common/patterns/event_bus.h>

#include <algorithm>
#include <exception>
#include <optional>

namespace boxlink::client {

namespace {

/// Granularity at which a waiting engine notices stop()
constexpr std::chrono::milliseconds cancel_check_interval{50};

constexpr int status_bad_request = 400;
constexpr int status_internal_error = 500;

/**
 * @brief Build and POST one entry; never throws
 *
 * Nothing is posted once the engine has stopped or given up on the attempt.
 */
delivery_result perform_send(const outbox_entry& entry,
                             const std::string& url,
                             const transfer_payload_builder& payloads,
                             network::http_client& http,
                             const std::atomic<bool>& cancelled,
                             const std::atomic<bool>& abandoned) {
    try {
        auto payload = payloads.build(entry);
        if (payload.is_err()) {
            const auto& err = payload.error();
            if (err.code == error_codes::dataset_not_found) {
                return {status_bad_request, err.message};
            }
            return {status_internal_error, err.message};
        }

        if (cancelled.load() || abandoned.load()) {
            return {status_internal_error, "abandoned before sending"};
        }

        auto response = http.post(url, payload.value(), "application/octet-stream");
        if (response.is_err()) {
            return {status_internal_error, response.error().message};
        }

        const auto& r = response.value();
        return {r.status_code, r.is_success() ? std::string{} : r.body_text()};
    } catch (const std::exception& e) {
        return {status_internal_error, e.what()};
    } catch (...) {
        return {status_internal_error, "unknown error while sending"};
    }
}

}  // namespace

/**
 * @brief Result slot shared between the engine and one pool job
 *
 * result is set exactly once, when the job returns (or when the pool
 * refused it). abandoned is set by the engine on timeout or stop().
 */
struct box_push_engine::attempt {
    std::mutex mutex;
    std::condition_variable cv;
    std::optional<delivery_result> result;
    std::atomic<bool> abandoned{false};

    bool finished() {
        std::lock_guard<std::mutex> lock(mutex);
        return result.has_value();
    }
};

// =============================================================================
// Construction / Destruction
// =============================================================================

box_push_engine::box_push_engine(box remote_box,
                                 std::shared_ptr<outbox_manager> outbox,
                                 std::shared_ptr<transfer_payload_builder> payloads,
                                 std::shared_ptr<network::http_client> http,
                                 std::shared_ptr<integration::thread_pool_interface> pool,
                                 push_engine_config config,
                                 std::shared_ptr<di::ILogger> logger)
    : box_(std::move(remote_box)),
      outbox_(std::move(outbox)),
      payloads_(std::move(payloads)),
      http_(std::move(http)),
      pool_(std::move(pool)),
      config_(config),
      logger_(logger ? std::move(logger) : di::null_logger()),
      cancelled_(std::make_shared<std::atomic<bool>>(false)) {}

box_push_engine::~box_push_engine() {
    stop();
}

// =============================================================================
// Lifecycle
// =============================================================================

void box_push_engine::start() {
    if (running_.exchange(true)) {
        return;
    }

    cancelled_ = std::make_shared<std::atomic<bool>>(false);
    worker_ = std::thread([this]() { run_loop(); });

    logger_->debug_fmt("Started push engine for box {}", box_.name);
}

void box_push_engine::stop() {
    cancelled_->store(true);

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

    logger_->debug_fmt("Stopped push engine for box {}", box_.name);
}

void box_push_engine::wake() {
    {
        std::lock_guard<std::mutex> lock(cv_mutex_);
        wake_requested_ = true;
    }
    cv_.notify_all();
}

push_state box_push_engine::state() const noexcept {
    return state_.load();
}

bool box_push_engine::is_running() const noexcept {
    return running_.load();
}

const box& box_push_engine::remote_box() const {
    return box_;
}

std::size_t box_push_engine::attempt_count() const noexcept {
    return attempts_.load();
}

// =============================================================================
// State Machine
// =============================================================================

push_outcome box_push_engine::run_cycle() {
    auto cancelled = cancelled_;
    if (cancelled->load()) {
        return push_outcome::cancelled;
    }

    auto expected = push_state::idle;
    if (!state_.compare_exchange_strong(expected, push_state::sending)) {
        return push_outcome::busy;
    }

    // An abandoned job may still be talking to the peer
    if (abandoned_ && !abandoned_->finished()) {
        state_.store(push_state::idle);
        logger_->debug_fmt("Previous send to box {} still outstanding", box_.name);
        return push_outcome::busy;
    }
    abandoned_.reset();

    auto entry = outbox_->next_pending_entry(box_.id);
    if (!entry) {
        state_.store(push_state::idle);
        return push_outcome::no_work;
    }

    logger_->debug_fmt("Sending image {} ({}/{}) of transaction {} to box {}",
                       entry->image_id, entry->sequence_number,
                       entry->total_image_count, entry->transaction_id, box_.name);

    auto slot = std::make_shared<attempt>();
    auto job = [slot, cancelled, e = *entry, url = image_url(*entry),
                payloads = payloads_, http = http_]() {
        auto result = perform_send(e, url, *payloads, *http, *cancelled, slot->abandoned);
        {
            std::lock_guard<std::mutex> lock(slot->mutex);
            slot->result = std::move(result);
        }
        slot->cv.notify_all();
    };

    try {
        (void)pool_->submit(std::move(job));
    } catch (const std::exception& e) {
        std::lock_guard<std::mutex> lock(slot->mutex);
        slot->result = delivery_result{status_internal_error, e.what()};
    }

    std::optional<delivery_result> result;
    bool was_cancelled = false;
    {
        std::unique_lock<std::mutex> lock(slot->mutex);
        auto deadline = std::chrono::steady_clock::now() + config_.receive_timeout;
        while (!slot->result) {
            if (cancelled->load()) {
                was_cancelled = true;
                break;
            }
            auto now = std::chrono::steady_clock::now();
            if (now >= deadline) {
                break;
            }
            slot->cv.wait_until(lock, std::min(deadline, now + cancel_check_interval));
        }
        result = slot->result;
    }

    if (was_cancelled || cancelled->load()) {
        slot->abandoned.store(true);
        abandoned_ = slot;
        state_.store(push_state::idle);
        return push_outcome::cancelled;
    }

    if (!result) {
        slot->abandoned.store(true);
        abandoned_ = slot;
        logger_->error_fmt(
            "Timed out sending image {} of transaction {} to box {}",
            entry->image_id, entry->transaction_id, box_.name);
        state_.store(push_state::idle);
        return push_outcome::timed_out;
    }

    ++attempts_;
    auto outcome = apply_result(*entry, *result);
    state_.store(push_state::idle);
    return outcome;
}

push_outcome box_push_engine::apply_result(const outbox_entry& entry,
                                           const delivery_result& result) {
    if (result.status_code >= 200 && result.status_code < 300) {
        auto ack = outbox_->acknowledge_delivered(entry);
        if (ack.is_err()) {
            logger_->error_fmt("Failed to acknowledge delivery to box {}: {}",
                               box_.name, ack.error().message);
            return push_outcome::soft_failed;
        }
        return push_outcome::delivered;
    }

    if (result.status_code >= status_internal_error) {
        logger_->debug_fmt("Box {} unavailable ({}), transaction {} waiting",
                           box_.name, result.status_code, entry.transaction_id);
        auto marked = outbox_->mark_transaction_waiting(entry.remote_box_id,
                                                        entry.transaction_id);
        if (marked.is_err()) {
            logger_->warn_fmt("Failed to mark transaction {} waiting: {}",
                              entry.transaction_id, marked.error().message);
        }
        return push_outcome::soft_failed;
    }

    logger_->error_fmt("Cannot send file to box {}: {}", box_.name, result.message);
    auto marked = outbox_->mark_transaction_failed(entry.remote_box_id,
                                                   entry.transaction_id);
    if (marked.is_err()) {
        logger_->warn_fmt("Failed to mark transaction {} failed: {}",
                          entry.transaction_id, marked.error().message);
    }

    integration::logger_adapter::log_send_failed(box_.name, entry.transaction_id,
                                                  result.status_code, result.message);
    kcenon::common::get_event_bus().publish(events::peer_send_failed_event{
        box_.id, box_.name, entry.transaction_id, result.status_code, result.message});

    return push_outcome::hard_failed;
}

std::string box_push_engine::image_url(const outbox_entry& entry) const {
    network::transfer_parameters params{entry.transaction_id, entry.sequence_number,
                                        entry.total_image_count};
    return box_.base_url + "/image?" + network::to_query_string(params);
}

void box_push_engine::run_loop() {
    while (running_.load()) {
        auto outcome = run_cycle();
        if (outcome == push_outcome::cancelled) {
            break;
        }
        if (outcome == push_outcome::delivered) {
            continue;
        }

        std::unique_lock<std::mutex> lock(cv_mutex_);
        cv_.wait_for(lock, config_.poll_interval,
                     [this] { return !running_.load() || wake_requested_; });
        wake_requested_ = false;
    }
}

}  // namespace boxlink::client
