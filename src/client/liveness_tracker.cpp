/**
 * @file liveness_tracker.cpp
 * @brief Implementation of the Liveness Tracker
 */

#include <boxlink/client/liveness_tracker.hpp>

#include <boxlink/core/events.hpp>
#include <boxlink/storage/box_repository.hpp>

#include <kcenon/common/patterns/event_bus.h>

#include <vector>

namespace boxlink::client {

// =============================================================================
// Construction / Destruction
// =============================================================================

liveness_tracker::liveness_tracker(std::shared_ptr<storage::box_repository> boxes,
                                   liveness_config config,
                                   std::shared_ptr<di::ILogger> logger)
    : boxes_(std::move(boxes)),
      config_(config),
      logger_(logger ? std::move(logger) : di::null_logger()) {}

liveness_tracker::~liveness_tracker() {
    stop();
}

// =============================================================================
// Contact Map
// =============================================================================

void liveness_tracker::track(std::int64_t box_id) {
    std::lock_guard<std::mutex> lock(contact_mutex_);
    last_contact_.emplace(box_id, clock::time_point{});
}

void liveness_tracker::untrack(std::int64_t box_id) {
    std::lock_guard<std::mutex> lock(contact_mutex_);
    last_contact_.erase(box_id);
}

void liveness_tracker::record_contact(std::int64_t box_id, clock::time_point when) {
    std::lock_guard<std::mutex> lock(contact_mutex_);
    last_contact_[box_id] = when;
}

std::optional<liveness_tracker::clock::time_point> liveness_tracker::last_contact(
    std::int64_t box_id) const {
    std::lock_guard<std::mutex> lock(contact_mutex_);
    auto it = last_contact_.find(box_id);
    if (it == last_contact_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::size_t liveness_tracker::tracked_count() const {
    std::lock_guard<std::mutex> lock(contact_mutex_);
    return last_contact_.size();
}

// =============================================================================
// Sweep
// =============================================================================

std::size_t liveness_tracker::sweep(clock::time_point now) {
    std::vector<std::pair<std::int64_t, clock::time_point>> snapshot;
    {
        std::lock_guard<std::mutex> lock(contact_mutex_);
        snapshot.assign(last_contact_.begin(), last_contact_.end());
    }

    std::size_t changed = 0;
    for (const auto& [box_id, last] : snapshot) {
        auto b = boxes_->find_by_id(box_id);
        if (!b || b->method != send_method::poll) {
            continue;
        }

        const bool online = (now - last) < config_.online_threshold;
        if (online == b->online) {
            continue;
        }

        auto result = boxes_->update_online(box_id, online);
        if (result.is_err()) {
            logger_->warn_fmt("Failed to update online status of box {}: {}",
                              b->name, result.error().message);
            continue;
        }

        ++changed;
        logger_->info_fmt("Box {} is now {}", b->name, online ? "online" : "offline");

        kcenon::common::get_event_bus().publish(
            events::box_status_changed_event{box_id, online});

        std::lock_guard<std::mutex> lock(callback_mutex_);
        if (status_callback_) {
            status_callback_(box_id, online);
        }
    }

    return changed;
}

// =============================================================================
// Scheduler
// =============================================================================

void liveness_tracker::start() {
    if (running_.exchange(true)) {
        return;
    }

    worker_ = std::thread([this]() { run_loop(); });
    logger_->debug("Started liveness tracker");
}

void liveness_tracker::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(cv_mutex_);
    }
    cv_.notify_all();

    if (worker_.joinable()) {
        worker_.join();
    }
    logger_->debug("Stopped liveness tracker");
}

bool liveness_tracker::is_running() const noexcept {
    return running_.load();
}

void liveness_tracker::set_status_callback(box_status_callback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    status_callback_ = std::move(callback);
}

void liveness_tracker::run_loop() {
    auto wait = config_.initial_delay;
    while (running_.load()) {
        {
            std::unique_lock<std::mutex> lock(cv_mutex_);
            cv_.wait_for(lock, wait, [this] { return !running_.load(); });
        }
        if (!running_.load()) {
            break;
        }

        sweep();
        wait = config_.interval;
    }
}

}  // namespace boxlink::client
