/**
 * @file outbox_manager.cpp
 * @brief Implementation of the Outbox Manager
 */

#include <boxlink/client/outbox_manager.hpp>

#include <boxlink/core/events.hpp>
#include <boxlink/integration/logger_adapter.hpp>
#include <boxlink/storage/box_database.hpp>
#include <boxlink/storage/box_repository.hpp>
#include <boxlink/storage/outbox_repository.hpp>

#include <kcenon/common/patterns/event_bus.h>

#include <algorithm>
#include <iterator>
#include <limits>
#include <string>

namespace boxlink::client {

namespace {

constexpr const char* module_name = "outbox_manager";

}  // namespace

// =============================================================================
// Construction / Destruction
// =============================================================================

outbox_manager::outbox_manager(std::shared_ptr<storage::box_database> db,
                               std::shared_ptr<storage::box_repository> boxes,
                               std::shared_ptr<storage::outbox_repository> outbox,
                               std::shared_ptr<di::ILogger> logger)
    : db_(std::move(db)),
      boxes_(std::move(boxes)),
      outbox_(std::move(outbox)),
      logger_(logger ? std::move(logger) : di::null_logger()),
      rng_(std::random_device{}()) {}

outbox_manager::~outbox_manager() = default;

// =============================================================================
// Enqueue / Dequeue
// =============================================================================

Result<std::int64_t> outbox_manager::enqueue_transfer(
    std::int64_t remote_box_id,
    const std::vector<std::int64_t>& image_ids,
    const std::vector<outbox_tag_value>& tag_values) {
    if (image_ids.empty()) {
        return make_error<std::int64_t>(error_codes::empty_transfer,
                                        "No images to send", module_name);
    }

    if (!boxes_->find_by_id(remote_box_id)) {
        return make_error<std::int64_t>(
            error_codes::box_not_found,
            "Unknown box id " + std::to_string(remote_box_id), module_name);
    }

    const auto transaction_id = next_transaction_id();
    const auto total = static_cast<std::int64_t>(image_ids.size());

    auto result = db_->with_transaction([&]() -> VoidResult {
        std::int64_t sequence = 1;
        for (auto image_id : image_ids) {
            outbox_entry entry;
            entry.remote_box_id = remote_box_id;
            entry.transaction_id = transaction_id;
            entry.sequence_number = sequence++;
            entry.total_image_count = total;
            entry.image_id = image_id;
            entry.status = transaction_status::pending;

            auto inserted = outbox_->insert(entry);
            if (inserted.is_err()) {
                return VoidResult(inserted.error());
            }
        }

        for (auto value : tag_values) {
            value.remote_box_id = remote_box_id;
            value.transaction_id = transaction_id;
            auto inserted = outbox_->insert_tag_value(value);
            if (inserted.is_err()) {
                return inserted;
            }
        }
        return ok();
    });

    if (result.is_err()) {
        logger_->error_fmt("Failed to queue {} images for box {}: {}",
                           total, remote_box_id, result.error().message);
        return Result<std::int64_t>(result.error());
    }

    logger_->info_fmt("Queued transaction {} with {} images for box {}",
                      transaction_id, total, remote_box_id);
    return ok(transaction_id);
}

std::optional<outbox_entry> outbox_manager::next_pending_entry(
    std::int64_t remote_box_id) const {
    return outbox_->find_next_pending(remote_box_id);
}

VoidResult outbox_manager::acknowledge_delivered(const outbox_entry& entry) {
    bool completed = false;
    std::int64_t total_image_count = 0;
    {
        // Serializes concurrent acknowledgements so a completion fires once
        auto guard = db_->lock();

        auto current = outbox_->find_by_transaction_and_sequence(
            entry.remote_box_id, entry.transaction_id, entry.sequence_number);
        if (!current) {
            return ok();
        }

        auto removed = outbox_->remove(current->id);
        if (removed.is_err()) {
            return removed;
        }

        if (current->is_last()) {
            completed = true;
            total_image_count = current->total_image_count;
            auto purged = outbox_->remove_tag_values(entry.remote_box_id,
                                                     entry.transaction_id);
            if (purged.is_err()) {
                logger_->warn_fmt("Failed to purge tag values of transaction {}: {}",
                                  entry.transaction_id, purged.error().message);
            }
        } else if (current->status == transaction_status::waiting) {
            auto reset = outbox_->update_transaction_status(
                entry.remote_box_id, entry.transaction_id, transaction_status::pending);
            if (reset.is_err()) {
                return reset;
            }
        }
    }

    if (completed) {
        publish_completion(entry.remote_box_id, entry.transaction_id, total_image_count);
    }
    return ok();
}

// =============================================================================
// Transaction Status
// =============================================================================

VoidResult outbox_manager::mark_transaction_waiting(std::int64_t remote_box_id,
                                                    std::int64_t transaction_id) {
    return outbox_->update_transaction_status(remote_box_id, transaction_id,
                                              transaction_status::waiting);
}

VoidResult outbox_manager::mark_transaction_failed(std::int64_t remote_box_id,
                                                   std::int64_t transaction_id) {
    return outbox_->update_transaction_status(remote_box_id, transaction_id,
                                              transaction_status::failed);
}

VoidResult outbox_manager::retry_transaction(std::int64_t remote_box_id,
                                             std::int64_t transaction_id) {
    auto guard = db_->lock();

    if (outbox_->find_by_transaction(remote_box_id, transaction_id).empty()) {
        return boxlink_void_error(
            error_codes::outbox_entry_not_found,
            "No outbox entries for transaction " + std::to_string(transaction_id));
    }

    auto result = outbox_->update_transaction_status(remote_box_id, transaction_id,
                                                     transaction_status::pending);
    if (result.is_ok()) {
        logger_->info_fmt("Transaction {} for box {} reset for retry",
                          transaction_id, remote_box_id);
    }
    return result;
}

std::optional<transaction_status> outbox_manager::get_transaction_status(
    std::int64_t remote_box_id, std::int64_t transaction_id) const {
    auto entries = outbox_->find_by_transaction(remote_box_id, transaction_id);
    if (entries.empty()) {
        return std::nullopt;
    }
    return entries.front().status;
}

// =============================================================================
// Accessors
// =============================================================================

VoidResult outbox_manager::remove_entry(std::int64_t id) {
    return outbox_->remove(id);
}

std::vector<outbox_entry> outbox_manager::list_entries() const {
    return outbox_->find_all();
}

std::optional<outbox_entry> outbox_manager::entry_by_transaction_and_sequence(
    std::int64_t remote_box_id,
    std::int64_t transaction_id,
    std::int64_t sequence_number) const {
    return outbox_->find_by_transaction_and_sequence(remote_box_id, transaction_id,
                                                     sequence_number);
}

std::vector<outbox_tag_value> outbox_manager::tag_values(std::int64_t transaction_id,
                                                         std::int64_t image_id) const {
    return outbox_->find_tag_values(transaction_id, image_id);
}

std::vector<outbox_transaction_summary> outbox_manager::transactions() const {
    std::vector<outbox_transaction_summary> result;

    for (const auto& entry : outbox_->find_all()) {
        auto it = std::find_if(result.begin(), result.end(), [&](const auto& s) {
            return s.remote_box_id == entry.remote_box_id &&
                   s.transaction_id == entry.transaction_id;
        });

        if (it == result.end()) {
            outbox_transaction_summary summary;
            summary.remote_box_id = entry.remote_box_id;
            summary.transaction_id = entry.transaction_id;
            summary.total_image_count = entry.total_image_count;
            summary.status = entry.status;
            auto b = boxes_->find_by_id(entry.remote_box_id);
            summary.remote_box_name = b ? b->name : std::to_string(entry.remote_box_id);
            result.push_back(std::move(summary));
            it = std::prev(result.end());
        }

        it->images_left++;
        it->outbox_entry_ids.push_back(entry.id);
    }

    return result;
}

void outbox_manager::set_transfer_callback(transfer_callback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    transfer_callback_ = std::move(callback);
}

// =============================================================================
// Private Helpers
// =============================================================================

std::int64_t outbox_manager::next_transaction_id() {
    std::uniform_int_distribution<std::int64_t> dist(
        1, std::numeric_limits<std::int64_t>::max());
    std::lock_guard<std::mutex> lock(rng_mutex_);
    return dist(rng_);
}

void outbox_manager::publish_completion(std::int64_t remote_box_id,
                                        std::int64_t transaction_id,
                                        std::int64_t total_image_count) {
    auto b = boxes_->find_by_id(remote_box_id);
    box target;
    if (b) {
        target = *b;
    } else {
        target.id = remote_box_id;
        target.name = std::to_string(remote_box_id);
    }

    logger_->info_fmt("Finished sending {} images to box {}", total_image_count, target.name);
    integration::logger_adapter::log_transfer_completed(target.name, transaction_id,
                                                        total_image_count);

    kcenon::common::get_event_bus().publish(events::transfer_completed_event{
        target.id, target.name, transaction_id, total_image_count});

    std::lock_guard<std::mutex> lock(callback_mutex_);
    if (transfer_callback_) {
        transfer_callback_(target, transaction_id, total_image_count);
    }
}

}  // namespace boxlink::client
