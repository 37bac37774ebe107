/**
 * @file inbox_manager.cpp
 * @brief Implementation of incoming transaction bookkeeping
 */

#include <boxlink/client/inbox_manager.hpp>

#include <boxlink/core/events.hpp>
#include <boxlink/integration/logger_adapter.hpp>
#include <boxlink/storage/box_database.hpp>
#include <boxlink/storage/inbox_repository.hpp>

#include <kcenon/common/patterns/event_bus.h>

namespace boxlink::client {

inbox_manager::inbox_manager(std::shared_ptr<storage::box_database> db,
                             std::shared_ptr<storage::inbox_repository> inbox,
                             std::shared_ptr<di::ILogger> logger)
    : db_(std::move(db)),
      inbox_(std::move(inbox)),
      logger_(logger ? std::move(logger) : di::null_logger()) {}

inbox_manager::~inbox_manager() = default;

Result<inbox_entry> inbox_manager::record_progress(const box& sender,
                                                   std::int64_t transaction_id,
                                                   std::int64_t sequence_number,
                                                   std::int64_t total_image_count) {
    bool completed_now = false;
    inbox_entry updated;
    {
        auto guard = db_->lock();

        auto previous = inbox_->find_by_transaction(sender.id, transaction_id);
        auto result = inbox_->upsert_progress(sender.id, transaction_id, sequence_number,
                                              total_image_count);
        if (result.is_err()) {
            return result;
        }

        updated = result.value();
        completed_now = updated.is_complete() && !(previous && previous->is_complete());
    }

    if (completed_now) {
        logger_->info_fmt("Received {} images from box {}", updated.total_image_count,
                          sender.name);
        integration::logger_adapter::log_receive_completed(sender.name, transaction_id,
                                                           updated.total_image_count);
        kcenon::common::get_event_bus().publish(events::receive_completed_event{
            sender.id, sender.name, transaction_id, updated.total_image_count});

        std::lock_guard<std::mutex> lock(callback_mutex_);
        if (receive_callback_) {
            receive_callback_(sender, transaction_id, updated.total_image_count);
        }
    }

    return ok(updated);
}

std::vector<inbox_entry> inbox_manager::list_entries() const {
    return inbox_->find_all();
}

VoidResult inbox_manager::remove_entry(std::int64_t id) {
    return inbox_->remove(id);
}

void inbox_manager::set_receive_callback(transfer_callback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    receive_callback_ = std::move(callback);
}

}  // namespace boxlink::client
