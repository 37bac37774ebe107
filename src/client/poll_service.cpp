/**
 * @file poll_service.cpp
 * @brief Implementation of the Poll Service Endpoint
 */

#include <boxlink/client/poll_service.hpp>

#include <boxlink/client/inbox_manager.hpp>
#include <boxlink/client/liveness_tracker.hpp>
#include <boxlink/client/outbox_manager.hpp>
#include <boxlink/client/transfer_payload_builder.hpp>
#include <boxlink/codec/payload_compressor.hpp>
#include <boxlink/storage/box_repository.hpp>
#include <boxlink/storage/image_storage.hpp>

#include <string>

namespace boxlink::client {

namespace {

constexpr const char* module_name = "poll_service";

template <typename T>
[[nodiscard]] Result<T> entry_not_found(std::int64_t transaction_id,
                                        std::int64_t sequence_number) {
    return make_error<T>(error_codes::outbox_entry_not_found,
                         "No outbox entry for transaction " +
                             std::to_string(transaction_id) + " sequence " +
                             std::to_string(sequence_number),
                         module_name);
}

}  // namespace

poll_service::poll_service(std::shared_ptr<storage::box_repository> boxes,
                           std::shared_ptr<outbox_manager> outbox,
                           std::shared_ptr<inbox_manager> inbox,
                           std::shared_ptr<liveness_tracker> liveness,
                           std::shared_ptr<transfer_payload_builder> payloads,
                           std::shared_ptr<storage::image_storage> storage,
                           std::shared_ptr<codec::payload_compressor> compressor,
                           std::shared_ptr<di::ILogger> logger)
    : boxes_(std::move(boxes)),
      outbox_(std::move(outbox)),
      inbox_(std::move(inbox)),
      liveness_(std::move(liveness)),
      payloads_(std::move(payloads)),
      storage_(std::move(storage)),
      compressor_(std::move(compressor)),
      logger_(logger ? std::move(logger) : di::null_logger()) {}

// =============================================================================
// Authentication
// =============================================================================

Result<box> poll_service::resolve_token(std::string_view token) const {
    auto b = boxes_->find_by_token(token);
    if (!b || b->method != send_method::poll) {
        return make_error<box>(error_codes::unknown_token,
                               "No box is registered for this token", module_name);
    }
    return ok(*b);
}

// =============================================================================
// Outbox Operations
// =============================================================================

Result<std::optional<outbox_entry>> poll_service::poll_outbox(std::string_view token) {
    auto b = resolve_token(token);
    if (b.is_err()) {
        return Result<std::optional<outbox_entry>>(b.error());
    }

    liveness_->record_contact(b.value().id);

    return ok(outbox_->next_pending_entry(b.value().id));
}

Result<outbox_entry> poll_service::fetch_entry(std::string_view token,
                                               std::int64_t transaction_id,
                                               std::int64_t sequence_number) {
    auto b = resolve_token(token);
    if (b.is_err()) {
        return Result<outbox_entry>(b.error());
    }

    auto entry = outbox_->entry_by_transaction_and_sequence(b.value().id, transaction_id,
                                                            sequence_number);
    if (!entry) {
        return entry_not_found<outbox_entry>(transaction_id, sequence_number);
    }
    return ok(*entry);
}

Result<byte_buffer> poll_service::fetch_entry_payload(std::string_view token,
                                                      std::int64_t transaction_id,
                                                      std::int64_t sequence_number) {
    auto entry = fetch_entry(token, transaction_id, sequence_number);
    if (entry.is_err()) {
        return Result<byte_buffer>(entry.error());
    }

    auto payload = payloads_->build(entry.value());
    if (payload.is_err()) {
        logger_->warn_fmt("Cannot serve image {} of transaction {}: {}",
                          entry.value().image_id, transaction_id,
                          payload.error().message);
    }
    return payload;
}

VoidResult poll_service::delete_entry(std::string_view token,
                                      std::int64_t transaction_id,
                                      std::int64_t sequence_number) {
    auto b = resolve_token(token);
    if (b.is_err()) {
        return VoidResult(b.error());
    }

    outbox_entry key;
    key.remote_box_id = b.value().id;
    key.transaction_id = transaction_id;
    key.sequence_number = sequence_number;
    return outbox_->acknowledge_delivered(key);
}

// =============================================================================
// Inbox Operations
// =============================================================================

Result<inbox_report_outcome> poll_service::report_inbox_progress(
    std::string_view token,
    std::int64_t transaction_id,
    std::int64_t sequence_number,
    std::int64_t total_image_count) {
    auto b = resolve_token(token);
    if (b.is_err()) {
        logger_->warn_fmt("Ignoring inbox report for transaction {} with unknown token",
                          transaction_id);
        return ok(inbox_report_outcome::unknown_token);
    }

    auto recorded = inbox_->record_progress(b.value(), transaction_id, sequence_number,
                                            total_image_count);
    if (recorded.is_err()) {
        return Result<inbox_report_outcome>(recorded.error());
    }
    return ok(inbox_report_outcome::recorded);
}

Result<std::int64_t> poll_service::receive_image(std::string_view token,
                                                 std::int64_t transaction_id,
                                                 std::int64_t sequence_number,
                                                 std::int64_t total_image_count,
                                                 const byte_buffer& payload) {
    auto b = resolve_token(token);
    if (b.is_err()) {
        return Result<std::int64_t>(b.error());
    }

    auto dataset = compressor_->decompress(payload);
    if (dataset.is_err()) {
        return Result<std::int64_t>(dataset.error());
    }

    auto image_id = storage_->store_dataset(dataset.value());
    if (image_id.is_err()) {
        logger_->error_fmt("Failed to store image from box {}: {}", b.value().name,
                           image_id.error().message);
        return image_id;
    }

    auto recorded = inbox_->record_progress(b.value(), transaction_id, sequence_number,
                                            total_image_count);
    if (recorded.is_err()) {
        return Result<std::int64_t>(recorded.error());
    }

    logger_->debug_fmt("Stored image {} ({}/{}) of transaction {} from box {}",
                       image_id.value(), sequence_number, total_image_count,
                       transaction_id, b.value().name);
    return image_id;
}

}  // namespace boxlink::client
