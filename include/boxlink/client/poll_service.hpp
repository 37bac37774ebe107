/**
 * @file poll_service.hpp
 * @brief Token-authenticated operations invoked by remote peers
 */

#pragma once

#include <boxlink/client/box_types.hpp>
#include <boxlink/core/result.hpp>
#include <boxlink/di/ilogger.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>

namespace boxlink::storage {
class box_repository;
class image_storage;
}  // namespace boxlink::storage

namespace boxlink::codec {
class payload_compressor;
}

namespace boxlink::client {

class inbox_manager;
class liveness_tracker;
class outbox_manager;
class transfer_payload_builder;

/**
 * @brief Outcome of report_inbox_progress()
 *
 * Both values are acknowledged to the caller on the wire.
 */
enum class inbox_report_outcome {
    recorded,
    unknown_token
};

/**
 * @brief Server side of the box protocol
 *
 * Every operation resolves the caller's token to a POLL box first. Peers
 * that pull from this node use the outbox operations; peers that push to
 * this node use receive_image() and report_inbox_progress().
 *
 * Thread Safety: all methods may be called concurrently.
 */
class poll_service {
public:
    poll_service(std::shared_ptr<storage::box_repository> boxes,
                 std::shared_ptr<outbox_manager> outbox,
                 std::shared_ptr<inbox_manager> inbox,
                 std::shared_ptr<liveness_tracker> liveness,
                 std::shared_ptr<transfer_payload_builder> payloads,
                 std::shared_ptr<storage::image_storage> storage,
                 std::shared_ptr<codec::payload_compressor> compressor,
                 std::shared_ptr<di::ILogger> logger = nullptr);

    /**
     * @brief Resolve a token to its POLL box
     *
     * @return unknown_token when no POLL box carries the token
     */
    [[nodiscard]] auto resolve_token(std::string_view token) const -> Result<box>;

    /**
     * @brief Next entry for the caller, or nullopt when its outbox is empty
     *
     * Records the call as contact from the peer.
     */
    [[nodiscard]] auto poll_outbox(std::string_view token)
        -> Result<std::optional<outbox_entry>>;

    [[nodiscard]] auto fetch_entry(std::string_view token,
                                   std::int64_t transaction_id,
                                   std::int64_t sequence_number) -> Result<outbox_entry>;

    /**
     * @brief Anonymized, compressed dataset of an entry
     */
    [[nodiscard]] auto fetch_entry_payload(std::string_view token,
                                           std::int64_t transaction_id,
                                           std::int64_t sequence_number)
        -> Result<byte_buffer>;

    /**
     * @brief Confirm receipt of an entry
     *
     * Succeeds when the entry is already gone.
     */
    [[nodiscard]] auto delete_entry(std::string_view token,
                                    std::int64_t transaction_id,
                                    std::int64_t sequence_number) -> VoidResult;

    /**
     * @brief Record that the peer delivered image @p sequence_number
     *
     * An unknown token changes nothing and is logged; it is not an error.
     */
    [[nodiscard]] auto report_inbox_progress(std::string_view token,
                                             std::int64_t transaction_id,
                                             std::int64_t sequence_number,
                                             std::int64_t total_image_count)
        -> Result<inbox_report_outcome>;

    /**
     * @brief Store an image pushed by the peer and record the progress
     *
     * @param payload Compressed dataset as sent on the wire
     * @return Local id of the stored image
     */
    [[nodiscard]] auto receive_image(std::string_view token,
                                     std::int64_t transaction_id,
                                     std::int64_t sequence_number,
                                     std::int64_t total_image_count,
                                     const byte_buffer& payload) -> Result<std::int64_t>;

private:
    std::shared_ptr<storage::box_repository> boxes_;
    std::shared_ptr<outbox_manager> outbox_;
    std::shared_ptr<inbox_manager> inbox_;
    std::shared_ptr<liveness_tracker> liveness_;
    std::shared_ptr<transfer_payload_builder> payloads_;
    std::shared_ptr<storage::image_storage> storage_;
    std::shared_ptr<codec::payload_compressor> compressor_;
    std::shared_ptr<di::ILogger> logger_;
};

}  // namespace boxlink::client
