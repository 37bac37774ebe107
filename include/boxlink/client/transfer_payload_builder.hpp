/**
 * @file transfer_payload_builder.hpp
 * @brief Builds the wire payload of one outbox entry
 */

#pragma once

#include <boxlink/client/box_types.hpp>
#include <boxlink/core/result.hpp>

#include <memory>

namespace boxlink::storage {
class image_storage;
class outbox_repository;
}  // namespace boxlink::storage

namespace boxlink::codec {
class payload_compressor;
}

namespace boxlink::client {

class image_anonymizer;

/**
 * @brief Load, anonymize and compress the image of an outbox entry
 *
 * Shared by push delivery and the poll fetch endpoint so that both modes
 * send identical bytes for the same entry.
 */
class transfer_payload_builder {
public:
    transfer_payload_builder(std::shared_ptr<storage::image_storage> storage,
                             std::shared_ptr<image_anonymizer> anonymizer,
                             std::shared_ptr<codec::payload_compressor> compressor,
                             std::shared_ptr<storage::outbox_repository> outbox);

    /**
     * @brief Produce the compressed, anonymized dataset for @p entry
     *
     * @return error_codes::dataset_not_found when the image is missing from
     *         storage; other collaborator errors are passed through
     */
    [[nodiscard]] auto build(const outbox_entry& entry) const -> Result<byte_buffer>;

private:
    std::shared_ptr<storage::image_storage> storage_;
    std::shared_ptr<image_anonymizer> anonymizer_;
    std::shared_ptr<codec::payload_compressor> compressor_;
    std::shared_ptr<storage::outbox_repository> outbox_;
};

}  // namespace boxlink::client
