/**
 * @file transfer_payload_builder.cpp
 * @brief Implementation of the outbox payload pipeline
 */

#include <boxlink/client/transfer_payload_builder.hpp>

#include <boxlink/client/image_anonymizer.hpp>
#include <boxlink/codec/payload_compressor.hpp>
#include <boxlink/storage/image_storage.hpp>
#include <boxlink/storage/outbox_repository.hpp>

namespace boxlink::client {

transfer_payload_builder::transfer_payload_builder(
    std::shared_ptr<storage::image_storage> storage,
    std::shared_ptr<image_anonymizer> anonymizer,
    std::shared_ptr<codec::payload_compressor> compressor,
    std::shared_ptr<storage::outbox_repository> outbox)
    : storage_(std::move(storage)),
      anonymizer_(std::move(anonymizer)),
      compressor_(std::move(compressor)),
      outbox_(std::move(outbox)) {}

Result<byte_buffer> transfer_payload_builder::build(const outbox_entry& entry) const {
    auto tag_values = outbox_->find_tag_values(entry.transaction_id, entry.image_id);

    auto dataset = storage_->get_dataset(entry.image_id, true);
    if (dataset.is_err()) {
        return dataset;
    }

    auto anonymized = anonymizer_->anonymize(entry.image_id, dataset.value(), tag_values);
    if (anonymized.is_err()) {
        return anonymized;
    }

    return compressor_->compress(anonymized.value());
}

}  // namespace boxlink::client
