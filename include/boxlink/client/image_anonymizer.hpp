/**
 * @file image_anonymizer.hpp
 * @brief Anonymization step applied to every outgoing dataset
 */

#pragma once

#include <boxlink/client/box_types.hpp>
#include <boxlink/core/result.hpp>

#include <cstdint>
#include <vector>

namespace boxlink::client {

/**
 * @brief Rewrites identifying attributes before a dataset leaves the node
 *
 * @p tag_values carries the per-transaction overrides registered with the
 * send request for this image, ordered by tag.
 */
class image_anonymizer {
public:
    virtual ~image_anonymizer() = default;

    [[nodiscard]] virtual auto anonymize(std::int64_t image_id,
                                         const byte_buffer& dataset,
                                         const std::vector<outbox_tag_value>& tag_values)
        -> Result<byte_buffer> = 0;
};

/**
 * @brief Anonymizer that forwards datasets unchanged
 *
 * For deployments where images are anonymized before they enter the store.
 */
class passthrough_anonymizer final : public image_anonymizer {
public:
    [[nodiscard]] auto anonymize(std::int64_t image_id,
                                 const byte_buffer& dataset,
                                 const std::vector<outbox_tag_value>& tag_values)
        -> Result<byte_buffer> override;
};

}  // namespace boxlink::client
