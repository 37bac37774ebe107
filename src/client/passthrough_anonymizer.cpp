/**
 * @file passthrough_anonymizer.cpp
 * @brief Implementation of the forwarding anonymizer
 */

#include <boxlink/client/image_anonymizer.hpp>

#include <boxlink/integration/logger_adapter.hpp>

namespace boxlink::client {

Result<byte_buffer> passthrough_anonymizer::anonymize(
    std::int64_t image_id,
    const byte_buffer& dataset,
    const std::vector<outbox_tag_value>& tag_values) {
    if (!tag_values.empty()) {
        integration::logger_adapter::debug(
            "Ignoring {} tag overrides for image {}", tag_values.size(), image_id);
    }
    return ok(byte_buffer(dataset));
}

}  // namespace boxlink::client
