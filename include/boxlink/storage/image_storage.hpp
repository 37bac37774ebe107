/**
 * @file image_storage.hpp
 * @brief Abstract image store used by the transfer engines
 *
 * The transfer protocol treats a dataset as an opaque byte buffer. Concrete
 * stores decide how images are indexed and laid out.
 */

#pragma once

#include <boxlink/client/box_types.hpp>
#include <boxlink/core/result.hpp>

#include <cstdint>

namespace boxlink::storage {

/**
 * @brief Source of outgoing datasets and sink for received ones
 *
 * Thread Safety:
 * - Implementations must allow concurrent calls from several delivery workers
 */
class image_storage {
public:
    virtual ~image_storage() = default;

    /**
     * @brief Load the dataset of an image
     *
     * @param image_id Local image id
     * @param with_pixel_data Include the pixel data element
     * @return The encoded dataset, or error_codes::dataset_not_found when the
     *         image does not exist
     */
    [[nodiscard]] virtual auto get_dataset(std::int64_t image_id, bool with_pixel_data)
        -> Result<client::byte_buffer> = 0;

    /**
     * @brief Store a received dataset
     *
     * @return Local id assigned to the stored image
     */
    [[nodiscard]] virtual auto store_dataset(const client::byte_buffer& dataset)
        -> Result<std::int64_t> = 0;
};

}  // namespace boxlink::storage
