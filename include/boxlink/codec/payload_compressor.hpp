/**
 * @file payload_compressor.hpp
 * @brief Compression of dataset payloads exchanged between boxes
 */

#pragma once

#include <boxlink/client/box_types.hpp>
#include <boxlink/core/result.hpp>

namespace boxlink::codec {

/**
 * @brief Symmetric payload codec
 *
 * Both peers must use the same codec: what one side compresses the other
 * decompresses.
 */
class payload_compressor {
public:
    virtual ~payload_compressor() = default;

    [[nodiscard]] virtual auto compress(const client::byte_buffer& data)
        -> Result<client::byte_buffer> = 0;

    [[nodiscard]] virtual auto decompress(const client::byte_buffer& data)
        -> Result<client::byte_buffer> = 0;
};

}  // namespace boxlink::codec
