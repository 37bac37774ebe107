/**
 * @file zlib_compressor.hpp
 * @brief zlib (RFC 1950) implementation of payload_compressor
 */

#pragma once

#include <boxlink/codec/payload_compressor.hpp>

#include <cstddef>

namespace boxlink::codec {

/**
 * @brief zlib codec settings
 */
struct zlib_config {
    /// zlib compression level, 0 (store) to 9 (best)
    int level{6};

    /// Decompression refuses to produce more than this many bytes
    std::size_t max_output_bytes{std::size_t{2} * 1024 * 1024 * 1024};
};

class zlib_compressor final : public payload_compressor {
public:
    explicit zlib_compressor(zlib_config config = {});

    [[nodiscard]] auto compress(const client::byte_buffer& data)
        -> Result<client::byte_buffer> override;

    [[nodiscard]] auto decompress(const client::byte_buffer& data)
        -> Result<client::byte_buffer> override;

private:
    zlib_config config_;
};

}  // namespace boxlink::codec
