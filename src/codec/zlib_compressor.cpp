/**
 * @file zlib_compressor.cpp
 * @brief Implementation of the zlib payload codec
 */

#include <boxlink/codec/zlib_compressor.hpp>

#include <boxlink/compat/format.hpp>

#include <zlib.h>

#include <algorithm>
#include <limits>
#include <string>

namespace boxlink::codec {

namespace {

constexpr const char* module_name = "zlib_compressor";

/// Output is grown in chunks of this size while inflating
constexpr std::size_t inflate_chunk = 64 * 1024;

}  // namespace

zlib_compressor::zlib_compressor(zlib_config config) : config_(config) {}

Result<client::byte_buffer> zlib_compressor::compress(const client::byte_buffer& data) {
    if (data.size() > std::numeric_limits<uLong>::max()) {
        return make_error<client::byte_buffer>(
            error_codes::compression_error, "Payload too large to compress", module_name);
    }

    auto src_len = static_cast<uLong>(data.size());
    uLongf out_len = compressBound(src_len);
    client::byte_buffer out(out_len);

    auto status = compress2(out.data(), &out_len, data.data(), src_len, config_.level);
    if (status != Z_OK) {
        return make_error<client::byte_buffer>(
            error_codes::compression_error,
            boxlink::compat::format("compress2 failed with status {}", status),
            module_name);
    }

    out.resize(out_len);
    return ok(std::move(out));
}

Result<client::byte_buffer> zlib_compressor::decompress(const client::byte_buffer& data) {
    z_stream stream{};
    if (inflateInit(&stream) != Z_OK) {
        return make_error<client::byte_buffer>(
            error_codes::decompression_error, "inflateInit failed", module_name);
    }

    stream.next_in = const_cast<Bytef*>(data.data());
    stream.avail_in = static_cast<uInt>(data.size());

    client::byte_buffer out;
    int status = Z_OK;
    while (status != Z_STREAM_END) {
        auto offset = out.size();
        if (offset >= config_.max_output_bytes) {
            inflateEnd(&stream);
            return make_error<client::byte_buffer>(
                error_codes::decompression_error,
                "Decompressed payload exceeds the configured limit", module_name);
        }

        out.resize(offset + std::min(inflate_chunk, config_.max_output_bytes - offset));
        stream.next_out = out.data() + offset;
        stream.avail_out = static_cast<uInt>(out.size() - offset);

        status = inflate(&stream, Z_NO_FLUSH);
        out.resize(out.size() - stream.avail_out);

        if (status == Z_BUF_ERROR && stream.avail_in == 0) {
            inflateEnd(&stream);
            return make_error<client::byte_buffer>(
                error_codes::decompression_error, "Truncated payload", module_name);
        }
        if (status != Z_OK && status != Z_STREAM_END && status != Z_BUF_ERROR) {
            auto message = stream.msg ? std::string(stream.msg) : std::string("invalid data");
            inflateEnd(&stream);
            return make_error<client::byte_buffer>(
                error_codes::decompression_error,
                boxlink::compat::format("inflate failed: {}", message), module_name);
        }
    }

    inflateEnd(&stream);
    return ok(std::move(out));
}

}  // namespace boxlink::codec
