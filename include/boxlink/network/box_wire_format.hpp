/**
 * @file box_wire_format.hpp
 * @brief Encoding of values exchanged on the peer HTTP surface
 *
 * @code
 * GET  {baseUrl}/outbox                 -> {"id":..,"transactionId":..,
 *                                           "sequenceNumber":..,"totalImageCount":..,
 *                                           "imageId":..,"failed":false}
 * POST {baseUrl}/image?transactionid=T&sequencenumber=S&totalimagecount=N
 * POST {baseUrl}/inbox?transactionid=T&sequencenumber=S&totalimagecount=N
 * @endcode
 */

#pragma once

#include <boxlink/client/box_types.hpp>
#include <boxlink/core/result.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace boxlink::network {

/**
 * @brief Position of one image within a transaction
 */
struct transfer_parameters {
    std::int64_t transaction_id{0};
    std::int64_t sequence_number{0};
    std::int64_t total_image_count{0};
};

[[nodiscard]] auto outbox_entry_to_json(const client::outbox_entry& entry) -> std::string;

/**
 * @brief Parse the JSON of outbox_entry_to_json()
 *
 * @return wire_format_error when the body is not an object with every key
 */
[[nodiscard]] auto outbox_entry_from_json(std::string_view body)
    -> Result<client::outbox_entry>;

/**
 * @brief Validate the three query parameters of an image or inbox request
 *
 * Any argument may be null (parameter absent). Values must be decimal, with
 * a positive transaction id and 1 <= sequence <= total.
 */
[[nodiscard]] auto parse_transfer_parameters(const char* transaction_id,
                                             const char* sequence_number,
                                             const char* total_image_count)
    -> Result<transfer_parameters>;

/// "transactionid=T&sequencenumber=S&totalimagecount=N"
[[nodiscard]] auto to_query_string(const transfer_parameters& params) -> std::string;

}  // namespace boxlink::network
