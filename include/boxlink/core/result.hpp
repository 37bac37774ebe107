/**
 * @file result.hpp
 * @brief Result<T> type aliases and error codes for boxlink
 *
 * Binds boxlink to common_system's Result pattern and defines the
 * box-transfer error code range.
 *
 * @see common_system/include/kcenon/common/patterns/result.h
 */

#pragma once

#include <kcenon/common/patterns/result.h>
#include <kcenon/common/error/error_codes.h>

#include <string>

namespace boxlink {

/**
 * @brief Result type alias for boxlink operations
 * @tparam T The success value type
 */
template <typename T>
using Result = kcenon::common::Result<T>;

/**
 * @brief Result type for void operations
 */
using VoidResult = kcenon::common::VoidResult;

/**
 * @brief Error information type
 */
using error_info = kcenon::common::error_info;

/**
 * @namespace error_codes
 * @brief boxlink error codes
 *
 * Error code range: -900 to -999
 */
namespace error_codes {
    using namespace kcenon::common::error::codes::common_errors;

    constexpr int boxlink_base = -900;

    // Peer registry errors (-900 to -919)
    constexpr int box_not_found = boxlink_base - 0;
    constexpr int unknown_token = boxlink_base - 1;
    constexpr int malformed_base_url = boxlink_base - 2;
    constexpr int duplicate_box = boxlink_base - 3;
    constexpr int invalid_box_name = boxlink_base - 4;
    constexpr int wrong_send_method = boxlink_base - 5;

    // Transfer errors (-920 to -939)
    constexpr int outbox_entry_not_found = boxlink_base - 20;
    constexpr int inbox_entry_not_found = boxlink_base - 21;
    constexpr int empty_transfer = boxlink_base - 22;
    constexpr int dataset_not_found = boxlink_base - 23;
    constexpr int anonymization_failed = boxlink_base - 24;
    constexpr int invalid_transfer_parameters = boxlink_base - 25;
    constexpr int transfer_cancelled = boxlink_base - 26;

    // Payload errors (-940 to -949)
    constexpr int compression_error = boxlink_base - 40;
    constexpr int decompression_error = boxlink_base - 41;
    constexpr int storage_write_error = boxlink_base - 42;
    constexpr int storage_read_error = boxlink_base - 43;

    // HTTP errors (-950 to -959)
    constexpr int http_transport_error = boxlink_base - 50;
    constexpr int http_unexpected_status = boxlink_base - 51;
    constexpr int wire_format_error = boxlink_base - 52;

    // Database errors (-980 to -989)
    constexpr int database_open_error = boxlink_base - 80;
    constexpr int database_query_error = boxlink_base - 81;
    constexpr int database_transaction_error = boxlink_base - 82;
    constexpr int database_migration_error = boxlink_base - 83;
} // namespace error_codes

using kcenon::common::ok;
using kcenon::common::make_error;

/**
 * @brief Create a boxlink error result with module context
 * @tparam T The result value type
 * @param code Error code from boxlink::error_codes
 * @param message Error message
 * @param details Optional additional details
 */
template <typename T>
inline Result<T> boxlink_error(int code, const std::string& message,
                               const std::string& details = "") {
    if (details.empty()) {
        return kcenon::common::make_error<T>(code, message, "boxlink");
    }
    return kcenon::common::make_error<T>(code, message, "boxlink", details);
}

/**
 * @brief Create a boxlink void error result
 */
inline VoidResult boxlink_void_error(int code, const std::string& message,
                                     const std::string& details = "") {
    if (details.empty()) {
        return VoidResult(error_info{code, message, "boxlink"});
    }
    return VoidResult(error_info{code, message, "boxlink", details});
}

} // namespace boxlink

