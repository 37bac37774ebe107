/**
 * @file box_types.hpp
 * @brief Peer, outbox and inbox data types for box-to-box transfer
 *
 * A box is a relationship with one remote node. Outgoing images are
 * queued as outbox entries grouped into transactions; incoming progress
 * is tracked per transaction as inbox entries.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace boxlink::client {

/// Raw payload bytes (DICOM datasets, compressed or not)
using byte_buffer = std::vector<std::uint8_t>;

// =============================================================================
// Send Method
// =============================================================================

/**
 * @brief How images travel to a peer
 */
enum class send_method {
    push,  ///< This node uploads to the peer
    poll   ///< The peer pulls from this node
};

[[nodiscard]] constexpr const char* to_string(send_method method) noexcept {
    switch (method) {
        case send_method::push: return "PUSH";
        case send_method::poll: return "POLL";
        default: return "PUSH";
    }
}

/**
 * @brief Parse send_method; unknown strings map to push
 */
[[nodiscard]] inline send_method send_method_from_string(std::string_view str) noexcept {
    if (str == "POLL") return send_method::poll;
    return send_method::push;
}

// =============================================================================
// Transaction Status
// =============================================================================

/**
 * @brief Delivery status shared by all outbox rows of a transaction
 */
enum class transaction_status {
    pending,  ///< Eligible for delivery
    waiting,  ///< Last attempt hit a transient fault, retried on the next tick
    failed    ///< Permanent fault, held until retried by an operator
};

[[nodiscard]] constexpr const char* to_string(transaction_status status) noexcept {
    switch (status) {
        case transaction_status::pending: return "PENDING";
        case transaction_status::waiting: return "WAITING";
        case transaction_status::failed: return "FAILED";
        default: return "PENDING";
    }
}

[[nodiscard]] inline transaction_status transaction_status_from_string(
    std::string_view str) noexcept {
    if (str == "WAITING") return transaction_status::waiting;
    if (str == "FAILED") return transaction_status::failed;
    return transaction_status::pending;
}

// =============================================================================
// Box
// =============================================================================

/**
 * @brief A peer relationship
 */
struct box {
    std::int64_t id{0};
    std::string name;
    std::string token;           ///< UUID credential embedded in base_url
    std::string base_url;        ///< {apiBaseUrl}/box/{token}
    send_method method{send_method::push};
    bool online{false};
};

// =============================================================================
// Outbox
// =============================================================================

/**
 * @brief One image queued for delivery to a peer
 */
struct outbox_entry {
    std::int64_t id{0};
    std::int64_t remote_box_id{0};
    std::int64_t transaction_id{0};
    std::int64_t sequence_number{0};   ///< 1-based position within the transaction
    std::int64_t total_image_count{0};
    std::int64_t image_id{0};
    transaction_status status{transaction_status::pending};

    [[nodiscard]] bool failed() const noexcept {
        return status == transaction_status::failed;
    }

    [[nodiscard]] bool is_last() const noexcept {
        return sequence_number == total_image_count;
    }
};

/**
 * @brief Outbox entry joined with the peer name for reporting
 */
struct outbox_entry_info {
    outbox_entry entry;
    std::string remote_box_name;
};

/**
 * @brief Per-transaction view of the outbox
 */
struct outbox_transaction_summary {
    std::int64_t remote_box_id{0};
    std::string remote_box_name;
    std::int64_t transaction_id{0};
    std::int64_t total_image_count{0};
    std::int64_t images_left{0};
    transaction_status status{transaction_status::pending};
    std::vector<std::int64_t> outbox_entry_ids;

    /**
     * @brief Delivered fraction in percent, rounded
     */
    [[nodiscard]] int progress_percent() const noexcept {
        if (total_image_count <= 0) {
            return 0;
        }
        auto done = total_image_count - images_left;
        return static_cast<int>((200 * done + total_image_count) / (2 * total_image_count));
    }
};

/**
 * @brief Tag override applied by the anonymizer to one image of a transaction
 */
struct outbox_tag_value {
    std::int64_t remote_box_id{0};
    std::int64_t transaction_id{0};
    std::int64_t image_id{0};
    std::uint32_t tag{0};   ///< (group << 16) | element
    std::string value;
};

// =============================================================================
// Inbox
// =============================================================================

/**
 * @brief Receive progress of one incoming transaction
 */
struct inbox_entry {
    std::int64_t id{0};
    std::int64_t remote_box_id{0};
    std::int64_t transaction_id{0};
    std::int64_t received_image_count{0};
    std::int64_t total_image_count{0};

    [[nodiscard]] bool is_complete() const noexcept {
        return received_image_count >= total_image_count && total_image_count > 0;
    }
};

/**
 * @brief Inbox entry joined with the peer name for reporting
 */
struct inbox_entry_info {
    inbox_entry entry;
    std::string remote_box_name;
};

// =============================================================================
// Callbacks
// =============================================================================

/// Called with (box, transaction_id, total_image_count)
using transfer_callback =
    std::function<void(const box&, std::int64_t, std::int64_t)>;

/// Called with (box_id, online)
using box_status_callback = std::function<void(std::int64_t, bool)>;

}  // namespace boxlink::client
