/**
 * @file events.hpp
 * @brief Domain events published on the common_system event bus
 *
 * @code
 * kcenon::common::get_event_bus().subscribe<events::transfer_completed_event>(
 *     [](const events::transfer_completed_event& e) { ... });
 * @endcode
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <utility>

namespace boxlink::events {

// ============================================================================
// Transfer Events
// ============================================================================

/**
 * @brief Every image of an outgoing transaction has been delivered
 */
struct transfer_completed_event {
    std::int64_t box_id;
    std::string box_name;
    std::int64_t transaction_id;
    std::int64_t total_image_count;
    std::chrono::steady_clock::time_point timestamp;

    transfer_completed_event(std::int64_t id,
                             std::string name,
                             std::int64_t transaction,
                             std::int64_t total)
        : box_id(id),
          box_name(std::move(name)),
          transaction_id(transaction),
          total_image_count(total),
          timestamp(std::chrono::steady_clock::now()) {}
};

/**
 * @brief Every image of an incoming transaction has arrived
 */
struct receive_completed_event {
    std::int64_t box_id;
    std::string box_name;
    std::int64_t transaction_id;
    std::int64_t total_image_count;
    std::chrono::steady_clock::time_point timestamp;

    receive_completed_event(std::int64_t id,
                            std::string name,
                            std::int64_t transaction,
                            std::int64_t total)
        : box_id(id),
          box_name(std::move(name)),
          transaction_id(transaction),
          total_image_count(total),
          timestamp(std::chrono::steady_clock::now()) {}
};

/**
 * @brief A push delivery failed permanently and the transaction was marked failed
 */
struct peer_send_failed_event {
    std::int64_t box_id;
    std::string box_name;
    std::int64_t transaction_id;
    int status_code;
    std::string message;
    std::chrono::steady_clock::time_point timestamp;

    peer_send_failed_event(std::int64_t id,
                           std::string name,
                           std::int64_t transaction,
                           int status,
                           std::string msg)
        : box_id(id),
          box_name(std::move(name)),
          transaction_id(transaction),
          status_code(status),
          message(std::move(msg)),
          timestamp(std::chrono::steady_clock::now()) {}
};

// ============================================================================
// Liveness Events
// ============================================================================

/**
 * @brief The persisted online flag of a POLL peer flipped
 */
struct box_status_changed_event {
    std::int64_t box_id;
    bool online;
    std::chrono::steady_clock::time_point timestamp;

    box_status_changed_event(std::int64_t id, bool is_online)
        : box_id(id),
          online(is_online),
          timestamp(std::chrono::steady_clock::now()) {}
};

}  // namespace boxlink::events
