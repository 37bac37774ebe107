/**
 * @file outbox_manager.hpp
 * @brief Creation, ordering and completion of outgoing transactions
 */

#pragma once

#include <boxlink/client/box_types.hpp>
#include <boxlink/core/result.hpp>
#include <boxlink/di/ilogger.hpp>

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <vector>

namespace boxlink::storage {
class box_database;
class box_repository;
class outbox_repository;
}  // namespace boxlink::storage

namespace boxlink::client {

/**
 * @brief Bookkeeping of outbox entries shared by push and poll delivery
 *
 * Delivery order within a box is insertion order. Entries of a FAILED
 * transaction are skipped until retry_transaction() resets it.
 *
 * Thread Safety:
 * - All public methods are thread-safe
 * - Completion callbacks run on the thread that acknowledged the last entry
 *
 * @code
 * auto tx = manager.enqueue_transfer(box_id, {5, 6, 7});
 * while (auto entry = manager.next_pending_entry(box_id)) {
 *     // deliver *entry, then
 *     (void)manager.acknowledge_delivered(*entry);
 * }
 * @endcode
 */
class outbox_manager {
public:
    outbox_manager(std::shared_ptr<storage::box_database> db,
                   std::shared_ptr<storage::box_repository> boxes,
                   std::shared_ptr<storage::outbox_repository> outbox,
                   std::shared_ptr<di::ILogger> logger = nullptr);

    ~outbox_manager();

    outbox_manager(const outbox_manager&) = delete;
    auto operator=(const outbox_manager&) -> outbox_manager& = delete;

    // =========================================================================
    // Enqueue / Dequeue
    // =========================================================================

    /**
     * @brief Queue images for a peer as one new transaction
     *
     * Entries get sequence numbers 1..N in the order of @p image_ids. The
     * entries and tag values are inserted atomically.
     *
     * @param tag_values Anonymization overrides; only image_id, tag and
     *        value are read
     * @return The new transaction id, or box_not_found / empty_transfer
     */
    [[nodiscard]] auto enqueue_transfer(std::int64_t remote_box_id,
                                        const std::vector<std::int64_t>& image_ids,
                                        const std::vector<outbox_tag_value>& tag_values = {})
        -> Result<std::int64_t>;

    [[nodiscard]] auto next_pending_entry(std::int64_t remote_box_id) const
        -> std::optional<outbox_entry>;

    /**
     * @brief Remove a delivered entry
     *
     * The entry is located by (remote_box_id, transaction_id,
     * sequence_number). Deleting an entry that is already gone succeeds
     * without side effects.
     * Removing the last sequence of a transaction completes it: tag values
     * are purged and the completion is published. A WAITING transaction
     * becomes PENDING again.
     */
    [[nodiscard]] auto acknowledge_delivered(const outbox_entry& entry) -> VoidResult;

    // =========================================================================
    // Transaction Status
    // =========================================================================

    [[nodiscard]] auto mark_transaction_waiting(std::int64_t remote_box_id,
                                                std::int64_t transaction_id) -> VoidResult;

    [[nodiscard]] auto mark_transaction_failed(std::int64_t remote_box_id,
                                               std::int64_t transaction_id) -> VoidResult;

    /**
     * @brief Return a WAITING or FAILED transaction to PENDING
     *
     * @return outbox_entry_not_found when the transaction has no entries left
     */
    [[nodiscard]] auto retry_transaction(std::int64_t remote_box_id,
                                         std::int64_t transaction_id) -> VoidResult;

    [[nodiscard]] auto get_transaction_status(std::int64_t remote_box_id,
                                              std::int64_t transaction_id) const
        -> std::optional<transaction_status>;

    // =========================================================================
    // Accessors
    // =========================================================================

    /// Idempotent delete by row id, without completion handling
    [[nodiscard]] auto remove_entry(std::int64_t id) -> VoidResult;

    [[nodiscard]] auto list_entries() const -> std::vector<outbox_entry>;

    [[nodiscard]] auto entry_by_transaction_and_sequence(std::int64_t remote_box_id,
                                                         std::int64_t transaction_id,
                                                         std::int64_t sequence_number) const
        -> std::optional<outbox_entry>;

    [[nodiscard]] auto tag_values(std::int64_t transaction_id, std::int64_t image_id) const
        -> std::vector<outbox_tag_value>;

    /**
     * @brief One summary per open transaction, in delivery order
     */
    [[nodiscard]] auto transactions() const -> std::vector<outbox_transaction_summary>;

    void set_transfer_callback(transfer_callback callback);

private:
    [[nodiscard]] auto next_transaction_id() -> std::int64_t;

    void publish_completion(std::int64_t remote_box_id,
                            std::int64_t transaction_id,
                            std::int64_t total_image_count);

    std::shared_ptr<storage::box_database> db_;
    std::shared_ptr<storage::box_repository> boxes_;
    std::shared_ptr<storage::outbox_repository> outbox_;
    std::shared_ptr<di::ILogger> logger_;

    std::mutex rng_mutex_;
    std::mt19937_64 rng_;

    transfer_callback transfer_callback_;
    mutable std::mutex callback_mutex_;
};

}  // namespace boxlink::client
