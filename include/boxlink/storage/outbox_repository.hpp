/**
 * @file outbox_repository.hpp
 * @brief Persistence of outbox entries and their tag overrides
 */

#pragma once

#include <boxlink/client/box_types.hpp>
#include <boxlink/core/result.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace boxlink::storage {

class box_database;

/**
 * @brief Access to the outbox_entries and outbox_tag_values tables
 *
 * Entries are ordered by id, which follows insertion order; a transaction's
 * rows are inserted in sequence order in one SQL transaction, so id order is
 * also (transaction, sequence) order.
 */
class outbox_repository {
public:
    explicit outbox_repository(std::shared_ptr<box_database> db);
    ~outbox_repository();

    outbox_repository(const outbox_repository&) = delete;
    auto operator=(const outbox_repository&) -> outbox_repository& = delete;
    outbox_repository(outbox_repository&&) noexcept;
    auto operator=(outbox_repository&&) noexcept -> outbox_repository&;

    // =========================================================================
    // Entries
    // =========================================================================

    [[nodiscard]] auto insert(const client::outbox_entry& entry) -> Result<std::int64_t>;

    [[nodiscard]] auto find_by_id(std::int64_t id) const
        -> std::optional<client::outbox_entry>;

    /**
     * @brief Oldest entry for the box whose transaction is not FAILED
     */
    [[nodiscard]] auto find_next_pending(std::int64_t remote_box_id) const
        -> std::optional<client::outbox_entry>;

    [[nodiscard]] auto find_by_transaction_and_sequence(
        std::int64_t remote_box_id,
        std::int64_t transaction_id,
        std::int64_t sequence_number) const -> std::optional<client::outbox_entry>;

    [[nodiscard]] auto find_by_transaction(std::int64_t remote_box_id,
                                           std::int64_t transaction_id) const
        -> std::vector<client::outbox_entry>;

    [[nodiscard]] auto find_by_box(std::int64_t remote_box_id) const
        -> std::vector<client::outbox_entry>;

    [[nodiscard]] auto find_all() const -> std::vector<client::outbox_entry>;

    /**
     * @brief Delete one entry; deleting a missing id succeeds
     */
    [[nodiscard]] auto remove(std::int64_t id) -> VoidResult;

    [[nodiscard]] auto remove_by_box(std::int64_t remote_box_id) -> VoidResult;

    /**
     * @brief Set the status of every remaining row of a transaction
     */
    [[nodiscard]] auto update_transaction_status(std::int64_t remote_box_id,
                                                 std::int64_t transaction_id,
                                                 client::transaction_status status)
        -> VoidResult;

    [[nodiscard]] auto count() const -> std::size_t;

    // =========================================================================
    // Tag Values
    // =========================================================================

    [[nodiscard]] auto insert_tag_value(const client::outbox_tag_value& value) -> VoidResult;

    [[nodiscard]] auto find_tag_values(std::int64_t transaction_id,
                                       std::int64_t image_id) const
        -> std::vector<client::outbox_tag_value>;

    [[nodiscard]] auto remove_tag_values(std::int64_t remote_box_id,
                                         std::int64_t transaction_id) -> VoidResult;

    [[nodiscard]] auto remove_tag_values_by_box(std::int64_t remote_box_id) -> VoidResult;

private:
    [[nodiscard]] auto query_entries(const char* where_clause,
                                     std::int64_t first,
                                     std::int64_t second,
                                     std::int64_t third,
                                     int bind_count) const
        -> std::vector<client::outbox_entry>;

    [[nodiscard]] auto delete_where(const char* sql, std::int64_t first,
                                    std::int64_t second, int bind_count,
                                    const char* action) -> VoidResult;

    std::shared_ptr<box_database> db_;
};

}  // namespace boxlink::storage
