/**
 * @file inbox_repository.hpp
 * @brief Persistence of receive progress per peer transaction
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
 * @brief Access to the inbox_entries table
 */
class inbox_repository {
public:
    explicit inbox_repository(std::shared_ptr<box_database> db);
    ~inbox_repository();

    inbox_repository(const inbox_repository&) = delete;
    auto operator=(const inbox_repository&) -> inbox_repository& = delete;
    inbox_repository(inbox_repository&&) noexcept;
    auto operator=(inbox_repository&&) noexcept -> inbox_repository&;

    /**
     * @brief Record that image @p sequence_number of a transaction arrived
     *
     * Creates the row on first report. The stored received count never
     * decreases, so reports arriving out of order keep the highest value.
     *
     * @return The row after the update
     */
    [[nodiscard]] auto upsert_progress(std::int64_t remote_box_id,
                                       std::int64_t transaction_id,
                                       std::int64_t sequence_number,
                                       std::int64_t total_image_count)
        -> Result<client::inbox_entry>;

    [[nodiscard]] auto find_by_transaction(std::int64_t remote_box_id,
                                           std::int64_t transaction_id) const
        -> std::optional<client::inbox_entry>;

    [[nodiscard]] auto find_by_id(std::int64_t id) const
        -> std::optional<client::inbox_entry>;

    [[nodiscard]] auto find_all() const -> std::vector<client::inbox_entry>;

    [[nodiscard]] auto remove(std::int64_t id) -> VoidResult;

    [[nodiscard]] auto count() const -> std::size_t;

private:
    std::shared_ptr<box_database> db_;
};

}  // namespace boxlink::storage
