/**
 * @file inbox_manager.hpp
 * @brief Progress of incoming transactions
 */

#pragma once

#include <boxlink/client/box_types.hpp>
#include <boxlink/core/result.hpp>
#include <boxlink/di/ilogger.hpp>

#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

namespace boxlink::storage {
class box_database;
class inbox_repository;
}  // namespace boxlink::storage

namespace boxlink::client {

/**
 * @brief Records received images per (peer, transaction)
 *
 * The receive-complete notification fires once, when a transaction first
 * reaches its total; repeated reports for a complete transaction only
 * refresh the row.
 */
class inbox_manager {
public:
    inbox_manager(std::shared_ptr<storage::box_database> db,
                  std::shared_ptr<storage::inbox_repository> inbox,
                  std::shared_ptr<di::ILogger> logger = nullptr);

    ~inbox_manager();

    inbox_manager(const inbox_manager&) = delete;
    auto operator=(const inbox_manager&) -> inbox_manager& = delete;

    [[nodiscard]] auto record_progress(const box& sender,
                                       std::int64_t transaction_id,
                                       std::int64_t sequence_number,
                                       std::int64_t total_image_count)
        -> Result<inbox_entry>;

    [[nodiscard]] auto list_entries() const -> std::vector<inbox_entry>;

    /// Idempotent delete by row id
    [[nodiscard]] auto remove_entry(std::int64_t id) -> VoidResult;

    void set_receive_callback(transfer_callback callback);

private:
    std::shared_ptr<storage::box_database> db_;
    std::shared_ptr<storage::inbox_repository> inbox_;
    std::shared_ptr<di::ILogger> logger_;

    transfer_callback receive_callback_;
    std::mutex callback_mutex_;
};

}  // namespace boxlink::client
