/**
 * @file box_database.hpp
 * @brief SQLite connection owning the transfer schema
 *
 * One connection per process. Every statement runs under the connection
 * mutex; multi-statement writes go through with_transaction().
 */

#pragma once

#include <boxlink/core/result.hpp>
#include <boxlink/storage/migration_runner.hpp>

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

struct sqlite3;

namespace boxlink::storage {

/**
 * @brief Connection settings
 */
struct database_config {
    /// Enable WAL journal mode (ignored for ":memory:")
    bool wal_mode{true};

    /// How long a statement waits on a locked database
    int busy_timeout_ms{5000};
};

/**
 * @brief Owner of the SQLite handle used by the repositories
 *
 * @code
 * auto db = box_database::open("boxlink.db");
 * if (db.is_err()) { ... }
 * box_repository boxes(std::move(db.value()));
 * @endcode
 */
class box_database {
public:
    /**
     * @brief Open (or create) a database and migrate it to the latest schema
     */
    [[nodiscard]] static auto open(std::string_view db_path)
        -> Result<std::shared_ptr<box_database>>;

    [[nodiscard]] static auto open(std::string_view db_path,
                                   const database_config& config)
        -> Result<std::shared_ptr<box_database>>;

    ~box_database();

    box_database(const box_database&) = delete;
    auto operator=(const box_database&) -> box_database& = delete;
    box_database(box_database&&) = delete;
    auto operator=(box_database&&) -> box_database& = delete;

    /**
     * @brief Raw handle; callers must hold lock() while using it
     */
    [[nodiscard]] auto native_handle() const noexcept -> sqlite3*;

    /**
     * @brief Acquire the connection mutex (recursive)
     */
    [[nodiscard]] auto lock() const -> std::unique_lock<std::recursive_mutex>;

    /**
     * @brief Run body inside BEGIN IMMEDIATE / COMMIT
     *
     * The transaction is rolled back when body returns an error. Nested
     * calls join the outermost transaction.
     */
    [[nodiscard]] auto with_transaction(const std::function<VoidResult()>& body)
        -> VoidResult;

    [[nodiscard]] auto path() const noexcept -> const std::string&;

    [[nodiscard]] auto schema_version() const -> int;

private:
    box_database(sqlite3* db, std::string path);

    [[nodiscard]] auto execute(const char* sql) -> VoidResult;

    sqlite3* db_{nullptr};
    std::string path_;
    mutable std::recursive_mutex mutex_;
    int transaction_depth_{0};
    migration_runner migration_runner_;
};

}  // namespace boxlink::storage
