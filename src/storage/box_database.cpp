/**
 * @file box_database.cpp
 * @brief Implementation of the transfer database connection
 */

#include <boxlink/storage/box_database.hpp>

#include <boxlink/compat/format.hpp>

#include <sqlite3.h>

namespace boxlink::storage {

auto box_database::open(std::string_view db_path)
    -> Result<std::shared_ptr<box_database>> {
    return open(db_path, database_config{});
}

auto box_database::open(std::string_view db_path, const database_config& config)
    -> Result<std::shared_ptr<box_database>> {
    sqlite3* db = nullptr;

    auto rc = sqlite3_open(std::string(db_path).c_str(), &db);
    if (rc != SQLITE_OK) {
        std::string error_msg = db ? sqlite3_errmsg(db) : "Failed to allocate memory";
        if (db) {
            sqlite3_close(db);
        }
        return boxlink_error<std::shared_ptr<box_database>>(
            error_codes::database_open_error,
            boxlink::compat::format("Failed to open database: {}", error_msg));
    }

    rc = sqlite3_exec(db, "PRAGMA foreign_keys = ON;", nullptr, nullptr, nullptr);
    if (rc != SQLITE_OK) {
        sqlite3_close(db);
        return boxlink_error<std::shared_ptr<box_database>>(
            error_codes::database_open_error, "Failed to enable foreign keys");
    }

    if (config.wal_mode && db_path != ":memory:") {
        rc = sqlite3_exec(db, "PRAGMA journal_mode = WAL;", nullptr, nullptr, nullptr);
        if (rc != SQLITE_OK) {
            sqlite3_close(db);
            return boxlink_error<std::shared_ptr<box_database>>(
                error_codes::database_open_error, "Failed to enable WAL mode");
        }
    }

    // Not critical when unsupported
    (void)sqlite3_exec(db, "PRAGMA synchronous = NORMAL;", nullptr, nullptr, nullptr);
    sqlite3_busy_timeout(db, config.busy_timeout_ms);

    auto instance = std::shared_ptr<box_database>(
        new box_database(db, std::string(db_path)));

    auto migration_result = instance->migration_runner_.run_migrations(db);
    if (migration_result.is_err()) {
        return boxlink_error<std::shared_ptr<box_database>>(
            error_codes::database_migration_error,
            boxlink::compat::format("Migration failed: {}",
                                    migration_result.error().message));
    }

    return instance;
}

box_database::box_database(sqlite3* db, std::string path)
    : db_(db), path_(std::move(path)) {}

box_database::~box_database() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

auto box_database::native_handle() const noexcept -> sqlite3* {
    return db_;
}

auto box_database::lock() const -> std::unique_lock<std::recursive_mutex> {
    return std::unique_lock<std::recursive_mutex>(mutex_);
}

auto box_database::with_transaction(const std::function<VoidResult()>& body)
    -> VoidResult {
    auto guard = lock();

    if (transaction_depth_ > 0) {
        ++transaction_depth_;
        auto result = body();
        --transaction_depth_;
        return result;
    }

    auto begin_result = execute("BEGIN IMMEDIATE;");
    if (begin_result.is_err()) {
        return begin_result;
    }

    ++transaction_depth_;
    auto result = body();
    --transaction_depth_;

    if (result.is_err()) {
        (void)execute("ROLLBACK;");
        return result;
    }

    auto commit_result = execute("COMMIT;");
    if (commit_result.is_err()) {
        (void)execute("ROLLBACK;");
        return commit_result;
    }

    return ok();
}

auto box_database::path() const noexcept -> const std::string& {
    return path_;
}

auto box_database::schema_version() const -> int {
    auto guard = lock();
    return migration_runner_.get_current_version(db_);
}

auto box_database::execute(const char* sql) -> VoidResult {
    char* errmsg = nullptr;
    auto rc = sqlite3_exec(db_, sql, nullptr, nullptr, &errmsg);
    if (rc != SQLITE_OK) {
        auto error_str = errmsg ? std::string(errmsg) : "Unknown error";
        sqlite3_free(errmsg);
        return boxlink_void_error(
            error_codes::database_transaction_error,
            boxlink::compat::format("Transaction statement '{}' failed: {}", sql, error_str));
    }
    return ok();
}

}  // namespace boxlink::storage
