/**
 * @file inbox_repository.cpp
 * @brief SQLite implementation of inbox persistence
 */

#include <boxlink/storage/inbox_repository.hpp>
#include <boxlink/storage/box_database.hpp>

#include "sqlite_helpers.hpp"

#include <sqlite3.h>

#include <string>

namespace boxlink::storage {

using detail::get_int64_column;

namespace {

constexpr const char* repository_name = "inbox_repository";

constexpr const char* select_columns = R"(
    SELECT id, remote_box_id, transaction_id, received_image_count, total_image_count
    FROM inbox_entries
)";

[[nodiscard]] client::inbox_entry parse_row(sqlite3_stmt* stmt) {
    client::inbox_entry entry;
    entry.id = get_int64_column(stmt, 0);
    entry.remote_box_id = get_int64_column(stmt, 1);
    entry.transaction_id = get_int64_column(stmt, 2);
    entry.received_image_count = get_int64_column(stmt, 3);
    entry.total_image_count = get_int64_column(stmt, 4);
    return entry;
}

}  // namespace

// =============================================================================
// Construction / Destruction
// =============================================================================

inbox_repository::inbox_repository(std::shared_ptr<box_database> db)
    : db_(std::move(db)) {}

inbox_repository::~inbox_repository() = default;

inbox_repository::inbox_repository(inbox_repository&&) noexcept = default;

auto inbox_repository::operator=(inbox_repository&&) noexcept
    -> inbox_repository& = default;

// =============================================================================
// Operations
// =============================================================================

Result<client::inbox_entry> inbox_repository::upsert_progress(
    std::int64_t remote_box_id,
    std::int64_t transaction_id,
    std::int64_t sequence_number,
    std::int64_t total_image_count) {
    auto guard = db_->lock();
    auto* db = db_->native_handle();

    static constexpr const char* sql = R"(
        INSERT INTO inbox_entries (
            remote_box_id, transaction_id, received_image_count, total_image_count
        ) VALUES (?, ?, ?, ?)
        ON CONFLICT(remote_box_id, transaction_id) DO UPDATE SET
            received_image_count = MAX(received_image_count, excluded.received_image_count),
            total_image_count = excluded.total_image_count,
            updated_at = datetime('now')
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return detail::prepare_error<client::inbox_entry>(db, repository_name);
    }

    sqlite3_bind_int64(stmt, 1, remote_box_id);
    sqlite3_bind_int64(stmt, 2, transaction_id);
    sqlite3_bind_int64(stmt, 3, sequence_number);
    sqlite3_bind_int64(stmt, 4, total_image_count);

    auto rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return detail::step_error<client::inbox_entry>(db, "upsert inbox progress",
                                                       repository_name);
    }

    auto entry = find_by_transaction(remote_box_id, transaction_id);
    if (!entry) {
        return make_error<client::inbox_entry>(
            error_codes::inbox_entry_not_found,
            "Inbox entry missing after upsert", repository_name);
    }
    return ok(*entry);
}

std::optional<client::inbox_entry> inbox_repository::find_by_transaction(
    std::int64_t remote_box_id, std::int64_t transaction_id) const {
    auto guard = db_->lock();
    auto* db = db_->native_handle();

    auto sql = std::string(select_columns) +
               " WHERE remote_box_id = ? AND transaction_id = ?";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }

    sqlite3_bind_int64(stmt, 1, remote_box_id);
    sqlite3_bind_int64(stmt, 2, transaction_id);

    std::optional<client::inbox_entry> result;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        result = parse_row(stmt);
    }

    sqlite3_finalize(stmt);
    return result;
}

std::optional<client::inbox_entry> inbox_repository::find_by_id(std::int64_t id) const {
    auto guard = db_->lock();
    auto* db = db_->native_handle();

    auto sql = std::string(select_columns) + " WHERE id = ?";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }

    sqlite3_bind_int64(stmt, 1, id);

    std::optional<client::inbox_entry> result;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        result = parse_row(stmt);
    }

    sqlite3_finalize(stmt);
    return result;
}

std::vector<client::inbox_entry> inbox_repository::find_all() const {
    std::vector<client::inbox_entry> result;
    auto guard = db_->lock();
    auto* db = db_->native_handle();

    auto sql = std::string(select_columns) + " ORDER BY id";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        return result;
    }

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        result.push_back(parse_row(stmt));
    }

    sqlite3_finalize(stmt);
    return result;
}

VoidResult inbox_repository::remove(std::int64_t id) {
    auto guard = db_->lock();
    auto* db = db_->native_handle();

    static constexpr const char* sql = "DELETE FROM inbox_entries WHERE id = ?";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return detail::void_prepare_error(db, repository_name);
    }

    sqlite3_bind_int64(stmt, 1, id);

    auto rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return detail::void_step_error(db, "delete inbox entry", repository_name);
    }

    return ok();
}

std::size_t inbox_repository::count() const {
    auto guard = db_->lock();
    auto* db = db_->native_handle();

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, "SELECT COUNT(*) FROM inbox_entries", -1, &stmt,
                           nullptr) != SQLITE_OK) {
        return 0;
    }

    std::size_t result = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        result = static_cast<std::size_t>(sqlite3_column_int64(stmt, 0));
    }

    sqlite3_finalize(stmt);
    return result;
}

}  // namespace boxlink::storage
