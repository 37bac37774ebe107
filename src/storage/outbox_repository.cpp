/**
 * @file outbox_repository.cpp
 * @brief SQLite implementation of outbox persistence
 */

#include <boxlink/storage/outbox_repository.hpp>
#include <boxlink/storage/box_database.hpp>

#include "sqlite_helpers.hpp"

#include <sqlite3.h>

#include <string>

namespace boxlink::storage {

using detail::get_int64_column;
using detail::get_text_column;

namespace {

constexpr const char* repository_name = "outbox_repository";

constexpr const char* select_columns = R"(
    SELECT id, remote_box_id, transaction_id, sequence_number,
           total_image_count, image_id, status
    FROM outbox_entries
)";

[[nodiscard]] client::outbox_entry parse_row(sqlite3_stmt* stmt) {
    client::outbox_entry entry;
    entry.id = get_int64_column(stmt, 0);
    entry.remote_box_id = get_int64_column(stmt, 1);
    entry.transaction_id = get_int64_column(stmt, 2);
    entry.sequence_number = get_int64_column(stmt, 3);
    entry.total_image_count = get_int64_column(stmt, 4);
    entry.image_id = get_int64_column(stmt, 5);
    entry.status = client::transaction_status_from_string(get_text_column(stmt, 6));
    return entry;
}

}  // namespace

// =============================================================================
// Construction / Destruction
// =============================================================================

outbox_repository::outbox_repository(std::shared_ptr<box_database> db)
    : db_(std::move(db)) {}

outbox_repository::~outbox_repository() = default;

outbox_repository::outbox_repository(outbox_repository&&) noexcept = default;

auto outbox_repository::operator=(outbox_repository&&) noexcept
    -> outbox_repository& = default;

// =============================================================================
// Entries
// =============================================================================

Result<std::int64_t> outbox_repository::insert(const client::outbox_entry& entry) {
    auto guard = db_->lock();
    auto* db = db_->native_handle();

    static constexpr const char* sql = R"(
        INSERT INTO outbox_entries (
            remote_box_id, transaction_id, sequence_number,
            total_image_count, image_id, status
        ) VALUES (?, ?, ?, ?, ?, ?)
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return detail::prepare_error<std::int64_t>(db, repository_name);
    }

    int idx = 1;
    sqlite3_bind_int64(stmt, idx++, entry.remote_box_id);
    sqlite3_bind_int64(stmt, idx++, entry.transaction_id);
    sqlite3_bind_int64(stmt, idx++, entry.sequence_number);
    sqlite3_bind_int64(stmt, idx++, entry.total_image_count);
    sqlite3_bind_int64(stmt, idx++, entry.image_id);
    sqlite3_bind_text(stmt, idx++, client::to_string(entry.status), -1, SQLITE_STATIC);

    auto rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return detail::step_error<std::int64_t>(db, "insert outbox entry", repository_name);
    }

    auto id = static_cast<std::int64_t>(sqlite3_last_insert_rowid(db));
    return ok(id);
}

std::optional<client::outbox_entry> outbox_repository::find_by_id(std::int64_t id) const {
    auto rows = query_entries("WHERE id = ?", id, 0, 0, 1);
    if (rows.empty()) {
        return std::nullopt;
    }
    return rows.front();
}

std::optional<client::outbox_entry> outbox_repository::find_next_pending(
    std::int64_t remote_box_id) const {
    auto rows = query_entries(
        "WHERE remote_box_id = ? AND status <> 'FAILED' ORDER BY id ASC LIMIT 1",
        remote_box_id, 0, 0, 1);
    if (rows.empty()) {
        return std::nullopt;
    }
    return rows.front();
}

std::optional<client::outbox_entry> outbox_repository::find_by_transaction_and_sequence(
    std::int64_t remote_box_id,
    std::int64_t transaction_id,
    std::int64_t sequence_number) const {
    auto rows = query_entries(
        "WHERE remote_box_id = ? AND transaction_id = ? AND sequence_number = ?",
        remote_box_id, transaction_id, sequence_number, 3);
    if (rows.empty()) {
        return std::nullopt;
    }
    return rows.front();
}

std::vector<client::outbox_entry> outbox_repository::find_by_transaction(
    std::int64_t remote_box_id, std::int64_t transaction_id) const {
    return query_entries(
        "WHERE remote_box_id = ? AND transaction_id = ? ORDER BY sequence_number",
        remote_box_id, transaction_id, 0, 2);
}

std::vector<client::outbox_entry> outbox_repository::find_by_box(
    std::int64_t remote_box_id) const {
    return query_entries("WHERE remote_box_id = ? ORDER BY id", remote_box_id, 0, 0, 1);
}

std::vector<client::outbox_entry> outbox_repository::find_all() const {
    return query_entries("ORDER BY id", 0, 0, 0, 0);
}

VoidResult outbox_repository::remove(std::int64_t id) {
    return delete_where("DELETE FROM outbox_entries WHERE id = ?", id, 0, 1,
                        "delete outbox entry");
}

VoidResult outbox_repository::remove_by_box(std::int64_t remote_box_id) {
    return delete_where("DELETE FROM outbox_entries WHERE remote_box_id = ?",
                        remote_box_id, 0, 1, "delete outbox entries");
}

VoidResult outbox_repository::update_transaction_status(
    std::int64_t remote_box_id,
    std::int64_t transaction_id,
    client::transaction_status status) {
    auto guard = db_->lock();
    auto* db = db_->native_handle();

    static constexpr const char* sql = R"(
        UPDATE outbox_entries SET status = ?
        WHERE remote_box_id = ? AND transaction_id = ?
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return detail::void_prepare_error(db, repository_name);
    }

    sqlite3_bind_text(stmt, 1, client::to_string(status), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 2, remote_box_id);
    sqlite3_bind_int64(stmt, 3, transaction_id);

    auto rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return detail::void_step_error(db, "update transaction status", repository_name);
    }

    return ok();
}

std::size_t outbox_repository::count() const {
    auto guard = db_->lock();
    auto* db = db_->native_handle();

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, "SELECT COUNT(*) FROM outbox_entries", -1, &stmt,
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

// =============================================================================
// Tag Values
// =============================================================================

VoidResult outbox_repository::insert_tag_value(const client::outbox_tag_value& value) {
    auto guard = db_->lock();
    auto* db = db_->native_handle();

    static constexpr const char* sql = R"(
        INSERT INTO outbox_tag_values (remote_box_id, transaction_id, image_id, tag, value)
        VALUES (?, ?, ?, ?, ?)
        ON CONFLICT(transaction_id, image_id, tag) DO UPDATE SET value = excluded.value
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return detail::void_prepare_error(db, repository_name);
    }

    int idx = 1;
    sqlite3_bind_int64(stmt, idx++, value.remote_box_id);
    sqlite3_bind_int64(stmt, idx++, value.transaction_id);
    sqlite3_bind_int64(stmt, idx++, value.image_id);
    sqlite3_bind_int64(stmt, idx++, static_cast<sqlite3_int64>(value.tag));
    sqlite3_bind_text(stmt, idx++, value.value.c_str(), -1, SQLITE_TRANSIENT);

    auto rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return detail::void_step_error(db, "insert tag value", repository_name);
    }

    return ok();
}

std::vector<client::outbox_tag_value> outbox_repository::find_tag_values(
    std::int64_t transaction_id, std::int64_t image_id) const {
    std::vector<client::outbox_tag_value> result;
    auto guard = db_->lock();
    auto* db = db_->native_handle();

    static constexpr const char* sql = R"(
        SELECT remote_box_id, transaction_id, image_id, tag, value
        FROM outbox_tag_values
        WHERE transaction_id = ? AND image_id = ?
        ORDER BY tag
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return result;
    }

    sqlite3_bind_int64(stmt, 1, transaction_id);
    sqlite3_bind_int64(stmt, 2, image_id);

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        client::outbox_tag_value value;
        value.remote_box_id = get_int64_column(stmt, 0);
        value.transaction_id = get_int64_column(stmt, 1);
        value.image_id = get_int64_column(stmt, 2);
        value.tag = static_cast<std::uint32_t>(get_int64_column(stmt, 3));
        value.value = get_text_column(stmt, 4);
        result.push_back(std::move(value));
    }

    sqlite3_finalize(stmt);
    return result;
}

VoidResult outbox_repository::remove_tag_values(std::int64_t remote_box_id,
                                                std::int64_t transaction_id) {
    return delete_where(
        "DELETE FROM outbox_tag_values WHERE remote_box_id = ? AND transaction_id = ?",
        remote_box_id, transaction_id, 2, "delete tag values");
}

VoidResult outbox_repository::remove_tag_values_by_box(std::int64_t remote_box_id) {
    return delete_where("DELETE FROM outbox_tag_values WHERE remote_box_id = ?",
                        remote_box_id, 0, 1, "delete tag values");
}

// =============================================================================
// Internal Helpers
// =============================================================================

std::vector<client::outbox_entry> outbox_repository::query_entries(
    const char* where_clause,
    std::int64_t first,
    std::int64_t second,
    std::int64_t third,
    int bind_count) const {
    std::vector<client::outbox_entry> result;
    auto guard = db_->lock();
    auto* db = db_->native_handle();

    auto sql = std::string(select_columns) + where_clause;

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        return result;
    }

    const std::int64_t params[] = {first, second, third};
    for (int i = 0; i < bind_count; ++i) {
        sqlite3_bind_int64(stmt, i + 1, params[i]);
    }

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        result.push_back(parse_row(stmt));
    }

    sqlite3_finalize(stmt);
    return result;
}

VoidResult outbox_repository::delete_where(const char* sql, std::int64_t first,
                                           std::int64_t second, int bind_count,
                                           const char* action) {
    auto guard = db_->lock();
    auto* db = db_->native_handle();

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return detail::void_prepare_error(db, repository_name);
    }

    if (bind_count >= 1) {
        sqlite3_bind_int64(stmt, 1, first);
    }
    if (bind_count >= 2) {
        sqlite3_bind_int64(stmt, 2, second);
    }

    auto rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return detail::void_step_error(db, action, repository_name);
    }

    return ok();
}

}  // namespace boxlink::storage
