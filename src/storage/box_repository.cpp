/**
 * @file box_repository.cpp
 * @brief SQLite implementation of box persistence
 */

#include <boxlink/storage/box_repository.hpp>
#include <boxlink/storage/box_database.hpp>

#include "sqlite_helpers.hpp"

#include <sqlite3.h>

namespace boxlink::storage {

using detail::get_int64_column;
using detail::get_text_column;

namespace {

constexpr const char* repository_name = "box_repository";

constexpr const char* select_columns =
    "SELECT id, name, token, base_url, send_method, online FROM boxes";

[[nodiscard]] client::box parse_row(sqlite3_stmt* stmt) {
    client::box b;
    b.id = get_int64_column(stmt, 0);
    b.name = get_text_column(stmt, 1);
    b.token = get_text_column(stmt, 2);
    b.base_url = get_text_column(stmt, 3);
    b.method = client::send_method_from_string(get_text_column(stmt, 4));
    b.online = get_int64_column(stmt, 5) != 0;
    return b;
}

}  // namespace

// =============================================================================
// Construction / Destruction
// =============================================================================

box_repository::box_repository(std::shared_ptr<box_database> db) : db_(std::move(db)) {}

box_repository::~box_repository() = default;

box_repository::box_repository(box_repository&&) noexcept = default;

auto box_repository::operator=(box_repository&&) noexcept -> box_repository& = default;

// =============================================================================
// CRUD Operations
// =============================================================================

Result<std::int64_t> box_repository::insert(const client::box& b) {
    auto guard = db_->lock();
    auto* db = db_->native_handle();

    static constexpr const char* sql = R"(
        INSERT INTO boxes (name, token, base_url, send_method, online)
        VALUES (?, ?, ?, ?, ?)
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return detail::prepare_error<std::int64_t>(db, repository_name);
    }

    int idx = 1;
    sqlite3_bind_text(stmt, idx++, b.name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, idx++, b.token.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, idx++, b.base_url.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, idx++, client::to_string(b.method), -1, SQLITE_STATIC);
    sqlite3_bind_int(stmt, idx++, b.online ? 1 : 0);

    auto rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc == SQLITE_CONSTRAINT) {
        return make_error<std::int64_t>(
            error_codes::duplicate_box,
            "A box with this token is already registered", repository_name);
    }
    if (rc != SQLITE_DONE) {
        return detail::step_error<std::int64_t>(db, "insert box", repository_name);
    }

    auto id = static_cast<std::int64_t>(sqlite3_last_insert_rowid(db));
    return ok(id);
}

std::optional<client::box> box_repository::find_by_id(std::int64_t id) const {
    auto guard = db_->lock();
    auto* db = db_->native_handle();

    auto sql = std::string(select_columns) + " WHERE id = ?";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }

    sqlite3_bind_int64(stmt, 1, id);

    std::optional<client::box> result;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        result = parse_row(stmt);
    }

    sqlite3_finalize(stmt);
    return result;
}

std::optional<client::box> box_repository::find_by_token(std::string_view token) const {
    auto guard = db_->lock();
    auto* db = db_->native_handle();

    auto sql = std::string(select_columns) + " WHERE token = ?";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }

    sqlite3_bind_text(stmt, 1, token.data(), static_cast<int>(token.size()), SQLITE_TRANSIENT);

    std::optional<client::box> result;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        result = parse_row(stmt);
    }

    sqlite3_finalize(stmt);
    return result;
}

std::optional<client::box> box_repository::find_by_base_url(
    std::string_view base_url, client::send_method method) const {
    auto guard = db_->lock();
    auto* db = db_->native_handle();

    auto sql = std::string(select_columns) +
               " WHERE base_url = ? AND send_method = ? ORDER BY id LIMIT 1";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }

    sqlite3_bind_text(stmt, 1, base_url.data(), static_cast<int>(base_url.size()),
                      SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, client::to_string(method), -1, SQLITE_STATIC);

    std::optional<client::box> result;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        result = parse_row(stmt);
    }

    sqlite3_finalize(stmt);
    return result;
}

std::vector<client::box> box_repository::find_all() const {
    std::vector<client::box> result;
    auto guard = db_->lock();
    auto* db = db_->native_handle();

    auto sql = std::string(select_columns) + " ORDER BY name, id";

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

std::vector<client::box> box_repository::find_by_method(client::send_method method) const {
    std::vector<client::box> result;
    auto guard = db_->lock();
    auto* db = db_->native_handle();

    auto sql = std::string(select_columns) + " WHERE send_method = ? ORDER BY id";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        return result;
    }

    sqlite3_bind_text(stmt, 1, client::to_string(method), -1, SQLITE_STATIC);

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        result.push_back(parse_row(stmt));
    }

    sqlite3_finalize(stmt);
    return result;
}

VoidResult box_repository::update_online(std::int64_t id, bool online) {
    auto guard = db_->lock();
    auto* db = db_->native_handle();

    static constexpr const char* sql = "UPDATE boxes SET online = ? WHERE id = ?";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return detail::void_prepare_error(db, repository_name);
    }

    sqlite3_bind_int(stmt, 1, online ? 1 : 0);
    sqlite3_bind_int64(stmt, 2, id);

    auto rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return detail::void_step_error(db, "update online status", repository_name);
    }

    return ok();
}

VoidResult box_repository::remove(std::int64_t id) {
    auto guard = db_->lock();
    auto* db = db_->native_handle();

    static constexpr const char* sql = "DELETE FROM boxes WHERE id = ?";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return detail::void_prepare_error(db, repository_name);
    }

    sqlite3_bind_int64(stmt, 1, id);

    auto rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return detail::void_step_error(db, "delete box", repository_name);
    }

    return ok();
}

std::size_t box_repository::count() const {
    auto guard = db_->lock();
    auto* db = db_->native_handle();

    static constexpr const char* sql = "SELECT COUNT(*) FROM boxes";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
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
