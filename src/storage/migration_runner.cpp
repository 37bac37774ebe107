/**
 * @file migration_runner.cpp
 * @brief Transfer database schema and the runner that applies it
 */

#include <boxlink/storage/migration_runner.hpp>

#include <boxlink/compat/format.hpp>

#include <sqlite3.h>

#include <string>
#include <utility>

namespace boxlink::storage {

namespace {

constexpr std::string_view schema_version_ddl = R"(
    CREATE TABLE IF NOT EXISTS schema_version (
        version     INTEGER PRIMARY KEY,
        description TEXT NOT NULL,
        applied_at  TEXT NOT NULL DEFAULT (datetime('now'))
    );
)";

// v1: peers and the two transfer queues
constexpr std::string_view boxes_and_queues_sql = R"(
    CREATE TABLE IF NOT EXISTS boxes (
        id          INTEGER PRIMARY KEY AUTOINCREMENT,
        name        TEXT NOT NULL,
        token       TEXT NOT NULL UNIQUE,
        base_url    TEXT NOT NULL,
        send_method TEXT NOT NULL CHECK (send_method IN ('PUSH', 'POLL')),
        online      INTEGER NOT NULL DEFAULT 0,
        created_at  TEXT NOT NULL DEFAULT (datetime('now'))
    );

    CREATE INDEX IF NOT EXISTS idx_boxes_base_url ON boxes(base_url);

    CREATE TABLE IF NOT EXISTS outbox_entries (
        id                INTEGER PRIMARY KEY AUTOINCREMENT,
        remote_box_id     INTEGER NOT NULL REFERENCES boxes(id) ON DELETE CASCADE,
        transaction_id    INTEGER NOT NULL,
        sequence_number   INTEGER NOT NULL,
        total_image_count INTEGER NOT NULL,
        image_id          INTEGER NOT NULL,
        status            TEXT NOT NULL DEFAULT 'PENDING'
                          CHECK (status IN ('PENDING', 'WAITING', 'FAILED')),
        created_at        TEXT NOT NULL DEFAULT (datetime('now')),
        UNIQUE (remote_box_id, transaction_id, sequence_number),
        CHECK (sequence_number >= 1 AND sequence_number <= total_image_count)
    );

    CREATE INDEX IF NOT EXISTS idx_outbox_box_order
        ON outbox_entries(remote_box_id, id);
    CREATE INDEX IF NOT EXISTS idx_outbox_transaction
        ON outbox_entries(transaction_id);

    CREATE TABLE IF NOT EXISTS inbox_entries (
        id                   INTEGER PRIMARY KEY AUTOINCREMENT,
        remote_box_id        INTEGER NOT NULL REFERENCES boxes(id) ON DELETE CASCADE,
        transaction_id       INTEGER NOT NULL,
        received_image_count INTEGER NOT NULL,
        total_image_count    INTEGER NOT NULL,
        updated_at           TEXT NOT NULL DEFAULT (datetime('now')),
        UNIQUE (remote_box_id, transaction_id)
    );
)";

// v2: per-image tag overrides handed to the anonymizer
constexpr std::string_view tag_values_sql = R"(
    CREATE TABLE IF NOT EXISTS outbox_tag_values (
        id             INTEGER PRIMARY KEY AUTOINCREMENT,
        remote_box_id  INTEGER NOT NULL REFERENCES boxes(id) ON DELETE CASCADE,
        transaction_id INTEGER NOT NULL,
        image_id       INTEGER NOT NULL,
        tag            INTEGER NOT NULL,
        value          TEXT NOT NULL,
        UNIQUE (transaction_id, image_id, tag)
    );

    CREATE INDEX IF NOT EXISTS idx_tag_values_lookup
        ON outbox_tag_values(transaction_id, image_id);
)";

VoidResult exec(sqlite3* db, std::string_view sql) {
    char* errmsg = nullptr;
    const std::string script(sql);
    if (sqlite3_exec(db, script.c_str(), nullptr, nullptr, &errmsg) != SQLITE_OK) {
        std::string message = errmsg ? errmsg : sqlite3_errmsg(db);
        sqlite3_free(errmsg);
        return boxlink_void_error(error_codes::database_migration_error,
                                  "SQL execution failed: " + message);
    }
    return ok();
}

bool has_version_table(sqlite3* db) {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db,
                           "SELECT 1 FROM sqlite_master "
                           "WHERE type='table' AND name='schema_version';",
                           -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }
    const bool found = sqlite3_step(stmt) == SQLITE_ROW;
    sqlite3_finalize(stmt);
    return found;
}

std::string column_text(sqlite3_stmt* stmt, int col) {
    const auto* text = sqlite3_column_text(stmt, col);
    return text ? reinterpret_cast<const char*>(text) : std::string{};
}

}  // namespace

auto transfer_schema_steps() -> const std::vector<migration_step>& {
    static const std::vector<migration_step> steps{
        {1, "Boxes, outbox and inbox", boxes_and_queues_sql},
        {2, "Outbox tag value overrides", tag_values_sql},
    };
    return steps;
}

migration_runner::migration_runner() : steps_(transfer_schema_steps()) {}

migration_runner::migration_runner(std::vector<migration_step> steps)
    : steps_(std::move(steps)) {}

// ============================================================================
// Applying
// ============================================================================

auto migration_runner::run_migrations(sqlite3* db) -> VoidResult {
    return run_migrations_to(db, get_latest_version());
}

auto migration_runner::run_migrations_to(sqlite3* db, int target_version) -> VoidResult {
    if (target_version > get_latest_version()) {
        return boxlink_void_error(
            error_codes::database_migration_error,
            boxlink::compat::format("Target version {} exceeds latest version {}",
                                    target_version, get_latest_version()));
    }

    auto table = exec(db, schema_version_ddl);
    if (table.is_err()) {
        return table;
    }

    const int current = get_current_version(db);
    for (const auto& step : steps_) {
        if (step.version <= current || step.version > target_version) {
            continue;
        }
        auto applied = apply_step(db, step);
        if (applied.is_err()) {
            return applied;
        }
    }
    return ok();
}

auto migration_runner::apply_step(sqlite3* db, const migration_step& step) -> VoidResult {
    auto begin = exec(db, "BEGIN IMMEDIATE;");
    if (begin.is_err()) {
        return begin;
    }

    auto body = exec(db, step.sql);
    if (body.is_ok()) {
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(db,
                               "INSERT INTO schema_version (version, description) "
                               "VALUES (?, ?);",
                               -1, &stmt, nullptr) != SQLITE_OK) {
            body = boxlink_void_error(error_codes::database_migration_error,
                                      std::string("Failed to record migration: ") +
                                          sqlite3_errmsg(db));
        } else {
            sqlite3_bind_int(stmt, 1, step.version);
            sqlite3_bind_text(stmt, 2, step.description.data(),
                              static_cast<int>(step.description.size()), SQLITE_TRANSIENT);
            if (sqlite3_step(stmt) != SQLITE_DONE) {
                body = boxlink_void_error(error_codes::database_migration_error,
                                          std::string("Failed to record migration: ") +
                                              sqlite3_errmsg(db));
            }
            sqlite3_finalize(stmt);
        }
    }

    if (body.is_err()) {
        (void)exec(db, "ROLLBACK;");
        return boxlink_void_error(
            error_codes::database_migration_error,
            boxlink::compat::format("Migration to v{} ({}) failed: {}", step.version,
                                    step.description, body.error().message));
    }

    auto commit = exec(db, "COMMIT;");
    if (commit.is_err()) {
        (void)exec(db, "ROLLBACK;");
    }
    return commit;
}

// ============================================================================
// Version queries
// ============================================================================

auto migration_runner::get_current_version(sqlite3* db) const -> int {
    if (!has_version_table(db)) {
        return 0;
    }

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, "SELECT COALESCE(MAX(version), 0) FROM schema_version;",
                           -1, &stmt, nullptr) != SQLITE_OK) {
        return 0;
    }
    const int version = sqlite3_step(stmt) == SQLITE_ROW ? sqlite3_column_int(stmt, 0) : 0;
    sqlite3_finalize(stmt);
    return version;
}

auto migration_runner::get_latest_version() const noexcept -> int {
    return steps_.empty() ? 0 : steps_.back().version;
}

auto migration_runner::needs_migration(sqlite3* db) const -> bool {
    return get_current_version(db) < get_latest_version();
}

auto migration_runner::get_history(sqlite3* db) const -> std::vector<migration_record> {
    std::vector<migration_record> history;
    if (!has_version_table(db)) {
        return history;
    }

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db,
                           "SELECT version, description, applied_at "
                           "FROM schema_version ORDER BY version;",
                           -1, &stmt, nullptr) != SQLITE_OK) {
        return history;
    }
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        history.push_back({sqlite3_column_int(stmt, 0), column_text(stmt, 1),
                           column_text(stmt, 2)});
    }
    sqlite3_finalize(stmt);
    return history;
}

}  // namespace boxlink::storage
