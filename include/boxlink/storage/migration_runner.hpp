/**
 * @file migration_runner.hpp
 * @brief Versioned schema migrations for the transfer database
 *
 * The schema is described as an ordered list of SQL scripts. Each script
 * runs in its own SQL transaction together with its schema_version row,
 * so a failing step leaves the database at the previous version.
 */

#pragma once

#include <boxlink/core/result.hpp>
#include <boxlink/storage/migration_record.hpp>

#include <string_view>
#include <vector>

struct sqlite3;

namespace boxlink::storage {

/**
 * @brief One schema version: the script that produces it
 */
struct migration_step {
    int version;
    std::string_view description;
    std::string_view sql;
};

/**
 * @brief The boxlink schema, oldest version first
 */
[[nodiscard]] auto transfer_schema_steps() -> const std::vector<migration_step>&;

class migration_runner {
public:
    /// Runner for the boxlink transfer schema
    migration_runner();

    /**
     * @brief Runner for a custom step list
     *
     * @p steps must be numbered 1..N in order.
     */
    explicit migration_runner(std::vector<migration_step> steps);

    migration_runner(const migration_runner&) = delete;
    auto operator=(const migration_runner&) -> migration_runner& = delete;

    [[nodiscard]] auto run_migrations(sqlite3* db) -> VoidResult;

    /**
     * @brief Apply pending steps up to and including @p target_version
     */
    [[nodiscard]] auto run_migrations_to(sqlite3* db, int target_version) -> VoidResult;

    /// 0 for a database that was never migrated
    [[nodiscard]] auto get_current_version(sqlite3* db) const -> int;

    [[nodiscard]] auto get_latest_version() const noexcept -> int;

    [[nodiscard]] auto needs_migration(sqlite3* db) const -> bool;

    [[nodiscard]] auto get_history(sqlite3* db) const -> std::vector<migration_record>;

private:
    [[nodiscard]] auto apply_step(sqlite3* db, const migration_step& step) -> VoidResult;

    std::vector<migration_step> steps_;
};

}  // namespace boxlink::storage
