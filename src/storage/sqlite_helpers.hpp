/**
 * @file sqlite_helpers.hpp
 * @brief Column and error helpers shared by the SQLite repositories
 */

#pragma once

#include <boxlink/core/result.hpp>
#include <boxlink/compat/format.hpp>

#include <sqlite3.h>

#include <cstdint>
#include <string>

namespace boxlink::storage::detail {

/// Get text column safely (returns empty string if NULL)
[[nodiscard]] inline std::string get_text_column(sqlite3_stmt* stmt, int col) {
    auto text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return text ? text : "";
}

/// Get int64 column with default
[[nodiscard]] inline std::int64_t get_int64_column(sqlite3_stmt* stmt, int col,
                                                   std::int64_t default_val = 0) {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) {
        return default_val;
    }
    return sqlite3_column_int64(stmt, col);
}

/// Error for a failed sqlite3_prepare_v2
template <typename T>
[[nodiscard]] inline Result<T> prepare_error(sqlite3* db, const char* repository) {
    return make_error<T>(
        error_codes::database_query_error,
        boxlink::compat::format("Failed to prepare statement: {}", sqlite3_errmsg(db)),
        repository);
}

/// Error for a failed sqlite3_step
template <typename T>
[[nodiscard]] inline Result<T> step_error(sqlite3* db, const char* action,
                                          const char* repository) {
    return make_error<T>(
        error_codes::database_query_error,
        boxlink::compat::format("Failed to {}: {}", action, sqlite3_errmsg(db)),
        repository);
}

[[nodiscard]] inline VoidResult void_prepare_error(sqlite3* db, const char* repository) {
    return VoidResult(error_info{
        error_codes::database_query_error,
        boxlink::compat::format("Failed to prepare statement: {}", sqlite3_errmsg(db)),
        repository});
}

[[nodiscard]] inline VoidResult void_step_error(sqlite3* db, const char* action,
                                                const char* repository) {
    return VoidResult(error_info{
        error_codes::database_query_error,
        boxlink::compat::format("Failed to {}: {}", action, sqlite3_errmsg(db)),
        repository});
}

}  // namespace boxlink::storage::detail
