/**
 * @file migration_record.hpp
 * @brief Applied schema migration record
 */

#pragma once

#include <string>

namespace boxlink::storage {

/**
 * @brief One row of the schema_version table
 */
struct migration_record {
    int version;              ///< Schema version number
    std::string description;  ///< What the migration created or changed
    std::string applied_at;   ///< UTC timestamp written by SQLite
};

}  // namespace boxlink::storage
