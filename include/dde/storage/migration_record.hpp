/**
 * @file migration_record.hpp
 * @brief Applied schema migration entry
 */

#pragma once

#include <string>

namespace dde::storage {

/**
 * @brief One row of the schema_version table
 */
struct migration_record {
    int version;              ///< Schema version number
    std::string description;  ///< What the migration changed
    std::string applied_at;   ///< When the migration was applied (UTC text)
};

}  // namespace dde::storage
