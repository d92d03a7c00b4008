/**
 * @file migration_runner.hpp
 * @brief Database schema migration runner
 *
 * This file provides the migration_runner class for managing the schema
 * of the DDE SQLite store. Migrations are applied in order and each one
 * runs inside its own transaction.
 *
 * Schema versions:
 * - V1: form instances, field data, discrepancies and audit log tables
 * - V2: lookup indexes and append-only triggers on the audit log
 */

#pragma once

#include <dde/core/result.hpp>
#include <dde/storage/migration_record.hpp>

#include <string_view>
#include <vector>

// Forward declaration of SQLite handle
struct sqlite3;

namespace dde::storage {

/**
 * @brief One versioned schema change
 */
struct schema_migration {
    int version;
    std::string_view description;
    std::string_view sql;
};

/**
 * @brief Applies versioned schema migrations to a SQLite database
 *
 * The current version is tracked in the schema_version table. Each pending
 * migration runs in its own transaction together with its schema_version
 * row, so a failed step leaves the previous version intact. Running on an
 * up-to-date database is a no-op.
 *
 * @example
 * @code
 * migration_runner runner;
 * auto result = runner.run_migrations(db);
 * if (result.is_err()) {
 *     // handle error
 * }
 * @endcode
 */
class migration_runner {
public:
    [[nodiscard]] auto run_migrations(sqlite3* db) const -> VoidResult;

    /**
     * @brief Run migrations up to a specific version
     * @return database_migration_error for a version beyond the latest
     */
    [[nodiscard]] auto run_migrations_to(sqlite3* db, int target_version) const
        -> VoidResult;

    /**
     * @brief Current schema version (0 when nothing has been applied)
     */
    [[nodiscard]] auto get_current_version(sqlite3* db) const -> int;

    [[nodiscard]] auto get_latest_version() const noexcept -> int;

    [[nodiscard]] auto needs_migration(sqlite3* db) const -> bool;

    /**
     * @brief Applied migrations in version order
     */
    [[nodiscard]] auto get_history(sqlite3* db) const
        -> std::vector<migration_record>;

private:
    [[nodiscard]] static auto apply(sqlite3* db, const schema_migration& step)
        -> VoidResult;

    [[nodiscard]] static auto exec(sqlite3* db, std::string_view sql)
        -> VoidResult;
};

}  // namespace dde::storage
