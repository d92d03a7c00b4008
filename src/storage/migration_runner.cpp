/**
 * @file migration_runner.cpp
 * @brief Implementation of database schema migration runner
 */

#include <dde/storage/migration_runner.hpp>

#include <dde/compat/format.hpp>
#include <dde/integration/logger_adapter.hpp>

#include <sqlite3.h>

#include <array>
#include <string>

namespace dde::storage {

using integration::logger_adapter;

namespace {

// ============================================================================
// Schema Versions
// ============================================================================

constexpr std::string_view schema_version_table = R"(
    CREATE TABLE IF NOT EXISTS schema_version (
        version     INTEGER PRIMARY KEY,
        description TEXT NOT NULL,
        applied_at  TEXT NOT NULL DEFAULT (datetime('now'))
    );
)";

constexpr std::string_view v1_tables = R"(
        -- =====================================================================
        -- FORM INSTANCES TABLE
        -- completion_status_id holds the shared completion status code (1..5)
        -- second_entry_values holds the JSON second-entry snapshot
        -- =====================================================================
        CREATE TABLE IF NOT EXISTS form_instances (
            form_instance_id      INTEGER PRIMARY KEY AUTOINCREMENT,
            subject_label         TEXT NOT NULL DEFAULT '',
            site_id               TEXT NOT NULL DEFAULT '',
            form_name             TEXT NOT NULL DEFAULT '',
            event_name            TEXT NOT NULL DEFAULT '',
            double_entry_required INTEGER NOT NULL DEFAULT 0,
            completion_status_id  INTEGER NOT NULL DEFAULT 1,
            first_entry_by        TEXT,
            first_entry_at        TEXT,
            second_entry_by       TEXT,
            second_entry_at       TEXT,
            second_entry_values   TEXT,
            completed_at          TEXT,
            created_at            TEXT NOT NULL DEFAULT (datetime('now')),
            updated_at            TEXT NOT NULL DEFAULT (datetime('now'))
        );

        -- =====================================================================
        -- FIELD DATA TABLE (authoritative first-entry values)
        -- =====================================================================
        CREATE TABLE IF NOT EXISTS field_data (
            field_id          INTEGER PRIMARY KEY AUTOINCREMENT,
            form_instance_id  INTEGER NOT NULL
                REFERENCES form_instances(form_instance_id),
            item_id           INTEGER NOT NULL,
            item_name         TEXT NOT NULL DEFAULT '',
            value             TEXT,
            updated_by        TEXT,
            updated_at        TEXT NOT NULL DEFAULT (datetime('now')),
            UNIQUE (form_instance_id, item_id)
        );

        -- =====================================================================
        -- DISCREPANCIES TABLE
        -- =====================================================================
        CREATE TABLE IF NOT EXISTS dde_discrepancies (
            discrepancy_id      INTEGER PRIMARY KEY AUTOINCREMENT,
            form_instance_id    INTEGER NOT NULL
                REFERENCES form_instances(form_instance_id),
            field_id            INTEGER NOT NULL REFERENCES field_data(field_id),
            item_id             INTEGER NOT NULL,
            first_value         TEXT NOT NULL DEFAULT '',
            second_value        TEXT NOT NULL DEFAULT '',
            resolution_status   TEXT NOT NULL DEFAULT 'open'
                CHECK (resolution_status IN ('open', 'resolved')),
            resolution_strategy TEXT,
            resolved_value      TEXT,
            resolved_by         TEXT,
            resolved_at         TEXT,
            resolution_notes    TEXT,
            created_at          TEXT NOT NULL DEFAULT (datetime('now'))
        );

        -- =====================================================================
        -- AUDIT LOG TABLE
        -- =====================================================================
        CREATE TABLE IF NOT EXISTS audit_log_events (
            audit_id          INTEGER PRIMARY KEY AUTOINCREMENT,
            audit_date        TEXT NOT NULL,
            user_id           TEXT NOT NULL,
            audit_table       TEXT NOT NULL,
            entity_id         INTEGER NOT NULL,
            entity_name       TEXT NOT NULL DEFAULT '',
            old_value         TEXT,
            new_value         TEXT,
            reason_for_change TEXT,
            form_instance_id  INTEGER
        );
)";

constexpr std::string_view v2_indexes_and_triggers = R"(
        CREATE INDEX IF NOT EXISTS idx_form_instances_status
            ON form_instances(completion_status_id);
        CREATE INDEX IF NOT EXISTS idx_form_instances_site
            ON form_instances(site_id);
        CREATE INDEX IF NOT EXISTS idx_field_data_form
            ON field_data(form_instance_id);
        CREATE INDEX IF NOT EXISTS idx_discrepancies_form
            ON dde_discrepancies(form_instance_id);
        CREATE INDEX IF NOT EXISTS idx_discrepancies_field
            ON dde_discrepancies(field_id);
        CREATE INDEX IF NOT EXISTS idx_discrepancies_status
            ON dde_discrepancies(resolution_status);
        CREATE INDEX IF NOT EXISTS idx_audit_form
            ON audit_log_events(form_instance_id);

        -- Audit entries are append-only
        CREATE TRIGGER IF NOT EXISTS trg_audit_log_no_update
            BEFORE UPDATE ON audit_log_events
        BEGIN
            SELECT RAISE(ABORT, 'audit_log_events is append-only');
        END;

        CREATE TRIGGER IF NOT EXISTS trg_audit_log_no_delete
            BEFORE DELETE ON audit_log_events
        BEGIN
            SELECT RAISE(ABORT, 'audit_log_events is append-only');
        END;
)";

constexpr std::array<schema_migration, 2> migrations{{
    {1, "Initial DDE schema", v1_tables},
    {2, "Indexes and append-only audit log", v2_indexes_and_triggers},
}};

auto migration_error(std::string message) -> VoidResult {
    return dde_void_error(error_codes::database_migration_error, message);
}

auto column_text(sqlite3_stmt* stmt, int col) -> std::string {
    const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return text ? text : "";
}

}  // namespace

// ============================================================================
// Migration Operations
// ============================================================================

auto migration_runner::run_migrations(sqlite3* db) const -> VoidResult {
    return run_migrations_to(db, get_latest_version());
}

auto migration_runner::run_migrations_to(sqlite3* db, int target_version) const
    -> VoidResult {
    if (target_version > get_latest_version()) {
        return migration_error(compat::format(
            "Target version {} exceeds latest version {}", target_version,
            get_latest_version()));
    }

    auto table = exec(db, schema_version_table);
    if (table.is_err()) {
        return table;
    }

    const auto current = get_current_version(db);
    for (const auto& step : migrations) {
        if (step.version <= current || step.version > target_version) {
            continue;
        }

        auto applied = apply(db, step);
        if (applied.is_err()) {
            logger_adapter::error("Schema migration to v{} failed: {}", step.version,
                                  applied.error().message);
            return applied;
        }
        logger_adapter::info("Applied schema migration v{}: {}", step.version,
                             step.description);
    }
    return ok();
}

// ============================================================================
// Version Information
// ============================================================================

auto migration_runner::get_current_version(sqlite3* db) const -> int {
    // The MAX() probe fails to prepare while schema_version does not exist
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, "SELECT MAX(version) FROM schema_version;", -1,
                           &stmt, nullptr) != SQLITE_OK) {
        sqlite3_finalize(stmt);
        return 0;
    }

    int version = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        version = sqlite3_column_int(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return version;
}

auto migration_runner::get_latest_version() const noexcept -> int {
    return migrations.back().version;
}

auto migration_runner::needs_migration(sqlite3* db) const -> bool {
    return get_current_version(db) < get_latest_version();
}

auto migration_runner::get_history(sqlite3* db) const
    -> std::vector<migration_record> {
    std::vector<migration_record> history;

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(
            db,
            "SELECT version, description, applied_at FROM schema_version "
            "ORDER BY version;",
            -1, &stmt, nullptr) != SQLITE_OK) {
        sqlite3_finalize(stmt);
        return history;
    }

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        history.push_back({sqlite3_column_int(stmt, 0), column_text(stmt, 1),
                           column_text(stmt, 2)});
    }
    sqlite3_finalize(stmt);
    return history;
}

// ============================================================================
// Internal Implementation
// ============================================================================

auto migration_runner::apply(sqlite3* db, const schema_migration& step)
    -> VoidResult {
    auto begun = exec(db, "BEGIN IMMEDIATE;");
    if (begun.is_err()) {
        return begun;
    }

    auto changed = exec(db, step.sql);
    if (changed.is_ok()) {
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(
                db, "INSERT INTO schema_version (version, description) VALUES (?, ?);",
                -1, &stmt, nullptr) == SQLITE_OK) {
            sqlite3_bind_int(stmt, 1, step.version);
            sqlite3_bind_text(stmt, 2, step.description.data(),
                              static_cast<int>(step.description.size()),
                              SQLITE_TRANSIENT);
            if (sqlite3_step(stmt) != SQLITE_DONE) {
                changed = migration_error(compat::format(
                    "Failed to record migration v{}: {}", step.version,
                    sqlite3_errmsg(db)));
            }
        } else {
            changed = migration_error(compat::format(
                "Failed to prepare statement: {}", sqlite3_errmsg(db)));
        }
        sqlite3_finalize(stmt);
    }

    if (changed.is_ok()) {
        changed = exec(db, "COMMIT;");
    }
    if (changed.is_err()) {
        auto rolled_back = exec(db, "ROLLBACK;");
        if (rolled_back.is_err()) {
            logger_adapter::warn("Rollback of migration v{} failed: {}", step.version,
                                 rolled_back.error().message);
        }
    }
    return changed;
}

auto migration_runner::exec(sqlite3* db, std::string_view sql) -> VoidResult {
    const std::string statement(sql);
    char* errmsg = nullptr;
    if (sqlite3_exec(db, statement.c_str(), nullptr, nullptr, &errmsg) == SQLITE_OK) {
        return ok();
    }

    std::string detail = errmsg ? errmsg : sqlite3_errmsg(db);
    sqlite3_free(errmsg);
    return migration_error("SQL execution failed: " + detail);
}

}  // namespace dde::storage
