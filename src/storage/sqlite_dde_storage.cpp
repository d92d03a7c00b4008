/**
 * @file sqlite_dde_storage.cpp
 * @brief Implementation of the SQLite DDE store
 */

#include <dde/storage/sqlite_dde_storage.hpp>

#include <dde/compat/format.hpp>
#include <dde/compat/time.hpp>
#include <dde/integration/logger_adapter.hpp>
#include <dde/storage/second_entry_codec.hpp>

#include <sqlite3.h>

namespace dde::storage {

using kcenon::common::make_error;
using kcenon::common::ok;
using integration::logger_adapter;

namespace {

// =============================================================================
// Helper Functions
// =============================================================================

[[nodiscard]] std::string get_text_column(sqlite3_stmt* stmt, int col) {
    auto text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return text ? text : "";
}

[[nodiscard]] std::optional<std::string> get_optional_text_column(sqlite3_stmt* stmt,
                                                                  int col) {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) {
        return std::nullopt;
    }
    return get_text_column(stmt, col);
}

[[nodiscard]] int64_t get_int64_column(sqlite3_stmt* stmt, int col,
                                       int64_t default_val = 0) {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) {
        return default_val;
    }
    return sqlite3_column_int64(stmt, col);
}

[[nodiscard]] std::chrono::system_clock::time_point get_time_column(
    sqlite3_stmt* stmt, int col) {
    return compat::from_timestamp_string(get_text_column(stmt, col));
}

/// Bind text, or NULL for an empty string
void bind_text_or_null(sqlite3_stmt* stmt, int idx, const std::string& value) {
    if (value.empty()) {
        sqlite3_bind_null(stmt, idx);
    } else {
        sqlite3_bind_text(stmt, idx, value.c_str(), -1, SQLITE_TRANSIENT);
    }
}

void bind_time_or_null(sqlite3_stmt* stmt, int idx,
                       std::chrono::system_clock::time_point tp) {
    bind_text_or_null(stmt, idx, compat::to_timestamp_string(tp));
}

[[nodiscard]] std::string now_or(std::chrono::system_clock::time_point tp) {
    if (tp == std::chrono::system_clock::time_point{}) {
        tp = std::chrono::system_clock::now();
    }
    return compat::to_timestamp_string(tp);
}

template <typename T>
[[nodiscard]] Result<T> prepare_error(sqlite3* db) {
    return make_error<T>(
        error_codes::database_query_error,
        compat::format("Failed to prepare statement: {}", sqlite3_errmsg(db)),
        "storage");
}

template <typename T>
[[nodiscard]] Result<T> step_error(sqlite3* db, std::string_view what) {
    return make_error<T>(error_codes::database_query_error,
                         compat::format("Failed to {}: {}", what, sqlite3_errmsg(db)),
                         "storage");
}

template <typename T>
[[nodiscard]] Result<T> not_found_error(std::string_view entity, int64_t id) {
    return make_error<T>(error_codes::record_not_found,
                         compat::format("{} not found: {}", entity, id), "storage");
}

constexpr const char* form_instance_columns = R"(
    form_instance_id, subject_label, site_id, form_name, event_name,
    double_entry_required, completion_status_id, first_entry_by,
    first_entry_at, second_entry_by, second_entry_at, second_entry_values,
    completed_at, created_at)";

constexpr const char* discrepancy_columns = R"(
    discrepancy_id, form_instance_id, field_id, item_id, first_value,
    second_value, resolution_status, resolution_strategy, resolved_value,
    resolved_by, resolved_at, resolution_notes, created_at)";

}  // namespace

// =============================================================================
// Construction / Destruction
// =============================================================================

auto sqlite_dde_storage::open(std::string_view db_path)
    -> Result<std::unique_ptr<sqlite_dde_storage>> {
    return open(db_path, sqlite_storage_config{});
}

auto sqlite_dde_storage::open(std::string_view db_path,
                              const sqlite_storage_config& config)
    -> Result<std::unique_ptr<sqlite_dde_storage>> {
    sqlite3* db = nullptr;

    auto rc = sqlite3_open(std::string(db_path).c_str(), &db);
    if (rc != SQLITE_OK) {
        std::string error_msg =
            db ? sqlite3_errmsg(db) : "Failed to allocate memory";
        if (db) {
            sqlite3_close(db);
        }
        return make_error<std::unique_ptr<sqlite_dde_storage>>(
            error_codes::database_open_error,
            compat::format("Failed to open database: {}", error_msg), "storage");
    }

    rc = sqlite3_exec(db, "PRAGMA foreign_keys = ON;", nullptr, nullptr, nullptr);
    if (rc != SQLITE_OK) {
        sqlite3_close(db);
        return make_error<std::unique_ptr<sqlite_dde_storage>>(
            error_codes::database_open_error, "Failed to enable foreign keys",
            "storage");
    }

    if (config.wal_mode && db_path != ":memory:") {
        rc = sqlite3_exec(db, "PRAGMA journal_mode = WAL;", nullptr, nullptr,
                          nullptr);
        if (rc != SQLITE_OK) {
            sqlite3_close(db);
            return make_error<std::unique_ptr<sqlite_dde_storage>>(
                error_codes::database_open_error, "Failed to enable WAL mode",
                "storage");
        }
    }

    // Negative value means KB
    auto cache_sql =
        compat::format("PRAGMA cache_size = -{};", config.cache_size_mb * 1024);
    rc = sqlite3_exec(db, cache_sql.c_str(), nullptr, nullptr, nullptr);
    if (rc != SQLITE_OK) {
        sqlite3_close(db);
        return make_error<std::unique_ptr<sqlite_dde_storage>>(
            error_codes::database_open_error, "Failed to set cache size",
            "storage");
    }

    sqlite3_busy_timeout(db, config.busy_timeout_ms);

    auto instance = std::unique_ptr<sqlite_dde_storage>(
        new sqlite_dde_storage(db, std::string(db_path), config));

    auto migration_result = instance->migration_runner_.run_migrations(db);
    if (migration_result.is_err()) {
        return make_error<std::unique_ptr<sqlite_dde_storage>>(
            error_codes::database_migration_error,
            compat::format("Migration failed: {}", migration_result.error().message),
            "storage");
    }

    logger_adapter::info("DDE store opened: {} (schema v{})", instance->path_,
                         instance->schema_version());

    return instance;
}

sqlite_dde_storage::sqlite_dde_storage(sqlite3* db, std::string path,
                                       const sqlite_storage_config& config)
    : db_(db), path_(std::move(path)), config_(config) {}

sqlite_dde_storage::~sqlite_dde_storage() {
    if (in_transaction_) {
        sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
        in_transaction_ = false;
        mutex_.unlock();
    }
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

auto sqlite_dde_storage::schema_version() const -> int {
    return migration_runner_.get_current_version(db_);
}

auto sqlite_dde_storage::execute(const char* sql) -> VoidResult {
    char* errmsg = nullptr;
    auto rc = sqlite3_exec(db_, sql, nullptr, nullptr, &errmsg);
    if (rc != SQLITE_OK) {
        auto error_str = errmsg ? std::string(errmsg) : "Unknown error";
        sqlite3_free(errmsg);
        return make_error<std::monostate>(
            error_codes::database_transaction_error,
            compat::format("SQL execution failed: {}", error_str), "storage");
    }
    return ok();
}

// =============================================================================
// Transactions
// =============================================================================

auto sqlite_dde_storage::begin_transaction() -> VoidResult {
    // Held until commit() or rollback()
    mutex_.lock();

    if (in_transaction_) {
        mutex_.unlock();
        return make_error<std::monostate>(error_codes::database_transaction_error,
                                          "Transaction already active", "storage");
    }

    auto result = execute("BEGIN IMMEDIATE TRANSACTION;");
    if (result.is_err()) {
        mutex_.unlock();
        return result;
    }

    in_transaction_ = true;
    return ok();
}

auto sqlite_dde_storage::commit() -> VoidResult {
    std::lock_guard lock(mutex_);

    if (!in_transaction_) {
        return make_error<std::monostate>(error_codes::database_transaction_error,
                                          "No active transaction", "storage");
    }

    auto result = execute("COMMIT;");
    if (result.is_err()) {
        // Transaction stays open; the caller rolls back
        return result;
    }

    in_transaction_ = false;
    mutex_.unlock();
    return ok();
}

auto sqlite_dde_storage::rollback() -> VoidResult {
    std::lock_guard lock(mutex_);

    if (!in_transaction_) {
        return make_error<std::monostate>(error_codes::database_transaction_error,
                                          "No active transaction", "storage");
    }

    VoidResult result = ok();
    // SQLite may already have rolled back on its own after certain errors
    if (sqlite3_get_autocommit(db_) == 0) {
        result = execute("ROLLBACK;");
    }

    in_transaction_ = false;
    mutex_.unlock();
    return result;
}

// =============================================================================
// Seeding
// =============================================================================

auto sqlite_dde_storage::register_form_instance(
    const form_instance_registration& registration) -> Result<int64_t> {
    std::lock_guard lock(mutex_);

    static constexpr const char* sql = R"(
        INSERT INTO form_instances (
            subject_label, site_id, form_name, event_name,
            double_entry_required, completion_status_id, created_at
        ) VALUES (?, ?, ?, ?, ?, ?, ?)
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return prepare_error<int64_t>(db_);
    }

    auto created = compat::to_timestamp_string(std::chrono::system_clock::now());

    sqlite3_bind_text(stmt, 1, registration.subject_label.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, registration.site_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, registration.form_name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 4, registration.event_name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt, 5, registration.double_entry_required ? 1 : 0);
    sqlite3_bind_int(stmt, 6,
                     core::to_completion_status_code(core::form_status::not_started));
    sqlite3_bind_text(stmt, 7, created.c_str(), -1, SQLITE_TRANSIENT);

    auto rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return step_error<int64_t>(db_, "register form instance");
    }

    return ok(static_cast<int64_t>(sqlite3_last_insert_rowid(db_)));
}

auto sqlite_dde_storage::register_field(int64_t form_instance_id, int64_t item_id,
                                        std::string_view item_name,
                                        std::optional<std::string> value)
    -> Result<int64_t> {
    std::lock_guard lock(mutex_);

    static constexpr const char* sql = R"(
        INSERT INTO field_data (form_instance_id, item_id, item_name, value)
        VALUES (?, ?, ?, ?)
        ON CONFLICT (form_instance_id, item_id) DO UPDATE SET
            item_name = excluded.item_name,
            value = excluded.value,
            updated_at = datetime('now')
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return prepare_error<int64_t>(db_);
    }

    std::string name(item_name);
    sqlite3_bind_int64(stmt, 1, form_instance_id);
    sqlite3_bind_int64(stmt, 2, item_id);
    sqlite3_bind_text(stmt, 3, name.c_str(), -1, SQLITE_TRANSIENT);
    if (value) {
        sqlite3_bind_text(stmt, 4, value->c_str(), -1, SQLITE_TRANSIENT);
    } else {
        sqlite3_bind_null(stmt, 4);
    }

    auto rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc == SQLITE_CONSTRAINT) {
        return not_found_error<int64_t>("Form instance", form_instance_id);
    }
    if (rc != SQLITE_DONE) {
        return step_error<int64_t>(db_, "register field");
    }

    // last_insert_rowid is not updated by the upsert's update branch
    static constexpr const char* lookup_sql = R"(
        SELECT field_id FROM field_data WHERE form_instance_id = ? AND item_id = ?
    )";

    if (sqlite3_prepare_v2(db_, lookup_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return prepare_error<int64_t>(db_);
    }
    sqlite3_bind_int64(stmt, 1, form_instance_id);
    sqlite3_bind_int64(stmt, 2, item_id);

    int64_t field_id = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        field_id = sqlite3_column_int64(stmt, 0);
    }
    sqlite3_finalize(stmt);

    if (field_id == 0) {
        return step_error<int64_t>(db_, "look up registered field");
    }
    return field_id;
}

auto sqlite_dde_storage::audit_trail(int64_t form_instance_id)
    -> Result<std::vector<audit_record>> {
    std::lock_guard lock(mutex_);

    static constexpr const char* sql = R"(
        SELECT audit_id, audit_date, user_id, audit_table, entity_id,
               entity_name, old_value, new_value, reason_for_change,
               form_instance_id
        FROM audit_log_events
        WHERE form_instance_id = ?
        ORDER BY audit_id
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return prepare_error<std::vector<audit_record>>(db_);
    }
    sqlite3_bind_int64(stmt, 1, form_instance_id);

    std::vector<audit_record> records;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        audit_record record;
        int col = 0;
        record.pk = get_int64_column(stmt, col++);
        record.timestamp = get_time_column(stmt, col++);
        record.user_id = get_text_column(stmt, col++);
        record.audit_table = get_text_column(stmt, col++);
        record.entity_id = get_int64_column(stmt, col++);
        record.entity_name = get_text_column(stmt, col++);
        record.old_value = get_text_column(stmt, col++);
        record.new_value = get_text_column(stmt, col++);
        record.reason = get_text_column(stmt, col++);
        record.form_instance_id = get_int64_column(stmt, col++);
        records.push_back(std::move(record));
    }
    sqlite3_finalize(stmt);

    return records;
}

// =============================================================================
// Form Instance Store
// =============================================================================

auto sqlite_dde_storage::parse_form_instance_row(sqlite3_stmt* stmt) const
    -> Result<form_instance_record> {
    form_instance_record record;
    int col = 0;

    record.form_instance_id = get_int64_column(stmt, col++);
    record.subject_label = get_text_column(stmt, col++);
    record.site_id = get_text_column(stmt, col++);
    record.form_name = get_text_column(stmt, col++);
    record.event_name = get_text_column(stmt, col++);
    record.double_entry_required = get_int64_column(stmt, col++) != 0;

    auto code = static_cast<int>(get_int64_column(stmt, col++));
    auto status = core::from_completion_status_code(code);
    if (!status) {
        return make_error<form_instance_record>(
            error_codes::database_integrity_error,
            compat::format("Form instance {} has completion status {} outside the "
                           "double data entry lifecycle",
                           record.form_instance_id, code),
            "storage");
    }
    record.status = *status;

    record.first_entry_by = get_text_column(stmt, col++);
    record.first_entry_at = get_time_column(stmt, col++);
    record.second_entry_by = get_text_column(stmt, col++);
    record.second_entry_at = get_time_column(stmt, col++);

    auto snapshot_text = get_text_column(stmt, col++);
    if (!snapshot_text.empty()) {
        auto snapshot = decode_second_entry(snapshot_text);
        if (snapshot) {
            record.second_entry_values = std::move(*snapshot);
        } else if (config_.strict_snapshot_parsing) {
            return make_error<form_instance_record>(
                error_codes::snapshot_parse_error,
                compat::format("Malformed second-entry snapshot on form instance {}",
                               record.form_instance_id),
                "storage");
        } else {
            logger_adapter::warn(
                "Malformed second-entry snapshot on form instance {}; "
                "treating it as empty",
                record.form_instance_id);
        }
    }

    record.completed_at = get_time_column(stmt, col++);
    record.created_at = get_time_column(stmt, col++);

    return record;
}

auto sqlite_dde_storage::get_form_instance(int64_t form_instance_id)
    -> Result<form_instance_record> {
    std::lock_guard lock(mutex_);

    auto sql = compat::format(
        "SELECT {} FROM form_instances WHERE form_instance_id = ?",
        form_instance_columns);

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        return prepare_error<form_instance_record>(db_);
    }
    sqlite3_bind_int64(stmt, 1, form_instance_id);

    auto rc = sqlite3_step(stmt);
    if (rc != SQLITE_ROW) {
        sqlite3_finalize(stmt);
        if (rc == SQLITE_DONE) {
            return not_found_error<form_instance_record>("Form instance",
                                                         form_instance_id);
        }
        return step_error<form_instance_record>(db_, "read form instance");
    }

    auto record = parse_form_instance_row(stmt);
    sqlite3_finalize(stmt);
    return record;
}

auto sqlite_dde_storage::update_form_instance(const form_instance_record& record)
    -> VoidResult {
    std::lock_guard lock(mutex_);

    static constexpr const char* sql = R"(
        UPDATE form_instances SET
            completion_status_id = ?,
            first_entry_by = ?,
            first_entry_at = ?,
            second_entry_by = ?,
            second_entry_at = ?,
            completed_at = ?,
            updated_at = datetime('now')
        WHERE form_instance_id = ?
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return prepare_error<std::monostate>(db_);
    }

    int idx = 1;
    sqlite3_bind_int(stmt, idx++, core::to_completion_status_code(record.status));
    bind_text_or_null(stmt, idx++, record.first_entry_by);
    bind_time_or_null(stmt, idx++, record.first_entry_at);
    bind_text_or_null(stmt, idx++, record.second_entry_by);
    bind_time_or_null(stmt, idx++, record.second_entry_at);
    bind_time_or_null(stmt, idx++, record.completed_at);
    sqlite3_bind_int64(stmt, idx++, record.form_instance_id);

    auto rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return step_error<std::monostate>(db_, "update form instance");
    }
    if (sqlite3_changes(db_) == 0) {
        return not_found_error<std::monostate>("Form instance",
                                               record.form_instance_id);
    }
    return ok();
}

auto sqlite_dde_storage::store_second_entry(int64_t form_instance_id,
                                            const second_entry_snapshot& entries)
    -> VoidResult {
    std::lock_guard lock(mutex_);

    static constexpr const char* sql = R"(
        UPDATE form_instances SET
            second_entry_values = ?,
            updated_at = datetime('now')
        WHERE form_instance_id = ?
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return prepare_error<std::monostate>(db_);
    }

    const auto snapshot = encode_second_entry(entries);
    sqlite3_bind_text(stmt, 1, snapshot.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 2, form_instance_id);

    auto rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return step_error<std::monostate>(db_, "store second entry");
    }
    if (sqlite3_changes(db_) == 0) {
        return not_found_error<std::monostate>("Form instance", form_instance_id);
    }
    return ok();
}

auto sqlite_dde_storage::is_double_entry_required(int64_t form_instance_id)
    -> Result<bool> {
    std::lock_guard lock(mutex_);

    static constexpr const char* sql =
        "SELECT double_entry_required FROM form_instances WHERE form_instance_id = ?";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return prepare_error<bool>(db_);
    }
    sqlite3_bind_int64(stmt, 1, form_instance_id);

    auto rc = sqlite3_step(stmt);
    bool required = rc == SQLITE_ROW && sqlite3_column_int(stmt, 0) != 0;
    sqlite3_finalize(stmt);

    if (rc == SQLITE_DONE) {
        return not_found_error<bool>("Form instance", form_instance_id);
    }
    if (rc != SQLITE_ROW) {
        return step_error<bool>(db_, "read form instance");
    }
    return required;
}

auto sqlite_dde_storage::parse_field_row(sqlite3_stmt* stmt) -> field_entry {
    field_entry entry;
    entry.field_id = get_int64_column(stmt, 0);
    entry.form_instance_id = get_int64_column(stmt, 1);
    entry.item_id = get_int64_column(stmt, 2);
    entry.item_name = get_text_column(stmt, 3);
    entry.value = get_optional_text_column(stmt, 4);
    return entry;
}

auto sqlite_dde_storage::get_field_values(int64_t form_instance_id)
    -> Result<std::vector<field_entry>> {
    std::lock_guard lock(mutex_);

    static constexpr const char* sql = R"(
        SELECT field_id, form_instance_id, item_id, item_name, value
        FROM field_data
        WHERE form_instance_id = ?
        ORDER BY item_id
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return prepare_error<std::vector<field_entry>>(db_);
    }
    sqlite3_bind_int64(stmt, 1, form_instance_id);

    std::vector<field_entry> entries;
    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        entries.push_back(parse_field_row(stmt));
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return step_error<std::vector<field_entry>>(db_, "read field values");
    }
    return entries;
}

auto sqlite_dde_storage::get_field_entry(int64_t field_id) -> Result<field_entry> {
    std::lock_guard lock(mutex_);

    static constexpr const char* sql = R"(
        SELECT field_id, form_instance_id, item_id, item_name, value
        FROM field_data
        WHERE field_id = ?
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return prepare_error<field_entry>(db_);
    }
    sqlite3_bind_int64(stmt, 1, field_id);

    auto rc = sqlite3_step(stmt);
    if (rc != SQLITE_ROW) {
        sqlite3_finalize(stmt);
        if (rc == SQLITE_DONE) {
            return not_found_error<field_entry>("Field", field_id);
        }
        return step_error<field_entry>(db_, "read field");
    }

    auto entry = parse_field_row(stmt);
    sqlite3_finalize(stmt);
    return entry;
}

auto sqlite_dde_storage::set_field_value(int64_t field_id, const std::string& value,
                                         const std::string& acting_user_id)
    -> VoidResult {
    std::lock_guard lock(mutex_);

    static constexpr const char* sql = R"(
        UPDATE field_data SET
            value = ?,
            updated_by = ?,
            updated_at = datetime('now')
        WHERE field_id = ?
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return prepare_error<std::monostate>(db_);
    }

    sqlite3_bind_text(stmt, 1, value.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, acting_user_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 3, field_id);

    auto rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return step_error<std::monostate>(db_, "write field value");
    }
    if (sqlite3_changes(db_) == 0) {
        return not_found_error<std::monostate>("Field", field_id);
    }
    return ok();
}

auto sqlite_dde_storage::find_form_instances(const form_instance_query& query)
    -> Result<std::vector<form_instance_record>> {
    std::lock_guard lock(mutex_);

    auto sql = compat::format("SELECT {} FROM form_instances WHERE 1=1",
                              form_instance_columns);

    if (query.status) {
        sql += " AND completion_status_id = ?";
    }
    if (query.site_id) {
        sql += " AND site_id = ?";
    }
    if (query.double_entry_only) {
        sql += " AND double_entry_required = 1";
    }
    sql += " ORDER BY form_instance_id";
    if (query.limit > 0) {
        sql += compat::format(" LIMIT {}", query.limit);
    }

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        return prepare_error<std::vector<form_instance_record>>(db_);
    }

    int idx = 1;
    if (query.status) {
        sqlite3_bind_int(stmt, idx++, core::to_completion_status_code(*query.status));
    }
    if (query.site_id) {
        sqlite3_bind_text(stmt, idx++, query.site_id->c_str(), -1, SQLITE_TRANSIENT);
    }

    std::vector<form_instance_record> records;
    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        auto record = parse_form_instance_row(stmt);
        if (record.is_err()) {
            sqlite3_finalize(stmt);
            return Result<std::vector<form_instance_record>>(record.error());
        }
        records.push_back(std::move(record.value()));
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return step_error<std::vector<form_instance_record>>(db_,
                                                             "search form instances");
    }
    return records;
}

auto sqlite_dde_storage::count_form_instances_by_status(bool double_entry_only)
    -> Result<std::map<core::form_status, std::size_t>> {
    std::lock_guard lock(mutex_);

    const char* sql = double_entry_only
        ? "SELECT completion_status_id, COUNT(*) FROM form_instances "
          "WHERE double_entry_required = 1 GROUP BY completion_status_id"
        : "SELECT completion_status_id, COUNT(*) FROM form_instances "
          "GROUP BY completion_status_id";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return prepare_error<std::map<core::form_status, std::size_t>>(db_);
    }

    std::map<core::form_status, std::size_t> counts;
    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        auto status = core::from_completion_status_code(sqlite3_column_int(stmt, 0));
        if (status) {
            counts[*status] = static_cast<std::size_t>(sqlite3_column_int64(stmt, 1));
        }
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return step_error<std::map<core::form_status, std::size_t>>(
            db_, "count form instances");
    }
    return counts;
}

// =============================================================================
// Discrepancy Store
// =============================================================================

auto sqlite_dde_storage::parse_discrepancy_row(sqlite3_stmt* stmt)
    -> discrepancy_record {
    discrepancy_record record;
    int col = 0;

    record.discrepancy_id = get_int64_column(stmt, col++);
    record.form_instance_id = get_int64_column(stmt, col++);
    record.field_id = get_int64_column(stmt, col++);
    record.item_id = get_int64_column(stmt, col++);
    record.first_value = get_text_column(stmt, col++);
    record.second_value = get_text_column(stmt, col++);
    record.status = parse_resolution_status(get_text_column(stmt, col++))
                        .value_or(resolution_status::open);
    record.strategy = parse_resolution_strategy(get_text_column(stmt, col++));
    record.resolved_value = get_optional_text_column(stmt, col++);
    record.resolved_by = get_text_column(stmt, col++);
    record.resolved_at = get_time_column(stmt, col++);
    record.resolution_notes = get_text_column(stmt, col++);
    record.created_at = get_time_column(stmt, col++);

    return record;
}

auto sqlite_dde_storage::create_discrepancy(const discrepancy_record& record)
    -> Result<int64_t> {
    std::lock_guard lock(mutex_);

    static constexpr const char* sql = R"(
        INSERT INTO dde_discrepancies (
            form_instance_id, field_id, item_id, first_value, second_value,
            resolution_status, created_at
        ) VALUES (?, ?, ?, ?, ?, ?, ?)
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return prepare_error<int64_t>(db_);
    }

    auto status = to_string(record.status);
    auto created = now_or(record.created_at);

    int idx = 1;
    sqlite3_bind_int64(stmt, idx++, record.form_instance_id);
    sqlite3_bind_int64(stmt, idx++, record.field_id);
    sqlite3_bind_int64(stmt, idx++, record.item_id);
    sqlite3_bind_text(stmt, idx++, record.first_value.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, idx++, record.second_value.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, idx++, status.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, idx++, created.c_str(), -1, SQLITE_TRANSIENT);

    auto rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return step_error<int64_t>(db_, "create discrepancy");
    }
    return ok(static_cast<int64_t>(sqlite3_last_insert_rowid(db_)));
}

auto sqlite_dde_storage::get_discrepancy(int64_t discrepancy_id)
    -> Result<discrepancy_record> {
    std::lock_guard lock(mutex_);

    auto sql = compat::format(
        "SELECT {} FROM dde_discrepancies WHERE discrepancy_id = ?",
        discrepancy_columns);

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        return prepare_error<discrepancy_record>(db_);
    }
    sqlite3_bind_int64(stmt, 1, discrepancy_id);

    auto rc = sqlite3_step(stmt);
    if (rc != SQLITE_ROW) {
        sqlite3_finalize(stmt);
        if (rc == SQLITE_DONE) {
            return not_found_error<discrepancy_record>("Discrepancy", discrepancy_id);
        }
        return step_error<discrepancy_record>(db_, "read discrepancy");
    }

    auto record = parse_discrepancy_row(stmt);
    sqlite3_finalize(stmt);
    return record;
}

auto sqlite_dde_storage::update_discrepancy(const discrepancy_record& record)
    -> VoidResult {
    std::lock_guard lock(mutex_);

    static constexpr const char* sql = R"(
        UPDATE dde_discrepancies SET
            resolution_status = ?,
            resolution_strategy = ?,
            resolved_value = ?,
            resolved_by = ?,
            resolved_at = ?,
            resolution_notes = ?
        WHERE discrepancy_id = ?
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return prepare_error<std::monostate>(db_);
    }

    auto status = to_string(record.status);
    auto strategy = record.strategy ? to_string(*record.strategy) : std::string();

    int idx = 1;
    sqlite3_bind_text(stmt, idx++, status.c_str(), -1, SQLITE_TRANSIENT);
    bind_text_or_null(stmt, idx++, strategy);
    if (record.resolved_value) {
        sqlite3_bind_text(stmt, idx++, record.resolved_value->c_str(), -1,
                          SQLITE_TRANSIENT);
    } else {
        sqlite3_bind_null(stmt, idx++);
    }
    bind_text_or_null(stmt, idx++, record.resolved_by);
    bind_time_or_null(stmt, idx++, record.resolved_at);
    bind_text_or_null(stmt, idx++, record.resolution_notes);
    sqlite3_bind_int64(stmt, idx++, record.discrepancy_id);

    auto rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return step_error<std::monostate>(db_, "update discrepancy");
    }
    if (sqlite3_changes(db_) == 0) {
        return not_found_error<std::monostate>("Discrepancy", record.discrepancy_id);
    }
    return ok();
}

auto sqlite_dde_storage::find_latest_discrepancy_for_field(int64_t field_id)
    -> Result<std::optional<discrepancy_record>> {
    std::lock_guard lock(mutex_);

    auto sql = compat::format(
        "SELECT {} FROM dde_discrepancies WHERE field_id = ? "
        "ORDER BY discrepancy_id DESC LIMIT 1",
        discrepancy_columns);

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        return prepare_error<std::optional<discrepancy_record>>(db_);
    }
    sqlite3_bind_int64(stmt, 1, field_id);

    std::optional<discrepancy_record> latest;
    auto rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        latest = parse_discrepancy_row(stmt);
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
        return step_error<std::optional<discrepancy_record>>(db_, "read discrepancy");
    }
    return latest;
}

auto sqlite_dde_storage::find_discrepancies(int64_t form_instance_id)
    -> Result<std::vector<discrepancy_record>> {
    std::lock_guard lock(mutex_);

    auto sql = compat::format(
        "SELECT {} FROM dde_discrepancies WHERE form_instance_id = ? "
        "ORDER BY discrepancy_id",
        discrepancy_columns);

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        return prepare_error<std::vector<discrepancy_record>>(db_);
    }
    sqlite3_bind_int64(stmt, 1, form_instance_id);

    std::vector<discrepancy_record> records;
    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        records.push_back(parse_discrepancy_row(stmt));
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return step_error<std::vector<discrepancy_record>>(db_, "read discrepancies");
    }
    return records;
}

auto sqlite_dde_storage::count_open_for_form_instance(int64_t form_instance_id)
    -> Result<std::size_t> {
    std::lock_guard lock(mutex_);

    static constexpr const char* sql = R"(
        SELECT COUNT(*) FROM dde_discrepancies
        WHERE form_instance_id = ? AND resolution_status = 'open'
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return prepare_error<std::size_t>(db_);
    }
    sqlite3_bind_int64(stmt, 1, form_instance_id);

    std::size_t count = 0;
    auto rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        count = static_cast<std::size_t>(sqlite3_column_int64(stmt, 0));
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_ROW) {
        return step_error<std::size_t>(db_, "count open discrepancies");
    }
    return count;
}

// =============================================================================
// Audit Sink
// =============================================================================

auto sqlite_dde_storage::append_audit(const audit_record& record)
    -> Result<int64_t> {
    std::lock_guard lock(mutex_);

    if (!record.is_valid()) {
        return make_error<int64_t>(error_codes::audit_write_failed,
                                   "Audit record requires a user and a table",
                                   "storage");
    }

    static constexpr const char* sql = R"(
        INSERT INTO audit_log_events (
            audit_date, user_id, audit_table, entity_id, entity_name,
            old_value, new_value, reason_for_change, form_instance_id
        ) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return make_error<int64_t>(
            error_codes::audit_write_failed,
            compat::format("Failed to prepare statement: {}", sqlite3_errmsg(db_)),
            "storage");
    }

    auto timestamp = now_or(record.timestamp);

    int idx = 1;
    sqlite3_bind_text(stmt, idx++, timestamp.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, idx++, record.user_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, idx++, record.audit_table.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, idx++, record.entity_id);
    sqlite3_bind_text(stmt, idx++, record.entity_name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, idx++, record.old_value.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, idx++, record.new_value.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, idx++, record.reason.c_str(), -1, SQLITE_TRANSIENT);
    if (record.form_instance_id > 0) {
        sqlite3_bind_int64(stmt, idx++, record.form_instance_id);
    } else {
        sqlite3_bind_null(stmt, idx++);
    }

    auto rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return make_error<int64_t>(
            error_codes::audit_write_failed,
            compat::format("Failed to append audit record: {}", sqlite3_errmsg(db_)),
            "storage");
    }
    return ok(static_cast<int64_t>(sqlite3_last_insert_rowid(db_)));
}

}  // namespace dde::storage
