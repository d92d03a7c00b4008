/**
 * @file sqlite_dde_storage.hpp
 * @brief SQLite implementation of the DDE storage interface
 *
 * Maps the typed storage contract onto the SQLite schema created by
 * migration_runner. The translation between form_status and the shared
 * completion status code, and between the typed second-entry snapshot and
 * its JSON text, happens only here.
 *
 * Thread Safety: one connection is shared by all callers. A recursive
 * mutex is held for every call and for the whole span between
 * begin_transaction() and commit()/rollback(), so a transaction is never
 * interleaved with statements from another thread.
 */

#pragma once

#include <dde/storage/dde_storage_interface.hpp>
#include <dde/storage/migration_runner.hpp>

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

// Forward declaration of SQLite types
struct sqlite3;
struct sqlite3_stmt;

namespace dde::storage {

/**
 * @brief Configuration for the SQLite store
 */
struct sqlite_storage_config {
    /// Cache size in megabytes
    std::size_t cache_size_mb = 16;

    /// Enable WAL mode (ignored for ":memory:")
    bool wal_mode = true;

    /// How long SQLite retries a locked database file, in milliseconds
    int busy_timeout_ms = 5000;

    /**
     * @brief Fail reads of a malformed second-entry snapshot
     *
     * When false a malformed snapshot is logged at warning level and read
     * as empty.
     */
    bool strict_snapshot_parsing = false;
};

/**
 * @brief Descriptive attributes for a new form instance
 */
struct form_instance_registration {
    std::string subject_label;
    std::string site_id;
    std::string form_name;
    std::string event_name;
    bool double_entry_required{true};
};

/**
 * @brief SQLite-backed DDE store
 *
 * @example
 * @code
 * auto db = sqlite_dde_storage::open("dde.db");
 * if (db.is_ok()) {
 *     auto storage = std::shared_ptr<sqlite_dde_storage>(std::move(db.value()));
 *     auto form_id = storage->register_form_instance({"SITE01-0042", "SITE01",
 *                                                     "Vitals", "Baseline"});
 * }
 * @endcode
 */
class sqlite_dde_storage final : public dde_storage_interface {
public:
    [[nodiscard]] static auto open(std::string_view db_path)
        -> Result<std::unique_ptr<sqlite_dde_storage>>;

    /**
     * @brief Open or create a database and bring its schema up to date
     * @param db_path Database file path, or ":memory:"
     * @param config Connection options
     */
    [[nodiscard]] static auto open(std::string_view db_path,
                                   const sqlite_storage_config& config)
        -> Result<std::unique_ptr<sqlite_dde_storage>>;

    ~sqlite_dde_storage() override;

    sqlite_dde_storage(const sqlite_dde_storage&) = delete;
    auto operator=(const sqlite_dde_storage&) -> sqlite_dde_storage& = delete;
    sqlite_dde_storage(sqlite_dde_storage&&) = delete;
    auto operator=(sqlite_dde_storage&&) -> sqlite_dde_storage& = delete;

    // ========================================================================
    // Seeding (adapter only)
    // ========================================================================

    /**
     * @brief Create a form instance in the not_started state
     * @return Identifier of the new form instance
     */
    [[nodiscard]] auto register_form_instance(
        const form_instance_registration& registration) -> Result<int64_t>;

    /**
     * @brief Add or replace a first-entry field value
     * @return Identifier of the field row
     */
    [[nodiscard]] auto register_field(int64_t form_instance_id, int64_t item_id,
                                      std::string_view item_name,
                                      std::optional<std::string> value)
        -> Result<int64_t>;

    /**
     * @brief Audit entries of a form instance, oldest first
     */
    [[nodiscard]] auto audit_trail(int64_t form_instance_id)
        -> Result<std::vector<audit_record>>;

    [[nodiscard]] auto schema_version() const -> int;

    [[nodiscard]] auto path() const -> const std::string& { return path_; }

    // ========================================================================
    // dde_storage_interface
    // ========================================================================

    [[nodiscard]] auto begin_transaction() -> VoidResult override;
    [[nodiscard]] auto commit() -> VoidResult override;
    [[nodiscard]] auto rollback() -> VoidResult override;

    [[nodiscard]] auto get_form_instance(int64_t form_instance_id)
        -> Result<form_instance_record> override;
    [[nodiscard]] auto update_form_instance(const form_instance_record& record)
        -> VoidResult override;
    [[nodiscard]] auto store_second_entry(int64_t form_instance_id,
                                          const second_entry_snapshot& entries)
        -> VoidResult override;
    [[nodiscard]] auto is_double_entry_required(int64_t form_instance_id)
        -> Result<bool> override;
    [[nodiscard]] auto get_field_values(int64_t form_instance_id)
        -> Result<std::vector<field_entry>> override;
    [[nodiscard]] auto get_field_entry(int64_t field_id)
        -> Result<field_entry> override;
    [[nodiscard]] auto set_field_value(int64_t field_id, const std::string& value,
                                       const std::string& acting_user_id)
        -> VoidResult override;
    [[nodiscard]] auto find_form_instances(const form_instance_query& query)
        -> Result<std::vector<form_instance_record>> override;
    [[nodiscard]] auto count_form_instances_by_status(bool double_entry_only)
        -> Result<std::map<core::form_status, std::size_t>> override;

    [[nodiscard]] auto create_discrepancy(const discrepancy_record& record)
        -> Result<int64_t> override;
    [[nodiscard]] auto get_discrepancy(int64_t discrepancy_id)
        -> Result<discrepancy_record> override;
    [[nodiscard]] auto update_discrepancy(const discrepancy_record& record)
        -> VoidResult override;
    [[nodiscard]] auto find_latest_discrepancy_for_field(int64_t field_id)
        -> Result<std::optional<discrepancy_record>> override;
    [[nodiscard]] auto find_discrepancies(int64_t form_instance_id)
        -> Result<std::vector<discrepancy_record>> override;
    [[nodiscard]] auto count_open_for_form_instance(int64_t form_instance_id)
        -> Result<std::size_t> override;

    [[nodiscard]] auto append_audit(const audit_record& record)
        -> Result<int64_t> override;

private:
    sqlite_dde_storage(sqlite3* db, std::string path,
                       const sqlite_storage_config& config);

    [[nodiscard]] auto execute(const char* sql) -> VoidResult;

    [[nodiscard]] auto parse_form_instance_row(sqlite3_stmt* stmt) const
        -> Result<form_instance_record>;

    [[nodiscard]] static auto parse_field_row(sqlite3_stmt* stmt) -> field_entry;

    [[nodiscard]] static auto parse_discrepancy_row(sqlite3_stmt* stmt)
        -> discrepancy_record;

    sqlite3* db_{nullptr};
    std::string path_;
    sqlite_storage_config config_;
    migration_runner migration_runner_;

    std::recursive_mutex mutex_;
    bool in_transaction_{false};
};

}  // namespace dde::storage
