/**
 * @file dde_storage_interface.hpp
 * @brief Storage collaborator contract consumed by the DDE engine
 *
 * The engine never builds queries. It reads and writes form instances,
 * field values, discrepancies and audit records through the named
 * operations of this interface, which is injected into every component.
 *
 * Error contract:
 * - lookups of a missing entity fail with error_codes::record_not_found
 * - all other failures use the database_* codes of dde::error_codes
 */

#pragma once

#include <dde/core/result.hpp>
#include <dde/storage/audit_record.hpp>
#include <dde/storage/discrepancy_record.hpp>
#include <dde/storage/form_instance_record.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace dde::storage {

class dde_storage_interface {
public:
    virtual ~dde_storage_interface() = default;

    // =========================================================================
    // Transactions
    // =========================================================================

    /**
     * @brief Begin a transaction owned by the calling thread
     *
     * Other threads sharing the store block until the transaction ends.
     */
    [[nodiscard]] virtual auto begin_transaction() -> VoidResult = 0;
    [[nodiscard]] virtual auto commit() -> VoidResult = 0;
    [[nodiscard]] virtual auto rollback() -> VoidResult = 0;

    // =========================================================================
    // Form Instance Store
    // =========================================================================

    [[nodiscard]] virtual auto get_form_instance(int64_t form_instance_id)
        -> Result<form_instance_record> = 0;

    /**
     * @brief Persist lifecycle fields of a form instance
     *
     * Writes status, entrant identities and timestamps and the completion
     * timestamp. The second-entry snapshot is left untouched.
     */
    [[nodiscard]] virtual auto update_form_instance(const form_instance_record& record)
        -> VoidResult = 0;

    /**
     * @brief Record the second-entry snapshot of a form instance
     *
     * The only write path for the snapshot; called once per accepted second
     * entry.
     */
    [[nodiscard]] virtual auto store_second_entry(int64_t form_instance_id,
                                                  const second_entry_snapshot& entries)
        -> VoidResult = 0;

    [[nodiscard]] virtual auto is_double_entry_required(int64_t form_instance_id)
        -> Result<bool> = 0;

    /// First-entry values ordered by item identifier
    [[nodiscard]] virtual auto get_field_values(int64_t form_instance_id)
        -> Result<std::vector<field_entry>> = 0;

    [[nodiscard]] virtual auto get_field_entry(int64_t field_id)
        -> Result<field_entry> = 0;

    [[nodiscard]] virtual auto set_field_value(int64_t field_id,
                                               const std::string& value,
                                               const std::string& acting_user_id)
        -> VoidResult = 0;

    [[nodiscard]] virtual auto find_form_instances(const form_instance_query& query)
        -> Result<std::vector<form_instance_record>> = 0;

    /**
     * @brief Count form instances per status
     * @param double_entry_only Count only forms requiring double entry
     */
    [[nodiscard]] virtual auto count_form_instances_by_status(bool double_entry_only)
        -> Result<std::map<core::form_status, std::size_t>> = 0;

    // =========================================================================
    // Discrepancy Store
    // =========================================================================

    /// @return Identifier assigned to the new discrepancy
    [[nodiscard]] virtual auto create_discrepancy(const discrepancy_record& record)
        -> Result<int64_t> = 0;

    [[nodiscard]] virtual auto get_discrepancy(int64_t discrepancy_id)
        -> Result<discrepancy_record> = 0;

    [[nodiscard]] virtual auto update_discrepancy(const discrepancy_record& record)
        -> VoidResult = 0;

    /// Most recently detected discrepancy of a field, if any
    [[nodiscard]] virtual auto find_latest_discrepancy_for_field(int64_t field_id)
        -> Result<std::optional<discrepancy_record>> = 0;

    /// All discrepancies of a form instance, oldest first
    [[nodiscard]] virtual auto find_discrepancies(int64_t form_instance_id)
        -> Result<std::vector<discrepancy_record>> = 0;

    [[nodiscard]] virtual auto count_open_for_form_instance(int64_t form_instance_id)
        -> Result<std::size_t> = 0;

    // =========================================================================
    // Audit Sink
    // =========================================================================

    /// @return Identifier assigned to the audit entry
    [[nodiscard]] virtual auto append_audit(const audit_record& record)
        -> Result<int64_t> = 0;

protected:
    dde_storage_interface() = default;
    dde_storage_interface(const dde_storage_interface&) = delete;
    dde_storage_interface& operator=(const dde_storage_interface&) = delete;
    dde_storage_interface(dde_storage_interface&&) = default;
    dde_storage_interface& operator=(dde_storage_interface&&) = default;
};

}  // namespace dde::storage
