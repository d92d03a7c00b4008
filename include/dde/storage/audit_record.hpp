/**
 * @file audit_record.hpp
 * @brief Audit trail record data structures
 *
 * This file provides the audit_record structure appended to the audit sink
 * for every lifecycle transition and every discrepancy resolution. Audit
 * records are never updated or deleted.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace dde::storage {

/// Audited table names
namespace audit_table {
    constexpr const char* form_instance = "form_instances";
    constexpr const char* field_data = "field_data";
}  // namespace audit_table

/// Audited entity names
namespace audit_entity {
    constexpr const char* first_entry_started = "DDE First Entry Started";
    constexpr const char* first_entry_complete = "DDE First Entry Complete";
    constexpr const char* second_entry_submitted = "DDE Second Entry Submitted";
    constexpr const char* auto_reconciled = "DDE Reconciled";
    constexpr const char* finalized = "DDE Finalized";
    constexpr const char* resolution = "DDE Resolution";
}  // namespace audit_entity

/**
 * @brief Audit trail entry
 */
struct audit_record {
    /// Primary key (assigned by the sink)
    int64_t pk{0};

    /// Timestamp of the change
    std::chrono::system_clock::time_point timestamp;

    /// Acting user
    std::string user_id;

    /// Table or entity kind that changed
    std::string audit_table;

    /// Primary key of the changed entity
    int64_t entity_id{0};

    /// Human-readable name of the change
    std::string entity_name;

    /// Value before the change
    std::string old_value;

    /// Value after the change
    std::string new_value;

    /// Reason for change
    std::string reason;

    /// Form instance the change belongs to
    int64_t form_instance_id{0};

    [[nodiscard]] auto is_valid() const noexcept -> bool {
        return !user_id.empty() && !audit_table.empty();
    }
};

}  // namespace dde::storage
