/**
 * @file form_instance_record.hpp
 * @brief Form instance and field entry data structures
 *
 * A form instance is one filled-out case report form for one subject visit.
 * Its first-entry field values live in the field table of the form instance
 * store; the second entry is kept on the form instance as a snapshot keyed
 * by item identifier.
 */

#pragma once

#include <dde/core/form_status.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace dde::storage {

/// Second-entry values keyed by item identifier
using second_entry_snapshot = std::map<int64_t, std::string>;

/**
 * @brief Form instance record from the form instance store
 */
struct form_instance_record {
    /// Primary key
    int64_t form_instance_id{0};

    /// Subject label (e.g. "SITE01-0042")
    std::string subject_label;

    /// Site identifier used for dashboard filtering
    std::string site_id;

    /// Form (CRF version) name
    std::string form_name;

    /// Visit / event name
    std::string event_name;

    /// Whether the form definition requires double data entry
    bool double_entry_required{false};

    /// Completion status
    core::form_status status{core::form_status::not_started};

    /// User who completed the first entry
    std::string first_entry_by;

    /// When the first entry was completed
    std::chrono::system_clock::time_point first_entry_at;

    /// User who submitted the second entry (empty when not submitted)
    std::string second_entry_by;

    /// When the second entry was submitted
    std::chrono::system_clock::time_point second_entry_at;

    /// Second-entry values captured at submission
    second_entry_snapshot second_entry_values;

    /// When the form instance reached the reconciled state
    std::chrono::system_clock::time_point completed_at;

    /// Record creation time
    std::chrono::system_clock::time_point created_at;

    [[nodiscard]] auto has_second_entry() const noexcept -> bool {
        return !second_entry_by.empty();
    }

    [[nodiscard]] auto is_valid() const noexcept -> bool {
        return form_instance_id > 0;
    }
};

/**
 * @brief One first-entry field value of a form instance
 */
struct field_entry {
    /// Primary key of the field row
    int64_t field_id{0};

    /// Owning form instance
    int64_t form_instance_id{0};

    /// CRF item identifier (key of the second-entry snapshot)
    int64_t item_id{0};

    /// Item name for display
    std::string item_name;

    /// Authoritative value (nullopt when never entered)
    std::optional<std::string> value;
};

/**
 * @brief Query parameters for form instance search
 */
struct form_instance_query {
    /// Status filter (exact match)
    std::optional<core::form_status> status;

    /// Site filter (exact match)
    std::optional<std::string> site_id;

    /// Only forms whose definition requires double data entry
    bool double_entry_only{false};

    /// Maximum number of results to return (0 = unlimited)
    std::size_t limit{0};
};

}  // namespace dde::storage
