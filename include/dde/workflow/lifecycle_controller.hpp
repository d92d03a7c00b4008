/**
 * @file lifecycle_controller.hpp
 * @brief Completion lifecycle of a form instance under double data entry
 *
 * The lifecycle controller is the only component that changes the
 * completion status of a form instance:
 *
 * @code
 *   not_started -> first_entry_in_progress -> first_entry_complete
 *               -> second_entry_in_progress -> reconciled
 * @endcode
 *
 * Every transition runs under the form instance lock, inside one storage
 * transaction, and appends one audit record.
 */

#pragma once

#include <dde/core/form_status.hpp>
#include <dde/core/result.hpp>
#include <dde/storage/dde_storage_interface.hpp>
#include <dde/workflow/comparison_engine.hpp>
#include <dde/workflow/entity_lock_manager.hpp>
#include <dde/workflow/entry_authorization_gate.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace dde::workflow {

// =============================================================================
// Status View
// =============================================================================

enum class entry_phase {
    pending,
    in_progress,
    complete
};

enum class comparison_phase {
    pending,        ///< No second entry yet
    matched,        ///< Compared without discrepancies
    discrepancies,  ///< Open discrepancies remain
    resolved        ///< All discrepancies resolved
};

[[nodiscard]] inline auto to_string(entry_phase phase) -> std::string {
    switch (phase) {
        case entry_phase::pending: return "pending";
        case entry_phase::in_progress: return "in_progress";
        case entry_phase::complete: return "complete";
        default: return "unknown";
    }
}

[[nodiscard]] inline auto to_string(comparison_phase phase) -> std::string {
    switch (phase) {
        case comparison_phase::pending: return "pending";
        case comparison_phase::matched: return "matched";
        case comparison_phase::discrepancies: return "discrepancies";
        case comparison_phase::resolved: return "resolved";
        default: return "unknown";
    }
}

/**
 * @brief Double data entry progress of one form instance
 */
struct dde_status {
    int64_t form_instance_id{0};
    core::form_status status{core::form_status::not_started};
    bool double_entry_required{false};

    entry_phase first_entry{entry_phase::pending};
    std::string first_entry_by;
    std::chrono::system_clock::time_point first_entry_at;

    entry_phase second_entry{entry_phase::pending};
    std::string second_entry_by;
    std::chrono::system_clock::time_point second_entry_at;

    comparison_phase comparison{comparison_phase::pending};
    std::size_t total_items{0};
    std::size_t open_discrepancies{0};
    std::size_t resolved_discrepancies{0};

    bool complete{false};
    std::chrono::system_clock::time_point completed_at;
};

/**
 * @brief Result of submit_second_entry()
 */
struct second_entry_outcome {
    comparison_result comparison;

    /// Status after the submission (reconciled when everything matched)
    core::form_status status{core::form_status::second_entry_in_progress};
};

// =============================================================================
// Lifecycle Controller
// =============================================================================

class lifecycle_controller {
public:
    lifecycle_controller(std::shared_ptr<storage::dde_storage_interface> storage,
                         std::shared_ptr<entity_lock_manager> locks);

    /**
     * @brief not_started -> first_entry_in_progress
     */
    [[nodiscard]] auto start_first_entry(int64_t form_instance_id,
                                         const std::string& user_id) -> VoidResult;

    /**
     * @brief not_started | first_entry_in_progress -> first_entry_complete
     *
     * Records the user as first entrant.
     */
    [[nodiscard]] auto mark_first_entry_complete(int64_t form_instance_id,
                                                 const std::string& user_id)
        -> VoidResult;

    /**
     * @brief Store the second entry and compare it against the first
     *
     * The entry authorization gate decides first; a denial returns its
     * reason and changes nothing. On success the form moves to
     * second_entry_in_progress, is compared, and moves on to reconciled
     * when every field matched. All of it is one transaction.
     *
     * @param entries Second-entry values keyed by item identifier
     */
    [[nodiscard]] auto submit_second_entry(int64_t form_instance_id,
                                           const std::string& user_id,
                                           const storage::second_entry_snapshot& entries)
        -> Result<second_entry_outcome>;

    /**
     * @brief second_entry_in_progress -> reconciled
     *
     * @return precondition_failed while discrepancies remain open
     */
    [[nodiscard]] auto finalize(int64_t form_instance_id, const std::string& user_id)
        -> VoidResult;

    [[nodiscard]] auto get_status(int64_t form_instance_id) -> Result<dde_status>;

private:
    /**
     * @brief Apply one lifecycle edge to a loaded record, persist and audit
     */
    [[nodiscard]] auto transition(storage::form_instance_record& form,
                                  core::form_status to, const std::string& user_id,
                                  const char* entity_name, const std::string& reason)
        -> VoidResult;

    std::shared_ptr<storage::dde_storage_interface> storage_;
    std::shared_ptr<entity_lock_manager> locks_;
    comparison_engine comparison_;
    entry_authorization_gate gate_;
};

}  // namespace dde::workflow
