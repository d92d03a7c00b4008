/**
 * @file comparison_engine.hpp
 * @brief Field-by-field comparison of first and second entries
 *
 * The comparison engine reads the authoritative first-entry values and the
 * stored second-entry snapshot of a form instance, compares them after
 * normalization, and records a discrepancy for every newly detected
 * mismatch. It never changes the form instance status.
 */

#pragma once

#include <dde/core/result.hpp>
#include <dde/storage/dde_storage_interface.hpp>
#include <dde/workflow/entity_lock_manager.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace dde::workflow {

/**
 * @brief Comparison outcome for one field
 */
struct field_verdict {
    int64_t field_id{0};
    int64_t item_id{0};
    std::string item_name;

    /// Raw first-entry value ("" when never entered)
    std::string first_value;

    /// Raw second-entry value ("" when absent from the snapshot)
    std::string second_value;

    bool matches{false};

    /// Discrepancy tracking this field, if any
    std::optional<int64_t> discrepancy_id;
    std::optional<storage::resolution_status> discrepancy_status;
};

/**
 * @brief Per-field verdicts and aggregate counts for one form instance
 */
struct comparison_result {
    int64_t form_instance_id{0};
    std::vector<field_verdict> fields;

    std::size_t total{0};
    std::size_t matched{0};
    std::size_t mismatched{0};

    /// Fields whose latest discrepancy is resolved
    std::size_t resolved{0};

    /// Discrepancies created by this comparison
    std::size_t created{0};
};

/**
 * @brief Compares first and second entries and detects discrepancies
 *
 * Detection is idempotent: a mismatch that already has an open discrepancy
 * is not flagged again, and a field whose latest discrepancy was resolved
 * to the value it still holds is treated as reconciled.
 */
class comparison_engine {
public:
    comparison_engine(std::shared_ptr<storage::dde_storage_interface> storage,
                      std::shared_ptr<entity_lock_manager> locks);

    /**
     * @brief Compare a form instance under its lock and in one transaction
     *
     * @param form_instance_id Form instance to compare
     * @param acting_user_id Caller, used as lock holder
     * @return record_not_found for an unknown form instance, invalid_state
     *         when no second entry has been recorded or the form is not in
     *         second_entry_in_progress
     */
    [[nodiscard]] auto compare(int64_t form_instance_id,
                               const std::string& acting_user_id = "")
        -> Result<comparison_result>;

    /**
     * @brief Compare within a lock and transaction already held by the caller
     */
    [[nodiscard]] auto compare_locked(const storage::form_instance_record& form)
        -> Result<comparison_result>;

private:
    std::shared_ptr<storage::dde_storage_interface> storage_;
    std::shared_ptr<entity_lock_manager> locks_;
};

}  // namespace dde::workflow
