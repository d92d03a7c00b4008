/**
 * @file discrepancy_manager.hpp
 * @brief Resolution of detected discrepancies
 *
 * Resolving a discrepancy picks the authoritative value for its field,
 * writes that value back to the form instance store, marks the discrepancy
 * resolved and records one audit entry, all in one transaction.
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
 * @brief Parameters of a resolve() call
 */
struct resolution_request {
    int64_t discrepancy_id{0};

    storage::resolution_strategy strategy{storage::resolution_strategy::first_correct};

    /// Required for new_value and adjudicated
    std::optional<std::string> new_value;

    /// Acting user
    std::string resolver_id;

    /// Optional reviewer notes; used as the audit reason when present
    std::optional<std::string> notes;
};

class discrepancy_manager {
public:
    discrepancy_manager(std::shared_ptr<storage::dde_storage_interface> storage,
                        std::shared_ptr<entity_lock_manager> locks);

    /**
     * @brief Resolve one discrepancy
     *
     * @return validation_error when the strategy needs a value that was not
     *         supplied (checked before anything is read), record_not_found for
     *         an unknown discrepancy, invalid_state when already resolved
     */
    [[nodiscard]] auto resolve(const resolution_request& request) -> VoidResult;

    /**
     * @brief Number of open discrepancies on a form instance
     */
    [[nodiscard]] auto count_open(int64_t form_instance_id) -> Result<std::size_t>;

    /**
     * @brief All discrepancies of a form instance, oldest first
     */
    [[nodiscard]] auto list_for_form_instance(int64_t form_instance_id)
        -> Result<std::vector<storage::discrepancy_record>>;

private:
    [[nodiscard]] auto resolve_locked(const resolution_request& request)
        -> VoidResult;

    std::shared_ptr<storage::dde_storage_interface> storage_;
    std::shared_ptr<entity_lock_manager> locks_;
};

}  // namespace dde::workflow
