/**
 * @file dde_engine.hpp
 * @brief Wires the DDE components around one store and one lock table
 */

#pragma once

#include <dde/services/dde_dashboard.hpp>
#include <dde/storage/dde_storage_interface.hpp>
#include <dde/workflow/comparison_engine.hpp>
#include <dde/workflow/dde_workflow_config.hpp>
#include <dde/workflow/discrepancy_manager.hpp>
#include <dde/workflow/entity_lock_manager.hpp>
#include <dde/workflow/entry_authorization_gate.hpp>
#include <dde/workflow/lifecycle_controller.hpp>

#include <memory>

namespace dde::workflow {

/**
 * @brief Owns the lock manager and the components sharing it
 *
 * All callers that mutate the same store must go through the same engine
 * (or at least the same entity_lock_manager).
 *
 * @example
 * @code
 * auto storage = std::shared_ptr<storage::sqlite_dde_storage>(
 *     storage::sqlite_dde_storage::open("dde.db").value());
 * dde_engine engine(storage);
 *
 * engine.lifecycle().mark_first_entry_complete(form_id, "user-1");
 * auto outcome = engine.lifecycle().submit_second_entry(form_id, "user-2", values);
 * @endcode
 */
class dde_engine {
public:
    explicit dde_engine(std::shared_ptr<storage::dde_storage_interface> storage,
                        const dde_workflow_config& config = {});

    [[nodiscard]] auto lifecycle() -> lifecycle_controller& { return lifecycle_; }
    [[nodiscard]] auto comparison() -> comparison_engine& { return comparison_; }
    [[nodiscard]] auto discrepancies() -> discrepancy_manager& { return discrepancies_; }
    [[nodiscard]] auto gate() -> entry_authorization_gate& { return gate_; }
    [[nodiscard]] auto dashboard() -> services::dde_dashboard& { return dashboard_; }
    [[nodiscard]] auto locks() -> entity_lock_manager& { return *locks_; }

    [[nodiscard]] auto config() const -> const dde_workflow_config& { return config_; }

private:
    dde_workflow_config config_;
    std::shared_ptr<storage::dde_storage_interface> storage_;
    std::shared_ptr<entity_lock_manager> locks_;

    comparison_engine comparison_;
    discrepancy_manager discrepancies_;
    entry_authorization_gate gate_;
    lifecycle_controller lifecycle_;
    services::dde_dashboard dashboard_;
};

}  // namespace dde::workflow
