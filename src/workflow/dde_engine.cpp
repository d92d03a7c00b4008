/**
 * @file dde_engine.cpp
 * @brief Construction of the DDE component set
 */

#include <dde/workflow/dde_engine.hpp>

namespace dde::workflow {

namespace {

auto make_locks(const dde_workflow_config& config)
    -> std::shared_ptr<entity_lock_manager> {
    entity_lock_manager_config lock_config;
    lock_config.acquire_wait_timeout = config.lock_wait_timeout;
    return std::make_shared<entity_lock_manager>(lock_config);
}

}  // namespace

dde_engine::dde_engine(std::shared_ptr<storage::dde_storage_interface> storage,
                       const dde_workflow_config& config)
    : config_(config),
      storage_(std::move(storage)),
      locks_(make_locks(config)),
      comparison_(storage_, locks_),
      discrepancies_(storage_, locks_),
      gate_(storage_),
      lifecycle_(storage_, locks_),
      dashboard_(storage_, config) {}

}  // namespace dde::workflow
