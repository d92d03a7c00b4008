/**
 * @file dde_workflow_config.hpp
 * @brief Configuration for the DDE workflow components
 */

#pragma once

#include <chrono>
#include <cstddef>

namespace dde::workflow {

/**
 * @brief Tunables shared by the DDE workflow components
 */
struct dde_workflow_config {
    /// Maximum time to wait for a form instance or discrepancy lock
    std::chrono::milliseconds lock_wait_timeout{5000};

    /// Maximum number of rows returned by dashboard lists
    std::size_t dashboard_limit{50};
};

}  // namespace dde::workflow
