/**
 * @file dde_dashboard.hpp
 * @brief Read-only projections over double data entry progress
 *
 * The dashboard lists form instances waiting for a second entry and form
 * instances waiting for discrepancy resolution, and counts form instances
 * by lifecycle status. It never mutates anything.
 */

#pragma once

#include <dde/core/form_status.hpp>
#include <dde/core/result.hpp>
#include <dde/storage/dde_storage_interface.hpp>
#include <dde/workflow/dde_workflow_config.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace dde::services {

/**
 * @brief One dashboard row
 */
struct form_instance_summary {
    int64_t form_instance_id{0};
    std::string subject_label;
    std::string site_id;
    std::string form_name;
    std::string event_name;
    core::form_status status{core::form_status::not_started};

    std::string first_entry_by;
    std::chrono::system_clock::time_point first_entry_at;
    std::string second_entry_by;
    std::chrono::system_clock::time_point second_entry_at;

    std::size_t open_discrepancies{0};

    /// Timestamp the wait is measured from
    std::chrono::system_clock::time_point waiting_since;

    /// Elapsed wait at the time the summary was built
    std::chrono::seconds wait_time{0};

    /// Whole days of wait_time
    int64_t days_waiting{0};
};

/**
 * @brief Counts of form instances
 */
struct dde_statistics {
    /// Double-entry forms per lifecycle status
    std::map<core::form_status, std::size_t> by_status;

    /// Forms past first entry (first_entry_complete, second_entry_in_progress, reconciled)
    std::size_t total{0};

    /// Waiting for a second entry
    std::size_t pending{0};

    /// Second entry submitted, not reconciled
    std::size_t discrepancies{0};

    /// Reconciled
    std::size_t complete{0};
};

/**
 * @brief Everything shown on the DDE dashboard
 */
struct dashboard_overview {
    std::vector<form_instance_summary> pending_second_entry;
    std::vector<form_instance_summary> pending_resolution;
    dde_statistics statistics;
};

class dde_dashboard {
public:
    explicit dde_dashboard(std::shared_ptr<storage::dde_storage_interface> storage,
                           workflow::dde_workflow_config config = {});

    /**
     * @brief Double-entry forms with a completed first entry and no second
     *        entry, longest waiting first
     */
    [[nodiscard]] auto pending_second_entry(
        const std::optional<std::string>& site_id = std::nullopt)
        -> Result<std::vector<form_instance_summary>>;

    /**
     * @brief Forms in second_entry_in_progress that still have open
     *        discrepancies, longest waiting first
     */
    [[nodiscard]] auto pending_resolution(
        const std::optional<std::string>& site_id = std::nullopt)
        -> Result<std::vector<form_instance_summary>>;

    [[nodiscard]] auto statistics() -> Result<dde_statistics>;

    [[nodiscard]] auto overview(const std::optional<std::string>& site_id = std::nullopt)
        -> Result<dashboard_overview>;

private:
    [[nodiscard]] static auto summarize(const storage::form_instance_record& form,
                                        std::chrono::system_clock::time_point since,
                                        std::chrono::system_clock::time_point now)
        -> form_instance_summary;

    std::shared_ptr<storage::dde_storage_interface> storage_;
    workflow::dde_workflow_config config_;
};

}  // namespace dde::services
