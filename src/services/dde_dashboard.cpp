/**
 * @file dde_dashboard.cpp
 * @brief Implementation of the DDE dashboard projections
 */

#include <dde/services/dde_dashboard.hpp>

#include <dde/integration/logger_adapter.hpp>

#include <algorithm>

namespace dde::services {

using core::form_status;
using integration::logger_adapter;

dde_dashboard::dde_dashboard(std::shared_ptr<storage::dde_storage_interface> storage,
                             workflow::dde_workflow_config config)
    : storage_(std::move(storage)), config_(config) {}

auto dde_dashboard::summarize(const storage::form_instance_record& form,
                              std::chrono::system_clock::time_point since,
                              std::chrono::system_clock::time_point now)
    -> form_instance_summary {
    form_instance_summary summary;
    summary.form_instance_id = form.form_instance_id;
    summary.subject_label = form.subject_label;
    summary.site_id = form.site_id;
    summary.form_name = form.form_name;
    summary.event_name = form.event_name;
    summary.status = form.status;
    summary.first_entry_by = form.first_entry_by;
    summary.first_entry_at = form.first_entry_at;
    summary.second_entry_by = form.second_entry_by;
    summary.second_entry_at = form.second_entry_at;
    summary.waiting_since = since;

    if (since != std::chrono::system_clock::time_point{} && now > since) {
        summary.wait_time =
            std::chrono::duration_cast<std::chrono::seconds>(now - since);
        summary.days_waiting = summary.wait_time.count() / (24 * 60 * 60);
    }
    return summary;
}

auto dde_dashboard::pending_second_entry(const std::optional<std::string>& site_id)
    -> Result<std::vector<form_instance_summary>> {
    storage::form_instance_query query;
    query.status = form_status::first_entry_complete;
    query.site_id = site_id;
    query.double_entry_only = true;

    auto forms = storage_->find_form_instances(query);
    if (forms.is_err()) {
        logger_adapter::error("Dashboard query failed: {}", forms.error().message);
        return Result<std::vector<form_instance_summary>>(forms.error());
    }

    const auto now = std::chrono::system_clock::now();
    std::vector<form_instance_summary> summaries;
    for (const auto& form : forms.value()) {
        if (form.has_second_entry()) {
            continue;
        }
        summaries.push_back(summarize(form, form.first_entry_at, now));
    }

    std::stable_sort(summaries.begin(), summaries.end(),
                     [](const auto& a, const auto& b) {
                         return a.waiting_since < b.waiting_since;
                     });
    if (summaries.size() > config_.dashboard_limit) {
        summaries.resize(config_.dashboard_limit);
    }
    return summaries;
}

auto dde_dashboard::pending_resolution(const std::optional<std::string>& site_id)
    -> Result<std::vector<form_instance_summary>> {
    storage::form_instance_query query;
    query.status = form_status::second_entry_in_progress;
    query.site_id = site_id;
    query.double_entry_only = true;

    auto forms = storage_->find_form_instances(query);
    if (forms.is_err()) {
        logger_adapter::error("Dashboard query failed: {}", forms.error().message);
        return Result<std::vector<form_instance_summary>>(forms.error());
    }

    const auto now = std::chrono::system_clock::now();
    std::vector<form_instance_summary> summaries;
    for (const auto& form : forms.value()) {
        auto open = storage_->count_open_for_form_instance(form.form_instance_id);
        if (open.is_err()) {
            return Result<std::vector<form_instance_summary>>(open.error());
        }
        if (open.value() == 0) {
            continue;
        }

        auto summary = summarize(form, form.second_entry_at, now);
        summary.open_discrepancies = open.value();
        summaries.push_back(std::move(summary));
    }

    std::stable_sort(summaries.begin(), summaries.end(),
                     [](const auto& a, const auto& b) {
                         return a.waiting_since < b.waiting_since;
                     });
    if (summaries.size() > config_.dashboard_limit) {
        summaries.resize(config_.dashboard_limit);
    }
    return summaries;
}

auto dde_dashboard::statistics() -> Result<dde_statistics> {
    auto counts = storage_->count_form_instances_by_status(true);
    if (counts.is_err()) {
        logger_adapter::error("Dashboard statistics failed: {}",
                              counts.error().message);
        return Result<dde_statistics>(counts.error());
    }

    dde_statistics stats;
    stats.by_status = counts.value();

    auto count_of = [&](form_status status) -> std::size_t {
        auto it = stats.by_status.find(status);
        return it == stats.by_status.end() ? 0 : it->second;
    };

    stats.pending = count_of(form_status::first_entry_complete);
    stats.discrepancies = count_of(form_status::second_entry_in_progress);
    stats.complete = count_of(form_status::reconciled);
    stats.total = stats.pending + stats.discrepancies + stats.complete;

    return stats;
}

auto dde_dashboard::overview(const std::optional<std::string>& site_id)
    -> Result<dashboard_overview> {
    dashboard_overview view;

    auto pending = pending_second_entry(site_id);
    if (pending.is_err()) {
        return Result<dashboard_overview>(pending.error());
    }
    view.pending_second_entry = std::move(pending.value());

    auto resolution = pending_resolution(site_id);
    if (resolution.is_err()) {
        return Result<dashboard_overview>(resolution.error());
    }
    view.pending_resolution = std::move(resolution.value());

    auto stats = statistics();
    if (stats.is_err()) {
        return Result<dashboard_overview>(stats.error());
    }
    view.statistics = std::move(stats.value());

    return view;
}

}  // namespace dde::services
