/**
 * @file comparison_engine.cpp
 * @brief Implementation of the first/second entry comparison
 */

#include <dde/workflow/comparison_engine.hpp>

#include <dde/core/form_status.hpp>
#include <dde/core/normalization.hpp>
#include <dde/integration/logger_adapter.hpp>
#include <dde/storage/transaction.hpp>

namespace dde::workflow {

using integration::logger_adapter;

comparison_engine::comparison_engine(
    std::shared_ptr<storage::dde_storage_interface> storage,
    std::shared_ptr<entity_lock_manager> locks)
    : storage_(std::move(storage)), locks_(std::move(locks)) {}

auto comparison_engine::compare(int64_t form_instance_id,
                                const std::string& acting_user_id)
    -> Result<comparison_result> {
    auto token = locks_->lock(entity_lock_manager::form_instance_key(form_instance_id),
                              acting_user_id, "compare entries");
    if (token.is_err()) {
        return Result<comparison_result>(token.error());
    }
    scoped_entity_lock guard(*locks_, token.value());

    return storage::in_transaction(*storage_, [&]() -> Result<comparison_result> {
        auto form = storage_->get_form_instance(form_instance_id);
        if (form.is_err()) {
            return Result<comparison_result>(form.error());
        }
        return compare_locked(form.value());
    });
}

auto comparison_engine::compare_locked(const storage::form_instance_record& form)
    -> Result<comparison_result> {
    if (!form.has_second_entry()) {
        return dde_error<comparison_result>(
            error_codes::invalid_state,
            compat::format("Form instance {} has no second entry to compare",
                           form.form_instance_id));
    }
    // Comparing a reconciled form could open a discrepancy on it
    if (form.status != core::form_status::second_entry_in_progress) {
        return dde_error<comparison_result>(
            error_codes::invalid_state,
            compat::format("Form instance {} is {}; entries are compared only while "
                           "the second entry is in progress",
                           form.form_instance_id, core::to_string(form.status)));
    }

    auto fields = storage_->get_field_values(form.form_instance_id);
    if (fields.is_err()) {
        return Result<comparison_result>(fields.error());
    }

    comparison_result result;
    result.form_instance_id = form.form_instance_id;

    for (const auto& field : fields.value()) {
        field_verdict verdict;
        verdict.field_id = field.field_id;
        verdict.item_id = field.item_id;
        verdict.item_name = field.item_name;
        verdict.first_value = field.value.value_or("");

        auto second_it = form.second_entry_values.find(field.item_id);
        if (second_it != form.second_entry_values.end()) {
            verdict.second_value = second_it->second;
        }

        verdict.matches = core::values_match(field.value, verdict.second_value);

        auto latest = storage_->find_latest_discrepancy_for_field(field.field_id);
        if (latest.is_err()) {
            return Result<comparison_result>(latest.error());
        }
        const auto& existing = latest.value();

        if (verdict.matches) {
            ++result.matched;
        } else {
            ++result.mismatched;

            bool reconciled = existing && !existing->is_open() &&
                              existing->resolved_value &&
                              core::values_match(field.value, *existing->resolved_value);

            if (!existing || (!existing->is_open() && !reconciled)) {
                storage::discrepancy_record record;
                record.form_instance_id = form.form_instance_id;
                record.field_id = field.field_id;
                record.item_id = field.item_id;
                record.first_value = verdict.first_value;
                record.second_value = verdict.second_value;
                record.status = storage::resolution_status::open;
                record.created_at = std::chrono::system_clock::now();

                auto created = storage_->create_discrepancy(record);
                if (created.is_err()) {
                    return Result<comparison_result>(created.error());
                }

                verdict.discrepancy_id = created.value();
                verdict.discrepancy_status = storage::resolution_status::open;
                ++result.created;

                logger_adapter::debug(
                    "Discrepancy {} on form instance {} item {}: '{}' vs '{}'",
                    created.value(), form.form_instance_id, field.item_id,
                    record.first_value, record.second_value);
            }
        }

        if (existing && !verdict.discrepancy_id) {
            verdict.discrepancy_id = existing->discrepancy_id;
            verdict.discrepancy_status = existing->status;
        }
        if (verdict.discrepancy_status == storage::resolution_status::resolved) {
            ++result.resolved;
        }

        result.fields.push_back(std::move(verdict));
    }

    result.total = result.fields.size();

    logger_adapter::info(
        "Compared form instance {}: {} fields, {} matched, {} mismatched, "
        "{} new discrepancies",
        form.form_instance_id, result.total, result.matched, result.mismatched,
        result.created);

    return result;
}

}  // namespace dde::workflow
