/**
 * @file discrepancy_manager.cpp
 * @brief Implementation of discrepancy resolution
 */

#include <dde/workflow/discrepancy_manager.hpp>

#include <dde/integration/logger_adapter.hpp>
#include <dde/storage/transaction.hpp>

namespace dde::workflow {

using integration::logger_adapter;

discrepancy_manager::discrepancy_manager(
    std::shared_ptr<storage::dde_storage_interface> storage,
    std::shared_ptr<entity_lock_manager> locks)
    : storage_(std::move(storage)), locks_(std::move(locks)) {}

auto discrepancy_manager::resolve(const resolution_request& request) -> VoidResult {
    if (storage::requires_new_value(request.strategy) &&
        (!request.new_value || request.new_value->empty())) {
        logger_adapter::log_security_event(
            integration::security_event_type::invalid_request,
            compat::format("Resolution of discrepancy {} as {} without a value",
                           request.discrepancy_id,
                           storage::to_string(request.strategy)),
            request.resolver_id);
        return dde_void_error(
            error_codes::validation_error,
            compat::format("A new value is required when resolving as {}",
                           storage::to_string(request.strategy)));
    }
    if (request.resolver_id.empty()) {
        return dde_void_error(error_codes::validation_error,
                              "A resolver is required to resolve a discrepancy");
    }

    // Unlocked read, only to find the owning form instance for lock ordering
    auto located = storage_->get_discrepancy(request.discrepancy_id);
    if (located.is_err()) {
        return VoidResult(located.error());
    }
    const auto form_instance_id = located.value().form_instance_id;

    auto form_token = locks_->lock(
        entity_lock_manager::form_instance_key(form_instance_id),
        request.resolver_id, "resolve discrepancy");
    if (form_token.is_err()) {
        return VoidResult(form_token.error());
    }
    scoped_entity_lock form_guard(*locks_, form_token.value());

    auto discrepancy_token = locks_->lock(
        entity_lock_manager::discrepancy_key(request.discrepancy_id),
        request.resolver_id, "resolve discrepancy");
    if (discrepancy_token.is_err()) {
        return VoidResult(discrepancy_token.error());
    }
    scoped_entity_lock discrepancy_guard(*locks_, discrepancy_token.value());

    auto result = storage::in_transaction(
        *storage_, [&]() -> VoidResult { return resolve_locked(request); });

    if (result.is_err()) {
        logger_adapter::warn("Resolving discrepancy {} failed: {}",
                             request.discrepancy_id, result.error().message);
    }
    return result;
}

auto discrepancy_manager::resolve_locked(const resolution_request& request)
    -> VoidResult {
    auto loaded = storage_->get_discrepancy(request.discrepancy_id);
    if (loaded.is_err()) {
        return VoidResult(loaded.error());
    }
    auto record = loaded.value();

    if (!record.is_open()) {
        return dde_void_error(
            error_codes::invalid_state,
            compat::format("Discrepancy {} is already resolved",
                           record.discrepancy_id));
    }

    auto field = storage_->get_field_entry(record.field_id);
    if (field.is_err()) {
        return VoidResult(field.error());
    }
    const auto old_value = field.value().value.value_or("");

    std::string resolved_value;
    switch (request.strategy) {
        case storage::resolution_strategy::first_correct:
            resolved_value = record.first_value;
            break;
        case storage::resolution_strategy::second_correct:
            resolved_value = record.second_value;
            break;
        case storage::resolution_strategy::new_value:
        case storage::resolution_strategy::adjudicated:
            resolved_value = *request.new_value;
            break;
    }

    auto written =
        storage_->set_field_value(record.field_id, resolved_value, request.resolver_id);
    if (written.is_err()) {
        return written;
    }

    const auto now = std::chrono::system_clock::now();
    record.status = storage::resolution_status::resolved;
    record.strategy = request.strategy;
    record.resolved_value = resolved_value;
    record.resolved_by = request.resolver_id;
    record.resolved_at = now;
    record.resolution_notes = request.notes.value_or("");

    auto updated = storage_->update_discrepancy(record);
    if (updated.is_err()) {
        return updated;
    }

    storage::audit_record audit;
    audit.timestamp = now;
    audit.user_id = request.resolver_id;
    audit.audit_table = storage::audit_table::field_data;
    audit.entity_id = record.field_id;
    audit.entity_name = storage::audit_entity::resolution;
    audit.old_value = old_value;
    audit.new_value = resolved_value;
    audit.reason = request.notes && !request.notes->empty()
        ? *request.notes
        : "DDE resolved as " + storage::to_string(request.strategy);
    audit.form_instance_id = record.form_instance_id;

    auto appended = storage_->append_audit(audit);
    if (appended.is_err()) {
        return VoidResult(appended.error());
    }

    logger_adapter::info("Discrepancy {} on form instance {} resolved as {} by {}",
                         record.discrepancy_id, record.form_instance_id,
                         storage::to_string(request.strategy), request.resolver_id);
    return ok();
}

auto discrepancy_manager::count_open(int64_t form_instance_id) -> Result<std::size_t> {
    return storage_->count_open_for_form_instance(form_instance_id);
}

auto discrepancy_manager::list_for_form_instance(int64_t form_instance_id)
    -> Result<std::vector<storage::discrepancy_record>> {
    return storage_->find_discrepancies(form_instance_id);
}

}  // namespace dde::workflow
