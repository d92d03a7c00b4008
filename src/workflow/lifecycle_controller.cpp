/**
 * @file lifecycle_controller.cpp
 * @brief Implementation of the form instance completion lifecycle
 */

#include <dde/workflow/lifecycle_controller.hpp>

#include <dde/integration/logger_adapter.hpp>
#include <dde/storage/transaction.hpp>

namespace dde::workflow {

using core::form_status;
using integration::logger_adapter;

namespace {

auto require_user(const std::string& user_id) -> VoidResult {
    if (user_id.empty()) {
        return dde_void_error(error_codes::validation_error,
                              "An acting user is required");
    }
    return ok();
}

auto invalid_state(const char* action, const storage::form_instance_record& form)
    -> VoidResult {
    return dde_void_error(
        error_codes::invalid_state,
        compat::format("Cannot {}: form instance {} is {}", action,
                       form.form_instance_id, core::to_string(form.status)));
}

}  // namespace

lifecycle_controller::lifecycle_controller(
    std::shared_ptr<storage::dde_storage_interface> storage,
    std::shared_ptr<entity_lock_manager> locks)
    : storage_(storage), locks_(locks), comparison_(storage, locks), gate_(storage) {}

// =============================================================================
// First Entry
// =============================================================================

auto lifecycle_controller::start_first_entry(int64_t form_instance_id,
                                             const std::string& user_id)
    -> VoidResult {
    auto valid = require_user(user_id);
    if (valid.is_err()) {
        return valid;
    }

    auto token = locks_->lock(entity_lock_manager::form_instance_key(form_instance_id),
                              user_id, "start first entry");
    if (token.is_err()) {
        return VoidResult(token.error());
    }
    scoped_entity_lock guard(*locks_, token.value());

    return storage::in_transaction(*storage_, [&]() -> VoidResult {
        auto loaded = storage_->get_form_instance(form_instance_id);
        if (loaded.is_err()) {
            return VoidResult(loaded.error());
        }
        auto form = loaded.value();

        if (form.status != form_status::not_started) {
            return invalid_state("start first entry", form);
        }

        return transition(form, form_status::first_entry_in_progress, user_id,
                          storage::audit_entity::first_entry_started,
                          "First data entry started");
    });
}

auto lifecycle_controller::mark_first_entry_complete(int64_t form_instance_id,
                                                     const std::string& user_id)
    -> VoidResult {
    auto valid = require_user(user_id);
    if (valid.is_err()) {
        return valid;
    }

    auto token = locks_->lock(entity_lock_manager::form_instance_key(form_instance_id),
                              user_id, "complete first entry");
    if (token.is_err()) {
        return VoidResult(token.error());
    }
    scoped_entity_lock guard(*locks_, token.value());

    return storage::in_transaction(*storage_, [&]() -> VoidResult {
        auto loaded = storage_->get_form_instance(form_instance_id);
        if (loaded.is_err()) {
            return VoidResult(loaded.error());
        }
        auto form = loaded.value();

        if (form.status != form_status::not_started &&
            form.status != form_status::first_entry_in_progress) {
            return invalid_state("complete first entry", form);
        }

        form.first_entry_by = user_id;
        form.first_entry_at = std::chrono::system_clock::now();

        return transition(form, form_status::first_entry_complete, user_id,
                          storage::audit_entity::first_entry_complete,
                          "First data entry completed by " + user_id);
    });
}

// =============================================================================
// Second Entry
// =============================================================================

auto lifecycle_controller::submit_second_entry(
    int64_t form_instance_id, const std::string& user_id,
    const storage::second_entry_snapshot& entries) -> Result<second_entry_outcome> {
    auto valid = require_user(user_id);
    if (valid.is_err()) {
        return Result<second_entry_outcome>(valid.error());
    }

    auto token = locks_->lock(entity_lock_manager::form_instance_key(form_instance_id),
                              user_id, "submit second entry");
    if (token.is_err()) {
        return Result<second_entry_outcome>(token.error());
    }
    scoped_entity_lock guard(*locks_, token.value());

    auto result = storage::in_transaction(
        *storage_, [&]() -> Result<second_entry_outcome> {
            auto loaded = storage_->get_form_instance(form_instance_id);
            if (loaded.is_err()) {
                return Result<second_entry_outcome>(loaded.error());
            }
            auto form = loaded.value();

            auto decision = gate_.check_loaded(form, user_id);
            if (decision.is_err()) {
                return Result<second_entry_outcome>(decision.error());
            }
            if (!decision.value().allowed) {
                return dde_error<second_entry_outcome>(decision.value().error_code,
                                                       decision.value().reason);
            }
            if (decision.value().type == entry_type::first ||
                form.status != form_status::first_entry_complete) {
                auto state = invalid_state("submit second entry", form);
                return Result<second_entry_outcome>(state.error());
            }

            auto stored = storage_->store_second_entry(form_instance_id, entries);
            if (stored.is_err()) {
                return Result<second_entry_outcome>(stored.error());
            }
            form.second_entry_values = entries;
            form.second_entry_by = user_id;
            form.second_entry_at = std::chrono::system_clock::now();

            auto submitted = transition(
                form, form_status::second_entry_in_progress, user_id,
                storage::audit_entity::second_entry_submitted,
                compat::format("Second data entry submitted with {} values",
                               entries.size()));
            if (submitted.is_err()) {
                return Result<second_entry_outcome>(submitted.error());
            }

            auto comparison = comparison_.compare_locked(form);
            if (comparison.is_err()) {
                return Result<second_entry_outcome>(comparison.error());
            }

            auto open = storage_->count_open_for_form_instance(form_instance_id);
            if (open.is_err()) {
                return Result<second_entry_outcome>(open.error());
            }

            second_entry_outcome outcome;
            outcome.comparison = std::move(comparison.value());

            if (outcome.comparison.mismatched == 0 && open.value() == 0) {
                form.completed_at = std::chrono::system_clock::now();
                auto reconciled = transition(
                    form, form_status::reconciled, user_id,
                    storage::audit_entity::auto_reconciled,
                    compat::format("All {} fields matched",
                                   outcome.comparison.total));
                if (reconciled.is_err()) {
                    return Result<second_entry_outcome>(reconciled.error());
                }
            }

            outcome.status = form.status;
            return outcome;
        });

    if (result.is_err()) {
        logger_adapter::warn("Second entry on form instance {} by {} rejected: {}",
                             form_instance_id, user_id, result.error().message);
    }
    return result;
}

// =============================================================================
// Finalize
// =============================================================================

auto lifecycle_controller::finalize(int64_t form_instance_id,
                                    const std::string& user_id) -> VoidResult {
    auto valid = require_user(user_id);
    if (valid.is_err()) {
        return valid;
    }

    auto token = locks_->lock(entity_lock_manager::form_instance_key(form_instance_id),
                              user_id, "finalize");
    if (token.is_err()) {
        return VoidResult(token.error());
    }
    scoped_entity_lock guard(*locks_, token.value());

    return storage::in_transaction(*storage_, [&]() -> VoidResult {
        auto loaded = storage_->get_form_instance(form_instance_id);
        if (loaded.is_err()) {
            return VoidResult(loaded.error());
        }
        auto form = loaded.value();

        if (form.status != form_status::second_entry_in_progress) {
            return invalid_state("finalize", form);
        }

        auto open = storage_->count_open_for_form_instance(form_instance_id);
        if (open.is_err()) {
            return VoidResult(open.error());
        }
        if (open.value() > 0) {
            return dde_void_error(
                error_codes::precondition_failed,
                compat::format("Cannot finalize: {} unresolved discrepancies remain",
                               open.value()));
        }

        form.completed_at = std::chrono::system_clock::now();
        return transition(form, form_status::reconciled, user_id,
                          storage::audit_entity::finalized,
                          "Double data entry finalized");
    });
}

// =============================================================================
// Status View
// =============================================================================

auto lifecycle_controller::get_status(int64_t form_instance_id) -> Result<dde_status> {
    auto loaded = storage_->get_form_instance(form_instance_id);
    if (loaded.is_err()) {
        return Result<dde_status>(loaded.error());
    }
    const auto& form = loaded.value();

    auto fields = storage_->get_field_values(form_instance_id);
    if (fields.is_err()) {
        return Result<dde_status>(fields.error());
    }

    auto discrepancies = storage_->find_discrepancies(form_instance_id);
    if (discrepancies.is_err()) {
        return Result<dde_status>(discrepancies.error());
    }

    dde_status view;
    view.form_instance_id = form.form_instance_id;
    view.status = form.status;
    view.double_entry_required = form.double_entry_required;
    view.total_items = fields.value().size();

    for (const auto& discrepancy : discrepancies.value()) {
        if (discrepancy.is_open()) {
            ++view.open_discrepancies;
        } else {
            ++view.resolved_discrepancies;
        }
    }

    switch (form.status) {
        case form_status::not_started:
            view.first_entry = entry_phase::pending;
            break;
        case form_status::first_entry_in_progress:
            view.first_entry = entry_phase::in_progress;
            break;
        default:
            view.first_entry = entry_phase::complete;
            break;
    }
    view.first_entry_by = form.first_entry_by;
    view.first_entry_at = form.first_entry_at;

    view.second_entry = form.has_second_entry() ? entry_phase::complete
                                                : entry_phase::pending;
    view.second_entry_by = form.second_entry_by;
    view.second_entry_at = form.second_entry_at;

    if (!form.has_second_entry()) {
        view.comparison = comparison_phase::pending;
    } else if (view.open_discrepancies > 0) {
        view.comparison = comparison_phase::discrepancies;
    } else if (view.resolved_discrepancies > 0) {
        view.comparison = comparison_phase::resolved;
    } else {
        view.comparison = comparison_phase::matched;
    }

    view.complete = form.status == form_status::reconciled;
    view.completed_at = form.completed_at;

    return view;
}

// =============================================================================
// Internal
// =============================================================================

auto lifecycle_controller::transition(storage::form_instance_record& form,
                                      form_status to, const std::string& user_id,
                                      const char* entity_name,
                                      const std::string& reason) -> VoidResult {
    const auto from = form.status;
    if (!core::is_permitted_transition(from, to)) {
        return dde_void_error(
            error_codes::invalid_state,
            compat::format("Transition {} -> {} is not permitted",
                           core::to_string(from), core::to_string(to)));
    }

    form.status = to;

    auto updated = storage_->update_form_instance(form);
    if (updated.is_err()) {
        form.status = from;
        return updated;
    }

    storage::audit_record audit;
    audit.timestamp = std::chrono::system_clock::now();
    audit.user_id = user_id;
    audit.audit_table = storage::audit_table::form_instance;
    audit.entity_id = form.form_instance_id;
    audit.entity_name = entity_name;
    audit.old_value = core::to_string(from);
    audit.new_value = core::to_string(to);
    audit.reason = reason;
    audit.form_instance_id = form.form_instance_id;

    auto appended = storage_->append_audit(audit);
    if (appended.is_err()) {
        form.status = from;
        return VoidResult(appended.error());
    }

    logger_adapter::info("Form instance {}: {} -> {} by {}", form.form_instance_id,
                         core::to_string(from), core::to_string(to), user_id);
    return ok();
}

}  // namespace dde::workflow
