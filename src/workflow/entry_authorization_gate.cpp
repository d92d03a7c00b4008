/**
 * @file entry_authorization_gate.cpp
 * @brief Implementation of the entry authorization gate
 */

#include <dde/workflow/entry_authorization_gate.hpp>

#include <dde/integration/logger_adapter.hpp>

namespace dde::workflow {

using integration::logger_adapter;
using integration::security_event_type;

entry_authorization_gate::entry_authorization_gate(
    std::shared_ptr<storage::dde_storage_interface> storage)
    : storage_(std::move(storage)) {}

auto entry_authorization_gate::authorize(const storage::form_instance_record& form,
                                         const std::string& user_id,
                                         bool double_entry_required)
    -> authorization_decision {
    if (core::ordinal(form.status) < core::ordinal(core::form_status::first_entry_complete)) {
        return authorization_decision::allow(entry_type::first);
    }

    if (!double_entry_required) {
        return authorization_decision::deny(error_codes::dde_not_required,
                                            "DDE not required for this form");
    }

    if (form.has_second_entry()) {
        return authorization_decision::deny(error_codes::dde_already_complete,
                                            "DDE entries already complete");
    }

    if (user_id == form.first_entry_by) {
        return authorization_decision::deny(
            error_codes::dde_same_entrant,
            "Different user required for second entry. First entry was done by " +
                form.first_entry_by);
    }

    return authorization_decision::allow(entry_type::second);
}

auto entry_authorization_gate::check(int64_t form_instance_id,
                                     const std::string& user_id)
    -> Result<authorization_decision> {
    auto form = storage_->get_form_instance(form_instance_id);
    if (form.is_err()) {
        return Result<authorization_decision>(form.error());
    }
    return check_loaded(form.value(), user_id);
}

auto entry_authorization_gate::check_loaded(const storage::form_instance_record& form,
                                            const std::string& user_id)
    -> Result<authorization_decision> {
    auto required = storage_->is_double_entry_required(form.form_instance_id);
    if (required.is_err()) {
        return Result<authorization_decision>(required.error());
    }

    auto decision = authorize(form, user_id, required.value());

    if (!decision.allowed) {
        auto type = decision.error_code == error_codes::dde_same_entrant
            ? security_event_type::same_entrant_rejected
            : security_event_type::entry_denied;
        logger_adapter::log_security_event(
            type,
            compat::format("Form instance {}: {}", form.form_instance_id,
                           decision.reason),
            user_id);
    }

    return decision;
}

}  // namespace dde::workflow
