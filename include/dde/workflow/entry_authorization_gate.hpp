/**
 * @file entry_authorization_gate.hpp
 * @brief Decides who may perform the first or second entry of a form
 *
 * The gate enforces the distinct-entrant rule: the user submitting the
 * second entry must differ from the user who completed the first entry.
 */

#pragma once

#include <dde/core/result.hpp>
#include <dde/storage/dde_storage_interface.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace dde::workflow {

/**
 * @brief Which transcription the user is allowed to perform
 */
enum class entry_type {
    first,
    second
};

[[nodiscard]] inline auto to_string(entry_type type) -> std::string {
    switch (type) {
        case entry_type::first: return "first";
        case entry_type::second: return "second";
        default: return "unknown";
    }
}

/**
 * @brief Outcome of an authorization check
 */
struct authorization_decision {
    bool allowed{false};

    /// Entry the user may perform when allowed
    std::optional<entry_type> type;

    /// Human-readable denial reason
    std::string reason;

    /// Denial code (dde_not_required, dde_already_complete, dde_same_entrant)
    int error_code{0};

    [[nodiscard]] static auto allow(entry_type type) -> authorization_decision {
        authorization_decision decision;
        decision.allowed = true;
        decision.type = type;
        return decision;
    }

    [[nodiscard]] static auto deny(int code, std::string reason)
        -> authorization_decision {
        authorization_decision decision;
        decision.error_code = code;
        decision.reason = std::move(reason);
        return decision;
    }
};

class entry_authorization_gate {
public:
    explicit entry_authorization_gate(
        std::shared_ptr<storage::dde_storage_interface> storage);

    /**
     * @brief Pure decision over already-loaded state
     *
     * 1. Before first_entry_complete anyone may perform the first entry.
     * 2. Otherwise the form must require double entry.
     * 3. The second entry slot must still be free.
     * 4. The user must differ from the first entrant.
     */
    [[nodiscard]] static auto authorize(const storage::form_instance_record& form,
                                        const std::string& user_id,
                                        bool double_entry_required)
        -> authorization_decision;

    /**
     * @brief Load the form instance and decide
     *
     * Denials are reported through the security event trail.
     *
     * @return record_not_found for an unknown form instance
     */
    [[nodiscard]] auto check(int64_t form_instance_id, const std::string& user_id)
        -> Result<authorization_decision>;

    /**
     * @brief Decide for a form instance already loaded by the caller
     */
    [[nodiscard]] auto check_loaded(const storage::form_instance_record& form,
                                    const std::string& user_id)
        -> Result<authorization_decision>;

private:
    std::shared_ptr<storage::dde_storage_interface> storage_;
};

}  // namespace dde::workflow
