/**
 * @file result.hpp
 * @brief Result<T> type aliases and error codes for the DDE engine
 *
 * This file provides standardized Result<T> types and error handling
 * utilities for the double data-entry reconciliation engine, integrating
 * with common_system's Result pattern.
 *
 * @see common_system/include/kcenon/common/patterns/result.h
 */

#pragma once

#include <kcenon/common/patterns/result.h>
#include <kcenon/common/error/error_codes.h>

#include <string>
#include <string_view>

namespace dde {

/**
 * @brief Result type alias for DDE operations
 * @tparam T The success value type
 */
template <typename T>
using Result = kcenon::common::Result<T>;

/**
 * @brief Result type for void operations
 */
using VoidResult = kcenon::common::VoidResult;

/**
 * @brief Error information type
 */
using error_info = kcenon::common::error_info;

/**
 * @namespace error_codes
 * @brief DDE-specific error codes
 *
 * Error code range: -700 to -799
 * Provides access to both common error codes and DDE-specific codes.
 */
namespace error_codes {
    // Import common error codes
    using namespace kcenon::common::error::codes::common_errors;

    constexpr int dde_base = -700;

    // Workflow errors (-700 to -719)
    constexpr int record_not_found = dde_base - 0;
    constexpr int invalid_state = dde_base - 1;
    constexpr int validation_error = dde_base - 2;
    constexpr int precondition_failed = dde_base - 3;

    // Entry authorization denials (-720 to -729)
    constexpr int authorization_denied = dde_base - 20;
    constexpr int dde_not_required = dde_base - 21;
    constexpr int dde_already_complete = dde_base - 22;
    constexpr int dde_same_entrant = dde_base - 23;

    // Lock errors (-740 to -749)
    constexpr int lock_timeout = dde_base - 40;
    constexpr int lock_invalid_token = dde_base - 41;
    constexpr int lock_not_found = dde_base - 42;

    // Storage errors (-780 to -799)
    constexpr int database_open_error = dde_base - 80;
    constexpr int database_query_error = dde_base - 81;
    constexpr int database_transaction_error = dde_base - 82;
    constexpr int database_migration_error = dde_base - 83;
    constexpr int database_integrity_error = dde_base - 84;
    constexpr int snapshot_parse_error = dde_base - 85;
    constexpr int audit_write_failed = dde_base - 86;
}  // namespace error_codes

/**
 * @brief Error taxonomy exposed to callers
 *
 * Every DDE error code maps onto one kind. Infrastructure failures
 * (database, lock wait) share the storage_failure kind.
 */
enum class error_kind {
    not_found,
    invalid_state,
    validation_error,
    authorization_denied,
    precondition_failed,
    storage_failure
};

/**
 * @brief Map an error code onto the error taxonomy
 */
[[nodiscard]] inline auto classify(int code) noexcept -> error_kind {
    switch (code) {
        case error_codes::record_not_found:
            return error_kind::not_found;
        case error_codes::invalid_state:
            return error_kind::invalid_state;
        case error_codes::validation_error:
            return error_kind::validation_error;
        case error_codes::authorization_denied:
        case error_codes::dde_not_required:
        case error_codes::dde_already_complete:
        case error_codes::dde_same_entrant:
            return error_kind::authorization_denied;
        case error_codes::precondition_failed:
            return error_kind::precondition_failed;
        default:
            return error_kind::storage_failure;
    }
}

/**
 * @brief Convert error_kind to its display name
 */
[[nodiscard]] inline auto to_string(error_kind kind) -> std::string {
    switch (kind) {
        case error_kind::not_found: return "NotFound";
        case error_kind::invalid_state: return "InvalidState";
        case error_kind::validation_error: return "ValidationError";
        case error_kind::authorization_denied: return "AuthorizationDenied";
        case error_kind::precondition_failed: return "PreconditionFailed";
        case error_kind::storage_failure: return "StorageFailure";
        default: return "Unknown";
    }
}

// Re-export common utility functions
using kcenon::common::ok;
using kcenon::common::make_error;

/**
 * @brief Create a DDE error result with module context
 * @tparam T The result value type
 * @param code Error code from dde::error_codes
 * @param message Error message
 * @return Result<T> containing the error
 */
template <typename T>
inline Result<T> dde_error(int code, const std::string& message) {
    return kcenon::common::make_error<T>(code, message, "dde");
}

/**
 * @brief Create a DDE void error result
 * @param code Error code from dde::error_codes
 * @param message Error message
 * @return VoidResult containing the error
 */
inline VoidResult dde_void_error(int code, const std::string& message) {
    return VoidResult(error_info{code, message, "dde"});
}

}  // namespace dde
