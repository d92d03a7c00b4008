/**
 * @file discrepancy_record.hpp
 * @brief Discrepancy record data structures
 *
 * A discrepancy captures a mismatch between the first and second entry of
 * one field, as observed when the entries were compared.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace dde::storage {

/**
 * @brief Resolution status of a discrepancy
 */
enum class resolution_status {
    open,
    resolved
};

[[nodiscard]] inline auto to_string(resolution_status status) -> std::string {
    switch (status) {
        case resolution_status::open: return "open";
        case resolution_status::resolved: return "resolved";
        default: return "unknown";
    }
}

[[nodiscard]] inline auto parse_resolution_status(std::string_view str)
    -> std::optional<resolution_status> {
    if (str == "open") return resolution_status::open;
    if (str == "resolved") return resolution_status::resolved;
    return std::nullopt;
}

/**
 * @brief How a discrepancy was resolved
 */
enum class resolution_strategy {
    first_correct,   ///< Keep the first entry's value
    second_correct,  ///< Take the value captured as second entry
    new_value,       ///< Caller supplies a corrected value
    adjudicated      ///< Reviewer supplies the authoritative value
};

[[nodiscard]] inline auto to_string(resolution_strategy strategy) -> std::string {
    switch (strategy) {
        case resolution_strategy::first_correct: return "first_correct";
        case resolution_strategy::second_correct: return "second_correct";
        case resolution_strategy::new_value: return "new_value";
        case resolution_strategy::adjudicated: return "adjudicated";
        default: return "unknown";
    }
}

[[nodiscard]] inline auto parse_resolution_strategy(std::string_view str)
    -> std::optional<resolution_strategy> {
    if (str == "first_correct") return resolution_strategy::first_correct;
    if (str == "second_correct") return resolution_strategy::second_correct;
    if (str == "new_value") return resolution_strategy::new_value;
    if (str == "adjudicated") return resolution_strategy::adjudicated;
    return std::nullopt;
}

/**
 * @brief Strategies that take the resolved value from the caller
 */
[[nodiscard]] constexpr auto requires_new_value(resolution_strategy strategy) noexcept
    -> bool {
    return strategy == resolution_strategy::new_value ||
           strategy == resolution_strategy::adjudicated;
}

/**
 * @brief Discrepancy record from the discrepancy store
 */
struct discrepancy_record {
    /// Primary key (assigned by the store)
    int64_t discrepancy_id{0};

    /// Linked form instance
    int64_t form_instance_id{0};

    /// Linked field row
    int64_t field_id{0};

    /// CRF item of the linked field
    int64_t item_id{0};

    /// First-entry value at detection time
    std::string first_value;

    /// Second-entry value at detection time
    std::string second_value;

    /// Resolution status
    resolution_status status{resolution_status::open};

    /// Strategy applied on resolution
    std::optional<resolution_strategy> strategy;

    /// Value written back on resolution
    std::optional<std::string> resolved_value;

    /// User who resolved the discrepancy
    std::string resolved_by;

    /// When the discrepancy was resolved
    std::chrono::system_clock::time_point resolved_at;

    /// Reviewer notes supplied with the resolution
    std::string resolution_notes;

    /// Detection time
    std::chrono::system_clock::time_point created_at;

    [[nodiscard]] auto is_open() const noexcept -> bool {
        return status == resolution_status::open;
    }
};

}  // namespace dde::storage
