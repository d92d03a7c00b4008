/**
 * @file form_status.hpp
 * @brief Completion status of a form instance under double data entry
 *
 * The five states form a linear lifecycle:
 *
 *   not_started -> first_entry_in_progress -> first_entry_complete
 *               -> second_entry_in_progress -> reconciled
 *
 * The shared store encodes completion status as an integer code that is
 * also used by unrelated workflows. Translation to and from that code is
 * confined to the storage adapter through the helpers in this file.
 */

#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace dde::core {

/**
 * @brief Lifecycle state of a form instance
 */
enum class form_status {
    not_started,
    first_entry_in_progress,
    first_entry_complete,
    second_entry_in_progress,
    reconciled
};

/**
 * @brief Convert form_status to string representation
 */
[[nodiscard]] inline auto to_string(form_status status) -> std::string {
    switch (status) {
        case form_status::not_started: return "not_started";
        case form_status::first_entry_in_progress: return "first_entry_in_progress";
        case form_status::first_entry_complete: return "first_entry_complete";
        case form_status::second_entry_in_progress: return "second_entry_in_progress";
        case form_status::reconciled: return "reconciled";
        default: return "unknown";
    }
}

/**
 * @brief Parse form_status from string
 */
[[nodiscard]] inline auto parse_form_status(std::string_view str)
    -> std::optional<form_status> {
    if (str == "not_started") return form_status::not_started;
    if (str == "first_entry_in_progress") return form_status::first_entry_in_progress;
    if (str == "first_entry_complete") return form_status::first_entry_complete;
    if (str == "second_entry_in_progress") return form_status::second_entry_in_progress;
    if (str == "reconciled") return form_status::reconciled;
    return std::nullopt;
}

/**
 * @brief Position of a status along the lifecycle (0-based)
 */
[[nodiscard]] constexpr auto ordinal(form_status status) noexcept -> int {
    return static_cast<int>(status);
}

/**
 * @brief Check whether a direct transition is part of the lifecycle graph
 *
 * The only edge that skips a state is not_started -> first_entry_complete,
 * taken when first entry is marked complete without an explicit start.
 */
[[nodiscard]] constexpr auto is_permitted_transition(form_status from,
                                                     form_status to) noexcept
    -> bool {
    switch (from) {
        case form_status::not_started:
            return to == form_status::first_entry_in_progress ||
                   to == form_status::first_entry_complete;
        case form_status::first_entry_in_progress:
            return to == form_status::first_entry_complete;
        case form_status::first_entry_complete:
            return to == form_status::second_entry_in_progress;
        case form_status::second_entry_in_progress:
            return to == form_status::reconciled;
        case form_status::reconciled:
        default:
            return false;
    }
}

// ─────────────────────────────────────────────────────
// Shared completion-status code translation
// ─────────────────────────────────────────────────────

/// Shared completion status codes used by the form instance store
namespace completion_status_code {
    constexpr int not_started = 1;
    constexpr int initial_data_entry = 2;
    constexpr int initial_data_entry_complete = 3;
    constexpr int double_data_entry = 4;
    constexpr int double_data_entry_complete = 5;
}  // namespace completion_status_code

/**
 * @brief Translate a form_status to the shared completion status code
 */
[[nodiscard]] constexpr auto to_completion_status_code(form_status status) noexcept
    -> int {
    switch (status) {
        case form_status::not_started:
            return completion_status_code::not_started;
        case form_status::first_entry_in_progress:
            return completion_status_code::initial_data_entry;
        case form_status::first_entry_complete:
            return completion_status_code::initial_data_entry_complete;
        case form_status::second_entry_in_progress:
            return completion_status_code::double_data_entry;
        case form_status::reconciled:
            return completion_status_code::double_data_entry_complete;
        default:
            return completion_status_code::not_started;
    }
}

/**
 * @brief Translate a shared completion status code to a form_status
 * @return nullopt for codes that do not belong to the DDE lifecycle
 */
[[nodiscard]] constexpr auto from_completion_status_code(int code) noexcept
    -> std::optional<form_status> {
    switch (code) {
        case completion_status_code::not_started:
            return form_status::not_started;
        case completion_status_code::initial_data_entry:
            return form_status::first_entry_in_progress;
        case completion_status_code::initial_data_entry_complete:
            return form_status::first_entry_complete;
        case completion_status_code::double_data_entry:
            return form_status::second_entry_in_progress;
        case completion_status_code::double_data_entry_complete:
            return form_status::reconciled;
        default:
            return std::nullopt;
    }
}

}  // namespace dde::core
