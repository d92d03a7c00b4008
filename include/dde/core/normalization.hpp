/**
 * @file normalization.hpp
 * @brief Canonical form of raw field values for entry comparison
 */

#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace dde::core {

/**
 * @brief Map a raw field value to its comparable form
 *
 * A missing value maps to the empty string. Otherwise leading and trailing
 * Unicode whitespace (White_Space, plus U+FEFF and without U+0085) is trimmed
 * and the text is lowercased with the root-locale Unicode case mapping.
 * Input is read as UTF-8; malformed sequences compare as U+FFFD.
 *
 * @param raw Raw value as entered (nullopt for a missing value)
 * @return Canonical string used for equality comparison
 */
[[nodiscard]] auto normalize_for_comparison(std::optional<std::string_view> raw)
    -> std::string;

/**
 * @brief Compare two raw values after normalization
 */
[[nodiscard]] auto values_match(std::optional<std::string_view> first,
                                std::optional<std::string_view> second) -> bool;

}  // namespace dde::core
