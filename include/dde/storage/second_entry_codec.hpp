/**
 * @file second_entry_codec.hpp
 * @brief Text encoding of the second-entry snapshot
 *
 * The snapshot is persisted in the form instance table as a JSON array:
 *
 * @code
 * [{"itemId":101,"value":"120"},{"itemId":102,"value":"Yes"}]
 * @endcode
 *
 * Only the SQLite adapter uses this encoding; the engine works with the
 * typed second_entry_snapshot map.
 */

#pragma once

#include <dde/storage/form_instance_record.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace dde::storage {

/**
 * @brief Encode a snapshot as a JSON array ordered by item identifier
 */
[[nodiscard]] auto encode_second_entry(const second_entry_snapshot& snapshot)
    -> std::string;

/**
 * @brief Decode a snapshot from its JSON array text
 *
 * Accepts numeric or string item identifiers and string, number, boolean
 * or null values (null decodes to an empty string). Unknown object members
 * are skipped.
 *
 * @return nullopt when the text is not a valid snapshot
 */
[[nodiscard]] auto decode_second_entry(std::string_view text)
    -> std::optional<second_entry_snapshot>;

}  // namespace dde::storage
