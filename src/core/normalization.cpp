/**
 * @file normalization.cpp
 * @brief Implementation of field value normalization
 */

#include <dde/core/normalization.hpp>

#include <unicode/uchar.h>
#include <unicode/ustring.h>
#include <unicode/utf16.h>
#include <unicode/utypes.h>

#include <vector>

namespace dde::core {

namespace {

/// Unicode White_Space plus U+FEFF, without U+0085
auto is_trimmable(UChar32 c) noexcept -> bool {
    if (c == 0xFEFF) {
        return true;
    }
    return c != 0x0085 && u_isUWhiteSpace(c);
}

auto to_utf16(std::string_view value) -> std::vector<UChar> {
    // UTF-16 never needs more code units than the UTF-8 input has bytes
    std::vector<UChar> units(value.size() + 1);
    int32_t length = 0;
    UErrorCode status = U_ZERO_ERROR;
    u_strFromUTF8WithSub(units.data(), static_cast<int32_t>(units.size()), &length,
                         value.data(), static_cast<int32_t>(value.size()),
                         0xFFFD, nullptr, &status);
    if (U_FAILURE(status)) {
        return {};
    }
    units.resize(static_cast<std::size_t>(length));
    return units;
}

auto to_lower(const UChar* src, int32_t length) -> std::vector<UChar> {
    std::vector<UChar> lowered(static_cast<std::size_t>(length) + 1);
    UErrorCode status = U_ZERO_ERROR;
    auto needed = u_strToLower(lowered.data(), static_cast<int32_t>(lowered.size()),
                               src, length, "", &status);
    if (status == U_BUFFER_OVERFLOW_ERROR) {
        lowered.resize(static_cast<std::size_t>(needed) + 1);
        status = U_ZERO_ERROR;
        needed = u_strToLower(lowered.data(), static_cast<int32_t>(lowered.size()),
                              src, length, "", &status);
    }
    if (U_FAILURE(status)) {
        return {};
    }
    lowered.resize(static_cast<std::size_t>(needed));
    return lowered;
}

auto to_utf8(const std::vector<UChar>& units) -> std::string {
    std::string out(units.size() * 3, '\0');
    int32_t length = 0;
    UErrorCode status = U_ZERO_ERROR;
    u_strToUTF8(out.data(), static_cast<int32_t>(out.size()), &length, units.data(),
                static_cast<int32_t>(units.size()), &status);
    if (U_FAILURE(status)) {
        return {};
    }
    out.resize(static_cast<std::size_t>(length));
    return out;
}

}  // namespace

auto normalize_for_comparison(std::optional<std::string_view> raw)
    -> std::string {
    if (!raw || raw->empty()) {
        return {};
    }

    const auto units = to_utf16(*raw);
    const auto count = static_cast<int32_t>(units.size());

    int32_t begin = 0;
    while (begin < count) {
        int32_t next = begin;
        UChar32 c = 0;
        U16_NEXT(units.data(), next, count, c);
        if (!is_trimmable(c)) {
            break;
        }
        begin = next;
    }

    int32_t end = count;
    while (end > begin) {
        int32_t prev = end;
        UChar32 c = 0;
        U16_PREV(units.data(), begin, prev, c);
        if (!is_trimmable(c)) {
            break;
        }
        end = prev;
    }

    if (begin == end) {
        return {};
    }
    return to_utf8(to_lower(units.data() + begin, end - begin));
}

auto values_match(std::optional<std::string_view> first,
                  std::optional<std::string_view> second) -> bool {
    return normalize_for_comparison(first) == normalize_for_comparison(second);
}

}  // namespace dde::core
