/**
 * @file second_entry_codec.cpp
 * @brief Implementation of the second-entry snapshot encoding
 */

#include <dde/storage/second_entry_codec.hpp>

#include <cctype>
#include <charconv>
#include <iomanip>
#include <sstream>

namespace dde::storage {

namespace {

auto escape_json(std::string_view str) -> std::string {
    std::ostringstream oss;
    for (char c : str) {
        switch (c) {
            case '"':
                oss << "\\\"";
                break;
            case '\\':
                oss << "\\\\";
                break;
            case '\n':
                oss << "\\n";
                break;
            case '\r':
                oss << "\\r";
                break;
            case '\t':
                oss << "\\t";
                break;
            default:
                if (static_cast<unsigned char>(c) < 32) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(c) << std::dec;
                } else {
                    oss << c;
                }
                break;
        }
    }
    return oss.str();
}

/**
 * @brief Minimal reader for the snapshot array
 *
 * Accepts exactly one top-level array of flat objects. Nested containers
 * inside an object are rejected.
 */
class snapshot_reader {
public:
    explicit snapshot_reader(std::string_view text) : text_(text) {}

    auto read() -> std::optional<second_entry_snapshot> {
        second_entry_snapshot snapshot;

        skip_whitespace();
        if (!consume('[')) return std::nullopt;

        skip_whitespace();
        if (consume(']')) {
            return finish(std::move(snapshot));
        }

        while (true) {
            if (!read_entry(snapshot)) return std::nullopt;

            skip_whitespace();
            if (consume(']')) break;
            if (!consume(',')) return std::nullopt;
        }

        return finish(std::move(snapshot));
    }

private:
    auto finish(second_entry_snapshot snapshot)
        -> std::optional<second_entry_snapshot> {
        skip_whitespace();
        if (pos_ != text_.size()) return std::nullopt;
        return snapshot;
    }

    auto read_entry(second_entry_snapshot& snapshot) -> bool {
        skip_whitespace();
        if (!consume('{')) return false;

        std::optional<int64_t> item_id;
        std::string value;

        skip_whitespace();
        if (!consume('}')) {
            while (true) {
                skip_whitespace();
                auto key = read_string();
                if (!key) return false;

                skip_whitespace();
                if (!consume(':')) return false;
                skip_whitespace();

                if (*key == "itemId") {
                    item_id = read_item_id();
                    if (!item_id) return false;
                } else if (*key == "value") {
                    auto scalar = read_scalar();
                    if (!scalar) return false;
                    value = std::move(*scalar);
                } else if (!read_scalar()) {
                    return false;
                }

                skip_whitespace();
                if (consume('}')) break;
                if (!consume(',')) return false;
            }
        }

        if (!item_id) return false;
        snapshot[*item_id] = std::move(value);
        return true;
    }

    auto read_item_id() -> std::optional<int64_t> {
        std::string digits;
        if (peek() == '"') {
            auto str = read_string();
            if (!str) return std::nullopt;
            digits = std::move(*str);
        } else {
            auto number = read_number();
            if (!number) return std::nullopt;
            digits = std::move(*number);
        }

        int64_t id = 0;
        const auto* first = digits.data();
        const auto* last = digits.data() + digits.size();
        auto [ptr, ec] = std::from_chars(first, last, id);
        if (ec != std::errc{} || ptr != last) return std::nullopt;
        return id;
    }

    auto read_scalar() -> std::optional<std::string> {
        char c = peek();
        if (c == '"') return read_string();
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) {
            return read_number();
        }
        if (consume_literal("true")) return std::string("true");
        if (consume_literal("false")) return std::string("false");
        if (consume_literal("null")) return std::string();
        return std::nullopt;
    }

    auto read_number() -> std::optional<std::string> {
        auto start = pos_;
        if (peek() == '-') ++pos_;
        while (pos_ < text_.size()) {
            char c = text_[pos_];
            if (std::isdigit(static_cast<unsigned char>(c)) || c == '.' ||
                c == 'e' || c == 'E' || c == '+' || c == '-') {
                ++pos_;
            } else {
                break;
            }
        }
        if (pos_ == start || (pos_ == start + 1 && text_[start] == '-')) {
            return std::nullopt;
        }
        return std::string(text_.substr(start, pos_ - start));
    }

    auto read_string() -> std::optional<std::string> {
        if (!consume('"')) return std::nullopt;

        std::string out;
        while (pos_ < text_.size()) {
            char c = text_[pos_++];
            if (c == '"') return out;
            if (c != '\\') {
                out += c;
                continue;
            }

            if (pos_ >= text_.size()) return std::nullopt;
            char esc = text_[pos_++];
            switch (esc) {
                case '"': out += '"'; break;
                case '\\': out += '\\'; break;
                case '/': out += '/'; break;
                case 'b': out += '\b'; break;
                case 'f': out += '\f'; break;
                case 'n': out += '\n'; break;
                case 'r': out += '\r'; break;
                case 't': out += '\t'; break;
                case 'u': {
                    auto code = read_code_point();
                    if (!code) return std::nullopt;
                    append_utf8(out, *code);
                    break;
                }
                default:
                    return std::nullopt;
            }
        }
        return std::nullopt;
    }

    auto read_hex4() -> std::optional<unsigned> {
        if (pos_ + 4 > text_.size()) return std::nullopt;
        unsigned code = 0;
        auto [ptr, ec] = std::from_chars(text_.data() + pos_,
                                         text_.data() + pos_ + 4, code, 16);
        if (ec != std::errc{} || ptr != text_.data() + pos_ + 4) {
            return std::nullopt;
        }
        pos_ += 4;
        return code;
    }

    /// Code point of an escape; a high surrogate must be followed by a low one
    auto read_code_point() -> std::optional<unsigned> {
        auto high = read_hex4();
        if (!high) return std::nullopt;
        if (*high >= 0xDC00 && *high <= 0xDFFF) return std::nullopt;
        if (*high < 0xD800 || *high > 0xDBFF) return high;

        if (!consume_literal("\\u")) return std::nullopt;
        auto low = read_hex4();
        if (!low || *low < 0xDC00 || *low > 0xDFFF) return std::nullopt;
        return 0x10000 + ((*high - 0xD800) << 10) + (*low - 0xDC00);
    }

    static void append_utf8(std::string& out, unsigned code) {
        if (code < 0x80) {
            out += static_cast<char>(code);
        } else if (code < 0x800) {
            out += static_cast<char>(0xC0 | (code >> 6));
            out += static_cast<char>(0x80 | (code & 0x3F));
        } else if (code < 0x10000) {
            out += static_cast<char>(0xE0 | (code >> 12));
            out += static_cast<char>(0x80 | ((code >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (code & 0x3F));
        } else {
            out += static_cast<char>(0xF0 | (code >> 18));
            out += static_cast<char>(0x80 | ((code >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((code >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (code & 0x3F));
        }
    }

    auto consume_literal(std::string_view literal) -> bool {
        if (text_.substr(pos_, literal.size()) == literal) {
            pos_ += literal.size();
            return true;
        }
        return false;
    }

    auto consume(char expected) -> bool {
        if (peek() == expected) {
            ++pos_;
            return true;
        }
        return false;
    }

    [[nodiscard]] auto peek() const -> char {
        return pos_ < text_.size() ? text_[pos_] : '\0';
    }

    void skip_whitespace() {
        while (pos_ < text_.size() &&
               std::isspace(static_cast<unsigned char>(text_[pos_]))) {
            ++pos_;
        }
    }

    std::string_view text_;
    std::size_t pos_{0};
};

}  // namespace

auto encode_second_entry(const second_entry_snapshot& snapshot) -> std::string {
    std::ostringstream json;
    json << "[";

    bool first = true;
    for (const auto& [item_id, value] : snapshot) {
        if (!first) json << ",";
        first = false;
        json << "{\"itemId\":" << item_id << ",\"value\":\"" << escape_json(value)
             << "\"}";
    }

    json << "]";
    return json.str();
}

auto decode_second_entry(std::string_view text)
    -> std::optional<second_entry_snapshot> {
    return snapshot_reader(text).read();
}

}  // namespace dde::storage
