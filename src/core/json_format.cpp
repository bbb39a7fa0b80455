/**
 * @file json_format.cpp
 * @brief Flat JSON reading and writing
 */

#include "json_format.h"

#include <cctype>
#include <charconv>
#include <cstdio>
#include <cstdlib>
#include <sstream>

namespace kcenon::orchestrator::detail {

auto escape_json_string(std::string_view input) -> std::string {
    std::string output;
    output.reserve(input.size() + 16);
    for (char c : input) {
        switch (c) {
            case '"':  output += "\\\""; break;
            case '\\': output += "\\\\"; break;
            case '\b': output += "\\b";  break;
            case '\f': output += "\\f";  break;
            case '\n': output += "\\n";  break;
            case '\r': output += "\\r";  break;
            case '\t': output += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    output += buf;
                } else {
                    output += c;
                }
        }
    }
    return output;
}

// ============================================================================
// flat_json_object
// ============================================================================

auto flat_json_object::has(const std::string& key) const -> bool {
    return members_.find(key) != members_.end();
}

auto flat_json_object::is_null(const std::string& key) const -> bool {
    auto it = members_.find(key);
    return it != members_.end() && !it->second.has_value();
}

auto flat_json_object::get_string(const std::string& key) const
    -> std::optional<std::string> {
    auto it = members_.find(key);
    if (it == members_.end()) {
        return std::nullopt;
    }
    return it->second;
}

auto flat_json_object::get_uint(const std::string& key) const -> std::optional<uint64_t> {
    auto text = get_string(key);
    if (!text || text->empty()) {
        return std::nullopt;
    }
    uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(text->data(), text->data() + text->size(), value);
    if (ec != std::errc{} || ptr != text->data() + text->size()) {
        return std::nullopt;
    }
    return value;
}

auto flat_json_object::get_int(const std::string& key) const -> std::optional<int64_t> {
    auto text = get_string(key);
    if (!text || text->empty()) {
        return std::nullopt;
    }
    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(text->data(), text->data() + text->size(), value);
    if (ec != std::errc{} || ptr != text->data() + text->size()) {
        return std::nullopt;
    }
    return value;
}

auto flat_json_object::get_double(const std::string& key) const -> std::optional<double> {
    auto text = get_string(key);
    if (!text || text->empty()) {
        return std::nullopt;
    }
    char* end = nullptr;
    double value = std::strtod(text->c_str(), &end);
    if (end != text->c_str() + text->size()) {
        return std::nullopt;
    }
    return value;
}

auto flat_json_object::get_bool(const std::string& key) const -> std::optional<bool> {
    auto text = get_string(key);
    if (!text) {
        return std::nullopt;
    }
    if (*text == "true") return true;
    if (*text == "false") return false;
    return std::nullopt;
}

// ============================================================================
// parse_flat_json
// ============================================================================

namespace {

class flat_parser {
public:
    explicit flat_parser(std::string_view text) : text_(text) {}

    auto parse() -> result<flat_json_object> {
        flat_json_object object;

        skip_ws();
        if (!consume('{')) {
            return fail("expected '{'");
        }
        skip_ws();
        if (consume('}')) {
            return object;
        }

        while (true) {
            skip_ws();
            auto key = parse_string();
            if (!key) {
                return fail("expected member name");
            }
            skip_ws();
            if (!consume(':')) {
                return fail("expected ':' after " + *key);
            }
            skip_ws();

            if (peek() == '"') {
                auto value = parse_string();
                if (!value) {
                    return fail("unterminated string for " + *key);
                }
                object.set(std::move(*key), std::move(*value));
            } else if (peek() == '{' || peek() == '[') {
                return fail("nested value for " + *key);
            } else {
                auto literal = parse_literal();
                if (literal.empty()) {
                    return fail("missing value for " + *key);
                }
                if (literal == "null") {
                    object.set(std::move(*key), std::nullopt);
                } else {
                    object.set(std::move(*key), std::move(literal));
                }
            }

            skip_ws();
            if (consume(',')) {
                continue;
            }
            if (consume('}')) {
                break;
            }
            return fail("expected ',' or '}'");
        }

        skip_ws();
        if (pos_ != text_.size()) {
            return fail("trailing data");
        }
        return object;
    }

private:
    auto fail(const std::string& what) const -> unexpected {
        return unexpected{error{error_code::journal_corrupted,
            "malformed JSON at offset " + std::to_string(pos_) + ": " + what}};
    }

    auto peek() const -> char { return pos_ < text_.size() ? text_[pos_] : '\0'; }

    auto consume(char c) -> bool {
        if (peek() == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    void skip_ws() {
        while (pos_ < text_.size() &&
               std::isspace(static_cast<unsigned char>(text_[pos_]))) {
            ++pos_;
        }
    }

    auto parse_string() -> std::optional<std::string> {
        if (!consume('"')) {
            return std::nullopt;
        }
        std::string out;
        while (pos_ < text_.size()) {
            char c = text_[pos_++];
            if (c == '"') {
                return out;
            }
            if (c != '\\') {
                out += c;
                continue;
            }
            if (pos_ >= text_.size()) {
                return std::nullopt;
            }
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
                    if (pos_ + 4 > text_.size()) {
                        return std::nullopt;
                    }
                    unsigned code = 0;
                    auto hex = text_.substr(pos_, 4);
                    auto [ptr, ec] = std::from_chars(hex.data(), hex.data() + 4, code, 16);
                    if (ec != std::errc{} || ptr != hex.data() + 4) {
                        return std::nullopt;
                    }
                    pos_ += 4;
                    // The writer only escapes control characters this way
                    out += static_cast<char>(code & 0xFF);
                    break;
                }
                default:
                    return std::nullopt;
            }
        }
        return std::nullopt;
    }

    auto parse_literal() -> std::string {
        auto start = pos_;
        while (pos_ < text_.size()) {
            char c = text_[pos_];
            if (c == ',' || c == '}' || std::isspace(static_cast<unsigned char>(c))) {
                break;
            }
            ++pos_;
        }
        return std::string(text_.substr(start, pos_ - start));
    }

    std::string_view text_;
    std::size_t pos_ = 0;
};

}  // namespace

auto parse_flat_json(std::string_view text) -> result<flat_json_object> {
    return flat_parser(text).parse();
}

// ============================================================================
// flat_json_writer
// ============================================================================

auto flat_json_writer::add_raw(std::string_view key, std::string raw) -> flat_json_writer& {
    members_.emplace_back(std::string(key), std::move(raw));
    return *this;
}

auto flat_json_writer::add(std::string_view key, std::string_view value) -> flat_json_writer& {
    return add_raw(key, "\"" + escape_json_string(value) + "\"");
}

auto flat_json_writer::add(std::string_view key, uint64_t value) -> flat_json_writer& {
    return add_raw(key, std::to_string(value));
}

auto flat_json_writer::add(std::string_view key, int64_t value) -> flat_json_writer& {
    return add_raw(key, std::to_string(value));
}

auto flat_json_writer::add(std::string_view key, double value) -> flat_json_writer& {
    std::ostringstream oss;
    oss.precision(6);
    oss << std::fixed << value;
    return add_raw(key, oss.str());
}

auto flat_json_writer::add(std::string_view key, bool value) -> flat_json_writer& {
    return add_raw(key, value ? "true" : "false");
}

auto flat_json_writer::add_null(std::string_view key) -> flat_json_writer& {
    return add_raw(key, "null");
}

auto flat_json_writer::str(bool pretty) const -> std::string {
    std::string out = "{";
    for (std::size_t i = 0; i < members_.size(); ++i) {
        if (i > 0) {
            out += ",";
        }
        if (pretty) {
            out += "\n  ";
        }
        out += "\"" + escape_json_string(members_[i].first) + "\":";
        if (pretty) {
            out += " ";
        }
        out += members_[i].second;
    }
    if (pretty && !members_.empty()) {
        out += "\n";
    }
    out += "}";
    return out;
}

}  // namespace kcenon::orchestrator::detail
