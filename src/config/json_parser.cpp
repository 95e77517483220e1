// json_parser.cpp - Minimal JSON reader implementation
// Part of rustimport - on-demand native extension builds

#include "config/json_parser.hpp"

#include <cerrno>
#include <cstdlib>

namespace rustimport::config {

JsonParser::JsonParser(std::string_view text, std::string_view source_name)
    : text_(text), source_name_(source_name) {
}

void JsonParser::fail(const std::string& message) const {
    // JSON messages are single lines, so report the byte offset as column
    throw ParseError(source_name_, 1, static_cast<uint32_t>(pos_ + 1), message);
}

void JsonParser::skip_whitespace() {
    while (pos_ < text_.size()) {
        char c = text_[pos_];
        if (c != ' ' && c != '\t' && c != '\n' && c != '\r') break;
        ++pos_;
    }
}

void JsonParser::expect(char c) {
    skip_whitespace();
    if (peek() != c) {
        fail(std::string("Expected '") + c + "'");
    }
    ++pos_;
}

Value JsonParser::parse() {
    Value value = parse_value();
    skip_whitespace();
    if (pos_ != text_.size()) {
        fail("Unexpected trailing characters");
    }
    return value;
}

Value JsonParser::parse_value() {
    skip_whitespace();
    switch (peek()) {
        case '{': return parse_object();
        case '[': return parse_array();
        case '"': return Value(parse_string());
        case 't': return parse_literal("true", Value(true));
        case 'f': return parse_literal("false", Value(false));
        case 'n': return parse_literal("null", Value());
        default:
            if (peek() == '-' || (peek() >= '0' && peek() <= '9')) {
                return parse_number();
            }
            fail("Expected a value");
    }
}

Value JsonParser::parse_object() {
    Value object = Value::table();
    expect('{');

    skip_whitespace();
    if (peek() == '}') {
        ++pos_;
        return object;
    }

    while (true) {
        skip_whitespace();
        if (peek() != '"') fail("Expected string key");
        std::string key = parse_string();
        expect(':');
        // Later duplicates win, as in most JSON readers
        object.set(key, parse_value());

        skip_whitespace();
        if (peek() == ',') {
            ++pos_;
            continue;
        }
        expect('}');
        return object;
    }
}

Value JsonParser::parse_array() {
    Value array = Value::array();
    expect('[');

    skip_whitespace();
    if (peek() == ']') {
        ++pos_;
        return array;
    }

    while (true) {
        array.as_array().push_back(parse_value());

        skip_whitespace();
        if (peek() == ',') {
            ++pos_;
            continue;
        }
        expect(']');
        return array;
    }
}

uint32_t JsonParser::parse_hex4() {
    uint32_t value = 0;
    for (int i = 0; i < 4; ++i) {
        char c = peek();
        uint32_t digit;
        if (c >= '0' && c <= '9') digit = static_cast<uint32_t>(c - '0');
        else if (c >= 'a' && c <= 'f') digit = static_cast<uint32_t>(c - 'a' + 10);
        else if (c >= 'A' && c <= 'F') digit = static_cast<uint32_t>(c - 'A' + 10);
        else fail("Invalid \\u escape");
        value = value * 16 + digit;
        ++pos_;
    }
    return value;
}

std::string JsonParser::parse_string() {
    ++pos_; // opening quote
    std::string out;

    while (true) {
        if (pos_ >= text_.size()) fail("Unterminated string");
        char c = text_[pos_++];

        if (c == '"') return out;
        if (c != '\\') {
            out += c;
            continue;
        }

        if (pos_ >= text_.size()) fail("Unterminated escape");
        char e = text_[pos_++];
        switch (e) {
            case '"':  out += '"'; break;
            case '\\': out += '\\'; break;
            case '/':  out += '/'; break;
            case 'b':  out += '\b'; break;
            case 'f':  out += '\f'; break;
            case 'n':  out += '\n'; break;
            case 'r':  out += '\r'; break;
            case 't':  out += '\t'; break;
            case 'u': {
                uint32_t codepoint = parse_hex4();
                // Combine surrogate pairs
                if (codepoint >= 0xD800 && codepoint <= 0xDBFF &&
                    text_.substr(pos_, 2) == "\\u") {
                    pos_ += 2;
                    uint32_t low = parse_hex4();
                    if (low < 0xDC00 || low > 0xDFFF) fail("Invalid surrogate pair");
                    codepoint = 0x10000 + ((codepoint - 0xD800) << 10) + (low - 0xDC00);
                } else if (codepoint >= 0xD800 && codepoint <= 0xDFFF) {
                    codepoint = 0xFFFD;
                }
                append_utf8(out, codepoint);
                break;
            }
            default:
                fail(std::string("Invalid escape '\\") + e + "'");
        }
    }
}

Value JsonParser::parse_number() {
    size_t start = pos_;
    bool is_float = false;

    if (peek() == '-') ++pos_;
    if (!(peek() >= '0' && peek() <= '9')) fail("Invalid number");
    while (peek() >= '0' && peek() <= '9') ++pos_;

    if (peek() == '.') {
        is_float = true;
        ++pos_;
        if (!(peek() >= '0' && peek() <= '9')) fail("Invalid number");
        while (peek() >= '0' && peek() <= '9') ++pos_;
    }

    if (peek() == 'e' || peek() == 'E') {
        is_float = true;
        ++pos_;
        if (peek() == '+' || peek() == '-') ++pos_;
        if (!(peek() >= '0' && peek() <= '9')) fail("Invalid number");
        while (peek() >= '0' && peek() <= '9') ++pos_;
    }

    std::string number(text_.substr(start, pos_ - start));
    if (!is_float) {
        errno = 0;
        long long parsed = std::strtoll(number.c_str(), nullptr, 10);
        if (errno != ERANGE) {
            return Value(static_cast<int64_t>(parsed));
        }
    }
    return Value(std::strtod(number.c_str(), nullptr));
}

Value JsonParser::parse_literal(std::string_view word, Value value) {
    if (text_.substr(pos_, word.size()) != word) {
        fail("Invalid literal");
    }
    pos_ += word.size();
    return value;
}

Value parse_json(std::string_view text) {
    JsonParser parser(text);
    return parser.parse();
}

} // namespace rustimport::config
