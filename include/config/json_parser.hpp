// json_parser.hpp - Minimal JSON reader for rustimport
// Part of rustimport - on-demand native extension builds
//
// Reads one JSON document (one line of `cargo --message-format json`
// output) into a config::Value. Objects keep member order; numbers without
// a fraction or exponent become integers.

#ifndef RUSTIMPORT_JSON_PARSER_HPP
#define RUSTIMPORT_JSON_PARSER_HPP

#include "config/value.hpp"

#include <string>
#include <string_view>

namespace rustimport::config {

class JsonParser {
public:
    explicit JsonParser(std::string_view text, std::string_view source_name = "<json>");

    // Parse a complete document; trailing non-whitespace is an error.
    Value parse();

private:
    std::string_view text_;
    std::string source_name_;
    size_t pos_ = 0;

    char peek() const { return pos_ < text_.size() ? text_[pos_] : '\0'; }
    void skip_whitespace();
    void expect(char c);

    Value parse_value();
    Value parse_object();
    Value parse_array();
    std::string parse_string();
    Value parse_number();
    Value parse_literal(std::string_view word, Value value);
    uint32_t parse_hex4();

    [[noreturn]] void fail(const std::string& message) const;
};

Value parse_json(std::string_view text);

} // namespace rustimport::config

#endif // RUSTIMPORT_JSON_PARSER_HPP
