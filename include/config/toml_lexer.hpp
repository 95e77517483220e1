/**
 * TOML Lexer
 *
 * Transforms Cargo manifest text into a stream of tokens for the parser.
 * TOML is line oriented, so unlike most lexers this one emits NEWLINE
 * tokens, and it is modal: the parser tells it whether the next token sits
 * in key position (bare keys, `[[`) or in value position (numbers, booleans,
 * multi-line strings).
 *
 * String tokens carry their decoded text (escapes already resolved).
 */

#ifndef RUSTIMPORT_TOML_LEXER_HPP
#define RUSTIMPORT_TOML_LEXER_HPP

#include <cstdint>
#include <string>
#include <string_view>

namespace rustimport::config {

/**
 * Token types for TOML documents
 */
enum class TokenType {
    // Structural tokens
    LEFT_BRACE,             // {
    RIGHT_BRACE,            // }
    LEFT_BRACKET,           // [
    RIGHT_BRACKET,          // ]
    DOUBLE_LEFT_BRACKET,    // [[ (key position only)
    DOUBLE_RIGHT_BRACKET,   // ]] (key position only)

    // Separators
    EQUALS,                 // =
    DOT,                    // .
    COMMA,                  // ,
    NEWLINE,                // end of line

    // Data tokens
    BARE_KEY,               // unquoted key segment
    STRING,                 // "basic" or 'literal'
    MULTILINE_STRING,       // """basic""" or '''literal'''
    WORD,                   // unquoted value: number, boolean, inf, nan, date

    // Control tokens
    END_OF_FILE,
    INVALID
};

const char* token_type_name(TokenType type);

struct Token {
    TokenType type = TokenType::INVALID;
    std::string text;
    uint32_t line = 0;
    uint32_t column = 0;

    bool is(TokenType t) const { return type == t; }
};

enum class LexMode {
    Key,
    Value
};

class TomlLexer {
public:
    explicit TomlLexer(std::string_view source, std::string_view filename = "<input>");

    /**
     * Get the next token from the input stream. Whitespace and comments are
     * skipped; line breaks are reported as NEWLINE.
     */
    Token next_token(LexMode mode);

    bool at_end() const { return current_ >= source_.size(); }
    uint32_t line() const { return line_; }
    uint32_t column() const { return column_; }
    std::string_view filename() const { return filename_; }

private:
    std::string_view source_;
    std::string_view filename_;
    size_t current_ = 0;
    uint32_t line_ = 1;
    uint32_t column_ = 1;

    // Character helpers
    char peek(size_t ahead = 0) const;
    char advance();
    bool starts_with(std::string_view text) const;

    void skip_whitespace_and_comments();

    Token scan_basic_string(uint32_t line, uint32_t column);
    Token scan_literal_string(uint32_t line, uint32_t column);
    Token scan_multiline_basic_string(uint32_t line, uint32_t column);
    Token scan_multiline_literal_string(uint32_t line, uint32_t column);
    Token scan_bare_key(uint32_t line, uint32_t column);
    Token scan_word(uint32_t line, uint32_t column);

    // Decodes the escape sequence following a backslash into `out`.
    void scan_escape(std::string& out);

    [[noreturn]] void fail(const std::string& message) const;
};

} // namespace rustimport::config

#endif // RUSTIMPORT_TOML_LEXER_HPP
