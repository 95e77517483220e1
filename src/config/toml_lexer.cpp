/**
 * TOML Lexer Implementation
 */

#include "config/toml_lexer.hpp"
#include "config/value.hpp"

namespace rustimport::config {

const char* token_type_name(TokenType type) {
    switch (type) {
        case TokenType::LEFT_BRACE:           return "LEFT_BRACE";
        case TokenType::RIGHT_BRACE:          return "RIGHT_BRACE";
        case TokenType::LEFT_BRACKET:         return "LEFT_BRACKET";
        case TokenType::RIGHT_BRACKET:        return "RIGHT_BRACKET";
        case TokenType::DOUBLE_LEFT_BRACKET:  return "DOUBLE_LEFT_BRACKET";
        case TokenType::DOUBLE_RIGHT_BRACKET: return "DOUBLE_RIGHT_BRACKET";
        case TokenType::EQUALS:               return "EQUALS";
        case TokenType::DOT:                  return "DOT";
        case TokenType::COMMA:                return "COMMA";
        case TokenType::NEWLINE:              return "NEWLINE";
        case TokenType::BARE_KEY:             return "BARE_KEY";
        case TokenType::STRING:               return "STRING";
        case TokenType::MULTILINE_STRING:     return "MULTILINE_STRING";
        case TokenType::WORD:                 return "WORD";
        case TokenType::END_OF_FILE:          return "END_OF_FILE";
        case TokenType::INVALID:              return "INVALID";
    }
    return "UNKNOWN";
}

namespace {

bool is_bare_key_char(char c) {
    return (c >= 'a' && c <= 'z') ||
           (c >= 'A' && c <= 'Z') ||
           (c >= '0' && c <= '9') ||
           c == '_' || c == '-';
}

bool is_word_char(char c) {
    return is_bare_key_char(c) || c == '+' || c == '.' || c == ':';
}

bool is_hex_digit(char c) {
    return (c >= '0' && c <= '9') ||
           (c >= 'a' && c <= 'f') ||
           (c >= 'A' && c <= 'F');
}

} // namespace

TomlLexer::TomlLexer(std::string_view source, std::string_view filename)
    : source_(source), filename_(filename) {}

char TomlLexer::peek(size_t ahead) const {
    if (current_ + ahead >= source_.size()) return '\0';
    return source_[current_ + ahead];
}

char TomlLexer::advance() {
    char c = source_[current_++];
    if (c == '\n') {
        line_++;
        column_ = 1;
    } else {
        column_++;
    }
    return c;
}

bool TomlLexer::starts_with(std::string_view text) const {
    return source_.substr(current_, text.size()) == text;
}

void TomlLexer::fail(const std::string& message) const {
    throw ParseError(std::string(filename_), line_, column_, message);
}

void TomlLexer::skip_whitespace_and_comments() {
    while (!at_end()) {
        char c = peek();
        if (c == ' ' || c == '\t') {
            advance();
        } else if (c == '\r' && peek(1) == '\n') {
            // Leave CRLF for the NEWLINE token
            return;
        } else if (c == '#') {
            while (!at_end() && peek() != '\n') {
                advance();
            }
        } else {
            return;
        }
    }
}

Token TomlLexer::next_token(LexMode mode) {
    skip_whitespace_and_comments();

    uint32_t line = line_;
    uint32_t column = column_;

    if (at_end()) {
        return Token{TokenType::END_OF_FILE, "", line, column};
    }

    char c = peek();

    if (c == '\n' || c == '\r') {
        if (c == '\r') advance();
        advance();
        return Token{TokenType::NEWLINE, "\n", line, column};
    }

    if (mode == LexMode::Key) {
        if (starts_with("[[")) {
            advance();
            advance();
            return Token{TokenType::DOUBLE_LEFT_BRACKET, "[[", line, column};
        }
        if (starts_with("]]")) {
            advance();
            advance();
            return Token{TokenType::DOUBLE_RIGHT_BRACKET, "]]", line, column};
        }
    }

    switch (c) {
        case '{': advance(); return Token{TokenType::LEFT_BRACE, "{", line, column};
        case '}': advance(); return Token{TokenType::RIGHT_BRACE, "}", line, column};
        case '[': advance(); return Token{TokenType::LEFT_BRACKET, "[", line, column};
        case ']': advance(); return Token{TokenType::RIGHT_BRACKET, "]", line, column};
        case '=': advance(); return Token{TokenType::EQUALS, "=", line, column};
        case ',': advance(); return Token{TokenType::COMMA, ",", line, column};
        case '.':
            if (mode == LexMode::Key) {
                advance();
                return Token{TokenType::DOT, ".", line, column};
            }
            break;
        default:
            break;
    }

    if (c == '"') {
        if (mode == LexMode::Value && starts_with("\"\"\"")) {
            return scan_multiline_basic_string(line, column);
        }
        return scan_basic_string(line, column);
    }

    if (c == '\'') {
        if (mode == LexMode::Value && starts_with("'''")) {
            return scan_multiline_literal_string(line, column);
        }
        return scan_literal_string(line, column);
    }

    if (mode == LexMode::Key && is_bare_key_char(c)) {
        return scan_bare_key(line, column);
    }

    if (mode == LexMode::Value && is_word_char(c)) {
        return scan_word(line, column);
    }

    fail(std::string("Unexpected character '") + c + "'");
}

void TomlLexer::scan_escape(std::string& out) {
    if (at_end()) fail("Unterminated escape sequence");

    char c = advance();
    switch (c) {
        case 'b':  out += '\b'; return;
        case 't':  out += '\t'; return;
        case 'n':  out += '\n'; return;
        case 'f':  out += '\f'; return;
        case 'r':  out += '\r'; return;
        case 'e':  out += '\x1b'; return;
        case '"':  out += '"'; return;
        case '\\': out += '\\'; return;
        case 'u':
        case 'U': {
            size_t digits = (c == 'u') ? 4 : 8;
            uint32_t codepoint = 0;
            for (size_t i = 0; i < digits; ++i) {
                char h = peek();
                if (!is_hex_digit(h)) fail("Invalid unicode escape");
                advance();
                codepoint = codepoint * 16 + static_cast<uint32_t>(
                    (h >= '0' && h <= '9') ? h - '0' :
                    (h >= 'a' && h <= 'f') ? h - 'a' + 10 : h - 'A' + 10);
            }
            if (codepoint > 0x10FFFF || (codepoint >= 0xD800 && codepoint <= 0xDFFF)) {
                fail("Unicode escape is not a scalar value");
            }
            append_utf8(out, codepoint);
            return;
        }
        default:
            fail(std::string("Invalid escape sequence '\\") + c + "'");
    }
}

Token TomlLexer::scan_basic_string(uint32_t line, uint32_t column) {
    advance(); // "
    std::string text;

    while (!at_end() && peek() != '"') {
        char c = peek();
        if (c == '\n') fail("Newline in basic string");
        advance();
        if (c == '\\') {
            scan_escape(text);
        } else {
            text += c;
        }
    }

    if (at_end()) fail("Unterminated string");
    advance(); // "

    return Token{TokenType::STRING, std::move(text), line, column};
}

Token TomlLexer::scan_literal_string(uint32_t line, uint32_t column) {
    advance(); // '
    size_t start = current_;

    while (!at_end() && peek() != '\'') {
        if (peek() == '\n') fail("Newline in literal string");
        advance();
    }

    if (at_end()) fail("Unterminated string");
    std::string text(source_.substr(start, current_ - start));
    advance(); // '

    return Token{TokenType::STRING, std::move(text), line, column};
}

Token TomlLexer::scan_multiline_basic_string(uint32_t line, uint32_t column) {
    advance(); advance(); advance(); // """
    std::string text;

    // A newline immediately following the delimiter is trimmed
    if (peek() == '\r' && peek(1) == '\n') advance();
    if (peek() == '\n') advance();

    while (!at_end()) {
        if (starts_with("\"\"\"")) {
            // Up to two quotes may sit directly before the closing delimiter
            size_t extra = 0;
            while (extra < 2 && peek(3 + extra) == '"') extra++;
            for (size_t i = 0; i < extra; ++i) text += advance();
            advance(); advance(); advance();
            return Token{TokenType::MULTILINE_STRING, std::move(text), line, column};
        }

        char c = advance();
        if (c != '\\') {
            text += c;
            continue;
        }

        // Line ending backslash: trim all whitespace up to the next content
        size_t look = 0;
        while (peek(look) == ' ' || peek(look) == '\t') look++;
        if (peek(look) == '\n' || (peek(look) == '\r' && peek(look + 1) == '\n')) {
            while (!at_end() && (peek() == ' ' || peek() == '\t' ||
                                 peek() == '\n' || peek() == '\r')) {
                advance();
            }
            continue;
        }
        scan_escape(text);
    }

    fail("Unterminated multi-line string");
}

Token TomlLexer::scan_multiline_literal_string(uint32_t line, uint32_t column) {
    advance(); advance(); advance(); // '''
    std::string text;

    if (peek() == '\r' && peek(1) == '\n') advance();
    if (peek() == '\n') advance();

    while (!at_end()) {
        if (starts_with("'''")) {
            size_t extra = 0;
            while (extra < 2 && peek(3 + extra) == '\'') extra++;
            for (size_t i = 0; i < extra; ++i) text += advance();
            advance(); advance(); advance();
            return Token{TokenType::MULTILINE_STRING, std::move(text), line, column};
        }
        text += advance();
    }

    fail("Unterminated multi-line string");
}

Token TomlLexer::scan_bare_key(uint32_t line, uint32_t column) {
    size_t start = current_;
    while (is_bare_key_char(peek())) {
        advance();
    }
    return Token{TokenType::BARE_KEY, std::string(source_.substr(start, current_ - start)),
                 line, column};
}

Token TomlLexer::scan_word(uint32_t line, uint32_t column) {
    size_t start = current_;
    while (is_word_char(peek())) {
        advance();
    }
    return Token{TokenType::WORD, std::string(source_.substr(start, current_ - start)),
                 line, column};
}

} // namespace rustimport::config
