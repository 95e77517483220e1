/**
 * TOML Parser
 *
 * Recursive-descent parser that builds a config::Value table from a Cargo
 * manifest or a header fragment.
 * Features:
 * - Bare, quoted and dotted keys
 * - [table] and [[array of tables]] headers
 * - Inline tables and (multi-line, trailing comma) arrays
 * - Duplicate key and table redefinition detection
 *
 * Date-time values are rejected with a ParseError.
 */

#ifndef RUSTIMPORT_TOML_PARSER_HPP
#define RUSTIMPORT_TOML_PARSER_HPP

#include "config/toml_lexer.hpp"
#include "config/value.hpp"

#include <filesystem>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace rustimport::config {

class TomlParser {
public:
    explicit TomlParser(std::string_view source, std::string_view filename = "<input>");

    /**
     * Parse the entire document.
     *
     * @return Root table
     * @throws ParseError on malformed input
     */
    Value parse();

private:
    TomlLexer lexer_;
    std::string filename_;
    Token current_;
    Value root_;

    // Dotted paths (joined with '\x1f') of tables opened by a header, and of
    // inline tables and arrays that may not be extended afterwards.
    std::set<std::string> defined_tables_;
    std::set<std::string> frozen_;
    std::string current_path_;

    // Token handling
    void advance(LexMode mode);
    bool check(TokenType type) const { return current_.type == type; }
    void expect(TokenType type, LexMode next_mode, const char* message);
    void expect_line_end();

    [[noreturn]] void error(const Token& at, const std::string& message) const;

    // Grammar
    std::vector<std::string> parse_key();
    Value parse_value(LexMode next_mode);
    Value parse_array(LexMode next_mode);
    Value parse_inline_table(LexMode next_mode);
    Value parse_word(const Token& word);

    void parse_key_value(Value& table, const std::string& table_path, LexMode next_mode);
    Value* open_table(const std::vector<std::string>& keys, bool array_of_tables,
                      const Token& header);
};

/**
 * Parse TOML text into a table.
 */
Value parse_toml(std::string_view source, std::string_view filename = "<input>");

/**
 * Read and parse a TOML file. Throws std::runtime_error if unreadable.
 */
Value parse_toml_file(const std::filesystem::path& path);

} // namespace rustimport::config

#endif // RUSTIMPORT_TOML_PARSER_HPP
