/**
 * TOML Parser Implementation
 */

#include "config/toml_parser.hpp"

#include <cstdlib>
#include <fstream>
#include <limits>
#include <regex>
#include <sstream>

namespace rustimport::config {

namespace {

constexpr char PATH_SEPARATOR = '\x1f';

std::string join_path(const std::string& prefix, const std::string& key) {
    if (prefix.empty()) return key;
    return prefix + PATH_SEPARATOR + key;
}

std::string strip_underscores(const std::string& text) {
    std::string result;
    result.reserve(text.size());
    for (char c : text) {
        if (c != '_') result += c;
    }
    return result;
}

} // namespace

TomlParser::TomlParser(std::string_view source, std::string_view filename)
    : lexer_(source, filename)
    , filename_(filename)
    , root_(Value::table()) {
}

void TomlParser::advance(LexMode mode) {
    current_ = lexer_.next_token(mode);
}

void TomlParser::error(const Token& at, const std::string& message) const {
    throw ParseError(filename_, at.line, at.column, message);
}

void TomlParser::expect(TokenType type, LexMode next_mode, const char* message) {
    if (!check(type)) {
        error(current_, std::string(message) + ", found " + token_type_name(current_.type));
    }
    advance(next_mode);
}

void TomlParser::expect_line_end() {
    if (check(TokenType::END_OF_FILE)) return;
    expect(TokenType::NEWLINE, LexMode::Key, "Expected end of line");
}

Value TomlParser::parse() {
    Value* table = &root_;
    current_path_.clear();

    advance(LexMode::Key);

    while (!check(TokenType::END_OF_FILE)) {
        if (check(TokenType::NEWLINE)) {
            advance(LexMode::Key);
            continue;
        }

        if (check(TokenType::LEFT_BRACKET) || check(TokenType::DOUBLE_LEFT_BRACKET)) {
            Token header = current_;
            bool array_of_tables = check(TokenType::DOUBLE_LEFT_BRACKET);
            advance(LexMode::Key);

            std::vector<std::string> keys = parse_key();
            if (array_of_tables) {
                expect(TokenType::DOUBLE_RIGHT_BRACKET, LexMode::Key, "Expected ']]'");
            } else {
                expect(TokenType::RIGHT_BRACKET, LexMode::Key, "Expected ']'");
            }

            table = open_table(keys, array_of_tables, header);
            expect_line_end();
            continue;
        }

        parse_key_value(*table, current_path_, LexMode::Key);
        expect_line_end();
    }

    return std::move(root_);
}

std::vector<std::string> TomlParser::parse_key() {
    std::vector<std::string> keys;

    while (true) {
        if (!check(TokenType::BARE_KEY) && !check(TokenType::STRING)) {
            error(current_, std::string("Expected a key, found ") + token_type_name(current_.type));
        }
        keys.push_back(current_.text);
        advance(LexMode::Key);

        if (!check(TokenType::DOT)) break;
        advance(LexMode::Key);
    }

    return keys;
}

void TomlParser::parse_key_value(Value& table, const std::string& table_path, LexMode next_mode) {
    Token key_token = current_;
    std::vector<std::string> keys = parse_key();
    expect(TokenType::EQUALS, LexMode::Value, "Expected '=' after key");

    bool freezes = check(TokenType::LEFT_BRACE) || check(TokenType::LEFT_BRACKET);
    Value value = parse_value(next_mode);

    // Walk dotted keys, creating intermediate tables
    Value* node = &table;
    std::string path = table_path;
    for (size_t i = 0; i + 1 < keys.size(); ++i) {
        path = join_path(path, keys[i]);
        Value* child = node->find(keys[i]);
        if (!child) {
            child = &node->set(keys[i], Value::table());
        } else if (!child->is_table() || frozen_.count(path)) {
            error(key_token, "Cannot extend key '" + keys[i] + "'");
        }
        node = child;
    }

    const std::string& last = keys.back();
    path = join_path(path, last);
    if (node->contains(last)) {
        error(key_token, "Duplicate key '" + last + "'");
    }
    node->set(last, std::move(value));
    if (freezes) {
        frozen_.insert(path);
    }
}

Value* TomlParser::open_table(const std::vector<std::string>& keys, bool array_of_tables,
                              const Token& header) {
    Value* node = &root_;
    std::string path;

    for (size_t i = 0; i + 1 < keys.size(); ++i) {
        path = join_path(path, keys[i]);
        Value* child = node->find(keys[i]);
        if (!child) {
            child = &node->set(keys[i], Value::table());
        }

        if (child->is_array() && !frozen_.count(path)) {
            Array& elements = child->as_array();
            if (elements.empty() || !elements.back().is_table()) {
                error(header, "Key '" + keys[i] + "' is not a table");
            }
            path += "#" + std::to_string(elements.size() - 1);
            node = &elements.back();
        } else if (child->is_table() && !frozen_.count(path)) {
            node = child;
        } else {
            error(header, "Key '" + keys[i] + "' is not a table");
        }
    }

    const std::string& last = keys.back();
    path = join_path(path, last);
    Value* child = node->find(last);

    if (!array_of_tables) {
        if (!child) {
            child = &node->set(last, Value::table());
        } else if (!child->is_table() || defined_tables_.count(path) || frozen_.count(path)) {
            error(header, "Table '" + last + "' defined more than once");
        }
        defined_tables_.insert(path);
        current_path_ = path;
        return child;
    }

    if (!child) {
        child = &node->set(last, Value::array());
    } else if (!child->is_array() || frozen_.count(path)) {
        error(header, "Key '" + last + "' is not an array of tables");
    }

    Array& elements = child->as_array();
    elements.push_back(Value::table());
    current_path_ = path + "#" + std::to_string(elements.size() - 1);
    return &elements.back();
}

Value TomlParser::parse_value(LexMode next_mode) {
    switch (current_.type) {
        case TokenType::STRING:
        case TokenType::MULTILINE_STRING: {
            Value value(std::move(current_.text));
            advance(next_mode);
            return value;
        }
        case TokenType::WORD: {
            Value value = parse_word(current_);
            advance(next_mode);
            return value;
        }
        case TokenType::LEFT_BRACKET:
            return parse_array(next_mode);
        case TokenType::LEFT_BRACE:
            return parse_inline_table(next_mode);
        default:
            error(current_, std::string("Expected a value, found ") + token_type_name(current_.type));
    }
}

Value TomlParser::parse_array(LexMode next_mode) {
    Value result = Value::array();
    advance(LexMode::Value); // [

    while (true) {
        while (check(TokenType::NEWLINE)) advance(LexMode::Value);
        if (check(TokenType::RIGHT_BRACKET)) break;

        result.as_array().push_back(parse_value(LexMode::Value));

        while (check(TokenType::NEWLINE)) advance(LexMode::Value);
        if (check(TokenType::COMMA)) {
            advance(LexMode::Value);
            continue;
        }
        if (!check(TokenType::RIGHT_BRACKET)) {
            error(current_, "Expected ',' or ']' in array");
        }
        break;
    }

    advance(next_mode); // ]
    return result;
}

Value TomlParser::parse_inline_table(LexMode next_mode) {
    Value result = Value::table();
    advance(LexMode::Key); // {

    // Inline tables get a private path space; they are frozen once closed.
    std::string path = "{inline}" + std::to_string(lexer_.line()) + ":" +
                       std::to_string(lexer_.column());

    if (!check(TokenType::RIGHT_BRACE)) {
        while (true) {
            parse_key_value(result, path, LexMode::Key);
            if (check(TokenType::COMMA)) {
                advance(LexMode::Key);
                continue;
            }
            if (!check(TokenType::RIGHT_BRACE)) {
                error(current_, "Expected ',' or '}' in inline table");
            }
            break;
        }
    }

    advance(next_mode); // }
    return result;
}

Value TomlParser::parse_word(const Token& word) {
    const std::string& text = word.text;

    if (text == "true") return Value(true);
    if (text == "false") return Value(false);

    if (text == "inf" || text == "+inf") return Value(std::numeric_limits<double>::infinity());
    if (text == "-inf") return Value(-std::numeric_limits<double>::infinity());
    if (text == "nan" || text == "+nan" || text == "-nan") {
        return Value(std::numeric_limits<double>::quiet_NaN());
    }

    static const std::regex date_pattern(R"(^\d{4}-\d{2}-\d{2}.*|^\d{2}:\d{2}.*)");
    static const std::regex decimal_pattern(R"(^[+-]?(0|[1-9](_?\d)*)$)");
    static const std::regex hex_pattern(R"(^0x[0-9A-Fa-f](_?[0-9A-Fa-f])*$)");
    static const std::regex octal_pattern(R"(^0o[0-7](_?[0-7])*$)");
    static const std::regex binary_pattern(R"(^0b[01](_?[01])*$)");
    static const std::regex float_pattern(
        R"(^[+-]?(0|[1-9](_?\d)*)(\.\d(_?\d)*)?([eE][+-]?\d(_?\d)*)?$)");

    if (std::regex_match(text, date_pattern)) {
        error(word, "Date-time values are not supported");
    }

    try {
        if (std::regex_match(text, decimal_pattern)) {
            return Value(static_cast<int64_t>(std::stoll(strip_underscores(text))));
        }

        int base = 0;
        if (std::regex_match(text, hex_pattern)) base = 16;
        else if (std::regex_match(text, octal_pattern)) base = 8;
        else if (std::regex_match(text, binary_pattern)) base = 2;

        if (base != 0) {
            unsigned long long parsed = std::stoull(strip_underscores(text.substr(2)), nullptr, base);
            if (parsed > static_cast<unsigned long long>(std::numeric_limits<int64_t>::max())) {
                error(word, "Integer out of range: " + text);
            }
            return Value(static_cast<int64_t>(parsed));
        }
    } catch (const std::out_of_range&) {
        error(word, "Integer out of range: " + text);
    }

    if (std::regex_match(text, float_pattern)) {
        return Value(std::strtod(strip_underscores(text).c_str(), nullptr));
    }

    error(word, "Invalid value '" + text + "'");
}

Value parse_toml(std::string_view source, std::string_view filename) {
    TomlParser parser(source, filename);
    return parser.parse();
}

Value parse_toml_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Failed to open manifest: " + path.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string contents = buffer.str();
    return parse_toml(contents, path.string());
}

} // namespace rustimport::config
