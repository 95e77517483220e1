/**
 * Configuration value tree implementation
 */

#include "config/value.hpp"

#include <sstream>

namespace rustimport::config {

namespace {

std::string format_parse_error(const std::string& source_name, uint32_t line,
                               uint32_t column, const std::string& message) {
    std::ostringstream oss;
    oss << source_name << ":" << line << ":" << column << ": error: " << message;
    return oss.str();
}

} // namespace

ParseError::ParseError(const std::string& source_name, uint32_t line, uint32_t column,
                       const std::string& message)
    : std::runtime_error(format_parse_error(source_name, line, column, message))
    , line_(line)
    , column_(column) {
}

const char* Value::type_name() const {
    switch (kind()) {
        case Kind::Null:    return "null";
        case Kind::Boolean: return "boolean";
        case Kind::Integer: return "integer";
        case Kind::Float:   return "float";
        case Kind::String:  return "string";
        case Kind::Array:   return "array";
        case Kind::Table:   return "table";
    }
    return "unknown";
}

const Value* Value::find(std::string_view key) const {
    if (!is_table()) return nullptr;
    for (const auto& member : as_table()) {
        if (member.first == key) {
            return &member.second;
        }
    }
    return nullptr;
}

Value* Value::find(std::string_view key) {
    if (!is_table()) return nullptr;
    for (auto& member : as_table()) {
        if (member.first == key) {
            return &member.second;
        }
    }
    return nullptr;
}

Value& Value::set(const std::string& key, Value value) {
    if (!is_table()) {
        throw std::logic_error("Cannot set key '" + key + "' on a " + type_name() + " value");
    }
    if (Value* existing = find(key)) {
        *existing = std::move(value);
        return *existing;
    }
    Table& table = as_table();
    table.emplace_back(key, std::move(value));
    return table.back().second;
}

bool Value::erase(std::string_view key) {
    if (!is_table()) return false;
    Table& table = as_table();
    for (auto it = table.begin(); it != table.end(); ++it) {
        if (it->first == key) {
            table.erase(it);
            return true;
        }
    }
    return false;
}

std::string Value::get_string(std::string_view key, const std::string& default_value) const {
    const Value* node = find(key);
    if (node && node->is_string()) {
        return node->as_string();
    }
    return default_value;
}

size_t Value::size() const {
    if (is_table()) return as_table().size();
    if (is_array()) return as_array().size();
    return 0;
}

void append_utf8(std::string& out, uint32_t codepoint) {
    if (codepoint < 0x80) {
        out += static_cast<char>(codepoint);
    } else if (codepoint < 0x800) {
        out += static_cast<char>(0xC0 | (codepoint >> 6));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else if (codepoint < 0x10000) {
        out += static_cast<char>(0xE0 | (codepoint >> 12));
        out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (codepoint >> 18));
        out += static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    }
}

} // namespace rustimport::config
