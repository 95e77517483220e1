/**
 * TOML Writer Implementation
 */

#include "config/toml_writer.hpp"

#include <cmath>
#include <cstdio>
#include <sstream>

namespace rustimport::config {

namespace {

bool is_bare_key(std::string_view key) {
    if (key.empty()) return false;
    for (char c : key) {
        bool ok = (c >= 'a' && c <= 'z') ||
                  (c >= 'A' && c <= 'Z') ||
                  (c >= '0' && c <= '9') ||
                  c == '_' || c == '-';
        if (!ok) return false;
    }
    return true;
}

std::string quote_string(std::string_view text) {
    std::string out = "\"";
    for (char c : text) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\t': out += "\\t"; break;
            case '\n': out += "\\n"; break;
            case '\f': out += "\\f"; break;
            case '\r': out += "\\r"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20 || c == 0x7F) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04X", static_cast<unsigned char>(c));
                    out += buf;
                } else {
                    out += c;
                }
        }
    }
    out += "\"";
    return out;
}

std::string format_float(double d) {
    if (std::isnan(d)) return "nan";
    if (std::isinf(d)) return d > 0 ? "inf" : "-inf";

    std::ostringstream oss;
    oss.precision(17);
    oss << d;
    std::string text = oss.str();
    if (text.find_first_of(".eE") == std::string::npos) {
        text += ".0";
    }
    return text;
}

bool is_array_of_tables(const Value& value) {
    if (!value.is_array() || value.as_array().empty()) return false;
    for (const auto& element : value.as_array()) {
        if (!element.is_table()) return false;
    }
    return true;
}

std::string header_path(const std::string& prefix, const std::string& key) {
    std::string formatted = format_key(key);
    return prefix.empty() ? formatted : prefix + "." + formatted;
}

bool has_plain_members(const Value& table) {
    for (const auto& [key, value] : table.as_table()) {
        if (!value.is_table() && !is_array_of_tables(value)) return true;
    }
    return false;
}

void write_table(std::ostringstream& out, const Value& table, const std::string& path) {
    // Plain key/value pairs
    for (const auto& [key, value] : table.as_table()) {
        if (value.is_table() || is_array_of_tables(value)) continue;
        out << format_key(key) << " = " << format_inline(value) << "\n";
    }

    // Sub-tables
    for (const auto& [key, value] : table.as_table()) {
        if (!value.is_table()) continue;
        std::string sub_path = header_path(path, key);

        // A table holding only sections needs no header of its own
        if (has_plain_members(value) || value.as_table().empty()) {
            out << "\n[" << sub_path << "]\n";
        }
        write_table(out, value, sub_path);
    }

    // Arrays of tables
    for (const auto& [key, value] : table.as_table()) {
        if (!is_array_of_tables(value)) continue;
        std::string sub_path = header_path(path, key);
        for (const auto& element : value.as_array()) {
            out << "\n[[" << sub_path << "]]\n";
            write_table(out, element, sub_path);
        }
    }
}

} // namespace

std::string format_key(std::string_view key) {
    return is_bare_key(key) ? std::string(key) : quote_string(key);
}

std::string format_inline(const Value& value) {
    switch (value.kind()) {
        case Value::Kind::Null:
            throw std::invalid_argument("TOML cannot represent null values");
        case Value::Kind::Boolean:
            return value.as_bool() ? "true" : "false";
        case Value::Kind::Integer:
            return std::to_string(value.as_integer());
        case Value::Kind::Float:
            return format_float(value.as_float());
        case Value::Kind::String:
            return quote_string(value.as_string());
        case Value::Kind::Array: {
            std::string out = "[";
            bool first = true;
            for (const auto& element : value.as_array()) {
                if (!first) out += ", ";
                first = false;
                out += format_inline(element);
            }
            return out + "]";
        }
        case Value::Kind::Table: {
            if (value.as_table().empty()) return "{}";
            std::string out = "{ ";
            bool first = true;
            for (const auto& [key, member] : value.as_table()) {
                if (!first) out += ", ";
                first = false;
                out += format_key(key) + " = " + format_inline(member);
            }
            return out + " }";
        }
    }
    return "";
}

std::string to_toml(const Value& document) {
    if (!document.is_table()) {
        throw std::invalid_argument("TOML document root must be a table");
    }

    std::ostringstream out;
    write_table(out, document, "");

    std::string text = out.str();
    // Sections start with a blank separator line; drop it at the very top
    if (!text.empty() && text.front() == '\n') {
        text.erase(0, 1);
    }
    return text;
}

} // namespace rustimport::config
