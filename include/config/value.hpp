/**
 * Configuration value tree
 *
 * Shared in-memory representation of TOML manifests and the JSON messages
 * emitted by cargo. Tables keep their insertion order so that a manifest
 * written back to disk reads the way the user wrote it.
 */

#ifndef RUSTIMPORT_CONFIG_VALUE_HPP
#define RUSTIMPORT_CONFIG_VALUE_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace rustimport::config {

class Value;

using Array = std::vector<Value>;
using Table = std::vector<std::pair<std::string, Value>>;

/**
 * Raised by the TOML and JSON readers on malformed input.
 */
class ParseError : public std::runtime_error {
public:
    ParseError(const std::string& source_name, uint32_t line, uint32_t column,
               const std::string& message);

    uint32_t line() const { return line_; }
    uint32_t column() const { return column_; }

private:
    uint32_t line_;
    uint32_t column_;
};

class Value {
public:
    enum class Kind {
        Null,
        Boolean,
        Integer,
        Float,
        String,
        Array,
        Table
    };

    Value() = default;
    Value(bool b) : data_(b) {}
    Value(int i) : data_(static_cast<int64_t>(i)) {}
    Value(int64_t i) : data_(i) {}
    Value(double d) : data_(d) {}
    Value(std::string s) : data_(std::move(s)) {}
    Value(const char* s) : data_(std::string(s)) {}
    Value(Array a) : data_(std::move(a)) {}
    Value(Table t) : data_(std::move(t)) {}

    static Value table() { return Value(Table{}); }
    static Value array() { return Value(Array{}); }

    Kind kind() const { return static_cast<Kind>(data_.index()); }
    const char* type_name() const;

    bool is_null() const { return kind() == Kind::Null; }
    bool is_bool() const { return kind() == Kind::Boolean; }
    bool is_integer() const { return kind() == Kind::Integer; }
    bool is_float() const { return kind() == Kind::Float; }
    bool is_string() const { return kind() == Kind::String; }
    bool is_array() const { return kind() == Kind::Array; }
    bool is_table() const { return kind() == Kind::Table; }

    // Typed access. Throws std::bad_variant_access on a kind mismatch.
    bool as_bool() const { return std::get<bool>(data_); }
    int64_t as_integer() const { return std::get<int64_t>(data_); }
    double as_float() const { return std::get<double>(data_); }
    const std::string& as_string() const { return std::get<std::string>(data_); }
    const Array& as_array() const { return std::get<Array>(data_); }
    Array& as_array() { return std::get<Array>(data_); }
    const Table& as_table() const { return std::get<Table>(data_); }
    Table& as_table() { return std::get<Table>(data_); }

    /**
     * Find a member of a table by key. Returns nullptr if this is not a
     * table or the key is absent.
     */
    const Value* find(std::string_view key) const;
    Value* find(std::string_view key);

    bool contains(std::string_view key) const { return find(key) != nullptr; }

    /**
     * Insert or replace a table member, keeping the position of an existing
     * key. Returns a reference to the stored value.
     */
    Value& set(const std::string& key, Value value);

    // Remove a table member. Returns true if it existed.
    bool erase(std::string_view key);

    /**
     * Get string value by key (returns default if not found or not string)
     */
    std::string get_string(std::string_view key, const std::string& default_value = "") const;

    size_t size() const;

    bool operator==(const Value& other) const { return data_ == other.data_; }
    bool operator!=(const Value& other) const { return !(*this == other); }

private:
    std::variant<std::monostate, bool, int64_t, double, std::string, Array, Table> data_;
};

// Appends the UTF-8 encoding of a Unicode scalar value.
void append_utf8(std::string& out, uint32_t codepoint);

} // namespace rustimport::config

#endif // RUSTIMPORT_CONFIG_VALUE_HPP
