/**
 * TOML Writer
 *
 * Serializes a config::Value table back to TOML for the generated
 * Cargo.toml. Layout per table: plain key/value pairs first, then
 * sub-tables as [a.b] sections, then arrays of tables as [[a.b]].
 */

#ifndef RUSTIMPORT_TOML_WRITER_HPP
#define RUSTIMPORT_TOML_WRITER_HPP

#include "config/value.hpp"

#include <string>
#include <string_view>

namespace rustimport::config {

/**
 * Serialize a root table to a TOML document.
 *
 * @throws std::invalid_argument if the root is not a table or contains a
 *         null value (TOML has no null)
 */
std::string to_toml(const Value& document);

// Quote a key unless it is a valid bare key.
std::string format_key(std::string_view key);

// Format a value in inline form (strings quoted, tables as { ... }).
std::string format_inline(const Value& value);

} // namespace rustimport::config

#endif // RUSTIMPORT_TOML_WRITER_HPP
