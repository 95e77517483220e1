// scaffold.hpp - `rustimport new` project templates
// Part of rustimport - on-demand native extension builds

#ifndef RUSTIMPORT_SCAFFOLD_HPP
#define RUSTIMPORT_SCAFFOLD_HPP

#include <filesystem>
#include <string>

namespace rustimport {

namespace fs = std::filesystem;

// Letters, digits and underscores, starting with a letter; optional ".rs".
bool is_valid_extension_name(const std::string& name);

/**
 * Create a new extension below `base_dir`.
 *
 * "name.rs" creates a single source file with a pyo3 header. Any other
 * name creates a crate directory with Cargo.toml, src/lib.rs and the
 * `.rustimport` opt-in marker.
 *
 * @return Path of the created file or directory
 * @throws std::invalid_argument for an invalid name
 * @throws std::runtime_error if the target already exists
 */
fs::path create_extension(const std::string& name, const fs::path& base_dir = fs::current_path());

// Template texts with {{EXTENSION_NAME}} substituted
std::string render_lib_template(const std::string& extension_name);
std::string render_cargo_template(const std::string& extension_name);

} // namespace rustimport

#endif // RUSTIMPORT_SCAFFOLD_HPP
