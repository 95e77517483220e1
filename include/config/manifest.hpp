// manifest.hpp - Cargo manifest tree operations
// Part of rustimport - on-demand native extension builds
//
// Manifests are layered: template defaults, then the header fragment, then
// the crate's own Cargo.toml. Each layer is combined with merge_manifests()
// using the more specific layer as the override.

#ifndef RUSTIMPORT_MANIFEST_HPP
#define RUSTIMPORT_MANIFEST_HPP

#include "config/value.hpp"

#include <array>
#include <filesystem>
#include <optional>
#include <string_view>
#include <vector>

namespace rustimport::config {

namespace fs = std::filesystem;

// Every manifest section that holds dependency specifications.
inline constexpr std::array<const char*, 7> DEPENDENCY_SECTIONS = {
    "dependencies",
    "dev-dependencies",
    "build-dependencies",
    "target.*.dependencies",
    "target.*.dev-dependencies",
    "target.*.build-dependencies",
    "workspace.dependencies",
};

/**
 * Merge `defaults` into a copy of `override_value`.
 *
 * Keys missing from the override are copied in; keys present in both
 * recurse when both values are tables, otherwise the override wins.
 * Neither input is modified.
 */
Value merge_manifests(const Value& override_value, const Value& defaults);

/**
 * Look up nodes by a dot-separated path where '*' matches every member of
 * a table, e.g. "target.*.dependencies". Returns an empty list when nothing
 * matches.
 */
std::vector<Value*> query(Value& root, std::string_view dotted_path);
std::vector<const Value*> query(const Value& root, std::string_view dotted_path);

/**
 * Make local `path = "..."` dependency references absolute, resolving them
 * against `base_dir`. References that resolve inside `keep_within` (a
 * workspace root that is staged as a whole) stay untouched.
 *
 * @return Number of rewritten references
 */
size_t rewrite_path_dependencies(Value& manifest, const fs::path& base_dir,
                                 const std::optional<fs::path>& keep_within = std::nullopt);

/**
 * True if `path` equals `root` or lies below it (lexical comparison on
 * normalized paths).
 */
bool path_is_within(const fs::path& path, const fs::path& root);

} // namespace rustimport::config

#endif // RUSTIMPORT_MANIFEST_HPP
