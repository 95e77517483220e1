// preprocessor.hpp - Turns a Rust source plus header into a buildable crate
// Part of rustimport - on-demand native extension builds

#ifndef RUSTIMPORT_PREPROCESSOR_HPP
#define RUSTIMPORT_PREPROCESSOR_HPP

#include "config/value.hpp"
#include "core/settings.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace rustimport {

namespace fs = std::filesystem;

struct PreprocessorResult {
    std::string cargo_manifest;                    // Serialized Cargo.toml
    config::Value manifest;                        // Same, as a tree
    std::vector<std::string> dependency_patterns;  // `//d:` globs, absolute
    std::optional<std::string> updated_source;     // nullopt: use the file as-is
    std::vector<std::string> extra_cargo_args;
};

/**
 * Preprocessor - Builds the final manifest and source for one unit
 *
 * Layers, lowest precedence first:
 *   1. Template defaults (only when the header names a template)
 *   2. The `//:` fragment from the source header
 *   3. The crate's own Cargo.toml (`manifest_path`), if any
 *
 * Relative `path` dependencies in layers 2 and 3 are resolved against the
 * directory of `manifest_path` (the source's directory when there is none)
 * and made absolute so they still resolve from the scratch directory,
 * except those inside `workspace_root`, which is staged as a whole.
 */
class Preprocessor {
public:
    Preprocessor(fs::path source_path,
                 std::string lib_name,
                 std::optional<fs::path> manifest_path = std::nullopt,
                 std::optional<fs::path> workspace_root = std::nullopt,
                 TargetOs target_os = host_target_os());

    /**
     * @throws std::runtime_error if the source or manifest cannot be read
     * @throws config::ParseError on malformed TOML
     * @throws std::invalid_argument on an unknown template name
     */
    PreprocessorResult process() const;

private:
    fs::path source_path_;
    std::string lib_name_;
    std::optional<fs::path> manifest_path_;
    std::optional<fs::path> workspace_root_;
    TargetOs target_os_;
};

// Read a whole file. Throws std::runtime_error if it cannot be opened.
std::string read_file(const fs::path& path);

} // namespace rustimport

#endif // RUSTIMPORT_PREPROCESSOR_HPP
