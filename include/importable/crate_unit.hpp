// crate_unit.hpp - Build unit for a crate with its own Cargo.toml
// Part of rustimport - on-demand native extension builds

#ifndef RUSTIMPORT_CRATE_UNIT_HPP
#define RUSTIMPORT_CRATE_UNIT_HPP

#include "importable/build_unit.hpp"

#include <optional>

namespace rustimport {

class WorkspaceStager;

// Marker file that opts a crate in without touching its Cargo.toml
inline constexpr const char* OPT_IN_MARKER = ".rustimport";

/**
 * A crate directory. When an ancestor directory also holds a Cargo.toml,
 * that ancestor is the workspace root: the whole workspace is staged and
 * every member shares one scratch directory.
 */
class CrateUnit : public BuildUnit {
public:
    CrateUnit(fs::path crate_dir, std::string fullname, Settings settings);

    // `path` may be the crate directory or its Cargo.toml.
    static std::unique_ptr<BuildUnit> try_create(const fs::path& path,
                                                 const std::string& fullname,
                                                 bool opt_in,
                                                 const Settings& settings,
                                                 FailureReasons& reasons);

    // Shared by all workspace members
    fs::path build_tempdir() const override;

    // Every .rs and Cargo.* under the staged root, plus `//d:` globs of
    // src/lib.rs
    std::vector<std::string> dependencies() const override;

    StagedCrate stage() const override;

    const char* kind() const override { return "crate"; }

    const std::optional<fs::path>& workspace_root() const { return workspace_root_; }
    fs::path manifest_path() const { return path_ / "Cargo.toml"; }

    // Workspace root, or the crate itself when standalone
    const fs::path& staging_root() const { return workspace_root_ ? *workspace_root_ : path_; }

private:
    // Override every other Cargo.toml under the staging root whose path
    // dependencies point outside the workspace. Returns the number overridden.
    size_t override_workspace_manifests(WorkspaceStager& stager) const;

    std::optional<fs::path> workspace_root_;
};

} // namespace rustimport

#endif // RUSTIMPORT_CRATE_UNIT_HPP
