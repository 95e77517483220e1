// build_unit.hpp - Importable build units
// Part of rustimport - on-demand native extension builds
//
// A build unit is one Rust entity that compiles to one extension artifact:
// a single `.rs` file or a crate with its own Cargo.toml. Units are
// immutable descriptors; building writes only to the scratch directory and
// the artifact path.

#ifndef RUSTIMPORT_BUILD_UNIT_HPP
#define RUSTIMPORT_BUILD_UNIT_HPP

#include "core/errors.hpp"
#include "core/settings.hpp"

#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace rustimport {

namespace fs = std::filesystem;

// A crate materialized in the scratch directory, ready for cargo.
struct StagedCrate {
    fs::path crate_dir;
    std::vector<std::string> extra_cargo_args;
};

class BuildUnit {
public:
    /**
     * @param path Canonical source path (file or crate directory)
     * @param fullname Dotted module name; empty means the file stem
     */
    BuildUnit(fs::path path, std::string fullname, Settings settings);
    virtual ~BuildUnit() = default;

    BuildUnit(const BuildUnit&) = delete;
    BuildUnit& operator=(const BuildUnit&) = delete;

    const fs::path& path() const { return path_; }
    const std::string& fullname() const { return fullname_; }
    const Settings& settings() const { return settings_; }

    // Last segment of the dotted name
    std::string name() const;

    // `<dir of path>/<name><extension suffix>`
    fs::path artifact_path() const;

    // Persistent scratch directory for this unit
    virtual fs::path build_tempdir() const;

    // Patterns whose contents decide staleness
    virtual std::vector<std::string> dependencies() const;

    // Materialize the crate in the scratch directory.
    virtual StagedCrate stage() const = 0;

    // "single-file" or "crate"
    virtual const char* kind() const = 0;

    // True when the artifact is missing or its fingerprint is stale for
    // the given build variant. Never throws for staleness problems.
    bool needs_rebuild(bool release) const;

    /**
     * Lock the scratch directory, stage, run cargo, copy the artifact next
     * to the source and stamp its fingerprint.
     *
     * @throws BuildError if cargo fails or produces no library
     * @throws ToolchainNotFoundError if cargo cannot be found
     */
    void build(bool release) const;

protected:
    fs::path path_;
    std::string fullname_;
    Settings settings_;
};

/**
 * Variant constructor used during resolution. Returns nullptr when `path`
 * is not this kind of unit; near misses (e.g. missing opt-in) are
 * reported through `reasons`.
 */
using BuildUnitFactory = std::function<std::unique_ptr<BuildUnit>(
    const fs::path& path, const std::string& fullname, bool opt_in,
    const Settings& settings, FailureReasons& reasons)>;

struct BuildUnitVariant {
    const char* name;
    BuildUnitFactory create;
};

// Variants in resolution order: crate first, then single file.
const std::vector<BuildUnitVariant>& build_unit_factories();

// Try every variant in order; first match wins.
std::unique_ptr<BuildUnit> create_build_unit(const fs::path& path,
                                             const std::string& fullname,
                                             bool opt_in,
                                             const Settings& settings,
                                             FailureReasons& reasons);

} // namespace rustimport

#endif // RUSTIMPORT_BUILD_UNIT_HPP
