// crate_unit.cpp - Build unit for a crate with its own Cargo.toml
// Part of rustimport - on-demand native extension builds

#include "importable/crate_unit.hpp"
#include "config/manifest.hpp"
#include "config/toml_parser.hpp"
#include "config/toml_writer.hpp"
#include "core/log.hpp"
#include "importable/workspace.hpp"
#include "preprocess/header.hpp"
#include "preprocess/preprocessor.hpp"
#include "state/hasher.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace rustimport {

namespace {

bool is_manifest_file(const fs::path& path) {
    std::string file = path.filename().string();
    std::transform(file.begin(), file.end(), file.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return file == "cargo.toml";
}

} // namespace

CrateUnit::CrateUnit(fs::path crate_dir, std::string fullname, Settings settings)
    : BuildUnit(std::move(crate_dir), std::move(fullname), std::move(settings)),
      workspace_root_(find_workspace_root(path_)) {
    if (workspace_root_) {
        RUSTIMPORT_LOG_DEBUG("Crate " << path_.string() << " belongs to workspace "
                             << workspace_root_->string());
    }
}

std::unique_ptr<BuildUnit> CrateUnit::try_create(const fs::path& path,
                                                 const std::string& fullname,
                                                 bool opt_in,
                                                 const Settings& settings,
                                                 FailureReasons& reasons) {
    fs::path manifest = is_manifest_file(path) ? path : path / "Cargo.toml";

    std::error_code ec;
    if (!fs::is_regular_file(manifest, ec)) {
        RUSTIMPORT_LOG_DEBUG("[try_import]: No Cargo.toml at " << manifest.string() << ".");
        return nullptr;
    }

    fs::path directory = manifest.parent_path();
    if (directory.empty()) {
        directory = ".";
    }

    if (opt_in &&
        !fs::is_regular_file(directory / OPT_IN_MARKER, ec) &&
        !first_line_contains_sentinel(manifest)) {
        reasons.notify(directory.string() + " is a crate but has neither a `" +
                       std::string(OPT_IN_MARKER) + "` file nor `" + SENTINEL_TOKEN +
                       "` in the first line of its Cargo.toml (required for opt-in)");
        return nullptr;
    }

    RUSTIMPORT_LOG_DEBUG("[try_import]: Successfully created CrateUnit to import from "
                         << directory.string() << ".");
    return std::make_unique<CrateUnit>(fs::canonical(directory), fullname, settings);
}

fs::path CrateUnit::build_tempdir() const {
    if (!workspace_root_) {
        return BuildUnit::build_tempdir();
    }
    const fs::path& root = *workspace_root_;
    return settings_.cache_dir /
           (root.filename().string() + "-" +
            Hasher::hex_digest(HashAlgorithm::MD5, root.string()));
}

std::vector<std::string> CrateUnit::dependencies() const {
    const fs::path& root = staging_root();
    std::vector<std::string> deps = {
        (root / "**" / "*.rs").string(),
        (root / "**" / "Cargo.*").string(),
    };

    fs::path lib_rs = path_ / "src" / "lib.rs";
    std::ifstream in(lib_rs, std::ios::binary);
    if (in) {
        std::ostringstream contents;
        contents << in.rdbuf();
        for (auto& pattern : resolve_dependency_globs(parse_header(contents.str()), lib_rs.parent_path())) {
            deps.push_back(std::move(pattern));
        }
    }
    return deps;
}

StagedCrate CrateUnit::stage() const {
    const fs::path& root = staging_root();
    WorkspaceStager stager(root, build_tempdir() / root.filename());

    StagedCrate staged;
    staged.crate_dir = stager.staged_path(path_);

    fs::path lib_rs = path_ / "src" / "lib.rs";
    std::error_code ec;
    if (fs::is_regular_file(lib_rs, ec)) {
        Preprocessor preprocessor(lib_rs, name(), manifest_path(), workspace_root_,
                                  settings_.target_os);
        PreprocessorResult processed = preprocessor.process();

        stager.override_file(manifest_path(), processed.cargo_manifest);
        if (processed.updated_source) {
            stager.override_file(lib_rs, *processed.updated_source);
        }
        staged.extra_cargo_args = std::move(processed.extra_cargo_args);
    } else {
        // Custom [lib] path: no header to read, but path dependencies still
        // have to resolve from the scratch directory
        config::Value manifest = config::parse_toml_file(manifest_path());
        config::rewrite_path_dependencies(manifest, path_, workspace_root_);
        stager.override_file(manifest_path(), config::to_toml(manifest));
    }

    if (size_t rewritten = override_workspace_manifests(stager)) {
        RUSTIMPORT_LOG_DEBUG("Rewrote path dependencies in " << rewritten
                             << " other manifest(s) under " << root.string());
    }
    stager.stage();
    return staged;
}

size_t CrateUnit::override_workspace_manifests(WorkspaceStager& stager) const {
    const fs::path& root = staging_root();
    const fs::path own_manifest = manifest_path().lexically_normal();
    size_t overridden = 0;

    auto it = fs::recursive_directory_iterator(root);
    for (; it != fs::recursive_directory_iterator(); ++it) {
        const auto& entry = *it;
        if (entry.is_directory()) {
            if (is_build_output_dir(entry.path())) {
                it.disable_recursion_pending();
            }
            continue;
        }
        if (!entry.is_regular_file() || entry.path().filename() != "Cargo.toml" ||
            entry.path().lexically_normal() == own_manifest) {
            continue;
        }

        // Sibling members and the root manifest are loaded by cargo too, so
        // their references outside the workspace must resolve from scratch
        config::Value manifest = config::parse_toml_file(entry.path());
        if (config::rewrite_path_dependencies(manifest, entry.path().parent_path(), workspace_root_) > 0) {
            stager.override_file(entry.path(), config::to_toml(manifest));
            overridden++;
        }
    }
    return overridden;
}

} // namespace rustimport
