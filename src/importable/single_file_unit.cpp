// single_file_unit.cpp - Build unit for a lone .rs file
// Part of rustimport - on-demand native extension builds

#include "importable/single_file_unit.hpp"
#include "core/log.hpp"
#include "importable/workspace.hpp"
#include "preprocess/header.hpp"
#include "preprocess/preprocessor.hpp"

#include <fstream>
#include <sstream>

namespace rustimport {

std::unique_ptr<BuildUnit> SingleFileUnit::try_create(const fs::path& path,
                                                      const std::string& fullname,
                                                      bool opt_in,
                                                      const Settings& settings,
                                                      FailureReasons& reasons) {
    fs::path source = path;
    if (source.extension() != ".rs") {
        source += ".rs";
    }

    std::error_code ec;
    if (!fs::is_regular_file(source, ec)) {
        RUSTIMPORT_LOG_DEBUG("[try_import]: Failed to create a SingleFileUnit to import from "
                             << source.string() << ".");
        return nullptr;
    }

    if (opt_in && !first_line_contains_sentinel(source)) {
        reasons.notify(source.string() + " exists but its first line does not contain `" +
                       SENTINEL_TOKEN + "` (required for opt-in)");
        return nullptr;
    }

    RUSTIMPORT_LOG_DEBUG("[try_import]: Successfully created SingleFileUnit to import from "
                         << source.string() << ".");
    return std::make_unique<SingleFileUnit>(fs::canonical(source), fullname, settings);
}

std::string SingleFileUnit::crate_name() const {
    return path_.stem().string();
}

std::vector<std::string> SingleFileUnit::dependencies() const {
    std::vector<std::string> deps = {path_.string()};

    // An unreadable source leaves only itself, which then reads as stale
    std::ifstream in(path_, std::ios::binary);
    if (!in) {
        return deps;
    }
    std::ostringstream contents;
    contents << in.rdbuf();

    for (auto& pattern : resolve_dependency_globs(parse_header(contents.str()), path_.parent_path())) {
        deps.push_back(std::move(pattern));
    }
    return deps;
}

StagedCrate SingleFileUnit::stage() const {
    StagedCrate staged;
    staged.crate_dir = build_tempdir() / crate_name();

    Preprocessor preprocessor(path_, name(), std::nullopt, std::nullopt, settings_.target_os);
    PreprocessorResult processed = preprocessor.process();

    const std::string source = processed.updated_source ? *processed.updated_source
                                                        : read_file(path_);

    if (write_if_changed(staged.crate_dir / "src" / "lib.rs", source)) {
        RUSTIMPORT_LOG_DEBUG("Staged source " << path_.string());
    }
    if (write_if_changed(staged.crate_dir / "Cargo.toml", processed.cargo_manifest)) {
        RUSTIMPORT_LOG_DEBUG("Staged manifest for " << path_.string());
    }

    staged.extra_cargo_args = std::move(processed.extra_cargo_args);
    return staged;
}

} // namespace rustimport
