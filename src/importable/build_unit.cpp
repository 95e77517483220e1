// build_unit.cpp - Importable build units
// Part of rustimport - on-demand native extension builds

#include "importable/build_unit.hpp"
#include "core/cargo.hpp"
#include "core/log.hpp"
#include "importable/crate_unit.hpp"
#include "importable/single_file_unit.hpp"
#include "importable/workspace.hpp"
#include "state/fingerprint.hpp"
#include "state/hasher.hpp"

namespace rustimport {

BuildUnit::BuildUnit(fs::path path, std::string fullname, Settings settings)
    : path_(std::move(path)), fullname_(std::move(fullname)), settings_(std::move(settings)) {
    if (fullname_.empty()) {
        fullname_ = path_.stem().string();
    }
}

std::string BuildUnit::name() const {
    auto dot = fullname_.rfind('.');
    return dot == std::string::npos ? fullname_ : fullname_.substr(dot + 1);
}

fs::path BuildUnit::artifact_path() const {
    return path_.parent_path() / (name() + settings_.extension_suffix);
}

fs::path BuildUnit::build_tempdir() const {
    return settings_.cache_dir /
           (fullname_ + "-" + Hasher::hex_digest(HashAlgorithm::MD5, path_.string()));
}

std::vector<std::string> BuildUnit::dependencies() const {
    return {path_.string()};
}

bool BuildUnit::needs_rebuild(bool release) const {
    FingerprintEngine engine(settings_.checksum_hasher);
    return !engine.is_valid(artifact_path(), dependencies(), release);
}

void BuildUnit::build(bool release) const {
    // Fail on a missing toolchain before touching the scratch directory
    CargoInvoker cargo(settings_);

    fs::path tempdir = build_tempdir();
    fs::path lock_file = tempdir;
    lock_file += ".lock";
    DirectoryLock lock(lock_file);

    StagedCrate staged = stage();
    RUSTIMPORT_LOG_DEBUG("Building in temporary directory " << staged.crate_dir.string());

    auto result = cargo.build(staged.crate_dir, artifact_path(), release,
                              settings_.quiet_cargo, staged.extra_cargo_args);

    if (!result.success) {
        throw BuildError(path_, result.error_output);
    }
    if (!result.artifact_path) {
        throw BuildError(path_, {"cargo did not report a library artifact for " +
                                 staged.crate_dir.string()});
    }

    FingerprintEngine engine(settings_.checksum_hasher);
    engine.stamp(artifact_path(), dependencies(), release);
}

// ============================================================================
// Variant registry
// ============================================================================

const std::vector<BuildUnitVariant>& build_unit_factories() {
    static const std::vector<BuildUnitVariant> variants = {
        {"crate", &CrateUnit::try_create},
        {"single-file", &SingleFileUnit::try_create},
    };
    return variants;
}

std::unique_ptr<BuildUnit> create_build_unit(const fs::path& path,
                                             const std::string& fullname,
                                             bool opt_in,
                                             const Settings& settings,
                                             FailureReasons& reasons) {
    for (const auto& variant : build_unit_factories()) {
        if (auto unit = variant.create(path, fullname, opt_in, settings, reasons)) {
            RUSTIMPORT_LOG_DEBUG("Resolved " << path.string() << " as " << variant.name
                                 << " unit " << unit->path().string());
            return unit;
        }
    }
    return nullptr;
}

} // namespace rustimport
