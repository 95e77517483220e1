/**
 * build_orchestrator.cpp
 * Implementation of rustimport's build policy and batch builds
 */

#include "core/build_orchestrator.hpp"
#include "config/manifest.hpp"
#include "core/errors.hpp"
#include "core/finder.hpp"
#include "core/log.hpp"
#include "importable/crate_unit.hpp"
#include "importable/single_file_unit.hpp"
#include "importable/workspace.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace rustimport {

void BatchSummary::merge(const BatchSummary& other) {
    success = success && other.success;
    total_units += other.total_units;
    built_units += other.built_units;
    up_to_date_units += other.up_to_date_units;
    skipped_units += other.skipped_units;
    failed_units += other.failed_units;
    total_time += other.total_time;
    skipped.insert(skipped.end(), other.skipped.begin(), other.skipped.end());
    errors.insert(errors.end(), other.errors.begin(), other.errors.end());
}

const char* unit_outcome_name(UnitOutcome outcome) {
    switch (outcome) {
        case UnitOutcome::BUILT:       return "built";
        case UnitOutcome::UP_TO_DATE:  return "up to date";
        case UnitOutcome::NOT_CHECKED: return "not checked";
    }
    return "unknown";
}

BuildOrchestrator::BuildOrchestrator(Settings settings)
    : settings_(std::move(settings))
{
}

// =============================================================================
// Single Units
// =============================================================================

UnitOutcome BuildOrchestrator::ensure_built(const BuildUnit& unit) {
    if (settings_.release_mode) {
        RUSTIMPORT_LOG_DEBUG("Release mode: using " << unit.artifact_path().string() << " as is");
        return UnitOutcome::NOT_CHECKED;
    }

    const bool release = settings_.compile_release_binaries;

    report_progress(BuildPhase::CHECKING, batch_index_, batch_total_, unit.path().string(),
                    "Checking for changes...");
    if (!settings_.force_rebuild && !unit.needs_rebuild(release)) {
        return UnitOutcome::UP_TO_DATE;
    }

    report_progress(BuildPhase::COMPILING, batch_index_, batch_total_, unit.path().string(), "Building...");
    unit.build(release);
    return UnitOutcome::BUILT;
}

std::unique_ptr<BuildUnit> BuildOrchestrator::build_module(const std::string& fullname, bool opt_in) {
    auto unit = find_build_unit(fullname, settings_.search_paths, opt_in, settings_);
    ensure_built(*unit);
    return unit;
}

std::unique_ptr<DynamicLibrary> BuildOrchestrator::import_module(const std::string& fullname, bool opt_in) {
    auto unit = build_module(fullname, opt_in);
    return load_extension(unit->artifact_path(), settings_);
}

// =============================================================================
// Batches
// =============================================================================

BatchSummary BuildOrchestrator::build_path(const fs::path& path) {
    std::error_code ec;
    if (fs::is_directory(path, ec)) {
        return build_all(path);
    }
    if (!fs::is_regular_file(path, ec)) {
        throw std::runtime_error("The given root path \"" + path.string() + "\" could not be found.");
    }

    auto start_time = std::chrono::steady_clock::now();
    BatchSummary summary;

    Candidate candidate{path, false};
    std::string file = path.filename().string();
    std::transform(file.begin(), file.end(), file.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    candidate.is_crate = (file == "cargo.toml");

    // An explicitly named file needs no opt-in
    process_candidate(candidate, false, 1, 1, summary);

    summary.total_time = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);
    report_progress(BuildPhase::COMPLETE, 1, 1, "", "Build complete");
    return summary;
}

BatchSummary BuildOrchestrator::build_all(const fs::path& root, bool opt_in) {
    auto start_time = std::chrono::steady_clock::now();
    BatchSummary summary;

    report_progress(BuildPhase::DISCOVERING, 0, 1, root.string(), "Looking for build units...");
    std::vector<Candidate> candidates = discover(root);

    for (size_t i = 0; i < candidates.size(); ++i) {
        if (!process_candidate(candidates[i], opt_in, i + 1, candidates.size(), summary)) {
            break;
        }
    }

    summary.total_time = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);
    report_progress(BuildPhase::COMPLETE, candidates.size(), candidates.size(), "", "Build complete");
    return summary;
}

std::vector<BuildOrchestrator::Candidate> BuildOrchestrator::discover(const fs::path& root) const {
    std::vector<fs::path> crates;
    std::vector<fs::path> sources;

    auto it = fs::recursive_directory_iterator(root);
    for (; it != fs::recursive_directory_iterator(); ++it) {
        const auto& entry = *it;
        const std::string file = entry.path().filename().string();

        if (entry.is_directory()) {
            if (file == BUILD_OUTPUT_DIR || (!file.empty() && file[0] == '.')) {
                it.disable_recursion_pending();
            }
            continue;
        }
        if (!entry.is_regular_file()) {
            continue;
        }

        if (file == "Cargo.toml") {
            crates.push_back(entry.path().parent_path());
        } else if (entry.path().extension() == ".rs") {
            sources.push_back(entry.path());
        }
    }

    std::sort(crates.begin(), crates.end());
    std::sort(sources.begin(), sources.end());

    // Sources inside a crate are built through the crate
    const bool root_in_crate = find_workspace_root(fs::absolute(root) / "_").has_value();

    std::vector<Candidate> candidates;
    for (const auto& crate : crates) {
        candidates.push_back({crate, true});
    }
    if (!root_in_crate) {
        for (const auto& source : sources) {
            bool owned = std::any_of(crates.begin(), crates.end(), [&](const fs::path& crate) {
                return config::path_is_within(source, crate);
            });
            if (!owned) {
                candidates.push_back({source, false});
            }
        }
    }

    RUSTIMPORT_LOG_DEBUG("Found " << crates.size() << " crate(s) and " << sources.size()
                         << " source file(s) under " << root.string());
    return candidates;
}

bool BuildOrchestrator::process_candidate(const Candidate& candidate, bool opt_in,
                                          size_t index, size_t total, BatchSummary& summary) {
    summary.total_units++;
    batch_index_ = index;
    batch_total_ = total;

    FailureReasons reasons;
    std::unique_ptr<BuildUnit> unit = candidate.is_crate
        ? CrateUnit::try_create(candidate.path, "", opt_in, settings_, reasons)
        : SingleFileUnit::try_create(candidate.path, "", opt_in, settings_, reasons);

    if (!unit) {
        summary.skipped_units++;
        std::string reason = reasons.empty() ? "not a build unit" : reasons.all().front();
        summary.skipped.push_back(candidate.path.string() + ": " + reason);
        RUSTIMPORT_LOG_DEBUG("Skipping " << candidate.path.string() << ": " << reason);
        return true;
    }

    struct ResetPosition {
        BuildOrchestrator& self;
        ~ResetPosition() { self.batch_index_ = 1; self.batch_total_ = 1; }
    } reset{*this};

    try {
        UnitOutcome outcome = ensure_built(*unit);
        if (outcome == UnitOutcome::BUILT) {
            summary.built_units++;
        } else {
            summary.up_to_date_units++;
        }
        RUSTIMPORT_LOG_DEBUG(unit->path().string() << ": " << unit_outcome_name(outcome));
    } catch (const BuildError& e) {
        summary.failed_units++;
        summary.success = false;
        summary.errors.push_back(e.what());
        return false;
    }
    return true;
}

void BuildOrchestrator::report_progress(BuildPhase phase, size_t current, size_t total,
                                        const std::string& unit,
                                        const std::string& message) {
    if (progress_cb_) {
        BuildProgress progress;
        progress.phase = phase;
        progress.current = current;
        progress.total = total;
        progress.current_unit = unit;
        progress.message = message;
        progress_cb_(progress);
    }
}

} // namespace rustimport
