/**
 * build_orchestrator.hpp
 * Build policy and batch builds for rustimport
 *
 * Integrates:
 * - Finder for dotted module names
 * - Build unit variants (single file, crate) for filesystem paths
 * - FingerprintEngine (through BuildUnit::needs_rebuild) for staleness
 * - DynamicLibrary for loading the result
 *
 * Rebuild Policy (ensure_built):
 * 1. release_mode set -> never check, never build
 * 2. force_rebuild set -> always build
 * 3. otherwise build when the artifact fingerprint is stale for the
 *    requested variant (compile_release_binaries)
 *
 * Batch Flow (build_all):
 * 1. Walk the tree, skipping `target` and hidden directories
 * 2. Every Cargo.toml is a crate candidate; every .rs outside a crate is a
 *    single-file candidate
 * 3. Candidates that fail opt-in are skipped and listed in the summary
 * 4. The first build failure stops the batch
 *
 * Units are processed one at a time.
 */

#ifndef RUSTIMPORT_BUILD_ORCHESTRATOR_HPP
#define RUSTIMPORT_BUILD_ORCHESTRATOR_HPP

#include "core/loader.hpp"
#include "core/settings.hpp"
#include "importable/build_unit.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace rustimport {

namespace fs = std::filesystem;

// =============================================================================
// Batch Summary
// =============================================================================
struct BatchSummary {
    bool success = true;

    size_t total_units = 0;
    size_t built_units = 0;
    size_t up_to_date_units = 0;
    size_t skipped_units = 0;   // Not eligible (opt-in missing, not a unit)
    size_t failed_units = 0;

    std::chrono::milliseconds total_time{0};

    // "<path>: <reason>" for every skipped candidate
    std::vector<std::string> skipped;

    // Errors encountered
    std::vector<std::string> errors;

    // Add another batch's counts and lists to this one.
    void merge(const BatchSummary& other);
};

enum class UnitOutcome {
    BUILT,
    UP_TO_DATE,
    NOT_CHECKED      // release_mode
};

const char* unit_outcome_name(UnitOutcome outcome);

// =============================================================================
// Progress Callback
// =============================================================================
enum class BuildPhase {
    DISCOVERING,       // Walking the tree for candidates
    CHECKING,          // Fingerprint comparison
    COMPILING,         // Staging and running cargo
    COMPLETE
};

struct BuildProgress {
    BuildPhase phase = BuildPhase::DISCOVERING;
    size_t current = 0;
    size_t total = 0;
    std::string current_unit;
    std::string message;
};

using ProgressCallback = std::function<void(const BuildProgress&)>;

// =============================================================================
// Build Orchestrator
// =============================================================================
class BuildOrchestrator {
public:
    explicit BuildOrchestrator(Settings settings);

    // No copying
    BuildOrchestrator(const BuildOrchestrator&) = delete;
    BuildOrchestrator& operator=(const BuildOrchestrator&) = delete;

    // =========================================================================
    // Single Units
    // =========================================================================

    /**
     * Apply the rebuild policy to one unit.
     *
     * @throws BuildError, ToolchainNotFoundError from the build
     */
    UnitOutcome ensure_built(const BuildUnit& unit);

    /**
     * Resolve a dotted module name and make sure it is built.
     *
     * @throws ImportNotFoundError if nothing matches
     */
    std::unique_ptr<BuildUnit> build_module(const std::string& fullname, bool opt_in = false);

    /**
     * build_module() followed by loading the artifact into this process.
     */
    std::unique_ptr<DynamicLibrary> import_module(const std::string& fullname, bool opt_in = false);

    // =========================================================================
    // Batches
    // =========================================================================

    /**
     * Build a file (no opt-in required) or every eligible unit below a
     * directory (opt-in required).
     *
     * @throws std::runtime_error if `path` does not exist
     */
    BatchSummary build_path(const fs::path& path);

    BatchSummary build_all(const fs::path& root, bool opt_in = true);

    // =========================================================================
    // Configuration
    // =========================================================================

    void set_progress_callback(ProgressCallback cb) { progress_cb_ = std::move(cb); }

    const Settings& settings() const { return settings_; }

private:
    struct Candidate {
        fs::path path;
        bool is_crate;
    };

    // Sorted crates first, then loose .rs files
    std::vector<Candidate> discover(const fs::path& root) const;

    // Build one candidate into the summary. Returns false on build failure.
    bool process_candidate(const Candidate& candidate, bool opt_in,
                           size_t index, size_t total, BatchSummary& summary);

    void report_progress(BuildPhase phase, size_t current, size_t total,
                         const std::string& unit = "",
                         const std::string& message = "");

    Settings settings_;
    ProgressCallback progress_cb_;

    // Position of the unit being processed within the current batch
    size_t batch_index_ = 1;
    size_t batch_total_ = 1;
};

} // namespace rustimport

#endif // RUSTIMPORT_BUILD_ORCHESTRATOR_HPP
