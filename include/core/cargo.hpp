// cargo.hpp - Invocation of the cargo build tool
// Part of rustimport - on-demand native extension builds

#ifndef RUSTIMPORT_CARGO_HPP
#define RUSTIMPORT_CARGO_HPP

#include "config/value.hpp"
#include "core/settings.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace rustimport {

namespace fs = std::filesystem;

/**
 * CargoInvoker - Runs `cargo rustc --lib` on a staged crate
 *
 * Responsibilities:
 * - Locate the cargo executable (settings override, then PATH)
 * - Spawn cargo in the crate directory with JSON message output
 * - Parse the line-delimited message stream while the process runs
 * - Pick the library artifact belonging to the crate being built
 * - Forward or buffer rendered compiler diagnostics
 * - Copy the artifact to its destination
 *
 * Platform Support: POSIX (fork/exec)
 */
class CargoInvoker {
public:
    struct BuildResult {
        std::optional<fs::path> artifact_path;       // nullopt when cargo reported none
        int exit_code = -1;
        bool success = false;
        std::vector<std::string> error_output;       // Rendered diagnostics, in order
        std::string stderr_output;                   // Raw cargo stderr (quiet mode)
        std::vector<config::Value> compiler_messages;
        std::chrono::milliseconds duration{0};
    };

    /**
     * @throws ToolchainNotFoundError if cargo cannot be found
     */
    explicit CargoInvoker(const Settings& settings);

    /**
     * Build the crate rooted at `crate_path` (the directory holding
     * Cargo.toml).
     *
     * @param destination Copy the library artifact here on success
     * @param release Pass --release
     * @param quiet Pass --quiet and buffer diagnostics; on failure they are
     *              logged as one report
     * @param extra_args Appended verbatim to the command line
     * @throws std::runtime_error on pipe/fork failure (not compile errors)
     * @throws fs::filesystem_error if the artifact cannot be copied
     */
    BuildResult build(const fs::path& crate_path,
                      const std::optional<fs::path>& destination,
                      bool release,
                      bool quiet,
                      const std::vector<std::string>& extra_args = {}) const;

    const std::string& executable() const { return executable_path_; }

    // Format: cargo rustc --lib --message-format json [--quiet] [--release] [extra...]
    std::vector<std::string> build_command_args(bool release, bool quiet,
                                                const std::vector<std::string>& extra_args) const;

private:
    std::string executable_path_;

    BuildResult execute(const std::vector<std::string>& args,
                        const fs::path& crate_path,
                        bool quiet) const;
};

/**
 * Feeds cargo's JSON lines into a BuildResult.
 *
 * `compiler-artifact` messages only count when their manifest lives in
 * `crate_dir`; workspace builds report artifacts of sibling crates too.
 * `compiler-message` text is always collected, and is also written to
 * stderr immediately unless `buffer_diagnostics` is set.
 */
class CargoMessageHandler {
public:
    CargoMessageHandler(fs::path crate_dir, bool buffer_diagnostics);

    void handle_line(const std::string& line, CargoInvoker::BuildResult& result) const;

private:
    fs::path crate_dir_;
    bool buffer_diagnostics_;
};

// Look up an executable name in $PATH.
std::optional<std::string> find_executable_in_path(const std::string& name);

// Copy `from` over `to` keeping permissions and modification time. The copy
// lands in a sibling temp file first and is renamed into place.
void copy_artifact(const fs::path& from, const fs::path& to);

} // namespace rustimport

#endif // RUSTIMPORT_CARGO_HPP
