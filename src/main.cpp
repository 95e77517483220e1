/**
 * main.cpp
 * rustimport - build Rust extensions on demand
 *
 * Usage:
 *   rustimport [options] build [paths...] [-f] [-r]
 *   rustimport [options] new <name>[.rs]
 *
 * Commands:
 *   build       Build files, crates, or every eligible unit under a directory
 *   new         Create a single-file extension or a crate
 *
 * Options:
 *   -v          Verbose output (debug logging)
 *   -q          Quiet mode (critical messages only)
 *   --help      Show this help
 *   --version   Show version
 */

#include "core/build_orchestrator.hpp"
#include "core/log.hpp"
#include "core/scaffold.hpp"

#include <iostream>
#include <string>
#include <vector>

using namespace rustimport;

// -----------------------------------------------------------------------------
// Version and Help
// -----------------------------------------------------------------------------

void print_version() {
    std::cout << "rustimport 1.0.0\n";
}

void print_help() {
    std::cout << R"(
rustimport - build Rust extensions on demand

USAGE:
    rustimport [OPTIONS] <COMMAND> [ARGS...]

COMMANDS:
    build [PATHS...]   Build the given files or directories (default: .).
                       A directory is walked recursively and every unit
                       that opts in is built.
    new <NAME>         Create a new extension. NAME ending in ".rs" creates
                       a single-file extension, otherwise a crate is set up.

BUILD OPTIONS:
    -f, --force        Force rebuild
    -r, --release      Build release-optimized binaries (cargo --release)

OPTIONS:
    -v, --verbose      Increase log verbosity
    -q, --quiet        Only print critical log messages
    -h, --help         Show this help message
    --version          Show version information

ENVIRONMENT:
    RUSTIMPORT_CARGO_EXECUTABLE   cargo binary to use
    RUSTIMPORT_CACHE_DIR          scratch directory root
    RUSTIMPORT_RELEASE_BINARIES   build with --release by default
    RUSTIMPORT_FORCE_REBUILD      always rebuild
    RUSTIMPORT_RELEASE_MODE       never check or build
    RUSTIMPORT_CHECKSUM_HASHER    sha1 (default), md5, sha256 or fnv1a
    RUSTIMPORT_EXTENSION_SUFFIX   artifact file suffix
    RUSTIMPORT_PATH               colon-separated module search paths

)";
}

// -----------------------------------------------------------------------------
// Progress Reporter
// -----------------------------------------------------------------------------

class ConsoleProgress {
public:
    explicit ConsoleProgress(bool verbose = false, bool quiet = false)
        : verbose_(verbose), quiet_(quiet) {}

    void operator()(const BuildProgress& progress) {
        if (quiet_) return;

        switch (progress.phase) {
            case BuildPhase::DISCOVERING:
                if (verbose_) {
                    std::cout << "Looking for build units in " << progress.current_unit << "...\n";
                }
                break;

            case BuildPhase::CHECKING:
                if (verbose_) {
                    std::cout << "[" << progress.current << "/" << progress.total
                              << "] Checking " << progress.current_unit << "...\n";
                }
                break;

            case BuildPhase::COMPILING:
                std::cout << "[" << progress.current << "/" << progress.total
                          << "] Building " << progress.current_unit << "...\n";
                break;

            case BuildPhase::COMPLETE:
                // Reported separately
                break;
        }
    }

private:
    bool verbose_;
    bool quiet_;
};

// -----------------------------------------------------------------------------
// Argument Parsing
// -----------------------------------------------------------------------------

enum class Command {
    NONE,
    BUILD,
    NEW
};

struct Options {
    Command command = Command::NONE;
    std::vector<std::string> args;
    bool force = false;
    bool release = false;
    bool verbose = false;
    bool quiet = false;
    bool show_help = false;
    bool show_version = false;
};

bool parse_args(int argc, char* argv[], Options& opts) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        // Help and version
        if (arg == "-h" || arg == "--help") {
            opts.show_help = true;
            return true;
        }
        if (arg == "--version") {
            opts.show_version = true;
            return true;
        }

        // Commands
        if (opts.command == Command::NONE && arg == "build") {
            opts.command = Command::BUILD;
            continue;
        }
        if (opts.command == Command::NONE && arg == "new") {
            opts.command = Command::NEW;
            continue;
        }

        // Boolean options
        if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
            continue;
        }
        if (arg == "-q" || arg == "--quiet") {
            opts.quiet = true;
            continue;
        }
        if (opts.command == Command::BUILD && (arg == "-f" || arg == "--force")) {
            opts.force = true;
            continue;
        }
        if (opts.command == Command::BUILD && (arg == "-r" || arg == "--release")) {
            opts.release = true;
            continue;
        }

        // Unknown option
        if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            std::cerr << "Try 'rustimport --help' for more information.\n";
            return false;
        }

        if (opts.command == Command::NONE) {
            std::cerr << "Unknown command: " << arg << "\n";
            std::cerr << "Try 'rustimport --help' for more information.\n";
            return false;
        }

        opts.args.push_back(arg);
    }

    if (opts.command == Command::NONE) {
        std::cerr << "Missing command.\n";
        std::cerr << "Try 'rustimport --help' for more information.\n";
        return false;
    }
    if (opts.command == Command::NEW && opts.args.size() != 1) {
        std::cerr << "Usage: rustimport new <name>[.rs]\n";
        return false;
    }
    return true;
}

// -----------------------------------------------------------------------------
// Commands
// -----------------------------------------------------------------------------

int run_build(const Options& opts, Settings settings) {
    settings.compile_release_binaries = opts.release || settings.compile_release_binaries;
    settings.force_rebuild = opts.force || settings.force_rebuild;

    BuildOrchestrator orchestrator(std::move(settings));
    orchestrator.set_progress_callback(ConsoleProgress(opts.verbose, opts.quiet));

    std::vector<std::string> roots = opts.args;
    if (roots.empty()) {
        roots.push_back(".");
    }

    BatchSummary summary;
    for (const auto& root : roots) {
        summary.merge(orchestrator.build_path(fs::absolute(root)));
        if (!summary.success) {
            break;
        }
    }

    if (!opts.quiet) {
        std::cout << "\n";
        if (summary.success) {
            std::cout << "Build succeeded: "
                      << summary.built_units << " built, "
                      << summary.up_to_date_units << " up-to-date, "
                      << summary.skipped_units << " skipped"
                      << " (" << summary.total_time.count() << "ms)\n";
        } else {
            std::cout << "Build failed: "
                      << summary.failed_units << " unit(s) failed\n";
        }
        if (opts.verbose) {
            for (const auto& skipped : summary.skipped) {
                std::cout << "  Skipped: " << skipped << "\n";
            }
        }
    }
    for (const auto& err : summary.errors) {
        std::cerr << "  Error: " << err << "\n";
    }

    return summary.success ? 0 : 1;
}

// -----------------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------------

int main(int argc, char* argv[]) {
    Options opts;

    if (!parse_args(argc, argv, opts)) {
        return 1;
    }

    if (opts.show_help) {
        print_help();
        return 0;
    }

    if (opts.show_version) {
        print_version();
        return 0;
    }

    if (opts.quiet) {
        rustimport::log::set_level(rustimport::log::LogLevel::Critical);
    } else if (opts.verbose) {
        rustimport::log::set_level(rustimport::log::LogLevel::Debug);
    } else {
        rustimport::log::set_level(rustimport::log::LogLevel::Info);
    }

    try {
        switch (opts.command) {
            case Command::BUILD:
                return run_build(opts, Settings::from_environment());

            case Command::NEW:
                create_extension(opts.args.front());
                return 0;

            case Command::NONE:
                break;
        }
    } catch (const std::exception& e) {
        // BuildError, ToolchainNotFoundError, config::ParseError, filesystem errors
        RUSTIMPORT_LOG_CRITICAL(e.what());
    }

    return 1;
}
