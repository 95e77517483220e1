// settings.hpp - Configuration for rustimport builds
// Part of rustimport - on-demand native extension builds
//
// Settings are an explicit value handed to the resolver, the build units,
// the cargo invoker and the orchestrator at construction time. Nothing
// reads the environment implicitly; from_environment() is the one place
// RUSTIMPORT_* variables are consulted.

#ifndef RUSTIMPORT_SETTINGS_HPP
#define RUSTIMPORT_SETTINGS_HPP

#include "state/hasher.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rustimport {

namespace fs = std::filesystem;

enum class TargetOs {
    Linux,
    MacOS,
    Windows,
    Other
};

TargetOs host_target_os();
const char* target_os_name(TargetOs os);

// ".so", ".dylib" or ".dll"
std::string default_extension_suffix(TargetOs os);

// `<system temp dir>/rustimport`
fs::path default_cache_dir();

// Accepts 1/true/yes in any case; everything else is false.
bool parse_bool_flag(std::string_view value);

struct Settings {
    // Cargo executable override (default: `cargo` looked up on PATH)
    std::optional<std::string> cargo_executable;

    // Root for per-unit scratch directories
    fs::path cache_dir = default_cache_dir();

    // Build optimized binaries (cargo --release)
    bool compile_release_binaries = false;

    // Rebuild on every request even when the fingerprint matches.
    // Has no effect when release_mode is set.
    bool force_rebuild = false;

    // Production mode: skip all staleness checks and never build
    bool release_mode = false;

    HashAlgorithm checksum_hasher = HashAlgorithm::SHA1;

    TargetOs target_os = host_target_os();

    // Appended to the bare module name to form the artifact file name
    std::string extension_suffix = default_extension_suffix(host_target_os());

    // Extra dlopen() flags, e.g. RTLD_GLOBAL to share symbols between
    // interdependent extensions
    int rtld_flags = 0;

    // Pass --quiet to cargo and buffer its diagnostics
    bool quiet_cargo = false;

    // Directories searched when resolving dotted module names
    std::vector<fs::path> search_paths;

    /**
     * Build settings from RUSTIMPORT_CARGO_EXECUTABLE, RUSTIMPORT_CACHE_DIR,
     * RUSTIMPORT_RELEASE_BINARIES, RUSTIMPORT_FORCE_REBUILD,
     * RUSTIMPORT_RELEASE_MODE, RUSTIMPORT_CHECKSUM_HASHER,
     * RUSTIMPORT_EXTENSION_SUFFIX and RUSTIMPORT_PATH.
     *
     * @throws std::invalid_argument on an unknown hash algorithm name
     */
    static Settings from_environment();
};

} // namespace rustimport

#endif // RUSTIMPORT_SETTINGS_HPP
