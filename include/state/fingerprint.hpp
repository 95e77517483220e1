#ifndef RUSTIMPORT_FINGERPRINT_HPP
#define RUSTIMPORT_FINGERPRINT_HPP

// fingerprint.hpp - Content fingerprints embedded in compiled artifacts
// Part of rustimport - on-demand native extension builds
//
// A fingerprint is a digest over `path:digest` lines of every file a build
// depends on. Instead of a sidecar state file it is appended to the artifact
// itself:
//
//   [hex fingerprint][int64 little-endian length]["rustimport"]
//
// A missing artifact, a missing or garbled trailer, or an unreadable
// dependency all read as "stale"; none of them is an error.

#include "state/hasher.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace rustimport {

namespace fs = std::filesystem;

class FingerprintEngine {
public:
    static constexpr const char* TRAILER_TAG = "rustimport";
    static constexpr size_t TRAILER_TAG_SIZE = 10;
    static constexpr size_t TRAILER_SIZE = 8 + TRAILER_TAG_SIZE;

    explicit FingerprintEngine(HashAlgorithm algorithm = HashAlgorithm::SHA1);

    // =========================================================================
    // Core Operations
    // =========================================================================

    // True if the artifact carries a trailer equal to the fingerprint of the
    // current dependency contents for the given build variant.
    bool is_valid(const fs::path& artifact_path,
                  const std::vector<std::string>& dependency_patterns,
                  bool release) const;

    // Append the current fingerprint to the artifact. Call only after a
    // successful build. Throws std::runtime_error if a dependency cannot be
    // read or the artifact cannot be written.
    void stamp(const fs::path& artifact_path,
               const std::vector<std::string>& dependency_patterns,
               bool release) const;

    // =========================================================================
    // Fingerprint Computation (public for testing)
    // =========================================================================

    // Expand patterns: globs recursively, directories to everything below
    // them, literal paths as-is. Result is sorted and de-duplicated.
    static std::vector<std::string> resolve_files(const std::vector<std::string>& dependency_patterns);

    // Returns nullopt if any resolved file cannot be read; its path is then
    // stored in `unreadable` when given.
    std::optional<std::string> compute(const std::vector<std::string>& dependency_patterns,
                                       bool release,
                                       std::string* unreadable = nullptr) const;

    // =========================================================================
    // Trailer I/O
    // =========================================================================

    static std::optional<std::string> read_trailer(const fs::path& artifact_path);

    // Strictly appends; existing trailers are never parsed or rewritten.
    static void append_trailer(const fs::path& artifact_path, const std::string& fingerprint);

    HashAlgorithm algorithm() const { return algorithm_; }

private:
    HashAlgorithm algorithm_;
};

} // namespace rustimport

#endif // RUSTIMPORT_FINGERPRINT_HPP
