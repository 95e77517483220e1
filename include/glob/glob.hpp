/**
 * Glob expansion for rustimport
 *
 * Resolves dependency patterns (`//d:` header directives and the broad
 * crate patterns) into concrete file lists for fingerprinting.
 *
 * Features:
 * - Full glob pattern support: *, **, ?, [...]
 * - Hidden entries are skipped unless the pattern component starts with '.'
 * - Canonical sorting for reproducible fingerprints
 */

#ifndef RUSTIMPORT_GLOB_HPP
#define RUSTIMPORT_GLOB_HPP

#include <filesystem>
#include <string>
#include <vector>

namespace rustimport::glob {

namespace fs = std::filesystem;

/**
 * Error codes from glob operations
 */
enum class GlobError {
    OK = 0,
    INVALID_BASE_DIR = 1,
    PATTERN_SYNTAX_ERROR = 2,
    MAX_DEPTH_EXCEEDED = 3
};

/**
 * Result of a glob operation
 */
struct GlobResult {
    std::vector<std::string> paths;
    GlobError error = GlobError::OK;
    std::string error_message;

    bool ok() const { return error == GlobError::OK; }
};

/**
 * Glob options
 */
struct GlobOptions {
    bool case_sensitive = true;
    bool follow_symlinks = false;
    size_t max_depth = 64;
    bool files_only = true;
    bool include_hidden = false;
};

/**
 * Expand a glob pattern to matching files.
 *
 * @param base_dir Root directory for relative patterns (ignored for
 *                 absolute ones)
 * @param pattern Glob pattern - supports wildcards and recursive matching
 * @param options Optional configuration
 * @return GlobResult with matched paths (sorted) or error
 *
 * Pattern syntax:
 * - *     matches any sequence (except path separator)
 * - **    as a whole component, matches zero or more directories
 * - ?     matches any single character
 * - [abc] matches any character in set
 * - [!abc] matches any character not in set
 * - [a-z] matches any character in range
 */
GlobResult expand_pattern(
    const fs::path& base_dir,
    const std::string& pattern,
    const GlobOptions& options = GlobOptions{}
);

/**
 * Expand multiple patterns (combined results, deduplicated).
 */
GlobResult expand_patterns(
    const fs::path& base_dir,
    const std::vector<std::string>& patterns,
    const GlobOptions& options = GlobOptions{}
);

/**
 * Check if a path matches a glob pattern, component by component.
 */
bool path_matches(
    const fs::path& path,
    const std::string& pattern,
    bool case_sensitive = true
);

/**
 * Validate a glob pattern syntax (balanced brackets, `**` only as a whole
 * component).
 */
bool validate_pattern(const std::string& pattern);

/**
 * True if the pattern contains any of the wildcard characters `*?[`.
 */
bool has_magic(const std::string& pattern);

/**
 * Get human-readable error string.
 */
const char* error_string(GlobError error);

} // namespace rustimport::glob

#endif // RUSTIMPORT_GLOB_HPP
