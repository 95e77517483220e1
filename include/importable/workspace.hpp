// workspace.hpp - Scratch directory staging and locking
// Part of rustimport - on-demand native extension builds
//
// Builds never run in the user's tree. A unit (or the whole workspace it
// belongs to) is mirrored into a scratch directory under the cache dir,
// which is kept between builds so cargo's `target/` stays warm.

#ifndef RUSTIMPORT_WORKSPACE_HPP
#define RUSTIMPORT_WORKSPACE_HPP

#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <string>

namespace rustimport {

namespace fs = std::filesystem;

// Build output directory; never copied from the source tree and never
// pruned in the scratch tree.
inline constexpr const char* BUILD_OUTPUT_DIR = "target";

// True for a `target` directory that sits next to a Cargo.toml. Source
// directories that happen to be named `target` (e.g. src/target/) are not
// build output.
bool is_build_output_dir(const fs::path& dir);

/**
 * Walk upward from the parent of `crate_dir` and return the first ancestor
 * directory holding a Cargo.toml, or nullopt for a standalone crate.
 */
std::optional<fs::path> find_workspace_root(const fs::path& crate_dir);

/**
 * Write `content` to `path` unless the file already holds exactly that,
 * creating parent directories as needed.
 *
 * @return true if the file was written
 */
bool write_if_changed(const fs::path& path, const std::string& content);

struct StageStats {
    size_t copied = 0;     // Files written because they were new or changed
    size_t unchanged = 0;  // Files left alone
    size_t pruned = 0;     // Stale scratch files deleted
};

/**
 * WorkspaceStager - Mirrors a source tree into a scratch directory
 *
 * Every destination written during a pass is tracked; afterwards any other
 * file in the scratch tree is deleted so removals in the source are
 * mirrored. Cargo output directories (see is_build_output_dir) are skipped
 * on both sides.
 *
 * Files whose size and modification time already match are not copied
 * again, and copies keep the source's modification time.
 */
class WorkspaceStager {
public:
    WorkspaceStager(fs::path source_root, fs::path scratch_root);

    /**
     * Stage `content` in place of the source file at `source_file` (which
     * must lie under the source root; it need not exist).
     */
    void override_file(const fs::path& source_file, std::string content);

    // Map a path in the source tree to its staged location.
    fs::path staged_path(const fs::path& source_file) const;

    /**
     * Copy, apply overrides, prune.
     *
     * @throws fs::filesystem_error on I/O failure
     */
    StageStats stage();

    const fs::path& source_root() const { return source_root_; }
    const fs::path& scratch_root() const { return scratch_root_; }

private:
    fs::path source_root_;
    fs::path scratch_root_;
    std::map<fs::path, std::string> overrides_;  // keyed by scratch path

    bool copy_if_changed(const fs::path& from, const fs::path& to) const;
    size_t prune(const std::set<fs::path>& written) const;
};

/**
 * DirectoryLock - Exclusive advisory lock held for one build
 *
 * Takes an fcntl() write lock on `lock_file` (created if missing) and
 * blocks until it is granted. Released on destruction. Serializes builds
 * from separate processes that share a scratch directory.
 */
class DirectoryLock {
public:
    /**
     * @throws std::runtime_error if the lock file cannot be opened or locked
     */
    explicit DirectoryLock(const fs::path& lock_file);
    ~DirectoryLock();

    DirectoryLock(const DirectoryLock&) = delete;
    DirectoryLock& operator=(const DirectoryLock&) = delete;

    const fs::path& path() const { return path_; }

private:
    fs::path path_;
    int fd_ = -1;
};

} // namespace rustimport

#endif // RUSTIMPORT_WORKSPACE_HPP
