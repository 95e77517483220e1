// workspace.cpp - Scratch directory staging and locking
// Part of rustimport - on-demand native extension builds

#include "importable/workspace.hpp"
#include "core/log.hpp"

#include <fcntl.h>
#include <unistd.h>
#include <errno.h>
#include <cstring>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace rustimport {

std::optional<fs::path> find_workspace_root(const fs::path& crate_dir) {
    fs::path dir = crate_dir.lexically_normal();
    if (!dir.has_relative_path()) {
        return std::nullopt;
    }

    for (fs::path parent = dir.parent_path(); !parent.empty(); parent = parent.parent_path()) {
        std::error_code ec;
        if (fs::is_regular_file(parent / "Cargo.toml", ec)) {
            return parent;
        }
        // The filesystem root is its own parent
        if (parent == parent.parent_path()) {
            break;
        }
    }
    return std::nullopt;
}

bool is_build_output_dir(const fs::path& dir) {
    if (dir.filename() != BUILD_OUTPUT_DIR) {
        return false;
    }
    std::error_code ec;
    return fs::is_regular_file(dir.parent_path() / "Cargo.toml", ec);
}

bool write_if_changed(const fs::path& path, const std::string& content) {
    {
        std::ifstream in(path, std::ios::binary);
        if (in) {
            std::ostringstream current;
            current << in.rdbuf();
            if (current.str() == content) {
                return false;
            }
        }
    }

    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path());
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("Failed to write " + path.string());
    }
    out << content;
    if (!out) {
        throw std::runtime_error("Failed to write " + path.string());
    }
    return true;
}

// ============================================================================
// WorkspaceStager
// ============================================================================

WorkspaceStager::WorkspaceStager(fs::path source_root, fs::path scratch_root)
    : source_root_(std::move(source_root)), scratch_root_(std::move(scratch_root)) {}

fs::path WorkspaceStager::staged_path(const fs::path& source_file) const {
    fs::path relative = source_file.lexically_relative(source_root_);
    return relative == "." ? scratch_root_ : scratch_root_ / relative;
}

void WorkspaceStager::override_file(const fs::path& source_file, std::string content) {
    overrides_[staged_path(source_file)] = std::move(content);
}

bool WorkspaceStager::copy_if_changed(const fs::path& from, const fs::path& to) const {
    std::error_code ec;
    if (fs::is_regular_file(to, ec) &&
        fs::file_size(to, ec) == fs::file_size(from) && !ec &&
        fs::last_write_time(to, ec) == fs::last_write_time(from) && !ec) {
        return false;
    }

    fs::copy_file(from, to, fs::copy_options::overwrite_existing);
    fs::last_write_time(to, fs::last_write_time(from));
    return true;
}

size_t WorkspaceStager::prune(const std::set<fs::path>& written) const {
    std::vector<fs::path> stale;

    auto it = fs::recursive_directory_iterator(scratch_root_);
    for (; it != fs::recursive_directory_iterator(); ++it) {
        const auto& entry = *it;
        if (entry.is_directory() && !entry.is_symlink()) {
            if (is_build_output_dir(entry.path())) {
                it.disable_recursion_pending();
            }
            continue;
        }
        if (written.count(entry.path()) == 0) {
            stale.push_back(entry.path());
        }
    }

    for (const auto& path : stale) {
        RUSTIMPORT_LOG_DEBUG("Removing stale staged file " << path.string());
        fs::remove(path);
    }
    return stale.size();
}

StageStats WorkspaceStager::stage() {
    StageStats stats;
    std::set<fs::path> written;

    fs::create_directories(scratch_root_);

    auto it = fs::recursive_directory_iterator(source_root_);
    for (; it != fs::recursive_directory_iterator(); ++it) {
        const auto& entry = *it;
        fs::path dest = staged_path(entry.path());

        if (entry.is_directory()) {
            if (is_build_output_dir(entry.path())) {
                it.disable_recursion_pending();
                continue;
            }
            fs::create_directories(dest);
            continue;
        }

        if (!entry.is_regular_file()) {
            continue;
        }

        bool changed;
        auto override_it = overrides_.find(dest);
        if (override_it != overrides_.end()) {
            changed = write_if_changed(dest, override_it->second);
        } else {
            changed = copy_if_changed(entry.path(), dest);
        }
        changed ? stats.copied++ : stats.unchanged++;
        written.insert(dest);
    }

    // Overrides for files the source tree does not have
    for (const auto& [dest, content] : overrides_) {
        if (written.count(dest)) continue;
        write_if_changed(dest, content) ? stats.copied++ : stats.unchanged++;
        written.insert(dest);
    }

    stats.pruned = prune(written);

    RUSTIMPORT_LOG_DEBUG("Staged " << source_root_.string() << " into " << scratch_root_.string()
                         << " (" << stats.copied << " copied, " << stats.unchanged
                         << " unchanged, " << stats.pruned << " pruned)");
    return stats;
}

// ============================================================================
// DirectoryLock
// ============================================================================

DirectoryLock::DirectoryLock(const fs::path& lock_file) : path_(lock_file) {
    if (path_.has_parent_path()) {
        fs::create_directories(path_.parent_path());
    }

    fd_ = ::open(path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd_ < 0) {
        throw std::runtime_error("Failed to open lock file " + path_.string() + ": " +
                                 strerror(errno));
    }

    struct flock lock {};
    lock.l_type = F_WRLCK;
    lock.l_whence = SEEK_SET;
    lock.l_start = 0;
    lock.l_len = 1;  // ensure a lock exists even if file is empty

    RUSTIMPORT_LOG_DEBUG("Waiting for lock " << path_.string());
    while (::fcntl(fd_, F_SETLKW, &lock) != 0) {
        if (errno == EINTR) continue;
        int err = errno;
        ::close(fd_);
        fd_ = -1;
        throw std::runtime_error("Failed to lock " + path_.string() + ": " + strerror(err));
    }
}

DirectoryLock::~DirectoryLock() {
    if (fd_ < 0) return;

    struct flock lock {};
    lock.l_type = F_UNLCK;
    lock.l_whence = SEEK_SET;
    lock.l_start = 0;
    lock.l_len = 1;
    ::fcntl(fd_, F_SETLK, &lock);
    ::close(fd_);
}

} // namespace rustimport
