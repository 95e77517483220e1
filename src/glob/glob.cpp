/**
 * Glob expansion implementation
 *
 * Walks the filesystem one pattern component at a time; single components
 * are matched with fnmatch(3).
 */

#include "glob/glob.hpp"

#include <fnmatch.h>

#include <algorithm>
#include <set>

namespace rustimport::glob {

namespace {

std::vector<std::string> split_components(const fs::path& pattern) {
    std::vector<std::string> components;
    for (const auto& part : pattern.relative_path()) {
        std::string text = part.string();
        if (!text.empty() && text != ".") {
            components.push_back(std::move(text));
        }
    }
    return components;
}

bool component_matches(const std::string& pattern, const std::string& name, bool case_sensitive) {
    int flags = FNM_PERIOD;
    if (!case_sensitive) flags |= FNM_CASEFOLD;
    return fnmatch(pattern.c_str(), name.c_str(), flags) == 0;
}

class Walker {
public:
    Walker(const std::vector<std::string>& components, const GlobOptions& options)
        : components_(components), options_(options) {}

    void walk(const fs::path& current, size_t index, size_t depth) {
        if (depth > options_.max_depth) {
            depth_exceeded_ = true;
            return;
        }

        if (index == components_.size()) {
            emit(current);
            return;
        }

        const std::string& component = components_[index];

        if (component == "**") {
            // Zero directories
            walk(current, index + 1, depth);

            bool last = (index + 1 == components_.size());
            for (const auto& entry : list(current)) {
                if (is_directory(entry)) {
                    walk(entry.path(), index, depth + 1);
                } else if (last) {
                    walk(entry.path(), index + 1, depth + 1);
                }
            }
            return;
        }

        if (!has_magic(component)) {
            fs::path next = current / component;
            std::error_code ec;
            if (fs::exists(fs::symlink_status(next, ec))) {
                walk(next, index + 1, depth + 1);
            }
            return;
        }

        bool allow_hidden = options_.include_hidden || component[0] == '.';
        for (const auto& entry : list(current, allow_hidden)) {
            std::string name = entry.path().filename().string();
            if (component_matches(component, name, options_.case_sensitive)) {
                walk(entry.path(), index + 1, depth + 1);
            }
        }
    }

    std::set<std::string>& results() { return results_; }
    bool depth_exceeded() const { return depth_exceeded_; }

private:
    const std::vector<std::string>& components_;
    const GlobOptions& options_;
    std::set<std::string> results_;
    bool depth_exceeded_ = false;

    std::vector<fs::directory_entry> list(const fs::path& dir, bool allow_hidden = false) const {
        std::vector<fs::directory_entry> entries;
        std::error_code ec;
        fs::directory_iterator it(dir.empty() ? fs::path(".") : dir, ec);
        if (ec) return entries;  // Not a directory or unreadable: no matches

        for (; it != fs::directory_iterator(); it.increment(ec)) {
            if (ec) break;
            std::string name = it->path().filename().string();
            if (!allow_hidden && !options_.include_hidden && !name.empty() && name[0] == '.') {
                continue;
            }
            entries.push_back(*it);
        }
        return entries;
    }

    bool is_directory(const fs::directory_entry& entry) const {
        std::error_code ec;
        if (!options_.follow_symlinks && entry.is_symlink(ec)) {
            return false;
        }
        return entry.is_directory(ec);
    }

    void emit(const fs::path& path) {
        std::error_code ec;
        if (options_.files_only && !fs::is_regular_file(path, ec)) {
            return;
        }
        results_.insert(path.string());
    }
};

bool match_from(const std::vector<std::string>& pattern, size_t pi,
                const std::vector<std::string>& path, size_t si, bool case_sensitive) {
    if (pi == pattern.size()) return si == path.size();

    if (pattern[pi] == "**") {
        for (size_t skip = si; skip <= path.size(); ++skip) {
            if (match_from(pattern, pi + 1, path, skip, case_sensitive)) return true;
        }
        return false;
    }

    if (si == path.size()) return false;
    if (!component_matches(pattern[pi], path[si], case_sensitive)) return false;
    return match_from(pattern, pi + 1, path, si + 1, case_sensitive);
}

} // namespace

bool has_magic(const std::string& pattern) {
    return pattern.find_first_of("*?[") != std::string::npos;
}

GlobResult expand_pattern(
    const fs::path& base_dir,
    const std::string& pattern,
    const GlobOptions& options
) {
    GlobResult result;

    if (!validate_pattern(pattern)) {
        result.error = GlobError::PATTERN_SYNTAX_ERROR;
        result.error_message = "Invalid glob pattern: " + pattern;
        return result;
    }

    fs::path pattern_path(pattern);
    fs::path start;
    if (pattern_path.is_absolute()) {
        start = pattern_path.root_path();
    } else {
        std::error_code ec;
        if (!base_dir.empty() && !fs::is_directory(base_dir, ec)) {
            result.error = GlobError::INVALID_BASE_DIR;
            result.error_message = "Base directory does not exist: " + base_dir.string();
            return result;
        }
        start = base_dir;
    }

    std::vector<std::string> components = split_components(pattern_path);
    Walker walker(components, options);
    walker.walk(start, 0, 0);

    if (walker.depth_exceeded()) {
        result.error = GlobError::MAX_DEPTH_EXCEEDED;
        result.error_message = "Maximum directory depth exceeded for pattern: " + pattern;
    }

    // std::set keeps the canonical order
    result.paths.assign(walker.results().begin(), walker.results().end());
    return result;
}

GlobResult expand_patterns(
    const fs::path& base_dir,
    const std::vector<std::string>& patterns,
    const GlobOptions& options
) {
    GlobResult result;
    std::set<std::string> seen;

    for (const auto& pattern : patterns) {
        GlobResult partial = expand_pattern(base_dir, pattern, options);

        if (!partial.ok()) {
            result.error = partial.error;
            result.error_message = partial.error_message;
            return result;
        }

        for (auto& path : partial.paths) {
            if (seen.insert(path).second) {
                result.paths.push_back(std::move(path));
            }
        }
    }

    // Canonical sort for reproducibility
    std::sort(result.paths.begin(), result.paths.end());

    return result;
}

bool path_matches(
    const fs::path& path,
    const std::string& pattern,
    bool case_sensitive
) {
    fs::path pattern_path(pattern);
    if (pattern_path.is_absolute() != path.is_absolute()) {
        return false;
    }
    return match_from(split_components(pattern_path), 0,
                      split_components(path.lexically_normal()), 0, case_sensitive);
}

bool validate_pattern(const std::string& pattern) {
    if (pattern.empty()) return false;

    for (const auto& component : split_components(fs::path(pattern))) {
        // `**` is only meaningful as a whole component
        if (component != "**" && component.find("**") != std::string::npos) {
            return false;
        }

        size_t open = component.find('[');
        while (open != std::string::npos) {
            size_t search_from = open + 1;
            if (search_from < component.size() &&
                (component[search_from] == '!' || component[search_from] == '^')) {
                search_from++;
            }
            // A ']' directly after the opening bracket is a literal member
            if (search_from < component.size() && component[search_from] == ']') {
                search_from++;
            }
            size_t close = component.find(']', search_from);
            if (close == std::string::npos) return false;
            open = component.find('[', close + 1);
        }
    }
    return true;
}

const char* error_string(GlobError error) {
    switch (error) {
        case GlobError::OK:                   return "ok";
        case GlobError::INVALID_BASE_DIR:     return "invalid base directory";
        case GlobError::PATTERN_SYNTAX_ERROR: return "pattern syntax error";
        case GlobError::MAX_DEPTH_EXCEEDED:   return "maximum depth exceeded";
    }
    return "unknown error";
}

} // namespace rustimport::glob
