// errors.hpp - Error types raised by rustimport
// Part of rustimport - on-demand native extension builds
//
// Staleness-check problems are never errors (they mean "rebuild"), so
// there is no exception type for them.

#ifndef RUSTIMPORT_ERRORS_HPP
#define RUSTIMPORT_ERRORS_HPP

#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace rustimport {

namespace fs = std::filesystem;

// Raised when the compiler exits non-zero for the requested unit.
class BuildError : public std::runtime_error {
public:
    BuildError(const fs::path& source_path, std::vector<std::string> diagnostics);

    const fs::path& source_path() const { return source_path_; }
    const std::vector<std::string>& diagnostics() const { return diagnostics_; }

private:
    fs::path source_path_;
    std::vector<std::string> diagnostics_;
};

// Raised when no build unit matches a logical module name.
class ImportNotFoundError : public std::runtime_error {
public:
    ImportNotFoundError(const std::string& module_name, bool opt_in,
                        std::vector<std::string> reasons);

    const std::string& module_name() const { return module_name_; }
    const std::vector<std::string>& reasons() const { return reasons_; }

private:
    std::string module_name_;
    std::vector<std::string> reasons_;
};

// Raised when the compiler toolchain cannot be located.
class ToolchainNotFoundError : public std::runtime_error {
public:
    explicit ToolchainNotFoundError(const std::string& executable);

    const std::string& executable() const { return executable_; }

    // Platform specific installation hint shown to the user.
    static std::string remediation();

private:
    std::string executable_;
};

/**
 * Collects "near miss" explanations during resolution, e.g. a source file
 * that would have matched if it carried the opt-in marker.
 */
class FailureReasons {
public:
    void notify(std::string reason) { reasons_.push_back(std::move(reason)); }
    const std::vector<std::string>& all() const { return reasons_; }
    bool empty() const { return reasons_.empty(); }
    void clear() { reasons_.clear(); }

private:
    std::vector<std::string> reasons_;
};

} // namespace rustimport

#endif // RUSTIMPORT_ERRORS_HPP
