// errors.cpp - Error types raised by rustimport
// Part of rustimport - on-demand native extension builds

#include "core/errors.hpp"

#include <sstream>

namespace rustimport {

namespace {

std::string build_error_message(const fs::path& source_path,
                                const std::vector<std::string>& diagnostics) {
    std::ostringstream oss;
    oss << "Failed to build " << source_path.string();
    if (!diagnostics.empty()) {
        oss << ":\n";
        for (const auto& d : diagnostics) {
            oss << d;
            if (d.empty() || d.back() != '\n') oss << "\n";
        }
    }
    return oss.str();
}

std::string not_found_message(const std::string& module_name, bool opt_in,
                              const std::vector<std::string>& reasons) {
    std::ostringstream oss;
    oss << "Couldn't find a valid import target matching the module name: "
        << module_name << " (opt_in: " << (opt_in ? "true" : "false") << ").";

    if (!reasons.empty()) {
        oss << " This could be potential reasons: \n";
        for (size_t i = 0; i < reasons.size(); ++i) {
            // Continuation lines are indented under the bullet
            std::string reason = reasons[i];
            size_t pos = 0;
            while ((pos = reason.find('\n', pos)) != std::string::npos) {
                reason.replace(pos, 1, "\n    ");
                pos += 5;
            }
            oss << "  - " << reason;
            if (i + 1 < reasons.size()) oss << "\n";
        }
    }
    return oss.str();
}

} // namespace

BuildError::BuildError(const fs::path& source_path, std::vector<std::string> diagnostics)
    : std::runtime_error(build_error_message(source_path, diagnostics))
    , source_path_(source_path)
    , diagnostics_(std::move(diagnostics)) {
}

ImportNotFoundError::ImportNotFoundError(const std::string& module_name, bool opt_in,
                                         std::vector<std::string> reasons)
    : std::runtime_error(not_found_message(module_name, opt_in, reasons))
    , module_name_(module_name)
    , reasons_(std::move(reasons)) {
}

ToolchainNotFoundError::ToolchainNotFoundError(const std::string& executable)
    : std::runtime_error("Could not find " + executable + " binary.\n\n" + remediation())
    , executable_(executable) {
}

std::string ToolchainNotFoundError::remediation() {
#ifdef _WIN32
    return "Could not find the rust toolchain installation. Make sure it is installed and "
           "the `PATH` environment variable is set correctly.\n\n"
           "To install the toolchain, visit "
           "https://forge.rust-lang.org/infra/other-installation-methods.html"
           "#other-ways-to-install-rustup\n";
#else
    return "Could not find the rust toolchain installation. Make sure it is installed and "
           "the `PATH` environment variable is set correctly.\n\n"
           "You can install the toolchain like this:\n$ curl https://sh.rustup.rs | sh\n";
#endif
}

} // namespace rustimport
