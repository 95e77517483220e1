// header.hpp - Source header mini-language
// Part of rustimport - on-demand native extension builds
//
// A Rust source file may open with a comment block such as:
//
//   // rustimport:pyo3
//   //: [dependencies]
//   //: rand = "0.8"
//   //d: ../data/*.json
//
// The first non-blank line is the opt-in sentinel (with an optional
// template name), `//:` lines form a Cargo.toml fragment and `//d:` lines
// add dependency globs. Scanning stops at the first line of real code.

#ifndef RUSTIMPORT_HEADER_HPP
#define RUSTIMPORT_HEADER_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rustimport {

namespace fs = std::filesystem;

inline constexpr const char* SENTINEL_TOKEN = "rustimport";
inline constexpr const char* MANIFEST_PREFIX = "//:";
inline constexpr const char* DEPENDENCY_PREFIX = "//d:";

struct HeaderConfig {
    // Raw TOML text accumulated from `//:` lines, one line each
    std::string manifest_fragment;

    // Template requested by `// rustimport:<name>`
    std::optional<std::string> template_name;

    // `//d:` patterns in the order they appear
    std::vector<std::string> dependency_globs;

    // First non-blank line is the sentinel
    bool opt_in = false;
};

HeaderConfig parse_header(std::string_view source);

// `//d:` patterns made absolute against the source file's directory.
std::vector<std::string> resolve_dependency_globs(const HeaderConfig& header,
                                                  const fs::path& base_dir);

/**
 * Opt-in filter used by the resolver: true if the first line of `file`
 * contains the sentinel token anywhere. Unreadable files count as false.
 */
bool first_line_contains_sentinel(const fs::path& file);

// Strip leading and trailing ASCII whitespace.
std::string_view strip(std::string_view text);

} // namespace rustimport

#endif // RUSTIMPORT_HEADER_HPP
