// header.cpp - Source header mini-language
// Part of rustimport - on-demand native extension builds

#include "preprocess/header.hpp"

#include <fstream>
#include <regex>

namespace rustimport {

namespace {

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

bool starts_with(std::string_view text, std::string_view prefix) {
    return text.substr(0, prefix.size()) == prefix;
}

} // namespace

std::string_view strip(std::string_view text) {
    size_t begin = 0;
    while (begin < text.size() && is_space(text[begin])) begin++;
    size_t end = text.size();
    while (end > begin && is_space(text[end - 1])) end--;
    return text.substr(begin, end - begin);
}

HeaderConfig parse_header(std::string_view source) {
    HeaderConfig header;

    // Sentinel: first non-blank line
    static const std::regex sentinel(R"(//\s*rustimport(?:\s*:\s*([\w-]+))?)");

    size_t first = 0;
    while (first < source.size() && is_space(source[first])) first++;
    size_t first_end = source.find('\n', first);
    std::string first_line(strip(source.substr(first, first_end == std::string_view::npos
                                                          ? std::string_view::npos
                                                          : first_end - first)));

    std::smatch match;
    if (std::regex_match(first_line, match, sentinel)) {
        header.opt_in = true;
        if (match[1].matched) {
            header.template_name = match[1].str();
        }
    }

    // Directives: every line of the leading comment run
    size_t pos = 0;
    while (pos <= source.size()) {
        size_t eol = source.find('\n', pos);
        std::string_view raw = source.substr(pos, eol == std::string_view::npos
                                                       ? std::string_view::npos
                                                       : eol - pos);
        std::string_view line = strip(raw);

        // The header must come before all code
        if (!line.empty() && !starts_with(line, "//")) {
            break;
        }

        if (starts_with(line, DEPENDENCY_PREFIX)) {
            header.dependency_globs.emplace_back(strip(line.substr(4)));
        } else if (starts_with(line, MANIFEST_PREFIX)) {
            std::string_view fragment = line.substr(3);
            while (!fragment.empty() && is_space(fragment.front())) fragment.remove_prefix(1);
            header.manifest_fragment.append(fragment);
            header.manifest_fragment += '\n';
        }

        if (eol == std::string_view::npos) break;
        pos = eol + 1;
    }

    return header;
}

std::vector<std::string> resolve_dependency_globs(const HeaderConfig& header,
                                                  const fs::path& base_dir) {
    std::vector<std::string> patterns;
    patterns.reserve(header.dependency_globs.size());
    for (const auto& glob : header.dependency_globs) {
        fs::path p(glob);
        patterns.push_back(p.is_absolute() ? glob : (base_dir / p).lexically_normal().string());
    }
    return patterns;
}

bool first_line_contains_sentinel(const fs::path& file) {
    std::ifstream in(file);
    if (!in) return false;

    std::string line;
    std::getline(in, line);
    return line.find(SENTINEL_TOKEN) != std::string::npos;
}

} // namespace rustimport
