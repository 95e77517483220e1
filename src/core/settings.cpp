// settings.cpp - Configuration for rustimport builds
// Part of rustimport - on-demand native extension builds

#include "core/settings.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace rustimport {

namespace {

std::optional<std::string> get_env(const char* name) {
    const char* value = std::getenv(name);
    if (!value || !*value) return std::nullopt;
    return std::string(value);
}

std::vector<fs::path> split_search_path(const std::string& value) {
    std::vector<fs::path> paths;
    size_t start = 0;
    while (start <= value.size()) {
        size_t sep = value.find(':', start);
        if (sep == std::string::npos) sep = value.size();
        if (sep > start) {
            paths.emplace_back(value.substr(start, sep - start));
        }
        start = sep + 1;
    }
    return paths;
}

} // namespace

TargetOs host_target_os() {
#if defined(__APPLE__)
    return TargetOs::MacOS;
#elif defined(_WIN32)
    return TargetOs::Windows;
#elif defined(__linux__)
    return TargetOs::Linux;
#else
    return TargetOs::Other;
#endif
}

const char* target_os_name(TargetOs os) {
    switch (os) {
        case TargetOs::Linux:   return "linux";
        case TargetOs::MacOS:   return "macos";
        case TargetOs::Windows: return "windows";
        case TargetOs::Other:   return "other";
    }
    return "other";
}

std::string default_extension_suffix(TargetOs os) {
    switch (os) {
        case TargetOs::MacOS:   return ".dylib";
        case TargetOs::Windows: return ".dll";
        default:                return ".so";
    }
}

fs::path default_cache_dir() {
    std::error_code ec;
    fs::path temp = fs::temp_directory_path(ec);
    if (ec) temp = "/tmp";
    return temp / "rustimport";
}

bool parse_bool_flag(std::string_view value) {
    std::string lower(value);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower == "1" || lower == "true" || lower == "yes";
}

Settings Settings::from_environment() {
    Settings settings;

    settings.cargo_executable = get_env("RUSTIMPORT_CARGO_EXECUTABLE");

    if (auto cache_dir = get_env("RUSTIMPORT_CACHE_DIR")) {
        settings.cache_dir = *cache_dir;
    }
    if (auto value = get_env("RUSTIMPORT_RELEASE_BINARIES")) {
        settings.compile_release_binaries = parse_bool_flag(*value);
    }
    if (auto value = get_env("RUSTIMPORT_FORCE_REBUILD")) {
        settings.force_rebuild = parse_bool_flag(*value);
    }
    if (auto value = get_env("RUSTIMPORT_RELEASE_MODE")) {
        settings.release_mode = parse_bool_flag(*value);
    }
    if (auto value = get_env("RUSTIMPORT_CHECKSUM_HASHER")) {
        settings.checksum_hasher = parse_hash_algorithm(*value);
    }
    if (auto value = get_env("RUSTIMPORT_EXTENSION_SUFFIX")) {
        settings.extension_suffix = *value;
    }
    if (auto value = get_env("RUSTIMPORT_PATH")) {
        settings.search_paths = split_search_path(*value);
    }

    return settings;
}

} // namespace rustimport
