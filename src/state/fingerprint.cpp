// fingerprint.cpp - Content fingerprints embedded in compiled artifacts
// Part of rustimport - on-demand native extension builds

#include "state/fingerprint.hpp"
#include "core/log.hpp"
#include "glob/glob.hpp"

#include <algorithm>
#include <cstring>
#include <fstream>
#include <stdexcept>

namespace rustimport {

namespace {

void encode_int64_le(int64_t value, char* out) {
    uint64_t bits = static_cast<uint64_t>(value);
    for (int i = 0; i < 8; ++i) {
        out[i] = static_cast<char>((bits >> (8 * i)) & 0xFF);
    }
}

int64_t decode_int64_le(const char* in) {
    uint64_t bits = 0;
    for (int i = 7; i >= 0; --i) {
        bits = (bits << 8) | static_cast<unsigned char>(in[i]);
    }
    return static_cast<int64_t>(bits);
}

} // namespace

FingerprintEngine::FingerprintEngine(HashAlgorithm algorithm)
    : algorithm_(algorithm) {
}

// =============================================================================
// Core Operations
// =============================================================================

bool FingerprintEngine::is_valid(const fs::path& artifact_path,
                                 const std::vector<std::string>& dependency_patterns,
                                 bool release) const {
    std::optional<std::string> stored = read_trailer(artifact_path);
    if (!stored) {
        return false;  // Reason already logged by read_trailer
    }

    std::string unreadable;
    std::optional<std::string> current = compute(dependency_patterns, release, &unreadable);
    if (!current) {
        RUSTIMPORT_LOG_INFO("Checksummed file not found while checking rustimport checksum ("
                            << unreadable << "); rebuilding.");
        return false;
    }

    return *stored == *current;
}

void FingerprintEngine::stamp(const fs::path& artifact_path,
                              const std::vector<std::string>& dependency_patterns,
                              bool release) const {
    std::string unreadable;
    std::optional<std::string> fingerprint = compute(dependency_patterns, release, &unreadable);
    if (!fingerprint) {
        throw std::runtime_error("Cannot fingerprint " + artifact_path.string() +
                                 ": failed to read " + unreadable);
    }
    append_trailer(artifact_path, *fingerprint);
}

// =============================================================================
// Fingerprint Computation
// =============================================================================

std::vector<std::string> FingerprintEngine::resolve_files(
    const std::vector<std::string>& dependency_patterns) {

    std::vector<std::string> files;
    glob::GlobOptions options;
    options.files_only = true;

    for (const auto& entity : dependency_patterns) {
        std::error_code ec;
        if (glob::has_magic(entity)) {
            glob::GlobResult matched = glob::expand_pattern(fs::path(), entity, options);
            if (!matched.ok()) {
                RUSTIMPORT_LOG_WARN("Ignoring dependency pattern " << entity << ": "
                                    << matched.error_message);
            }
            files.insert(files.end(), matched.paths.begin(), matched.paths.end());
        } else if (fs::is_directory(entity, ec)) {
            glob::GlobResult matched = glob::expand_pattern(
                fs::path(), (fs::path(entity) / "**").string(), options);
            files.insert(files.end(), matched.paths.begin(), matched.paths.end());
        } else {
            files.push_back(entity);
        }
    }

    std::sort(files.begin(), files.end());
    files.erase(std::unique(files.begin(), files.end()), files.end());
    return files;
}

std::optional<std::string> FingerprintEngine::compute(
    const std::vector<std::string>& dependency_patterns,
    bool release,
    std::string* unreadable) const {

    std::string payload = release ? "r\n" : "";
    bool first = true;

    for (const auto& file : resolve_files(dependency_patterns)) {
        std::optional<std::string> digest = Hasher::hash_file(algorithm_, file);
        if (!digest) {
            if (unreadable) *unreadable = file;
            return std::nullopt;
        }
        if (!first) payload += '\n';
        first = false;
        payload += file + ":" + *digest;
    }

    RUSTIMPORT_LOG_DEBUG("Checksum payload: " << payload);

    return Hasher::hex_digest(algorithm_, payload);
}

// =============================================================================
// Trailer I/O
// =============================================================================

std::optional<std::string> FingerprintEngine::read_trailer(const fs::path& artifact_path) {
    std::ifstream file(artifact_path, std::ios::binary);
    if (!file) {
        RUSTIMPORT_LOG_INFO("Failed to find compiled extension; rebuilding.");
        return std::nullopt;
    }

    file.seekg(0, std::ios::end);
    std::streamoff size = file.tellg();
    if (size < static_cast<std::streamoff>(TRAILER_SIZE)) {
        RUSTIMPORT_LOG_INFO("The extension is missing the trailer tag and thus is missing"
                            " its checksum; rebuilding.");
        return std::nullopt;
    }

    char trailer[TRAILER_SIZE];
    file.seekg(size - static_cast<std::streamoff>(TRAILER_SIZE));
    file.read(trailer, TRAILER_SIZE);
    if (!file || std::memcmp(trailer + 8, TRAILER_TAG, TRAILER_TAG_SIZE) != 0) {
        RUSTIMPORT_LOG_INFO("The extension is missing the trailer tag and thus is missing"
                            " its checksum; rebuilding.");
        return std::nullopt;
    }

    int64_t length = decode_int64_le(trailer);
    if (length < 0 || length > size - static_cast<std::streamoff>(TRAILER_SIZE)) {
        RUSTIMPORT_LOG_INFO("The extension has a corrupt checksum trailer; rebuilding.");
        return std::nullopt;
    }

    std::string fingerprint(static_cast<size_t>(length), '\0');
    file.seekg(size - static_cast<std::streamoff>(TRAILER_SIZE) - length);
    file.read(fingerprint.data(), length);
    if (!file) {
        RUSTIMPORT_LOG_INFO("Failed to read the extension checksum; rebuilding.");
        return std::nullopt;
    }
    return fingerprint;
}

void FingerprintEngine::append_trailer(const fs::path& artifact_path, const std::string& fingerprint) {
    std::ofstream file(artifact_path, std::ios::binary | std::ios::app);
    if (!file) {
        throw std::runtime_error("Failed to open artifact for stamping: " + artifact_path.string());
    }

    char length[8];
    encode_int64_le(static_cast<int64_t>(fingerprint.size()), length);

    file.write(fingerprint.data(), static_cast<std::streamsize>(fingerprint.size()));
    file.write(length, sizeof(length));
    file.write(TRAILER_TAG, TRAILER_TAG_SIZE);

    if (!file.good()) {
        throw std::runtime_error("Failed to write checksum trailer to " + artifact_path.string());
    }
}

} // namespace rustimport
