// hasher.cpp - Content hashing implementation
// Part of rustimport - on-demand native extension builds

#include "state/hasher.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace rustimport {

// =============================================================================
// FNV-1a Hash Constants
// =============================================================================

static constexpr uint64_t FNV_OFFSET_BASIS = 14695981039346656037ULL;
static constexpr uint64_t FNV_PRIME = 1099511628211ULL;

const char* hash_algorithm_name(HashAlgorithm algorithm) {
    switch (algorithm) {
        case HashAlgorithm::SHA1:   return "sha1";
        case HashAlgorithm::MD5:    return "md5";
        case HashAlgorithm::SHA256: return "sha256";
        case HashAlgorithm::FNV1A:  return "fnv1a";
    }
    return "unknown";
}

HashAlgorithm parse_hash_algorithm(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "sha1") return HashAlgorithm::SHA1;
    if (lower == "md5") return HashAlgorithm::MD5;
    if (lower == "sha256") return HashAlgorithm::SHA256;
    if (lower == "fnv1a") return HashAlgorithm::FNV1A;

    throw std::invalid_argument("Unknown checksum hash algorithm: " + std::string(name));
}

void Hasher::EvpDeleter::operator()(EVP_MD_CTX* ctx) const {
    EVP_MD_CTX_free(ctx);
}

Hasher::Hasher(HashAlgorithm algorithm)
    : algorithm_(algorithm)
    , fnv_state_(FNV_OFFSET_BASIS) {

    const EVP_MD* md = nullptr;
    switch (algorithm) {
        case HashAlgorithm::SHA1:   md = EVP_sha1(); break;
        case HashAlgorithm::MD5:    md = EVP_md5(); break;
        case HashAlgorithm::SHA256: md = EVP_sha256(); break;
        case HashAlgorithm::FNV1A:  return;
    }

    ctx_.reset(EVP_MD_CTX_new());
    if (!ctx_ || EVP_DigestInit_ex(ctx_.get(), md, nullptr) != 1) {
        throw std::runtime_error(std::string("Failed to initialize ") +
                                 hash_algorithm_name(algorithm) + " digest");
    }
}

Hasher::~Hasher() = default;

void Hasher::update(const void* data, size_t size) {
    if (finished_) {
        throw std::logic_error("Hasher updated after hex_digest()");
    }

    if (algorithm_ == HashAlgorithm::FNV1A) {
        const auto* bytes = static_cast<const unsigned char*>(data);
        for (size_t i = 0; i < size; ++i) {
            fnv_state_ ^= static_cast<uint64_t>(bytes[i]);
            fnv_state_ *= FNV_PRIME;
        }
        return;
    }

    if (EVP_DigestUpdate(ctx_.get(), data, size) != 1) {
        throw std::runtime_error("EVP_DigestUpdate failed");
    }
}

std::string Hasher::hex_digest() {
    finished_ = true;
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');

    if (algorithm_ == HashAlgorithm::FNV1A) {
        oss << std::setw(16) << fnv_state_;
        return oss.str();
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx_.get(), digest, &length) != 1) {
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    }

    for (unsigned int i = 0; i < length; ++i) {
        oss << std::setw(2) << static_cast<unsigned int>(digest[i]);
    }
    return oss.str();
}

std::string Hasher::hex_digest(HashAlgorithm algorithm, std::string_view data) {
    Hasher hasher(algorithm);
    hasher.update(data);
    return hasher.hex_digest();
}

std::optional<std::string> Hasher::hash_file(HashAlgorithm algorithm, const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }

    Hasher hasher(algorithm);
    char buffer[8192];

    while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
        hasher.update(buffer, static_cast<size_t>(file.gcount()));
    }

    if (file.bad()) {
        return std::nullopt;
    }
    return hasher.hex_digest();
}

} // namespace rustimport
