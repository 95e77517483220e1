#ifndef RUSTIMPORT_HASHER_HPP
#define RUSTIMPORT_HASHER_HPP

// hasher.hpp - Content hashing for rustimport fingerprints
// Part of rustimport - on-demand native extension builds
//
// Implements the selectable checksum hash:
// - SHA-1 (default), MD5 and SHA-256 through OpenSSL EVP
// - FNV-1a 64-bit in-tree (fast, non-cryptographic)
//
// Digests are always returned as lowercase hex strings.

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace rustimport {

namespace fs = std::filesystem;

enum class HashAlgorithm {
    SHA1,
    MD5,
    SHA256,
    FNV1A
};

const char* hash_algorithm_name(HashAlgorithm algorithm);

// Parses "sha1", "md5", "sha256" or "fnv1a" (case-insensitive).
// Throws std::invalid_argument for anything else.
HashAlgorithm parse_hash_algorithm(std::string_view name);

class Hasher {
public:
    explicit Hasher(HashAlgorithm algorithm);
    ~Hasher();

    Hasher(const Hasher&) = delete;
    Hasher& operator=(const Hasher&) = delete;

    void update(const void* data, size_t size);
    void update(std::string_view data) { update(data.data(), data.size()); }

    // Finish the digest. The hasher cannot be updated afterwards.
    std::string hex_digest();

    HashAlgorithm algorithm() const { return algorithm_; }

    // One-shot helpers
    static std::string hex_digest(HashAlgorithm algorithm, std::string_view data);

    // Hash a file's contents. Returns nullopt if the file cannot be read.
    static std::optional<std::string> hash_file(HashAlgorithm algorithm, const fs::path& path);

private:
    struct EvpDeleter {
        void operator()(EVP_MD_CTX* ctx) const;
    };

    HashAlgorithm algorithm_;
    std::unique_ptr<EVP_MD_CTX, EvpDeleter> ctx_;
    uint64_t fnv_state_;
    bool finished_ = false;
};

} // namespace rustimport

#endif // RUSTIMPORT_HASHER_HPP
