#ifndef JARCACHE_CONTENT_HASHER_HPP
#define JARCACHE_CONTENT_HASHER_HPP

// content_hasher.hpp - SHA-256 content digests for artifacts and sources
// Part of jarcache - Server Artifact Cache
//
// Files are streamed through SHA-256 (OpenSSL EVP) in fixed-size chunks.
// Directories are only hashable in REPOSITORY mode, where the digest stands
// for the checkout's head commit instead of its contents.

#include "vcs/vcs_inspector.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace jarcache {

namespace fs = std::filesystem;

enum class HashMode {
    PLAIN_FILE,   // Regular file contents; directories are rejected
    REPOSITORY    // Directories are hashed by their head revision id
};

class ContentHasher {
public:
    static constexpr size_t CHUNK_SIZE = 8192;

    // Digest used for repositories with no commits yet
    static constexpr const char* EMPTY_REPOSITORY_SENTINEL = "NONE";

    explicit ContentHasher(const VcsInspector& inspector)
        : inspector_(inspector) {}

    // Hex SHA-256 of `path`.
    // Throws CacheError(NOT_HASHABLE) for directories in PLAIN_FILE mode or
    // unreadable files, CacheError(INVALID_REPOSITORY) for a directory that
    // isn't a repository root in REPOSITORY mode.
    std::string hash(const fs::path& path, HashMode mode = HashMode::PLAIN_FILE) const;

    // Hex SHA-256 of an in-memory buffer
    static std::string hash_bytes(std::string_view data);

private:
    const VcsInspector& inspector_;

    std::string hash_file(const fs::path& path) const;
    std::string hash_repository_head(const fs::path& repo) const;
};

// Decode a hex string into raw bytes (revision ids are hashed raw)
std::string hex_to_bytes(std::string_view hex);

} // namespace jarcache

#endif // JARCACHE_CONTENT_HASHER_HPP
