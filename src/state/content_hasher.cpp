// content_hasher.cpp - SHA-256 hashing via OpenSSL EVP
// Part of jarcache - Server Artifact Cache

#include "state/content_hasher.hpp"

#include <openssl/evp.h>

#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>

namespace jarcache {

namespace {

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

// Incremental SHA-256 over an EVP context
class Sha256 {
public:
    Sha256() : ctx_(EVP_MD_CTX_new()) {
        if (!ctx_ || EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
            throw std::runtime_error("Failed to initialise SHA-256 context");
        }
    }

    void update(const void* data, size_t size) {
        if (EVP_DigestUpdate(ctx_.get(), data, size) != 1) {
            throw std::runtime_error("SHA-256 update failed");
        }
    }

    std::string hex_digest() {
        unsigned char digest[EVP_MAX_MD_SIZE];
        unsigned int length = 0;
        if (EVP_DigestFinal_ex(ctx_.get(), digest, &length) != 1) {
            throw std::runtime_error("SHA-256 finalisation failed");
        }

        std::ostringstream oss;
        oss << std::hex << std::setfill('0');
        for (unsigned int i = 0; i < length; ++i) {
            oss << std::setw(2) << static_cast<int>(digest[i]);
        }
        return oss.str();
    }

private:
    MdCtxPtr ctx_;
};

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::string hex_to_bytes(std::string_view hex) {
    if (hex.size() % 2 != 0) {
        throw std::invalid_argument("Odd-length hex string");
    }
    std::string bytes;
    bytes.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        int hi = hex_value(hex[i]);
        int lo = hex_value(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            throw std::invalid_argument("Invalid hex digit in '" + std::string(hex) + "'");
        }
        bytes.push_back(static_cast<char>((hi << 4) | lo));
    }
    return bytes;
}

std::string ContentHasher::hash_bytes(std::string_view data) {
    Sha256 sha;
    sha.update(data.data(), data.size());
    return sha.hex_digest();
}

std::string ContentHasher::hash(const fs::path& path, HashMode mode) const {
    std::error_code ec;
    if (fs::is_directory(path, ec)) {
        if (mode != HashMode::REPOSITORY) {
            throw CacheError(ErrorKind::NOT_HASHABLE,
                             "Cannot hash a directory: " + path.string());
        }
        return hash_repository_head(path);
    }
    return hash_file(path);
}

std::string ContentHasher::hash_file(const fs::path& path) const {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw CacheError(ErrorKind::NOT_HASHABLE,
                         "Unable to open for hashing: " + path.string());
    }

    Sha256 sha;
    char buffer[CHUNK_SIZE];
    while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
        sha.update(buffer, static_cast<size_t>(file.gcount()));
    }
    if (file.bad()) {
        throw CacheError(ErrorKind::NOT_HASHABLE,
                         "Read error while hashing: " + path.string());
    }
    return sha.hex_digest();
}

std::string ContentHasher::hash_repository_head(const fs::path& repo) const {
    if (!inspector_.is_repository(repo)) {
        throw CacheError(ErrorKind::INVALID_REPOSITORY,
                         "Unable to hash as git repo: " + repo.string());
    }

    Sha256 sha;
    auto head = inspector_.head_revision(repo);
    if (head) {
        std::string raw = hex_to_bytes(*head);
        sha.update(raw.data(), raw.size());
    } else {
        std::string_view sentinel(EMPTY_REPOSITORY_SENTINEL);
        sha.update(sentinel.data(), sentinel.size());
    }
    return sha.hex_digest();
}

} // namespace jarcache
