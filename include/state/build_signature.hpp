#ifndef JARCACHE_BUILD_SIGNATURE_HPP
#define JARCACHE_BUILD_SIGNATURE_HPP

// build_signature.hpp - Provenance fingerprint of a development build
// Part of jarcache - Server Artifact Cache
//
// A signature records what produced an artifact: the artifact's own hash,
// the commit it was built from, and the hash of every path that differed
// from that commit at build time. It is persisted as JSON beside the cache
// (nlohmann/json) and compared against the live tree on every run.

#include "state/change_scanner.hpp"
#include "state/content_hasher.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace jarcache {

namespace fs = std::filesystem;

struct BuildSignature {
    std::string artifact_hash;                           // SHA-256 of the built artifact
    std::string source_revision;                         // Commit id ("" for an unborn repo)
    std::map<std::string, std::string> changed_sources;  // Relative path -> SHA-256

    bool operator==(const BuildSignature& other) const {
        return artifact_hash == other.artifact_hash
            && source_revision == other.source_revision
            && changed_sources == other.changed_sources;
    }

    bool operator!=(const BuildSignature& other) const {
        return !(*this == other);
    }

    nlohmann::json to_json() const;

    // Throws CacheError(CORRUPT_SIGNATURE) on structurally invalid input
    static BuildSignature from_json(const nlohmann::json& data);
};

// Stand-in digests for changed paths that have no content of their own
std::string directory_marker_hash();
std::string deleted_marker_hash();

// Hash the artifact and every changed path (relative to `repo_root`).
// Nested repository roots hash by head commit, plain directories and
// deleted paths by their marker digests.
BuildSignature capture_signature(const ContentHasher& hasher,
                                 const VcsInspector& inspector,
                                 const fs::path& artifact_path,
                                 const std::string& source_revision,
                                 const fs::path& repo_root,
                                 const ChangeSet& changes);

// Write `signature` to `path`, creating parent directories. Returns false on I/O failure.
bool save_signature(const BuildSignature& signature, const fs::path& path);

// Throws CacheError(CORRUPT_SIGNATURE) if unreadable or malformed
BuildSignature load_signature(const fs::path& path);

// Owns the signature side-car for one product version. Loads lazily and
// keeps the value in memory until the next save or invalidate().
class SignatureStore {
public:
    explicit SignatureStore(fs::path path);

    const fs::path& path() const { return path_; }
    bool exists() const;

    // Cached load. Throws CacheInvalidationError(SIGNATURE_MISSING) if the
    // file is absent, CacheError(CORRUPT_SIGNATURE) if it is malformed.
    const BuildSignature& load();

    // Persist and replace the cached value
    bool save(const BuildSignature& signature);

    void invalidate() { cached_.reset(); }
    bool is_loaded() const { return cached_.has_value(); }

private:
    fs::path path_;
    std::optional<BuildSignature> cached_;
};

} // namespace jarcache

#endif // JARCACHE_BUILD_SIGNATURE_HPP
