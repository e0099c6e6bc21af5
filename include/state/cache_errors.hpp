#ifndef JARCACHE_CACHE_ERRORS_HPP
#define JARCACHE_CACHE_ERRORS_HPP

// cache_errors.hpp - Error taxonomy for signature and cache handling
// Part of jarcache - Server Artifact Cache
//
// Every failure raised by the engine is a CacheError carrying a kind,
// a one-line summary (what()) and the detail lines needed to print a
// full diagnostic. Cache invalidations are a recoverable subclass: the
// resolver catches them and decides to rebuild or redownload.

#include <stdexcept>
#include <string>
#include <vector>
#include <optional>

namespace jarcache {

enum class ErrorKind {
    NOT_HASHABLE,                // Directory (or unreadable path) passed to a plain hash
    INVALID_REPOSITORY,          // Path is not the root of a repository
    CORRUPT_SIGNATURE,           // Signature file is structurally invalid
    SCAN_INCONSISTENCY,          // Inspector claimed a change the scanner can't find
    VCS_ERROR,                   // Inspector command failed
    ARTIFACT_MISSING,            // Resolved artifact doesn't exist
    SIGNATURE_MISSING,           // Cache was never recorded
    ARTIFACT_HASH_MISMATCH,      // Artifact bytes changed since recorded
    REVISION_MISMATCH,           // Built from a different commit than HEAD
    UNTRACKED_CHANGES_MISMATCH,  // Uncommitted changes differ from the recorded ones
    CATALOG_ERROR,               // Catalog unreachable or returned nothing usable
    CATALOG_INCONSISTENCY,       // Catalog state contradicts the local build
    DOWNLOAD_CORRUPT,            // Downloaded bytes don't match the catalog hash
    BUILD_FAILED,                // Build tool exited non-zero
    ARTIFACT_NOT_PRODUCED,       // Build tool succeeded but output is missing
    REVALIDATION_FAILED,         // Freshly produced artifact still fails validation
    INVALID_VERSION,             // Unparsable product version
    DOWNLOAD_FAILED,             // Transfer from a plain URL failed
    MALFORMED_PLUGIN_CONFIG,     // Plugin list can't be parsed or is incomplete
    PLUGIN_ERROR,                // Plugin jar missing, unknown or not writable
    MANUAL_PLUGIN_MISSING        // Jar that must be fetched by hand isn't there
};

inline const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NOT_HASHABLE:               return "not_hashable";
        case ErrorKind::INVALID_REPOSITORY:         return "invalid_repository";
        case ErrorKind::CORRUPT_SIGNATURE:          return "corrupt_signature";
        case ErrorKind::SCAN_INCONSISTENCY:         return "scan_inconsistency";
        case ErrorKind::VCS_ERROR:                  return "vcs_error";
        case ErrorKind::ARTIFACT_MISSING:           return "artifact_missing";
        case ErrorKind::SIGNATURE_MISSING:          return "signature_missing";
        case ErrorKind::ARTIFACT_HASH_MISMATCH:     return "artifact_hash_mismatch";
        case ErrorKind::REVISION_MISMATCH:          return "revision_mismatch";
        case ErrorKind::UNTRACKED_CHANGES_MISMATCH: return "untracked_changes_mismatch";
        case ErrorKind::CATALOG_ERROR:              return "catalog_error";
        case ErrorKind::CATALOG_INCONSISTENCY:      return "catalog_inconsistency";
        case ErrorKind::DOWNLOAD_CORRUPT:           return "download_corrupt";
        case ErrorKind::BUILD_FAILED:               return "build_failed";
        case ErrorKind::ARTIFACT_NOT_PRODUCED:      return "artifact_not_produced";
        case ErrorKind::REVALIDATION_FAILED:        return "revalidation_failed";
        case ErrorKind::INVALID_VERSION:            return "invalid_version";
        case ErrorKind::DOWNLOAD_FAILED:            return "download_failed";
        case ErrorKind::MALFORMED_PLUGIN_CONFIG:    return "malformed_plugin_config";
        case ErrorKind::PLUGIN_ERROR:               return "plugin_error";
        case ErrorKind::MANUAL_PLUGIN_MISSING:      return "manual_plugin_missing";
        default:                                    return "unknown";
    }
}

// Kinds that must abort the run instead of triggering a retry
inline bool is_fatal_kind(ErrorKind kind) {
    return kind == ErrorKind::CATALOG_INCONSISTENCY
        || kind == ErrorKind::DOWNLOAD_CORRUPT
        || kind == ErrorKind::REVALIDATION_FAILED
        || kind == ErrorKind::SCAN_INCONSISTENCY;
}

class CacheError : public std::runtime_error {
public:
    CacheError(ErrorKind kind, const std::string& summary,
               std::vector<std::string> details = {})
        : std::runtime_error(summary)
        , kind_(kind)
        , details_(std::move(details)) {}

    ErrorKind kind() const { return kind_; }
    const std::vector<std::string>& details() const { return details_; }
    bool is_fatal() const { return is_fatal_kind(kind_); }

private:
    ErrorKind kind_;
    std::vector<std::string> details_;
};

// =============================================================================
// Cache Invalidation
// =============================================================================

enum class ChangeKind {
    ADDED,     // Only present in the live tree
    REMOVED,   // Only present in the recorded signature
    MODIFIED   // Present in both with a different hash
};

inline const char* change_kind_to_string(ChangeKind kind) {
    switch (kind) {
        case ChangeKind::ADDED:    return "Added";
        case ChangeKind::REMOVED:  return "Removed";
        case ChangeKind::MODIFIED: return "Modified";
        default:                   return "Unknown";
    }
}

struct PathChange {
    std::string path;
    ChangeKind kind;

    bool operator==(const PathChange& other) const {
        return path == other.path && kind == other.kind;
    }
};

// A revision resolved for display (falls back to the raw id when unknown)
struct RevisionInfo {
    std::string id;
    std::string short_id;
    std::string summary;
    std::string full_message;
};

class CacheInvalidationError : public CacheError {
public:
    CacheInvalidationError(ErrorKind kind, const std::string& summary,
                           std::vector<std::string> details = {})
        : CacheError(kind, summary, std::move(details)) {}

    static CacheInvalidationError revision_mismatch(
        const std::string& repo_name,
        const RevisionInfo& expected,
        const RevisionInfo& actual);

    static CacheInvalidationError untracked_changes(
        std::vector<PathChange> changes);

    const std::vector<PathChange>& changes() const { return changes_; }
    const std::optional<RevisionInfo>& expected_revision() const { return expected_; }
    const std::optional<RevisionInfo>& actual_revision() const { return actual_; }

private:
    std::vector<PathChange> changes_;
    std::optional<RevisionInfo> expected_;
    std::optional<RevisionInfo> actual_;
};

} // namespace jarcache

#endif // JARCACHE_CACHE_ERRORS_HPP
