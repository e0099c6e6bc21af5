#ifndef JARCACHE_CACHE_VALIDATOR_HPP
#define JARCACHE_CACHE_VALIDATOR_HPP

// cache_validator.hpp - Decides whether a development build is still valid
// Part of jarcache - Server Artifact Cache
//
// Validation rules, in order (the first failing rule wins):
//   1. Artifact must exist                      -> ARTIFACT_MISSING
//   2. Signature must have been recorded        -> SIGNATURE_MISSING
//   3. Signature must load                      -> CORRUPT_SIGNATURE
//   4. Artifact hash must match                 -> ARTIFACT_HASH_MISMATCH
//   5. Source revision must match HEAD          -> REVISION_MISMATCH
//   6. Uncommitted changes must match           -> UNTRACKED_CHANGES_MISMATCH
//
// A changed artifact says nothing trustworthy about the sources it came
// from, so rule 4 stops all further diagnosis.

#include "state/build_signature.hpp"
#include "state/change_scanner.hpp"
#include "state/content_hasher.hpp"
#include "vcs/vcs_inspector.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace jarcache {

namespace fs = std::filesystem;

class CacheValidator {
public:
    CacheValidator(const VcsInspector& inspector,
                   const ContentHasher& hasher,
                   const RepoChangeScanner& scanner);

    // Returns silently when the cache is valid, throws CacheInvalidationError
    // otherwise. Other CacheErrors (corrupt signature, broken repository)
    // propagate unchanged.
    void validate(const fs::path& artifact_path,
                  SignatureStore& signatures,
                  const fs::path& repo_root) const;

    // Same, reading the signature file directly (no caching)
    void validate(const fs::path& artifact_path,
                  const fs::path& signature_file,
                  const fs::path& repo_root) const;

    // Signature of the artifact on disk against the live tree
    BuildSignature current_signature(const fs::path& artifact_path,
                                     const fs::path& repo_root) const;

    // Every path whose recorded and live hashes differ, sorted by path
    static std::vector<PathChange> diff_changed_sources(const BuildSignature& expected,
                                                        const BuildSignature& actual);

    // Resolve a revision for display; unknown revisions degrade to the raw id
    RevisionInfo describe_revision(const fs::path& repo_root,
                                   const std::string& revision) const;

private:
    const VcsInspector& inspector_;
    const ContentHasher& hasher_;
    const RepoChangeScanner& scanner_;
};

// Repository path for messages, shortened to "~/..." under $HOME
std::string display_repo_name(const fs::path& repo_root);

} // namespace jarcache

#endif // JARCACHE_CACHE_VALIDATOR_HPP
