// cache_validator.cpp - Expected vs. actual signature comparison
// Part of jarcache - Server Artifact Cache

#include "state/cache_validator.hpp"

#include <cstdlib>
#include <set>

namespace jarcache {

CacheValidator::CacheValidator(const VcsInspector& inspector,
                               const ContentHasher& hasher,
                               const RepoChangeScanner& scanner)
    : inspector_(inspector)
    , hasher_(hasher)
    , scanner_(scanner) {
}

void CacheValidator::validate(const fs::path& artifact_path,
                              const fs::path& signature_file,
                              const fs::path& repo_root) const {
    SignatureStore store(signature_file);
    validate(artifact_path, store, repo_root);
}

void CacheValidator::validate(const fs::path& artifact_path,
                              SignatureStore& signatures,
                              const fs::path& repo_root) const {
    std::error_code ec;

    // Rule 1: Artifact must exist
    if (!fs::exists(artifact_path, ec)) {
        throw CacheInvalidationError(
            ErrorKind::ARTIFACT_MISSING,
            "Missing compiled artifact for git repo",
            {"Expected location: " + artifact_path.string()});
    }

    // Rule 2: Signature must have been recorded
    if (!signatures.exists()) {
        throw CacheInvalidationError(
            ErrorKind::SIGNATURE_MISSING,
            "Missing development build signature: " + signatures.path().filename().string());
    }

    // Rule 3: Load (cached after the first call)
    const BuildSignature& expected = signatures.load();
    BuildSignature actual = current_signature(artifact_path, repo_root);

    // Rule 4: Artifact hash must match
    if (actual.artifact_hash != expected.artifact_hash) {
        throw CacheInvalidationError(
            ErrorKind::ARTIFACT_HASH_MISMATCH,
            "Compiled artifact changed on disk (hash)",
            {
                "Expected " + expected.artifact_hash,
                "Actually " + actual.artifact_hash
            });
    }

    // Rule 5: Source revision must match
    if (actual.source_revision != expected.source_revision) {
        throw CacheInvalidationError::revision_mismatch(
            display_repo_name(repo_root),
            describe_revision(repo_root, expected.source_revision),
            describe_revision(repo_root, actual.source_revision));
    }

    // Rule 6: Only uncommitted changes are left as a possible input
    if (actual.changed_sources != expected.changed_sources) {
        throw CacheInvalidationError::untracked_changes(
            diff_changed_sources(expected, actual));
    }
}

BuildSignature CacheValidator::current_signature(const fs::path& artifact_path,
                                                 const fs::path& repo_root) const {
    std::string revision = inspector_.head_revision(repo_root).value_or("");
    ChangeSet changes = scanner_.detect_changes(repo_root);
    return capture_signature(hasher_, inspector_, artifact_path, revision, repo_root, changes);
}

std::vector<PathChange> CacheValidator::diff_changed_sources(const BuildSignature& expected,
                                                             const BuildSignature& actual) {
    std::set<std::string> all_paths;
    for (const auto& entry : expected.changed_sources) all_paths.insert(entry.first);
    for (const auto& entry : actual.changed_sources) all_paths.insert(entry.first);

    std::vector<PathChange> changes;
    for (const auto& path : all_paths) {
        auto expected_it = expected.changed_sources.find(path);
        auto actual_it = actual.changed_sources.find(path);

        if (expected_it == expected.changed_sources.end()) {
            changes.push_back({path, ChangeKind::ADDED});
        } else if (actual_it == actual.changed_sources.end()) {
            changes.push_back({path, ChangeKind::REMOVED});
        } else if (expected_it->second != actual_it->second) {
            changes.push_back({path, ChangeKind::MODIFIED});
        }
    }
    return changes;
}

RevisionInfo CacheValidator::describe_revision(const fs::path& repo_root,
                                               const std::string& revision) const {
    if (revision.empty()) {
        return RevisionInfo{"", "<none>", "<no commits>", ""};
    }
    try {
        return inspector_.resolve_revision(repo_root, revision);
    } catch (const CacheError&) {
        // The recorded commit may have been garbage collected or rebased away
        return RevisionInfo{revision, revision, "<unknown message>", ""};
    }
}

std::string display_repo_name(const fs::path& repo_root) {
    const char* home = std::getenv("HOME");
    if (home && *home) {
        std::error_code ec;
        fs::path relative = fs::relative(repo_root, home, ec);
        if (!ec && !relative.empty() && *relative.begin() != "..") {
            return "~/" + relative.generic_string();
        }
    }
    return repo_root.string();
}

} // namespace jarcache
