#ifndef JARCACHE_CHANGE_SCANNER_HPP
#define JARCACHE_CHANGE_SCANNER_HPP

// change_scanner.hpp - Expands repository status into concrete changed paths
// Part of jarcache - Server Artifact Cache
//
// The scanner turns the inspector's (path -> flag) status report into the
// list of filesystem paths that differ from a clean checkout:
// - plain changed files are reported as-is
// - a dirty submodule reports itself plus its own changes, recursively
// - an untracked directory reports every non-ignored file and subdirectory
//   inside it, never descending into ignored directories
// - an untracked directory that is itself a repository root reports only
//   itself
//
// Paths are relative to the scanned root and use '/' separators.

#include "vcs/vcs_inspector.hpp"

#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace jarcache {

namespace fs = std::filesystem;

// Sorted, de-duplicated relative paths
using ChangeSet = std::vector<std::string>;

using PathVisitor = std::function<void(const std::string&)>;

class RepoChangeScanner {
public:
    explicit RepoChangeScanner(const VcsInspector& inspector,
                               std::vector<std::string> nested_repositories = {});

    // Visit every changed path of `repo_root` (order unspecified).
    // Throws CacheError(INVALID_REPOSITORY) for a broken submodule and
    // CacheError(SCAN_INCONSISTENCY) when a reported directory has no
    // visible members.
    void scan(const fs::path& repo_root, const PathVisitor& visit) const;

    // scan() plus the configured nested repositories, collected and sorted
    ChangeSet detect_changes(const fs::path& repo_root) const;

private:
    const VcsInspector& inspector_;

    // Independent checkouts inside the root (usually ignored by it) that
    // still feed the build, e.g. generated server/API trees
    std::vector<std::string> nested_repositories_;

    void scan_repository(const fs::path& repo,
                         const std::string& prefix,
                         const PathVisitor& visit) const;

    // Root of a checkout that lives inside the scanned tree
    bool is_embedded_repository(const fs::path& dir) const;

    // Returns the number of entries emitted (files plus non-empty subdirectories)
    size_t walk_untracked_directory(const fs::path& repo,
                                    const std::string& relative_dir,
                                    const std::string& prefix,
                                    const PathVisitor& visit) const;
};

} // namespace jarcache

#endif // JARCACHE_CHANGE_SCANNER_HPP
