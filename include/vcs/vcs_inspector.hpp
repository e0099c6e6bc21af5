/**
 * vcs_inspector.hpp
 * Version-control queries used by the change scanner and cache validator
 *
 * VcsInspector is the seam between the cache engine and the version-control
 * system. GitInspector implements it on top of the `git` command line, run
 * through ProcessRunner, so no git library is linked.
 *
 * All paths returned by status(), list_submodules() and ignored_paths() are
 * relative to the repository root, with '/' separators.
 */

#ifndef JARCACHE_VCS_INSPECTOR_HPP
#define JARCACHE_VCS_INSPECTOR_HPP

#include "state/cache_errors.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace jarcache {

namespace fs = std::filesystem;

enum class StatusFlag {
    CURRENT,      // Matches HEAD
    MODIFIED,     // Changed in worktree or index
    ADDED,        // New in index
    DELETED,      // Removed from worktree or index
    RENAMED,      // Renamed or copied in index
    CONFLICTED,   // Unmerged
    UNTRACKED,    // Not known to the repository
    IGNORED       // Matched by ignore rules
};

inline const char* status_flag_to_string(StatusFlag flag) {
    switch (flag) {
        case StatusFlag::CURRENT:    return "current";
        case StatusFlag::MODIFIED:   return "modified";
        case StatusFlag::ADDED:      return "added";
        case StatusFlag::DELETED:    return "deleted";
        case StatusFlag::RENAMED:    return "renamed";
        case StatusFlag::CONFLICTED: return "conflicted";
        case StatusFlag::UNTRACKED:  return "untracked";
        case StatusFlag::IGNORED:    return "ignored";
        default:                     return "unknown";
    }
}

using StatusMap = std::map<std::string, StatusFlag>;

class VcsInspector {
public:
    virtual ~VcsInspector() = default;

    // True if `path` is the top-level directory of a repository
    virtual bool is_repository(const fs::path& path) const = 0;

    // Current head commit id, or nullopt for a repository with no commits.
    // Throws CacheError(INVALID_REPOSITORY) if `repo` isn't a repository.
    virtual std::optional<std::string> head_revision(const fs::path& repo) const = 0;

    virtual StatusMap status(const fs::path& repo) const = 0;

    virtual std::set<std::string> list_submodules(const fs::path& repo) const = 0;

    // Subset of `candidates` matched by the repository's ignore rules
    virtual std::set<std::string> ignored_paths(
        const fs::path& repo,
        const std::vector<std::string>& candidates) const = 0;

    // Throws CacheError(VCS_ERROR) if `expression` doesn't name a commit
    virtual RevisionInfo resolve_revision(const fs::path& repo,
                                          const std::string& expression) const = 0;
};

class GitInspector : public VcsInspector {
public:
    explicit GitInspector(std::string git_executable = "git", bool verbose = false);

    bool is_repository(const fs::path& path) const override;
    std::optional<std::string> head_revision(const fs::path& repo) const override;
    StatusMap status(const fs::path& repo) const override;
    std::set<std::string> list_submodules(const fs::path& repo) const override;
    std::set<std::string> ignored_paths(
        const fs::path& repo,
        const std::vector<std::string>& candidates) const override;
    RevisionInfo resolve_revision(const fs::path& repo,
                                  const std::string& expression) const override;

private:
    std::string git_;
    bool verbose_;

    void require_repository(const fs::path& repo) const;
};

} // namespace jarcache

#endif // JARCACHE_VCS_INSPECTOR_HPP
