// change_scanner.cpp - Repository change detection
// Part of jarcache - Server Artifact Cache

#include "state/change_scanner.hpp"

#include <algorithm>
#include <set>

namespace jarcache {

RepoChangeScanner::RepoChangeScanner(const VcsInspector& inspector,
                                     std::vector<std::string> nested_repositories)
    : inspector_(inspector)
    , nested_repositories_(std::move(nested_repositories)) {
}

void RepoChangeScanner::scan(const fs::path& repo_root, const PathVisitor& visit) const {
    scan_repository(repo_root, "", visit);
}

ChangeSet RepoChangeScanner::detect_changes(const fs::path& repo_root) const {
    std::set<std::string> collected;
    auto collect = [&collected](const std::string& path) {
        collected.insert(path);
    };

    scan_repository(repo_root, "", collect);

    for (const auto& nested : nested_repositories_) {
        fs::path nested_path = repo_root / nested;
        std::error_code ec;
        if (!fs::exists(nested_path, ec)) {
            continue;
        }
        if (!inspector_.is_repository(nested_path)) {
            throw CacheError(ErrorKind::INVALID_REPOSITORY,
                             "Nested checkout is not a git repository: " + nested_path.string());
        }
        scan_repository(nested_path, nested + "/", collect);
    }

    return ChangeSet(collected.begin(), collected.end());
}

void RepoChangeScanner::scan_repository(const fs::path& repo,
                                        const std::string& prefix,
                                        const PathVisitor& visit) const {
    StatusMap status = inspector_.status(repo);
    std::set<std::string> submodules;
    bool submodules_loaded = false;

    for (const auto& [path, flag] : status) {
        if (flag == StatusFlag::CURRENT || flag == StatusFlag::IGNORED) {
            continue;
        }

        fs::path target = repo / path;
        std::error_code ec;
        if (!fs::is_directory(fs::symlink_status(target, ec))) {
            visit(prefix + path);
            continue;
        }

        if (!submodules_loaded) {
            submodules = inspector_.list_submodules(repo);
            submodules_loaded = true;
        }

        if (submodules.count(path) > 0) {
            if (!inspector_.is_repository(target)) {
                throw CacheError(ErrorKind::INVALID_REPOSITORY,
                                 "Submodule is no longer a repository: " + target.string());
            }
            // The submodule's pointed-to commit may differ even if no file does
            visit(prefix + path);
            scan_repository(target, prefix + path + "/", visit);
            continue;
        }

        // An independent checkout is one entry, hashed by its head revision
        if (is_embedded_repository(target)) {
            visit(prefix + path);
            continue;
        }

        // The directory itself carries no metadata; only its members count
        size_t emitted = walk_untracked_directory(repo, path, prefix, visit);
        if (emitted == 0) {
            throw CacheError(ErrorKind::SCAN_INCONSISTENCY,
                             "Unable to find git's claimed modification (flag="
                                 + std::string(status_flag_to_string(flag)) + "): "
                                 + target.string());
        }
    }
}

bool RepoChangeScanner::is_embedded_repository(const fs::path& dir) const {
    std::error_code ec;
    return fs::exists(dir / ".git", ec) && inspector_.is_repository(dir);
}

size_t RepoChangeScanner::walk_untracked_directory(const fs::path& repo,
                                                   const std::string& relative_dir,
                                                   const std::string& prefix,
                                                   const PathVisitor& visit) const {
    std::vector<std::string> entries;
    std::set<std::string> directories;
    for (const auto& entry : fs::directory_iterator(repo / relative_dir)) {
        std::string name = entry.path().filename().string();
        if (name == ".git") {
            continue;
        }
        std::string relative = relative_dir + "/" + name;
        std::error_code ec;
        if (entry.is_directory(ec) && !entry.is_symlink(ec)) {
            directories.insert(relative);
        }
        entries.push_back(std::move(relative));
    }
    std::sort(entries.begin(), entries.end());

    // One ignore query per directory level; ignored directories are pruned
    std::set<std::string> ignored = inspector_.ignored_paths(repo, entries);

    size_t emitted = 0;
    for (const auto& relative : entries) {
        if (ignored.count(relative) > 0) {
            continue;
        }
        if (directories.count(relative) == 0 || is_embedded_repository(repo / relative)) {
            visit(prefix + relative);
            ++emitted;
            continue;
        }

        // A subdirectory is reported only if something visible lives in it
        std::vector<std::string> nested;
        walk_untracked_directory(repo, relative, prefix,
                                 [&nested](const std::string& path) {
                                     nested.push_back(path);
                                 });
        if (nested.empty()) {
            continue;
        }
        visit(prefix + relative);
        ++emitted;
        for (const auto& path : nested) {
            visit(path);
            ++emitted;
        }
    }

    return emitted;
}

} // namespace jarcache
