// cache_errors.cpp - Structured invalidation diagnostics
// Part of jarcache - Server Artifact Cache

#include "state/cache_errors.hpp"

#include <iomanip>
#include <sstream>

namespace jarcache {

CacheInvalidationError CacheInvalidationError::revision_mismatch(
    const std::string& repo_name,
    const RevisionInfo& expected,
    const RevisionInfo& actual) {

    CacheInvalidationError error(
        ErrorKind::REVISION_MISMATCH,
        "Mismatched commits for " + repo_name,
        {
            "Expected commit " + expected.short_id + ": " + expected.summary,
            "Actual commit " + actual.short_id + ": " + actual.summary
        });
    error.expected_ = expected;
    error.actual_ = actual;
    return error;
}

CacheInvalidationError CacheInvalidationError::untracked_changes(
    std::vector<PathChange> changes) {

    std::vector<std::string> lines;
    lines.reserve(changes.size());
    for (const auto& change : changes) {
        std::ostringstream line;
        line << std::left << std::setw(10)
             << (std::string(change_kind_to_string(change.kind)) + ":")
             << " " << change.path;
        lines.push_back(line.str());
    }

    CacheInvalidationError error(
        ErrorKind::UNTRACKED_CHANGES_MISMATCH,
        "Detected " + std::to_string(changes.size()) + " changes to uncommitted files",
        std::move(lines));
    error.changes_ = std::move(changes);
    return error;
}

} // namespace jarcache
