/**
 * git_inspector.cpp
 * VcsInspector implementation driving the git CLI
 */

#include "vcs/vcs_inspector.hpp"
#include "core/process_runner.hpp"

#include <algorithm>
#include <sstream>

namespace jarcache {

namespace {

// check-ignore takes paths on the command line; keep argv bounded
constexpr size_t CHECK_IGNORE_BATCH = 256;

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\n\r");
    return s.substr(start, end - start + 1);
}

std::vector<std::string> split_nul(const std::string& s) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (start < s.size()) {
        size_t end = s.find('\0', start);
        if (end == std::string::npos) end = s.size();
        parts.push_back(s.substr(start, end - start));
        start = end + 1;
    }
    return parts;
}

// Undo git's C-style quoting of unusual path names ("a\tb", "\303\251")
std::string unquote_path(const std::string& s) {
    if (s.size() < 2 || s.front() != '"' || s.back() != '"') {
        return s;
    }
    std::string out;
    for (size_t i = 1; i + 1 < s.size(); ++i) {
        char c = s[i];
        if (c != '\\' || i + 2 >= s.size()) {
            out += c;
            continue;
        }
        char next = s[++i];
        switch (next) {
            case 'a': out += '\a'; break;
            case 'b': out += '\b'; break;
            case 'f': out += '\f'; break;
            case 'n': out += '\n'; break;
            case 'r': out += '\r'; break;
            case 't': out += '\t'; break;
            case 'v': out += '\v'; break;
            default:
                if (next >= '0' && next <= '7' && i + 2 < s.size() - 1) {
                    int value = (next - '0') * 64 + (s[i + 1] - '0') * 8 + (s[i + 2] - '0');
                    out += static_cast<char>(value);
                    i += 2;
                } else {
                    out += next;
                }
                break;
        }
    }
    return out;
}

StatusFlag classify_status(char x, char y) {
    if (x == '?' && y == '?') return StatusFlag::UNTRACKED;
    if (x == '!' && y == '!') return StatusFlag::IGNORED;
    if (x == 'U' || y == 'U' || (x == 'A' && y == 'A') || (x == 'D' && y == 'D')) {
        return StatusFlag::CONFLICTED;
    }
    if (x == 'D' || y == 'D') return StatusFlag::DELETED;
    if (x == 'R' || x == 'C') return StatusFlag::RENAMED;
    if (x == 'A') return StatusFlag::ADDED;
    if (x == ' ' && y == ' ') return StatusFlag::CURRENT;
    return StatusFlag::MODIFIED;
}

} // namespace

GitInspector::GitInspector(std::string git_executable, bool verbose)
    : git_(std::move(git_executable))
    , verbose_(verbose) {
}

bool GitInspector::is_repository(const fs::path& path) const {
    std::error_code ec;
    if (!fs::is_directory(path, ec)) {
        return false;
    }

    ProcessRunner::Options options;
    options.echo_command = verbose_;
    auto result = ProcessRunner::run(
        {git_, "-C", path.string(), "rev-parse", "--show-toplevel"}, options);
    if (!result.success()) {
        return false;
    }

    // A plain subdirectory of a checkout reports its enclosing toplevel
    fs::path toplevel = fs::weakly_canonical(trim(result.stdout_output), ec);
    if (ec) return false;
    fs::path requested = fs::weakly_canonical(path, ec);
    if (ec) return false;
    return toplevel == requested;
}

void GitInspector::require_repository(const fs::path& repo) const {
    if (!is_repository(repo)) {
        throw CacheError(ErrorKind::INVALID_REPOSITORY,
                         "Not a git repository: " + repo.string());
    }
}

std::optional<std::string> GitInspector::head_revision(const fs::path& repo) const {
    require_repository(repo);

    ProcessRunner::Options options;
    options.echo_command = verbose_;
    auto result = ProcessRunner::run(
        {git_, "-C", repo.string(), "rev-parse", "--verify", "-q", "HEAD^{commit}"},
        options);
    if (!result.success()) {
        // Unborn branch: the repository has no commits yet
        return std::nullopt;
    }
    return trim(result.stdout_output);
}

StatusMap GitInspector::status(const fs::path& repo) const {
    ProcessRunner::Options options;
    options.echo_command = verbose_;
    auto result = ProcessRunner::run(
        {git_, "-C", repo.string(), "status", "--porcelain=v1", "-z",
         "--untracked-files=normal", "--ignore-submodules=none"},
        options);
    if (!result.success()) {
        throw CacheError(ErrorKind::VCS_ERROR,
                         "git status failed for " + repo.string(),
                         {trim(result.stderr_output)});
    }

    StatusMap entries;
    std::vector<std::string> records = split_nul(result.stdout_output);
    for (size_t i = 0; i < records.size(); ++i) {
        const std::string& record = records[i];
        if (record.size() < 4) {
            continue;
        }
        char x = record[0];
        char y = record[1];
        std::string path = record.substr(3);
        // Untracked directories are reported with a trailing slash
        while (path.size() > 1 && path.back() == '/') {
            path.pop_back();
        }
        entries[path] = classify_status(x, y);

        // Renames and copies are followed by their source path
        if (x == 'R' || x == 'C') {
            ++i;
        }
    }
    return entries;
}

std::set<std::string> GitInspector::list_submodules(const fs::path& repo) const {
    std::set<std::string> submodules;
    std::error_code ec;
    if (!fs::exists(repo / ".gitmodules", ec)) {
        return submodules;
    }

    ProcessRunner::Options options;
    options.echo_command = verbose_;
    auto result = ProcessRunner::run(
        {git_, "-C", repo.string(), "config", "--file", ".gitmodules",
         "--get-regexp", R"(^submodule\..*\.path$)"},
        options);
    if (result.exit_code == 1) {
        return submodules;  // No submodule entries
    }
    if (!result.success()) {
        throw CacheError(ErrorKind::VCS_ERROR,
                         "Unable to read .gitmodules in " + repo.string(),
                         {trim(result.stderr_output)});
    }

    std::istringstream lines(result.stdout_output);
    std::string line;
    while (std::getline(lines, line)) {
        size_t space = line.find(' ');
        if (space == std::string::npos) continue;
        std::string path = trim(line.substr(space + 1));
        if (!path.empty()) {
            submodules.insert(path);
        }
    }
    return submodules;
}

std::set<std::string> GitInspector::ignored_paths(
    const fs::path& repo,
    const std::vector<std::string>& candidates) const {

    std::set<std::string> ignored;
    for (size_t offset = 0; offset < candidates.size(); offset += CHECK_IGNORE_BATCH) {
        size_t end = std::min(candidates.size(), offset + CHECK_IGNORE_BATCH);

        // -z is only accepted together with --stdin; read one path per line
        std::vector<std::string> args = {
            git_, "-C", repo.string(), "-c", "core.quotePath=false", "check-ignore", "--"
        };
        args.insert(args.end(), candidates.begin() + offset, candidates.begin() + end);

        ProcessRunner::Options options;
        options.echo_command = verbose_;
        auto result = ProcessRunner::run(args, options);

        // 0 = some ignored, 1 = none ignored, anything else is an error
        if (result.exit_code != 0 && result.exit_code != 1) {
            throw CacheError(ErrorKind::VCS_ERROR,
                             "git check-ignore failed for " + repo.string(),
                             {trim(result.stderr_output)});
        }
        std::istringstream lines(result.stdout_output);
        std::string line;
        while (std::getline(lines, line)) {
            if (!line.empty()) {
                ignored.insert(unquote_path(line));
            }
        }
    }
    return ignored;
}

RevisionInfo GitInspector::resolve_revision(const fs::path& repo,
                                            const std::string& expression) const {
    ProcessRunner::Options options;
    options.echo_command = verbose_;
    auto result = ProcessRunner::run(
        {git_, "-C", repo.string(), "show", "-s", "--format=%H%x00%h%x00%B",
         expression + "^{commit}", "--"},
        options);
    if (!result.success()) {
        throw CacheError(ErrorKind::VCS_ERROR,
                         "Unable to resolve revision '" + expression + "'",
                         {trim(result.stderr_output)});
    }

    std::vector<std::string> fields = split_nul(result.stdout_output);
    if (fields.size() < 3) {
        throw CacheError(ErrorKind::VCS_ERROR,
                         "Unexpected git show output for '" + expression + "'");
    }

    RevisionInfo info;
    info.id = trim(fields[0]);
    info.short_id = trim(fields[1]);
    info.full_message = trim(fields[2]);
    if (info.full_message.empty()) {
        throw CacheError(ErrorKind::VCS_ERROR,
                         "Invalid message for " + info.short_id);
    }
    info.summary = info.full_message.substr(0, info.full_message.find('\n'));
    return info;
}

} // namespace jarcache
