// test_support.hpp - Shared macros and fixtures for the jarcache test suites
// Part of jarcache - Server Artifact Cache

#ifndef JARCACHE_TEST_SUPPORT_HPP
#define JARCACHE_TEST_SUPPORT_HPP

#include "core/process_runner.hpp"
#include "state/cache_errors.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <unistd.h>

namespace fs = std::filesystem;

// Test counters
static int tests_run = 0;
static int tests_passed = 0;

#define TEST(name) \
    do { \
        tests_run++; \
        std::cout << "  Testing: " << #name << "... "; \
        try { \
            test_##name(); \
            tests_passed++; \
            std::cout << "PASS\n"; \
        } catch (const std::exception& e) { \
            std::cout << "FAIL: " << e.what() << "\n"; \
        } \
    } while(0)

#define ASSERT(cond) \
    if (!(cond)) { \
        throw std::runtime_error("Assertion failed: " #cond); \
    }

#define ASSERT_EQ(a, b) \
    if ((a) != (b)) { \
        throw std::runtime_error("Assertion failed: " #a " == " #b); \
    }

// Runs `statement` and requires a CacheError (or subclass) of `expected_kind`
#define ASSERT_THROWS_KIND(statement, expected_kind) \
    do { \
        bool thrown_ = false; \
        try { \
            statement; \
        } catch (const jarcache::CacheError& e_) { \
            thrown_ = true; \
            if (e_.kind() != (expected_kind)) { \
                throw std::runtime_error(std::string("Wrong error kind: ") \
                    + jarcache::error_kind_to_string(e_.kind())); \
            } \
        } \
        if (!thrown_) { \
            throw std::runtime_error("Expected exception from: " #statement); \
        } \
    } while(0)

inline int report_results() {
    std::cout << "\n=== Results ===\n";
    std::cout << "Passed: " << tests_passed << "/" << tests_run << "\n";
    return tests_passed == tests_run ? 0 : 1;
}

// =============================================================================
// Test Fixtures
// =============================================================================

class TestFixture {
public:
    fs::path test_dir;

    explicit TestFixture(const std::string& suite) {
        test_dir = fs::temp_directory_path()
            / ("jarcache_" + suite + "_" + std::to_string(::getpid()));
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
    }

    ~TestFixture() {
        std::error_code ec;
        fs::remove_all(test_dir, ec);
    }

    // Fresh, empty subdirectory for one test case
    fs::path scratch(const std::string& name) const {
        fs::path dir = test_dir / name;
        fs::remove_all(dir);
        fs::create_directories(dir);
        return dir;
    }
};

inline void write_file(const fs::path& path, const std::string& content) {
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path());
    }
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
    if (!out) {
        throw std::runtime_error("Unable to write " + path.string());
    }
}

// =============================================================================
// Git Helpers
// =============================================================================

// Run git in `repo` with a fixed identity; throws on non-zero exit
inline std::string git(const fs::path& repo, const std::vector<std::string>& args) {
    std::vector<std::string> command = {
        "git",
        "-c", "user.name=jarcache tests",
        "-c", "user.email=tests@jarcache.invalid",
        "-c", "commit.gpgsign=false",
        "-c", "init.defaultBranch=main",
        "-c", "protocol.file.allow=always"
    };
    command.insert(command.end(), args.begin(), args.end());

    jarcache::ProcessRunner::Options options;
    options.cwd = repo;
    auto result = jarcache::ProcessRunner::run(command, options);
    if (!result.success()) {
        throw std::runtime_error(jarcache::ProcessRunner::format_command(command)
                                 + " failed: " + result.stderr_output);
    }

    std::string output = result.stdout_output;
    while (!output.empty() && (output.back() == '\n' || output.back() == '\r')) {
        output.pop_back();
    }
    return output;
}

inline void init_repo(const fs::path& repo) {
    fs::create_directories(repo);
    git(repo, {"init", "-q"});
}

inline void commit_all(const fs::path& repo, const std::string& message) {
    git(repo, {"add", "-A"});
    git(repo, {"commit", "-q", "--allow-empty", "-m", message});
}

inline std::string head_of(const fs::path& repo) {
    return git(repo, {"rev-parse", "HEAD"});
}

#endif // JARCACHE_TEST_SUPPORT_HPP
