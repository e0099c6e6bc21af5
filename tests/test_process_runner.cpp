// test_process_runner.cpp - Tests for ProcessRunner and BuildTool
// Part of jarcache - Server Artifact Cache

#include "core/build_tool.hpp"
#include "core/process_runner.hpp"

#include "test_support.hpp"

#include <memory>
#include <stdexcept>

using namespace jarcache;

static std::unique_ptr<TestFixture> fixture;

// =============================================================================
// ProcessRunner Tests
// =============================================================================

void test_captures_stdout_and_stderr() {
    auto result = ProcessRunner::run({"sh", "-c", "echo out; echo err 1>&2"});
    ASSERT(result.success());
    ASSERT_EQ(result.stdout_output, "out\n");
    ASSERT_EQ(result.stderr_output, "err\n");
}

void test_reports_exit_code() {
    auto result = ProcessRunner::run({"sh", "-c", "exit 7"});
    ASSERT(!result.success());
    ASSERT_EQ(result.exit_code, 7);
}

void test_runs_in_working_directory() {
    fs::path dir = fixture->scratch("cwd");
    write_file(dir / "marker.txt", "here");

    ProcessRunner::Options options;
    options.cwd = dir;
    auto result = ProcessRunner::run({"cat", "marker.txt"}, options);
    ASSERT(result.success());
    ASSERT_EQ(result.stdout_output, "here");
}

void test_large_output_is_drained() {
    // More than a pipe buffer on both streams at once
    auto result = ProcessRunner::run(
        {"sh", "-c", "head -c 200000 /dev/zero | tr '\\0' a; head -c 200000 /dev/zero | tr '\\0' b 1>&2"});
    ASSERT(result.success());
    ASSERT_EQ(result.stdout_output.size(), 200000u);
    ASSERT_EQ(result.stderr_output.size(), 200000u);
}

void test_missing_executable_is_an_exit_code() {
    auto result = ProcessRunner::run({"jarcache-no-such-tool-xyz"});
    ASSERT(!result.success());
}

void test_format_command() {
    ASSERT_EQ(ProcessRunner::format_command({"mvn", "clean", "package"}), "mvn clean package");
}

// =============================================================================
// BuildTool Tests
// =============================================================================

void test_build_tool_runs_in_repository() {
    fs::path dir = fixture->scratch("build");
    BuildTool tool({"sh", "-c", "echo built > result.txt"});

    auto result = tool.run(dir);
    ASSERT(result.success());
    ASSERT(fs::exists(dir / "result.txt"));
    ASSERT_EQ(tool.describe(), "sh -c \"echo built > result.txt\"");
}

void test_build_tool_rejects_empty_command() {
    bool thrown = false;
    try {
        BuildTool tool(std::vector<std::string>{});
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    ASSERT(thrown);
}

int main() {
    std::cout << "=== ProcessRunner Test Suite ===\n\n";

    fixture = std::make_unique<TestFixture>("process");

    std::cout << "ProcessRunner Tests:\n";
    TEST(captures_stdout_and_stderr);
    TEST(reports_exit_code);
    TEST(runs_in_working_directory);
    TEST(large_output_is_drained);
    TEST(missing_executable_is_an_exit_code);
    TEST(format_command);

    std::cout << "\nBuildTool Tests:\n";
    TEST(build_tool_runs_in_repository);
    TEST(build_tool_rejects_empty_command);

    fixture.reset();

    return report_results();
}
