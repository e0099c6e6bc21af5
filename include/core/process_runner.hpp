#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <filesystem>
#include <stdexcept>

namespace jarcache {

/**
 * ProcessRunner - Runs external tools (git, the project build tool)
 *
 * Responsibilities:
 * - Spawn a child process in a given working directory
 * - Capture stdout/stderr, or let the child write to the terminal
 * - Report exit code and duration
 *
 * Non-zero exit codes are reported, never thrown; only failure to create
 * the process raises.
 *
 * Platform Support: Linux (fork/exec)
 */
class ProcessRunner {
public:
    /**
     * Result of a process run
     */
    struct Result {
        int exit_code;                          // Process exit code (0 = success)
        std::string stdout_output;              // Captured stdout (empty when inherited)
        std::string stderr_output;              // Captured stderr (empty when inherited)
        std::chrono::milliseconds duration;     // Wall time

        bool success() const { return exit_code == 0; }
    };

    struct Options {
        std::filesystem::path cwd;              // Working directory (empty = inherit)
        bool capture_output = true;             // false = child writes to our stdout/stderr
        bool echo_command = false;              // Print "[CMD] ..." before running
    };

    /**
     * Run a command to completion.
     *
     * @param args Command-line arguments (first is the executable, looked up in PATH)
     * @param options Working directory and output handling
     * @return Result with exit code, output, and timing
     * @throws std::runtime_error on pipe/fork failure (not on tool errors)
     */
    static Result run(const std::vector<std::string>& args, const Options& options);

    static Result run(const std::vector<std::string>& args) {
        return run(args, Options{});
    }

    // Render args as a single shell-like line (for logs and error messages)
    static std::string format_command(const std::vector<std::string>& args);
};

} // namespace jarcache
