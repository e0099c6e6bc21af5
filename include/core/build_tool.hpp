#pragma once

#include "core/process_runner.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace jarcache {

/**
 * BuildTool - Runs the project's own build in a source checkout
 *
 * The command is executed with the repository as working directory and
 * its output passed straight through to the terminal; only the exit code
 * and timing are reported back.
 */
class BuildTool {
public:
    explicit BuildTool(std::vector<std::string> command, bool verbose = false);

    /**
     * Build the repository.
     *
     * @param repo_dir Working directory for the build command
     * @return Result of the build process (output is not captured)
     * @throws std::runtime_error if the process could not be started
     */
    ProcessRunner::Result run(const std::filesystem::path& repo_dir) const;

    const std::vector<std::string>& command() const { return command_; }

    std::string describe() const { return ProcessRunner::format_command(command_); }

private:
    std::vector<std::string> command_;
    bool verbose_;
};

} // namespace jarcache
