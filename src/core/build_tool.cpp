#include "core/build_tool.hpp"

#include <stdexcept>

namespace jarcache {

BuildTool::BuildTool(std::vector<std::string> command, bool verbose)
    : command_(std::move(command))
    , verbose_(verbose) {
    if (command_.empty()) {
        throw std::invalid_argument("BuildTool: empty build command");
    }
}

ProcessRunner::Result BuildTool::run(const std::filesystem::path& repo_dir) const {
    ProcessRunner::Options options;
    options.cwd = repo_dir;
    options.capture_output = false;
    options.echo_command = verbose_;
    return ProcessRunner::run(command_, options);
}

} // namespace jarcache
