#include "core/process_runner.hpp"
#include <sys/types.h>
#include <sys/wait.h>
#include <sys/select.h>
#include <unistd.h>
#include <fcntl.h>
#include <errno.h>
#include <cstring>
#include <iostream>
#include <sstream>
#include <algorithm>

namespace jarcache {

namespace {

// Read whatever is available on a non-blocking fd; false once EOF is hit
bool drain_fd(int fd, std::string& out) {
    char buffer[4096];
    while (true) {
        ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            out.append(buffer, static_cast<size_t>(n));
            continue;
        }
        if (n == 0) {
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        // EAGAIN: nothing more right now
        return errno == EAGAIN || errno == EWOULDBLOCK;
    }
}

[[noreturn]] void exec_child(const std::vector<std::string>& args,
                             const std::filesystem::path& cwd) {
    if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
        std::cerr << "Failed to enter " << cwd << ": " << strerror(errno) << std::endl;
        _exit(127);
    }

    std::vector<char*> argv;
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    execvp(argv[0], argv.data());

    // If we get here, execvp failed
    std::cerr << "Failed to execute " << args[0] << ": "
              << strerror(errno) << std::endl;
    _exit(127);  // Use _exit to avoid flushing parent's buffers
}

int decode_status(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

} // namespace

std::string ProcessRunner::format_command(const std::vector<std::string>& args) {
    std::ostringstream cmd;
    for (size_t i = 0; i < args.size(); ++i) {
        if (i > 0) cmd << ' ';
        if (args[i].find(' ') != std::string::npos) {
            cmd << '"' << args[i] << '"';
        } else {
            cmd << args[i];
        }
    }
    return cmd.str();
}

ProcessRunner::Result ProcessRunner::run(
    const std::vector<std::string>& args,
    const Options& options
) {
    if (args.empty()) {
        throw std::runtime_error("Cannot execute empty command");
    }

    if (options.echo_command) {
        std::cout << "[CMD] " << format_command(args) << "\n";
    }

    auto start_time = std::chrono::steady_clock::now();

    if (!options.capture_output) {
        std::cout.flush();
        pid_t pid = fork();
        if (pid < 0) {
            throw std::runtime_error(
                std::string("Failed to fork process: ") + strerror(errno)
            );
        }
        if (pid == 0) {
            exec_child(args, options.cwd);
        }

        int status = 0;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }

        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time
        );
        return Result{decode_status(status), "", "", duration};
    }

    int stdout_pipe[2];
    int stderr_pipe[2];

    if (pipe(stdout_pipe) != 0) {
        throw std::runtime_error(
            std::string("Failed to create stdout pipe: ") + strerror(errno)
        );
    }

    if (pipe(stderr_pipe) != 0) {
        close(stdout_pipe[0]);
        close(stdout_pipe[1]);
        throw std::runtime_error(
            std::string("Failed to create stderr pipe: ") + strerror(errno)
        );
    }

    pid_t pid = fork();

    if (pid < 0) {
        close(stdout_pipe[0]); close(stdout_pipe[1]);
        close(stderr_pipe[0]); close(stderr_pipe[1]);
        throw std::runtime_error(
            std::string("Failed to fork process: ") + strerror(errno)
        );
    }

    if (pid == 0) {
        dup2(stdout_pipe[1], STDOUT_FILENO);
        close(stdout_pipe[0]);
        close(stdout_pipe[1]);

        dup2(stderr_pipe[1], STDERR_FILENO);
        close(stderr_pipe[0]);
        close(stderr_pipe[1]);

        exec_child(args, options.cwd);
    }

    // Parent process: child is the only writer
    close(stdout_pipe[1]);
    close(stderr_pipe[1]);

    int stdout_flags = fcntl(stdout_pipe[0], F_GETFL, 0);
    fcntl(stdout_pipe[0], F_SETFL, stdout_flags | O_NONBLOCK);
    int stderr_flags = fcntl(stderr_pipe[0], F_GETFL, 0);
    fcntl(stderr_pipe[0], F_SETFL, stderr_flags | O_NONBLOCK);

    std::string stdout_output;
    std::string stderr_output;
    bool stdout_open = true;
    bool stderr_open = true;

    // Read until both pipes hit EOF (the child closes them on exit)
    while (stdout_open || stderr_open) {
        fd_set read_fds;
        FD_ZERO(&read_fds);
        int max_fd = -1;

        if (stdout_open) {
            FD_SET(stdout_pipe[0], &read_fds);
            max_fd = std::max(max_fd, stdout_pipe[0]);
        }
        if (stderr_open) {
            FD_SET(stderr_pipe[0], &read_fds);
            max_fd = std::max(max_fd, stderr_pipe[0]);
        }

        struct timeval timeout;
        timeout.tv_sec = 0;
        timeout.tv_usec = 10000; // 10ms

        int ready = select(max_fd + 1, &read_fds, nullptr, nullptr, &timeout);
        if (ready < 0) {
            if (errno == EINTR) continue;
            break;
        }

        if (stdout_open && FD_ISSET(stdout_pipe[0], &read_fds)) {
            stdout_open = drain_fd(stdout_pipe[0], stdout_output);
        }
        if (stderr_open && FD_ISSET(stderr_pipe[0], &read_fds)) {
            stderr_open = drain_fd(stderr_pipe[0], stderr_output);
        }
    }

    close(stdout_pipe[0]);
    close(stderr_pipe[0]);

    int status = 0;
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time
    );

    return Result{
        decode_status(status),
        std::move(stdout_output),
        std::move(stderr_output),
        duration
    };
}

} // namespace jarcache
