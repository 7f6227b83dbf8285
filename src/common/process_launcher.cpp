#include "process_launcher.h"
#include "logger.h"
#include <sstream>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {
    // RAII wrapper for a pipe file descriptor
    struct FdGuard {
        int fd_;
        explicit FdGuard(int fd) : fd_(fd) {}
        ~FdGuard() {
            if (fd_ >= 0) {
                close(fd_);
            }
        }
        int get() const { return fd_; }
    };
}

bool ProcessLauncher::parseCommand(const std::string& command, std::string& executable, std::vector<std::string>& arguments) {
    arguments.clear();
    executable.clear();

    std::istringstream iss(command);
    bool in_quotes = false;
    std::string current_arg;

    auto flush = [&]() {
        if (current_arg.empty()) return;
        if (executable.empty()) {
            executable = current_arg;
        } else {
            arguments.push_back(current_arg);
        }
        current_arg.clear();
    };

    while (iss.good()) {
        int c = iss.get();
        if (c == EOF) break;

        if (c == '"') {
            in_quotes = !in_quotes;
            if (!in_quotes) {
                flush();
            }
        } else if (c == ' ' && !in_quotes) {
            flush();
        } else {
            current_arg += static_cast<char>(c);
        }
    }
    flush();

    return !executable.empty();
}

ProcessResult ProcessLauncher::run(const std::string& executable, const std::vector<std::string>& arguments,
                                   bool capture_output, bool redirect_stderr) {
    ProcessResult result;

    int pipe_fds[2] = {-1, -1};
    if (capture_output && pipe(pipe_fds) != 0) {
        LOG_ERROR("ProcessLauncher", "Failed to create stdout pipe: " << strerror(errno));
        return result;
    }

    std::vector<char*> argv;
    argv.reserve(arguments.size() + 2);
    argv.push_back(const_cast<char*>(executable.c_str()));
    for (const auto& arg : arguments) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        LOG_ERROR("ProcessLauncher", "fork failed for " << executable << ": " << strerror(errno));
        if (capture_output) {
            close(pipe_fds[0]);
            close(pipe_fds[1]);
        }
        return result;
    }

    if (pid == 0) {
        // Child: wire stdout/stderr, then exec. Only async-signal-safe calls here.
        int dev_null = open("/dev/null", O_RDWR);
        if (dev_null >= 0) {
            dup2(dev_null, STDIN_FILENO);
        }
        if (capture_output) {
            close(pipe_fds[0]);
            dup2(pipe_fds[1], STDOUT_FILENO);
            if (redirect_stderr) {
                dup2(pipe_fds[1], STDERR_FILENO);
            } else if (dev_null >= 0) {
                dup2(dev_null, STDERR_FILENO);
            }
            close(pipe_fds[1]);
        } else if (dev_null >= 0) {
            dup2(dev_null, STDOUT_FILENO);
            dup2(dev_null, STDERR_FILENO);
        }
        if (dev_null > STDERR_FILENO) {
            close(dev_null);
        }
        execvp(argv[0], argv.data());
        _exit(127);
    }

    result.launched = true;

    if (capture_output) {
        close(pipe_fds[1]);
        FdGuard read_guard(pipe_fds[0]);
        char buffer[4096];
        while (true) {
            ssize_t bytes_read = read(read_guard.get(), buffer, sizeof(buffer));
            if (bytes_read > 0) {
                result.output.append(buffer, static_cast<size_t>(bytes_read));
            } else if (bytes_read < 0 && errno == EINTR) {
                continue;
            } else {
                break;
            }
        }
    }

    int status = 0;
    pid_t waited;
    do {
        waited = waitpid(pid, &status, 0);
    } while (waited < 0 && errno == EINTR);

    if (waited < 0) {
        LOG_WARN("ProcessLauncher", "waitpid failed for " << executable << ": " << strerror(errno));
        result.exit_code = -1;
    } else if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else {
        result.exit_code = -1;
    }

    if (result.exit_code == 127) {
        LOG_WARN("ProcessLauncher", "Could not execute " << executable << " (exit 127)");
    }
    LOG_DEBUG("ProcessLauncher", executable << " finished with exit code " << result.exit_code);
    return result;
}

ProcessResult ProcessLauncher::runCommand(const std::string& command, const std::vector<std::string>& arguments,
                                          bool capture_output, bool redirect_stderr) {
    std::string executable;
    std::vector<std::string> leading_args;
    if (!parseCommand(command, executable, leading_args)) {
        LOG_ERROR("ProcessLauncher", "Empty command");
        return ProcessResult();
    }
    leading_args.insert(leading_args.end(), arguments.begin(), arguments.end());
    return run(executable, leading_args, capture_output, redirect_stderr);
}
