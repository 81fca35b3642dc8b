//! # Subprocess Execution (POSIX)
//!
//! fork + execv with pipe-based output capture. Both pipes are drained with
//! `poll` while the child runs so a child writing a large tree to stdout
//! cannot block on a full pipe.

#include "syntax/process.hpp"

#include "log/log.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <sstream>

#include <poll.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

namespace lth::syntax {

namespace {

void close_pipe(int fds[2]) {
    close(fds[0]);
    close(fds[1]);
}

/// Reads from both descriptors until each reaches end of file.
void drain(int out_fd, int err_fd, std::string& out, std::string& err) {
    pollfd fds[2] = {{out_fd, POLLIN, 0}, {err_fd, POLLIN, 0}};
    std::string* sinks[2] = {&out, &err};
    int open_count = 2;
    char buf[4096];

    while (open_count > 0) {
        int ready = poll(fds, 2, -1);
        if (ready < 0) {
            if (errno == EINTR)
                continue;
            break;
        }
        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0)
                continue;
            ssize_t n = read(fds[i].fd, buf, sizeof(buf));
            if (n > 0) {
                sinks[i]->append(buf, static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                fds[i].fd = -1;
                --open_count;
            }
        }
    }
}

auto is_executable_file(const std::string& path) -> bool {
    struct stat st;
    if (stat(path.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
        return false;
    }
    return access(path.c_str(), X_OK) == 0;
}

} // namespace

auto run_process(const std::string& exe_path, const std::vector<std::string>& args)
    -> Result<ProcessResult, SyntaxError> {
    if (!is_executable_file(exe_path)) {
        return SyntaxError::make("'" + exe_path + "' is not an executable file");
    }

    int stdout_pipe[2];
    int stderr_pipe[2];
    if (pipe(stdout_pipe) != 0) {
        return SyntaxError::make("failed to create pipe: " + std::string(std::strerror(errno)));
    }
    if (pipe(stderr_pipe) != 0) {
        close_pipe(stdout_pipe);
        return SyntaxError::make("failed to create pipe: " + std::string(std::strerror(errno)));
    }

    pid_t pid = fork();
    if (pid < 0) {
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        return SyntaxError::make("failed to fork: " + std::string(std::strerror(errno)));
    }

    if (pid == 0) {
        // Child process
        close(stdout_pipe[0]);
        close(stderr_pipe[0]);
        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);
        close(stdout_pipe[1]);
        close(stderr_pipe[1]);

        std::vector<char*> c_args;
        c_args.push_back(const_cast<char*>(exe_path.c_str()));
        for (const auto& a : args) {
            c_args.push_back(const_cast<char*>(a.c_str()));
        }
        c_args.push_back(nullptr);

        execv(exe_path.c_str(), c_args.data());
        _exit(127);
    }

    close(stdout_pipe[1]);
    close(stderr_pipe[1]);

    ProcessResult result;
    drain(stdout_pipe[0], stderr_pipe[0], result.stdout_output, result.stderr_output);
    close(stdout_pipe[0]);
    close(stderr_pipe[0]);

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return SyntaxError::make("failed to wait for '" + exe_path +
                                     "': " + std::string(std::strerror(errno)));
        }
    }

    result.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    LTH_LOG_DEBUG("parser", exe_path << " exited with " << result.exit_code << " ("
                                     << result.stdout_output.size() << " bytes of output)");
    return result;
}

auto find_in_path(std::string_view name) -> std::optional<std::string> {
    const char* path_env = std::getenv("PATH");
    if (!path_env) {
        return std::nullopt;
    }

    std::istringstream iss{std::string(path_env)};
    std::string dir;
    while (std::getline(iss, dir, ':')) {
        if (dir.empty()) {
            dir = ".";
        }
        std::string candidate = dir + "/" + std::string(name);
        if (is_executable_file(candidate)) {
            return candidate;
        }
    }
    return std::nullopt;
}

} // namespace lth::syntax
