/**
 * @file    process_executor.cpp
 * @brief   Subprocess execution via fork/execvp
 * @license MIT
 *
 * @details
 * An O_CLOEXEC pipe carries the errno of a failed execvp back to the
 * parent. A successful exec closes the pipe and the parent reads EOF,
 * so "gs not installed" is reported as a spawn failure instead of the
 * child's exit status 127.
 */

#include "core/process_executor.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <utility>

#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace pdfshrink {

namespace {

ExecResult spawn_failure(std::string message) {
    ExecResult result;
    result.spawned = false;
    result.error = std::move(message);
    return result;
}

}  // anonymous namespace

ExecResult PosixProcessExecutor::run(const std::vector<std::string>& argv) {
    if (argv.empty() || argv.front().empty()) {
        return spawn_failure("empty command");
    }

    // Convert vector of strings into a NULL terminated char* array
    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    int err_pipe[2];
    if (pipe2(err_pipe, O_CLOEXEC) == -1) {
        return spawn_failure(fmt::format("pipe failed: {}", std::strerror(errno)));
    }

    pid_t pid = fork();
    if (pid == -1) {
        int err = errno;
        close(err_pipe[0]);
        close(err_pipe[1]);
        return spawn_failure(fmt::format("fork failed: {}", std::strerror(err)));
    }

    if (pid == 0) {
        close(err_pipe[0]);
        execvp(args[0], args.data());

        // Only reached when execvp failed
        int err = errno;
        ssize_t ignored = write(err_pipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    close(err_pipe[1]);

    int exec_errno = 0;
    ssize_t n;
    do {
        n = read(err_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n == -1 && errno == EINTR);
    close(err_pipe[0]);

    int status = 0;
    while (waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            return spawn_failure(fmt::format("waitpid failed: {}", std::strerror(errno)));
        }
    }

    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        return spawn_failure(fmt::format("cannot execute '{}': {}", argv.front(), std::strerror(exec_errno)));
    }

    ExecResult result;
    result.spawned = true;
    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.term_signal = WTERMSIG(status);
        result.exit_code = 128 + result.term_signal;
    }

    spdlog::trace("'{}' (pid {}) exited with {}", argv.front(), pid, result.exit_code);
    return result;
}

}  // namespace pdfshrink
