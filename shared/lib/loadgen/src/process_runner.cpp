/**
 * @file process_runner.cpp
 * @brief Child process execution via posix_spawn
 */

#include "caload/loadgen/process_runner.h"
#include "exceptions.h"

#include <array>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>
#include <spdlog/spdlog.h>

extern char** environ;

namespace caload::loadgen {

namespace {

constexpr size_t MAX_CAPTURED_OUTPUT = 64 * 1024;
constexpr int TIMEOUT_EXIT_STATUS = 124;
constexpr int KILLED_EXIT_STATUS = 128 + 9;
constexpr const char* SHELL_PATH = "/bin/sh";

/// Owns a file descriptor
class UniqueFd {
public:
    explicit UniqueFd(int fd) : fd_(fd) {}
    ~UniqueFd() { reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    int get() const { return fd_; }

    void reset() {
        if (fd_ >= 0) {
            close(fd_);
            fd_ = -1;
        }
    }

private:
    int fd_;
};

} // anonymous namespace

std::string shellQuote(const std::string& arg) {
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

std::string buildCommandLine(const std::vector<std::string>& argv) {
    std::string cmd;
    for (size_t i = 0; i < argv.size(); ++i) {
        if (i > 0) cmd += " ";
        cmd += shellQuote(argv[i]);
    }
    return cmd;
}

ProcessResult runProcess(const std::vector<std::string>& argv, int timeoutSeconds) {
    if (argv.empty()) {
        throw common::UnexpectedError("empty command");
    }

    std::string cmd;
    if (timeoutSeconds > 0) {
        cmd = "timeout --kill-after=5 " + std::to_string(timeoutSeconds) + " ";
    }
    cmd += buildCommandLine(argv);

    spdlog::trace("exec: {}", cmd);

    // Close-on-exec so children spawned concurrently by other workers never
    // hold this pipe's write end open
    int fds[2];
    if (pipe2(fds, O_CLOEXEC) != 0) {
        throw common::UnexpectedError("failed to create pipe for '" + argv.front() + "': " + std::strerror(errno));
    }
    UniqueFd readEnd(fds[0]);
    UniqueFd writeEnd(fds[1]);

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, writeEnd.get(), STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&actions, writeEnd.get(), STDERR_FILENO);

    // Own process group: a terminal Ctrl-C cancels the run, not the calls in flight
    posix_spawnattr_t attr;
    posix_spawnattr_init(&attr);
    posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETPGROUP);
    posix_spawnattr_setpgroup(&attr, 0);

    std::string shell = "sh";
    std::string dashC = "-c";
    char* const shellArgv[] = {shell.data(), dashC.data(), cmd.data(), nullptr};

    pid_t pid = 0;
    int rc = posix_spawn(&pid, SHELL_PATH, &actions, &attr, shellArgv, environ);
    posix_spawn_file_actions_destroy(&actions);
    posix_spawnattr_destroy(&attr);
    if (rc != 0) {
        throw common::UnexpectedError("failed to execute '" + argv.front() + "': " + std::strerror(rc));
    }
    writeEnd.reset();

    ProcessResult result;
    std::array<char, 512> buffer;
    while (true) {
        ssize_t n = read(readEnd.get(), buffer.data(), buffer.size());
        if (n > 0) {
            if (result.output.size() < MAX_CAPTURED_OUTPUT) {
                result.output.append(buffer.data(), static_cast<size_t>(n));
            }
        } else if (n == 0 || errno != EINTR) {
            break;
        }
    }

    int status = 0;
    while (waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            throw common::UnexpectedError("failed to reap '" + argv.front() + "': " + std::strerror(errno));
        }
    }

    if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exitCode = 128 + WTERMSIG(status);
    }

    if (timeoutSeconds > 0 &&
        (result.exitCode == TIMEOUT_EXIT_STATUS || result.exitCode == KILLED_EXIT_STATUS)) {
        result.timedOut = true;
    }

    return result;
}

} // namespace caload::loadgen
