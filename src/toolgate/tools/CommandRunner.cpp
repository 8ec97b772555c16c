//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CommandRunner.cpp
// Purpose: fork/exec of /bin/sh with poll-based capture, deadline enforcement and process-group kill
//==========================================================================================================

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <csignal>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

#include <fmt/format.h>

#include "logging/Logger.h"
#include "toolgate/errors/Errors.h"
#include "toolgate/tools/CommandRunner.h"

namespace fs = std::filesystem;

namespace toolgate {
namespace tools {

namespace {

using Clock = std::chrono::steady_clock;

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

// Pipe pair closed on scope exit.
struct Pipe {
    int fds[2]{-1, -1};
    ~Pipe() { closeFd(fds[0]); closeFd(fds[1]); }
    int& readEnd() { return fds[0]; }
    int& writeEnd() { return fds[1]; }
};

struct Capture {
    int& fd;
    std::string& text;
    bool& truncated;
};

// Drains whatever is readable; returns false once the stream reached EOF.
bool drain(Capture& c, std::size_t limit) {
    char buf[16 * 1024];
    for (;;) {
        ssize_t n = ::read(c.fd, buf, sizeof(buf));
        if (n > 0) {
            const auto got = static_cast<std::size_t>(n);
            if (c.text.size() < limit) {
                const std::size_t keep = std::min(got, limit - c.text.size());
                c.text.append(buf, keep);
                if (keep < got) c.truncated = true;
            } else {
                c.truncated = true;
            }
            continue;
        }
        if (n == 0) return false;
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) return true;
        return false;
    }
}

int decodeStatus(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

int waitForChild(pid_t pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) return -1;
    }
    return decodeStatus(status);
}

} // namespace

CommandRunner::CommandRunner(Options opts) : opts_(std::move(opts)) {
    if (opts_.workspaceRoot.empty()) {
        opts_.workspaceRoot = fs::current_path();
    }
}

CommandResult CommandRunner::Execute(const std::string& command, const std::string& workingDirectory,
                                     std::optional<double> timeoutSeconds) const {
    if (command.empty()) {
        throw errors::validationError("command must not be empty");
    }
    const double timeout = timeoutSeconds.value_or(opts_.defaultTimeoutSeconds);
    if (!std::isfinite(timeout) || timeout <= 0.0 || timeout > opts_.maxTimeoutSeconds) {
        throw errors::validationError(fmt::format("timeout must be > 0 and <= {} seconds, got {}",
                                                  opts_.maxTimeoutSeconds, timeout));
    }

    fs::path cwd = workingDirectory.empty() ? opts_.workspaceRoot : fs::path(workingDirectory);
    if (cwd.is_relative()) cwd = opts_.workspaceRoot / cwd;
    cwd = cwd.lexically_normal();
    struct stat st{};
    if (::stat(cwd.c_str(), &st) != 0) {
        throw errors::errnoError(errno, cwd.string(), "working directory");
    }
    if (!S_ISDIR(st.st_mode)) {
        throw errors::GatewayError(errors::ErrorCategory::NotADirectory, "not a directory: " + cwd.string());
    }

    Pipe out, err, status;
    if (::pipe2(out.fds, O_CLOEXEC) != 0 || ::pipe2(err.fds, O_CLOEXEC) != 0 || ::pipe2(status.fds, O_CLOEXEC) != 0) {
        throw errors::GatewayError(errors::ErrorCategory::Execution,
                                   std::string("failed to create pipes: ") + std::strerror(errno));
    }

    // Everything the child touches is prepared before fork
    const std::string cwdStr = cwd.string();
    const char* shell = "/bin/sh";
    const auto start = Clock::now();

    pid_t pid = ::fork();
    if (pid < 0) {
        throw errors::GatewayError(errors::ErrorCategory::Execution,
                                   std::string("fork() failed: ") + std::strerror(errno));
    }
    if (pid == 0) {
        ::setpgid(0, 0);
        ::signal(SIGPIPE, SIG_DFL);
        int childErr = 0;
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull < 0 || ::dup2(devnull, STDIN_FILENO) < 0 ||
            ::dup2(out.fds[1], STDOUT_FILENO) < 0 || ::dup2(err.fds[1], STDERR_FILENO) < 0) {
            childErr = errno;
        } else if (::chdir(cwdStr.c_str()) != 0) {
            childErr = errno;
        } else {
            ::execl(shell, "sh", "-c", command.c_str(), static_cast<char*>(nullptr));
            childErr = errno;
        }
        // Report the failure through the close-on-exec status pipe
        ssize_t ignored = ::write(status.fds[1], &childErr, sizeof(childErr));
        (void)ignored;
        ::_exit(127);
    }

    ::setpgid(pid, pid);
    closeFd(out.writeEnd());
    closeFd(err.writeEnd());
    closeFd(status.writeEnd());

    int childErr = 0;
    ssize_t got = 0;
    do {
        got = ::read(status.readEnd(), &childErr, sizeof(childErr));
    } while (got < 0 && errno == EINTR);
    if (got == static_cast<ssize_t>(sizeof(childErr))) {
        waitForChild(pid);
        throw errors::GatewayError(errors::ErrorCategory::Execution,
                                   fmt::format("failed to start command: {}", std::strerror(childErr)));
    }

    ::fcntl(out.readEnd(), F_SETFL, ::fcntl(out.readEnd(), F_GETFL) | O_NONBLOCK);
    ::fcntl(err.readEnd(), F_SETFL, ::fcntl(err.readEnd(), F_GETFL) | O_NONBLOCK);

    CommandResult result;
    Capture captures[2] = {
        Capture{out.readEnd(), result.stdoutText, result.stdoutTruncated},
        Capture{err.readEnd(), result.stderrText, result.stderrTruncated},
    };

    const auto deadline = start + std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(timeout));
    Clock::time_point killAt{};
    Clock::time_point abandonAt{};
    bool killed = false;

    // SIGTERM at the deadline, SIGKILL after the grace period
    auto enforceDeadline = [&](Clock::time_point now) {
        if (!result.timedOut && now >= deadline) {
            result.timedOut = true;
            LOG_WARN("Command timed out after {}s, sending SIGTERM to process group {}", timeout, pid);
            ::kill(-pid, SIGTERM);
            killAt = now + opts_.killGrace;
        }
        if (result.timedOut && !killed && now >= killAt) {
            LOG_WARN("Command ignored SIGTERM, sending SIGKILL to process group {}", pid);
            ::kill(-pid, SIGKILL);
            killed = true;
            abandonAt = now + std::chrono::seconds(1);
        }
    };
    auto nextWakeup = [&]() {
        return !result.timedOut ? deadline : (!killed ? killAt : abandonAt);
    };

    while (out.readEnd() >= 0 || err.readEnd() >= 0) {
        const auto now = Clock::now();
        enforceDeadline(now);
        // A descendant that left the process group may keep the pipes open forever
        if (killed && now >= abandonAt) break;

        auto waitMs = std::chrono::duration_cast<std::chrono::milliseconds>(nextWakeup() - now).count();
        if (waitMs < 0) waitMs = 0;

        struct pollfd pfds[2];
        nfds_t n = 0;
        int which[2];
        for (int k = 0; k < 2; ++k) {
            if (captures[k].fd >= 0) {
                pfds[n].fd = captures[k].fd;
                pfds[n].events = POLLIN;
                pfds[n].revents = 0;
                which[n] = k;
                ++n;
            }
        }
        int rc = ::poll(pfds, n, static_cast<int>(std::min<long long>(waitMs + 1, 1000)));
        if (rc < 0) {
            if (errno == EINTR) continue;
            const int pollErr = errno;
            ::kill(-pid, SIGKILL);
            waitForChild(pid);
            throw errors::GatewayError(errors::ErrorCategory::Execution,
                                       std::string("poll() failed: ") + std::strerror(pollErr));
        }
        for (nfds_t k = 0; k < n; ++k) {
            if (pfds[k].revents == 0) continue;
            Capture& c = captures[which[k]];
            if (!drain(c, opts_.outputLimit)) {
                closeFd(c.fd);
            }
        }
    }

    // The shell may outlive its output streams (e.g. it closed stdout), so the deadline still applies
    for (;;) {
        int wstatus = 0;
        pid_t r = ::waitpid(pid, &wstatus, killed ? 0 : WNOHANG);
        if (r == pid) {
            result.exitCode = decodeStatus(wstatus);
            break;
        }
        if (r < 0) {
            if (errno == EINTR) continue;
            result.exitCode = -1;
            break;
        }
        enforceDeadline(Clock::now());
        ::usleep(10 * 1000);
    }

    result.durationMs = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start).count();
    LOG_DEBUG("Command exited with {} after {} ms (timed_out={})", result.exitCode, result.durationMs, result.timedOut);
    return result;
}

} // namespace tools
} // namespace toolgate
