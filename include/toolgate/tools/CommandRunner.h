//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CommandRunner.h
// Purpose: Shell command execution with a hard timeout and separate stdout/stderr capture
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace toolgate {
namespace tools {

struct CommandResult {
    std::string stdoutText;
    std::string stderrText;
    int exitCode{0};          // 128 + signal for signal-terminated processes
    bool timedOut{false};
    int64_t durationMs{0};
    bool stdoutTruncated{false};
    bool stderrTruncated{false};
};

//==========================================================================================================
// CommandRunner
// Purpose: Runs "/bin/sh -c <command>" in its own process group with stdin at /dev/null.
// Notes:
//   - At the deadline the whole process group gets SIGTERM, then SIGKILL after killGrace.
//   - Output beyond outputLimit bytes per stream is drained and dropped.
//   - A non-zero exit status is a normal result, not an error.
//   - Stateless apart from its options; concurrent Execute() calls are independent.
//==========================================================================================================
class CommandRunner {
public:
    struct Options {
        std::filesystem::path workspaceRoot;
        double defaultTimeoutSeconds{30.0};
        double maxTimeoutSeconds{600.0};
        std::size_t outputLimit{8 * 1024 * 1024};
        std::chrono::milliseconds killGrace{2000};
    };

    explicit CommandRunner(Options opts);

    const Options& GetOptions() const { return opts_; }

    //==========================================================================================================
    // Execute
    // Args:
    //   command: Shell command line (non-empty).
    //   workingDirectory: Relative to the workspace root; empty means the workspace root.
    //   timeoutSeconds: > 0 and <= maxTimeoutSeconds; defaults to defaultTimeoutSeconds.
    // Returns:
    //   CommandResult with everything captured, also when the command timed out.
    // Throws:
    //   ValidationError (empty command, bad timeout), NotFound/NotADirectory (working directory),
    //   ExecutionError when the process cannot be started.
    //==========================================================================================================
    CommandResult Execute(const std::string& command, const std::string& workingDirectory = std::string(),
                          std::optional<double> timeoutSeconds = std::nullopt) const;

private:
    Options opts_;
};

} // namespace tools
} // namespace toolgate
