//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_command_runner.cpp
// Purpose: GoogleTests for shell execution, output capture, timeouts and working directory checks
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <functional>
#include <string>
#include <thread>

#include "TempWorkspace.h"
#include "toolgate/errors/Errors.h"
#include "toolgate/tools/CommandRunner.h"

using namespace toolgate;
using namespace toolgate::tools;
using toolgate_test::TempWorkspace;

namespace {

CommandRunner makeRunner(const TempWorkspace& ws) {
    CommandRunner::Options opts;
    opts.workspaceRoot = ws.root();
    opts.killGrace = std::chrono::milliseconds(500);
    return CommandRunner(opts);
}

errors::ErrorCategory categoryOf(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const errors::GatewayError& e) {
        return e.category();
    }
    ADD_FAILURE() << "expected GatewayError";
    return errors::ErrorCategory::Internal;
}

} // namespace

TEST(CommandRunner, CapturesStdoutAndStderrSeparately) {
    TempWorkspace ws;
    auto runner = makeRunner(ws);
    auto r = runner.Execute("echo out; echo err 1>&2");
    EXPECT_EQ(r.exitCode, 0);
    EXPECT_EQ(r.stdoutText, "out\n");
    EXPECT_EQ(r.stderrText, "err\n");
    EXPECT_FALSE(r.timedOut);
    EXPECT_GE(r.durationMs, 0);
}

TEST(CommandRunner, NonZeroExitIsAResultNotAnError) {
    TempWorkspace ws;
    auto runner = makeRunner(ws);
    auto r = runner.Execute("exit 3");
    EXPECT_EQ(r.exitCode, 3);
    EXPECT_FALSE(r.timedOut);
}

TEST(CommandRunner, SignalExitIsReportedAs128PlusSignal) {
    TempWorkspace ws;
    auto runner = makeRunner(ws);
    auto r = runner.Execute("kill -9 $$");
    EXPECT_EQ(r.exitCode, 128 + 9);
}

TEST(CommandRunner, StdinIsEmpty) {
    TempWorkspace ws;
    auto runner = makeRunner(ws);
    auto r = runner.Execute("cat; echo done", "", 5.0);
    EXPECT_EQ(r.stdoutText, "done\n");
    EXPECT_FALSE(r.timedOut);
}

TEST(CommandRunner, TimeoutKillsTheProcessGroup) {
    TempWorkspace ws;
    auto runner = makeRunner(ws);
    const auto start = std::chrono::steady_clock::now();
    auto r = runner.Execute("echo started; sleep 10; echo never", "", 1.0);
    const auto elapsed = std::chrono::steady_clock::now() - start;
    EXPECT_TRUE(r.timedOut);
    EXPECT_EQ(r.stdoutText, "started\n");
    EXPECT_LT(elapsed, std::chrono::seconds(5));
    EXPECT_GE(r.durationMs, 900);
}

TEST(CommandRunner, RunsInWorkingDirectory) {
    TempWorkspace ws;
    ws.write("sub/marker.txt", "m");
    auto runner = makeRunner(ws);
    auto rel = runner.Execute("ls", "sub");
    EXPECT_EQ(rel.stdoutText, "marker.txt\n");
    auto root = runner.Execute("pwd");
    EXPECT_EQ(root.stdoutText, ws.root().string() + "\n");
    auto abs = runner.Execute("pwd", ws.path("sub").string());
    EXPECT_EQ(abs.stdoutText, ws.path("sub").string() + "\n");
}

TEST(CommandRunner, WorkingDirectoryErrors) {
    TempWorkspace ws;
    ws.write("file.txt", "x");
    auto runner = makeRunner(ws);
    EXPECT_EQ(categoryOf([&] { runner.Execute("true", "missing"); }), errors::ErrorCategory::NotFound);
    EXPECT_EQ(categoryOf([&] { runner.Execute("true", "file.txt"); }), errors::ErrorCategory::NotADirectory);
}

TEST(CommandRunner, RejectsBadArguments) {
    TempWorkspace ws;
    auto runner = makeRunner(ws);
    EXPECT_EQ(categoryOf([&] { runner.Execute(""); }), errors::ErrorCategory::Validation);
    EXPECT_EQ(categoryOf([&] { runner.Execute("true", "", 0.0); }), errors::ErrorCategory::Validation);
    EXPECT_EQ(categoryOf([&] { runner.Execute("true", "", -1.0); }), errors::ErrorCategory::Validation);
    EXPECT_EQ(categoryOf([&] { runner.Execute("true", "", 601.0); }), errors::ErrorCategory::Validation);
}

TEST(CommandRunner, TruncatesOutputBeyondLimit) {
    TempWorkspace ws;
    CommandRunner::Options opts;
    opts.workspaceRoot = ws.root();
    opts.outputLimit = 10;
    CommandRunner runner(opts);
    auto r = runner.Execute("printf '0123456789abcdef'; printf 'e' 1>&2");
    EXPECT_EQ(r.exitCode, 0);
    EXPECT_EQ(r.stdoutText, "0123456789");
    EXPECT_TRUE(r.stdoutTruncated);
    EXPECT_EQ(r.stderrText, "e");
    EXPECT_FALSE(r.stderrTruncated);
}

TEST(CommandRunner, ConcurrentExecutionsAreIndependent) {
    TempWorkspace ws;
    auto runner = makeRunner(ws);
    const auto start = std::chrono::steady_clock::now();
    CommandResult a, b;
    std::thread ta([&] { a = runner.Execute("sleep 1; echo a"); });
    std::thread tb([&] { b = runner.Execute("sleep 1; echo b"); });
    ta.join();
    tb.join();
    EXPECT_EQ(a.stdoutText, "a\n");
    EXPECT_EQ(b.stdoutText, "b\n");
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(1900));
}
