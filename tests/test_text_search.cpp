//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_text_search.cpp
// Purpose: GoogleTests for literal/regex search over files and trees, and bounded replace
//==========================================================================================================

#include <gtest/gtest.h>

#include <filesystem>
#include <functional>
#include <string>

#include <sys/stat.h>
#include <unistd.h>

#include "TempWorkspace.h"
#include "toolgate/errors/Errors.h"
#include "toolgate/tools/FileMutator.h"
#include "toolgate/tools/TextSearch.h"

using namespace toolgate;
using namespace toolgate::tools;
using toolgate_test::TempWorkspace;
namespace fs = std::filesystem;

class TextSearchTest : public ::testing::Test {
protected:
    TempWorkspace ws;
    FileMutator files{ws.root()};
    TextSearch search{files};

    errors::ErrorCategory failureCategory(const std::function<void()>& fn) {
        try {
            fn();
        } catch (const errors::GatewayError& e) {
            return e.category();
        }
        ADD_FAILURE() << "expected GatewayError";
        return errors::ErrorCategory::Internal;
    }
};

TEST_F(TextSearchTest, LiteralDotMatchesOnlyDot) {
    ws.write("f.txt", "a.b\naxb\nA.B\n");
    auto r = search.SearchFile("a.b", "f.txt");
    ASSERT_EQ(r.matches.size(), 2u);  // case-insensitive by default
    EXPECT_EQ(r.matches[0].lineNumber, 1u);
    EXPECT_EQ(r.matches[0].lineText, "a.b");
    EXPECT_EQ(r.matches[1].lineNumber, 3u);

    SearchOptions exact;
    exact.caseSensitive = true;
    auto r2 = search.SearchFile("a.b", "f.txt", exact);
    ASSERT_EQ(r2.matches.size(), 1u);
    EXPECT_EQ(r2.matches[0].lineNumber, 1u);
}

TEST_F(TextSearchTest, OneRecordPerOccurrenceWithByteSpans) {
    ws.write("f.txt", "foo bar foo\r\nnone\n");
    auto r = search.SearchFile("foo", "f.txt");
    ASSERT_EQ(r.matches.size(), 2u);
    EXPECT_EQ(r.matches[0].matchStart, 0u);
    EXPECT_EQ(r.matches[0].matchEnd, 3u);
    EXPECT_EQ(r.matches[1].matchStart, 8u);
    EXPECT_EQ(r.matches[1].matchEnd, 11u);
    EXPECT_EQ(r.matches[1].lineText, "foo bar foo");
    EXPECT_EQ(r.matches[0].filePath, (ws.root() / "f.txt").string());
    EXPECT_EQ(r.filesScanned, 1u);
}

TEST_F(TextSearchTest, RegexModeAndCaseFolding) {
    ws.write("code.py", "def Alpha():\n    return 42\ndef beta():\n");
    SearchOptions re;
    re.regex = true;
    auto r = search.SearchFile("^def [a-z]+", "code.py", re);
    ASSERT_EQ(r.matches.size(), 2u);
    EXPECT_EQ(r.matches[0].matchEnd, 9u);

    re.caseSensitive = true;
    auto r2 = search.SearchFile("^def [a-z]+", "code.py", re);
    ASSERT_EQ(r2.matches.size(), 1u);
    EXPECT_EQ(r2.matches[0].lineNumber, 3u);

    auto digits = search.SearchFile("\\d+", "code.py", re);
    ASSERT_EQ(digits.matches.size(), 1u);
    EXPECT_EQ(digits.matches[0].matchStart, 11u);
    EXPECT_EQ(digits.matches[0].matchEnd, 13u);
}

TEST_F(TextSearchTest, InvalidPatternsAreValidationErrors) {
    ws.write("f.txt", "x");
    SearchOptions re;
    re.regex = true;
    EXPECT_EQ(failureCategory([&] { search.SearchFile("", "f.txt"); }), errors::ErrorCategory::Validation);
    EXPECT_EQ(failureCategory([&] { search.SearchFile("([", "f.txt", re); }), errors::ErrorCategory::Validation);
}

TEST_F(TextSearchTest, DirectoryWalkIsSortedAndRecursive) {
    ws.write("b.txt", "needle\n");
    ws.write("a/z.txt", "needle here\n");
    ws.write("a/y.txt", "nothing\n");
    ws.write("c/deep/x.txt", "x needle\n");
    auto r = search.SearchDirectory("needle", "");
    ASSERT_EQ(r.matches.size(), 3u);
    EXPECT_EQ(r.matches[0].filePath, (ws.root() / "a" / "z.txt").string());
    EXPECT_EQ(r.matches[1].filePath, (ws.root() / "b.txt").string());
    EXPECT_EQ(r.matches[2].filePath, (ws.root() / "c" / "deep" / "x.txt").string());
    EXPECT_EQ(r.filesScanned, 4u);
    EXPECT_EQ(r.filesSkipped, 0u);
    EXPECT_TRUE(r.errors.empty());
}

TEST_F(TextSearchTest, SkipsBinaryAndInvalidUtf8Files) {
    ws.write("text.txt", "needle\n");
    ws.write("nul.bin", std::string("needle\0", 7));
    ws.write("latin.txt", "needle \xE9\n");
    auto r = search.SearchDirectory("needle", ".");
    EXPECT_EQ(r.matches.size(), 1u);
    EXPECT_EQ(r.filesScanned, 1u);
    EXPECT_EQ(r.filesSkipped, 2u);
}

TEST_F(TextSearchTest, UnreadableDirectoryIsRecordedAndScanContinues) {
    if (::geteuid() == 0) {
        GTEST_SKIP() << "root bypasses directory permissions";
    }
    ws.write("a.txt", "needle a\n");
    ws.write("locked/hidden.txt", "needle hidden\n");
    ws.write("z.txt", "needle z\n");
    const fs::path locked = ws.path("locked");
    ASSERT_EQ(::chmod(locked.c_str(), 0000), 0);

    SearchResult r;
    EXPECT_NO_THROW(r = search.SearchDirectory("needle", ""));
    ::chmod(locked.c_str(), 0755);

    ASSERT_EQ(r.errors.size(), 1u);
    EXPECT_EQ(r.errors[0].path, locked.string());
    EXPECT_EQ(r.errors[0].error.rfind("PermissionDenied:", 0), 0u) << r.errors[0].error;
    ASSERT_EQ(r.matches.size(), 2u);
    EXPECT_EQ(r.matches[0].filePath, (ws.root() / "a.txt").string());
    EXPECT_EQ(r.matches[1].filePath, (ws.root() / "z.txt").string());
    EXPECT_EQ(r.filesScanned, 2u);
}

TEST_F(TextSearchTest, DoesNotFollowSymlinkedDirectories) {
    ws.write("real/f.txt", "needle\n");
    fs::create_directory_symlink(ws.path("real"), ws.path("link"));
    fs::create_symlink(ws.path("gone.txt"), ws.path("dangling"));
    auto r = search.SearchDirectory("needle", "");
    ASSERT_EQ(r.matches.size(), 1u);
    EXPECT_EQ(r.matches[0].filePath, (ws.root() / "real" / "f.txt").string());
    EXPECT_TRUE(r.errors.empty());
}

TEST_F(TextSearchTest, ScopeErrors) {
    ws.write("f.txt", "x");
    EXPECT_EQ(failureCategory([&] { search.SearchDirectory("x", "missing"); }), errors::ErrorCategory::NotFound);
    EXPECT_EQ(failureCategory([&] { search.SearchDirectory("x", "f.txt"); }), errors::ErrorCategory::NotADirectory);
    EXPECT_EQ(failureCategory([&] { search.SearchFile("x", "missing.txt"); }), errors::ErrorCategory::NotFound);
}

TEST_F(TextSearchTest, ReplaceAllThenNothingLeft) {
    ws.write("f.txt", "old old\nold\n");
    auto r = search.Replace("f.txt", "old", "new");
    EXPECT_EQ(r.replacements, 3u);
    EXPECT_TRUE(r.backupCreated);
    EXPECT_EQ(ws.read("f.txt"), "new new\nnew\n");
    EXPECT_EQ(ws.read("f.txt.bak"), "old old\nold\n");

    auto again = search.Replace("f.txt", "old", "new");
    EXPECT_EQ(again.replacements, 0u);
    EXPECT_FALSE(again.backupCreated);
    EXPECT_EQ(ws.read("f.txt"), "new new\nnew\n");
    // The earlier backup is untouched by a no-op replace.
    EXPECT_EQ(ws.read("f.txt.bak"), "old old\nold\n");
}

TEST_F(TextSearchTest, ReplaceHonorsCount) {
    ws.write("f.txt", "aaaa");
    auto r = search.Replace("f.txt", "a", "b", 2, false);
    EXPECT_EQ(r.replacements, 2u);
    EXPECT_FALSE(r.backupCreated);
    EXPECT_EQ(ws.read("f.txt"), "bbaa");
    EXPECT_FALSE(fs::exists(ws.path("f.txt.bak")));

    auto none = search.Replace("f.txt", "a", "b", 0);
    EXPECT_EQ(none.replacements, 0u);
    EXPECT_EQ(ws.read("f.txt"), "bbaa");
}

TEST_F(TextSearchTest, ReplaceDoesNotRescanInsertedText) {
    ws.write("f.txt", "ab");
    auto r = search.Replace("f.txt", "a", "aa");
    EXPECT_EQ(r.replacements, 1u);
    EXPECT_EQ(ws.read("f.txt"), "aab");
}

TEST_F(TextSearchTest, ReplaceValidation) {
    ws.write("f.txt", "x");
    EXPECT_EQ(failureCategory([&] { search.Replace("f.txt", "", "y"); }), errors::ErrorCategory::Validation);
    EXPECT_EQ(failureCategory([&] { search.Replace("f.txt", "x", "y", -2); }), errors::ErrorCategory::Validation);
    EXPECT_EQ(failureCategory([&] { search.Replace("missing.txt", "x", "y"); }), errors::ErrorCategory::NotFound);
}
