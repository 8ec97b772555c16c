//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: TextSearch.h
// Purpose: Literal/regex text search over a file or directory tree and bounded literal replace
//==========================================================================================================

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "toolgate/tools/FileMutator.h"

namespace toolgate {
namespace tools {

struct SearchOptions {
    bool caseSensitive{false};
    bool regex{false};
};

//==========================================================================================================
// SearchMatch
// Purpose: One occurrence of the pattern.
// Fields:
//   lineNumber: 1-based.
//   lineText: The line without its terminator.
//   matchStart/matchEnd: 0-based byte range [start, end) within lineText.
//==========================================================================================================
struct SearchMatch {
    std::string filePath;
    uint64_t lineNumber{0};
    std::string lineText;
    std::size_t matchStart{0};
    std::size_t matchEnd{0};
};

struct SearchError {
    std::string path;
    std::string error;
};

struct SearchResult {
    std::vector<SearchMatch> matches;
    uint64_t filesScanned{0};
    uint64_t filesSkipped{0};   // not UTF-8 or containing NUL bytes
    std::vector<SearchError> errors;
};

struct ReplaceResult {
    uint64_t replacements{0};
    bool backupCreated{false};
    std::string backupPath;
};

//==========================================================================================================
// TextSearch
// Purpose: Search and replace on top of a FileMutator (path resolution, backup + atomic write).
// Notes:
//   - Literal mode compares bytes, folding ASCII letters when case-insensitive.
//   - Regex mode uses ECMAScript std::regex, icase when case-insensitive.
//   - Directory walks are depth-first with entries sorted per directory; symlinked directories are
//     not followed; per-entry failures are collected in SearchResult::errors.
//==========================================================================================================
class TextSearch {
public:
    explicit TextSearch(const FileMutator& files) : files_(files) {}

    // Throws ValidationError (empty pattern, bad regex, path is a directory), NotFound, PermissionDenied.
    SearchResult SearchFile(const std::string& pattern, const std::string& filePath,
                            const SearchOptions& options = SearchOptions{}) const;

    // Throws ValidationError (empty pattern, bad regex), NotFound, NotADirectory.
    SearchResult SearchDirectory(const std::string& pattern, const std::string& directory,
                                 const SearchOptions& options = SearchOptions{}) const;

    //==========================================================================================================
    // Replace
    // Purpose: Literal left-to-right replacement of at most count occurrences (-1 = all).
    // Notes:
    //   When nothing is replaced the file is neither rewritten nor backed up.
    // Throws:
    //   ValidationError (empty oldText, count < -1), NotFound, PermissionDenied, DiskError.
    //==========================================================================================================
    ReplaceResult Replace(const std::string& filePath, const std::string& oldText, const std::string& newText,
                          int64_t count = -1, bool backup = true) const;

private:
    const FileMutator& files_;
};

} // namespace tools
} // namespace toolgate
