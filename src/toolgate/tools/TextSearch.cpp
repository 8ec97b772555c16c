//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: TextSearch.cpp
// Purpose: Line-oriented matcher, recursive directory walk and literal replace
//==========================================================================================================

#include <algorithm>
#include <optional>
#include <regex>
#include <system_error>

#include "logging/Logger.h"
#include "toolgate/errors/Errors.h"
#include "toolgate/tools/Encoding.h"
#include "toolgate/tools/TextSearch.h"

namespace fs = std::filesystem;

namespace toolgate {
namespace tools {

namespace {

char foldAscii(char c) {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

// Finds every occurrence of the pattern in a single line.
class LineMatcher {
public:
    LineMatcher(const std::string& pattern, const SearchOptions& options)
        : pattern_(pattern), options_(options) {
        if (pattern.empty()) {
            throw errors::validationError("pattern must not be empty");
        }
        if (options.regex) {
            auto flags = std::regex::ECMAScript;
            if (!options.caseSensitive) flags |= std::regex::icase;
            try {
                regex_.emplace(pattern, flags);
            } catch (const std::regex_error& e) {
                throw errors::validationError("invalid regex '" + pattern + "': " + e.what());
            }
        } else if (!options.caseSensitive) {
            folded_.reserve(pattern.size());
            for (char c : pattern) folded_.push_back(foldAscii(c));
        }
    }

    // Appends [start, end) spans of every match in line.
    void FindAll(const std::string& line, std::vector<std::pair<std::size_t, std::size_t>>& spans) const {
        if (regex_) {
            auto begin = std::sregex_iterator(line.begin(), line.end(), *regex_);
            for (auto it = begin; it != std::sregex_iterator(); ++it) {
                const auto pos = static_cast<std::size_t>(it->position(0));
                spans.emplace_back(pos, pos + static_cast<std::size_t>(it->length(0)));
            }
            return;
        }
        if (options_.caseSensitive) {
            std::size_t pos = line.find(pattern_);
            while (pos != std::string::npos) {
                spans.emplace_back(pos, pos + pattern_.size());
                pos = line.find(pattern_, pos + pattern_.size());
            }
            return;
        }
        std::string foldedLine;
        foldedLine.reserve(line.size());
        for (char c : line) foldedLine.push_back(foldAscii(c));
        std::size_t pos = foldedLine.find(folded_);
        while (pos != std::string::npos) {
            spans.emplace_back(pos, pos + folded_.size());
            pos = foldedLine.find(folded_, pos + folded_.size());
        }
    }

private:
    std::string pattern_;
    std::string folded_;
    SearchOptions options_;
    std::optional<std::regex> regex_;
};

bool isSearchable(const std::string& bytes) {
    if (bytes.find('\0') != std::string::npos) return false;
    return IsValidUtf8(bytes);
}

void scanContent(const std::string& path, const std::string& bytes, const LineMatcher& matcher,
                 std::vector<SearchMatch>& out) {
    std::vector<std::pair<std::size_t, std::size_t>> spans;
    uint64_t lineNumber = 0;
    std::size_t start = 0;
    while (start < bytes.size()) {
        std::size_t nl = bytes.find('\n', start);
        std::size_t end = (nl == std::string::npos) ? bytes.size() : nl;
        ++lineNumber;
        std::string line = bytes.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        spans.clear();
        matcher.FindAll(line, spans);
        for (const auto& [s, e] : spans) {
            out.push_back(SearchMatch{path, lineNumber, line, s, e});
        }
        if (nl == std::string::npos) break;
        start = nl + 1;
    }
}

void walkDirectory(const FileMutator& files, const fs::path& dir, const LineMatcher& matcher, SearchResult& result) {
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        result.errors.push_back(SearchError{dir.string(), errors::errnoError(ec.value(), dir.string(), "directory").what()});
        return;
    }
    std::vector<fs::path> entries;
    const fs::directory_iterator end;
    while (it != end) {
        entries.push_back(it->path());
        it.increment(ec);
        if (ec) {
            result.errors.push_back(SearchError{dir.string(), errors::errnoError(ec.value(), dir.string(), "directory").what()});
            break;
        }
    }
    std::sort(entries.begin(), entries.end(),
              [](const fs::path& a, const fs::path& b){ return a.filename().string() < b.filename().string(); });

    for (const auto& p : entries) {
        const fs::file_status linkStatus = fs::symlink_status(p, ec);
        if (ec) {
            result.errors.push_back(SearchError{p.string(), errors::errnoError(ec.value(), p.string(), "path").what()});
            continue;
        }
        fs::file_status st = linkStatus;
        if (fs::is_symlink(linkStatus)) {
            st = fs::status(p, ec);
            // Dangling links and links to directories are not followed
            if (ec || fs::is_directory(st)) continue;
        }
        if (fs::is_directory(st)) {
            walkDirectory(files, p, matcher, result);
            continue;
        }
        if (!fs::is_regular_file(st)) continue;

        std::string bytes;
        try {
            bytes = files.ReadBytes(p);
        } catch (const errors::GatewayError& e) {
            result.errors.push_back(SearchError{p.string(), e.what()});
            continue;
        }
        if (!isSearchable(bytes)) {
            ++result.filesSkipped;
            continue;
        }
        ++result.filesScanned;
        scanContent(p.string(), bytes, matcher, result.matches);
    }
}

} // namespace

SearchResult TextSearch::SearchFile(const std::string& pattern, const std::string& filePath,
                                    const SearchOptions& options) const {
    LineMatcher matcher(pattern, options);
    const fs::path target = files_.Resolve(filePath);
    SearchResult result;
    const std::string bytes = files_.ReadBytes(target);
    if (!isSearchable(bytes)) {
        ++result.filesSkipped;
        return result;
    }
    ++result.filesScanned;
    scanContent(target.string(), bytes, matcher, result.matches);
    return result;
}

SearchResult TextSearch::SearchDirectory(const std::string& pattern, const std::string& directory,
                                         const SearchOptions& options) const {
    LineMatcher matcher(pattern, options);
    const fs::path root = directory.empty() ? files_.WorkspaceRoot() : files_.Resolve(directory);
    std::error_code ec;
    const fs::file_status st = fs::status(root, ec);
    if (ec || !fs::exists(st)) {
        throw errors::errnoError(ec ? ec.value() : ENOENT, root.string(), "directory");
    }
    if (!fs::is_directory(st)) {
        throw errors::GatewayError(errors::ErrorCategory::NotADirectory, "not a directory: " + root.string());
    }
    SearchResult result;
    walkDirectory(files_, root, matcher, result);
    LOG_DEBUG("Searched {}: {} matches in {} files ({} skipped, {} errors)", root.string(),
              result.matches.size(), result.filesScanned, result.filesSkipped, result.errors.size());
    return result;
}

ReplaceResult TextSearch::Replace(const std::string& filePath, const std::string& oldText, const std::string& newText,
                                  int64_t count, bool backup) const {
    if (oldText.empty()) {
        throw errors::validationError("old_text must not be empty");
    }
    if (count < -1) {
        throw errors::validationError("count must be -1 (all) or a non-negative integer, got " + std::to_string(count));
    }
    const fs::path target = files_.Resolve(filePath);
    const std::string bytes = files_.ReadBytes(target);

    ReplaceResult result;
    std::string out;
    out.reserve(bytes.size());
    std::size_t pos = 0;
    while (count < 0 || result.replacements < static_cast<uint64_t>(count)) {
        std::size_t hit = bytes.find(oldText, pos);
        if (hit == std::string::npos) break;
        out.append(bytes, pos, hit - pos);
        out.append(newText);
        pos = hit + oldText.size();
        ++result.replacements;
    }
    if (result.replacements == 0) {
        return result;
    }
    out.append(bytes, pos, std::string::npos);

    WriteResult w = files_.WriteBytes(target, out, backup);
    result.backupCreated = w.backupCreated;
    result.backupPath = w.backupPath;
    LOG_DEBUG("Replaced {} occurrence(s) in {}", result.replacements, target.string());
    return result;
}

} // namespace tools
} // namespace toolgate
