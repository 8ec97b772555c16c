//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: FileMutator.h
// Purpose: Workspace-relative file read, durable write-with-backup, and directory listing
//==========================================================================================================

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "toolgate/tools/Encoding.h"

namespace toolgate {
namespace tools {

struct ReadResult {
    std::string content;   // UTF-8
    uint64_t size{0};      // bytes on disk
    TextEncoding encoding{TextEncoding::Utf8};
};

struct WriteResult {
    uint64_t bytesWritten{0};
    bool backupCreated{false};
    std::string backupPath;  // empty when no backup was taken
};

struct DirectoryEntry {
    std::string name;
    std::string path;      // absolute
    std::string type;      // "file" | "directory" | "other"
    uint64_t size{0};
    std::string modified;  // ISO-8601 UTC, e.g. 2025-01-31T12:00:00Z
};

//==========================================================================================================
// FileMutator
// Purpose: File operations rooted at a workspace directory.
// Notes:
//   - Relative paths resolve against the workspace root; absolute paths are used as given.
//   - Writes go to a temporary sibling that is fsync'ed and renamed over the target, so readers see
//     either the old or the new content.
//   - A backup is the single sibling "<path>.bak", replaced by each new backup of the same path and
//     made durable before the target is touched.
//   - All failures throw errors::GatewayError.
//==========================================================================================================
class FileMutator {
public:
    explicit FileMutator(std::filesystem::path workspaceRoot);

    const std::filesystem::path& WorkspaceRoot() const { return root_; }

    // Absolute, lexically normalized path for a request path.
    std::filesystem::path Resolve(const std::string& path) const;

    // Lexical containment check against the workspace root (no symlink resolution).
    bool IsInsideWorkspace(const std::filesystem::path& absolute) const;

    //==========================================================================================================
    // Read
    // Purpose: Reads a file and decodes it to UTF-8.
    // Throws:
    //   NotFound, PermissionDenied, DecodeError, ValidationError when the path is a directory.
    //==========================================================================================================
    ReadResult Read(const std::string& path, TextEncoding encoding = TextEncoding::Utf8) const;

    // Raw bytes of an absolute path (same errors as Read, minus decoding).
    std::string ReadBytes(const std::filesystem::path& absolute) const;

    //==========================================================================================================
    // Write
    // Purpose: Encodes content, optionally backs up the current file, then atomically replaces it.
    // Args:
    //   path: Target path; parent directories are created.
    //   content: UTF-8 text.
    //   encoding: Target encoding; characters it cannot represent are a ValidationError.
    //   backup: Take "<path>.bak" first when the target exists.
    // Throws:
    //   PermissionDenied, DiskError, ValidationError (not encodable, target is a directory).
    //==========================================================================================================
    WriteResult Write(const std::string& path, const std::string& content,
                      TextEncoding encoding = TextEncoding::Utf8, bool backup = true) const;

    // Same as Write with already-encoded bytes and an absolute path.
    WriteResult WriteBytes(const std::filesystem::path& absolute, const std::string& bytes, bool backup) const;

    //==========================================================================================================
    // List
    // Purpose: Immediate entries of a directory sorted by name. Empty path means the workspace root.
    // Throws:
    //   NotFound, NotADirectory, PermissionDenied.
    //==========================================================================================================
    std::vector<DirectoryEntry> List(const std::string& directory = std::string()) const;

    static std::filesystem::path BackupPathFor(const std::filesystem::path& target);

private:
    std::filesystem::path root_;
};

} // namespace tools
} // namespace toolgate
