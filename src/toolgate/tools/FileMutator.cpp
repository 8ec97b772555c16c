//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: FileMutator.cpp
// Purpose: POSIX implementation of workspace file operations (atomic replace, durable backups)
//==========================================================================================================

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <ctime>
#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <fmt/format.h>

#include "logging/Logger.h"
#include "toolgate/errors/Errors.h"
#include "toolgate/tools/FileMutator.h"

namespace fs = std::filesystem;

namespace toolgate {
namespace tools {

namespace {

// Owns a file descriptor; closes it on scope exit.
class UniqueFd {
public:
    explicit UniqueFd(int fd = -1) : fd_(fd) {}
    ~UniqueFd() { reset(); }
    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }
    void reset() {
        if (fd_ >= 0) { ::close(fd_); fd_ = -1; }
    }
    // Explicit close whose failure is reported (close can surface deferred write errors)
    int close() {
        int rc = ::close(fd_);
        fd_ = -1;
        return rc;
    }

private:
    int fd_;
};

// Unlinks a temporary path unless release() was called after a successful rename.
class TempPathGuard {
public:
    explicit TempPathGuard(std::string path) : path_(std::move(path)) {}
    ~TempPathGuard() {
        if (!path_.empty()) { ::unlink(path_.c_str()); }
    }
    TempPathGuard(const TempPathGuard&) = delete;
    TempPathGuard& operator=(const TempPathGuard&) = delete;
    void release() { path_.clear(); }

private:
    std::string path_;
};

void writeAll(int fd, const std::string& bytes, const std::string& path) {
    std::size_t written = 0;
    while (written < bytes.size()) {
        ssize_t n = ::write(fd, bytes.data() + written, bytes.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw errors::errnoError(errno, path);
        }
        written += static_cast<std::size_t>(n);
    }
}

void syncDirectory(const fs::path& dir) {
    UniqueFd fd(::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC));
    if (!fd.valid()) {
        throw errors::errnoError(errno, dir.string(), "directory");
    }
    if (::fsync(fd.get()) != 0) {
        throw errors::GatewayError(errors::ErrorCategory::Disk,
                                   fmt::format("fsync failed for directory {}: {}", dir.string(), std::strerror(errno)));
    }
}

//==========================================================================================================
// replaceFileAtomically
// Purpose: Writes bytes to a temporary sibling, fsyncs it, renames it over target, fsyncs the directory.
// Args:
//   target: Destination path.
//   bytes: Full new content.
//   mode: Permission bits applied to the new file.
//==========================================================================================================
void replaceFileAtomically(const fs::path& target, const std::string& bytes, mode_t mode) {
    const fs::path dir = target.parent_path();
    std::string tmpl = (dir / ("." + target.filename().string() + ".tmp.XXXXXX")).string();
    UniqueFd fd(::mkostemp(tmpl.data(), O_CLOEXEC));
    if (!fd.valid()) {
        throw errors::errnoError(errno, target.string());
    }
    TempPathGuard guard(tmpl);

    writeAll(fd.get(), bytes, target.string());
    if (::fchmod(fd.get(), mode) != 0) {
        throw errors::errnoError(errno, target.string());
    }
    if (::fsync(fd.get()) != 0) {
        throw errors::GatewayError(errors::ErrorCategory::Disk,
                                   fmt::format("fsync failed for {}: {}", target.string(), std::strerror(errno)));
    }
    if (fd.close() != 0) {
        throw errors::errnoError(errno, target.string());
    }
    if (::rename(tmpl.c_str(), target.c_str()) != 0) {
        throw errors::errnoError(errno, target.string());
    }
    guard.release();
    syncDirectory(dir);
}

std::string isoUtc(const struct timespec& ts) {
    std::tm tm{};
    ::gmtime_r(&ts.tv_sec, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

} // namespace

FileMutator::FileMutator(fs::path workspaceRoot) {
    if (workspaceRoot.empty()) {
        workspaceRoot = fs::current_path();
    }
    root_ = fs::absolute(workspaceRoot).lexically_normal();
    // Drop a trailing separator so containment checks compare path components
    if (root_.has_relative_path() && root_.filename().empty()) {
        root_ = root_.parent_path();
    }
}

fs::path FileMutator::Resolve(const std::string& path) const {
    if (path.empty()) {
        throw errors::validationError("path must not be empty");
    }
    fs::path p(path);
    if (p.is_relative()) {
        p = root_ / p;
    }
    return p.lexically_normal();
}

bool FileMutator::IsInsideWorkspace(const fs::path& absolute) const {
    const fs::path rel = absolute.lexically_normal().lexically_relative(root_);
    if (rel.empty()) return false;
    if (rel == ".") return true;
    return *rel.begin() != "..";
}

fs::path FileMutator::BackupPathFor(const fs::path& target) {
    fs::path b = target;
    b += ".bak";
    return b;
}

std::string FileMutator::ReadBytes(const fs::path& absolute) const {
    UniqueFd fd(::open(absolute.c_str(), O_RDONLY | O_CLOEXEC));
    if (!fd.valid()) {
        throw errors::errnoError(errno, absolute.string());
    }
    struct stat st{};
    if (::fstat(fd.get(), &st) != 0) {
        throw errors::errnoError(errno, absolute.string());
    }
    if (S_ISDIR(st.st_mode)) {
        throw errors::validationError("path is a directory: " + absolute.string());
    }
    std::string bytes;
    if (st.st_size > 0) bytes.reserve(static_cast<std::size_t>(st.st_size));
    char buf[64 * 1024];
    for (;;) {
        ssize_t n = ::read(fd.get(), buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            throw errors::errnoError(errno, absolute.string());
        }
        if (n == 0) break;
        bytes.append(buf, static_cast<std::size_t>(n));
    }
    return bytes;
}

ReadResult FileMutator::Read(const std::string& path, TextEncoding encoding) const {
    const fs::path target = Resolve(path);
    std::string bytes = ReadBytes(target);
    ReadResult r;
    r.size = bytes.size();
    r.encoding = encoding;
    r.content = DecodeBytes(bytes, encoding, target.string());
    LOG_DEBUG("Read {} bytes from {}", r.size, target.string());
    return r;
}

WriteResult FileMutator::Write(const std::string& path, const std::string& content,
                               TextEncoding encoding, bool backup) const {
    const fs::path target = Resolve(path);
    // Encode before touching the filesystem so an unencodable payload changes nothing
    const std::string bytes = EncodeText(content, encoding);
    return WriteBytes(target, bytes, backup);
}

WriteResult FileMutator::WriteBytes(const fs::path& target, const std::string& bytes, bool backup) const {
    if (target.filename().empty()) {
        throw errors::validationError("path is a directory: " + target.string());
    }
    struct stat st{};
    bool exists = false;
    mode_t mode = 0644;
    if (::stat(target.c_str(), &st) == 0) {
        if (S_ISDIR(st.st_mode)) {
            throw errors::validationError("path is a directory: " + target.string());
        }
        exists = true;
        mode = st.st_mode & 07777;
    } else if (errno != ENOENT) {
        throw errors::errnoError(errno, target.string());
    }

    if (!exists) {
        std::error_code ec;
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            throw errors::errnoError(ec.value(), target.parent_path().string(), "directory");
        }
    }

    WriteResult result;
    if (backup && exists) {
        const fs::path backupPath = BackupPathFor(target);
        replaceFileAtomically(backupPath, ReadBytes(target), mode);
        result.backupCreated = true;
        result.backupPath = backupPath.string();
        LOG_DEBUG("Backed up {} to {}", target.string(), result.backupPath);
    }

    replaceFileAtomically(target, bytes, mode);
    result.bytesWritten = bytes.size();
    LOG_DEBUG("Wrote {} bytes to {}", result.bytesWritten, target.string());
    return result;
}

std::vector<DirectoryEntry> FileMutator::List(const std::string& directory) const {
    const fs::path dir = directory.empty() ? root_ : Resolve(directory);
    struct stat st{};
    if (::stat(dir.c_str(), &st) != 0) {
        throw errors::errnoError(errno, dir.string(), "directory");
    }
    if (!S_ISDIR(st.st_mode)) {
        throw errors::GatewayError(errors::ErrorCategory::NotADirectory, "not a directory: " + dir.string());
    }

    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        throw errors::errnoError(ec.value(), dir.string(), "directory");
    }
    std::vector<DirectoryEntry> out;
    const fs::directory_iterator end;
    while (it != end) {
        const fs::path p = it->path();
        DirectoryEntry e;
        e.name = p.filename().string();
        e.path = p.string();
        e.type = "other";
        struct stat est{};
        // Follow symlinks; a dangling link is described by the link itself
        if (::stat(p.c_str(), &est) == 0 || ::lstat(p.c_str(), &est) == 0) {
            if (S_ISREG(est.st_mode)) {
                e.type = "file";
            } else if (S_ISDIR(est.st_mode)) {
                e.type = "directory";
            }
            e.size = static_cast<uint64_t>(est.st_size);
            e.modified = isoUtc(est.st_mtim);
        }
        out.push_back(std::move(e));
        it.increment(ec);
        if (ec) {
            throw errors::errnoError(ec.value(), dir.string(), "directory");
        }
    }
    std::sort(out.begin(), out.end(), [](const DirectoryEntry& a, const DirectoryEntry& b){ return a.name < b.name; });
    return out;
}

} // namespace tools
} // namespace toolgate
