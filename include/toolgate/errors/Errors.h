//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Error taxonomy for gateway actions, the GatewayError exception and errno mapping helpers
//==========================================================================================================

#pragma once

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>

namespace toolgate {
namespace errors {

// Categorization of every failure an action can report. The category name prefixes the wire error string.
enum class ErrorCategory {
    Validation,
    NotFound,
    NotADirectory,
    PermissionDenied,
    Decode,
    Disk,
    Execution,
    Timeout,
    ExternalService,
    Internal
};

// Wire name of a category ("ValidationError", "NotFound", ...).
inline const char* categoryName(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::Validation: return "ValidationError";
        case ErrorCategory::NotFound: return "NotFound";
        case ErrorCategory::NotADirectory: return "NotADirectory";
        case ErrorCategory::PermissionDenied: return "PermissionDenied";
        case ErrorCategory::Decode: return "DecodeError";
        case ErrorCategory::Disk: return "DiskError";
        case ErrorCategory::Execution: return "ExecutionError";
        case ErrorCategory::Timeout: return "Timeout";
        case ErrorCategory::ExternalService: return "ExternalServiceError";
        case ErrorCategory::Internal: return "InternalError";
    }
    return "InternalError";
}

//==========================================================================================================
// GatewayError
// Purpose: Exception thrown by tools and handlers; caught at the action registry boundary and turned
//          into a failure envelope.
// Fields:
//   category: Failure category.
//   detail: Human-readable detail without the category prefix.
// Notes:
//   what() returns "<CategoryName>: <detail>", which is exactly the envelope's error string.
//==========================================================================================================
class GatewayError : public std::runtime_error {
public:
    GatewayError(ErrorCategory category, const std::string& detail)
        : std::runtime_error(std::string(categoryName(category)) + ": " + detail),
          category_(category), detail_(detail) {}

    ErrorCategory category() const noexcept { return category_; }
    const std::string& detail() const noexcept { return detail_; }

private:
    ErrorCategory category_;
    std::string detail_;
};

// Map an errno value to an ErrorCategory.
//
// Args:
//   err: errno captured right after the failing call.
//
// Returns:
//   NotFound, NotADirectory, PermissionDenied, or Disk for anything else.
inline ErrorCategory errorCategoryFromErrno(int err) {
    switch (err) {
        case ENOENT: return ErrorCategory::NotFound;
        case ENOTDIR: return ErrorCategory::NotADirectory;
        case EACCES:
        case EPERM:
        case EROFS: return ErrorCategory::PermissionDenied;
        default: return ErrorCategory::Disk;
    }
}

// Build a GatewayError for a failed filesystem call on a path.
//
// Args:
//   err: errno value.
//   path: Path the call operated on.
//   subject: Noun used in the not-found message ("file", "directory", "path").
//
// Returns:
//   GatewayError with a category from errorCategoryFromErrno and a specific message.
inline GatewayError errnoError(int err, const std::string& path, const char* subject = "file") {
    const ErrorCategory category = errorCategoryFromErrno(err);
    switch (category) {
        case ErrorCategory::NotFound:
            return GatewayError(category, std::string(subject) + " not found: " + path);
        case ErrorCategory::NotADirectory:
            return GatewayError(category, "not a directory: " + path);
        case ErrorCategory::PermissionDenied:
            return GatewayError(category, "permission denied: " + path);
        default:
            return GatewayError(category, std::string(std::strerror(err)) + ": " + path);
    }
}

inline GatewayError validationError(const std::string& detail) {
    return GatewayError(ErrorCategory::Validation, detail);
}

} // namespace errors
} // namespace toolgate
