//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: MockFactory.cpp
// Purpose: create_mock fixture builders
//==========================================================================================================

#include <system_error>
#include <utility>
#include <vector>

#include "logging/Logger.h"
#include "toolgate/errors/Errors.h"
#include "toolgate/tools/Encoding.h"
#include "toolgate/tools/MockFactory.h"

namespace fs = std::filesystem;

namespace toolgate {
namespace tools {

namespace {
constexpr const char* kDefaultMockContent = "mock content generated by toolgate\n";
}

JSONValue::Object MockFactory::Create(const std::string& mockType, const JSONValue& mockData) const {
    if (!mockData.IsObject()) {
        throw errors::validationError(std::string("mock_data must be an object, got ") + TypeName(mockData));
    }
    if (mockType == "file") return createFile(mockData);
    if (mockType == "directory") return createDirectory(mockData);
    if (mockType == "response") return createResponse(mockData);
    throw errors::validationError("unsupported mock_type '" + mockType + "' (expected file, directory or response)");
}

fs::path MockFactory::fixturePath(const JSONValue& mockData) const {
    auto path = GetStringMember(mockData, "path");
    if (!path.has_value() || path->empty()) {
        throw errors::validationError("mock_data.path must be a non-empty string");
    }
    const fs::path resolved = files_.Resolve(*path);
    if (!files_.IsInsideWorkspace(resolved) || resolved == files_.WorkspaceRoot()) {
        throw errors::validationError("mock path must stay inside the workspace: " + resolved.string());
    }
    return resolved;
}

JSONValue::Object MockFactory::createFile(const JSONValue& mockData) const {
    const fs::path target = fixturePath(mockData);
    std::string content = kDefaultMockContent;
    if (const JSONValue* c = FindMember(mockData, "content"); c != nullptr && !c->IsNull()) {
        if (!std::holds_alternative<std::string>(c->value)) {
            throw errors::validationError(std::string("mock_data.content must be a string, got ") + TypeName(*c));
        }
        content = std::get<std::string>(c->value);
    }
    WriteResult w = files_.WriteBytes(target, EncodeText(content, TextEncoding::Utf8), false);

    JSONValue::Object out;
    SetMember(out, "mock_type", JSONValue("file"));
    SetMember(out, "path", JSONValue(target.string()));
    SetMember(out, "bytes_written", JSONValue(static_cast<int64_t>(w.bytesWritten)));
    return out;
}

JSONValue::Object MockFactory::createDirectory(const JSONValue& mockData) const {
    const fs::path dir = fixturePath(mockData);
    const JSONValue* filesMember = FindMember(mockData, "files");
    if (filesMember != nullptr && !filesMember->IsNull() && !filesMember->IsObject()) {
        throw errors::validationError(std::string("mock_data.files must be an object, got ") + TypeName(*filesMember));
    }

    // Validate every entry before creating anything
    std::vector<std::pair<fs::path, std::string>> planned;
    if (filesMember != nullptr && filesMember->IsObject()) {
        for (const auto& [name, value] : std::get<JSONValue::Object>(filesMember->value)) {
            if (!value || !std::holds_alternative<std::string>(value->value)) {
                throw errors::validationError("mock_data.files['" + name + "'] must be a string");
            }
            const fs::path rel(name);
            if (name.empty() || rel.is_absolute()) {
                throw errors::validationError("mock file names must be non-empty relative paths: '" + name + "'");
            }
            const fs::path target = (dir / rel).lexically_normal();
            const fs::path within = target.lexically_relative(dir);
            if (within.empty() || *within.begin() == ".." || within == ".") {
                throw errors::validationError("mock file escapes its directory: '" + name + "'");
            }
            planned.emplace_back(target, EncodeText(std::get<std::string>(value->value), TextEncoding::Utf8));
        }
    }

    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        throw errors::errnoError(ec.value(), dir.string(), "directory");
    }
    if (!fs::is_directory(dir, ec)) {
        throw errors::GatewayError(errors::ErrorCategory::NotADirectory, "not a directory: " + dir.string());
    }
    for (const auto& [target, bytes] : planned) {
        files_.WriteBytes(target, bytes, false);
    }
    LOG_DEBUG("Created mock directory {} with {} files", dir.string(), planned.size());

    JSONValue::Object out;
    SetMember(out, "mock_type", JSONValue("directory"));
    SetMember(out, "path", JSONValue(dir.string()));
    SetMember(out, "files_created", JSONValue(static_cast<int64_t>(planned.size())));
    return out;
}

JSONValue::Object MockFactory::createResponse(const JSONValue& mockData) const {
    JSONValue::Object response;
    SetMember(response, "success", JSONValue(true));
    SetMember(response, "message", JSONValue("Mock response"));
    SetMember(response, "data", mockData);

    JSONValue::Object out;
    SetMember(out, "mock_type", JSONValue("response"));
    SetMember(out, "response", JSONValue(std::move(response)));
    return out;
}

} // namespace tools
} // namespace toolgate
