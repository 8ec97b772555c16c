//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: MockFactory.h
// Purpose: Test fixture generation for create_mock (files, directory trees, canned responses)
//==========================================================================================================

#pragma once

#include <string>

#include "toolgate/JSONValue.h"
#include "toolgate/tools/FileMutator.h"

namespace toolgate {
namespace tools {

//==========================================================================================================
// MockFactory
// Purpose: Builds fixtures described by (mock_type, mock_data).
// Notes:
//   - "file": {path, content?} writes one file (no backup). Result {mock_type, path, bytes_written}.
//   - "directory": {path, files?: {name: content}} creates a directory and its files.
//     Result {mock_type, path, files_created}.
//   - "response": any object, echoed as a canned success envelope. Result {mock_type, response}.
//   - Fixture paths must resolve inside the workspace root; anything else is a ValidationError.
//==========================================================================================================
class MockFactory {
public:
    explicit MockFactory(const FileMutator& files) : files_(files) {}

    JSONValue::Object Create(const std::string& mockType, const JSONValue& mockData) const;

private:
    JSONValue::Object createFile(const JSONValue& mockData) const;
    JSONValue::Object createDirectory(const JSONValue& mockData) const;
    JSONValue::Object createResponse(const JSONValue& mockData) const;

    std::filesystem::path fixturePath(const JSONValue& mockData) const;

    const FileMutator& files_;
};

} // namespace tools
} // namespace toolgate
