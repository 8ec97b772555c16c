//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StandardActions.cpp
// Purpose: Handlers for the action catalog: argument extraction, tool calls and result shaping
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include "logging/Logger.h"
#include "toolgate/StandardActions.h"
#include "toolgate/errors/Errors.h"
#include "toolgate/tools/Encoding.h"
#include "toolgate/tools/MockFactory.h"
#include "toolgate/tools/TextSearch.h"

namespace toolgate {

namespace {

// Schema validation ran before any handler, so required members are present with the right type.
std::string requireString(const JSONValue& data, const char* key) {
    return GetStringMember(data, key).value_or(std::string());
}

double getNumber(const JSONValue& data, const char* key, double fallback) {
    const JSONValue* v = FindMember(data, key);
    if (v == nullptr) return fallback;
    if (std::holds_alternative<int64_t>(v->value)) return static_cast<double>(std::get<int64_t>(v->value));
    if (std::holds_alternative<double>(v->value)) return std::get<double>(v->value);
    return fallback;
}

JSONValue nullableString(const std::string& s) {
    return s.empty() ? JSONValue(nullptr) : JSONValue(s);
}

JSONValue u64(uint64_t v) {
    return JSONValue(static_cast<int64_t>(v));
}

JSONValue::Object searchResultToObject(const tools::SearchResult& r) {
    JSONValue::Array matches;
    matches.reserve(r.matches.size());
    for (const auto& m : r.matches) {
        JSONValue::Object o;
        SetMember(o, "file_path", JSONValue(m.filePath));
        SetMember(o, "line_number", u64(m.lineNumber));
        SetMember(o, "line_text", JSONValue(m.lineText));
        SetMember(o, "match_start", u64(m.matchStart));
        SetMember(o, "match_end", u64(m.matchEnd));
        matches.push_back(std::make_shared<JSONValue>(std::move(o)));
    }
    JSONValue::Array errs;
    for (const auto& e : r.errors) {
        JSONValue::Object o;
        SetMember(o, "path", JSONValue(e.path));
        SetMember(o, "error", JSONValue(e.error));
        errs.push_back(std::make_shared<JSONValue>(std::move(o)));
    }
    JSONValue::Object out;
    SetMember(out, "total_matches", u64(r.matches.size()));
    SetMember(out, "matches", JSONValue(std::move(matches)));
    SetMember(out, "files_scanned", u64(r.filesScanned));
    SetMember(out, "files_skipped", u64(r.filesSkipped));
    SetMember(out, "errors", JSONValue(std::move(errs)));
    return out;
}

// Payload forwarded to the collaborator: the request data plus resolved defaults.
JSONValue withMember(const JSONValue& data, const std::string& key, JSONValue value) {
    JSONValue copy = data;
    SetMember(std::get<JSONValue::Object>(copy.value), key, std::move(value));
    return copy;
}

void registerFileActions(ActionRegistry& registry, const std::shared_ptr<tools::FileMutator>& files) {
    registry.Register(Action::ReadFile, "Read a text file",
        ActionSchema{}.Required("file_path", FieldType::String).Optional("encoding", FieldType::String),
        [files](const JSONValue& data) {
            const auto encoding = tools::ParseEncoding(GetStringMember(data, "encoding").value_or("utf-8"));
            const std::string path = requireString(data, "file_path");
            tools::ReadResult r = files->Read(path, encoding);
            JSONValue::Object out;
            SetMember(out, "file_path", JSONValue(files->Resolve(path).string()));
            SetMember(out, "content", JSONValue(std::move(r.content)));
            SetMember(out, "size", u64(r.size));
            SetMember(out, "encoding", JSONValue(tools::EncodingName(r.encoding)));
            return ActionResult{"File read successfully", std::move(out)};
        },
        "Failed to read file");

    registry.Register(Action::WriteFile, "Write a text file, backing up the previous content",
        ActionSchema{}.Required("file_path", FieldType::String).Required("content", FieldType::String)
                      .Optional("encoding", FieldType::String).Optional("backup", FieldType::Boolean),
        [files](const JSONValue& data) {
            const auto encoding = tools::ParseEncoding(GetStringMember(data, "encoding").value_or("utf-8"));
            const std::string path = requireString(data, "file_path");
            tools::WriteResult w = files->Write(path, requireString(data, "content"), encoding,
                                                GetBoolMember(data, "backup").value_or(true));
            JSONValue::Object out;
            SetMember(out, "file_path", JSONValue(files->Resolve(path).string()));
            SetMember(out, "bytes_written", u64(w.bytesWritten));
            SetMember(out, "backup_created", JSONValue(w.backupCreated));
            SetMember(out, "backup_path", nullableString(w.backupPath));
            return ActionResult{"File written successfully", std::move(out)};
        },
        "Failed to write file");

    registry.Register(Action::ListDirectory, "List the entries of a directory",
        ActionSchema{}.Optional("directory", FieldType::String),
        [files](const JSONValue& data) {
            const std::string dir = GetStringMember(data, "directory").value_or("");
            const auto entries = files->List(dir);
            JSONValue::Array arr;
            arr.reserve(entries.size());
            for (const auto& e : entries) {
                JSONValue::Object o;
                SetMember(o, "name", JSONValue(e.name));
                SetMember(o, "path", JSONValue(e.path));
                SetMember(o, "type", JSONValue(e.type));
                SetMember(o, "size", u64(e.size));
                SetMember(o, "modified", nullableString(e.modified));
                arr.push_back(std::make_shared<JSONValue>(std::move(o)));
            }
            JSONValue::Object out;
            SetMember(out, "directory", JSONValue((dir.empty() ? files->WorkspaceRoot() : files->Resolve(dir)).string()));
            SetMember(out, "count", u64(entries.size()));
            SetMember(out, "entries", JSONValue(std::move(arr)));
            return ActionResult{"Directory listed successfully", std::move(out)};
        },
        "Failed to list directory");

    registry.Register(Action::SearchText, "Search a file or directory tree for a literal or regex pattern",
        ActionSchema{}.Required("pattern", FieldType::String).Optional("file_path", FieldType::String)
                      .Optional("directory", FieldType::String).Optional("case_sensitive", FieldType::Boolean)
                      .Optional("regex", FieldType::Boolean),
        [files](const JSONValue& data) {
            const auto filePath = GetStringMember(data, "file_path");
            const auto directory = GetStringMember(data, "directory");
            if (filePath.has_value() == directory.has_value()) {
                throw errors::validationError("exactly one of 'file_path' or 'directory' is required");
            }
            tools::SearchOptions opts;
            opts.caseSensitive = GetBoolMember(data, "case_sensitive").value_or(false);
            opts.regex = GetBoolMember(data, "regex").value_or(false);
            tools::TextSearch search(*files);
            const std::string pattern = requireString(data, "pattern");
            tools::SearchResult r = filePath ? search.SearchFile(pattern, *filePath, opts)
                                             : search.SearchDirectory(pattern, *directory, opts);
            return ActionResult{"Search completed", searchResultToObject(r)};
        },
        "Failed to search text");

    registry.Register(Action::ReplaceText, "Replace literal text in a file",
        ActionSchema{}.Required("file_path", FieldType::String).Required("old_text", FieldType::String)
                      .Required("new_text", FieldType::String).Optional("count", FieldType::Integer)
                      .Optional("backup", FieldType::Boolean),
        [files](const JSONValue& data) {
            tools::TextSearch search(*files);
            const std::string path = requireString(data, "file_path");
            tools::ReplaceResult r = search.Replace(path, requireString(data, "old_text"), requireString(data, "new_text"),
                                                    GetIntMember(data, "count").value_or(-1),
                                                    GetBoolMember(data, "backup").value_or(true));
            JSONValue::Object out;
            SetMember(out, "file_path", JSONValue(files->Resolve(path).string()));
            SetMember(out, "replacements", u64(r.replacements));
            SetMember(out, "backup_created", JSONValue(r.backupCreated));
            SetMember(out, "backup_path", nullableString(r.backupPath));
            return ActionResult{r.replacements > 0 ? "Text replaced successfully" : "No occurrences replaced", std::move(out)};
        },
        "Failed to replace text");

    registry.Register(Action::CreateMock, "Create a test fixture (file, directory or canned response)",
        ActionSchema{}.Required("mock_type", FieldType::String).Required("mock_data", FieldType::Object),
        [files](const JSONValue& data) {
            tools::MockFactory factory(*files);
            const JSONValue* mockData = FindMember(data, "mock_data");
            return ActionResult{"Mock created successfully",
                                factory.Create(requireString(data, "mock_type"), *mockData)};
        },
        "Failed to create mock");
}

void registerCommandAction(ActionRegistry& registry, const std::shared_ptr<tools::CommandRunner>& commands) {
    registry.Register(Action::ExecuteCommand, "Run a shell command with a timeout",
        ActionSchema{}.Required("command", FieldType::String).Optional("working_directory", FieldType::String)
                      .Optional("timeout", FieldType::Number),
        [commands](const JSONValue& data) {
            const std::string command = requireString(data, "command");
            const double timeout = getNumber(data, "timeout", commands->GetOptions().defaultTimeoutSeconds);
            tools::CommandResult r = commands->Execute(command, GetStringMember(data, "working_directory").value_or(""),
                                                       timeout);
            JSONValue::Object out;
            SetMember(out, "command", JSONValue(command));
            SetMember(out, "stdout", JSONValue(std::move(r.stdoutText)));
            SetMember(out, "stderr", JSONValue(std::move(r.stderrText)));
            SetMember(out, "exit_code", JSONValue(static_cast<int64_t>(r.exitCode)));
            SetMember(out, "timed_out", JSONValue(r.timedOut));
            SetMember(out, "duration_ms", JSONValue(r.durationMs));
            SetMember(out, "stdout_truncated", JSONValue(r.stdoutTruncated));
            SetMember(out, "stderr_truncated", JSONValue(r.stderrTruncated));
            return ActionResult{r.timedOut ? "Command timed out" : "Command executed", std::move(out)};
        },
        "Failed to execute command");
}

void registerCollaboratorActions(ActionRegistry& registry, const std::shared_ptr<ICollaborator>& collaborator) {
    registry.Register(Action::AnalyzeCode, "Analyze code for issues and suggestions",
        ActionSchema{}.Required("code", FieldType::String).Required("language", FieldType::String)
                      .Optional("context", FieldType::String),
        [collaborator](const JSONValue& data) {
            JSONValue::Object out;
            SetMember(out, "analysis", JSONValue(collaborator->Invoke("analyze_code", data)));
            return ActionResult{"Code analysis completed", std::move(out)};
        },
        "Failed to analyze code");

    registry.Register(Action::GenerateCode, "Generate code from a description",
        ActionSchema{}.Required("description", FieldType::String).Required("language", FieldType::String)
                      .Optional("context", FieldType::String).Optional("existing_code", FieldType::String),
        [collaborator](const JSONValue& data) {
            JSONValue::Object out;
            SetMember(out, "generated_code", JSONValue(collaborator->Invoke("generate_code", data)));
            return ActionResult{"Code generated successfully", std::move(out)};
        },
        "Failed to generate code");

    registry.Register(Action::GenerateTests, "Generate unit tests for code",
        ActionSchema{}.Required("code", FieldType::String).Required("language", FieldType::String)
                      .Optional("test_framework", FieldType::String),
        [collaborator](const JSONValue& data) {
            const std::string framework = GetStringMember(data, "test_framework")
                .value_or(DefaultTestFramework(requireString(data, "language")));
            const JSONValue payload = withMember(data, "test_framework", JSONValue(framework));
            JSONValue::Object out;
            SetMember(out, "test_code", JSONValue(collaborator->Invoke("generate_tests", payload)));
            SetMember(out, "test_framework", JSONValue(framework));
            return ActionResult{"Tests generated successfully", std::move(out)};
        },
        "Failed to generate tests");

    registry.Register(Action::RefactorCode, "Refactor code",
        ActionSchema{}.Required("code", FieldType::String).Required("language", FieldType::String)
                      .Required("refactoring_type", FieldType::String),
        [collaborator](const JSONValue& data) {
            JSONValue::Object out;
            SetMember(out, "refactored_code", JSONValue(collaborator->Invoke("refactor_code", data)));
            SetMember(out, "refactoring_type", JSONValue(requireString(data, "refactoring_type")));
            return ActionResult{"Code refactored successfully", std::move(out)};
        },
        "Failed to refactor code");

    registry.Register(Action::PlanTask, "Break a task into steps",
        ActionSchema{}.Required("task", FieldType::String).Optional("context", FieldType::String)
                      .Optional("constraints", FieldType::String),
        [collaborator](const JSONValue& data) {
            const std::string text = collaborator->Invoke("plan_task", data);
            JSONValue plan(text);
            // Structured plans are embedded as objects; free text stays a string
            try {
                JSONValue parsed = ParseJSON(text);
                if (parsed.IsObject()) plan = std::move(parsed);
            } catch (const JSONParseError&) {
                LOG_DEBUG("plan_task: collaborator returned a free-text plan");
            }
            JSONValue::Object out;
            SetMember(out, "plan", std::move(plan));
            SetMember(out, "task", JSONValue(requireString(data, "task")));
            return ActionResult{"Plan created successfully", std::move(out)};
        },
        "Failed to plan task");
}

} // namespace

std::string DefaultTestFramework(const std::string& language) {
    std::string l = language;
    std::transform(l.begin(), l.end(), l.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    if (l == "python") return "pytest";
    if (l == "javascript" || l == "typescript") return "jest";
    if (l == "java") return "junit";
    if (l == "csharp" || l == "c#") return "nunit";
    if (l == "go") return "testing";
    if (l == "cpp" || l == "c++") return "gtest";
    return "pytest";
}

void RegisterStandardActions(ActionRegistry& registry, const ToolContext& context) {
    if (!context.files || !context.commands || !context.collaborator) {
        throw std::invalid_argument("RegisterStandardActions: ToolContext members must be non-null");
    }
    registerFileActions(registry, context.files);
    registerCommandAction(registry, context.commands);
    registerCollaboratorActions(registry, context.collaborator);
    LOG_INFO("Registered {} actions (collaborator: {})", registry.ListActions().size(), context.collaborator->Name());
}

} // namespace toolgate
