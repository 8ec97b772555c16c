//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ActionRegistry.h
// Purpose: Closed action catalog, input schemas, and dispatch of request payloads to handlers
//==========================================================================================================

#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "toolgate/Envelope.h"
#include "toolgate/JSONValue.h"

namespace toolgate {

// The closed set of actions a gateway can serve.
enum class Action {
    ReadFile,
    WriteFile,
    ListDirectory,
    SearchText,
    ReplaceText,
    ExecuteCommand,
    AnalyzeCode,
    GenerateCode,
    GenerateTests,
    RefactorCode,
    PlanTask,
    CreateMock
};

// Wire name of an action ("read_file", ...).
const char* ActionName(Action action);
// Inverse of ActionName; std::nullopt for names outside the catalog.
std::optional<Action> ActionFromName(const std::string& name);
// Every action in declaration order.
const std::vector<Action>& AllActions();

enum class FieldType { String, Integer, Number, Boolean, Object };

const char* FieldTypeName(FieldType type);

struct FieldSpec {
    std::string name;
    FieldType type{FieldType::String};
    bool required{false};
};

//==========================================================================================================
// ActionSchema
// Purpose: Input contract of an action: named fields with a JSON type and a required flag.
// Notes:
//   - Members not listed are ignored.
//   - A member explicitly set to null counts as absent.
//==========================================================================================================
struct ActionSchema {
    std::vector<FieldSpec> fields;

    ActionSchema& Required(const std::string& name, FieldType type) {
        fields.push_back(FieldSpec{name, type, true});
        return *this;
    }
    ActionSchema& Optional(const std::string& name, FieldType type) {
        fields.push_back(FieldSpec{name, type, false});
        return *this;
    }

    // Throws errors::GatewayError(Validation) naming the first offending field.
    void Validate(const JSONValue& data) const;

    // JSON-Schema-like description ({type:"object", properties, required}).
    JSONValue ToJSON() const;
};

// Successful handler outcome; becomes {success:true, message, data}.
struct ActionResult {
    std::string message;
    JSONValue::Object data;
};

// Handlers receive the validated data object; failures are reported by throwing errors::GatewayError.
using ActionHandler = std::function<ActionResult(const JSONValue& data)>;

struct ActionInfo {
    Action action;
    std::string name;
    std::string description;
    ActionSchema schema;
    std::string failureMessage;
};

//==========================================================================================================
// ActionRegistry
// Purpose: Startup-time registration of the action catalog followed by concurrent dispatch.
// Notes:
//   - Register() after Seal(), or registering the same action twice, throws std::logic_error.
//   - After Seal() lookups take no lock; Dispatch() is safe from any number of threads.
//   - Dispatch() never throws for request-level problems: every failure becomes an envelope.
//==========================================================================================================
class ActionRegistry {
public:
    ActionRegistry();
    ~ActionRegistry();
    ActionRegistry(const ActionRegistry&) = delete;
    ActionRegistry& operator=(const ActionRegistry&) = delete;

    //==========================================================================================================
    // Register
    // Args:
    //   action: Catalog entry to bind.
    //   description: Human-readable summary for ListActions().
    //   schema: Input contract checked before the handler runs.
    //   handler: Callable executed on a worker thread.
    //   failureMessage: Envelope message used when the handler fails (default "Action failed").
    //==========================================================================================================
    void Register(Action action, const std::string& description, ActionSchema schema, ActionHandler handler,
                  const std::string& failureMessage = "Action failed");

    void Seal();
    bool IsSealed() const;

    bool Contains(const std::string& name) const;

    //==========================================================================================================
    // Dispatch
    // Purpose: Resolves name, validates data against the schema and runs the handler.
    // Returns:
    //   Success envelope with the handler's result or a failure envelope. request_id is left null;
    //   the session attaches it.
    //==========================================================================================================
    ResponseEnvelope Dispatch(const std::string& name, const JSONValue& data) const;

    // Registered actions sorted by name.
    std::vector<ActionInfo> ListActions() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace toolgate
