//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ActionRegistry.cpp
// Purpose: Action catalog names, schema validation and handler dispatch
//==========================================================================================================

#include <algorithm>
#include <atomic>
#include <cmath>
#include <mutex>
#include <stdexcept>
#include <unordered_map>

#include "logging/Logger.h"
#include "toolgate/ActionRegistry.h"
#include "toolgate/errors/Errors.h"

namespace toolgate {

namespace {

struct ActionNameEntry {
    Action action;
    const char* name;
};

constexpr ActionNameEntry kActionNames[] = {
    {Action::ReadFile, "read_file"},
    {Action::WriteFile, "write_file"},
    {Action::ListDirectory, "list_directory"},
    {Action::SearchText, "search_text"},
    {Action::ReplaceText, "replace_text"},
    {Action::ExecuteCommand, "execute_command"},
    {Action::AnalyzeCode, "analyze_code"},
    {Action::GenerateCode, "generate_code"},
    {Action::GenerateTests, "generate_tests"},
    {Action::RefactorCode, "refactor_code"},
    {Action::PlanTask, "plan_task"},
    {Action::CreateMock, "create_mock"},
};

bool matchesType(const JSONValue& v, FieldType type) {
    switch (type) {
        case FieldType::String: return std::holds_alternative<std::string>(v.value);
        case FieldType::Integer: return AsInt64(v).has_value();
        case FieldType::Number:
            return std::holds_alternative<int64_t>(v.value) || std::holds_alternative<double>(v.value);
        case FieldType::Boolean: return std::holds_alternative<bool>(v.value);
        case FieldType::Object: return std::holds_alternative<JSONValue::Object>(v.value);
    }
    return false;
}

} // namespace

const char* ActionName(Action action) {
    for (const auto& e : kActionNames) {
        if (e.action == action) return e.name;
    }
    return "unknown";
}

std::optional<Action> ActionFromName(const std::string& name) {
    for (const auto& e : kActionNames) {
        if (name == e.name) return e.action;
    }
    return std::nullopt;
}

const std::vector<Action>& AllActions() {
    static const std::vector<Action> all = [](){
        std::vector<Action> v;
        for (const auto& e : kActionNames) v.push_back(e.action);
        return v;
    }();
    return all;
}

const char* FieldTypeName(FieldType type) {
    switch (type) {
        case FieldType::String: return "string";
        case FieldType::Integer: return "integer";
        case FieldType::Number: return "number";
        case FieldType::Boolean: return "boolean";
        case FieldType::Object: return "object";
    }
    return "unknown";
}

void ActionSchema::Validate(const JSONValue& data) const {
    if (!data.IsObject()) {
        throw errors::validationError(std::string("data must be an object, got ") + TypeName(data));
    }
    for (const auto& f : fields) {
        const JSONValue* v = FindMember(data, f.name);
        if (v == nullptr || v->IsNull()) {
            if (f.required) {
                throw errors::validationError("missing required field '" + f.name + "'");
            }
            continue;
        }
        if (f.type == FieldType::Integer && std::holds_alternative<double>(v->value) && !AsInt64(*v)) {
            const double d = std::get<double>(v->value);
            if (std::isfinite(d) && std::floor(d) == d) {
                throw errors::validationError("field '" + f.name + "' is out of the 64-bit integer range");
            }
        }
        if (!matchesType(*v, f.type)) {
            throw errors::validationError("field '" + f.name + "' must be " + FieldTypeName(f.type) +
                                          ", got " + TypeName(*v));
        }
    }
}

JSONValue ActionSchema::ToJSON() const {
    JSONValue::Object schema;
    JSONValue::Object props;
    JSONValue::Array required;
    for (const auto& f : fields) {
        JSONValue::Object p;
        SetMember(p, "type", JSONValue(FieldTypeName(f.type)));
        SetMember(props, f.name, JSONValue(std::move(p)));
        if (f.required) required.push_back(std::make_shared<JSONValue>(f.name));
    }
    SetMember(schema, "type", JSONValue("object"));
    SetMember(schema, "properties", JSONValue(std::move(props)));
    SetMember(schema, "required", JSONValue(std::move(required)));
    return JSONValue(std::move(schema));
}

class ActionRegistry::Impl {
public:
    struct Entry {
        ActionInfo info;
        ActionHandler handler;
    };

    std::mutex registryMutex;
    std::atomic<bool> sealed{false};
    std::unordered_map<std::string, Entry> actions;

    // Sealed registries are immutable, so readers skip the mutex
    const Entry* find(const std::string& name) {
        if (sealed.load(std::memory_order_acquire)) {
            auto it = actions.find(name);
            return it == actions.end() ? nullptr : &it->second;
        }
        std::lock_guard<std::mutex> lock(registryMutex);
        auto it = actions.find(name);
        return it == actions.end() ? nullptr : &it->second;
    }
};

ActionRegistry::ActionRegistry() : pImpl(std::make_unique<Impl>()) {}
ActionRegistry::~ActionRegistry() = default;

void ActionRegistry::Register(Action action, const std::string& description, ActionSchema schema,
                              ActionHandler handler, const std::string& failureMessage) {
    const std::string name = ActionName(action);
    std::lock_guard<std::mutex> lock(pImpl->registryMutex);
    if (pImpl->sealed.load()) {
        throw std::logic_error("ActionRegistry is sealed; cannot register '" + name + "'");
    }
    if (!handler) {
        throw std::logic_error("ActionRegistry: empty handler for '" + name + "'");
    }
    if (pImpl->actions.count(name) != 0) {
        throw std::logic_error("ActionRegistry: action '" + name + "' registered twice");
    }
    LOG_DEBUG("Registering action: {}", name);
    Impl::Entry entry{ActionInfo{action, name, description, std::move(schema), failureMessage}, std::move(handler)};
    pImpl->actions.emplace(name, std::move(entry));
}

void ActionRegistry::Seal() {
    std::lock_guard<std::mutex> lock(pImpl->registryMutex);
    pImpl->sealed.store(true, std::memory_order_release);
    LOG_INFO("Action registry sealed with {} actions", pImpl->actions.size());
}

bool ActionRegistry::IsSealed() const {
    return pImpl->sealed.load(std::memory_order_acquire);
}

bool ActionRegistry::Contains(const std::string& name) const {
    return pImpl->find(name) != nullptr;
}

ResponseEnvelope ActionRegistry::Dispatch(const std::string& name, const JSONValue& data) const {
    const Impl::Entry* entry = pImpl->find(name);
    if (entry == nullptr) {
        LOG_DEBUG("Unknown action requested: {}", name);
        return ResponseEnvelope::Failure("Unknown action",
                                         errors::validationError("unknown action '" + name + "'").what());
    }
    try {
        entry->info.schema.Validate(data);
        ActionResult result = entry->handler(data);
        return ResponseEnvelope::Success(std::move(result.message), std::move(result.data));
    } catch (const errors::GatewayError& e) {
        LOG_WARN("Action {} failed: {}", name, e.what());
        return ResponseEnvelope::FromError(entry->info.failureMessage, e);
    } catch (const std::exception& e) {
        LOG_ERROR("Action {} raised an unexpected exception: {}", name, e.what());
        return ResponseEnvelope::FromError(entry->info.failureMessage,
                                           errors::GatewayError(errors::ErrorCategory::Internal, e.what()));
    }
}

std::vector<ActionInfo> ActionRegistry::ListActions() const {
    std::vector<ActionInfo> out;
    {
        std::lock_guard<std::mutex> lock(pImpl->registryMutex);
        out.reserve(pImpl->actions.size());
        for (const auto& kv : pImpl->actions) out.push_back(kv.second.info);
    }
    std::sort(out.begin(), out.end(), [](const ActionInfo& a, const ActionInfo& b){ return a.name < b.name; });
    return out;
}

} // namespace toolgate
