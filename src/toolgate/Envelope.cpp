//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Envelope.cpp
// Purpose: Request envelope parsing and response envelope construction/serialization
//==========================================================================================================

#include <algorithm>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

#include "toolgate/Envelope.h"

namespace toolgate {

std::string RequestIdKey(const JSONValue& id) {
    // Type-tagged (1, 1.0 and "1" differ); object members in sorted key order
    std::string out;
    std::visit([&out](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            out += "n";
        } else if constexpr (std::is_same_v<T, bool>) {
            out += v ? "b:1" : "b:0";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            out += "i:" + std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
            out += "d:" + SerializeJSON(JSONValue(v));
        } else if constexpr (std::is_same_v<T, std::string>) {
            out += "s:" + SerializeJSON(JSONValue(v));
        } else if constexpr (std::is_same_v<T, JSONValue::Array>) {
            out += "a[";
            for (const auto& e : v) {
                out += e ? RequestIdKey(*e) : std::string("n");
                out += ',';
            }
            out += ']';
        } else if constexpr (std::is_same_v<T, JSONValue::Object>) {
            std::vector<std::string> keys;
            keys.reserve(v.size());
            for (const auto& kv : v) keys.push_back(kv.first);
            std::sort(keys.begin(), keys.end());
            out += "o{";
            for (const auto& k : keys) {
                const auto& e = v.at(k);
                out += SerializeJSON(JSONValue(k)) + ":" + (e ? RequestIdKey(*e) : std::string("n")) + ",";
            }
            out += '}';
        }
    }, id.get());
    return out;
}

std::string RequestEnvelope::Serialize() const {
    JSONValue::Object obj;
    SetMember(obj, "action", JSONValue(action));
    SetMember(obj, "data", data);
    if (hasRequestId) {
        SetMember(obj, "request_id", requestId);
    }
    return SerializeJSON(JSONValue(std::move(obj)));
}

RequestEnvelope ParseRequestEnvelope(const std::string& text) {
    JSONValue root;
    try {
        root = ParseJSON(text);
    } catch (const JSONParseError& e) {
        throw InvalidEnvelope("Invalid JSON", std::string("failed to parse message as JSON: ") + e.what(), JSONValue());
    }
    if (!root.IsObject()) {
        throw InvalidEnvelope("Invalid request", std::string("request must be a JSON object, got ") + TypeName(root), JSONValue());
    }

    RequestEnvelope req;
    // Recover the request_id first so every later rejection can still be correlated
    if (const JSONValue* id = FindMember(root, "request_id")) {
        req.requestId = *id;
        req.hasRequestId = true;
    }

    const JSONValue* action = FindMember(root, "action");
    if (action == nullptr || action->IsNull()) {
        throw InvalidEnvelope("Invalid request", "missing required field 'action'", req.requestId);
    }
    if (!std::holds_alternative<std::string>(action->value)) {
        throw InvalidEnvelope("Invalid request",
                              std::string("field 'action' must be a string, got ") + TypeName(*action),
                              req.requestId);
    }
    req.action = std::get<std::string>(action->value);
    if (req.action.empty()) {
        throw InvalidEnvelope("Invalid request", "field 'action' must not be empty", req.requestId);
    }

    if (const JSONValue* data = FindMember(root, "data")) {
        if (data->IsObject()) {
            req.data = *data;
        } else if (!data->IsNull()) {
            throw InvalidEnvelope("Invalid request",
                                  std::string("field 'data' must be an object, got ") + TypeName(*data),
                                  req.requestId);
        }
    }
    return req;
}

ResponseEnvelope ResponseEnvelope::Success(std::string message, JSONValue::Object data, JSONValue requestId) {
    ResponseEnvelope r;
    r.success_ = true;
    r.message_ = std::move(message);
    r.data_ = std::move(data);
    r.requestId_ = std::move(requestId);
    return r;
}

ResponseEnvelope ResponseEnvelope::Failure(std::string message, std::string error, JSONValue requestId) {
    ResponseEnvelope r;
    r.success_ = false;
    r.message_ = std::move(message);
    r.error_ = error.empty() ? std::string("InternalError: unspecified failure") : std::move(error);
    r.requestId_ = std::move(requestId);
    return r;
}

ResponseEnvelope ResponseEnvelope::FromError(const std::string& message, const errors::GatewayError& err,
                                             JSONValue requestId) {
    return Failure(message, err.what(), std::move(requestId));
}

JSONValue ResponseEnvelope::ToJSON() const {
    JSONValue::Object obj;
    SetMember(obj, "success", JSONValue(success_));
    SetMember(obj, "message", JSONValue(message_));
    if (success_) {
        SetMember(obj, "data", JSONValue(data_));
        SetMember(obj, "error", JSONValue(nullptr));
    } else {
        SetMember(obj, "data", JSONValue(nullptr));
        SetMember(obj, "error", JSONValue(error_));
    }
    SetMember(obj, "request_id", requestId_);
    return JSONValue(std::move(obj));
}

std::string ResponseEnvelope::Serialize() const {
    return SerializeJSON(ToJSON());
}

ResponseEnvelope ResponseEnvelope::Deserialize(const std::string& text) {
    JSONValue root = ParseJSON(text);
    if (!root.IsObject()) {
        throw std::invalid_argument("response envelope must be a JSON object");
    }
    auto success = GetBoolMember(root, "success");
    if (!success.has_value()) {
        throw std::invalid_argument("response envelope lacks boolean 'success'");
    }
    std::string message = GetStringMember(root, "message").value_or("");
    JSONValue requestId;
    if (const JSONValue* id = FindMember(root, "request_id")) {
        requestId = *id;
    }
    if (*success) {
        const JSONValue* data = FindMember(root, "data");
        if (data == nullptr || !data->IsObject()) {
            throw std::invalid_argument("success envelope must carry an object 'data'");
        }
        return Success(std::move(message), std::get<JSONValue::Object>(data->value), std::move(requestId));
    }
    auto error = GetStringMember(root, "error");
    if (!error.has_value() || error->empty()) {
        throw std::invalid_argument("failure envelope must carry a non-empty 'error'");
    }
    return Failure(std::move(message), std::move(*error), std::move(requestId));
}

} // namespace toolgate
