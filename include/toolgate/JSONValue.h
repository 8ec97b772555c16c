//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONValue.h
// Purpose: JSON value type, strict parser and serializer used by the envelope protocol
//==========================================================================================================

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace toolgate {

//==========================================================================================================
// JSONValue
// Purpose: JSON representation backed by std::variant and shared_ptr graphs.
// Fields:
//   Array: vector<shared_ptr<JSONValue>> representing a JSON array.
//   Object: unordered_map<string, shared_ptr<JSONValue>> representing a JSON object.
//   value: variant holding nullptr, bool, int64_t, double, string, Array, or Object.
//==========================================================================================================
struct JSONValue {
    using Array = std::vector<std::shared_ptr<JSONValue>>;
    using Object = std::unordered_map<std::string, std::shared_ptr<JSONValue>>;

    std::variant<
        std::nullptr_t,
        bool,
        int64_t,
        double,
        std::string,
        Array,
        Object
    > value;

    JSONValue();
    JSONValue(const JSONValue&);
    JSONValue(JSONValue&&) noexcept;
    JSONValue& operator=(const JSONValue&);
    JSONValue& operator=(JSONValue&&) noexcept;
    ~JSONValue();

    explicit JSONValue(std::nullptr_t);
    explicit JSONValue(bool v);
    explicit JSONValue(int64_t v);
    explicit JSONValue(double v);
    explicit JSONValue(const char* s);
    explicit JSONValue(const std::string& s);
    explicit JSONValue(std::string&& s);
    explicit JSONValue(const Array& a);
    explicit JSONValue(Array&& a);
    explicit JSONValue(const Object& o);
    explicit JSONValue(Object&& o);

    auto& get() { return value; }
    const auto& get() const { return value; }

    bool IsNull() const { return std::holds_alternative<std::nullptr_t>(value); }
    bool IsObject() const { return std::holds_alternative<Object>(value); }
};

//==========================================================================================================
// JSONParseError
// Purpose: Raised by ParseJSON for malformed input; offset is the byte position of the failure.
//==========================================================================================================
class JSONParseError : public std::runtime_error {
public:
    JSONParseError(const std::string& what, std::size_t offset)
        : std::runtime_error(what + " at offset " + std::to_string(offset)), offset_(offset) {}
    std::size_t offset() const noexcept { return offset_; }

private:
    std::size_t offset_;
};

//==========================================================================================================
// ParseJSON
// Purpose: Parses a complete JSON document (RFC 8259). Trailing non-whitespace is an error.
// Throws:
//   JSONParseError on malformed input or nesting deeper than 256 levels.
//==========================================================================================================
JSONValue ParseJSON(const std::string& text);

//==========================================================================================================
// SerializeJSON
// Purpose: Compact JSON text for a value. Strings are escaped; non-finite doubles become null.
//==========================================================================================================
std::string SerializeJSON(const JSONValue& value);

//------------------------------ Object helpers ------------------------------
// Returns the member or nullptr when value is not an object or the key is absent.
const JSONValue* FindMember(const JSONValue& value, const std::string& key);

inline void SetMember(JSONValue::Object& obj, const std::string& key, JSONValue v) {
    obj[key] = std::make_shared<JSONValue>(std::move(v));
}

std::optional<std::string> GetStringMember(const JSONValue& value, const std::string& key);
std::optional<bool> GetBoolMember(const JSONValue& value, const std::string& key);
std::optional<int64_t> GetIntMember(const JSONValue& value, const std::string& key);

// Integer view of a value: an int64, or a whole double inside [-2^63, 2^63). Otherwise nullopt.
std::optional<int64_t> AsInt64(const JSONValue& value);

// Human-readable JSON type name ("string", "object", ...), used in validation messages.
const char* TypeName(const JSONValue& value);

} // namespace toolgate
