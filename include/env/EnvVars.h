//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Helpers to read environment variables safely.
//==========================================================================================================
#pragma once
#include <cstdint>
#include <cstdlib>
#include <stdexcept>
#include <string>

//==========================================================================================================
// GetEnvOrDefault
// Purpose: Returns the value of the environment variable or a provided default when unset/empty.
// Args:
//   name: C-string name of the environment variable. When null or empty, returns defaultValue.
//   defaultValue: Value to return when the variable is not set.
// Returns:
//   std::string with the environment value (when set and non-empty) or defaultValue otherwise.
//==========================================================================================================
inline std::string GetEnvOrDefault(const char* name, const std::string& defaultValue) {
    if (name == nullptr || *name == '\0') {
        return defaultValue;
    }
    const char* v = std::getenv(name);
    if (v == nullptr || *v == '\0') {
        return defaultValue;
    }
    return std::string(v);
}

//==========================================================================================================
// ParseInt64Setting
// Purpose: Strictly parses a decimal integer setting (no trailing characters).
// Args:
//   name: Setting name used in the error message.
//   text: Text to parse.
// Returns:
//   Parsed value. Throws std::invalid_argument naming the setting when text is not an integer.
//==========================================================================================================
inline int64_t ParseInt64Setting(const std::string& name, const std::string& text) {
    std::size_t used = 0;
    long long v = 0;
    try {
        v = std::stoll(text, &used, 10);
    } catch (const std::exception&) {
        throw std::invalid_argument("invalid integer for " + name + ": '" + text + "'");
    }
    if (used != text.size()) {
        throw std::invalid_argument("invalid integer for " + name + ": '" + text + "'");
    }
    return static_cast<int64_t>(v);
}

//==========================================================================================================
// GetEnvInt64OrDefault
// Purpose: Reads an integer environment variable, falling back to a default when unset/empty.
//==========================================================================================================
inline int64_t GetEnvInt64OrDefault(const char* name, int64_t defaultValue) {
    const std::string raw = GetEnvOrDefault(name, "");
    if (raw.empty()) {
        return defaultValue;
    }
    return ParseInt64Setting(name, raw);
}
