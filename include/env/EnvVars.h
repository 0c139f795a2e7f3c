//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Helpers to read MCPENGINE_* configuration from environment variables.
//==========================================================================================================
#pragma once
#include <cctype>
#include <cstdlib>
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
    const char* raw = std::getenv(name);
    if (raw == nullptr || *raw == '\0') {
        return defaultValue;
    }
    return std::string(raw);
}

//==========================================================================================================
// GetEnvBool
// Purpose: Interprets 1/true/yes/on (case-insensitive) as true and 0/false/no/off as false.
// Args:
//   name: Environment variable name.
//   defaultValue: Returned when unset or unrecognized.
// Returns:
//   Parsed boolean.
//==========================================================================================================
inline bool GetEnvBool(const char* name, bool defaultValue) {
    std::string v = GetEnvOrDefault(name, "");
    for (auto& c : v) c = static_cast<char>(::tolower(static_cast<unsigned char>(c)));
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    return defaultValue;
}

//==========================================================================================================
// GetEnvInt
// Purpose: Parses a signed integer environment value.
// Args:
//   name: Environment variable name.
//   defaultValue: Returned when unset or not a valid integer.
// Returns:
//   Parsed value.
//==========================================================================================================
inline long long GetEnvInt(const char* name, long long defaultValue) {
    const std::string v = GetEnvOrDefault(name, "");
    if (v.empty()) return defaultValue;
    char* end = nullptr;
    long long parsed = std::strtoll(v.c_str(), &end, 10);
    if (end == nullptr || *end != '\0') return defaultValue;
    return parsed;
}
