//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Helpers to read SSEHOST_* configuration from environment variables.
//==========================================================================================================
#pragma once
#include <cstdlib>
#include <optional>
#include <string>

// Value of `name`, or defaultValue when the variable is unset or the name is empty.
inline std::string GetEnvOrDefault(const char* name, const std::string& defaultValue) {
    if (name == nullptr || *name == '\0') {
        return defaultValue;
    }
    if (const char* v = std::getenv(name)) {
        return std::string(v);
    }
    return defaultValue;
}

//==========================================================================================================
// GetEnvInt
// Purpose: Reads an integer environment variable.
// Returns:
//   The parsed value, or std::nullopt when unset, empty, or not a complete base-10 integer.
//==========================================================================================================
inline std::optional<long> GetEnvInt(const char* name) {
    const std::string raw = GetEnvOrDefault(name, "");
    if (raw.empty()) {
        return std::nullopt;
    }
    char* end = nullptr;
    long v = std::strtol(raw.c_str(), &end, 10);
    if (end == raw.c_str() || *end != '\0') {
        return std::nullopt;
    }
    return v;
}

// True for "1", "true" and "TRUE".
inline bool GetEnvFlag(const char* name, bool defaultValue) {
    const std::string v = GetEnvOrDefault(name, defaultValue ? "1" : "0");
    return (v == "1" || v == "true" || v == "TRUE");
}
