//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Helpers to read environment variables safely (string and unsigned integer forms).
//==========================================================================================================
#pragma once
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <stdexcept>
#include <string>

//==========================================================================================================
// GetEnvOrDefault
// Purpose: Returns the value of the environment variable or a provided default when unset.
// Args:
//   name: C-string name of the environment variable. When null or empty, returns defaultValue.
//   defaultValue: Value to return when the variable is not set.
// Returns:
//   std::string with the environment value (when set) or defaultValue otherwise.
//==========================================================================================================
inline std::string GetEnvOrDefault(const char* name, const std::string& defaultValue) {
    if (name == nullptr || *name == '\0') {
        return defaultValue;
    }
    const char* v = std::getenv(name);
    return v ? std::string(v) : defaultValue;
}

//==========================================================================================================
// ParseUint64
// Purpose: Strict decimal parse; the whole string must be a non-negative integer.
// Returns:
//   The parsed value, or std::nullopt when empty or malformed.
//==========================================================================================================
inline std::optional<uint64_t> ParseUint64(const std::string& v) {
    if (v.empty() || v.front() == '-') {
        return std::nullopt;
    }
    try {
        std::size_t used = 0;
        unsigned long long parsed = std::stoull(v, &used);
        if (used != v.size()) {
            return std::nullopt;
        }
        return static_cast<uint64_t>(parsed);
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

// Unsigned integer environment variable; std::nullopt when unset, empty or malformed.
inline std::optional<uint64_t> GetEnvUint64(const char* name) {
    return ParseUint64(GetEnvOrDefault(name, ""));
}
