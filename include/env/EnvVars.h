//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Helpers to read environment variables safely.
//==========================================================================================================
#pragma once
#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <optional>
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
// Purpose: Parses a whole string as an unsigned decimal integer.
// Returns:
//   The value, or std::nullopt when the string is empty, has trailing characters, or overflows.
//==========================================================================================================
inline std::optional<uint64_t> ParseUint64(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }
    uint64_t out = 0;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, out);
    if (ec != std::errc{} || ptr != last) {
        return std::nullopt;
    }
    return out;
}
