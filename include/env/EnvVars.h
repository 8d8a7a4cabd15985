//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Helpers to read environment variables and snapshot the process environment.
//==========================================================================================================
#pragma once
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>

extern char** environ;

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
// GetEnvUint64
// Purpose: Reads an unsigned integer variable.
// Returns:
//   The parsed value, or std::nullopt when unset, empty or not a number.
//==========================================================================================================
inline std::optional<uint64_t> GetEnvUint64(const char* name) {
    const std::string v = GetEnvOrDefault(name, "");
    if (v.empty()) {
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

//==========================================================================================================
// GetEnvBool
// Purpose: Reads a boolean flag ("1"/"true"/"yes"/"on" or "0"/"false"/"no"/"off", case-insensitive).
// Returns:
//   The flag, or std::nullopt when unset or unrecognized.
//==========================================================================================================
inline std::optional<bool> GetEnvBool(const char* name) {
    std::string v = GetEnvOrDefault(name, "");
    for (auto& c : v) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    return std::nullopt;
}

//==========================================================================================================
// SnapshotEnvironment
// Purpose: Copies the current process environment into an ordered map (used to build child envs).
//==========================================================================================================
inline std::map<std::string, std::string> SnapshotEnvironment() {
    std::map<std::string, std::string> out;
    if (environ == nullptr) {
        return out;
    }
    for (char** e = environ; *e != nullptr; ++e) {
        std::string entry(*e);
        auto eq = entry.find('=');
        if (eq == std::string::npos || eq == 0) {
            continue;
        }
        out.emplace(entry.substr(0, eq), entry.substr(eq + 1));
    }
    return out;
}
