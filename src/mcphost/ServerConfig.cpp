//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerConfig.cpp
// Purpose: ServerConfig validation and store-row decoding
//==========================================================================================================

#include "mcphost/ServerConfig.h"
#include "mcphost/errors/Errors.h"

#include <algorithm>

namespace mcphost {

using errors::ErrorCategory;
using errors::HostError;

namespace {
constexpr std::size_t kMinNameLength = 3;
constexpr std::size_t kMaxNameLength = 50;

[[noreturn]] void configError(const std::string& msg) {
    throw HostError(ErrorCategory::ConfigurationError, msg);
}

// Returns the string member, an empty string when absent or null, and throws when mistyped.
std::string stringMember(const JSONValue& row, const char* key, bool required) {
    const JSONValue* v = row.Find(key);
    if (v == nullptr || v->IsNull()) {
        if (required) {
            configError(std::string("Configuration row is missing '") + key + "'");
        }
        return std::string();
    }
    if (std::holds_alternative<std::string>(v->value)) {
        return std::get<std::string>(v->value);
    }
    // Numeric ids are common in relational stores
    if (std::holds_alternative<int64_t>(v->value)) {
        return std::to_string(std::get<int64_t>(v->value));
    }
    configError(std::string("Configuration member '") + key + "' must be a string");
}
// Code points in a UTF-8 string; continuation bytes (10xxxxxx) are not counted
std::size_t utf8Length(const std::string& s) {
    std::size_t n = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) {
            ++n;
        }
    }
    return n;
}
} // namespace

const std::vector<std::string>& AllowedCommands() {
    static const std::vector<std::string> kAllowed{"npx", "node", "python", "python3", "uvx"};
    return kAllowed;
}

void ValidateServerConfig(const ServerConfig& cfg) {
    const std::size_t nameLength = utf8Length(cfg.name);
    if (nameLength < kMinNameLength) {
        configError("Server name must be at least 3 characters");
    }
    if (nameLength > kMaxNameLength) {
        configError("Server name must be at most 50 characters");
    }
    if (cfg.mcpType != "stdio") {
        configError("Unsupported MCP type '" + cfg.mcpType + "' (only stdio is supported)");
    }
    const auto& allowed = AllowedCommands();
    const bool isAllowedLauncher = std::find(allowed.begin(), allowed.end(), cfg.command) != allowed.end();
    const bool isAbsolute = !cfg.command.empty() && cfg.command.front() == '/';
    if (!isAllowedLauncher && !isAbsolute) {
        configError("Command '" + cfg.command + "' must be one of npx, node, python, python3, uvx or an absolute path");
    }
    if (cfg.args.empty()) {
        configError("Server args must not be empty");
    }
    for (const auto& a : cfg.args) {
        if (a.empty()) {
            configError("Server args must not contain empty strings");
        }
    }
    for (const auto& [key, value] : cfg.env) {
        (void)value;
        if (key.empty()) {
            configError("Environment variable names must not be empty");
        }
    }
}

ServerConfig ServerConfigFromJson(const JSONValue& row) {
    if (!row.IsObject()) {
        configError("Configuration row must be a JSON object");
    }
    ServerConfig cfg;
    cfg.id = stringMember(row, "id", true);
    cfg.userId = stringMember(row, "user_id", false);
    cfg.name = stringMember(row, "name", true);
    const std::string type = stringMember(row, "mcp_type", false);
    if (!type.empty()) {
        cfg.mcpType = type;
    }
    cfg.command = stringMember(row, "command", true);
    cfg.createdAt = stringMember(row, "created_at", false);

    if (const JSONValue* args = row.Find("args"); args != nullptr && !args->IsNull()) {
        if (!args->IsArray()) {
            configError("Configuration member 'args' must be an array");
        }
        for (const auto& a : std::get<JSONValue::Array>(args->value)) {
            if (!a || !a->IsString()) {
                configError("Configuration member 'args' must contain only strings");
            }
            cfg.args.push_back(std::get<std::string>(a->value));
        }
    }

    if (const JSONValue* env = row.Find("env"); env != nullptr && !env->IsNull()) {
        if (!env->IsObject()) {
            configError("Configuration member 'env' must be an object");
        }
        for (const auto& [k, v] : std::get<JSONValue::Object>(env->value)) {
            if (!v || !v->IsString()) {
                configError("Environment value for '" + k + "' must be a string");
            }
            cfg.env[k] = std::get<std::string>(v->value);
        }
    }

    if (const JSONValue* enabled = row.Find("enabled"); enabled != nullptr && !enabled->IsNull()) {
        if (!std::holds_alternative<bool>(enabled->value)) {
            configError("Configuration member 'enabled' must be a boolean");
        }
        cfg.enabled = std::get<bool>(enabled->value);
    }

    if (const JSONValue* meta = row.Find("metadata"); meta != nullptr) {
        cfg.metadata = *meta;
    }
    return cfg;
}

JSONValue ServerConfigToJson(const ServerConfig& cfg) {
    JSONValue::Object row;
    row["id"] = MakeJSON(cfg.id);
    row["user_id"] = MakeJSON(cfg.userId);
    row["name"] = MakeJSON(cfg.name);
    row["mcp_type"] = MakeJSON(cfg.mcpType);
    row["command"] = MakeJSON(cfg.command);
    JSONValue::Array args;
    for (const auto& a : cfg.args) {
        args.push_back(MakeJSON(a));
    }
    row["args"] = std::make_shared<JSONValue>(std::move(args));
    JSONValue::Object env;
    for (const auto& [k, v] : cfg.env) {
        env[k] = MakeJSON(v);
    }
    row["env"] = std::make_shared<JSONValue>(std::move(env));
    row["enabled"] = MakeJSON(cfg.enabled);
    row["metadata"] = MakeJSON(cfg.metadata);
    if (!cfg.createdAt.empty()) {
        row["created_at"] = MakeJSON(cfg.createdAt);
    }
    return JSONValue(std::move(row));
}

} // namespace mcphost
