//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerConfig.h
// Purpose: A user's declared tool server and the rules it must satisfy before it is launched
//==========================================================================================================

#pragma once

#include <map>
#include <string>
#include <vector>

#include "mcphost/JSONRPCTypes.h"

namespace mcphost {

//==========================================================================================================
// ServerConfig
// Purpose: One tool server configuration row, read-only to the host.
// Fields:
//   id: Config identifier (store primary key).
//   userId: Owning user.
//   name: Display name (3..50 characters).
//   mcpType: Transport kind; only "stdio" is launched.
//   command: Executable; one of the allowed launchers or an absolute path.
//   args: Non-empty argument list.
//   env: Environment overrides applied on top of the parent environment.
//   enabled: Disabled configs are never started.
//   metadata: Opaque JSON object carried through from the store.
//   createdAt: Store timestamp, used for ordering.
//==========================================================================================================
struct ServerConfig {
    std::string id;
    std::string userId;
    std::string name;
    std::string mcpType{"stdio"};
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    bool enabled{true};
    JSONValue metadata;
    std::string createdAt;
};

// Launchers accepted without an absolute path
const std::vector<std::string>& AllowedCommands();

//==========================================================================================================
// ValidateServerConfig
// Purpose: Checks name length, transport type, command, args and env keys.
// Throws:
//   errors::HostError with category ConfigurationError naming the first violated rule.
//==========================================================================================================
void ValidateServerConfig(const ServerConfig& cfg);

//==========================================================================================================
// ServerConfigFromJson
// Purpose: Decodes a configuration store row.
// Args:
//   row: JSON object with id, user_id, name, mcp_type, command, args, env, enabled, metadata, created_at.
// Returns:
//   The decoded config. Does not validate; call ValidateServerConfig before launching.
// Throws:
//   errors::HostError (ConfigurationError) when required members are missing or mistyped.
//==========================================================================================================
ServerConfig ServerConfigFromJson(const JSONValue& row);

// Encodes a config in the same row shape ServerConfigFromJson reads.
JSONValue ServerConfigToJson(const ServerConfig& cfg);

} // namespace mcphost
