//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: MCP protocol data structures and constants used when talking to tool servers
//==========================================================================================================

#pragma once

#include "JSONRPCTypes.h"
#include <string>
#include <vector>
#include <optional>

namespace mcphost {
//==========================================================================================================
// MCP Protocol types and constants
// Purpose: Shared protocol structures and method names for the client side of the handshake.
//==========================================================================================================
///////////////////////////////////////// Protocol constants ///////////////////////////////////////////
// Protocol version offered in initialize
constexpr const char* PROTOCOL_VERSION = "2024-11-05";

///////////////////////////////////////// Implementation ///////////////////////////////////////////
// Implementation information (clientInfo / serverInfo)
struct Implementation {
    std::string name;
    std::string version;

    Implementation() = default;
    Implementation(std::string name, std::string version)
        : name(std::move(name)), version(std::move(version)) {}
};

///////////////////////////////////////// Initialize ///////////////////////////////////////////
// What the server reported in its initialize result
struct InitializeResult {
    std::string protocolVersion;
    Implementation serverInfo;
    JSONValue capabilities;  // opaque; retained for diagnostics
};

///////////////////////////////////////// Tools ///////////////////////////////////////////
// One capability advertised by a running server. serverId/serverName are filled in by the
// Registry when the tool is exposed to callers.
struct Tool {
    std::string name;
    std::string description;
    JSONValue inputSchema;  // JSON Schema for tool parameters, passed through untouched
    std::string serverId;
    std::string serverName;

    Tool() = default;
    Tool(std::string name, std::string description, JSONValue inputSchema = JSONValue{})
        : name(std::move(name)), description(std::move(description)),
          inputSchema(std::move(inputSchema)) {}
};

///////////////////////////////////////// Method names ///////////////////////////////////////////
namespace Methods {
    // Client to server
    constexpr const char* Initialize = "initialize";
    constexpr const char* ListTools = "tools/list";
    constexpr const char* CallTool = "tools/call";

    // Notifications
    constexpr const char* Initialized = "notifications/initialized";
    constexpr const char* Cancelled = "notifications/cancelled";
    constexpr const char* Log = "notifications/message";
    constexpr const char* ToolListChanged = "notifications/tools/list_changed";
}

} // namespace mcphost
