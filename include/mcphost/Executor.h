//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Executor.h
// Purpose: Single entry point for tool calls (quota check, execution, call accounting)
//==========================================================================================================

#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "mcphost/JSONRPCTypes.h"
#include "mcphost/errors/Errors.h"

namespace mcphost {

class Registry;
class RateLimiter;

// What the calling agent asks for
struct ToolCallRequest {
    std::string toolName;
    JSONValue arguments;
    std::string mcpServerId;  // config id of the owning server
};

//==========================================================================================================
// ToolCallResult
// Purpose: Uniform result envelope. Exactly one of result/error is set.
// Fields:
//   errorCategory: Why the call failed, when it did.
//   executionTimeMs: Wall time spent executing; absent when the call was never attempted.
//==========================================================================================================
struct ToolCallResult {
    bool success{false};
    std::string toolName;
    std::optional<JSONValue> result;
    std::optional<std::string> error;
    std::optional<errors::ErrorCategory> errorCategory;
    std::optional<int64_t> executionTimeMs;

    // { success, tool_name, result | error, execution_time_ms? }
    JSONValue ToJson() const;
};

//==========================================================================================================
// Executor
// Purpose: Checks the quota, runs the call through the Registry and records the outcome. Never throws
//          for execution failures; callers always get a ToolCallResult.
//==========================================================================================================
class Executor {
public:
    Executor(Registry& registry, RateLimiter& rateLimiter);

    ToolCallResult Execute(const std::string& userId, const ToolCallRequest& request);

private:
    Registry& registry_;
    RateLimiter& rateLimiter_;
};

} // namespace mcphost
