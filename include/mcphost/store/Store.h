//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Store.h
// Purpose: Interfaces to the external configuration store and the append-only tool call log
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "mcphost/JSONRPCTypes.h"
#include "mcphost/ServerConfig.h"

namespace mcphost {
namespace store {

using TimePoint = std::chrono::system_clock::time_point;

//==========================================================================================================
// ToolCallRecord
// Purpose: One audit/quota row, appended for every execution attempt and never mutated.
//==========================================================================================================
struct ToolCallRecord {
    std::string userId;
    std::string configId;
    std::string toolName;
    bool success{false};
    std::optional<std::string> errorMessage;
    std::optional<int64_t> executionTimeMs;
    TimePoint calledAt{};
};

// Row shape written to the call log: { mcp_config_id, user_id, tool_name, success, error_message?,
// execution_time_ms?, called_at }
JSONValue ToolCallRecordToJson(const ToolCallRecord& record);

// UTC ISO-8601 with millisecond precision, e.g. 2025-03-01T12:00:00.000Z
std::string FormatTimestamp(TimePoint tp);

//==========================================================================================================
// IConfigStore
// Purpose: Read side of the configuration store.
//==========================================================================================================
class IConfigStore {
public:
    virtual ~IConfigStore() = default;

    //==========================================================================================================
    // Returns the user's server configurations ordered by creation time (oldest first).
    // Throws:
    //   errors::HostError (StoreUnavailable) when the store cannot be reached.
    //==========================================================================================================
    virtual std::vector<ServerConfig> FetchUserConfigs(const std::string& userId) = 0;
};

//==========================================================================================================
// ICallLogStore
// Purpose: Append-only call log read by the rate limiter as a count.
//==========================================================================================================
class ICallLogStore {
public:
    virtual ~ICallLogStore() = default;

    // Throws errors::HostError (StoreUnavailable) when the write fails.
    virtual void AppendToolCall(const ToolCallRecord& record) = 0;

    //==========================================================================================================
    // Counts records for (userId, configId) with calledAt >= since.
    // Throws:
    //   errors::HostError (StoreUnavailable) when the store cannot be reached.
    //==========================================================================================================
    virtual uint64_t CountToolCallsSince(const std::string& userId, const std::string& configId,
                                         TimePoint since) = 0;
};

} // namespace store
} // namespace mcphost
