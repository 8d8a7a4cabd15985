//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Store.cpp
// Purpose: Call log row encoding shared by the store backends
//==========================================================================================================

#include <ctime>

#include <fmt/format.h>

#include "mcphost/store/Store.h"

namespace mcphost {
namespace store {

std::string FormatTimestamp(TimePoint tp) {
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
    const std::time_t secs = static_cast<std::time_t>(ms / 1000);
    std::tm buf{};
    ::gmtime_r(&secs, &buf);
    return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z",
                       buf.tm_year + 1900, buf.tm_mon + 1, buf.tm_mday,
                       buf.tm_hour, buf.tm_min, buf.tm_sec, static_cast<int>(ms % 1000));
}

JSONValue ToolCallRecordToJson(const ToolCallRecord& record) {
    JSONValue::Object row;
    row["mcp_config_id"] = MakeJSON(record.configId);
    row["user_id"] = MakeJSON(record.userId);
    row["tool_name"] = MakeJSON(record.toolName);
    row["success"] = MakeJSON(record.success);
    if (record.errorMessage.has_value()) {
        row["error_message"] = MakeJSON(record.errorMessage.value());
    }
    if (record.executionTimeMs.has_value()) {
        row["execution_time_ms"] = MakeJSON(record.executionTimeMs.value());
    }
    row["called_at"] = MakeJSON(FormatTimestamp(record.calledAt));
    return JSONValue{row};
}

} // namespace store
} // namespace mcphost
