//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Executor.cpp
// Purpose: Tool call execution with rate limiting and call accounting
//==========================================================================================================

#include <chrono>

#include <fmt/format.h>

#include "logging/Logger.h"
#include "mcphost/Executor.h"
#include "mcphost/RateLimiter.h"
#include "mcphost/Registry.h"

namespace mcphost {

JSONValue ToolCallResult::ToJson() const {
    JSONValue::Object obj;
    obj["success"] = MakeJSON(success);
    obj["tool_name"] = MakeJSON(toolName);
    if (result.has_value()) {
        obj["result"] = MakeJSON(result.value());
    }
    if (error.has_value()) {
        obj["error"] = MakeJSON(error.value());
    }
    if (errorCategory.has_value()) {
        obj["error_category"] = MakeJSON(errors::toString(errorCategory.value()));
    }
    if (executionTimeMs.has_value()) {
        obj["execution_time_ms"] = MakeJSON(executionTimeMs.value());
    }
    return JSONValue{obj};
}

Executor::Executor(Registry& registry, RateLimiter& rateLimiter)
    : registry_(registry), rateLimiter_(rateLimiter) {}

ToolCallResult Executor::Execute(const std::string& userId, const ToolCallRequest& request) {
    FUNC_SCOPE();
    ToolCallResult out;
    out.toolName = request.toolName;

    const RateLimitDecision decision = rateLimiter_.CheckRateLimit(userId, request.mcpServerId);
    if (!decision.allowed) {
        LOG_WARN("Rate limit exceeded for user {}, MCP {}", userId, request.mcpServerId);
        out.success = false;
        out.error = fmt::format("Rate limit exceeded ({} calls/hour). Please try again later.", rateLimiter_.Limit());
        out.errorCategory = errors::ErrorCategory::RateLimitExceeded;
        return out;
    }

    const auto start = std::chrono::steady_clock::now();
    auto elapsedMs = [&start]() {
        return static_cast<int64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count());
    };

    try {
        JSONValue result = registry_.ExecuteTool(userId, request.mcpServerId, request.toolName, request.arguments);
        const int64_t ms = elapsedMs();
        rateLimiter_.RecordToolCall(userId, request.mcpServerId, request.toolName, true, std::nullopt, ms);
        LOG_INFO("MCP tool {} executed successfully in {}ms", request.toolName, ms);
        out.success = true;
        out.result = std::move(result);
        out.executionTimeMs = ms;
        return out;
    } catch (const errors::HostError& e) {
        out.error = std::string(e.what());
        out.errorCategory = e.category();
    } catch (const std::exception& e) {
        out.error = std::string(e.what());
        out.errorCategory = errors::ErrorCategory::ProtocolError;
    }

    const int64_t ms = elapsedMs();
    rateLimiter_.RecordToolCall(userId, request.mcpServerId, request.toolName, false, out.error, ms);
    LOG_ERROR("MCP tool {} failed ({}): {}", request.toolName, errors::toString(out.errorCategory.value()),
              out.error.value());
    out.success = false;
    out.executionTimeMs = ms;
    return out;
}

} // namespace mcphost
