//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RateLimiter.cpp
// Purpose: Sliding-window quota implementation
//==========================================================================================================

#include <stdexcept>

#include "logging/Logger.h"
#include "mcphost/RateLimiter.h"
#include "mcphost/errors/Errors.h"

namespace mcphost {

RateLimiter::RateLimiter(std::shared_ptr<store::ICallLogStore> callLog, const HostOptions& options, Clock clock)
    : callLog_(std::move(callLog)),
      limit_(options.callsPerHour),
      window_(ClampedSeconds(options.rateLimitWindowSec)),
      failOpen_(options.rateLimitFailOpen),
      clock_(std::move(clock)) {
    if (!callLog_) {
        throw std::invalid_argument("RateLimiter requires a call log store");
    }
    if (!clock_) {
        clock_ = []() { return std::chrono::system_clock::now(); };
    }
}

RateLimitDecision RateLimiter::CheckRateLimit(const std::string& userId, const std::string& configId) {
    FUNC_SCOPE();
    const store::TimePoint since = clock_() - window_;
    uint64_t count = 0;
    try {
        count = callLog_->CountToolCallsSince(userId, configId, since);
    } catch (const std::exception& e) {
        if (failOpen_) {
            LOG_WARN("Rate limit check failed for user {} config {}; allowing call: {}", userId, configId, e.what());
            return RateLimitDecision{true, std::nullopt};
        }
        LOG_WARN("Rate limit check failed for user {} config {}; denying call: {}", userId, configId, e.what());
        return RateLimitDecision{false, std::nullopt};
    }

    RateLimitDecision decision;
    decision.allowed = count < limit_;
    decision.remaining = count >= limit_ ? 0 : limit_ - count;
    LOG_DEBUG("Rate limit for user {} config {}: {}/{} used", userId, configId, count, limit_);
    return decision;
}

void RateLimiter::RecordToolCall(const std::string& userId, const std::string& configId, const std::string& toolName,
                                 bool success, const std::optional<std::string>& errorMessage,
                                 const std::optional<int64_t>& executionTimeMs) {
    FUNC_SCOPE();
    store::ToolCallRecord record;
    record.userId = userId;
    record.configId = configId;
    record.toolName = toolName;
    record.success = success;
    record.errorMessage = errorMessage;
    record.executionTimeMs = executionTimeMs;
    record.calledAt = clock_();
    try {
        callLog_->AppendToolCall(record);
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to record tool call {} for user {} config {}: {}", toolName, userId, configId, e.what());
    }
}

} // namespace mcphost
