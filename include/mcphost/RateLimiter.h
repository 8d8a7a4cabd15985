//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RateLimiter.h
// Purpose: Sliding-window quota per (user, config) backed by the tool call log
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "mcphost/HostOptions.h"
#include "mcphost/store/Store.h"

namespace mcphost {

// Outcome of a quota check. remaining is empty when the store could not be consulted.
struct RateLimitDecision {
    bool allowed{true};
    std::optional<uint64_t> remaining;
};

//==========================================================================================================
// RateLimiter
// Purpose: Counts the call log rows for (user, config) inside the trailing window and compares the
//          count with callsPerHour. Store outages fail open by default (rateLimitFailOpen).
//==========================================================================================================
class RateLimiter {
public:
    using Clock = std::function<store::TimePoint()>;

    //==========================================================================================================
    // Args:
    //   callLog: Call log backend (shared with whoever else reads it).
    //   options: callsPerHour, rateLimitWindowSec and rateLimitFailOpen are used.
    //   clock: Time source; system_clock::now when empty.
    //==========================================================================================================
    RateLimiter(std::shared_ptr<store::ICallLogStore> callLog, const HostOptions& options, Clock clock = Clock());

    //==========================================================================================================
    // CheckRateLimit
    // Returns:
    //   allowed = count < limit and remaining = limit - count (floored at 0). On a store failure:
    //   { true, nullopt } when failing open, { false, nullopt } otherwise.
    //==========================================================================================================
    RateLimitDecision CheckRateLimit(const std::string& userId, const std::string& configId);

    //==========================================================================================================
    // RecordToolCall
    // Purpose: Appends one record stamped with the current time. Store failures are logged and
    //          never reach the caller.
    //==========================================================================================================
    void RecordToolCall(const std::string& userId, const std::string& configId, const std::string& toolName,
                        bool success, const std::optional<std::string>& errorMessage = std::nullopt,
                        const std::optional<int64_t>& executionTimeMs = std::nullopt);

    uint64_t Limit() const { return limit_; }
    std::chrono::seconds Window() const { return window_; }

private:
    std::shared_ptr<store::ICallLogStore> callLog_;
    uint64_t limit_;
    std::chrono::seconds window_;
    bool failOpen_;
    Clock clock_;
};

} // namespace mcphost
