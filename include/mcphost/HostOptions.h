//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HostOptions.h
// Purpose: Tunables for the tool host (timeouts, quota, policies, store endpoint)
//==========================================================================================================

#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <string>

namespace mcphost {

// Every duration knob is capped at one year so it always fits a signed chrono count.
constexpr uint64_t kMaxDurationMs = 365ULL * 24 * 60 * 60 * 1000;
constexpr uint64_t kMaxDurationSec = kMaxDurationMs / 1000;

inline std::chrono::milliseconds ClampedMillis(uint64_t ms) {
    return std::chrono::milliseconds(static_cast<int64_t>(std::min(ms, kMaxDurationMs)));
}

inline std::chrono::seconds ClampedSeconds(uint64_t sec) {
    return std::chrono::seconds(static_cast<int64_t>(std::min(sec, kMaxDurationSec)));
}

//==========================================================================================================
// HostOptions
// Purpose: All host knobs in one place. Defaults match production behaviour.
// Fields:
//   requestTimeoutMs: Bound on every initialize / tools/list / tools/call exchange.
//   shutdownTimeoutMs: Grace period for a child to exit after stdin closes before it is signalled.
//   callsPerHour: Quota per (user, config) within rateLimitWindowSec.
//   rateLimitWindowSec: Sliding window length.
//   rateLimitFailOpen: Allow calls when the call-log store is unreachable.
//   maxConfigsPerUser: Configs beyond this count are ignored at load time.
//   notifyCancelOnTimeout: Send notifications/cancelled to the child when a request times out.
//   failPendingOnExit: Fail in-flight requests with ConnectionClosed as soon as the child's stdout closes.
//   inheritParentEnv: Start children with the parent environment overlaid by the config env.
//   clientName/clientVersion: clientInfo sent in initialize.
//   protocolVersion: protocolVersion sent in initialize.
//   storeUrl/storeKey/storeCaFile/storeTimeoutMs: REST store endpoint, API key, CA bundle and I/O bound.
//==========================================================================================================
struct HostOptions {
    uint64_t requestTimeoutMs{30000};
    uint64_t shutdownTimeoutMs{5000};
    uint64_t callsPerHour{100};
    uint64_t rateLimitWindowSec{3600};
    bool rateLimitFailOpen{true};
    uint64_t maxConfigsPerUser{5};
    bool notifyCancelOnTimeout{false};
    bool failPendingOnExit{false};
    bool inheritParentEnv{true};
    std::string clientName{"mcphost"};
    std::string clientVersion;
    std::string protocolVersion{"2024-11-05"};
    std::string storeUrl;
    std::string storeKey;
    std::string storeCaFile;
    uint64_t storeTimeoutMs{10000};

    HostOptions();

    //======================================================================================================
    // FromEnv
    // Purpose: Defaults overlaid with MCPHOST_* environment variables. Malformed values are logged
    //          and ignored; durations above one year are clamped with a warning.
    //======================================================================================================
    static HostOptions FromEnv();

    //======================================================================================================
    // Parse
    // Purpose: Defaults overlaid with a semicolon-delimited "key=value" string using snake_case keys
    //          (e.g. "request_timeout_ms=5000; rate_limit_fail_open=false").
    //          Durations above one year are clamped with a warning.
    // Throws:
    //   errors::HostError (ConfigurationError) on a malformed value. Unknown keys are logged and ignored.
    //======================================================================================================
    static HostOptions Parse(const std::string& config);
};

} // namespace mcphost
