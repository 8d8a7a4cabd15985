//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HostOptions.cpp
// Purpose: HostOptions defaults, environment overlay and key=value parsing
//==========================================================================================================

#include "mcphost/HostOptions.h"
#include "mcphost/errors/Errors.h"
#include "mcphost/version.h"
#include "env/EnvVars.h"
#include "logging/Logger.h"

#include <cctype>

namespace mcphost {

namespace {
std::string trim(const std::string& s) {
    std::size_t b = 0, e = s.size();
    while (b < e && (s[b] == ' ' || s[b] == '\t')) {
        ++b;
    }
    while (e > b && (s[e - 1] == ' ' || s[e - 1] == '\t')) {
        --e;
    }
    return s.substr(b, e - b);
}

uint64_t parseUint(const std::string& key, const std::string& val) {
    std::size_t used = 0;
    unsigned long long v = 0;
    try {
        v = std::stoull(val, &used);
    } catch (const std::exception&) {
        used = 0;
    }
    if (used == 0 || used != val.size() || val.front() == '-') {
        throw errors::HostError(errors::ErrorCategory::ConfigurationError,
                                "Invalid numeric value for " + key + ": '" + val + "'");
    }
    return static_cast<uint64_t>(v);
}

bool parseBool(const std::string& key, std::string val) {
    for (auto& c : val) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (val == "1" || val == "true" || val == "yes" || val == "on") return true;
    if (val == "0" || val == "false" || val == "no" || val == "off") return false;
    throw errors::HostError(errors::ErrorCategory::ConfigurationError,
                            "Invalid boolean value for " + key + ": '" + val + "'");
}

uint64_t clampDuration(const std::string& key, uint64_t value, uint64_t max) {
    if (value > max) {
        LOG_WARN("Host option {}={} exceeds one year; clamped to {}", key, value, max);
        return max;
    }
    return value;
}

void envUint(const char* name, uint64_t& field) {
    const std::string raw = GetEnvOrDefault(name, "");
    if (raw.empty()) {
        return;
    }
    auto v = GetEnvUint64(name);
    if (!v.has_value()) {
        LOG_WARN("Ignoring malformed {}='{}'", name, raw);
        return;
    }
    field = *v;
}

void envDuration(const char* name, uint64_t& field, uint64_t max) {
    envUint(name, field);
    field = clampDuration(name, field, max);
}

void envBool(const char* name, bool& field) {
    const std::string raw = GetEnvOrDefault(name, "");
    if (raw.empty()) {
        return;
    }
    auto v = GetEnvBool(name);
    if (!v.has_value()) {
        LOG_WARN("Ignoring malformed {}='{}'", name, raw);
        return;
    }
    field = *v;
}

void envString(const char* name, std::string& field) {
    const std::string v = GetEnvOrDefault(name, "");
    if (!v.empty()) {
        field = v;
    }
}
} // namespace

HostOptions::HostOptions() : clientVersion(GetVersionString()) {}

HostOptions HostOptions::FromEnv() {
    HostOptions opts;
    envDuration("MCPHOST_REQUEST_TIMEOUT_MS", opts.requestTimeoutMs, kMaxDurationMs);
    envDuration("MCPHOST_SHUTDOWN_TIMEOUT_MS", opts.shutdownTimeoutMs, kMaxDurationMs);
    envUint("MCPHOST_CALLS_PER_HOUR", opts.callsPerHour);
    envDuration("MCPHOST_RATE_LIMIT_WINDOW_SEC", opts.rateLimitWindowSec, kMaxDurationSec);
    envBool("MCPHOST_RATE_LIMIT_FAIL_OPEN", opts.rateLimitFailOpen);
    envUint("MCPHOST_MAX_CONFIGS_PER_USER", opts.maxConfigsPerUser);
    envBool("MCPHOST_NOTIFY_CANCEL_ON_TIMEOUT", opts.notifyCancelOnTimeout);
    envBool("MCPHOST_FAIL_PENDING_ON_EXIT", opts.failPendingOnExit);
    envBool("MCPHOST_INHERIT_PARENT_ENV", opts.inheritParentEnv);
    envString("MCPHOST_STORE_URL", opts.storeUrl);
    envString("MCPHOST_STORE_KEY", opts.storeKey);
    envString("MCPHOST_STORE_CA_FILE", opts.storeCaFile);
    envDuration("MCPHOST_STORE_TIMEOUT_MS", opts.storeTimeoutMs, kMaxDurationMs);
    return opts;
}

HostOptions HostOptions::Parse(const std::string& config) {
    HostOptions opts;
    std::size_t start = 0;
    while (start < config.size()) {
        std::size_t sep = config.find(';', start);
        if (sep == std::string::npos) { sep = config.size(); }
        std::string kv = trim(config.substr(start, sep - start));
        start = sep + 1;
        if (kv.empty()) {
            continue;
        }
        std::size_t eq = kv.find('=');
        if (eq == std::string::npos) {
            throw errors::HostError(errors::ErrorCategory::ConfigurationError,
                                    "Expected key=value, got '" + kv + "'");
        }
        std::string key = trim(kv.substr(0, eq));
        std::string val = trim(kv.substr(eq + 1));
        if (key == "request_timeout_ms") {
            opts.requestTimeoutMs = clampDuration(key, parseUint(key, val), kMaxDurationMs);
        }
        else if (key == "shutdown_timeout_ms") {
            opts.shutdownTimeoutMs = clampDuration(key, parseUint(key, val), kMaxDurationMs);
        }
        else if (key == "calls_per_hour") {
            opts.callsPerHour = parseUint(key, val);
        }
        else if (key == "rate_limit_window_sec") {
            opts.rateLimitWindowSec = clampDuration(key, parseUint(key, val), kMaxDurationSec);
        }
        else if (key == "rate_limit_fail_open") {
            opts.rateLimitFailOpen = parseBool(key, val);
        }
        else if (key == "max_configs_per_user") {
            opts.maxConfigsPerUser = parseUint(key, val);
        }
        else if (key == "notify_cancel_on_timeout") {
            opts.notifyCancelOnTimeout = parseBool(key, val);
        }
        else if (key == "fail_pending_on_exit") {
            opts.failPendingOnExit = parseBool(key, val);
        }
        else if (key == "inherit_parent_env") {
            opts.inheritParentEnv = parseBool(key, val);
        }
        else if (key == "client_name") {
            opts.clientName = val;
        }
        else if (key == "client_version") {
            opts.clientVersion = val;
        }
        else if (key == "protocol_version") {
            opts.protocolVersion = val;
        }
        else if (key == "store_url") {
            opts.storeUrl = val;
        }
        else if (key == "store_key") {
            opts.storeKey = val;
        }
        else if (key == "store_ca_file") {
            opts.storeCaFile = val;
        }
        else if (key == "store_timeout_ms") {
            opts.storeTimeoutMs = clampDuration(key, parseUint(key, val), kMaxDurationMs);
        }
        else {
            LOG_WARN("Ignoring unknown host option '{}'", key);
        }
    }
    return opts;
}

} // namespace mcphost
