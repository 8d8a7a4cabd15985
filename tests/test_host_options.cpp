//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_host_options.cpp
// Purpose: GoogleTests for HostOptions defaults, key=value parsing and the environment overlay
//==========================================================================================================

#include <gtest/gtest.h>
#include "mcphost/HostOptions.h"
#include "mcphost/errors/Errors.h"
#include "mcphost/version.h"

#include <cstdint>
#include <cstdlib>

using namespace mcphost;

TEST(HostOptions, Defaults) {
    HostOptions o;
    EXPECT_EQ(o.requestTimeoutMs, 30000u);
    EXPECT_EQ(o.callsPerHour, 100u);
    EXPECT_EQ(o.rateLimitWindowSec, 3600u);
    EXPECT_TRUE(o.rateLimitFailOpen);
    EXPECT_EQ(o.maxConfigsPerUser, 5u);
    EXPECT_FALSE(o.notifyCancelOnTimeout);
    EXPECT_FALSE(o.failPendingOnExit);
    EXPECT_TRUE(o.inheritParentEnv);
    EXPECT_EQ(o.clientName, "mcphost");
    EXPECT_EQ(o.clientVersion, GetVersionString());
}

TEST(HostOptions, ParseOverridesKeys) {
    HostOptions o = HostOptions::Parse(
        "request_timeout_ms=5000; calls_per_hour = 10 ;rate_limit_fail_open=false;"
        "store_url=https://db.example.com/rest/v1;notify_cancel_on_timeout=on;");
    EXPECT_EQ(o.requestTimeoutMs, 5000u);
    EXPECT_EQ(o.callsPerHour, 10u);
    EXPECT_FALSE(o.rateLimitFailOpen);
    EXPECT_TRUE(o.notifyCancelOnTimeout);
    EXPECT_EQ(o.storeUrl, "https://db.example.com/rest/v1");
    EXPECT_EQ(o.shutdownTimeoutMs, 5000u);
}

TEST(HostOptions, ParseIgnoresUnknownKeys) {
    HostOptions o = HostOptions::Parse("no_such_option=1;max_configs_per_user=2");
    EXPECT_EQ(o.maxConfigsPerUser, 2u);
}

TEST(HostOptions, ParseRejectsMalformedValues) {
    EXPECT_THROW(HostOptions::Parse("request_timeout_ms=abc"), errors::HostError);
    EXPECT_THROW(HostOptions::Parse("request_timeout_ms=-5"), errors::HostError);
    EXPECT_THROW(HostOptions::Parse("rate_limit_fail_open=maybe"), errors::HostError);
    EXPECT_THROW(HostOptions::Parse("calls_per_hour"), errors::HostError);
    try {
        HostOptions::Parse("calls_per_hour=12x");
        FAIL() << "expected HostError";
    } catch (const errors::HostError& e) {
        EXPECT_EQ(e.category(), errors::ErrorCategory::ConfigurationError);
    }
}

TEST(HostOptions, FromEnvOverlay) {
    ::setenv("MCPHOST_CALLS_PER_HOUR", "7", 1);
    ::setenv("MCPHOST_RATE_LIMIT_FAIL_OPEN", "false", 1);
    ::setenv("MCPHOST_REQUEST_TIMEOUT_MS", "not-a-number", 1);
    ::setenv("MCPHOST_STORE_KEY", "anon-key", 1);
    HostOptions o = HostOptions::FromEnv();
    ::unsetenv("MCPHOST_CALLS_PER_HOUR");
    ::unsetenv("MCPHOST_RATE_LIMIT_FAIL_OPEN");
    ::unsetenv("MCPHOST_REQUEST_TIMEOUT_MS");
    ::unsetenv("MCPHOST_STORE_KEY");

    EXPECT_EQ(o.callsPerHour, 7u);
    EXPECT_FALSE(o.rateLimitFailOpen);
    EXPECT_EQ(o.requestTimeoutMs, 30000u);  // malformed value ignored
    EXPECT_EQ(o.storeKey, "anon-key");
}

TEST(HostOptions, HugeDurationsAreClamped) {
    HostOptions o = HostOptions::Parse(
        "request_timeout_ms=18446744073709551615;shutdown_timeout_ms=9223372036854775808;"
        "rate_limit_window_sec=18446744073709551615;store_timeout_ms=31536000000");
    EXPECT_EQ(o.requestTimeoutMs, kMaxDurationMs);
    EXPECT_EQ(o.shutdownTimeoutMs, kMaxDurationMs);
    EXPECT_EQ(o.rateLimitWindowSec, kMaxDurationSec);
    EXPECT_EQ(o.storeTimeoutMs, 31536000000u);  // exactly one year is kept

    ::setenv("MCPHOST_REQUEST_TIMEOUT_MS", "9223372036854775808", 1);
    HostOptions e = HostOptions::FromEnv();
    ::unsetenv("MCPHOST_REQUEST_TIMEOUT_MS");
    EXPECT_EQ(e.requestTimeoutMs, kMaxDurationMs);
}

TEST(HostOptions, ClampedDurationsStayPositive) {
    EXPECT_EQ(ClampedMillis(1500).count(), 1500);
    EXPECT_GT(ClampedMillis(UINT64_MAX).count(), 0);
    EXPECT_EQ(ClampedMillis(UINT64_MAX).count(), static_cast<int64_t>(kMaxDurationMs));
    EXPECT_GT(ClampedSeconds(UINT64_MAX).count(), 0);
}
