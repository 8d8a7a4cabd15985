//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_tool_host.cpp
// Purpose: GoogleTests for the ToolHost service lifecycle and its end-to-end call path
//==========================================================================================================

#include <gtest/gtest.h>
#include "mcphost/Registry.h"
#include "mcphost/ToolHost.h"
#include "mcphost/store/InMemoryStore.hpp"
#include "FakeServer.h"

using namespace mcphost;
using namespace mcphost::test_support;
using mcphost::errors::ErrorCategory;
using mcphost::errors::HostError;
using mcphost::store::InMemoryStore;

namespace {
ToolCallRequest addRequest(const std::string& configId, int64_t a, int64_t b) {
    JSONValue::Object args;
    args["a"] = MakeJSON(a);
    args["b"] = MakeJSON(b);
    return ToolCallRequest{"add", JSONValue{args}, configId};
}
} // namespace

TEST(ToolHost, RejectsUseBeforeInit) {
    auto store = std::make_shared<InMemoryStore>();
    ToolHost host(FastOptions(), store, store);
    EXPECT_THROW(host.ListTools("u1"), HostError);
    EXPECT_THROW(host.GetRegistry(), HostError);

    ToolCallResult r = host.Execute("u1", addRequest("cfg-a", 1, 2));
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.errorCategory.value_or(ErrorCategory::ProtocolError), ErrorCategory::Uninitialized);
    EXPECT_EQ(r.toolName, "add");
}

TEST(ToolHost, InitValidatesDependencies) {
    auto store = std::make_shared<InMemoryStore>();
    ToolHost missing(FastOptions(), store, nullptr);
    try {
        missing.Init();
        FAIL() << "expected ConfigurationError";
    } catch (const HostError& e) {
        EXPECT_EQ(e.category(), ErrorCategory::ConfigurationError);
    }

    HostOptions zero = FastOptions();
    zero.requestTimeoutMs = 0;
    ToolHost badOptions(zero, store, store);
    EXPECT_THROW(badOptions.Init(), HostError);
}

TEST(ToolHost, EndToEndListExecuteShutdown) {
    auto store = std::make_shared<InMemoryStore>();
    store->PutConfig(FakeServerConfig("cfg-a", "u1", "calculator"));
    ToolHost host(FastOptions(), store, store);
    host.Init();
    host.Init();  // idempotent

    std::vector<Tool> tools = host.ListTools("u1");
    ASSERT_EQ(tools.size(), 6u);
    EXPECT_EQ(tools[1].name, "add");
    EXPECT_EQ(tools[1].serverId, "cfg-a");
    EXPECT_EQ(tools[1].serverName, "calculator");

    ToolCallResult r = host.Execute("u1", addRequest("cfg-a", 20, 22));
    ASSERT_TRUE(r.success) << r.error.value_or("");
    EXPECT_EQ(std::get<int64_t>(r.result->Find("sum")->value), 42);
    EXPECT_EQ(store->Records("u1", "cfg-a").size(), 1u);

    const int pid = host.GetRegistry().FindInstance("u1", "cfg-a")->pid;
    host.ShutdownUser("u1");
    EXPECT_TRUE(ProcessGone(pid));
    ToolCallResult gone = host.Execute("u1", addRequest("cfg-a", 1, 1));
    EXPECT_EQ(gone.errorCategory.value_or(ErrorCategory::ProtocolError), ErrorCategory::NotFound);

    EXPECT_EQ(host.LoadUserTools("u1", true).size(), 6u);
    const int reloaded = host.GetRegistry().FindInstance("u1", "cfg-a")->pid;
    host.ShutdownAll();
    host.ShutdownAll();
    EXPECT_TRUE(ProcessGone(reloaded));
    EXPECT_THROW(host.ListTools("u1"), HostError);
    EXPECT_THROW(host.Init(), HostError);
}

TEST(ToolHost, InitAfterShutdownIsRejected) {
    auto store = std::make_shared<InMemoryStore>();
    ToolHost host(FastOptions(), store, store);
    host.Init();
    EXPECT_NO_THROW(host.Init());
    host.ShutdownAll();
    try {
        host.Init();
        FAIL() << "Init after ShutdownAll must throw";
    } catch (const HostError& e) {
        EXPECT_EQ(e.category(), ErrorCategory::Uninitialized);
    }
    ToolCallResult r = host.Execute("u1", addRequest("cfg-a", 1, 2));
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.errorCategory.value_or(ErrorCategory::ProtocolError), ErrorCategory::Uninitialized);
}

TEST(ToolHost, CustomTransportFactoryIsUsed) {
    auto store = std::make_shared<InMemoryStore>();
    store->PutConfig(FakeServerConfig("cfg-a", "u1", "counted"));
    auto factory = std::make_shared<CountingTransportFactory>();
    ToolHost host(FastOptions(), store, store, factory);
    host.Init();
    host.ListTools("u1");
    host.ListTools("u1");
    EXPECT_EQ(factory->created.load(), 1);
}
