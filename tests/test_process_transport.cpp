//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_process_transport.cpp
// Purpose: GoogleTests for ProcessTransport against the fake tool server (correlation, timeouts, exit)
//==========================================================================================================

#include <gtest/gtest.h>
#include "mcphost/ProcessTransport.hpp"
#include "mcphost/JSONRPCTypes.h"
#include "mcphost/Protocol.h"
#include "mcphost/errors/Errors.h"
#include "FakeServer.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <future>
#include <vector>

#include <unistd.h>

using namespace mcphost;
using namespace mcphost::test_support;

namespace {

std::unique_ptr<JSONRPCRequest> toolCall(const std::string& tool, JSONValue::Object args = {}) {
    JSONValue::Object params;
    params["name"] = MakeJSON(tool);
    params["arguments"] = MakeJSON(JSONValue{args});
    return std::make_unique<JSONRPCRequest>(int64_t(0), Methods::CallTool, JSONValue{params});
}

std::unique_ptr<JSONRPCRequest> echoCall(const std::string& text) {
    JSONValue::Object args;
    args["text"] = MakeJSON(text);
    return toolCall("echo", args);
}

std::string echoedText(const JSONRPCResponse& resp) {
    if (!resp.result.has_value()) {
        return "<no result>";
    }
    const JSONValue* content = resp.result->Find("content");
    if (content == nullptr || !content->IsArray()) {
        return "<no content>";
    }
    const auto& items = std::get<JSONValue::Array>(content->value);
    if (items.empty()) {
        return "<empty>";
    }
    return std::get<std::string>(items[0]->Find("text")->value);
}

int errorCode(const JSONRPCResponse& resp) {
    auto err = errors::remoteErrorFromResponse(resp);
    return err.has_value() ? err->code : 0;
}

// A child that never answers and copies everything it is sent to path
ServerConfig StdinCaptureConfig(const std::string& path) {
    ServerConfig cfg;
    cfg.id = "cfg-cap";
    cfg.userId = "u1";
    cfg.name = "stdin-capture";
    cfg.command = "/bin/sh";
    cfg.args = {"-c", "cat > '" + path + "'"};
    return cfg;
}

std::string CapturePath(const char* tag) {
    return ::testing::TempDir() + "mcphost_" + tag + "_" + std::to_string(::getpid()) + ".jsonl";
}

std::vector<std::string> ReadLines(const std::string& path) {
    std::vector<std::string> lines;
    std::ifstream in(path);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty()) {
            lines.push_back(line);
        }
    }
    return lines;
}

const JSONRPCNotification* FindCancel(const std::vector<IncomingMessage>& msgs) {
    for (const auto& m : msgs) {
        if (m.kind == IncomingMessage::Kind::Notification && m.notification->method == Methods::Cancelled) {
            return m.notification.get();
        }
    }
    return nullptr;
}

} // namespace

TEST(ProcessTransport, CorrelatesOutOfOrderResponses) {
    ProcessTransport t(FakeServerConfig("cfg-a", "u1", "reorder", {"--reorder=3"}), FastOptions());
    ASSERT_NO_THROW(t.Start().get());
    EXPECT_GT(t.GetProcessId(), 0);
    EXPECT_TRUE(t.IsConnected());

    auto f1 = t.SendRequest(echoCall("one"));
    auto f2 = t.SendRequest(echoCall("two"));
    // Nothing is answered until the third call arrives
    EXPECT_EQ(f1.wait_for(std::chrono::milliseconds(100)), std::future_status::timeout);
    auto f3 = t.SendRequest(echoCall("three"));

    ASSERT_EQ(f3.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    ASSERT_EQ(f1.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    ASSERT_EQ(f2.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    auto r1 = f1.get();
    auto r2 = f2.get();
    auto r3 = f3.get();
    EXPECT_EQ(echoedText(*r1), "one");
    EXPECT_EQ(echoedText(*r2), "two");
    EXPECT_EQ(echoedText(*r3), "three");
    EXPECT_EQ(IdToString(r1->id), "1");
    EXPECT_EQ(IdToString(r3->id), "3");
    EXPECT_EQ(t.PendingRequestCount(), 0u);
    t.Close().get();
}

TEST(ProcessTransport, TimeoutRemovesPendingEntryAndTransportStaysUsable) {
    HostOptions opts = FastOptions();
    opts.requestTimeoutMs = 300;
    ProcessTransport t(FakeServerConfig("cfg-h", "u1", "hanger"), opts);
    ASSERT_NO_THROW(t.Start().get());

    auto start = std::chrono::steady_clock::now();
    auto hung = t.SendRequest(toolCall("hang"));
    ASSERT_EQ(hung.wait_for(std::chrono::seconds(3)), std::future_status::ready);
    auto elapsed = std::chrono::steady_clock::now() - start;
    auto resp = hung.get();
    ASSERT_TRUE(resp->IsError());
    EXPECT_EQ(errorCode(*resp), JSONRPCErrorCodes::RequestTimeout);
    EXPECT_TRUE(resp->local);
    EXPECT_GE(elapsed, std::chrono::milliseconds(250));
    EXPECT_EQ(t.PendingRequestCount(), 0u);

    auto ok = t.SendRequest(echoCall("still alive"));
    ASSERT_EQ(ok.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_EQ(echoedText(*ok.get()), "still alive");
    t.Close().get();
}

TEST(ProcessTransport, HugeRequestTimeoutDoesNotExpireImmediately) {
    HostOptions opts = FastOptions();
    opts.requestTimeoutMs = UINT64_MAX;
    ProcessTransport t(FakeServerConfig("cfg-big", "u1", "patient"), opts);
    ASSERT_NO_THROW(t.Start().get());
    auto hung = t.SendRequest(toolCall("hang"));
    EXPECT_EQ(hung.wait_for(std::chrono::milliseconds(300)), std::future_status::timeout);
    auto ok = t.SendRequest(echoCall("fine"));
    ASSERT_EQ(ok.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_EQ(echoedText(*ok.get()), "fine");
    t.Close().get();
    // Close resolves what the timeout never would
    ASSERT_EQ(hung.wait_for(std::chrono::seconds(1)), std::future_status::ready);
    EXPECT_EQ(errorCode(*hung.get()), JSONRPCErrorCodes::ConnectionClosed);
}

TEST(ProcessTransport, SkipsMalformedLinesAndForwardsNotifications) {
    ProcessTransport t(FakeServerConfig("cfg-g", "u1", "noisy", {"--garbage", "--notify"}), FastOptions());
    std::atomic<int> logs{0};
    t.SetNotificationHandler([&logs](std::unique_ptr<JSONRPCNotification> n) {
        if (n && n->method == Methods::Log) {
            ++logs;
        }
    });
    ASSERT_NO_THROW(t.Start().get());

    auto f = t.SendRequest(echoCall("through the noise"));
    ASSERT_EQ(f.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_EQ(echoedText(*f.get()), "through the noise");
    EXPECT_TRUE(WaitFor([&logs] { return logs.load() >= 1; }));
    EXPECT_TRUE(t.IsConnected());
    t.Close().get();
}

TEST(ProcessTransport, UnknownMethodIsRemoteError) {
    ProcessTransport t(FakeServerConfig("cfg-m", "u1", "methods"), FastOptions());
    ASSERT_NO_THROW(t.Start().get());
    auto f = t.SendRequest(std::make_unique<JSONRPCRequest>(int64_t(0), "resources/list"));
    ASSERT_EQ(f.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    auto resp = f.get();
    EXPECT_EQ(errorCode(*resp), JSONRPCErrorCodes::MethodNotFound);
    t.Close().get();
}

TEST(ProcessTransport, ClosedTransportRejectsTraffic) {
    ProcessTransport t(FakeServerConfig("cfg-c", "u1", "closer"), FastOptions());
    ASSERT_NO_THROW(t.Start().get());
    const int pid = t.GetProcessId();
    t.Close().get();
    EXPECT_FALSE(t.IsConnected());
    EXPECT_TRUE(ProcessGone(pid));

    auto f = t.SendRequest(echoCall("late"));
    ASSERT_EQ(f.wait_for(std::chrono::milliseconds(100)), std::future_status::ready);
    EXPECT_EQ(errorCode(*f.get()), JSONRPCErrorCodes::ConnectionClosed);

    auto n = t.SendNotification(std::make_unique<JSONRPCNotification>(Methods::Initialized));
    EXPECT_THROW(n.get(), errors::HostError);

    // Close is idempotent
    EXPECT_NO_THROW(t.Close().get());
}

TEST(ProcessTransport, CloseFailsInFlightRequests) {
    ProcessTransport t(FakeServerConfig("cfg-i", "u1", "inflight"), FastOptions());
    ASSERT_NO_THROW(t.Start().get());
    auto hung = t.SendRequest(toolCall("hang"));
    t.Close().get();
    ASSERT_EQ(hung.wait_for(std::chrono::milliseconds(100)), std::future_status::ready);
    EXPECT_EQ(errorCode(*hung.get()), JSONRPCErrorCodes::ConnectionClosed);
}

TEST(ProcessTransport, MissingExecutableIsStartupFailure) {
    ServerConfig cfg = FakeServerConfig("cfg-x", "u1", "missing");
    cfg.command = "/nonexistent/mcphost/server";
    ProcessTransport t(cfg, FastOptions());
    try {
        t.Start().get();
        FAIL() << "expected StartupFailure";
    } catch (const errors::HostError& e) {
        EXPECT_EQ(e.category(), errors::ErrorCategory::StartupFailure);
    }
    EXPECT_FALSE(t.IsConnected());
    EXPECT_THROW(t.Start().get(), errors::HostError);
}

TEST(ProcessTransport, ChildExitWithoutFailPendingTimesOut) {
    HostOptions opts = FastOptions();
    opts.requestTimeoutMs = 400;
    ProcessTransport t(FakeServerConfig("cfg-e", "u1", "exiter"), opts);
    ASSERT_NO_THROW(t.Start().get());
    auto f = t.SendRequest(toolCall("exit"));
    ASSERT_EQ(f.wait_for(std::chrono::seconds(3)), std::future_status::ready);
    EXPECT_EQ(errorCode(*f.get()), JSONRPCErrorCodes::RequestTimeout);
    t.Close().get();
}

TEST(ProcessTransport, ChildExitWithFailPendingFailsFast) {
    HostOptions opts = FastOptions();
    opts.requestTimeoutMs = 10000;
    opts.failPendingOnExit = true;
    ProcessTransport t(FakeServerConfig("cfg-f", "u1", "exiter"), opts);
    ASSERT_NO_THROW(t.Start().get());
    auto f = t.SendRequest(toolCall("exit"));
    ASSERT_EQ(f.wait_for(std::chrono::seconds(3)), std::future_status::ready);
    EXPECT_EQ(errorCode(*f.get()), JSONRPCErrorCodes::ConnectionClosed);
    EXPECT_TRUE(WaitFor([&t] { return !t.IsConnected(); }));
    t.Close().get();
}

TEST(ProcessTransport, ConfigEnvironmentOverlaysParent) {
    ::setenv("MCPHOST_TEST_PARENT_ONLY", "from-parent", 1);
    ServerConfig cfg = FakeServerConfig("cfg-v", "u1", "envcheck");
    cfg.env["MCPHOST_TEST_CONFIG_VAR"] = "from-config";

    auto readVar = [](ProcessTransport& t, const std::string& name) -> JSONValue {
        JSONValue::Object args;
        args["name"] = MakeJSON(name);
        auto f = t.SendRequest(toolCall("env", args));
        if (f.wait_for(std::chrono::seconds(2)) != std::future_status::ready) {
            return JSONValue{"<timeout>"};
        }
        auto resp = f.get();
        if (!resp->result.has_value() || resp->result->Find("value") == nullptr) {
            return JSONValue{"<malformed>"};
        }
        return *resp->result->Find("value");
    };

    {
        ProcessTransport t(cfg, FastOptions());
        ASSERT_NO_THROW(t.Start().get());
        JSONValue a = readVar(t, "MCPHOST_TEST_CONFIG_VAR");
        JSONValue b = readVar(t, "MCPHOST_TEST_PARENT_ONLY");
        ASSERT_TRUE(a.IsString());
        EXPECT_EQ(std::get<std::string>(a.value), "from-config");
        ASSERT_TRUE(b.IsString());
        EXPECT_EQ(std::get<std::string>(b.value), "from-parent");
        t.Close().get();
    }
    {
        HostOptions isolated = FastOptions();
        isolated.inheritParentEnv = false;
        ProcessTransport t(cfg, isolated);
        ASSERT_NO_THROW(t.Start().get());
        EXPECT_TRUE(readVar(t, "MCPHOST_TEST_PARENT_ONLY").IsNull());
        JSONValue a = readVar(t, "MCPHOST_TEST_CONFIG_VAR");
        ASSERT_TRUE(a.IsString());
        EXPECT_EQ(std::get<std::string>(a.value), "from-config");
        t.Close().get();
    }
    ::unsetenv("MCPHOST_TEST_PARENT_ONLY");
}

TEST(ProcessTransport, TimeoutSendsCancelledNotificationWhenEnabled) {
    const std::string path = CapturePath("cancel_on");
    HostOptions opts = FastOptions();
    opts.requestTimeoutMs = 300;
    opts.notifyCancelOnTimeout = true;
    ProcessTransport t(StdinCaptureConfig(path), opts);
    ASSERT_NO_THROW(t.Start().get());

    auto f = t.SendRequest(toolCall("anything"));
    ASSERT_EQ(f.wait_for(std::chrono::seconds(3)), std::future_status::ready);
    EXPECT_EQ(errorCode(*f.get()), JSONRPCErrorCodes::RequestTimeout);
    ASSERT_TRUE(WaitFor([&] { return ReadLines(path).size() >= 2; }));
    t.Close().get();

    std::vector<IncomingMessage> msgs;
    for (const auto& line : ReadLines(path)) {
        msgs.push_back(ClassifyMessage(line));
    }
    ASSERT_EQ(msgs.size(), 2u);
    ASSERT_EQ(msgs[0].kind, IncomingMessage::Kind::Request);
    const int64_t requestId = std::get<int64_t>(msgs[0].request->id);

    const JSONRPCNotification* cancel = FindCancel(msgs);
    ASSERT_NE(cancel, nullptr);
    ASSERT_TRUE(cancel->params.has_value());
    const JSONValue* id = cancel->params->Find("requestId");
    ASSERT_NE(id, nullptr);
    EXPECT_EQ(std::get<int64_t>(id->value), requestId);
    const JSONValue* reason = cancel->params->Find("reason");
    ASSERT_NE(reason, nullptr);
    EXPECT_NE(std::get<std::string>(reason->value).find("timed out"), std::string::npos);
    std::remove(path.c_str());
}

TEST(ProcessTransport, TimeoutSendsNoCancelledNotificationByDefault) {
    const std::string path = CapturePath("cancel_off");
    HostOptions opts = FastOptions();
    opts.requestTimeoutMs = 300;
    ProcessTransport t(StdinCaptureConfig(path), opts);
    ASSERT_NO_THROW(t.Start().get());

    auto f = t.SendRequest(toolCall("anything"));
    ASSERT_EQ(f.wait_for(std::chrono::seconds(3)), std::future_status::ready);
    EXPECT_EQ(errorCode(*f.get()), JSONRPCErrorCodes::RequestTimeout);
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    t.Close().get();

    std::vector<IncomingMessage> msgs;
    for (const auto& line : ReadLines(path)) {
        msgs.push_back(ClassifyMessage(line));
    }
    EXPECT_EQ(msgs.size(), 1u);
    EXPECT_EQ(FindCancel(msgs), nullptr);
    std::remove(path.c_str());
}

TEST(ProcessTransportFactory, CreatesUnstartedTransport) {
    ProcessTransportFactory factory;
    auto t = factory.CreateTransport(FakeServerConfig("cfg-p", "u1", "factory"), FastOptions());
    ASSERT_TRUE(t != nullptr);
    EXPECT_FALSE(t->IsConnected());
    EXPECT_EQ(t->GetProcessId(), -1);
}
