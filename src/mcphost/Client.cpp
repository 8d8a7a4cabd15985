//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Client.cpp
// Purpose: Tool server client implementation
//==========================================================================================================
#include <atomic>
#include <mutex>
#include <stdexcept>

#include <fmt/format.h>

#include "logging/Logger.h"
#include "mcphost/Client.h"
#include "mcphost/Protocol.h"
#include "mcphost/async/Task.h"
#include "mcphost/errors/Errors.h"

namespace mcphost {

const char* toString(ClientState state) {
    switch (state) {
        case ClientState::Unstarted: return "Unstarted";
        case ClientState::Starting: return "Starting";
        case ClientState::Ready: return "Ready";
        case ClientState::ShuttingDown: return "ShuttingDown";
        case ClientState::Stopped: return "Stopped";
    }
    return "Unknown";
}

namespace {

std::string stringMember(const JSONValue& obj, const char* key) {
    const JSONValue* v = obj.Find(key);
    if (v != nullptr && v->IsString()) {
        return std::get<std::string>(v->value);
    }
    return std::string();
}

} // namespace

std::vector<Tool> ParseToolsListResult(const JSONValue& result) {
    const JSONValue* toolsVal = result.Find("tools");
    if (toolsVal == nullptr || !toolsVal->IsArray()) {
        throw errors::HostError(errors::ErrorCategory::ProtocolError,
                                "tools/list result has no tools array");
    }
    std::vector<Tool> tools;
    for (const auto& entry : std::get<JSONValue::Array>(toolsVal->value)) {
        if (!entry || !entry->IsObject()) {
            LOG_WARN("Skipping non-object entry in tools/list result");
            continue;
        }
        Tool tool;
        tool.name = stringMember(*entry, "name");
        if (tool.name.empty()) {
            LOG_WARN("Skipping tools/list entry without a name");
            continue;
        }
        tool.description = stringMember(*entry, "description");
        const JSONValue* schema = entry->Find("inputSchema");
        if (schema != nullptr) {
            tool.inputSchema = *schema;
        } else {
            tool.inputSchema = JSONValue{JSONValue::Object{}};
        }
        tools.push_back(std::move(tool));
    }
    return tools;
}

// Client implementation
class Client::Impl {
public:
    std::string serverName;
    HostOptions options;
    std::atomic<ClientState> state{ClientState::Unstarted};
    mutable std::mutex initMutex;
    InitializeResult initResult;
    // Declared last: destroyed first, so the reader thread is joined before the members its handlers touch.
    std::unique_ptr<ITransport> transport;

    Impl(std::unique_ptr<ITransport> t, std::string name, HostOptions opts)
        : serverName(std::move(name)), options(std::move(opts)), transport(std::move(t)) {}

    void onNotification(std::unique_ptr<JSONRPCNotification> n) {
        if (!n) {
            return;
        }
        const std::string params = n->params.has_value() ? SerializeJSON(n->params.value()) : std::string("{}");
        if (n->method == Methods::Log) {
            LOG_INFO("MCP server '{}' log: {}", serverName, params);
        } else if (n->method == Methods::ToolListChanged) {
            // Picked up on the next forced reload
            LOG_INFO("MCP server '{}' reports its tool list changed", serverName);
        } else {
            LOG_DEBUG("MCP server '{}' notification {} {}", serverName, n->method, params);
        }
    }

    errors::HostError notInitialized(const char* method) const {
        return errors::HostError(errors::ErrorCategory::Uninitialized,
            fmt::format("MCP client '{}' is not initialized ({} requested in state {})",
                        serverName, method, toString(state.load())));
    }

    async::Task<void> coStart();
    async::Task<InitializeResult> coInitialize();
    async::Task<void> coShutdown();
};

// Free coroutines take their inputs by value: the frame outlives the caller's arguments.
namespace {

async::Task<std::vector<Tool>> coListTools(ITransport* transport, std::string serverName) {
    FUNC_SCOPE();
    auto request = std::make_unique<JSONRPCRequest>();
    request->method = Methods::ListTools;
    LOG_DEBUG("Requesting tools list from '{}'", serverName);
    auto fut = transport->SendRequest(std::move(request));
    auto response = co_await async::makeFutureAwaitable(std::move(fut));
    if (!response) {
        throw errors::HostError(errors::ErrorCategory::ProtocolError, "Empty response to tools/list");
    }
    if (response->IsError()) {
        throw errors::hostErrorFromResponse(*response, Methods::ListTools);
    }
    if (!response->result.has_value()) {
        throw errors::HostError(errors::ErrorCategory::ProtocolError, "tools/list response has no result");
    }
    auto tools = ParseToolsListResult(response->result.value());
    LOG_DEBUG("MCP server '{}' advertised {} tools", serverName, tools.size());
    co_return tools;
}

async::Task<JSONValue> coCallTool(ITransport* transport, std::string serverName,
                                  std::string name, JSONValue arguments) {
    FUNC_SCOPE();
    JSONValue::Object paramsObj;
    paramsObj["name"] = MakeJSON(name);
    paramsObj["arguments"] = MakeJSON(arguments);
    auto request = std::make_unique<JSONRPCRequest>();
    request->method = Methods::CallTool;
    request->params = JSONValue{paramsObj};
    LOG_DEBUG("Calling tool {} on '{}'", name, serverName);
    auto fut = transport->SendRequest(std::move(request));
    auto response = co_await async::makeFutureAwaitable(std::move(fut));
    if (!response) {
        throw errors::HostError(errors::ErrorCategory::ProtocolError, "Empty response to tools/call");
    }
    if (response->IsError()) {
        throw errors::hostErrorFromResponse(*response, Methods::CallTool);
    }
    if (!response->result.has_value()) {
        throw errors::HostError(errors::ErrorCategory::ProtocolError, "tools/call response has no result");
    }
    co_return response->result.value();
}

} // namespace

async::Task<void> Client::Impl::coStart() {
    FUNC_SCOPE();
    auto fut = this->transport->Start();
    try {
        co_await async::makeFutureAwaitable(std::move(fut));
    } catch (const std::exception& e) {
        LOG_ERROR("MCP server '{}' failed to start: {}", this->serverName, e.what());
        this->state = ClientState::Stopped;
        throw;
    }
    LOG_DEBUG("MCP server '{}' transport started (pid {})", this->serverName, this->transport->GetProcessId());
    co_return;
}

async::Task<InitializeResult> Client::Impl::coInitialize() {
    FUNC_SCOPE();
    JSONValue::Object clientInfo;
    clientInfo["name"] = MakeJSON(this->options.clientName);
    clientInfo["version"] = MakeJSON(this->options.clientVersion);
    JSONValue::Object capabilities;
    capabilities["tools"] = MakeJSON(JSONValue{JSONValue::Object{}});
    JSONValue::Object paramsObj;
    paramsObj["protocolVersion"] = MakeJSON(this->options.protocolVersion);
    paramsObj["capabilities"] = MakeJSON(JSONValue{capabilities});
    paramsObj["clientInfo"] = MakeJSON(JSONValue{clientInfo});

    auto request = std::make_unique<JSONRPCRequest>();
    request->method = Methods::Initialize;
    request->params = JSONValue{paramsObj};

    LOG_INFO("Initializing MCP server '{}'", this->serverName);
    auto fut = this->transport->SendRequest(std::move(request));
    auto response = co_await async::makeFutureAwaitable(std::move(fut));
    if (!response) {
        throw errors::HostError(errors::ErrorCategory::StartupFailure,
            fmt::format("MCP server '{}' initialize failed: empty response", this->serverName));
    }
    if (response->IsError()) {
        const errors::HostError cause = errors::hostErrorFromResponse(*response, Methods::Initialize);
        throw errors::HostError(errors::ErrorCategory::StartupFailure,
            fmt::format("MCP server '{}' initialize failed: {}", this->serverName, cause.what()), cause.code());
    }
    if (!response->result.has_value() || !response->result->IsObject()) {
        throw errors::HostError(errors::ErrorCategory::StartupFailure,
            fmt::format("MCP server '{}' initialize failed: result is not an object", this->serverName));
    }

    InitializeResult result;
    const JSONValue& rv = response->result.value();
    result.protocolVersion = stringMember(rv, "protocolVersion");
    if (const JSONValue* info = rv.Find("serverInfo")) {
        result.serverInfo.name = stringMember(*info, "name");
        result.serverInfo.version = stringMember(*info, "version");
    }
    if (const JSONValue* caps = rv.Find("capabilities")) {
        result.capabilities = *caps;
    }
    if (!result.protocolVersion.empty() && result.protocolVersion != this->options.protocolVersion) {
        LOG_WARN("MCP server '{}' negotiated protocol version {} (offered {})",
                 this->serverName, result.protocolVersion, this->options.protocolVersion);
    }

    auto notifyFut = this->transport->SendNotification(
        std::make_unique<JSONRPCNotification>(Methods::Initialized));
    try {
        co_await async::makeFutureAwaitable(std::move(notifyFut));
    } catch (const std::exception& e) {
        throw errors::HostError(errors::ErrorCategory::StartupFailure,
            fmt::format("MCP server '{}' initialize failed: {}", this->serverName, e.what()));
    }

    {
        std::lock_guard<std::mutex> lk(this->initMutex);
        this->initResult = result;
    }
    ClientState expected = ClientState::Starting;
    if (!this->state.compare_exchange_strong(expected, ClientState::Ready)) {
        throw errors::HostError(errors::ErrorCategory::StartupFailure,
            fmt::format("MCP server '{}' was shut down during initialize", this->serverName));
    }
    LOG_INFO("MCP server '{}' ready ({} {})", this->serverName,
             result.serverInfo.name.empty() ? std::string("unnamed") : result.serverInfo.name,
             result.serverInfo.version);
    co_return result;
}

async::Task<void> Client::Impl::coShutdown() {
    FUNC_SCOPE();
    auto fut = this->transport->Close();
    try {
        co_await async::makeFutureAwaitable(std::move(fut));
    } catch (const std::exception& e) {
        LOG_WARN("Error shutting down MCP server '{}': {}", this->serverName, e.what());
    }
    this->state = ClientState::Stopped;
    co_return;
}

Client::Client(std::unique_ptr<ITransport> transport, std::string serverName, HostOptions options)
    : pImpl(std::make_unique<Impl>(std::move(transport), std::move(serverName), std::move(options))) {
    FUNC_SCOPE();
    if (!pImpl->transport) {
        throw std::invalid_argument("Client requires a transport");
    }
    Impl* impl = pImpl.get();
    pImpl->transport->SetNotificationHandler([impl](std::unique_ptr<JSONRPCNotification> n) {
        impl->onNotification(std::move(n));
    });
    pImpl->transport->SetErrorHandler([impl](const std::string& err) {
        LOG_WARN("MCP server '{}' transport error: {}", impl->serverName, err);
    });
}

Client::~Client() {
    FUNC_SCOPE();
    if (pImpl->state != ClientState::Stopped) {
        Shutdown().wait();
    }
}

std::future<void> Client::Start() {
    FUNC_SCOPE();
    ClientState expected = ClientState::Unstarted;
    if (!pImpl->state.compare_exchange_strong(expected, ClientState::Starting)) {
        return async::failedFuture<void>(errors::HostError(errors::ErrorCategory::StartupFailure,
            fmt::format("MCP client '{}' cannot start from state {}", pImpl->serverName, toString(expected))));
    }
    return pImpl->coStart().toFuture();
}

std::future<InitializeResult> Client::Initialize() {
    FUNC_SCOPE();
    if (pImpl->state != ClientState::Starting) {
        return async::failedFuture<InitializeResult>(pImpl->notInitialized(Methods::Initialize));
    }
    return pImpl->coInitialize().toFuture();
}

std::future<std::vector<Tool>> Client::ListTools() {
    FUNC_SCOPE();
    if (pImpl->state != ClientState::Ready) {
        return async::failedFuture<std::vector<Tool>>(pImpl->notInitialized(Methods::ListTools));
    }
    return coListTools(pImpl->transport.get(), pImpl->serverName).toFuture();
}

std::future<JSONValue> Client::CallTool(const std::string& name, const JSONValue& arguments) {
    FUNC_SCOPE();
    if (pImpl->state != ClientState::Ready) {
        return async::failedFuture<JSONValue>(pImpl->notInitialized(Methods::CallTool));
    }
    return coCallTool(pImpl->transport.get(), pImpl->serverName, name, arguments).toFuture();
}

std::future<void> Client::Shutdown() {
    FUNC_SCOPE();
    ClientState current = pImpl->state.load();
    do {
        if (current == ClientState::ShuttingDown || current == ClientState::Stopped) {
            return async::readyFuture();
        }
    } while (!pImpl->state.compare_exchange_weak(current, ClientState::ShuttingDown));
    return pImpl->coShutdown().toFuture();
}

ClientState Client::GetState() const { return pImpl->state.load(); }

int Client::GetProcessId() const { return pImpl->transport->GetProcessId(); }

InitializeResult Client::GetInitializeResult() const {
    std::lock_guard<std::mutex> lk(pImpl->initMutex);
    return pImpl->initResult;
}

} // namespace mcphost
