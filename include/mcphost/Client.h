//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Client.h
// Purpose: Client side of one tool server session (handshake, tool discovery, tool calls)
//==========================================================================================================

#pragma once

#include <future>
#include <memory>
#include <string>
#include <vector>

#include "mcphost/HostOptions.h"
#include "mcphost/JSONRPCTypes.h"
#include "mcphost/Protocol.h"
#include "mcphost/Transport.h"

namespace mcphost {

// Lifecycle of one client. Requests other than initialize are only accepted in Ready.
enum class ClientState {
    Unstarted,
    Starting,
    Ready,
    ShuttingDown,
    Stopped
};

const char* toString(ClientState state);

//==========================================================================================================
// IClient
// Purpose: Capability interface the Registry drives. The stdio client is one implementation; other
//          transports plug in underneath through ITransport.
//==========================================================================================================
class IClient {
public:
    virtual ~IClient() = default;

    //==========================================================================================================
    // Starts the underlying transport.
    // Returns:
    //   Future completing once the peer is running; carries HostError(StartupFailure) otherwise.
    //==========================================================================================================
    virtual std::future<void> Start() = 0;

    //==========================================================================================================
    // Runs the initialize handshake and sends notifications/initialized.
    // Returns:
    //   Future for what the server reported. Failures carry HostError(StartupFailure) with the
    //   JSON-RPC code of the underlying error when there was one.
    //==========================================================================================================
    virtual std::future<InitializeResult> Initialize() = 0;

    //==========================================================================================================
    // Requests tools/list.
    // Returns:
    //   Future for the advertised tools; HostError(Uninitialized) before the handshake completes.
    //==========================================================================================================
    virtual std::future<std::vector<Tool>> ListTools() = 0;

    //==========================================================================================================
    // Requests tools/call.
    // Args:
    //   name: Tool name as advertised.
    //   arguments: JSON object passed through untouched.
    // Returns:
    //   Future for the result member of the response. Carries HostError with category Uninitialized,
    //   Timeout, ConnectionClosed or RemoteToolError on failure.
    //==========================================================================================================
    virtual std::future<JSONValue> CallTool(const std::string& name, const JSONValue& arguments) = 0;

    //==========================================================================================================
    // Closes the session and stops the peer. Idempotent; never throws through the future.
    //==========================================================================================================
    virtual std::future<void> Shutdown() = 0;

    virtual ClientState GetState() const = 0;
    virtual int GetProcessId() const = 0;
};

//==========================================================================================================
// Client
// Purpose: Standard client over an ITransport.
//==========================================================================================================
class Client : public IClient {
public:
    //==========================================================================================================
    // Args:
    //   transport: Unstarted transport; the client takes ownership.
    //   serverName: Display name used in log lines and error messages.
    //   options: Host options (clientInfo and protocol version for the handshake).
    //==========================================================================================================
    Client(std::unique_ptr<ITransport> transport, std::string serverName, HostOptions options);
    virtual ~Client();

    ////////////////////////////////////////// IClient implementation //////////////////////////////////////////
    std::future<void> Start() override;
    std::future<InitializeResult> Initialize() override;
    std::future<std::vector<Tool>> ListTools() override;
    std::future<JSONValue> CallTool(const std::string& name, const JSONValue& arguments) override;
    std::future<void> Shutdown() override;
    ClientState GetState() const override;
    int GetProcessId() const override;

    // serverInfo/capabilities from the last successful handshake
    InitializeResult GetInitializeResult() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

//==========================================================================================================
// ParseToolsListResult
// Purpose: Decodes a tools/list result ({ tools: [ { name, description, inputSchema } ] }).
//          Entries without a string name are skipped.
// Throws:
//   errors::HostError (ProtocolError) when the result is not an object with a tools array.
//==========================================================================================================
std::vector<Tool> ParseToolsListResult(const JSONValue& result);

} // namespace mcphost
