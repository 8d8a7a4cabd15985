//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProcessTransport.hpp
// Purpose: Transport that launches a tool server as a child process and speaks newline-delimited
//          JSON-RPC over its stdin/stdout
//==========================================================================================================
#pragma once

#include "mcphost/Transport.h"
#include "mcphost/ServerConfig.h"
#include "mcphost/HostOptions.h"
#include <memory>
#include <cstdint>

namespace mcphost {

//==========================================================================================================
// ProcessTransport
// Purpose: Owns one child process. A reader thread splits stdout into lines and resolves pending
//          requests by id, a writer thread drains the outbound queue into stdin, a sweeper thread fails
//          requests whose deadline has passed, and a drain thread forwards stderr to the log.
//==========================================================================================================
class ProcessTransport : public ITransport {
public:
    ProcessTransport(ServerConfig config, HostOptions options);
    virtual ~ProcessTransport();

    ////////////////////////////////////////// ITransport //////////////////////////////////////////
    //==========================================================================================================
    // Spawns the child (command + args, environment built from the config) and starts the I/O threads.
    // Returns:
    //   Future that completes once the child has exec'd; carries HostError(StartupFailure) when the
    //   pipes, fork or exec fail.
    //==========================================================================================================
    std::future<void> Start() override;

    //==========================================================================================================
    // Stops the reader, closes the child's stdin, waits up to shutdownTimeoutMs for it to exit, then
    // escalates to SIGTERM and SIGKILL. Remaining pending requests fail with ConnectionClosed.
    //==========================================================================================================
    std::future<void> Close() override;

    bool IsConnected() const override;
    std::string GetSessionId() const override;
    int GetProcessId() const override;

    //==========================================================================================================
    // Assigns the next integer id, registers the pending entry with its deadline and queues the line.
    //==========================================================================================================
    std::future<std::unique_ptr<JSONRPCResponse>> SendRequest(
        std::unique_ptr<JSONRPCRequest> request) override;

    std::future<void> SendNotification(
        std::unique_ptr<JSONRPCNotification> notification) override;

    void SetNotificationHandler(NotificationHandler handler) override;
    void SetErrorHandler(ErrorHandler handler) override;

    // Number of requests awaiting a response (diagnostics and tests)
    std::size_t PendingRequestCount() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

//==========================================================================================================
// ProcessTransportFactory
// Purpose: Default factory used by the Registry.
//==========================================================================================================
class ProcessTransportFactory : public ITransportFactory {
public:
    std::unique_ptr<ITransport> CreateTransport(const ServerConfig& config,
                                                const HostOptions& options) override;
};

} // namespace mcphost
