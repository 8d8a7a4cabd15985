//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Transport.h
// Purpose: Transport layer interfaces between the host and one tool server session
//==========================================================================================================

#pragma once

#include <memory>
#include <string>
#include <functional>
#include <future>
#include <cstdint>

namespace mcphost {

// Forward declarations
class JSONRPCRequest;
class JSONRPCResponse;
class JSONRPCNotification;
struct ServerConfig;
struct HostOptions;

//==========================================================================================================
// ITransport
// Purpose: One JSON-RPC session with one tool server. Requests are correlated purely by id, so any
//          number of requests may be in flight at once.
//==========================================================================================================
class ITransport {
public:
    virtual ~ITransport() = default;

    /////////////////////////////////////////// Connection lifecycle ///////////////////////////////////////////
    //==========================================================================================================
    // Starts the transport (spawning the peer if it is a process) and its I/O loops.
    // Args:
    //   (none)
    // Returns:
    //   A future that completes when the transport is running; it carries errors::HostError
    //   (StartupFailure) when the peer could not be started.
    //==========================================================================================================
    virtual std::future<void> Start() = 0;

    //==========================================================================================================
    // Closes the transport and releases resources. Idempotent; failures are logged, never raised.
    // Args:
    //   (none)
    // Returns:
    //   A future that completes when the transport has closed.
    //==========================================================================================================
    virtual std::future<void> Close() = 0;

    //==========================================================================================================
    // Indicates whether the inbound stream is still open.
    // Returns:
    //   true if connected; false otherwise.
    //==========================================================================================================
    virtual bool IsConnected() const = 0;

    //==========================================================================================================
    // Returns a transport session identifier for diagnostics.
    //==========================================================================================================
    virtual std::string GetSessionId() const = 0;

    //==========================================================================================================
    // Returns the OS process id of the peer, or -1 when the transport does not own a process.
    //==========================================================================================================
    virtual int GetProcessId() const = 0;

    /////////////////////////////////////////// Message sending ///////////////////////////////////////////
    //==========================================================================================================
    // Sends a JSON-RPC request and returns a future for the response.
    // Args:
    //   request: Unique pointer to a JSONRPCRequest; its id is replaced by the transport's next id.
    // Returns:
    //   Future resolving to a unique_ptr<JSONRPCResponse>. Timeouts and closed connections are
    //   reported as error responses (JSONRPCErrorCodes::RequestTimeout / ConnectionClosed).
    //==========================================================================================================
    virtual std::future<std::unique_ptr<JSONRPCResponse>> SendRequest(
        std::unique_ptr<JSONRPCRequest> request) = 0;

    //==========================================================================================================
    // Sends a JSON-RPC notification (no response expected).
    // Returns:
    //   Future completing when the notification has been queued for writing.
    //==========================================================================================================
    virtual std::future<void> SendNotification(
        std::unique_ptr<JSONRPCNotification> notification) = 0;

    /////////////////////////////////////////// Handlers ///////////////////////////////////////////
    // Invoked on the reader thread for every inbound notification.
    using NotificationHandler = std::function<void(std::unique_ptr<JSONRPCNotification>)>;
    virtual void SetNotificationHandler(NotificationHandler handler) = 0;

    // Invoked with a short description on transport errors (stream closed, write failure).
    using ErrorHandler = std::function<void(const std::string& error)>;
    virtual void SetErrorHandler(ErrorHandler handler) = 0;
};

// Concrete transports are declared in their respective headers:
//  - mcphost/ProcessTransport.hpp

//==========================================================================================================
// ITransportFactory
// Purpose: Creates the transport for one server configuration. The Registry owns a factory so tests
//          can substitute one that counts or redirects launches.
//==========================================================================================================
class ITransportFactory {
public:
    virtual ~ITransportFactory() = default;

    //==========================================================================================================
    // Creates a transport instance for the given config. The transport is not started.
    // Args:
    //   config: Validated server configuration.
    //   options: Host options (timeouts and transport policies).
    // Returns:
    //   A unique_ptr to a newly created ITransport.
    //==========================================================================================================
    virtual std::unique_ptr<ITransport> CreateTransport(const ServerConfig& config,
                                                        const HostOptions& options) = 0;
};

} // namespace mcphost
