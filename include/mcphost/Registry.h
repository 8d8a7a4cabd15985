//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Registry.h
// Purpose: Per-user pool of running tool server instances
//==========================================================================================================

#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "mcphost/Client.h"
#include "mcphost/HostOptions.h"
#include "mcphost/Protocol.h"
#include "mcphost/Transport.h"
#include "mcphost/store/Store.h"

namespace mcphost {

//==========================================================================================================
// ServerInstance
// Purpose: One running, handshake-completed server bound to one (user, config).
//==========================================================================================================
struct ServerInstance {
    std::string instanceId;
    std::string userId;
    std::string configId;
    std::string name;
    int pid{-1};
    std::vector<Tool> tools;      // tagged with serverId/serverName
    std::shared_ptr<IClient> client;
};

// Diagnostics snapshot of an instance (no client handle)
struct InstanceInfo {
    std::string instanceId;
    std::string configId;
    std::string name;
    int pid{-1};
    std::vector<Tool> tools;
};

//==========================================================================================================
// Registry
// Purpose: Owns user -> configId -> ServerInstance. Loads for one user are serialized by a per-user
//          mutex, so concurrent loads start each config once; the map itself is guarded by a separate
//          mutex that is never held across process I/O.
//==========================================================================================================
class Registry {
public:
    //==========================================================================================================
    // Args:
    //   configStore: Source of the user's server configurations.
    //   transportFactory: Creates one transport per started config.
    //   options: Host options (maxConfigsPerUser, timeouts, handshake identity).
    //==========================================================================================================
    Registry(std::shared_ptr<store::IConfigStore> configStore,
             std::shared_ptr<ITransportFactory> transportFactory,
             HostOptions options);
    ~Registry();

    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    //==========================================================================================================
    // LoadUserTools
    // Purpose: Starts every enabled config of the user that is not already running and returns the
    //          flattened tool list. Returns the cached list when already loaded and forceReload is false.
    //          With forceReload, instances whose config vanished or was disabled are stopped.
    // Notes:
    //   A config that fails validation, spawn, handshake or discovery is logged and skipped. A config
    //   store failure is logged; the user stays unloaded and the running instances are returned.
    //==========================================================================================================
    std::vector<Tool> LoadUserTools(const std::string& userId, bool forceReload = false);

    // Loads on first use, then flattens every instance's tools.
    std::vector<Tool> GetUserTools(const std::string& userId);

    //==========================================================================================================
    // ExecuteTool
    // Purpose: Forwards tools/call to the instance for (userId, configId). Calls are not serialized.
    // Throws:
    //   errors::HostError NotFound when no instance is running for the pair; otherwise whatever the
    //   client raises (Timeout, RemoteToolError, ConnectionClosed, ProtocolError).
    //==========================================================================================================
    JSONValue ExecuteTool(const std::string& userId, const std::string& configId,
                          const std::string& toolName, const JSONValue& arguments);

    //==========================================================================================================
    // Removes the user's instances from the map, then shuts each down. Errors are logged.
    //==========================================================================================================
    void ShutdownUser(const std::string& userId);

    // ShutdownUser for every user, including users whose first load is still running. Idempotent.
    void ShutdownAll();

    //==========================================================================================================
    // Close
    // Purpose: Final shutdown. Later loads return nothing and an instance whose start finishes after this
    //          call is stopped instead of published. Idempotent; the destructor calls it.
    //==========================================================================================================
    void Close();

    std::optional<InstanceInfo> FindInstance(const std::string& userId, const std::string& configId) const;
    std::size_t RunningInstanceCount() const;
    bool IsUserLoaded(const std::string& userId) const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcphost
