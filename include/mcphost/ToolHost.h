//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolHost.h
// Purpose: Service object owning the registry, rate limiter and executor for one process
//==========================================================================================================

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "mcphost/Executor.h"
#include "mcphost/HostOptions.h"
#include "mcphost/Protocol.h"
#include "mcphost/Transport.h"
#include "mcphost/store/Store.h"

namespace mcphost {

class Registry;

//==========================================================================================================
// ToolHost
// Purpose: Constructed once at startup and passed to whoever needs tools. Init() must be called
//          before use; ShutdownAll() stops every server and is safe to call more than once.
//==========================================================================================================
class ToolHost {
public:
    //==========================================================================================================
    // Args:
    //   options: Host options.
    //   configStore: Source of server configurations.
    //   callLog: Call log used for quota and accounting.
    //   transportFactory: Transport factory; ProcessTransportFactory when null.
    //==========================================================================================================
    ToolHost(HostOptions options,
             std::shared_ptr<store::IConfigStore> configStore,
             std::shared_ptr<store::ICallLogStore> callLog,
             std::shared_ptr<ITransportFactory> transportFactory = nullptr);
    ~ToolHost();

    ToolHost(const ToolHost&) = delete;
    ToolHost& operator=(const ToolHost&) = delete;

    // Builds the components. Throws errors::HostError (ConfigurationError) on unusable options.
    void Init();

    void ShutdownAll();

    //==========================================================================================================
    // Tools exposed to the calling agent, each tagged with its owning server id and name.
    // Throws:
    //   errors::HostError (Uninitialized) before Init() or after ShutdownAll().
    //==========================================================================================================
    std::vector<Tool> ListTools(const std::string& userId);

    // Uniform result envelope; an Uninitialized host reports failure in the envelope.
    ToolCallResult Execute(const std::string& userId, const ToolCallRequest& request);

    std::vector<Tool> LoadUserTools(const std::string& userId, bool forceReload = false);
    void ShutdownUser(const std::string& userId);

    // Valid between Init() and ShutdownAll()
    Registry& GetRegistry();

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcphost
