//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolHost.cpp
// Purpose: Service object wiring
//==========================================================================================================

#include <mutex>

#include "logging/Logger.h"
#include "mcphost/ProcessTransport.hpp"
#include "mcphost/RateLimiter.h"
#include "mcphost/Registry.h"
#include "mcphost/ToolHost.h"
#include "mcphost/errors/Errors.h"

namespace mcphost {

class ToolHost::Impl {
public:
    HostOptions options;
    std::shared_ptr<store::IConfigStore> configStore;
    std::shared_ptr<store::ICallLogStore> callLog;
    std::shared_ptr<ITransportFactory> transportFactory;

    std::mutex lifecycleMutex;
    bool initialized{false};
    bool shutDown{false};

    std::unique_ptr<Registry> registry;
    std::unique_ptr<RateLimiter> rateLimiter;
    std::unique_ptr<Executor> executor;

    void requireRunning(const char* op) {
        std::lock_guard<std::mutex> lk(lifecycleMutex);
        if (!initialized || shutDown) {
            throw errors::HostError(errors::ErrorCategory::Uninitialized,
                                    std::string("ToolHost is not running (") + op + ")");
        }
    }
};

ToolHost::ToolHost(HostOptions options,
                   std::shared_ptr<store::IConfigStore> configStore,
                   std::shared_ptr<store::ICallLogStore> callLog,
                   std::shared_ptr<ITransportFactory> transportFactory)
    : pImpl(std::make_unique<Impl>()) {
    FUNC_SCOPE();
    pImpl->options = std::move(options);
    pImpl->configStore = std::move(configStore);
    pImpl->callLog = std::move(callLog);
    pImpl->transportFactory = transportFactory ? std::move(transportFactory)
                                               : std::make_shared<ProcessTransportFactory>();
}

ToolHost::~ToolHost() {
    FUNC_SCOPE();
    ShutdownAll();
}

void ToolHost::Init() {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lk(pImpl->lifecycleMutex);
    if (pImpl->shutDown) {
        throw errors::HostError(errors::ErrorCategory::Uninitialized, "ToolHost was shut down");
    }
    if (pImpl->initialized) {
        return;
    }
    if (!pImpl->configStore || !pImpl->callLog) {
        throw errors::HostError(errors::ErrorCategory::ConfigurationError,
                                "ToolHost requires a config store and a call log store");
    }
    if (pImpl->options.requestTimeoutMs == 0 || pImpl->options.rateLimitWindowSec == 0) {
        throw errors::HostError(errors::ErrorCategory::ConfigurationError,
                                "requestTimeoutMs and rateLimitWindowSec must be positive");
    }
    pImpl->registry = std::make_unique<Registry>(pImpl->configStore, pImpl->transportFactory, pImpl->options);
    pImpl->rateLimiter = std::make_unique<RateLimiter>(pImpl->callLog, pImpl->options);
    pImpl->executor = std::make_unique<Executor>(*pImpl->registry, *pImpl->rateLimiter);
    pImpl->initialized = true;
    LOG_INFO("ToolHost initialized (limit {} calls per {}s, request timeout {} ms)",
             pImpl->options.callsPerHour, pImpl->options.rateLimitWindowSec, pImpl->options.requestTimeoutMs);
}

void ToolHost::ShutdownAll() {
    FUNC_SCOPE();
    {
        std::lock_guard<std::mutex> lk(pImpl->lifecycleMutex);
        if (!pImpl->initialized || pImpl->shutDown) {
            pImpl->shutDown = true;
            return;
        }
        pImpl->shutDown = true;
    }
    pImpl->registry->Close();
}

std::vector<Tool> ToolHost::ListTools(const std::string& userId) {
    FUNC_SCOPE();
    pImpl->requireRunning("ListTools");
    return pImpl->registry->GetUserTools(userId);
}

ToolCallResult ToolHost::Execute(const std::string& userId, const ToolCallRequest& request) {
    FUNC_SCOPE();
    try {
        pImpl->requireRunning("Execute");
    } catch (const errors::HostError& e) {
        ToolCallResult out;
        out.toolName = request.toolName;
        out.error = std::string(e.what());
        out.errorCategory = e.category();
        return out;
    }
    return pImpl->executor->Execute(userId, request);
}

std::vector<Tool> ToolHost::LoadUserTools(const std::string& userId, bool forceReload) {
    FUNC_SCOPE();
    pImpl->requireRunning("LoadUserTools");
    return pImpl->registry->LoadUserTools(userId, forceReload);
}

void ToolHost::ShutdownUser(const std::string& userId) {
    FUNC_SCOPE();
    pImpl->requireRunning("ShutdownUser");
    pImpl->registry->ShutdownUser(userId);
}

Registry& ToolHost::GetRegistry() {
    pImpl->requireRunning("GetRegistry");
    return *pImpl->registry;
}

} // namespace mcphost
