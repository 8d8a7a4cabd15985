//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Registry.cpp
// Purpose: Per-user tool server pool (load, reuse, execute, shutdown)
//==========================================================================================================

#include <algorithm>
#include <atomic>
#include <mutex>
#include <random>
#include <set>
#include <stdexcept>
#include <unordered_map>

#include <fmt/format.h>

#include "logging/Logger.h"
#include "mcphost/Registry.h"
#include "mcphost/ServerConfig.h"
#include "mcphost/errors/Errors.h"

namespace mcphost {

class Registry::Impl {
public:
    struct UserPool {
        bool loaded{false};
        std::vector<std::shared_ptr<ServerInstance>> instances;  // in load order
    };

    std::shared_ptr<store::IConfigStore> configStore;
    std::shared_ptr<ITransportFactory> transportFactory;
    HostOptions options;

    mutable std::mutex mapMutex;
    std::unordered_map<std::string, UserPool> users;
    // Serializes load/shutdown per user; entries are never erased so a lock outlives its pool.
    std::unordered_map<std::string, std::shared_ptr<std::mutex>> loadLocks;
    // Set by Close(); guarded by mapMutex. No instance is published once set.
    bool closed{false};

    std::atomic<uint64_t> instanceCounter{0};
    uint32_t instanceSalt{0};

    Impl(std::shared_ptr<store::IConfigStore> store, std::shared_ptr<ITransportFactory> factory, HostOptions opts)
        : configStore(std::move(store)), transportFactory(std::move(factory)), options(std::move(opts)) {
        std::random_device rd;
        instanceSalt = static_cast<uint32_t>(rd());
    }

    std::shared_ptr<std::mutex> userLock(const std::string& userId) {
        std::lock_guard<std::mutex> lk(mapMutex);
        auto& m = loadLocks[userId];
        if (!m) {
            m = std::make_shared<std::mutex>();
        }
        return m;
    }

    // Caller holds mapMutex
    static std::vector<Tool> flatten(const UserPool& pool) {
        std::vector<Tool> tools;
        for (const auto& inst : pool.instances) {
            tools.insert(tools.end(), inst->tools.begin(), inst->tools.end());
        }
        return tools;
    }

    std::vector<Tool> currentTools(const std::string& userId) const {
        std::lock_guard<std::mutex> lk(mapMutex);
        auto it = users.find(userId);
        if (it == users.end()) {
            return {};
        }
        return flatten(it->second);
    }

    std::shared_ptr<ServerInstance> findLocked(const std::string& userId, const std::string& configId) const {
        auto it = users.find(userId);
        if (it == users.end()) {
            return nullptr;
        }
        for (const auto& inst : it->second.instances) {
            if (inst->configId == configId) {
                return inst;
            }
        }
        return nullptr;
    }

    static void shutdownClient(IClient& client, const std::string& name) {
        try {
            client.Shutdown().get();
        } catch (const std::exception& e) {
            LOG_ERROR("Error shutting down MCP {}: {}", name, e.what());
        }
    }

    static void stopInstances(const std::vector<std::shared_ptr<ServerInstance>>& instances) {
        for (const auto& inst : instances) {
            if (inst->client) {
                shutdownClient(*inst->client, inst->name);
            }
        }
    }

    //==========================================================================================================
    // Validates, spawns, handshakes and lists tools for one config.
    // Returns:
    //   The new instance, or nullptr after logging the failure (the half-started client is shut down).
    //==========================================================================================================
    std::shared_ptr<ServerInstance> startInstance(const std::string& userId, const ServerConfig& cfg) {
        LOG_INFO("Starting MCP server: {}", cfg.name);
        std::shared_ptr<IClient> client;
        try {
            ValidateServerConfig(cfg);
            auto transport = transportFactory->CreateTransport(cfg, options);
            client = std::make_shared<Client>(std::move(transport), cfg.name, options);
            client->Start().get();
            (void)client->Initialize().get();
            auto tools = client->ListTools().get();
            for (auto& t : tools) {
                t.serverId = cfg.id;
                t.serverName = cfg.name;
            }

            auto inst = std::make_shared<ServerInstance>();
            inst->instanceId = fmt::format("mcp-{:08x}-{}", instanceSalt, ++instanceCounter);
            inst->userId = userId;
            inst->configId = cfg.id;
            inst->name = cfg.name;
            inst->pid = client->GetProcessId();
            inst->tools = std::move(tools);
            inst->client = std::move(client);
            LOG_INFO("Started MCP server: {} (pid {}) with {} tools", inst->name, inst->pid, inst->tools.size());
            return inst;
        } catch (const std::exception& e) {
            LOG_ERROR("Failed to start MCP {}: {}", cfg.name, e.what());
            if (client) {
                shutdownClient(*client, cfg.name);
            }
            return nullptr;
        }
    }
};

Registry::Registry(std::shared_ptr<store::IConfigStore> configStore,
                   std::shared_ptr<ITransportFactory> transportFactory,
                   HostOptions options)
    : pImpl(std::make_unique<Impl>(std::move(configStore), std::move(transportFactory), std::move(options))) {
    FUNC_SCOPE();
    if (!pImpl->configStore || !pImpl->transportFactory) {
        throw std::invalid_argument("Registry requires a config store and a transport factory");
    }
}

Registry::~Registry() {
    FUNC_SCOPE();
    Close();
}

std::vector<Tool> Registry::LoadUserTools(const std::string& userId, bool forceReload) {
    FUNC_SCOPE();
    auto lock = pImpl->userLock(userId);
    std::lock_guard<std::mutex> loadGuard(*lock);
    {
        std::lock_guard<std::mutex> lk(pImpl->mapMutex);
        if (pImpl->closed) {
            LOG_WARN("Registry closed; not loading MCPs for user {}", userId);
            return {};
        }
        auto it = pImpl->users.find(userId);
        if (it != pImpl->users.end() && it->second.loaded && !forceReload) {
            LOG_DEBUG("MCPs already loaded for user {}", userId);
            return Impl::flatten(it->second);
        }
    }

    LOG_INFO("Loading MCPs for user {}", userId);
    std::vector<ServerConfig> configs;
    try {
        configs = pImpl->configStore->FetchUserConfigs(userId);
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to fetch MCP configs for user {}: {}", userId, e.what());
        return pImpl->currentTools(userId);
    }
    LOG_INFO("Found {} MCP configurations for user {}", configs.size(), userId);
    if (configs.size() > pImpl->options.maxConfigsPerUser) {
        LOG_WARN("User {} has {} MCP configurations; only the first {} are loaded",
                 userId, configs.size(), pImpl->options.maxConfigsPerUser);
        configs.resize(static_cast<std::size_t>(pImpl->options.maxConfigsPerUser));
    }

    if (forceReload) {
        std::set<std::string> wanted;
        for (const auto& cfg : configs) {
            if (cfg.enabled) {
                wanted.insert(cfg.id);
            }
        }
        std::vector<std::shared_ptr<ServerInstance>> stale;
        {
            std::lock_guard<std::mutex> lk(pImpl->mapMutex);
            auto& pool = pImpl->users[userId];
            auto split = std::stable_partition(pool.instances.begin(), pool.instances.end(),
                [&](const std::shared_ptr<ServerInstance>& inst) { return wanted.count(inst->configId) > 0; });
            stale.assign(split, pool.instances.end());
            pool.instances.erase(split, pool.instances.end());
        }
        for (const auto& inst : stale) {
            LOG_INFO("Stopping MCP {} for user {}: configuration removed or disabled", inst->name, userId);
        }
        Impl::stopInstances(stale);
    }

    for (const auto& cfg : configs) {
        if (!cfg.enabled) {
            LOG_DEBUG("Skipping disabled MCP: {}", cfg.name);
            continue;
        }
        if (!cfg.userId.empty() && cfg.userId != userId) {
            LOG_WARN("Skipping MCP {}: configuration belongs to user {}", cfg.name, cfg.userId);
            continue;
        }
        {
            std::lock_guard<std::mutex> lk(pImpl->mapMutex);
            if (pImpl->findLocked(userId, cfg.id)) {
                LOG_DEBUG("MCP {} already running", cfg.name);
                continue;
            }
        }
        auto inst = pImpl->startInstance(userId, cfg);
        if (!inst) {
            continue;
        }
        bool publish = false;
        {
            std::lock_guard<std::mutex> lk(pImpl->mapMutex);
            if (!pImpl->closed) {
                pImpl->users[userId].instances.push_back(inst);
                publish = true;
            }
        }
        if (!publish) {
            LOG_WARN("Registry closed while starting MCP {}; stopping it", inst->name);
            Impl::stopInstances({inst});
        }
    }

    std::lock_guard<std::mutex> lk(pImpl->mapMutex);
    if (pImpl->closed) {
        return {};
    }
    auto& pool = pImpl->users[userId];
    pool.loaded = true;
    LOG_INFO("User {} has {} MCP servers running", userId, pool.instances.size());
    return Impl::flatten(pool);
}

std::vector<Tool> Registry::GetUserTools(const std::string& userId) {
    FUNC_SCOPE();
    if (!IsUserLoaded(userId)) {
        return LoadUserTools(userId, false);
    }
    auto tools = pImpl->currentTools(userId);
    LOG_DEBUG("User {} has {} MCP tools available", userId, tools.size());
    return tools;
}

JSONValue Registry::ExecuteTool(const std::string& userId, const std::string& configId,
                                const std::string& toolName, const JSONValue& arguments) {
    FUNC_SCOPE();
    std::shared_ptr<ServerInstance> inst;
    {
        std::lock_guard<std::mutex> lk(pImpl->mapMutex);
        inst = pImpl->findLocked(userId, configId);
    }
    if (!inst) {
        throw errors::HostError(errors::ErrorCategory::NotFound,
                                fmt::format("MCP server {} not found for user {}", configId, userId));
    }
    LOG_INFO("Executing MCP tool {} on {} for user {}", toolName, inst->name, userId);
    return inst->client->CallTool(toolName, arguments).get();
}

void Registry::ShutdownUser(const std::string& userId) {
    FUNC_SCOPE();
    auto lock = pImpl->userLock(userId);
    std::lock_guard<std::mutex> loadGuard(*lock);
    std::vector<std::shared_ptr<ServerInstance>> instances;
    {
        std::lock_guard<std::mutex> lk(pImpl->mapMutex);
        auto it = pImpl->users.find(userId);
        if (it == pImpl->users.end()) {
            LOG_DEBUG("No MCPs loaded for user {}", userId);
            return;
        }
        instances = std::move(it->second.instances);
        pImpl->users.erase(it);
    }
    LOG_INFO("Shutting down all MCPs for user {}", userId);
    Impl::stopInstances(instances);
    LOG_INFO("Shut down {} MCPs for user {}", instances.size(), userId);
}

void Registry::ShutdownAll() {
    FUNC_SCOPE();
    // Every pool is created under its user's load lock, so the lock keys also cover users whose
    // first load is still in flight; ShutdownUser waits behind that load.
    std::vector<std::string> userIds;
    {
        std::lock_guard<std::mutex> lk(pImpl->mapMutex);
        if (pImpl->loadLocks.empty()) {
            return;
        }
        for (const auto& kv : pImpl->loadLocks) {
            userIds.push_back(kv.first);
        }
    }
    LOG_INFO("Shutting down all MCP servers");
    for (const auto& userId : userIds) {
        ShutdownUser(userId);
    }
    LOG_INFO("All MCP servers shut down");
}

void Registry::Close() {
    FUNC_SCOPE();
    {
        std::lock_guard<std::mutex> lk(pImpl->mapMutex);
        pImpl->closed = true;
    }
    ShutdownAll();
}

std::optional<InstanceInfo> Registry::FindInstance(const std::string& userId, const std::string& configId) const {
    std::lock_guard<std::mutex> lk(pImpl->mapMutex);
    auto inst = pImpl->findLocked(userId, configId);
    if (!inst) {
        return std::nullopt;
    }
    InstanceInfo info;
    info.instanceId = inst->instanceId;
    info.configId = inst->configId;
    info.name = inst->name;
    info.pid = inst->pid;
    info.tools = inst->tools;
    return info;
}

std::size_t Registry::RunningInstanceCount() const {
    std::lock_guard<std::mutex> lk(pImpl->mapMutex);
    std::size_t n = 0;
    for (const auto& kv : pImpl->users) {
        n += kv.second.instances.size();
    }
    return n;
}

bool Registry::IsUserLoaded(const std::string& userId) const {
    std::lock_guard<std::mutex> lk(pImpl->mapMutex);
    auto it = pImpl->users.find(userId);
    return it != pImpl->users.end() && it->second.loaded;
}

} // namespace mcphost
