//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InMemoryStore.cpp
// Purpose: In-memory configuration store and call log
//==========================================================================================================

#include <algorithm>
#include <atomic>
#include <mutex>

#include <fmt/format.h>

#include "logging/Logger.h"
#include "mcphost/errors/Errors.h"
#include "mcphost/store/InMemoryStore.hpp"

namespace mcphost {
namespace store {

class InMemoryStore::Impl {
public:
    mutable std::mutex mutex;
    std::vector<ServerConfig> configs;
    std::vector<ToolCallRecord> records;
    std::atomic<bool> unavailable{false};
    std::atomic<uint64_t> fetchCount{0};

    void throwIfUnavailable(const char* op) const {
        if (unavailable) {
            throw errors::HostError(errors::ErrorCategory::StoreUnavailable,
                                    fmt::format("In-memory store unavailable ({})", op));
        }
    }
};

InMemoryStore::InMemoryStore() : pImpl(std::make_unique<Impl>()) {}

InMemoryStore::~InMemoryStore() = default;

std::vector<ServerConfig> InMemoryStore::FetchUserConfigs(const std::string& userId) {
    FUNC_SCOPE();
    ++pImpl->fetchCount;
    pImpl->throwIfUnavailable("fetch configs");
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    std::vector<ServerConfig> out;
    for (const auto& cfg : pImpl->configs) {
        if (cfg.userId == userId) {
            out.push_back(cfg);
        }
    }
    return out;
}

void InMemoryStore::AppendToolCall(const ToolCallRecord& record) {
    FUNC_SCOPE();
    pImpl->throwIfUnavailable("append tool call");
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    pImpl->records.push_back(record);
}

uint64_t InMemoryStore::CountToolCallsSince(const std::string& userId, const std::string& configId,
                                            TimePoint since) {
    FUNC_SCOPE();
    pImpl->throwIfUnavailable("count tool calls");
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    return static_cast<uint64_t>(std::count_if(pImpl->records.begin(), pImpl->records.end(),
        [&](const ToolCallRecord& r) {
            return r.userId == userId && r.configId == configId && r.calledAt >= since;
        }));
}

void InMemoryStore::PutConfig(const ServerConfig& config) {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    auto it = std::find_if(pImpl->configs.begin(), pImpl->configs.end(),
                           [&](const ServerConfig& c) { return c.id == config.id; });
    if (it != pImpl->configs.end()) {
        *it = config;
        return;
    }
    pImpl->configs.push_back(config);
}

bool InMemoryStore::RemoveConfig(const std::string& configId) {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    auto it = std::remove_if(pImpl->configs.begin(), pImpl->configs.end(),
                             [&](const ServerConfig& c) { return c.id == configId; });
    const bool found = it != pImpl->configs.end();
    pImpl->configs.erase(it, pImpl->configs.end());
    return found;
}

bool InMemoryStore::SetConfigEnabled(const std::string& configId, bool enabled) {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    for (auto& c : pImpl->configs) {
        if (c.id == configId) {
            c.enabled = enabled;
            return true;
        }
    }
    return false;
}

std::vector<ToolCallRecord> InMemoryStore::Records(const std::string& userId, const std::string& configId) const {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    std::vector<ToolCallRecord> out;
    for (const auto& r : pImpl->records) {
        if (r.userId == userId && r.configId == configId) {
            out.push_back(r);
        }
    }
    return out;
}

void InMemoryStore::SetUnavailable(bool unavailable) {
    LOG_DEBUG("InMemoryStore: unavailable={}", unavailable);
    pImpl->unavailable = unavailable;
}

uint64_t InMemoryStore::FetchCount() const { return pImpl->fetchCount.load(); }

} // namespace store
} // namespace mcphost
