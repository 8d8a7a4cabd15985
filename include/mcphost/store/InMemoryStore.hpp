//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InMemoryStore.hpp
// Purpose: Process-local configuration store and call log (tests, examples, single-node hosts)
//==========================================================================================================
#pragma once

#include "mcphost/store/Store.h"
#include <memory>

namespace mcphost {
namespace store {

//==========================================================================================================
// InMemoryStore
// Purpose: Thread-safe implementation of both store interfaces. SetUnavailable() makes every call
//          fail with StoreUnavailable, simulating an outage.
//==========================================================================================================
class InMemoryStore : public IConfigStore, public ICallLogStore {
public:
    InMemoryStore();
    virtual ~InMemoryStore();

    ////////////////////////////////////////// IConfigStore //////////////////////////////////////////
    std::vector<ServerConfig> FetchUserConfigs(const std::string& userId) override;

    ////////////////////////////////////////// ICallLogStore //////////////////////////////////////////
    void AppendToolCall(const ToolCallRecord& record) override;
    uint64_t CountToolCallsSince(const std::string& userId, const std::string& configId,
                                 TimePoint since) override;

    //==========================================================================================================
    // Inserts or replaces (by id) a configuration. Configs are returned in insertion order.
    //==========================================================================================================
    void PutConfig(const ServerConfig& config);

    // Returns true when a config with that id existed.
    bool RemoveConfig(const std::string& configId);

    // Returns false when no config with that id exists.
    bool SetConfigEnabled(const std::string& configId, bool enabled);

    // Snapshot of the call log for (userId, configId), oldest first.
    std::vector<ToolCallRecord> Records(const std::string& userId, const std::string& configId) const;

    void SetUnavailable(bool unavailable);

    // Number of FetchUserConfigs calls served (including failed ones)
    uint64_t FetchCount() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace store
} // namespace mcphost
