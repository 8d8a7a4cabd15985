//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RestStore.hpp
// Purpose: Configuration store and call log backed by a PostgREST-style HTTP/HTTPS endpoint
//==========================================================================================================
#pragma once

#include "mcphost/HostOptions.h"
#include "mcphost/store/Store.h"
#include <memory>
#include <string>

namespace mcphost {
namespace store {

//==========================================================================================================
// RestStore
// Purpose: Talks to {baseUrl}/rest/v1/mcp_configurations and {baseUrl}/rest/v1/mcp_tool_calls using
//          Boost.Beast. HTTPS uses TLS 1.3 only with peer verification. Every failure (network,
//          TLS, non-2xx status, undecodable body) is raised as HostError(StoreUnavailable).
//==========================================================================================================
class RestStore : public IConfigStore, public ICallLogStore {
public:
    struct Options {
        std::string baseUrl;       // http(s)://host[:port][/prefix]
        std::string apiKey;        // sent as apikey and Authorization: Bearer
        std::string caFile;        // optional PEM bundle; system defaults otherwise
        uint64_t timeoutMs{10000}; // connect and I/O bound per request
    };

    explicit RestStore(const Options& opts);
    // Options from HostOptions::storeUrl/storeKey/storeCaFile/storeTimeoutMs
    explicit RestStore(const HostOptions& options);
    virtual ~RestStore();

    ////////////////////////////////////////// IConfigStore //////////////////////////////////////////
    // GET mcp_configurations?user_id=eq.{u}&order=created_at.asc. Rows that fail to decode are skipped.
    std::vector<ServerConfig> FetchUserConfigs(const std::string& userId) override;

    ////////////////////////////////////////// ICallLogStore //////////////////////////////////////////
    // POST mcp_tool_calls with Prefer: return=minimal
    void AppendToolCall(const ToolCallRecord& record) override;

    // GET with Prefer: count=exact and Range: 0-0; the total is read from Content-Range.
    uint64_t CountToolCallsSince(const std::string& userId, const std::string& configId,
                                 TimePoint since) override;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

// Parses the total out of a Content-Range header ("0-0/42", "*/0"). Returns false when absent or "*".
bool ParseContentRangeTotal(const std::string& header, uint64_t& total);

} // namespace store
} // namespace mcphost
