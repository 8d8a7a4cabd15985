//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: examples/tool_host/main.cpp
// Purpose: Command-line driver that launches one tool server, lists its tools and optionally calls one
//
// Usage: mcphost_cli --command=<exe> [--args=a,b,c] [--name=<server name>] [--user=<id>]
//                    [--tool=<name>] [--arguments=<json object>] [--options=<key=value;...>]
//==========================================================================================================

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "logging/Logger.h"
#include "mcphost/HostOptions.h"
#include "mcphost/ToolHost.h"
#include "mcphost/errors/Errors.h"
#include "mcphost/store/InMemoryStore.hpp"

using namespace mcphost;

//==========================================================================================================
// getArgValue
// Purpose: Parses key=value style CLI options.
// Args:
//   argc: Argument count
//   argv: Argument vector
//   key: Key string including leading dashes (e.g., "--tool")
// Returns:
//   Optional string containing the value when present
//==========================================================================================================
static std::optional<std::string> getArgValue(int argc, char** argv, const std::string& key) {
    for (std::size_t i = 1; i < static_cast<std::size_t>(argc); ++i) {
        std::string a = argv[i];
        auto eq = a.find('=');
        if (eq != std::string::npos && a.substr(0, eq) == key) {
            return a.substr(eq + 1);
        }
    }
    return std::nullopt;
}

static std::vector<std::string> splitComma(const std::string& s) {
    std::vector<std::string> out;
    std::size_t start = 0;
    while (start <= s.size()) {
        std::size_t comma = s.find(',', start);
        if (comma == std::string::npos) {
            comma = s.size();
        }
        if (comma > start) {
            out.push_back(s.substr(start, comma - start));
        }
        start = comma + 1;
    }
    return out;
}

static void usage() {
    std::cerr << "usage: mcphost_cli --command=<exe> [--args=a,b,c] [--name=<server name>] [--user=<id>]\n"
                 "                   [--tool=<name>] [--arguments=<json object>] [--options=<key=value;...>]\n";
}

int main(int argc, char** argv) {
    // Logs go to stderr; stdout carries only the JSON result
    ::setenv("MCPHOST_STDIO_MODE", "1", 0);
    Logger::setLogLevel(LogLevel::LOG_WARN_LEVEL);
    Logger::configureFromEnv();

    auto command = getArgValue(argc, argv, "--command");
    if (!command.has_value() || command->empty()) {
        usage();
        return 2;
    }

    HostOptions options;
    try {
        auto opt = getArgValue(argc, argv, "--options");
        options = opt.has_value() ? HostOptions::Parse(*opt) : HostOptions::FromEnv();
    } catch (const errors::HostError& e) {
        std::cerr << "mcphost_cli: " << e.what() << std::endl;
        return 2;
    }

    const std::string userId = getArgValue(argc, argv, "--user").value_or("local");
    ServerConfig cfg;
    cfg.id = "cli";
    cfg.userId = userId;
    cfg.name = getArgValue(argc, argv, "--name").value_or("cli-server");
    cfg.command = *command;
    cfg.args = splitComma(getArgValue(argc, argv, "--args").value_or(""));

    JSONValue arguments{JSONValue::Object{}};
    if (auto raw = getArgValue(argc, argv, "--arguments"); raw.has_value()) {
        try {
            arguments = ParseJSON(*raw);
        } catch (const std::runtime_error& e) {
            std::cerr << "mcphost_cli: --arguments is not valid JSON: " << e.what() << std::endl;
            return 2;
        }
        if (!arguments.IsObject()) {
            std::cerr << "mcphost_cli: --arguments must be a JSON object" << std::endl;
            return 2;
        }
    }

    auto store = std::make_shared<store::InMemoryStore>();
    store->PutConfig(cfg);
    ToolHost host(options, store, store);
    try {
        host.Init();
    } catch (const errors::HostError& e) {
        std::cerr << "mcphost_cli: " << e.what() << std::endl;
        return 2;
    }

    std::vector<Tool> tools = host.ListTools(userId);
    if (tools.empty()) {
        std::cerr << "mcphost_cli: server '" << cfg.name << "' did not start or advertises no tools" << std::endl;
        host.ShutdownAll();
        return 1;
    }

    auto tool = getArgValue(argc, argv, "--tool");
    if (!tool.has_value()) {
        JSONValue::Array list;
        for (const auto& t : tools) {
            JSONValue::Object entry;
            entry["name"] = MakeJSON(t.name);
            entry["description"] = MakeJSON(t.description);
            entry["inputSchema"] = MakeJSON(t.inputSchema);
            entry["server_id"] = MakeJSON(t.serverId);
            entry["server_name"] = MakeJSON(t.serverName);
            list.push_back(MakeJSON(JSONValue{entry}));
        }
        std::cout << SerializeJSON(JSONValue{list}) << std::endl;
        host.ShutdownAll();
        return 0;
    }

    ToolCallResult result = host.Execute(userId, ToolCallRequest{*tool, arguments, cfg.id});
    std::cout << SerializeJSON(result.ToJson()) << std::endl;
    host.ShutdownAll();
    return result.success ? 0 : 1;
}
