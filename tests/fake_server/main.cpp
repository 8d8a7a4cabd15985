//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/fake_server/main.cpp
// Purpose: Scriptable tool server speaking newline-delimited JSON-RPC over stdio, used by the tests
//
// Usage: mcphost_fake_server [name] [--reorder=N] [--no-initialize-reply] [--initialize-error]
//                            [--garbage] [--notify]
// Tools:
//   echo  { text }  -> { content: [ { type: text, text } ] }
//   add   { a, b }  -> { content: [...], sum }
//   env   { name }  -> { value } (null when unset)
//   fail            -> JSON-RPC error -32603
//   hang            -> never answered
//   exit            -> process exits without answering
//==========================================================================================================

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <unistd.h>

#include "mcphost/JSONRPCTypes.h"
#include "mcphost/Protocol.h"

using namespace mcphost;

namespace {

struct Flags {
    std::string name{"fake-mcp"};
    std::size_t reorder{0};
    bool noInitializeReply{false};
    bool initializeError{false};
    bool garbage{false};
    bool notify{false};
};

Flags parseFlags(int argc, char** argv) {
    Flags f;
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a.rfind("--reorder=", 0) == 0) {
            f.reorder = static_cast<std::size_t>(std::strtoul(a.c_str() + 10, nullptr, 10));
        } else if (a == "--no-initialize-reply") {
            f.noInitializeReply = true;
        } else if (a == "--initialize-error") {
            f.initializeError = true;
        } else if (a == "--garbage") {
            f.garbage = true;
        } else if (a == "--notify") {
            f.notify = true;
        } else if (a.rfind("--", 0) != 0) {
            f.name = a;
        }
    }
    return f;
}

void emit(const std::string& line) {
    std::cout << line << "\n";
    std::cout.flush();
}

JSONValue textContent(const std::string& text) {
    JSONValue::Object item;
    item["type"] = MakeJSON("text");
    item["text"] = MakeJSON(text);
    JSONValue::Array content;
    content.push_back(MakeJSON(JSONValue{item}));
    return JSONValue{content};
}

JSONValue toolEntry(const char* name, const char* description, const JSONValue::Object& properties) {
    JSONValue::Object schema;
    schema["type"] = MakeJSON("object");
    schema["properties"] = MakeJSON(JSONValue{properties});
    JSONValue::Object tool;
    tool["name"] = MakeJSON(name);
    tool["description"] = MakeJSON(description);
    tool["inputSchema"] = MakeJSON(JSONValue{schema});
    return JSONValue{tool};
}

JSONValue toolsList() {
    JSONValue::Object stringProp;
    stringProp["type"] = MakeJSON("string");
    JSONValue::Object numberProp;
    numberProp["type"] = MakeJSON("number");

    JSONValue::Object echoProps;
    echoProps["text"] = MakeJSON(JSONValue{stringProp});
    JSONValue::Object addProps;
    addProps["a"] = MakeJSON(JSONValue{numberProp});
    addProps["b"] = MakeJSON(JSONValue{numberProp});
    JSONValue::Object envProps;
    envProps["name"] = MakeJSON(JSONValue{stringProp});

    JSONValue::Array tools;
    tools.push_back(MakeJSON(toolEntry("echo", "Echo the text argument", echoProps)));
    tools.push_back(MakeJSON(toolEntry("add", "Add two integers", addProps)));
    tools.push_back(MakeJSON(toolEntry("env", "Read an environment variable", envProps)));
    tools.push_back(MakeJSON(toolEntry("fail", "Always fails", JSONValue::Object{})));
    tools.push_back(MakeJSON(toolEntry("hang", "Never answers", JSONValue::Object{})));
    tools.push_back(MakeJSON(toolEntry("exit", "Exits the server", JSONValue::Object{})));
    JSONValue::Object result;
    result["tools"] = MakeJSON(JSONValue{tools});
    return JSONValue{result};
}

int64_t intArg(const JSONValue& args, const char* key) {
    const JSONValue* v = args.Find(key);
    if (v == nullptr) {
        return 0;
    }
    if (std::holds_alternative<int64_t>(v->value)) {
        return std::get<int64_t>(v->value);
    }
    if (std::holds_alternative<double>(v->value)) {
        return static_cast<int64_t>(std::get<double>(v->value));
    }
    return 0;
}

// Returns nullptr when the call must not be answered.
std::unique_ptr<JSONRPCResponse> callTool(const JSONRPCRequest& req) {
    JSONValue params = req.params.value_or(JSONValue{JSONValue::Object{}});
    std::string tool;
    if (const JSONValue* n = params.Find("name"); n != nullptr && n->IsString()) {
        tool = std::get<std::string>(n->value);
    }
    JSONValue args{JSONValue::Object{}};
    if (const JSONValue* a = params.Find("arguments"); a != nullptr) {
        args = *a;
    }

    if (tool == "echo") {
        const JSONValue* t = args.Find("text");
        const std::string text = (t != nullptr && t->IsString()) ? std::get<std::string>(t->value) : SerializeJSON(args);
        JSONValue::Object result;
        result["content"] = MakeJSON(textContent(text));
        return std::make_unique<JSONRPCResponse>(req.id, JSONValue{result});
    }
    if (tool == "add") {
        const int64_t sum = intArg(args, "a") + intArg(args, "b");
        JSONValue::Object result;
        result["content"] = MakeJSON(textContent(std::to_string(sum)));
        result["sum"] = MakeJSON(sum);
        return std::make_unique<JSONRPCResponse>(req.id, JSONValue{result});
    }
    if (tool == "env") {
        const JSONValue* n = args.Find("name");
        const char* value = (n != nullptr && n->IsString()) ? std::getenv(std::get<std::string>(n->value).c_str()) : nullptr;
        JSONValue::Object result;
        result["value"] = value != nullptr ? MakeJSON(value) : std::make_shared<JSONValue>(nullptr);
        return std::make_unique<JSONRPCResponse>(req.id, JSONValue{result});
    }
    if (tool == "fail") {
        return CreateErrorResponse(req.id, JSONRPCErrorCodes::InternalError, "Tool failed on purpose");
    }
    if (tool == "hang") {
        return nullptr;
    }
    if (tool == "exit") {
        std::_Exit(0);
    }
    return CreateErrorResponse(req.id, JSONRPCErrorCodes::InvalidParams, "Unknown tool: " + tool);
}

} // namespace

int main(int argc, char** argv) {
    const Flags flags = parseFlags(argc, argv);
    std::cerr << flags.name << ": fake tool server started (pid " << ::getpid() << ")" << std::endl;

    std::vector<std::string> held;  // reordered tools/call replies
    std::string line;
    while (std::getline(std::cin, line)) {
        if (line.empty()) {
            continue;
        }
        IncomingMessage msg = ClassifyMessage(line);
        if (msg.kind != IncomingMessage::Kind::Request) {
            // notifications/initialized, notifications/cancelled and stray responses need no answer
            continue;
        }
        const JSONRPCRequest& req = *msg.request;

        std::unique_ptr<JSONRPCResponse> resp;
        if (req.method == Methods::Initialize) {
            if (flags.noInitializeReply) {
                continue;
            }
            if (flags.initializeError) {
                resp = CreateErrorResponse(req.id, JSONRPCErrorCodes::InvalidRequest, "Initialization refused");
            } else {
                JSONValue::Object serverInfo;
                serverInfo["name"] = MakeJSON(flags.name);
                serverInfo["version"] = MakeJSON("1.0.0");
                JSONValue::Object caps;
                caps["tools"] = MakeJSON(JSONValue{JSONValue::Object{}});
                JSONValue::Object result;
                result["protocolVersion"] = MakeJSON(PROTOCOL_VERSION);
                result["serverInfo"] = MakeJSON(JSONValue{serverInfo});
                result["capabilities"] = MakeJSON(JSONValue{caps});
                resp = std::make_unique<JSONRPCResponse>(req.id, JSONValue{result});
            }
        } else if (req.method == Methods::ListTools) {
            resp = std::make_unique<JSONRPCResponse>(req.id, toolsList());
        } else if (req.method == Methods::CallTool) {
            resp = callTool(req);
            if (!resp) {
                continue;
            }
            if (flags.reorder > 0) {
                held.push_back(resp->Serialize());
                if (held.size() == flags.reorder) {
                    // Last reply first, then the rest in arrival order
                    emit(held.back());
                    for (std::size_t i = 0; i + 1 < held.size(); ++i) {
                        emit(held[i]);
                    }
                    held.clear();
                }
                continue;
            }
        } else {
            resp = CreateErrorResponse(req.id, JSONRPCErrorCodes::MethodNotFound, "Method not found: " + req.method);
        }

        if (flags.garbage) {
            emit("this is not json {");
        }
        if (flags.notify) {
            JSONValue::Object p;
            p["level"] = MakeJSON("info");
            p["data"] = MakeJSON("handling " + req.method);
            emit(JSONRPCNotification(Methods::Log, JSONValue{p}).Serialize());
        }
        emit(resp->Serialize());
    }
    return 0;
}
