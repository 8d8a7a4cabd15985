//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Host error taxonomy, typed remote errors and JSON-RPC error mapping helpers
//==========================================================================================================

#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include "mcphost/JSONRPCTypes.h"

namespace mcphost {
namespace errors {

// Failure classes surfaced by the host. Callers branch on these, never on message text.
enum class ErrorCategory {
    StartupFailure,      // child could not be spawned or the handshake failed
    ProtocolError,       // malformed or unexpected message from a tool server
    RemoteToolError,     // tool server answered with a JSON-RPC error
    Timeout,             // no response within the request timeout
    RateLimitExceeded,
    NotFound,            // no running instance for (user, config)
    ConfigurationError,  // invalid server configuration or host option
    Uninitialized,       // call made before the handshake completed
    ConnectionClosed,    // transport closed before the request could complete
    StoreUnavailable     // persistence backend failed
};

inline const char* toString(ErrorCategory c) {
    switch (c) {
        case ErrorCategory::StartupFailure: return "StartupFailure";
        case ErrorCategory::ProtocolError: return "ProtocolError";
        case ErrorCategory::RemoteToolError: return "RemoteToolError";
        case ErrorCategory::Timeout: return "Timeout";
        case ErrorCategory::RateLimitExceeded: return "RateLimitExceeded";
        case ErrorCategory::NotFound: return "NotFound";
        case ErrorCategory::ConfigurationError: return "ConfigurationError";
        case ErrorCategory::Uninitialized: return "Uninitialized";
        case ErrorCategory::ConnectionClosed: return "ConnectionClosed";
        case ErrorCategory::StoreUnavailable: return "StoreUnavailable";
    }
    return "Unknown";
}

//==========================================================================================================
// HostError
// Purpose: Exception type thrown across the host API. what() carries the human-readable message.
//==========================================================================================================
class HostError : public std::runtime_error {
public:
    HostError(ErrorCategory category, const std::string& message,
              std::optional<int> code = std::nullopt)
        : std::runtime_error(message), category_(category), code_(code) {}

    ErrorCategory category() const noexcept { return category_; }
    // JSON-RPC error code when the failure came from (or was synthesized for) a JSON-RPC exchange
    std::optional<int> code() const noexcept { return code_; }

private:
    ErrorCategory category_;
    std::optional<int> code_;
};

// Typed representation of a JSON-RPC error object received from a tool server.
struct RemoteError {
    int code{0};
    std::string message;
    std::optional<JSONValue> data;
};

// Map the code of a locally synthesized error response to the category the host reports.
//
// Args:
//   code: The integer error code carried by the error object.
//
// Returns:
//   Timeout and ConnectionClosed for the transport's own codes; RemoteToolError otherwise.
//   Responses read from a tool server never go through this mapping (see hostErrorFromResponse).
inline ErrorCategory categoryFromCode(int code) {
    switch (code) {
        case JSONRPCErrorCodes::RequestTimeout: return ErrorCategory::Timeout;
        case JSONRPCErrorCodes::ConnectionClosed: return ErrorCategory::ConnectionClosed;
        default: return ErrorCategory::RemoteToolError;
    }
}

// Convert a JSON-RPC error object (shape: { code, message, data? }) to RemoteError.
// Returns std::nullopt when the input is not a valid error object.
inline std::optional<RemoteError> remoteErrorFromErrorValue(const JSONValue& errVal) {
    if (!std::holds_alternative<JSONValue::Object>(errVal.value)) {
        return std::nullopt;
    }
    const auto& obj = std::get<JSONValue::Object>(errVal.value);
    auto itCode = obj.find("code");
    auto itMsg = obj.find("message");
    if (itCode == obj.end() || itMsg == obj.end()) {
        return std::nullopt;
    }
    if (!itCode->second || !itMsg->second) {
        return std::nullopt;
    }
    if (!std::holds_alternative<int64_t>(itCode->second->value) ||
        !std::holds_alternative<std::string>(itMsg->second->value)) {
        return std::nullopt;
    }

    RemoteError e;
    e.code = static_cast<int>(std::get<int64_t>(itCode->second->value));
    e.message = std::get<std::string>(itMsg->second->value);
    auto itData = obj.find("data");
    if (itData != obj.end() && itData->second) {
        e.data = *(itData->second);
    }
    return e;
}

// Extract RemoteError from a JSONRPCResponse if it carries an error.
inline std::optional<RemoteError> remoteErrorFromResponse(const JSONRPCResponse& response) {
    if (!response.error.has_value()) {
        return std::nullopt;
    }
    return remoteErrorFromErrorValue(response.error.value());
}

// Build the HostError a failed response maps to. A malformed error object is a ProtocolError. Any error a
// tool server sent is a RemoteToolError, even when it reuses -32000/-32001.
inline HostError hostErrorFromResponse(const JSONRPCResponse& response, const std::string& method) {
    auto err = remoteErrorFromResponse(response);
    if (!err.has_value()) {
        return HostError(ErrorCategory::ProtocolError,
                         "Malformed error object in response to " + method);
    }
    const ErrorCategory category = response.local ? categoryFromCode(err->code) : ErrorCategory::RemoteToolError;
    if (category == ErrorCategory::RemoteToolError) {
        return HostError(category, "MCP error " + std::to_string(err->code) + ": " + err->message, err->code);
    }
    return HostError(category, err->message, err->code);
}

} // namespace errors
} // namespace mcphost
