//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Exception hierarchy and JSON-RPC error mapping helpers for the MCP session client
//==========================================================================================================

#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include "mcpsession/JSONRPCTypes.h"

namespace mcpsession {
namespace errors {

// Categorization of JSON-RPC error codes received from a server.
enum class ErrorCategory {
    JsonRpcParse,
    JsonRpcInvalidRequest,
    JsonRpcMethodNotFound,
    JsonRpcInvalidParams,
    JsonRpcInternal,
    ServerDefined,
    Unknown
};

// Typed view of a JSON-RPC error object { code, message, data? }.
struct McpError {
    int code{0};
    std::string message;
    std::optional<JSONValue> data;
    ErrorCategory category{ErrorCategory::Unknown};
};

// Map a JSON-RPC numeric error code to an ErrorCategory.
//
// Args:
//   code: The integer error code.
//
// Returns:
//   ErrorCategory corresponding to the code. Codes in the implementation-defined server range
//   (-32099..-32000) map to ServerDefined; anything else unmapped is Unknown.
inline ErrorCategory errorCategoryFromCode(int code) {
    switch (code) {
        case JSONRPCErrorCodes::ParseError: return ErrorCategory::JsonRpcParse;
        case JSONRPCErrorCodes::InvalidRequest: return ErrorCategory::JsonRpcInvalidRequest;
        case JSONRPCErrorCodes::MethodNotFound: return ErrorCategory::JsonRpcMethodNotFound;
        case JSONRPCErrorCodes::InvalidParams: return ErrorCategory::JsonRpcInvalidParams;
        case JSONRPCErrorCodes::InternalError: return ErrorCategory::JsonRpcInternal;
        default: break;
    }
    if (code >= -32099 && code <= -32000) {
        return ErrorCategory::ServerDefined;
    }
    return ErrorCategory::Unknown;
}

// Convert a JSON-RPC error object (shape: { code, message, data? }) to McpError.
// Returns std::nullopt when the input is not a valid error object.
inline std::optional<McpError> mcpErrorFromErrorValue(const JSONValue& errVal) {
    const JSONValue* codeVal = FindMember(errVal, "code");
    const JSONValue* msgVal = FindMember(errVal, "message");
    if (codeVal == nullptr || msgVal == nullptr) {
        return std::nullopt;
    }
    if (!std::holds_alternative<int64_t>(codeVal->value) ||
        !std::holds_alternative<std::string>(msgVal->value)) {
        return std::nullopt;
    }
    McpError e;
    e.code = static_cast<int>(std::get<int64_t>(codeVal->value));
    e.message = std::get<std::string>(msgVal->value);
    if (const JSONValue* dataVal = FindMember(errVal, "data")) {
        e.data = *dataVal;
    }
    e.category = errorCategoryFromCode(e.code);
    return e;
}

//==========================================================================================================
// SessionError
// Purpose: Common base of every error raised by the session client.
//==========================================================================================================
class SessionError : public std::runtime_error {
public:
    explicit SessionError(const std::string& what) : std::runtime_error(what) {}
};

// The child process could not be started, or exited immediately.
class ProcessSpawnError : public SessionError {
public:
    explicit ProcessSpawnError(const std::string& what, int sysErrno = 0)
        : SessionError(what), sysErrno_(sysErrno) {}
    int sysErrno() const { return sysErrno_; }
private:
    int sysErrno_;
};

// A line on the wire is not valid JSON or not a well-formed JSON-RPC 2.0 message.
class MalformedMessageError : public SessionError {
public:
    using SessionError::SessionError;
};

// A well-formed message arrived that the session cannot accept (unknown id, wrong phase).
class ProtocolViolation : public SessionError {
public:
    using SessionError::SessionError;
};

// The operation requires a Ready session.
class SessionNotReadyError : public SessionError {
public:
    using SessionError::SessionError;
};

// A pending call exceeded its deadline.
class TimeoutError : public SessionError {
public:
    using SessionError::SessionError;
};

// The session was closed or its process died; terminal for the session.
class SessionClosedError : public SessionError {
public:
    using SessionError::SessionError;
};

// The settings file or an override could not be read.
class ConfigError : public SessionError {
public:
    using SessionError::SessionError;
};

//==========================================================================================================
// RemoteError
// Purpose: The peer answered with a JSON-RPC error object.
//==========================================================================================================
class RemoteError : public SessionError {
public:
    explicit RemoteError(McpError err)
        : SessionError("remote error " + std::to_string(err.code) + ": " + err.message),
          error_(std::move(err)) {}
    RemoteError(const std::string& what, McpError err)
        : SessionError(what), error_(std::move(err)) {}

    int code() const { return error_.code; }
    const std::string& remoteMessage() const { return error_.message; }
    const std::optional<JSONValue>& data() const { return error_.data; }
    ErrorCategory category() const { return error_.category; }
    const McpError& error() const { return error_; }

private:
    McpError error_;
};

// tools/call returned a JSON-RPC error object.
class ToolCallError : public RemoteError {
public:
    ToolCallError(const std::string& toolName, const McpError& err)
        : RemoteError(describe(toolName, err), err), toolName_(toolName) {}

    const std::string& toolName() const { return toolName_; }

private:
    static std::string describe(const std::string& toolName, const McpError& err) {
        return "tool '" + toolName + "' failed (" + std::to_string(err.code) + "): " + err.message;
    }

    std::string toolName_;
};

} // namespace errors
} // namespace mcpsession
