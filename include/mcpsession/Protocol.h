//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: MCP protocol data structures and constants used by the session client
//==========================================================================================================

#pragma once

#include "JSONRPCTypes.h"
#include <optional>
#include <string>
#include <vector>

namespace mcpsession {
//==========================================================================================================
// MCP Protocol types and constants
// Purpose: Shared protocol structures and method names.
//==========================================================================================================
///////////////////////////////////////// Protocol constants ///////////////////////////////////////////
// The single protocol revision this client speaks; no negotiation is attempted.
constexpr const char* PROTOCOL_VERSION = "2024-11-05";

///////////////////////////////////////// Implementation ///////////////////////////////////////////
// Implementation information (clientInfo / serverInfo)
struct Implementation {
    std::string name;
    std::string version;

    Implementation() = default;
    Implementation(std::string name, std::string version)
        : name(std::move(name)), version(std::move(version)) {}
};

//==========================================================================================================
// InitializeResult
// Purpose: What the server reported in its initialize response.
// Fields:
//   protocolVersion: Revision echoed by the server (may differ; logged, not negotiated).
//   serverInfo: Server name/version when provided.
//   capabilities: Raw server capabilities object (empty object when absent).
//   instructions: Optional free-form usage hints.
//==========================================================================================================
struct InitializeResult {
    std::string protocolVersion;
    Implementation serverInfo;
    JSONValue capabilities{JSONValue::Object{}};
    std::optional<std::string> instructions;
};

///////////////////////////////////////// Tools ///////////////////////////////////////////
// Tool descriptor as listed by tools/list
struct Tool {
    std::string name;
    std::string description;
    JSONValue inputSchema;  // JSON Schema for tool parameters

    Tool() = default;
    Tool(std::string name, std::string description, JSONValue inputSchema = JSONValue{})
        : name(std::move(name)), description(std::move(description)),
          inputSchema(std::move(inputSchema)) {}
};

///////////////////////////////////////// Method names ///////////////////////////////////////////
namespace Methods {
    // Client to server
    constexpr const char* Initialize = "initialize";
    constexpr const char* ListTools = "tools/list";
    constexpr const char* CallTool = "tools/call";

    // Either direction
    constexpr const char* Ping = "ping";

    // Notifications
    constexpr const char* Initialized = "notifications/initialized";
    constexpr const char* Log = "notifications/message";
    constexpr const char* ToolListChanged = "notifications/tools/list_changed";
    constexpr const char* Cancelled = "notifications/cancelled";
}

} // namespace mcpsession
