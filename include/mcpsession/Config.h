//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Config.h
// Purpose: Server process configuration (mcp-settings.json) and per-session tuning options
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "mcpsession/JSONRPCTypes.h"
#include "mcpsession/Protocol.h"

namespace mcpsession {

//==========================================================================================================
// ServerConfig
// Purpose: Everything needed to launch one server process.
// Fields:
//   name: Key under "mcpServers" (informational).
//   command: Executable; "uvx" when the settings entry omits it.
//   args: Arguments after the executable.
//   env: Overrides layered over the inherited environment.
//   cwd: Optional working directory.
//   disabled: Entry is skipped when picking the first server.
//==========================================================================================================
struct ServerConfig {
    std::string name;
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    std::optional<std::string> cwd;
    bool disabled{false};
};

//==========================================================================================================
// ServerConfigStore
// Purpose: Parsed view of a settings document of the form
//          {"mcpServers": {"<key>": {"command": ..., "args": [...], "env": {...}, "cwd": ..., "disabled": b}}}
// Notes:
//   - Server keys are kept in sorted order; "first" means the lexicographically smallest enabled key.
//==========================================================================================================
class ServerConfigStore {
public:
    // Default file name looked up in the current directory.
    static constexpr const char* DefaultFileName = "mcp-settings.json";

    //==========================================================================================================
    // LoadFile / LoadString
    // Purpose: Parse a settings document.
    // Throws:
    //   errors::ConfigError when the file cannot be read, the JSON is invalid, or an entry has the wrong shape.
    //==========================================================================================================
    static ServerConfigStore LoadFile(const std::string& path);
    static ServerConfigStore LoadString(const std::string& json);

    //==========================================================================================================
    // Get
    // Purpose: Returns the named server, or the first enabled server when key is empty.
    // Throws:
    //   errors::ConfigError when the key is unknown or no enabled server exists.
    //==========================================================================================================
    const ServerConfig& Get(const std::string& key = std::string()) const;

    std::vector<std::string> Keys() const;
    bool Empty() const { return servers.empty(); }

private:
    std::map<std::string, ServerConfig> servers;
};

//==========================================================================================================
// SessionOptions
// Purpose: Handshake identity and timing knobs for one Session.
// Fields:
//   clientInfo: Sent as initialize.params.clientInfo.
//   capabilities: Sent as initialize.params.capabilities.
//   initializeTimeout: Deadline for the initialize response.
//   requestTimeout: Default deadline for tools/list and tools/call.
//   shutdownGrace: How long Close waits for a voluntary exit after closing stdin.
//   maxLineBytes: Longest accepted line from the server.
//==========================================================================================================
struct SessionOptions {
    Implementation clientInfo;
    JSONValue capabilities;
    std::chrono::milliseconds initializeTimeout{std::chrono::seconds(30)};
    std::chrono::milliseconds requestTimeout{std::chrono::seconds(30)};
    std::chrono::milliseconds shutdownGrace{std::chrono::seconds(5)};
    std::size_t maxLineBytes{4 * 1024 * 1024};

    // Upper bound accepted for any timeout override (24 h).
    static constexpr uint64_t MaxDurationMs = 24ULL * 60 * 60 * 1000;

    // clientInfo {"mcpsession", library version}, capabilities {"tools":{}}.
    SessionOptions();

    //==========================================================================================================
    // FromEnvironment
    // Purpose: Defaults overridden by MCPSESSION_INIT_TIMEOUT_MS, MCPSESSION_REQUEST_TIMEOUT_MS and
    //          MCPSESSION_SHUTDOWN_GRACE_MS. Malformed, zero or out-of-range (> MaxDurationMs) values are
//          logged and ignored.
    //==========================================================================================================
    static SessionOptions FromEnvironment();
};

} // namespace mcpsession
