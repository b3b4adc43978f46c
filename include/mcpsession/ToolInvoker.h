//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolInvoker.h
// Purpose: tools/list and tools/call on top of a Ready Session
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "mcpsession/JSONRPCTypes.h"
#include "mcpsession/Protocol.h"

namespace mcpsession {

class Session;

//==========================================================================================================
// ToolInvoker
// Purpose: Typed tool operations. Every call is an independent round trip; any number may be outstanding.
// Notes:
//   - The Session must outlive the invoker and any future it returned.
//   - Readiness is enforced by Session: SessionNotReadyError / SessionClosedError propagate unchanged.
//==========================================================================================================
class ToolInvoker {
public:
    explicit ToolInvoker(Session& session);

    ////////////////////////////////////////// Tool operations /////////////////////////////////////////////////
    //==========================================================================================================
    // ListTools
    // Purpose: Sends tools/list and returns result.tools in server order.
    // Args:
    //   timeout: Per-call deadline; the session's request timeout when absent.
    // Returns:
    //   Tool descriptors; empty when the result carries no "tools" member.
    // Throws:
    //   errors::RemoteError when the server answers with an error object, plus the Session errors.
    //==========================================================================================================
    std::vector<Tool> ListTools(std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    //==========================================================================================================
    // CallTool
    // Purpose: Sends tools/call with {name, arguments}.
    // Returns:
    //   The result value, uninterpreted (including results that carry isError=true).
    // Throws:
    //   std::invalid_argument when name is empty (before any I/O).
    //   errors::ToolCallError when the server answers with an error object, plus the Session errors.
    //==========================================================================================================
    JSONValue CallTool(const std::string& name, const JSONValue& arguments,
                       std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    // Future-returning variants; failures surface from future.get().
    std::future<std::vector<Tool>> ListToolsAsync(std::optional<std::chrono::milliseconds> timeout = std::nullopt);
    std::future<JSONValue> CallToolAsync(std::string name, JSONValue arguments,
                                         std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    ////////////////////////////////////////// Tools cache (optional) ////////////////////////////////////////
    //==========================================================================================================
    // Enables the tools/list cache. Within ttlMs, ListTools answers from the last successful listing unless
    // the server sent notifications/tools/list_changed in between. std::nullopt or 0 disables it.
    //==========================================================================================================
    void SetToolsCacheTtlMs(const std::optional<uint64_t>& ttlMs);
    void InvalidateToolsCache();

    // True when ListTools (cached when enabled) reports a tool with this name.
    bool HasTool(const std::string& name);

    // Concatenates the "text" of every {"type":"text"} item in result.content, separated by '\n'.
    static std::string ExtractTextContent(const JSONValue& result);

private:
    struct ToolsCache {
        std::vector<Tool> data;
        std::chrono::steady_clock::time_point ts;
        uint64_t generation{0};
        bool set{false};
    };

    Session& session;
    std::mutex cacheMutex;
    std::optional<uint64_t> toolsCacheTtlMs;
    ToolsCache toolsCache;
};

} // namespace mcpsession
