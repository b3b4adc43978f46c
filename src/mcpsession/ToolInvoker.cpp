//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolInvoker.cpp
// Purpose: tools/list and tools/call request construction and result interpretation
//==========================================================================================================

#include <stdexcept>

#include "logging/Logger.h"
#include "mcpsession/Session.h"
#include "mcpsession/ToolInvoker.h"
#include "mcpsession/errors/Errors.h"

namespace mcpsession {

namespace {

errors::McpError requireErrorObject(const JSONValue& error) {
    std::optional<errors::McpError> err = errors::mcpErrorFromErrorValue(error);
    if (!err.has_value()) {
        throw errors::MalformedMessageError("error response without a readable error object");
    }
    return *err;
}

std::vector<Tool> parseTools(const JSONValue& result) {
    std::vector<Tool> tools;
    const JSONValue* toolsVal = FindMember(result, "tools");
    if (toolsVal == nullptr) {
        return tools;
    }
    if (!toolsVal->IsArray()) {
        throw errors::MalformedMessageError("tools/list result.tools is not an array");
    }
    for (const auto& toolJson : std::get<JSONValue::Array>(toolsVal->value)) {
        if (!toolJson->IsObject()) {
            LOG_WARN("Skipping tools/list entry that is not an object");
            continue;
        }
        Tool tool;
        tool.name = GetStringMember(*toolJson, "name").value_or("");
        tool.description = GetStringMember(*toolJson, "description").value_or("");
        if (const JSONValue* schema = FindMember(*toolJson, "inputSchema")) {
            tool.inputSchema = *schema;
        }
        if (tool.name.empty()) {
            LOG_WARN("Skipping tools/list entry without a name");
            continue;
        }
        tools.push_back(std::move(tool));
    }
    return tools;
}

} // namespace

ToolInvoker::ToolInvoker(Session& session) : session(session) {}

std::vector<Tool> ToolInvoker::ListTools(std::optional<std::chrono::milliseconds> timeout) {
    FUNC_SCOPE();
    const uint64_t generation = session.ToolListGeneration();
    if (session.State() == SessionState::Ready) {
        std::lock_guard<std::mutex> lk(cacheMutex);
        if (toolsCacheTtlMs.value_or(0) > 0 && toolsCache.set && toolsCache.generation == generation) {
            auto ageMs = std::chrono::duration_cast<std::chrono::milliseconds>(
                             std::chrono::steady_clock::now() - toolsCache.ts).count();
            if (ageMs <= static_cast<int64_t>(*toolsCacheTtlMs)) {
                LOG_DEBUG("ListTools cache hit (ageMs={})", ageMs);
                return toolsCache.data;
            }
        }
    }

    LOG_DEBUG("Requesting tools list");
    JSONRPCResponse response = session.SendRequest(Methods::ListTools, std::nullopt, timeout);
    if (response.IsError()) {
        errors::McpError err = requireErrorObject(*response.error);
        LOG_WARN("tools/list failed ({}): {}", err.code, err.message);
        throw errors::RemoteError(err);
    }
    std::vector<Tool> tools = parseTools(*response.result);
    LOG_DEBUG("Server lists {} tool(s)", tools.size());

    std::lock_guard<std::mutex> lk(cacheMutex);
    if (toolsCacheTtlMs.value_or(0) > 0) {
        toolsCache.data = tools;
        toolsCache.ts = std::chrono::steady_clock::now();
        toolsCache.generation = generation;
        toolsCache.set = true;
    }
    return tools;
}

JSONValue ToolInvoker::CallTool(const std::string& name, const JSONValue& arguments,
                                std::optional<std::chrono::milliseconds> timeout) {
    FUNC_SCOPE();
    if (name.empty()) {
        throw std::invalid_argument("CallTool: tool name must not be empty");
    }
    JSONValue::Object paramsObj;
    paramsObj["name"] = std::make_shared<JSONValue>(name);
    paramsObj["arguments"] = std::make_shared<JSONValue>(arguments);
    LOG_DEBUG("Calling tool: {}", name);

    JSONRPCResponse response = session.SendRequest(Methods::CallTool, JSONValue{paramsObj}, timeout);
    if (response.IsError()) {
        errors::McpError err = requireErrorObject(*response.error);
        LOG_WARN("Tool '{}' failed ({}): {}", name, err.code, err.message);
        throw errors::ToolCallError(name, err);
    }
    return *response.result;
}

std::future<std::vector<Tool>> ToolInvoker::ListToolsAsync(std::optional<std::chrono::milliseconds> timeout) {
    return std::async(std::launch::async, [this, timeout]() { return ListTools(timeout); });
}

std::future<JSONValue> ToolInvoker::CallToolAsync(std::string name, JSONValue arguments,
                                                  std::optional<std::chrono::milliseconds> timeout) {
    return std::async(std::launch::async,
                      [this, name = std::move(name), arguments = std::move(arguments), timeout]() {
                          return CallTool(name, arguments, timeout);
                      });
}

void ToolInvoker::SetToolsCacheTtlMs(const std::optional<uint64_t>& ttlMs) {
    std::lock_guard<std::mutex> lk(cacheMutex);
    toolsCacheTtlMs = ttlMs;
    toolsCache.set = false;
}

void ToolInvoker::InvalidateToolsCache() {
    std::lock_guard<std::mutex> lk(cacheMutex);
    toolsCache.set = false;
}

bool ToolInvoker::HasTool(const std::string& name) {
    for (const auto& tool : ListTools()) {
        if (tool.name == name) {
            return true;
        }
    }
    return false;
}

std::string ToolInvoker::ExtractTextContent(const JSONValue& result) {
    std::string text;
    const JSONValue* content = FindMember(result, "content");
    if (content == nullptr || !content->IsArray()) {
        return text;
    }
    bool first = true;
    for (const auto& item : std::get<JSONValue::Array>(content->value)) {
        if (GetStringMember(*item, "type").value_or("") != "text") {
            continue;
        }
        if (auto piece = GetStringMember(*item, "text")) {
            if (!first) {
                text.push_back('\n');
            }
            text += *piece;
            first = false;
        }
    }
    return text;
}

} // namespace mcpsession
