//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: DocumentationClient.cpp
// Purpose: Documentation search/read facade implementation
//==========================================================================================================

#include <stdexcept>

#include "logging/Logger.h"
#include "mcpsession/DocumentationClient.hpp"
#include "mcpsession/ToolInvoker.h"
#include "mcpsession/errors/Errors.h"

namespace mcpsession {

namespace {

DocumentationResult fromObject(const JSONValue& hit) {
    DocumentationResult r;
    r.title = GetStringMember(hit, "title").value_or("");
    r.url = GetStringMember(hit, "url").value_or("");
    r.context = GetStringMember(hit, "context").value_or("");
    r.content = GetStringMember(hit, "content").value_or("");
    r.raw = hit;
    return r;
}

DocumentationResult fromPlainText(const std::string& phrase, const std::string& text) {
    JSONValue::Object obj;
    obj["title"] = std::make_shared<JSONValue>(phrase);
    obj["content"] = std::make_shared<JSONValue>(text);
    obj["url"] = std::make_shared<JSONValue>(std::string());
    DocumentationResult r;
    r.title = phrase;
    r.content = text;
    r.raw = JSONValue{obj};
    return r;
}

} // namespace

DocumentationClient::DocumentationClient(ToolInvoker& tools) : tools(tools) {}

std::vector<DocumentationResult> DocumentationClient::ParseSearchResult(const JSONValue& result,
                                                                        const std::string& phrase) {
    std::vector<DocumentationResult> hits;
    const JSONValue* content = FindMember(result, "content");
    if (content == nullptr || !content->IsArray()) {
        return hits;
    }
    for (const auto& item : std::get<JSONValue::Array>(content->value)) {
        std::optional<std::string> text = GetStringMember(*item, "text");
        if (!text) {
            continue;
        }
        JSONValue parsed;
        try {
            parsed = ParseJSONValue(*text);
        } catch (const std::runtime_error&) {
            hits.push_back(fromPlainText(phrase, *text));
            continue;
        }
        if (parsed.IsArray()) {
            for (const auto& hit : std::get<JSONValue::Array>(parsed.value)) {
                if (hit->IsObject()) {
                    hits.push_back(fromObject(*hit));
                }
            }
        } else if (parsed.IsObject()) {
            hits.push_back(fromObject(parsed));
        } else {
            hits.push_back(fromPlainText(phrase, *text));
        }
    }
    return hits;
}

std::vector<DocumentationResult> DocumentationClient::SearchDocumentation(const std::string& phrase, int64_t limit) {
    FUNC_SCOPE();
    if (!tools.HasTool(SearchTool)) {
        LOG_WARN("{} tool not available", SearchTool);
        return {};
    }
    JSONValue::Object args;
    args["search_phrase"] = std::make_shared<JSONValue>(phrase);
    args["limit"] = std::make_shared<JSONValue>(limit);
    JSONValue result = tools.CallTool(SearchTool, JSONValue{args});

    std::vector<DocumentationResult> hits = ParseSearchResult(result, phrase);
    LOG_INFO("Found {} documentation result(s) for: {}", hits.size(), phrase);
    return hits;
}

std::optional<std::string> DocumentationClient::ReadDocumentation(const std::string& url, int64_t maxLength) {
    FUNC_SCOPE();
    if (!tools.HasTool(ReadTool)) {
        LOG_WARN("{} tool not available", ReadTool);
        return std::nullopt;
    }
    JSONValue::Object args;
    args["url"] = std::make_shared<JSONValue>(url);
    args["max_length"] = std::make_shared<JSONValue>(maxLength);
    JSONValue result = tools.CallTool(ReadTool, JSONValue{args});

    std::string text = ToolInvoker::ExtractTextContent(result);
    if (text.empty()) {
        return std::nullopt;
    }
    LOG_INFO("Read documentation from: {}", url);
    return text;
}

std::optional<ServiceDocumentation> DocumentationClient::GetServiceDocumentation(const std::string& serviceName) {
    FUNC_SCOPE();
    std::vector<DocumentationResult> hits = SearchDocumentation(serviceName + " user guide");
    if (hits.empty()) {
        LOG_WARN("No search results for {}", serviceName);
        return std::nullopt;
    }
    const DocumentationResult& first = hits.front();
    ServiceDocumentation doc;
    doc.serviceName = serviceName;
    doc.title = first.title;
    doc.url = first.url;
    doc.content = first.content;
    doc.description = GetStringMember(first.raw, "description").value_or(first.context);
    if (doc.content.empty() && !doc.url.empty()) {
        doc.content = ReadDocumentation(doc.url, 3000).value_or("");
    }
    return doc;
}

bool DocumentationClient::TestConnection() {
    FUNC_SCOPE();
    try {
        std::vector<Tool> listed = tools.ListTools();
        LOG_INFO("Connection test successful: {} tools available", listed.size());
        return true;
    } catch (const errors::SessionError& e) {
        LOG_WARN("Connection test failed: {}", e.what());
        return false;
    }
}

} // namespace mcpsession
