//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: DocumentationClient.hpp
// Purpose: Documentation search/read facade over the search_documentation and read_documentation tools
//==========================================================================================================

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "mcpsession/JSONRPCTypes.h"

namespace mcpsession {

class ToolInvoker;

//==========================================================================================================
// DocumentationResult
// Purpose: One search hit.
// Fields:
//   title, url, context: String members of the hit when present, empty otherwise.
//   content: Plain text for hits the server returned as non-JSON text.
//   raw: The hit as returned (object), or a synthesized object for plain-text hits.
//==========================================================================================================
struct DocumentationResult {
    std::string title;
    std::string url;
    std::string context;
    std::string content;
    JSONValue raw;
};

// Overview of one service assembled from its best "user guide" hit.
struct ServiceDocumentation {
    std::string serviceName;
    std::string title;
    std::string url;
    std::string content;
    std::string description;
};

class DocumentationClient {
public:
    static constexpr const char* SearchTool = "search_documentation";
    static constexpr const char* ReadTool = "read_documentation";

    explicit DocumentationClient(ToolInvoker& tools);

    //==========================================================================================================
    // SearchDocumentation
    // Purpose: Calls search_documentation with {search_phrase, limit}.
    // Returns:
    //   The hits in server order; empty when the server does not offer the tool.
    // Throws:
    //   errors::ToolCallError and the Session errors.
    //==========================================================================================================
    std::vector<DocumentationResult> SearchDocumentation(const std::string& phrase, int64_t limit = 10);

    //==========================================================================================================
    // ReadDocumentation
    // Purpose: Calls read_documentation with {url, max_length}.
    // Returns:
    //   The page text (text items joined by '\n'); std::nullopt when the tool is not offered or returned no text.
    //==========================================================================================================
    std::optional<std::string> ReadDocumentation(const std::string& url, int64_t maxLength = 5000);

    //==========================================================================================================
    // GetServiceDocumentation
    // Purpose: Searches "<serviceName> user guide" and builds a ServiceDocumentation from the first hit.
    //   description is the hit's "description" member, falling back to its context. When the hit carries no
    //   content but has a url, content is filled from read_documentation (up to 3000 characters).
    // Returns:
    //   std::nullopt when the search yields no hits or the search tool is not offered.
    // Throws:
    //   errors::ToolCallError and the Session errors.
    //==========================================================================================================
    std::optional<ServiceDocumentation> GetServiceDocumentation(const std::string& serviceName);

    // Lists the server's tools as a liveness check. False (with a warning) on any session or remote error.
    bool TestConnection();

    // Parses a search_documentation result; exposed for callers holding a raw result.
    static std::vector<DocumentationResult> ParseSearchResult(const JSONValue& result, const std::string& phrase);

private:
    ToolInvoker& tools;
};

} // namespace mcpsession
