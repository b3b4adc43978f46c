//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_documentation_client.cpp
// Purpose: GoogleTests for documentation search/read over the stub server and search result parsing
//==========================================================================================================

#include <gtest/gtest.h>
#include <string>

#include "StubSupport.h"
#include "mcpsession/DocumentationClient.hpp"
#include "mcpsession/Session.h"
#include "mcpsession/ToolInvoker.h"

using namespace mcpsession;
using stubtest::fastOptions;
using stubtest::stubConfig;

namespace {

JSONValue textResult(const std::string& text) {
    JSONValue::Object item;
    item["type"] = std::make_shared<JSONValue>(std::string("text"));
    item["text"] = std::make_shared<JSONValue>(text);
    JSONValue::Array content;
    content.push_back(std::make_shared<JSONValue>(JSONValue{item}));
    JSONValue::Object result;
    result["content"] = std::make_shared<JSONValue>(content);
    return JSONValue{result};
}

} // namespace

TEST(DocumentationClient, SearchReturnsHitsUpToLimit) {
    Session session(stubConfig("echo"), fastOptions());
    session.Start();
    ToolInvoker tools(session);
    DocumentationClient docs(tools);

    auto hits = docs.SearchDocumentation("s3 buckets");
    ASSERT_EQ(hits.size(), 2u);
    EXPECT_EQ(hits[0].title, "s3 buckets 1");
    EXPECT_EQ(hits[0].url, "https://docs.example.com/1");
    EXPECT_FALSE(hits[0].context.empty());
    EXPECT_TRUE(hits[0].raw.IsObject());
    EXPECT_EQ(hits[1].url, "https://docs.example.com/2");

    EXPECT_EQ(docs.SearchDocumentation("s3 buckets", 1).size(), 1u);
}

TEST(DocumentationClient, PlainTextAnswerBecomesSingleHit) {
    Session session(stubConfig("echo"), fastOptions());
    session.Start();
    ToolInvoker tools(session);
    DocumentationClient docs(tools);

    auto hits = docs.SearchDocumentation("plain");
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0].title, "plain");
    EXPECT_EQ(hits[0].content, "plain text answer");
    EXPECT_TRUE(hits[0].url.empty());
}

TEST(DocumentationClient, ReadJoinsTextItems) {
    Session session(stubConfig("echo"), fastOptions());
    session.Start();
    ToolInvoker tools(session);
    DocumentationClient docs(tools);

    auto page = docs.ReadDocumentation("https://docs.example.com/0", 100);
    ASSERT_TRUE(page.has_value());
    EXPECT_EQ(*page, "Page https://docs.example.com/0\nsecond part");
}

TEST(DocumentationClient, MissingToolsYieldNothing) {
    // list mode offers search_documentation only
    Session session(stubConfig("list"), fastOptions());
    session.Start();
    ToolInvoker tools(session);
    DocumentationClient docs(tools);
    EXPECT_FALSE(docs.ReadDocumentation("https://docs.example.com/0").has_value());

    Session bare(stubConfig("bare"), fastOptions());
    bare.Start();
    ToolInvoker bareTools(bare);
    DocumentationClient bareDocs(bareTools);
    EXPECT_TRUE(bareDocs.SearchDocumentation("anything").empty());
}

TEST(DocumentationClient, ParseSearchResultShapes) {
    auto fromArray = DocumentationClient::ParseSearchResult(
        textResult(R"([{"title":"A","url":"u1","context":"c1"},7,{"title":"B"}])"), "q");
    ASSERT_EQ(fromArray.size(), 2u);
    EXPECT_EQ(fromArray[0].title, "A");
    EXPECT_EQ(fromArray[0].context, "c1");
    EXPECT_EQ(fromArray[1].title, "B");
    EXPECT_TRUE(fromArray[1].url.empty());

    auto fromObject = DocumentationClient::ParseSearchResult(textResult(R"({"title":"Only","url":"u"})"), "q");
    ASSERT_EQ(fromObject.size(), 1u);
    EXPECT_EQ(fromObject[0].url, "u");

    auto fromScalar = DocumentationClient::ParseSearchResult(textResult("42"), "q");
    ASSERT_EQ(fromScalar.size(), 1u);
    EXPECT_EQ(fromScalar[0].title, "q");
    EXPECT_EQ(fromScalar[0].content, "42");

    EXPECT_TRUE(DocumentationClient::ParseSearchResult(JSONValue{JSONValue::Object{}}, "q").empty());
}

TEST(DocumentationClient, ServiceDocumentationUsesFirstUserGuideHit) {
    Session session(stubConfig("echo"), fastOptions());
    session.Start();
    ToolInvoker tools(session);
    DocumentationClient docs(tools);

    auto doc = docs.GetServiceDocumentation("s3");
    ASSERT_TRUE(doc.has_value());
    EXPECT_EQ(doc->serviceName, "s3");
    EXPECT_EQ(doc->title, "s3 user guide 1");
    EXPECT_EQ(doc->url, "https://docs.example.com/1");
    EXPECT_EQ(doc->description, "context for s3 user guide");
    // The hit has no content of its own, so the page is read
    EXPECT_EQ(doc->content, "Page https://docs.example.com/1\nsecond part");
}

TEST(DocumentationClient, ServiceDocumentationWithoutReadToolKeepsEmptyContent) {
    Session session(stubConfig("list"), fastOptions());
    session.Start();
    ToolInvoker tools(session);
    DocumentationClient docs(tools);

    auto doc = docs.GetServiceDocumentation("lambda");
    ASSERT_TRUE(doc.has_value());
    EXPECT_EQ(doc->title, "lambda user guide 1");
    EXPECT_TRUE(doc->content.empty());

    Session bare(stubConfig("bare"), fastOptions());
    bare.Start();
    ToolInvoker bareTools(bare);
    DocumentationClient bareDocs(bareTools);
    EXPECT_FALSE(bareDocs.GetServiceDocumentation("s3").has_value());
}

TEST(DocumentationClient, TestConnectionReflectsSessionState) {
    Session session(stubConfig("echo"), fastOptions());
    ToolInvoker tools(session);
    DocumentationClient docs(tools);
    EXPECT_FALSE(docs.TestConnection());

    session.Start();
    EXPECT_TRUE(docs.TestConnection());

    session.Close();
    EXPECT_FALSE(docs.TestConnection());
}
