//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_session.cpp
// Purpose: End-to-end GoogleTests for the session lifecycle against the stub MCP server
//==========================================================================================================

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "StubSupport.h"
#include "mcpsession/Session.h"
#include "mcpsession/ToolInvoker.h"
#include "mcpsession/errors/Errors.h"

using namespace mcpsession;
using namespace std::chrono_literals;
using stubtest::fastOptions;
using stubtest::stubConfig;

namespace {

JSONValue argsWithN(int64_t n) {
    JSONValue::Object obj;
    obj["n"] = std::make_shared<JSONValue>(n);
    return JSONValue{obj};
}

int64_t echoedN(const JSONValue& result) {
    const JSONValue* echo = FindMember(result, "echo");
    EXPECT_NE(echo, nullptr);
    if (echo == nullptr) {
        return -1;
    }
    return std::get<int64_t>(FindMember(*echo, "n")->value);
}

JSONValue slowArgs(int64_t ms) {
    JSONValue::Object obj;
    obj["ms"] = std::make_shared<JSONValue>(ms);
    return JSONValue{obj};
}

} // namespace

TEST(Session, ScenarioA_ListToolsReturnsTheSingleTool) {
    Session session(stubConfig("list"), fastOptions());
    session.Start();
    ASSERT_EQ(session.State(), SessionState::Ready);

    ToolInvoker tools(session);
    auto list = tools.ListTools();
    ASSERT_EQ(list.size(), 1u);
    EXPECT_EQ(list[0].name, "search_documentation");
    EXPECT_EQ(list[0].description, "Search the documentation");
    EXPECT_TRUE(list[0].inputSchema.IsObject());

    // An empty initialize result still yields a usable session
    auto init = session.GetInitializeResult();
    ASSERT_TRUE(init.has_value());
    EXPECT_TRUE(init->protocolVersion.empty());
    EXPECT_TRUE(init->capabilities.IsObject());
}

TEST(Session, ScenarioB_SilentServerTimesOutIntoFailed) {
    auto opts = fastOptions();
    opts.initializeTimeout = 2s;
    Session session(stubConfig("silent"), opts);

    auto start = std::chrono::steady_clock::now();
    EXPECT_THROW(session.Start(), errors::TimeoutError);
    auto elapsed = std::chrono::steady_clock::now() - start;
    EXPECT_GE(elapsed, 2s);
    EXPECT_LT(elapsed, 8s);

    EXPECT_EQ(session.State(), SessionState::Failed);
    EXPECT_TRUE(session.FailureCause() != nullptr);
    EXPECT_EQ(session.PendingRequests(), 0u);
    EXPECT_THROW(session.SendRequest(Methods::ListTools), errors::SessionClosedError);

    session.Close();
    EXPECT_EQ(session.State(), SessionState::Failed);
}

TEST(Session, ScenarioC_ResponsesInReverseOrderReachTheirCallers) {
    Session session(stubConfig("reverse"), fastOptions());
    session.Start();
    ToolInvoker tools(session);

    auto first = tools.CallToolAsync("echo", argsWithN(1));
    auto second = tools.CallToolAsync("echo", argsWithN(2));
    ASSERT_EQ(first.wait_for(5s), std::future_status::ready);
    ASSERT_EQ(second.wait_for(5s), std::future_status::ready);
    EXPECT_EQ(echoedN(first.get()), 1);
    EXPECT_EQ(echoedN(second.get()), 2);
}

TEST(Session, ConcurrentCallsEachReceiveTheirOwnResponse) {
    const std::string capture = stubtest::captureFile("concurrent");
    auto cfg = stubConfig("echo");
    cfg.env["STUB_CAPTURE_FILE"] = capture;
    Session session(cfg, fastOptions());
    session.Start();
    ToolInvoker tools(session);

    constexpr int kCalls = 32;
    std::vector<std::future<JSONValue>> futures;
    for (int i = 0; i < kCalls; ++i) {
        futures.push_back(tools.CallToolAsync("echo", argsWithN(i)));
    }
    for (int i = 0; i < kCalls; ++i) {
        ASSERT_EQ(futures[i].wait_for(10s), std::future_status::ready);
        JSONValue result = futures[i].get();
        EXPECT_EQ(echoedN(result), i);
    }
    session.Close();

    // Every request id on the wire is unique
    std::set<int64_t> ids;
    int requests = 0;
    for (const auto& m : stubtest::readMessages(capture)) {
        if (const auto* req = std::get_if<JSONRPCRequest>(&m)) {
            ++requests;
            ids.insert(std::get<int64_t>(req->id));
        }
    }
    EXPECT_EQ(requests, kCalls + 1);
    EXPECT_EQ(ids.size(), static_cast<size_t>(kCalls + 1));
}

TEST(Session, SequentialIdsStrictlyIncrease) {
    const std::string capture = stubtest::captureFile("sequential");
    auto cfg = stubConfig("echo");
    cfg.env["STUB_CAPTURE_FILE"] = capture;
    Session session(cfg, fastOptions());
    session.Start();
    ToolInvoker tools(session);
    for (int i = 0; i < 5; ++i) {
        (void)tools.CallTool("echo", argsWithN(i));
    }
    (void)tools.ListTools();
    session.Close();

    int64_t last = 0;
    for (const auto& m : stubtest::readMessages(capture)) {
        if (const auto* req = std::get_if<JSONRPCRequest>(&m)) {
            int64_t id = std::get<int64_t>(req->id);
            EXPECT_GT(id, last);
            last = id;
        }
    }
    EXPECT_EQ(last, 7);
}

TEST(Session, HandshakePrecedesAllToolTraffic) {
    const std::string capture = stubtest::captureFile("ordering");
    auto cfg = stubConfig("echo");
    cfg.env["STUB_CAPTURE_FILE"] = capture;
    Session session(cfg, fastOptions());
    session.Start();
    ToolInvoker tools(session);
    // The stub answers out-of-order traffic with an error, which would surface here
    EXPECT_NO_THROW((void)tools.ListTools());
    EXPECT_NO_THROW((void)tools.CallTool("echo", argsWithN(1)));
    session.Close();

    auto messages = stubtest::readMessages(capture);
    ASSERT_GE(messages.size(), 4u);
    const auto* init = std::get_if<JSONRPCRequest>(&messages[0]);
    ASSERT_NE(init, nullptr);
    EXPECT_EQ(init->method, Methods::Initialize);
    EXPECT_EQ(std::get<int64_t>(init->id), 1);
    ASSERT_TRUE(init->params.has_value());
    EXPECT_EQ(GetStringMember(*init->params, "protocolVersion").value_or(""), PROTOCOL_VERSION);
    const JSONValue* clientInfo = FindMember(*init->params, "clientInfo");
    ASSERT_NE(clientInfo, nullptr);
    EXPECT_EQ(GetStringMember(*clientInfo, "name").value_or(""), "mcpsession");
    const JSONValue* caps = FindMember(*init->params, "capabilities");
    ASSERT_NE(caps, nullptr);
    EXPECT_NE(FindMember(*caps, "tools"), nullptr);

    const auto* initialized = std::get_if<JSONRPCNotification>(&messages[1]);
    ASSERT_NE(initialized, nullptr);
    EXPECT_EQ(initialized->method, Methods::Initialized);

    for (size_t i = 2; i < messages.size(); ++i) {
        const auto* req = std::get_if<JSONRPCRequest>(&messages[i]);
        ASSERT_NE(req, nullptr);
        EXPECT_EQ(req->method.rfind("tools/", 0), 0u);
    }
}

TEST(Session, OperationsBeforeStartAreNotReady) {
    Session session(stubConfig("echo"), fastOptions());
    EXPECT_EQ(session.State(), SessionState::Unstarted);
    EXPECT_THROW(session.SendRequest(Methods::ListTools), errors::SessionNotReadyError);
    EXPECT_THROW(session.SendNotification("notifications/custom"), errors::SessionNotReadyError);
    ToolInvoker tools(session);
    EXPECT_THROW((void)tools.ListTools(), errors::SessionNotReadyError);
    EXPECT_THROW((void)tools.CallTool("echo", argsWithN(1)), errors::SessionNotReadyError);
    EXPECT_FALSE(session.GetInitializeResult().has_value());
}

TEST(Session, StartTwiceIsRejected) {
    Session session(stubConfig("echo"), fastOptions());
    session.Start();
    EXPECT_THROW(session.Start(), errors::SessionNotReadyError);
    EXPECT_EQ(session.State(), SessionState::Ready);
}

TEST(Session, InitializeResultIsExposed) {
    Session session(stubConfig("echo"), fastOptions());
    session.Start();
    auto init = session.GetInitializeResult();
    ASSERT_TRUE(init.has_value());
    EXPECT_EQ(init->protocolVersion, PROTOCOL_VERSION);
    EXPECT_EQ(init->serverInfo.name, "stub-server");
    EXPECT_EQ(init->serverInfo.version, "9.9.9");
    ASSERT_TRUE(init->instructions.has_value());
    EXPECT_EQ(*init->instructions, "stub instructions");
    EXPECT_NE(FindMember(init->capabilities, "tools"), nullptr);
}

TEST(Session, CloseFailsOutstandingCallsPromptly) {
    Session session(stubConfig("echo"), fastOptions());
    session.Start();
    ToolInvoker tools(session);

    std::vector<std::future<JSONValue>> pending;
    for (int i = 0; i < 4; ++i) {
        pending.push_back(tools.CallToolAsync("slow", slowArgs(10000), 30s));
    }
    ASSERT_TRUE(stubtest::waitFor([&]() { return session.PendingRequests() == 4u; }, 2s));

    auto start = std::chrono::steady_clock::now();
    session.Close();
    for (auto& f : pending) {
        ASSERT_EQ(f.wait_for(3s), std::future_status::ready);
        EXPECT_THROW(f.get(), errors::SessionClosedError);
    }
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
    EXPECT_EQ(session.State(), SessionState::Closed);
    EXPECT_THROW((void)tools.CallTool("echo", argsWithN(1)), errors::SessionClosedError);
}

TEST(Session, CloseIsIdempotent) {
    Session session(stubConfig("echo"), fastOptions());
    session.Start();
    session.Close();
    session.Close();
    EXPECT_EQ(session.State(), SessionState::Closed);

    Session never(stubConfig("echo"), fastOptions());
    never.Close();
    EXPECT_EQ(never.State(), SessionState::Closed);
    EXPECT_THROW(never.Start(), errors::SessionNotReadyError);
}

TEST(Session, MalformedLinesAreSkipped) {
    Session session(stubConfig("garbage"), fastOptions());
    session.Start();
    ToolInvoker tools(session);
    EXPECT_EQ(echoedN(tools.CallTool("echo", argsWithN(11))), 11);
    EXPECT_EQ(echoedN(tools.CallTool("echo", argsWithN(12))), 12);
    EXPECT_EQ(session.State(), SessionState::Ready);
}

TEST(Session, ServerExitFailsPendingAndSession) {
    Session session(stubConfig("exit-after-init"), fastOptions());
    session.Start();
    ToolInvoker tools(session);
    EXPECT_THROW((void)tools.CallTool("echo", argsWithN(1)), errors::SessionClosedError);
    EXPECT_TRUE(stubtest::waitFor([&]() { return session.State() == SessionState::Failed; }, 2s));
    EXPECT_TRUE(session.FailureCause() != nullptr);
    EXPECT_THROW((void)tools.ListTools(), errors::SessionClosedError);
}

TEST(Session, RejectedInitializeSurfacesRemoteError) {
    Session session(stubConfig("reject"), fastOptions());
    try {
        session.Start();
        FAIL() << "expected RemoteError";
    } catch (const errors::RemoteError& e) {
        EXPECT_EQ(e.code(), JSONRPCErrorCodes::InvalidParams);
        EXPECT_EQ(e.remoteMessage(), "unsupported client");
    }
    EXPECT_EQ(session.State(), SessionState::Failed);
}

TEST(Session, MissingExecutableFailsStart) {
    ServerConfig cfg;
    cfg.name = "missing";
    cfg.command = "/definitely/not/here/mcp-server";
    Session session(cfg, fastOptions());
    EXPECT_THROW(session.Start(), errors::ProcessSpawnError);
    EXPECT_EQ(session.State(), SessionState::Failed);
}

TEST(Session, RequestTimeoutLeavesSessionUsable) {
    Session session(stubConfig("echo"), fastOptions());
    session.Start();
    ToolInvoker tools(session);
    EXPECT_THROW((void)tools.CallTool("slow", slowArgs(1000), 100ms), errors::TimeoutError);
    EXPECT_EQ(session.State(), SessionState::Ready);
    EXPECT_EQ(echoedN(tools.CallTool("echo", argsWithN(5))), 5);
    // The late answer to the timed-out call is dropped without disturbing anything
    std::this_thread::sleep_for(1200ms);
    EXPECT_EQ(session.State(), SessionState::Ready);
    EXPECT_EQ(echoedN(tools.CallTool("echo", argsWithN(6))), 6);
}

TEST(Session, ServerRequestsAreAnswered) {
    const std::string capture = stubtest::captureFile("server_requests");
    auto cfg = stubConfig("echo");
    cfg.env["STUB_CAPTURE_FILE"] = capture;
    Session session(cfg, fastOptions());
    session.Start();
    ToolInvoker tools(session);
    (void)tools.CallTool("ping_client", JSONValue{JSONValue::Object{}});

    auto answered = [&](const std::string& id) {
        for (const auto& m : stubtest::readMessages(capture)) {
            const auto* r = std::get_if<JSONRPCResponse>(&m);
            if (r != nullptr && std::holds_alternative<std::string>(r->id) && std::get<std::string>(r->id) == id) {
                return true;
            }
        }
        return false;
    };
    ASSERT_TRUE(stubtest::waitFor([&]() { return answered("s-ping") && answered("s-sample"); }, 2s));

    for (const auto& m : stubtest::readMessages(capture)) {
        const auto* r = std::get_if<JSONRPCResponse>(&m);
        if (r == nullptr) {
            continue;
        }
        if (std::get<std::string>(r->id) == "s-ping") {
            EXPECT_FALSE(r->IsError());
        } else {
            ASSERT_TRUE(r->IsError());
            EXPECT_EQ(std::get<int64_t>(FindMember(*r->error, "code")->value), JSONRPCErrorCodes::MethodNotFound);
        }
    }
}

TEST(Session, NotificationsReachHandlersAndBumpToolGeneration) {
    Session session(stubConfig("echo"), fastOptions());
    std::atomic<int> customSeen{0};
    session.SetNotificationHandler("notifications/custom", [&](const JSONRPCNotification& n) {
        EXPECT_EQ(n.method, "notifications/custom");
        customSeen.fetch_add(1);
    });
    session.Start();
    EXPECT_EQ(session.ToolListGeneration(), 0u);

    ToolInvoker tools(session);
    (void)tools.CallTool("notify", JSONValue{JSONValue::Object{}});
    // Notifications precede the response on the wire and are dispatched first
    EXPECT_EQ(customSeen.load(), 1);
    EXPECT_EQ(session.ToolListGeneration(), 1u);

    session.SetNotificationHandler("notifications/custom", nullptr);
    (void)tools.CallTool("notify", JSONValue{JSONValue::Object{}});
    EXPECT_EQ(customSeen.load(), 1);
    EXPECT_EQ(session.ToolListGeneration(), 2u);
}

TEST(Session, DestructorReleasesARunningSession) {
    auto start = std::chrono::steady_clock::now();
    {
        Session session(stubConfig("echo"), fastOptions());
        session.Start();
    }
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
}

TEST(Session, HandlerMayDestroyItsOwnSession) {
    auto session = std::make_unique<Session>(stubConfig("echo"), fastOptions());
    std::atomic<bool> destroyed{false};
    session->SetNotificationHandler("notifications/custom", [&](const JSONRPCNotification&) {
        session.reset();
        destroyed.store(true);
    });
    session->Start();
    // The stub answers the poke with notifications/custom after a short delay
    session->SendNotification("notifications/stub/poke");
    ASSERT_TRUE(stubtest::waitFor([&]() { return destroyed.load(); }, 5s));
    // Give the reader time to unwind after the handler returned
    std::this_thread::sleep_for(300ms);
}

TEST(Session, ServerRequestFloodDoesNotStallResponses) {
    const std::string capture = stubtest::captureFile("flood");
    auto cfg = stubConfig("echo");
    cfg.env["STUB_CAPTURE_FILE"] = capture;
    Session session(cfg, fastOptions());
    session.Start();
    ToolInvoker tools(session);

    // Far more ping answers than fit in one pipe buffer while the stub is busy writing
    constexpr int kPings = 3000;
    JSONValue::Object args;
    args["count"] = std::make_shared<JSONValue>(static_cast<int64_t>(kPings));
    JSONValue result = tools.CallTool("ping_flood", JSONValue{args}, 10s);
    EXPECT_EQ(ToolInvoker::ExtractTextContent(result), "flooded");
    EXPECT_EQ(session.State(), SessionState::Ready);

    auto answered = [&]() {
        int n = 0;
        for (const auto& line : stubtest::readLines(capture)) {
            if (line.find("\"flood-") != std::string::npos) {
                ++n;
            }
        }
        return n;
    };
    EXPECT_TRUE(stubtest::waitFor([&]() { return answered() == kPings; }, 10s)) << answered();
    EXPECT_EQ(echoedN(tools.CallTool("echo", argsWithN(9))), 9);
}
