//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_request_correlator.cpp
// Purpose: GoogleTests for id allocation, response matching, timeouts, and terminal failure of pending calls
//==========================================================================================================

#include <gtest/gtest.h>
#include <algorithm>
#include <chrono>
#include <future>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

#include "mcpsession/RequestCorrelator.h"
#include "mcpsession/errors/Errors.h"

using namespace mcpsession;
using namespace std::chrono_literals;

namespace {

JSONRPCResponse okResponse(int64_t id, int64_t marker) {
    JSONValue::Object obj;
    obj["marker"] = std::make_shared<JSONValue>(marker);
    return JSONRPCResponse(id, JSONValue{obj});
}

int64_t markerOf(const JSONRPCResponse& r) {
    return std::get<int64_t>(FindMember(*r.result, "marker")->value);
}

} // namespace

TEST(RequestCorrelator, IdsStrictlyIncreasingAcrossThreads) {
    RequestCorrelator c;
    constexpr int kThreads = 8;
    constexpr int kPerThread = 500;
    std::vector<std::vector<int64_t>> perThread(kThreads);
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t]() {
            for (int i = 0; i < kPerThread; ++i) {
                perThread[t].push_back(c.NextId());
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }
    std::set<int64_t> all;
    for (const auto& ids : perThread) {
        EXPECT_TRUE(std::is_sorted(ids.begin(), ids.end()));
        EXPECT_TRUE(std::adjacent_find(ids.begin(), ids.end()) == ids.end());
        all.insert(ids.begin(), ids.end());
    }
    EXPECT_EQ(all.size(), static_cast<size_t>(kThreads * kPerThread));
    EXPECT_EQ(*all.begin(), 1);
    EXPECT_EQ(*all.rbegin(), kThreads * kPerThread);
}

TEST(RequestCorrelator, ResolveDeliversToMatchingWaiterOnly) {
    RequestCorrelator c;
    auto first = c.Register(c.NextId());
    auto second = c.Register(c.NextId());
    EXPECT_EQ(c.PendingCount(), 2u);

    EXPECT_TRUE(c.Resolve(okResponse(second.id, 20)));
    EXPECT_TRUE(c.Resolve(okResponse(first.id, 10)));

    EXPECT_EQ(markerOf(c.Await(first, 1s)), 10);
    EXPECT_EQ(markerOf(c.Await(second, 1s)), 20);
    EXPECT_EQ(c.PendingCount(), 0u);
}

TEST(RequestCorrelator, UnknownAndDuplicateResponsesAreDroppedQuietly) {
    RequestCorrelator c;
    auto call = c.Register(c.NextId());

    EXPECT_FALSE(c.Resolve(okResponse(9999, 1)));
    EXPECT_FALSE(c.Resolve(JSONRPCResponse(std::string("1"), JSONValue{JSONValue::Object{}})));
    EXPECT_EQ(c.PendingCount(), 1u);

    EXPECT_TRUE(c.Resolve(okResponse(call.id, 5)));
    EXPECT_FALSE(c.Resolve(okResponse(call.id, 6)));
    EXPECT_EQ(markerOf(c.Await(call, 1s)), 5);
}

TEST(RequestCorrelator, AwaitTimesOutAndRemovesEntry) {
    RequestCorrelator c;
    auto call = c.Register(c.NextId());
    auto other = c.Register(c.NextId());

    auto start = std::chrono::steady_clock::now();
    EXPECT_THROW(c.Await(call, 100ms), errors::TimeoutError);
    EXPECT_GE(std::chrono::steady_clock::now() - start, 100ms);
    EXPECT_EQ(c.PendingCount(), 1u);

    // A late response finds no entry; the other waiter is unaffected
    EXPECT_FALSE(c.Resolve(okResponse(call.id, 1)));
    EXPECT_TRUE(c.Resolve(okResponse(other.id, 2)));
    EXPECT_EQ(markerOf(c.Await(other, 1s)), 2);
}

TEST(RequestCorrelator, AwaitBlocksUntilResolvedFromAnotherThread) {
    RequestCorrelator c;
    auto call = c.Register(c.NextId());
    std::thread resolver([&]() {
        std::this_thread::sleep_for(50ms);
        c.Resolve(okResponse(call.id, 77));
    });
    EXPECT_EQ(markerOf(c.Await(call, 2s)), 77);
    resolver.join();
}

TEST(RequestCorrelator, FailAllReleasesEveryWaiterAndSeals) {
    RequestCorrelator c;
    std::vector<std::future<void>> waiters;
    for (int i = 0; i < 5; ++i) {
        auto call = std::make_shared<PendingCall>(c.Register(c.NextId()));
        waiters.push_back(std::async(std::launch::async, [&c, call]() { (void)c.Await(*call, 10s); }));
    }
    std::this_thread::sleep_for(20ms);
    EXPECT_EQ(c.FailAll(std::make_exception_ptr(errors::SessionClosedError("closed"))), 5u);
    for (auto& w : waiters) {
        ASSERT_EQ(w.wait_for(2s), std::future_status::ready);
        EXPECT_THROW(w.get(), errors::SessionClosedError);
    }
    EXPECT_EQ(c.PendingCount(), 0u);
    EXPECT_TRUE(c.IsSealed());
    EXPECT_THROW(c.Register(c.NextId()), errors::SessionClosedError);
}

TEST(RequestCorrelator, DiscardRemovesUnsentRequest) {
    RequestCorrelator c;
    auto call = c.Register(c.NextId());
    c.Discard(call.id);
    EXPECT_EQ(c.PendingCount(), 0u);
    EXPECT_FALSE(c.Resolve(okResponse(call.id, 1)));
    c.Discard(call.id);
}

TEST(RequestCorrelator, DuplicateRegistrationRejected) {
    RequestCorrelator c;
    auto call = c.Register(42);
    EXPECT_THROW(c.Register(42), std::logic_error);
    EXPECT_TRUE(c.Resolve(okResponse(42, 1)));
    EXPECT_EQ(markerOf(c.Await(call, 1s)), 1);
}

TEST(RequestCorrelator, HugeTimeoutWaitsInsteadOfExpiring) {
    RequestCorrelator c;
    auto call = c.Register(c.NextId());
    std::thread resolver([&]() {
        std::this_thread::sleep_for(100ms);
        c.Resolve(okResponse(call.id, 3));
    });
    EXPECT_EQ(markerOf(c.Await(call, std::chrono::milliseconds::max())), 3);
    resolver.join();

    auto second = c.Register(c.NextId());
    std::thread resolver2([&]() {
        std::this_thread::sleep_for(100ms);
        c.Resolve(okResponse(second.id, 4));
    });
    EXPECT_EQ(markerOf(c.Await(second, std::chrono::milliseconds(100000000000000LL))), 4);
    resolver2.join();
}

TEST(RequestCorrelator, NonPositiveTimeoutExpiresAtOnce) {
    RequestCorrelator c;
    auto call = c.Register(c.NextId());
    EXPECT_THROW(c.Await(call, std::chrono::milliseconds(-5)), errors::TimeoutError);
    EXPECT_EQ(c.PendingCount(), 0u);
}
