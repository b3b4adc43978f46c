//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RequestCorrelator.h
// Purpose: Request id allocation and response-to-caller matching for one session
//==========================================================================================================

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <future>
#include <mutex>
#include <optional>
#include <unordered_map>

#include "mcpsession/JSONRPCTypes.h"

namespace mcpsession {

//==========================================================================================================
// PendingCall
// Purpose: Caller-side handle for one outstanding request.
// Fields:
//   id: Correlation id written on the wire.
//   response: Completed exactly once by Resolve, FailAll, or (on timeout) never.
//==========================================================================================================
struct PendingCall {
    int64_t id{0};
    std::future<JSONRPCResponse> response;
};

//==========================================================================================================
// RequestCorrelator
// Purpose: Allocates strictly increasing ids and routes each response to the caller that registered it.
// Notes:
//   - All methods are thread-safe. The pending map and sealed state are guarded by one mutex; the id
//     counter is atomic.
//   - Every entry is removed exactly once: by Resolve, by Await timing out, by Discard, or by FailAll.
//   - After FailAll the correlator is sealed: Register rethrows the terminal error immediately.
//==========================================================================================================
class RequestCorrelator {
public:
    RequestCorrelator() = default;
    RequestCorrelator(const RequestCorrelator&) = delete;
    RequestCorrelator& operator=(const RequestCorrelator&) = delete;

    // Returns the next id (1, 2, 3, ...). Never reuses a value.
    int64_t NextId();

    //==========================================================================================================
    // Register
    // Purpose: Creates the pending entry for id.
    // Throws:
    //   The terminal error passed to FailAll when the correlator is sealed.
    //   std::logic_error when id is already pending.
    //==========================================================================================================
    PendingCall Register(int64_t id);

    //==========================================================================================================
    // Await
    // Purpose: Blocks the calling thread until the response for call.id arrives or timeout elapses.
    // Returns:
    //   The matching response (result or error object, uninterpreted).
    // Throws:
    //   errors::TimeoutError after removing the entry on expiry.
    //   The terminal error when FailAll resolved the entry.
    //==========================================================================================================
    JSONRPCResponse Await(PendingCall& call, std::chrono::milliseconds timeout);

    //==========================================================================================================
    // Resolve
    // Purpose: Delivers a response to its waiter. Called by the reader loop only.
    // Returns:
    //   true when a waiter received it; false when the id was unknown, already resolved, or not an integer.
    //   The latter is logged as a protocol violation and the response dropped. Never throws.
    //==========================================================================================================
    bool Resolve(JSONRPCResponse response) noexcept;

    // Removes an entry whose request never reached the wire. No-op when absent.
    void Discard(int64_t id);

    //==========================================================================================================
    // FailAll
    // Purpose: Completes every pending entry with error and seals the correlator.
    // Returns:
    //   Number of entries that were failed. Later calls only count newly registered entries (none).
    //==========================================================================================================
    std::size_t FailAll(std::exception_ptr error);

    std::size_t PendingCount() const;
    bool IsSealed() const;

private:
    struct Entry {
        std::promise<JSONRPCResponse> promise;
        std::optional<std::chrono::steady_clock::time_point> deadline;
    };

    std::atomic<int64_t> lastId{0};
    mutable std::mutex mutex;
    std::unordered_map<int64_t, Entry> pending;
    std::exception_ptr terminalError;
};

} // namespace mcpsession
