//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RequestCorrelator.cpp
// Purpose: Request id allocation and response-to-caller matching implementation
//==========================================================================================================

#include <algorithm>
#include <stdexcept>

#include "logging/Logger.h"
#include "mcpsession/RequestCorrelator.h"
#include "mcpsession/errors/Errors.h"

namespace mcpsession {

int64_t RequestCorrelator::NextId() {
    return lastId.fetch_add(1, std::memory_order_relaxed) + 1;
}

PendingCall RequestCorrelator::Register(int64_t id) {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lock(mutex);
    if (terminalError) {
        std::rethrow_exception(terminalError);
    }
    auto [it, inserted] = pending.try_emplace(id);
    if (!inserted) {
        throw std::logic_error("RequestCorrelator: id " + std::to_string(id) + " is already pending");
    }
    PendingCall call;
    call.id = id;
    call.response = it->second.promise.get_future();
    return call;
}

JSONRPCResponse RequestCorrelator::Await(PendingCall& call, std::chrono::milliseconds timeout) {
    FUNC_SCOPE();
    using Clock = std::chrono::steady_clock;
    const auto now = Clock::now();
    // Saturate instead of overflowing for very long timeouts
    const auto headroom = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::time_point::max() - now);
    const auto deadline = timeout.count() <= 0 ? now : now + std::min(timeout, headroom);
    {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = pending.find(call.id);
        if (it != pending.end()) {
            it->second.deadline = deadline;
        }
    }

    if (call.response.wait_until(deadline) != std::future_status::ready) {
        bool removed = false;
        {
            std::lock_guard<std::mutex> lock(mutex);
            removed = pending.erase(call.id) > 0;
        }
        // A response that raced the deadline already completed the future; deliver it instead
        if (removed) {
            LOG_WARN("Request id={} timed out after {} ms", call.id, static_cast<long long>(timeout.count()));
            throw errors::TimeoutError("request id=" + std::to_string(call.id) + " timed out after " +
                                       std::to_string(timeout.count()) + " ms");
        }
    }
    return call.response.get();
}

bool RequestCorrelator::Resolve(JSONRPCResponse response) noexcept {
    if (!std::holds_alternative<int64_t>(response.id)) {
        LOG_WARN("ProtocolViolation: response id {} does not match any request this client issued; dropped",
                 IdToString(response.id));
        return false;
    }
    const int64_t id = std::get<int64_t>(response.id);
    std::lock_guard<std::mutex> lock(mutex);
    auto it = pending.find(id);
    if (it == pending.end()) {
        LOG_WARN("ProtocolViolation: no pending request for response id={} (late, duplicate, or unknown); dropped", id);
        return false;
    }
    try {
        it->second.promise.set_value(std::move(response));
    } catch (const std::future_error& e) {
        LOG_ERROR("RequestCorrelator: completing id={} failed: {}", id, e.what());
    }
    pending.erase(it);
    return true;
}

void RequestCorrelator::Discard(int64_t id) {
    std::lock_guard<std::mutex> lock(mutex);
    pending.erase(id);
}

std::size_t RequestCorrelator::FailAll(std::exception_ptr error) {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lock(mutex);
    if (!terminalError) {
        terminalError = error;
    }
    std::size_t failed = 0;
    for (auto& [id, entry] : pending) {
        try {
            entry.promise.set_exception(error);
            ++failed;
        } catch (const std::future_error& e) {
            LOG_ERROR("RequestCorrelator: failing id={} failed: {}", id, e.what());
        }
    }
    pending.clear();
    if (failed > 0) {
        LOG_INFO("Failed {} pending request(s)", failed);
    }
    return failed;
}

std::size_t RequestCorrelator::PendingCount() const {
    std::lock_guard<std::mutex> lock(mutex);
    return pending.size();
}

bool RequestCorrelator::IsSealed() const {
    std::lock_guard<std::mutex> lock(mutex);
    return static_cast<bool>(terminalError);
}

} // namespace mcpsession
