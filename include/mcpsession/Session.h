//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Session.h
// Purpose: Stateful MCP session over a child process's stdio: lifecycle, handshake, and request routing
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "mcpsession/Config.h"
#include "mcpsession/JSONRPCTypes.h"
#include "mcpsession/Protocol.h"

namespace mcpsession {

//==========================================================================================================
// SessionState
// Purpose: Lifecycle of one session. Transitions only move forward:
//          Unstarted -> Initializing -> Ready, and any non-terminal state -> Closed | Failed.
//==========================================================================================================
enum class SessionState {
    Unstarted,
    Initializing,
    Ready,
    Closed,
    Failed
};

const char* ToString(SessionState state);

//==========================================================================================================
// Session
// Purpose: Owns one server process, its pipes, and the reader thread that demultiplexes its output.
// Notes:
//   - Start() must complete (state Ready) before SendRequest/SendNotification are legal.
//   - SendRequest is safe from any number of threads; each call blocks only its caller. Writes to the
//     server are serialized so one message is never interleaved with another.
//   - Close() is idempotent and fails every outstanding request with SessionClosedError before tearing
//     the process down. The destructor calls Close().
//   - Notification handlers run on the reader thread; they must not block on the session's own requests.
//     A handler may Close() or destroy the session; the reader then finishes on its own after the handler.
//   - Answers to server-initiated requests are queued to a writer thread, so the reader never waits on
//     the server's stdin.
//==========================================================================================================
class Session {
public:
    using NotificationHandler = std::function<void(const JSONRPCNotification&)>;

    explicit Session(ServerConfig server, SessionOptions options = SessionOptions::FromEnvironment());
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    //==========================================================================================================
    // Start
    // Purpose: Spawns the server, starts the reader, performs initialize / notifications/initialized.
    // Returns:
    //   When the session is Ready.
    // Throws:
    //   errors::SessionNotReadyError when the session was already started.
    //   errors::ProcessSpawnError, errors::TimeoutError, errors::RemoteError, errors::MalformedMessageError,
    //   errors::SessionClosedError: the handshake failed; the session is now Failed (or Closed when Close()
    //   raced the handshake).
    //==========================================================================================================
    void Start();

    // Closes the session; see class notes.
    void Close();

    SessionState State() const;

    // Cause recorded when the session entered Failed; null otherwise.
    std::exception_ptr FailureCause() const;

    // The server's initialize result; std::nullopt until the handshake succeeded.
    std::optional<InitializeResult> GetInitializeResult() const;

    const ServerConfig& Server() const;
    const SessionOptions& Options() const;

    //==========================================================================================================
    // SendRequest
    // Purpose: One request/response round trip.
    // Args:
    //   method: JSON-RPC method name.
    //   params: Optional params object.
    //   timeout: Per-call deadline; Options().requestTimeout when absent.
    // Returns:
    //   The response, success or error, uninterpreted.
    // Throws:
    //   errors::SessionNotReadyError before Ready; errors::SessionClosedError once Closed or Failed, or
    //   when the session ends while waiting; errors::TimeoutError on expiry (the session stays usable).
    //==========================================================================================================
    JSONRPCResponse SendRequest(const std::string& method,
                                std::optional<JSONValue> params = std::nullopt,
                                std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    // Sends a notification (no response). Same readiness rules as SendRequest.
    void SendNotification(const std::string& method, std::optional<JSONValue> params = std::nullopt);

    // Registers (or with an empty handler, removes) the handler for a notification method.
    void SetNotificationHandler(const std::string& method, NotificationHandler handler);

    // Incremented on every notifications/tools/list_changed received.
    uint64_t ToolListGeneration() const;

    // Requests issued and not yet resolved.
    std::size_t PendingRequests() const;

private:
    struct Impl;
    std::shared_ptr<Impl> pImpl;
};

} // namespace mcpsession
