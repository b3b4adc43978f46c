//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Session.cpp
// Purpose: MCP session state machine, handshake, serialized writer, and the stdout/stderr reader thread
//==========================================================================================================

#include <poll.h>
#include <sys/eventfd.h>
#include <unistd.h>

#include <array>
#include <atomic>
#include <cerrno>
#include <condition_variable>
#include <cstring>
#include <deque>
#include <format>
#include <mutex>
#include <string_view>
#include <thread>
#include <unordered_map>

#include "logging/Logger.h"
#include "mcpsession/MessageCodec.h"
#include "mcpsession/ProcessLauncher.hpp"
#include "mcpsession/RequestCorrelator.h"
#include "mcpsession/Session.h"
#include "mcpsession/errors/Errors.h"

namespace mcpsession {

namespace {

using errors::SessionClosedError;

constexpr std::size_t kReadChunk = 8192;
constexpr int kStderrDrainPollMs = 100;
constexpr int kStderrDrainMaxReads = 64;
constexpr std::size_t kReplyQueueMaxBytes = 2 * 1024 * 1024;

std::string describe(const std::exception_ptr& error) {
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    }
    return "unknown error";
}

InitializeResult parseInitializeResult(const JSONValue& result) {
    if (!result.IsObject()) {
        throw errors::MalformedMessageError("initialize result is not an object");
    }
    InitializeResult out;
    if (auto version = GetStringMember(result, "protocolVersion")) {
        out.protocolVersion = *version;
    }
    if (const JSONValue* info = FindMember(result, "serverInfo"); info != nullptr && info->IsObject()) {
        out.serverInfo.name = GetStringMember(*info, "name").value_or("");
        out.serverInfo.version = GetStringMember(*info, "version").value_or("");
    }
    if (const JSONValue* caps = FindMember(result, "capabilities"); caps != nullptr && caps->IsObject()) {
        out.capabilities = *caps;
    }
    out.instructions = GetStringMember(result, "instructions");
    return out;
}

} // namespace

const char* ToString(SessionState state) {
    switch (state) {
        case SessionState::Unstarted: return "Unstarted";
        case SessionState::Initializing: return "Initializing";
        case SessionState::Ready: return "Ready";
        case SessionState::Closed: return "Closed";
        case SessionState::Failed: return "Failed";
    }
    return "Unknown";
}

////////////////////////////////////////// Session::Impl //////////////////////////////////////////
struct Session::Impl : std::enable_shared_from_this<Session::Impl> {
    ServerConfig server;
    SessionOptions options;

    mutable std::mutex stateMutex;
    SessionState state{SessionState::Unstarted};
    std::exception_ptr failureCause;
    std::optional<InitializeResult> initResult;
    std::unique_ptr<ChildProcess> child;

    RequestCorrelator correlator;
    std::mutex writeMutex;

    // Answers to server-initiated requests; written by replyWriter so the reader never blocks on stdin
    std::mutex replyMutex;
    std::condition_variable cvReply;
    std::deque<std::string> replyQueue;
    std::size_t replyQueuedBytes{0};
    bool replyStop{false};
    std::thread replyWriter;

    std::atomic<bool> initializedSent{false};
    std::atomic<uint64_t> toolListGeneration{0};

    std::mutex handlersMutex;
    std::unordered_map<std::string, NotificationHandler> handlers;

    std::mutex closeMutex;
    bool closeCalled{false};

    std::mutex teardownMutex;
    std::atomic<bool> stopRequested{false};
    int wakeFd{-1};
    std::thread reader;

    Impl(ServerConfig s, SessionOptions o) : server(std::move(s)), options(std::move(o)) {
        wakeFd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
        if (wakeFd < 0) {
            const int err = errno;
            throw errors::SessionError(std::format("failed to create reader wake eventfd: {}", ::strerror(err)));
        }
    }

    ~Impl() {
        StopReplyWriter();
        if (reader.joinable()) {
            if (reader.get_id() == std::this_thread::get_id()) {
                reader.detach();
            } else {
                stopRequested.store(true);
                Wake();
                reader.join();
            }
        }
        if (wakeFd >= 0 && ::close(wakeFd) != 0) {
            const int err = errno;
            LOG_WARN("Session: closing wake eventfd failed (errno={} msg={})", err, ::strerror(err));
        }
    }

    ////////////////////////////////////////// State //////////////////////////////////////////
    void RequireReady() const {
        std::lock_guard<std::mutex> lock(stateMutex);
        switch (state) {
            case SessionState::Ready:
                return;
            case SessionState::Unstarted:
            case SessionState::Initializing:
                throw errors::SessionNotReadyError(
                    std::format("session is {}; the handshake has not completed", ToString(state)));
            case SessionState::Closed:
            case SessionState::Failed:
                break;
        }
        throw SessionClosedError(std::format("session is {}", ToString(state)));
    }

    bool TransitionToFailed(const std::exception_ptr& cause) {
        std::lock_guard<std::mutex> lock(stateMutex);
        if (state == SessionState::Closed || state == SessionState::Failed) {
            return false;
        }
        state = SessionState::Failed;
        failureCause = cause;
        return true;
    }

    ChildProcess* CurrentChild() const {
        std::lock_guard<std::mutex> lock(stateMutex);
        return child.get();
    }

    ////////////////////////////////////////// Writing //////////////////////////////////////////
    void WriteMessage(const JSONRPCMessage& message) {
        WriteLine(MessageCodec::Encode(message));
    }

    void WriteLine(const std::string& line) {
        ChildProcess* proc = CurrentChild();
        if (proc == nullptr) {
            throw SessionClosedError("server process is not running");
        }
        std::lock_guard<std::mutex> lock(writeMutex);
        LOG_DEBUG("-> {}", std::string_view(line.data(), line.size() - 1));
        proc->WriteAll(line);
    }

    JSONRPCResponse RoundTrip(const std::string& method, std::optional<JSONValue> params,
                              std::chrono::milliseconds timeout) {
        const int64_t id = correlator.NextId();
        PendingCall call = correlator.Register(id);
        try {
            WriteMessage(JSONRPCRequest(id, method, std::move(params)));
        } catch (const SessionClosedError&) {
            correlator.Discard(id);
            throw;
        }
        return correlator.Await(call, timeout);
    }

    ////////////////////////////////////////// Start //////////////////////////////////////////
    void Launch() {
        auto proc = ProcessLauncher::Start(server.command, server.args, server.env, server.cwd);
        std::lock_guard<std::mutex> lock(stateMutex);
        if (state != SessionState::Initializing) {
            throw SessionClosedError("session was closed while the server was starting");
        }
        child = std::move(proc);
        replyWriter = std::thread([this]() { ReplyWriterLoop(); });
        // The reader keeps Impl alive: a handler may drop the last Session reference from this thread
        reader = std::thread([self = shared_from_this()]() { self->ReaderLoop(); });
    }

    void Handshake() {
        JSONValue::Object clientInfo;
        clientInfo["name"] = std::make_shared<JSONValue>(options.clientInfo.name);
        clientInfo["version"] = std::make_shared<JSONValue>(options.clientInfo.version);

        JSONValue::Object params;
        params["protocolVersion"] = std::make_shared<JSONValue>(std::string(PROTOCOL_VERSION));
        params["capabilities"] = std::make_shared<JSONValue>(options.capabilities);
        params["clientInfo"] = std::make_shared<JSONValue>(clientInfo);

        LOG_INFO("Sending initialize to '{}' (protocol {})", server.name, PROTOCOL_VERSION);
        JSONRPCResponse response = RoundTrip(Methods::Initialize, JSONValue{params}, options.initializeTimeout);
        if (response.IsError()) {
            std::optional<errors::McpError> err = errors::mcpErrorFromErrorValue(*response.error);
            if (!err.has_value()) {
                throw errors::MalformedMessageError("initialize failed with an unreadable error object");
            }
            throw errors::RemoteError(std::format("initialize rejected ({}): {}", err->code, err->message), *err);
        }
        InitializeResult result = parseInitializeResult(*response.result);
        if (!result.protocolVersion.empty() && result.protocolVersion != PROTOCOL_VERSION) {
            LOG_WARN("Server '{}' answered with protocol {} (client speaks {}); continuing",
                     server.name, result.protocolVersion, PROTOCOL_VERSION);
        }

        // From here on the reader accepts server requests and notifications
        initializedSent.store(true);
        WriteMessage(JSONRPCNotification(Methods::Initialized));

        {
            std::lock_guard<std::mutex> lock(stateMutex);
            if (state != SessionState::Initializing) {
                throw SessionClosedError("session was closed during the handshake");
            }
            initResult = result;
            state = SessionState::Ready;
        }
        LOG_INFO("Session ready: server '{}' {} (protocol {})", result.serverInfo.name,
                 result.serverInfo.version, result.protocolVersion);
    }

    void AbortStart(const std::exception_ptr& cause) {
        if (TransitionToFailed(cause)) {
            LOG_ERROR("Session with '{}' failed during start: {}", server.name, describe(cause));
        }
        correlator.FailAll(cause);
        Teardown();
    }

    ////////////////////////////////////////// Teardown //////////////////////////////////////////
    void Wake() {
        const uint64_t one = 1;
        ssize_t w = 0;
        do {
            w = ::write(wakeFd, &one, sizeof(one));
        } while (w < 0 && errno == EINTR);
        if (w < 0 && errno != EAGAIN) {
            const int err = errno;
            LOG_WARN("Session: eventfd write failed (errno={} msg={})", err, ::strerror(err));
        }
    }

    void StopReplyWriter() {
        {
            std::lock_guard<std::mutex> lock(replyMutex);
            replyStop = true;
        }
        cvReply.notify_all();
        if (replyWriter.joinable()) {
            replyWriter.join();
        }
    }

    // Terminates the process, then stops the reply writer and the reader. Safe to call more than once.
    void Teardown() {
        std::lock_guard<std::mutex> lock(teardownMutex);
        ChildProcess* proc = nullptr;
        bool hasReader = false;
        {
            std::lock_guard<std::mutex> stateLock(stateMutex);
            proc = child.get();
            hasReader = reader.joinable();
        }
        if (proc != nullptr) {
            proc->Terminate(options.shutdownGrace);
        }
        StopReplyWriter();
        stopRequested.store(true);
        Wake();
        if (!hasReader || !reader.joinable()) {
            return;
        }
        if (reader.get_id() == std::this_thread::get_id()) {
            LOG_DEBUG("Session closed from its own reader thread; the reader exits after this callback");
            return;
        }
        reader.join();
    }

    ////////////////////////////////////////// Replies //////////////////////////////////////////
    void QueueReply(const JSONRPCResponse& reply) {
        std::string line = MessageCodec::Encode(reply);
        {
            std::lock_guard<std::mutex> lock(replyMutex);
            if (replyStop) {
                return;
            }
            if (replyQueuedBytes + line.size() > kReplyQueueMaxBytes) {
                LOG_ERROR("Reply queue overflow (queued={} add={} max={}); dropping reply id={}", replyQueuedBytes,
                          line.size(), kReplyQueueMaxBytes, IdToString(reply.id));
                return;
            }
            replyQueuedBytes += line.size();
            replyQueue.emplace_back(std::move(line));
        }
        cvReply.notify_one();
    }

    void ReplyWriterLoop() {
        while (true) {
            std::string line;
            {
                std::unique_lock<std::mutex> lock(replyMutex);
                cvReply.wait(lock, [&] { return replyStop || !replyQueue.empty(); });
                if (replyStop) {
                    return;
                }
                line = std::move(replyQueue.front());
                replyQueue.pop_front();
                replyQueuedBytes -= line.size();
            }
            try {
                WriteLine(line);
            } catch (const SessionClosedError& e) {
                LOG_WARN("Could not answer server request: {}", e.what());
                return;
            }
        }
    }

    ////////////////////////////////////////// Reader //////////////////////////////////////////
    void OnReaderFailure(const std::string& reason) {
        auto cause = std::make_exception_ptr(SessionClosedError(reason));
        if (TransitionToFailed(cause)) {
            LOG_ERROR("Session with '{}' failed: {}", server.name, reason);
        }
        correlator.FailAll(cause);
    }

    void DrainWake() {
        uint64_t v = 0;
        ssize_t r = 0;
        do {
            r = ::read(wakeFd, &v, sizeof(v));
        } while (r < 0 && errno == EINTR);
    }

    void ForwardStderr(LineBuffer& buffer) {
        while (true) {
            try {
                std::optional<std::string> line = buffer.NextLine();
                if (!line) {
                    return;
                }
                LOG_DEBUG("[{} stderr] {}", server.name, *line);
            } catch (const errors::MalformedMessageError& e) {
                LOG_WARN("Dropped oversized stderr line from '{}': {}", server.name, e.what());
            }
        }
    }

    // Returns false once stderr reached EOF or failed.
    bool ReadStderr(int fd, LineBuffer& buffer, std::array<char, kReadChunk>& chunk) {
        ssize_t n = 0;
        do {
            n = ::read(fd, chunk.data(), chunk.size());
        } while (n < 0 && errno == EINTR);
        if (n > 0) {
            buffer.Append(chunk.data(), static_cast<std::size_t>(n));
            ForwardStderr(buffer);
            return true;
        }
        if (n < 0) {
            const int err = errno;
            LOG_WARN("Reading stderr of '{}' failed (errno={} msg={})", server.name, err, ::strerror(err));
        }
        return false;
    }

    // Last words of a dying server are usually on stderr; pick them up before reporting the failure.
    void DrainStderr(int fd, LineBuffer& buffer, std::array<char, kReadChunk>& chunk) {
        for (int i = 0; fd >= 0 && i < kStderrDrainMaxReads; ++i) {
            pollfd pfd{fd, POLLIN, 0};
            int rc = ::poll(&pfd, 1, kStderrDrainPollMs);
            if (rc <= 0 || !ReadStderr(fd, buffer, chunk)) {
                return;
            }
        }
    }

    void HandleServerRequest(const JSONRPCRequest& request) {
        std::unique_ptr<JSONRPCResponse> reply;
        if (request.method == Methods::Ping) {
            reply = std::make_unique<JSONRPCResponse>(request.id, JSONValue{JSONValue::Object{}});
        } else {
            LOG_WARN("Server request '{}' (id={}) is not supported; answering MethodNotFound", request.method,
                     IdToString(request.id));
            reply = CreateErrorResponse(request.id, JSONRPCErrorCodes::MethodNotFound,
                                        "Method not found: " + request.method);
        }
        QueueReply(*reply);
    }

    void ForwardServerLog(const std::optional<JSONValue>& params) {
        if (!params || !params->IsObject()) {
            LOG_WARN("ProtocolViolation: {} without a params object; ignored", Methods::Log);
            return;
        }
        const std::string level = GetStringMember(*params, "level").value_or("info");
        const std::string source = GetStringMember(*params, "logger").value_or(server.name);
        std::string text;
        if (const JSONValue* data = FindMember(*params, "data")) {
            text = data->IsString() ? std::get<std::string>(data->value) : SerializeJSONValue(*data);
        }
        if (level == "debug") {
            LOG_DEBUG("[{}] {}", source, text);
        } else if (level == "info" || level == "notice") {
            LOG_INFO("[{}] {}", source, text);
        } else if (level == "warning") {
            LOG_WARN("[{}] {}", source, text);
        } else {
            LOG_ERROR("[{}] ({}) {}", source, level, text);
        }
    }

    void HandleNotification(const JSONRPCNotification& notification) {
        if (notification.method == Methods::ToolListChanged) {
            const uint64_t generation = ++toolListGeneration;
            LOG_INFO("Server '{}' tool list changed (generation {})", server.name, generation);
        } else if (notification.method == Methods::Log) {
            ForwardServerLog(notification.params);
        }

        NotificationHandler handler;
        {
            std::lock_guard<std::mutex> lock(handlersMutex);
            auto it = handlers.find(notification.method);
            if (it != handlers.end()) {
                handler = it->second;
            }
        }
        if (!handler) {
            return;
        }
        try {
            handler(notification);
        } catch (const std::exception& e) {
            LOG_ERROR("Notification handler for '{}' threw: {}", notification.method, e.what());
        }
    }

    void HandleLine(const std::string& line) {
        LOG_DEBUG("<- {}", line);
        std::optional<Message> message;
        try {
            message = MessageCodec::Decode(line);
        } catch (const errors::MalformedMessageError& e) {
            LOG_WARN("Dropping malformed line from '{}': {}", server.name, e.what());
            return;
        }

        if (auto* response = std::get_if<JSONRPCResponse>(&*message)) {
            correlator.Resolve(std::move(*response));
            return;
        }
        if (auto* request = std::get_if<JSONRPCRequest>(&*message)) {
            if (!initializedSent.load()) {
                LOG_WARN("ProtocolViolation: server request '{}' before the handshake completed; ignored",
                         request->method);
                return;
            }
            HandleServerRequest(*request);
            return;
        }
        auto& notification = std::get<JSONRPCNotification>(*message);
        if (!initializedSent.load()) {
            LOG_WARN("ProtocolViolation: notification '{}' before the handshake completed; ignored",
                     notification.method);
            return;
        }
        HandleNotification(notification);
    }

    void DispatchLines(LineBuffer& buffer) {
        while (true) {
            std::optional<std::string> line;
            try {
                line = buffer.NextLine();
            } catch (const errors::MalformedMessageError& e) {
                LOG_WARN("Dropping line from '{}': {}", server.name, e.what());
                continue;
            }
            if (!line) {
                return;
            }
            HandleLine(*line);
        }
    }

    void ReaderLoop() {
        ChildProcess* proc = CurrentChild();
        const int outFd = proc->StdoutFd();
        int errFd = proc->StderrFd();
        LineBuffer outBuffer(options.maxLineBytes);
        LineBuffer errBuffer(options.maxLineBytes);
        std::array<char, kReadChunk> chunk{};
        LOG_DEBUG("Reader started for '{}' (pid={})", server.name, proc->Pid());

        while (!stopRequested.load()) {
            pollfd pfds[3] = {
                {outFd, POLLIN, 0},
                {errFd, POLLIN, 0},
                {wakeFd, POLLIN, 0},
            };
            int rc = ::poll(pfds, 3, -1);
            if (rc < 0) {
                if (errno == EINTR) {
                    continue;
                }
                const int err = errno;
                OnReaderFailure(std::format("poll on server pipes failed: {}", ::strerror(err)));
                break;
            }
            if (pfds[2].revents & POLLIN) {
                DrainWake();
            }
            if (errFd >= 0 && (pfds[1].revents & (POLLIN | POLLHUP | POLLERR))) {
                if (!ReadStderr(errFd, errBuffer, chunk)) {
                    errFd = -1;
                }
            }
            if (pfds[0].revents & (POLLIN | POLLHUP | POLLERR)) {
                ssize_t n = 0;
                do {
                    n = ::read(outFd, chunk.data(), chunk.size());
                } while (n < 0 && errno == EINTR);
                if (n > 0) {
                    outBuffer.Append(chunk.data(), static_cast<std::size_t>(n));
                    DispatchLines(outBuffer);
                    continue;
                }
                std::string reason = (n == 0) ? std::string("server closed its stdout")
                                              : std::format("reading server stdout failed: {}", ::strerror(errno));
                if (!stopRequested.load()) {
                    DrainStderr(errFd, errBuffer, chunk);
                    if (!proc->IsRunning()) {
                        if (std::optional<int> code = proc->ExitCode()) {
                            reason += std::format(" (exit code {})", *code);
                        }
                    }
                    OnReaderFailure(reason);
                }
                break;
            }
        }
        LOG_DEBUG("Reader for '{}' stopped", server.name);
    }
};

////////////////////////////////////////// Session //////////////////////////////////////////
Session::Session(ServerConfig server, SessionOptions options)
    : pImpl(std::make_shared<Impl>(std::move(server), std::move(options))) {}

Session::~Session() {
    Close();
}

void Session::Start() {
    FUNC_SCOPE();
    {
        std::lock_guard<std::mutex> lock(pImpl->stateMutex);
        if (pImpl->state != SessionState::Unstarted) {
            throw errors::SessionNotReadyError(
                std::format("session cannot start from state {}", ToString(pImpl->state)));
        }
        pImpl->state = SessionState::Initializing;
    }
    LOG_INFO("Starting MCP session with '{}' ({})", pImpl->server.name, pImpl->server.command);
    try {
        pImpl->Launch();
        pImpl->Handshake();
    } catch (...) {
        pImpl->AbortStart(std::current_exception());
        throw;
    }
}

void Session::Close() {
    FUNC_SCOPE();
    {
        std::lock_guard<std::mutex> lock(pImpl->closeMutex);
        if (pImpl->closeCalled) {
            return;
        }
        pImpl->closeCalled = true;
    }
    SessionState previous;
    {
        std::lock_guard<std::mutex> lock(pImpl->stateMutex);
        previous = pImpl->state;
        if (previous != SessionState::Closed && previous != SessionState::Failed) {
            pImpl->state = SessionState::Closed;
        }
    }
    if (previous != SessionState::Unstarted) {
        LOG_INFO("Closing session with '{}' (was {})", pImpl->server.name, ToString(previous));
    }
    pImpl->correlator.FailAll(std::make_exception_ptr(SessionClosedError("session closed")));
    pImpl->Teardown();
}

SessionState Session::State() const {
    std::lock_guard<std::mutex> lock(pImpl->stateMutex);
    return pImpl->state;
}

std::exception_ptr Session::FailureCause() const {
    std::lock_guard<std::mutex> lock(pImpl->stateMutex);
    return pImpl->failureCause;
}

std::optional<InitializeResult> Session::GetInitializeResult() const {
    std::lock_guard<std::mutex> lock(pImpl->stateMutex);
    return pImpl->initResult;
}

const ServerConfig& Session::Server() const { return pImpl->server; }
const SessionOptions& Session::Options() const { return pImpl->options; }

JSONRPCResponse Session::SendRequest(const std::string& method, std::optional<JSONValue> params,
                                     std::optional<std::chrono::milliseconds> timeout) {
    FUNC_SCOPE();
    pImpl->RequireReady();
    return pImpl->RoundTrip(method, std::move(params), timeout.value_or(pImpl->options.requestTimeout));
}

void Session::SendNotification(const std::string& method, std::optional<JSONValue> params) {
    pImpl->RequireReady();
    pImpl->WriteMessage(JSONRPCNotification(method, std::move(params)));
}

void Session::SetNotificationHandler(const std::string& method, NotificationHandler handler) {
    std::lock_guard<std::mutex> lock(pImpl->handlersMutex);
    if (handler) {
        pImpl->handlers[method] = std::move(handler);
    } else {
        pImpl->handlers.erase(method);
    }
}

uint64_t Session::ToolListGeneration() const {
    return pImpl->toolListGeneration.load();
}

std::size_t Session::PendingRequests() const {
    return pImpl->correlator.PendingCount();
}

} // namespace mcpsession
