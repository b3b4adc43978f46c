//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: MessageCodec.h
// Purpose: Newline-delimited JSON-RPC framing: message encode/decode and incremental line buffering
//==========================================================================================================

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <variant>

#include "mcpsession/JSONRPCTypes.h"

namespace mcpsession {

//==========================================================================================================
// Message
// Purpose: One decoded wire message. Exactly one of the three JSON-RPC shapes.
//==========================================================================================================
using Message = std::variant<JSONRPCRequest, JSONRPCNotification, JSONRPCResponse>;

//==========================================================================================================
// MessageCodec
// Purpose: Stateless conversion between Message values and newline-terminated compact JSON lines.
//==========================================================================================================
class MessageCodec {
public:
    //==========================================================================================================
    // Encode
    // Purpose: Serializes a message to compact JSON followed by exactly one '\n'.
    // Args:
    //   message: Request, Notification, or Response.
    // Returns:
    //   Bytes ready to be written to the peer; always carries "jsonrpc":"2.0".
    //==========================================================================================================
    static std::string Encode(const Message& message);
    static std::string Encode(const JSONRPCMessage& message);

    //==========================================================================================================
    // Decode
    // Purpose: Parses one line (without its terminator) and validates its JSON-RPC 2.0 shape.
    // Args:
    //   line: A single line; a trailing '\r' is tolerated.
    // Returns:
    //   The decoded Message.
    // Throws:
    //   errors::MalformedMessageError for invalid JSON, a missing or wrong "jsonrpc" member, or a shape
    //   that is neither Request, Notification, nor Response.
    //==========================================================================================================
    static Message Decode(const std::string& line);
};

//==========================================================================================================
// LineBuffer
// Purpose: Accumulates bytes that arrive in arbitrary chunks and yields complete '\n'-terminated lines.
// Notes:
//   - Blank lines are skipped; a trailing '\r' is stripped.
//   - A line longer than maxLineBytes is discarded up to its terminator and reported once by NextLine()
//     throwing MalformedMessageError; the buffer remains usable afterwards.
//   - Not thread-safe; owned by the single reader loop.
//==========================================================================================================
class LineBuffer {
public:
    static constexpr std::size_t DefaultMaxLineBytes = 4 * 1024 * 1024;

    explicit LineBuffer(std::size_t maxLineBytes = DefaultMaxLineBytes);

    void Append(const char* data, std::size_t size);
    void Append(const std::string& data) { Append(data.data(), data.size()); }

    //==========================================================================================================
    // NextLine
    // Purpose: Extracts the next complete, non-blank line.
    // Returns:
    //   The line without terminator, or std::nullopt when no complete line is buffered yet.
    // Throws:
    //   errors::MalformedMessageError when an oversized line was dropped.
    //==========================================================================================================
    std::optional<std::string> NextLine();

    // Bytes held for an incomplete line.
    std::size_t Buffered() const { return buffer.size(); }

private:
    std::string buffer;
    std::size_t scanFrom{0};
    std::size_t maxLineBytes;
    bool discarding{false};
};

} // namespace mcpsession
