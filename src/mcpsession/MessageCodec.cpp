//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: MessageCodec.cpp
// Purpose: Newline-delimited JSON-RPC framing implementation
//==========================================================================================================

#include <format>
#include <stdexcept>

#include "mcpsession/MessageCodec.h"
#include "mcpsession/errors/Errors.h"

namespace mcpsession {

namespace {

using errors::MalformedMessageError;

JSONRPCId decodeId(const JSONValue& idVal, bool allowNull) {
    if (std::holds_alternative<int64_t>(idVal.value)) {
        return std::get<int64_t>(idVal.value);
    }
    if (std::holds_alternative<std::string>(idVal.value)) {
        return std::get<std::string>(idVal.value);
    }
    if (allowNull && std::holds_alternative<std::nullptr_t>(idVal.value)) {
        return nullptr;
    }
    throw MalformedMessageError("id must be an integer or a string");
}

std::optional<JSONValue> decodeParams(const JSONValue& obj) {
    const JSONValue* params = FindMember(obj, "params");
    if (params == nullptr) {
        return std::nullopt;
    }
    if (!params->IsObject() && !params->IsArray()) {
        throw MalformedMessageError("params must be an object or an array");
    }
    return *params;
}

Message decodeCall(const JSONValue& obj, const JSONValue& methodVal) {
    if (!methodVal.IsString() || std::get<std::string>(methodVal.value).empty()) {
        throw MalformedMessageError("method must be a non-empty string");
    }
    if (FindMember(obj, "result") != nullptr || FindMember(obj, "error") != nullptr) {
        throw MalformedMessageError("message carries both method and result/error");
    }
    std::string method = std::get<std::string>(methodVal.value);
    std::optional<JSONValue> params = decodeParams(obj);

    if (const JSONValue* idVal = FindMember(obj, "id")) {
        return JSONRPCRequest(decodeId(*idVal, false), std::move(method), std::move(params));
    }
    return JSONRPCNotification(std::move(method), std::move(params));
}

Message decodeResponse(const JSONValue& obj) {
    const JSONValue* idVal = FindMember(obj, "id");
    if (idVal == nullptr) {
        throw MalformedMessageError("message has neither method nor id");
    }
    const JSONValue* result = FindMember(obj, "result");
    const JSONValue* error = FindMember(obj, "error");
    if ((result == nullptr) == (error == nullptr)) {
        throw MalformedMessageError("response must carry exactly one of result or error");
    }

    JSONRPCResponse response;
    // A null id is legal only on error responses (the peer could not read the request id)
    response.id = decodeId(*idVal, error != nullptr);
    if (result != nullptr) {
        response.result = *result;
        return response;
    }
    if (!errors::mcpErrorFromErrorValue(*error).has_value()) {
        throw MalformedMessageError("error must be an object with integer code and string message");
    }
    response.error = *error;
    return response;
}

} // namespace

std::string MessageCodec::Encode(const JSONRPCMessage& message) {
    std::string bytes = message.Serialize();
    bytes.push_back('\n');
    return bytes;
}

std::string MessageCodec::Encode(const Message& message) {
    return std::visit([](const auto& m) { return Encode(static_cast<const JSONRPCMessage&>(m)); }, message);
}

Message MessageCodec::Decode(const std::string& line) {
    std::string text = line;
    if (!text.empty() && text.back() == '\r') {
        text.pop_back();
    }

    JSONValue root;
    try {
        root = ParseJSONValue(text);
    } catch (const std::runtime_error& e) {
        throw MalformedMessageError(std::format("invalid JSON: {}", e.what()));
    }
    if (!root.IsObject()) {
        throw MalformedMessageError("message is not a JSON object");
    }

    const JSONValue* version = FindMember(root, "jsonrpc");
    if (version == nullptr) {
        throw MalformedMessageError("missing jsonrpc member");
    }
    if (!version->IsString() || std::get<std::string>(version->value) != "2.0") {
        throw MalformedMessageError(std::format("unsupported jsonrpc version {}", SerializeJSONValue(*version)));
    }

    if (const JSONValue* method = FindMember(root, "method")) {
        return decodeCall(root, *method);
    }
    return decodeResponse(root);
}

LineBuffer::LineBuffer(std::size_t maxLineBytes)
    : maxLineBytes(maxLineBytes == 0 ? DefaultMaxLineBytes : maxLineBytes) {}

void LineBuffer::Append(const char* data, std::size_t size) {
    buffer.append(data, size);
}

std::optional<std::string> LineBuffer::NextLine() {
    while (true) {
        std::size_t eol = buffer.find('\n', scanFrom);
        if (discarding) {
            if (eol == std::string::npos) {
                buffer.clear();
                scanFrom = 0;
                return std::nullopt;
            }
            buffer.erase(0, eol + 1);
            scanFrom = 0;
            discarding = false;
            continue;
        }
        if (eol == std::string::npos) {
            if (buffer.size() > maxLineBytes) {
                std::size_t dropped = buffer.size();
                buffer.clear();
                scanFrom = 0;
                discarding = true;
                throw errors::MalformedMessageError(
                    std::format("line exceeds {} bytes (dropped {} buffered bytes)", maxLineBytes, dropped));
            }
            scanFrom = buffer.size();
            return std::nullopt;
        }

        std::string line = buffer.substr(0, eol);
        buffer.erase(0, eol + 1);
        scanFrom = 0;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.size() > maxLineBytes) {
            throw errors::MalformedMessageError(std::format("line exceeds {} bytes ({} bytes)", maxLineBytes, line.size()));
        }
        if (line.find_first_not_of(" \t") == std::string::npos) {
            continue;
        }
        return line;
    }
}

} // namespace mcpsession
