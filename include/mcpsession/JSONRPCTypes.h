//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONRPCTypes.h
// Purpose: JSON value model and JSON-RPC 2.0 message types for the MCP session client
//==========================================================================================================

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace mcpsession {

//==========================================================================================================
// JSONValue
// Purpose: Simplified JSON representation backed by std::variant and shared_ptr graphs.
// Fields:
//   Array: vector<shared_ptr<JSONValue>> representing a JSON array.
//   Object: unordered_map<string, shared_ptr<JSONValue>> representing a JSON object.
//   value: variant holding nullptr, bool, int64_t, double, string, Array, or Object.
// Notes:
//   Equality is structural (deep), not pointer identity.
//==========================================================================================================
struct JSONValue {
    using Array = std::vector<std::shared_ptr<JSONValue>>;
    using Object = std::unordered_map<std::string, std::shared_ptr<JSONValue>>;

    std::variant<
        std::nullptr_t,
        bool,
        int64_t,
        double,
        std::string,
        Array,
        Object
    > value;

    JSONValue();
    JSONValue(const JSONValue&);
    JSONValue(JSONValue&&) noexcept;
    JSONValue& operator=(const JSONValue&);
    JSONValue& operator=(JSONValue&&) noexcept;
    ~JSONValue();

    explicit JSONValue(std::nullptr_t);
    explicit JSONValue(bool v);
    explicit JSONValue(int64_t v);
    explicit JSONValue(double v);
    explicit JSONValue(const char* s);
    explicit JSONValue(const std::string& s);
    explicit JSONValue(std::string&& s);
    explicit JSONValue(const Array& a);
    explicit JSONValue(Array&& a);
    explicit JSONValue(const Object& o);
    explicit JSONValue(Object&& o);

    auto& get() { return value; }
    const auto& get() const { return value; }

    bool IsObject() const { return std::holds_alternative<Object>(value); }
    bool IsArray() const { return std::holds_alternative<Array>(value); }
    bool IsString() const { return std::holds_alternative<std::string>(value); }
    bool IsNull() const { return std::holds_alternative<std::nullptr_t>(value); }
};

bool operator==(const JSONValue& a, const JSONValue& b);
inline bool operator!=(const JSONValue& a, const JSONValue& b) { return !(a == b); }

//==========================================================================================================
// ParseJSONValue
// Purpose: Strict JSON parser. The whole input must be one JSON value (surrounding whitespace allowed).
// Args:
//   json: UTF-8 JSON text.
// Returns:
//   Parsed JSONValue.
// Throws:
//   std::runtime_error describing the first syntax error (including truncated input).
//==========================================================================================================
JSONValue ParseJSONValue(const std::string& json);

//==========================================================================================================
// SerializeJSONValue
// Purpose: Compact JSON serialization (no insignificant whitespace). Object member order is unspecified.
//==========================================================================================================
std::string SerializeJSONValue(const JSONValue& value);

//==========================================================================================================
// FindMember
// Purpose: Returns the member named key when v is an object that carries it; nullptr otherwise.
//==========================================================================================================
const JSONValue* FindMember(const JSONValue& v, const std::string& key);

// Returns the string member or std::nullopt when absent or not a string.
std::optional<std::string> GetStringMember(const JSONValue& v, const std::string& key);

//==========================================================================================================
// JSONRPCId
// Purpose: JSON-RPC 2.0 id variant: string, integer, or null. This client only issues integers.
//==========================================================================================================
using JSONRPCId = std::variant<std::string, int64_t, std::nullptr_t>;

std::string IdToString(const JSONRPCId& id);

//==========================================================================================================
// JSONRPCMessage
// Purpose: Abstract base for JSON-RPC 2.0 messages providing serialization APIs.
// Methods:
//   ToJSON(): Structured form, always carrying "jsonrpc":"2.0".
//   Serialize(): Compact JSON string (no trailing newline; framing belongs to the codec).
//==========================================================================================================
class JSONRPCMessage {
public:
    std::string jsonrpc = "2.0";

    virtual ~JSONRPCMessage() = default;
    virtual JSONValue ToJSON() const = 0;
    std::string Serialize() const { return SerializeJSONValue(ToJSON()); }
};

//==========================================================================================================
// JSONRPCRequest
// Purpose: JSON-RPC 2.0 request message with id, method, and optional params.
//==========================================================================================================
class JSONRPCRequest : public JSONRPCMessage {
public:
    JSONRPCId id;
    std::string method;
    std::optional<JSONValue> params;

    JSONRPCRequest() = default;
    JSONRPCRequest(JSONRPCId id, std::string method, std::optional<JSONValue> params = std::nullopt)
        : id(std::move(id)), method(std::move(method)), params(std::move(params)) {}

    JSONValue ToJSON() const override;
};

//==========================================================================================================
// JSONRPCResponse
// Purpose: JSON-RPC 2.0 response message carrying either result or error.
// Ctors:
//   JSONRPCResponse(id, result): Success response with result set.
//   JSONRPCResponse(id, error, /*isError*/): Error response with error set.
//==========================================================================================================
class JSONRPCResponse : public JSONRPCMessage {
public:
    JSONRPCId id;
    std::optional<JSONValue> result;
    std::optional<JSONValue> error;

    JSONRPCResponse() = default;
    JSONRPCResponse(JSONRPCId id, JSONValue result)
        : id(std::move(id)), result(std::move(result)) {}
    JSONRPCResponse(JSONRPCId id, JSONValue error, bool /*isError*/)
        : id(std::move(id)), error(std::move(error)) {}

    JSONValue ToJSON() const override;

    bool IsError() const { return error.has_value(); }
};

//==========================================================================================================
// JSONRPCNotification
// Purpose: JSON-RPC 2.0 notification (no id, no response).
//==========================================================================================================
class JSONRPCNotification : public JSONRPCMessage {
public:
    std::string method;
    std::optional<JSONValue> params;

    JSONRPCNotification() = default;
    JSONRPCNotification(std::string method, std::optional<JSONValue> params = std::nullopt)
        : method(std::move(method)), params(std::move(params)) {}

    JSONValue ToJSON() const override;
};

bool operator==(const JSONRPCRequest& a, const JSONRPCRequest& b);
bool operator==(const JSONRPCResponse& a, const JSONRPCResponse& b);
bool operator==(const JSONRPCNotification& a, const JSONRPCNotification& b);

//==========================================================================================================
// JSONRPCErrorCodes
// Purpose: Standard JSON-RPC 2.0 error codes.
//==========================================================================================================
namespace JSONRPCErrorCodes {
    constexpr int ParseError = -32700;
    constexpr int InvalidRequest = -32600;
    constexpr int MethodNotFound = -32601;
    constexpr int InvalidParams = -32602;
    constexpr int InternalError = -32603;
}

//==========================================================================================================
// CreateErrorObject
// Purpose: Build a JSON error object with shape { code, message, data? }.
//==========================================================================================================
JSONValue CreateErrorObject(int code, const std::string& message,
                            const std::optional<JSONValue>& data = std::nullopt);

//==========================================================================================================
// CreateErrorResponse
// Purpose: Convenience to wrap an error object into a JSONRPCResponse with the given id.
//==========================================================================================================
std::unique_ptr<JSONRPCResponse> CreateErrorResponse(
    const JSONRPCId& id, int code, const std::string& message,
    const std::optional<JSONValue>& data = std::nullopt);

} // namespace mcpsession
