//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONParser.cpp
// Purpose: Strict JSON parser/serializer and JSON-RPC message serialization using only std library
//==========================================================================================================

#include <cctype>
#include <cmath>
#include <format>
#include <limits>
#include <stdexcept>

#include "mcpsession/JSONRPCTypes.h"
#include "logging/Logger.h"

namespace mcpsession {

//----------------------------------------------------------------------------------------------------------
// JSONValue special members (out-of-line definitions)
//----------------------------------------------------------------------------------------------------------
JSONValue::JSONValue() : value(nullptr) {}
JSONValue::JSONValue(const JSONValue&) = default;
JSONValue::JSONValue(JSONValue&&) noexcept = default;
JSONValue& JSONValue::operator=(const JSONValue&) = default;
JSONValue& JSONValue::operator=(JSONValue&&) noexcept = default;
JSONValue::~JSONValue() {}

JSONValue::JSONValue(std::nullptr_t) : value(nullptr) {}
JSONValue::JSONValue(bool v) : value(v) {}
JSONValue::JSONValue(int64_t v) : value(v) {}
JSONValue::JSONValue(double v) : value(v) {}
JSONValue::JSONValue(const char* s) : value(std::string(s ? s : "")) {}
JSONValue::JSONValue(const std::string& s) : value(s) {}
JSONValue::JSONValue(std::string&& s) : value(std::move(s)) {}
JSONValue::JSONValue(const Array& a) : value(a) {}
JSONValue::JSONValue(Array&& a) : value(std::move(a)) {}
JSONValue::JSONValue(const Object& o) : value(o) {}
JSONValue::JSONValue(Object&& o) : value(std::move(o)) {}

bool operator==(const JSONValue& a, const JSONValue& b) {
    if (a.value.index() != b.value.index()) {
        return false;
    }
    return std::visit([&b](const auto& lhs) -> bool {
        using T = std::decay_t<decltype(lhs)>;
        const auto& rhs = std::get<T>(b.value);
        if constexpr (std::is_same_v<T, JSONValue::Array>) {
            if (lhs.size() != rhs.size()) return false;
            for (std::size_t i = 0; i < lhs.size(); ++i) {
                const JSONValue null;
                const JSONValue& l = lhs[i] ? *lhs[i] : null;
                const JSONValue& r = rhs[i] ? *rhs[i] : null;
                if (l != r) return false;
            }
            return true;
        } else if constexpr (std::is_same_v<T, JSONValue::Object>) {
            if (lhs.size() != rhs.size()) return false;
            for (const auto& [key, val] : lhs) {
                auto it = rhs.find(key);
                if (it == rhs.end()) return false;
                const JSONValue null;
                const JSONValue& l = val ? *val : null;
                const JSONValue& r = it->second ? *it->second : null;
                if (l != r) return false;
            }
            return true;
        } else {
            return lhs == rhs;
        }
    }, a.value);
}

// -------------------------------
// Strict recursive JSON parser
// -------------------------------
namespace {

constexpr int MaxNestingDepth = 256;

void appendUtf8(std::string& out, unsigned int code) {
    if (code <= 0x7F) {
        out.push_back(static_cast<char>(code));
    } else if (code <= 0x7FF) {
        out.push_back(static_cast<char>(0xC0 | ((code >> 6) & 0x1F)));
        out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
    } else if (code <= 0xFFFF) {
        out.push_back(static_cast<char>(0xE0 | ((code >> 12) & 0x0F)));
        out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | ((code >> 18) & 0x07)));
        out.push_back(static_cast<char>(0x80 | ((code >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
    }
}

struct JsonParser {
    const std::string& s;
    std::size_t i{0};
    int depth{0};

    explicit JsonParser(const std::string& str) : s(str) {}

    [[noreturn]] void fail(const std::string& what) const {
        throw std::runtime_error(std::format("{} at offset {}", what, i));
    }

    void skipWs() {
        while (i < s.size()) {
            char c = s[i];
            if (c == ' ' || c == '\t' || c == '\r' || c == '\n') { ++i; } else { break; }
        }
    }

    bool match(char c) {
        skipWs();
        if (i < s.size() && s[i] == c) { ++i; return true; }
        return false;
    }

    unsigned int parseHex4() {
        if (i + 4 > s.size()) fail("Truncated unicode escape");
        unsigned int code = 0;
        for (int k = 0; k < 4; ++k) {
            char h = s[i++];
            code <<= 4;
            if (h >= '0' && h <= '9') code += static_cast<unsigned int>(h - '0');
            else if (h >= 'a' && h <= 'f') code += 10u + static_cast<unsigned int>(h - 'a');
            else if (h >= 'A' && h <= 'F') code += 10u + static_cast<unsigned int>(h - 'A');
            else fail("Invalid hex in unicode escape");
        }
        return code;
    }

    std::string parseString() {
        skipWs();
        if (i >= s.size() || s[i] != '"') fail("Expected '\"' at string start");
        ++i;
        std::string out;
        while (true) {
            if (i >= s.size()) fail("Unterminated string");
            char c = s[i++];
            if (c == '"') break;
            if (static_cast<unsigned char>(c) < 0x20) fail("Unescaped control character in string");
            if (c != '\\') {
                out.push_back(c);
                continue;
            }
            if (i >= s.size()) fail("Truncated escape");
            char e = s[i++];
            switch (e) {
                case '"': out.push_back('"'); break;
                case '\\': out.push_back('\\'); break;
                case '/': out.push_back('/'); break;
                case 'b': out.push_back('\b'); break;
                case 'f': out.push_back('\f'); break;
                case 'n': out.push_back('\n'); break;
                case 'r': out.push_back('\r'); break;
                case 't': out.push_back('\t'); break;
                case 'u': {
                    unsigned int code = parseHex4();
                    if (code >= 0xD800 && code <= 0xDBFF) {
                        // High surrogate must be followed by an escaped low surrogate
                        if (i + 2 <= s.size() && s[i] == '\\' && s[i + 1] == 'u') {
                            i += 2;
                            unsigned int low = parseHex4();
                            if (low < 0xDC00 || low > 0xDFFF) fail("Invalid low surrogate");
                            code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
                        } else {
                            fail("Unpaired high surrogate");
                        }
                    } else if (code >= 0xDC00 && code <= 0xDFFF) {
                        fail("Unpaired low surrogate");
                    }
                    appendUtf8(out, code);
                    break;
                }
                default: fail("Unknown escape");
            }
        }
        return out;
    }

    JSONValue parseNumber() {
        std::size_t start = i;
        if (i < s.size() && s[i] == '-') ++i;
        std::size_t intStart = i;
        while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        if (i == intStart) fail("Invalid number");
        if (s[intStart] == '0' && i - intStart > 1) fail("Leading zero in number");
        bool isFloat = false;
        if (i < s.size() && s[i] == '.') {
            isFloat = true; ++i;
            std::size_t fracStart = i;
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
            if (i == fracStart) fail("Missing fraction digits");
        }
        if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
            isFloat = true; ++i;
            if (i < s.size() && (s[i] == '-' || s[i] == '+')) ++i;
            std::size_t expStart = i;
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
            if (i == expStart) fail("Missing exponent digits");
        }
        std::string num = s.substr(start, i - start);
        if (!isFloat) {
            try {
                return JSONValue(static_cast<int64_t>(std::stoll(num)));
            } catch (const std::out_of_range&) {
                // Integers beyond int64 degrade to double like most JSON libraries
            }
        }
        try {
            return JSONValue(std::stod(num));
        } catch (const std::out_of_range&) {
            fail("Number out of range");
        }
    }

    JSONValue parseArray() {
        ++i; // '['
        if (++depth > MaxNestingDepth) fail("Nesting too deep");
        JSONValue::Array arr;
        if (match(']')) { --depth; return JSONValue(std::move(arr)); }
        while (true) {
            arr.push_back(std::make_shared<JSONValue>(parseValue()));
            if (match(']')) break;
            if (!match(',')) fail("Expected ',' or ']' in array");
        }
        --depth;
        return JSONValue(std::move(arr));
    }

    JSONValue parseObject() {
        ++i; // '{'
        if (++depth > MaxNestingDepth) fail("Nesting too deep");
        JSONValue::Object obj;
        if (match('}')) { --depth; return JSONValue(std::move(obj)); }
        while (true) {
            std::string key = parseString();
            if (!match(':')) fail("Expected ':' after key");
            obj[key] = std::make_shared<JSONValue>(parseValue());
            if (match('}')) break;
            if (!match(',')) fail("Expected ',' or '}' in object");
        }
        --depth;
        return JSONValue(std::move(obj));
    }

    JSONValue parseValue() {
        skipWs();
        if (i >= s.size()) fail("Unexpected end of JSON");
        char c = s[i];
        if (c == '"') return JSONValue(parseString());
        if (c == '{') return parseObject();
        if (c == '[') return parseArray();
        if (s.compare(i, 4, "true") == 0) { i += 4; return JSONValue(true); }
        if (s.compare(i, 5, "false") == 0) { i += 5; return JSONValue(false); }
        if (s.compare(i, 4, "null") == 0) { i += 4; return JSONValue(nullptr); }
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) return parseNumber();
        fail(std::format("Unexpected character '{}'", c));
    }
};

void appendEscaped(std::string& out, const std::string& v) {
    out.push_back('"');
    for (char c : v) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out += std::format("\\u{:04x}", static_cast<unsigned int>(static_cast<unsigned char>(c)));
                } else {
                    out.push_back(c);
                }
                break;
        }
    }
    out.push_back('"');
}

void appendValue(std::string& out, const JSONValue& value) {
    std::visit([&out](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            out += "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            out += v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            out += std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
            if (!std::isfinite(v)) {
                out += "null";
                return;
            }
            // Shortest round-trip form; keep a fraction so the value re-parses as a double
            std::string num = std::format("{}", v);
            if (num.find_first_of(".eE") == std::string::npos) {
                num += ".0";
            }
            out += num;
        } else if constexpr (std::is_same_v<T, std::string>) {
            appendEscaped(out, v);
        } else if constexpr (std::is_same_v<T, JSONValue::Array>) {
            out.push_back('[');
            for (std::size_t i = 0; i < v.size(); ++i) {
                if (i > 0) out.push_back(',');
                if (v[i]) appendValue(out, *v[i]); else out += "null";
            }
            out.push_back(']');
        } else if constexpr (std::is_same_v<T, JSONValue::Object>) {
            out.push_back('{');
            bool first = true;
            for (const auto& [key, val] : v) {
                if (!first) out.push_back(',');
                first = false;
                appendEscaped(out, key);
                out.push_back(':');
                if (val) appendValue(out, *val); else out += "null";
            }
            out.push_back('}');
        }
    }, value.get());
}

JSONValue idToJSON(const JSONRPCId& id) {
    return std::visit([](const auto& v) -> JSONValue {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return JSONValue(v);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return JSONValue(v);
        } else {
            return JSONValue(nullptr);
        }
    }, id);
}

} // namespace

JSONValue ParseJSONValue(const std::string& json) {
    JsonParser p(json);
    JSONValue v = p.parseValue();
    p.skipWs();
    if (p.i != json.size()) {
        p.fail("Trailing characters after JSON value");
    }
    return v;
}

std::string SerializeJSONValue(const JSONValue& value) {
    std::string out;
    appendValue(out, value);
    return out;
}

const JSONValue* FindMember(const JSONValue& v, const std::string& key) {
    if (!std::holds_alternative<JSONValue::Object>(v.value)) {
        return nullptr;
    }
    const auto& obj = std::get<JSONValue::Object>(v.value);
    auto it = obj.find(key);
    if (it == obj.end() || !it->second) {
        return nullptr;
    }
    return it->second.get();
}

std::optional<std::string> GetStringMember(const JSONValue& v, const std::string& key) {
    const JSONValue* m = FindMember(v, key);
    if (m == nullptr || !std::holds_alternative<std::string>(m->value)) {
        return std::nullopt;
    }
    return std::get<std::string>(m->value);
}

std::string IdToString(const JSONRPCId& id) {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return "\"" + v + "\"";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return std::to_string(v);
        } else {
            return "null";
        }
    }, id);
}

// JSONRPCRequest implementation
JSONValue JSONRPCRequest::ToJSON() const {
    JSONValue::Object obj;
    obj["jsonrpc"] = std::make_shared<JSONValue>(jsonrpc);
    obj["id"] = std::make_shared<JSONValue>(idToJSON(id));
    obj["method"] = std::make_shared<JSONValue>(method);
    if (params.has_value()) {
        obj["params"] = std::make_shared<JSONValue>(params.value());
    }
    return JSONValue(std::move(obj));
}

// JSONRPCResponse implementation
JSONValue JSONRPCResponse::ToJSON() const {
    JSONValue::Object obj;
    obj["jsonrpc"] = std::make_shared<JSONValue>(jsonrpc);
    obj["id"] = std::make_shared<JSONValue>(idToJSON(id));
    if (error.has_value()) {
        obj["error"] = std::make_shared<JSONValue>(error.value());
    } else {
        obj["result"] = std::make_shared<JSONValue>(result.value_or(JSONValue{}));
    }
    return JSONValue(std::move(obj));
}

// JSONRPCNotification implementation
JSONValue JSONRPCNotification::ToJSON() const {
    JSONValue::Object obj;
    obj["jsonrpc"] = std::make_shared<JSONValue>(jsonrpc);
    obj["method"] = std::make_shared<JSONValue>(method);
    if (params.has_value()) {
        obj["params"] = std::make_shared<JSONValue>(params.value());
    }
    return JSONValue(std::move(obj));
}

bool operator==(const JSONRPCRequest& a, const JSONRPCRequest& b) {
    return a.jsonrpc == b.jsonrpc && a.id == b.id && a.method == b.method && a.params == b.params;
}

bool operator==(const JSONRPCResponse& a, const JSONRPCResponse& b) {
    return a.jsonrpc == b.jsonrpc && a.id == b.id && a.result == b.result && a.error == b.error;
}

bool operator==(const JSONRPCNotification& a, const JSONRPCNotification& b) {
    return a.jsonrpc == b.jsonrpc && a.method == b.method && a.params == b.params;
}

// Utility functions
JSONValue CreateErrorObject(int code, const std::string& message,
                            const std::optional<JSONValue>& data) {
    FUNC_SCOPE();
    JSONValue::Object errorObj;
    errorObj["code"] = std::make_shared<JSONValue>(static_cast<int64_t>(code));
    errorObj["message"] = std::make_shared<JSONValue>(message);
    if (data.has_value()) {
        errorObj["data"] = std::make_shared<JSONValue>(data.value());
    }
    return JSONValue(std::move(errorObj));
}

std::unique_ptr<JSONRPCResponse> CreateErrorResponse(
    const JSONRPCId& id, int code, const std::string& message,
    const std::optional<JSONValue>& data) {
    FUNC_SCOPE();
    auto response = std::make_unique<JSONRPCResponse>();
    response->id = id;
    response->error = CreateErrorObject(code, message, data);
    return response;
}

} // namespace mcpsession
