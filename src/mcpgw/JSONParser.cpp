//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONParser.cpp
// Purpose: Recursive-descent JSON parser/serializer and JSON-RPC envelope (de)serialization
//==========================================================================================================

#include <charconv>
#include <cmath>
#include <cstdlib>
#include <format>
#include <sstream>
#include <stdexcept>
#include <iomanip>
#include "mcpgw/JSONRPCTypes.h"
#include "logging/Logger.h"


namespace mcpgw {

//----------------------------------------------------------------------------------------------------------
// JSONValue special members (out-of-line definitions)
//----------------------------------------------------------------------------------------------------------
JSONValue::JSONValue() : value(nullptr) {}
JSONValue::JSONValue(const JSONValue&) = default;
JSONValue::JSONValue(JSONValue&&) = default;
JSONValue& JSONValue::operator=(const JSONValue&) = default;
JSONValue& JSONValue::operator=(JSONValue&&) = default;
JSONValue::~JSONValue() {}

// Explicit constructors
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

// -------------------------------
// Recursive JSON parser
// -------------------------------
namespace {
constexpr unsigned int kMaxDepth = 128u;

struct JsonParser {
    const std::string& s;
    std::size_t i{0};
    unsigned int depth{0};

    explicit JsonParser(const std::string& str, std::size_t start = 0) : s(str), i(start) {}

    [[noreturn]] void fail(const char* what) const {
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
        if (i + 4 > s.size()) fail("Invalid unicode escape");
        unsigned int code = 0;
        for (std::size_t k = 0; k < 4; ++k) {
            char h = s[i++];
            code <<= 4;
            if (h >= '0' && h <= '9') code += static_cast<unsigned int>(h - '0');
            else if (h >= 'a' && h <= 'f') code += 10u + static_cast<unsigned int>(h - 'a');
            else if (h >= 'A' && h <= 'F') code += 10u + static_cast<unsigned int>(h - 'A');
            else fail("Invalid hex in unicode escape");
        }
        return code;
    }

    static void appendUtf8(std::string& out, unsigned int code) {
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

    std::string parseString() {
        skipWs();
        if (i >= s.size() || s[i] != '"') fail("Expected '\"' at string start");
        ++i; // skip opening quote
        std::string out;
        bool closed = false;
        while (i < s.size()) {
            char c = s[i++];
            if (c == '"') { closed = true; break; }
            if (static_cast<unsigned char>(c) < 0x20) fail("Unescaped control character in string");
            if (c == '\\') {
                if (i >= s.size()) fail("Invalid escape");
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
                        // Surrogate pair: high surrogate must be followed by \uDC00-\uDFFF
                        if (code >= 0xD800 && code <= 0xDBFF) {
                            if (i + 2 <= s.size() && s[i] == '\\' && s[i + 1] == 'u') {
                                i += 2;
                                unsigned int low = parseHex4();
                                if (low < 0xDC00 || low > 0xDFFF) fail("Invalid low surrogate");
                                code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
                            } else {
                                fail("Unpaired high surrogate");
                            }
                        }
                        appendUtf8(out, code);
                        break;
                    }
                    default: fail("Unknown escape");
                }
            } else {
                out.push_back(c);
            }
        }
        if (!closed) fail("Unterminated string");
        return out;
    }

    JSONValue parseNumber() {
        skipWs();
        std::size_t start = i;
        auto digits = [&]() {
            std::size_t d0 = i;
            while (i < s.size() && s[i] >= '0' && s[i] <= '9') ++i;
            return i - d0;
        };
        if (i < s.size() && s[i] == '-') ++i;
        if (i < s.size() && s[i] == '0') {
            ++i;
        } else if (digits() == 0) {
            fail("Invalid number");
        }
        bool isFloat = false;
        if (i < s.size() && s[i] == '.') {
            isFloat = true; ++i;
            if (digits() == 0) fail("Invalid fraction");
        }
        if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
            isFloat = true; ++i;
            if (i < s.size() && (s[i] == '-' || s[i] == '+')) ++i;
            if (digits() == 0) fail("Invalid exponent");
        }
        const char* first = s.data() + start;
        const char* last = s.data() + i;
        if (!isFloat) {
            int64_t v = 0;
            auto [ptr, ec] = std::from_chars(first, last, v);
            if (ec == std::errc() && ptr == last) {
                return JSONValue(v);
            }
            // Out of int64 range: keep magnitude as double
        }
        std::string num(first, last);
        char* endp = nullptr;
        double d = std::strtod(num.c_str(), &endp);
        if (endp != num.c_str() + num.size()) fail("Invalid number");
        return JSONValue(d);
    }

    JSONValue parseArray() {
        if (!match('[')) fail("Expected '['");
        if (++depth > kMaxDepth) fail("Nesting too deep");
        JSONValue::Array arr;
        if (match(']')) { --depth; return JSONValue(std::move(arr)); }
        while (true) {
            JSONValue val = parseValue();
            arr.push_back(std::make_shared<JSONValue>(std::move(val)));
            if (match(']')) break;
            if (!match(',')) fail("Expected ',' in array");
        }
        --depth;
        return JSONValue(std::move(arr));
    }

    JSONValue parseObject() {
        if (!match('{')) fail("Expected '{'");
        if (++depth > kMaxDepth) fail("Nesting too deep");
        JSONValue::Object obj;
        if (match('}')) { --depth; return JSONValue(std::move(obj)); }
        while (true) {
            std::string key = parseString();
            if (!match(':')) fail("Expected ':' after key");
            JSONValue val = parseValue();
            obj[key] = std::make_shared<JSONValue>(std::move(val));
            if (match('}')) break;
            if (!match(',')) fail("Expected ',' in object");
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
        if (c == 't') {
            if (s.compare(i, 4, "true") == 0) { i += 4; return JSONValue(true); }
            fail("Invalid literal");
        }
        if (c == 'f') {
            if (s.compare(i, 5, "false") == 0) { i += 5; return JSONValue(false); }
            fail("Invalid literal");
        }
        if (c == 'n') {
            if (s.compare(i, 4, "null") == 0) { i += 4; return JSONValue(nullptr); }
            fail("Invalid literal");
        }
        if (c == '-' || (c >= '0' && c <= '9')) {
            return parseNumber();
        }
        fail("Unexpected character");
    }
};

void writeEscaped(std::ostringstream& oss, const std::string& v) {
    oss << '"';
    for (char c : v) {
        switch (c) {
            case '"': oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\b': oss << "\\b"; break;
            case '\f': oss << "\\f"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c) << std::dec;
                } else {
                    oss << c;
                }
                break;
        }
    }
    oss << '"';
}

void writeValue(std::ostringstream& oss, const JSONValue& value) {
    std::visit([&oss](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            oss << "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            oss << (v ? "true" : "false");
        } else if constexpr (std::is_same_v<T, int64_t>) {
            oss << v;
        } else if constexpr (std::is_same_v<T, double>) {
            if (std::isfinite(v)) {
                oss << std::format("{}", v);
            } else {
                oss << "null";
            }
        } else if constexpr (std::is_same_v<T, std::string>) {
            writeEscaped(oss, v);
        } else if constexpr (std::is_same_v<T, JSONValue::Array>) {
            oss << '[';
            for (size_t i = 0; i < v.size(); ++i) {
                if (i > 0) oss << ',';
                if (v[i]) { writeValue(oss, *v[i]); } else { oss << "null"; }
            }
            oss << ']';
        } else if constexpr (std::is_same_v<T, JSONValue::Object>) {
            oss << '{';
            bool first = true;
            for (const auto& [key, val] : v) {
                if (!first) oss << ',';
                first = false;
                writeEscaped(oss, key);
                oss << ':';
                if (val) { writeValue(oss, *val); } else { oss << "null"; }
            }
            oss << '}';
        }
    }, value.get());
}

void writeId(std::ostringstream& oss, const JSONRPCId& id) {
    std::visit([&oss](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) {
            writeEscaped(oss, v);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            oss << v;
        } else {
            oss << "null";
        }
    }, id);
}

// Maps a JSON id member to JSONRPCId; fails for fractional numbers, booleans and structured ids.
bool idFromJSON(const JSONValue& v, JSONRPCId& out) {
    if (std::holds_alternative<std::string>(v.value)) { out = std::get<std::string>(v.value); return true; }
    if (std::holds_alternative<int64_t>(v.value)) { out = std::get<int64_t>(v.value); return true; }
    if (std::holds_alternative<std::nullptr_t>(v.value)) { out = nullptr; return true; }
    return false;
}
} // namespace

JSONValue ParseJSON(const std::string& text) {
    FUNC_SCOPE();
    JsonParser p(text);
    JSONValue v = p.parseValue();
    p.skipWs();
    if (p.i != text.size()) {
        p.fail("Trailing characters after JSON value");
    }
    return v;
}

std::string SerializeJSON(const JSONValue& value) {
    FUNC_SCOPE();
    std::ostringstream oss;
    writeValue(oss, value);
    return oss.str();
}

const JSONValue* FindMember(const JSONValue& value, const std::string& key) {
    if (!std::holds_alternative<JSONValue::Object>(value.value)) {
        return nullptr;
    }
    const auto& obj = std::get<JSONValue::Object>(value.value);
    auto it = obj.find(key);
    if (it == obj.end() || !it->second) {
        return nullptr;
    }
    return it->second.get();
}

std::optional<std::string> GetStringMember(const JSONValue& value, const std::string& key) {
    const JSONValue* m = FindMember(value, key);
    if (m == nullptr || !std::holds_alternative<std::string>(m->value)) {
        return std::nullopt;
    }
    return std::get<std::string>(m->value);
}

void SetMember(JSONValue::Object& obj, const std::string& key, JSONValue v) {
    obj[key] = std::make_shared<JSONValue>(std::move(v));
}

std::string IdToString(const JSONRPCId& id) {
    if (std::holds_alternative<std::string>(id)) return std::get<std::string>(id);
    if (std::holds_alternative<int64_t>(id)) return std::to_string(std::get<int64_t>(id));
    return "null";
}

std::optional<JSONRPCId> IdFromJSON(const JSONValue& v) {
    JSONRPCId id;
    if (!idFromJSON(v, id)) {
        return std::nullopt;
    }
    return id;
}

// JSONRPCResponse implementation
std::string JSONRPCResponse::Serialize() const {
    FUNC_SCOPE();
    std::ostringstream oss;
    oss << "{\"jsonrpc\":";
    writeEscaped(oss, jsonrpc);
    oss << ",\"id\":";
    writeId(oss, id);
    if (result.has_value()) {
        oss << ",\"result\":";
        writeValue(oss, result.value());
    }
    if (error.has_value()) {
        oss << ",\"error\":";
        writeValue(oss, error.value());
    }
    oss << "}";
    return oss.str();
}

// JSONRPCNotification implementation
std::string JSONRPCNotification::Serialize() const {
    FUNC_SCOPE();
    std::ostringstream oss;
    oss << "{\"jsonrpc\":";
    writeEscaped(oss, jsonrpc);
    oss << ",\"method\":";
    writeEscaped(oss, method);
    if (params.has_value()) {
        oss << ",\"params\":";
        writeValue(oss, params.value());
    }
    oss << "}";
    return oss.str();
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

    return JSONValue(errorObj);
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

} // namespace mcpgw
