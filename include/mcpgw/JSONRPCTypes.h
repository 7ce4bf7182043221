//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONRPCTypes.h
// Purpose: JSON value model and JSON-RPC 2.0 envelope types for the gateway
//==========================================================================================================

#pragma once

#include <cstdint>
#include <string>
#include <memory>
#include <variant>
#include <optional>
#include <unordered_map>
#include <vector>

namespace mcpgw {

//==========================================================================================================
// JSONValue
// Purpose: Simplified JSON representation backed by std::variant and shared_ptr graphs.
// Fields:
//   Array: vector<shared_ptr<JSONValue>> representing a JSON array.
//   Object: unordered_map<string, shared_ptr<JSONValue>> representing a JSON object.
//   value: variant holding nullptr, bool, int64_t, double, string, Array, or Object.
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

    // Constructors and special members (defined out-of-line)
    JSONValue();
    JSONValue(const JSONValue&);
    JSONValue(JSONValue&&);
    JSONValue& operator=(const JSONValue&);
    JSONValue& operator=(JSONValue&&);
    ~JSONValue();

    // Explicit constructors for supported types
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

    // Access the underlying variant
    auto& get() { return value; }
    const auto& get() const { return value; }

    bool IsNull() const { return std::holds_alternative<std::nullptr_t>(value); }
    bool IsObject() const { return std::holds_alternative<Object>(value); }
    bool IsArray() const { return std::holds_alternative<Array>(value); }
    bool IsString() const { return std::holds_alternative<std::string>(value); }
};

//==========================================================================================================
// ParseJSON
// Purpose: Parses a complete JSON text into a JSONValue.
// Args:
//   text: JSON document. Leading/trailing whitespace is allowed; any other trailing content is an error.
// Returns:
//   Parsed JSONValue.
// Throws:
//   std::runtime_error with a short description when the text is not valid JSON.
//==========================================================================================================
JSONValue ParseJSON(const std::string& text);

//==========================================================================================================
// SerializeJSON
// Purpose: Serializes a JSONValue to compact JSON text (strings and keys escaped, non-finite doubles as null).
//==========================================================================================================
std::string SerializeJSON(const JSONValue& value);

//==========================================================================================================
// FindMember
// Purpose: Looks up a key on an object value.
// Returns:
//   Pointer to the member value, or nullptr when value is not an object or the key is absent.
//==========================================================================================================
const JSONValue* FindMember(const JSONValue& value, const std::string& key);

// Returns the string member or std::nullopt when absent or not a string.
std::optional<std::string> GetStringMember(const JSONValue& value, const std::string& key);

// Convenience for building objects: obj[key] = make_shared<JSONValue>(v).
void SetMember(JSONValue::Object& obj, const std::string& key, JSONValue v);

//==========================================================================================================
// JSONRPCId
// Purpose: JSON-RPC 2.0 id variant: string, integer, or null.
//==========================================================================================================
using JSONRPCId = std::variant<std::string, int64_t, std::nullptr_t>;

// Renders an id for logs and map keys ("null" for null ids).
std::string IdToString(const JSONRPCId& id);

// Maps a JSON id member to JSONRPCId. std::nullopt for fractional numbers, booleans and structured values.
std::optional<JSONRPCId> IdFromJSON(const JSONValue& v);

//==========================================================================================================
// JSONRPCMessage
// Purpose: Abstract base for JSON-RPC 2.0 messages providing serialization APIs.
// Methods:
//   Serialize(): Returns the compact wire text for the message.
//==========================================================================================================
class JSONRPCMessage {
public:
    std::string jsonrpc = "2.0";

    virtual ~JSONRPCMessage() = default;
    virtual std::string Serialize() const = 0;
};

//==========================================================================================================
// JSONRPCResponse
// Purpose: JSON-RPC 2.0 response message carrying either result or error.
// Ctors:
//   JSONRPCResponse(id, result): Success response with result set. Errors are built by CreateErrorResponse.
// Methods:
//   Serialize()
//==========================================================================================================
class JSONRPCResponse : public JSONRPCMessage {
public:
    JSONRPCId id;
    std::optional<JSONValue> result;
    std::optional<JSONValue> error;

    JSONRPCResponse() = default;
    JSONRPCResponse(JSONRPCId id, JSONValue result)
        : id(std::move(id)), result(std::move(result)) {}

    std::string Serialize() const override;
};

//==========================================================================================================
// JSONRPCNotification
// Purpose: JSON-RPC 2.0 notification (no id, no response).
// Ctors:
//   JSONRPCNotification(method, params?): Initializes method and optional params.
// Methods:
//   Serialize()
//==========================================================================================================
class JSONRPCNotification : public JSONRPCMessage {
public:
    std::string method;
    std::optional<JSONValue> params;

    JSONRPCNotification() = default;
    JSONRPCNotification(std::string method, std::optional<JSONValue> params = std::nullopt)
        : method(std::move(method)), params(std::move(params)) {}

    std::string Serialize() const override;
};

//==========================================================================================================
// JSONRPCErrorCodes
// Purpose: Standard JSON-RPC error codes plus the gateway's server-defined codes.
// Notes:
//   Values align with JSON-RPC 2.0; server-defined codes live in the reserved -320xx range.
//==========================================================================================================
namespace JSONRPCErrorCodes {
    constexpr int ParseError = -32700;
    constexpr int InvalidRequest = -32600;
    constexpr int MethodNotFound = -32601;
    constexpr int InvalidParams = -32602;
    constexpr int InternalError = -32603;

    // Server-defined
    constexpr int ServerNotInitialized = -32002;
}

//==========================================================================================================
// CreateErrorObject
// Purpose: Build a JSON error object with shape { code, message, data? }.
// Args:
//   code: Integer error code.
//   message: Human-readable description.
//   data: Optional structured payload.
// Returns:
//   JSONValue object representing the error.
//==========================================================================================================
JSONValue CreateErrorObject(int code, const std::string& message,
                           const std::optional<JSONValue>& data = std::nullopt);

//==========================================================================================================
// CreateErrorResponse
// Purpose: Convenience to wrap an error object into a JSONRPCResponse with the given id.
// Args:
//   id: Request id to echo in the response (string | int64 | null).
//   code: Integer error code.
//   message: Error message.
//   data: Optional structured payload.
// Returns:
//   unique_ptr<JSONRPCResponse> with error populated.
//==========================================================================================================
std::unique_ptr<JSONRPCResponse> CreateErrorResponse(
    const JSONRPCId& id, int code, const std::string& message,
    const std::optional<JSONValue>& data = std::nullopt);

} // namespace mcpgw
