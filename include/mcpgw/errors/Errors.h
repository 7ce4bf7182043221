//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Typed protocol and tool-call error structures plus JSON-RPC error mapping helpers
//==========================================================================================================

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "mcpgw/JSONRPCTypes.h"

namespace mcpgw {
namespace errors {

// Categorization of the JSON-RPC error codes the gateway emits.
enum class ErrorCategory {
    JsonRpcParse,
    JsonRpcInvalidRequest,
    JsonRpcMethodNotFound,
    JsonRpcInvalidParams,
    JsonRpcInternal,
    ServerNotInitialized,
    Unknown
};

// Typed protocol-level error. Always leaves an adapter as a JSON-RPC error object.
struct McpError {
    int code{0};
    std::string message;
    std::optional<JSONValue> data;
    ErrorCategory category{ErrorCategory::Unknown};
};

// Map a JSON-RPC numeric error code to an ErrorCategory.
//
// Args:
//   code: The integer error code.
//
// Returns:
//   ErrorCategory corresponding to the code, or Unknown when unmapped.
inline ErrorCategory errorCategoryFromCode(int code) {
    switch (code) {
        case JSONRPCErrorCodes::ParseError: return ErrorCategory::JsonRpcParse;
        case JSONRPCErrorCodes::InvalidRequest: return ErrorCategory::JsonRpcInvalidRequest;
        case JSONRPCErrorCodes::MethodNotFound: return ErrorCategory::JsonRpcMethodNotFound;
        case JSONRPCErrorCodes::InvalidParams: return ErrorCategory::JsonRpcInvalidParams;
        case JSONRPCErrorCodes::InternalError: return ErrorCategory::JsonRpcInternal;
        case JSONRPCErrorCodes::ServerNotInitialized: return ErrorCategory::ServerNotInitialized;
        default: return ErrorCategory::Unknown;
    }
}

// Build an McpError with its category filled in from the code.
inline McpError makeMcpError(int code, std::string message, std::optional<JSONValue> data = std::nullopt) {
    McpError e;
    e.code = code;
    e.message = std::move(message);
    e.data = std::move(data);
    e.category = errorCategoryFromCode(code);
    return e;
}

// Convert a JSON-RPC error object (shape: { code, message, data? }) to McpError.
// Returns std::nullopt when the input is not a valid error object.
inline std::optional<McpError> mcpErrorFromErrorValue(const JSONValue& errVal) {
    const JSONValue* code = FindMember(errVal, "code");
    auto message = GetStringMember(errVal, "message");
    if (code == nullptr || !message.has_value() || !std::holds_alternative<int64_t>(code->value)) {
        return std::nullopt;
    }
    std::optional<JSONValue> data;
    if (const JSONValue* d = FindMember(errVal, "data")) {
        data = *d;
    }
    return makeMcpError(static_cast<int>(std::get<int64_t>(code->value)), std::move(*message), std::move(data));
}

// Extract McpError from a JSONRPCResponse if it carries an error.
inline std::optional<McpError> mcpErrorFromResponse(const JSONRPCResponse& response) {
    if (!response.error.has_value()) {
        return std::nullopt;
    }
    return mcpErrorFromErrorValue(response.error.value());
}

// Convenience: Create a JSONRPCResponse error from McpError and id.
//
// Args:
//   id: JSON-RPC id to echo in the response.
//   err: Typed error to map.
//
// Returns:
//   std::unique_ptr<JSONRPCResponse> containing an error.
inline std::unique_ptr<JSONRPCResponse> makeErrorResponse(const JSONRPCId& id, const McpError& err) {
    return CreateErrorResponse(id, err.code, err.message, err.data);
}

//==========================================================================================================
// ToolErrorKind
// Purpose: Tool-level failure taxonomy. These never become JSON-RPC errors; they are rendered as a
//          successful tools/call result with isError:true.
//   Validation: required argument missing or argument type mismatch.
//   UnknownTool: no descriptor registered under the requested name.
//   Timeout: client-side execution exceeded its bound.
//   NoClient: no executor reachable; reported immediately.
//   Executor: the executor (or an in-process handler) reported failure; message passed through verbatim.
//   Internal: gateway-side failure such as send failure or shutdown.
//==========================================================================================================
enum class ToolErrorKind {
    Validation,
    UnknownTool,
    Timeout,
    NoClient,
    Executor,
    Internal
};

// Stable lowercase name used in logs and the _meta.errorKind field.
const char* toolErrorKindName(ToolErrorKind kind);

// A type mismatch on one argument.
struct TypeMismatch {
    std::string field;
    std::string expected;
    std::string actual;
};

//==========================================================================================================
// ToolCallError
// Purpose: Structured tool-level failure carrying the tool name and echoed arguments.
// Fields:
//   kind: ToolErrorKind.
//   toolName: The tool the caller asked for.
//   message: Human-readable description (verbatim executor text for Executor).
//   arguments: Arguments as received, echoed back for diagnostics.
//   missingFields / typeMismatches: Populated for Validation.
//   elapsedMs: Populated for Timeout.
//==========================================================================================================
struct ToolCallError {
    ToolErrorKind kind{ToolErrorKind::Internal};
    std::string toolName;
    std::string message;
    JSONValue arguments;
    std::vector<std::string> missingFields;
    std::vector<TypeMismatch> typeMismatches;
    int64_t elapsedMs{0};
};

// Renders { errorKind, toolName, message, arguments, missingFields?, typeMismatches?, elapsedMs? }.
JSONValue toolCallErrorToJSON(const ToolCallError& err);

} // namespace errors
} // namespace mcpgw
