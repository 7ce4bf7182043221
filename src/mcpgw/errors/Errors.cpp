//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.cpp
// Purpose: Tool-call error rendering
//==========================================================================================================

#include "mcpgw/errors/Errors.h"

namespace mcpgw {
namespace errors {

const char* toolErrorKindName(ToolErrorKind kind) {
    switch (kind) {
        case ToolErrorKind::Validation: return "validation";
        case ToolErrorKind::UnknownTool: return "unknown_tool";
        case ToolErrorKind::Timeout: return "timeout";
        case ToolErrorKind::NoClient: return "no_client";
        case ToolErrorKind::Executor: return "executor";
        case ToolErrorKind::Internal: return "internal";
    }
    return "internal";
}

JSONValue toolCallErrorToJSON(const ToolCallError& err) {
    JSONValue::Object obj;
    SetMember(obj, "errorKind", JSONValue(toolErrorKindName(err.kind)));
    SetMember(obj, "toolName", JSONValue(err.toolName));
    SetMember(obj, "message", JSONValue(err.message));
    SetMember(obj, "arguments", err.arguments);
    if (!err.missingFields.empty()) {
        JSONValue::Array missing;
        for (const auto& f : err.missingFields) {
            missing.push_back(std::make_shared<JSONValue>(f));
        }
        SetMember(obj, "missingFields", JSONValue(std::move(missing)));
    }
    if (!err.typeMismatches.empty()) {
        JSONValue::Array mismatches;
        for (const auto& m : err.typeMismatches) {
            JSONValue::Object mo;
            SetMember(mo, "field", JSONValue(m.field));
            SetMember(mo, "expected", JSONValue(m.expected));
            SetMember(mo, "actual", JSONValue(m.actual));
            mismatches.push_back(std::make_shared<JSONValue>(std::move(mo)));
        }
        SetMember(obj, "typeMismatches", JSONValue(std::move(mismatches)));
    }
    if (err.kind == ToolErrorKind::Timeout) {
        SetMember(obj, "elapsedMs", JSONValue(err.elapsedMs));
    }
    return JSONValue{std::move(obj)};
}

} // namespace errors
} // namespace mcpgw
