//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ParameterValidator.cpp
// Purpose: Required-field and type checks for tool arguments
//==========================================================================================================

#include <cmath>
#include <format>

#include "mcpgw/validation/ParameterValidator.h"

namespace mcpgw {
namespace validation {

const char* jsonTypeName(const JSONValue& value) {
    if (std::holds_alternative<std::nullptr_t>(value.value)) return "null";
    if (std::holds_alternative<bool>(value.value)) return "boolean";
    if (std::holds_alternative<int64_t>(value.value)) return "integer";
    if (std::holds_alternative<double>(value.value)) return "number";
    if (std::holds_alternative<std::string>(value.value)) return "string";
    if (std::holds_alternative<JSONValue::Array>(value.value)) return "array";
    return "object";
}

bool matchesParamType(ParamType type, const JSONValue& value) {
    switch (type) {
        case ParamType::Any:
            return true;
        case ParamType::String:
            return std::holds_alternative<std::string>(value.value);
        case ParamType::Boolean:
            return std::holds_alternative<bool>(value.value);
        case ParamType::Array:
            return std::holds_alternative<JSONValue::Array>(value.value);
        case ParamType::Object:
            return std::holds_alternative<JSONValue::Object>(value.value);
        case ParamType::Number:
            return std::holds_alternative<int64_t>(value.value) || std::holds_alternative<double>(value.value);
        case ParamType::Integer:
            if (std::holds_alternative<int64_t>(value.value)) {
                return true;
            }
            // 5.0 is integral; 5.5 is not
            if (std::holds_alternative<double>(value.value)) {
                const double d = std::get<double>(value.value);
                return std::isfinite(d) && std::floor(d) == d;
            }
            return false;
    }
    return false;
}

std::optional<errors::ToolCallError> validateToolArguments(const ToolCatalog& catalog,
                                                           const std::string& toolName,
                                                           const JSONValue& arguments) {
    errors::ToolCallError err;
    err.toolName = toolName;
    err.arguments = arguments;

    const ToolDescriptor* tool = catalog.Find(toolName);
    if (tool == nullptr) {
        err.kind = errors::ToolErrorKind::UnknownTool;
        err.message = std::format("Unknown tool: {}", toolName);
        return err;
    }

    const bool isNull = std::holds_alternative<std::nullptr_t>(arguments.value);
    if (!isNull && !std::holds_alternative<JSONValue::Object>(arguments.value)) {
        err.kind = errors::ToolErrorKind::Validation;
        err.typeMismatches.push_back(errors::TypeMismatch{"arguments", "object", jsonTypeName(arguments)});
        err.message = std::format("Invalid arguments for {}: expected an object, got {}", toolName, jsonTypeName(arguments));
        return err;
    }

    for (const auto& p : tool->parameters) {
        const JSONValue* v = isNull ? nullptr : FindMember(arguments, p.name);
        if (v == nullptr) {
            if (p.required) {
                err.missingFields.push_back(p.name);
            }
            continue;
        }
        if (!matchesParamType(p.type, *v)) {
            err.typeMismatches.push_back(errors::TypeMismatch{p.name, ParamTypeName(p.type), jsonTypeName(*v)});
        }
    }

    if (err.missingFields.empty() && err.typeMismatches.empty()) {
        return std::nullopt;
    }

    err.kind = errors::ToolErrorKind::Validation;
    std::string detail;
    if (!err.missingFields.empty()) {
        detail = "missing required field(s): ";
        for (std::size_t i = 0; i < err.missingFields.size(); ++i) {
            if (i > 0) detail += ", ";
            detail += err.missingFields[i];
        }
    }
    for (const auto& m : err.typeMismatches) {
        if (!detail.empty()) detail += "; ";
        detail += std::format("field '{}' expected {} but got {}", m.field, m.expected, m.actual);
    }
    err.message = std::format("Invalid arguments for {}: {}", toolName, detail);
    return err;
}

} // namespace validation
} // namespace mcpgw
