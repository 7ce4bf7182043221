//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ParameterValidator.h
// Purpose: Checks tools/call arguments against the catalog's declared parameter schema
//==========================================================================================================

#pragma once

#include <optional>
#include <string>

#include "mcpgw/JSONRPCTypes.h"
#include "mcpgw/ToolCatalog.h"
#include "mcpgw/errors/Errors.h"

namespace mcpgw {
namespace validation {

// Returns the JSON type name of a value ("string", "integer", "number", "boolean", "array", "object", "null").
const char* jsonTypeName(const JSONValue& value);

// True when value satisfies the declared type. Integer accepts only integral numbers; Number accepts both.
bool matchesParamType(ParamType type, const JSONValue& value);

//==========================================================================================================
// validateToolArguments
// Purpose: Pure check of one tool call against the catalog.
// Args:
//   catalog: Tool registry.
//   toolName: Requested tool.
//   arguments: tools/call arguments. null is treated as an empty object.
// Returns:
//   std::nullopt when the call may be dispatched. Otherwise a ToolCallError of kind UnknownTool (no such
//   tool) or Validation (missingFields and/or typeMismatches populated, in declaration order). The error
//   echoes toolName and arguments. Arguments not declared by the tool are allowed.
//==========================================================================================================
std::optional<errors::ToolCallError> validateToolArguments(const ToolCatalog& catalog,
                                                           const std::string& toolName,
                                                           const JSONValue& arguments);

} // namespace validation
} // namespace mcpgw
