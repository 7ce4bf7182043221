//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolCatalog.h
// Purpose: Registry of tool descriptors (name, description, parameter schema, execution site)
//==========================================================================================================

#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "mcpgw/JSONRPCTypes.h"

namespace mcpgw {

// Declared argument type. Any disables the type check for that argument.
enum class ParamType {
    String,
    Number,
    Integer,
    Boolean,
    Array,
    Object,
    Any
};

// Returns the JSON-schema type name ("string", "number", ...; "any" for Any).
const char* ParamTypeName(ParamType type);

//==========================================================================================================
// ParameterSpec
// Purpose: One named argument of a tool.
// Fields:
//   name: Argument key inside tools/call arguments.
//   type: Declared type (Any = unchecked).
//   description: Human-readable description surfaced in inputSchema.
//   required: When true the argument must be present.
//   defaultValue: Optional default advertised in inputSchema (not injected into calls).
//==========================================================================================================
struct ParameterSpec {
    std::string name;
    ParamType type{ParamType::Any};
    std::string description;
    bool required{false};
    std::optional<JSONValue> defaultValue;
};

// Where a tool runs: inside the gateway process, or in the external executor.
enum class ExecutionSite {
    ServerSide,
    ClientSide
};

// In-process implementation of a server-side tool. Throwing std::exception reports tool failure.
using InProcessToolHandler = std::function<JSONValue(const JSONValue& arguments)>;

//==========================================================================================================
// ToolDescriptor
// Purpose: Immutable description of one tool.
// Fields:
//   name: Unique, stable key.
//   description: Free text.
//   category: Grouping label used by Categories()/Statistics().
//   parameters: Ordered parameter specs.
//   site: ServerSide (handler required) or ClientSide (forwarded to the executor).
//   handler: In-process implementation for ServerSide tools.
//==========================================================================================================
struct ToolDescriptor {
    std::string name;
    std::string description;
    std::string category;
    std::vector<ParameterSpec> parameters;
    ExecutionSite site{ExecutionSite::ClientSide};
    InProcessToolHandler handler;

    // Names of parameters marked required, in declaration order.
    std::vector<std::string> RequiredFields() const;

    // { type: "object", properties: { name: { type?, description, default? } }, required: [...] }
    JSONValue InputSchema() const;

    // { name, description, inputSchema }
    JSONValue ToJSON() const;
};

//==========================================================================================================
// ToolCatalog
// Purpose: Owns the registered descriptors. Lookups are by exact name; listing is sorted by name.
// Notes:
//   Registration happens before the gateway starts serving; afterwards the catalog is read-only.
//==========================================================================================================
class ToolCatalog {
public:
    ToolCatalog() = default;

    //==========================================================================================================
    // Register
    // Purpose: Adds a descriptor.
    // Args:
    //   descriptor: Tool to add.
    // Throws:
    //   std::invalid_argument when the name is empty or already registered, when a ServerSide tool has no
    //   handler, or when two parameters share a name.
    //==========================================================================================================
    void Register(ToolDescriptor descriptor);

    // Returns the descriptor or nullptr.
    const ToolDescriptor* Find(const std::string& name) const;

    bool Contains(const std::string& name) const { return Find(name) != nullptr; }

    std::size_t Size() const { return tools.size(); }

    // All descriptors sorted by name.
    std::vector<ToolDescriptor> ListTools() const;

    // { tools: [ ToolDescriptor::ToJSON()... ] }
    JSONValue ToListResult() const;

    // Category -> tool names (sorted). Tools with an empty category are grouped under "general".
    std::map<std::string, std::vector<std::string>> Categories() const;

    // { total, serverSide, clientSide, categories: { name: count } }
    JSONValue Statistics() const;

private:
    std::map<std::string, ToolDescriptor> tools;
};

} // namespace mcpgw
