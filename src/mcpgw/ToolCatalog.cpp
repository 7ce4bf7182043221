//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolCatalog.cpp
// Purpose: Tool descriptor registry and inputSchema rendering
//==========================================================================================================

#include <stdexcept>
#include <unordered_set>

#include "logging/Logger.h"
#include "mcpgw/ToolCatalog.h"

namespace mcpgw {

const char* ParamTypeName(ParamType type) {
    switch (type) {
        case ParamType::String: return "string";
        case ParamType::Number: return "number";
        case ParamType::Integer: return "integer";
        case ParamType::Boolean: return "boolean";
        case ParamType::Array: return "array";
        case ParamType::Object: return "object";
        case ParamType::Any: return "any";
    }
    return "any";
}

std::vector<std::string> ToolDescriptor::RequiredFields() const {
    std::vector<std::string> out;
    for (const auto& p : parameters) {
        if (p.required) {
            out.push_back(p.name);
        }
    }
    return out;
}

JSONValue ToolDescriptor::InputSchema() const {
    JSONValue::Object props;
    JSONValue::Array required;
    for (const auto& p : parameters) {
        JSONValue::Object prop;
        // "any" is not a JSON-schema type; leave the property unconstrained
        if (p.type != ParamType::Any) {
            prop["type"] = std::make_shared<JSONValue>(ParamTypeName(p.type));
        }
        if (!p.description.empty()) {
            prop["description"] = std::make_shared<JSONValue>(p.description);
        }
        if (p.defaultValue.has_value()) {
            prop["default"] = std::make_shared<JSONValue>(p.defaultValue.value());
        }
        props[p.name] = std::make_shared<JSONValue>(prop);
        if (p.required) {
            required.push_back(std::make_shared<JSONValue>(p.name));
        }
    }
    JSONValue::Object schema;
    schema["type"] = std::make_shared<JSONValue>(std::string("object"));
    schema["properties"] = std::make_shared<JSONValue>(props);
    schema["required"] = std::make_shared<JSONValue>(required);
    return JSONValue{schema};
}

JSONValue ToolDescriptor::ToJSON() const {
    JSONValue::Object obj;
    obj["name"] = std::make_shared<JSONValue>(name);
    obj["description"] = std::make_shared<JSONValue>(description);
    obj["inputSchema"] = std::make_shared<JSONValue>(InputSchema());
    return JSONValue{obj};
}

void ToolCatalog::Register(ToolDescriptor descriptor) {
    FUNC_SCOPE();
    if (descriptor.name.empty()) {
        throw std::invalid_argument("ToolCatalog: tool name must not be empty");
    }
    if (tools.find(descriptor.name) != tools.end()) {
        throw std::invalid_argument("ToolCatalog: duplicate tool name: " + descriptor.name);
    }
    if (descriptor.site == ExecutionSite::ServerSide && !descriptor.handler) {
        throw std::invalid_argument("ToolCatalog: server-side tool without handler: " + descriptor.name);
    }
    std::unordered_set<std::string> seen;
    for (const auto& p : descriptor.parameters) {
        if (!seen.insert(p.name).second) {
            throw std::invalid_argument("ToolCatalog: duplicate parameter '" + p.name + "' on tool " + descriptor.name);
        }
    }
    LOG_DEBUG("Registered tool {} ({})", descriptor.name,
              descriptor.site == ExecutionSite::ServerSide ? "server-side" : "client-side");
    std::string key = descriptor.name;
    tools.emplace(std::move(key), std::move(descriptor));
}

const ToolDescriptor* ToolCatalog::Find(const std::string& name) const {
    auto it = tools.find(name);
    if (it == tools.end()) {
        return nullptr;
    }
    return &it->second;
}

std::vector<ToolDescriptor> ToolCatalog::ListTools() const {
    std::vector<ToolDescriptor> out;
    out.reserve(tools.size());
    for (const auto& [name, d] : tools) {
        out.push_back(d);
    }
    return out;
}

JSONValue ToolCatalog::ToListResult() const {
    JSONValue::Array arr;
    for (const auto& [name, d] : tools) {
        arr.push_back(std::make_shared<JSONValue>(d.ToJSON()));
    }
    JSONValue::Object resultObj;
    resultObj["tools"] = std::make_shared<JSONValue>(arr);
    return JSONValue{resultObj};
}

std::map<std::string, std::vector<std::string>> ToolCatalog::Categories() const {
    std::map<std::string, std::vector<std::string>> out;
    for (const auto& [name, d] : tools) {
        out[d.category.empty() ? std::string("general") : d.category].push_back(name);
    }
    return out;
}

JSONValue ToolCatalog::Statistics() const {
    int64_t serverSide = 0;
    int64_t clientSide = 0;
    for (const auto& [name, d] : tools) {
        if (d.site == ExecutionSite::ServerSide) {
            ++serverSide;
        } else {
            ++clientSide;
        }
    }
    JSONValue::Object cats;
    for (const auto& [cat, names] : Categories()) {
        cats[cat] = std::make_shared<JSONValue>(static_cast<int64_t>(names.size()));
    }
    JSONValue::Object obj;
    obj["total"] = std::make_shared<JSONValue>(static_cast<int64_t>(tools.size()));
    obj["serverSide"] = std::make_shared<JSONValue>(serverSide);
    obj["clientSide"] = std::make_shared<JSONValue>(clientSide);
    obj["categories"] = std::make_shared<JSONValue>(cats);
    return JSONValue{obj};
}

} // namespace mcpgw
