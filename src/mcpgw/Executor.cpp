//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Executor.cpp
// Purpose: JSON codec for executor request/reply messages
//==========================================================================================================

#include "mcpgw/Executor.h"

namespace mcpgw {

JSONValue ExecutionRequest::ToJSON() const {
    JSONValue::Object obj;
    obj["requestId"] = std::make_shared<JSONValue>(requestId);
    obj["toolName"] = std::make_shared<JSONValue>(toolName);
    obj["parameters"] = std::make_shared<JSONValue>(parameters);
    obj["clientId"] = std::make_shared<JSONValue>(clientId);
    return JSONValue{obj};
}

std::optional<ExecutionRequest> ExecutionRequest::FromJSON(const JSONValue& v) {
    auto id = GetStringMember(v, "requestId");
    auto tool = GetStringMember(v, "toolName");
    if (!id.has_value() || !tool.has_value()) {
        return std::nullopt;
    }
    ExecutionRequest req;
    req.requestId = std::move(*id);
    req.toolName = std::move(*tool);
    if (const JSONValue* p = FindMember(v, "parameters")) {
        req.parameters = *p;
    } else {
        req.parameters = JSONValue{JSONValue::Object{}};
    }
    req.clientId = GetStringMember(v, "clientId").value_or(std::string());
    return req;
}

std::string ExecutionReply::errorMessage() const {
    if (!error.has_value()) {
        return "Unknown executor error";
    }
    if (std::holds_alternative<std::string>(error->value)) {
        return std::get<std::string>(error->value);
    }
    if (auto msg = GetStringMember(error.value(), "message")) {
        return *msg;
    }
    return SerializeJSON(error.value());
}

JSONValue ExecutionReply::ToJSON() const {
    JSONValue::Object obj;
    obj["requestId"] = std::make_shared<JSONValue>(requestId);
    obj["success"] = std::make_shared<JSONValue>(success);
    if (result.has_value()) {
        obj["result"] = std::make_shared<JSONValue>(result.value());
    }
    if (error.has_value()) {
        obj["error"] = std::make_shared<JSONValue>(error.value());
    }
    return JSONValue{obj};
}

std::optional<ExecutionReply> ExecutionReply::FromJSON(const JSONValue& v) {
    auto id = GetStringMember(v, "requestId");
    const JSONValue* ok = FindMember(v, "success");
    if (!id.has_value() || ok == nullptr || !std::holds_alternative<bool>(ok->value)) {
        return std::nullopt;
    }
    ExecutionReply reply;
    reply.requestId = std::move(*id);
    reply.success = std::get<bool>(ok->value);
    if (const JSONValue* r = FindMember(v, "result")) {
        reply.result = *r;
    }
    if (const JSONValue* e = FindMember(v, "error")) {
        reply.error = *e;
    }
    return reply;
}

} // namespace mcpgw
