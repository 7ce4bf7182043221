//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: GatewayCore.cpp
// Purpose: Shared JSON-RPC method switch and tools/call rendering
//==========================================================================================================

#include <algorithm>
#include <cctype>

#include "logging/Logger.h"
#include "mcpgw/GatewayCore.h"

namespace mcpgw {
namespace net = boost::asio;

const char* HandshakePolicyName(HandshakePolicy policy) {
    return policy == HandshakePolicy::Strict ? "strict" : "lenient";
}

std::optional<HandshakePolicy> HandshakePolicyFromString(const std::string& name) {
    std::string s = name;
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    if (s == "lenient") {
        return HandshakePolicy::Lenient;
    }
    if (s == "strict") {
        return HandshakePolicy::Strict;
    }
    return std::nullopt;
}

GatewayCore::GatewayCore(const ToolCatalog& catalog, ExecutionDispatcher& dispatcher, Options opts)
    : catalog(catalog), dispatcher(dispatcher), opts(std::move(opts)) {}

//==========================================================================================================
// Rendering
//==========================================================================================================
JSONValue GatewayCore::RenderToolOutcome(const std::string& toolName, const ToolCallOutcome& outcome) {
    CallToolResult result;
    if (outcome.success) {
        result.content.push_back(MakeTextContent(SerializeJSON(outcome.result)));
        return SerializeCallToolResult(result);
    }
    const std::string message = outcome.error.has_value() ? outcome.error->message : std::string("Unknown error");
    result.content.push_back(MakeTextContent("Error executing tool " + toolName + ": " + message));
    result.isError = true;
    if (outcome.error.has_value()) {
        result.meta = errors::toolCallErrorToJSON(outcome.error.value());
    }
    return SerializeCallToolResult(result);
}

//==========================================================================================================
// Envelope entry points
//==========================================================================================================
net::awaitable<EnvelopeOutcome> GatewayCore::HandleEnvelope(std::string text,
                                                            std::shared_ptr<ProtocolSession> session,
                                                            TransportKind transport) {
    co_return co_await HandleDecoded(DecodeEnvelope(text), std::move(session), transport);
}

net::awaitable<EnvelopeOutcome> GatewayCore::HandleDecoded(DecodedEnvelope envelope,
                                                           std::shared_ptr<ProtocolSession> session,
                                                           TransportKind transport) {
    EnvelopeOutcome out;
    switch (envelope.kind) {
        case DecodedEnvelope::Kind::ParseError: {
            LOG_WARN("[{}] Parse error: {}", TransportKindName(transport), envelope.detail);
            out.status = EnvelopeOutcome::Status::ParseError;
            out.reply = CreateErrorResponse(nullptr, JSONRPCErrorCodes::ParseError, "Parse error",
                                            JSONValue(envelope.detail))->Serialize();
            co_return out;
        }
        case DecodedEnvelope::Kind::Invalid: {
            LOG_WARN("[{}] Invalid request: {}", TransportKindName(transport), envelope.detail);
            out.status = EnvelopeOutcome::Status::InvalidRequest;
            out.reply = CreateErrorResponse(envelope.id, JSONRPCErrorCodes::InvalidRequest, "Invalid Request",
                                            JSONValue(envelope.detail))->Serialize();
            co_return out;
        }
        case DecodedEnvelope::Kind::Response: {
            LOG_DEBUG("[{}] Ignoring client response for id {}", TransportKindName(transport), IdToString(envelope.id));
            out.status = EnvelopeOutcome::Status::Notification;
            co_return out;
        }
        case DecodedEnvelope::Kind::Notification: {
            handleNotification(envelope, *session);
            out.status = EnvelopeOutcome::Status::Notification;
            co_return out;
        }
        case DecodedEnvelope::Kind::Request:
            break;
    }

    std::unique_ptr<JSONRPCResponse> response;
    std::optional<std::string> faultMessage;
    try {
        response = co_await handleRequest(envelope, *session, transport);
    } catch (const std::exception& e) {
        faultMessage = e.what();
    }
    if (faultMessage.has_value() || !response) {
        const std::string msg = faultMessage.value_or(std::string("No response from handler"));
        LOG_ERROR("[{}] {} failed: {}", TransportKindName(transport), envelope.method, msg);
        out.status = EnvelopeOutcome::Status::InternalError;
        out.reply = CreateErrorResponse(envelope.id, JSONRPCErrorCodes::InternalError, "Internal error",
                                        JSONValue(msg))->Serialize();
        co_return out;
    }
    response->id = envelope.id;
    out.status = EnvelopeOutcome::Status::Ok;
    out.reply = response->Serialize();
    co_return out;
}

//==========================================================================================================
// Method switch
//==========================================================================================================
std::optional<errors::McpError> GatewayCore::gate(const std::string& method, const ProtocolSession& session) const {
    if (session.IsReady()) {
        return std::nullopt;
    }
    if (opts.handshakePolicy == HandshakePolicy::Strict) {
        LOG_WARN("Session {}: {} rejected before initialization ({})", session.Id(), method,
                 SessionStateName(session.State()));
        return errors::makeMcpError(JSONRPCErrorCodes::ServerNotInitialized, "Server not initialized");
    }
    LOG_WARN("Session {}: {} served before initialization ({})", session.Id(), method,
             SessionStateName(session.State()));
    return std::nullopt;
}

net::awaitable<std::unique_ptr<JSONRPCResponse>> GatewayCore::handleRequest(const DecodedEnvelope& envelope,
                                                                            ProtocolSession& session,
                                                                            TransportKind transport) {
    const std::string& method = envelope.method;

    if (method == Methods::Initialize) {
        co_return std::make_unique<JSONRPCResponse>(envelope.id, handleInitialize(envelope, session));
    }
    if (method == Methods::Initialized || method == Methods::InitializedAlias) {
        // Sent as a request by some clients; acknowledge with an empty result.
        (void)session.OnInitialized();
        co_return std::make_unique<JSONRPCResponse>(envelope.id, JSONValue{JSONValue::Object{}});
    }
    if (method == Methods::Ping) {
        co_return std::make_unique<JSONRPCResponse>(envelope.id, handlePing(session));
    }
    if (method == Methods::ListTools) {
        if (auto refused = gate(method, session)) {
            co_return errors::makeErrorResponse(envelope.id, *refused);
        }
        co_return std::make_unique<JSONRPCResponse>(envelope.id, catalog.ToListResult());
    }
    if (method == Methods::CallTool) {
        if (auto refused = gate(method, session)) {
            co_return errors::makeErrorResponse(envelope.id, *refused);
        }
        co_return co_await handleToolsCall(envelope, transport);
    }

    LOG_WARN("[{}] Method not found: {}", TransportKindName(transport), method);
    co_return CreateErrorResponse(envelope.id, JSONRPCErrorCodes::MethodNotFound, "Method not found: " + method);
}

void GatewayCore::handleNotification(const DecodedEnvelope& envelope, ProtocolSession& session) {
    if (envelope.method == Methods::Initialized || envelope.method == Methods::InitializedAlias) {
        (void)session.OnInitialized();
        return;
    }
    if (envelope.method == Methods::Cancelled) {
        // The executor cannot be interrupted; the pending call still ends by reply or timeout.
        LOG_DEBUG("Session {}: cancellation notice ignored", session.Id());
        return;
    }
    LOG_DEBUG("Session {}: unhandled notification {}", session.Id(), envelope.method);
}

JSONValue GatewayCore::handleInitialize(const DecodedEnvelope& envelope, ProtocolSession& session) {
    const std::string version = session.OnInitialize(envelope.params, opts.defaultProtocolVersion);
    JSONValue::Object result;
    result["protocolVersion"] = std::make_shared<JSONValue>(version);
    result["capabilities"] = std::make_shared<JSONValue>(SerializeServerCapabilities(opts.capabilities));
    result["serverInfo"] = std::make_shared<JSONValue>(SerializeImplementation(opts.serverInfo));
    return JSONValue{result};
}

JSONValue GatewayCore::handlePing(ProtocolSession& session) {
    JSONValue::Object result;
    result["status"] = std::make_shared<JSONValue>("ok");
    result["timestamp"] = std::make_shared<JSONValue>(MakeTimestamp());
    result["serverReady"] = std::make_shared<JSONValue>(session.IsReady());
    result["executorReady"] = std::make_shared<JSONValue>(dispatcher.ExecutorReady());
    result["state"] = std::make_shared<JSONValue>(SessionStateName(session.State()));
    return JSONValue{result};
}

net::awaitable<std::unique_ptr<JSONRPCResponse>> GatewayCore::handleToolsCall(const DecodedEnvelope& envelope,
                                                                              TransportKind transport) {
    std::optional<std::string> name;
    JSONValue arguments{JSONValue::Object{}};
    if (envelope.params.has_value()) {
        name = GetStringMember(envelope.params.value(), "name");
        if (const JSONValue* a = FindMember(envelope.params.value(), "arguments")) {
            arguments = *a;
        }
    }
    if (!name.has_value() || name->empty()) {
        co_return CreateErrorResponse(envelope.id, JSONRPCErrorCodes::InvalidParams, "Missing tool name");
    }

    ToolCallOutcome outcome = co_await dispatcher.CallTool(*name, std::move(arguments));
    if (outcome.success) {
        LOG_INFO("[{}] tools/call {} ok in {} ms", TransportKindName(transport), *name, outcome.elapsed.count());
    } else {
        LOG_INFO("[{}] tools/call {} failed ({}) in {} ms", TransportKindName(transport), *name,
                 outcome.error.has_value() ? errors::toolErrorKindName(outcome.error->kind) : "internal",
                 outcome.elapsed.count());
    }
    co_return std::make_unique<JSONRPCResponse>(envelope.id, RenderToolOutcome(*name, outcome));
}

} // namespace mcpgw
