//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: GatewayCore.h
// Purpose: Transport-independent JSON-RPC method handling shared by the HTTP, streaming and socket adapters
//==========================================================================================================

#pragma once

#include <memory>
#include <optional>
#include <string>

#include <utility>

#include <boost/asio/awaitable.hpp>

#include "mcpgw/ConnectionRegistry.h"
#include "mcpgw/EnvelopeDecoder.h"
#include "mcpgw/ExecutionDispatcher.h"
#include "mcpgw/Protocol.h"
#include "mcpgw/ProtocolSession.h"
#include "mcpgw/ToolCatalog.h"
#include "mcpgw/errors/Errors.h"

namespace mcpgw {

// How tools/list and tools/call are treated before the session is Ready.
enum class HandshakePolicy {
    Lenient,  // served with a WARN
    Strict    // rejected with -32002
};

const char* HandshakePolicyName(HandshakePolicy policy);
std::optional<HandshakePolicy> HandshakePolicyFromString(const std::string& name);

//==========================================================================================================
// EnvelopeOutcome
// Purpose: What an adapter has to send back for one inbound frame.
// Fields:
//   reply: Serialized JSON-RPC response, or std::nullopt when nothing is owed (notifications, responses).
//   status: Coarse classification for adapters that map onto HTTP status codes.
//==========================================================================================================
struct EnvelopeOutcome {
    enum class Status {
        Ok,
        Notification,
        ParseError,
        InvalidRequest,
        InternalError
    };

    std::optional<std::string> reply;
    Status status{Status::Ok};
};

//==========================================================================================================
// GatewayCore
// Purpose: One method switch for every transport.
//   initialize             -> capture client info, answer { protocolVersion, capabilities, serverInfo }
//   initialized            -> session Ready (alias notifications/initialized); idempotent
//   tools/list             -> catalog listing (pre-handshake per HandshakePolicy)
//   tools/call             -> ExecutionDispatcher; tool failures become isError results
//   ping                   -> { status, timestamp, serverReady, executorReady, state }
//   anything else          -> -32601
// Notes:
//   Runs on the event loop. Never throws; handler faults become -32603.
//==========================================================================================================
class GatewayCore {
public:
    struct Options {
        Implementation serverInfo{"mcp-tool-gateway", "1.0.0"};
        ServerCapabilities capabilities;
        std::string defaultProtocolVersion{DEFAULT_PROTOCOL_VERSION};
        HandshakePolicy handshakePolicy{HandshakePolicy::Lenient};
    };

    GatewayCore(const ToolCatalog& catalog, ExecutionDispatcher& dispatcher, Options opts);

    //==========================================================================================================
    // HandleEnvelope
    // Purpose: Decode and handle one text frame.
    // Args:
    //   text: Raw frame.
    //   session: Handshake state of the originating connection (the shared HTTP session for HTTP).
    //   transport: Originating adapter, for logs.
    //==========================================================================================================
    boost::asio::awaitable<EnvelopeOutcome> HandleEnvelope(std::string text,
                                                           std::shared_ptr<ProtocolSession> session,
                                                           TransportKind transport);

    // Same as HandleEnvelope for an already-decoded frame.
    boost::asio::awaitable<EnvelopeOutcome> HandleDecoded(DecodedEnvelope envelope,
                                                          std::shared_ptr<ProtocolSession> session,
                                                          TransportKind transport);

    // Renders a dispatcher outcome as a tools/call result.
    static JSONValue RenderToolOutcome(const std::string& toolName, const ToolCallOutcome& outcome);

    const Options& GetOptions() const { return opts; }

private:
    boost::asio::awaitable<std::unique_ptr<JSONRPCResponse>> handleRequest(const DecodedEnvelope& envelope,
                                                                           ProtocolSession& session,
                                                                           TransportKind transport);
    void handleNotification(const DecodedEnvelope& envelope, ProtocolSession& session);

    JSONValue handleInitialize(const DecodedEnvelope& envelope, ProtocolSession& session);
    JSONValue handlePing(ProtocolSession& session);
    boost::asio::awaitable<std::unique_ptr<JSONRPCResponse>> handleToolsCall(const DecodedEnvelope& envelope,
                                                                             TransportKind transport);

    // Returns the error to answer with when the policy refuses method before Ready.
    std::optional<errors::McpError> gate(const std::string& method, const ProtocolSession& session) const;

    const ToolCatalog& catalog;
    ExecutionDispatcher& dispatcher;
    Options opts;
};

} // namespace mcpgw
