//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: MCP protocol constants and small data structures used by the gateway
//==========================================================================================================

#pragma once

#include "JSONRPCTypes.h"
#include <string>
#include <vector>

namespace mcpgw {

//==========================================================================================================
// MCP Protocol types and constants
// Purpose: Shared protocol structures, capabilities, and method names.
//==========================================================================================================

///////////////////////////////////////// Protocol constants ///////////////////////////////////////////
// Protocol version answered when the client does not request one
constexpr const char* DEFAULT_PROTOCOL_VERSION = "2024-11-05";

// Default bound on one client-side tool execution
constexpr long long DEFAULT_TOOL_TIMEOUT_MS = 30000;

///////////////////////////////////////// Implementation ///////////////////////////////////////////
// Implementation information (serverInfo / clientInfo)
struct Implementation {
    std::string name;
    std::string version;
    std::string description;

    Implementation() = default;
    Implementation(std::string name, std::string version, std::string description = std::string())
        : name(std::move(name)), version(std::move(version)), description(std::move(description)) {}
};

///////////////////////////////////////// Capabilities ///////////////////////////////////////////
struct ToolsCapability {
    bool listChanged = true;
};

struct LoggingCapability {
    // Empty - presence indicates logging notifications are supported
};

struct ServerCapabilities {
    std::optional<ToolsCapability> tools{ToolsCapability{}};
    std::optional<LoggingCapability> logging{LoggingCapability{}};
};

//==========================================================================================================
// SerializeServerCapabilities
// Purpose: Renders capabilities as { tools?: { listChanged }, logging?: {} }.
//==========================================================================================================
JSONValue SerializeServerCapabilities(const ServerCapabilities& caps);

//==========================================================================================================
// SerializeImplementation
// Purpose: Renders { name, version, description? } (description omitted when empty).
//==========================================================================================================
JSONValue SerializeImplementation(const Implementation& impl);

///////////////////////////////////////// Tools ///////////////////////////////////////////
struct CallToolResult {
    std::vector<JSONValue> content;  // Array of content items
    bool isError = false;
    std::optional<JSONValue> meta;   // serialized as _meta
};

// Builds a { type: "text", text } content item.
JSONValue MakeTextContent(const std::string& text);

// Renders { content: [...], isError?, _meta? }; isError is emitted only when true.
JSONValue SerializeCallToolResult(const CallToolResult& result);

// Current UTC time as ISO-8601 with milliseconds, e.g. 2025-01-01T12:00:00.000Z.
std::string MakeTimestamp();

///////////////////////////////////////// Method names ///////////////////////////////////////////
namespace Methods {
    // Client to server
    constexpr const char* Initialize = "initialize";
    constexpr const char* ListTools = "tools/list";
    constexpr const char* CallTool = "tools/call";
    constexpr const char* Ping = "ping";

    // Notifications
    constexpr const char* Initialized = "initialized";
    constexpr const char* InitializedAlias = "notifications/initialized";
    constexpr const char* Cancelled = "notifications/cancelled";
    constexpr const char* Connected = "notifications/connected";
}

} // namespace mcpgw
