//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: GatewayConfig.h
// Purpose: Gateway settings loaded from MCPGW_* environment variables and --key=value arguments
//==========================================================================================================

#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "mcpgw/GatewayCore.h"
#include "mcpgw/Protocol.h"

namespace mcpgw {

//==========================================================================================================
// GatewayConfig
// Purpose: Every tunable of the gateway process.
//   Setting                 Env                         CLI                   Default
//   address                 MCPGW_ADDRESS               --address             127.0.0.1
//   httpPort                MCPGW_HTTP_PORT             --http-port           3002
//   wsPort                  MCPGW_WS_PORT               --ws-port             3003
//   scheme                  MCPGW_HTTP_SCHEME           --scheme              http
//   certFile / keyFile      MCPGW_TLS_CERT/MCPGW_TLS_KEY --cert / --key       (empty)
//   toolTimeout             MCPGW_TOOL_TIMEOUT_MS       --tool-timeout-ms     30000
//   handshakePolicy         MCPGW_HANDSHAKE_POLICY      --handshake           lenient
//   protocolVersion         MCPGW_PROTOCOL_VERSION      --protocol-version    2024-11-05
//   executorChannel         MCPGW_EXECUTOR_CHANNEL      --executor            (empty: no executor)
//   sseKeepAlive            MCPGW_SSE_KEEPALIVE_MS      --sse-keepalive-ms    15000 (0 = off)
//   serverName              MCPGW_SERVER_NAME           --name                mcp-tool-gateway
// Notes:
//   Invalid values are logged at WARN and the previous value is kept.
//==========================================================================================================
struct GatewayConfig {
    std::string address{"127.0.0.1"};
    std::string httpPort{"3002"};
    std::string wsPort{"3003"};
    std::string scheme{"http"};
    std::string certFile;
    std::string keyFile;
    std::chrono::milliseconds toolTimeout{DEFAULT_TOOL_TIMEOUT_MS};
    HandshakePolicy handshakePolicy{HandshakePolicy::Lenient};
    std::string protocolVersion{DEFAULT_PROTOCOL_VERSION};
    std::string executorChannel;
    std::chrono::milliseconds sseKeepAlive{15000};
    std::string serverName{"mcp-tool-gateway"};
    std::string serverVersion;

    GatewayConfig();

    // Overlays MCPGW_* environment variables onto this config.
    void ApplyEnvironment();

    // Overlays --key=value arguments onto this config.
    void ApplyArguments(int argc, char** argv);

    // Defaults, then environment, then arguments.
    static GatewayConfig Load(int argc, char** argv);
};

// Returns the value of --key=value from argv, or std::nullopt.
std::optional<std::string> GetArgValue(int argc, char** argv, const std::string& key);

} // namespace mcpgw
