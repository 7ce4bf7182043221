//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Gateway.h
// Purpose: Composition root: catalog, dispatcher, executor, connection registry and all three adapters on
//          one event loop
//==========================================================================================================

#pragma once

#include <functional>
#include <future>
#include <memory>
#include <string>

#include <boost/asio/any_io_executor.hpp>

#include "mcpgw/ConnectionRegistry.h"
#include "mcpgw/ExecutionDispatcher.h"
#include "mcpgw/Executor.h"
#include "mcpgw/GatewayConfig.h"
#include "mcpgw/ToolCatalog.h"

namespace mcpgw {

//==========================================================================================================
// Gateway
// Purpose: Owns every long-lived piece of state for one gateway instance. Tests construct a fresh Gateway
//          per case (ports "0" pick ephemeral ports; see HttpPort()/WsPort()).
// Notes:
//   - Start() starts the executor (when present), binds both listeners and runs the event loop thread.
//   - Stop() rejects pending calls with "Server stopping", closes the listeners, stops the loop and the
//     executor. Do not call Stop() from a handler running on the loop.
//   - An exception escaping a handler ends the event loop; the fatal handler is told and the owner is
//     expected to Stop() and exit.
//==========================================================================================================
class Gateway {
public:
    using ErrorHandler = std::function<void(const std::string& error)>;

    //==========================================================================================================
    // Args:
    //   config: Listener, timeout and protocol settings.
    //   catalog: Tools to expose; moved into the gateway.
    //   executor: Out-of-process executor; null means every client-side tool fails with NoClient.
    // Throws:
    //   std::invalid_argument on invalid timeout; std::runtime_error when TLS material cannot be loaded.
    //==========================================================================================================
    Gateway(GatewayConfig config, ToolCatalog catalog, std::shared_ptr<IExecutor> executor);
    ~Gateway();

    Gateway(const Gateway&) = delete;
    Gateway& operator=(const Gateway&) = delete;

    // Exceptional future when the executor cannot start or a listener cannot bind.
    std::future<void> Start();

    // Graceful shutdown. Idempotent.
    std::future<void> Stop();

    bool IsRunning() const;

    unsigned short HttpPort() const;
    unsigned short WsPort() const;

    // { isInitialized, activeConnections, wsConnections, sseConnections, httpConnections, pendingRequests,
    //   executorReady, protocolVersion, clientInfo, stats }
    JSONValue Status() const;

    // Liveness document served at GET /health.
    JSONValue Health() const;

    // Server description served at GET /mcp.
    JSONValue Info() const;

    const ToolCatalog& Catalog() const;
    const ConnectionRegistry& Connections() const;
    ExecutionDispatcher::Stats DispatcherStats() const;

    void SetErrorHandler(ErrorHandler handler);

    // Set before Start(). Invoked once, on the loop thread, after the loop has stopped serving.
    void SetFatalHandler(ErrorHandler handler);

    // Executor of the gateway's event loop; work posted here runs on the loop thread.
    boost::asio::any_io_executor GetExecutor();

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcpgw
