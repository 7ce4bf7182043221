//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: WebSocketListener.hpp
// Purpose: Socket adapter: JSON-RPC over WebSocket text frames (Boost.Beast)
//==========================================================================================================

#pragma once

#include <functional>
#include <future>
#include <memory>
#include <string>

#include <boost/asio/io_context.hpp>

#include "mcpgw/ConnectionRegistry.h"
#include "mcpgw/GatewayCore.h"

namespace mcpgw {

//==========================================================================================================
// WebSocketListener
// Purpose: Accepts WebSocket connections; every text frame is one envelope handled concurrently with the
//          others on the same socket, so responses may leave in any order and carry their request id.
// Notes:
//   - One ProtocolSession per socket, discarded on close.
//   - On connect the client receives a notifications/connected notification
//     { status: "connected", serverId, capabilities }.
//   - Frames that are not JSON are answered with -32700 and id null; the socket stays open.
//   - Close() must run on the io_context.
//==========================================================================================================
class WebSocketListener {
public:
    struct Options {
        std::string address{"127.0.0.1"};
        std::string port{"3003"};
        std::string serverId{"mcp-tool-gateway"};
    };

    using ErrorHandler = std::function<void(const std::string& error)>;

    WebSocketListener(boost::asio::io_context& ioc,
                      GatewayCore& core,
                      ConnectionRegistry& registry,
                      const Options& opts);
    ~WebSocketListener();

    // Binds and starts accepting. Exceptional future when the port is invalid or cannot be bound.
    std::future<void> Start();

    // Stops accepting and closes every socket.
    void Close();

    unsigned short Port() const;
    std::size_t SocketCount() const;

    void SetErrorHandler(ErrorHandler handler);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcpgw
