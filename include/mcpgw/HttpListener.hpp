//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HttpListener.hpp
// Purpose: Coroutine-based HTTP/HTTPS listener hosting the one-shot HTTP adapter and the SSE streaming
//          adapter (Boost.Beast, TLS 1.3 only for HTTPS)
//==========================================================================================================

#pragma once

#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <string>

#include <boost/asio/io_context.hpp>

#include "mcpgw/ConnectionRegistry.h"
#include "mcpgw/GatewayCore.h"
#include "mcpgw/ProtocolSession.h"

namespace mcpgw {

//==========================================================================================================
// HttpListener
// Purpose: Routes
//   POST /  and POST /sse                      one JSON-RPC envelope in, one response out (HTTP adapter)
//   GET  /  and GET  /sse                      text/event-stream channel (streaming adapter)
//   POST /messages?sessionId=<id>              companion channel for a stream: 202, reply pushed on the stream
//   POST /sse?sessionId=<id>                   same as /messages
//   GET  /health                               liveness JSON
//   GET  /mcp                                  server info JSON
//   OPTIONS *                                  CORS preflight (204)
// Status mapping for the HTTP adapter:
//   200 response, 204 notification, 400 parse error / invalid envelope, 500 handler fault,
//   404 unknown path, 405 wrong verb. Every response carries Access-Control-Allow-Origin: *.
// Notes:
//   Runs on the caller's io_context. Close() must be invoked on that io_context.
//==========================================================================================================
class HttpListener {
public:
    //==========================================================================================================
    // Options
    // Fields:
    //   address: Bind address (default: 127.0.0.1)
    //   port: Listen port; "0" picks an ephemeral port (see Port())
    //   scheme: "http" or "https" (TLS 1.3 only for https)
    //   certFile/keyFile: PEM files required when scheme == https
    //   keepAlive: Interval of ": keepalive" comments on idle streams (0 disables)
    //==========================================================================================================
    struct Options {
        std::string address{"127.0.0.1"};
        std::string port{"3002"};
        std::string scheme{"http"};
        std::string certFile;
        std::string keyFile;
        std::chrono::milliseconds keepAlive{15000};
    };

    using JsonProvider = std::function<JSONValue()>;
    using ErrorHandler = std::function<void(const std::string& error)>;

    //==========================================================================================================
    // Args:
    //   ioc: Event loop shared with the rest of the gateway.
    //   core: Method handling.
    //   registry: Connection bookkeeping (streams register as Streaming, exchanges as Http).
    //   httpSession: Process-wide handshake state used by every one-shot HTTP exchange.
    //   opts: Listener options.
    // Throws:
    //   std::runtime_error when https is requested and the certificate or key cannot be loaded.
    //==========================================================================================================
    HttpListener(boost::asio::io_context& ioc,
                 GatewayCore& core,
                 ConnectionRegistry& registry,
                 std::shared_ptr<ProtocolSession> httpSession,
                 const Options& opts);
    ~HttpListener();

    //==========================================================================================================
    // Binds the listening socket and starts accepting.
    // Returns:
    //   Future that is ready once bound, or exceptional when the port is invalid or cannot be bound.
    //==========================================================================================================
    std::future<void> Start();

    // Stops accepting and ends every open stream.
    void Close();

    // Bound port (valid after Start()).
    unsigned short Port() const;

    // Number of open event streams.
    std::size_t StreamCount() const;

    void SetHealthProvider(JsonProvider provider);
    void SetInfoProvider(JsonProvider provider);
    void SetErrorHandler(ErrorHandler handler);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcpgw
