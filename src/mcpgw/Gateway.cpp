//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Gateway.cpp
// Purpose: Gateway lifecycle, wiring and diagnostics
//==========================================================================================================

#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>
#include <thread>

#include <utility>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>

#include "logging/Logger.h"
#include "mcpgw/Gateway.h"
#include "mcpgw/GatewayCore.h"
#include "mcpgw/HttpListener.hpp"
#include "mcpgw/ProtocolSession.h"
#include "mcpgw/WebSocketListener.hpp"

namespace mcpgw {
namespace net = boost::asio;

namespace {

// Time given to rejected calls to flush their responses before sockets are closed.
constexpr std::chrono::milliseconds kShutdownGrace{100};

// Upper bound on waiting for the in-loop shutdown sequence.
constexpr std::chrono::seconds kShutdownTimeout{5};

JSONValue count(std::size_t n) {
    return JSONValue(static_cast<int64_t>(n));
}

} // namespace

class Gateway::Impl {
public:
    GatewayConfig config;
    ToolCatalog catalog;
    std::shared_ptr<IExecutor> executor;

    net::io_context ioc;
    std::optional<net::executor_work_guard<net::io_context::executor_type>> work;
    std::thread loopThread;
    std::atomic<bool> running{false};
    std::atomic<bool> loopAlive{false};
    std::mutex lifecycleMutex;

    ConnectionRegistry registry;
    // HTTP is connectionless: one handshake state for the whole process, never reset per request.
    std::shared_ptr<ProtocolSession> httpSession{std::make_shared<ProtocolSession>("http")};
    ExecutionDispatcher dispatcher;
    GatewayCore core;
    HttpListener httpListener;
    WebSocketListener wsListener;

    ErrorHandler errorHandler;
    ErrorHandler fatalHandler;

    Impl(GatewayConfig cfg, ToolCatalog cat, std::shared_ptr<IExecutor> exec)
        : config(std::move(cfg)),
          catalog(std::move(cat)),
          executor(std::move(exec)),
          dispatcher(ioc.get_executor(), catalog, executor, ExecutionDispatcher::Options{config.toolTimeout}),
          core(catalog, dispatcher, coreOptions(config)),
          httpListener(ioc, core, registry, httpSession, httpOptions(config)),
          wsListener(ioc, core, registry, wsOptions(config)) {}

    static GatewayCore::Options coreOptions(const GatewayConfig& c) {
        GatewayCore::Options o;
        o.serverInfo = Implementation(c.serverName, c.serverVersion, "MCP multi-transport tool-call gateway");
        o.defaultProtocolVersion = c.protocolVersion;
        o.handshakePolicy = c.handshakePolicy;
        return o;
    }

    static HttpListener::Options httpOptions(const GatewayConfig& c) {
        HttpListener::Options o;
        o.address = c.address;
        o.port = c.httpPort;
        o.scheme = c.scheme;
        o.certFile = c.certFile;
        o.keyFile = c.keyFile;
        o.keepAlive = c.sseKeepAlive;
        return o;
    }

    static WebSocketListener::Options wsOptions(const GatewayConfig& c) {
        WebSocketListener::Options o;
        o.address = c.address;
        o.port = c.wsPort;
        o.serverId = c.serverName;
        return o;
    }

    void reportError(const std::string& msg) {
        if (errorHandler) { errorHandler(msg); }
    }

    bool isInitialized() const {
        return httpSession->IsReady() || registry.ReadySessionCount() > 0;
    }

    net::awaitable<void> shutdownSequence() {
        dispatcher.RejectAll("Server stopping");
        net::steady_timer grace(ioc);
        grace.expires_after(kShutdownGrace);
        boost::system::error_code ec;
        co_await grace.async_wait(net::redirect_error(net::use_awaitable, ec));
        httpListener.Close();
        wsListener.Close();
        co_return;
    }

    void stopLoop() {
        work.reset();
        ioc.stop();
        if (loopThread.joinable()) {
            loopThread.join();
        }
    }
};

Gateway::Gateway(GatewayConfig config, ToolCatalog catalog, std::shared_ptr<IExecutor> executor)
    : pImpl(std::make_unique<Impl>(std::move(config), std::move(catalog), std::move(executor))) {
    FUNC_SCOPE();
    pImpl->httpListener.SetHealthProvider([this]() { return Health(); });
    pImpl->httpListener.SetInfoProvider([this]() { return Info(); });
    pImpl->httpListener.SetErrorHandler([this](const std::string& e) { pImpl->reportError(e); });
    pImpl->wsListener.SetErrorHandler([this](const std::string& e) { pImpl->reportError(e); });
    if (pImpl->executor) {
        pImpl->executor->SetErrorHandler([this](const std::string& e) {
            LOG_ERROR("Executor error: {}", e);
            pImpl->reportError(e);
        });
    }
}

Gateway::~Gateway() {
    FUNC_SCOPE();
    if (pImpl->running.load()) {
        Stop().get();
    }
}

std::future<void> Gateway::Start() {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lk(pImpl->lifecycleMutex);
    std::promise<void> ready;
    if (pImpl->running.load()) {
        ready.set_value();
        return ready.get_future();
    }

    try {
        if (pImpl->executor) {
            pImpl->executor->Start().get();
        }
        pImpl->httpListener.Start().get();
        pImpl->wsListener.Start().get();
    } catch (const std::exception& e) {
        LOG_ERROR("Gateway failed to start: {}", e.what());
        pImpl->httpListener.Close();
        pImpl->wsListener.Close();
        if (pImpl->executor) {
            pImpl->executor->Stop().get();
        }
        ready.set_exception(std::current_exception());
        return ready.get_future();
    }

    pImpl->ioc.restart();
    pImpl->work.emplace(net::make_work_guard(pImpl->ioc));
    pImpl->running.store(true);
    pImpl->loopAlive.store(true);
    pImpl->loopThread = std::thread([this]() {
        try {
            pImpl->ioc.run();
        } catch (const std::exception& e) {
            pImpl->loopAlive.store(false);
            LOG_ERROR("Gateway event loop stopped by an unhandled error: {}", e.what());
            if (pImpl->fatalHandler) {
                pImpl->fatalHandler(e.what());
            }
            return;
        }
        pImpl->loopAlive.store(false);
    });

    LOG_INFO("Gateway {} {} ready: http={} ws={} tools={} executor={} handshake={}",
             pImpl->config.serverName, pImpl->config.serverVersion, pImpl->httpListener.Port(),
             pImpl->wsListener.Port(), pImpl->catalog.Size(), pImpl->executor ? "attached" : "none",
             HandshakePolicyName(pImpl->config.handshakePolicy));
    ready.set_value();
    return ready.get_future();
}

std::future<void> Gateway::Stop() {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lk(pImpl->lifecycleMutex);
    std::promise<void> done;
    if (!pImpl->running.exchange(false)) {
        done.set_value();
        return done.get_future();
    }

    LOG_INFO("Gateway stopping ({} pending call(s))", pImpl->dispatcher.PendingCount());
    if (pImpl->loopAlive.load()) {
        auto drained = std::make_shared<std::promise<void>>();
        auto drainedFuture = drained->get_future();
        net::co_spawn(pImpl->ioc, pImpl->shutdownSequence(), [drained](std::exception_ptr) {
            drained->set_value();
        });
        if (drainedFuture.wait_for(kShutdownTimeout) != std::future_status::ready) {
            LOG_WARN("Gateway shutdown sequence did not finish in time; stopping the loop");
        }
    } else {
        // Loop already ended on a fatal error; nothing will run the shutdown sequence
        pImpl->dispatcher.RejectAll("Server stopping");
        pImpl->httpListener.Close();
        pImpl->wsListener.Close();
    }
    pImpl->stopLoop();

    if (pImpl->executor) {
        try {
            pImpl->executor->Stop().get();
        } catch (const std::exception& e) {
            LOG_WARN("Executor stop failed: {}", e.what());
        }
    }
    LOG_INFO("Gateway stopped");
    done.set_value();
    return done.get_future();
}

bool Gateway::IsRunning() const {
    return pImpl->running.load();
}

unsigned short Gateway::HttpPort() const {
    return pImpl->httpListener.Port();
}

unsigned short Gateway::WsPort() const {
    return pImpl->wsListener.Port();
}

const ToolCatalog& Gateway::Catalog() const {
    return pImpl->catalog;
}

const ConnectionRegistry& Gateway::Connections() const {
    return pImpl->registry;
}

ExecutionDispatcher::Stats Gateway::DispatcherStats() const {
    return pImpl->dispatcher.GetStats();
}

void Gateway::SetErrorHandler(ErrorHandler handler) {
    pImpl->errorHandler = std::move(handler);
}

void Gateway::SetFatalHandler(ErrorHandler handler) {
    pImpl->fatalHandler = std::move(handler);
}

net::any_io_executor Gateway::GetExecutor() {
    return pImpl->ioc.get_executor();
}

JSONValue Gateway::Status() const {
    const ConnectionRegistry& reg = pImpl->registry;
    const ExecutionDispatcher::Stats stats = pImpl->dispatcher.GetStats();

    JSONValue::Object statsObj;
    statsObj["dispatched"] = std::make_shared<JSONValue>(static_cast<int64_t>(stats.dispatched));
    statsObj["completed"] = std::make_shared<JSONValue>(static_cast<int64_t>(stats.completed));
    statsObj["failed"] = std::make_shared<JSONValue>(static_cast<int64_t>(stats.failed));
    statsObj["timedOut"] = std::make_shared<JSONValue>(static_cast<int64_t>(stats.timedOut));
    statsObj["discardedReplies"] = std::make_shared<JSONValue>(static_cast<int64_t>(stats.discardedReplies));

    const std::string version = pImpl->httpSession->ProtocolVersion();
    JSONValue::Object obj;
    obj["isInitialized"] = std::make_shared<JSONValue>(pImpl->isInitialized());
    obj["activeConnections"] = std::make_shared<JSONValue>(count(reg.Count()));
    obj["wsConnections"] = std::make_shared<JSONValue>(count(reg.Count(TransportKind::Socket)));
    obj["sseConnections"] = std::make_shared<JSONValue>(count(reg.Count(TransportKind::Streaming)));
    obj["httpConnections"] = std::make_shared<JSONValue>(count(reg.Count(TransportKind::Http)));
    obj["pendingRequests"] = std::make_shared<JSONValue>(count(pImpl->dispatcher.PendingCount()));
    obj["executorReady"] = std::make_shared<JSONValue>(pImpl->dispatcher.ExecutorReady());
    obj["protocolVersion"] = std::make_shared<JSONValue>(version.empty() ? pImpl->config.protocolVersion : version);
    obj["clientInfo"] = std::make_shared<JSONValue>(pImpl->httpSession->ClientInfo().value_or(JSONValue(nullptr)));
    obj["stats"] = std::make_shared<JSONValue>(statsObj);
    return JSONValue{obj};
}

JSONValue Gateway::Health() const {
    const ConnectionRegistry& reg = pImpl->registry;

    JSONValue::Object connections;
    connections["total"] = std::make_shared<JSONValue>(count(reg.Count()));
    connections["sse"] = std::make_shared<JSONValue>(count(reg.Count(TransportKind::Streaming)));
    connections["websocket"] = std::make_shared<JSONValue>(count(reg.Count(TransportKind::Socket)));
    connections["http"] = std::make_shared<JSONValue>(count(reg.Count(TransportKind::Http)));

    JSONValue::Object obj;
    obj["status"] = std::make_shared<JSONValue>("healthy");
    obj["timestamp"] = std::make_shared<JSONValue>(MakeTimestamp());
    obj["server"] = std::make_shared<JSONValue>(
        SerializeImplementation(Implementation(pImpl->config.serverName, pImpl->config.serverVersion)));
    obj["isInitialized"] = std::make_shared<JSONValue>(pImpl->isInitialized());
    obj["executorReady"] = std::make_shared<JSONValue>(pImpl->dispatcher.ExecutorReady());
    obj["pendingRequests"] = std::make_shared<JSONValue>(count(pImpl->dispatcher.PendingCount()));
    obj["connections"] = std::make_shared<JSONValue>(connections);
    return JSONValue{obj};
}

JSONValue Gateway::Info() const {
    const GatewayCore::Options& opts = pImpl->core.GetOptions();

    JSONValue::Object transports;
    transports["http"] = std::make_shared<JSONValue>("POST /");
    transports["sse"] = std::make_shared<JSONValue>("GET /sse");
    transports["messages"] = std::make_shared<JSONValue>("POST /messages?sessionId=<id>");
    transports["websocket"] = std::make_shared<JSONValue>(
        "ws://" + pImpl->config.address + ":" + std::to_string(pImpl->wsListener.Port()));

    JSONValue::Object obj;
    obj["name"] = std::make_shared<JSONValue>(opts.serverInfo.name);
    obj["version"] = std::make_shared<JSONValue>(opts.serverInfo.version);
    obj["description"] = std::make_shared<JSONValue>(opts.serverInfo.description);
    obj["protocolVersion"] = std::make_shared<JSONValue>(opts.defaultProtocolVersion);
    obj["capabilities"] = std::make_shared<JSONValue>(SerializeServerCapabilities(opts.capabilities));
    obj["toolCount"] = std::make_shared<JSONValue>(count(pImpl->catalog.Size()));
    obj["tools"] = std::make_shared<JSONValue>(pImpl->catalog.Statistics());
    obj["transports"] = std::make_shared<JSONValue>(transports);
    obj["status"] = std::make_shared<JSONValue>(pImpl->isInitialized() ? "ready" : "initializing");
    return JSONValue{obj};
}

} // namespace mcpgw
