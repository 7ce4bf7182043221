//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: mcpgw_server: MCP tool-call gateway over HTTP, SSE and WebSocket
//==========================================================================================================

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <memory>

#include <utility>

#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/signal_set.hpp>

#include "logging/Logger.h"
#include "mcpgw/BuiltinCatalog.h"
#include "mcpgw/Gateway.h"
#include "mcpgw/GatewayConfig.h"
#include "mcpgw/SharedMemoryExecutor.hpp"

using namespace mcpgw;

namespace {

void onTerminate() {
    std::exception_ptr ep = std::current_exception();
    if (ep) {
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            LOG_FATAL("Unhandled exception: {}", e.what());
        }
    }
    LOG_FATAL("Terminated without an active exception");
}

std::shared_ptr<IExecutor> makeExecutor(const GatewayConfig& cfg) {
    if (cfg.executorChannel.empty()) {
        LOG_WARN("No executor channel configured; client-side tools will fail with NoClient");
        return nullptr;
    }
    SharedMemoryChannelOptions opts = ParseSharedMemoryChannelConfig(cfg.executorChannel);
    // The gateway owns the queues
    opts.create = true;
    LOG_INFO("Executor channel: {}", opts.channelName);
    return std::make_shared<SharedMemoryExecutor>(opts);
}

} // namespace

int main(int argc, char** argv) {
    FUNC_SCOPE();
    std::set_terminate(onTerminate);
    Logger::configureFromEnvironment();

    GatewayConfig cfg = GatewayConfig::Load(argc, argv);

    boost::asio::io_context signalsIoc;
    boost::asio::signal_set signals(signalsIoc, SIGINT, SIGTERM);
    std::atomic<bool> failed{false};

    std::unique_ptr<Gateway> gateway;
    try {
        // Throws when TLS material cannot be loaded or a setting is unusable
        gateway = std::make_unique<Gateway>(cfg, MakeBuiltinCatalog(), makeExecutor(cfg));
        gateway->SetErrorHandler([](const std::string& err) {
            LOG_WARN("Gateway reported: {}", err);
        });
        gateway->SetFatalHandler([&failed, &signalsIoc, &signals](const std::string& err) {
            LOG_ERROR("Gateway cannot continue: {}", err);
            failed.store(true);
            boost::asio::post(signalsIoc, [&signals]() {
                boost::system::error_code ec;
                signals.cancel(ec);
            });
        });
        gateway->Start().get();
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start gateway: {}", e.what());
        return EXIT_FAILURE;
    }

    const std::string scheme = cfg.scheme;
    LOG_INFO("Streaming endpoint: {}://{}:{}/sse", scheme, cfg.address, gateway->HttpPort());
    LOG_INFO("HTTP endpoint:      {}://{}:{}/", scheme, cfg.address, gateway->HttpPort());
    LOG_INFO("WebSocket endpoint: ws://{}:{}", cfg.address, gateway->WsPort());
    LOG_INFO("Health:             {}://{}:{}/health", scheme, cfg.address, gateway->HttpPort());

    signals.async_wait([](const boost::system::error_code& ec, int signo) {
        if (!ec) {
            LOG_INFO("Received signal {}, shutting down", signo);
        }
    });
    signalsIoc.run();

    gateway->Stop().get();
    return failed.load() ? EXIT_FAILURE : EXIT_SUCCESS;
}
