//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: mcpgw_echo_executor: reference executor that answers every request with its own parameters
//==========================================================================================================

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <string>
#include <thread>

#include <utility>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "mcpgw/GatewayConfig.h"
#include "mcpgw/SharedMemoryExecutor.hpp"

using namespace mcpgw;

int main(int argc, char** argv) {
    FUNC_SCOPE();
    Logger::configureFromEnvironment();

    std::string channel = GetEnvOrDefault("MCPGW_EXECUTOR_CHANNEL", "mcpgw-exec");
    if (auto v = GetArgValue(argc, argv, "--executor"); v.has_value()) {
        channel = v.value();
    }
    SharedMemoryChannelOptions opts = ParseSharedMemoryChannelConfig(channel);
    opts.create = false;
    if (auto v = GetArgValue(argc, argv, "--client-id"); v.has_value()) {
        opts.clientId = v.value();
    }

    // Optional artificial latency, handy for exercising gateway timeouts
    int delayMs = 0;
    if (auto v = GetArgValue(argc, argv, "--delay-ms"); v.has_value()) {
        try {
            delayMs = std::stoi(v.value());
        } catch (const std::exception& e) {
            LOG_WARN("Ignoring invalid --delay-ms '{}': {}", v.value(), e.what());
        }
    }

    SharedMemoryExecutorHost host(opts);
    host.SetRequestHandler([delayMs](const ExecutionRequest& req) {
        LOG_INFO("Executing {} ({})", req.toolName, req.requestId);
        if (delayMs > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(delayMs));
        }
        JSONValue::Object result;
        result["tool"] = std::make_shared<JSONValue>(req.toolName);
        result["echo"] = std::make_shared<JSONValue>(req.parameters);
        ExecutionReply reply;
        reply.requestId = req.requestId;
        reply.success = true;
        reply.result = JSONValue{result};
        return reply;
    });

    try {
        host.Start().get();
    } catch (const std::exception& e) {
        LOG_ERROR("Cannot attach to executor channel {}: {}", opts.channelName, e.what());
        return EXIT_FAILURE;
    }
    LOG_INFO("Echo executor '{}' attached to {}", opts.clientId, opts.channelName);

    boost::asio::io_context ioc;
    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([](const boost::system::error_code&, int) {});
    ioc.run();

    host.Stop().get();
    return EXIT_SUCCESS;
}
