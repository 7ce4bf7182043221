//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SharedMemoryExecutor.hpp
// Purpose: Cross-process executor channel built on Boost.Interprocess message queues
//==========================================================================================================

#pragma once

#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <string>

#include "mcpgw/ConnectionRegistry.h"
#include "mcpgw/Executor.h"

namespace mcpgw {

//==========================================================================================================
// SharedMemoryChannelOptions
// Purpose: Channel identity and queue sizing shared by both ends.
// Fields:
//   channelName: Base name. Two queues are derived: "<channelName>_exec" (gateway -> executor) and
//                "<channelName>_reply" (executor -> gateway).
//   create: When true, create (and on stop remove) the queues. The gateway side normally creates.
//   maxMessageSize: Maximum bytes per message when creating queues (default: 1 MiB).
//   maxMessageCount: Maximum buffered messages per queue when creating (default: 256).
//   clientId: Identity announced by the executor side in its ready message.
//   heartbeatInterval: Executor side. Period of { "type": "heartbeat" } messages; 0 disables them.
//   livenessTimeout: Gateway side. An executor not heard from (ready or heartbeat) for this long is
//                    detached; 0 keeps executors attached until they send stopped.
//==========================================================================================================
struct SharedMemoryChannelOptions {
    std::string channelName;
    bool create{false};
    std::size_t maxMessageSize{1024ull * 1024ull};
    unsigned int maxMessageCount{256u};
    std::string clientId{"executor"};
    std::chrono::milliseconds heartbeatInterval{1000};
    std::chrono::milliseconds livenessTimeout{5000};
};

//==========================================================================================================
// ParseSharedMemoryChannelConfig
// Purpose: Parses "shm://<channel>?create=true&maxSize=<bytes>&maxCount=<n>&clientId=<id>&heartbeatMs=<ms>
//          &livenessMs=<ms>" or a bare "<channel>[?query]". Unknown parameters are ignored; an empty channel
//          defaults to "mcpgw-exec".
//==========================================================================================================
SharedMemoryChannelOptions ParseSharedMemoryChannelConfig(const std::string& config);

//==========================================================================================================
// SharedMemoryExecutor
// Purpose: Gateway-side IExecutor. Sends ExecutionRequest JSON on "_exec" and receives ExecutionReply JSON
//          and control messages on "_reply" from a background receive thread.
// Control messages (executor -> gateway):
//   { "type": "ready", "clientId": "<id>" }     attaches an executor (IsReady() becomes true)
//   { "type": "heartbeat", "clientId": "<id>" } keeps it attached (re-attaches one that had expired)
//   { "type": "stopped", "clientId": "<id>" }   detaches it
// An executor that goes silent for livenessTimeout is detached, so a crashed peer turns into NoClient.
//==========================================================================================================
class SharedMemoryExecutor : public IExecutor {
public:
    explicit SharedMemoryExecutor(const SharedMemoryChannelOptions& opts);
    ~SharedMemoryExecutor() override;

    std::future<void> Start() override;
    std::future<void> Stop() override;
    bool IsReady() const override;
    bool Send(const ExecutionRequest& request) override;
    void SetReplyHandler(ReplyHandler handler) override;
    void SetErrorHandler(ErrorHandler handler) override;

    // Attached executors (kind Executor).
    const ConnectionRegistry& Executors() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

//==========================================================================================================
// SharedMemoryExecutorHost
// Purpose: Executor-side endpoint. Opens (or creates) the channel, announces ready, sends heartbeats, runs a
//          handler per ExecutionRequest and sends the ExecutionReply back. Announces stopped on Stop().
//==========================================================================================================
class SharedMemoryExecutorHost {
public:
    using RequestHandler = std::function<ExecutionReply(const ExecutionRequest& request)>;

    explicit SharedMemoryExecutorHost(const SharedMemoryChannelOptions& opts);
    ~SharedMemoryExecutorHost();

    // Handler must be set before Start(). Exceptions thrown by it become failed replies.
    void SetRequestHandler(RequestHandler handler);

    std::future<void> Start();
    std::future<void> Stop();

    // Sends an arbitrary reply (for executors that answer asynchronously).
    bool SendReply(const ExecutionReply& reply);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcpgw
