//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ExecutionDispatcher.h
// Purpose: Validates tool calls and routes them in-process or to the executor with reply correlation
//==========================================================================================================

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include <utility>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>

#include "mcpgw/Executor.h"
#include "mcpgw/PendingCallTable.h"
#include "mcpgw/Protocol.h"
#include "mcpgw/ToolCatalog.h"

namespace mcpgw {

//==========================================================================================================
// ExecutionDispatcher
// Purpose: The single tools/call path shared by every transport.
// Flow:
//   1. validate against the catalog (Validation / UnknownTool tool errors)
//   2. ServerSide tools: run the in-process handler inline
//   3. ClientSide tools: NoClient when no executor is attached; otherwise allocate a correlation id, insert a
//      PendingCall, send { requestId, toolName, parameters, clientId } and await the reply or the timeout
// Notes:
//   Runs on one event loop. Executor replies arrive on the executor's own thread and are posted onto that
//   loop before they touch the pending-call table. Reply, timeout and shutdown race through
//   PendingCallTable::Take(); the loser is a no-op (late replies are logged and counted, never delivered).
//==========================================================================================================
class ExecutionDispatcher {
public:
    struct Options {
        std::chrono::milliseconds timeout{DEFAULT_TOOL_TIMEOUT_MS};
    };

    struct Stats {
        std::uint64_t dispatched{0};
        std::uint64_t completed{0};
        std::uint64_t failed{0};
        std::uint64_t timedOut{0};
        std::uint64_t discardedReplies{0};
    };

    //==========================================================================================================
    // Args:
    //   loop: Executor of the event loop that owns the pending-call table.
    //   catalog: Tool registry (must outlive the dispatcher).
    //   executor: Out-of-process executor; may be null (every client-side call then fails with NoClient).
    //   opts: Timeout policy.
    //==========================================================================================================
    ExecutionDispatcher(boost::asio::any_io_executor loop,
                        const ToolCatalog& catalog,
                        std::shared_ptr<IExecutor> executor,
                        Options opts);
    ExecutionDispatcher(boost::asio::any_io_executor loop,
                        const ToolCatalog& catalog,
                        std::shared_ptr<IExecutor> executor);
    ~ExecutionDispatcher();

    ExecutionDispatcher(const ExecutionDispatcher&) = delete;
    ExecutionDispatcher& operator=(const ExecutionDispatcher&) = delete;

    //==========================================================================================================
    // CallTool
    // Purpose: Runs one tool call to completion. Never throws for tool-level failures; those are returned as
    //          ToolCallOutcome::error.
    // Args:
    //   toolName: Requested tool.
    //   arguments: Call arguments (null treated as {}).
    //==========================================================================================================
    boost::asio::awaitable<ToolCallOutcome> CallTool(std::string toolName, JSONValue arguments);

    // Correlates one executor reply. Must run on the loop. Unknown ids are discarded with a warning.
    void HandleReply(ExecutionReply reply);

    // Fails every pending call with an Internal tool error carrying reason. Must run on the loop.
    std::size_t RejectAll(const std::string& reason);

    bool ExecutorReady() const;
    std::size_t PendingCount() const { return pending.Size(); }
    Stats GetStats() const;

    std::chrono::milliseconds Timeout() const { return opts.timeout; }

private:
    std::string nextCorrelationId();
    ToolCallOutcome runInProcess(const ToolDescriptor& tool, const JSONValue& arguments);
    boost::asio::awaitable<ToolCallOutcome> forward(const ToolDescriptor& tool, JSONValue arguments);
    void recordOutcome(const ToolCallOutcome& outcome);

    boost::asio::any_io_executor loop;
    const ToolCatalog& catalog;
    std::shared_ptr<IExecutor> executor;
    Options opts;
    PendingCallTable pending;

    std::atomic<std::uint64_t> dispatched{0};
    std::atomic<std::uint64_t> completed{0};
    std::atomic<std::uint64_t> failed{0};
    std::atomic<std::uint64_t> timedOut{0};
    std::atomic<std::uint64_t> discardedReplies{0};
};

} // namespace mcpgw
