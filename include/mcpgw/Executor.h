//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Executor.h
// Purpose: Abstract executor interface (out-of-process tool execution) and its message contract
//==========================================================================================================

#pragma once

#include <functional>
#include <future>
#include <optional>
#include <string>

#include "mcpgw/JSONRPCTypes.h"

namespace mcpgw {

//==========================================================================================================
// ExecutionRequest
// Purpose: Message sent to the executor for one client-side tool call.
// Wire shape: { requestId, toolName, parameters, clientId }
//==========================================================================================================
struct ExecutionRequest {
    std::string requestId;
    std::string toolName;
    JSONValue parameters;
    std::string clientId;

    JSONValue ToJSON() const;
    static std::optional<ExecutionRequest> FromJSON(const JSONValue& v);
};

//==========================================================================================================
// ExecutionReply
// Purpose: Executor answer for one ExecutionRequest.
// Wire shape: { requestId, success, result | error }
// Notes:
//   error may be a string or an object with a message member; errorMessage() normalizes both.
//==========================================================================================================
struct ExecutionReply {
    std::string requestId;
    bool success{false};
    std::optional<JSONValue> result;
    std::optional<JSONValue> error;

    // Failure text passed through verbatim: the error string, error.message, or the serialized error.
    std::string errorMessage() const;

    JSONValue ToJSON() const;
    static std::optional<ExecutionReply> FromJSON(const JSONValue& v);
};

//==========================================================================================================
// IExecutor
// Purpose: Injected collaborator that runs client-side tools. The gateway only sends execution requests
//          and consumes replies; it never inspects how the executor does the work.
// Notes:
//   Reply and error handlers may be invoked from an executor-owned thread. Consumers marshal onto their own
//   event loop.
//==========================================================================================================
class IExecutor {
public:
    using ReplyHandler = std::function<void(ExecutionReply reply)>;
    using ErrorHandler = std::function<void(const std::string& error)>;

    virtual ~IExecutor() = default;

    // Opens the out-of-band channel. Exceptional future on failure.
    virtual std::future<void> Start() = 0;

    // Closes the channel. Idempotent.
    virtual std::future<void> Stop() = 0;

    // True when an executor peer is attached and able to take work.
    virtual bool IsReady() const = 0;

    // Queues one execution request. Returns false when it could not be delivered.
    virtual bool Send(const ExecutionRequest& request) = 0;

    virtual void SetReplyHandler(ReplyHandler handler) = 0;
    virtual void SetErrorHandler(ErrorHandler handler) = 0;
};

} // namespace mcpgw
