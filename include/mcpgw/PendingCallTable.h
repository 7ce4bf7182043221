//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: PendingCallTable.h
// Purpose: In-flight client-side tool calls keyed by correlation id, and the continuation each one awaits
//==========================================================================================================

#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <utility>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>

#include "mcpgw/JSONRPCTypes.h"
#include "mcpgw/errors/Errors.h"

namespace mcpgw {

//==========================================================================================================
// ToolCallOutcome
// Purpose: Final result of one tools/call as seen by the protocol layer.
// Fields:
//   success: True when result holds the tool result; false when error is set.
//   result: Tool result (null when none was provided).
//   error: Structured tool-level failure.
//   elapsed: Wall time from dispatch to settlement.
//==========================================================================================================
struct ToolCallOutcome {
    bool success{false};
    JSONValue result;
    std::optional<errors::ToolCallError> error;
    std::chrono::milliseconds elapsed{0};

    static ToolCallOutcome Success(JSONValue result);
    static ToolCallOutcome Failure(errors::ToolCallError error);
};

//==========================================================================================================
// CallContinuation
// Purpose: Rendezvous between the coroutine awaiting a client-side call and whoever settles it (reply
//          handler or shutdown). Bounded by a deadline armed at construction.
// Notes:
//   Event-loop only. Settle() stores the outcome and wakes the waiter; a second Settle() is ignored and
//   reports false. Wait() returns when settled or when the deadline passes, whichever comes first.
//==========================================================================================================
class CallContinuation {
public:
    CallContinuation(boost::asio::any_io_executor executor, std::chrono::milliseconds timeout);

    // Returns false when the continuation was already settled.
    bool Settle(ToolCallOutcome outcome);

    bool IsSettled() const { return outcome.has_value(); }

    boost::asio::awaitable<void> Wait();

    // Moves the stored outcome out (std::nullopt when not settled).
    std::optional<ToolCallOutcome> TakeOutcome();

private:
    boost::asio::steady_timer deadline;
    std::optional<ToolCallOutcome> outcome;
};

//==========================================================================================================
// PendingCall
// Purpose: One in-flight client-side tool invocation.
//==========================================================================================================
struct PendingCall {
    std::string id;
    std::string toolName;
    JSONValue arguments;
    std::string clientId;
    std::chrono::steady_clock::time_point createdAt{std::chrono::steady_clock::now()};
    std::shared_ptr<CallContinuation> continuation;
};

//==========================================================================================================
// PendingCallTable
// Purpose: Correlation id -> PendingCall.
// Notes:
//   Take() is the single removal point: reply, timeout and shutdown paths all call it and only the caller
//   that gets the entry back may settle the continuation. The table is mutated on the event loop; the
//   mutex makes Size()/Contains() safe for diagnostics from other threads.
//==========================================================================================================
class PendingCallTable {
public:
    // Returns false (and leaves the table unchanged) when the id is already present.
    bool Insert(PendingCall call);

    // Removes and returns the entry, or std::nullopt when absent.
    std::optional<PendingCall> Take(const std::string& id);

    bool Contains(const std::string& id) const;
    std::size_t Size() const;

    // Removes every entry (shutdown).
    std::vector<PendingCall> TakeAll();

private:
    mutable std::mutex mutex;
    std::unordered_map<std::string, PendingCall> calls;
};

} // namespace mcpgw
