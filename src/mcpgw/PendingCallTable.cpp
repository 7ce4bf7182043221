//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: PendingCallTable.cpp
// Purpose: Pending-call bookkeeping and the timer-backed call continuation
//==========================================================================================================

#include <utility>

#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

#include "logging/Logger.h"
#include "mcpgw/PendingCallTable.h"

namespace mcpgw {
namespace net = boost::asio;

ToolCallOutcome ToolCallOutcome::Success(JSONValue result) {
    ToolCallOutcome o;
    o.success = true;
    o.result = std::move(result);
    return o;
}

ToolCallOutcome ToolCallOutcome::Failure(errors::ToolCallError error) {
    ToolCallOutcome o;
    o.success = false;
    o.error = std::move(error);
    return o;
}

CallContinuation::CallContinuation(net::any_io_executor executor, std::chrono::milliseconds timeout)
    : deadline(executor) {
    deadline.expires_after(timeout);
}

bool CallContinuation::Settle(ToolCallOutcome result) {
    if (outcome.has_value()) {
        return false;
    }
    outcome = std::move(result);
    deadline.cancel();
    return true;
}

net::awaitable<void> CallContinuation::Wait() {
    if (outcome.has_value()) {
        co_return;
    }
    // operation_aborted means Settle() cancelled the deadline; success means the deadline passed.
    boost::system::error_code ec;
    co_await deadline.async_wait(net::redirect_error(net::use_awaitable, ec));
    co_return;
}

std::optional<ToolCallOutcome> CallContinuation::TakeOutcome() {
    std::optional<ToolCallOutcome> out = std::move(outcome);
    outcome.reset();
    return out;
}

bool PendingCallTable::Insert(PendingCall call) {
    std::lock_guard<std::mutex> lk(mutex);
    std::string key = call.id;
    auto [it, inserted] = calls.emplace(std::move(key), std::move(call));
    if (!inserted) {
        LOG_WARN("PendingCallTable: correlation id collision on {}", it->first);
    }
    return inserted;
}

std::optional<PendingCall> PendingCallTable::Take(const std::string& id) {
    std::lock_guard<std::mutex> lk(mutex);
    auto it = calls.find(id);
    if (it == calls.end()) {
        return std::nullopt;
    }
    PendingCall call = std::move(it->second);
    calls.erase(it);
    return call;
}

bool PendingCallTable::Contains(const std::string& id) const {
    std::lock_guard<std::mutex> lk(mutex);
    return calls.find(id) != calls.end();
}

std::size_t PendingCallTable::Size() const {
    std::lock_guard<std::mutex> lk(mutex);
    return calls.size();
}

std::vector<PendingCall> PendingCallTable::TakeAll() {
    std::lock_guard<std::mutex> lk(mutex);
    std::vector<PendingCall> out;
    out.reserve(calls.size());
    for (auto& [id, call] : calls) {
        out.push_back(std::move(call));
    }
    calls.clear();
    return out;
}

} // namespace mcpgw
