//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ExecutionDispatcher.cpp
// Purpose: tools/call validation, in-process execution, and executor request/reply correlation
//==========================================================================================================

#include <format>
#include <random>
#include <stdexcept>

#include <utility>

#include <boost/asio/post.hpp>
#include <boost/asio/this_coro.hpp>

#include "logging/Logger.h"
#include "mcpgw/ExecutionDispatcher.h"
#include "mcpgw/validation/ParameterValidator.h"

namespace mcpgw {
namespace net = boost::asio;

namespace {

// Attempts before giving up on finding a free correlation id.
constexpr int kMaxIdAttempts = 8;

std::int64_t elapsedSince(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();
}

errors::ToolCallError makeToolError(errors::ToolErrorKind kind, const std::string& toolName,
                                    std::string message, const JSONValue& arguments) {
    errors::ToolCallError err;
    err.kind = kind;
    err.toolName = toolName;
    err.message = std::move(message);
    err.arguments = arguments;
    return err;
}

} // namespace

ExecutionDispatcher::ExecutionDispatcher(net::any_io_executor loop,
                                         const ToolCatalog& catalog,
                                         std::shared_ptr<IExecutor> executor,
                                         Options opts)
    : loop(std::move(loop)), catalog(catalog), executor(std::move(executor)), opts(opts) {
    FUNC_SCOPE();
    if (this->opts.timeout.count() <= 0) {
        throw std::invalid_argument("ExecutionDispatcher: timeout must be positive");
    }
    if (this->executor) {
        this->executor->SetReplyHandler([this](ExecutionReply reply) {
            net::post(this->loop, [this, r = std::move(reply)]() mutable {
                HandleReply(std::move(r));
            });
        });
    }
}

ExecutionDispatcher::ExecutionDispatcher(net::any_io_executor loop,
                                         const ToolCatalog& catalog,
                                         std::shared_ptr<IExecutor> executor)
    : ExecutionDispatcher(std::move(loop), catalog, std::move(executor), Options{}) {}

ExecutionDispatcher::~ExecutionDispatcher() {
    FUNC_SCOPE();
    if (executor) {
        executor->SetReplyHandler(nullptr);
    }
}

bool ExecutionDispatcher::ExecutorReady() const {
    return executor && executor->IsReady();
}

ExecutionDispatcher::Stats ExecutionDispatcher::GetStats() const {
    Stats s;
    s.dispatched = dispatched.load();
    s.completed = completed.load();
    s.failed = failed.load();
    s.timedOut = timedOut.load();
    s.discardedReplies = discardedReplies.load();
    return s;
}

std::string ExecutionDispatcher::nextCorrelationId() {
    static constexpr char kAlphabet[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<int> pick(0, 35);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    std::string suffix(9, '0');
    for (char& ch : suffix) {
        ch = kAlphabet[pick(rng)];
    }
    return std::format("mcp_{}_{}", ms, suffix);
}

void ExecutionDispatcher::recordOutcome(const ToolCallOutcome& outcome) {
    if (outcome.success) {
        ++completed;
        return;
    }
    ++failed;
    if (outcome.error.has_value() && outcome.error->kind == errors::ToolErrorKind::Timeout) {
        ++timedOut;
    }
}

ToolCallOutcome ExecutionDispatcher::runInProcess(const ToolDescriptor& tool, const JSONValue& arguments) {
    try {
        return ToolCallOutcome::Success(tool.handler(arguments));
    } catch (const std::exception& e) {
        LOG_WARN("Server-side tool {} failed: {}", tool.name, e.what());
        return ToolCallOutcome::Failure(makeToolError(errors::ToolErrorKind::Executor, tool.name, e.what(), arguments));
    }
}

net::awaitable<ToolCallOutcome> ExecutionDispatcher::forward(const ToolDescriptor& tool, JSONValue arguments) {
    if (!ExecutorReady()) {
        co_return ToolCallOutcome::Failure(makeToolError(
            errors::ToolErrorKind::NoClient, tool.name, "No client connected", arguments));
    }

    auto continuation = std::make_shared<CallContinuation>(co_await net::this_coro::executor, opts.timeout);
    PendingCall call;
    call.toolName = tool.name;
    call.arguments = arguments;
    call.clientId = GetStringMember(arguments, "clientId").value_or(std::string());
    call.continuation = continuation;

    bool inserted = false;
    for (int attempt = 0; attempt < kMaxIdAttempts && !inserted; ++attempt) {
        call.id = nextCorrelationId();
        inserted = pending.Insert(call);
    }
    if (!inserted) {
        co_return ToolCallOutcome::Failure(makeToolError(
            errors::ToolErrorKind::Internal, tool.name, "Could not allocate a correlation id", arguments));
    }

    const std::string id = call.id;
    ExecutionRequest request;
    request.requestId = id;
    request.toolName = tool.name;
    request.parameters = arguments;
    request.clientId = call.clientId;

    LOG_DEBUG("Dispatching {} to executor as {}", tool.name, id);
    if (!executor->Send(request)) {
        (void)pending.Take(id);
        co_return ToolCallOutcome::Failure(makeToolError(
            errors::ToolErrorKind::Internal, tool.name, "Failed to send execution request to executor", arguments));
    }

    co_await continuation->Wait();

    if (auto settled = continuation->TakeOutcome()) {
        co_return std::move(*settled);
    }

    // Deadline passed without a settlement. Only the path that removes the entry may report.
    if (auto expired = pending.Take(id)) {
        errors::ToolCallError err = makeToolError(
            errors::ToolErrorKind::Timeout, tool.name,
            std::format("Tool execution timeout after {} ms", opts.timeout.count()), arguments);
        err.elapsedMs = elapsedSince(expired->createdAt);
        LOG_WARN("Tool {} ({}) timed out after {} ms", tool.name, id, err.elapsedMs);
        co_return ToolCallOutcome::Failure(std::move(err));
    }

    // Entry already taken by a settling path whose outcome has not been stored; treat as internal.
    co_return ToolCallOutcome::Failure(makeToolError(
        errors::ToolErrorKind::Internal, tool.name, "Call settled without an outcome", arguments));
}

net::awaitable<ToolCallOutcome> ExecutionDispatcher::CallTool(std::string toolName, JSONValue arguments) {
    const auto start = std::chrono::steady_clock::now();
    if (arguments.IsNull()) {
        arguments = JSONValue{JSONValue::Object{}};
    }
    ++dispatched;

    ToolCallOutcome outcome;
    if (auto invalid = validation::validateToolArguments(catalog, toolName, arguments)) {
        outcome = ToolCallOutcome::Failure(std::move(*invalid));
    } else {
        const ToolDescriptor* tool = catalog.Find(toolName);
        if (tool->site == ExecutionSite::ServerSide) {
            outcome = runInProcess(*tool, arguments);
        } else {
            outcome = co_await forward(*tool, std::move(arguments));
        }
    }

    outcome.elapsed = std::chrono::milliseconds(elapsedSince(start));
    recordOutcome(outcome);
    co_return outcome;
}

void ExecutionDispatcher::HandleReply(ExecutionReply reply) {
    auto call = pending.Take(reply.requestId);
    if (!call.has_value()) {
        ++discardedReplies;
        LOG_WARN("Discarding executor reply for unknown or expired request {}", reply.requestId);
        return;
    }

    ToolCallOutcome outcome;
    if (reply.success) {
        outcome = ToolCallOutcome::Success(reply.result.value_or(JSONValue(nullptr)));
    } else {
        outcome = ToolCallOutcome::Failure(makeToolError(
            errors::ToolErrorKind::Executor, call->toolName, reply.errorMessage(), call->arguments));
    }
    LOG_DEBUG("Executor reply for {} ({}) after {} ms", call->toolName, call->id, elapsedSince(call->createdAt));
    (void)call->continuation->Settle(std::move(outcome));
}

std::size_t ExecutionDispatcher::RejectAll(const std::string& reason) {
    auto calls = pending.TakeAll();
    for (auto& call : calls) {
        (void)call.continuation->Settle(ToolCallOutcome::Failure(makeToolError(
            errors::ToolErrorKind::Internal, call.toolName, reason, call.arguments)));
    }
    if (!calls.empty()) {
        LOG_INFO("Rejected {} pending tool call(s): {}", calls.size(), reason);
    }
    return calls.size();
}

} // namespace mcpgw
