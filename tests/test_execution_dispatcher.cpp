//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_execution_dispatcher.cpp
// Purpose: ExecutionDispatcher routing, correlation, timeout and late-reply handling
//==========================================================================================================

#include <gtest/gtest.h>
#include <chrono>
#include <boost/asio/steady_timer.hpp>
#include "mcpgw/ExecutionDispatcher.h"
#include "FakeExecutor.h"

using namespace mcpgw;
using namespace mcpgw::test;
namespace net = boost::asio;
using namespace std::chrono_literals;

namespace {

ToolCatalog makeCatalog() {
    ToolCatalog catalog;

    ToolDescriptor remote;
    remote.name = "search_features";
    ParameterSpec q;
    q.name = "query";
    q.type = ParamType::String;
    q.required = true;
    remote.parameters = {q};
    catalog.Register(remote);

    ToolDescriptor local;
    local.name = "local_sum";
    local.site = ExecutionSite::ServerSide;
    local.handler = [](const JSONValue& args) {
        const JSONValue* a = FindMember(args, "a");
        const JSONValue* b = FindMember(args, "b");
        if (a == nullptr || b == nullptr) {
            throw std::runtime_error("a and b are required");
        }
        return JSONValue(std::get<int64_t>(a->value) + std::get<int64_t>(b->value));
    };
    catalog.Register(local);
    return catalog;
}

JSONValue queryArgs(const std::string& q) {
    JSONValue::Object obj;
    obj["query"] = std::make_shared<JSONValue>(q);
    obj["clientId"] = std::make_shared<JSONValue>("browser-1");
    return JSONValue{obj};
}

} // namespace

TEST(ExecutionDispatcher, NoExecutorFailsImmediately) {
    net::io_context ioc;
    ToolCatalog catalog = makeCatalog();
    ExecutionDispatcher dispatcher(ioc.get_executor(), catalog, nullptr);

    auto start = std::chrono::steady_clock::now();
    ToolCallOutcome out = RunToCompletion(ioc, dispatcher.CallTool("search_features", queryArgs("dnaA")));
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);

    ASSERT_FALSE(out.success);
    EXPECT_EQ(out.error->kind, errors::ToolErrorKind::NoClient);
    EXPECT_EQ(out.error->message, "No client connected");
    EXPECT_EQ(dispatcher.PendingCount(), 0u);
}

TEST(ExecutionDispatcher, ExecutorNotReadyFailsImmediately) {
    net::io_context ioc;
    ToolCatalog catalog = makeCatalog();
    auto fake = std::make_shared<FakeExecutor>(false);
    ExecutionDispatcher dispatcher(ioc.get_executor(), catalog, fake);

    ToolCallOutcome out = RunToCompletion(ioc, dispatcher.CallTool("search_features", queryArgs("dnaA")));
    ASSERT_FALSE(out.success);
    EXPECT_EQ(out.error->kind, errors::ToolErrorKind::NoClient);
    EXPECT_TRUE(fake->Sent().empty());
}

TEST(ExecutionDispatcher, ReplyResolvesCall) {
    net::io_context ioc;
    ToolCatalog catalog = makeCatalog();
    auto fake = std::make_shared<FakeExecutor>();
    fake->delayFn = [](const ExecutionRequest&) { return 5ms; };
    ExecutionDispatcher dispatcher(ioc.get_executor(), catalog, fake, ExecutionDispatcher::Options{2000ms});

    ToolCallOutcome out = RunToCompletion(ioc, dispatcher.CallTool("search_features", queryArgs("dnaA")));
    fake->JoinWorkers();

    ASSERT_TRUE(out.success) << (out.error ? out.error->message : "");
    EXPECT_EQ(StringAt(out.result, "tool"), "search_features");
    EXPECT_EQ(StringAt(Member(out.result, "echo"), "query"), "dnaA");

    auto sent = fake->Sent();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0].clientId, "browser-1");
    EXPECT_EQ(sent[0].requestId.rfind("mcp_", 0), 0u);
    EXPECT_EQ(dispatcher.PendingCount(), 0u);
    EXPECT_EQ(dispatcher.GetStats().completed, 1u);
}

// 30 ms timeout, executor answers after 60 ms: the call times out and the late reply is dropped
TEST(ExecutionDispatcher, TimeoutThenLateReplyIsDiscarded) {
    net::io_context ioc;
    ToolCatalog catalog = makeCatalog();
    auto fake = std::make_shared<FakeExecutor>();
    fake->delayFn = [](const ExecutionRequest&) { return 60ms; };
    ExecutionDispatcher dispatcher(ioc.get_executor(), catalog, fake, ExecutionDispatcher::Options{30ms});

    ToolCallOutcome out = RunToCompletion(ioc, dispatcher.CallTool("search_features", queryArgs("slow")));
    ASSERT_FALSE(out.success);
    EXPECT_EQ(out.error->kind, errors::ToolErrorKind::Timeout);
    EXPECT_EQ(out.error->message, "Tool execution timeout after 30 ms");
    EXPECT_GE(out.error->elapsedMs, 25);
    EXPECT_EQ(dispatcher.PendingCount(), 0u);

    // Let the stale reply arrive and be processed on the loop
    fake->JoinWorkers();
    ioc.restart();
    ioc.run();

    auto stats = dispatcher.GetStats();
    EXPECT_EQ(stats.timedOut, 1u);
    EXPECT_EQ(stats.discardedReplies, 1u);
    EXPECT_EQ(stats.completed, 0u);
}

TEST(ExecutionDispatcher, DuplicateReplyIsIgnored) {
    net::io_context ioc;
    ToolCatalog catalog = makeCatalog();
    auto fake = std::make_shared<FakeExecutor>();
    ExecutionDispatcher dispatcher(ioc.get_executor(), catalog, fake, ExecutionDispatcher::Options{2000ms});

    ToolCallOutcome out = RunToCompletion(ioc, dispatcher.CallTool("search_features", queryArgs("x")));
    fake->JoinWorkers();
    ASSERT_TRUE(out.success);

    // Same reply delivered again after resolution
    auto again = FakeExecutor::defaultReply(fake->Sent().front());
    fake->Deliver(*again);
    ioc.restart();
    ioc.run();
    EXPECT_EQ(dispatcher.GetStats().discardedReplies, 1u);
    EXPECT_EQ(dispatcher.GetStats().completed, 1u);
}

TEST(ExecutionDispatcher, ExecutorFailureIsPassedThrough) {
    net::io_context ioc;
    ToolCatalog catalog = makeCatalog();
    auto fake = std::make_shared<FakeExecutor>();
    fake->script = [](const ExecutionRequest& req) -> std::optional<ExecutionReply> {
        ExecutionReply reply;
        reply.requestId = req.requestId;
        reply.success = false;
        reply.error = JSONValue("Genome not loaded");
        return reply;
    };
    ExecutionDispatcher dispatcher(ioc.get_executor(), catalog, fake, ExecutionDispatcher::Options{2000ms});

    ToolCallOutcome out = RunToCompletion(ioc, dispatcher.CallTool("search_features", queryArgs("x")));
    fake->JoinWorkers();
    ASSERT_FALSE(out.success);
    EXPECT_EQ(out.error->kind, errors::ToolErrorKind::Executor);
    EXPECT_EQ(out.error->message, "Genome not loaded");
}

TEST(ExecutionDispatcher, SendFailureIsInternalError) {
    net::io_context ioc;
    ToolCatalog catalog = makeCatalog();
    auto fake = std::make_shared<FakeExecutor>();
    fake->failSends = true;
    ExecutionDispatcher dispatcher(ioc.get_executor(), catalog, fake);

    ToolCallOutcome out = RunToCompletion(ioc, dispatcher.CallTool("search_features", queryArgs("x")));
    ASSERT_FALSE(out.success);
    EXPECT_EQ(out.error->kind, errors::ToolErrorKind::Internal);
    EXPECT_EQ(dispatcher.PendingCount(), 0u);
}

TEST(ExecutionDispatcher, ValidationFailsBeforeDispatch) {
    net::io_context ioc;
    ToolCatalog catalog = makeCatalog();
    auto fake = std::make_shared<FakeExecutor>();
    ExecutionDispatcher dispatcher(ioc.get_executor(), catalog, fake);

    ToolCallOutcome missing = RunToCompletion(ioc, dispatcher.CallTool("search_features", JSONValue(nullptr)));
    ASSERT_FALSE(missing.success);
    EXPECT_EQ(missing.error->kind, errors::ToolErrorKind::Validation);
    EXPECT_EQ(missing.error->missingFields, std::vector<std::string>{"query"});

    ToolCallOutcome unknown = RunToCompletion(ioc, dispatcher.CallTool("frobnicate", JSONValue(nullptr)));
    ASSERT_FALSE(unknown.success);
    EXPECT_EQ(unknown.error->kind, errors::ToolErrorKind::UnknownTool);
    EXPECT_TRUE(fake->Sent().empty());
}

TEST(ExecutionDispatcher, ServerSideToolRunsInProcess) {
    net::io_context ioc;
    ToolCatalog catalog = makeCatalog();
    auto fake = std::make_shared<FakeExecutor>();
    ExecutionDispatcher dispatcher(ioc.get_executor(), catalog, fake);

    JSONValue::Object args;
    args["a"] = std::make_shared<JSONValue>(static_cast<int64_t>(2));
    args["b"] = std::make_shared<JSONValue>(static_cast<int64_t>(40));
    ToolCallOutcome ok = RunToCompletion(ioc, dispatcher.CallTool("local_sum", JSONValue{args}));
    ASSERT_TRUE(ok.success);
    EXPECT_EQ(std::get<int64_t>(ok.result.value), 42);

    ToolCallOutcome failed = RunToCompletion(ioc, dispatcher.CallTool("local_sum", JSONValue{JSONValue::Object{}}));
    ASSERT_FALSE(failed.success);
    EXPECT_EQ(failed.error->kind, errors::ToolErrorKind::Executor);
    EXPECT_TRUE(fake->Sent().empty());
}

TEST(ExecutionDispatcher, RejectAllSettlesPendingCalls) {
    net::io_context ioc;
    ToolCatalog catalog = makeCatalog();
    auto fake = std::make_shared<FakeExecutor>();
    fake->script = [](const ExecutionRequest&) -> std::optional<ExecutionReply> { return std::nullopt; };
    ExecutionDispatcher dispatcher(ioc.get_executor(), catalog, fake, ExecutionDispatcher::Options{10000ms});

    net::steady_timer shutdown(ioc);
    shutdown.expires_after(20ms);
    std::size_t rejected = 0;
    shutdown.async_wait([&](const boost::system::error_code&) { rejected = dispatcher.RejectAll("Server stopping"); });

    ToolCallOutcome out = RunToCompletion(ioc, dispatcher.CallTool("search_features", queryArgs("x")));
    EXPECT_EQ(rejected, 1u);
    ASSERT_FALSE(out.success);
    EXPECT_EQ(out.error->kind, errors::ToolErrorKind::Internal);
    EXPECT_EQ(out.error->message, "Server stopping");
}

TEST(ExecutionDispatcher, RejectsNonPositiveTimeout) {
    net::io_context ioc;
    ToolCatalog catalog = makeCatalog();
    EXPECT_THROW(ExecutionDispatcher(ioc.get_executor(), catalog, nullptr, ExecutionDispatcher::Options{0ms}),
                 std::invalid_argument);
}
