//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_shared_memory_executor.cpp
// Purpose: Boost.Interprocess executor bridge: ready/stopped control, request and reply flow
//==========================================================================================================

#include <gtest/gtest.h>
#include <future>
#include <thread>
#include <unistd.h>
#include <boost/interprocess/ipc/message_queue.hpp>
#include "mcpgw/ExecutionDispatcher.h"
#include "mcpgw/SharedMemoryExecutor.hpp"
#include "FakeExecutor.h"

using namespace mcpgw;
using namespace std::chrono_literals;

namespace {

std::string uniqueChannel(const std::string& tag) {
    return "mcpgw-test-" + tag + "-" + std::to_string(::getpid());
}

template <typename Pred>
bool eventually(Pred pred) {
    const auto deadline = std::chrono::steady_clock::now() + 3s;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(5ms);
    }
    return pred();
}

} // namespace

TEST(SharedMemoryExecutor, ParseChannelConfig) {
    auto o = ParseSharedMemoryChannelConfig("shm://genome?create=true&maxSize=4096&maxCount=8&clientId=browser-7");
    EXPECT_EQ(o.channelName, "genome");
    EXPECT_TRUE(o.create);
    EXPECT_EQ(o.maxMessageSize, 4096u);
    EXPECT_EQ(o.maxMessageCount, 8u);
    EXPECT_EQ(o.clientId, "browser-7");

    auto timing = ParseSharedMemoryChannelConfig("genome?heartbeatMs=250&livenessMs=0");
    EXPECT_EQ(timing.heartbeatInterval, 250ms);
    EXPECT_EQ(timing.livenessTimeout, 0ms);

    auto bare = ParseSharedMemoryChannelConfig("");
    EXPECT_EQ(bare.channelName, "mcpgw-exec");
    EXPECT_FALSE(bare.create);
}

TEST(SharedMemoryExecutor, HostFailsWithoutGatewayQueues) {
    SharedMemoryChannelOptions opts;
    opts.channelName = uniqueChannel("absent");
    SharedMemoryExecutorHost host(opts);
    host.SetRequestHandler([](const ExecutionRequest& r) {
        ExecutionReply reply;
        reply.requestId = r.requestId;
        reply.success = true;
        return reply;
    });
    EXPECT_THROW(host.Start().get(), std::runtime_error);
}

TEST(SharedMemoryExecutor, RequestReplyRoundTrip) {
    SharedMemoryChannelOptions gwOpts;
    gwOpts.channelName = uniqueChannel("rt");
    gwOpts.create = true;
    SharedMemoryExecutor executor(gwOpts);

    std::promise<ExecutionReply> got;
    executor.SetReplyHandler([&got](ExecutionReply reply) { got.set_value(std::move(reply)); });
    executor.Start().get();
    EXPECT_FALSE(executor.IsReady());

    SharedMemoryChannelOptions hostOpts;
    hostOpts.channelName = gwOpts.channelName;
    hostOpts.clientId = "browser-1";
    SharedMemoryExecutorHost host(hostOpts);
    host.SetRequestHandler([](const ExecutionRequest& req) {
        ExecutionReply reply;
        reply.requestId = req.requestId;
        reply.success = true;
        JSONValue::Object result;
        result["tool"] = std::make_shared<JSONValue>(req.toolName);
        reply.result = JSONValue{result};
        return reply;
    });
    host.Start().get();

    ASSERT_TRUE(eventually([&executor]() { return executor.IsReady(); }));
    EXPECT_EQ(executor.Executors().Count(TransportKind::Executor), 1u);

    ExecutionRequest req;
    req.requestId = "mcp_1_abc";
    req.toolName = "jump_to_gene";
    req.parameters = JSONValue{JSONValue::Object{}};
    ASSERT_TRUE(executor.Send(req));

    auto fut = got.get_future();
    ASSERT_EQ(fut.wait_for(3s), std::future_status::ready);
    ExecutionReply reply = fut.get();
    EXPECT_EQ(reply.requestId, "mcp_1_abc");
    EXPECT_TRUE(reply.success);
    ASSERT_TRUE(reply.result.has_value());
    EXPECT_EQ(std::get<std::string>(FindMember(*reply.result, "tool")->value), "jump_to_gene");

    host.Stop().get();
    EXPECT_TRUE(eventually([&executor]() { return !executor.IsReady(); }));
    executor.Stop().get();
    EXPECT_FALSE(executor.Send(req));
}

TEST(SharedMemoryExecutor, HandlerExceptionBecomesFailedReply) {
    SharedMemoryChannelOptions gwOpts;
    gwOpts.channelName = uniqueChannel("throw");
    gwOpts.create = true;
    SharedMemoryExecutor executor(gwOpts);
    std::promise<ExecutionReply> got;
    executor.SetReplyHandler([&got](ExecutionReply reply) { got.set_value(std::move(reply)); });
    executor.Start().get();

    SharedMemoryChannelOptions hostOpts;
    hostOpts.channelName = gwOpts.channelName;
    SharedMemoryExecutorHost host(hostOpts);
    host.SetRequestHandler([](const ExecutionRequest&) -> ExecutionReply {
        throw std::runtime_error("Genome not loaded");
    });
    host.Start().get();
    ASSERT_TRUE(eventually([&executor]() { return executor.IsReady(); }));

    ExecutionRequest req;
    req.requestId = "mcp_2_def";
    req.toolName = "get_genome_info";
    req.parameters = JSONValue{JSONValue::Object{}};
    ASSERT_TRUE(executor.Send(req));

    auto fut = got.get_future();
    ASSERT_EQ(fut.wait_for(3s), std::future_status::ready);
    ExecutionReply reply = fut.get();
    EXPECT_FALSE(reply.success);
    EXPECT_EQ(reply.errorMessage(), "Genome not loaded");

    host.Stop().get();
    executor.Stop().get();
}

TEST(SharedMemoryExecutor, SilentExecutorIsDetachedAndCallsFailFast) {
    // Arrange: gateway side with a short liveness window
    SharedMemoryChannelOptions gwOpts;
    gwOpts.channelName = uniqueChannel("silent");
    gwOpts.create = true;
    gwOpts.livenessTimeout = 200ms;
    auto executor = std::make_shared<SharedMemoryExecutor>(gwOpts);
    executor->Start().get();

    // A peer that announces ready and then dies: no heartbeat, no stopped message
    {
        boost::interprocess::message_queue replyQueue(boost::interprocess::open_only,
                                                      (gwOpts.channelName + "_reply").c_str());
        const std::string ready = R"({"type":"ready","clientId":"crashed-browser"})";
        replyQueue.send(ready.data(), ready.size(), 0);
    }
    ASSERT_TRUE(eventually([&executor]() { return executor->IsReady(); }));

    // Act
    EXPECT_TRUE(eventually([&executor]() { return !executor->IsReady(); }));

    // Assert: a client-side call now fails with NoClient instead of waiting for the deadline
    boost::asio::io_context ioc;
    ToolCatalog catalog;
    ToolDescriptor remote;
    remote.name = "get_genome_info";
    catalog.Register(remote);
    ExecutionDispatcher dispatcher(ioc.get_executor(), catalog, executor);

    const auto start = std::chrono::steady_clock::now();
    ToolCallOutcome out = mcpgw::test::RunToCompletion(ioc,
        dispatcher.CallTool("get_genome_info", JSONValue{JSONValue::Object{}}));
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);
    ASSERT_FALSE(out.success);
    EXPECT_EQ(out.error->kind, errors::ToolErrorKind::NoClient);
    EXPECT_EQ(executor->Executors().Count(TransportKind::Executor), 0u);

    executor->Stop().get();
}

TEST(SharedMemoryExecutor, HeartbeatKeepsExecutorAttached) {
    SharedMemoryChannelOptions gwOpts;
    gwOpts.channelName = uniqueChannel("beat");
    gwOpts.create = true;
    gwOpts.livenessTimeout = 300ms;
    SharedMemoryExecutor executor(gwOpts);
    executor.Start().get();

    SharedMemoryChannelOptions hostOpts;
    hostOpts.channelName = gwOpts.channelName;
    hostOpts.heartbeatInterval = 50ms;
    SharedMemoryExecutorHost host(hostOpts);
    host.SetRequestHandler([](const ExecutionRequest& r) {
        ExecutionReply reply;
        reply.requestId = r.requestId;
        reply.success = true;
        return reply;
    });
    host.Start().get();
    ASSERT_TRUE(eventually([&executor]() { return executor.IsReady(); }));

    // Well past the liveness window
    std::this_thread::sleep_for(900ms);
    EXPECT_TRUE(executor.IsReady());

    host.Stop().get();
    EXPECT_TRUE(eventually([&executor]() { return !executor.IsReady(); }));
    executor.Stop().get();
}

TEST(ExecutionMessages, ReplyErrorShapes) {
    ExecutionReply asString;
    asString.error = JSONValue("boom");
    EXPECT_EQ(asString.errorMessage(), "boom");

    JSONValue::Object obj;
    obj["message"] = std::make_shared<JSONValue>("nested boom");
    ExecutionReply asObject;
    asObject.error = JSONValue{obj};
    EXPECT_EQ(asObject.errorMessage(), "nested boom");

    auto parsed = ExecutionReply::FromJSON(ParseJSON(R"({"requestId":"r1","success":true,"result":{"x":1}})"));
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->requestId, "r1");
    EXPECT_TRUE(parsed->success);
    EXPECT_FALSE(ExecutionReply::FromJSON(ParseJSON(R"({"success":true})")).has_value());
}
