//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_sse_adapter.cpp
// Purpose: Streaming (SSE) adapter: endpoint event, companion POST and pushed replies
//==========================================================================================================

#include <gtest/gtest.h>
#include <thread>
#include "GatewayFixture.h"

using namespace mcpgw;
using namespace mcpgw::test;
using namespace std::chrono_literals;

namespace {

// Polls until pred() holds or two seconds pass.
template <typename Pred>
bool eventually(Pred pred) {
    const auto deadline = std::chrono::steady_clock::now() + 2s;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(5ms);
    }
    return pred();
}

} // namespace

using SseAdapter = GatewayTest;

TEST_F(SseAdapter, EndpointEventThenRepliesOnStream) {
    StartGateway();
    SseReader stream(gateway->HttpPort());
    EXPECT_NE(stream.headers.find("text/event-stream"), std::string::npos);

    SseReader::Event endpoint = stream.Next();
    ASSERT_EQ(endpoint.name, "endpoint");
    ASSERT_EQ(endpoint.data.rfind("/messages?sessionId=", 0), 0u);
    EXPECT_TRUE(eventually([this]() { return gateway->Connections().Count(TransportKind::Streaming) == 1; }));

    HttpResult ack = HttpPost(gateway->HttpPort(), endpoint.data,
        R"({"jsonrpc":"2.0","method":"initialize","params":{"protocolVersion":"2024-11-05"},"id":"init-1"})");
    EXPECT_EQ(ack.status, 202);
    EXPECT_EQ(StringAt(ParseJSON(ack.body), "status"), "accepted");

    SseReader::Event message = stream.Next();
    ASSERT_EQ(message.name, "message");
    JSONValue v = ParseJSON(message.data);
    EXPECT_EQ(StringAt(v, "id"), "init-1");
    EXPECT_EQ(StringAt(Member(v, "result"), "protocolVersion"), "2024-11-05");
}

TEST_F(SseAdapter, ToolCallResultIsPushed) {
    StartGateway();
    SseReader stream(gateway->HttpPort(), "/");
    SseReader::Event endpoint = stream.Next();
    ASSERT_EQ(endpoint.name, "endpoint");

    // The legacy companion path on /sse accepts the same sessionId
    const std::string sessionId = endpoint.data.substr(endpoint.data.find('=') + 1);
    HttpResult ack = HttpPost(gateway->HttpPort(), "/sse?sessionId=" + sessionId,
        R"({"jsonrpc":"2.0","method":"tools/call","params":{"name":"get_genome_info","arguments":{}},"id":"abc123"})");
    EXPECT_EQ(ack.status, 202);

    SseReader::Event message = stream.Next();
    JSONValue v = ParseJSON(message.data);
    EXPECT_EQ(StringAt(v, "id"), "abc123");
    EXPECT_EQ(FindMember(Member(v, "result"), "isError"), nullptr);
}

TEST_F(SseAdapter, DisconnectIsNoticedOnKeepalive) {
    config.sseKeepAlive = 20ms;
    StartGateway();
    {
        SseReader stream(gateway->HttpPort());
        (void)stream.Next();
        ASSERT_TRUE(eventually([this]() { return gateway->Connections().Count(TransportKind::Streaming) == 1; }));
        stream.Close();
    }
    EXPECT_TRUE(eventually([this]() { return gateway->Connections().Count(TransportKind::Streaming) == 0; }));
}

TEST_F(SseAdapter, DisconnectIsNoticedWithoutKeepalive) {
    // Arrange: keepalive off, so nothing is ever written to an idle stream
    config.sseKeepAlive = 0ms;
    StartGateway();
    std::string endpointPath;
    {
        SseReader stream(gateway->HttpPort());
        SseReader::Event endpoint = stream.Next();
        ASSERT_EQ(endpoint.name, "endpoint");
        endpointPath = endpoint.data;
        ASSERT_TRUE(eventually([this]() { return gateway->Connections().Count(TransportKind::Streaming) == 1; }));

        // Act
        stream.Close();
    }

    // Assert: the registry entry and the session route are both gone
    EXPECT_TRUE(eventually([this]() { return gateway->Connections().Count(TransportKind::Streaming) == 0; }));
    HttpResult late = HttpPost(gateway->HttpPort(), endpointPath,
        R"({"jsonrpc":"2.0","method":"ping","id":1})");
    EXPECT_EQ(late.status, 404);
}
