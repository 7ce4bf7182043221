//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_connection_registry.cpp
// Purpose: ConnectionRegistry bookkeeping and protocol session state machine
//==========================================================================================================

#include <gtest/gtest.h>
#include "mcpgw/ConnectionRegistry.h"
#include "mcpgw/ProtocolSession.h"

using namespace mcpgw;

namespace {

ConnectionInfo conn(const std::string& id, TransportKind kind, std::shared_ptr<ProtocolSession> session = nullptr) {
    ConnectionInfo info;
    info.id = id;
    info.kind = kind;
    info.remote = "127.0.0.1:1";
    info.session = std::move(session);
    return info;
}

} // namespace

TEST(ConnectionRegistry, AddRemoveCount) {
    ConnectionRegistry reg;
    EXPECT_FALSE(reg.IsAnyoneConnected());
    EXPECT_TRUE(reg.Add(conn("ws-1", TransportKind::Socket)));
    EXPECT_FALSE(reg.Add(conn("ws-1", TransportKind::Socket)));
    EXPECT_TRUE(reg.Add(conn("sse-1", TransportKind::Streaming)));
    EXPECT_EQ(reg.Count(), 2u);
    EXPECT_EQ(reg.Count(TransportKind::Socket), 1u);
    EXPECT_EQ(reg.Count(TransportKind::Http), 0u);
    EXPECT_TRUE(reg.IsAnyoneConnected());

    EXPECT_TRUE(reg.Remove("ws-1"));
    EXPECT_FALSE(reg.Remove("ws-1"));
    EXPECT_FALSE(reg.Contains("ws-1"));
    EXPECT_EQ(reg.Snapshot().size(), 1u);
}

TEST(ConnectionRegistry, ReadySessionCount) {
    ConnectionRegistry reg;
    auto ready = std::make_shared<ProtocolSession>("a");
    ready->OnInitialize(std::nullopt, "2024-11-05");
    ready->OnInitialized();
    reg.Add(conn("a", TransportKind::Socket, ready));
    reg.Add(conn("b", TransportKind::Socket, std::make_shared<ProtocolSession>("b")));
    reg.Add(conn("c", TransportKind::Executor));
    EXPECT_EQ(reg.ReadySessionCount(), 1u);
}

TEST(ConnectionRegistry, ConnectionIdsAreUniqueAndPrefixed) {
    const std::string a = MakeConnectionId("ws");
    const std::string b = MakeConnectionId("ws");
    EXPECT_NE(a, b);
    EXPECT_EQ(a.rfind("ws-", 0), 0u);
    EXPECT_STREQ(TransportKindName(TransportKind::Streaming), "sse");
}

TEST(ProtocolSession, HandshakeTransitions) {
    ProtocolSession s("s1");
    EXPECT_EQ(s.State(), SessionState::Uninitialized);

    JSONValue::Object params;
    params["protocolVersion"] = std::make_shared<JSONValue>("2025-03-26");
    JSONValue::Object info;
    info["name"] = std::make_shared<JSONValue>("test");
    params["clientInfo"] = std::make_shared<JSONValue>(info);
    EXPECT_EQ(s.OnInitialize(JSONValue{params}, "2024-11-05"), "2025-03-26");
    EXPECT_EQ(s.State(), SessionState::AwaitingInitializedAck);
    EXPECT_TRUE(s.ClientInfo().has_value());

    EXPECT_TRUE(s.OnInitialized());
    EXPECT_TRUE(s.IsReady());
    // Repeated acknowledgements are no-ops
    EXPECT_FALSE(s.OnInitialized());
    EXPECT_FALSE(s.OnInitialized());
    EXPECT_TRUE(s.IsReady());
}

TEST(ProtocolSession, DefaultVersionWhenClientOmitsIt) {
    ProtocolSession s("s2");
    EXPECT_EQ(s.OnInitialize(std::nullopt, "2024-11-05"), "2024-11-05");
    EXPECT_EQ(s.ProtocolVersion(), "2024-11-05");
}
