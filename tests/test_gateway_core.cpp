//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_gateway_core.cpp
// Purpose: Shared JSON-RPC dispatch core: handshake, method switch and tools/call rendering
//==========================================================================================================

#include <gtest/gtest.h>
#include "mcpgw/BuiltinCatalog.h"
#include "mcpgw/GatewayCore.h"
#include "FakeExecutor.h"

using namespace mcpgw;
using namespace mcpgw::test;
namespace net = boost::asio;
using namespace std::chrono_literals;

namespace {

struct CoreFixture {
    net::io_context ioc;
    ToolCatalog catalog{MakeBuiltinCatalog()};
    std::shared_ptr<FakeExecutor> fake{std::make_shared<FakeExecutor>()};
    ExecutionDispatcher dispatcher;
    GatewayCore core;
    std::shared_ptr<ProtocolSession> session{std::make_shared<ProtocolSession>("test")};

    explicit CoreFixture(HandshakePolicy policy = HandshakePolicy::Lenient)
        : dispatcher(ioc.get_executor(), catalog, fake, ExecutionDispatcher::Options{2000ms}),
          core(catalog, dispatcher, options(policy)) {}

    static GatewayCore::Options options(HandshakePolicy policy) {
        GatewayCore::Options o;
        o.handshakePolicy = policy;
        return o;
    }

    EnvelopeOutcome send(const std::string& text) {
        EnvelopeOutcome out = RunToCompletion(ioc, core.HandleEnvelope(text, session, TransportKind::Http));
        fake->JoinWorkers();
        return out;
    }

    JSONValue sendParsed(const std::string& text) {
        EnvelopeOutcome out = send(text);
        if (!out.reply.has_value()) {
            throw std::runtime_error("no reply");
        }
        return ParseJSON(*out.reply);
    }

    void handshake() {
        (void)send(R"({"jsonrpc":"2.0","method":"initialize","params":{"protocolVersion":"2024-11-05"},"id":0})");
        (void)send(R"({"jsonrpc":"2.0","method":"initialized"})");
    }
};

} // namespace

TEST(GatewayCore, InitializeReturnsVersionAndServerInfo) {
    CoreFixture f;
    JSONValue v = f.sendParsed(
        R"({"jsonrpc":"2.0","method":"initialize","params":{"protocolVersion":"2024-11-05","clientInfo":{"name":"test"}},"id":1})");
    EXPECT_EQ(IntAt(v, "id"), 1);
    const JSONValue& result = Member(v, "result");
    EXPECT_EQ(StringAt(result, "protocolVersion"), "2024-11-05");
    EXPECT_FALSE(StringAt(Member(result, "serverInfo"), "name").empty());
    EXPECT_NE(FindMember(Member(result, "capabilities"), "tools"), nullptr);
    EXPECT_EQ(f.session->State(), SessionState::AwaitingInitializedAck);
}

TEST(GatewayCore, ToolsListServedBeforeHandshake) {
    CoreFixture f;
    EnvelopeOutcome out = f.send(R"({"jsonrpc":"2.0","method":"tools/list","id":2})");
    EXPECT_EQ(out.status, EnvelopeOutcome::Status::Ok);
    JSONValue v = ParseJSON(*out.reply);
    const auto& tools = std::get<JSONValue::Array>(Member(Member(v, "result"), "tools").value);
    EXPECT_FALSE(tools.empty());
    EXPECT_EQ(tools.size(), f.catalog.Size());
}

TEST(GatewayCore, StrictPolicyRejectsBeforeHandshake) {
    CoreFixture f(HandshakePolicy::Strict);
    JSONValue v = f.sendParsed(R"({"jsonrpc":"2.0","method":"tools/list","id":2})");
    EXPECT_EQ(IntAt(Member(v, "error"), "code"), JSONRPCErrorCodes::ServerNotInitialized);

    f.handshake();
    JSONValue after = f.sendParsed(R"({"jsonrpc":"2.0","method":"tools/list","id":3})");
    EXPECT_NE(FindMember(after, "result"), nullptr);
}

TEST(GatewayCore, UnknownMethodIsMethodNotFound) {
    CoreFixture f;
    JSONValue v = f.sendParsed(R"({"jsonrpc":"2.0","method":"frobnicate","id":7})");
    EXPECT_EQ(IntAt(Member(v, "error"), "code"), -32601);
    EXPECT_EQ(IntAt(v, "id"), 7);
}

TEST(GatewayCore, ParseAndInvalidEnvelopes) {
    CoreFixture f;
    EnvelopeOutcome bad = f.send("{oops");
    EXPECT_EQ(bad.status, EnvelopeOutcome::Status::ParseError);
    JSONValue v = ParseJSON(*bad.reply);
    EXPECT_EQ(IntAt(Member(v, "error"), "code"), -32700);
    EXPECT_TRUE(Member(v, "id").IsNull());

    EnvelopeOutcome invalid = f.send(R"({"jsonrpc":"2.0","id":"q"})");
    EXPECT_EQ(invalid.status, EnvelopeOutcome::Status::InvalidRequest);
    JSONValue iv = ParseJSON(*invalid.reply);
    EXPECT_EQ(IntAt(Member(iv, "error"), "code"), -32600);
    EXPECT_EQ(StringAt(iv, "id"), "q");
}

TEST(GatewayCore, InitializedIsIdempotent) {
    CoreFixture f;
    f.handshake();
    ASSERT_TRUE(f.session->IsReady());

    for (int i = 0; i < 3; ++i) {
        EnvelopeOutcome out = f.send(R"({"jsonrpc":"2.0","method":"notifications/initialized"})");
        EXPECT_EQ(out.status, EnvelopeOutcome::Status::Notification);
        EXPECT_FALSE(out.reply.has_value());
        EXPECT_TRUE(f.session->IsReady());
    }
    JSONValue v = f.sendParsed(R"({"jsonrpc":"2.0","method":"tools/list","id":9})");
    EXPECT_NE(FindMember(v, "result"), nullptr);
}

TEST(GatewayCore, InitializedAsRequestGetsEmptyResult) {
    CoreFixture f;
    JSONValue v = f.sendParsed(R"({"jsonrpc":"2.0","method":"initialized","id":5})");
    EXPECT_TRUE(Member(v, "result").IsObject());
    EXPECT_TRUE(f.session->IsReady());
}

TEST(GatewayCore, PingReportsState) {
    CoreFixture f;
    JSONValue v = f.sendParsed(R"({"jsonrpc":"2.0","method":"ping","id":"p"})");
    const JSONValue& r = Member(v, "result");
    EXPECT_EQ(StringAt(r, "status"), "ok");
    EXPECT_FALSE(BoolAt(r, "serverReady"));
    EXPECT_TRUE(BoolAt(r, "executorReady"));
    EXPECT_EQ(StringAt(r, "state"), "uninitialized");
    EXPECT_FALSE(StringAt(r, "timestamp").empty());
}

TEST(GatewayCore, ToolsCallEchoesStringId) {
    CoreFixture f;
    f.handshake();
    JSONValue v = f.sendParsed(
        R"({"jsonrpc":"2.0","method":"tools/call","params":{"name":"jump_to_gene","arguments":{"geneName":"dnaA"}},"id":"abc123"})");
    EXPECT_EQ(StringAt(v, "id"), "abc123");
    const JSONValue& result = Member(v, "result");
    const auto& content = std::get<JSONValue::Array>(Member(result, "content").value);
    ASSERT_EQ(content.size(), 1u);
    EXPECT_EQ(StringAt(*content[0], "type"), "text");
    JSONValue payload = ParseJSON(StringAt(*content[0], "text"));
    EXPECT_EQ(StringAt(payload, "tool"), "jump_to_gene");
    EXPECT_EQ(StringAt(Member(payload, "echo"), "geneName"), "dnaA");
}

TEST(GatewayCore, ToolFailureRendersAsErrorContent) {
    CoreFixture f;
    JSONValue v = f.sendParsed(
        R"({"jsonrpc":"2.0","method":"tools/call","params":{"name":"jump_to_gene","arguments":{}},"id":11})");
    const JSONValue& result = Member(v, "result");
    EXPECT_TRUE(BoolAt(result, "isError"));
    const auto& content = std::get<JSONValue::Array>(Member(result, "content").value);
    ASSERT_EQ(content.size(), 1u);
    EXPECT_EQ(StringAt(*content[0], "text").rfind("Error executing tool jump_to_gene: ", 0), 0u);
    EXPECT_EQ(StringAt(Member(result, "_meta"), "errorKind"), "validation");
}

TEST(GatewayCore, ToolsCallWithoutNameIsInvalidParams) {
    CoreFixture f;
    JSONValue v = f.sendParsed(R"({"jsonrpc":"2.0","method":"tools/call","params":{},"id":12})");
    EXPECT_EQ(IntAt(Member(v, "error"), "code"), JSONRPCErrorCodes::InvalidParams);
}

TEST(GatewayCore, NoExecutorYieldsNoClientResult) {
    net::io_context ioc;
    ToolCatalog catalog = MakeBuiltinCatalog();
    ExecutionDispatcher dispatcher(ioc.get_executor(), catalog, nullptr);
    GatewayCore core(catalog, dispatcher, GatewayCore::Options{});
    auto session = std::make_shared<ProtocolSession>("s");

    EnvelopeOutcome out = RunToCompletion(ioc, core.HandleEnvelope(
        R"({"jsonrpc":"2.0","method":"tools/call","params":{"name":"get_genome_info"},"id":1})", session,
        TransportKind::Socket));
    JSONValue v = ParseJSON(*out.reply);
    const JSONValue& result = Member(v, "result");
    EXPECT_TRUE(BoolAt(result, "isError"));
    EXPECT_EQ(StringAt(Member(result, "_meta"), "errorKind"), "no_client");
}

TEST(GatewayCore, HandshakePolicyNames) {
    EXPECT_EQ(HandshakePolicyFromString("STRICT"), HandshakePolicy::Strict);
    EXPECT_EQ(HandshakePolicyFromString("lenient"), HandshakePolicy::Lenient);
    EXPECT_FALSE(HandshakePolicyFromString("sometimes").has_value());
}
