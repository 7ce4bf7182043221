//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_json_value.cpp
// Purpose: JSON parser/serializer and JSON-RPC envelope type tests
//==========================================================================================================

#include <gtest/gtest.h>
#include "mcpgw/JSONRPCTypes.h"
#include "FakeExecutor.h"

using namespace mcpgw;
using namespace mcpgw::test;

TEST(JSONValue, ParsesNestedDocument) {
    JSONValue v = ParseJSON(R"({"a":1,"b":[true,null,"x"],"c":{"d":2.5}})");
    ASSERT_TRUE(v.IsObject());
    EXPECT_EQ(IntAt(v, "a"), 1);
    const auto& arr = std::get<JSONValue::Array>(Member(v, "b").value);
    ASSERT_EQ(arr.size(), 3u);
    EXPECT_TRUE(std::get<bool>(arr[0]->value));
    EXPECT_TRUE(arr[1]->IsNull());
    EXPECT_EQ(std::get<std::string>(arr[2]->value), "x");
    EXPECT_DOUBLE_EQ(std::get<double>(Member(Member(v, "c"), "d").value), 2.5);
}

TEST(JSONValue, RejectsMalformedText) {
    EXPECT_THROW(ParseJSON("{"), std::runtime_error);
    EXPECT_THROW(ParseJSON("{\"a\":1} trailing"), std::runtime_error);
    EXPECT_THROW(ParseJSON(""), std::runtime_error);
}

TEST(JSONValue, SerializeEscapesStrings) {
    JSONValue::Object obj;
    obj["s"] = std::make_shared<JSONValue>("quote\" and \\ newline\n");
    const std::string text = SerializeJSON(JSONValue{obj});
    JSONValue back = ParseJSON(text);
    EXPECT_EQ(StringAt(back, "s"), "quote\" and \\ newline\n");
}

TEST(JSONRPCTypes, IdFromJSONAcceptsStringIntegerNull) {
    EXPECT_TRUE(IdFromJSON(JSONValue("abc123")).has_value());
    EXPECT_TRUE(IdFromJSON(JSONValue(static_cast<int64_t>(7))).has_value());
    EXPECT_TRUE(IdFromJSON(JSONValue(nullptr)).has_value());
    EXPECT_FALSE(IdFromJSON(JSONValue(1.5)).has_value());
    EXPECT_FALSE(IdFromJSON(JSONValue(true)).has_value());
}

TEST(JSONRPCTypes, ErrorResponseCarriesCodeAndId) {
    auto resp = CreateErrorResponse(JSONRPCId{std::string("abc123")}, JSONRPCErrorCodes::MethodNotFound, "Method not found: x");
    JSONValue v = ParseJSON(resp->Serialize());
    EXPECT_EQ(StringAt(v, "jsonrpc"), "2.0");
    EXPECT_EQ(StringAt(v, "id"), "abc123");
    EXPECT_EQ(IntAt(Member(v, "error"), "code"), -32601);
    EXPECT_EQ(StringAt(Member(v, "error"), "message"), "Method not found: x");
}
