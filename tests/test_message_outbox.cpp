//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_message_outbox.cpp
// Purpose: MessageOutbox ordering, idle ticks and close semantics
//==========================================================================================================

#include <gtest/gtest.h>
#include <vector>
#include "mcpgw/MessageOutbox.h"
#include "FakeExecutor.h"

using namespace mcpgw;
using namespace mcpgw::test;
namespace net = boost::asio;

TEST(MessageOutbox, DeliversInOrderThenClosed) {
    net::io_context ioc;
    MessageOutbox outbox(ioc.get_executor());
    EXPECT_TRUE(outbox.Push("one"));
    EXPECT_TRUE(outbox.Push("two"));
    outbox.Close();
    EXPECT_FALSE(outbox.Push("three"));

    auto drain = [&outbox]() -> net::awaitable<std::vector<std::string>> {
        std::vector<std::string> seen;
        for (;;) {
            auto item = co_await outbox.Next();
            if (item.kind != MessageOutbox::Item::Kind::Message) {
                break;
            }
            seen.push_back(item.text);
        }
        co_return seen;
    };
    auto seen = RunToCompletion(ioc, drain());
    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0], "one");
    EXPECT_EQ(seen[1], "two");
}

TEST(MessageOutbox, IdleTickWhenNothingQueued) {
    net::io_context ioc;
    MessageOutbox outbox(ioc.get_executor());
    auto item = RunToCompletion(ioc, outbox.Next(std::chrono::milliseconds(10)));
    EXPECT_EQ(item.kind, MessageOutbox::Item::Kind::Idle);
}

TEST(MessageOutbox, PushWakesWaitingReader) {
    net::io_context ioc;
    MessageOutbox outbox(ioc.get_executor());
    net::steady_timer later(ioc);
    later.expires_after(std::chrono::milliseconds(10));
    later.async_wait([&outbox](const boost::system::error_code&) { (void)outbox.Push("late"); });

    auto item = RunToCompletion(ioc, outbox.Next());
    EXPECT_EQ(item.kind, MessageOutbox::Item::Kind::Message);
    EXPECT_EQ(item.text, "late");
}
