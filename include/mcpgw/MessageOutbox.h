//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: MessageOutbox.h
// Purpose: Ordered outbound message queue drained by one writer coroutine per connection
//==========================================================================================================

#pragma once

#include <chrono>
#include <deque>
#include <string>

#include <utility>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>

namespace mcpgw {

//==========================================================================================================
// MessageOutbox
// Purpose: Serializes writes on a persistent connection. Any number of handlers Push(); exactly one writer
//          loops on Next(). Event-loop only.
//==========================================================================================================
class MessageOutbox {
public:
    struct Item {
        enum class Kind {
            Message,  // text holds the next message
            Idle,     // idle interval elapsed with nothing queued
            Closed    // outbox closed and drained
        };
        Kind kind{Kind::Closed};
        std::string text;
    };

    explicit MessageOutbox(boost::asio::any_io_executor executor);

    // Queues a message. Returns false when the outbox is already closed.
    bool Push(std::string message);

    // Stops accepting messages; the writer drains what is queued and then sees Closed.
    void Close();

    bool IsClosed() const { return closed; }
    std::size_t Size() const { return queue.size(); }

    //==========================================================================================================
    // Next
    // Purpose: Waits for the next item.
    // Args:
    //   idle: When positive, an Idle item is produced after this long without a message.
    //==========================================================================================================
    boost::asio::awaitable<Item> Next(std::chrono::milliseconds idle = std::chrono::milliseconds(0));

private:
    std::deque<std::string> queue;
    boost::asio::steady_timer signal;
    bool closed{false};
};

} // namespace mcpgw
