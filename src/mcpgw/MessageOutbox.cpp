//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: MessageOutbox.cpp
// Purpose: Outbound queue with a timer used as a wake-up signal
//==========================================================================================================

#include <utility>

#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

#include "mcpgw/MessageOutbox.h"

namespace mcpgw {
namespace net = boost::asio;

MessageOutbox::MessageOutbox(net::any_io_executor executor)
    : signal(executor) {}

bool MessageOutbox::Push(std::string message) {
    if (closed) {
        return false;
    }
    queue.push_back(std::move(message));
    signal.cancel();
    return true;
}

void MessageOutbox::Close() {
    closed = true;
    signal.cancel();
}

net::awaitable<MessageOutbox::Item> MessageOutbox::Next(std::chrono::milliseconds idle) {
    for (;;) {
        if (!queue.empty()) {
            Item item;
            item.kind = Item::Kind::Message;
            item.text = std::move(queue.front());
            queue.pop_front();
            co_return item;
        }
        if (closed) {
            co_return Item{Item::Kind::Closed, std::string()};
        }
        if (idle.count() > 0) {
            signal.expires_after(idle);
        } else {
            signal.expires_at(net::steady_timer::time_point::max());
        }
        boost::system::error_code ec;
        co_await signal.async_wait(net::redirect_error(net::use_awaitable, ec));
        // A cancelled wait means Push() or Close(); an expired one is an idle tick.
        if (!ec && queue.empty() && !closed) {
            co_return Item{Item::Kind::Idle, std::string()};
        }
    }
}

} // namespace mcpgw
