//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/mcpgw/WebSocketListener.cpp
// Purpose: WebSocket socket adapter using Boost.Beast
//==========================================================================================================

#include <algorithm>
#include <atomic>
#include <cctype>
#include <unordered_map>

#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include "logging/Logger.h"
#include "mcpgw/MessageOutbox.h"
#include "mcpgw/Protocol.h"
#include "mcpgw/WebSocketListener.hpp"

namespace mcpgw {
namespace net = boost::asio;
namespace beast = boost::beast;
namespace websocket = boost::beast::websocket;
using tcp = net::ip::tcp;

class WebSocketListener::Impl {
public:
    struct SocketChannel {
        SocketChannel(std::string id, tcp::socket socket, net::any_io_executor ex)
            : id(std::move(id)),
              session(std::make_shared<ProtocolSession>(this->id)),
              ws(std::move(socket)),
              outbox(std::move(ex)) {}

        std::string id;
        std::string remote;
        std::shared_ptr<ProtocolSession> session;
        websocket::stream<beast::tcp_stream> ws;
        MessageOutbox outbox;
    };

    net::io_context& ioc;
    GatewayCore& core;
    ConnectionRegistry& registry;
    WebSocketListener::Options opts;

    std::atomic<bool> running{false};
    std::unique_ptr<tcp::acceptor> acceptor;
    std::atomic<unsigned short> boundPort{0};

    // Event-loop only.
    std::unordered_map<std::string, std::shared_ptr<SocketChannel>> sockets;
    std::atomic<std::size_t> openSockets{0};

    ErrorHandler errorHandler;

    Impl(net::io_context& ioc, GatewayCore& core, ConnectionRegistry& registry, const WebSocketListener::Options& o)
        : ioc(ioc), core(core), registry(registry), opts(o) {}

    void setError(const std::string& msg) {
        LOG_ERROR("{}", msg);
        if (errorHandler) { errorHandler(msg); }
    }

    auto spawnFailureHandler(std::string what) {
        return [this, what = std::move(what)](std::exception_ptr ep) {
            if (!ep) {
                return;
            }
            try {
                std::rethrow_exception(ep);
            } catch (const std::exception& e) {
                setError("WebSocketListener " + what + " error: " + e.what());
            }
        };
    }

    std::string greeting() const {
        JSONValue::Object params;
        params["status"] = std::make_shared<JSONValue>("connected");
        params["serverId"] = std::make_shared<JSONValue>(opts.serverId);
        params["capabilities"] = std::make_shared<JSONValue>(
            SerializeServerCapabilities(core.GetOptions().capabilities));
        JSONRPCNotification note(Methods::Connected, JSONValue{params});
        return note.Serialize();
    }

    net::awaitable<void> writer(std::shared_ptr<SocketChannel> channel) {
        for (;;) {
            MessageOutbox::Item item = co_await channel->outbox.Next();
            if (item.kind != MessageOutbox::Item::Kind::Message) {
                break;
            }
            boost::system::error_code ec;
            co_await channel->ws.async_write(net::buffer(item.text), net::redirect_error(net::use_awaitable, ec));
            if (ec) {
                LOG_DEBUG("WebSocket {} write failed: {}", channel->id, ec.message());
                channel->outbox.Close();
                break;
            }
        }
        co_return;
    }

    net::awaitable<void> handleFrame(std::shared_ptr<SocketChannel> channel, std::string text) {
        EnvelopeOutcome out = co_await core.HandleEnvelope(std::move(text), channel->session, TransportKind::Socket);
        if (out.reply.has_value() && !channel->outbox.Push(std::move(*out.reply))) {
            LOG_WARN("WebSocket {} closed before its reply could be sent", channel->id);
        }
        co_return;
    }

    net::awaitable<void> session(tcp::socket socket) {
        auto channel = std::make_shared<SocketChannel>(MakeConnectionId("ws"), std::move(socket), ioc.get_executor());
        {
            boost::system::error_code ec;
            auto ep = beast::get_lowest_layer(channel->ws).socket().remote_endpoint(ec);
            channel->remote = ec ? std::string("unknown") : ep.address().to_string() + ":" + std::to_string(ep.port());
        }

        boost::system::error_code ec;
        channel->ws.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
        channel->ws.text(true);
        co_await channel->ws.async_accept(net::redirect_error(net::use_awaitable, ec));
        if (ec) {
            LOG_WARN("WebSocket handshake from {} failed: {}", channel->remote, ec.message());
            co_return;
        }

        sockets[channel->id] = channel;
        ++openSockets;
        ConnectionInfo info;
        info.id = channel->id;
        info.kind = TransportKind::Socket;
        info.remote = channel->remote;
        info.session = channel->session;
        (void)registry.Add(std::move(info));
        LOG_INFO("WebSocket {} connected from {}", channel->id, channel->remote);

        (void)channel->outbox.Push(greeting());
        net::co_spawn(ioc, writer(channel), spawnFailureHandler("writer"));

        for (;;) {
            beast::flat_buffer buffer;
            co_await channel->ws.async_read(buffer, net::redirect_error(net::use_awaitable, ec));
            if (ec) {
                break;
            }
            net::co_spawn(ioc, handleFrame(channel, beast::buffers_to_string(buffer.data())),
                          spawnFailureHandler("frame handler"));
        }

        if (ec == websocket::error::closed) {
            LOG_INFO("WebSocket {} closed by peer", channel->id);
        } else {
            LOG_INFO("WebSocket {} disconnected: {}", channel->id, ec.message());
        }
        channel->outbox.Close();
        sockets.erase(channel->id);
        --openSockets;
        (void)registry.Remove(channel->id);
        co_return;
    }

    net::awaitable<void> acceptLoop() {
        try {
            while (running.load()) {
                tcp::socket socket = co_await acceptor->async_accept(net::use_awaitable);
                net::co_spawn(ioc, session(std::move(socket)), spawnFailureHandler("session"));
            }
        } catch (const std::exception& e) {
            if (!running.load()) {
                LOG_DEBUG("WebSocketListener accept suppressed during shutdown: {}", e.what());
            } else {
                setError(std::string("WebSocketListener accept error: ") + e.what());
            }
        }
        co_return;
    }

    void bind() {
        if (opts.port.empty() || opts.port.size() > 5 ||
            !std::all_of(opts.port.begin(), opts.port.end(), [](unsigned char ch){ return std::isdigit(ch) != 0; }) ||
            std::stoul(opts.port) > 65535ul) {
            throw std::invalid_argument("WebSocketListener invalid port: " + opts.port);
        }
        tcp::resolver resolver(ioc);
        auto r = resolver.resolve(opts.address, opts.port);
        tcp::endpoint ep = *r.begin();

        acceptor = std::make_unique<tcp::acceptor>(ioc);
        acceptor->open(ep.protocol());
        acceptor->set_option(tcp::acceptor::reuse_address(true));
        acceptor->bind(ep);
        acceptor->listen();
        boundPort.store(acceptor->local_endpoint().port());
    }
};

WebSocketListener::WebSocketListener(net::io_context& ioc, GatewayCore& core, ConnectionRegistry& registry,
                                     const Options& opts)
    : pImpl(std::make_unique<Impl>(ioc, core, registry, opts)) {}

WebSocketListener::~WebSocketListener() = default;

std::future<void> WebSocketListener::Start() {
    FUNC_SCOPE();
    std::promise<void> ready;
    try {
        pImpl->bind();
    } catch (const std::exception& e) {
        LOG_ERROR("WebSocketListener failed to bind {}:{}: {}", pImpl->opts.address, pImpl->opts.port, e.what());
        ready.set_exception(std::make_exception_ptr(std::runtime_error(
            std::string("WebSocketListener bind failed: ") + e.what())));
        return ready.get_future();
    }
    pImpl->running.store(true);
    net::co_spawn(pImpl->ioc, pImpl->acceptLoop(), net::detached);
    LOG_INFO("WebSocket listener on ws://{}:{}", pImpl->opts.address, pImpl->boundPort.load());
    ready.set_value();
    return ready.get_future();
}

void WebSocketListener::Close() {
    FUNC_SCOPE();
    pImpl->running.store(false);
    if (pImpl->acceptor) {
        boost::system::error_code ec;
        pImpl->acceptor->close(ec);
    }
    for (auto& [id, channel] : pImpl->sockets) {
        channel->outbox.Close();
        beast::get_lowest_layer(channel->ws).close();
    }
}

unsigned short WebSocketListener::Port() const {
    return pImpl->boundPort.load();
}

std::size_t WebSocketListener::SocketCount() const {
    return pImpl->openSockets.load();
}

void WebSocketListener::SetErrorHandler(ErrorHandler handler) {
    pImpl->errorHandler = std::move(handler);
}

} // namespace mcpgw
