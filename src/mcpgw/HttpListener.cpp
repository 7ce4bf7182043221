//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/mcpgw/HttpListener.cpp
// Purpose: HTTP/HTTPS adapter and SSE streaming adapter using Boost.Beast (TLS 1.3 only for HTTPS)
//==========================================================================================================

#include <algorithm>
#include <atomic>
#include <cctype>
#include <unordered_map>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/http.hpp>

#include "logging/Logger.h"
#include "mcpgw/HttpListener.hpp"
#include "mcpgw/MessageOutbox.h"

#include <openssl/ssl.h>

namespace mcpgw {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

namespace {

using Request = http::request<http::string_body>;
using Response = http::response<http::string_body>;

// Target split into path and the sessionId query parameter.
struct Target {
    std::string path;
    std::string sessionId;
};

Target parseTarget(beast::string_view raw) {
    Target t;
    std::string target(raw);
    auto q = target.find('?');
    t.path = target.substr(0, q);
    if (q == std::string::npos) {
        return t;
    }
    std::string query = target.substr(q + 1);
    std::size_t start = 0;
    while (start <= query.size()) {
        std::size_t amp = query.find('&', start);
        if (amp == std::string::npos) {
            amp = query.size();
        }
        std::string kv = query.substr(start, amp - start);
        auto eq = kv.find('=');
        if (eq != std::string::npos && kv.substr(0, eq) == "sessionId") {
            t.sessionId = kv.substr(eq + 1);
        }
        start = amp + 1;
    }
    return t;
}

void applyCors(http::fields& f) {
    f.set(http::field::access_control_allow_origin, "*");
    f.set(http::field::access_control_allow_methods, "GET, POST, OPTIONS");
    f.set(http::field::access_control_allow_headers, "Content-Type, Authorization");
}

Response makeJson(const Request& req, http::status status, std::string body) {
    Response res{status, req.version()};
    res.set(http::field::content_type, "application/json");
    applyCors(res.base());
    res.keep_alive(false);
    res.body() = std::move(body);
    res.prepare_payload();
    return res;
}

Response makeEmpty(const Request& req, http::status status) {
    Response res{status, req.version()};
    applyCors(res.base());
    res.keep_alive(false);
    res.prepare_payload();
    return res;
}

std::string simpleError(const std::string& message) {
    JSONValue::Object obj;
    obj["error"] = std::make_shared<JSONValue>(message);
    return SerializeJSON(JSONValue{obj});
}

std::string sseEvent(const std::string& event, const std::string& data) {
    return "event: " + event + "\ndata: " + data + "\n\n";
}

tcp::socket& socketOf(beast::tcp_stream& stream) { return stream.socket(); }
tcp::socket& socketOf(ssl::stream<tcp::socket>& stream) { return stream.next_layer(); }

std::string remoteOf(const tcp::socket& socket) {
    boost::system::error_code ec;
    auto ep = socket.remote_endpoint(ec);
    if (ec) {
        return "unknown";
    }
    return ep.address().to_string() + ":" + std::to_string(ep.port());
}

} // namespace

class HttpListener::Impl {
public:
    struct StreamChannel {
        StreamChannel(std::string id, net::any_io_executor ex)
            : id(std::move(id)), session(std::make_shared<ProtocolSession>(this->id)), outbox(ex), watcherDone(ex) {}

        std::string id;
        std::shared_ptr<ProtocolSession> session;
        MessageOutbox outbox;
        // Set by the inbound watcher when it returns; watcherDone is cancelled at the same time.
        bool watching{false};
        net::steady_timer watcherDone;
    };

    net::io_context& ioc;
    GatewayCore& core;
    ConnectionRegistry& registry;
    std::shared_ptr<ProtocolSession> httpSession;
    HttpListener::Options opts;

    std::atomic<bool> running{false};
    std::unique_ptr<tcp::acceptor> acceptor;
    std::unique_ptr<ssl::context> sslCtx; // present when scheme==https
    std::atomic<unsigned short> boundPort{0};

    // Event-loop only.
    std::unordered_map<std::string, std::shared_ptr<StreamChannel>> streams;
    std::atomic<std::size_t> openStreams{0};
    std::uint64_t nextExchange{0};

    JsonProvider healthProvider;
    JsonProvider infoProvider;
    ErrorHandler errorHandler;

    Impl(net::io_context& ioc, GatewayCore& core, ConnectionRegistry& registry,
         std::shared_ptr<ProtocolSession> httpSession, const HttpListener::Options& o)
        : ioc(ioc), core(core), registry(registry), httpSession(std::move(httpSession)), opts(o) {
        if (opts.scheme == "https") {
            sslCtx = std::make_unique<ssl::context>(ssl::context::tls_server);
            // TLS 1.3 only
            ::SSL_CTX_set_min_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
            ::SSL_CTX_set_max_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
            try {
                sslCtx->use_certificate_chain_file(opts.certFile);
                sslCtx->use_private_key_file(opts.keyFile, ssl::context::file_format::pem);
            } catch (const std::exception& e) {
                LOG_ERROR("HttpListener: failed to load certificate/key: {}", e.what());
                throw std::runtime_error(std::string("HttpListener: failed to load certificate/key: ") + e.what());
            }
            sslCtx->set_options(
                ssl::context::default_workarounds | ssl::context::no_sslv2 | ssl::context::no_sslv3 |
                ssl::context::no_tlsv1 | ssl::context::no_tlsv1_1 | ssl::context::no_tlsv1_2);
        } else if (opts.scheme != "http") {
            throw std::invalid_argument("HttpListener: unsupported scheme " + opts.scheme);
        }
    }

    void setError(const std::string& msg) {
        LOG_ERROR("{}", msg);
        if (errorHandler) { errorHandler(msg); }
    }

    void sessionFailed(const char* where, const std::exception& e) {
        if (!running.load()) {
            // Shutdown closes sockets under in-flight operations
            LOG_DEBUG("HttpListener {} suppressed during shutdown: {}", where, e.what());
        } else {
            setError(std::string("HttpListener ") + where + " error: " + e.what());
        }
    }

    //======================================================================================================
    // Streaming adapter
    //======================================================================================================
    template <typename Stream>
    net::awaitable<void> watchStream(Stream& stream, std::shared_ptr<StreamChannel> channel) {
        // An event-stream client sends nothing after its request. Stray bytes are discarded; EOF, reset or
        // cancellation ends the stream.
        char scratch[512];
        boost::system::error_code ec;
        for (;;) {
            co_await stream.async_read_some(net::buffer(scratch), net::redirect_error(net::use_awaitable, ec));
            if (ec) {
                break;
            }
        }
        if (ec != net::error::operation_aborted) {
            LOG_DEBUG("SSE stream {} peer gone: {}", channel->id, ec.message());
        }
        channel->watching = false;
        channel->outbox.Close();
        channel->watcherDone.cancel();
        co_return;
    }

    template <typename Stream>
    net::awaitable<void> runStream(Stream& stream, const Request& req, const std::string& remote) {
        auto channel = std::make_shared<StreamChannel>(MakeConnectionId("sse"), ioc.get_executor());
        const std::string id = channel->id;
        streams[id] = channel;
        ++openStreams;

        ConnectionInfo info;
        info.id = id;
        info.kind = TransportKind::Streaming;
        info.remote = remote;
        info.session = channel->session;
        (void)registry.Add(std::move(info));
        LOG_INFO("SSE stream {} opened from {}", id, remote);

        http::response<http::empty_body> res{http::status::ok, req.version()};
        res.set(http::field::content_type, "text/event-stream");
        res.set(http::field::cache_control, "no-cache");
        res.set(http::field::connection, "keep-alive");
        applyCors(res.base());
        http::response_serializer<http::empty_body> sr{res};

        (void)channel->outbox.Push(sseEvent("endpoint", "/messages?sessionId=" + id));
        try {
            co_await http::async_write_header(stream, sr, net::use_awaitable);
            channel->watching = true;
            net::co_spawn(ioc, watchStream(stream, channel),
                [this, id](std::exception_ptr ep) {
                    if (!ep) {
                        return;
                    }
                    try {
                        std::rethrow_exception(ep);
                    } catch (const std::exception& e) {
                        setError("SSE stream " + id + " watcher error: " + e.what());
                    }
                });
            for (;;) {
                MessageOutbox::Item item = co_await channel->outbox.Next(opts.keepAlive);
                if (item.kind == MessageOutbox::Item::Kind::Closed) {
                    break;
                }
                const std::string chunk = item.kind == MessageOutbox::Item::Kind::Idle
                    ? std::string(": keepalive\n\n")
                    : std::move(item.text);
                co_await net::async_write(stream, net::buffer(chunk), net::use_awaitable);
            }
        } catch (const boost::system::system_error& e) {
            LOG_DEBUG("SSE stream {} write ended: {}", id, e.what());
        }

        channel->outbox.Close();
        if (channel->watching) {
            // The watcher holds a reference to stream; wake it and wait before the stream goes away.
            boost::system::error_code ec;
            socketOf(stream).cancel(ec);
            channel->watcherDone.expires_at(net::steady_timer::time_point::max());
            boost::system::error_code waitEc;
            co_await channel->watcherDone.async_wait(net::redirect_error(net::use_awaitable, waitEc));
        }
        streams.erase(id);
        --openStreams;
        (void)registry.Remove(id);
        LOG_INFO("SSE stream {} closed", id);
        co_return;
    }

    // Companion POST for a stream: acknowledge now, push the reply on the stream when ready.
    Response acceptStreamMessage(const Request& req, const std::string& sessionId) {
        auto it = streams.find(sessionId);
        if (it == streams.end()) {
            LOG_WARN("HttpListener: message for unknown stream {}", sessionId);
            return makeJson(req, http::status::not_found, simpleError("Unknown sessionId"));
        }
        std::shared_ptr<StreamChannel> channel = it->second;
        net::co_spawn(ioc,
            [this, channel, body = req.body()]() -> net::awaitable<void> {
                EnvelopeOutcome out = co_await core.HandleEnvelope(body, channel->session, TransportKind::Streaming);
                if (out.reply.has_value() && !channel->outbox.Push(sseEvent("message", *out.reply))) {
                    LOG_WARN("SSE stream {} closed before its reply could be sent", channel->id);
                }
            },
            [this](std::exception_ptr ep) {
                if (!ep) {
                    return;
                }
                try {
                    std::rethrow_exception(ep);
                } catch (const std::exception& e) {
                    setError(std::string("SSE message handler error: ") + e.what());
                }
            });
        return makeJson(req, http::status::accepted, "{\"status\":\"accepted\"}");
    }

    //======================================================================================================
    // One-shot HTTP adapter
    //======================================================================================================
    net::awaitable<Response> handleRpc(const Request& req, const std::string& remote) {
        ConnectionInfo info;
        info.id = "http-" + std::to_string(++nextExchange);
        info.kind = TransportKind::Http;
        info.remote = remote;
        info.session = httpSession;
        const std::string exchangeId = info.id;
        (void)registry.Add(std::move(info));

        EnvelopeOutcome out = co_await core.HandleEnvelope(req.body(), httpSession, TransportKind::Http);
        (void)registry.Remove(exchangeId);

        switch (out.status) {
            case EnvelopeOutcome::Status::Notification:
                co_return makeEmpty(req, http::status::no_content);
            case EnvelopeOutcome::Status::ParseError:
            case EnvelopeOutcome::Status::InvalidRequest:
                co_return makeJson(req, http::status::bad_request, out.reply.value_or(std::string()));
            case EnvelopeOutcome::Status::InternalError:
                co_return makeJson(req, http::status::internal_server_error, out.reply.value_or(std::string()));
            case EnvelopeOutcome::Status::Ok:
                break;
        }
        co_return makeJson(req, http::status::ok, out.reply.value_or(std::string()));
    }

    net::awaitable<Response> route(const Request& req, const Target& target, const std::string& remote) {
        const http::verb verb = req.method();
        if (verb == http::verb::options) {
            co_return makeEmpty(req, http::status::no_content);
        }
        if (target.path == "/health") {
            if (verb != http::verb::get) {
                co_return makeJson(req, http::status::method_not_allowed, simpleError("Method not allowed"));
            }
            co_return makeJson(req, http::status::ok,
                               SerializeJSON(healthProvider ? healthProvider() : JSONValue{JSONValue::Object{}}));
        }
        if (target.path == "/mcp") {
            if (verb != http::verb::get) {
                co_return makeJson(req, http::status::method_not_allowed, simpleError("Method not allowed"));
            }
            co_return makeJson(req, http::status::ok,
                               SerializeJSON(infoProvider ? infoProvider() : JSONValue{JSONValue::Object{}}));
        }
        if (target.path == "/messages") {
            if (verb != http::verb::post) {
                co_return makeJson(req, http::status::method_not_allowed, simpleError("Method not allowed"));
            }
            if (target.sessionId.empty()) {
                co_return makeJson(req, http::status::bad_request, simpleError("Missing sessionId"));
            }
            co_return acceptStreamMessage(req, target.sessionId);
        }
        if (target.path == "/" || target.path == "/sse") {
            if (verb != http::verb::post) {
                co_return makeJson(req, http::status::method_not_allowed, simpleError("Method not allowed"));
            }
            if (!target.sessionId.empty()) {
                co_return acceptStreamMessage(req, target.sessionId);
            }
            co_return co_await handleRpc(req, remote);
        }
        co_return makeJson(req, http::status::not_found, simpleError("Not found"));
    }

    template <typename Stream>
    net::awaitable<void> serve(Stream& stream) {
        const std::string remote = remoteOf(socketOf(stream));
        beast::flat_buffer buffer;
        Request req;
        co_await http::async_read(stream, buffer, req, net::use_awaitable);

        const Target target = parseTarget(req.target());
        if (req.method() == http::verb::get && (target.path == "/" || target.path == "/sse")) {
            co_await runStream(stream, req, remote);
            co_return;
        }
        Response res = co_await route(req, target, remote);
        LOG_DEBUG("HTTP {} {} -> {}", std::string(req.method_string()), target.path, res.result_int());
        co_await http::async_write(stream, res, net::use_awaitable);
        co_return;
    }

    net::awaitable<void> sessionPlain(tcp::socket socket) {
        try {
            beast::tcp_stream stream(std::move(socket));
            co_await serve(stream);
            boost::system::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_send, ec);
        } catch (const std::exception& e) {
            sessionFailed("plain session", e);
        }
        co_return;
    }

    net::awaitable<void> sessionTls(tcp::socket socket) {
        try {
            ssl::stream<tcp::socket> tls(std::move(socket), *sslCtx);
            co_await tls.async_handshake(ssl::stream_base::server, net::use_awaitable);
            co_await serve(tls);
            boost::system::error_code ec;
            tls.shutdown(ec);
        } catch (const std::exception& e) {
            sessionFailed("TLS session", e);
        }
        co_return;
    }

    net::awaitable<void> acceptLoop() {
        try {
            while (running.load()) {
                tcp::socket socket = co_await acceptor->async_accept(net::use_awaitable);
                if (sslCtx) {
                    net::co_spawn(ioc, sessionTls(std::move(socket)), net::detached);
                } else {
                    net::co_spawn(ioc, sessionPlain(std::move(socket)), net::detached);
                }
            }
        } catch (const std::exception& e) {
            sessionFailed("accept", e);
        }
        co_return;
    }

    void bind() {
        // Validate port strictly: numeric and within [0, 65535]
        if (opts.port.empty() ||
            !std::all_of(opts.port.begin(), opts.port.end(), [](unsigned char ch){ return std::isdigit(ch) != 0; })) {
            throw std::invalid_argument("HttpListener invalid port: " + opts.port);
        }
        if (opts.port.size() > 5 || std::stoul(opts.port) > 65535ul) {
            throw std::invalid_argument("HttpListener invalid port (out of range): " + opts.port);
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

HttpListener::HttpListener(net::io_context& ioc, GatewayCore& core, ConnectionRegistry& registry,
                           std::shared_ptr<ProtocolSession> httpSession, const Options& opts)
    : pImpl(std::make_unique<Impl>(ioc, core, registry, std::move(httpSession), opts)) {}

HttpListener::~HttpListener() = default;

std::future<void> HttpListener::Start() {
    FUNC_SCOPE();
    std::promise<void> ready;
    try {
        pImpl->bind();
    } catch (const std::exception& e) {
        LOG_ERROR("HttpListener failed to bind {}:{}: {}", pImpl->opts.address, pImpl->opts.port, e.what());
        ready.set_exception(std::make_exception_ptr(std::runtime_error(
            std::string("HttpListener bind failed: ") + e.what())));
        return ready.get_future();
    }
    pImpl->running.store(true);
    net::co_spawn(pImpl->ioc, pImpl->acceptLoop(), net::detached);
    LOG_INFO("HTTP listener on {}://{}:{} (streams at /sse, messages at /messages)",
             pImpl->opts.scheme, pImpl->opts.address, pImpl->boundPort.load());
    ready.set_value();
    return ready.get_future();
}

void HttpListener::Close() {
    FUNC_SCOPE();
    pImpl->running.store(false);
    if (pImpl->acceptor) {
        boost::system::error_code ec;
        pImpl->acceptor->close(ec);
    }
    for (auto& [id, channel] : pImpl->streams) {
        channel->outbox.Close();
    }
}

unsigned short HttpListener::Port() const {
    return pImpl->boundPort.load();
}

std::size_t HttpListener::StreamCount() const {
    return pImpl->openStreams.load();
}

void HttpListener::SetHealthProvider(JsonProvider provider) {
    pImpl->healthProvider = std::move(provider);
}

void HttpListener::SetInfoProvider(JsonProvider provider) {
    pImpl->infoProvider = std::move(provider);
}

void HttpListener::SetErrorHandler(ErrorHandler handler) {
    pImpl->errorHandler = std::move(handler);
}

} // namespace mcpgw
