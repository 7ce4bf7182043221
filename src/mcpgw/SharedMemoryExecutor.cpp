//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SharedMemoryExecutor.cpp
// Purpose: Cross-process executor channel built on Boost.Interprocess message_queue
//==========================================================================================================

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include <boost/interprocess/ipc/message_queue.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>

#include "logging/Logger.h"
#include "mcpgw/JSONRPCTypes.h"
#include "mcpgw/SharedMemoryExecutor.hpp"

namespace mcpgw {

using namespace boost::interprocess;

namespace {

std::string execQueueName(const SharedMemoryChannelOptions& o) { return o.channelName + "_exec"; }
std::string replyQueueName(const SharedMemoryChannelOptions& o) { return o.channelName + "_reply"; }

void removeQueues(const SharedMemoryChannelOptions& o) {
    // remove() reports a missing queue by returning false
    (void)message_queue::remove(execQueueName(o).c_str());
    (void)message_queue::remove(replyQueueName(o).c_str());
}

// Opens or creates both queues. Returns {recv, send} for the requested side.
struct QueuePair {
    std::unique_ptr<message_queue> recv;
    std::unique_ptr<message_queue> send;
};

QueuePair openQueues(const SharedMemoryChannelOptions& o, bool gatewaySide) {
    QueuePair q;
    const std::string exec = execQueueName(o);
    const std::string reply = replyQueueName(o);
    std::unique_ptr<message_queue> execMq;
    std::unique_ptr<message_queue> replyMq;
    if (o.create) {
        removeQueues(o);
        execMq = std::make_unique<message_queue>(create_only, exec.c_str(), o.maxMessageCount, o.maxMessageSize);
        replyMq = std::make_unique<message_queue>(create_only, reply.c_str(), o.maxMessageCount, o.maxMessageSize);
    } else {
        execMq = std::make_unique<message_queue>(open_only, exec.c_str());
        replyMq = std::make_unique<message_queue>(open_only, reply.c_str());
    }
    if (gatewaySide) {
        q.send = std::move(execMq);
        q.recv = std::move(replyMq);
    } else {
        q.send = std::move(replyMq);
        q.recv = std::move(execMq);
    }
    return q;
}

// Non-blocking send with a short bounded retry when the queue is momentarily full.
bool sendPayload(message_queue* mq, const std::string& payload, std::string& error) {
    if (mq == nullptr) {
        error = "send queue not available";
        return false;
    }
    if (payload.size() > mq->get_max_msg_size()) {
        error = "payload too large";
        return false;
    }
    try {
        bool ok = mq->try_send(payload.data(), payload.size(), 0);
        if (!ok) {
            ok = mq->timed_send(
                payload.data(),
                payload.size(),
                0,
                boost::posix_time::microsec_clock::universal_time() + boost::posix_time::milliseconds(200));
        }
        if (!ok) {
            error = "send failed (queue full)";
        }
        return ok;
    } catch (const interprocess_exception& e) {
        error = std::string("send failed: ") + e.what();
        return false;
    }
}

// Receive loop shared by both ends; invokes onMessage for every complete message and onTick after every
// wake-up (at least every 100 ms).
template <typename OnMessage, typename OnError, typename OnTick>
void receiveLoop(std::stop_token st, message_queue& mq, const std::atomic<bool>& running,
                 OnMessage&& onMessage, OnError&& onError, OnTick&& onTick) {
    std::vector<char> buffer(mq.get_max_msg_size());
    while (running.load() && !st.stop_requested()) {
        message_queue::size_type recvd = 0;
        unsigned int prio = 0;
        bool got = false;
        try {
            got = mq.timed_receive(
                buffer.data(),
                buffer.size(),
                recvd,
                prio,
                boost::posix_time::microsec_clock::universal_time() + boost::posix_time::milliseconds(100));
        } catch (const interprocess_exception& e) {
            onError(std::string("receive failed: ") + e.what());
            break;
        }
        if (got) {
            onMessage(std::string(buffer.data(), buffer.data() + recvd));
        }
        onTick();
    }
}

std::string controlMessage(const char* type, const std::string& clientId) {
    JSONValue::Object obj;
    obj["type"] = std::make_shared<JSONValue>(type);
    obj["clientId"] = std::make_shared<JSONValue>(clientId);
    return SerializeJSON(JSONValue{obj});
}

} // namespace

//==========================================================================================================
// SharedMemoryExecutor (gateway side)
//==========================================================================================================
class SharedMemoryExecutor::Impl {
public:
    SharedMemoryChannelOptions opts;
    std::atomic<bool> running{false};
    std::unique_ptr<message_queue> sendMq;
    std::unique_ptr<message_queue> recvMq;
    std::jthread receiveThread;

    std::mutex handlerMutex;
    ReplyHandler replyHandler;
    ErrorHandler errorHandler;

    ConnectionRegistry executors;
    // Last ready/heartbeat per attached executor. Receive thread only.
    std::unordered_map<std::string, std::chrono::steady_clock::time_point> lastSeen;

    explicit Impl(const SharedMemoryChannelOptions& o) : opts(o) {}

    ~Impl() {
        shutdown();
    }

    void shutdown() {
        running.store(false);
        if (receiveThread.joinable()) {
            receiveThread.request_stop();
            receiveThread.join();
        }
        sendMq.reset();
        recvMq.reset();
        if (opts.create) {
            removeQueues(opts);
        }
        for (const auto& info : executors.Snapshot()) {
            (void)executors.Remove(info.id);
        }
        lastSeen.clear();
    }

    void markAlive(const std::string& clientId, bool announced) {
        lastSeen[clientId] = std::chrono::steady_clock::now();
        ConnectionInfo info;
        info.id = clientId;
        info.kind = TransportKind::Executor;
        info.remote = "shm://" + opts.channelName;
        if (executors.Add(std::move(info))) {
            if (announced) {
                LOG_INFO("Executor {} attached on channel {}", clientId, opts.channelName);
            } else {
                LOG_INFO("Executor {} re-attached on channel {} after a heartbeat", clientId, opts.channelName);
            }
        }
    }

    void expireSilent() {
        if (opts.livenessTimeout.count() <= 0) {
            return;
        }
        const auto now = std::chrono::steady_clock::now();
        for (auto it = lastSeen.begin(); it != lastSeen.end();) {
            if (now - it->second < opts.livenessTimeout) {
                ++it;
                continue;
            }
            LOG_WARN("Executor {} silent for more than {} ms; detaching", it->first, opts.livenessTimeout.count());
            (void)executors.Remove(it->first);
            it = lastSeen.erase(it);
        }
    }

    void reportError(const std::string& msg) {
        LOG_ERROR("SharedMemoryExecutor[{}]: {}", opts.channelName, msg);
        ErrorHandler h;
        {
            std::lock_guard<std::mutex> lk(handlerMutex);
            h = errorHandler;
        }
        if (h) { h(msg); }
    }

    void processMessage(const std::string& message) {
        JSONValue doc;
        try {
            doc = ParseJSON(message);
        } catch (const std::exception& e) {
            LOG_WARN("SharedMemoryExecutor[{}]: dropping malformed message: {}", opts.channelName, e.what());
            return;
        }
        if (auto type = GetStringMember(doc, "type")) {
            const std::string clientId = GetStringMember(doc, "clientId").value_or(std::string("executor"));
            if (*type == "ready" || *type == "heartbeat") {
                markAlive(clientId, *type == "ready");
            } else if (*type == "stopped") {
                lastSeen.erase(clientId);
                if (executors.Remove(clientId)) {
                    LOG_INFO("Executor {} detached from channel {}", clientId, opts.channelName);
                }
            } else {
                LOG_WARN("SharedMemoryExecutor[{}]: unknown control message type {}", opts.channelName, *type);
            }
            return;
        }
        auto reply = ExecutionReply::FromJSON(doc);
        if (!reply.has_value()) {
            LOG_WARN("SharedMemoryExecutor[{}]: message is neither control nor reply", opts.channelName);
            return;
        }
        ReplyHandler h;
        {
            std::lock_guard<std::mutex> lk(handlerMutex);
            h = replyHandler;
        }
        if (h) {
            h(std::move(*reply));
        } else {
            LOG_WARN("SharedMemoryExecutor[{}]: reply {} dropped (no handler)", opts.channelName, reply->requestId);
        }
    }
};

SharedMemoryExecutor::SharedMemoryExecutor(const SharedMemoryChannelOptions& opts)
    : pImpl(std::make_unique<Impl>(opts)) {
    FUNC_SCOPE();
}

SharedMemoryExecutor::~SharedMemoryExecutor() {
    FUNC_SCOPE();
}

std::future<void> SharedMemoryExecutor::Start() {
    FUNC_SCOPE();
    std::promise<void> ready;
    try {
        auto q = openQueues(pImpl->opts, true);
        pImpl->sendMq = std::move(q.send);
        pImpl->recvMq = std::move(q.recv);
    } catch (const std::exception& e) {
        ready.set_exception(std::make_exception_ptr(std::runtime_error(
            std::string("SharedMemoryExecutor start failed: ") + e.what())));
        return ready.get_future();
    }

    pImpl->running.store(true);
    pImpl->receiveThread = std::jthread([this](std::stop_token st) {
        receiveLoop(st, *pImpl->recvMq, pImpl->running,
            [this](const std::string& msg) { pImpl->processMessage(msg); },
            [this](const std::string& err) { pImpl->reportError(err); },
            [this]() { pImpl->expireSilent(); });
    });
    LOG_INFO("SharedMemoryExecutor listening on channel {}", pImpl->opts.channelName);
    ready.set_value();
    return ready.get_future();
}

std::future<void> SharedMemoryExecutor::Stop() {
    FUNC_SCOPE();
    pImpl->shutdown();
    std::promise<void> done;
    done.set_value();
    return done.get_future();
}

bool SharedMemoryExecutor::IsReady() const {
    return pImpl->running.load() && pImpl->executors.IsAnyoneConnected();
}

bool SharedMemoryExecutor::Send(const ExecutionRequest& request) {
    FUNC_SCOPE();
    if (!pImpl->running.load()) {
        return false;
    }
    std::string error;
    if (!sendPayload(pImpl->sendMq.get(), SerializeJSON(request.ToJSON()), error)) {
        pImpl->reportError(std::string("request ") + request.requestId + ": " + error);
        return false;
    }
    return true;
}

void SharedMemoryExecutor::SetReplyHandler(ReplyHandler handler) {
    std::lock_guard<std::mutex> lk(pImpl->handlerMutex);
    pImpl->replyHandler = std::move(handler);
}

void SharedMemoryExecutor::SetErrorHandler(ErrorHandler handler) {
    std::lock_guard<std::mutex> lk(pImpl->handlerMutex);
    pImpl->errorHandler = std::move(handler);
}

const ConnectionRegistry& SharedMemoryExecutor::Executors() const {
    return pImpl->executors;
}

//==========================================================================================================
// SharedMemoryExecutorHost (executor side)
//==========================================================================================================
class SharedMemoryExecutorHost::Impl {
public:
    SharedMemoryChannelOptions opts;
    std::atomic<bool> running{false};
    std::unique_ptr<message_queue> sendMq;
    std::unique_ptr<message_queue> recvMq;
    std::jthread receiveThread;
    RequestHandler handler;

    struct Worker {
        std::shared_ptr<std::atomic<bool>> done;
        std::jthread thread;
    };
    std::mutex workersMutex;
    std::vector<Worker> workers;

    std::chrono::steady_clock::time_point lastHeartbeat{};

    explicit Impl(const SharedMemoryChannelOptions& o) : opts(o) {}

    ~Impl() {
        shutdown(false);
    }

    void heartbeat() {
        if (opts.heartbeatInterval.count() <= 0) {
            return;
        }
        const auto now = std::chrono::steady_clock::now();
        if (now - lastHeartbeat < opts.heartbeatInterval) {
            return;
        }
        lastHeartbeat = now;
        (void)send(controlMessage("heartbeat", opts.clientId));
    }

    bool send(const std::string& payload) {
        std::string error;
        if (!sendPayload(sendMq.get(), payload, error)) {
            LOG_ERROR("SharedMemoryExecutorHost[{}]: {}", opts.channelName, error);
            return false;
        }
        return true;
    }

    void shutdown(bool announce) {
        const bool wasRunning = running.exchange(false);
        if (receiveThread.joinable()) {
            receiveThread.request_stop();
            receiveThread.join();
        }
        {
            std::lock_guard<std::mutex> lk(workersMutex);
            workers.clear(); // jthread joins
        }
        if (wasRunning && announce && sendMq) {
            (void)send(controlMessage("stopped", opts.clientId));
        }
        sendMq.reset();
        recvMq.reset();
        if (opts.create) {
            removeQueues(opts);
        }
    }

    void execute(const ExecutionRequest& req) {
        ExecutionReply reply;
        reply.requestId = req.requestId;
        try {
            reply = handler(req);
            reply.requestId = req.requestId;
        } catch (const std::exception& e) {
            reply.success = false;
            reply.result.reset();
            reply.error = JSONValue(std::string(e.what()));
        }
        (void)send(SerializeJSON(reply.ToJSON()));
    }

    void processMessage(const std::string& message) {
        std::optional<ExecutionRequest> req;
        try {
            req = ExecutionRequest::FromJSON(ParseJSON(message));
        } catch (const std::exception& e) {
            LOG_WARN("SharedMemoryExecutorHost[{}]: dropping malformed request: {}", opts.channelName, e.what());
            return;
        }
        if (!req.has_value()) {
            LOG_WARN("SharedMemoryExecutorHost[{}]: message is not an execution request", opts.channelName);
            return;
        }
        std::lock_guard<std::mutex> lk(workersMutex);
        // Reap finished workers so the vector does not grow without bound
        std::erase_if(workers, [](const Worker& w) { return w.done->load(); });
        auto done = std::make_shared<std::atomic<bool>>(false);
        workers.push_back(Worker{done, std::jthread([this, done, r = std::move(*req)]() {
            execute(r);
            done->store(true);
        })});
    }
};

SharedMemoryExecutorHost::SharedMemoryExecutorHost(const SharedMemoryChannelOptions& opts)
    : pImpl(std::make_unique<Impl>(opts)) {
    FUNC_SCOPE();
}

SharedMemoryExecutorHost::~SharedMemoryExecutorHost() {
    FUNC_SCOPE();
}

void SharedMemoryExecutorHost::SetRequestHandler(RequestHandler handler) {
    pImpl->handler = std::move(handler);
}

std::future<void> SharedMemoryExecutorHost::Start() {
    FUNC_SCOPE();
    std::promise<void> ready;
    if (!pImpl->handler) {
        ready.set_exception(std::make_exception_ptr(std::logic_error("SharedMemoryExecutorHost: no request handler")));
        return ready.get_future();
    }
    try {
        auto q = openQueues(pImpl->opts, false);
        pImpl->sendMq = std::move(q.send);
        pImpl->recvMq = std::move(q.recv);
    } catch (const std::exception& e) {
        ready.set_exception(std::make_exception_ptr(std::runtime_error(
            std::string("SharedMemoryExecutorHost start failed: ") + e.what())));
        return ready.get_future();
    }
    pImpl->running.store(true);
    pImpl->lastHeartbeat = std::chrono::steady_clock::now();
    pImpl->receiveThread = std::jthread([this](std::stop_token st) {
        receiveLoop(st, *pImpl->recvMq, pImpl->running,
            [this](const std::string& msg) { pImpl->processMessage(msg); },
            [this](const std::string& err) {
                LOG_ERROR("SharedMemoryExecutorHost[{}]: {}", pImpl->opts.channelName, err);
            },
            [this]() { pImpl->heartbeat(); });
    });
    if (!pImpl->send(controlMessage("ready", pImpl->opts.clientId))) {
        pImpl->shutdown(false);
        ready.set_exception(std::make_exception_ptr(std::runtime_error("SharedMemoryExecutorHost: ready announcement failed")));
        return ready.get_future();
    }
    LOG_INFO("Executor {} attached to channel {}", pImpl->opts.clientId, pImpl->opts.channelName);
    ready.set_value();
    return ready.get_future();
}

std::future<void> SharedMemoryExecutorHost::Stop() {
    FUNC_SCOPE();
    pImpl->shutdown(true);
    std::promise<void> done;
    done.set_value();
    return done.get_future();
}

bool SharedMemoryExecutorHost::SendReply(const ExecutionReply& reply) {
    if (!pImpl->running.load()) {
        return false;
    }
    return pImpl->send(SerializeJSON(reply.ToJSON()));
}

} // namespace mcpgw

//==========================================================================================================
// ParseSharedMemoryChannelConfig
// Purpose: Channel options from "shm://<channel>?create=true&maxSize=<bytes>&maxCount=<n>&clientId=<id>"
//==========================================================================================================
mcpgw::SharedMemoryChannelOptions mcpgw::ParseSharedMemoryChannelConfig(const std::string& config) {
    FUNC_SCOPE();
    SharedMemoryChannelOptions opts;

    auto parseBool = [](std::string v) -> bool {
        std::transform(v.begin(), v.end(), v.begin(), [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
        return (v == "1" || v == "true" || v == "yes");
    };

    auto parseQuery = [&](const std::string& q){
        std::size_t start = 0;
        while (start < q.size()) {
            std::size_t amp = q.find('&', start);
            if (amp == std::string::npos) {
                amp = q.size();
            }
            std::string kv = q.substr(start, amp - start);
            std::size_t eq = kv.find('=');
            if (eq != std::string::npos) {
                std::string k = kv.substr(0, eq);
                std::string v = kv.substr(eq + 1);
                if (k == "create") {
                    opts.create = parseBool(v);
                } else if (k == "clientId") {
                    opts.clientId = v;
                } else if (k == "maxSize" || k == "maxCount" || k == "heartbeatMs" || k == "livenessMs") {
                    try {
                        unsigned long long n = std::stoull(v);
                        if (k == "maxSize") {
                            opts.maxMessageSize = static_cast<std::size_t>(n);
                        } else if (k == "maxCount") {
                            opts.maxMessageCount = static_cast<unsigned int>(n);
                        } else if (k == "heartbeatMs") {
                            opts.heartbeatInterval = std::chrono::milliseconds(static_cast<long long>(n));
                        } else {
                            opts.livenessTimeout = std::chrono::milliseconds(static_cast<long long>(n));
                        }
                    } catch (const std::exception& e) {
                        LOG_WARN("Ignoring invalid shm option {}={}: {}", k, v, e.what());
                    }
                }
            }
            start = amp + 1;
        }
    };

    std::string rest = config;
    const std::string prefix = "shm://";
    if (rest.rfind(prefix, 0) == 0) {
        rest = rest.substr(prefix.size());
    }
    std::size_t qpos = rest.find('?');
    if (qpos == std::string::npos) {
        opts.channelName = rest;
    } else {
        opts.channelName = rest.substr(0, qpos);
        parseQuery(rest.substr(qpos + 1));
    }

    if (opts.channelName.empty()) {
        // Both peers must use the same name to communicate.
        opts.channelName = "mcpgw-exec";
    }
    return opts;
}
