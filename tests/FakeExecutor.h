//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: FakeExecutor.h
// Purpose: Scripted in-memory IExecutor and coroutine helpers shared by the gateway tests
//==========================================================================================================

#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>

#include "mcpgw/Executor.h"

namespace mcpgw {
namespace test {

//==========================================================================================================
// FakeExecutor
// Purpose: IExecutor whose replies are produced by a script on a worker thread after a per-request delay.
// Notes:
//   - By default every request is answered with success and { tool, echo: parameters }.
//   - Script returning std::nullopt means "never reply".
//   - JoinWorkers() waits for all scheduled replies to be delivered to the reply handler.
//==========================================================================================================
class FakeExecutor : public IExecutor {
public:
    using Script = std::function<std::optional<ExecutionReply>(const ExecutionRequest& request)>;
    using DelayFn = std::function<std::chrono::milliseconds(const ExecutionRequest& request)>;

    explicit FakeExecutor(bool ready = true) : ready(ready) {}

    ~FakeExecutor() override {
        JoinWorkers();
    }

    std::future<void> Start() override {
        ++starts;
        std::promise<void> p;
        p.set_value();
        return p.get_future();
    }

    std::future<void> Stop() override {
        ++stops;
        std::promise<void> p;
        p.set_value();
        return p.get_future();
    }

    bool IsReady() const override { return ready.load(); }

    bool Send(const ExecutionRequest& request) override {
        if (failSends.load()) {
            return false;
        }
        {
            std::lock_guard<std::mutex> lk(mutex);
            sent.push_back(request);
        }
        std::chrono::milliseconds delay = delayFn ? delayFn(request) : std::chrono::milliseconds(0);
        std::optional<ExecutionReply> reply = script ? script(request) : defaultReply(request);
        if (!reply.has_value()) {
            return true;
        }
        std::lock_guard<std::mutex> lk(mutex);
        workers.emplace_back([this, delay, r = std::move(*reply)]() {
            if (delay.count() > 0) {
                std::this_thread::sleep_for(delay);
            }
            Deliver(r);
        });
        return true;
    }

    void SetReplyHandler(ReplyHandler handler) override {
        std::lock_guard<std::mutex> lk(handlerMutex);
        replyHandler = std::move(handler);
    }

    void SetErrorHandler(ErrorHandler handler) override {
        std::lock_guard<std::mutex> lk(handlerMutex);
        errorHandler = std::move(handler);
    }

    // Pushes a reply to the gateway as if the executor had sent it.
    void Deliver(const ExecutionReply& reply) {
        ReplyHandler h;
        {
            std::lock_guard<std::mutex> lk(handlerMutex);
            h = replyHandler;
        }
        if (h) {
            h(reply);
        }
    }

    void JoinWorkers() {
        std::vector<std::thread> pending;
        {
            std::lock_guard<std::mutex> lk(mutex);
            pending.swap(workers);
        }
        for (auto& t : pending) {
            if (t.joinable()) {
                t.join();
            }
        }
    }

    std::vector<ExecutionRequest> Sent() const {
        std::lock_guard<std::mutex> lk(mutex);
        return sent;
    }

    static std::optional<ExecutionReply> defaultReply(const ExecutionRequest& request) {
        JSONValue::Object result;
        result["tool"] = std::make_shared<JSONValue>(request.toolName);
        result["echo"] = std::make_shared<JSONValue>(request.parameters);
        ExecutionReply reply;
        reply.requestId = request.requestId;
        reply.success = true;
        reply.result = JSONValue{result};
        return reply;
    }

    std::atomic<bool> ready;
    std::atomic<bool> failSends{false};
    std::atomic<int> starts{0};
    std::atomic<int> stops{0};
    Script script;
    DelayFn delayFn;

private:
    mutable std::mutex mutex;
    std::vector<ExecutionRequest> sent;
    std::vector<std::thread> workers;

    std::mutex handlerMutex;
    ReplyHandler replyHandler;
    ErrorHandler errorHandler;
};

// Runs aw on ioc until the loop has no more work and returns its value.
template <typename T>
T RunToCompletion(boost::asio::io_context& ioc, boost::asio::awaitable<T> aw) {
    auto fut = boost::asio::co_spawn(ioc, std::move(aw), boost::asio::use_future);
    ioc.restart();
    ioc.run();
    return fut.get();
}

// Member lookup that fails the test instead of dereferencing null.
inline const JSONValue& Member(const JSONValue& v, const std::string& key) {
    const JSONValue* m = FindMember(v, key);
    if (m == nullptr) {
        throw std::runtime_error("missing member: " + key);
    }
    return *m;
}

inline std::string StringAt(const JSONValue& v, const std::string& key) {
    return std::get<std::string>(Member(v, key).value);
}

inline int64_t IntAt(const JSONValue& v, const std::string& key) {
    return std::get<int64_t>(Member(v, key).value);
}

inline bool BoolAt(const JSONValue& v, const std::string& key) {
    return std::get<bool>(Member(v, key).value);
}

} // namespace test
} // namespace mcpgw
