//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ConnectionRegistry.cpp
// Purpose: Live connection bookkeeping
//==========================================================================================================

#include <cstdint>
#include <random>

#include "logging/Logger.h"
#include "mcpgw/ConnectionRegistry.h"
#include "mcpgw/ProtocolSession.h"

namespace mcpgw {

const char* TransportKindName(TransportKind kind) {
    switch (kind) {
        case TransportKind::Streaming: return "sse";
        case TransportKind::Socket: return "websocket";
        case TransportKind::Http: return "http";
        case TransportKind::Executor: return "executor";
    }
    return "http";
}

std::string MakeConnectionId(const std::string& prefix) {
    static constexpr char kHex[] = "0123456789abcdef";
    thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uint64_t bits = rng();
    std::string id = prefix;
    id.push_back('-');
    for (int i = 0; i < 16; ++i) {
        id.push_back(kHex[bits & 0xF]);
        bits >>= 4;
    }
    return id;
}

bool ConnectionRegistry::Add(ConnectionInfo info) {
    std::lock_guard<std::mutex> lk(mutex);
    std::string key = info.id;
    auto [it, inserted] = entries.emplace(std::move(key), std::move(info));
    if (!inserted) {
        LOG_WARN("ConnectionRegistry: duplicate handle {}", it->first);
    }
    return inserted;
}

bool ConnectionRegistry::Remove(const std::string& id) {
    std::lock_guard<std::mutex> lk(mutex);
    return entries.erase(id) > 0;
}

bool ConnectionRegistry::Contains(const std::string& id) const {
    std::lock_guard<std::mutex> lk(mutex);
    return entries.find(id) != entries.end();
}

std::size_t ConnectionRegistry::Count() const {
    std::lock_guard<std::mutex> lk(mutex);
    return entries.size();
}

std::size_t ConnectionRegistry::Count(TransportKind kind) const {
    std::lock_guard<std::mutex> lk(mutex);
    std::size_t n = 0;
    for (const auto& [id, info] : entries) {
        if (info.kind == kind) {
            ++n;
        }
    }
    return n;
}

std::size_t ConnectionRegistry::ReadySessionCount() const {
    std::lock_guard<std::mutex> lk(mutex);
    std::size_t n = 0;
    for (const auto& [id, info] : entries) {
        if (info.session && info.session->IsReady()) {
            ++n;
        }
    }
    return n;
}

std::vector<ConnectionInfo> ConnectionRegistry::Snapshot() const {
    std::lock_guard<std::mutex> lk(mutex);
    std::vector<ConnectionInfo> out;
    out.reserve(entries.size());
    for (const auto& [id, info] : entries) {
        out.push_back(info);
    }
    return out;
}

} // namespace mcpgw
