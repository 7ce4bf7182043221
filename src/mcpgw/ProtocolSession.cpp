//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProtocolSession.cpp
// Purpose: Handshake transitions for a protocol session
//==========================================================================================================

#include "logging/Logger.h"
#include "mcpgw/ProtocolSession.h"

namespace mcpgw {

const char* SessionStateName(SessionState state) {
    switch (state) {
        case SessionState::Uninitialized: return "uninitialized";
        case SessionState::AwaitingInitializedAck: return "awaiting-initialized";
        case SessionState::Ready: return "ready";
    }
    return "uninitialized";
}

ProtocolSession::ProtocolSession(std::string id)
    : id(std::move(id)) {}

std::string ProtocolSession::OnInitialize(const std::optional<JSONValue>& params, const std::string& defaultVersion) {
    std::string version = defaultVersion;
    std::optional<JSONValue> info;
    if (params.has_value()) {
        if (auto v = GetStringMember(params.value(), "protocolVersion"); v.has_value() && !v->empty()) {
            version = *v;
        }
        if (const JSONValue* ci = FindMember(params.value(), "clientInfo")) {
            info = *ci;
        }
    }
    {
        std::lock_guard<std::mutex> lk(mutex);
        protocolVersion = version;
        clientInfo = std::move(info);
    }
    const SessionState prev = state.exchange(SessionState::AwaitingInitializedAck);
    if (prev == SessionState::Ready) {
        LOG_INFO("Session {}: re-initialize requested; awaiting initialized again", id);
    } else {
        LOG_INFO("Session {}: initialize (protocolVersion={})", id, version);
    }
    return version;
}

bool ProtocolSession::OnInitialized() {
    const SessionState prev = state.exchange(SessionState::Ready);
    if (prev == SessionState::Ready) {
        LOG_DEBUG("Session {}: duplicate initialized ignored", id);
        return false;
    }
    if (prev == SessionState::Uninitialized) {
        LOG_WARN("Session {}: initialized received before initialize", id);
    }
    LOG_INFO("Session {}: ready", id);
    return true;
}

std::string ProtocolSession::ProtocolVersion() const {
    std::lock_guard<std::mutex> lk(mutex);
    return protocolVersion;
}

std::optional<JSONValue> ProtocolSession::ClientInfo() const {
    std::lock_guard<std::mutex> lk(mutex);
    return clientInfo;
}

} // namespace mcpgw
