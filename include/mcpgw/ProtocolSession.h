//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProtocolSession.h
// Purpose: Handshake state for one protocol session (Uninitialized -> AwaitingInitializedAck -> Ready)
//==========================================================================================================

#pragma once

#include <atomic>
#include <mutex>
#include <optional>
#include <string>

#include "mcpgw/JSONRPCTypes.h"

namespace mcpgw {

enum class SessionState {
    Uninitialized,
    AwaitingInitializedAck,
    Ready
};

// "uninitialized" | "awaiting-initialized" | "ready"
const char* SessionStateName(SessionState state);

//==========================================================================================================
// ProtocolSession
// Purpose: Captures clientInfo/protocolVersion from initialize and tracks the handshake state.
// Notes:
//   Streaming and socket connections own one session each; the HTTP adapter shares one session for the
//   process lifetime. State is readable from any thread (diagnostics); transitions happen on the event loop.
//==========================================================================================================
class ProtocolSession {
public:
    explicit ProtocolSession(std::string id);

    const std::string& Id() const { return id; }

    SessionState State() const { return state.load(); }
    bool IsReady() const { return state.load() == SessionState::Ready; }

    //==========================================================================================================
    // OnInitialize
    // Purpose: Applies an initialize request (valid in any state).
    // Args:
    //   params: initialize params; clientInfo and protocolVersion are captured when present.
    //   defaultVersion: Version answered when the client requested none.
    // Returns:
    //   The protocol version to answer with (the client's, echoed, or defaultVersion).
    //==========================================================================================================
    std::string OnInitialize(const std::optional<JSONValue>& params, const std::string& defaultVersion);

    //==========================================================================================================
    // OnInitialized
    // Purpose: Applies the initialized notification.
    // Returns:
    //   true when this call moved the session to Ready; false when it was already Ready.
    //==========================================================================================================
    bool OnInitialized();

    // Negotiated protocol version (empty before initialize).
    std::string ProtocolVersion() const;

    // clientInfo captured at initialize, if any.
    std::optional<JSONValue> ClientInfo() const;

private:
    std::string id;
    std::atomic<SessionState> state{SessionState::Uninitialized};
    mutable std::mutex mutex;
    std::string protocolVersion;
    std::optional<JSONValue> clientInfo;
};

} // namespace mcpgw
