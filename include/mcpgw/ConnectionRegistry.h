//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ConnectionRegistry.h
// Purpose: Set of live transport sessions for diagnostics and "anyone connected" checks
//==========================================================================================================

#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace mcpgw {

class ProtocolSession;

// Which adapter (or executor bridge) owns a connection.
enum class TransportKind {
    Streaming,
    Socket,
    Http,
    Executor
};

const char* TransportKindName(TransportKind kind);

// Random handle id "<prefix>-<16 hex chars>".
std::string MakeConnectionId(const std::string& prefix);

//==========================================================================================================
// ConnectionInfo
// Purpose: One registered handle.
// Fields:
//   id: Unique handle id (session id, socket id, or executor client id).
//   kind: Owning adapter.
//   remote: Peer description for logs (address:port or client id).
//   openedAt: Registration time.
//   session: Protocol session bound to the connection (null for HTTP exchanges and executors).
//==========================================================================================================
struct ConnectionInfo {
    std::string id;
    TransportKind kind{TransportKind::Http};
    std::string remote;
    std::chrono::system_clock::time_point openedAt{std::chrono::system_clock::now()};
    std::shared_ptr<ProtocolSession> session;
};

//==========================================================================================================
// ConnectionRegistry
// Purpose: add/remove/count/isAnyoneConnected over the live handles.
// Notes:
//   Guarded by a mutex: adapters mutate it on the event loop while the executor bridge mutates its own
//   instance from its receive thread.
//==========================================================================================================
class ConnectionRegistry {
public:
    // Returns false when a handle with the same id is already registered.
    bool Add(ConnectionInfo info);

    // Returns false when the id was not registered.
    bool Remove(const std::string& id);

    bool Contains(const std::string& id) const;

    std::size_t Count() const;
    std::size_t Count(TransportKind kind) const;

    bool IsAnyoneConnected() const { return Count() > 0; }

    // Number of registered sessions whose handshake reached Ready.
    std::size_t ReadySessionCount() const;

    std::vector<ConnectionInfo> Snapshot() const;

private:
    mutable std::mutex mutex;
    std::unordered_map<std::string, ConnectionInfo> entries;
};

} // namespace mcpgw
