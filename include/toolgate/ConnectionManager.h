//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ConnectionManager.h
// Purpose: Registry of live sessions keyed by connection id
//==========================================================================================================

#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "toolgate/Session.h"

namespace toolgate {

//==========================================================================================================
// ConnectionManager
// Purpose: Tracks sessions between handshake and close.
// Notes:
//   - All members are thread-safe. Callbacks passed to ForEach() run without the internal lock held,
//     on a snapshot of the sessions.
//   - Ids are generated here ("conn-1", "conn-2", ...) and never reused within a process.
//==========================================================================================================
class ConnectionManager {
public:
    ConnectionManager() = default;
    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    std::string NextId();

    // Throws std::logic_error when a session with the same id is already registered.
    void Add(const std::shared_ptr<Session>& session);

    // Returns false when the id was not registered.
    bool Remove(const std::string& id);

    std::shared_ptr<Session> Find(const std::string& id) const;
    std::size_t Count() const;
    std::vector<std::string> Ids() const;

    void ForEach(const std::function<void(const std::shared_ptr<Session>&)>& fn) const;

    // Closes every session and empties the registry.
    void CloseAll();

private:
    std::vector<std::shared_ptr<Session>> snapshot() const;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Session>> sessions_;
    uint64_t nextId_{0};
};

} // namespace toolgate
