//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ConnectionManager.cpp
// Purpose: Session bookkeeping for the gateway server
//==========================================================================================================

#include <algorithm>
#include <stdexcept>

#include "logging/Logger.h"
#include "toolgate/ConnectionManager.h"

namespace toolgate {

std::string ConnectionManager::NextId() {
    std::lock_guard<std::mutex> lock(mutex_);
    return "conn-" + std::to_string(++nextId_);
}

void ConnectionManager::Add(const std::shared_ptr<Session>& session) {
    if (!session) {
        throw std::invalid_argument("ConnectionManager::Add: null session");
    }
    std::size_t count = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!sessions_.emplace(session->Id(), session).second) {
            throw std::logic_error("session already registered: " + session->Id());
        }
        count = sessions_.size();
    }
    LOG_INFO("Connection {} registered ({} active)", session->Id(), count);
}

bool ConnectionManager::Remove(const std::string& id) {
    std::size_t count = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (sessions_.erase(id) == 0) {
            return false;
        }
        count = sessions_.size();
    }
    LOG_INFO("Connection {} removed ({} active)", id, count);
    return true;
}

std::shared_ptr<Session> ConnectionManager::Find(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(id);
    return it == sessions_.end() ? nullptr : it->second;
}

std::size_t ConnectionManager::Count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

std::vector<std::string> ConnectionManager::Ids() const {
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ids.reserve(sessions_.size());
        for (const auto& kv : sessions_) {
            ids.push_back(kv.first);
        }
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

std::vector<std::shared_ptr<Session>> ConnectionManager::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<Session>> out;
    out.reserve(sessions_.size());
    for (const auto& kv : sessions_) {
        out.push_back(kv.second);
    }
    return out;
}

void ConnectionManager::ForEach(const std::function<void(const std::shared_ptr<Session>&)>& fn) const {
    for (const auto& s : snapshot()) {
        fn(s);
    }
}

void ConnectionManager::CloseAll() {
    std::vector<std::shared_ptr<Session>> all;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        all.reserve(sessions_.size());
        for (auto& kv : sessions_) {
            all.push_back(std::move(kv.second));
        }
        sessions_.clear();
    }
    for (const auto& s : all) {
        s->Close();
    }
    if (!all.empty()) {
        LOG_INFO("Closed {} connection(s)", all.size());
    }
}

} // namespace toolgate
