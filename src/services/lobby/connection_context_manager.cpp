/// @file connection_context_manager.cpp
/// @brief ConnectionContextManager implementation.

#include "lcs/service/connection_context_manager.hpp"

namespace lcs::service {

ConnectionContextManager::ConnectionContextManager(uint32_t joinedLobbiesLimit)
    : joinedLobbiesLimit_(joinedLobbiesLimit) {}

std::shared_ptr<ConnectionLobbyContext> ConnectionContextManager::getOrCreate(PeerId peerId) {
    std::lock_guard lock(mutex_);

    auto it = contexts_.find(peerId);
    if (it != contexts_.end()) {
        return it->second;
    }

    auto ctx = std::make_shared<ConnectionLobbyContext>(peerId, joinedLobbiesLimit_);
    contexts_.emplace(peerId, ctx);
    return ctx;
}

std::shared_ptr<ConnectionLobbyContext> ConnectionContextManager::find(PeerId peerId) const {
    std::lock_guard lock(mutex_);

    auto it = contexts_.find(peerId);
    if (it == contexts_.end()) {
        return nullptr;
    }
    return it->second;
}

std::shared_ptr<ConnectionLobbyContext> ConnectionContextManager::remove(PeerId peerId) {
    std::lock_guard lock(mutex_);

    auto it = contexts_.find(peerId);
    if (it == contexts_.end()) {
        return nullptr;
    }
    auto ctx = std::move(it->second);
    contexts_.erase(it);
    return ctx;
}

std::size_t ConnectionContextManager::size() const {
    std::lock_guard lock(mutex_);
    return contexts_.size();
}

void ConnectionContextManager::clear() {
    std::lock_guard lock(mutex_);
    contexts_.clear();
}

}  // namespace lcs::service
