/// @file connection_lobby_context.cpp
/// @brief ConnectionLobbyContext implementation.

#include "lcs/service/connection_lobby_context.hpp"

#include <algorithm>

namespace lcs::service {

ConnectionLobbyContext::ConnectionLobbyContext(PeerId peerId, uint32_t joinedLobbiesLimit)
    : peerId_(peerId)
    , limit_(std::max<uint32_t>(joinedLobbiesLimit, 1)) {}

std::optional<LobbyId> ConnectionLobbyContext::currentLobby() const {
    std::lock_guard lock(mutex_);
    if (joined_.empty()) {
        return std::nullopt;
    }
    return joined_.back();
}

std::vector<LobbyId> ConnectionLobbyContext::joinedLobbies() const {
    std::lock_guard lock(mutex_);
    return joined_;
}

bool ConnectionLobbyContext::hasCapacity() const {
    std::lock_guard lock(mutex_);
    return joined_.size() < static_cast<std::size_t>(limit_);
}

bool ConnectionLobbyContext::bindLobby(LobbyId lobbyId) {
    std::lock_guard lock(mutex_);

    if (joined_.size() >= static_cast<std::size_t>(limit_)) {
        return false;
    }
    if (std::find(joined_.begin(), joined_.end(), lobbyId) != joined_.end()) {
        return false;
    }

    joined_.push_back(lobbyId);
    return true;
}

bool ConnectionLobbyContext::unbindLobby(LobbyId lobbyId) {
    std::lock_guard lock(mutex_);

    auto it = std::find(joined_.begin(), joined_.end(), lobbyId);
    if (it == joined_.end()) {
        return false;
    }
    joined_.erase(it);
    return true;
}

}  // namespace lcs::service
