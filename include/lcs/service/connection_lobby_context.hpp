#pragma once

/// @file connection_lobby_context.hpp
/// @brief Per-connection lobby membership bookkeeping.

#include <cstdint>
#include <mutex>
#include <optional>
#include <vector>

#include "lcs/service/lobby_types.hpp"

namespace lcs::service {

/// Tracks which lobbies one connection currently belongs to.
///
/// Holds lobby ids only; lobbies are owned by the LobbyRegistry and looked up
/// by id. Lobbies bind and unbind themselves here as members join and leave,
/// so the context always agrees with lobby membership.
///
/// Thread-safe. Never calls into a lobby, so a lobby may call it while
/// holding its own lock.
class ConnectionLobbyContext {
public:
    /// A limit below 1 is raised to 1.
    ConnectionLobbyContext(PeerId peerId, uint32_t joinedLobbiesLimit);

    [[nodiscard]] PeerId peerId() const noexcept { return peerId_; }

    /// Most recently joined lobby, if any.
    [[nodiscard]] std::optional<LobbyId> currentLobby() const;

    /// All joined lobbies in join order.
    [[nodiscard]] std::vector<LobbyId> joinedLobbies() const;

    /// True while the connection may join another lobby.
    [[nodiscard]] bool hasCapacity() const;

    /// Record membership in @p lobbyId.
    /// @return false if already bound to it or the join limit is reached.
    [[nodiscard]] bool bindLobby(LobbyId lobbyId);

    /// Forget membership in @p lobbyId. Returns whether it was bound.
    bool unbindLobby(LobbyId lobbyId);

private:
    const PeerId peerId_;
    const uint32_t limit_;
    mutable std::mutex mutex_;
    std::vector<LobbyId> joined_;
};

}  // namespace lcs::service
