#pragma once

/// @file lobby_coordinator.hpp
/// @brief Lobby coordination service: validates every lobby request, routes
///        it to the right lobby, and exposes the public game listing.
///
/// LobbyCoordinator owns the factory registry, the lobby registry and the
/// per-connection contexts. It never inspects a lobby's concrete type.

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "lcs/foundation/service_result.hpp"
#include "lcs/service/lobby.hpp"
#include "lcs/service/lobby_factory_registry.hpp"
#include "lcs/service/lobby_types.hpp"

namespace lcs::service {

/// Orchestrator for lobby creation, membership and discovery.
///
/// Usage:
/// @code
///   LobbyCoordinator coordinator(LobbyCoordinatorConfig{});
///   coordinator.registerFactory("deathmatch", makeDeathmatchFactory(presets));
///   coordinator.start();
///
///   auto id = coordinator.createLobby(host, "deathmatch", {{"maxPlayers", "8"}});
///   coordinator.joinLobby(host, id.value());
///   coordinator.joinLobby(guest, id.value());
///   coordinator.setLobbyProperties(host, id.value(), {{"map", "arena2"}});
///
///   auto games = coordinator.getPublicGames(guest, {});
///   coordinator.stop();
/// @endcode
class LobbyCoordinator {
public:
    explicit LobbyCoordinator(LobbyCoordinatorConfig config);
    ~LobbyCoordinator();

    LobbyCoordinator(const LobbyCoordinator&) = delete;
    LobbyCoordinator& operator=(const LobbyCoordinator&) = delete;
    LobbyCoordinator(LobbyCoordinator&&) noexcept;
    LobbyCoordinator& operator=(LobbyCoordinator&&) noexcept;

    // -- Lifecycle ------------------------------------------------------------

    /// Start accepting requests.
    [[nodiscard]] lcs::foundation::ServiceResult<void> start();

    /// Destroy every live lobby and forget every connection.
    /// Registered factories are kept.
    void stop();

    [[nodiscard]] bool isRunning() const noexcept;

    // -- Factories ------------------------------------------------------------

    /// Register or replace a lobby factory. Replacement logs a warning.
    bool registerFactory(const std::string& factoryId, LobbyFactory factory);

    [[nodiscard]] bool hasFactory(const std::string& factoryId) const;

    // -- Lobby requests -------------------------------------------------------

    /// Build a lobby with the named factory and register it.
    ///
    /// The creator owns the lobby but is not joined automatically.
    [[nodiscard]] lcs::foundation::ServiceResult<LobbyId> createLobby(
        const PeerInfo& peer, const std::string& factoryId, const LobbyProperties& options);

    /// Join a lobby; returns a snapshot personalized for the caller.
    [[nodiscard]] lcs::foundation::ServiceResult<LobbyData> joinLobby(
        const PeerInfo& peer, LobbyId lobbyId);

    /// Leave a lobby. Unknown lobbies and non-members succeed silently.
    [[nodiscard]] lcs::foundation::ServiceResult<void> leaveLobby(
        const PeerInfo& peer, LobbyId lobbyId);

    /// Apply lobby properties in order, stopping at the first rejected key.
    ///
    /// Keys before the rejected one stay applied. The error's subject names
    /// the rejected key.
    [[nodiscard]] lcs::foundation::ServiceResult<void> setLobbyProperties(
        const PeerInfo& peer, LobbyId lobbyId, const PropertyList& properties);

    /// Apply properties to the caller's member record in its current lobby,
    /// with the same stop-at-first-rejection rule.
    [[nodiscard]] lcs::foundation::ServiceResult<void> setMyProperties(
        const PeerInfo& peer, const PropertyList& properties);

    [[nodiscard]] lcs::foundation::ServiceResult<void> setReady(
        const PeerInfo& peer, bool isReady);

    [[nodiscard]] lcs::foundation::ServiceResult<void> joinTeam(
        const PeerInfo& peer, const std::string& teamName);

    /// Relay a chat message to the caller's current lobby.
    /// Callers outside a lobby get an error that must not be answered.
    [[nodiscard]] lcs::foundation::ServiceResult<void> sendChatMessage(
        const PeerInfo& peer, const std::string& message);

    /// Start the game in the caller's current lobby.
    [[nodiscard]] lcs::foundation::ServiceResult<void> startGame(const PeerInfo& peer);

    [[nodiscard]] lcs::foundation::ServiceResult<RoomAccess> getRoomAccess(
        const PeerInfo& peer);

    // -- Queries --------------------------------------------------------------

    [[nodiscard]] lcs::foundation::ServiceResult<LobbyMemberData> getMemberData(
        const PeerInfo& peer, LobbyId lobbyId, PeerId target) const;

    [[nodiscard]] lcs::foundation::ServiceResult<LobbyData> getLobbyInfo(
        const PeerInfo& peer, LobbyId lobbyId) const;

    /// One summary per live lobby. With non-empty @p filters, a lobby is
    /// listed only if every filter key is a public property with that value.
    [[nodiscard]] std::vector<GameInfo> getPublicGames(
        const PeerInfo& peer, const LobbyProperties& filters = {}) const;

    /// Lobby the connection joined most recently, if any.
    [[nodiscard]] std::optional<LobbyId> currentLobbyOf(PeerId peerId) const;

    [[nodiscard]] std::shared_ptr<ILobby> findLobby(LobbyId lobbyId) const;

    // -- Connections ----------------------------------------------------------

    /// Remove the connection from every lobby and drop its context.
    void onPeerDisconnected(PeerId peerId);

    // -- Statistics -----------------------------------------------------------

    [[nodiscard]] CoordinatorStats stats() const;

    [[nodiscard]] const LobbyCoordinatorConfig& config() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace lcs::service
