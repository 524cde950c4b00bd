#pragma once

/// @file lobby.hpp
/// @brief ILobby: the capability interface every lobby implementation exposes.
///
/// The coordinator only talks to lobbies through this interface and never
/// inspects the concrete type. Game-specific rule sets derive from BaseLobby
/// (or implement ILobby directly) and are selected by factory id.

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "lcs/foundation/service_result.hpp"
#include "lcs/foundation/signal.hpp"
#include "lcs/service/connection_lobby_context.hpp"
#include "lcs/service/lobby_types.hpp"

namespace lcs::service {

/// A pre-match room tracking members, properties and teams.
///
/// Implementations serialize their own mutating operations; every method is
/// safe to call concurrently. Snapshot methods return value types, never
/// references to internal state.
class ILobby {
public:
    virtual ~ILobby() = default;

    // -- Description ----------------------------------------------------------

    [[nodiscard]] virtual LobbyId id() const noexcept = 0;
    [[nodiscard]] virtual std::string name() const = 0;

    /// Factory id this lobby was built from.
    [[nodiscard]] virtual std::string type() const = 0;

    [[nodiscard]] virtual uint32_t maxPlayers() const = 0;
    [[nodiscard]] virtual uint32_t playerCount() const = 0;
    [[nodiscard]] virtual LobbyState state() const = 0;
    [[nodiscard]] virtual PeerId ownerId() const = 0;
    [[nodiscard]] virtual std::string gameAddress() const = 0;
    [[nodiscard]] virtual uint16_t gamePort() const = 0;
    [[nodiscard]] virtual bool hasMember(PeerId peerId) const = 0;

    // -- Membership -----------------------------------------------------------

    /// Add the connection as a member.
    ///
    /// On success the lobby has bound itself into @p context, so
    /// context->currentLobby() equals id().
    [[nodiscard]] virtual lcs::foundation::ServiceResult<void> addPlayer(
        const PeerInfo& peer, const std::shared_ptr<ConnectionLobbyContext>& context) = 0;

    /// Remove the connection. Removing a non-member is a no-op.
    ///
    /// Always unbinds this lobby from @p context and clears any team
    /// assignment. Returns whether a member was actually removed.
    virtual bool removePlayer(ConnectionLobbyContext& context) = 0;

    // -- Properties -----------------------------------------------------------

    /// Lobby-level property write by @p actor, routed through the
    /// implementation's validation hook.
    [[nodiscard]] virtual lcs::foundation::ServiceResult<void> setProperty(
        PeerId actor, const std::string& key, const std::string& value) = 0;

    /// Member-level property write, routed through the validation hook.
    [[nodiscard]] virtual lcs::foundation::ServiceResult<void> setPlayerProperty(
        PeerId member, const std::string& key, const std::string& value) = 0;

    /// Unconditional readiness change. Fails only for non-members.
    [[nodiscard]] virtual lcs::foundation::ServiceResult<void> setReadyState(
        PeerId member, bool isReady) = 0;

    /// Move @p member into @p teamName, leaving any previous team.
    [[nodiscard]] virtual lcs::foundation::ServiceResult<void> tryJoinTeam(
        PeerId member, const std::string& teamName) = 0;

    // -- Game -----------------------------------------------------------------

    /// Start the game on behalf of @p requester and provision the room.
    ///
    /// May block for a bounded time while the room is provisioned. On failure
    /// the lobby state is left as it was before the call.
    [[nodiscard]] virtual lcs::foundation::ServiceResult<void> startGameManually(
        PeerId requester) = 0;

    /// Room-connection credentials for a member once the game is in progress.
    [[nodiscard]] virtual lcs::foundation::ServiceResult<RoomAccess> gameAccessRequestHandler(
        const PeerInfo& requester) = 0;

    /// Route a chat message from @p sender. Returns false if not delivered.
    virtual bool chatMessageHandler(PeerId sender, const std::string& message) = 0;

    // -- Snapshots ------------------------------------------------------------

    /// Full snapshot. When @p requester is a member, that member's private
    /// properties are included.
    [[nodiscard]] virtual LobbyData generateLobbyData(
        std::optional<PeerId> requester = std::nullopt) const = 0;

    /// Data packet of one member, or nullopt if @p peerId is not a member.
    [[nodiscard]] virtual std::optional<LobbyMemberData> memberData(PeerId peerId) const = 0;

    /// Lobby-level properties safe for discovery listings.
    [[nodiscard]] virtual LobbyProperties getPublicProperties(
        std::optional<PeerId> requester = std::nullopt) const = 0;

    // -- Lifetime -------------------------------------------------------------

    /// Enter Destroyed and emit destroyedSignal() exactly once. Idempotent.
    virtual void destroy() = 0;

    [[nodiscard]] virtual bool isDestroyed() const = 0;

    /// Fired once with id() when the lobby is destroyed.
    [[nodiscard]] virtual lcs::foundation::Signal<LobbyId>& destroyedSignal() = 0;
};

}  // namespace lcs::service
