#pragma once

/// @file base_lobby.hpp
/// @brief Reference ILobby implementation with overridable rule hooks.
///
/// BaseLobby implements membership, owner hand-off, lobby and member
/// properties, readiness, teams, chat, the Forming -> Starting ->
/// InProgress -> Destroyed state machine, and room provisioning on start.
/// Game types customize it through BaseLobbyConfig and by overriding the
/// protected validation hooks.

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "lcs/foundation/service_result.hpp"
#include "lcs/foundation/signal.hpp"
#include "lcs/service/lobby.hpp"
#include "lcs/service/lobby_events.hpp"
#include "lcs/service/room_provisioner.hpp"

namespace lcs::service {

/// A team inside a lobby. In BaseLobbyConfig the member list is empty.
struct LobbyTeam {
    std::string name;
    uint32_t minPlayers = 1;
    uint32_t maxPlayers = 1;
    LobbyProperties properties;
    std::vector<PeerId> members;
};

/// One connection's participation record inside a lobby.
struct LobbyMember {
    PeerId peerId;
    std::string username;
    LobbyProperties properties;
    bool isReady = false;
    std::string team;
    std::chrono::steady_clock::time_point joinedAt;

    /// Non-owning handle back to the connection's context.
    std::weak_ptr<ConnectionLobbyContext> context;
};

/// Rules and collaborators for a BaseLobby.
struct BaseLobbyConfig {
    std::string name = "Lobby";
    std::string type;
    uint32_t maxPlayers = 10;

    /// Members required before the game may start.
    uint32_t minPlayers = 1;

    /// Empty means the lobby has no teams.
    std::vector<LobbyTeam> teams;

    /// Initial lobby-level properties.
    LobbyProperties properties;

    bool enableReadySystem = true;
    bool enableManualStart = true;
    bool enableTeamSwitching = true;

    /// Let any member, not only the owner, write lobby properties.
    bool allowPlayersChangeLobbyProperties = false;

    bool destroyOnLastPlayerLeft = true;

    /// Upper bound on room provisioning during startGameManually().
    std::chrono::milliseconds startTimeout{10000};

    std::shared_ptr<ILobbyEventSink> eventSink;
    std::shared_ptr<IRoomProvisioner> provisioner;
};

/// Mutex-per-lobby implementation of ILobby.
///
/// Lock order is lobby -> connection context. Notifications and the
/// destroyed signal are delivered after the lobby lock is released, so a
/// sink or a destroyed-signal slot may call back into the lobby.
///
/// Usage:
/// @code
///   BaseLobbyConfig cfg;
///   cfg.type = "deathmatch";
///   cfg.maxPlayers = 8;
///   cfg.eventSink = sink;
///   cfg.provisioner = provisioner;
///   auto lobby = std::make_shared<BaseLobby>(lobbyId, std::move(cfg), creator.id);
///   lobby->addPlayer(creator, context);
///   lobby->setProperty(creator.id, "map", "arena2");
/// @endcode
class BaseLobby : public ILobby {
public:
    BaseLobby(LobbyId lobbyId, BaseLobbyConfig config, PeerId ownerId);
    ~BaseLobby() override;

    BaseLobby(const BaseLobby&) = delete;
    BaseLobby& operator=(const BaseLobby&) = delete;

    // -- ILobby: description --------------------------------------------------

    [[nodiscard]] LobbyId id() const noexcept override { return id_; }
    [[nodiscard]] std::string name() const override;
    [[nodiscard]] std::string type() const override;
    [[nodiscard]] uint32_t maxPlayers() const override;
    [[nodiscard]] uint32_t playerCount() const override;
    [[nodiscard]] LobbyState state() const override;
    [[nodiscard]] PeerId ownerId() const override;
    [[nodiscard]] std::string gameAddress() const override;
    [[nodiscard]] uint16_t gamePort() const override;
    [[nodiscard]] bool hasMember(PeerId peerId) const override;

    // -- ILobby: operations ---------------------------------------------------

    [[nodiscard]] lcs::foundation::ServiceResult<void> addPlayer(
        const PeerInfo& peer,
        const std::shared_ptr<ConnectionLobbyContext>& context) override;

    bool removePlayer(ConnectionLobbyContext& context) override;

    [[nodiscard]] lcs::foundation::ServiceResult<void> setProperty(
        PeerId actor, const std::string& key, const std::string& value) override;

    [[nodiscard]] lcs::foundation::ServiceResult<void> setPlayerProperty(
        PeerId member, const std::string& key, const std::string& value) override;

    [[nodiscard]] lcs::foundation::ServiceResult<void> setReadyState(
        PeerId member, bool isReady) override;

    [[nodiscard]] lcs::foundation::ServiceResult<void> tryJoinTeam(
        PeerId member, const std::string& teamName) override;

    [[nodiscard]] lcs::foundation::ServiceResult<void> startGameManually(
        PeerId requester) override;

    [[nodiscard]] lcs::foundation::ServiceResult<RoomAccess> gameAccessRequestHandler(
        const PeerInfo& requester) override;

    bool chatMessageHandler(PeerId sender, const std::string& message) override;

    [[nodiscard]] LobbyData generateLobbyData(
        std::optional<PeerId> requester = std::nullopt) const override;

    [[nodiscard]] std::optional<LobbyMemberData> memberData(PeerId peerId) const override;

    [[nodiscard]] LobbyProperties getPublicProperties(
        std::optional<PeerId> requester = std::nullopt) const override;

    void destroy() override;

    [[nodiscard]] bool isDestroyed() const override;

    [[nodiscard]] lcs::foundation::Signal<LobbyId>& destroyedSignal() override {
        return destroyed_;
    }

    /// Run validateProperty() over the initial lobby properties. Factories
    /// call this once after construction; a rejected key fails with
    /// InvalidLobbyOptions naming that key.
    [[nodiscard]] lcs::foundation::ServiceResult<void> validateInitialProperties() const;

protected:
    // -- Rule hooks -----------------------------------------------------------
    //
    // Hooks run with the lobby lock held. They may read state through the
    // protected accessors below but must not call the public API.

    /// Validate a lobby-level property write. Default accepts everything.
    [[nodiscard]] virtual lcs::foundation::ServiceResult<void> validateProperty(
        const std::string& key, const std::string& value) const;

    /// Validate a member-level property write. Default accepts everything.
    [[nodiscard]] virtual lcs::foundation::ServiceResult<void> validatePlayerProperty(
        const LobbyMember& member, const std::string& key, const std::string& value) const;

    /// Start preconditions: minimum players, every member ready (when the
    /// ready system is enabled) and every team at its minimum.
    [[nodiscard]] virtual lcs::foundation::ServiceResult<void> canStart() const;

    /// Lobby properties visible to @p requester in discovery listings.
    /// Default drops private ("#"-prefixed) keys.
    [[nodiscard]] virtual LobbyProperties publicPropertiesFor(
        std::optional<PeerId> requester) const;

    /// Team for a newly joining member. Default picks the least populated
    /// team that is not full; declaration order breaks ties.
    [[nodiscard]] virtual std::optional<std::string> pickTeamFor(
        const LobbyMember& member) const;

    // -- Locked accessors for hooks -------------------------------------------

    [[nodiscard]] const BaseLobbyConfig& config() const noexcept { return config_; }
    [[nodiscard]] const std::vector<LobbyMember>& members() const noexcept { return members_; }
    [[nodiscard]] const std::vector<LobbyTeam>& teams() const noexcept { return teams_; }
    [[nodiscard]] const LobbyProperties& properties() const noexcept { return properties_; }

private:
    using Outbox = std::vector<std::pair<PeerId, LobbyEvent>>;

    [[nodiscard]] LobbyMember* findMember(PeerId peerId);
    [[nodiscard]] const LobbyMember* findMember(PeerId peerId) const;
    [[nodiscard]] LobbyTeam* findTeam(const std::string& teamName);
    void detachFromTeam(LobbyMember& member);

    [[nodiscard]] LobbyMemberData toMemberData(const LobbyMember& member,
                                               bool includePrivate) const;

    /// Queue @p event for every current member.
    void broadcast(Outbox& outbox, LobbyEvent event) const;

    /// Deliver queued events. Called without the lobby lock.
    void deliver(const Outbox& outbox) const;

    [[nodiscard]] LobbyEvent makeEvent(LobbyEventType type) const;

    const LobbyId id_;
    const BaseLobbyConfig config_;

    mutable std::mutex mutex_;
    LobbyState state_ = LobbyState::Forming;
    PeerId ownerId_;
    std::vector<LobbyMember> members_;
    std::vector<LobbyTeam> teams_;
    LobbyProperties properties_;
    std::string roomId_;
    std::string gameAddress_;
    uint16_t gamePort_ = 0;

    lcs::foundation::Signal<LobbyId> destroyed_;
};

}  // namespace lcs::service
