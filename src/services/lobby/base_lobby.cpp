/// @file base_lobby.cpp
/// @brief BaseLobby implementation: membership, properties, teams and the
///        start/provisioning state machine.

#include "lcs/service/base_lobby.hpp"

#include <algorithm>
#include <future>
#include <stop_token>

#include "lcs/foundation/error_code.hpp"
#include "lcs/foundation/service_error.hpp"
#include "lcs/foundation/service_logger.hpp"

namespace lcs::service {

using lcs::foundation::ErrorCode;
using lcs::foundation::LogCategory;
using lcs::foundation::LogContext;
using lcs::foundation::LogLevel;
using lcs::foundation::ServiceError;
using lcs::foundation::ServiceResult;

namespace {

LogContext lobbyContext(LobbyId lobbyId, std::optional<PeerId> peerId = std::nullopt) {
    LogContext ctx;
    ctx.lobbyId = lobbyId;
    ctx.peerId = peerId;
    return ctx;
}

ServiceResult<void> fail(ErrorCode code, std::string message, std::string subject = {}) {
    return ServiceResult<void>::err(
        ServiceError(code, std::move(message), std::move(subject)));
}

} // anonymous namespace

BaseLobby::BaseLobby(LobbyId lobbyId, BaseLobbyConfig config, PeerId ownerId)
    : id_(lobbyId)
    , config_(std::move(config))
    , ownerId_(ownerId)
    , teams_(config_.teams)
    , properties_(config_.properties) {
    for (auto& team : teams_) {
        team.members.clear();
    }
}

BaseLobby::~BaseLobby() = default;

// -- Description --------------------------------------------------------------

std::string BaseLobby::name() const {
    return config_.name;
}

std::string BaseLobby::type() const {
    return config_.type;
}

uint32_t BaseLobby::maxPlayers() const {
    return config_.maxPlayers;
}

uint32_t BaseLobby::playerCount() const {
    std::lock_guard lock(mutex_);
    return static_cast<uint32_t>(members_.size());
}

LobbyState BaseLobby::state() const {
    std::lock_guard lock(mutex_);
    return state_;
}

PeerId BaseLobby::ownerId() const {
    std::lock_guard lock(mutex_);
    return ownerId_;
}

std::string BaseLobby::gameAddress() const {
    std::lock_guard lock(mutex_);
    return gameAddress_;
}

uint16_t BaseLobby::gamePort() const {
    std::lock_guard lock(mutex_);
    return gamePort_;
}

bool BaseLobby::hasMember(PeerId peerId) const {
    std::lock_guard lock(mutex_);
    return findMember(peerId) != nullptr;
}

bool BaseLobby::isDestroyed() const {
    std::lock_guard lock(mutex_);
    return state_ == LobbyState::Destroyed;
}

// -- Membership ---------------------------------------------------------------

ServiceResult<void> BaseLobby::addPlayer(
    const PeerInfo& peer, const std::shared_ptr<ConnectionLobbyContext>& context) {
    if (!context) {
        return fail(ErrorCode::InvalidArgument, "connection context is required");
    }

    Outbox outbox;
    {
        std::lock_guard lock(mutex_);

        if (state_ != LobbyState::Forming) {
            return fail(ErrorCode::LobbyNotAccepting, "Lobby is not accepting players");
        }
        if (findMember(peer.id) != nullptr) {
            return fail(ErrorCode::AlreadyLobbyMember, "Player is already in this lobby");
        }
        if (members_.size() >= static_cast<std::size_t>(config_.maxPlayers)) {
            return fail(ErrorCode::LobbyFull, "Lobby is full");
        }

        LobbyMember member;
        member.peerId = peer.id;
        member.username = peer.username;
        member.joinedAt = std::chrono::steady_clock::now();
        member.context = context;

        if (!teams_.empty()) {
            auto team = pickTeamFor(member);
            if (!team) {
                return fail(ErrorCode::LobbyFull, "All teams are full");
            }
            member.team = *team;
        }

        if (!context->bindLobby(id_)) {
            return fail(ErrorCode::AlreadyInLobby, "You're already in a lobby");
        }

        if (!member.team.empty()) {
            if (auto* team = findTeam(member.team)) {
                team->members.push_back(member.peerId);
            }
        }

        if (!ownerId_.isValid()) {
            ownerId_ = peer.id;
        }

        auto event = makeEvent(LobbyEventType::MemberJoined);
        event.subject = peer.id;
        event.key = member.team;
        event.value = peer.username;

        members_.push_back(std::move(member));
        broadcast(outbox, std::move(event));
    }

    LCS_LOG_CTX(LogLevel::Debug, LogCategory::Lobby, "Player joined lobby",
                lobbyContext(id_, peer.id));
    deliver(outbox);
    return ServiceResult<void>::ok();
}

bool BaseLobby::removePlayer(ConnectionLobbyContext& context) {
    const PeerId peerId = context.peerId();
    bool destroyNow = false;
    Outbox outbox;
    {
        std::lock_guard lock(mutex_);

        context.unbindLobby(id_);

        auto it = std::find_if(members_.begin(), members_.end(),
                               [peerId](const LobbyMember& m) { return m.peerId == peerId; });
        if (it == members_.end()) {
            return false;
        }

        auto leftEvent = makeEvent(LobbyEventType::MemberLeft);
        leftEvent.subject = peerId;
        leftEvent.value = it->username;
        outbox.emplace_back(peerId, leftEvent);

        detachFromTeam(*it);
        members_.erase(it);
        broadcast(outbox, std::move(leftEvent));

        if (ownerId_ == peerId) {
            // Members are kept in join order.
            ownerId_ = members_.empty() ? PeerId{} : members_.front().peerId;
            if (ownerId_.isValid()) {
                auto ownerEvent = makeEvent(LobbyEventType::OwnerChanged);
                ownerEvent.subject = ownerId_;
                broadcast(outbox, std::move(ownerEvent));
            }
        }

        destroyNow = members_.empty() && config_.destroyOnLastPlayerLeft &&
                     state_ != LobbyState::Destroyed;
    }

    LCS_LOG_CTX(LogLevel::Debug, LogCategory::Lobby, "Player left lobby",
                lobbyContext(id_, peerId));
    deliver(outbox);

    if (destroyNow) {
        destroy();
    }
    return true;
}

// -- Properties ---------------------------------------------------------------

ServiceResult<void> BaseLobby::validateInitialProperties() const {
    std::lock_guard lock(mutex_);
    for (const auto& [key, value] : properties_) {
        auto valid = validateProperty(key, value);
        if (!valid) {
            return fail(ErrorCode::InvalidLobbyOptions, std::string(valid.error().message()),
                        key);
        }
    }
    return ServiceResult<void>::ok();
}

ServiceResult<void> BaseLobby::setProperty(
    PeerId actor, const std::string& key, const std::string& value) {
    Outbox outbox;
    {
        std::lock_guard lock(mutex_);

        const bool isOwner = actor == ownerId_;
        const bool mayWrite = isOwner || (config_.allowPlayersChangeLobbyProperties &&
                                          findMember(actor) != nullptr);
        if (!mayWrite) {
            return fail(ErrorCode::NotLobbyOwner,
                        "Only the lobby owner can change lobby properties", key);
        }
        if (state_ != LobbyState::Forming) {
            return fail(ErrorCode::LobbyNotAccepting,
                        "Lobby properties can only change before the game starts", key);
        }

        auto valid = validateProperty(key, value);
        if (!valid) {
            const auto& error = valid.error();
            return fail(error.code(), std::string(error.message()), key);
        }

        properties_[key] = value;

        auto event = makeEvent(LobbyEventType::LobbyPropertyChanged);
        event.subject = actor;
        event.key = key;
        event.value = value;
        broadcast(outbox, std::move(event));
    }

    deliver(outbox);
    return ServiceResult<void>::ok();
}

ServiceResult<void> BaseLobby::setPlayerProperty(
    PeerId member, const std::string& key, const std::string& value) {
    Outbox outbox;
    {
        std::lock_guard lock(mutex_);

        auto* record = findMember(member);
        if (record == nullptr) {
            return fail(ErrorCode::NotLobbyMember, "Player is not in the lobby", key);
        }
        if (state_ == LobbyState::Starting || state_ == LobbyState::Destroyed) {
            return fail(ErrorCode::LobbyNotAccepting,
                        "Player properties are locked while the game starts", key);
        }

        auto valid = validatePlayerProperty(*record, key, value);
        if (!valid) {
            const auto& error = valid.error();
            return fail(error.code(), std::string(error.message()), key);
        }

        record->properties[key] = value;

        auto event = makeEvent(LobbyEventType::MemberPropertyChanged);
        event.subject = member;
        event.key = key;
        event.value = value;
        if (isPrivatePropertyKey(key)) {
            outbox.emplace_back(member, std::move(event));
        } else {
            broadcast(outbox, std::move(event));
        }
    }

    deliver(outbox);
    return ServiceResult<void>::ok();
}

ServiceResult<void> BaseLobby::setReadyState(PeerId member, bool isReady) {
    Outbox outbox;
    {
        std::lock_guard lock(mutex_);

        auto* record = findMember(member);
        if (record == nullptr) {
            return fail(ErrorCode::NotLobbyMember, "Player is not in the lobby");
        }

        record->isReady = isReady;

        auto event = makeEvent(LobbyEventType::MemberReadyChanged);
        event.subject = member;
        event.value = isReady ? "1" : "0";
        broadcast(outbox, std::move(event));
    }

    deliver(outbox);
    return ServiceResult<void>::ok();
}

ServiceResult<void> BaseLobby::tryJoinTeam(PeerId member, const std::string& teamName) {
    Outbox outbox;
    {
        std::lock_guard lock(mutex_);

        auto* record = findMember(member);
        if (record == nullptr) {
            return fail(ErrorCode::NotLobbyMember, "Player is not in the lobby", teamName);
        }
        if (!config_.enableTeamSwitching) {
            return fail(ErrorCode::TeamSwitchForbidden, "Team switching is disabled", teamName);
        }
        if (state_ != LobbyState::Forming) {
            return fail(ErrorCode::TeamSwitchForbidden,
                        "Teams are locked once the game starts", teamName);
        }

        auto* team = findTeam(teamName);
        if (team == nullptr) {
            return fail(ErrorCode::TeamNotFound, "Team not found", teamName);
        }
        if (record->team == teamName) {
            return ServiceResult<void>::ok();
        }
        if (team->members.size() >= static_cast<std::size_t>(team->maxPlayers)) {
            return fail(ErrorCode::TeamFull, "Team is full", teamName);
        }

        detachFromTeam(*record);
        team->members.push_back(member);
        record->team = teamName;

        auto event = makeEvent(LobbyEventType::MemberTeamChanged);
        event.subject = member;
        event.key = teamName;
        broadcast(outbox, std::move(event));
    }

    deliver(outbox);
    return ServiceResult<void>::ok();
}

// -- Game ---------------------------------------------------------------------

ServiceResult<void> BaseLobby::startGameManually(PeerId requester) {
    RoomRequest request;
    std::shared_ptr<IRoomProvisioner> provisioner;
    Outbox outbox;
    {
        std::lock_guard lock(mutex_);

        if (requester != ownerId_) {
            return fail(ErrorCode::NotLobbyOwner, "Only the lobby owner can start the game");
        }
        if (!config_.enableManualStart) {
            return fail(ErrorCode::StartConditionsNotMet, "Manual start is disabled");
        }
        if (state_ != LobbyState::Forming) {
            return fail(ErrorCode::StartConditionsNotMet,
                        std::string("Game cannot start while lobby is ") +
                            std::string(lobbyStateName(state_)));
        }

        auto ready = canStart();
        if (!ready) {
            return ready;
        }

        provisioner = config_.provisioner;
        if (!provisioner) {
            return fail(ErrorCode::ProvisionerUnavailable, "No room provisioner available");
        }

        request.lobbyId = id_;
        request.lobbyType = config_.type;
        request.name = config_.name;
        request.maxPlayers = config_.maxPlayers;
        request.properties = properties_;
        for (const auto& member : members_) {
            request.players.push_back(member.peerId);
        }

        state_ = LobbyState::Starting;
        auto event = makeEvent(LobbyEventType::StateChanged);
        event.key = lobbyStateName(state_);
        broadcast(outbox, std::move(event));
    }
    deliver(outbox);
    outbox.clear();

    LCS_LOG_CTX(LogLevel::Info, LogCategory::Provisioning, "Provisioning game room",
                lobbyContext(id_, requester));

    // Provisioning runs without the lobby lock; Starting rejects writes meanwhile.
    std::stop_source cancel;
    auto pending = provisioner->provisionRoom(std::move(request), cancel.get_token());

    ServiceResult<RoomEndpoint> outcome = ServiceResult<RoomEndpoint>::err(
        ServiceError(ErrorCode::ProvisioningFailed, "Failed starting the game"));

    if (!pending.valid()) {
        outcome = ServiceResult<RoomEndpoint>::err(
            ServiceError(ErrorCode::ProvisioningFailed, "Room provisioner returned no result"));
    } else if (pending.wait_for(config_.startTimeout) != std::future_status::ready) {
        cancel.request_stop();
        outcome = ServiceResult<RoomEndpoint>::err(
            ServiceError(ErrorCode::ProvisioningTimeout, "Room provisioning timed out"));
    } else {
        auto endpoint = pending.get();
        if (endpoint) {
            outcome = std::move(endpoint);
        } else {
            outcome = ServiceResult<RoomEndpoint>::err(
                ServiceError(ErrorCode::ProvisioningFailed,
                             std::string(endpoint.error().message())));
        }
    }

    ServiceResult<void> result = ServiceResult<void>::ok();
    bool orphaned = false;
    {
        std::lock_guard lock(mutex_);

        if (state_ == LobbyState::Destroyed) {
            orphaned = true;
        } else if (outcome) {
            const auto& endpoint = outcome.value();
            roomId_ = endpoint.roomId;
            gameAddress_ = endpoint.address;
            gamePort_ = endpoint.port;
            state_ = LobbyState::InProgress;

            auto stateEvent = makeEvent(LobbyEventType::StateChanged);
            stateEvent.key = lobbyStateName(state_);
            broadcast(outbox, std::move(stateEvent));

            auto startedEvent = makeEvent(LobbyEventType::GameStarted);
            startedEvent.key = gameAddress_;
            startedEvent.value = std::to_string(gamePort_);
            broadcast(outbox, std::move(startedEvent));
        } else {
            state_ = LobbyState::Forming;

            auto stateEvent = makeEvent(LobbyEventType::StateChanged);
            stateEvent.key = lobbyStateName(state_);
            broadcast(outbox, std::move(stateEvent));

            const auto& error = outcome.error();
            result = ServiceResult<void>::err(
                ServiceError(error.code(), std::string(error.message())));
        }
    }
    deliver(outbox);

    if (orphaned) {
        if (outcome) {
            provisioner->releaseRoom(outcome.value().roomId);
        }
        LCS_LOG_CTX(LogLevel::Warning, LogCategory::Provisioning,
                    "Lobby closed while its room was provisioned", lobbyContext(id_, requester));
        return fail(ErrorCode::LobbyNotAccepting, "Lobby was closed while starting");
    }

    if (result) {
        LCS_LOG_CTX(LogLevel::Info, LogCategory::Provisioning, "Game started",
                    lobbyContext(id_, requester));
    } else {
        auto ctx = lobbyContext(id_, requester);
        ctx.extra["reason"] = std::string(result.error().message());
        LCS_LOG_CTX(LogLevel::Error, LogCategory::Provisioning, "Game start failed", ctx);
    }
    return result;
}

ServiceResult<RoomAccess> BaseLobby::gameAccessRequestHandler(const PeerInfo& requester) {
    std::shared_ptr<IRoomProvisioner> provisioner;
    std::string roomId;
    RoomAccess fallback;
    {
        std::lock_guard lock(mutex_);

        if (findMember(requester.id) == nullptr) {
            return ServiceResult<RoomAccess>::err(
                ServiceError(ErrorCode::NotLobbyMember, "Player is not in the lobby"));
        }
        if (state_ != LobbyState::InProgress) {
            return ServiceResult<RoomAccess>::err(
                ServiceError(ErrorCode::GameNotStarted, "Game is not in progress"));
        }
        provisioner = config_.provisioner;
        if (!provisioner) {
            return ServiceResult<RoomAccess>::err(
                ServiceError(ErrorCode::ProvisionerUnavailable, "No room provisioner available"));
        }
        roomId = roomId_;
        fallback.address = gameAddress_;
        fallback.port = gamePort_;
    }

    auto access = provisioner->requestAccess(roomId, requester);
    if (!access) {
        return access;
    }

    auto granted = std::move(access).value();
    if (granted.address.empty()) {
        granted.address = fallback.address;
        granted.port = fallback.port;
    }
    if (granted.roomId.empty()) {
        granted.roomId = roomId;
    }
    return ServiceResult<RoomAccess>::ok(std::move(granted));
}

bool BaseLobby::chatMessageHandler(PeerId sender, const std::string& message) {
    Outbox outbox;
    {
        std::lock_guard lock(mutex_);

        const auto* member = findMember(sender);
        if (member == nullptr) {
            return false;
        }

        auto event = makeEvent(LobbyEventType::ChatMessage);
        event.subject = sender;
        event.key = member->username;
        event.value = message;
        broadcast(outbox, std::move(event));
    }

    deliver(outbox);
    return true;
}

// -- Snapshots ----------------------------------------------------------------

LobbyData BaseLobby::generateLobbyData(std::optional<PeerId> requester) const {
    std::lock_guard lock(mutex_);

    LobbyData data;
    data.lobbyId = id_;
    data.name = config_.name;
    data.type = config_.type;
    data.state = state_;
    data.maxPlayers = config_.maxPlayers;
    data.playerCount = static_cast<uint32_t>(members_.size());
    data.ownerId = ownerId_;
    data.gameAddress = gameAddress_;
    data.gamePort = gamePort_;
    data.properties = properties_;
    data.enableReadySystem = config_.enableReadySystem;
    data.enableManualStart = config_.enableManualStart;
    data.enableTeamSwitching = config_.enableTeamSwitching;

    for (const auto& member : members_) {
        const bool self = requester && *requester == member.peerId;
        data.members.push_back(toMemberData(member, self));
    }

    for (const auto& team : teams_) {
        LobbyTeamData teamData;
        teamData.name = team.name;
        teamData.minPlayers = team.minPlayers;
        teamData.maxPlayers = team.maxPlayers;
        teamData.properties = team.properties;
        teamData.members = team.members;
        data.teams.push_back(std::move(teamData));
    }

    if (requester && findMember(*requester) != nullptr) {
        data.requesterId = requester;
    }
    return data;
}

std::optional<LobbyMemberData> BaseLobby::memberData(PeerId peerId) const {
    std::lock_guard lock(mutex_);

    const auto* member = findMember(peerId);
    if (member == nullptr) {
        return std::nullopt;
    }
    return toMemberData(*member, false);
}

LobbyProperties BaseLobby::getPublicProperties(std::optional<PeerId> requester) const {
    std::lock_guard lock(mutex_);
    return publicPropertiesFor(requester);
}

// -- Lifetime -----------------------------------------------------------------

void BaseLobby::destroy() {
    Outbox outbox;
    std::string roomId;
    {
        std::lock_guard lock(mutex_);

        if (state_ == LobbyState::Destroyed) {
            return;
        }
        roomId = roomId_;

        broadcast(outbox, makeEvent(LobbyEventType::LobbyDestroyed));

        for (auto& member : members_) {
            if (auto context = member.context.lock()) {
                context->unbindLobby(id_);
            }
        }
        members_.clear();
        for (auto& team : teams_) {
            team.members.clear();
        }
        state_ = LobbyState::Destroyed;
    }

    LCS_LOG_CTX(LogLevel::Info, LogCategory::Lobby, "Lobby destroyed", lobbyContext(id_));
    if (!roomId.empty() && config_.provisioner) {
        config_.provisioner->releaseRoom(roomId);
    }
    deliver(outbox);
    destroyed_.emit(id_);
}

// -- Default hooks ------------------------------------------------------------

ServiceResult<void> BaseLobby::validateProperty(const std::string& /*key*/,
                                                const std::string& /*value*/) const {
    return ServiceResult<void>::ok();
}

ServiceResult<void> BaseLobby::validatePlayerProperty(const LobbyMember& /*member*/,
                                                      const std::string& /*key*/,
                                                      const std::string& /*value*/) const {
    return ServiceResult<void>::ok();
}

ServiceResult<void> BaseLobby::canStart() const {
    if (members_.size() < static_cast<std::size_t>(config_.minPlayers)) {
        return fail(ErrorCode::StartConditionsNotMet, "Not enough players to start");
    }

    if (config_.enableReadySystem) {
        const bool allReady = std::all_of(members_.begin(), members_.end(),
                                          [](const LobbyMember& m) { return m.isReady; });
        if (!allReady) {
            return fail(ErrorCode::StartConditionsNotMet, "Not all players are ready");
        }
    }

    for (const auto& team : teams_) {
        if (team.members.size() < static_cast<std::size_t>(team.minPlayers)) {
            return fail(ErrorCode::StartConditionsNotMet,
                        "Team " + team.name + " needs more players", team.name);
        }
    }
    return ServiceResult<void>::ok();
}

LobbyProperties BaseLobby::publicPropertiesFor(std::optional<PeerId> /*requester*/) const {
    LobbyProperties result;
    for (const auto& [key, value] : properties_) {
        if (!isPrivatePropertyKey(key)) {
            result.emplace(key, value);
        }
    }
    return result;
}

std::optional<std::string> BaseLobby::pickTeamFor(const LobbyMember& /*member*/) const {
    const LobbyTeam* best = nullptr;
    for (const auto& team : teams_) {
        if (team.members.size() >= static_cast<std::size_t>(team.maxPlayers)) {
            continue;
        }
        if (best == nullptr || team.members.size() < best->members.size()) {
            best = &team;
        }
    }

    if (best == nullptr) {
        return std::nullopt;
    }
    return best->name;
}

// -- Internals ----------------------------------------------------------------

LobbyMember* BaseLobby::findMember(PeerId peerId) {
    auto it = std::find_if(members_.begin(), members_.end(),
                           [peerId](const LobbyMember& m) { return m.peerId == peerId; });
    return it == members_.end() ? nullptr : &*it;
}

const LobbyMember* BaseLobby::findMember(PeerId peerId) const {
    auto it = std::find_if(members_.begin(), members_.end(),
                           [peerId](const LobbyMember& m) { return m.peerId == peerId; });
    return it == members_.end() ? nullptr : &*it;
}

LobbyTeam* BaseLobby::findTeam(const std::string& teamName) {
    auto it = std::find_if(teams_.begin(), teams_.end(),
                           [&teamName](const LobbyTeam& t) { return t.name == teamName; });
    return it == teams_.end() ? nullptr : &*it;
}

void BaseLobby::detachFromTeam(LobbyMember& member) {
    if (member.team.empty()) {
        return;
    }
    if (auto* team = findTeam(member.team)) {
        std::erase(team->members, member.peerId);
    }
    member.team.clear();
}

LobbyMemberData BaseLobby::toMemberData(const LobbyMember& member, bool includePrivate) const {
    LobbyMemberData data;
    data.peerId = member.peerId;
    data.username = member.username;
    data.isReady = member.isReady;
    data.team = member.team;
    for (const auto& [key, value] : member.properties) {
        if (includePrivate || !isPrivatePropertyKey(key)) {
            data.properties.emplace(key, value);
        }
    }
    return data;
}

LobbyEvent BaseLobby::makeEvent(LobbyEventType type) const {
    LobbyEvent event;
    event.type = type;
    event.lobbyId = id_;
    return event;
}

void BaseLobby::broadcast(Outbox& outbox, LobbyEvent event) const {
    for (const auto& member : members_) {
        outbox.emplace_back(member.peerId, event);
    }
}

void BaseLobby::deliver(const Outbox& outbox) const {
    if (!config_.eventSink) {
        return;
    }
    for (const auto& [recipient, event] : outbox) {
        config_.eventSink->deliver(recipient, event);
    }
}

}  // namespace lcs::service
