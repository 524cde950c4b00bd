/// @file lobby_coordinator.cpp
/// @brief LobbyCoordinator implementation: request validation, routing and
///        discovery.

#include "lcs/service/lobby_coordinator.hpp"

#include <atomic>

#include "lcs/foundation/error_code.hpp"
#include "lcs/foundation/service_error.hpp"
#include "lcs/foundation/service_logger.hpp"
#include "lcs/service/connection_context_manager.hpp"
#include "lcs/service/lobby_registry.hpp"

namespace lcs::service {

using lcs::foundation::ErrorCode;
using lcs::foundation::LogCategory;
using lcs::foundation::LogContext;
using lcs::foundation::LogLevel;
using lcs::foundation::ServiceError;
using lcs::foundation::ServiceResult;

namespace {

template <typename T>
ServiceResult<T> notStarted() {
    return ServiceResult<T>::err(
        ServiceError(ErrorCode::CoordinatorNotStarted, "lobby coordinator is not running"));
}

LogContext requestContext(const PeerInfo& peer, std::optional<LobbyId> lobbyId = std::nullopt) {
    LogContext ctx;
    ctx.peerId = peer.id;
    ctx.lobbyId = lobbyId;
    return ctx;
}

/// The caller's current lobby plus its context.
struct MemberLobby {
    std::shared_ptr<ConnectionLobbyContext> context;
    std::shared_ptr<ILobby> lobby;
};

} // anonymous namespace

// -- Impl ---------------------------------------------------------------------

struct LobbyCoordinator::Impl {
    LobbyCoordinatorConfig config;

    LobbyFactoryRegistry factories;
    LobbyRegistry lobbies;
    ConnectionContextManager contexts;

    std::atomic<bool> running{false};
    std::atomic<uint64_t> lobbiesCreated{0};
    std::atomic<uint64_t> gamesStarted{0};

    explicit Impl(LobbyCoordinatorConfig cfg)
        : config(std::move(cfg))
        , contexts(config.joinedLobbiesLimit) {}

    /// Resolve the caller's current lobby. When @p requireMember is set the
    /// caller must also be a member of it.
    ServiceResult<MemberLobby> currentLobby(const PeerInfo& peer, bool requireMember) {
        auto context = contexts.getOrCreate(peer.id);

        auto lobbyId = context->currentLobby();
        if (!lobbyId) {
            return ServiceResult<MemberLobby>::err(
                ServiceError(ErrorCode::NotInLobby, "You're not in a lobby"));
        }

        auto lobby = lobbies.get(*lobbyId);
        if (!lobby) {
            // Stale binding to a lobby that is already gone.
            context->unbindLobby(*lobbyId);
            return ServiceResult<MemberLobby>::err(
                ServiceError(ErrorCode::NotInLobby, "You're not in a lobby"));
        }

        if (requireMember && !lobby->hasMember(peer.id)) {
            return ServiceResult<MemberLobby>::err(
                ServiceError(ErrorCode::NotLobbyMember, "Player is not in the lobby"));
        }

        return ServiceResult<MemberLobby>::ok(MemberLobby{std::move(context), std::move(lobby)});
    }
};

// -- Construction / destruction / move ----------------------------------------

LobbyCoordinator::LobbyCoordinator(LobbyCoordinatorConfig config)
    : impl_(std::make_unique<Impl>(std::move(config))) {}

LobbyCoordinator::~LobbyCoordinator() {
    if (impl_ && impl_->running.load()) {
        stop();
    }
}

LobbyCoordinator::LobbyCoordinator(LobbyCoordinator&&) noexcept = default;
LobbyCoordinator& LobbyCoordinator::operator=(LobbyCoordinator&&) noexcept = default;

// -- Lifecycle ----------------------------------------------------------------

ServiceResult<void> LobbyCoordinator::start() {
    if (impl_->running.exchange(true)) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::CoordinatorAlreadyStarted,
                         "lobby coordinator is already running"));
    }

    LCS_LOG_INFO(LogCategory::Coordinator,
                 "Lobby coordinator started with " +
                     std::to_string(impl_->factories.size()) + " factories");
    return ServiceResult<void>::ok();
}

void LobbyCoordinator::stop() {
    if (!impl_->running.exchange(false)) {
        return;
    }

    auto live = impl_->lobbies.allLobbies();
    for (const auto& lobby : live) {
        lobby->destroy();
    }
    impl_->lobbies.clear();
    impl_->contexts.clear();

    LCS_LOG_INFO(LogCategory::Coordinator,
                 "Lobby coordinator stopped, destroyed " + std::to_string(live.size()) +
                     " lobbies");
}

bool LobbyCoordinator::isRunning() const noexcept {
    return impl_->running.load();
}

// -- Factories ----------------------------------------------------------------

bool LobbyCoordinator::registerFactory(const std::string& factoryId, LobbyFactory factory) {
    return impl_->factories.registerFactory(factoryId, std::move(factory));
}

bool LobbyCoordinator::hasFactory(const std::string& factoryId) const {
    return impl_->factories.contains(factoryId);
}

// -- Lobby requests -----------------------------------------------------------

ServiceResult<LobbyId> LobbyCoordinator::createLobby(
    const PeerInfo& peer, const std::string& factoryId, const LobbyProperties& options) {
    if (!impl_->running.load()) {
        return notStarted<LobbyId>();
    }

    if (peer.permissionLevel < impl_->config.createLobbiesPermissionLevel) {
        return ServiceResult<LobbyId>::err(
            ServiceError(ErrorCode::PermissionDenied, "Insufficient permissions"));
    }

    auto context = impl_->contexts.getOrCreate(peer.id);
    if (impl_->config.dontAllowCreatingIfJoined && context->currentLobby()) {
        return ServiceResult<LobbyId>::err(
            ServiceError(ErrorCode::AlreadyInLobby, "You are already in a lobby"));
    }

    if (factoryId.empty()) {
        return ServiceResult<LobbyId>::err(
            ServiceError(ErrorCode::InvalidLobbyOptions, "Invalid request (undefined factory)"));
    }

    auto factory = impl_->factories.resolve(factoryId);
    if (!factory) {
        return ServiceResult<LobbyId>::err(
            ServiceError(ErrorCode::UnknownLobbyFactory, "Unavailable lobby factory", factoryId));
    }

    const LobbyId lobbyId = impl_->lobbies.generateLobbyId();
    auto built = (*factory)(lobbyId, options, peer);
    if (!built) {
        const auto& error = built.error();
        return ServiceResult<LobbyId>::err(
            ServiceError(error.code(), std::string(error.message()), std::string(error.subject())));
    }

    std::shared_ptr<ILobby> lobby = std::move(built).value();
    if (!lobby) {
        return ServiceResult<LobbyId>::err(
            ServiceError(ErrorCode::InvalidLobbyOptions, "Lobby factory produced no lobby",
                         factoryId));
    }

    auto added = impl_->lobbies.add(lobby);
    if (!added) {
        lobby->destroy();
        auto ctx = requestContext(peer, lobbyId);
        ctx.extra["reason"] = std::string(added.error().message());
        LCS_LOG_CTX(LogLevel::Error, LogCategory::Coordinator, "Lobby registration failed", ctx);
        return ServiceResult<LobbyId>::err(
            ServiceError(ErrorCode::LobbyRegistrationFailed, "Lobby registration failed"));
    }

    impl_->lobbiesCreated.fetch_add(1, std::memory_order_relaxed);

    auto ctx = requestContext(peer, lobbyId);
    ctx.extra["factory"] = factoryId;
    LCS_LOG_CTX(LogLevel::Info, LogCategory::Coordinator, "Lobby created", ctx);

    return ServiceResult<LobbyId>::ok(lobbyId);
}

ServiceResult<LobbyData> LobbyCoordinator::joinLobby(const PeerInfo& peer, LobbyId lobbyId) {
    if (!impl_->running.load()) {
        return notStarted<LobbyData>();
    }

    auto context = impl_->contexts.getOrCreate(peer.id);
    if (!context->hasCapacity()) {
        return ServiceResult<LobbyData>::err(
            ServiceError(ErrorCode::AlreadyInLobby, "You're already in a lobby"));
    }

    auto lobby = impl_->lobbies.get(lobbyId);
    if (!lobby) {
        return ServiceResult<LobbyData>::err(
            ServiceError(ErrorCode::LobbyNotFound, "Lobby was not found"));
    }

    auto added = lobby->addPlayer(peer, context);
    if (!added) {
        return ServiceResult<LobbyData>::err(added.error());
    }

    return ServiceResult<LobbyData>::ok(lobby->generateLobbyData(peer.id));
}

ServiceResult<void> LobbyCoordinator::leaveLobby(const PeerInfo& peer, LobbyId lobbyId) {
    if (!impl_->running.load()) {
        return notStarted<void>();
    }

    auto context = impl_->contexts.getOrCreate(peer.id);
    auto lobby = impl_->lobbies.get(lobbyId);
    if (!lobby) {
        context->unbindLobby(lobbyId);
        return ServiceResult<void>::ok();
    }

    lobby->removePlayer(*context);
    return ServiceResult<void>::ok();
}

ServiceResult<void> LobbyCoordinator::setLobbyProperties(
    const PeerInfo& peer, LobbyId lobbyId, const PropertyList& properties) {
    if (!impl_->running.load()) {
        return notStarted<void>();
    }

    auto lobby = impl_->lobbies.get(lobbyId);
    if (!lobby) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::LobbyNotFound, "Lobby was not found"));
    }

    for (const auto& [key, value] : properties) {
        auto applied = lobby->setProperty(peer.id, key, value);
        if (!applied) {
            auto ctx = requestContext(peer, lobbyId);
            ctx.extra["key"] = key;
            ctx.extra["reason"] = std::string(applied.error().message());
            LCS_LOG_CTX(LogLevel::Debug, LogCategory::Coordinator,
                        "Lobby property rejected", ctx);
            return ServiceResult<void>::err(
                ServiceError(applied.error().code(), "Failed to set the property: " + key, key));
        }
    }
    return ServiceResult<void>::ok();
}

ServiceResult<void> LobbyCoordinator::setMyProperties(
    const PeerInfo& peer, const PropertyList& properties) {
    if (!impl_->running.load()) {
        return notStarted<void>();
    }

    auto resolved = impl_->currentLobby(peer, true);
    if (!resolved) {
        return ServiceResult<void>::err(resolved.error());
    }
    const auto& lobby = resolved.value().lobby;

    for (const auto& [key, value] : properties) {
        auto applied = lobby->setPlayerProperty(peer.id, key, value);
        if (!applied) {
            return ServiceResult<void>::err(
                ServiceError(applied.error().code(), "Failed to set property: " + key, key));
        }
    }
    return ServiceResult<void>::ok();
}

ServiceResult<void> LobbyCoordinator::setReady(const PeerInfo& peer, bool isReady) {
    if (!impl_->running.load()) {
        return notStarted<void>();
    }

    auto resolved = impl_->currentLobby(peer, true);
    if (!resolved) {
        return ServiceResult<void>::err(resolved.error());
    }
    return resolved.value().lobby->setReadyState(peer.id, isReady);
}

ServiceResult<void> LobbyCoordinator::joinTeam(const PeerInfo& peer, const std::string& teamName) {
    if (!impl_->running.load()) {
        return notStarted<void>();
    }

    auto resolved = impl_->currentLobby(peer, true);
    if (!resolved) {
        return ServiceResult<void>::err(resolved.error());
    }

    auto joined = resolved.value().lobby->tryJoinTeam(peer.id, teamName);
    if (!joined) {
        return ServiceResult<void>::err(
            ServiceError(joined.error().code(), "Failed to join a team: " + teamName, teamName));
    }
    return ServiceResult<void>::ok();
}

ServiceResult<void> LobbyCoordinator::sendChatMessage(
    const PeerInfo& peer, const std::string& message) {
    if (!impl_->running.load()) {
        return notStarted<void>();
    }

    auto resolved = impl_->currentLobby(peer, true);
    if (!resolved) {
        return ServiceResult<void>::err(resolved.error());
    }

    if (!resolved.value().lobby->chatMessageHandler(peer.id, message)) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::NotLobbyMember, "Player is not in the lobby"));
    }
    return ServiceResult<void>::ok();
}

ServiceResult<void> LobbyCoordinator::startGame(const PeerInfo& peer) {
    if (!impl_->running.load()) {
        return notStarted<void>();
    }

    // Authority is the lobby's decision; only the current lobby is checked here.
    auto resolved = impl_->currentLobby(peer, false);
    if (!resolved) {
        return ServiceResult<void>::err(resolved.error());
    }
    const auto& lobby = resolved.value().lobby;

    auto started = lobby->startGameManually(peer.id);
    if (!started) {
        return started;
    }

    impl_->gamesStarted.fetch_add(1, std::memory_order_relaxed);
    LCS_LOG_CTX(LogLevel::Info, LogCategory::Coordinator, "Game started",
                requestContext(peer, lobby->id()));
    return ServiceResult<void>::ok();
}

ServiceResult<RoomAccess> LobbyCoordinator::getRoomAccess(const PeerInfo& peer) {
    if (!impl_->running.load()) {
        return notStarted<RoomAccess>();
    }

    auto resolved = impl_->currentLobby(peer, false);
    if (!resolved) {
        return ServiceResult<RoomAccess>::err(resolved.error());
    }
    return resolved.value().lobby->gameAccessRequestHandler(peer);
}

// -- Queries ------------------------------------------------------------------

ServiceResult<LobbyMemberData> LobbyCoordinator::getMemberData(
    const PeerInfo& /*peer*/, LobbyId lobbyId, PeerId target) const {
    if (!impl_->running.load()) {
        return notStarted<LobbyMemberData>();
    }

    auto lobby = impl_->lobbies.get(lobbyId);
    if (!lobby) {
        return ServiceResult<LobbyMemberData>::err(
            ServiceError(ErrorCode::LobbyNotFound, "Lobby not found"));
    }

    auto member = lobby->memberData(target);
    if (!member) {
        return ServiceResult<LobbyMemberData>::err(
            ServiceError(ErrorCode::NotLobbyMember, "Player is not in the lobby"));
    }
    return ServiceResult<LobbyMemberData>::ok(std::move(*member));
}

ServiceResult<LobbyData> LobbyCoordinator::getLobbyInfo(
    const PeerInfo& peer, LobbyId lobbyId) const {
    if (!impl_->running.load()) {
        return notStarted<LobbyData>();
    }

    auto lobby = impl_->lobbies.get(lobbyId);
    if (!lobby || lobby->isDestroyed()) {
        return ServiceResult<LobbyData>::err(
            ServiceError(ErrorCode::LobbyNotFound, "Lobby not found"));
    }
    return ServiceResult<LobbyData>::ok(lobby->generateLobbyData(peer.id));
}

std::vector<GameInfo> LobbyCoordinator::getPublicGames(
    const PeerInfo& peer, const LobbyProperties& filters) const {
    std::vector<GameInfo> games;
    if (!impl_->running.load()) {
        return games;
    }

    // Rendered outside the registry lock; each lobby locks only itself.
    for (const auto& lobby : impl_->lobbies.allLobbies()) {
        if (lobby->isDestroyed()) {
            continue;
        }

        auto publicProperties = lobby->getPublicProperties(peer.id);

        bool matches = true;
        for (const auto& [key, value] : filters) {
            auto it = publicProperties.find(key);
            if (it == publicProperties.end() || it->second != value) {
                matches = false;
                break;
            }
        }
        if (!matches) {
            continue;
        }

        GameInfo info;
        auto address = lobby->gameAddress();
        if (!address.empty()) {
            info.address = address + ":" + std::to_string(lobby->gamePort());
        }
        info.id = lobby->id();
        info.maxPlayers = lobby->maxPlayers();
        info.name = lobby->name();
        info.onlinePlayers = lobby->playerCount();
        info.customOptions = std::move(publicProperties);
        info.type = GameInfoType::Lobby;
        games.push_back(std::move(info));
    }
    return games;
}

std::optional<LobbyId> LobbyCoordinator::currentLobbyOf(PeerId peerId) const {
    auto context = impl_->contexts.find(peerId);
    if (!context) {
        return std::nullopt;
    }
    return context->currentLobby();
}

std::shared_ptr<ILobby> LobbyCoordinator::findLobby(LobbyId lobbyId) const {
    return impl_->lobbies.get(lobbyId);
}

// -- Connections --------------------------------------------------------------

void LobbyCoordinator::onPeerDisconnected(PeerId peerId) {
    auto context = impl_->contexts.remove(peerId);
    if (!context) {
        return;
    }

    for (auto lobbyId : context->joinedLobbies()) {
        if (auto lobby = impl_->lobbies.get(lobbyId)) {
            lobby->removePlayer(*context);
        }
    }

    LCS_LOG_DEBUG(LogCategory::Session,
                  "Peer " + std::to_string(peerId.value()) + " disconnected");
}

// -- Statistics ---------------------------------------------------------------

CoordinatorStats LobbyCoordinator::stats() const {
    CoordinatorStats s;
    s.activeLobbies = impl_->lobbies.size();
    s.trackedConnections = impl_->contexts.size();
    s.lobbiesCreated = impl_->lobbiesCreated.load();
    s.lobbiesDestroyed = impl_->lobbies.removedCount();
    s.gamesStarted = impl_->gamesStarted.load();
    return s;
}

const LobbyCoordinatorConfig& LobbyCoordinator::config() const noexcept {
    return impl_->config;
}

}  // namespace lcs::service
