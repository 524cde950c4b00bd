#pragma once

/// @file lobby_types.hpp
/// @brief Core types for the lobby coordination service: ids, property maps,
///        lobby states, snapshots, discovery summaries and configuration.

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "lcs/foundation/types.hpp"

namespace lcs::service {

using lcs::foundation::PeerId;
using lcs::foundation::PeerInfo;

/// Unique lobby identifier. Generated by the LobbyRegistry, starting at 0.
using LobbyId = uint32_t;

/// Lobby-level or member-level properties, ordered by key.
using LobbyProperties = std::map<std::string, std::string>;

/// Ordered key/value batch as received on the wire.
///
/// Batch writes are applied in this order and stop at the first rejected key.
using PropertyList = std::vector<std::pair<std::string, std::string>>;

/// Keys starting with this prefix are private: hidden from discovery, and
/// for member properties visible only to the owning member.
inline constexpr std::string_view kPrivatePropertyPrefix = "#";

/// Creation option carrying the factory id in a CreateLobby request.
inline constexpr std::string_view kLobbyFactoryIdKey = "lobbyFactoryId";

/// Well-known creation options understood by BaseLobby factories.
inline constexpr std::string_view kLobbyNameKey = "lobbyName";
inline constexpr std::string_view kMaxPlayersKey = "maxPlayers";

[[nodiscard]] inline bool isPrivatePropertyKey(std::string_view key) {
    return key.starts_with(kPrivatePropertyPrefix);
}

// -- Lobby state --------------------------------------------------------------

/// Lifecycle of a lobby.
enum class LobbyState : uint8_t {
    Forming,     ///< Accepting joins, pre-start.
    Starting,    ///< Start requested; room provisioning in progress.
    InProgress,  ///< Game address/port known; players move to the room.
    Destroyed    ///< Terminal; removed from the registry.
};

constexpr std::string_view lobbyStateName(LobbyState state) {
    switch (state) {
        case LobbyState::Forming:    return "Forming";
        case LobbyState::Starting:   return "Starting";
        case LobbyState::InProgress: return "InProgress";
        case LobbyState::Destroyed:  return "Destroyed";
    }
    return "Unknown";
}

// -- Snapshots ----------------------------------------------------------------

/// Data packet describing one member of a lobby.
struct LobbyMemberData {
    PeerId peerId;
    std::string username;
    LobbyProperties properties;
    bool isReady = false;
    std::string team;
};

/// Team description inside a lobby snapshot.
struct LobbyTeamData {
    std::string name;
    uint32_t minPlayers = 0;
    uint32_t maxPlayers = 0;
    LobbyProperties properties;
    std::vector<PeerId> members;
};

/// Point-in-time snapshot of a lobby, safe to hand to any caller.
struct LobbyData {
    LobbyId lobbyId = 0;
    std::string name;
    std::string type;
    LobbyState state = LobbyState::Forming;
    uint32_t maxPlayers = 0;
    uint32_t playerCount = 0;
    PeerId ownerId;
    std::string gameAddress;
    uint16_t gamePort = 0;
    LobbyProperties properties;
    std::vector<LobbyMemberData> members;
    std::vector<LobbyTeamData> teams;

    bool enableReadySystem = true;
    bool enableManualStart = true;
    bool enableTeamSwitching = true;

    /// Set when the snapshot was personalized for a member.
    std::optional<PeerId> requesterId;
};

// -- Discovery ----------------------------------------------------------------

enum class GameInfoType : uint8_t {
    Unknown = 0,
    Room = 1,
    Lobby = 2,
};

/// Public summary of a lobby as listed by the discovery feed.
struct GameInfo {
    /// "address:port" of the game session, empty until the game started.
    std::string address;
    LobbyId id = 0;
    bool isPasswordProtected = false;
    uint32_t maxPlayers = 0;
    std::string name;
    uint32_t onlinePlayers = 0;
    LobbyProperties customOptions;
    GameInfoType type = GameInfoType::Lobby;
};

// -- Room hand-off ------------------------------------------------------------

/// Connection details for a provisioned game room.
struct RoomEndpoint {
    std::string roomId;
    std::string address;
    uint16_t port = 0;
};

/// Credentials a member uses to enter the room once the game is in progress.
struct RoomAccess {
    std::string roomId;
    std::string address;
    uint16_t port = 0;
    std::string token;
    LobbyProperties customOptions;
};

/// Request sent to the room provisioner when a lobby starts its game.
struct RoomRequest {
    LobbyId lobbyId = 0;
    std::string lobbyType;
    std::string name;
    uint32_t maxPlayers = 0;
    LobbyProperties properties;
    std::vector<PeerId> players;
};

// -- Configuration ------------------------------------------------------------

/// Configuration for the lobby coordinator.
struct LobbyCoordinatorConfig {
    /// Minimum permission level required to create a lobby.
    int32_t createLobbiesPermissionLevel = 0;

    /// Refuse CreateLobby while the caller is a member of any lobby.
    bool dontAllowCreatingIfJoined = true;

    /// How many lobbies a connection may be a member of at once.
    uint32_t joinedLobbiesLimit = 1;
};

/// Runtime statistics for the coordinator.
struct CoordinatorStats {
    std::size_t activeLobbies = 0;
    std::size_t trackedConnections = 0;
    uint64_t lobbiesCreated = 0;
    uint64_t lobbiesDestroyed = 0;
    uint64_t gamesStarted = 0;
};

}  // namespace lcs::service
