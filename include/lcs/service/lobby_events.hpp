#pragma once

/// @file lobby_events.hpp
/// @brief Outbound lobby notifications and the sink that delivers them.
///
/// Lobbies report every observable change to their members through an
/// ILobbyEventSink. The transport layer implements the sink; the lobby
/// service never touches sockets.

#include <cstdint>
#include <string>
#include <string_view>

#include "lcs/service/lobby_types.hpp"

namespace lcs::service {

enum class LobbyEventType : uint8_t {
    MemberJoined,
    MemberLeft,
    LobbyPropertyChanged,
    MemberPropertyChanged,
    MemberReadyChanged,
    MemberTeamChanged,
    OwnerChanged,
    ChatMessage,
    StateChanged,
    GameStarted,
    LobbyDestroyed
};

constexpr std::string_view lobbyEventTypeName(LobbyEventType type) {
    switch (type) {
        case LobbyEventType::MemberJoined:          return "MemberJoined";
        case LobbyEventType::MemberLeft:            return "MemberLeft";
        case LobbyEventType::LobbyPropertyChanged:  return "LobbyPropertyChanged";
        case LobbyEventType::MemberPropertyChanged: return "MemberPropertyChanged";
        case LobbyEventType::MemberReadyChanged:    return "MemberReadyChanged";
        case LobbyEventType::MemberTeamChanged:     return "MemberTeamChanged";
        case LobbyEventType::OwnerChanged:          return "OwnerChanged";
        case LobbyEventType::ChatMessage:           return "ChatMessage";
        case LobbyEventType::StateChanged:          return "StateChanged";
        case LobbyEventType::GameStarted:           return "GameStarted";
        case LobbyEventType::LobbyDestroyed:        return "LobbyDestroyed";
    }
    return "Unknown";
}

/// A single notification. Fields not relevant to the event type stay empty.
///
/// | Type                  | subject     | key        | value        |
/// |-----------------------|-------------|------------|--------------|
/// | MemberJoined          | member      | team       | username     |
/// | MemberLeft            | member      |            | username     |
/// | LobbyPropertyChanged  | setter      | property   | new value    |
/// | MemberPropertyChanged | member      | property   | new value    |
/// | MemberReadyChanged    | member      |            | "1" / "0"    |
/// | MemberTeamChanged     | member      | team       |              |
/// | OwnerChanged          | new owner   |            |              |
/// | ChatMessage           | sender      | username   | message text |
/// | StateChanged          |             | state name |              |
/// | GameStarted           |             | address    | port         |
/// | LobbyDestroyed        |             |            |              |
struct LobbyEvent {
    LobbyEventType type = LobbyEventType::StateChanged;
    LobbyId lobbyId = 0;
    PeerId subject;
    std::string key;
    std::string value;
};

/// Delivery boundary for lobby notifications.
class ILobbyEventSink {
public:
    virtual ~ILobbyEventSink() = default;

    /// Deliver @p event to @p recipient. Must not call back into the lobby.
    virtual void deliver(PeerId recipient, const LobbyEvent& event) = 0;
};

}  // namespace lcs::service
