#pragma once

/// @file lobby_protocol.hpp
/// @brief Lobby message opcodes, response status codes and the response
///        envelope returned by the request dispatcher.

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "lcs/foundation/error_code.hpp"

namespace lcs::service {

// -- Opcodes ------------------------------------------------------------------

/// Lobby opcodes (range 0x0200 - 0x02FF).
namespace LobbyOpcode {
    /// PropertyList of creation options, factory id under "lobbyFactoryId".
    constexpr uint16_t CreateLobby = 0x0201;

    /// i32 lobby id.
    constexpr uint16_t JoinLobby = 0x0202;

    /// i32 lobby id.
    constexpr uint16_t LeaveLobby = 0x0203;

    /// i32 lobby id + PropertyList.
    constexpr uint16_t SetLobbyProperties = 0x0204;

    /// PropertyList applied to the caller's member record.
    constexpr uint16_t SetMyLobbyProperties = 0x0205;

    /// string team name.
    constexpr uint16_t JoinLobbyTeam = 0x0206;

    /// string message. Never answered.
    constexpr uint16_t LobbySendChatMessage = 0x0207;

    /// i32, > 0 means ready.
    constexpr uint16_t LobbySetReady = 0x0208;

    /// Empty payload.
    constexpr uint16_t LobbyStartGame = 0x0209;

    /// Empty payload.
    constexpr uint16_t GetLobbyRoomAccess = 0x020A;

    /// i32 lobby id + u64 peer id.
    constexpr uint16_t GetLobbyMemberData = 0x020B;

    /// i32 lobby id.
    constexpr uint16_t GetLobbyInfo = 0x020C;

    /// LobbyProperties filters (may be empty).
    constexpr uint16_t GetPublicGames = 0x020D;

    constexpr uint16_t RangeBegin = 0x0200;
    constexpr uint16_t RangeEnd = 0x02FF;
} // namespace LobbyOpcode

[[nodiscard]] constexpr bool isLobbyOpcode(uint16_t opcode) {
    return opcode >= LobbyOpcode::RangeBegin && opcode <= LobbyOpcode::RangeEnd;
}

// -- Responses ----------------------------------------------------------------

/// Status code carried by every response.
enum class ResponseStatus : uint8_t {
    Success = 0,
    Failed = 1,
    Unauthorized = 2,
    Error = 3
};

constexpr std::string_view responseStatusName(ResponseStatus status) {
    switch (status) {
        case ResponseStatus::Success:      return "Success";
        case ResponseStatus::Failed:       return "Failed";
        case ResponseStatus::Unauthorized: return "Unauthorized";
        case ResponseStatus::Error:        return "Error";
    }
    return "Unknown";
}

/// Map an error class to the status reported to the caller.
constexpr ResponseStatus responseStatusFor(lcs::foundation::ErrorKind kind) {
    switch (kind) {
        case lcs::foundation::ErrorKind::None:
            return ResponseStatus::Success;
        case lcs::foundation::ErrorKind::Unauthorized:
            return ResponseStatus::Unauthorized;
        case lcs::foundation::ErrorKind::InvalidRequest:
        case lcs::foundation::ErrorKind::Conflict:
        case lcs::foundation::ErrorKind::NotFound:
            return ResponseStatus::Failed;
        case lcs::foundation::ErrorKind::Internal:
            return ResponseStatus::Error;
    }
    return ResponseStatus::Error;
}

/// Exactly one of these is produced per answered request.
struct LobbyResponse {
    ResponseStatus status = ResponseStatus::Success;

    /// Human-readable reason; empty on success.
    std::string reason;

    /// Encoded success payload; may be empty.
    std::vector<uint8_t> payload;

    [[nodiscard]] bool isSuccess() const noexcept {
        return status == ResponseStatus::Success;
    }
};

}  // namespace lcs::service
