#pragma once

/// @file lobby_request_dispatcher.hpp
/// @brief Turns an opcode plus binary payload into a coordinator call and
///        exactly one response.

#include <cstdint>
#include <optional>
#include <span>

#include "lcs/service/lobby_coordinator.hpp"
#include "lcs/service/lobby_protocol.hpp"

namespace lcs::service {

/// Transport-facing entry point of the lobby service.
///
/// Every decoded request produces one LobbyResponse. The only unanswered
/// path is LobbySendChatMessage, which never replies. Malformed payloads are
/// answered with Failed / "Invalid request"; coordinator errors are mapped
/// through responseStatusFor(). No error escapes dispatch().
///
/// Usage:
/// @code
///   LobbyRequestDispatcher dispatcher(coordinator);
///   if (auto response = dispatcher.dispatch(peer, opcode, payload)) {
///       transport.reply(peer.id, *response);
///   }
/// @endcode
class LobbyRequestDispatcher {
public:
    explicit LobbyRequestDispatcher(LobbyCoordinator& coordinator);

    /// Handle one request from @p peer.
    /// @return The response to send, or nullopt when none must be sent.
    [[nodiscard]] std::optional<LobbyResponse> dispatch(const PeerInfo& peer, uint16_t opcode,
                                                        std::span<const uint8_t> payload);

private:
    LobbyCoordinator& coordinator_;
};

}  // namespace lcs::service
