#pragma once

/// @file room_provisioner.hpp
/// @brief Interface to the room/spawner subsystem that hosts started games.

#include <future>
#include <stop_token>
#include <string>

#include "lcs/foundation/service_result.hpp"
#include "lcs/service/lobby_types.hpp"

namespace lcs::service {

/// Room/spawner collaborator consumed when a lobby starts its game.
///
/// provisionRoom() must not block: it returns a future that the lobby waits
/// on for a bounded time. When the lobby gives up it requests a stop through
/// @p cancel; implementations should then release anything they allocated.
class IRoomProvisioner {
public:
    virtual ~IRoomProvisioner() = default;

    [[nodiscard]] virtual std::future<lcs::foundation::ServiceResult<RoomEndpoint>>
    provisionRoom(RoomRequest request, std::stop_token cancel) = 0;

    /// Produce credentials for @p peer to enter an already provisioned room.
    [[nodiscard]] virtual lcs::foundation::ServiceResult<RoomAccess>
    requestAccess(const std::string& roomId, const PeerInfo& peer) = 0;

    /// The lobby that owned @p roomId was destroyed. Unknown ids are ignored.
    virtual void releaseRoom(const std::string& roomId) = 0;
};

}  // namespace lcs::service
