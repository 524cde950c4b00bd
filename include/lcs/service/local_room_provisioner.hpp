#pragma once

/// @file local_room_provisioner.hpp
/// @brief In-process room provisioner that hands out ports from a fixed pool
///        and issues signed room access tokens.

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

#include "lcs/service/room_provisioner.hpp"

namespace lcs::service {

/// Configuration for LocalRoomProvisioner.
struct LocalRoomConfig {
    /// Address players connect to.
    std::string publicAddress = "127.0.0.1";

    /// First port of the pool.
    uint16_t firstPort = 7777;

    /// Number of ports (and therefore concurrent rooms) in the pool.
    uint16_t portCount = 100;

    /// HMAC key for access tokens. Generated at startup when empty.
    std::string tokenSecret;

    std::chrono::seconds tokenTtl{300};
};

/// Room provisioner for single-host deployments.
///
/// Each started lobby gets the next free port from the pool; the port
/// returns to the pool when the lobby is destroyed. Access tokens are
/// HMAC-SHA256 signed so a game server sharing the secret can verify them
/// with verifyAccessToken().
class LocalRoomProvisioner : public IRoomProvisioner {
public:
    explicit LocalRoomProvisioner(LocalRoomConfig config);

    [[nodiscard]] std::future<lcs::foundation::ServiceResult<RoomEndpoint>>
    provisionRoom(RoomRequest request, std::stop_token cancel) override;

    [[nodiscard]] lcs::foundation::ServiceResult<RoomAccess>
    requestAccess(const std::string& roomId, const PeerInfo& peer) override;

    void releaseRoom(const std::string& roomId) override;

    /// Check signature, room, peer and expiry of a token from requestAccess().
    [[nodiscard]] bool verifyAccessToken(const std::string& token, const std::string& roomId,
                                         PeerId peerId) const;

    [[nodiscard]] std::size_t activeRooms() const;

private:
    struct Room {
        LobbyId lobbyId = 0;
        uint16_t port = 0;
        LobbyProperties properties;
    };

    LocalRoomConfig config_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Room> rooms_;
    std::unordered_map<uint16_t, std::string> portOwners_;
    uint16_t nextOffset_ = 0;
};

}  // namespace lcs::service
