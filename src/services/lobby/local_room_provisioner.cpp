/// @file local_room_provisioner.cpp
/// @brief LocalRoomProvisioner implementation.

#include "lcs/service/local_room_provisioner.hpp"

#include <charconv>

#include "lcs/foundation/error_code.hpp"
#include "lcs/foundation/service_error.hpp"
#include "lcs/foundation/service_logger.hpp"
#include "room_token.hpp"

namespace lcs::service {

using lcs::foundation::ErrorCode;
using lcs::foundation::LogCategory;
using lcs::foundation::ServiceError;
using lcs::foundation::ServiceResult;

namespace {

constexpr std::size_t kGeneratedSecretBytes = 32;

int64_t unixNow() {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

std::future<ServiceResult<RoomEndpoint>> readyFuture(ServiceResult<RoomEndpoint> result) {
    std::promise<ServiceResult<RoomEndpoint>> promise;
    auto future = promise.get_future();
    promise.set_value(std::move(result));
    return future;
}

} // anonymous namespace

LocalRoomProvisioner::LocalRoomProvisioner(LocalRoomConfig config)
    : config_(std::move(config)) {
    if (config_.tokenSecret.empty()) {
        config_.tokenSecret = detail::secureRandomHex(kGeneratedSecretBytes);
        LCS_LOG_INFO(LogCategory::Provisioning,
                     "No room token secret configured; generated an ephemeral one");
    }
}

std::future<ServiceResult<RoomEndpoint>> LocalRoomProvisioner::provisionRoom(
    RoomRequest request, std::stop_token cancel) {
    if (cancel.stop_requested()) {
        return readyFuture(ServiceResult<RoomEndpoint>::err(
            ServiceError(ErrorCode::ProvisioningFailed, "Room request was cancelled")));
    }

    std::lock_guard lock(mutex_);

    if (config_.portCount == 0 || rooms_.size() >= config_.portCount) {
        LCS_LOG_ERROR(LogCategory::Provisioning, "Room port pool exhausted");
        return readyFuture(ServiceResult<RoomEndpoint>::err(
            ServiceError(ErrorCode::ProvisionerUnavailable, "No free room ports")));
    }

    // Round-robin from the last allocation so a released port is not reused at once.
    uint16_t port = 0;
    for (uint16_t i = 0; i < config_.portCount; ++i) {
        auto offset = static_cast<uint16_t>((nextOffset_ + i) % config_.portCount);
        auto candidate = static_cast<uint16_t>(config_.firstPort + offset);
        if (!portOwners_.contains(candidate)) {
            port = candidate;
            nextOffset_ = static_cast<uint16_t>((offset + 1) % config_.portCount);
            break;
        }
    }

    RoomEndpoint endpoint;
    endpoint.roomId = "room-" + std::to_string(request.lobbyId) + "-" + std::to_string(port);
    endpoint.address = config_.publicAddress;
    endpoint.port = port;

    Room room;
    room.lobbyId = request.lobbyId;
    room.port = port;
    for (const auto& [key, value] : request.properties) {
        if (!isPrivatePropertyKey(key)) {
            room.properties.emplace(key, value);
        }
    }
    rooms_.insert_or_assign(endpoint.roomId, std::move(room));
    portOwners_.insert_or_assign(port, endpoint.roomId);

    LCS_LOG_INFO(LogCategory::Provisioning,
                 "Room " + endpoint.roomId + " allocated on port " + std::to_string(port));
    return readyFuture(ServiceResult<RoomEndpoint>::ok(std::move(endpoint)));
}

ServiceResult<RoomAccess> LocalRoomProvisioner::requestAccess(const std::string& roomId,
                                                              const PeerInfo& peer) {
    std::lock_guard lock(mutex_);

    auto it = rooms_.find(roomId);
    if (it == rooms_.end()) {
        return ServiceResult<RoomAccess>::err(
            ServiceError(ErrorCode::ProvisioningFailed, "Room is no longer available"));
    }

    auto token = detail::signRoomToken(config_.tokenSecret, roomId, peer.id.value(),
                                       unixNow() + config_.tokenTtl.count());
    if (token.empty()) {
        return ServiceResult<RoomAccess>::err(
            ServiceError(ErrorCode::ProvisioningFailed, "Failed to sign room access token"));
    }

    RoomAccess access;
    access.roomId = roomId;
    access.address = config_.publicAddress;
    access.port = it->second.port;
    access.token = std::move(token);
    access.customOptions = it->second.properties;
    return ServiceResult<RoomAccess>::ok(std::move(access));
}

void LocalRoomProvisioner::releaseRoom(const std::string& roomId) {
    std::lock_guard lock(mutex_);

    auto it = rooms_.find(roomId);
    if (it == rooms_.end()) {
        return;
    }
    portOwners_.erase(it->second.port);
    rooms_.erase(it);

    LCS_LOG_DEBUG(LogCategory::Provisioning, "Room " + roomId + " released");
}

bool LocalRoomProvisioner::verifyAccessToken(const std::string& token,
                                             const std::string& roomId,
                                             PeerId peerId) const {
    auto sep = token.rfind('.');
    if (sep == std::string::npos) {
        return false;
    }
    std::string_view body(token.data(), sep);
    std::string_view signature(token.data() + sep + 1, token.size() - sep - 1);

    if (!detail::constantTimeEqual(detail::hmacSha256Hex(config_.tokenSecret, body),
                                   signature)) {
        return false;
    }

    const std::string prefix = roomId + "." + std::to_string(peerId.value()) + ".";
    if (!body.starts_with(prefix)) {
        return false;
    }

    auto expiry = body.substr(prefix.size());
    int64_t expiresAt = 0;
    auto [ptr, ec] = std::from_chars(expiry.data(), expiry.data() + expiry.size(), expiresAt);
    if (ec != std::errc{} || ptr != expiry.data() + expiry.size()) {
        return false;
    }
    return expiresAt > unixNow();
}

std::size_t LocalRoomProvisioner::activeRooms() const {
    std::lock_guard lock(mutex_);
    return rooms_.size();
}

}  // namespace lcs::service
