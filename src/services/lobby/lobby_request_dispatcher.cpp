/// @file lobby_request_dispatcher.cpp
/// @brief LobbyRequestDispatcher implementation.

#include "lcs/service/lobby_request_dispatcher.hpp"

#include <string>
#include <utility>

#include "lcs/foundation/byte_buffer.hpp"
#include "lcs/foundation/service_logger.hpp"
#include "lcs/service/lobby_codec.hpp"

namespace lcs::service {

using lcs::foundation::ByteReader;
using lcs::foundation::ByteWriter;
using lcs::foundation::LogCategory;
using lcs::foundation::ServiceError;

namespace {

LobbyResponse makeSuccess(std::vector<uint8_t> payload = {}) {
    LobbyResponse response;
    response.status = ResponseStatus::Success;
    response.payload = std::move(payload);
    return response;
}

LobbyResponse makeFailure(ResponseStatus status, std::string reason) {
    LobbyResponse response;
    response.status = status;
    response.reason = std::move(reason);
    return response;
}

LobbyResponse fromError(const ServiceError& error) {
    return makeFailure(responseStatusFor(error.kind()), std::string(error.message()));
}

LobbyResponse invalidRequest() {
    return makeFailure(ResponseStatus::Failed, "Invalid request");
}

bool readLobbyId(ByteReader& r, LobbyId& lobbyId) {
    int32_t raw = 0;
    if (!r.read(raw) || raw < 0) {
        return false;
    }
    lobbyId = static_cast<LobbyId>(raw);
    return true;
}

} // anonymous namespace

LobbyRequestDispatcher::LobbyRequestDispatcher(LobbyCoordinator& coordinator)
    : coordinator_(coordinator) {}

std::optional<LobbyResponse> LobbyRequestDispatcher::dispatch(
    const PeerInfo& peer, uint16_t opcode, std::span<const uint8_t> payload) {
    ByteReader r{payload, 0};

    switch (opcode) {
        case LobbyOpcode::CreateLobby: {
            PropertyList list;
            if (!readPropertyList(r, list) || !r.atEnd()) {
                return invalidRequest();
            }

            LobbyProperties options;
            for (auto& [key, value] : list) {
                options.insert_or_assign(std::move(key), std::move(value));
            }

            std::string factoryId;
            if (auto it = options.find(std::string(kLobbyFactoryIdKey)); it != options.end()) {
                factoryId = it->second;
            }

            auto created = coordinator_.createLobby(peer, factoryId, options);
            if (!created) {
                return fromError(created.error());
            }
            ByteWriter w;
            w.write(static_cast<int32_t>(created.value()));
            return makeSuccess(std::move(w).bytes());
        }

        case LobbyOpcode::JoinLobby: {
            LobbyId lobbyId = 0;
            if (!readLobbyId(r, lobbyId) || !r.atEnd()) {
                return invalidRequest();
            }
            auto joined = coordinator_.joinLobby(peer, lobbyId);
            if (!joined) {
                return fromError(joined.error());
            }
            return makeSuccess(encodeLobbyData(joined.value()));
        }

        case LobbyOpcode::LeaveLobby: {
            LobbyId lobbyId = 0;
            if (!readLobbyId(r, lobbyId) || !r.atEnd()) {
                return invalidRequest();
            }
            auto left = coordinator_.leaveLobby(peer, lobbyId);
            if (!left) {
                return fromError(left.error());
            }
            return makeSuccess();
        }

        case LobbyOpcode::SetLobbyProperties: {
            LobbyId lobbyId = 0;
            PropertyList properties;
            if (!readLobbyId(r, lobbyId) || !readPropertyList(r, properties) || !r.atEnd()) {
                return invalidRequest();
            }
            auto applied = coordinator_.setLobbyProperties(peer, lobbyId, properties);
            if (!applied) {
                return fromError(applied.error());
            }
            return makeSuccess();
        }

        case LobbyOpcode::SetMyLobbyProperties: {
            PropertyList properties;
            if (!readPropertyList(r, properties) || !r.atEnd()) {
                return invalidRequest();
            }
            auto applied = coordinator_.setMyProperties(peer, properties);
            if (!applied) {
                return fromError(applied.error());
            }
            return makeSuccess();
        }

        case LobbyOpcode::JoinLobbyTeam: {
            std::string teamName;
            if (!r.readString(teamName) || !r.atEnd()) {
                return invalidRequest();
            }
            auto joined = coordinator_.joinTeam(peer, teamName);
            if (!joined) {
                return fromError(joined.error());
            }
            return makeSuccess();
        }

        case LobbyOpcode::LobbySendChatMessage: {
            std::string message;
            if (!r.readString(message) || !r.atEnd()) {
                return std::nullopt;
            }
            auto sent = coordinator_.sendChatMessage(peer, message);
            if (!sent) {
                LCS_LOG_DEBUG(LogCategory::Protocol,
                              "Chat message dropped: " + std::string(sent.error().message()));
            }
            return std::nullopt;
        }

        case LobbyOpcode::LobbySetReady: {
            int32_t ready = 0;
            if (!r.read(ready) || !r.atEnd()) {
                return invalidRequest();
            }
            auto applied = coordinator_.setReady(peer, ready > 0);
            if (!applied) {
                return fromError(applied.error());
            }
            return makeSuccess();
        }

        case LobbyOpcode::LobbyStartGame: {
            auto started = coordinator_.startGame(peer);
            if (!started) {
                return fromError(started.error());
            }
            return makeSuccess();
        }

        case LobbyOpcode::GetLobbyRoomAccess: {
            auto access = coordinator_.getRoomAccess(peer);
            if (!access) {
                return fromError(access.error());
            }
            return makeSuccess(encodeRoomAccess(access.value()));
        }

        case LobbyOpcode::GetLobbyMemberData: {
            LobbyId lobbyId = 0;
            uint64_t target = 0;
            if (!readLobbyId(r, lobbyId) || !r.read(target) || !r.atEnd()) {
                return invalidRequest();
            }
            auto member = coordinator_.getMemberData(peer, lobbyId, PeerId(target));
            if (!member) {
                return fromError(member.error());
            }
            return makeSuccess(encodeMemberData(member.value()));
        }

        case LobbyOpcode::GetLobbyInfo: {
            LobbyId lobbyId = 0;
            if (!readLobbyId(r, lobbyId) || !r.atEnd()) {
                return invalidRequest();
            }
            auto info = coordinator_.getLobbyInfo(peer, lobbyId);
            if (!info) {
                return fromError(info.error());
            }
            return makeSuccess(encodeLobbyData(info.value()));
        }

        case LobbyOpcode::GetPublicGames: {
            LobbyProperties filters;
            if (!payload.empty() && (!readProperties(r, filters) || !r.atEnd())) {
                return invalidRequest();
            }
            return makeSuccess(encodeGameInfoList(coordinator_.getPublicGames(peer, filters)));
        }

        default: {
            LCS_LOG_DEBUG(LogCategory::Protocol,
                          "Unknown lobby opcode " + std::to_string(opcode));
            return makeFailure(ResponseStatus::Failed, "Invalid request");
        }
    }
}

}  // namespace lcs::service
