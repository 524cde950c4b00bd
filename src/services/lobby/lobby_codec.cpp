/// @file lobby_codec.cpp
/// @brief Lobby payload encoders and decoders.

#include "lcs/service/lobby_codec.hpp"

#include <utility>

#include "lcs/foundation/error_code.hpp"
#include "lcs/foundation/service_error.hpp"

namespace lcs::service {

using lcs::foundation::ByteReader;
using lcs::foundation::ByteWriter;
using lcs::foundation::ErrorCode;
using lcs::foundation::ServiceError;
using lcs::foundation::ServiceResult;

namespace {

// Smallest encodings, used to reject counts larger than the buffer allows.
constexpr std::size_t kMinPairSize = 8;     // two empty strings
constexpr std::size_t kMinMemberSize = 21;  // u64 + str + props + bool + str
constexpr std::size_t kMinTeamSize = 20;    // str + u32 + u32 + props + ids
constexpr std::size_t kMinGameInfoSize = 26;

bool readCount(ByteReader& r, uint32_t& count, std::size_t minElementSize) {
    auto start = r.pos;
    if (!r.read(count)) {
        return false;
    }
    const std::size_t remaining = r.data.size() - r.pos;
    if (static_cast<std::size_t>(count) > remaining / minElementSize) {
        r.pos = start;
        return false;
    }
    return true;
}

bool readPeerId(ByteReader& r, PeerId& id) {
    uint64_t raw = 0;
    if (!r.read(raw)) {
        return false;
    }
    id = PeerId(raw);
    return true;
}

bool readLobbyId(ByteReader& r, LobbyId& id) {
    int32_t raw = 0;
    if (!r.read(raw) || raw < 0) {
        return false;
    }
    id = static_cast<LobbyId>(raw);
    return true;
}

void writeTeam(ByteWriter& w, const LobbyTeamData& team) {
    w.writeString(team.name);
    w.write(team.minPlayers);
    w.write(team.maxPlayers);
    writeProperties(w, team.properties);
    w.write(static_cast<uint32_t>(team.members.size()));
    for (const auto& member : team.members) {
        w.write(member.value());
    }
}

bool readTeam(ByteReader& r, LobbyTeamData& team) {
    uint32_t count = 0;
    if (!r.readString(team.name) || !r.read(team.minPlayers) || !r.read(team.maxPlayers) ||
        !readProperties(r, team.properties) || !readCount(r, count, sizeof(uint64_t))) {
        return false;
    }
    team.members.clear();
    team.members.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        PeerId id;
        if (!readPeerId(r, id)) {
            return false;
        }
        team.members.push_back(id);
    }
    return true;
}

template <typename T>
ServiceResult<T> decodeWhole(std::span<const uint8_t> data, bool (*readFn)(ByteReader&, T&)) {
    ByteReader r{data, 0};
    T value{};
    if (!readFn(r, value) || !r.atEnd()) {
        return ServiceResult<T>::err(
            ServiceError(ErrorCode::InvalidMessage, "Invalid request"));
    }
    return ServiceResult<T>::ok(std::move(value));
}

bool readGameInfoList(ByteReader& r, std::vector<GameInfo>& games) {
    uint32_t count = 0;
    if (!readCount(r, count, kMinGameInfoSize)) {
        return false;
    }
    games.clear();
    games.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        GameInfo info;
        if (!readGameInfo(r, info)) {
            return false;
        }
        games.push_back(std::move(info));
    }
    return true;
}

} // anonymous namespace

// -- Properties ---------------------------------------------------------------

void writePropertyList(ByteWriter& w, const PropertyList& props) {
    w.write(static_cast<uint32_t>(props.size()));
    for (const auto& [key, value] : props) {
        w.writeString(key);
        w.writeString(value);
    }
}

void writeProperties(ByteWriter& w, const LobbyProperties& props) {
    w.write(static_cast<uint32_t>(props.size()));
    for (const auto& [key, value] : props) {
        w.writeString(key);
        w.writeString(value);
    }
}

bool readPropertyList(ByteReader& r, PropertyList& props) {
    uint32_t count = 0;
    if (!readCount(r, count, kMinPairSize)) {
        return false;
    }
    props.clear();
    props.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        std::string key;
        std::string value;
        if (!r.readString(key) || !r.readString(value)) {
            return false;
        }
        props.emplace_back(std::move(key), std::move(value));
    }
    return true;
}

bool readProperties(ByteReader& r, LobbyProperties& props) {
    PropertyList list;
    if (!readPropertyList(r, list)) {
        return false;
    }
    props.clear();
    for (auto& [key, value] : list) {
        props.insert_or_assign(std::move(key), std::move(value));
    }
    return true;
}

// -- Members and lobbies ------------------------------------------------------

void writeMemberData(ByteWriter& w, const LobbyMemberData& member) {
    w.write(member.peerId.value());
    w.writeString(member.username);
    writeProperties(w, member.properties);
    w.write(member.isReady);
    w.writeString(member.team);
}

bool readMemberData(ByteReader& r, LobbyMemberData& member) {
    return readPeerId(r, member.peerId) && r.readString(member.username) &&
           readProperties(r, member.properties) && r.read(member.isReady) &&
           r.readString(member.team);
}

void writeLobbyData(ByteWriter& w, const LobbyData& lobby) {
    w.write(static_cast<int32_t>(lobby.lobbyId));
    w.writeString(lobby.name);
    w.writeString(lobby.type);
    w.write(static_cast<uint8_t>(lobby.state));
    w.write(lobby.maxPlayers);
    w.write(lobby.playerCount);
    w.write(lobby.ownerId.value());
    w.writeString(lobby.gameAddress);
    w.write(lobby.gamePort);
    writeProperties(w, lobby.properties);

    w.write(static_cast<uint32_t>(lobby.members.size()));
    for (const auto& member : lobby.members) {
        writeMemberData(w, member);
    }
    w.write(static_cast<uint32_t>(lobby.teams.size()));
    for (const auto& team : lobby.teams) {
        writeTeam(w, team);
    }

    w.write(lobby.enableReadySystem);
    w.write(lobby.enableManualStart);
    w.write(lobby.enableTeamSwitching);
    w.write(lobby.requesterId.has_value());
    if (lobby.requesterId) {
        w.write(lobby.requesterId->value());
    }
}

bool readLobbyData(ByteReader& r, LobbyData& lobby) {
    uint8_t state = 0;
    if (!readLobbyId(r, lobby.lobbyId) || !r.readString(lobby.name) ||
        !r.readString(lobby.type) || !r.read(state) ||
        state > static_cast<uint8_t>(LobbyState::Destroyed) || !r.read(lobby.maxPlayers) ||
        !r.read(lobby.playerCount) || !readPeerId(r, lobby.ownerId) ||
        !r.readString(lobby.gameAddress) || !r.read(lobby.gamePort) ||
        !readProperties(r, lobby.properties)) {
        return false;
    }
    lobby.state = static_cast<LobbyState>(state);

    uint32_t count = 0;
    if (!readCount(r, count, kMinMemberSize)) {
        return false;
    }
    lobby.members.clear();
    lobby.members.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        LobbyMemberData member;
        if (!readMemberData(r, member)) {
            return false;
        }
        lobby.members.push_back(std::move(member));
    }

    if (!readCount(r, count, kMinTeamSize)) {
        return false;
    }
    lobby.teams.clear();
    lobby.teams.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        LobbyTeamData team;
        if (!readTeam(r, team)) {
            return false;
        }
        lobby.teams.push_back(std::move(team));
    }

    bool hasRequester = false;
    if (!r.read(lobby.enableReadySystem) || !r.read(lobby.enableManualStart) ||
        !r.read(lobby.enableTeamSwitching) || !r.read(hasRequester)) {
        return false;
    }
    lobby.requesterId.reset();
    if (hasRequester) {
        PeerId requester;
        if (!readPeerId(r, requester)) {
            return false;
        }
        lobby.requesterId = requester;
    }
    return true;
}

// -- Room access and discovery ------------------------------------------------

void writeRoomAccess(ByteWriter& w, const RoomAccess& access) {
    w.writeString(access.roomId);
    w.writeString(access.address);
    w.write(access.port);
    w.writeString(access.token);
    writeProperties(w, access.customOptions);
}

bool readRoomAccess(ByteReader& r, RoomAccess& access) {
    return r.readString(access.roomId) && r.readString(access.address) &&
           r.read(access.port) && r.readString(access.token) &&
           readProperties(r, access.customOptions);
}

void writeGameInfo(ByteWriter& w, const GameInfo& info) {
    w.writeString(info.address);
    w.write(static_cast<int32_t>(info.id));
    w.write(info.isPasswordProtected);
    w.write(info.maxPlayers);
    w.writeString(info.name);
    w.write(info.onlinePlayers);
    writeProperties(w, info.customOptions);
    w.write(static_cast<uint8_t>(info.type));
}

bool readGameInfo(ByteReader& r, GameInfo& info) {
    uint8_t type = 0;
    if (!r.readString(info.address) || !readLobbyId(r, info.id) ||
        !r.read(info.isPasswordProtected) || !r.read(info.maxPlayers) ||
        !r.readString(info.name) || !r.read(info.onlinePlayers) ||
        !readProperties(r, info.customOptions) || !r.read(type) ||
        type > static_cast<uint8_t>(GameInfoType::Lobby)) {
        return false;
    }
    info.type = static_cast<GameInfoType>(type);
    return true;
}

// -- Whole buffer -------------------------------------------------------------

std::vector<uint8_t> encodePropertyList(const PropertyList& props) {
    ByteWriter w;
    writePropertyList(w, props);
    return std::move(w).bytes();
}

std::vector<uint8_t> encodeMemberData(const LobbyMemberData& member) {
    ByteWriter w;
    writeMemberData(w, member);
    return std::move(w).bytes();
}

std::vector<uint8_t> encodeLobbyData(const LobbyData& lobby) {
    ByteWriter w;
    writeLobbyData(w, lobby);
    return std::move(w).bytes();
}

std::vector<uint8_t> encodeRoomAccess(const RoomAccess& access) {
    ByteWriter w;
    writeRoomAccess(w, access);
    return std::move(w).bytes();
}

std::vector<uint8_t> encodeGameInfoList(const std::vector<GameInfo>& games) {
    ByteWriter w;
    w.write(static_cast<uint32_t>(games.size()));
    for (const auto& info : games) {
        writeGameInfo(w, info);
    }
    return std::move(w).bytes();
}

ServiceResult<PropertyList> decodePropertyList(std::span<const uint8_t> data) {
    return decodeWhole<PropertyList>(data, &readPropertyList);
}

ServiceResult<LobbyMemberData> decodeMemberData(std::span<const uint8_t> data) {
    return decodeWhole<LobbyMemberData>(data, &readMemberData);
}

ServiceResult<LobbyData> decodeLobbyData(std::span<const uint8_t> data) {
    return decodeWhole<LobbyData>(data, &readLobbyData);
}

ServiceResult<RoomAccess> decodeRoomAccess(std::span<const uint8_t> data) {
    return decodeWhole<RoomAccess>(data, &readRoomAccess);
}

ServiceResult<std::vector<GameInfo>> decodeGameInfoList(std::span<const uint8_t> data) {
    return decodeWhole<std::vector<GameInfo>>(data, &readGameInfoList);
}

}  // namespace lcs::service
