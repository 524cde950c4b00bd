#pragma once

/// @file lobby_codec.hpp
/// @brief Binary encoding of lobby payloads.
///
/// All integers are little-endian; strings and collections carry a u32
/// length prefix. Lobby ids travel as i32 and peer ids as u64.
///
/// Stream-level read/write functions compose into request payloads (for
/// example "i32 lobby id + PropertyList"). The encode/decode pairs handle a
/// whole buffer; decoders report truncated or trailing bytes as
/// ErrorCode::InvalidMessage.
///
/// Example:
/// @code
///   ByteWriter w;
///   w.write<int32_t>(0);
///   writePropertyList(w, {{"map", "arena2"}, {"roundsX", "5"}});
///   dispatcher.dispatch(peer, LobbyOpcode::SetLobbyProperties, w.bytes());
/// @endcode

#include <cstdint>
#include <span>
#include <vector>

#include "lcs/foundation/byte_buffer.hpp"
#include "lcs/foundation/service_result.hpp"
#include "lcs/service/lobby_types.hpp"

namespace lcs::service {

// -- Stream level -------------------------------------------------------------

void writePropertyList(lcs::foundation::ByteWriter& w, const PropertyList& props);
void writeProperties(lcs::foundation::ByteWriter& w, const LobbyProperties& props);
void writeMemberData(lcs::foundation::ByteWriter& w, const LobbyMemberData& member);
void writeLobbyData(lcs::foundation::ByteWriter& w, const LobbyData& lobby);
void writeRoomAccess(lcs::foundation::ByteWriter& w, const RoomAccess& access);
void writeGameInfo(lcs::foundation::ByteWriter& w, const GameInfo& info);

[[nodiscard]] bool readPropertyList(lcs::foundation::ByteReader& r, PropertyList& props);

/// Duplicate keys keep the last value.
[[nodiscard]] bool readProperties(lcs::foundation::ByteReader& r, LobbyProperties& props);

[[nodiscard]] bool readMemberData(lcs::foundation::ByteReader& r, LobbyMemberData& member);
[[nodiscard]] bool readLobbyData(lcs::foundation::ByteReader& r, LobbyData& lobby);
[[nodiscard]] bool readRoomAccess(lcs::foundation::ByteReader& r, RoomAccess& access);
[[nodiscard]] bool readGameInfo(lcs::foundation::ByteReader& r, GameInfo& info);

// -- Whole buffer -------------------------------------------------------------

[[nodiscard]] std::vector<uint8_t> encodePropertyList(const PropertyList& props);
[[nodiscard]] std::vector<uint8_t> encodeMemberData(const LobbyMemberData& member);
[[nodiscard]] std::vector<uint8_t> encodeLobbyData(const LobbyData& lobby);
[[nodiscard]] std::vector<uint8_t> encodeRoomAccess(const RoomAccess& access);
[[nodiscard]] std::vector<uint8_t> encodeGameInfoList(const std::vector<GameInfo>& games);

[[nodiscard]] lcs::foundation::ServiceResult<PropertyList> decodePropertyList(
    std::span<const uint8_t> data);
[[nodiscard]] lcs::foundation::ServiceResult<LobbyMemberData> decodeMemberData(
    std::span<const uint8_t> data);
[[nodiscard]] lcs::foundation::ServiceResult<LobbyData> decodeLobbyData(
    std::span<const uint8_t> data);
[[nodiscard]] lcs::foundation::ServiceResult<RoomAccess> decodeRoomAccess(
    std::span<const uint8_t> data);
[[nodiscard]] lcs::foundation::ServiceResult<std::vector<GameInfo>> decodeGameInfoList(
    std::span<const uint8_t> data);

}  // namespace lcs::service
