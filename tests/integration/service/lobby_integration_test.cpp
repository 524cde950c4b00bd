/// @file lobby_integration_test.cpp
/// @brief End-to-end lobby flows through the request dispatcher with
///        encoded payloads, the preset factories and the local provisioner.

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "lcs/foundation/byte_buffer.hpp"
#include "lcs/service/local_room_provisioner.hpp"
#include "lcs/service/lobby_codec.hpp"
#include "lcs/service/lobby_presets.hpp"
#include "lcs/service/lobby_request_dispatcher.hpp"
#include "recording_event_sink.hpp"

using namespace lcs::service;
using lcs::foundation::ByteReader;
using lcs::foundation::ByteWriter;
using lcs::test::RecordingEventSink;

namespace {

PeerInfo makePeer(uint64_t id, const std::string& name) {
    PeerInfo peer;
    peer.id = PeerId(id);
    peer.username = name;
    return peer;
}

std::vector<uint8_t> lobbyIdPayload(int32_t lobbyId) {
    ByteWriter w;
    w.write(lobbyId);
    return std::move(w).bytes();
}

std::vector<uint8_t> readyPayload(bool ready) {
    ByteWriter w;
    w.write<int32_t>(ready ? 1 : 0);
    return std::move(w).bytes();
}

} // namespace

class LobbyIntegrationTest : public ::testing::Test {
protected:
    void SetUp() override {
        sink_ = std::make_shared<RecordingEventSink>();

        LocalRoomConfig rooms;
        rooms.publicAddress = "192.0.2.10";
        rooms.firstPort = 7777;
        rooms.portCount = 4;
        rooms.tokenSecret = "integration-secret";
        rooms_ = std::make_shared<LocalRoomProvisioner>(rooms);

        LobbyPresetOptions presets;
        presets.eventSink = sink_;
        presets.provisioner = rooms_;
        presets.startTimeout = std::chrono::milliseconds(1000);
        for (auto& [id, factory] : defaultLobbyFactories(presets)) {
            coordinator_.registerFactory(id, std::move(factory));
        }
        ASSERT_TRUE(coordinator_.start());
    }

    LobbyResponse send(const PeerInfo& peer, uint16_t opcode,
                       const std::vector<uint8_t>& payload = {}) {
        auto response = dispatcher_.dispatch(peer, opcode, payload);
        EXPECT_TRUE(response.has_value()) << "opcode " << opcode;
        return response.value_or(LobbyResponse{});
    }

    int32_t create(const PeerInfo& peer, const PropertyList& options) {
        auto response = send(peer, LobbyOpcode::CreateLobby, encodePropertyList(options));
        EXPECT_TRUE(response.isSuccess()) << response.reason;
        ByteReader r{response.payload, 0};
        int32_t id = -1;
        EXPECT_TRUE(r.read(id));
        return id;
    }

    LobbyData join(const PeerInfo& peer, int32_t lobbyId) {
        auto response = send(peer, LobbyOpcode::JoinLobby, lobbyIdPayload(lobbyId));
        EXPECT_TRUE(response.isSuccess()) << response.reason;
        auto data = decodeLobbyData(response.payload);
        EXPECT_TRUE(data);
        return data ? data.value() : LobbyData{};
    }

    LobbyData info(const PeerInfo& peer, int32_t lobbyId) {
        auto response = send(peer, LobbyOpcode::GetLobbyInfo, lobbyIdPayload(lobbyId));
        EXPECT_TRUE(response.isSuccess()) << response.reason;
        auto data = decodeLobbyData(response.payload);
        EXPECT_TRUE(data);
        return data ? data.value() : LobbyData{};
    }

    std::vector<GameInfo> publicGames(const PeerInfo& peer) {
        auto response = send(peer, LobbyOpcode::GetPublicGames);
        EXPECT_TRUE(response.isSuccess());
        auto games = decodeGameInfoList(response.payload);
        EXPECT_TRUE(games);
        return games ? games.value() : std::vector<GameInfo>{};
    }

    std::shared_ptr<RecordingEventSink> sink_;
    std::shared_ptr<LocalRoomProvisioner> rooms_;
    LobbyCoordinator coordinator_{LobbyCoordinatorConfig{}};
    LobbyRequestDispatcher dispatcher_{coordinator_};

    const PeerInfo host_ = makePeer(100, "host");
    const PeerInfo guest_ = makePeer(200, "guest");
    const PeerInfo rival_ = makePeer(300, "rival");
};

// ===========================================================================
// Full lobby flow
// ===========================================================================

TEST_F(LobbyIntegrationTest, CreateJoinConfigureAndLeave) {
    // Host creates an 8-player deathmatch and joins it.
    auto lobbyId = create(host_, {{"lobbyFactoryId", "deathmatch"}, {"maxPlayers", "8"}});
    ASSERT_EQ(lobbyId, 0);

    auto hostView = join(host_, lobbyId);
    EXPECT_EQ(hostView.playerCount, 1u);
    EXPECT_EQ(hostView.maxPlayers, 8u);
    EXPECT_EQ(hostView.ownerId, host_.id);

    // Guest joins.
    auto guestView = join(guest_, lobbyId);
    EXPECT_EQ(guestView.playerCount, 2u);
    EXPECT_EQ(sink_->countFor(host_.id, LobbyEventType::MemberJoined), 2u);

    // Rival sets up a second lobby and cannot join the first one as well.
    auto otherId = create(rival_, {{"lobbyFactoryId", "deathmatch"}});
    ASSERT_EQ(otherId, 1);
    join(rival_, otherId);

    auto refused = send(rival_, LobbyOpcode::JoinLobby, lobbyIdPayload(lobbyId));
    EXPECT_EQ(refused.status, ResponseStatus::Failed);
    EXPECT_EQ(refused.reason, "You're already in a lobby");
    EXPECT_EQ(info(guest_, lobbyId).playerCount, 2u);

    // A property batch stops at the first rejected key.
    ByteWriter batch;
    batch.write(lobbyId);
    writePropertyList(batch, {{"map", "arena2"}, {"roundsX", "bad"}});
    auto applied = send(host_, LobbyOpcode::SetLobbyProperties, batch.bytes());
    EXPECT_EQ(applied.status, ResponseStatus::Failed);
    EXPECT_NE(applied.reason.find("roundsX"), std::string::npos);

    auto afterBatch = info(guest_, lobbyId);
    EXPECT_EQ(afterBatch.properties.at("map"), "arena2");
    EXPECT_EQ(afterBatch.properties.count("roundsX"), 0u);

    // Only the owner may start.
    auto notOwner = send(guest_, LobbyOpcode::LobbyStartGame);
    EXPECT_EQ(notOwner.status, ResponseStatus::Unauthorized);
    EXPECT_EQ(info(guest_, lobbyId).state, LobbyState::Forming);

    // Everyone leaves; the lobby disappears from lookup and discovery.
    EXPECT_TRUE(send(host_, LobbyOpcode::LeaveLobby, lobbyIdPayload(lobbyId)).isSuccess());
    EXPECT_EQ(info(guest_, lobbyId).ownerId, guest_.id);
    EXPECT_TRUE(send(guest_, LobbyOpcode::LeaveLobby, lobbyIdPayload(lobbyId)).isSuccess());

    auto gone = send(guest_, LobbyOpcode::GetLobbyInfo, lobbyIdPayload(lobbyId));
    EXPECT_EQ(gone.status, ResponseStatus::Failed);
    EXPECT_EQ(gone.reason, "Lobby not found");

    auto games = publicGames(guest_);
    ASSERT_EQ(games.size(), 1u);
    EXPECT_EQ(games[0].id, static_cast<LobbyId>(otherId));
}

TEST_F(LobbyIntegrationTest, StartGameHandsOutVerifiableRoomAccess) {
    auto lobbyId = create(host_, {{"lobbyFactoryId", "deathmatch"}, {"map", "arena1"}});
    join(host_, lobbyId);
    join(guest_, lobbyId);

    ASSERT_TRUE(send(host_, LobbyOpcode::LobbySetReady, readyPayload(true)).isSuccess());
    auto notReady = send(host_, LobbyOpcode::LobbyStartGame);
    EXPECT_EQ(notReady.status, ResponseStatus::Failed);

    ASSERT_TRUE(send(guest_, LobbyOpcode::LobbySetReady, readyPayload(true)).isSuccess());
    auto started = send(host_, LobbyOpcode::LobbyStartGame);
    ASSERT_TRUE(started.isSuccess()) << started.reason;

    auto view = info(guest_, lobbyId);
    EXPECT_EQ(view.state, LobbyState::InProgress);
    EXPECT_EQ(view.gameAddress, "192.0.2.10");
    EXPECT_EQ(view.gamePort, 7777);
    EXPECT_EQ(rooms_->activeRooms(), 1u);

    auto games = publicGames(rival_);
    ASSERT_EQ(games.size(), 1u);
    EXPECT_EQ(games[0].address, "192.0.2.10:7777");

    auto response = send(guest_, LobbyOpcode::GetLobbyRoomAccess);
    ASSERT_TRUE(response.isSuccess()) << response.reason;
    auto access = decodeRoomAccess(response.payload);
    ASSERT_TRUE(access);
    EXPECT_EQ(access.value().port, 7777);
    EXPECT_EQ(access.value().customOptions.at("map"), "arena1");
    EXPECT_TRUE(rooms_->verifyAccessToken(access.value().token, access.value().roomId,
                                          guest_.id));
    EXPECT_FALSE(rooms_->verifyAccessToken(access.value().token, access.value().roomId,
                                           host_.id));

    // The room goes back to the pool once the lobby is gone.
    coordinator_.onPeerDisconnected(host_.id);
    coordinator_.onPeerDisconnected(guest_.id);
    EXPECT_EQ(coordinator_.findLobby(static_cast<LobbyId>(lobbyId)), nullptr);
    EXPECT_EQ(rooms_->activeRooms(), 0u);
}

TEST_F(LobbyIntegrationTest, AutoBalancedTeamsLockSwitching) {
    auto lobbyId = create(host_, {{"lobbyFactoryId", "3v3auto"}});
    join(host_, lobbyId);
    join(guest_, lobbyId);

    auto view = info(host_, lobbyId);
    ASSERT_EQ(view.teams.size(), 2u);
    EXPECT_EQ(view.teams[0].members.size(), 1u);
    EXPECT_EQ(view.teams[1].members.size(), 1u);

    ByteWriter team;
    team.writeString("Blue");
    auto switched = send(host_, LobbyOpcode::JoinLobbyTeam, team.bytes());
    EXPECT_EQ(switched.status, ResponseStatus::Failed);
    EXPECT_EQ(switched.reason, "Failed to join a team: Blue");
}

TEST_F(LobbyIntegrationTest, ChatAndPrivateMemberProperties) {
    auto lobbyId = create(host_, {{"lobbyFactoryId", "deathmatch"}});
    join(host_, lobbyId);
    join(guest_, lobbyId);
    sink_->clear();

    ByteWriter chat;
    chat.writeString("ready when you are");
    EXPECT_FALSE(dispatcher_.dispatch(guest_, LobbyOpcode::LobbySendChatMessage, chat.bytes()));
    EXPECT_EQ(sink_->countFor(host_.id, LobbyEventType::ChatMessage), 1u);

    auto props = encodePropertyList({{"skin", "red"}, {"#loadout", "sniper"}});
    ASSERT_TRUE(send(guest_, LobbyOpcode::SetMyLobbyProperties, props).isSuccess());

    ByteWriter query;
    query.write(lobbyId);
    query.write<uint64_t>(guest_.id.value());
    auto response = send(host_, LobbyOpcode::GetLobbyMemberData, query.bytes());
    ASSERT_TRUE(response.isSuccess()) << response.reason;
    auto member = decodeMemberData(response.payload);
    ASSERT_TRUE(member);
    EXPECT_EQ(member.value().properties.at("skin"), "red");

    // The host's snapshot hides the guest's private keys; the guest's own does not.
    auto hostView = info(host_, lobbyId);
    auto guestView = info(guest_, lobbyId);
    auto findGuest = [this](const LobbyData& data) {
        for (const auto& m : data.members) {
            if (m.peerId == guest_.id) {
                return m;
            }
        }
        return LobbyMemberData{};
    };
    EXPECT_EQ(findGuest(hostView).properties.count("#loadout"), 0u);
    EXPECT_EQ(findGuest(guestView).properties.at("#loadout"), "sniper");
}

TEST_F(LobbyIntegrationTest, ConcurrentJoinsRespectCapacity) {
    auto lobbyId = create(host_, {{"lobbyFactoryId", "deathmatch"}, {"maxPlayers", "5"}});

    constexpr int kPlayers = 16;
    std::vector<std::thread> threads;
    std::atomic<int> accepted{0};
    for (int i = 0; i < kPlayers; ++i) {
        threads.emplace_back([&, i]() {
            auto peer = makePeer(1000 + static_cast<uint64_t>(i), "p" + std::to_string(i));
            auto response = dispatcher_.dispatch(peer, LobbyOpcode::JoinLobby,
                                                 lobbyIdPayload(lobbyId));
            if (response && response->isSuccess()) {
                accepted.fetch_add(1);
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(accepted.load(), 5);
    EXPECT_EQ(info(host_, lobbyId).playerCount, 5u);
}
