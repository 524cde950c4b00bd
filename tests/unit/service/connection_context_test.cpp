#include <gtest/gtest.h>

#include <memory>
#include <optional>
#include <vector>

#include "lcs/service/connection_context_manager.hpp"
#include "lcs/service/connection_lobby_context.hpp"

using namespace lcs::service;

// ===========================================================================
// ConnectionLobbyContext
// ===========================================================================

TEST(ConnectionLobbyContextTest, StartsOutsideAnyLobby) {
    ConnectionLobbyContext ctx(PeerId(1), 1);
    EXPECT_EQ(ctx.peerId(), PeerId(1));
    EXPECT_FALSE(ctx.currentLobby().has_value());
    EXPECT_TRUE(ctx.joinedLobbies().empty());
    EXPECT_TRUE(ctx.hasCapacity());
}

TEST(ConnectionLobbyContextTest, SingleLobbyLimit) {
    ConnectionLobbyContext ctx(PeerId(1), 1);
    EXPECT_TRUE(ctx.bindLobby(0));
    EXPECT_FALSE(ctx.hasCapacity());
    EXPECT_FALSE(ctx.bindLobby(1));
    EXPECT_EQ(ctx.currentLobby(), std::optional<LobbyId>(0));
}

TEST(ConnectionLobbyContextTest, ZeroLimitIsTreatedAsOne) {
    ConnectionLobbyContext ctx(PeerId(1), 0);
    EXPECT_TRUE(ctx.hasCapacity());
    EXPECT_TRUE(ctx.bindLobby(5));
    EXPECT_FALSE(ctx.bindLobby(6));
}

TEST(ConnectionLobbyContextTest, CurrentLobbyIsMostRecentlyJoined) {
    ConnectionLobbyContext ctx(PeerId(1), 3);
    ASSERT_TRUE(ctx.bindLobby(4));
    ASSERT_TRUE(ctx.bindLobby(7));
    EXPECT_EQ(ctx.currentLobby(), std::optional<LobbyId>(7));

    EXPECT_TRUE(ctx.unbindLobby(7));
    EXPECT_EQ(ctx.currentLobby(), std::optional<LobbyId>(4));
    EXPECT_EQ(ctx.joinedLobbies(), std::vector<LobbyId>{4});
}

TEST(ConnectionLobbyContextTest, DuplicateBindAndUnknownUnbindAreRejected) {
    ConnectionLobbyContext ctx(PeerId(1), 3);
    ASSERT_TRUE(ctx.bindLobby(2));
    EXPECT_FALSE(ctx.bindLobby(2));
    EXPECT_FALSE(ctx.unbindLobby(9));
    EXPECT_EQ(ctx.joinedLobbies().size(), 1u);
}

TEST(ConnectionLobbyContextTest, UnbindFreesCapacity) {
    ConnectionLobbyContext ctx(PeerId(1), 1);
    ASSERT_TRUE(ctx.bindLobby(3));
    EXPECT_TRUE(ctx.unbindLobby(3));
    EXPECT_TRUE(ctx.hasCapacity());
    EXPECT_TRUE(ctx.bindLobby(4));
}

// ===========================================================================
// ConnectionContextManager
// ===========================================================================

TEST(ConnectionContextManagerTest, GetOrCreateReturnsSameContext) {
    ConnectionContextManager manager(1);
    auto a = manager.getOrCreate(PeerId(10));
    ASSERT_TRUE(a->bindLobby(2));
    auto b = manager.getOrCreate(PeerId(10));

    EXPECT_EQ(a, b);
    EXPECT_EQ(b->currentLobby(), std::optional<LobbyId>(2));
    EXPECT_EQ(manager.size(), 1u);
}

TEST(ConnectionContextManagerTest, ContextsUseConfiguredLimit) {
    ConnectionContextManager manager(2);
    auto ctx = manager.getOrCreate(PeerId(10));
    EXPECT_TRUE(ctx->bindLobby(1));
    EXPECT_TRUE(ctx->bindLobby(2));
    EXPECT_FALSE(ctx->bindLobby(3));
}

TEST(ConnectionContextManagerTest, FindAndRemove) {
    ConnectionContextManager manager(1);
    (void)manager.getOrCreate(PeerId(10));
    (void)manager.getOrCreate(PeerId(11));

    EXPECT_NE(manager.find(PeerId(10)), nullptr);
    EXPECT_EQ(manager.find(PeerId(12)), nullptr);

    auto removed = manager.remove(PeerId(10));
    ASSERT_NE(removed, nullptr);
    EXPECT_EQ(removed->peerId(), PeerId(10));
    EXPECT_EQ(manager.find(PeerId(10)), nullptr);
    EXPECT_EQ(manager.remove(PeerId(10)), nullptr);

    EXPECT_EQ(manager.size(), 1u);
    manager.clear();
    EXPECT_EQ(manager.size(), 0u);
}
