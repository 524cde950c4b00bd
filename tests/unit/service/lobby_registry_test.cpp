#include <gtest/gtest.h>

#include <algorithm>
#include <memory>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

#include "lcs/service/base_lobby.hpp"
#include "lcs/service/lobby_registry.hpp"

using namespace lcs::service;
using lcs::foundation::ErrorCode;

namespace {

std::shared_ptr<BaseLobby> makeLobby(LobbyId id) {
    BaseLobbyConfig cfg;
    cfg.type = "test";
    return std::make_shared<BaseLobby>(id, std::move(cfg), PeerId(1));
}

} // namespace

// ===========================================================================
// Id generation
// ===========================================================================

TEST(LobbyRegistryTest, IdsStartAtZeroAndIncrease) {
    LobbyRegistry registry;
    EXPECT_EQ(registry.generateLobbyId(), 0u);
    EXPECT_EQ(registry.generateLobbyId(), 1u);
    EXPECT_EQ(registry.generateLobbyId(), 2u);
}

TEST(LobbyRegistryTest, ConcurrentIdsAreDistinct) {
    LobbyRegistry registry;
    constexpr int kThreads = 8;
    constexpr int kPerThread = 500;

    std::mutex mutex;
    std::vector<LobbyId> ids;
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&]() {
            std::vector<LobbyId> local;
            for (int i = 0; i < kPerThread; ++i) {
                local.push_back(registry.generateLobbyId());
            }
            // Each thread observes strictly increasing ids.
            EXPECT_TRUE(std::is_sorted(local.begin(), local.end()));
            std::lock_guard lock(mutex);
            ids.insert(ids.end(), local.begin(), local.end());
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    std::set<LobbyId> unique(ids.begin(), ids.end());
    EXPECT_EQ(unique.size(), static_cast<std::size_t>(kThreads * kPerThread));
    EXPECT_EQ(*unique.rbegin(), static_cast<LobbyId>(kThreads * kPerThread - 1));
}

// ===========================================================================
// Registration
// ===========================================================================

TEST(LobbyRegistryTest, AddAndGet) {
    LobbyRegistry registry;
    auto lobby = makeLobby(registry.generateLobbyId());
    ASSERT_TRUE(registry.add(lobby));

    EXPECT_EQ(registry.get(0), lobby);
    EXPECT_EQ(registry.get(1), nullptr);
    EXPECT_EQ(registry.size(), 1u);
}

TEST(LobbyRegistryTest, NullLobbyIsRejected) {
    LobbyRegistry registry;
    auto result = registry.add(nullptr);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidArgument);
}

TEST(LobbyRegistryTest, DuplicateIdIsACollision) {
    LobbyRegistry registry;
    ASSERT_TRUE(registry.add(makeLobby(4)));

    auto second = makeLobby(4);
    auto result = registry.add(second);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code(), ErrorCode::LobbyIdCollision);
    EXPECT_EQ(registry.size(), 1u);
    EXPECT_NE(registry.get(4), second);
}

TEST(LobbyRegistryTest, AllLobbiesSortedById) {
    LobbyRegistry registry;
    ASSERT_TRUE(registry.add(makeLobby(5)));
    ASSERT_TRUE(registry.add(makeLobby(1)));
    ASSERT_TRUE(registry.add(makeLobby(3)));

    auto all = registry.allLobbies();
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0]->id(), 1u);
    EXPECT_EQ(all[1]->id(), 3u);
    EXPECT_EQ(all[2]->id(), 5u);
}

// ===========================================================================
// Removal
// ===========================================================================

TEST(LobbyRegistryTest, DestroyedLobbyRemovesItself) {
    LobbyRegistry registry;
    auto lobby = makeLobby(registry.generateLobbyId());
    ASSERT_TRUE(registry.add(lobby));

    lobby->destroy();

    EXPECT_EQ(registry.get(0), nullptr);
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_EQ(registry.removedCount(), 1u);
    EXPECT_EQ(lobby->destroyedSignal().slotCount(), 0u);
}

TEST(LobbyRegistryTest, ExplicitRemoveDetachesFromSignal) {
    LobbyRegistry registry;
    auto lobby = makeLobby(0);
    ASSERT_TRUE(registry.add(lobby));

    EXPECT_TRUE(registry.remove(0));
    EXPECT_FALSE(registry.remove(0));
    EXPECT_EQ(lobby->destroyedSignal().slotCount(), 0u);

    // Destroying after removal must not touch the registry again.
    lobby->destroy();
    EXPECT_EQ(registry.removedCount(), 1u);
}

TEST(LobbyRegistryTest, LobbyOutlivingRegistryIsSafe) {
    auto lobby = makeLobby(0);
    {
        LobbyRegistry registry;
        ASSERT_TRUE(registry.add(lobby));
    }
    EXPECT_EQ(lobby->destroyedSignal().slotCount(), 0u);
    lobby->destroy();
    EXPECT_TRUE(lobby->isDestroyed());
}

TEST(LobbyRegistryTest, ConcurrentCreateAndDestroy) {
    LobbyRegistry registry;
    constexpr int kThreads = 4;
    constexpr int kPerThread = 100;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < kPerThread; ++i) {
                auto lobby = makeLobby(registry.generateLobbyId());
                EXPECT_TRUE(registry.add(lobby));
                if (i % 2 == 0) {
                    lobby->destroy();
                }
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(registry.size(), static_cast<std::size_t>(kThreads * kPerThread / 2));
    EXPECT_EQ(registry.removedCount(), static_cast<uint64_t>(kThreads * kPerThread / 2));
}
