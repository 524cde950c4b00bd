#pragma once

/// @file lobby_registry.hpp
/// @brief Live lobbies by id, lobby id generation, and destroy-driven removal.

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

#include "lcs/foundation/service_result.hpp"
#include "lcs/service/lobby.hpp"

namespace lcs::service {

/// Thread-safe owner of every live lobby.
///
/// Lookups and discovery snapshots take a shared lock; add/remove take an
/// exclusive one. The registry never calls into a lobby while holding its
/// lock, so it never contends with a lobby's own mutex.
///
/// Each added lobby gets a one-shot subscription on its destroyed signal
/// that removes the entry; the slot is detached after it fires.
///
/// Example:
/// @code
///   LobbyRegistry lobbies;
///   LobbyId id = lobbies.generateLobbyId();   // 0, 1, 2, ...
///   lobbies.add(std::move(lobby));
///   lobby->destroy();                         // entry removed automatically
/// @endcode
class LobbyRegistry {
public:
    LobbyRegistry();
    ~LobbyRegistry();

    LobbyRegistry(const LobbyRegistry&) = delete;
    LobbyRegistry& operator=(const LobbyRegistry&) = delete;

    /// Next lobby id. Strictly increasing from 0 and never reused.
    [[nodiscard]] LobbyId generateLobbyId();

    /// Register @p lobby under its id.
    /// Fails with LobbyIdCollision if the id is already present.
    [[nodiscard]] lcs::foundation::ServiceResult<void> add(std::shared_ptr<ILobby> lobby);

    /// Drop the entry for @p lobbyId. Unknown ids are a no-op.
    /// @return true if an entry was removed.
    bool remove(LobbyId lobbyId);

    [[nodiscard]] std::shared_ptr<ILobby> get(LobbyId lobbyId) const;

    /// Point-in-time copy of every registered lobby, ordered by id.
    [[nodiscard]] std::vector<std::shared_ptr<ILobby>> allLobbies() const;

    [[nodiscard]] std::size_t size() const;

    /// Number of entries removed since construction.
    [[nodiscard]] uint64_t removedCount() const noexcept;

    /// Remove every entry and detach every destroyed-signal subscription.
    void clear();

private:
    using SlotId = lcs::foundation::Signal<LobbyId>::SlotId;

    struct Entry {
        std::shared_ptr<ILobby> lobby;
        SlotId destroyedSlot = 0;
    };

    std::unordered_map<LobbyId, Entry> lobbies_;
    mutable std::shared_mutex mutex_;
    std::atomic<LobbyId> nextLobbyId_{0};
    std::atomic<uint64_t> removed_{0};
};

}  // namespace lcs::service
