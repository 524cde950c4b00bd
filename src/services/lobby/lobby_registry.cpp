/// @file lobby_registry.cpp
/// @brief LobbyRegistry implementation.

#include "lcs/service/lobby_registry.hpp"

#include <algorithm>
#include <mutex>
#include <string>

#include "lcs/foundation/error_code.hpp"
#include "lcs/foundation/service_error.hpp"
#include "lcs/foundation/service_logger.hpp"

namespace lcs::service {

using lcs::foundation::ErrorCode;
using lcs::foundation::LogCategory;
using lcs::foundation::ServiceError;
using lcs::foundation::ServiceResult;

LobbyRegistry::LobbyRegistry() = default;

LobbyRegistry::~LobbyRegistry() {
    clear();
}

LobbyId LobbyRegistry::generateLobbyId() {
    return nextLobbyId_.fetch_add(1, std::memory_order_relaxed);
}

ServiceResult<void> LobbyRegistry::add(std::shared_ptr<ILobby> lobby) {
    if (!lobby) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::InvalidArgument, "lobby is null"));
    }

    const LobbyId lobbyId = lobby->id();
    {
        std::unique_lock lock(mutex_);

        if (!lobbies_.contains(lobbyId)) {
            // Signal mutex is a leaf lock; connecting here cannot deadlock.
            auto slot = lobby->destroyedSignal().connectOnce(
                [this](LobbyId destroyedId) { remove(destroyedId); });
            lobbies_.emplace(lobbyId, Entry{std::move(lobby), slot});
            return ServiceResult<void>::ok();
        }
    }

    LCS_LOG_ERROR(LogCategory::Registry,
                  "Lobby id collision: " + std::to_string(lobbyId) +
                      " is already registered");
    return ServiceResult<void>::err(
        ServiceError(ErrorCode::LobbyIdCollision,
                     "lobby id " + std::to_string(lobbyId) + " is already registered"));
}

bool LobbyRegistry::remove(LobbyId lobbyId) {
    Entry entry;
    {
        std::unique_lock lock(mutex_);

        auto it = lobbies_.find(lobbyId);
        if (it == lobbies_.end()) {
            return false;
        }
        entry = std::move(it->second);
        lobbies_.erase(it);
    }

    // No-op when called from the one-shot slot itself.
    entry.lobby->destroyedSignal().disconnect(entry.destroyedSlot);
    removed_.fetch_add(1, std::memory_order_relaxed);

    LCS_LOG_DEBUG(LogCategory::Registry,
                  "Lobby " + std::to_string(lobbyId) + " removed from registry");
    return true;
}

std::shared_ptr<ILobby> LobbyRegistry::get(LobbyId lobbyId) const {
    std::shared_lock lock(mutex_);

    auto it = lobbies_.find(lobbyId);
    if (it == lobbies_.end()) {
        return nullptr;
    }
    return it->second.lobby;
}

std::vector<std::shared_ptr<ILobby>> LobbyRegistry::allLobbies() const {
    std::vector<std::pair<LobbyId, std::shared_ptr<ILobby>>> entries;
    {
        std::shared_lock lock(mutex_);
        entries.reserve(lobbies_.size());
        for (const auto& [id, entry] : lobbies_) {
            entries.emplace_back(id, entry.lobby);
        }
    }

    std::sort(entries.begin(), entries.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });

    std::vector<std::shared_ptr<ILobby>> result;
    result.reserve(entries.size());
    for (auto& [id, lobby] : entries) {
        result.push_back(std::move(lobby));
    }
    return result;
}

std::size_t LobbyRegistry::size() const {
    std::shared_lock lock(mutex_);
    return lobbies_.size();
}

uint64_t LobbyRegistry::removedCount() const noexcept {
    return removed_.load(std::memory_order_relaxed);
}

void LobbyRegistry::clear() {
    std::unordered_map<LobbyId, Entry> drained;
    {
        std::unique_lock lock(mutex_);
        drained.swap(lobbies_);
    }

    for (auto& [id, entry] : drained) {
        entry.lobby->destroyedSignal().disconnect(entry.destroyedSlot);
    }
}

}  // namespace lcs::service
