#pragma once

/// @file connection_context_manager.hpp
/// @brief Lazily created per-connection lobby contexts, keyed by peer id.

#include <cstdint>
#include <memory>
#include <mutex>
#include <unordered_map>

#include "lcs/service/connection_lobby_context.hpp"

namespace lcs::service {

/// Thread-safe map of connection contexts owned by the coordinator.
///
/// Example:
/// @code
///   ConnectionContextManager contexts(1);
///   auto ctx = contexts.getOrCreate(peer.id);   // created on first use
///   contexts.remove(peer.id);                   // on disconnect
/// @endcode
class ConnectionContextManager {
public:
    explicit ConnectionContextManager(uint32_t joinedLobbiesLimit);

    /// Return the context for @p peerId, creating it on first use.
    [[nodiscard]] std::shared_ptr<ConnectionLobbyContext> getOrCreate(PeerId peerId);

    /// Return the context for @p peerId, or nullptr if none was created.
    [[nodiscard]] std::shared_ptr<ConnectionLobbyContext> find(PeerId peerId) const;

    /// Drop the context for @p peerId and return it (nullptr if absent).
    std::shared_ptr<ConnectionLobbyContext> remove(PeerId peerId);

    [[nodiscard]] std::size_t size() const;

    void clear();

private:
    uint32_t joinedLobbiesLimit_;
    mutable std::mutex mutex_;
    std::unordered_map<PeerId, std::shared_ptr<ConnectionLobbyContext>> contexts_;
};

}  // namespace lcs::service
