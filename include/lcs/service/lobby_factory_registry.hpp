#pragma once

/// @file lobby_factory_registry.hpp
/// @brief Factory id to lobby constructor mapping.

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "lcs/foundation/service_result.hpp"
#include "lcs/service/lobby.hpp"

namespace lcs::service {

/// Builds a lobby with the given id from creation options.
///
/// Invalid options are reported as an error; a factory never returns a
/// half-built lobby.
using LobbyFactory = std::function<lcs::foundation::ServiceResult<std::unique_ptr<ILobby>>(
    LobbyId lobbyId, const LobbyProperties& options, const PeerInfo& creator)>;

/// Thread-safe registry of lobby factories.
///
/// Registering an id twice replaces the earlier factory and logs a warning;
/// later registrations are treated as intentional.
///
/// Example:
/// @code
///   LobbyFactoryRegistry factories;
///   factories.registerFactory("deathmatch", makeDeathmatchLobby);
///   if (auto factory = factories.resolve("deathmatch")) {
///       auto lobby = (*factory)(0, options, creator);
///   }
/// @endcode
class LobbyFactoryRegistry {
public:
    /// Register or replace the factory for @p factoryId.
    /// @return true if an existing factory was replaced.
    bool registerFactory(const std::string& factoryId, LobbyFactory factory);

    [[nodiscard]] std::optional<LobbyFactory> resolve(const std::string& factoryId) const;

    [[nodiscard]] bool contains(const std::string& factoryId) const;

    /// Registered ids in lexical order.
    [[nodiscard]] std::vector<std::string> factoryIds() const;

    [[nodiscard]] std::size_t size() const;

    void clear();

private:
    std::unordered_map<std::string, LobbyFactory> factories_;
    mutable std::shared_mutex mutex_;
};

}  // namespace lcs::service
