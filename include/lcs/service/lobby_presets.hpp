#pragma once

/// @file lobby_presets.hpp
/// @brief Ready-made lobby factories: "deathmatch", "2v2v4" and "3v3auto".

#include <chrono>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "lcs/service/base_lobby.hpp"
#include "lcs/service/lobby_factory_registry.hpp"

namespace lcs::service {

namespace LobbyPresetId {
inline constexpr const char* kDeathmatch = "deathmatch";
inline constexpr const char* kTwoVsTwoVsFour = "2v2v4";
inline constexpr const char* kThreeVsThreeAuto = "3v3auto";
} // namespace LobbyPresetId

/// Collaborators shared by every preset lobby.
struct LobbyPresetOptions {
    std::shared_ptr<ILobbyEventSink> eventSink;
    std::shared_ptr<IRoomProvisioner> provisioner;
    std::chrono::milliseconds startTimeout{10000};
};

/// Free-for-all lobby whose numeric settings must be integers.
///
/// Keys listed in numericPropertyKeys() (e.g. "roundsX") reject values that
/// are not non-negative integers.
class DeathmatchLobby : public BaseLobby {
public:
    using BaseLobby::BaseLobby;

    [[nodiscard]] static const std::vector<std::string>& numericPropertyKeys();

protected:
    [[nodiscard]] lcs::foundation::ServiceResult<void> validateProperty(
        const std::string& key, const std::string& value) const override;
};

/// Free-for-all. Option "maxPlayers" (1-64, default 10) sets the capacity.
[[nodiscard]] LobbyFactory makeDeathmatchFactory(LobbyPresetOptions options);

/// Three teams of 2, 2 and 4 players with free team switching.
[[nodiscard]] LobbyFactory makeTwoVsTwoVsFourFactory(LobbyPresetOptions options);

/// Two teams of 3, balanced automatically on join; switching disabled.
[[nodiscard]] LobbyFactory makeThreeVsThreeAutoFactory(LobbyPresetOptions options);

/// Every preset keyed by its factory id.
[[nodiscard]] std::vector<std::pair<std::string, LobbyFactory>> defaultLobbyFactories(
    const LobbyPresetOptions& options);

}  // namespace lcs::service
