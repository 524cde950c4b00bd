/// @file lobby_presets.cpp
/// @brief Preset lobby factories.

#include "lcs/service/lobby_presets.hpp"

#include <algorithm>
#include <charconv>
#include <cstdint>

#include "lcs/foundation/error_code.hpp"
#include "lcs/foundation/service_error.hpp"

namespace lcs::service {

using lcs::foundation::ErrorCode;
using lcs::foundation::ServiceError;
using lcs::foundation::ServiceResult;

namespace {

constexpr uint32_t kDeathmatchDefaultPlayers = 10;
constexpr uint32_t kDeathmatchMaxPlayers = 64;

using FactoryResult = ServiceResult<std::unique_ptr<ILobby>>;

bool parseUnsigned(const std::string& text, uint32_t& out) {
    if (text.empty()) {
        return false;
    }
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, out);
    return ec == std::errc{} && ptr == last;
}

std::string optionOr(const LobbyProperties& options, std::string_view key,
                     std::string fallback) {
    auto it = options.find(std::string(key));
    if (it == options.end() || it->second.empty()) {
        return fallback;
    }
    return it->second;
}

/// Copy creation options that are not consumed by the factory itself.
LobbyProperties initialProperties(const LobbyProperties& options) {
    LobbyProperties props;
    for (const auto& [key, value] : options) {
        if (key == kLobbyFactoryIdKey || key == kLobbyNameKey || key == kMaxPlayersKey) {
            continue;
        }
        props.emplace(key, value);
    }
    return props;
}

BaseLobbyConfig baseConfig(const LobbyPresetOptions& preset, const LobbyProperties& options,
                           std::string type, std::string defaultName) {
    BaseLobbyConfig cfg;
    cfg.type = std::move(type);
    cfg.name = optionOr(options, kLobbyNameKey, std::move(defaultName));
    cfg.properties = initialProperties(options);
    cfg.eventSink = preset.eventSink;
    cfg.provisioner = preset.provisioner;
    cfg.startTimeout = preset.startTimeout;
    return cfg;
}

/// Hand out @p lobby only if its creation options pass its own validation.
FactoryResult checked(std::unique_ptr<BaseLobby> lobby) {
    auto valid = lobby->validateInitialProperties();
    if (!valid) {
        const auto& error = valid.error();
        return FactoryResult::err(ServiceError(error.code(), std::string(error.message()),
                                               std::string(error.subject())));
    }
    return FactoryResult::ok(std::move(lobby));
}

LobbyTeam team(std::string name, uint32_t minPlayers, uint32_t maxPlayers) {
    LobbyTeam t;
    t.name = std::move(name);
    t.minPlayers = minPlayers;
    t.maxPlayers = maxPlayers;
    return t;
}

} // anonymous namespace

// -- DeathmatchLobby ----------------------------------------------------------

const std::vector<std::string>& DeathmatchLobby::numericPropertyKeys() {
    static const std::vector<std::string> keys{"roundsX", "timeLimit", "fragLimit"};
    return keys;
}

ServiceResult<void> DeathmatchLobby::validateProperty(const std::string& key,
                                                      const std::string& value) const {
    const auto& numeric = numericPropertyKeys();
    if (std::find(numeric.begin(), numeric.end(), key) == numeric.end()) {
        return ServiceResult<void>::ok();
    }

    uint32_t parsed = 0;
    if (!parseUnsigned(value, parsed)) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::PropertyRejected, key + " must be a number", key));
    }
    return ServiceResult<void>::ok();
}

// -- Factories ----------------------------------------------------------------

LobbyFactory makeDeathmatchFactory(LobbyPresetOptions options) {
    return [preset = std::move(options)](LobbyId lobbyId, const LobbyProperties& opts,
                                         const PeerInfo& creator) -> FactoryResult {
        auto cfg = baseConfig(preset, opts, LobbyPresetId::kDeathmatch, "Deathmatch");

        uint32_t maxPlayers = kDeathmatchDefaultPlayers;
        auto it = opts.find(std::string(kMaxPlayersKey));
        if (it != opts.end()) {
            if (!parseUnsigned(it->second, maxPlayers) || maxPlayers == 0 ||
                maxPlayers > kDeathmatchMaxPlayers) {
                return FactoryResult::err(ServiceError(
                    ErrorCode::InvalidLobbyOptions, "Invalid maxPlayers option",
                    std::string(kMaxPlayersKey)));
            }
        }
        cfg.maxPlayers = maxPlayers;
        cfg.minPlayers = 1;

        return checked(std::make_unique<DeathmatchLobby>(lobbyId, std::move(cfg), creator.id));
    };
}

LobbyFactory makeTwoVsTwoVsFourFactory(LobbyPresetOptions options) {
    return [preset = std::move(options)](LobbyId lobbyId, const LobbyProperties& opts,
                                         const PeerInfo& creator) -> FactoryResult {
        auto cfg = baseConfig(preset, opts, LobbyPresetId::kTwoVsTwoVsFour, "2 vs 2 vs 4");
        cfg.teams = {team("Red", 1, 2), team("Blue", 1, 2), team("Green", 1, 4)};
        cfg.maxPlayers = 8;
        cfg.minPlayers = 3;
        cfg.enableTeamSwitching = true;

        return checked(std::make_unique<BaseLobby>(lobbyId, std::move(cfg), creator.id));
    };
}

LobbyFactory makeThreeVsThreeAutoFactory(LobbyPresetOptions options) {
    return [preset = std::move(options)](LobbyId lobbyId, const LobbyProperties& opts,
                                         const PeerInfo& creator) -> FactoryResult {
        auto cfg = baseConfig(preset, opts, LobbyPresetId::kThreeVsThreeAuto, "3 vs 3 (auto)");
        cfg.teams = {team("Red", 1, 3), team("Blue", 1, 3)};
        cfg.maxPlayers = 6;
        cfg.minPlayers = 2;
        cfg.enableTeamSwitching = false;

        return checked(std::make_unique<BaseLobby>(lobbyId, std::move(cfg), creator.id));
    };
}

std::vector<std::pair<std::string, LobbyFactory>> defaultLobbyFactories(
    const LobbyPresetOptions& options) {
    std::vector<std::pair<std::string, LobbyFactory>> factories;
    factories.emplace_back(LobbyPresetId::kDeathmatch, makeDeathmatchFactory(options));
    factories.emplace_back(LobbyPresetId::kTwoVsTwoVsFour, makeTwoVsTwoVsFourFactory(options));
    factories.emplace_back(LobbyPresetId::kThreeVsThreeAuto,
                           makeThreeVsThreeAutoFactory(options));
    return factories;
}

}  // namespace lcs::service
