/// @file lobby_service_settings.cpp
/// @brief Configuration file to LobbyServiceSettings mapping.

#include "lcs/service/lobby_service_settings.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace lcs::service {

using lcs::foundation::ConfigManager;
using lcs::foundation::ErrorCode;
using lcs::foundation::ServiceError;
using lcs::foundation::ServiceResult;

namespace {

using SettingsResult = ServiceResult<LobbyServiceSettings>;

/// Copy an optional key into @p out. Absent keys leave @p out untouched.
template <typename T>
ServiceResult<void> readOptional(const ConfigManager& config, std::string_view key, T& out) {
    if (!config.hasKey(key)) {
        return ServiceResult<void>::ok();
    }
    auto value = config.get<T>(key);
    if (!value) {
        return ServiceResult<void>::err(value.error());
    }
    out = value.value();
    return ServiceResult<void>::ok();
}

SettingsResult invalidValue(std::string_view key, std::string_view reason) {
    return SettingsResult::err(ServiceError(
        ErrorCode::ConfigInvalidValue,
        std::string(key) + ": " + std::string(reason), std::string(key)));
}

} // anonymous namespace

SettingsResult loadLobbyServiceSettings(const ConfigManager& config) {
    LobbyServiceSettings settings;

    // -- lobby ----------------------------------------------------------------

    if (auto r = readOptional(config, "lobby.create_permission_level",
                              settings.coordinator.createLobbiesPermissionLevel);
        !r) {
        return SettingsResult::err(r.error());
    }
    if (auto r = readOptional(config, "lobby.dont_allow_creating_if_joined",
                              settings.coordinator.dontAllowCreatingIfJoined);
        !r) {
        return SettingsResult::err(r.error());
    }

    int64_t joinedLimit = settings.coordinator.joinedLobbiesLimit;
    if (auto r = readOptional(config, "lobby.joined_lobbies_limit", joinedLimit); !r) {
        return SettingsResult::err(r.error());
    }
    if (joinedLimit < 1 || joinedLimit > UINT32_MAX) {
        return invalidValue("lobby.joined_lobbies_limit", "must be at least 1");
    }
    settings.coordinator.joinedLobbiesLimit = static_cast<uint32_t>(joinedLimit);

    int64_t startTimeoutMs = settings.startTimeout.count();
    if (auto r = readOptional(config, "lobby.start_timeout_ms", startTimeoutMs); !r) {
        return SettingsResult::err(r.error());
    }
    if (startTimeoutMs <= 0) {
        return invalidValue("lobby.start_timeout_ms", "must be positive");
    }
    settings.startTimeout = std::chrono::milliseconds(startTimeoutMs);

    if (auto r = readOptional(config, "lobby.register_presets", settings.registerPresets); !r) {
        return SettingsResult::err(r.error());
    }

    // -- rooms ----------------------------------------------------------------

    if (auto r = readOptional(config, "rooms.public_address", settings.rooms.publicAddress);
        !r) {
        return SettingsResult::err(r.error());
    }

    int64_t firstPort = settings.rooms.firstPort;
    if (auto r = readOptional(config, "rooms.first_port", firstPort); !r) {
        return SettingsResult::err(r.error());
    }
    int64_t portCount = settings.rooms.portCount;
    if (auto r = readOptional(config, "rooms.port_count", portCount); !r) {
        return SettingsResult::err(r.error());
    }
    if (firstPort < 1 || firstPort > UINT16_MAX) {
        return invalidValue("rooms.first_port", "must be a port number");
    }
    if (portCount < 1 || firstPort + portCount - 1 > UINT16_MAX) {
        return invalidValue("rooms.port_count", "pool must fit in the port range");
    }
    settings.rooms.firstPort = static_cast<uint16_t>(firstPort);
    settings.rooms.portCount = static_cast<uint16_t>(portCount);

    if (auto r = readOptional(config, "rooms.token_secret", settings.rooms.tokenSecret); !r) {
        return SettingsResult::err(r.error());
    }

    int64_t tokenTtl = settings.rooms.tokenTtl.count();
    if (auto r = readOptional(config, "rooms.token_ttl_s", tokenTtl); !r) {
        return SettingsResult::err(r.error());
    }
    if (tokenTtl <= 0) {
        return invalidValue("rooms.token_ttl_s", "must be positive");
    }
    settings.rooms.tokenTtl = std::chrono::seconds(tokenTtl);

    // -- logging / shutdown ---------------------------------------------------

    std::string level(lcs::foundation::logLevelName(settings.logLevel));
    if (auto r = readOptional(config, "logging.level", level); !r) {
        return SettingsResult::err(r.error());
    }
    auto parsed = lcs::foundation::parseLogLevel(level);
    if (!parsed) {
        return invalidValue("logging.level", "unknown level '" + level + "'");
    }
    settings.logLevel = *parsed;

    int64_t drain = settings.drainTimeout.count();
    if (auto r = readOptional(config, "shutdown.drain_timeout_s", drain); !r) {
        return SettingsResult::err(r.error());
    }
    if (drain <= 0) {
        return invalidValue("shutdown.drain_timeout_s", "must be positive");
    }
    settings.drainTimeout = std::chrono::seconds(drain);

    return SettingsResult::ok(std::move(settings));
}

} // namespace lcs::service
