#pragma once

/// @file lobby_service_settings.hpp
/// @brief Typed view of the lobby service configuration file.
///
/// Recognized keys (all optional):
/// @code
///   lobby:
///     create_permission_level: 0
///     dont_allow_creating_if_joined: true
///     joined_lobbies_limit: 1
///     start_timeout_ms: 10000
///     register_presets: true
///   rooms:
///     public_address: 127.0.0.1
///     first_port: 7777
///     port_count: 100
///     token_secret: ""
///     token_ttl_s: 300
///   logging:
///     level: info
///   shutdown:
///     drain_timeout_s: 30
/// @endcode

#include <chrono>

#include "lcs/foundation/config_manager.hpp"
#include "lcs/foundation/service_logger.hpp"
#include "lcs/foundation/service_result.hpp"
#include "lcs/service/local_room_provisioner.hpp"
#include "lcs/service/lobby_types.hpp"

namespace lcs::service {

struct LobbyServiceSettings {
    LobbyCoordinatorConfig coordinator;
    LocalRoomConfig rooms;
    std::chrono::milliseconds startTimeout{10000};
    bool registerPresets = true;
    lcs::foundation::LogLevel logLevel = lcs::foundation::LogLevel::Info;
    std::chrono::seconds drainTimeout{30};
};

/// Read every recognized key, keeping defaults for absent ones.
///
/// @return ConfigTypeMismatch for a value of the wrong type, or
///         ConfigInvalidValue for an out-of-range value.
[[nodiscard]] lcs::foundation::ServiceResult<LobbyServiceSettings>
loadLobbyServiceSettings(const lcs::foundation::ConfigManager& config);

} // namespace lcs::service
