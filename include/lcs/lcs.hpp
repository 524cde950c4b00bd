#pragma once

/// @file lcs.hpp
/// @brief Umbrella header for the lobby coordination service library.

#include "lcs/version.hpp"
#include "lcs/core/result.hpp"

#include "lcs/foundation/config_manager.hpp"
#include "lcs/foundation/error_code.hpp"
#include "lcs/foundation/service_error.hpp"
#include "lcs/foundation/service_logger.hpp"
#include "lcs/foundation/service_result.hpp"
#include "lcs/foundation/types.hpp"

#include "lcs/service/base_lobby.hpp"
#include "lcs/service/lobby_codec.hpp"
#include "lcs/service/lobby_coordinator.hpp"
#include "lcs/service/lobby_presets.hpp"
#include "lcs/service/lobby_protocol.hpp"
#include "lcs/service/lobby_request_dispatcher.hpp"
#include "lcs/service/local_room_provisioner.hpp"
#include "lcs/service/logging_event_sink.hpp"
