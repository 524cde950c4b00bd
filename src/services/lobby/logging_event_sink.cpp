/// @file logging_event_sink.cpp
/// @brief LoggingEventSink implementation.

#include "lcs/service/logging_event_sink.hpp"

#include <string>

#include "lcs/foundation/service_logger.hpp"

namespace lcs::service {

using lcs::foundation::LogCategory;
using lcs::foundation::LogContext;
using lcs::foundation::LogLevel;

void LoggingEventSink::deliver(PeerId recipient, const LobbyEvent& event) {
    delivered_.fetch_add(1, std::memory_order_relaxed);

    LogContext ctx;
    ctx.peerId = recipient;
    ctx.lobbyId = event.lobbyId;
    if (event.subject.isValid()) {
        ctx.extra["subject"] = std::to_string(event.subject.value());
    }
    if (!event.key.empty()) {
        ctx.extra["key"] = event.key;
    }
    if (!event.value.empty()) {
        ctx.extra["value"] = event.value;
    }

    LCS_LOG_CTX(LogLevel::Debug, LogCategory::Lobby,
                std::string("Lobby event ") + std::string(lobbyEventTypeName(event.type)), ctx);
}

}  // namespace lcs::service
