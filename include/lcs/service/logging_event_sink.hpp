#pragma once

/// @file logging_event_sink.hpp
/// @brief ILobbyEventSink that records lobby notifications in the service log.

#include <atomic>
#include <cstdint>

#include "lcs/service/lobby_events.hpp"

namespace lcs::service {

/// Event sink for deployments without a transport attached.
///
/// Writes one Debug line per delivery under the Lobby log category and
/// counts deliveries.
class LoggingEventSink : public ILobbyEventSink {
public:
    void deliver(PeerId recipient, const LobbyEvent& event) override;

    [[nodiscard]] uint64_t deliveredCount() const noexcept {
        return delivered_.load(std::memory_order_relaxed);
    }

private:
    std::atomic<uint64_t> delivered_{0};
};

}  // namespace lcs::service
