/// @file main.cpp
/// @brief Lobby coordination service entry point.
///
/// Loads the configuration, registers the preset lobby factories and runs
/// the coordinator until SIGINT or SIGTERM.

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include "lcs/foundation/config_manager.hpp"
#include "lcs/foundation/service_logger.hpp"
#include "lcs/service/lobby_coordinator.hpp"
#include "lcs/service/lobby_presets.hpp"
#include "lcs/service/lobby_request_dispatcher.hpp"
#include "lcs/service/lobby_service_settings.hpp"
#include "lcs/service/local_room_provisioner.hpp"
#include "lcs/service/logging_event_sink.hpp"
#include "lcs/service/service_runner.hpp"
#include "lcs/version.hpp"

int main(int argc, char* argv[]) {
    using lcs::foundation::LogCategory;

    lcs::service::SignalHandler signals;

    auto configPath = lcs::service::parseConfigArg(argc, argv);
    if (configPath.empty()) {
        configPath = lcs::service::kDefaultConfigPath;
    }

    lcs::foundation::ConfigManager config;
    auto loadResult = lcs::service::loadConfig(config, configPath);
    if (!loadResult) {
        std::cerr << "Failed to load config: "
                  << loadResult.error().message() << "\n";
        return EXIT_FAILURE;
    }

    auto settingsResult = lcs::service::loadLobbyServiceSettings(config);
    if (!settingsResult) {
        std::cerr << "Invalid config: "
                  << settingsResult.error().message() << "\n";
        return EXIT_FAILURE;
    }
    const auto& settings = settingsResult.value();

    auto& logger = lcs::foundation::ServiceLogger::instance();
    logger.setAllCategoryLevels(settings.logLevel);

    auto sink = std::make_shared<lcs::service::LoggingEventSink>();
    auto rooms = std::make_shared<lcs::service::LocalRoomProvisioner>(settings.rooms);

    lcs::service::LobbyCoordinator coordinator(settings.coordinator);
    if (settings.registerPresets) {
        lcs::service::LobbyPresetOptions presets;
        presets.eventSink = sink;
        presets.provisioner = rooms;
        presets.startTimeout = settings.startTimeout;
        for (auto& [factoryId, factory] : lcs::service::defaultLobbyFactories(presets)) {
            coordinator.registerFactory(factoryId, std::move(factory));
        }
    }

    auto startResult = coordinator.start();
    if (!startResult) {
        std::cerr << "Failed to start lobby coordinator: "
                  << startResult.error().message() << "\n";
        return EXIT_FAILURE;
    }

    lcs::service::LobbyRequestDispatcher dispatcher(coordinator);

    lcs::service::GracefulShutdown shutdown;
    shutdown.setDrainTimeout(settings.drainTimeout);
    shutdown.addHook("coordinator", [&]() { coordinator.stop(); });
    shutdown.addHook("logger", [&]() {
        auto flushed = logger.flush();
        if (!flushed) {
            std::cerr << "Failed to flush logs: " << flushed.error().message() << "\n";
        }
    });

    LCS_LOG_INFO(LogCategory::Core,
                 std::string(lcs::Version::serviceName) + " " + lcs::Version::string +
                     " started (rooms: " +
                     settings.rooms.publicAddress + ":" +
                     std::to_string(settings.rooms.firstPort) + "+" +
                     std::to_string(settings.rooms.portCount) + ")");
    std::cout << "Lobby service started (joined_lobbies_limit: "
              << settings.coordinator.joinedLobbiesLimit
              << ", first_room_port: " << settings.rooms.firstPort << ")\n";

    signals.waitForShutdown();

    std::cout << "Shutting down lobby service...\n";
    auto stats = coordinator.stats();
    LCS_LOG_INFO(LogCategory::Core,
                 "Shutting down: " + std::to_string(stats.activeLobbies) + " active lobbies, " +
                     std::to_string(stats.lobbiesCreated) + " created, " +
                     std::to_string(stats.gamesStarted) + " games started, " +
                     std::to_string(sink->deliveredCount()) + " events delivered");
    shutdown.execute();
    std::cout << "Lobby service stopped\n";
    return EXIT_SUCCESS;
}
