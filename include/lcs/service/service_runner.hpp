#pragma once

/// @file service_runner.hpp
/// @brief Process plumbing for the lobby service entry point.
///
/// Signal handling, configuration file resolution, ordered shutdown hooks
/// and CLI argument parsing.

#include <atomic>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

#include "lcs/foundation/config_manager.hpp"
#include "lcs/foundation/service_result.hpp"

namespace lcs::service {

/// Environment variable that overrides the configuration file path.
inline constexpr const char* kConfigPathEnv = "LCS_CONFIG_PATH";

/// Configuration file used when neither --config nor LCS_CONFIG_PATH is given.
inline constexpr const char* kDefaultConfigPath = "/etc/lcs/config.yaml";

/// Installs SIGINT and SIGTERM handlers and exposes a shutdown flag.
///
/// Only one SignalHandler instance should exist per process. The handler
/// does a relaxed store on a lock-free atomic, which is async-signal-safe.
/// The destructor restores the default handlers.
class SignalHandler {
public:
    SignalHandler();
    ~SignalHandler();

    SignalHandler(const SignalHandler&) = delete;
    SignalHandler& operator=(const SignalHandler&) = delete;

    /// Returns true after SIGINT or SIGTERM is received.
    [[nodiscard]] bool shutdownRequested() const noexcept;

    /// Set the shutdown flag as if a signal had arrived.
    void requestShutdown() noexcept;

    /// Block the calling thread until a shutdown signal arrives.
    void waitForShutdown() const;

private:
    static std::atomic<bool> shutdownFlag_;
    static void handler(int signal);
};

using ShutdownHook = std::function<void()>;

/// Ordered shutdown steps.
///
/// Usage:
/// @code
///   GracefulShutdown shutdown;
///   shutdown.addHook("coordinator", [&]() { coordinator.stop(); });
///   shutdown.addHook("logger", [&]() { (void)logger.flush(); });
///
///   signals.waitForShutdown();
///   shutdown.execute();
/// @endcode
class GracefulShutdown {
public:
    /// Add a named hook. Hooks run in registration order.
    void addHook(std::string name, ShutdownHook hook);

    /// Run every hook once, in order. Later calls do nothing.
    ///
    /// A hook that overruns the drain timeout is logged; the remaining
    /// hooks still run.
    void execute();

    [[nodiscard]] std::size_t hookCount() const;

    [[nodiscard]] bool executed() const noexcept { return executed_; }

    void setDrainTimeout(std::chrono::seconds timeout);

private:
    struct Hook {
        std::string name;
        ShutdownHook callback;
    };
    std::vector<Hook> hooks_;
    std::chrono::seconds drainTimeout_{30};
    bool executed_ = false;
};

/// Load a YAML configuration file into @p config.
///
/// The path is resolved in order:
///   1. LCS_CONFIG_PATH environment variable (if set and non-empty)
///   2. @p defaultPath
///
/// @return Success or ConfigLoadFailed error.
[[nodiscard]] lcs::foundation::ServiceResult<void>
loadConfig(lcs::foundation::ConfigManager& config,
           const std::filesystem::path& defaultPath);

/// Parse `--config <path>` or `--config=<path>` from command-line arguments.
///
/// @return Config file path, or empty path if not specified.
[[nodiscard]] std::filesystem::path
parseConfigArg(int argc, char* argv[]);

} // namespace lcs::service
