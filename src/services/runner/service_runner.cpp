/// @file service_runner.cpp
/// @brief Implementation of the entry-point plumbing.

#include "lcs/service/service_runner.hpp"

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <string_view>
#include <thread>

#include "lcs/foundation/service_logger.hpp"

namespace lcs::service {

using lcs::foundation::LogCategory;

// -- SignalHandler -----------------------------------------------------------

std::atomic<bool> SignalHandler::shutdownFlag_{false};

void SignalHandler::handler(int /*signal*/) {
    shutdownFlag_.store(true, std::memory_order_relaxed);
}

SignalHandler::SignalHandler() {
    shutdownFlag_.store(false, std::memory_order_relaxed);
    std::signal(SIGINT, &SignalHandler::handler);
    std::signal(SIGTERM, &SignalHandler::handler);
}

SignalHandler::~SignalHandler() {
#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wold-style-cast"
#endif
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic pop
#endif
}

bool SignalHandler::shutdownRequested() const noexcept {
    return shutdownFlag_.load(std::memory_order_relaxed);
}

void SignalHandler::requestShutdown() noexcept {
    shutdownFlag_.store(true, std::memory_order_relaxed);
}

void SignalHandler::waitForShutdown() const {
    using namespace std::chrono_literals;
    while (!shutdownFlag_.load(std::memory_order_relaxed)) {
        std::this_thread::sleep_for(100ms);
    }
}

// -- GracefulShutdown --------------------------------------------------------

void GracefulShutdown::addHook(std::string name, ShutdownHook hook) {
    hooks_.push_back(Hook{std::move(name), std::move(hook)});
}

void GracefulShutdown::execute() {
    if (executed_) {
        return;
    }
    executed_ = true;

    const auto deadline = std::chrono::steady_clock::now() + drainTimeout_;
    for (auto& hook : hooks_) {
        if (!hook.callback) {
            continue;
        }
        LCS_LOG_DEBUG(LogCategory::Core, "Shutdown hook: " + hook.name);
        hook.callback();
        if (std::chrono::steady_clock::now() > deadline) {
            LCS_LOG_WARN(LogCategory::Core,
                         "Shutdown drain timeout exceeded after hook: " + hook.name);
        }
    }
}

std::size_t GracefulShutdown::hookCount() const {
    return hooks_.size();
}

void GracefulShutdown::setDrainTimeout(std::chrono::seconds timeout) {
    drainTimeout_ = timeout;
}

// -- Config loading ----------------------------------------------------------

lcs::foundation::ServiceResult<void>
loadConfig(lcs::foundation::ConfigManager& config,
           const std::filesystem::path& defaultPath) {
    std::filesystem::path configPath = defaultPath;

    const char* envPath = std::getenv(kConfigPathEnv);
    if (envPath != nullptr && *envPath != '\0') {
        configPath = envPath;
    }

    LCS_LOG_INFO(LogCategory::Config, "Loading configuration from " + configPath.string());
    return config.load(configPath);
}

// -- CLI argument parsing ----------------------------------------------------

std::filesystem::path parseConfigArg(int argc, char* argv[]) {
    constexpr std::string_view kFlag = "--config";
    constexpr std::string_view kFlagEq = "--config=";

    for (int i = 1; i < argc; ++i) {
        std::string_view arg(argv[i]);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        if (arg.starts_with(kFlagEq)) {
            return std::filesystem::path(std::string(arg.substr(kFlagEq.size())));
        }
        if (arg == kFlag && i + 1 < argc) {
            return argv[i + 1];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        }
    }
    return {};
}

} // namespace lcs::service
