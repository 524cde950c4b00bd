#include <gtest/gtest.h>

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <string>
#include <thread>
#include <vector>

#include "lcs/foundation/config_manager.hpp"
#include "lcs/service/service_runner.hpp"

using namespace lcs::service;
using lcs::foundation::ConfigManager;
using lcs::foundation::ErrorCode;

// ===========================================================================
// Helper: RAII temp directory
// ===========================================================================

class TempDir {
public:
    TempDir() {
        auto now = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = std::filesystem::temp_directory_path() /
                ("lcs_test_" + std::to_string(now));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

    std::filesystem::path write(const std::string& name, const std::string& content) const {
        auto file = path_ / name;
        std::ofstream out(file);
        out << content;
        return file;
    }

private:
    std::filesystem::path path_;
};

/// Builds a mutable argv for parseConfigArg().
class Args {
public:
    Args(std::initializer_list<std::string> args) : storage_(args) {
        for (auto& arg : storage_) {
            pointers_.push_back(arg.data());
        }
        pointers_.push_back(nullptr);
    }

    int argc() const { return static_cast<int>(storage_.size()); }
    char** argv() { return pointers_.data(); }

private:
    std::vector<std::string> storage_;
    std::vector<char*> pointers_;
};

// ===========================================================================
// parseConfigArg
// ===========================================================================

TEST(ParseConfigArgTest, SeparateValue) {
    Args args{"lcs_lobby_service", "--config", "/tmp/lobby.yaml"};
    EXPECT_EQ(parseConfigArg(args.argc(), args.argv()).string(), "/tmp/lobby.yaml");
}

TEST(ParseConfigArgTest, EqualsForm) {
    Args args{"lcs_lobby_service", "--verbose", "--config=/srv/lobby.yaml"};
    EXPECT_EQ(parseConfigArg(args.argc(), args.argv()).string(), "/srv/lobby.yaml");
}

TEST(ParseConfigArgTest, MissingFlagOrValueGivesEmptyPath) {
    Args none{"lcs_lobby_service"};
    EXPECT_TRUE(parseConfigArg(none.argc(), none.argv()).empty());

    Args dangling{"lcs_lobby_service", "--config"};
    EXPECT_TRUE(parseConfigArg(dangling.argc(), dangling.argv()).empty());
}

// ===========================================================================
// loadConfig
// ===========================================================================

class LoadConfigTest : public ::testing::Test {
protected:
    void SetUp() override { ::unsetenv(kConfigPathEnv); }
    void TearDown() override { ::unsetenv(kConfigPathEnv); }

    TempDir dir_;
};

TEST_F(LoadConfigTest, LoadsDefaultPath) {
    auto file = dir_.write("default.yaml", "lobby:\n  joined_lobbies_limit: 3\n");

    ConfigManager config;
    ASSERT_TRUE(loadConfig(config, file));
    EXPECT_EQ(config.get<int>("lobby.joined_lobbies_limit").value(), 3);
}

TEST_F(LoadConfigTest, EnvironmentOverridesDefaultPath) {
    auto fallback = dir_.write("default.yaml", "lobby:\n  joined_lobbies_limit: 3\n");
    auto preferred = dir_.write("env.yaml", "lobby:\n  joined_lobbies_limit: 7\n");
    ::setenv(kConfigPathEnv, preferred.c_str(), 1);

    ConfigManager config;
    ASSERT_TRUE(loadConfig(config, fallback));
    EXPECT_EQ(config.get<int>("lobby.joined_lobbies_limit").value(), 7);
}

TEST_F(LoadConfigTest, EmptyEnvironmentIsIgnored) {
    auto fallback = dir_.write("default.yaml", "logging:\n  level: debug\n");
    ::setenv(kConfigPathEnv, "", 1);

    ConfigManager config;
    ASSERT_TRUE(loadConfig(config, fallback));
    EXPECT_TRUE(config.hasKey("logging.level"));
}

TEST_F(LoadConfigTest, MissingFileFails) {
    ConfigManager config;
    auto result = loadConfig(config, dir_.path() / "absent.yaml");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}

// ===========================================================================
// GracefulShutdown
// ===========================================================================

TEST(GracefulShutdownTest, RunsHooksInRegistrationOrder) {
    std::vector<std::string> order;
    GracefulShutdown shutdown;
    shutdown.addHook("coordinator", [&]() { order.push_back("coordinator"); });
    shutdown.addHook("provisioner", [&]() { order.push_back("provisioner"); });
    shutdown.addHook("logger", [&]() { order.push_back("logger"); });
    EXPECT_EQ(shutdown.hookCount(), 3u);

    shutdown.execute();

    ASSERT_EQ(order.size(), 3u);
    EXPECT_EQ(order[0], "coordinator");
    EXPECT_EQ(order[1], "provisioner");
    EXPECT_EQ(order[2], "logger");
    EXPECT_TRUE(shutdown.executed());
}

TEST(GracefulShutdownTest, ExecutesOnlyOnce) {
    int calls = 0;
    GracefulShutdown shutdown;
    shutdown.addHook("count", [&]() { ++calls; });

    shutdown.execute();
    shutdown.execute();
    EXPECT_EQ(calls, 1);
}

TEST(GracefulShutdownTest, EmptyHookIsSkipped) {
    int calls = 0;
    GracefulShutdown shutdown;
    shutdown.addHook("empty", ShutdownHook{});
    shutdown.addHook("count", [&]() { ++calls; });

    shutdown.execute();
    EXPECT_EQ(calls, 1);
}

TEST(GracefulShutdownTest, OverrunningHookDoesNotStopLaterHooks) {
    bool lateHookRan = false;
    GracefulShutdown shutdown;
    shutdown.setDrainTimeout(std::chrono::seconds(0));
    shutdown.addHook("slow", []() { std::this_thread::sleep_for(std::chrono::milliseconds(5)); });
    shutdown.addHook("late", [&]() { lateHookRan = true; });

    shutdown.execute();
    EXPECT_TRUE(lateHookRan);
}

// ===========================================================================
// SignalHandler
// ===========================================================================

TEST(SignalHandlerTest, StartsClear) {
    SignalHandler signals;
    EXPECT_FALSE(signals.shutdownRequested());
}

TEST(SignalHandlerTest, RequestShutdownSetsFlag) {
    SignalHandler signals;
    signals.requestShutdown();
    EXPECT_TRUE(signals.shutdownRequested());
    signals.waitForShutdown();
}

TEST(SignalHandlerTest, SigtermSetsFlag) {
    SignalHandler signals;
    ASSERT_EQ(std::raise(SIGTERM), 0);
    EXPECT_TRUE(signals.shutdownRequested());
}

TEST(SignalHandlerTest, WaitReturnsAfterSignalFromAnotherThread) {
    SignalHandler signals;
    std::thread sender([]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        std::raise(SIGINT);
    });

    signals.waitForShutdown();
    sender.join();
    EXPECT_TRUE(signals.shutdownRequested());
}
