#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include "lcs/foundation/config_manager.hpp"

using namespace lcs::foundation;

namespace {

constexpr const char* kSampleYaml = R"(
lobby:
  joined_lobbies_limit: 2
  dont_allow_creating_if_joined: false
rooms:
  public_address: 10.1.2.3
  first_port: 8000
logging:
  level: debug
)";

} // namespace

TEST(ConfigManagerTest, FlattensNestedMapsIntoDottedKeys) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString(kSampleYaml));

    EXPECT_TRUE(config.hasKey("lobby.joined_lobbies_limit"));
    EXPECT_TRUE(config.hasKey("rooms.public_address"));
    EXPECT_TRUE(config.hasKey("logging.level"));
    EXPECT_FALSE(config.hasKey("lobby"));
    EXPECT_FALSE(config.hasKey("rooms"));
}

TEST(ConfigManagerTest, TypedGet) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString(kSampleYaml));

    auto limit = config.get<int>("lobby.joined_lobbies_limit");
    ASSERT_TRUE(limit);
    EXPECT_EQ(limit.value(), 2);

    auto flag = config.get<bool>("lobby.dont_allow_creating_if_joined");
    ASSERT_TRUE(flag);
    EXPECT_FALSE(flag.value());

    EXPECT_EQ(config.get<std::string>("rooms.public_address").value(), "10.1.2.3");
}

TEST(ConfigManagerTest, MissingKeyReportsNotFound) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString(kSampleYaml));

    auto missing = config.get<int>("lobby.nope");
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code(), ErrorCode::ConfigKeyNotFound);
    EXPECT_EQ(missing.error().subject(), "lobby.nope");
}

TEST(ConfigManagerTest, WrongTypeReportsMismatch) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString(kSampleYaml));

    auto mistyped = config.get<int>("logging.level");
    ASSERT_FALSE(mistyped);
    EXPECT_EQ(mistyped.error().code(), ErrorCode::ConfigTypeMismatch);
}

TEST(ConfigManagerTest, ReloadReplacesEntries) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString(kSampleYaml));
    ASSERT_TRUE(config.loadFromString("rooms:\n  port_count: 16\n"));

    EXPECT_FALSE(config.hasKey("rooms.first_port"));
    EXPECT_EQ(config.get<int>("rooms.port_count").value(), 16);
}

TEST(ConfigManagerTest, MalformedYamlFailsToLoad) {
    ConfigManager config;
    auto result = config.loadFromString("lobby: [unterminated");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST(ConfigManagerTest, MissingFileFailsToLoad) {
    ConfigManager config;
    auto result = config.load("/nonexistent/lcs/config.yaml");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST(ConfigManagerTest, LoadsFromFile) {
    auto path = std::filesystem::temp_directory_path() / "lcs_config_manager_test.yaml";
    {
        std::ofstream out(path);
        out << kSampleYaml;
    }

    ConfigManager config;
    ASSERT_TRUE(config.load(path));
    EXPECT_EQ(config.get<std::string>("logging.level").value(), "debug");

    std::filesystem::remove(path);
}
