#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "lcs/foundation/service_logger.hpp"
#include "mock_logger.hpp"

using namespace lcs::foundation;
using kcenon::common::interfaces::GlobalLoggerRegistry;
using kcenon::common::interfaces::log_level;
using lcs::test::MockLogger;

class ServiceLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto& registry = GlobalLoggerRegistry::instance();
        registry.clear();
        mockLogger_ = std::make_shared<MockLogger>();
        registry.set_default_logger(mockLogger_);
    }

    void TearDown() override {
        GlobalLoggerRegistry::instance().clear();
    }

    std::shared_ptr<MockLogger> mockLogger_;
};

// ===========================================================================
// Names and parsing
// ===========================================================================

TEST(LogCategoryTest, Names) {
    EXPECT_EQ(logCategoryName(LogCategory::Core), "Core");
    EXPECT_EQ(logCategoryName(LogCategory::Coordinator), "Coordinator");
    EXPECT_EQ(logCategoryName(LogCategory::Lobby), "Lobby");
    EXPECT_EQ(logCategoryName(LogCategory::Provisioning), "Provisioning");
    EXPECT_EQ(logCategoryName(static_cast<LogCategory>(42)), "Unknown");
}

TEST(LogLevelTest, ParseIsCaseInsensitive) {
    EXPECT_EQ(parseLogLevel("debug"), LogLevel::Debug);
    EXPECT_EQ(parseLogLevel("INFO"), LogLevel::Info);
    EXPECT_EQ(parseLogLevel("warn"), LogLevel::Warning);
    EXPECT_EQ(parseLogLevel("Off"), LogLevel::Off);
    EXPECT_FALSE(parseLogLevel("loud").has_value());
}

// ===========================================================================
// Level filtering
// ===========================================================================

TEST(ServiceLoggerBasicTest, DefaultCategoryLevels) {
    ServiceLogger logger;
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Core), LogLevel::Info);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Lobby), LogLevel::Debug);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Session), LogLevel::Debug);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Protocol), LogLevel::Info);
}

TEST(ServiceLoggerBasicTest, SetAllCategoryLevels) {
    ServiceLogger logger;
    logger.setAllCategoryLevels(LogLevel::Error);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Warning, LogCategory::Lobby));
    EXPECT_TRUE(logger.isEnabled(LogLevel::Error, LogCategory::Coordinator));
}

TEST(ServiceLoggerBasicTest, InvalidCategoryIsOff) {
    ServiceLogger logger;
    auto invalid = static_cast<LogCategory>(99);
    EXPECT_EQ(logger.getCategoryLevel(invalid), LogLevel::Off);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Critical, invalid));
}

// ===========================================================================
// Output through the kcenon registry
// ===========================================================================

TEST_F(ServiceLoggerTest, PrefixesCategory) {
    ServiceLogger logger;
    logger.log(LogLevel::Info, LogCategory::Coordinator, "Lobby created");

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].level, log_level::info);
    EXPECT_EQ(records[0].message, "[Coordinator] Lobby created");
}

TEST_F(ServiceLoggerTest, FiltersBelowCategoryLevel) {
    ServiceLogger logger;
    logger.log(LogLevel::Debug, LogCategory::Core, "hidden");
    EXPECT_TRUE(mockLogger_->records().empty());
}

TEST_F(ServiceLoggerTest, ContextFieldsAreAppended) {
    ServiceLogger logger;
    LogContext ctx;
    ctx.peerId = PeerId(42);
    ctx.lobbyId = 3;
    ctx.extra["factory"] = "deathmatch";

    logger.logWithContext(LogLevel::Info, LogCategory::Coordinator, "Lobby created", ctx);

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);
    const auto& msg = records[0].message;
    EXPECT_NE(msg.find("[Coordinator] Lobby created {"), std::string::npos);
    EXPECT_NE(msg.find("peer_id=42"), std::string::npos);
    EXPECT_NE(msg.find("lobby_id=3"), std::string::npos);
    EXPECT_NE(msg.find("factory=deathmatch"), std::string::npos);
}

TEST_F(ServiceLoggerTest, EmptyContextOmitsBraces) {
    ServiceLogger logger;
    logger.logWithContext(LogLevel::Info, LogCategory::Core, "No context", LogContext{});

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].message, "[Core] No context");
}

TEST_F(ServiceLoggerTest, NamedCategoryLoggerTakesPrecedence) {
    auto lobbyLogger = std::make_shared<MockLogger>();
    (void)GlobalLoggerRegistry::instance().register_logger("lcs.Lobby", lobbyLogger);

    ServiceLogger logger;
    logger.log(LogLevel::Info, LogCategory::Lobby, "to named");
    logger.log(LogLevel::Info, LogCategory::Core, "to default");

    EXPECT_TRUE(lobbyLogger->contains("to named"));
    EXPECT_FALSE(lobbyLogger->contains("to default"));
    EXPECT_TRUE(mockLogger_->contains("to default"));
}

TEST_F(ServiceLoggerTest, FlushDelegatesToDefaultLogger) {
    ServiceLogger logger;
    EXPECT_TRUE(logger.flush());
    EXPECT_TRUE(mockLogger_->wasFlushed());
}

TEST_F(ServiceLoggerTest, MacroUsesProcessLogger) {
    ServiceLogger::instance().setCategoryLevel(LogCategory::Registry, LogLevel::Debug);
    LCS_LOG_DEBUG(LogCategory::Registry, "macro test");
    EXPECT_TRUE(mockLogger_->contains("[Registry] macro test"));
}
