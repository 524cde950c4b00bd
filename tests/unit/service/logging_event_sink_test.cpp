#include <gtest/gtest.h>

#include <memory>

#include "lcs/foundation/service_logger.hpp"
#include "lcs/service/logging_event_sink.hpp"
#include "mock_logger.hpp"

using namespace lcs::service;
using kcenon::common::interfaces::GlobalLoggerRegistry;
using lcs::foundation::LogCategory;
using lcs::foundation::LogLevel;
using lcs::foundation::ServiceLogger;
using lcs::test::MockLogger;

class LoggingEventSinkTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto& registry = GlobalLoggerRegistry::instance();
        registry.clear();
        mockLogger_ = std::make_shared<MockLogger>();
        registry.set_default_logger(mockLogger_);
        ServiceLogger::instance().setCategoryLevel(LogCategory::Lobby, LogLevel::Debug);
    }

    void TearDown() override {
        GlobalLoggerRegistry::instance().clear();
    }

    std::shared_ptr<MockLogger> mockLogger_;
};

TEST_F(LoggingEventSinkTest, LogsEachDelivery) {
    LoggingEventSink sink;

    LobbyEvent event;
    event.type = LobbyEventType::ChatMessage;
    event.lobbyId = 4;
    event.subject = PeerId(7);
    event.key = "alice";
    event.value = "gl hf";

    sink.deliver(PeerId(9), event);

    EXPECT_EQ(sink.deliveredCount(), 1u);
    EXPECT_TRUE(mockLogger_->contains("[Lobby] Lobby event ChatMessage"));
    EXPECT_TRUE(mockLogger_->contains("peer_id=9"));
    EXPECT_TRUE(mockLogger_->contains("lobby_id=4"));
    EXPECT_TRUE(mockLogger_->contains("subject=7"));
    EXPECT_TRUE(mockLogger_->contains("value=gl hf"));
}

TEST_F(LoggingEventSinkTest, CountsDeliveriesEvenWhenFiltered) {
    ServiceLogger::instance().setCategoryLevel(LogCategory::Lobby, LogLevel::Info);
    LoggingEventSink sink;

    LobbyEvent event;
    event.type = LobbyEventType::LobbyDestroyed;
    sink.deliver(PeerId(1), event);
    sink.deliver(PeerId(2), event);

    EXPECT_EQ(sink.deliveredCount(), 2u);
    EXPECT_TRUE(mockLogger_->records().empty());
}
