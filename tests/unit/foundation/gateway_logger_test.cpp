/// @file gateway_logger_test.cpp
/// @brief Unit tests for GatewayLogger over a mock kcenon logger.

#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "pgw/foundation/gateway_logger.hpp"
#include "support/mock_logger.hpp"

using namespace pgw::foundation;
using kcenon::common::interfaces::GlobalLoggerRegistry;
using kcenon::common::interfaces::log_level;
using pgw::testing::MockLogger;

class GatewayLoggerTest : public ::testing::Test {
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

TEST(LogCategoryTest, NamesAndCount) {
    EXPECT_EQ(kLogCategoryCount, 8u);
    EXPECT_EQ(logCategoryName(LogCategory::Gateway), "Gateway");
    EXPECT_EQ(logCategoryName(LogCategory::Circuit), "Circuit");
    EXPECT_EQ(logLevelName(LogLevel::Warning), "WARNING");
}

TEST(GatewayLoggerBasicTest, DefaultCategoryLevels) {
    GatewayLogger logger;
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Gateway), LogLevel::Info);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Mode), LogLevel::Info);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Store), LogLevel::Warning);
    EXPECT_FALSE(logger.jsonOutput());
}

TEST_F(GatewayLoggerTest, ForwardsWithCategoryPrefix) {
    GatewayLogger logger;
    logger.log(LogLevel::Info, LogCategory::Budget, "spent 7");

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].level, log_level::info);
    EXPECT_EQ(records[0].message, "[Budget] spent 7");
}

TEST_F(GatewayLoggerTest, FiltersBelowCategoryLevel) {
    GatewayLogger logger;
    logger.log(LogLevel::Info, LogCategory::Store, "dropped");
    logger.log(LogLevel::Debug, LogCategory::Gateway, "dropped too");
    EXPECT_TRUE(mockLogger_->records().empty());

    logger.setCategoryLevel(LogCategory::Store, LogLevel::Debug);
    logger.log(LogLevel::Info, LogCategory::Store, "kept");
    EXPECT_EQ(mockLogger_->records().size(), 1u);
}

TEST_F(GatewayLoggerTest, ContextAppendedAsPairs) {
    GatewayLogger logger;
    LogContext ctx;
    ctx.requestId = "r-1";
    ctx.endpointClass = "photos";
    logger.logWithContext(LogLevel::Warning, LogCategory::Gateway, "refused", ctx);

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].message,
              "[Gateway] refused {request_id=r-1, endpoint_class=photos}");
}

TEST_F(GatewayLoggerTest, JsonOutputUsesFormatter) {
    GatewayLogger logger;
    logger.setJsonOutput(true);
    LogContext ctx;
    ctx.requestId = "r-2";
    logger.logWithContext(LogLevel::Error, LogCategory::Provider, "resolution failed", ctx);

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].message.front(), '{');
    EXPECT_NE(records[0].message.find("\"correlation_id\":\"r-2\""), std::string::npos);
    EXPECT_NE(records[0].message.find("\"category\":\"Provider\""), std::string::npos);
}

TEST_F(GatewayLoggerTest, FlushReachesDefaultLogger) {
    GatewayLogger logger;
    ASSERT_TRUE(logger.flush());
    EXPECT_TRUE(mockLogger_->wasFlushed());
}

TEST_F(GatewayLoggerTest, MacrosUseProcessLogger) {
    PGW_LOG_WARN(LogCategory::Signing, "invalid media signature");
    EXPECT_TRUE(mockLogger_->contains("[Signing] invalid media signature"));
}
