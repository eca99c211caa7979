#include "logging/logger.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>

#include "mocks/mock_log_sink.hpp"

using namespace qode::logging;
using qode::tests::MockLogSink;
using ::testing::_;
using ::testing::StrictMock;

TEST(LoggerTest, MacroFormatsStreamExpression) {
    auto sink = std::make_shared<StrictMock<MockLogSink>>();
    Logger log(sink, Channel::CLIENT);

    EXPECT_CALL(*sink, write(Channel::CLIENT, Level::LVL_WARN, _, _, "attempt 3 of 100"));
    LOG_WARN(log, "attempt " << 3 << " of " << 100);
}

TEST(LoggerTest, ChannelIsBoundPerLogger) {
    auto sink = std::make_shared<StrictMock<MockLogSink>>();
    Logger client(sink, Channel::CLIENT);
    Logger server(sink, Channel::SERVER);

    EXPECT_CALL(*sink, write(Channel::CLIENT, Level::LVL_DEBUG, _, _, "from client"));
    EXPECT_CALL(*sink, write(Channel::SERVER, Level::LVL_ERROR, _, _, "from worker"));
    LOG_DEBUG(client, "from client");
    LOG_ERROR(server, "from worker");
}

TEST(LoggerTest, LoggerWithoutSinkDiscards) {
    Logger log;
    EXPECT_FALSE(log.has_sink());
    LOG_ERROR(log, "nowhere");
}

TEST(LoggerTest, ChannelNames) {
    EXPECT_STREQ(channel_name(Channel::CLIENT), "qode-client");
    EXPECT_STREQ(channel_name(Channel::SERVER), "qode-server");
}

TEST(LoggerTest, StringToLevel) {
    EXPECT_EQ(string_to_level("debug"), Level::LVL_DEBUG);
    EXPECT_EQ(string_to_level("INFO"), Level::LVL_INFO);
    EXPECT_EQ(string_to_level("Warn"), Level::LVL_WARN);
    EXPECT_EQ(string_to_level("error"), Level::LVL_ERROR);
    EXPECT_EQ(string_to_level("none"), Level::LVL_NONE);
    EXPECT_EQ(string_to_level("verbose"), Level::LVL_INFO);
    EXPECT_EQ(string_to_level("d\xc3\xa9" "bug"), Level::LVL_INFO);  // non-ASCII bytes
}

TEST(LoggerTest, StderrSinkThreshold) {
    StderrSink sink(Level::LVL_WARN);
    EXPECT_EQ(sink.level(), Level::LVL_WARN);

    testing::internal::CaptureStderr();
    sink.write(Channel::CLIENT, Level::LVL_INFO, __FILE__, __LINE__, "hidden");
    sink.write(Channel::SERVER, Level::LVL_ERROR, __FILE__, __LINE__, "shown");
    std::string output = testing::internal::GetCapturedStderr();

    EXPECT_EQ(output.find("hidden"), std::string::npos);
    EXPECT_NE(output.find("[ERROR] [qode-server] shown"), std::string::npos);

    sink.set_level(Level::LVL_DEBUG);
    EXPECT_EQ(sink.level(), Level::LVL_DEBUG);
}
