#include <gtest/gtest.h>
#include "logger.h"
#include "fs.h"
#include <string>

using namespace rtcdrop;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        delete_file("test_logger.log");
        previous_level_ = Logger::getInstance().get_log_level();
    }

    void TearDown() override {
        Logger::getInstance().set_log_file("");
        Logger::getInstance().set_log_level(previous_level_);
        delete_file("test_logger.log");
    }

    LogLevel previous_level_;
};

TEST_F(LoggerTest, LevelFromStringTest) {
    EXPECT_EQ(log_level_from_string("DEBUG"), LogLevel::DEBUG);
    EXPECT_EQ(log_level_from_string("debug"), LogLevel::DEBUG);
    EXPECT_EQ(log_level_from_string("Info"), LogLevel::INFO);
    EXPECT_EQ(log_level_from_string("warn"), LogLevel::WARN);
    EXPECT_EQ(log_level_from_string("WARNING"), LogLevel::WARN);
    EXPECT_EQ(log_level_from_string("error"), LogLevel::ERROR);
    EXPECT_EQ(log_level_from_string("verbose"), LogLevel::INFO);
    EXPECT_EQ(log_level_from_string(""), LogLevel::INFO);
}

TEST_F(LoggerTest, LevelToStringTest) {
    EXPECT_EQ(log_level_to_string(LogLevel::DEBUG), "DEBUG");
    EXPECT_EQ(log_level_to_string(LogLevel::INFO), "INFO");
    EXPECT_EQ(log_level_to_string(LogLevel::WARN), "WARN");
    EXPECT_EQ(log_level_to_string(LogLevel::ERROR), "ERROR");
}

TEST_F(LoggerTest, LogFileTest) {
    Logger& logger = Logger::getInstance();
    logger.set_log_level(LogLevel::INFO);
    ASSERT_TRUE(logger.set_log_file("test_logger.log"));

    LOG_INFO("test", "transfer of " << 3 << " chunks complete");
    LOG_DEBUG("test", "filtered out");
    LOG_WARN("test", "peer timed out");
    ASSERT_TRUE(logger.set_log_file(""));

    std::string contents = read_file_text_cpp("test_logger.log");
    EXPECT_NE(contents.find("[INFO ] [test] transfer of 3 chunks complete"), std::string::npos);
    EXPECT_NE(contents.find("[WARN ] [test] peer timed out"), std::string::npos);
    EXPECT_EQ(contents.find("filtered out"), std::string::npos);
    // No color escapes in the file
    EXPECT_EQ(contents.find('\x1b'), std::string::npos);
}

TEST_F(LoggerTest, LogFileOpenFailureTest) {
    EXPECT_FALSE(Logger::getInstance().set_log_file("no_such_directory/test.log"));
}

TEST_F(LoggerTest, LogLevelTest) {
    Logger& logger = Logger::getInstance();
    logger.set_log_level(LogLevel::WARN);
    EXPECT_EQ(logger.get_log_level(), LogLevel::WARN);
    logger.set_log_level(LogLevel::DEBUG);
    EXPECT_EQ(logger.get_log_level(), LogLevel::DEBUG);
}
