// tests/test_consolelogger.cpp
#include <iostream>
#include <sstream>
#include <string>

#include "gtest/gtest.h"

#include "../src/logging/ConsoleLogger.hpp"

// No other test in this binary creates the ConsoleLogger, so this level sticks
static const LogUtils::LogLevel kTestLevel = LogUtils::LogLevel::WARN;

class ConsoleLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        old_cout_ = std::cout.rdbuf(cout_.rdbuf());
        old_cerr_ = std::cerr.rdbuf(cerr_.rdbuf());
        logger_ = ConsoleLogger::getInstance(kTestLevel);
    }

    void TearDown() override {
        std::cout.rdbuf(old_cout_);
        std::cerr.rdbuf(old_cerr_);
    }

    std::ostringstream cout_;
    std::ostringstream cerr_;
    std::streambuf* old_cout_ = nullptr;
    std::streambuf* old_cerr_ = nullptr;
    std::shared_ptr<ConsoleLogger> logger_;
};

TEST_F(ConsoleLoggerTest, ReturnsSameInstance) {
    EXPECT_EQ(ConsoleLogger::getInstance(LogUtils::LogLevel::DEBUG), logger_);
    EXPECT_EQ(logger_->getLogLevel(), static_cast<int>(kTestLevel));
}

TEST_F(ConsoleLoggerTest, DropsMessagesBelowLevel) {
    logger_->debug("debug line");
    logger_->info("info line");
    EXPECT_EQ(cout_.str(), "");
    EXPECT_EQ(cerr_.str(), "");
}

TEST_F(ConsoleLoggerTest, WarnGoesToStdoutWithPrefix) {
    logger_->warn("cache nearly full");
    EXPECT_EQ(cout_.str(), "[Warning] cache nearly full\n");
    EXPECT_EQ(cerr_.str(), "");
}

TEST_F(ConsoleLoggerTest, ErrorGoesToStderrWithPrefix) {
    logger_->error("max_size must be positive");
    EXPECT_EQ(cout_.str(), "");
    EXPECT_EQ(cerr_.str(), "[Error] max_size must be positive\n");
}

TEST_F(ConsoleLoggerTest, SetupIsAlwaysPrinted) {
    logger_->setup("Configuration loaded.");
    EXPECT_EQ(cout_.str(), "[Setup] Configuration loaded.\n");
}
