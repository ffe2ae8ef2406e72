// tests/test_utils.cpp
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "gtest/gtest.h"

#include "../src/utils/Utils.hpp"

// Silences std::cerr for the lifetime of the object and keeps what was written
class CerrCapture {
public:
    CerrCapture() : old_(std::cerr.rdbuf(captured_.rdbuf())) {}
    ~CerrCapture() { std::cerr.rdbuf(old_); }
    std::string str() const { return captured_.str(); }

private:
    std::ostringstream captured_;
    std::streambuf* old_;
};

// --- Tests for parseArguments ---

TEST(UtilsTest, ParseArgumentsValidSingle) {
    std::vector<std::string> args = {"key=value"};
    auto result = Utils::parseArguments(args);
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->size(), 1);
    EXPECT_EQ(result->at("key"), "value");
}

TEST(UtilsTest, ParseArgumentsValidMultiple) {
    std::vector<std::string> args = {"demo_max_size=10", "log_level=DEBUG"};
    auto result = Utils::parseArguments(args);
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->size(), 2);
    EXPECT_EQ(result->at("demo_max_size"), "10");
    EXPECT_EQ(result->at("log_level"), "DEBUG");
}

TEST(UtilsTest, ParseArgumentsEmptyInput) {
    std::vector<std::string> args = {};
    auto result = Utils::parseArguments(args);
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->empty());
}

TEST(UtilsTest, ParseArgumentsInvalidNoEquals) {
    CerrCapture capture;
    std::vector<std::string> args = {"keyvalue"};
    EXPECT_FALSE(Utils::parseArguments(args).has_value());
}

TEST(UtilsTest, ParseArgumentsInvalidEmptyKey) {
    CerrCapture capture;
    std::vector<std::string> args = {"=value"};
    EXPECT_FALSE(Utils::parseArguments(args).has_value());
}

TEST(UtilsTest, ParseArgumentsEmptyValue) {
    std::vector<std::string> args = {"key="};
    auto result = Utils::parseArguments(args);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->at("key"), "");
}

TEST(UtilsTest, ParseArgumentsMixedValidInvalid) {
    // Any invalid argument rejects the whole set
    CerrCapture capture;
    std::vector<std::string> args = {"key1=value1", "invalid", "key2=value2"};
    EXPECT_FALSE(Utils::parseArguments(args).has_value());
}

// --- Tests for conversions ---

TEST(UtilsTest, StringToInt) {
    EXPECT_EQ(Utils::stringToInt("42"), 42);
    EXPECT_EQ(Utils::stringToInt("-7"), -7);
    EXPECT_FALSE(Utils::stringToInt("abc").has_value());
    EXPECT_FALSE(Utils::stringToInt("12abc").has_value());
    EXPECT_FALSE(Utils::stringToInt("99999999999999").has_value());
}

TEST(UtilsTest, StringToDouble) {
    EXPECT_DOUBLE_EQ(*Utils::stringToDouble("30000.5"), 30000.5);
    EXPECT_FALSE(Utils::stringToDouble("fast").has_value());
    EXPECT_FALSE(Utils::stringToDouble("1.5x").has_value());
}

TEST(UtilsTest, StringToLogLevel) {
    EXPECT_EQ(Utils::stringToLogLevel("DEBUG"), LogUtils::LogLevel::DEBUG);
    EXPECT_EQ(Utils::stringToLogLevel("INFO"), LogUtils::LogLevel::INFO);
    EXPECT_EQ(Utils::stringToLogLevel("WARNING"), LogUtils::LogLevel::WARN);
    EXPECT_EQ(Utils::stringToLogLevel("CERROR"), LogUtils::LogLevel::CERROR);
    EXPECT_THROW(Utils::stringToLogLevel("VERBOSE"), std::invalid_argument);
}

TEST(UtilsTest, Trim) {
    EXPECT_EQ(Utils::trim("  value \t"), "value");
    EXPECT_EQ(Utils::trim("value"), "value");
    EXPECT_EQ(Utils::trim("   "), "");
}

// --- Tests for loadConfiguration ---

TEST(UtilsTest, LoadConfigurationDefaults) {
    CerrCapture capture;
    AppConfig config = Utils::loadConfiguration({});
    EXPECT_EQ(config.log_level, LogUtils::LogLevel::INFO);
    EXPECT_EQ(config.demo_max_size, 5);
    EXPECT_EQ(config.benchmark_cache_size, 10000);
    EXPECT_EQ(config.benchmark_operations, 50000);
    EXPECT_EQ(config.benchmark_threads, 4);
    EXPECT_DOUBLE_EQ(config.benchmark_target_ops_per_sec, 30000.0);
    EXPECT_TRUE(config.benchmark_report_file.empty());
}

TEST(UtilsTest, LoadConfigurationOverrides) {
    CerrCapture capture;
    std::map<std::string, std::string> args = {
        {"log_level", "DEBUG"},
        {"demo_max_size", "8"},
        {"benchmark_ttl_millis", "0"},
        {"benchmark_target_ops_per_sec", "1000.5"},
        {"benchmark_report_file", "report.json"}
    };
    AppConfig config = Utils::loadConfiguration(args);
    EXPECT_EQ(config.log_level, LogUtils::LogLevel::DEBUG);
    EXPECT_EQ(config.demo_max_size, 8);
    EXPECT_EQ(config.benchmark_ttl_millis, 0);
    EXPECT_DOUBLE_EQ(config.benchmark_target_ops_per_sec, 1000.5);
    EXPECT_EQ(config.benchmark_report_file, "report.json");
}

TEST(UtilsTest, LoadConfigurationInvalidIntegerKeepsDefault) {
    CerrCapture capture;
    AppConfig config = Utils::loadConfiguration({{"demo_max_size", "abc"}});
    EXPECT_EQ(config.demo_max_size, 5);
    EXPECT_NE(capture.str().find("Warning: Invalid positive integer for demo_max_size"), std::string::npos);
}

TEST(UtilsTest, LoadConfigurationNonPositiveSizeKeepsDefault) {
    CerrCapture capture;
    AppConfig config = Utils::loadConfiguration({{"benchmark_cache_size", "0"}, {"benchmark_threads", "-2"}});
    EXPECT_EQ(config.benchmark_cache_size, 10000);
    EXPECT_EQ(config.benchmark_threads, 4);
}

TEST(UtilsTest, LoadConfigurationUnknownKeyWarns) {
    CerrCapture capture;
    AppConfig config = Utils::loadConfiguration({{"frontend_port", "9000"}});
    EXPECT_EQ(config.demo_max_size, 5);
    EXPECT_NE(capture.str().find("Warning: Unknown command-line argument: frontend_port"), std::string::npos);
}

TEST(UtilsTest, LoadConfigurationInvalidLogLevelThrows) {
    CerrCapture capture;
    std::map<std::string, std::string> args = {{"log_level", "LOUD"}};
    EXPECT_THROW(Utils::loadConfiguration(args), std::invalid_argument);
}

TEST(UtilsTest, AppConfigToStringListsKeys) {
    AppConfig config;
    std::string text = config.to_string();
    EXPECT_NE(text.find("demo_max_size: 5"), std::string::npos);
    EXPECT_NE(text.find("benchmark_threads: 4"), std::string::npos);
    EXPECT_NE(text.find("benchmark_report_file: <none>"), std::string::npos);
}
