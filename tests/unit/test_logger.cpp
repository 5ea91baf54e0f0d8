/**
 * @file test_logger.cpp
 * @brief Unit tests for the logging framework
 */

#include <gtest/gtest.h>
#include <airvol/utils/logger.hpp>

#include <cerrno>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace airvol::utils;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().setLevel(LogLevel::TRACE);
        Logger::instance().setColorEnabled(false);
        Logger::instance().setStream(&output_);
    }

    void TearDown() override {
        Logger::instance().setStream(nullptr);
        Logger::instance().setColorEnabled(true);
        Logger::instance().setLevel(LogLevel::INFO);
    }

    std::string output() const { return output_.str(); }

    std::ostringstream output_;
};

TEST_F(LoggerTest, SingletonInstance) {
    auto& instance1 = Logger::instance();
    auto& instance2 = Logger::instance();
    EXPECT_EQ(&instance1, &instance2);
}

TEST_F(LoggerTest, LogLevelFiltering) {
    Logger::instance().setLevel(LogLevel::WARN);

    LOG_TRACE("Test", "filtered trace");
    LOG_DEBUG("Test", "filtered debug");
    LOG_INFO("Test", "filtered info");
    LOG_WARN("Test", "visible warn");
    LOG_ERROR("Test", "visible error");

    std::string text = output();
    EXPECT_EQ(text.find("filtered"), std::string::npos);
    EXPECT_NE(text.find("visible warn"), std::string::npos);
    EXPECT_NE(text.find("visible error"), std::string::npos);
}

TEST_F(LoggerTest, OffSilencesEverything) {
    Logger::instance().setLevel(LogLevel::OFF);
    LOG_ERROR("Test", "nothing");
    EXPECT_TRUE(output().empty());
}

TEST_F(LoggerTest, LogLevelNames) {
    EXPECT_STREQ(logLevelToString(LogLevel::TRACE), "TRACE");
    EXPECT_STREQ(logLevelToString(LogLevel::DEBUG), "DEBUG");
    EXPECT_STREQ(logLevelToString(LogLevel::INFO), "INFO ");
    EXPECT_STREQ(logLevelToString(LogLevel::WARN), "WARN ");
    EXPECT_STREQ(logLevelToString(LogLevel::ERROR), "ERROR");
    EXPECT_STREQ(logLevelToString(LogLevel::FATAL), "FATAL");
}

TEST_F(LoggerTest, ComponentTagAndLevelInLine) {
    LOG_INFO("Discovery", "Listening on {}", 4210);

    std::string text = output();
    EXPECT_NE(text.find("[INFO ]"), std::string::npos);
    EXPECT_NE(text.find("[Discovery] Listening on 4210"), std::string::npos);
}

TEST_F(LoggerTest, NoColorCodesWhenDisabled) {
    LOG_WARN("Test", "plain");
    EXPECT_EQ(output().find("\033["), std::string::npos);
}

TEST_F(LoggerTest, ColorCodesWhenEnabled) {
    Logger::instance().setColorEnabled(true);
    LOG_WARN("Test", "colored");
    EXPECT_NE(output().find("\033[33m"), std::string::npos);
}

// =============================================================================
// Formatting
// =============================================================================

TEST_F(LoggerTest, FormatSubstitutesInOrder) {
    EXPECT_EQ(Logger::format("{}:{}", "10.0.0.5", 81), "10.0.0.5:81");
}

TEST_F(LoggerTest, FormatWithoutArguments) {
    EXPECT_EQ(Logger::format("no placeholders"), "no placeholders");
}

TEST_F(LoggerTest, FormatKeepsSurplusPlaceholders) {
    EXPECT_EQ(Logger::format("{} and {}", 1), "1 and {}");
}

TEST_F(LoggerTest, FormatDropsSurplusArguments) {
    EXPECT_EQ(Logger::format("only {}", 1, 2, 3), "only 1");
}

TEST_F(LoggerTest, DescribeErrorIncludesCode) {
    std::string text = describeError(ECONNREFUSED);
    EXPECT_EQ(text.rfind(std::to_string(ECONNREFUSED) + " (", 0), 0u);
    EXPECT_EQ(text.back(), ')');
}

TEST_F(LoggerTest, ThreadSafety) {
    std::vector<std::thread> threads;
    const int num_threads = 10;
    const int logs_per_thread = 100;

    for (int i = 0; i < num_threads; ++i) {
        threads.emplace_back([i, logs_per_thread]() {
            std::string component = "Thread" + std::to_string(i);
            for (int j = 0; j < logs_per_thread; ++j) {
                LOG_INFO(component.c_str(), "Message {}", j);
            }
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    std::string text = output();
    size_t lines = 0;
    for (char c : text) {
        if (c == '\n') ++lines;
    }
    EXPECT_EQ(lines, static_cast<size_t>(num_threads * logs_per_thread));
}
