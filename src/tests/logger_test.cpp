#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <boost/log/core.hpp>
#include "logger/logger.hpp"

using namespace brightchain::logging;

class LoggerTest : public ::testing::Test {
protected:
    std::filesystem::path log_path;

    void SetUp() override {
        log_path = std::filesystem::temp_directory_path() /
            ("brightchain_logger_test_" + std::to_string(std::chrono::system_clock::now().time_since_epoch().count())
             + ".log");
        init_logging(log_path.string(), severity::trace);
    }

    void TearDown() override {
        boost::log::core::get()->flush();
        boost::log::core::get()->remove_all_sinks();
        std::filesystem::remove(log_path);
    }

    std::string log_content() {
        boost::log::core::get()->flush();
        std::ifstream file(log_path, std::ios::in | std::ios::binary);
        std::stringstream content;
        content << file.rdbuf();
        return content.str();
    }

    bool log_contains(const std::string& text) {
        return log_content().find(text) != std::string::npos;
    }
};

TEST_F(LoggerTest, BasicLogging) {
    BOOST_LOG_TRIVIAL(info) << "Test info message";
    BOOST_LOG_TRIVIAL(error) << "Test error message";

    EXPECT_TRUE(log_contains("Test info message"));
    EXPECT_TRUE(log_contains("Test error message"));
    EXPECT_TRUE(log_contains("[error]"));
}

TEST_F(LoggerTest, ThreadLogging) {
    std::thread t([]() {
        BOOST_LOG_TRIVIAL(info) << "Message from thread";
    });
    t.join();

    EXPECT_TRUE(log_contains("Message from thread"));
}

TEST_F(LoggerTest, SeverityLevels) {
    BOOST_LOG_TRIVIAL(trace) << "Trace message";
    BOOST_LOG_TRIVIAL(debug) << "Debug message";
    BOOST_LOG_TRIVIAL(warning) << "Warning message";
    BOOST_LOG_TRIVIAL(fatal) << "Fatal message";

    EXPECT_TRUE(log_contains("Trace message"));
    EXPECT_TRUE(log_contains("Debug message"));
    EXPECT_TRUE(log_contains("Warning message"));
    EXPECT_TRUE(log_contains("Fatal message"));
}

TEST_F(LoggerTest, LogLevelFiltering) {
    set_log_level(severity::warning);

    BOOST_LOG_TRIVIAL(debug) << "Should not appear";
    BOOST_LOG_TRIVIAL(warning) << "Should appear";

    EXPECT_FALSE(log_contains("Should not appear"));
    EXPECT_TRUE(log_contains("Should appear"));
}

TEST(LoggerSeverityTest, ParsesLevelNames) {
    EXPECT_EQ(parse_severity("trace"), severity::trace);
    EXPECT_EQ(parse_severity("warning"), severity::warning);
    EXPECT_EQ(parse_severity("fatal"), severity::fatal);
    EXPECT_THROW(parse_severity("verbose"), std::invalid_argument);
    EXPECT_THROW(parse_severity(""), std::invalid_argument);
}
