#include <gtest/gtest.h>
#include <fstream>
#include <sstream>
#include <string>
#include <filesystem>
#include <boost/log/core.hpp>
#include "logger/logger.hpp"

using namespace cirrus::logging;

class LoggerTest : public ::testing::Test {
protected:
    std::filesystem::path log_path = std::filesystem::temp_directory_path() / "cirrus-logger-test.log";

    void SetUp() override {
        std::filesystem::remove(log_path);
        init_logging(log_path.string(), severity_level::trace);
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
};

// Test that records land in the file with their severity
TEST_F(LoggerTest, WritesToFile) {
    BOOST_LOG_TRIVIAL(info) << "Test: hello from the logger";
    BOOST_LOG_TRIVIAL(error) << "Test: something failed";

    auto content = log_content();
    EXPECT_NE(content.find("Logger: Logging initialized"), std::string::npos);
    EXPECT_NE(content.find("[info] Test: hello from the logger"), std::string::npos);
    EXPECT_NE(content.find("[error] Test: something failed"), std::string::npos);
}

// Test filtering by level
TEST_F(LoggerTest, FiltersBelowLevel) {
    set_log_level(severity_level::warning);
    BOOST_LOG_TRIVIAL(debug) << "Test: hidden debug";
    BOOST_LOG_TRIVIAL(warning) << "Test: visible warning";

    auto content = log_content();
    EXPECT_EQ(content.find("Test: hidden debug"), std::string::npos);
    EXPECT_NE(content.find("Test: visible warning"), std::string::npos);
}

// Test level names
TEST_F(LoggerTest, ParsesSeverity) {
    EXPECT_EQ(parse_severity("trace"), severity_level::trace);
    EXPECT_EQ(parse_severity("warning"), severity_level::warning);
    EXPECT_EQ(parse_severity("fatal"), severity_level::fatal);
    EXPECT_THROW(parse_severity("loud"), std::invalid_argument);
}
