#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <boost/log/core.hpp>
#include "core/error.hpp"
#include "logger/logger.hpp"
#include "test_utils.hpp"

using namespace pasteall::logging;

class LoggerTest : public ::testing::Test {
protected:
    std::filesystem::path log_dir;
    std::filesystem::path log_file;

    void SetUp() override {
        log_dir = pasteall::test::make_temp_dir("logger_test");
        log_file = log_dir / "pasteall.log";
        init_logging(boost::log::trivial::info, log_file.string());
    }

    void TearDown() override {
        // Back to the console only setup the other tests use
        pasteall::test::init_logging();
        std::filesystem::remove_all(log_dir);
    }

    std::string log_contents() {
        boost::log::core::get()->flush();
        std::ifstream file(log_file);
        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }
};

TEST_F(LoggerTest, WritesToFile) {
    BOOST_LOG_TRIVIAL(info) << "Test: file sink message";
    BOOST_LOG_TRIVIAL(error) << "Test: error message";

    const auto contents = log_contents();
    EXPECT_NE(contents.find("Test: file sink message"), std::string::npos);
    EXPECT_NE(contents.find("Test: error message"), std::string::npos);
    EXPECT_NE(contents.find("[error]"), std::string::npos);
}

TEST_F(LoggerTest, FiltersBelowMinimumLevel) {
    BOOST_LOG_TRIVIAL(debug) << "Test: hidden debug message";
    BOOST_LOG_TRIVIAL(warning) << "Test: visible warning";

    const auto contents = log_contents();
    EXPECT_EQ(contents.find("Test: hidden debug message"), std::string::npos);
    EXPECT_NE(contents.find("Test: visible warning"), std::string::npos);
}

TEST_F(LoggerTest, ReinitializingAppends) {
    BOOST_LOG_TRIVIAL(info) << "Test: first run";
    init_logging(boost::log::trivial::trace, log_file.string());
    BOOST_LOG_TRIVIAL(trace) << "Test: second run";

    const auto contents = log_contents();
    EXPECT_NE(contents.find("Test: first run"), std::string::npos);
    EXPECT_NE(contents.find("Test: second run"), std::string::npos);
}

TEST(SeverityTest, ParsesNames) {
    EXPECT_EQ(parse_severity("trace"), boost::log::trivial::trace);
    EXPECT_EQ(parse_severity("warning"), boost::log::trivial::warning);
    EXPECT_EQ(parse_severity("fatal"), boost::log::trivial::fatal);
    EXPECT_EQ(severity_to_string(boost::log::trivial::debug), "debug");
    EXPECT_THROW(parse_severity("verbose"), pasteall::core::ConfigError);
    EXPECT_THROW(parse_severity(""), pasteall::core::ConfigError);
}
