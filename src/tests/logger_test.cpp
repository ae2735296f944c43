#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include <boost/log/core.hpp>
#include "logger/logger.hpp"
#include "test_utils.hpp"

using namespace xornet::logger;

class LoggerTest : public ::testing::Test {
protected:
    std::filesystem::path log_dir;
    std::filesystem::path log_file;

    void SetUp() override {
        log_dir = xornet::test::unique_temp_dir("logger_test");
        log_file = log_dir / "node.log";
        init_logging(log_file.string(), boost::log::trivial::trace);
    }

    void TearDown() override {
        boost::log::core::get()->flush();
        boost::log::core::get()->remove_all_sinks();
        xornet::test::quiet_logging();
        std::filesystem::remove_all(log_dir);
    }

    std::string log_contents() {
        boost::log::core::get()->flush();
        std::ifstream file(log_file);
        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }

    bool log_contains(const std::string& text) {
        return log_contents().find(text) != std::string::npos;
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

TEST_F(LoggerTest, LogLevelFiltering) {
    set_log_level(boost::log::trivial::warning);

    BOOST_LOG_TRIVIAL(debug) << "Should not appear";
    BOOST_LOG_TRIVIAL(warning) << "Should appear";

    EXPECT_FALSE(log_contains("Should not appear"));
    EXPECT_TRUE(log_contains("Should appear"));
}

TEST_F(LoggerTest, ReinitializingReplacesSinks) {
    std::filesystem::path second = log_dir / "second.log";
    init_logging(second.string(), boost::log::trivial::info);
    BOOST_LOG_TRIVIAL(info) << "Only in second";
    boost::log::core::get()->flush();

    EXPECT_FALSE(log_contains("Only in second"));
    std::ifstream file(second);
    std::stringstream buffer;
    buffer << file.rdbuf();
    EXPECT_NE(buffer.str().find("Only in second"), std::string::npos);
}

TEST(SeverityParsingTest, ParsesKnownLevels) {
    EXPECT_EQ(parse_severity("trace"), boost::log::trivial::trace);
    EXPECT_EQ(parse_severity("warning"), boost::log::trivial::warning);
    EXPECT_EQ(parse_severity("fatal"), boost::log::trivial::fatal);
    EXPECT_THROW(parse_severity("loud"), std::invalid_argument);
}
