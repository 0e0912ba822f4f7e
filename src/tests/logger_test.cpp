#include <gtest/gtest.h>
#include <fstream>
#include <iterator>
#include <string>
#include <thread>
#include <filesystem>
#include <boost/log/core.hpp>
#include "logger/logger.hpp"
#include "test_utils.hpp"

using namespace cafs::logging;

class LoggerTest : public ::testing::Test {
protected:
    std::unique_ptr<TempDir> log_dir;
    std::filesystem::path log_file;

    void SetUp() override {
        log_dir = std::make_unique<TempDir>("logger_test");
        log_file = log_dir->path() / "cafs.log";

        LogOptions options;
        options.log_file = log_file.string();
        options.min_level = boost::log::trivial::trace;
        init_logging(options);
    }

    void TearDown() override {
        // Ensure all logs are written
        boost::log::core::get()->flush();
        boost::log::core::get()->remove_all_sinks();
        log_dir.reset();
    }

    bool log_contains(const std::string& text) {
        boost::log::core::get()->flush();

        std::ifstream file(log_file, std::ios::in | std::ios::binary);
        if (!file.is_open()) {
            return false;
        }
        std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
        return content.find(text) != std::string::npos;
    }
};

TEST_F(LoggerTest, BasicLogging) {
    BOOST_LOG_TRIVIAL(info) << "Test info message";
    BOOST_LOG_TRIVIAL(error) << "Test error message";

    EXPECT_TRUE(log_contains("Test info message"));
    EXPECT_TRUE(log_contains("[error] Test error message"));
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
    BOOST_LOG_TRIVIAL(info) << "Info message";
    BOOST_LOG_TRIVIAL(warning) << "Warning message";
    BOOST_LOG_TRIVIAL(error) << "Error message";
    BOOST_LOG_TRIVIAL(fatal) << "Fatal message";

    EXPECT_TRUE(log_contains("Trace message"));
    EXPECT_TRUE(log_contains("Debug message"));
    EXPECT_TRUE(log_contains("Info message"));
    EXPECT_TRUE(log_contains("Warning message"));
    EXPECT_TRUE(log_contains("Error message"));
    EXPECT_TRUE(log_contains("Fatal message"));
}

TEST_F(LoggerTest, LogLevelFiltering) {
    set_log_level(boost::log::trivial::warning);

    BOOST_LOG_TRIVIAL(debug) << "Should not appear";
    BOOST_LOG_TRIVIAL(warning) << "Should appear";

    EXPECT_FALSE(log_contains("Should not appear"));
    EXPECT_TRUE(log_contains("Should appear"));
}

TEST_F(LoggerTest, DefaultLogForwardsAtInfo) {
    LogFn log = default_log();
    log("Operational message");

    EXPECT_TRUE(log_contains("[info] Operational message"));
}

TEST_F(LoggerTest, ReinitializingReplacesSinks) {
    const auto second_file = log_dir->path() / "second.log";
    LogOptions options;
    options.log_file = second_file.string();
    init_logging(options);

    BOOST_LOG_TRIVIAL(info) << "Only in the second file";
    boost::log::core::get()->flush();

    EXPECT_FALSE(log_contains("Only in the second file"));
    std::ifstream file(second_file);
    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    EXPECT_NE(content.find("Only in the second file"), std::string::npos);
}
