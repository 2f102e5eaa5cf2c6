// ============================================================================
// SPICEDECK - Logger Unit Tests
// ============================================================================

#include "spicedeck/utils/logger.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace spicedeck::utils;

TEST(LogLevelTest, ParsesConfigNames) {
    EXPECT_EQ(parse_log_level("trace"), LogLevel::Trace);
    EXPECT_EQ(parse_log_level("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(parse_log_level("warning"), LogLevel::Warn);
    EXPECT_EQ(parse_log_level("Error"), LogLevel::Error);
    EXPECT_EQ(parse_log_level("off"), LogLevel::Off);
    EXPECT_EQ(parse_log_level("verbose"), LogLevel::Info);
}

TEST(LoggerTest, WritesFormattedMessagesToFile) {
    const auto path = std::filesystem::temp_directory_path() / "spicedeck_logger_test.log";
    std::filesystem::remove(path);

    LogConfig config;
    config.level = LogLevel::Info;
    config.log_file = path.string();
    config.console = false;
    Logger::initialize(config);

    LOG_INFO("admitted {} of {} calls", 3, 60);
    LOG_DEBUG("filtered out {}", "debug line");
    Logger::instance().flush();

    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    const auto text = ss.str();
    EXPECT_NE(text.find("admitted 3 of 60 calls"), std::string::npos);
    EXPECT_EQ(text.find("debug line"), std::string::npos);

    Logger::shutdown();
    std::filesystem::remove(path);
}

TEST(LoggerTest, LevelCanBeChanged) {
    auto& logger = Logger::instance();
    const auto previous = logger.level();
    logger.set_level(LogLevel::Error);
    EXPECT_EQ(logger.level(), LogLevel::Error);
    logger.set_level(previous);
}

TEST(LoggerTest, WarningsReachFileWithoutExplicitFlush) {
    const auto path = std::filesystem::temp_directory_path() / "spicedeck_logger_sync_test.log";
    std::filesystem::remove(path);

    LogConfig config;
    config.log_file = path.string();
    config.console = false;
    Logger::initialize(config);

    // Records are written on the calling thread and warnings flush at once
    LOG_WARN("budget low: {} left", 2);

    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    EXPECT_NE(ss.str().find("budget low: 2 left"), std::string::npos);

    Logger::shutdown();
    std::filesystem::remove(path);
}
