// VoxStruct Core Tests
// logger_test.cpp - Tests for Logger levels and categories

#include <gtest/gtest.h>

#include <voxstruct/core/logger.hpp>

#include <filesystem>

namespace voxstruct::core {
namespace {

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override { Logger::shutdown(); }
    void TearDown() override { Logger::shutdown(); }
};

TEST(LogLevelTest, ParsesKnownNames) {
    EXPECT_EQ(parse_log_level("trace"), LogLevel::Trace);
    EXPECT_EQ(parse_log_level("debug"), LogLevel::Debug);
    EXPECT_EQ(parse_log_level("info"), LogLevel::Info);
    EXPECT_EQ(parse_log_level("warn"), LogLevel::Warn);
    EXPECT_EQ(parse_log_level("warning"), LogLevel::Warn);
    EXPECT_EQ(parse_log_level("error"), LogLevel::Error);
    EXPECT_EQ(parse_log_level("critical"), LogLevel::Critical);
    EXPECT_EQ(parse_log_level("off"), LogLevel::Off);
}

TEST(LogLevelTest, RejectsUnknownNames) {
    EXPECT_FALSE(parse_log_level("verbose").has_value());
    EXPECT_FALSE(parse_log_level("").has_value());
    EXPECT_FALSE(parse_log_level("INFO").has_value());
}

TEST_F(LoggerTest, InitializeAndShutdown) {
    EXPECT_FALSE(Logger::is_initialized());

    LoggerConfig config;
    config.console_level = LogLevel::Warn;
    Logger::initialize(config);

    EXPECT_TRUE(Logger::is_initialized());
    EXPECT_EQ(Logger::get_global_level(), LogLevel::Warn);

    Logger::shutdown();
    EXPECT_FALSE(Logger::is_initialized());
}

TEST_F(LoggerTest, CategoryLevelOverridesGlobal) {
    Logger::initialize();
    Logger::set_global_level(LogLevel::Info);
    Logger::set_category_level(log_category::CODEC, LogLevel::Trace);

    EXPECT_EQ(Logger::get_category_level(log_category::CODEC), LogLevel::Trace);
    EXPECT_EQ(Logger::get_category_level(log_category::PALETTE), LogLevel::Info);
}

TEST_F(LoggerTest, ShutdownClearsCategoryLevels) {
    Logger::initialize();
    Logger::set_category_level(log_category::ROTATION, LogLevel::Error);
    Logger::shutdown();

    Logger::initialize();
    EXPECT_EQ(Logger::get_category_level(log_category::ROTATION), Logger::get_global_level());
}

TEST_F(LoggerTest, WritesLogFile) {
    auto dir = std::filesystem::temp_directory_path() / "voxstruct_test_logs";
    std::filesystem::remove_all(dir);

    LoggerConfig config;
    config.log_directory = dir;
    config.file_level = LogLevel::Trace;
    Logger::initialize(config);

    VOXSTRUCT_LOG_INFO(log_category::IO, "Hello {}", 42);
    Logger::flush();

    EXPECT_TRUE(std::filesystem::exists(dir / config.log_filename));

    Logger::shutdown();
    std::filesystem::remove_all(dir);
}

TEST_F(LoggerTest, LogsBeforeInitialize) {
    // Falls back to spdlog's default logger
    VOXSTRUCT_LOG_DEBUG(log_category::STRUCTURE, "Not initialized {}", "yet");
    EXPECT_FALSE(Logger::is_initialized());
}

}  // namespace
}  // namespace voxstruct::core
