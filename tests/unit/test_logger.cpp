#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include "utils/logger.hpp"

namespace fs = std::filesystem;
using namespace toydb;

class LoggerFixture : public ::testing::Test {
protected:
    void SetUp() override {
        log_path = fs::temp_directory_path() / "toydb_logger_test.log";
        fs::remove(log_path);
    }

    void TearDown() override {
        Logger::shutdown();
        fs::remove(log_path);
    }

    std::string read_log() {
        std::ifstream file(log_path);
        std::stringstream ss;
        ss << file.rdbuf();
        return ss.str();
    }

    fs::path log_path;
};

TEST(LogLevelTest, ParsesNames) {
    EXPECT_EQ(parse_log_level("trace"), LogLevel::TRACE);
    EXPECT_EQ(parse_log_level("debug"), LogLevel::DEBUG);
    EXPECT_EQ(parse_log_level("warn"), LogLevel::WARN);
    EXPECT_EQ(parse_log_level("critical"), LogLevel::CRITICAL);
    EXPECT_EQ(parse_log_level("verbose"), LogLevel::INFO);
}

TEST_F(LoggerFixture, SilentUntilInitialized) {
    EXPECT_FALSE(Logger::initialized());
    Logger::info("dropped {}", 1);
    EXPECT_FALSE(fs::exists(log_path));
}

TEST_F(LoggerFixture, WritesToFileAtConfiguredLevel) {
    Logger::init(log_path.string(), LogLevel::WARN);
    ASSERT_TRUE(Logger::initialized());

    Logger::info("below threshold");
    Logger::warn("table '{}' missing", "ghost");
    Logger::shutdown();
    EXPECT_FALSE(Logger::initialized());

    std::string contents = read_log();
    EXPECT_EQ(contents.find("below threshold"), std::string::npos);
    EXPECT_NE(contents.find("table 'ghost' missing"), std::string::npos);
}
