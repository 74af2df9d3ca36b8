#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include "utils/epoch_logger.hpp"
#include "utils/logger.hpp"

using namespace orion;
using namespace orion::utils;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::filesystem::create_directories("test_logs");
    }

    void TearDown() override {
        Logger::shutdown();
        std::filesystem::remove_all("test_logs");
    }

    static std::string read_file(const std::string& path) {
        std::ifstream in(path);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }
};

TEST_F(LoggerTest, DisabledUntilInitialized) {
    EXPECT_FALSE(Logger::is_enabled(LogLevel::CRITICAL));
    EXPECT_NO_THROW(Logger::info("dropped"));
    EXPECT_NO_THROW(ORION_LOG_WARN("dropped {}", 1));
}

TEST_F(LoggerTest, WritesToRotatingFile) {
    Logger::initialize("test_logs/orion.log", LogLevel::DEBUG, false);
    ORION_LOG_INFO("Vault {} settled", "v1");
    Logger::shutdown();

    const std::string contents = read_file("test_logs/orion.log");
    EXPECT_NE(contents.find("Vault v1 settled"), std::string::npos);
    EXPECT_NE(contents.find("[info]"), std::string::npos);
}

TEST_F(LoggerTest, LogLevelFiltering) {
    Logger::initialize("test_logs/level.log", LogLevel::WARN, false);

    EXPECT_EQ(Logger::get_level(), LogLevel::WARN);
    EXPECT_FALSE(Logger::is_enabled(LogLevel::DEBUG));
    EXPECT_FALSE(Logger::is_enabled(LogLevel::INFO));
    EXPECT_TRUE(Logger::is_enabled(LogLevel::WARN));
    EXPECT_TRUE(Logger::is_enabled(LogLevel::ERROR));

    ORION_LOG_INFO("hidden line");
    ORION_LOG_ERROR("visible line");
    Logger::shutdown();

    const std::string contents = read_file("test_logs/level.log");
    EXPECT_EQ(contents.find("hidden line"), std::string::npos);
    EXPECT_NE(contents.find("visible line"), std::string::npos);
}

TEST_F(LoggerTest, LevelNamesParse) {
    EXPECT_EQ(parse_log_level("debug"), LogLevel::DEBUG);
    EXPECT_EQ(parse_log_level("Warning"), LogLevel::WARN);
    EXPECT_EQ(parse_log_level("CRITICAL"), LogLevel::CRITICAL);
    EXPECT_EQ(parse_log_level("verbose"), LogLevel::INFO);
    EXPECT_EQ(to_string(LogLevel::ERROR), "ERROR");
}

TEST_F(LoggerTest, EpochEventsFormatAmounts) {
    Logger::initialize("test_logs/epoch.log", LogLevel::DEBUG, false);

    EXPECT_NO_THROW(EpochLogger::log_epoch_started(3, 2, 1, 4));
    EXPECT_NO_THROW(EpochLogger::log_trade_executed(OrderSide::SELL, "WETH", Amount("79898989898989899"),
                                                    Amount(77518000), Amount(79100000)));
    EXPECT_NO_THROW(EpochLogger::log_epoch_completed(3, Amount(999999)));
    {
        ScopedTimer timer("epoch_step");
    }
    Logger::shutdown();

    const std::string contents = read_file("test_logs/epoch.log");
    EXPECT_NE(contents.find("79898989898989899"), std::string::npos);
    EXPECT_NE(contents.find("WETH"), std::string::npos);
    EXPECT_NE(contents.find("epoch_step took"), std::string::npos);
}
