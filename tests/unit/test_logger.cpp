/**
 * @file test_logger.cpp
 * @brief Tests for the process-wide Logger
 */

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>

#include "Logger.h"
#include "LoggerMacros.h"
#include "TestHelpers.h"

using namespace CubeLink;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = test::makeTempDir("cubelink_log");
        auto& logger = Logger::instance();
        previousLevel_ = logger.getLevel();
        logger.setConsoleOutput(false);
    }

    void TearDown() override {
        auto& logger = Logger::instance();
        logger.setLogFile("");
        logger.setMaxFileSize(50);
        logger.setLevel(previousLevel_);
        logger.setConsoleOutput(true);
        std::filesystem::remove_all(dir_);
    }

    bool fileContains(const std::string& path, const std::string& needle) {
        std::ifstream file(path);
        std::string line;
        while (std::getline(file, line)) {
            if (line.find(needle) != std::string::npos) {
                return true;
            }
        }
        return false;
    }

    std::filesystem::path dir_;
    LogLevel previousLevel_{LogLevel::INFO};
};

TEST_F(LoggerTest, Singleton) {
    EXPECT_EQ(&Logger::instance(), &Logger::instance());
}

TEST_F(LoggerTest, WritesEntriesWithComponent) {
    auto path = (dir_ / "cubelink.log").string();
    auto& logger = Logger::instance();
    logger.setLogFile(path);
    logger.setLevel(LogLevel::DEBUG);

    logger.info("Room created", "RoomRegistry");
    logger.error("Transfer failed");

    EXPECT_TRUE(fileContains(path, "[INFO] [RoomRegistry] Room created"));
    EXPECT_TRUE(fileContains(path, "Transfer failed"));
}

TEST_F(LoggerTest, LevelFiltersLowerSeverity) {
    auto path = (dir_ / "filtered.log").string();
    auto& logger = Logger::instance();
    logger.setLogFile(path);
    logger.setLevel(LogLevel::WARN);

    EXPECT_FALSE(logger.isInfoEnabled());
    EXPECT_FALSE(logger.isDebugEnabled());

    logger.info("hidden info");
    logger.warn("visible warning");

    EXPECT_FALSE(fileContains(path, "hidden info"));
    EXPECT_TRUE(fileContains(path, "visible warning"));
}

TEST_F(LoggerTest, ParseLevel) {
    EXPECT_EQ(Logger::parseLevel("debug"), LogLevel::DEBUG);
    EXPECT_EQ(Logger::parseLevel("WARNING"), LogLevel::WARN);
    EXPECT_EQ(Logger::parseLevel("Error"), LogLevel::ERROR);
    EXPECT_EQ(Logger::parseLevel("critical"), LogLevel::CRITICAL);
    EXPECT_EQ(Logger::parseLevel("nonsense"), LogLevel::INFO);
}

TEST_F(LoggerTest, RotatesOncePastMaxSize) {
    auto path = (dir_ / "rotating.log").string();
    auto& logger = Logger::instance();
    logger.setMaxFileSize(1);
    logger.setLogFile(path);
    logger.setLevel(LogLevel::INFO);

    const std::string filler(1024, 'x');
    for (int i = 0; i < 1100; ++i) {
        logger.info(filler, "Rotation");
    }
    logger.info("after rotation", "Rotation");

    size_t rotated = 0;
    for (const auto& entry : std::filesystem::directory_iterator(dir_)) {
        if (entry.path().filename().string().rfind("rotating.log.", 0) == 0) {
            ++rotated;
            EXPECT_GT(entry.file_size(), 1024u * 1024u);
        }
    }
    EXPECT_EQ(rotated, 1u);
    EXPECT_LT(std::filesystem::file_size(path), 1024u * 1024u);
    EXPECT_TRUE(fileContains(path, "after rotation"));
}

TEST_F(LoggerTest, ScopedTimerLogsAtDebugOnly) {
    auto path = (dir_ / "timer.log").string();
    auto& logger = Logger::instance();
    logger.setLogFile(path);

    logger.setLevel(LogLevel::INFO);
    {
        SCOPED_TIMER_COMP("Quiet section", "Timing");
    }
    EXPECT_FALSE(fileContains(path, "Quiet section"));

    logger.setLevel(LogLevel::DEBUG);
    {
        SCOPED_TIMER_COMP("Send t-1", "Timing");
    }
    EXPECT_TRUE(fileContains(path, "[DEBUG] [Timing] Send t-1 took "));
}
