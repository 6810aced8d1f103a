/**
 * @file test_logger.cpp
 * @brief Logger level handling, session files and component tags
 */

#include <gtest/gtest.h>
#include <heartfield/core/Logger.hpp>
#include <heartfield/app/AppConfig.hpp>
#include <heartfield/particles/AnimationEngine.hpp>
#include <fstream>
#include <sstream>
#include <thread>
#include <vector>

using namespace heartfield::core;

namespace {

std::string readFile(const std::string& path) {
    std::ifstream in(path);
    std::stringstream content;
    content << in.rdbuf();
    return content.str();
}

size_t countOccurrences(const std::string& text, const std::string& needle) {
    size_t n = 0;
    for (size_t pos = text.find(needle); pos != std::string::npos; pos = text.find(needle, pos + 1)) {
        ++n;
    }
    return n;
}

} // namespace

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().configure(LogLevel::DEBUG, false);
        Logger::getInstance().resetCounters();
    }

    void TearDown() override {
        Logger::getInstance().closeLogFile();
        Logger::getInstance().configure(LogLevel::INFO, true);
    }
};

TEST_F(LoggerTest, ParsesLevelNames) {
    LogLevel level = LogLevel::INFO;
    EXPECT_TRUE(parseLogLevel("debug", level));
    EXPECT_EQ(level, LogLevel::DEBUG);
    EXPECT_TRUE(parseLogLevel("WARNING", level));
    EXPECT_EQ(level, LogLevel::WARNING);
    EXPECT_TRUE(parseLogLevel("warn", level));
    EXPECT_EQ(level, LogLevel::WARNING);
    EXPECT_TRUE(parseLogLevel("Error", level));
    EXPECT_EQ(level, LogLevel::ERROR);
    EXPECT_FALSE(parseLogLevel("loud", level));
    EXPECT_EQ(level, LogLevel::ERROR);
}

TEST_F(LoggerTest, SessionFileCollectsMessagesFromManyThreads) {
    Logger& logger = Logger::getInstance();
    ASSERT_TRUE(logger.openSessionFile(::testing::TempDir() + "heartfield_logs/nested"));

    const std::string path = logger.getCurrentLogFile();
    ASSERT_FALSE(path.empty());
    EXPECT_NE(path.find("heartfield_"), std::string::npos);

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([t]() {
            for (int i = 0; i < 50; ++i) {
                LOG_INFO("thread " + std::to_string(t) + " message " + std::to_string(i));
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }
    LOG_TRACE("below threshold");
    HEARTFIELD_LOG(WARNING, "session") << "stream message " << 42;
    logger.closeLogFile();
    EXPECT_TRUE(logger.getCurrentLogFile().empty());

    const std::string text = readFile(path);
    EXPECT_NE(text.find("Heartfield session log"), std::string::npos);
    EXPECT_NE(text.find("thread 3 message 49"), std::string::npos);
    EXPECT_NE(text.find("[session] stream message 42"), std::string::npos);
    EXPECT_NE(text.find("test_logger.cpp:"), std::string::npos);
    EXPECT_EQ(text.find("below threshold"), std::string::npos);
    EXPECT_EQ(countOccurrences(text, "message "), 201u);  // 200 thread messages + the stream message

    EXPECT_EQ(logger.messageCount(LogLevel::INFO), 200u);
    EXPECT_EQ(logger.messageCount(LogLevel::WARNING), 1u);
    EXPECT_EQ(logger.messageCount(LogLevel::TRACE), 0u);
}

TEST_F(LoggerTest, EngineMessagesCarryComponentTag) {
    Logger& logger = Logger::getInstance();
    ASSERT_TRUE(logger.openSessionFile(::testing::TempDir() + "heartfield_logs"));
    const std::string path = logger.getCurrentLogFile();

    heartfield::particles::AnimationConfig config;
    config.particle_count = 100;
    heartfield::particles::AnimationEngine engine(config);
    EXPECT_FALSE(engine.setMode("galaxy"));
    logger.closeLogFile();

    EXPECT_EQ(logger.messageCount(LogLevel::WARNING), 1u);
    const std::string text = readFile(path);
    EXPECT_NE(text.find("[engine] Invalid mode 'galaxy'"), std::string::npos);
    EXPECT_NE(text.find("[engine] Initialized: 100 particles"), std::string::npos);
}

TEST_F(LoggerTest, AppliesLoggingSection) {
    heartfield::app::LoggingConfig logging;
    logging.level = "warning";
    logging.console = false;
    logging.file = true;
    logging.directory = ::testing::TempDir() + "heartfield_applied";

    Logger& logger = Logger::getInstance();
    ASSERT_TRUE(heartfield::app::applyLoggingConfig(logging));
    EXPECT_EQ(logger.getLevel(), LogLevel::WARNING);
    EXPECT_FALSE(logger.consoleOutput());
    EXPECT_FALSE(logger.getCurrentLogFile().empty());

    logging.file = false;
    logging.console = true;
    logging.level = "debug";
    ASSERT_TRUE(heartfield::app::applyLoggingConfig(logging));
    EXPECT_EQ(logger.getLevel(), LogLevel::DEBUG);
    EXPECT_TRUE(logger.consoleOutput());
    EXPECT_TRUE(logger.getCurrentLogFile().empty());
}
