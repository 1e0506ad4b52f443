#include "core/logging.hpp"

#include "../test_utils/volume_generator.hpp"

#include <gtest/gtest.h>
#include <spdlog/sinks/ringbuffer_sink.h>

#include <filesystem>
#include <fstream>
#include <sstream>

namespace ibis::logging {
namespace {

class LoggerFactoryTest : public ::testing::Test {
protected:
    void TearDown() override {
        LoggerFactory::shutdown();
        LoggerFactory::configure(LogConfig{});
    }
};

TEST(ParseLogLevelTest, AcceptsConfigNamesCaseInsensitively) {
    EXPECT_EQ(parseLogLevel("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(parseLogLevel("info"), LogLevel::Info);
    EXPECT_EQ(parseLogLevel("Warning"), LogLevel::Warning);
    EXPECT_EQ(parseLogLevel("ERROR"), LogLevel::Error);
}

TEST(ParseLogLevelTest, RejectsUnknownNames) {
    EXPECT_FALSE(parseLogLevel("VERBOSE").has_value());
    EXPECT_FALSE(parseLogLevel("").has_value());
}

TEST_F(LoggerFactoryTest, CreateReturnsRegisteredLogger) {
    auto first = LoggerFactory::create("FactoryTest");
    auto second = LoggerFactory::create("FactoryTest");
    ASSERT_TRUE(first);
    EXPECT_EQ(first.get(), second.get());
    EXPECT_EQ(first->name(), "FactoryTest");
}

TEST_F(LoggerFactoryTest, SetGlobalLevelAppliesToExistingLoggers) {
    auto logger = LoggerFactory::create("LevelTest");
    LoggerFactory::setGlobalLevel(LogLevel::Error);
    EXPECT_EQ(LoggerFactory::getGlobalLevel(), LogLevel::Error);
    EXPECT_EQ(logger->level(), spdlog::level::err);
    EXPECT_FALSE(logger->should_log(spdlog::level::info));
}

TEST_F(LoggerFactoryTest, FileLoggingWritesToLogDirectory) {
    auto dir = test_utils::makeTempDir("logging_test");

    LogConfig config;
    config.level = LogLevel::Debug;
    config.enableConsole = false;
    config.enableFileLogging = true;
    config.logDirectory = dir / "logs";
    config.fileName = "run.log";
    LoggerFactory::configure(config);

    auto logger = LoggerFactory::create("FileTest");
    logger->debug("debug line {}", 7);
    logger->flush();

    std::ifstream in(dir / "logs" / "run.log");
    std::stringstream content;
    content << in.rdbuf();
    EXPECT_NE(content.str().find("debug line 7"), std::string::npos);
    EXPECT_NE(content.str().find("[FileTest]"), std::string::npos);

    LoggerFactory::shutdown();
    std::filesystem::remove_all(dir);
}

TEST_F(LoggerFactoryTest, LogMemoryUsageReportsPeakRss) {
    auto sink = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(8);
    auto logger = std::make_shared<spdlog::logger>("MemoryTest", sink);
    logger->set_pattern("%v");

    logMemoryUsage(logger, "step start");
    auto lines = sink->last_formatted();
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_NE(lines[0].find("step start memory:"), std::string::npos);

    EXPECT_NO_THROW(logMemoryUsage(nullptr, "ignored"));
}

}  // anonymous namespace
}  // namespace ibis::logging
