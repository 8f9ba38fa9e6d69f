/**
 * @file test_logger.cpp
 * @brief Layer 2 tests for the asynchronous Logger.
 *
 * Sink and level tests run in worker processes because the Logger is a lifecycle
 * module; level-name parsing is a pure function and runs in-process.
 */
#include "test_patterns.h"
#include "shared_test_helpers.h"
#include "bmc_service.hpp"
#include <gmock/gmock.h>
#include <gtest/gtest.h>

using namespace bmapcopy::tests;
using namespace bmapcopy::tests::helper;
using bmapcopy::utils::Logger;
using ::testing::HasSubstr;

class LoggerTest : public IsolatedProcessTest
{
  protected:
    void SetUp() override
    {
        IsolatedProcessTest::SetUp();
        scratch_ = std::make_unique<ScratchDir>("logger");
        log_path_ = (*scratch_ / "test.log").string();
    }
    void TearDown() override { scratch_.reset(); }

    std::unique_ptr<ScratchDir> scratch_;
    std::string log_path_;
};

TEST_F(LoggerTest, FileSinkReceivesMessages)
{
    auto w = SpawnWorker("logger.file_sink", {log_path_});
    ExpectWorkerOk(w);
}

TEST_F(LoggerTest, LevelFilteringDropsLowerLevels)
{
    auto w = SpawnWorker("logger.level_filtering", {log_path_});
    ExpectWorkerOk(w);
}

TEST_F(LoggerTest, SwitchBackToConsole)
{
    auto w = SpawnWorker("logger.switch_to_console", {log_path_});
    ExpectWorkerOk(w, {"to-console"});
}

TEST_F(LoggerTest, UnopenableLogfileIsReportedOnStderr)
{
    auto w = SpawnWorker("logger.unopenable_logfile", {log_path_});
    ExpectWorkerOk(w, {"[LOGGER] error: Failed to create FileSink", "still-on-console"});
}

TEST_F(LoggerTest, MessagesBeforeInitAreDropped)
{
    auto w = SpawnWorker("logger.before_init");
    ExpectWorkerOk(w, {"after-init"});
    EXPECT_THAT(w.get_stderr(), ::testing::Not(HasSubstr("dropped-before-init")));
}

TEST_F(LoggerTest, ConfigurationBeforeInitPanics)
{
    auto w = SpawnWorker("logger.config_before_init");
    w.wait_for_exit();
    EXPECT_NE(w.exit_code(), 0);
    EXPECT_THAT(w.get_stderr(), HasSubstr("before the Logger module was initialized"));
}

TEST_F(LoggerTest, ConcurrentWritersLoseNothing)
{
    auto w = SpawnWorker("logger.multithread", {log_path_});
    ExpectWorkerOk(w);
}

TEST(LoggerLevelTest, ParseLevelNames)
{
    EXPECT_EQ(Logger::parse_level("trace"), Logger::Level::L_TRACE);
    EXPECT_EQ(Logger::parse_level("debug"), Logger::Level::L_DEBUG);
    EXPECT_EQ(Logger::parse_level("info"), Logger::Level::L_INFO);
    EXPECT_EQ(Logger::parse_level("warn"), Logger::Level::L_WARNING);
    EXPECT_EQ(Logger::parse_level("warning"), Logger::Level::L_WARNING);
    EXPECT_EQ(Logger::parse_level("error"), Logger::Level::L_ERROR);
    EXPECT_EQ(Logger::parse_level("system"), Logger::Level::L_SYSTEM);
    EXPECT_FALSE(Logger::parse_level("verbose").has_value());
    EXPECT_FALSE(Logger::parse_level("").has_value());
}
