// tests/test_layer2_service/test_logger.cpp
/**
 * @file test_logger.cpp
 * @brief Logger tests. The logic lives in workers/logger_workers.cpp; every test
 *        runs it in a separate process.
 */
#include "shared_test_helpers.h"
#include "test_patterns.h"

#include <gtest/gtest.h>

using namespace testpipe::tests::helper;

class LoggerTest : public testpipe::tests::IsolatedProcessTest
{
  protected:
    std::vector<fs::path> paths_to_clean_;

    void TearDown() override
    {
        for (const auto &p : paths_to_clean_)
        {
            std::error_code ec;
            fs::remove(p, ec);
        }
    }

    std::string GetUniqueLogPath(std::string_view test_name)
    {
        auto p = make_temp_path(test_name);
        paths_to_clean_.push_back(p);
        return p.string();
    }
};

TEST_F(LoggerTest, BasicLogging)
{
    auto w = SpawnWorker("logger.basic_logging", {GetUniqueLogPath("basic_logging")});
    ExpectWorkerOk(w);
}

TEST_F(LoggerTest, LevelFiltering)
{
    auto w = SpawnWorker("logger.level_filtering", {GetUniqueLogPath("level_filtering")});
    ExpectWorkerOk(w);
}

TEST_F(LoggerTest, BadFormatStringIsLoggedNotThrown)
{
    auto w = SpawnWorker("logger.bad_format_string", {GetUniqueLogPath("bad_format")});
    ExpectWorkerOk(w);
}

TEST_F(LoggerTest, UnopenableLogfileKeepsTheCurrentSink)
{
    auto w = SpawnWorker("logger.unopenable_logfile_keeps_current_sink",
                         {GetUniqueLogPath("unopenable")});
    ExpectWorkerOk(w);
}

TEST_F(LoggerTest, MultithreadLoggingKeepsEveryLine)
{
    const int threads = 8;
    const int per_thread = scaled_value(500, 50);
    auto w = SpawnWorker("logger.multithread_logging",
                         {GetUniqueLogPath("multithread"), std::to_string(threads),
                          std::to_string(per_thread)});
    ExpectWorkerOk(w);
}

TEST_F(LoggerTest, ShutdownIsIdempotentAndDropsLateMessages)
{
    auto w = SpawnWorker("logger.shutdown_drops_late_messages", {GetUniqueLogPath("shutdown")});
    ExpectWorkerOk(w);
}

TEST_F(LoggerTest, LoggingBeforeInitializationIsDropped)
{
    auto w = SpawnWorker("logger.log_before_init_is_dropped");
    ExpectWorkerOk(w);
    EXPECT_EQ(w.get_stderr().find("nobody hears this"), std::string::npos);
}
