// tests/test_layer3_pipe/test_emitter.cpp
/**
 * @file test_emitter.cpp
 * @brief Emitter tests. The logic lives in workers/emitter_workers.cpp; every test
 *        runs it in a separate process.
 */
#include "shared_test_helpers.h"
#include "test_patterns.h"

#include <gtest/gtest.h>

using namespace testpipe::tests::helper;

class EmitterTest : public testpipe::tests::IsolatedProcessTest
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

    std::string OutputPath(std::string_view test_name)
    {
        auto p = make_temp_path(test_name, ".frames");
        paths_to_clean_.push_back(p);
        return p.string();
    }
};

TEST_F(EmitterTest, FullSessionDecodesOnTheConsumerSide)
{
    auto w = SpawnWorker("emitter.full_session", {OutputPath("full_session")});
    ExpectWorkerOk(w);
}

TEST_F(EmitterTest, CollectionThreadFinishesBeforeTheRunPhase)
{
    auto w = SpawnWorker("emitter.collection_thread", {OutputPath("collection_thread")});
    ExpectWorkerOk(w);
}

TEST_F(EmitterTest, TestStartedDuringCollectionGivesTheSameOutcomes)
{
    auto w = SpawnWorker("emitter.test_starts_while_collecting",
                         {OutputPath("while_collecting"), OutputPath("canonical_order")});
    ExpectWorkerOk(w);
}

TEST_F(EmitterTest, CollectReportOutsideCollectionIsDropped)
{
    auto w = SpawnWorker("emitter.report_outside_collection_is_dropped",
                         {OutputPath("outside_collection")});
    ExpectWorkerOk(w, {"arrived outside collection"}, true);
}

TEST_F(EmitterTest, StandardStreamsBecomeCopyFrames)
{
    auto w = SpawnWorker("emitter.redirected_streams", {OutputPath("redirected")});
    ExpectWorkerOk(w);
    // fds 1 and 2 pointed at the null device while the Emitter ran.
    EXPECT_EQ(w.get_stdout().find("hello from the engine"), std::string::npos);
}

TEST_F(EmitterTest, ConcurrentWritersNeverInterleaveFrames)
{
    const int threads = 8;
    const int per_thread = scaled_value(400, 40);
    auto w = SpawnWorker("emitter.concurrent_writers",
                         {OutputPath("concurrent"), std::to_string(threads),
                          std::to_string(per_thread)});
    ExpectWorkerOk(w);
}

TEST_F(EmitterTest, FramesAfterShutdownAreCountedAsDropped)
{
    auto w = SpawnWorker("emitter.frames_after_shutdown_are_dropped",
                         {OutputPath("after_shutdown")});
    ExpectWorkerOk(w);
}
