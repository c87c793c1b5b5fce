#pragma once
/**
 * @file test_patterns.h
 * @brief The standard test patterns of the testpipe test suite.
 *
 * The Logger is a process-global lifecycle module and the Emitter rewires the
 * process's stdout and stderr. A test that does either would disturb every test
 * that runs after it in the same process, so `main()` initializes nothing and
 * such tests run in a subprocess.
 *
 * ## Pattern 1: PureApiTest
 *
 * In-process, no lifecycle. For pure functions, data structures, the codec, the
 * state model and anything driven through a fake ByteSource.
 *
 *   class CodecTest : public testpipe::tests::PureApiTest { ... };
 *
 * ## Pattern 2: plain ::testing::Test
 *
 * In-process thread-racing tests that need no lifecycle module. Use ThreadRacer
 * from shared_test_helpers.h.
 *
 * ## Pattern 3: IsolatedProcessTest
 *
 * Spawns the test binary again in worker mode. The worker owns its lifecycle via
 * run_gtest_worker() or run_worker_bare().
 *
 *   TEST_F(EmitterProcessTest, FullSession) {
 *       auto w = SpawnWorker("emitter.full_session", {out_path});
 *       ExpectWorkerOk(w);
 *   }
 */

#include "gtest/gtest.h"
#include "test_entrypoint.h"
#include "test_process_utils.h"

#include <list>
#include <string>
#include <utility>
#include <vector>

namespace testpipe::tests
{

// ============================================================================
// Pattern 1: Pure API / Function Tests
// ============================================================================

class PureApiTest : public ::testing::Test
{
  protected:
    void SetUp() override {}
    void TearDown() override {}
};

// ============================================================================
// Pattern 3: Isolated Process Tests
// ============================================================================

class IsolatedProcessTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        ASSERT_FALSE(g_self_exe_path.empty())
            << "g_self_exe_path is empty; test_entrypoint.cpp must set it in main()";
    }

    /**
     * @brief Spawns a single worker subprocess for a named scenario.
     * @param scenario Worker mode string, e.g. "logger.basic_logging".
     * @param args     Additional positional arguments passed after the scenario name.
     */
    helper::WorkerProcess SpawnWorker(const std::string &scenario,
                                      std::vector<std::string> args = {},
                                      helper::WorkerProcess::Environment env = {})
    {
        return helper::WorkerProcess(g_self_exe_path, scenario, args, env);
    }

    /**
     * @brief Spawns several workers before waiting on any of them.
     *
     * std::list because WorkerProcess is neither copyable nor movable.
     */
    std::list<helper::WorkerProcess>
    SpawnWorkers(std::vector<std::pair<std::string, std::vector<std::string>>> scenarios)
    {
        std::list<helper::WorkerProcess> workers;
        for (auto &[scenario, args] : scenarios)
            workers.emplace_back(g_self_exe_path, scenario, args);
        return workers;
    }

    void ExpectWorkerOk(helper::WorkerProcess &proc,
                        std::vector<std::string> expected_stderr_substrings = {},
                        bool allow_expected_logger_errors = false)
    {
        proc.wait_for_exit();
        helper::expect_worker_ok(proc, expected_stderr_substrings, allow_expected_logger_errors);
    }

    void ExpectAllWorkersOk(std::list<helper::WorkerProcess> &workers)
    {
        for (auto &w : workers)
        {
            w.wait_for_exit();
            helper::expect_worker_ok(w);
        }
    }
};

} // namespace testpipe::tests
