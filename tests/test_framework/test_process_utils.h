// tests/test_framework/test_process_utils.h
#pragma once

#include "tp_base.hpp"

#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h> // For fork, execv, _exit

#include <utility>
#include <vector>

/**
 * @file test_process_utils.h
 * @brief Spawns and manages child processes in tests.
 *
 * Used both to re-run the test executable in worker mode and to run the
 * testpipe executables end to end. POSIX only, like the pipe itself.
 */
namespace testpipe::tests::helper
{
namespace fs = std::filesystem;

using ProcessHandle = pid_t;
static constexpr pid_t NULL_PROC_HANDLE = 0;

/**
 * @class WorkerProcess
 * @brief RAII handle for a child process whose stdout and stderr go to temp files.
 *
 * The destructor waits for a process that was never waited for and removes the
 * capture files.
 */
class WorkerProcess
{
  public:
    using Environment = std::vector<std::pair<std::string, std::string>>;

    /**
     * @param exe_path Executable to run (g_self_exe_path for worker mode).
     * @param mode     Worker mode string such as "emitter.full_session"; passed as
     *                 the first argument unless empty.
     * @param args     Further arguments.
     * @param env      Variables set in the child in addition to the inherited ones.
     */
    WorkerProcess(const std::string &exe_path, const std::string &mode,
                  const std::vector<std::string> &args, const Environment &env = {});
    ~WorkerProcess();

    WorkerProcess(const WorkerProcess &) = delete;
    WorkerProcess &operator=(const WorkerProcess &) = delete;
    WorkerProcess(WorkerProcess &&) = delete;
    WorkerProcess &operator=(WorkerProcess &&) = delete;

    /// Waits for the process and reads its captured output. Returns the exit code.
    int wait_for_exit();

    const std::string &get_stdout() const;
    const std::string &get_stderr() const;

    /// Exit code, 128 + signal for a killed process, or -1 if not yet waited for.
    int exit_code() const { return exit_code_; }

    bool valid() const { return spawned_; }

  private:
    ProcessHandle handle_ = NULL_PROC_HANDLE;
    bool spawned_ = false;
    int exit_code_ = -1;
    fs::path stdout_path_;
    fs::path stderr_path_;
    mutable std::string stdout_content_;
    mutable std::string stderr_content_;
    bool waited_ = false;
};

/**
 * @brief Asserts that a worker exited with 0 and that its stderr has no failure markers.
 * @param expected_stderr_substrings Strings that must appear in stderr.
 * @param allow_expected_logger_errors Skip the "ERROR" check for tests that log errors on purpose.
 */
void expect_worker_ok(const WorkerProcess &proc,
                      const std::vector<std::string> &expected_stderr_substrings = {},
                      bool allow_expected_logger_errors = false);

} // namespace testpipe::tests::helper
