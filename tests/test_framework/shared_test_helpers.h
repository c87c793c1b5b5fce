// tests/test_framework/shared_test_helpers.h
#pragma once
// Must be first: defines TESTPIPE_IS_POSIX before any platform-conditional includes.
#include "tp_platform.hpp"

#include <filesystem>
namespace fs = std::filesystem;

/**
 * @file shared_test_helpers.h
 * @brief Common helpers for test cases: file I/O, fd capture, temp paths, and the
 *        wrappers that run test logic inside a worker process.
 */

#include <fcntl.h>
#include <unistd.h>

#include "gtest/gtest.h"

// Required for run_gtest_worker: LifecycleGuard, print_stack_trace (Layer 2 umbrella)
#include "tp_service.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace testpipe::tests::helper
{

/**
 * @class StringCapture
 * @brief Redirects a file descriptor into a pipe and collects what was written.
 *
 * Only suitable for output smaller than the pipe buffer.
 */
class StringCapture
{
  public:
    explicit StringCapture(int fd_to_capture) : fd_to_capture_(fd_to_capture), original_fd_(-1)
    {
        if (::pipe(pipe_fds_) != 0)
            return;
        original_fd_ = dup(fd_to_capture_);
        dup2(pipe_fds_[1], fd_to_capture_);
        close(pipe_fds_[1]);
    }

    ~StringCapture()
    {
        if (original_fd_ != -1)
        {
            dup2(original_fd_, fd_to_capture_);
            close(original_fd_);
            close(pipe_fds_[0]);
        }
    }

    StringCapture(const StringCapture &) = delete;
    StringCapture &operator=(const StringCapture &) = delete;

    std::string GetOutput()
    {
        if (original_fd_ == -1)
            return {};
        fflush(stdout);
        fflush(stderr);
        dup2(original_fd_, fd_to_capture_);
        close(original_fd_);
        original_fd_ = -1;

        std::string output;
        std::vector<char> buffer(1024);
        ssize_t bytes_read;
        while ((bytes_read = read(pipe_fds_[0], buffer.data(), buffer.size())) > 0)
            output.append(buffer.data(), static_cast<size_t>(bytes_read));
        close(pipe_fds_[0]);
        return output;
    }

  private:
    int fd_to_capture_;
    int original_fd_;
    int pipe_fds_[2]{-1, -1};
};

/**
 * @brief Reads the entire contents of a file into a string.
 * @return True if the file was read successfully, false otherwise.
 */
bool read_file_contents(const std::string &path, std::string &out);

/**
 * @brief Counts the lines of @p text, optionally only those containing
 *        @p must_include and not containing @p must_exclude.
 */
size_t count_lines(std::string_view text,
                   std::optional<std::string_view> must_include = std::nullopt,
                   std::optional<std::string_view> must_exclude = std::nullopt);

/**
 * @brief Polls a file until @p expected appears in it or @p timeout elapses.
 */
bool wait_for_string_in_file(const fs::path &path, const std::string &expected,
                             std::chrono::milliseconds timeout = std::chrono::seconds(15));

/**
 * @brief A unique path in the temp directory; nothing is created.
 * @param tag Becomes part of the file name.
 */
fs::path make_temp_path(std::string_view tag, std::string_view extension = ".log");

/// `TESTPIPE_TEST_SCALE` ("small" shortens stress tests), or an empty string.
std::string test_scale();

/// @p small_value when test_scale() is "small", otherwise @p original.
int scaled_value(int original, int small_value);

/**
 * @brief Wraps test logic for execution in a worker process.
 *
 * Starts the given lifecycle modules, runs @p test_logic with GTest assertions
 * turned into exceptions, and reports failures on stderr.
 *
 * @return 0 on success, 1 on GTest assertion failure, 2 on standard exception, 3 on unknown
 * exception.
 */
template <typename Fn, typename... Mods>
int run_gtest_worker(Fn test_logic, const char *test_name, Mods &&...mods)
{
    // Without throw_on_failure ASSERT_* only returns from the lambda and EXPECT_*
    // keeps going; both would let a failing worker exit with 0.
    ::testing::GTEST_FLAG(throw_on_failure) = true;
    testpipe::utils::LifecycleGuard guard(
        testpipe::utils::MakeModDefList(std::forward<Mods>(mods)...));
    try
    {
        test_logic();
    }
    catch (const ::testing::internal::GoogleTestFailureException &e)
    {
        testpipe::debug::debug_msg("[WORKER FAILURE] GTest assertion failed in {}: \n{}",
                                   test_name, e.what());
        testpipe::debug::print_stack_trace();
        return 1;
    }
    catch (const std::exception &e)
    {
        testpipe::debug::debug_msg("[WORKER FAILURE] {} threw an exception: {}", test_name,
                                   e.what());
        testpipe::debug::print_stack_trace();
        return 2;
    }
    catch (...)
    {
        testpipe::debug::debug_msg("[WORKER FAILURE] {} threw an unknown exception.", test_name);
        testpipe::debug::print_stack_trace();
        return 3;
    }
    return 0;
}

/**
 * @brief Wraps worker logic with no lifecycle initialization.
 *
 * For workers that test pre-init behavior or control the lifecycle themselves.
 * @return 0 on success, 1 GTest failure, 2 std::exception, 3 unknown exception.
 */
template <typename Fn> int run_worker_bare(Fn test_logic, const char *test_name)
{
    ::testing::GTEST_FLAG(throw_on_failure) = true;
    try
    {
        test_logic();
    }
    catch (const ::testing::internal::GoogleTestFailureException &e)
    {
        testpipe::debug::debug_msg("[WORKER FAILURE] GTest assertion failed in {}: \n{}",
                                   test_name, e.what());
        return 1;
    }
    catch (const std::exception &e)
    {
        testpipe::debug::debug_msg("[WORKER FAILURE] {} threw an exception: {}", test_name,
                                   e.what());
        return 2;
    }
    catch (...)
    {
        testpipe::debug::debug_msg("[WORKER FAILURE] {} threw an unknown exception.", test_name);
        return 3;
    }
    return 0;
}

// ============================================================================
// ThreadRacer
// ============================================================================

/**
 * @brief Runs N threads that start together and collects what they throw.
 *
 * @code
 *   ThreadRacer racer(8);
 *   ASSERT_TRUE(racer.race([&](int id) { emitter.write_line(fmt::format("t{}", id)); }));
 * @endcode
 */
class ThreadRacer
{
  public:
    explicit ThreadRacer(int n_threads) : n_threads_(n_threads) {}

    /// @return true if every thread completed without throwing.
    template <typename F> bool race(F fn)
    {
        exceptions_.clear();
        exceptions_.resize(static_cast<size_t>(n_threads_));
        std::atomic<int> ready_count{0};
        std::atomic<bool> start_flag{false};

        std::vector<std::thread> threads;
        threads.reserve(static_cast<size_t>(n_threads_));
        for (int i = 0; i < n_threads_; ++i)
        {
            threads.emplace_back(
                [&, i]()
                {
                    ready_count.fetch_add(1, std::memory_order_release);
                    while (!start_flag.load(std::memory_order_acquire))
                        std::this_thread::yield();
                    try
                    {
                        fn(i);
                    }
                    catch (...)
                    {
                        exceptions_[static_cast<size_t>(i)] = std::current_exception();
                    }
                });
        }

        while (ready_count.load(std::memory_order_acquire) < n_threads_)
            std::this_thread::yield();
        start_flag.store(true, std::memory_order_release);

        for (auto &t : threads)
            t.join();

        return std::all_of(exceptions_.begin(), exceptions_.end(),
                           [](const std::exception_ptr &p) { return p == nullptr; });
    }

    const std::vector<std::exception_ptr> &exceptions() const { return exceptions_; }

  private:
    int n_threads_;
    std::vector<std::exception_ptr> exceptions_;
};

} // namespace testpipe::tests::helper
