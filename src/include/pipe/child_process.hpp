#pragma once

/*******************************************************************************
 * @file child_process.hpp
 * @brief The engine process and the byte stream it writes.
 *
 * ByteSource is the seam between the stream reconstructor and the operating
 * system: ChildProcess implements it with a POSIX pipe, tests implement it with
 * scripted chunks.
 ******************************************************************************/

#include "pipe/errors.hpp"
#include "utils/result.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace testpipe::pipe
{

struct ReadResult
{
    enum class Status
    {
        Data,        ///< `bytes` bytes were read.
        WouldBlock,  ///< Nothing arrived within the timeout.
        EndOfStream, ///< Every writer closed its end.
        Error,       ///< The read failed; `error` holds errno.
    };

    Status status{Status::WouldBlock};
    std::size_t bytes{0};
    int error{0};
};

class ByteSource
{
  public:
    virtual ~ByteSource() = default;

    /// Waits at most @p timeout for data and reads up to @p size bytes into @p buf.
    virtual ReadResult read_chunk(char *buf, std::size_t size,
                                  std::chrono::milliseconds timeout) = 0;
    /// The exit status if the producer has exited, without blocking.
    virtual std::optional<int> poll_exit() = 0;
    /// Blocks until the producer exits and returns its exit status.
    virtual int wait() = 0;
    /// Asks the producer to stop.
    virtual void terminate() = 0;
};

/**
 * @class ChildProcess
 * @brief A spawned engine whose stdout and stderr share one pipe.
 *
 * Exit statuses follow the shell convention: a normal exit gives its code, death
 * by signal gives 128 + the signal number, and a failed exec gives 127. The
 * destructor closes the pipe and reaps the child, sending SIGTERM first if it is
 * still running.
 */
class ChildProcess : public ByteSource
{
  public:
    using Environment = std::vector<std::pair<std::string, std::string>>;

    /**
     * @brief Starts @p argv[0] (looked up on PATH) with @p argv.
     * @param extra_env Variables set in the child on top of the inherited environment.
     */
    [[nodiscard]] static utils::Result<ChildProcess, SpawnError>
    spawn(const std::vector<std::string> &argv, const Environment &extra_env = {});

    ChildProcess(ChildProcess &&other) noexcept;
    ChildProcess &operator=(ChildProcess &&other) noexcept;
    ChildProcess(const ChildProcess &) = delete;
    ChildProcess &operator=(const ChildProcess &) = delete;
    ~ChildProcess() override;

    ReadResult read_chunk(char *buf, std::size_t size, std::chrono::milliseconds timeout) override;
    std::optional<int> poll_exit() override;
    int wait() override;
    void terminate() override;

    int pid() const noexcept { return m_pid; }

  private:
    ChildProcess(int pid, int read_fd) noexcept : m_pid(pid), m_fd(read_fd) {}
    void release() noexcept;

    int m_pid{-1};
    int m_fd{-1};
    std::optional<int> m_exit_status;
};

} // namespace testpipe::pipe
