/*******************************************************************************
 * @file child_process.cpp
 * @brief Engine process spawning and its shared output pipe.
 ******************************************************************************/

#include "pipe/child_process.hpp"

#include "tp_service.hpp"

#include <cerrno>
#include <cstring>
#include <string_view>

#if defined(TESTPIPE_IS_POSIX)
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char **environ;
#endif

namespace testpipe::pipe
{

#if defined(TESTPIPE_IS_POSIX)

namespace
{

int decode_wait_status(int status) noexcept
{
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
        return 128 + WTERMSIG(status);
    return -1;
}

// Inherited environment with @p extra replacing or adding entries.
std::vector<std::string> build_environment(const ChildProcess::Environment &extra)
{
    std::vector<std::string> env;
    for (char **e = environ; e != nullptr && *e != nullptr; ++e)
    {
        std::string_view entry(*e);
        const auto eq = entry.find('=');
        const auto key = entry.substr(0, eq);
        bool overridden = false;
        for (const auto &[k, v] : extra)
        {
            if (k == key)
            {
                overridden = true;
                break;
            }
        }
        if (!overridden)
            env.emplace_back(entry);
    }
    for (const auto &[k, v] : extra)
        env.push_back(k + "=" + v);
    return env;
}

std::vector<char *> c_strings(std::vector<std::string> &strings)
{
    std::vector<char *> out;
    out.reserve(strings.size() + 1);
    for (auto &s : strings)
        out.push_back(s.data());
    out.push_back(nullptr);
    return out;
}

} // namespace

utils::Result<ChildProcess, SpawnError> ChildProcess::spawn(const std::vector<std::string> &argv,
                                                            const Environment &extra_env)
{
    using R = utils::Result<ChildProcess, SpawnError>;
    if (argv.empty() || argv.front().empty())
        return R::error(SpawnError::EmptyCommand);

    int fds[2] = {-1, -1};
    if (::pipe(fds) != 0)
        return R::error(SpawnError::PipeFailed, errno);
    // Neither end may leak into unrelated children spawned later.
    ::fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    ::fcntl(fds[1], F_SETFD, FD_CLOEXEC);

    // Everything the child touches is prepared before fork().
    std::vector<std::string> args_copy(argv);
    std::vector<char *> c_argv = c_strings(args_copy);
    std::vector<std::string> env = build_environment(extra_env);
    std::vector<char *> c_env = c_strings(env);

    const pid_t pid = ::fork();
    if (pid < 0)
    {
        const int err = errno;
        ::close(fds[0]);
        ::close(fds[1]);
        return R::error(SpawnError::ForkFailed, err);
    }
    if (pid == 0)
    {
        // dup2 clears FD_CLOEXEC on the duplicates.
        ::dup2(fds[1], STDOUT_FILENO);
        ::dup2(fds[1], STDERR_FILENO);
        environ = c_env.data();
        ::execvp(c_argv[0], c_argv.data());
        _exit(127);
    }

    ::close(fds[1]);
    LOGGER_DEBUG("Spawned engine '{}' as pid {}", argv.front(), pid);
    return R::ok(ChildProcess(pid, fds[0]));
}

ChildProcess::ChildProcess(ChildProcess &&other) noexcept
    : m_pid(std::exchange(other.m_pid, -1)), m_fd(std::exchange(other.m_fd, -1)),
      m_exit_status(std::exchange(other.m_exit_status, std::nullopt))
{
}

ChildProcess &ChildProcess::operator=(ChildProcess &&other) noexcept
{
    if (this != &other)
    {
        release();
        m_pid = std::exchange(other.m_pid, -1);
        m_fd = std::exchange(other.m_fd, -1);
        m_exit_status = std::exchange(other.m_exit_status, std::nullopt);
    }
    return *this;
}

ChildProcess::~ChildProcess()
{
    release();
}

void ChildProcess::release() noexcept
{
    if (m_fd >= 0)
    {
        ::close(m_fd);
        m_fd = -1;
    }
    if (m_pid > 0 && !m_exit_status)
    {
        if (!poll_exit())
        {
            ::kill(m_pid, SIGTERM);
            int status = 0;
            while (::waitpid(m_pid, &status, 0) < 0 && errno == EINTR)
            {
            }
        }
    }
    m_pid = -1;
}

ReadResult ChildProcess::read_chunk(char *buf, std::size_t size,
                                    std::chrono::milliseconds timeout)
{
    if (m_fd < 0)
        return {ReadResult::Status::EndOfStream, 0, 0};

    pollfd pfd{m_fd, POLLIN, 0};
    const int rc = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (rc == 0)
        return {ReadResult::Status::WouldBlock, 0, 0};
    if (rc < 0)
    {
        if (errno == EINTR)
            return {ReadResult::Status::WouldBlock, 0, 0};
        return {ReadResult::Status::Error, 0, errno};
    }

    const ssize_t n = ::read(m_fd, buf, size);
    if (n > 0)
        return {ReadResult::Status::Data, static_cast<std::size_t>(n), 0};
    if (n == 0)
        return {ReadResult::Status::EndOfStream, 0, 0};
    if (errno == EINTR || errno == EAGAIN)
        return {ReadResult::Status::WouldBlock, 0, 0};
    return {ReadResult::Status::Error, 0, errno};
}

std::optional<int> ChildProcess::poll_exit()
{
    if (m_exit_status)
        return m_exit_status;
    if (m_pid <= 0)
        return std::nullopt;
    int status = 0;
    const pid_t rc = ::waitpid(m_pid, &status, WNOHANG);
    if (rc == m_pid)
        m_exit_status = decode_wait_status(status);
    else if (rc < 0 && errno == ECHILD)
        m_exit_status = -1;
    return m_exit_status;
}

int ChildProcess::wait()
{
    if (m_exit_status)
        return *m_exit_status;
    if (m_pid <= 0)
        return -1;
    int status = 0;
    pid_t rc;
    do
    {
        rc = ::waitpid(m_pid, &status, 0);
    } while (rc < 0 && errno == EINTR);
    m_exit_status = rc == m_pid ? decode_wait_status(status) : -1;
    return *m_exit_status;
}

void ChildProcess::terminate()
{
    if (m_pid > 0 && !poll_exit())
    {
        LOGGER_INFO("Terminating engine pid {}", m_pid);
        ::kill(m_pid, SIGTERM);
    }
}

#else // !TESTPIPE_IS_POSIX

utils::Result<ChildProcess, SpawnError> ChildProcess::spawn(const std::vector<std::string> &,
                                                            const Environment &)
{
    return utils::Result<ChildProcess, SpawnError>::error(SpawnError::NotSupported);
}

ChildProcess::ChildProcess(ChildProcess &&other) noexcept
    : m_pid(std::exchange(other.m_pid, -1)), m_fd(std::exchange(other.m_fd, -1))
{
}
ChildProcess &ChildProcess::operator=(ChildProcess &&other) noexcept
{
    m_pid = std::exchange(other.m_pid, -1);
    m_fd = std::exchange(other.m_fd, -1);
    return *this;
}
ChildProcess::~ChildProcess() = default;
void ChildProcess::release() noexcept {}
ReadResult ChildProcess::read_chunk(char *, std::size_t, std::chrono::milliseconds)
{
    return {ReadResult::Status::EndOfStream, 0, 0};
}
std::optional<int> ChildProcess::poll_exit()
{
    return -1;
}
int ChildProcess::wait()
{
    return -1;
}
void ChildProcess::terminate() {}

#endif

} // namespace testpipe::pipe
