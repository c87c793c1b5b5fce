#include "utils/logger_sinks/file_sink.hpp"

#include <cerrno>
#include <stdexcept>
#include <system_error>

#if defined(TESTPIPE_IS_POSIX)
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>
#endif

namespace testpipe::utils
{

#if defined(TESTPIPE_IS_POSIX)

FileSink::FileSink(const std::string &path) : m_path(path)
{
    m_fd = ::open(m_path.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, 0644);
    if (m_fd == -1)
    {
        throw std::runtime_error(fmt::format("Cannot open log file '{}': {}", path,
                                             std::generic_category().message(errno)));
    }
}

FileSink::~FileSink()
{
    if (m_fd != -1)
        ::close(m_fd);
}

void FileSink::write(const LogMessage &msg)
{
    const std::string line = format_logmsg(msg);
    ::flock(m_fd, LOCK_EX);
    const ssize_t n = ::write(m_fd, line.data(), line.size());
    const int saved_errno = errno;
    ::flock(m_fd, LOCK_UN);
    if (n != static_cast<ssize_t>(line.size()))
    {
        throw std::system_error(n < 0 ? saved_errno : EIO, std::generic_category(),
                                fmt::format("short write to {}", m_path.string()));
    }
}

void FileSink::flush()
{
    ::fsync(m_fd);
}

#else

FileSink::FileSink(const std::string &path) : m_path(path)
{
    m_file = std::fopen(path.c_str(), "ab");
    if (m_file == nullptr)
        throw std::runtime_error(fmt::format("Cannot open log file '{}'", path));
}

FileSink::~FileSink()
{
    if (m_file != nullptr)
        std::fclose(m_file);
}

void FileSink::write(const LogMessage &msg)
{
    const std::string line = format_logmsg(msg);
    if (std::fwrite(line.data(), 1, line.size(), m_file) != line.size())
    {
        throw std::system_error(errno, std::generic_category(),
                                fmt::format("short write to {}", m_path.string()));
    }
}

void FileSink::flush()
{
    std::fflush(m_file);
}

#endif

} // namespace testpipe::utils
