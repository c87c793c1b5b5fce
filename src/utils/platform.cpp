/**
 * @file platform.cpp
 * @brief Cross-platform implementations for the process and thread helpers declared in
 *        `testpipe::platform`.
 */
#include "tp_base.hpp"

#include <chrono>
#include <filesystem>
#include <thread>
#include <vector>

#if defined(TESTPIPE_IS_POSIX)
#include <limits.h>
#include <sys/syscall.h>
#include <sys/types.h>
#include <unistd.h>
#endif

#ifdef TESTPIPE_PLATFORM_FREEBSD
#include <sys/sysctl.h>
#endif

#if defined(TESTPIPE_PLATFORM_APPLE)
#include <mach-o/dyld.h> // _NSGetExecutablePath
#endif

namespace testpipe::platform
{

uint64_t get_pid()
{
#if defined(TESTPIPE_PLATFORM_WIN64)
    return static_cast<uint64_t>(GetCurrentProcessId());
#else
    return static_cast<uint64_t>(getpid());
#endif
}

/**
 * @brief Gets a platform-native thread ID, suitable for log lines.
 */
uint64_t get_native_thread_id() noexcept
{
#if defined(TESTPIPE_PLATFORM_WIN64)
    return static_cast<uint64_t>(::GetCurrentThreadId());
#elif defined(__APPLE__)
    uint64_t tid;
    pthread_threadid_np(nullptr, &tid);
    return tid;
#elif defined(__linux__)
    return static_cast<uint64_t>(syscall(SYS_gettid));
#else
    return std::hash<std::thread::id>()(std::this_thread::get_id());
#endif
}

/**
 * @brief Discovers the name and optionally the full path of the current executable.
 * @details Used to locate the `config/` directory next to the installed binaries and by
 *          the test framework to re-launch itself in worker mode.
 */
std::string get_executable_name(bool include_path) noexcept
{
    try
    {
        std::string full_path;
#if defined(TESTPIPE_PLATFORM_LINUX)
        std::vector<char> buf(PATH_MAX);
        ssize_t count = readlink("/proc/self/exe", buf.data(), buf.size());
        if (count == -1)
        {
            return "unknown_linux";
        }
        full_path.assign(buf.data(), static_cast<size_t>(count));
#elif defined(TESTPIPE_PLATFORM_APPLE)
        uint32_t size = 0;
        if (_NSGetExecutablePath(nullptr, &size) == -1 && size > 0)
        {
            std::vector<char> buf(size);
            if (_NSGetExecutablePath(buf.data(), &size) == 0)
            {
                char resolved[PATH_MAX];
                full_path = realpath(buf.data(), resolved) != nullptr ? resolved : buf.data();
            }
        }
        if (full_path.empty())
        {
            return "unknown_macos";
        }
#elif defined(TESTPIPE_PLATFORM_FREEBSD)
        int mib[4] = {CTL_KERN, KERN_PROC, KERN_PROC_PATHNAME, -1};
        size_t buffer_size = 0;
        if (sysctl(mib, 4, nullptr, &buffer_size, nullptr, 0) == -1)
        {
            return "unknown_freebsd";
        }
        std::vector<char> buf(buffer_size);
        if (sysctl(mib, 4, buf.data(), &buffer_size, nullptr, 0) == -1)
        {
            return "unknown_freebsd";
        }
        full_path.assign(buf.data(), buffer_size - 1);
#else
        (void)include_path;
        return "unknown";
#endif
        if (include_path)
        {
            return full_path;
        }
        return std::filesystem::path(full_path).filename().string();
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "Warning: get_executable_name failed: {}.\n", e.what());
    }
    return "unknown";
}

uint64_t monotonic_time_ns() noexcept
{
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
                                     std::chrono::steady_clock::now().time_since_epoch())
                                     .count());
}

} // namespace testpipe::platform
