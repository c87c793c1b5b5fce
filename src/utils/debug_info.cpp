/**
 * @file debug_info.cpp
 * @brief Stack trace printing for testpipe::debug::print_stack_trace().
 *
 * POSIX builds resolve frames with backtrace()/dladdr() and demangle C++ names.
 * Other platforms print a single notice line.
 */
#include "tp_base.hpp"

#if defined(TESTPIPE_IS_POSIX)
#include <cxxabi.h>   // __cxa_demangle
#include <dlfcn.h>    // dladdr
#include <execinfo.h> // backtrace, backtrace_symbols
#include <memory>
#include <string>
#endif

namespace testpipe::debug
{

namespace
{
// Printing inside a crash path must never throw.
template <typename... Args>
void safe_format_to_stderr(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    try
    {
        fmt::print(stderr, fmt_str, std::forward<Args>(args)...);
    }
    catch (const std::exception &)
    {
        std::fputs("[stack trace formatting failed]\n", stderr);
    }
}
} // namespace

void print_stack_trace() noexcept
{
#if defined(TESTPIPE_IS_POSIX)
    safe_format_to_stderr("Stack Trace (most recent call first):\n");

    constexpr int kMaxFrames = 128;
    void *callstack[kMaxFrames];
    int nframes = backtrace(callstack, kMaxFrames);
    if (nframes <= 0)
    {
        safe_format_to_stderr("  [No stack frames available]\n");
        return;
    }

    std::unique_ptr<char *, decltype(&std::free)> symbols(backtrace_symbols(callstack, nframes),
                                                          &std::free);
    // Frame 0 is this function.
    for (int i = 1; i < nframes; ++i)
    {
        const auto addr = reinterpret_cast<uintptr_t>(callstack[i]);
        Dl_info info{};
        if (dladdr(callstack[i], &info) != 0 && info.dli_sname != nullptr)
        {
            int status = 0;
            std::unique_ptr<char, decltype(&std::free)> demangled(
                abi::__cxa_demangle(info.dli_sname, nullptr, nullptr, &status), &std::free);
            const char *name = (status == 0 && demangled) ? demangled.get() : info.dli_sname;
            const auto sym_addr = reinterpret_cast<uintptr_t>(info.dli_saddr);
            safe_format_to_stderr("  #{:02}  {:#018x}  {} + {:#x}  ({})\n", i, addr, name,
                                  addr - sym_addr,
                                  info.dli_fname != nullptr
                                      ? format_tools::filename_only(info.dli_fname)
                                      : std::string_view{"?"});
        }
        else if (symbols)
        {
            safe_format_to_stderr("  #{:02}  {}\n", i, symbols.get()[i]);
        }
        else
        {
            safe_format_to_stderr("  #{:02}  {:#018x}  [symbol unknown]\n", i, addr);
        }
    }
    std::fflush(stderr);
#else
    safe_format_to_stderr("  [Stack trace not supported on this platform]\n");
#endif
}

} // namespace testpipe::debug
