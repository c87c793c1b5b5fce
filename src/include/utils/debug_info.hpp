/**
 * @file debug_info.hpp
 * @brief Debugging utilities: stack trace printing, panic handling for programming
 *        errors, and debug messaging.
 *
 * All functions live in `testpipe::debug`. They use `fmt` for compile-time format
 * string checks and `std::source_location` for automatic location reporting.
 * `panic` is reserved for misuse of the ambient stack (for example configuring the
 * Logger before the lifecycle has started it); protocol and engine failures are
 * reported through exceptions instead.
 */
#pragma once

#include <cstdio>
#include <cstdlib>
#include <fmt/format.h>
#include <source_location>
#include <string>
#include <string_view>

#include "tp_platform.hpp"
#include "utils/format_tools.hpp"

/**
 * @brief Renders a source location as "file:line:function".
 */
inline std::string SRCLOC_TO_STR(std::source_location loc)
{
    return fmt::format("{}:{}:{}", testpipe::format_tools::filename_only(loc.file_name()),
                       loc.line(), loc.function_name());
}

namespace testpipe::debug
{

/**
 * @brief Prints the current call stack to `stderr`.
 *
 * On POSIX it uses `backtrace`, `dladdr` and `__cxa_demangle`. Not async-signal-safe.
 */
TESTPIPE_UTILS_EXPORT void print_stack_trace() noexcept;

/**
 * @brief Halts the program with a fatal error message and a stack trace.
 * @noreturn This function never returns.
 */
template <typename... Args>
[[noreturn]] inline void panic(std::source_location loc, fmt::format_string<Args...> fmt_str,
                               Args &&...args) noexcept
{
    try
    {
        const auto body = fmt::format(fmt_str, std::forward<Args>(args)...);
        fmt::print(stderr, "[PANIC] {} -- {}\n", SRCLOC_TO_STR(loc), body);
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr,
                   "[PANIC] {} -- FATAL FORMAT ERROR WHEN PANIC fmt_str['{}']\n"
                   "[PANIC]  Exception: '{}'\n",
                   SRCLOC_TO_STR(loc), fmt::string_view(fmt_str), e.what());
    }
    std::fflush(stderr);
    print_stack_trace();
    std::abort();
}

/**
 * @brief Prints a debug message to `stderr` with compile-time format checking.
 */
template <typename... Args>
inline void debug_msg(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    try
    {
        const auto body = fmt::format(fmt_str, std::forward<Args>(args)...);
        fmt::print(stderr, "[DBG]  {}\n", body);
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr,
                   "[DBG]  FATAL FORMAT ERROR DURING DEBUG_MSG: fmt_str['{}']\n"
                   "[DBG]  Exception: '{}'\n",
                   fmt::string_view(fmt_str), e.what());
        std::fflush(stderr);
    }
}

// Runtime format string; args by const& so make_format_args binds.
template <typename... Args>
inline void debug_msg_rt(std::string_view fmt_str, const Args &...args) noexcept
{
    try
    {
        fmt::print(stderr, "[DBG]  ");
        fmt::vprint(stderr, fmt_str, fmt::make_format_args(args...));
        fmt::print(stderr, "\n");
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr,
                   "[DBG]  FATAL FORMAT ERROR DURING DEBUG_MSG_RT: fmt_str['{}']\n"
                   "[DBG]  Exception: '{}'\n",
                   fmt_str, e.what());
        std::fflush(stderr);
    }
}

} // namespace testpipe::debug

// ---------------- thin macros for convenience --------------
#ifndef TP_LOC_HERE_STR
#define TP_LOC_HERE_STR (SRCLOC_TO_STR(std::source_location::current()))
#endif

#ifndef TP_PANIC
#define TP_PANIC(fmt, ...)                                                                         \
    ::testpipe::debug::panic(std::source_location::current(),                                      \
                             FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#endif

#ifndef TP_DEBUG
#if defined(TESTPIPE_ENABLE_DEBUG_MESSAGES)
#define TP_DEBUG(fmt, ...) ::testpipe::debug::debug_msg(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#else
#define TP_DEBUG(fmt, ...)                                                                         \
    do                                                                                             \
    {                                                                                              \
    } while (0)
#endif
#endif

#ifndef TP_DEBUG_RT
#if defined(TESTPIPE_ENABLE_DEBUG_MESSAGES)
#define TP_DEBUG_RT(fmt, ...) ::testpipe::debug::debug_msg_rt(fmt __VA_OPT__(, ) __VA_ARGS__)
#else
#define TP_DEBUG_RT(fmt, ...)                                                                      \
    do                                                                                             \
    {                                                                                              \
    } while (0)
#endif
#endif
