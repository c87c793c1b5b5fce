#pragma once
/**
 * @file tp_platform.hpp
 * @brief Layer 0: Platform detection and platform utility declarations.
 *
 * Every file that needs platform macros (TESTPIPE_PLATFORM_LINUX, TESTPIPE_IS_POSIX,
 * etc.) should include this. It is self-contained and can be included at any point.
 *
 * Prefer build-system macros (PLATFORM_LINUX, etc.); fall back to compiler predefined macros.
 */
#include <cstddef>
#include <cstdint>
#include <string>

#if defined(PLATFORM_WIN64)
#define TESTPIPE_PLATFORM_WIN64 1
#elif defined(PLATFORM_APPLE)
#define TESTPIPE_PLATFORM_APPLE 1
#elif defined(PLATFORM_FREEBSD)
#define TESTPIPE_PLATFORM_FREEBSD 1
#elif defined(PLATFORM_LINUX)
#define TESTPIPE_PLATFORM_LINUX 1
#elif defined(PLATFORM_UNKNOWN)
#define TESTPIPE_PLATFORM_UNKNOWN 1
#else
// Fallback detection
#if defined(_WIN64)
#define TESTPIPE_PLATFORM_WIN64 1
#elif defined(__APPLE__) && defined(__MACH__)
#define TESTPIPE_PLATFORM_APPLE 1
#elif defined(__FreeBSD__)
#define TESTPIPE_PLATFORM_FREEBSD 1
#elif defined(__linux__)
#define TESTPIPE_PLATFORM_LINUX 1
#else
#define TESTPIPE_PLATFORM_UNKNOWN 1
#endif
#endif

#if defined(TESTPIPE_PLATFORM_WIN64)
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#endif

// Convenience booleans for source code usage:
#if defined(TESTPIPE_PLATFORM_WIN64)
#define TESTPIPE_IS_WINDOWS 1
#undef TESTPIPE_IS_POSIX
#elif defined(TESTPIPE_PLATFORM_APPLE) || defined(TESTPIPE_PLATFORM_FREEBSD) ||                    \
    defined(TESTPIPE_PLATFORM_LINUX)
#undef TESTPIPE_IS_WINDOWS
#define TESTPIPE_IS_POSIX 1
#else
#undef TESTPIPE_IS_WINDOWS
#undef TESTPIPE_IS_POSIX
#endif

// --- Require C++20 or later --------------------------------------------------
// For GCC/Clang use __cplusplus; for MSVC use _MSVC_LANG (MSVC sets __cplusplus only when
// /Zc:__cplusplus is enabled).
#if defined(_MSC_VER)
#if !defined(_MSVC_LANG) || (_MSVC_LANG < 202002L)
#error "This project requires C++20 or later. Please compile with /std:c++20 or newer (MSVC)."
#endif
#else
#if __cplusplus < 202002L
#error "This project requires C++20 or later. Please compile with -std=c++20 or newer."
#endif
#endif

#include "testpipe_utils_export.h"

namespace testpipe::platform
{

/**
 * @brief Gets the native thread ID for the calling thread.
 * @return A 64-bit unsigned integer representing the thread ID.
 */
TESTPIPE_UTILS_EXPORT uint64_t get_native_thread_id() noexcept;
/**
 * @brief Gets the process ID (PID) for the current process.
 * @return A 64-bit unsigned integer representing the process ID.
 */
TESTPIPE_UTILS_EXPORT uint64_t get_pid();
/**
 * @brief Gets the name of the current executable.
 * @param include_path If `true`, returns the full absolute path to the executable.
 *                     If `false` (default), returns only the filename.
 * @return A string containing the name of the executable. Returns "unknown" on failure.
 */
TESTPIPE_UTILS_EXPORT std::string get_executable_name(bool include_path = false) noexcept;

/**
 * @brief Gets a monotonic timestamp in nanoseconds.
 * @note The absolute value is meaningless; use for computing time deltas only.
 */
TESTPIPE_UTILS_EXPORT uint64_t monotonic_time_ns() noexcept;

} // namespace testpipe::platform
