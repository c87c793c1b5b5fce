// Tools for formatting strings and byte payloads
#pragma once
#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>

#include "tp_platform.hpp"
#include "utils/result.hpp"

namespace testpipe::format_tools
{

/**
 * @brief Formats a system_clock time_point into a string with microsecond precision.
 * @return A string in the format "YYYY-MM-DD HH:MM:SS.us".
 */
TESTPIPE_UTILS_EXPORT std::string formatted_time(std::chrono::system_clock::time_point timestamp);

/// Failure modes of from_hex(). The Result's error_code() carries the offending offset.
enum class HexError
{
    InvalidCharacter,
    OddLength
};

TESTPIPE_UTILS_EXPORT const char *to_string(HexError err) noexcept;

/**
 * @brief Encodes raw bytes as lowercase hexadecimal text, two characters per byte.
 */
TESTPIPE_UTILS_EXPORT std::string to_hex(std::string_view bytes);

/**
 * @brief Decodes hexadecimal text (either case) back into raw bytes.
 * @return The bytes, or HexError::InvalidCharacter with the offset of the first
 *         non-hex character, or HexError::OddLength with the text length.
 */
TESTPIPE_UTILS_EXPORT utils::Result<std::string, HexError> from_hex(std::string_view text);

/**
 * @brief Splits text into chunks of at most @p width characters.
 * @details Splits hard at the width; existing newlines start a new chunk. Used to keep
 *          very long diagnostic payloads readable in log files.
 */
TESTPIPE_UTILS_EXPORT std::vector<std::string> wrap_text(std::string_view text, std::size_t width);

/**
 * @brief Removes trailing whitespace (space, tab, CR, LF, FF, VT).
 */
TESTPIPE_UTILS_EXPORT std::string_view trim_trailing_whitespace(std::string_view str) noexcept;

/**
 * @brief Creates a `fmt::memory_buffer` from a compile-time format string and arguments.
 */
template <typename... Args>
fmt::memory_buffer make_buffer(fmt::format_string<Args...> fmt_str, Args &&...args)
{
    fmt::memory_buffer mb;
    mb.reserve(128); // small reserve to avoid many reallocs
    fmt::format_to(std::back_inserter(mb), fmt_str, std::forward<Args>(args)...);
    return mb;
}

/**
 * @brief Extracts the filename from a full path at compile time.
 */
constexpr std::string_view filename_only(std::string_view file_path) noexcept
{
    const auto last_slash = file_path.find_last_of('/');
    const auto last_backslash = file_path.find_last_of('\\');

    const std::string_view::size_type last_separator_pos = [&]()
    {
        if (last_slash == std::string_view::npos)
        {
            return last_backslash;
        }
        if (last_backslash == std::string_view::npos)
        {
            return last_slash;
        }
        return last_slash > last_backslash ? last_slash : last_backslash;
    }();

    if (last_separator_pos == std::string_view::npos)
    {
        return file_path;
    }
    return file_path.substr(last_separator_pos + 1);
}

} // namespace testpipe::format_tools
