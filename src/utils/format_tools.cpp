// format_tools.cpp
#include "tp_base.hpp"

namespace testpipe::format_tools
{

// Manual two-step method: seconds through fmt's chrono support, microseconds appended.
std::string formatted_time(std::chrono::system_clock::time_point timestamp)
{
    auto tp_us = std::chrono::time_point_cast<std::chrono::microseconds>(timestamp);
    auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp_us);
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(tp_us - secs).count();
    // normalize to 0..999999 even for negative timestamps
    int fractional_us = static_cast<int>(us % 1000000);
    if (fractional_us < 0)
        fractional_us += 1000000;
    auto sec_part = fmt::format("{:%Y-%m-%d %H:%M:%S}", secs);
    return fmt::format("{}.{:06d}", sec_part, fractional_us);
}

const char *to_string(HexError err) noexcept
{
    switch (err)
    {
    case HexError::InvalidCharacter:
        return "InvalidCharacter";
    case HexError::OddLength:
        return "OddLength";
    default:
        return "Unknown";
    }
}

namespace
{
constexpr char kHexDigits[] = "0123456789abcdef";

constexpr int hex_value(char c) noexcept
{
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}
} // namespace

std::string to_hex(std::string_view bytes)
{
    std::string out;
    out.reserve(bytes.size() * 2);
    for (unsigned char b : bytes)
    {
        out.push_back(kHexDigits[b >> 4]);
        out.push_back(kHexDigits[b & 0x0f]);
    }
    return out;
}

utils::Result<std::string, HexError> from_hex(std::string_view text)
{
    using R = utils::Result<std::string, HexError>;
    // A bad character is reported before a bad length: its offset is more useful.
    for (std::size_t i = 0; i < text.size(); ++i)
    {
        if (hex_value(text[i]) < 0)
        {
            return R::error(HexError::InvalidCharacter, static_cast<int>(i));
        }
    }
    if (text.size() % 2 != 0)
    {
        return R::error(HexError::OddLength, static_cast<int>(text.size()));
    }

    std::string out;
    out.reserve(text.size() / 2);
    for (std::size_t i = 0; i < text.size(); i += 2)
    {
        out.push_back(static_cast<char>((hex_value(text[i]) << 4) | hex_value(text[i + 1])));
    }
    return R::ok(std::move(out));
}

std::vector<std::string> wrap_text(std::string_view text, std::size_t width)
{
    std::vector<std::string> chunks;
    if (width == 0)
    {
        chunks.emplace_back(text);
        return chunks;
    }
    std::size_t start = 0;
    while (start < text.size())
    {
        auto newline = text.find('\n', start);
        std::string_view line = newline == std::string_view::npos
                                    ? text.substr(start)
                                    : text.substr(start, newline - start);
        if (line.empty())
        {
            chunks.emplace_back();
        }
        for (std::size_t pos = 0; pos < line.size(); pos += width)
        {
            chunks.emplace_back(line.substr(pos, width));
        }
        if (newline == std::string_view::npos)
        {
            break;
        }
        start = newline + 1;
    }
    return chunks;
}

std::string_view trim_trailing_whitespace(std::string_view str) noexcept
{
    constexpr std::string_view whitespace = " \t\n\r\f\v";
    auto last = str.find_last_not_of(whitespace);
    if (last == std::string_view::npos)
    {
        return str.substr(0, 0);
    }
    return str.substr(0, last + 1);
}

} // namespace testpipe::format_tools
