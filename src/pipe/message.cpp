/*******************************************************************************
 * @file message.cpp
 * @brief Message kind names and frame text parsing and formatting.
 ******************************************************************************/

#include "pipe/message.hpp"

namespace testpipe::pipe
{

namespace
{

constexpr std::array<std::string_view, kMessageKindCount> kNames{
    "proto_init",
    "proto_session_start",
    "proto_runtestloop",
    "proto_session_end",
    "proto_unconfigure",
    "proto_test_collection_start",
    "proto_test_collect_report",
    "proto_deselect_tests",
    "proto_test_collection_finish",
    "proto_start_run_phase",
    "proto_start_test",
    "proto_test_report",
    "proto_end_test",
    "write_sep",
    "write",
    "write_line",
    "rewrite",
    "rich_write",
    "rich_write_line",
    "proto_internal_error",
    "proto_warning_recorded",
    "proto_keyboard_interrupt",
    "copy_stdout",
    "copy_stderr",
};

constexpr bool is_space(char c) noexcept
{
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
}

std::vector<std::string_view> split_whitespace(std::string_view text)
{
    std::vector<std::string_view> out;
    std::size_t i = 0;
    while (i < text.size())
    {
        while (i < text.size() && is_space(text[i]))
            ++i;
        const std::size_t start = i;
        while (i < text.size() && !is_space(text[i]))
            ++i;
        if (i > start)
            out.push_back(text.substr(start, i - start));
    }
    return out;
}

} // namespace

MessageKindSet make_kind_set(std::initializer_list<MessageKind> kinds)
{
    MessageKindSet set;
    for (auto k : kinds)
        set.set(static_cast<std::size_t>(k));
    return set;
}

MessageKindSet all_kinds()
{
    MessageKindSet set;
    set.set();
    return set;
}

std::string_view message_name(MessageKind kind) noexcept
{
    const auto idx = static_cast<std::size_t>(kind);
    return idx < kNames.size() ? kNames[idx] : std::string_view("unknown");
}

std::optional<MessageKind> message_kind_from_name(std::string_view name) noexcept
{
    for (std::size_t i = 0; i < kNames.size(); ++i)
    {
        if (kNames[i] == name)
            return static_cast<MessageKind>(i);
    }
    return std::nullopt;
}

bool is_run_phase_message(MessageKind kind) noexcept
{
    return kind == MessageKind::StartTest || kind == MessageKind::TestReport ||
           kind == MessageKind::EndTest;
}

std::string format_frame(MessageKind kind, const std::vector<std::string> &encoded_args)
{
    std::string line;
    line.reserve(kSentinel.size() + 32);
    line.append(kSentinel);
    line += ' ';
    line.append(message_name(kind));
    for (const auto &arg : encoded_args)
    {
        line += ' ';
        line += arg;
    }
    return line;
}

std::optional<RawFrame> parse_frame(std::string_view line)
{
    const auto tokens = split_whitespace(line);
    if (tokens.empty() || tokens.front() != kSentinel)
        return std::nullopt;

    RawFrame frame;
    if (tokens.size() > 1)
        frame.name = std::string(tokens[1]);
    for (std::size_t i = 2; i < tokens.size(); ++i)
        frame.args.emplace_back(tokens[i]);
    return frame;
}

} // namespace testpipe::pipe
