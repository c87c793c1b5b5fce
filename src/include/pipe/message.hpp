#pragma once

/*******************************************************************************
 * @file message.hpp
 * @brief The line protocol: message kinds, their wire names, and frame text.
 *
 * A frame is one line: `<<--RICH-PIPE-->>: <name> <hex-arg> <hex-arg> ...`.
 * Every other line on the channel is passthrough text.
 ******************************************************************************/

#include <array>
#include <bitset>
#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace testpipe::pipe
{

inline constexpr std::string_view kSentinel = "<<--RICH-PIPE-->>:";

enum class MessageKind : std::size_t
{
    Init,
    SessionStart,
    RunTestLoop,
    SessionEnd,
    Unconfigure,
    CollectionStart,
    CollectReport,
    DeselectTests,
    CollectionFinish,
    StartRunPhase,
    StartTest,
    TestReport,
    EndTest,
    WriteSep,
    Write,
    WriteLine,
    Rewrite,
    RichWrite,
    RichWriteLine,
    InternalError,
    WarningRecorded,
    KeyboardInterrupt,
    CopyStdout,
    CopyStderr,
};

inline constexpr std::size_t kMessageKindCount = 24;

using MessageKindSet = std::bitset<kMessageKindCount>;

MessageKindSet make_kind_set(std::initializer_list<MessageKind> kinds);
/// Every kind; for observers that want the full stream.
MessageKindSet all_kinds();

std::string_view message_name(MessageKind kind) noexcept;
std::optional<MessageKind> message_kind_from_name(std::string_view name) noexcept;

/// Per-test messages that are held back until the run phase is confirmed.
bool is_run_phase_message(MessageKind kind) noexcept;

/// Builds the frame line (without the trailing newline).
std::string format_frame(MessageKind kind, const std::vector<std::string> &encoded_args);

struct RawFrame
{
    std::string name;              ///< Empty when the sentinel had nothing after it.
    std::vector<std::string> args; ///< Still hex-encoded.
};

/**
 * @brief Splits a frame into name and argument tokens.
 * @return std::nullopt for passthrough text (the first token is not the sentinel).
 */
std::optional<RawFrame> parse_frame(std::string_view line);

} // namespace testpipe::pipe
