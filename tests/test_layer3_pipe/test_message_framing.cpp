// tests/test_layer3_pipe/test_message_framing.cpp
/**
 * @file test_message_framing.cpp
 * @brief Wire names, frame text, and line reassembly from arbitrary chunks.
 */
#include "tp_pipe.hpp"
#include "test_patterns.h"

#include <gmock/gmock.h>

using namespace testpipe::pipe;
using testpipe::tests::PureApiTest;
using ::testing::ElementsAre;

class MessageTest : public PureApiTest
{
};

TEST_F(MessageTest, EveryKindRoundTripsThroughItsName)
{
    for (std::size_t i = 0; i < kMessageKindCount; ++i)
    {
        const auto kind = static_cast<MessageKind>(i);
        const auto name = message_name(kind);
        auto back = message_kind_from_name(name);
        ASSERT_TRUE(back.has_value()) << name;
        EXPECT_EQ(*back, kind);
    }
    EXPECT_FALSE(message_kind_from_name("proto_bogus").has_value());
}

TEST_F(MessageTest, WireNamesMatchTheProtocol)
{
    EXPECT_EQ(message_name(MessageKind::Init), "proto_init");
    EXPECT_EQ(message_name(MessageKind::CollectReport), "proto_test_collect_report");
    EXPECT_EQ(message_name(MessageKind::StartRunPhase), "proto_start_run_phase");
    EXPECT_EQ(message_name(MessageKind::WriteSep), "write_sep");
    EXPECT_EQ(message_name(MessageKind::CopyStderr), "copy_stderr");
}

TEST_F(MessageTest, OnlyPerTestMessagesAreRunPhaseMessages)
{
    EXPECT_TRUE(is_run_phase_message(MessageKind::StartTest));
    EXPECT_TRUE(is_run_phase_message(MessageKind::TestReport));
    EXPECT_TRUE(is_run_phase_message(MessageKind::EndTest));
    EXPECT_FALSE(is_run_phase_message(MessageKind::StartRunPhase));
    EXPECT_FALSE(is_run_phase_message(MessageKind::CollectReport));
}

TEST_F(MessageTest, KindSets)
{
    auto set = make_kind_set({MessageKind::Init, MessageKind::EndTest});
    EXPECT_EQ(set.count(), 2u);
    EXPECT_TRUE(set.test(static_cast<std::size_t>(MessageKind::EndTest)));
    EXPECT_EQ(all_kinds().count(), kMessageKindCount);
}

TEST_F(MessageTest, FormatFrame)
{
    EXPECT_EQ(format_frame(MessageKind::RunTestLoop, {}), "<<--RICH-PIPE-->>: proto_runtestloop");
    EXPECT_EQ(format_frame(MessageKind::Write, {"a1", "b2"}), "<<--RICH-PIPE-->>: write a1 b2");
}

TEST_F(MessageTest, ParseFrameSplitsOnAnyWhitespace)
{
    auto f = parse_frame("  <<--RICH-PIPE-->>:\tproto_end_test   00ff \r");
    ASSERT_TRUE(f.has_value());
    EXPECT_EQ(f->name, "proto_end_test");
    EXPECT_THAT(f->args, ElementsAre("00ff"));
}

TEST_F(MessageTest, ParseFrameSentinelAlone)
{
    auto f = parse_frame("<<--RICH-PIPE-->>:");
    ASSERT_TRUE(f.has_value());
    EXPECT_TRUE(f->name.empty());
    EXPECT_TRUE(f->args.empty());
}

TEST_F(MessageTest, OtherLinesArePassthrough)
{
    EXPECT_FALSE(parse_frame("").has_value());
    EXPECT_FALSE(parse_frame("plain output").has_value());
    EXPECT_FALSE(parse_frame("x <<--RICH-PIPE-->>: write 00").has_value());
    // The sentinel must be a whole token.
    EXPECT_FALSE(parse_frame("<<--RICH-PIPE-->>:write").has_value());
}

class LineAssemblerTest : public PureApiTest
{
  protected:
    LineAssembler assembler;
};

TEST_F(LineAssemblerTest, JoinsLinesSplitAcrossChunks)
{
    EXPECT_TRUE(assembler.feed("hel").empty());
    EXPECT_EQ(assembler.pending_size(), 3u);
    EXPECT_THAT(assembler.feed("lo\nwor"), ElementsAre("hello"));
    EXPECT_THAT(assembler.feed("ld\n\nx"), ElementsAre("world", ""));
    EXPECT_EQ(assembler.finish(), std::optional<std::string>("x"));
    EXPECT_EQ(assembler.pending_size(), 0u);
}

TEST_F(LineAssemblerTest, StripsTrailingWhitespaceAndCarriageReturns)
{
    EXPECT_THAT(assembler.feed("a  \r\n  b\t\n"), ElementsAre("a", "  b"));
}

TEST_F(LineAssemblerTest, FinishWithoutRemainder)
{
    (void)assembler.feed("done\n");
    EXPECT_FALSE(assembler.finish().has_value());
}

TEST_F(LineAssemblerTest, ByteByByteFeedingMatchesWholeFeeding)
{
    const std::string text = "first line\nsecond\r\nthird";
    std::vector<std::string> lines;
    for (char c : text)
    {
        for (auto &l : assembler.feed(std::string_view(&c, 1)))
            lines.push_back(std::move(l));
    }
    if (auto rest = assembler.finish())
        lines.push_back(*rest);
    EXPECT_THAT(lines, ElementsAre("first line", "second", "third"));
}
