// tests/test_layer3_pipe/test_progress_grouping.cpp
#include "pipe_test_support.h"
#include "test_patterns.h"

#include <gmock/gmock.h>

using namespace testpipe::pipe;
using namespace testpipe::tests::pipe_support;
using testpipe::tests::PureApiTest;
using ::testing::ElementsAre;

class ProgressMapperTest : public PureApiTest
{
  protected:
    void SetUp() override { state.prepare_for_test_collection(); }

    void add_file(const std::string &file, int tests)
    {
        std::vector<std::string> names;
        for (int i = 0; i < tests; ++i)
            names.push_back("test_" + std::to_string(i));
        state.add_collected(collected(file, names));
    }

    std::vector<std::string> group_names(const ProgressMapper &m) const
    {
        std::vector<std::string> out;
        for (const auto &g : m.groups())
            out.push_back(g.name);
        return out;
    }

    TestState state;
};

TEST_F(ProgressMapperTest, OneGroupPerFileSortedByName)
{
    add_file("tests/test_b.py", 2);
    add_file("tests/test_a.py", 3);
    ProgressMapper mapper(Surface{80, 24}, state);

    EXPECT_FALSE(mapper.grouped_by_directory());
    EXPECT_THAT(group_names(mapper), ElementsAre("tests/test_a.py", "tests/test_b.py"));
    EXPECT_EQ(mapper.groups()[0].members.size(), 3u);
    EXPECT_EQ(mapper.groups()[0].label, "tests/test_a.py");
}

TEST_F(ProgressMapperTest, LongFileIsSplitIntoChunks)
{
    // Name width 21 leaves 80 - 21 - 9 = 50 slots per line.
    add_file("tests/unit/test_bg.py", 200);
    ProgressMapper mapper(Surface{80, 24}, state);

    EXPECT_THAT(group_names(mapper),
                ElementsAre("tests/unit/test_bg.py", "tests/unit/test_bg.py[2]",
                            "tests/unit/test_bg.py[3]", "tests/unit/test_bg.py[4]"));
    for (const auto &g : mapper.groups())
        EXPECT_EQ(g.members.size(), 50u);
    EXPECT_EQ(mapper.groups()[0].label, "tests/unit/test_bg.py");
    EXPECT_EQ(mapper.groups()[1].label, "");
    EXPECT_EQ(mapper.groups()[1].members.front(), "tests/unit/test_bg.py::test_50");
}

TEST_F(ProgressMapperTest, NarrowSurfaceStillHoldsMinimumSlots)
{
    add_file("f.py", 311);
    ProgressMapper mapper(Surface{20, 100}, state);

    const auto names = group_names(mapper);
    ASSERT_EQ(names.size(), 11u);
    EXPECT_EQ(mapper.groups()[0].members.size(),
              static_cast<std::size_t>(ProgressMapper::kMinSlots));
    // Chunk numbers sort numerically.
    EXPECT_EQ(names[8], "f.py[9]");
    EXPECT_EQ(names[9], "f.py[10]");
    EXPECT_EQ(names[10], "f.py[11]");
    EXPECT_EQ(mapper.groups()[10].members.size(), 11u);
}

TEST_F(ProgressMapperTest, TooManyFilesRegroupByDirectory)
{
    for (int i = 0; i < 20; ++i)
        add_file("pkg" + std::to_string(i % 2) + "/test_" + std::to_string(i) + ".py", 1);
    add_file("test_root.py", 1);
    ProgressMapper mapper(Surface{80, 24}, state);

    EXPECT_TRUE(mapper.grouped_by_directory());
    EXPECT_THAT(group_names(mapper), ElementsAre(".", "pkg0", "pkg1"));
    EXPECT_EQ(mapper.groups()[1].members.size(), 10u);
}

TEST_F(ProgressMapperTest, FilesThatFitTheHeightStayPerFile)
{
    for (int i = 0; i < 18; ++i)
        add_file("pkg/test_" + std::to_string(i) + ".py", 1);
    ProgressMapper mapper(Surface{80, 24}, state);
    EXPECT_FALSE(mapper.grouped_by_directory());
    EXPECT_EQ(mapper.groups().size(), 18u);
}

TEST_F(ProgressMapperTest, LookupByNodeId)
{
    add_file("a.py", 2);
    ProgressMapper mapper(Surface{}, state);

    const auto *name = mapper.group_of("a.py::test_1");
    ASSERT_NE(name, nullptr);
    EXPECT_EQ(*name, "a.py");
    EXPECT_THAT(mapper.members_of_group("a.py::test_1"),
                ElementsAre("a.py::test_0", "a.py::test_1"));
    EXPECT_EQ(mapper.group_of("nope"), nullptr);
    EXPECT_TRUE(mapper.members_of_group("nope").empty());
}

TEST_F(ProgressMapperTest, EmptyStateHasNoGroups)
{
    ProgressMapper mapper(Surface{}, state);
    EXPECT_TRUE(mapper.groups().empty());
}

TEST_F(ProgressMapperTest, RenderIndicatorsFollowsMemberOrder)
{
    add_file("a.py", 3);
    const std::string id = "a.py::test_1";
    state.start_test(NodeID(id));
    state.store_phase_report(phase_report(id, Phase::Setup));
    state.store_phase_report(phase_report(id, Phase::Call, ReportOutcome::Failed));
    state.store_phase_report(phase_report(id, Phase::Teardown));

    ProgressMapper mapper(Surface{}, state);
    ASSERT_EQ(mapper.groups().size(), 1u);
    EXPECT_EQ(ProgressMapper::render_indicators(mapper.groups()[0], state, true), ".F.");
    EXPECT_EQ(ProgressMapper::render_indicators(mapper.groups()[0], state, false), ".✕.");

    ProgressGroup stale{"x", "x", {"gone.py::t"}};
    EXPECT_EQ(ProgressMapper::render_indicators(stale, state, true), "?");
}
