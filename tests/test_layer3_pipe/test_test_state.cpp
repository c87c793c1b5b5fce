// tests/test_layer3_pipe/test_test_state.cpp
/**
 * @file test_test_state.cpp
 * @brief TestRecord classification, TestState bookkeeping, summaries and timers.
 */
#include "pipe_test_support.h"
#include "test_patterns.h"

#include <gmock/gmock.h>

#include <thread>

using namespace testpipe::pipe;
using namespace testpipe::tests::pipe_support;
using testpipe::tests::PureApiTest;
using ::testing::ElementsAre;
using ::testing::HasSubstr;

namespace
{

std::vector<std::string> ids(const TestState::RecordList &records)
{
    std::vector<std::string> out;
    for (const auto *r : records)
        out.push_back(r->node_id().str());
    return out;
}

} // namespace

// ── TestRecord ────────────────────────────────────────────────────────────────

class TestRecordTest : public PureApiTest
{
  protected:
    TestRecord rec{NodeID("t.py::a"), test_node("t.py::a")};

    void run(ReportOutcome setup, std::optional<TestReportRepr> call,
             std::optional<ReportOutcome> teardown)
    {
        rec.set_started(true);
        rec.set_report(phase_report("t.py::a", Phase::Setup, setup));
        if (call)
            rec.set_report(*call);
        if (teardown)
            rec.set_report(phase_report("t.py::a", Phase::Teardown, *teardown));
    }

    static TestReportRepr call(ReportOutcome outcome, bool xfail = false)
    {
        auto r = phase_report("t.py::a", Phase::Call, outcome);
        if (xfail)
            r.wasxfail = std::string("reason");
        return r;
    }
};

TEST_F(TestRecordTest, LifecycleProgression)
{
    EXPECT_EQ(rec.outcome(), Outcome::NotStarted);
    rec.set_started(true);
    rec.clear_report(Phase::Setup);
    EXPECT_EQ(rec.outcome(), Outcome::SetupRunning);
    rec.set_report(phase_report("t.py::a", Phase::Setup));
    EXPECT_EQ(rec.outcome(), Outcome::Running);
    rec.set_report(call(ReportOutcome::Passed));
    EXPECT_EQ(rec.outcome(), Outcome::TeardownRunning);
    EXPECT_FALSE(rec.finished());
    rec.set_report(phase_report("t.py::a", Phase::Teardown));
    EXPECT_TRUE(rec.finished());
    EXPECT_EQ(rec.outcome(), Outcome::Passed);
}

TEST_F(TestRecordTest, FailedCall)
{
    run(ReportOutcome::Passed, call(ReportOutcome::Failed), ReportOutcome::Passed);
    EXPECT_EQ(rec.outcome(), Outcome::Failed);
    EXPECT_EQ(rec.main_error_report(), rec.call());
}

TEST_F(TestRecordTest, SetupErrorGoesStraightToTeardown)
{
    run(ReportOutcome::Failed, std::nullopt, std::nullopt);
    // A failed setup is never followed by a call, so no running state.
    EXPECT_EQ(rec.outcome(), Outcome::SetupErrored);
    rec.set_report(phase_report("t.py::a", Phase::Teardown));
    EXPECT_EQ(rec.outcome(), Outcome::SetupErrored);
    EXPECT_EQ(rec.main_error_report(), rec.setup());
}

TEST_F(TestRecordTest, TeardownError)
{
    run(ReportOutcome::Passed, call(ReportOutcome::Passed), ReportOutcome::Failed);
    EXPECT_EQ(rec.outcome(), Outcome::TeardownErrored);
    EXPECT_EQ(rec.main_error_report(), rec.teardown());
}

TEST_F(TestRecordTest, ExpectedFailureAndUnexpectedPass)
{
    run(ReportOutcome::Passed, call(ReportOutcome::Skipped, true), ReportOutcome::Passed);
    EXPECT_EQ(rec.outcome(), Outcome::XFailed);

    rec.reset();
    run(ReportOutcome::Passed, call(ReportOutcome::Passed, true), ReportOutcome::Passed);
    EXPECT_EQ(rec.outcome(), Outcome::XPassed);
}

TEST_F(TestRecordTest, SkippedInSetupOrCall)
{
    run(ReportOutcome::Skipped, std::nullopt, ReportOutcome::Passed);
    EXPECT_EQ(rec.outcome(), Outcome::Skipped);

    rec.reset();
    run(ReportOutcome::Passed, call(ReportOutcome::Skipped), ReportOutcome::Passed);
    EXPECT_EQ(rec.outcome(), Outcome::Skipped);
}

TEST_F(TestRecordTest, FinishedWithoutCallIsUnknown)
{
    run(ReportOutcome::Passed, std::nullopt, ReportOutcome::Passed);
    EXPECT_EQ(rec.outcome(), Outcome::Unknown);
}

TEST_F(TestRecordTest, ResetClearsEverything)
{
    run(ReportOutcome::Passed, call(ReportOutcome::Failed), ReportOutcome::Passed);
    rec.park();
    rec.reset();
    EXPECT_FALSE(rec.started());
    EXPECT_FALSE(rec.parked());
    EXPECT_EQ(rec.setup(), nullptr);
    EXPECT_EQ(rec.outcome(), Outcome::NotStarted);
}

TEST_F(TestRecordTest, SensibleStateAfterCall)
{
    run(ReportOutcome::Passed, call(ReportOutcome::Failed), std::nullopt);
    EXPECT_TRUE(rec.get_to_sensible_state());
    EXPECT_TRUE(rec.finished());
    EXPECT_EQ(rec.outcome(), Outcome::Failed);
}

TEST_F(TestRecordTest, SensibleStateAfterPassingSetupOnly)
{
    run(ReportOutcome::Passed, std::nullopt, std::nullopt);
    EXPECT_TRUE(rec.get_to_sensible_state());
    EXPECT_FALSE(rec.started());
    EXPECT_EQ(rec.setup(), nullptr);
    EXPECT_EQ(rec.outcome(), Outcome::NotStarted);
}

TEST_F(TestRecordTest, SensibleStateAfterFailedSetup)
{
    run(ReportOutcome::Failed, std::nullopt, std::nullopt);
    EXPECT_TRUE(rec.get_to_sensible_state());
    EXPECT_TRUE(rec.finished());
    EXPECT_EQ(rec.outcome(), Outcome::SetupErrored);
}

TEST_F(TestRecordTest, SensibleStateLeavesFinishedOrUnstartedAlone)
{
    EXPECT_FALSE(rec.get_to_sensible_state());
    run(ReportOutcome::Passed, call(ReportOutcome::Passed), ReportOutcome::Passed);
    EXPECT_FALSE(rec.get_to_sensible_state());
}

TEST(OutcomeNames, NamesAndIndicators)
{
    EXPECT_STREQ(outcome_name(Outcome::SetupErrored), "setup_errored");
    EXPECT_STREQ(outcome_name(Outcome::XPassed), "xpassed");
    EXPECT_STREQ(indicator(Outcome::Failed, true), "F");
    EXPECT_STREQ(indicator(Outcome::Failed, false), "✕");
    EXPECT_STREQ(indicator(Outcome::Passed, true), ".");
    EXPECT_STREQ(indicator(Outcome::Skipped, false), "s");
}

// ── TestState ─────────────────────────────────────────────────────────────────

class TestStateTest : public PureApiTest
{
  protected:
    void SetUp() override
    {
        state.prepare_for_run({});
        state.prepare_for_test_collection();
        state.add_collected(collected("a.py", {"t1", "t2", "t3"}));
        state.add_collected(collected("b.py", {"t1"}));
    }

    void finish(const std::string &id, ReportOutcome call_outcome = ReportOutcome::Passed,
                ReportOutcome setup_outcome = ReportOutcome::Passed)
    {
        state.start_test(NodeID(id));
        state.store_phase_report(phase_report(id, Phase::Setup, setup_outcome));
        if (setup_outcome == ReportOutcome::Passed)
            state.store_phase_report(phase_report(id, Phase::Call, call_outcome));
        state.store_phase_report(phase_report(id, Phase::Teardown));
        state.end_test(NodeID(id));
    }

    TestState state;
};

TEST_F(TestStateTest, CollectionKeepsOrder)
{
    EXPECT_EQ(state.size(), 4u);
    EXPECT_THAT(ids(state.query_results()),
                ElementsAre("a.py::t1", "a.py::t2", "a.py::t3", "b.py::t1"));
    EXPECT_THAT(ids(state.query_results({"b.py::t1", "missing", "a.py::t2"})),
                ElementsAre("b.py::t1", "a.py::t2"));
}

TEST_F(TestStateTest, DuplicateCollectReportsAreIgnored)
{
    auto flags = state.add_collected(collected("a.py", {"t1", "t9"}));
    EXPECT_FALSE(flags.added);
    EXPECT_EQ(state.size(), 4u);

    state.prepare_for_test_collection();
    flags = state.add_collected(collected("a.py", {"t1", "t9"}));
    EXPECT_TRUE(flags.added);
    EXPECT_EQ(state.size(), 5u);
}

TEST_F(TestStateTest, NonTestNodesAreNotRecords)
{
    auto report = collected("c.py", {});
    NodeRepr cls;
    cls.kind = NodeKind::Class;
    cls.name = "TestX";
    cls.nodeid = NodeID("c.py::TestX");
    report.result.push_back(cls);
    state.add_collected(report);
    EXPECT_EQ(state.lookup("c.py::TestX"), nullptr);
}

TEST_F(TestStateTest, CollectFailuresAndSkips)
{
    CollectReportRepr failed;
    failed.nodeid = NodeID("broken.py");
    failed.outcome = ReportOutcome::Failed;
    failed.traceback = std::string("SyntaxError");
    auto flags = state.add_collected(failed);
    EXPECT_TRUE(flags.failed);

    CollectReportRepr skipped;
    skipped.nodeid = NodeID("skipme.py");
    skipped.outcome = ReportOutcome::Skipped;
    state.add_collected(skipped);

    EXPECT_EQ(state.collect_failures().count("broken.py"), 1u);
    EXPECT_EQ(state.collect_skipped().count("skipme.py"), 1u);
    EXPECT_EQ(state.format_collection_progress(false), "running: selected=4 skipped=1 failed=1");
}

TEST_F(TestStateTest, DeselectionRemovesRecords)
{
    state.deselect_tests({test_node("a.py::t2"), test_node("zzz.py::never_collected")});
    EXPECT_EQ(state.size(), 3u);
    EXPECT_EQ(state.lookup("a.py::t2"), nullptr);
    EXPECT_EQ(state.deselected().size(), 2u);
    EXPECT_EQ(state.format_collection_progress(true), "complete: selected=3 deselected=2");
}

TEST(TestStateDeselection, LargeBatchKeepsCollectionOrder)
{
    constexpr int kTests = 5000;
    std::vector<std::string> names;
    for (int i = 0; i < kTests; ++i)
        names.push_back(fmt::format("t{}", i));
    TestState state;
    state.add_collected(collected("big.py", names));

    // Every even test, last one first.
    std::vector<NodeRepr> dropped;
    for (int i = kTests - 2; i >= 0; i -= 2)
        dropped.push_back(test_node(fmt::format("big.py::t{}", i)));
    state.deselect_tests(dropped);

    ASSERT_EQ(state.size(), static_cast<std::size_t>(kTests / 2));
    EXPECT_EQ(state.deselected().size(), static_cast<std::size_t>(kTests / 2));
    const auto remaining = ids(state.query_results());
    for (std::size_t i = 0; i < remaining.size(); ++i)
        ASSERT_EQ(remaining[i], fmt::format("big.py::t{}", 2 * i + 1));
    EXPECT_EQ(state.completion_counts(),
              std::make_pair(std::size_t{0}, static_cast<std::size_t>(kTests / 2)));
}

TEST_F(TestStateTest, ExecutionUpdatesViewsAndCounts)
{
    finish("a.py::t1");
    finish("a.py::t2", ReportOutcome::Failed);
    finish("a.py::t3", ReportOutcome::Passed, ReportOutcome::Failed);

    EXPECT_THAT(ids(state.passed()), ElementsAre("a.py::t1"));
    EXPECT_THAT(ids(state.failed()), ElementsAre("a.py::t2"));
    EXPECT_THAT(ids(state.setup_errored()), ElementsAre("a.py::t3"));
    EXPECT_THAT(ids(state.not_run()), ElementsAre("b.py::t1"));
    EXPECT_EQ(state.completion_counts(), std::make_pair(std::size_t{3}, std::size_t{4}));
}

TEST_F(TestStateTest, EventsForUnknownTestsAreIgnored)
{
    EXPECT_EQ(state.start_test(NodeID("ghost.py::x")), nullptr);
    EXPECT_EQ(state.store_phase_report(phase_report("ghost.py::x", Phase::Setup)), nullptr);
    EXPECT_EQ(state.end_test(NodeID("ghost.py::x")), nullptr);
    EXPECT_EQ(state.size(), 4u);
}

TEST_F(TestStateTest, SecondReportForAPhaseIsRejected)
{
    state.start_test(NodeID("a.py::t1"));
    ASSERT_NE(state.store_phase_report(phase_report("a.py::t1", Phase::Setup)), nullptr);
    EXPECT_EQ(state.store_phase_report(
                  phase_report("a.py::t1", Phase::Setup, ReportOutcome::Failed)),
              nullptr);
    EXPECT_EQ(state.lookup("a.py::t1")->setup()->outcome, ReportOutcome::Passed);
}

TEST_F(TestStateTest, MarkInterruptedTidiesUnfinishedTests)
{
    finish("a.py::t1");
    state.start_test(NodeID("a.py::t2"));
    state.store_phase_report(phase_report("a.py::t2", Phase::Setup));
    state.store_phase_report(phase_report("a.py::t2", Phase::Call, ReportOutcome::Failed));
    state.start_test(NodeID("a.py::t3"));
    state.store_phase_report(phase_report("a.py::t3", Phase::Setup));

    EXPECT_EQ(state.mark_interrupted(), 2u);
    EXPECT_EQ(state.lookup("a.py::t2")->outcome(), Outcome::Failed);
    EXPECT_EQ(state.lookup("a.py::t3")->outcome(), Outcome::NotStarted);
    EXPECT_EQ(state.completion_counts().first, 2u);
}

TEST_F(TestStateTest, SubsetRunParksTheRest)
{
    finish("a.py::t1", ReportOutcome::Failed);
    finish("b.py::t1");

    const TestState::Selection selection{"a.py::t1"};
    state.prepare_for_run(selection);
    state.park_and_reset_stored_results(selection);

    EXPECT_EQ(state.size(), 4u);
    const auto *rerun = state.lookup("a.py::t1");
    EXPECT_EQ(rerun->outcome(), Outcome::NotStarted);
    EXPECT_FALSE(rerun->parked());
    const auto *kept = state.lookup("b.py::t1");
    EXPECT_TRUE(kept->parked());
    EXPECT_EQ(kept->outcome(), Outcome::Passed);
    EXPECT_EQ(state.completion_counts().first, 1u);

    // The re-collected file does not duplicate records.
    state.prepare_for_test_collection();
    state.add_collected(collected("a.py", {"t1"}));
    EXPECT_EQ(state.size(), 4u);
}

TEST_F(TestStateTest, FullRunForgetsEverything)
{
    finish("a.py::t1");
    state.prepare_for_run({});
    EXPECT_EQ(state.size(), 0u);
    EXPECT_EQ(state.completion_counts().first, 0u);
}

TEST_F(TestStateTest, ParkAndResetSingleRecords)
{
    finish("a.py::t1");
    EXPECT_TRUE(state.park("a.py::t1"));
    EXPECT_TRUE(state.lookup("a.py::t1")->parked());
    EXPECT_TRUE(state.reset("a.py::t1"));
    EXPECT_EQ(state.completion_counts().first, 0u);
    EXPECT_FALSE(state.park("nope"));
    EXPECT_FALSE(state.reset("nope"));
}

TEST_F(TestStateTest, ShortSummary)
{
    state.deselect_tests({test_node("x.py::y")});
    EXPECT_EQ(state.format_summary(false),
              "TOTAL tests:             5\n"
              "Deselected:              1");
}

TEST_F(TestStateTest, FullSummaryListsNonEmptyViews)
{
    finish("a.py::t1");
    finish("a.py::t2", ReportOutcome::Failed);

    const auto text = state.format_summary(true, nullptr, true);
    EXPECT_THAT(text, HasSubstr("TOTAL tests:             4"));
    EXPECT_THAT(text, HasSubstr("Passed (.):              1"));
    EXPECT_THAT(text, HasSubstr("Failed (F):              1"));
    EXPECT_THAT(text, HasSubstr("Not run (.):             2"));
    EXPECT_THAT(text, ::testing::Not(HasSubstr("Skipped")));
    EXPECT_THAT(text, ::testing::Not(HasSubstr("Overall")));
}

TEST_F(TestStateTest, SummaryWithTimings)
{
    TimeStatsCollector stats;
    stats.start("Collection");
    stats.stop("Collection");
    const auto text = state.format_summary(true, &stats);
    EXPECT_THAT(text, ::testing::ContainsRegex("Collection: +[0-9]+\\.[0-9]{3}s"));
    EXPECT_THAT(text, ::testing::ContainsRegex("Overall: +[0-9]+\\.[0-9]{3}s"));
}

// ── TimeStatsCollector ────────────────────────────────────────────────────────

TEST(TimeStatsTest, OnlyStoppedTimersAreReportedInStartOrder)
{
    TimeStatsCollector stats;
    stats.start("first");
    stats.start("second");
    stats.stop("second");
    EXPECT_TRUE(stats.running("first"));
    EXPECT_FALSE(stats.running("second"));

    auto entries = stats.entries();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].first, "second");

    stats.stop_all();
    entries = stats.entries();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].first, "first");
    EXPECT_GE(entries[0].second, entries[1].second);
}

TEST(TimeStatsTest, RestartKeepsPositionAndStopIsIdempotent)
{
    TimeStatsCollector stats;
    stats.start("a");
    stats.start("b");
    stats.stop_all();
    stats.start("a");
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    stats.stop("a");
    stats.stop("a");
    stats.stop("unknown");

    const auto entries = stats.entries();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].first, "a");
    EXPECT_GE(entries[0].second, 0.004);

    stats.clear();
    EXPECT_TRUE(stats.entries().empty());
}
