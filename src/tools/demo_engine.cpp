/**
 * @file demo_engine.cpp
 * @brief A simulated test engine that reports a full session through the Emitter.
 *
 * The engine "collects" a configurable number of files with a configurable number
 * of tests each and runs them, producing failures, expected failures, skips and
 * setup errors at fixed intervals. It is what `testpipe` runs by default and what
 * the multi-process tests drive.
 *
 * Positional arguments are node ids ("file::test") to run, or a directory prefix
 * for the generated files. Non-selected tests are reported as deselected.
 *
 * Exit status is the session status: 0 if every test passed, 1 otherwise. With
 * --crash-after N the process kills itself after N tests, without ending the
 * session.
 */
#include "tp_pipe.hpp"

#include <charconv>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <future>
#include <iostream>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#if defined(TESTPIPE_IS_POSIX)
#include <signal.h>
#include <unistd.h>
#endif

using namespace testpipe::utils;
namespace tp = testpipe::pipe;
namespace engine = testpipe::pipe::engine;

namespace
{

struct EngineArgs
{
    int files{3};
    int tests{5};
    int fail_every{0};
    int xfail_every{0};
    int skip_every{0};
    int setup_error_every{0};
    int crash_after{0};
    bool parallel_collect{false};
    bool chatty{false};
    std::string test_dir{"tests"};
    std::set<std::string> selected;
};

int parse_count(std::string_view opt, std::string_view text)
{
    int v = 0;
    const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), v);
    if (ec != std::errc() || end != text.data() + text.size() || v < 0)
        throw std::invalid_argument(
            fmt::format("{} expects a non-negative integer, got '{}'", opt, text));
    return v;
}

EngineArgs parse_args(int argc, char *argv[])
{
    EngineArgs args;
    for (int i = 1; i < argc; ++i)
    {
        std::string_view arg(argv[i]);
        const bool has_value = i + 1 < argc;
        if (arg == "--files" && has_value)
            args.files = parse_count(arg, argv[++i]);
        else if (arg == "--tests" && has_value)
            args.tests = parse_count(arg, argv[++i]);
        else if (arg == "--fail-every" && has_value)
            args.fail_every = parse_count(arg, argv[++i]);
        else if (arg == "--xfail-every" && has_value)
            args.xfail_every = parse_count(arg, argv[++i]);
        else if (arg == "--skip-every" && has_value)
            args.skip_every = parse_count(arg, argv[++i]);
        else if (arg == "--setup-error-every" && has_value)
            args.setup_error_every = parse_count(arg, argv[++i]);
        else if (arg == "--crash-after" && has_value)
            args.crash_after = parse_count(arg, argv[++i]);
        else if (arg == "--parallel-collect")
            args.parallel_collect = true;
        else if (arg == "--chatty")
            args.chatty = true;
        else if (arg.starts_with("--"))
            throw std::invalid_argument(fmt::format("Unknown argument: {}", arg));
        else if (arg.find("::") != std::string_view::npos)
            args.selected.emplace(arg);
        else
            args.test_dir = std::string(arg);
    }
    return args;
}

bool every(int n, int k) noexcept { return n > 0 && k % n == 0; }

// ── Simulated test tree ──────────────────────────────────────────────────────

struct SimFile
{
    std::string path;
    std::vector<engine::Node> tests;
};

std::vector<SimFile> make_tree(const EngineArgs &args)
{
    std::vector<SimFile> files;
    for (int f = 1; f <= args.files; ++f)
    {
        SimFile file;
        file.path = fmt::format("{}/test_module_{}.py", args.test_dir, f);
        for (int t = 1; t <= args.tests; ++t)
        {
            engine::Node node;
            node.kind = tp::NodeKind::Function;
            node.name = fmt::format("test_case_{}", t);
            node.nodeid = fmt::format("{}::{}", file.path, node.name);
            node.path = std::filesystem::path(file.path);
            node.originalname = node.name;
            node.keywords = {node.name, "demo"};
            file.tests.push_back(std::move(node));
        }
        files.push_back(std::move(file));
    }
    return files;
}

class DemoEngine
{
  public:
    DemoEngine(EngineArgs args, tp::Emitter &emitter)
        : m_args(std::move(args)), m_emitter(emitter), m_tree(make_tree(m_args))
    {
    }

    int run()
    {
        auto config = std::make_shared<engine::Config>();
        config->rootpath = std::filesystem::current_path();
        config->invocation_dir = config->rootpath;
        config->options = {{"verbose", 0}, {"capture", "fd"}, {"color", "no"}};
        config->plugins = {"demo"};
        m_emitter.start(*config);

        engine::Session session;
        session.config = config;
        m_emitter.session_start(session);

        if (m_args.parallel_collect)
        {
            std::promise<void> done;
            auto finished = done.get_future();
            m_emitter.start_collection_thread(
                [this, &done]()
                {
                    try
                    {
                        collect();
                        done.set_value();
                    }
                    catch (const std::exception &)
                    {
                        done.set_exception(std::current_exception());
                    }
                });
            finished.get();
        }
        else
        {
            collect();
        }

        m_emitter.runtestloop();
        const int status = run_tests();
        m_emitter.session_finish(status);
        m_emitter.unconfigure();
        return status;
    }

  private:
    void collect()
    {
        m_emitter.collection_start();
        if (m_args.chatty)
            m_emitter.write_line(fmt::format("collecting {} file(s)", m_tree.size()));

        std::vector<engine::Node> deselected;
        for (const auto &file : m_tree)
        {
            engine::CollectReport report;
            report.nodeid = file.path;
            report.traceback = std::string();
            for (const auto &node : file.tests)
            {
                report.result.push_back(node);
                if (!m_args.selected.empty() && !m_args.selected.contains(node.nodeid))
                    deselected.push_back(node);
            }
            m_emitter.collect_report(report);

            // A parallel collector hands out a second copy without the traceback.
            if (m_args.parallel_collect)
            {
                report.traceback.reset();
                m_emitter.collect_report(report);
            }
        }

        // Selected ids that do not exist in the tree fail to collect.
        for (const auto &id : m_args.selected)
        {
            if (find(id) != nullptr)
                continue;
            engine::CollectReport missing;
            missing.nodeid = id;
            missing.outcome = tp::ReportOutcome::Failed;
            missing.traceback = fmt::format("ERROR: not found: {}", id);
            m_emitter.collect_report(missing);
            ++m_collect_errors;
        }

        if (!deselected.empty())
            m_emitter.deselected(deselected);
        m_emitter.collection_finish();
    }

    const engine::Node *find(const std::string &id) const
    {
        for (const auto &file : m_tree)
            for (const auto &node : file.tests)
                if (node.nodeid == id)
                    return &node;
        return nullptr;
    }

    engine::TestReport make_report(const engine::Node &node, tp::Phase when,
                                   tp::ReportOutcome outcome) const
    {
        engine::TestReport r;
        r.nodeid = node.nodeid;
        r.when = when;
        r.outcome = outcome;
        r.duration = 0.001;
        r.location = tp::Location{node.path ? node.path->string() : "", 1, node.name};
        r.keywords = {{node.name, 1}};
        if (outcome == tp::ReportOutcome::Failed)
        {
            r.traceback = fmt::format("{}:1: AssertionError in {} ({})",
                                      node.path ? node.path->string() : "", node.name,
                                      tp::to_string(when));
            r.longrepr = *r.traceback;
        }
        return r;
    }

    int run_tests()
    {
        bool failed = m_collect_errors > 0;
        int k = 0;
        for (const auto &file : m_tree)
        {
            for (const auto &node : file.tests)
            {
                if (!m_args.selected.empty() && !m_args.selected.contains(node.nodeid))
                    continue;
                ++k;
                failed |= run_one(node, k);
                if (m_args.crash_after > 0 && k >= m_args.crash_after)
                    crash();
            }
        }
        return failed ? 1 : 0;
    }

    /// @return true when the test counts as a failure.
    bool run_one(const engine::Node &node, int k)
    {
        using tp::Phase;
        using tp::ReportOutcome;

        m_emitter.log_start(node.nodeid);
        bool failed = false;

        if (every(m_args.setup_error_every, k))
        {
            m_emitter.log_report(make_report(node, Phase::Setup, ReportOutcome::Failed));
            failed = true;
        }
        else
        {
            m_emitter.log_report(make_report(node, Phase::Setup, ReportOutcome::Passed));
            if (m_args.chatty)
            {
                std::cout << "running " << node.name << std::endl;
                std::cerr << "diagnostics for " << node.name << '\n' << std::flush;
            }

            auto call = make_report(node, Phase::Call, ReportOutcome::Passed);
            if (every(m_args.xfail_every, k))
            {
                call.outcome = ReportOutcome::Skipped;
                call.wasxfail = "known issue";
            }
            else if (every(m_args.fail_every, k))
            {
                call = make_report(node, Phase::Call, ReportOutcome::Failed);
                failed = true;
            }
            else if (every(m_args.skip_every, k))
            {
                call.outcome = ReportOutcome::Skipped;
            }
            m_emitter.log_report(call);

            if (m_args.chatty && call.outcome == ReportOutcome::Skipped && !call.wasxfail)
            {
                engine::WarningMessage w;
                w.message = fmt::format("{} skipped by the demo engine", node.name);
                w.category = "UserWarning";
                w.filename = node.path ? node.path->string() : "";
                w.lineno = 1;
                m_emitter.warning_recorded(w, "runtest", node.nodeid);
            }
        }

        m_emitter.log_report(make_report(node, Phase::Teardown, ReportOutcome::Passed));
        m_emitter.log_finish(node.nodeid);
        return failed;
    }

    [[noreturn]] void crash()
    {
        LOGGER_WARN("Demo engine crashing on request");
        m_emitter.flush();
#if defined(TESTPIPE_IS_POSIX)
        ::kill(::getpid(), SIGKILL);
#endif
        std::_Exit(3);
    }

    EngineArgs m_args;
    tp::Emitter &m_emitter;
    std::vector<SimFile> m_tree;
    int m_collect_errors{0};
};

} // anonymous namespace

int main(int argc, char *argv[])
{
#if defined(TESTPIPE_IS_POSIX)
    // A front end that went away must not kill the engine mid-write.
    std::signal(SIGPIPE, SIG_IGN);
#endif

    EngineArgs args;
    try
    {
        args = parse_args(argc, argv);
    }
    catch (const std::invalid_argument &e)
    {
        std::cerr << "Error: " << e.what() << '\n';
        return 4;
    }

    LifecycleGuard app_lifecycle(MakeModDefList(Logger::GetLifecycleModule()));
    if (const char *log_file = std::getenv("TESTPIPE_LOG_FILE"); log_file && *log_file)
    {
        if (!Logger::instance().set_logfile(log_file))
            return 4;
    }
    if (const char *level = std::getenv("TESTPIPE_LOG_LEVEL"))
    {
        if (auto lvl = Logger::level_from_string(level))
            Logger::instance().set_level(*lvl);
    }

    try
    {
        tp::Emitter emitter;
        DemoEngine demo(std::move(args), emitter);
        const int status = demo.run();
        LOGGER_INFO("Demo engine finished with status {}", status);
        return status;
    }
    catch (const std::runtime_error &e)
    {
        LOGGER_ERROR("Demo engine failed: {}", e.what());
        return 4;
    }
}
