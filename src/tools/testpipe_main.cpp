/**
 * @file testpipe_main.cpp
 * @brief testpipe front end: runs a test engine and reports its progress.
 *
 * Usage
 * -----
 *     testpipe [--config <file>] [--width N] [--height N] [--std-symbols]
 *              [--select <nodeid>]... [-- <engine command...>]
 *
 * The engine command defaults to `engine.command` from the configuration. The
 * process exits with 0 when every selected test passed, 1 when a test or
 * collection failed, and 2 when the run itself could not be completed.
 *
 * SIGINT / SIGTERM stop the engine; a second signal exits immediately.
 */
#include "tp_pipe.hpp"

#include <algorithm>
#include <atomic>
#include <charconv>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

using namespace testpipe::utils;
using namespace testpipe::pipe;

// ---------------------------------------------------------------------------
// Global stop flag (set by SIGINT/SIGTERM)
// ---------------------------------------------------------------------------

static std::atomic<bool> g_stop_requested{false};

static void signal_handler(int /*sig*/) noexcept
{
    if (g_stop_requested.load(std::memory_order_relaxed))
        std::_Exit(2);
    g_stop_requested.store(true, std::memory_order_relaxed);
}

// ---------------------------------------------------------------------------
// Argument parsing
// ---------------------------------------------------------------------------

namespace
{

constexpr int kExitOk = 0;
constexpr int kExitTestsFailed = 1;
constexpr int kExitError = 2;

struct FrontEndArgs
{
    std::string config_path;
    std::optional<int> width;
    std::optional<int> height;
    bool std_symbols{false};
    TestState::Selection selection;
    std::vector<std::string> engine_command;
};

void print_usage(const char *prog)
{
    std::cout
        << "Usage:\n"
        << "  " << prog
        << " [--config <file>] [--width N] [--height N] [--std-symbols]\n"
        << "           [--select <nodeid>]... [-- <engine command...>]\n\n"
        << "Options:\n"
        << "  --config <file>   Use this configuration file instead of the layered config\n"
        << "  --width N         Display width used for grouping and separators\n"
        << "  --height N        Display height used for grouping\n"
        << "  --std-symbols     Use the classic F/./E/x/X progress symbols\n"
        << "  --select <nodeid> Run only this test (repeatable)\n"
        << "  --help            Show this message\n";
}

int parse_positive(std::string_view opt, std::string_view text)
{
    int v = 0;
    const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), v);
    if (ec != std::errc() || end != text.data() + text.size() || v <= 0)
        throw std::invalid_argument(
            fmt::format("{} expects a positive integer, got '{}'", opt, text));
    return v;
}

FrontEndArgs parse_args(int argc, char *argv[])
{
    FrontEndArgs args;
    for (int i = 1; i < argc; ++i)
    {
        std::string_view arg(argv[i]);
        if (arg == "--help" || arg == "-h")
        {
            print_usage(argv[0]);
            std::exit(kExitOk);
        }
        if (arg == "--")
        {
            for (++i; i < argc; ++i)
                args.engine_command.emplace_back(argv[i]);
            break;
        }
        if (arg == "--config" && i + 1 < argc)
        {
            args.config_path = argv[++i];
        }
        else if (arg == "--width" && i + 1 < argc)
        {
            args.width = parse_positive(arg, argv[++i]);
        }
        else if (arg == "--height" && i + 1 < argc)
        {
            args.height = parse_positive(arg, argv[++i]);
        }
        else if (arg == "--std-symbols")
        {
            args.std_symbols = true;
        }
        else if (arg == "--select" && i + 1 < argc)
        {
            args.selection.insert(argv[++i]);
        }
        else
        {
            throw std::invalid_argument(fmt::format("Unknown argument: {}", arg));
        }
    }
    return args;
}

void configure_logger(const LoggingSettings &logging)
{
    auto &logger = Logger::instance();
    if (auto lvl = Logger::level_from_string(logging.level))
        logger.set_level(*lvl);
    else
        LOGGER_WARN("Unknown log level '{}', keeping the default", logging.level);
    if (!logging.file.empty() && !logger.set_logfile(logging.file))
        LOGGER_WARN("Cannot log to '{}', keeping the console sink", logging.file);
}

void print_line(OutputChannel channel, const std::string &line)
{
    if (channel == OutputChannel::Stderr)
        std::cerr << line << '\n';
    else
        std::cout << line << '\n';
}

void print_progress(const RunController &controller, const RunConfig &config)
{
    const auto *mapper = controller.progress_mapper();
    if (mapper == nullptr)
        return;
    const auto &state = controller.state();
    std::size_t name_width = 0;
    for (const auto &g : mapper->groups())
        name_width = std::max(name_width, g.name.size());

    for (const auto &g : mapper->groups())
    {
        std::size_t done = 0;
        for (const auto &id : g.members)
        {
            const auto *rec = state.lookup(id);
            if (rec != nullptr && rec->finished())
                ++done;
        }
        const auto percent = g.members.empty() ? 100 : done * 100 / g.members.size();
        std::cout << fmt::format("{:<{}} {} {:>3}%\n", g.name, name_width,
                                 ProgressMapper::render_indicators(g, state,
                                                                   config.display.std_symbols),
                                 percent);
    }
}

void print_failures(const RunController &controller, const RunConfig &config)
{
    const auto &state = controller.state();
    for (const auto &[id, report] : state.collect_failures())
    {
        std::cout << fmt::format("COLLECT ERROR {}\n", id);
        if (const auto *tb = report.traceback.get())
            std::cout << *tb << '\n';
    }
    if (controller.failing_tests().empty())
        return;
    std::cout << fmt::format("{:=^{}}\n", " FAILURES ", config.display.width);
    for (const auto &id : controller.failing_tests())
    {
        const auto *rec = state.lookup(id);
        const auto *report = rec != nullptr ? rec->main_error_report() : nullptr;
        if (report == nullptr)
            continue;
        std::cout << fmt::format("{} [{}] {}\n", outcome_name(rec->outcome()),
                                 to_string(report->when), id);
        if (const auto *tb = report->traceback.get())
            std::cout << *tb << '\n';
    }
}

int exit_code_for(const RunController &controller, const RunOutcome &outcome)
{
    if (outcome.error)
        return kExitError;
    const auto &state = controller.state();
    const bool failures = !state.failed().empty() || !state.setup_errored().empty() ||
                          !state.teardown_errored().empty() ||
                          !state.collect_failures().empty() ||
                          outcome.session_exitstatus.value_or(0) != 0;
    return failures ? kExitTestsFailed : kExitOk;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------

int main(int argc, char *argv[])
{
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // ── Parse arguments and load config ───────────────────────────────────────
    FrontEndArgs args;
    RunConfig config;
    try
    {
        args = parse_args(argc, argv);
        config = RunConfig::load(args.config_path);
    }
    catch (const std::exception &e)
    {
        std::cerr << "Error: " << e.what() << "\n\n";
        print_usage(argv[0]);
        return kExitError;
    }
    if (args.width)
        config.display.width = *args.width;
    if (args.height)
        config.display.height = *args.height;
    if (args.std_symbols)
        config.display.std_symbols = true;
    if (!args.engine_command.empty())
        config.engine.command = args.engine_command;

    // ── Lifecycle guard ───────────────────────────────────────────────────────
    LifecycleGuard app_lifecycle(MakeModDefList(Logger::GetLifecycleModule()));
    configure_logger(config.logging);
    for (const auto &src : config.sources)
        LOGGER_DEBUG("Configuration source: {}", src.string());

    RunContext ctx(std::move(config));
    RunController controller(ctx);
    controller.set_output(print_line);

    // Signal handlers only set the flag; this thread turns it into a stop request.
    std::atomic<bool> run_done{false};
    std::thread stop_watcher(
        [&]()
        {
            while (!run_done.load(std::memory_order_acquire))
            {
                if (g_stop_requested.load(std::memory_order_relaxed))
                {
                    LOGGER_WARN("Stop requested, terminating the engine");
                    controller.request_stop();
                    return;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
            }
        });

    RunOutcome outcome;
    try
    {
        outcome = controller.run(args.selection);
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR("Run failed: {}", e.what());
        run_done.store(true, std::memory_order_release);
        stop_watcher.join();
        return kExitError;
    }
    run_done.store(true, std::memory_order_release);
    stop_watcher.join();

    // ── Report ────────────────────────────────────────────────────────────────
    const auto &cfg = ctx.config();
    if (!controller.collection_progress().empty())
        std::cout << controller.collection_progress() << '\n';
    print_progress(controller, cfg);
    print_failures(controller, cfg);
    for (const auto &w : controller.warnings())
        std::cout << fmt::format("WARNING [{}] {}: {}\n", w.when, w.nodeid, w.warning.message);
    std::cout << controller.state().format_summary(true, &controller.time_stats(),
                                                   cfg.display.std_symbols)
              << '\n';
    if (outcome.interrupted > 0)
        std::cout << fmt::format("{} test(s) interrupted\n", outcome.interrupted);
    if (outcome.error)
        std::cerr << "Error: " << outcome.error->what() << '\n';
    std::cout.flush();

    return exit_code_for(controller, outcome);
}
