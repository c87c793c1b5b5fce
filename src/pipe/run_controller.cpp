/*******************************************************************************
 * @file run_controller.cpp
 * @brief One engine run: spawn, pump, state updates and final outcome.
 ******************************************************************************/

#include "pipe/run_controller.hpp"

#include "tp_service.hpp"

#include <algorithm>
#include <cstring>

namespace testpipe::pipe
{

const char *to_string(OutputChannel channel) noexcept
{
    switch (channel)
    {
    case OutputChannel::Passthrough:
        return "passthrough";
    case OutputChannel::Stdout:
        return "stdout";
    case OutputChannel::Stderr:
        return "stderr";
    case OutputChannel::Terminal:
        return "terminal";
    }
    return "unknown";
}

namespace
{

constexpr const char *kInitTimer = "Init phase";
constexpr const char *kCollectionTimer = "Collection";
constexpr const char *kExecutionTimer = "Execution";

std::string repeat_to(std::string_view unit, std::size_t cells)
{
    std::string out;
    if (unit.empty())
        return out;
    while (out.size() + unit.size() <= cells)
        out.append(unit);
    out.append(unit.substr(0, cells - out.size()));
    return out;
}

// A ruled line of @p width cells with an optional centred title.
std::string format_separator(std::string_view sep, const std::optional<std::string> &title,
                             std::size_t width)
{
    if (sep.empty())
        sep = "-";
    if (!title || title->empty())
        return repeat_to(sep, width);
    const std::size_t used = title->size() + 2;
    const std::size_t fill = width > used ? width - used : 2;
    const std::string side = repeat_to(sep, std::max<std::size_t>(fill / 2, 1));
    std::string line = fmt::format("{} {} {}", side, *title, side);
    if (line.size() < width)
        line += repeat_to(sep, width - line.size());
    return line;
}

} // namespace

// ── StateUpdater ──────────────────────────────────────────────────────────────

/// The controller's own handler: keeps TestState, timers and the run sets current.
class RunController::StateUpdater : public MessageHandler
{
  public:
    explicit StateUpdater(RunController &owner) : m_rc(owner) {}

    MessageKindSet handled_kinds() const override { return all_kinds(); }

    void on_init(const ConfigRepr &config) override
    {
        LOGGER_INFO("Engine configured: rootpath '{}'", config.rootpath);
    }

    void on_session_start(const SessionRepr &) override
    {
        m_rc.m_time_stats.clear();
        m_rc.m_time_stats.start(kInitTimer);
        m_rc.m_session_ended = false;
        m_rc.m_session_exitstatus.reset();
    }

    void on_session_end(int64_t exitstatus) override
    {
        m_rc.m_time_stats.stop(kExecutionTimer);
        m_rc.m_session_ended = true;
        m_rc.m_session_exitstatus = exitstatus;
        LOGGER_INFO("Session ended with status {}", exitstatus);
    }

    void on_collection_start() override
    {
        m_rc.m_time_stats.stop(kInitTimer);
        m_rc.m_time_stats.start(kCollectionTimer);
        m_rc.m_state->prepare_for_test_collection();
    }

    void on_collect_report(const CollectReportRepr &report) override
    {
        const auto flags = m_rc.m_state->add_collected(report);
        if (flags.failed)
            LOGGER_WARN("Collection failed for '{}'", report.nodeid.str());
        if (flags.added || flags.failed)
            m_rc.update_collection_progress(false);
    }

    void on_deselect_tests(const std::vector<NodeRepr> &items) override
    {
        m_rc.m_state->deselect_tests(items);
        m_rc.update_collection_progress(false);
    }

    void on_collection_finish() override
    {
        m_rc.m_time_stats.stop(kCollectionTimer);
        m_rc.update_collection_progress(true);
    }

    void on_start_run_phase() override
    {
        m_rc.m_time_stats.stop(kCollectionTimer);
        m_rc.m_time_stats.start(kExecutionTimer);
        if (!m_rc.m_mapper)
        {
            m_rc.rebuild_mapper();
        }
    }

    void on_start_test(const NodeID &id) override
    {
        if (m_rc.m_state->start_test(id))
            m_rc.m_running.insert(id.str());
    }

    void on_test_report(const TestReportRepr &report) override
    {
        const auto *rec = m_rc.m_state->store_phase_report(report);
        if (rec && rec->finished() && rec->main_error_report())
            m_rc.m_failing.insert(rec->node_id().str());
    }

    void on_end_test(const NodeID &id) override
    {
        m_rc.m_state->end_test(id);
        m_rc.m_running.erase(id.str());
    }

    void on_write_sep(const std::string &sep, const std::optional<std::string> &title,
                      std::optional<int64_t> fullwidth) override
    {
        const auto width = fullwidth && *fullwidth > 0
                               ? static_cast<std::size_t>(*fullwidth)
                               : static_cast<std::size_t>(m_rc.m_ctx.config().display.width);
        m_rc.emit(OutputChannel::Terminal, format_separator(sep, title, width));
    }

    void on_write(const std::string &text) override { m_terminal.append(text); }
    void on_write_line(const std::string &line) override { m_terminal.append(line + "\n"); }
    void on_rewrite(const std::string &line) override
    {
        m_terminal.flush_partial();
        m_rc.emit(OutputChannel::Terminal, line);
    }
    void on_rich_write(const std::string &text) override { m_terminal.append(text); }
    void on_rich_write_line(const std::string &line) override { m_terminal.append(line + "\n"); }

    void on_internal_error() override
    {
        ++m_rc.m_internal_errors;
        LOGGER_ERROR("The engine reported an internal error");
    }

    void on_warning_recorded(const WarningRecord &record) override
    {
        m_rc.m_warnings.push_back(record);
    }

    void on_keyboard_interrupt() override
    {
        m_rc.m_keyboard_interrupt = true;
        LOGGER_WARN("The engine reported an interruption");
    }

    void on_copy_stdout(const std::string &text) override { m_rc.m_stdout_writer.append(text); }
    void on_copy_stderr(const std::string &text) override { m_rc.m_stderr_writer.append(text); }

    void bind_terminal()
    {
        m_terminal.set_sink([this](const std::string &line)
                            { m_rc.emit(OutputChannel::Terminal, line); });
    }

    void flush() { m_terminal.flush_partial(); }

  private:
    RunController &m_rc;
    BufferedWriter m_terminal;
};

// ── RunController ─────────────────────────────────────────────────────────────

RunController::RunController(RunContext &ctx)
    : m_ctx(ctx), m_state(std::make_shared<TestState>()), m_dispatcher(ctx.codec()),
      m_updater(std::make_shared<StateUpdater>(*this)),
      m_surface{ctx.config().display.width, ctx.config().display.height}
{
    m_updater->bind_terminal();
    m_stdout_writer.set_sink([this](const std::string &line)
                             { emit(OutputChannel::Stdout, line); });
    m_stderr_writer.set_sink([this](const std::string &line)
                             { emit(OutputChannel::Stderr, line); });
    m_dispatcher.add_handler(m_updater);
    m_dispatcher.set_passthrough([this](const std::string &line)
                                 { emit(OutputChannel::Passthrough, line); });
}

RunController::~RunController() = default;

void RunController::add_observer(std::shared_ptr<MessageHandler> observer)
{
    m_dispatcher.add_handler(std::move(observer));
}

std::vector<std::string> RunController::build_command(const TestState::Selection &selection) const
{
    const auto &engine = m_ctx.config().engine;
    std::vector<std::string> cmd = engine.command;
    cmd.insert(cmd.end(), engine.extra_args.begin(), engine.extra_args.end());
    if (selection.empty())
        cmd.push_back(engine.test_dir);
    else
        cmd.insert(cmd.end(), selection.begin(), selection.end());
    return cmd;
}

void RunController::resize(int width, int height)
{
    m_surface = Surface{width, height};
    if (m_mapper)
        rebuild_mapper();
}

void RunController::rebuild_mapper()
{
    m_mapper = std::make_unique<ProgressMapper>(m_surface, *m_state);
    LOGGER_DEBUG("Progress layout for {}x{}: {} group(s)", m_surface.width, m_surface.height,
                 m_mapper->groups().size());
}

void RunController::prepare(const TestState::Selection &selection)
{
    m_state->prepare_for_run(selection);
    if (selection.empty())
        m_mapper.reset();
    else
        m_state->park_and_reset_stored_results(selection);

    m_running.clear();
    m_failing.clear();
    m_warnings.clear();
    m_collection_progress.clear();
    m_session_ended = false;
    m_session_exitstatus.reset();
    m_keyboard_interrupt = false;
    m_internal_errors = 0;
}

RunOutcome RunController::run(const TestState::Selection &selection)
{
    prepare(selection);
    const auto cmd = build_command(selection);
    LOGGER_INFO("Starting engine: {}", fmt::join(cmd, " "));

    auto spawned = ChildProcess::spawn(cmd);
    if (spawned.is_error())
    {
        RunOutcome outcome;
        ChildProcessError err(fmt::format("Cannot start engine '{}': {} ({})", cmd.front(),
                                          to_string(spawned.error()),
                                          std::strerror(spawned.error_code())),
                              -1, false);
        log_recoverable(err);
        outcome.error = std::move(err);
        return outcome;
    }
    ChildProcess child = std::move(spawned).content();
    return pump(child);
}

RunOutcome RunController::run_with_source(ByteSource &source,
                                          const TestState::Selection &selection)
{
    prepare(selection);
    return pump(source);
}

void RunController::request_stop()
{
    std::lock_guard<std::mutex> lock(m_stop_mutex);
    if (m_active_reconstructor)
        m_active_reconstructor->request_stop();
}

RunOutcome RunController::pump(ByteSource &source)
{
    const auto &pipe_cfg = m_ctx.config().pipe;
    StreamReconstructor reconstructor(
        StreamReconstructor::Options{pipe_cfg.read_chunk_size, pipe_cfg.read_poll,
                                     pipe_cfg.exit_grace});
    {
        std::lock_guard<std::mutex> lock(m_stop_mutex);
        m_active_reconstructor = &reconstructor;
    }

    const StreamEnd end = reconstructor.run(
        source, [this](const std::string &line) { m_dispatcher.process_line(line); });

    {
        std::lock_guard<std::mutex> lock(m_stop_mutex);
        m_active_reconstructor = nullptr;
    }
    return finalize(end);
}

RunOutcome RunController::finalize(const StreamEnd &end)
{
    m_updater->flush();
    m_stdout_writer.flush_partial();
    m_stderr_writer.flush_partial();
    m_time_stats.stop_all();

    RunOutcome outcome;
    outcome.exit_status = end.exit_status;
    outcome.session_ended = m_session_ended;
    outcome.session_exitstatus = m_session_exitstatus;

    if (end.abrupt || !m_session_ended)
    {
        outcome.interrupted = m_state->mark_interrupted();
        m_running.clear();
    }

    outcome.clean = !end.abrupt && m_session_ended;

    // The engine reports test failures through the session status; only an exit
    // status that disagrees with it, or a broken stream, is a process error.
    const bool status_expected =
        end.exit_status == 0 ||
        (m_session_exitstatus && end.exit_status == static_cast<int>(*m_session_exitstatus));
    if (end.abrupt || !m_session_ended || !status_expected)
    {
        std::string reason;
        if (end.abrupt)
            reason = "engine output closed abruptly";
        else if (!m_session_ended)
            reason = "engine exited before ending its session";
        else
            reason = "engine exited with an unexpected status";
        ChildProcessError err(fmt::format("{} (exit status {})", reason, end.exit_status),
                              end.exit_status, end.abrupt);
        log_recoverable(err);
        outcome.error = std::move(err);
    }
    return outcome;
}

void RunController::emit(OutputChannel channel, const std::string &line)
{
    if (m_output)
        m_output(channel, line);
}

void RunController::update_collection_progress(bool final)
{
    m_collection_progress = m_state->format_collection_progress(final);
    if (m_status)
        m_status(m_collection_progress);
}

} // namespace testpipe::pipe
