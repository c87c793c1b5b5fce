#pragma once

/*******************************************************************************
 * @file run_controller.hpp
 * @brief Front-end orchestration of one engine run.
 *
 * RunController spawns the engine, pumps its output through the stream
 * reconstructor into the Dispatcher, and keeps the TestState up to date through
 * its own MessageHandler. Observers registered with add_observer() receive the
 * same decoded messages after the state has been updated.
 ******************************************************************************/

#include "pipe/buffered_writer.hpp"
#include "pipe/child_process.hpp"
#include "pipe/dispatcher.hpp"
#include "pipe/errors.hpp"
#include "pipe/progress_grouping.hpp"
#include "pipe/run_context.hpp"
#include "pipe/stream_reconstructor.hpp"
#include "pipe/test_state.hpp"
#include "pipe/time_stats.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace testpipe::pipe
{

enum class OutputChannel
{
    Passthrough, ///< Lines that were not frames.
    Stdout,      ///< copy_stdout text, reassembled into lines.
    Stderr,      ///< copy_stderr text, reassembled into lines.
    Terminal,    ///< write / write_line / rewrite / write_sep from the engine's reporter.
};

const char *to_string(OutputChannel channel) noexcept;

struct RunOutcome
{
    int exit_status{-1};
    /// The stream closed normally and the engine finished its session.
    bool clean{false};
    bool session_ended{false};
    std::optional<int64_t> session_exitstatus;
    /// Unfinished records tidied up after an interruption.
    std::size_t interrupted{0};
    std::optional<ChildProcessError> error;
};

class RunController
{
  public:
    using OutputFn = std::function<void(OutputChannel, const std::string &)>;
    using StatusFn = std::function<void(const std::string &)>;

    explicit RunController(RunContext &ctx);
    ~RunController();

    RunController(const RunController &) = delete;
    RunController &operator=(const RunController &) = delete;

    void add_observer(std::shared_ptr<MessageHandler> observer);
    /// Receives engine output line by line.
    void set_output(OutputFn fn) { m_output = std::move(fn); }
    /// Receives collection progress text as it changes.
    void set_status(StatusFn fn) { m_status = std::move(fn); }

    /// engine.command + extra_args + (the selected ids, or the test directory).
    std::vector<std::string> build_command(const TestState::Selection &selection) const;

    /**
     * @brief Runs the engine once and returns when its output has ended.
     * @details An empty selection runs everything and forgets earlier results; a
     *          subset re-runs only those tests and parks the rest.
     */
    RunOutcome run(const TestState::Selection &selection = {});

    /// Same as run() but reads from an already started source.
    RunOutcome run_with_source(ByteSource &source, const TestState::Selection &selection = {});

    /**
     * @brief Changes the surface the progress layout is computed for.
     * @details An existing layout is rebuilt at once; otherwise the new size is used
     *          when the next run phase starts. Not thread-safe; call between runs or
     *          from the thread that drives run().
     */
    void resize(int width, int height);

    /// Thread-safe; terminates the engine of the current run.
    void request_stop();

    const TestState &state() const noexcept { return *m_state; }
    std::shared_ptr<const TestState> shared_state() const noexcept { return m_state; }
    const TimeStatsCollector &time_stats() const noexcept { return m_time_stats; }
    const ProgressMapper *progress_mapper() const noexcept { return m_mapper.get(); }
    const Dispatcher &dispatcher() const noexcept { return m_dispatcher; }

    const std::set<std::string> &running_tests() const noexcept { return m_running; }
    const std::set<std::string> &failing_tests() const noexcept { return m_failing; }
    const std::vector<WarningRecord> &warnings() const noexcept { return m_warnings; }
    const std::string &collection_progress() const noexcept { return m_collection_progress; }
    bool interrupted() const noexcept { return m_keyboard_interrupt; }
    std::size_t internal_errors() const noexcept { return m_internal_errors; }

  private:
    class StateUpdater;
    friend class StateUpdater;

    void prepare(const TestState::Selection &selection);
    RunOutcome pump(ByteSource &source);
    RunOutcome finalize(const StreamEnd &end);
    void emit(OutputChannel channel, const std::string &line);
    void update_collection_progress(bool final);
    void rebuild_mapper();

    RunContext &m_ctx;
    std::shared_ptr<TestState> m_state;
    Dispatcher m_dispatcher;
    std::shared_ptr<StateUpdater> m_updater;
    TimeStatsCollector m_time_stats;
    Surface m_surface;
    std::unique_ptr<ProgressMapper> m_mapper;
    BufferedWriter m_stdout_writer;
    BufferedWriter m_stderr_writer;
    OutputFn m_output;
    StatusFn m_status;

    std::mutex m_stop_mutex;
    StreamReconstructor *m_active_reconstructor{nullptr};

    std::set<std::string> m_running;
    std::set<std::string> m_failing;
    std::vector<WarningRecord> m_warnings;
    std::string m_collection_progress;
    bool m_session_ended{false};
    std::optional<int64_t> m_session_exitstatus;
    bool m_keyboard_interrupt{false};
    std::size_t m_internal_errors{0};
};

} // namespace testpipe::pipe
