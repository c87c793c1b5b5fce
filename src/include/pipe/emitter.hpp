#pragma once

/*******************************************************************************
 * @file emitter.hpp
 * @brief Producer side of the pipe: turns engine hook calls into frames.
 *
 * The Emitter runs inside the engine process. Every hook encodes its arguments on
 * the calling thread and enqueues one frame; a single writer thread drains the
 * queue in batches and writes the lines to the pipe, so hooks never block on the
 * reader and frames never interleave.
 *
 * With stream redirection enabled (the default) the pipe is a duplicate of the
 * original stdout, fds 1 and 2 are pointed at the null device, and std::cout,
 * std::cerr and std::clog are replaced by stream buffers that forward whatever
 * is written to them as copy_stdout / copy_stderr frames.
 *
 * Phases are inferred from hook order:
 *
 *     Init ──collection_start──▶ Collecting ──first log_start──▶ Running
 *                                                                  │
 *     Done ◀────────────────────────session_finish─────────────────┘
 *
 * Thread safety: hooks may be called from any thread. The collection hooks of a
 * parallel collection run on the thread started by start_collection_thread().
 ******************************************************************************/

#include "pipe/codec.hpp"
#include "pipe/engine_types.hpp"
#include "pipe/message.hpp"
#include "pipe/value.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace testpipe::pipe
{

class Emitter
{
  public:
    enum class RunPhase
    {
        Init,
        Collecting,
        Running,
        Done,
    };

    struct Options
    {
        /// Replace fds 1/2 and the standard C++ streams (see file comment).
        bool redirect_streams{true};
        /// Write frames to a duplicate of this fd instead of stdout. Negative means stdout.
        int output_fd{-1};
    };

    Emitter();
    explicit Emitter(Options opts);
    ~Emitter();

    Emitter(const Emitter &) = delete;
    Emitter &operator=(const Emitter &) = delete;

    // ── Session hooks ────────────────────────────────────────────────────────

    /// Starts the writer, redirects the standard streams and emits proto_init.
    /// @throws std::runtime_error when the pipe fd cannot be duplicated.
    void start(const engine::Config &config);
    void session_start(const engine::Session &session);
    void runtestloop();
    void session_finish(int exitstatus);
    /// Emits proto_unconfigure, joins the collection thread and shuts the writer down.
    void unconfigure();

    // ── Collection hooks ─────────────────────────────────────────────────────

    void collection_start();
    /// Drops duplicates (no traceback marker) and reports outside collection.
    void collect_report(const engine::CollectReport &report);
    void deselected(const std::vector<engine::Node> &items);
    void collection_finish();

    /**
     * @brief Runs @p fn on a dedicated collection thread.
     * @details collection_finish() called from that thread marks it joinable; the
     *          join happens at the next log_start, session_finish or unconfigure.
     */
    void start_collection_thread(std::function<void()> fn);

    // ── Run hooks ────────────────────────────────────────────────────────────

    void log_start(std::string_view nodeid);
    void log_report(const engine::TestReport &report);
    void log_finish(std::string_view nodeid);

    // ── Terminal output ──────────────────────────────────────────────────────

    void write_sep(std::string_view sep, std::optional<std::string> title = std::nullopt,
                   std::optional<int64_t> fullwidth = std::nullopt);
    void write(std::string_view text);
    void write_line(std::string_view line);
    void rewrite(std::string_view line);
    void rich_write(std::string_view text);
    void rich_write_line(std::string_view line);

    // ── Other hooks ──────────────────────────────────────────────────────────

    void internal_error();
    /// Emits each distinct (message, when, nodeid, filename, line, function) once.
    void warning_recorded(const engine::WarningMessage &warning, std::string_view when,
                          std::string_view nodeid, std::optional<std::string> filename = {},
                          std::optional<int64_t> line = {},
                          std::optional<std::string> function = {});
    void keyboard_interrupt();

    // ── Plumbing ─────────────────────────────────────────────────────────────

    /// Encodes @p args and enqueues one frame. Unrepresentable values become placeholders.
    void put(MessageKind kind, const std::vector<Value> &args = {});

    /// Blocks until every frame enqueued before the call has been written.
    bool flush();

    /// Writes everything still queued, stops the writer and restores the streams.
    /// Idempotent; also run by the destructor.
    void shutdown();

    RunPhase phase() const noexcept;
    bool collection_active() const noexcept;
    /// Frames dropped because the pipe could not be written.
    std::size_t frames_dropped() const noexcept;

  private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

const char *to_string(Emitter::RunPhase phase) noexcept;

} // namespace testpipe::pipe
