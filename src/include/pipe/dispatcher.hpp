#pragma once

/*******************************************************************************
 * @file dispatcher.hpp
 * @brief Routes decoded frames to the handlers registered for their kind.
 ******************************************************************************/

#include "pipe/codec.hpp"
#include "pipe/message.hpp"
#include "pipe/representation.hpp"

#include <array>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace testpipe::pipe
{

/// The arguments of a proto_warning_recorded frame.
struct WarningRecord
{
    WarningRepr warning;
    std::string when; ///< "config", "collect" or "runtest".
    std::string nodeid;
    std::optional<std::string> filename;
    std::optional<int64_t> line;
    std::optional<std::string> function;
};

/**
 * @class MessageHandler
 * @brief Receives the messages of the kinds it declares in handled_kinds().
 *
 * Every method has an empty default so a handler only overrides what it needs.
 * A handler that throws is logged and skipped; delivery to the others continues.
 */
class MessageHandler
{
  public:
    virtual ~MessageHandler() = default;

    virtual MessageKindSet handled_kinds() const = 0;

    // ── Session ──────────────────────────────────────────────────────────────
    virtual void on_init(const ConfigRepr &) {}
    virtual void on_session_start(const SessionRepr &) {}
    virtual void on_runtestloop() {}
    virtual void on_session_end(int64_t /*exitstatus*/) {}
    virtual void on_unconfigure() {}

    // ── Collection ───────────────────────────────────────────────────────────
    virtual void on_collection_start() {}
    virtual void on_collect_report(const CollectReportRepr &) {}
    virtual void on_deselect_tests(const std::vector<NodeRepr> &) {}
    virtual void on_collection_finish() {}

    // ── Run ──────────────────────────────────────────────────────────────────
    virtual void on_start_run_phase() {}
    virtual void on_start_test(const NodeID &) {}
    virtual void on_test_report(const TestReportRepr &) {}
    virtual void on_end_test(const NodeID &) {}

    // ── Terminal output ──────────────────────────────────────────────────────
    virtual void on_write_sep(const std::string & /*sep*/,
                              const std::optional<std::string> & /*title*/,
                              std::optional<int64_t> /*fullwidth*/)
    {
    }
    virtual void on_write(const std::string &) {}
    virtual void on_write_line(const std::string &) {}
    virtual void on_rewrite(const std::string &) {}
    virtual void on_rich_write(const std::string &) {}
    virtual void on_rich_write_line(const std::string &) {}

    // ── Other ────────────────────────────────────────────────────────────────
    virtual void on_internal_error() {}
    virtual void on_warning_recorded(const WarningRecord &) {}
    virtual void on_keyboard_interrupt() {}
    virtual void on_copy_stdout(const std::string &) {}
    virtual void on_copy_stderr(const std::string &) {}
};

/**
 * @class Dispatcher
 * @brief Turns reconstructed lines into handler calls.
 *
 * Per-test messages (start, report, end) that arrive before the run phase is
 * confirmed by proto_start_run_phase are held back and replayed, in arrival
 * order, right after every handler has seen the start of the run phase. A new
 * session or a new collection clears the confirmation.
 *
 * Not thread-safe; lines are processed on the thread that pumps the stream.
 */
class Dispatcher
{
  public:
    using PassthroughFn = std::function<void(const std::string &)>;

    explicit Dispatcher(Codec &codec);
    ~Dispatcher();

    Dispatcher(const Dispatcher &) = delete;
    Dispatcher &operator=(const Dispatcher &) = delete;

    /// Handlers of the same kind are called in registration order.
    void add_handler(std::shared_ptr<MessageHandler> handler);

    /// Receives every line that is not a frame.
    void set_passthrough(PassthroughFn fn);

    /// Never throws for bad input; problems are logged and the frame is skipped.
    void process_line(const std::string &line);

    bool run_phase_confirmed() const noexcept { return m_run_phase_confirmed; }
    std::size_t held_back() const noexcept { return m_held.size(); }

    /// Known names that arrived with no handler registered (each logged once).
    const std::set<std::string> &unhandled_names() const noexcept { return m_unhandled_names; }
    /// Names outside the protocol (each logged once).
    const std::set<std::string> &unknown_names() const noexcept { return m_unknown_names; }

    std::size_t frames_processed() const noexcept { return m_frames_processed; }
    std::size_t frames_skipped() const noexcept { return m_frames_skipped; }
    std::size_t handler_failures() const noexcept { return m_handler_failures; }

  private:
    using Invoker = std::function<void(MessageHandler &)>;

    struct Pending
    {
        MessageKind kind;
        Invoker invoke;
        std::string line;
    };

    Invoker build_invoker(MessageKind kind, const std::vector<std::string> &args);
    void deliver(MessageKind kind, const Invoker &invoke, const std::string &line);

    Codec &m_codec;
    std::array<std::vector<std::shared_ptr<MessageHandler>>, kMessageKindCount> m_table;
    PassthroughFn m_passthrough;
    bool m_run_phase_confirmed{false};
    std::vector<Pending> m_held;
    std::set<std::string> m_unhandled_names;
    std::set<std::string> m_unknown_names;
    std::size_t m_frames_processed{0};
    std::size_t m_frames_skipped{0};
    std::size_t m_handler_failures{0};
};

} // namespace testpipe::pipe
