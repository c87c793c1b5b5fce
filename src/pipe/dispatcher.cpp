/*******************************************************************************
 * @file dispatcher.cpp
 * @brief Frame decoding and routing to registered handlers.
 ******************************************************************************/

#include "pipe/dispatcher.hpp"

#include "tp_service.hpp"

namespace testpipe::pipe
{

namespace
{

/// Typed access to the decoded arguments of one frame.
class Args
{
  public:
    Args(std::string_view name, std::vector<Value> values)
        : m_name(name), m_values(std::move(values))
    {
    }

    template <typename R> R repr(std::size_t i) const
    {
        if (const auto *r = at(i).as<R>())
            return *r;
        fail(i, "a representation of the expected kind");
    }

    std::string text(std::size_t i) const
    {
        if (const auto *s = at(i).get_if<std::string>())
            return *s;
        fail(i, "a string");
    }

    int64_t integer(std::size_t i) const
    {
        if (const auto *n = at(i).get_if<int64_t>())
            return *n;
        fail(i, "an integer");
    }

    std::optional<std::string> optional_text(std::size_t i) const
    {
        if (i >= m_values.size() || m_values[i].is_none())
            return std::nullopt;
        return text(i);
    }

    std::optional<int64_t> optional_integer(std::size_t i) const
    {
        if (i >= m_values.size() || m_values[i].is_none())
            return std::nullopt;
        return integer(i);
    }

    std::vector<NodeRepr> nodes(std::size_t i) const
    {
        const auto *seq = at(i).get_if<Value::Sequence>();
        if (!seq)
            fail(i, "a sequence of nodes");
        std::vector<NodeRepr> out;
        out.reserve(seq->size());
        for (const auto &v : *seq)
        {
            const auto *node = v.as<NodeRepr>();
            if (!node)
                fail(i, "a sequence of nodes");
            out.push_back(*node);
        }
        return out;
    }

  private:
    const Value &at(std::size_t i) const
    {
        if (i >= m_values.size())
            fail(i, "an argument");
        return m_values[i];
    }

    [[noreturn]] void fail(std::size_t i, const char *what) const
    {
        throw DecodeError(fmt::format("'{}' argument {} is not {}", m_name, i, what), 0, {}, {});
    }

    std::string_view m_name;
    std::vector<Value> m_values;
};

} // namespace

Dispatcher::Dispatcher(Codec &codec) : m_codec(codec) {}

Dispatcher::~Dispatcher()
{
    if (!m_held.empty())
    {
        LOGGER_WARN("{} per-test message(s) never saw the start of the run phase",
                    m_held.size());
    }
}

void Dispatcher::add_handler(std::shared_ptr<MessageHandler> handler)
{
    if (!handler)
        return;
    const MessageKindSet kinds = handler->handled_kinds();
    for (std::size_t k = 0; k < kMessageKindCount; ++k)
    {
        if (kinds.test(k))
            m_table[k].push_back(handler);
    }
}

void Dispatcher::set_passthrough(PassthroughFn fn)
{
    m_passthrough = std::move(fn);
}

void Dispatcher::process_line(const std::string &line)
{
    auto frame = parse_frame(line);
    if (!frame)
    {
        if (m_passthrough)
            m_passthrough(line);
        return;
    }

    const auto kind = message_kind_from_name(frame->name);
    if (!kind)
    {
        ++m_frames_skipped;
        if (m_unknown_names.insert(frame->name).second)
            log_recoverable(ProtocolViolation(frame->name));
        return;
    }

    // Run-phase bookkeeping happens whether or not anybody listens.
    if (*kind == MessageKind::SessionStart)
    {
        if (!m_held.empty())
        {
            LOGGER_WARN("New session: discarding {} held-back per-test message(s)",
                        m_held.size());
            m_held.clear();
        }
        m_run_phase_confirmed = false;
    }
    else if (*kind == MessageKind::CollectionStart)
    {
        m_run_phase_confirmed = false;
    }

    const auto &handlers = m_table[static_cast<std::size_t>(*kind)];
    if (handlers.empty() && *kind != MessageKind::StartRunPhase)
    {
        if (m_unhandled_names.insert(frame->name).second)
            LOGGER_INFO("No handler registered for '{}'; such messages are ignored", frame->name);
        return;
    }

    Invoker invoke;
    try
    {
        invoke = build_invoker(*kind, frame->args);
    }
    catch (const DecodeError &e)
    {
        ++m_frames_skipped;
        log_recoverable(e);
        LOGGER_WARN("Skipped frame: {}", line);
        return;
    }

    if (is_run_phase_message(*kind) && !m_run_phase_confirmed)
    {
        TP_DEBUG("Holding back '{}' until the run phase starts", frame->name);
        m_held.push_back(Pending{*kind, std::move(invoke), line});
        return;
    }

    deliver(*kind, invoke, line);

    if (*kind == MessageKind::StartRunPhase)
    {
        m_run_phase_confirmed = true;
        std::vector<Pending> held;
        held.swap(m_held);
        if (!held.empty())
            LOGGER_DEBUG("Replaying {} held-back per-test message(s)", held.size());
        for (const auto &p : held)
            deliver(p.kind, p.invoke, p.line);
    }
}

void Dispatcher::deliver(MessageKind kind, const Invoker &invoke, const std::string &line)
{
    ++m_frames_processed;
    for (const auto &handler : m_table[static_cast<std::size_t>(kind)])
    {
        try
        {
            invoke(*handler);
        }
        catch (const PipeError &e)
        {
            ++m_handler_failures;
            log_recoverable(e);
            LOGGER_ERROR("...while handling frame: {}", line);
        }
        catch (const std::exception &e)
        {
            ++m_handler_failures;
            LOGGER_ERROR("Handler failed: {} (frame: {})", e.what(), line);
        }
    }
}

Dispatcher::Invoker Dispatcher::build_invoker(MessageKind kind,
                                              const std::vector<std::string> &raw)
{
    std::vector<Value> values;
    values.reserve(raw.size());
    for (const auto &token : raw)
        values.push_back(m_codec.decode(token));
    const Args a(message_name(kind), std::move(values));

    switch (kind)
    {
    case MessageKind::Init:
        return [r = a.repr<ConfigRepr>(0)](MessageHandler &h) { h.on_init(r); };
    case MessageKind::SessionStart:
        return [r = a.repr<SessionRepr>(0)](MessageHandler &h) { h.on_session_start(r); };
    case MessageKind::RunTestLoop:
        return [](MessageHandler &h) { h.on_runtestloop(); };
    case MessageKind::SessionEnd:
        return [n = a.integer(0)](MessageHandler &h) { h.on_session_end(n); };
    case MessageKind::Unconfigure:
        return [](MessageHandler &h) { h.on_unconfigure(); };
    case MessageKind::CollectionStart:
        return [](MessageHandler &h) { h.on_collection_start(); };
    case MessageKind::CollectReport:
        return [r = a.repr<CollectReportRepr>(0)](MessageHandler &h) { h.on_collect_report(r); };
    case MessageKind::DeselectTests:
        return [n = a.nodes(0)](MessageHandler &h) { h.on_deselect_tests(n); };
    case MessageKind::CollectionFinish:
        return [](MessageHandler &h) { h.on_collection_finish(); };
    case MessageKind::StartRunPhase:
        return [](MessageHandler &h) { h.on_start_run_phase(); };
    case MessageKind::StartTest:
        return [id = m_codec.make_node_id(a.text(0))](MessageHandler &h) { h.on_start_test(id); };
    case MessageKind::TestReport:
        return [r = a.repr<TestReportRepr>(0)](MessageHandler &h) { h.on_test_report(r); };
    case MessageKind::EndTest:
        return [id = m_codec.make_node_id(a.text(0))](MessageHandler &h) { h.on_end_test(id); };
    case MessageKind::WriteSep:
        return [sep = a.text(0), title = a.optional_text(1),
                width = a.optional_integer(2)](MessageHandler &h)
        { h.on_write_sep(sep, title, width); };
    case MessageKind::Write:
        return [t = a.text(0)](MessageHandler &h) { h.on_write(t); };
    case MessageKind::WriteLine:
        return [t = a.text(0)](MessageHandler &h) { h.on_write_line(t); };
    case MessageKind::Rewrite:
        return [t = a.text(0)](MessageHandler &h) { h.on_rewrite(t); };
    case MessageKind::RichWrite:
        return [t = a.text(0)](MessageHandler &h) { h.on_rich_write(t); };
    case MessageKind::RichWriteLine:
        return [t = a.text(0)](MessageHandler &h) { h.on_rich_write_line(t); };
    case MessageKind::InternalError:
        return [](MessageHandler &h) { h.on_internal_error(); };
    case MessageKind::WarningRecorded:
    {
        WarningRecord rec{a.repr<WarningRepr>(0), a.text(1),          a.text(2),
                          a.optional_text(3),     a.optional_integer(4), a.optional_text(5)};
        return [rec = std::move(rec)](MessageHandler &h) { h.on_warning_recorded(rec); };
    }
    case MessageKind::KeyboardInterrupt:
        return [](MessageHandler &h) { h.on_keyboard_interrupt(); };
    case MessageKind::CopyStdout:
        return [t = a.text(0)](MessageHandler &h) { h.on_copy_stdout(t); };
    case MessageKind::CopyStderr:
        return [t = a.text(0)](MessageHandler &h) { h.on_copy_stderr(t); };
    }
    throw DecodeError(fmt::format("no decoder for kind {}", static_cast<std::size_t>(kind)), 0,
                      {}, {});
}

} // namespace testpipe::pipe
