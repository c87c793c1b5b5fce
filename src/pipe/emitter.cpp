/*******************************************************************************
 * @file emitter.cpp
 * @brief Engine-side frame writer, stream redirection and collection thread.
 ******************************************************************************/

#include "pipe/emitter.hpp"

#include "tp_service.hpp"

#include <atomic>
#include <cerrno>
#include <condition_variable>
#include <cstdio>
#include <cstring>
#include <functional>
#include <future>
#include <iostream>
#include <mutex>
#include <set>
#include <streambuf>
#include <thread>
#include <tuple>
#include <variant>

#if defined(TESTPIPE_IS_POSIX)
#include <fcntl.h>
#include <unistd.h>
#endif

namespace testpipe::pipe
{

const char *to_string(Emitter::RunPhase phase) noexcept
{
    switch (phase)
    {
    case Emitter::RunPhase::Init:
        return "Init";
    case Emitter::RunPhase::Collecting:
        return "Collecting";
    case Emitter::RunPhase::Running:
        return "Running";
    case Emitter::RunPhase::Done:
        return "Done";
    }
    return "Unknown";
}

namespace
{

struct FrameCommand
{
    std::string line;
};
struct FlushCommand
{
    std::shared_ptr<std::promise<bool>> promise;
};
struct StopCommand
{
};

using Command = std::variant<FrameCommand, FlushCommand, StopCommand>;

void answer(const std::shared_ptr<std::promise<bool>> &p, bool value)
{
    if (!p)
        return;
    try
    {
        p->set_value(value);
    }
    catch (const std::future_error &)
    {
        // Already answered.
    }
}

using WarningKey = std::tuple<std::string, std::string, std::string, std::optional<std::string>,
                              std::optional<int64_t>, std::optional<std::string>>;

Value optional_value(const std::optional<std::string> &s)
{
    return s ? Value(*s) : Value();
}

Value optional_value(const std::optional<int64_t> &n)
{
    return n ? Value(*n) : Value();
}

} // namespace

// ── Stream buffer forwarding std::cout / std::cerr ────────────────────────────

/**
 * Buffers characters until a newline and forwards everything up to the last
 * newline as one frame. sync() forwards the remainder.
 */
class PipeStreamBuf : public std::streambuf
{
  public:
    using PutFn = std::function<void(MessageKind, const std::vector<Value> &)>;

    PipeStreamBuf(PutFn put, MessageKind kind) : m_put(std::move(put)), m_kind(kind) {}

  protected:
    int_type overflow(int_type ch) override
    {
        if (!traits_type::eq_int_type(ch, traits_type::eof()))
        {
            const char c = traits_type::to_char_type(ch);
            append(&c, 1);
        }
        return traits_type::not_eof(ch);
    }

    std::streamsize xsputn(const char *s, std::streamsize n) override
    {
        append(s, static_cast<std::size_t>(n));
        return n;
    }

    int sync() override
    {
        std::string rest;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            rest.swap(m_pending);
        }
        if (!rest.empty())
            m_put(m_kind, {Value(std::move(rest))});
        return 0;
    }

  private:
    void append(const char *s, std::size_t n)
    {
        std::string text;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_pending.append(s, n);
            const auto nl = m_pending.rfind('\n');
            if (nl == std::string::npos)
                return;
            text = m_pending.substr(0, nl + 1);
            m_pending.erase(0, nl + 1);
        }
        m_put(m_kind, {Value(std::move(text))});
    }

    PutFn m_put;
    MessageKind m_kind;
    std::mutex m_mutex;
    std::string m_pending;
};

// ── Impl ──────────────────────────────────────────────────────────────────────

struct Emitter::Impl
{
    explicit Impl(Options o) : opts(o) {}

    void put(MessageKind kind, const std::vector<Value> &args);
    void enqueue(Command &&cmd);
    void writer_loop();
    void write_line(const std::string &line);
    void open_pipe();
    void redirect_streams();
    void detach_streams();
    void restore_fds();
    void join_collection_thread_if_awaitable();
    void shutdown();

    Options opts;
    Codec codec;

    // Pipe and redirection.
    int pipe_fd{-1};
    int saved_stdout_fd{-1};
    int saved_stderr_fd{-1};
    bool redirected{false};
    std::streambuf *old_cout{nullptr};
    std::streambuf *old_cerr{nullptr};
    std::streambuf *old_clog{nullptr};
    std::unique_ptr<PipeStreamBuf> stdout_buf;
    std::unique_ptr<PipeStreamBuf> stderr_buf;

    // Writer queue.
    std::thread writer;
    std::mutex queue_mutex;
    std::condition_variable cv;
    std::vector<Command> queue;
    bool stop_enqueued{false};
    std::atomic<bool> write_failed{false};
    std::atomic<std::size_t> frames_dropped{0};
    std::atomic<bool> shut_down{false};

    // Hook state.
    std::mutex state_mutex;
    std::atomic<RunPhase> phase{RunPhase::Init};
    std::atomic<bool> collection_active{false};
    bool run_phase_started{false};
    std::thread collection_thread;
    bool collection_thread_awaitable{false};
    std::set<WarningKey> seen_warnings;
};

void Emitter::Impl::put(MessageKind kind, const std::vector<Value> &args)
{
    std::vector<std::string> encoded;
    encoded.reserve(args.size());
    for (const auto &a : args)
        encoded.push_back(codec.encode(a));
    enqueue(FrameCommand{format_frame(kind, encoded)});
}

void Emitter::Impl::enqueue(Command &&cmd)
{
    {
        std::lock_guard<std::mutex> lock(queue_mutex);
        if (stop_enqueued)
        {
            if (auto *f = std::get_if<FlushCommand>(&cmd))
                answer(f->promise, false);
            else if (std::holds_alternative<FrameCommand>(cmd))
                frames_dropped.fetch_add(1, std::memory_order_relaxed);
            return;
        }
        if (std::holds_alternative<StopCommand>(cmd))
            stop_enqueued = true;
        queue.emplace_back(std::move(cmd));
    }
    cv.notify_one();
}

void Emitter::Impl::writer_loop()
{
    std::vector<Command> local;
    for (;;)
    {
        {
            std::unique_lock<std::mutex> lock(queue_mutex);
            cv.wait(lock, [this] { return !queue.empty(); });
            local.swap(queue);
        }

        bool stop = false;
        for (auto &cmd : local)
        {
            if (stop)
            {
                if (auto *f = std::get_if<FlushCommand>(&cmd))
                    answer(f->promise, false);
                continue;
            }
            if (auto *frame = std::get_if<FrameCommand>(&cmd))
                write_line(frame->line);
            else if (auto *f = std::get_if<FlushCommand>(&cmd))
                answer(f->promise, !write_failed.load(std::memory_order_relaxed));
            else
                stop = true;
        }
        local.clear();
        if (stop)
            return;
    }
}

void Emitter::Impl::write_line(const std::string &line)
{
    if (write_failed.load(std::memory_order_relaxed))
    {
        frames_dropped.fetch_add(1, std::memory_order_relaxed);
        return;
    }
#if defined(TESTPIPE_IS_POSIX)
    std::string data = line;
    data.push_back('\n');
    const char *p = data.data();
    std::size_t left = data.size();
    while (left > 0)
    {
        const ssize_t n = ::write(pipe_fd, p, left);
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            const int err = errno;
            write_failed.store(true, std::memory_order_relaxed);
            frames_dropped.fetch_add(1, std::memory_order_relaxed);
            LOGGER_ERROR("Pipe write failed ({}); further frames are dropped",
                         std::strerror(err));
            return;
        }
        p += n;
        left -= static_cast<std::size_t>(n);
    }
#else
    frames_dropped.fetch_add(1, std::memory_order_relaxed);
#endif
}

void Emitter::Impl::open_pipe()
{
#if defined(TESTPIPE_IS_POSIX)
    const int source_fd = opts.output_fd >= 0 ? opts.output_fd : STDOUT_FILENO;
    std::fflush(stdout);
    pipe_fd = ::dup(source_fd);
    if (pipe_fd < 0)
    {
        throw std::runtime_error(
            fmt::format("Emitter: cannot duplicate fd {}: {}", source_fd, std::strerror(errno)));
    }
    ::fcntl(pipe_fd, F_SETFD, FD_CLOEXEC);
#else
    throw std::runtime_error("Emitter: the pipe needs a POSIX platform");
#endif
}

void Emitter::Impl::redirect_streams()
{
#if defined(TESTPIPE_IS_POSIX)
    std::cout.flush();
    std::cerr.flush();
    std::fflush(stdout);
    std::fflush(stderr);

    const int devnull = ::open("/dev/null", O_WRONLY | O_CLOEXEC);
    if (devnull < 0)
    {
        LOGGER_WARN("Emitter: cannot open /dev/null ({}); standard streams left as they are",
                    std::strerror(errno));
        return;
    }
    saved_stdout_fd = ::dup(STDOUT_FILENO);
    saved_stderr_fd = ::dup(STDERR_FILENO);
    ::dup2(devnull, STDOUT_FILENO);
    ::dup2(devnull, STDERR_FILENO);
    ::close(devnull);
#endif

    auto put_fn = [this](MessageKind kind, const std::vector<Value> &args) { put(kind, args); };
    stdout_buf = std::make_unique<PipeStreamBuf>(put_fn, MessageKind::CopyStdout);
    stderr_buf = std::make_unique<PipeStreamBuf>(put_fn, MessageKind::CopyStderr);
    old_cout = std::cout.rdbuf(stdout_buf.get());
    old_cerr = std::cerr.rdbuf(stderr_buf.get());
    old_clog = std::clog.rdbuf(stderr_buf.get());
    redirected = true;
}

void Emitter::Impl::detach_streams()
{
    if (!redirected)
        return;
    stdout_buf->pubsync();
    stderr_buf->pubsync();
    std::cout.rdbuf(old_cout);
    std::cerr.rdbuf(old_cerr);
    std::clog.rdbuf(old_clog);
}

void Emitter::Impl::restore_fds()
{
#if defined(TESTPIPE_IS_POSIX)
    if (saved_stdout_fd >= 0)
    {
        ::dup2(saved_stdout_fd, STDOUT_FILENO);
        ::close(saved_stdout_fd);
        saved_stdout_fd = -1;
    }
    if (saved_stderr_fd >= 0)
    {
        ::dup2(saved_stderr_fd, STDERR_FILENO);
        ::close(saved_stderr_fd);
        saved_stderr_fd = -1;
    }
    if (pipe_fd >= 0)
    {
        ::close(pipe_fd);
        pipe_fd = -1;
    }
#endif
    redirected = false;
}

void Emitter::Impl::join_collection_thread_if_awaitable()
{
    std::thread t;
    {
        std::lock_guard<std::mutex> lock(state_mutex);
        if (!collection_thread_awaitable)
            return;
        t = std::move(collection_thread);
        collection_thread_awaitable = false;
    }
    if (t.joinable())
    {
        t.join();
        LOGGER_DEBUG("Collection thread joined");
    }
}

void Emitter::Impl::shutdown()
{
    if (shut_down.exchange(true))
        return;

    // Leftover stream text must be queued before the stop command.
    detach_streams();

    enqueue(StopCommand{});
    if (writer.joinable())
        writer.join();

    restore_fds();

    {
        std::thread t;
        {
            std::lock_guard<std::mutex> lock(state_mutex);
            t = std::move(collection_thread);
        }
        if (t.joinable())
        {
            LOGGER_WARN("Emitter shut down while the collection thread was running; joining");
            t.join();
        }
    }

    const auto dropped = frames_dropped.load();
    if (dropped > 0)
        LOGGER_WARN("Emitter dropped {} frame(s)", dropped);
}

// ── Public API ────────────────────────────────────────────────────────────────

Emitter::Emitter() : Emitter(Options{}) {}

Emitter::Emitter(Options opts) : pImpl(std::make_unique<Impl>(opts)) {}

Emitter::~Emitter()
{
    if (pImpl)
        pImpl->shutdown();
}

void Emitter::start(const engine::Config &config)
{
    pImpl->open_pipe();
    pImpl->writer = std::thread(&Impl::writer_loop, pImpl.get());
    if (pImpl->opts.redirect_streams)
        pImpl->redirect_streams();
    LOGGER_DEBUG("Emitter started for rootpath '{}'", config.rootpath.string());
    put(MessageKind::Init, {engine::represent(config)});
}

void Emitter::session_start(const engine::Session &session)
{
    put(MessageKind::SessionStart, {engine::represent(session)});
}

void Emitter::runtestloop()
{
    put(MessageKind::RunTestLoop);
}

void Emitter::session_finish(int exitstatus)
{
    pImpl->phase.store(RunPhase::Done);
    put(MessageKind::SessionEnd, {exitstatus});
    pImpl->join_collection_thread_if_awaitable();
}

void Emitter::unconfigure()
{
    put(MessageKind::Unconfigure);
    pImpl->join_collection_thread_if_awaitable();
    shutdown();
}

void Emitter::collection_start()
{
    std::lock_guard<std::mutex> lock(pImpl->state_mutex);
    put(MessageKind::CollectionStart);
    pImpl->collection_active.store(true);
    pImpl->phase.store(RunPhase::Collecting);
}

void Emitter::collect_report(const engine::CollectReport &report)
{
    if (!report.traceback)
    {
        LOGGER_DEBUG("Dropping duplicate collect report for '{}'", report.nodeid);
        return;
    }
    if (!pImpl->collection_active.load())
    {
        LOGGER_ERROR("Collect report for '{}' arrived outside collection; dropped",
                     report.nodeid);
        return;
    }
    put(MessageKind::CollectReport, {engine::represent(report)});
}

void Emitter::deselected(const std::vector<engine::Node> &items)
{
    Value::Sequence nodes;
    nodes.reserve(items.size());
    for (const auto &item : items)
        nodes.emplace_back(engine::represent(item));
    put(MessageKind::DeselectTests, {Value(std::move(nodes))});
}

void Emitter::collection_finish()
{
    std::lock_guard<std::mutex> lock(pImpl->state_mutex);
    const bool have_thread = pImpl->collection_thread.joinable();
    if (have_thread && std::this_thread::get_id() != pImpl->collection_thread.get_id())
    {
        LOGGER_DEBUG("Collection finish outside the collection thread; ignored");
        return;
    }
    put(MessageKind::CollectionFinish);
    pImpl->collection_active.store(false);
    if (have_thread)
        pImpl->collection_thread_awaitable = true;
}

void Emitter::start_collection_thread(std::function<void()> fn)
{
    pImpl->join_collection_thread_if_awaitable();
    std::lock_guard<std::mutex> lock(pImpl->state_mutex);
    if (pImpl->collection_thread.joinable())
    {
        LOGGER_WARN("A collection thread is already running; request ignored");
        return;
    }
    LOGGER_DEBUG("Starting collection thread");
    pImpl->collection_thread = std::thread(
        [fn = std::move(fn)]
        {
            try
            {
                fn();
            }
            catch (const std::exception &e)
            {
                LOGGER_ERROR("Collection thread failed: {}", e.what());
            }
        });
}

void Emitter::log_start(std::string_view nodeid)
{
    {
        std::lock_guard<std::mutex> lock(pImpl->state_mutex);
        if (!pImpl->run_phase_started && !pImpl->collection_active.load())
        {
            put(MessageKind::StartRunPhase);
            pImpl->run_phase_started = true;
            pImpl->phase.store(RunPhase::Running);
        }
        put(MessageKind::StartTest, {clean_nodeid(nodeid)});
    }
    pImpl->join_collection_thread_if_awaitable();
}

void Emitter::log_report(const engine::TestReport &report)
{
    TestReportRepr repr = engine::represent(report);
    repr.nodeid = NodeID(clean_nodeid(report.nodeid));
    put(MessageKind::TestReport, {std::move(repr)});
}

void Emitter::log_finish(std::string_view nodeid)
{
    put(MessageKind::EndTest, {clean_nodeid(nodeid)});
}

void Emitter::write_sep(std::string_view sep, std::optional<std::string> title,
                        std::optional<int64_t> fullwidth)
{
    put(MessageKind::WriteSep,
        {std::string(sep), optional_value(title), optional_value(fullwidth)});
}

void Emitter::write(std::string_view text)
{
    put(MessageKind::Write, {std::string(text)});
}

void Emitter::write_line(std::string_view line)
{
    put(MessageKind::WriteLine, {std::string(line)});
}

void Emitter::rewrite(std::string_view line)
{
    put(MessageKind::Rewrite, {std::string(line)});
}

void Emitter::rich_write(std::string_view text)
{
    put(MessageKind::RichWrite, {std::string(text)});
}

void Emitter::rich_write_line(std::string_view line)
{
    put(MessageKind::RichWriteLine, {std::string(line)});
}

void Emitter::internal_error()
{
    put(MessageKind::InternalError);
}

void Emitter::warning_recorded(const engine::WarningMessage &warning, std::string_view when,
                               std::string_view nodeid, std::optional<std::string> filename,
                               std::optional<int64_t> line, std::optional<std::string> function)
{
    WarningKey key{warning.message, std::string(when), std::string(nodeid), filename, line,
                   function};
    {
        std::lock_guard<std::mutex> lock(pImpl->state_mutex);
        if (!pImpl->seen_warnings.insert(std::move(key)).second)
            return;
    }
    put(MessageKind::WarningRecorded,
        {engine::represent(warning), std::string(when), std::string(nodeid),
         optional_value(filename), optional_value(line), optional_value(function)});
}

void Emitter::keyboard_interrupt()
{
    put(MessageKind::KeyboardInterrupt);
}

void Emitter::put(MessageKind kind, const std::vector<Value> &args)
{
    pImpl->put(kind, args);
}

bool Emitter::flush()
{
    if (!pImpl->writer.joinable() || pImpl->shut_down.load())
        return false;
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    pImpl->enqueue(FlushCommand{promise});
    return future.get();
}

void Emitter::shutdown()
{
    pImpl->shutdown();
}

Emitter::RunPhase Emitter::phase() const noexcept
{
    return pImpl->phase.load();
}

bool Emitter::collection_active() const noexcept
{
    return pImpl->collection_active.load();
}

std::size_t Emitter::frames_dropped() const noexcept
{
    return pImpl->frames_dropped.load();
}

} // namespace testpipe::pipe
