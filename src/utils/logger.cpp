/*******************************************************************************
 * @file logger.cpp
 * @brief Logger worker, command queue and lifecycle hooks.
 ******************************************************************************/

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <utility>
#include <variant>
#include <vector>

#include "utils/lifecycle.hpp"
#include "utils/logger.hpp"

#include "utils/logger_sinks/console_sink.hpp"
#include "utils/logger_sinks/file_sink.hpp"

using namespace testpipe::format_tools;

namespace testpipe::utils
{

enum class LoggerState
{
    Uninitialized,
    Running,
    Stopping,
    Stopped
};

static std::atomic<LoggerState> g_logger_state{LoggerState::Uninitialized};

// Panics when called before the lifecycle started the logger; false once it stopped.
static bool logger_accepts_control(const char *function_name)
{
    const auto state = g_logger_state.load(std::memory_order_acquire);
    if (state == LoggerState::Uninitialized)
    {
        TP_PANIC("{} called before the Logger lifecycle module was initialized", function_name);
    }
    return state == LoggerState::Running;
}

namespace
{

using Done = std::shared_ptr<std::promise<bool>>;

struct SwitchSink
{
    std::unique_ptr<Sink> sink;
    Done done;
};
struct Flush
{
    Done done;
};
struct AnnounceSinkSwitch
{
    bool enabled;
    Done done;
};

using Command = std::variant<LogMessage, SwitchSink, Flush, AnnounceSinkSwitch>;

void complete(const Done &done, bool value)
{
    if (!done)
        return;
    try
    {
        done->set_value(value);
    }
    catch (const std::future_error &)
    {
        // already answered
    }
}

LogMessage make_message(Logger::Level lvl, fmt::memory_buffer &&body)
{
    return LogMessage{.timestamp = std::chrono::system_clock::now(),
                      .process_id = platform::get_pid(),
                      .thread_id = platform::get_native_thread_id(),
                      .level = static_cast<int>(lvl),
                      .body = std::move(body)};
}

} // namespace

struct Logger::Impl
{
    ~Impl();

    bool push(Command &&cmd);
    bool call(Command &&cmd, std::future<bool> answer);
    void run();
    void stop();

    // Worker-side helpers; the worker is the only thread touching sink_.
    void write(const LogMessage &msg) noexcept;
    void write_internal(Level lvl, fmt::memory_buffer &&body) noexcept;
    void handle(SwitchSink &cmd);
    void drain_batch(std::vector<Command> &batch);

    std::unique_ptr<Sink> sink_ = std::make_unique<ConsoleSink>();
    bool announce_switches_ = true;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<Command> queue_;
    size_t max_queue_size_ = 10000;
    bool stop_requested_ = false;
    size_t dropped_ = 0;
    std::chrono::steady_clock::time_point dropping_since_;

    std::thread worker_;
    std::atomic<Level> level_{Level::L_INFO};
};

Logger::Impl::~Impl()
{
    if (worker_.joinable())
    {
        TP_DEBUG("Logger destroyed while its worker was running; the lifecycle never stopped it.");
        stop();
    }
}

bool Logger::Impl::push(Command &&cmd)
{
    const bool is_line = std::holds_alternative<LogMessage>(cmd);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const size_t limit = is_line ? max_queue_size_ : max_queue_size_ * 2;
        if (!stop_requested_ && queue_.size() < limit)
        {
            queue_.push_back(std::move(cmd));
            cv_.notify_one();
            return true;
        }
        if (!stop_requested_ && dropped_++ == 0)
            dropping_since_ = std::chrono::steady_clock::now();
    }
    std::visit(
        [](auto &refused)
        {
            if constexpr (!std::is_same_v<std::decay_t<decltype(refused)>, LogMessage>)
                complete(refused.done, false);
        },
        cmd);
    return false;
}

bool Logger::Impl::call(Command &&cmd, std::future<bool> answer)
{
    push(std::move(cmd));
    return answer.get();
}

void Logger::Impl::write(const LogMessage &msg) noexcept
{
    try
    {
        sink_->write(msg);
    }
    catch (const std::exception &e)
    {
        // The sink is the only channel we have; stderr is the last resort.
        fmt::print(stderr, "[LOGGER] {} failed: {}\n", sink_->description(), e.what());
    }
}

void Logger::Impl::write_internal(Level lvl, fmt::memory_buffer &&body) noexcept
{
    write(make_message(lvl, std::move(body)));
}

void Logger::Impl::handle(SwitchSink &cmd)
{
    const std::string from = sink_->description();
    if (announce_switches_)
    {
        write_internal(Level::L_SYSTEM,
                       make_buffer("Switching log sink to: {}", cmd.sink->description()));
        sink_->flush();
    }
    sink_ = std::move(cmd.sink);
    if (announce_switches_)
        write_internal(Level::L_SYSTEM, make_buffer("Log sink switched from: {}", from));
    complete(cmd.done, true);
}

void Logger::Impl::drain_batch(std::vector<Command> &batch)
{
    const int threshold = static_cast<int>(level_.load(std::memory_order_relaxed));
    for (auto &cmd : batch)
    {
        if (auto *msg = std::get_if<LogMessage>(&cmd))
        {
            if (msg->level >= threshold)
                write(*msg);
        }
        else if (auto *sw = std::get_if<SwitchSink>(&cmd))
        {
            handle(*sw);
        }
        else if (auto *fl = std::get_if<Flush>(&cmd))
        {
            sink_->flush();
            complete(fl->done, true);
        }
        else if (auto *an = std::get_if<AnnounceSinkSwitch>(&cmd))
        {
            announce_switches_ = an->enabled;
            complete(an->done, true);
        }
    }
    batch.clear();
}

void Logger::Impl::run()
{
    std::vector<Command> batch;
    for (;;)
    {
        size_t dropped = 0;
        double dropped_for_s = 0.0;
        bool stopping = false;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return !queue_.empty() || stop_requested_; });
            batch.swap(queue_);
            stopping = stop_requested_ && batch.empty();
            if (dropped_ > 0)
            {
                dropped = std::exchange(dropped_, 0);
                dropped_for_s = std::chrono::duration<double>(std::chrono::steady_clock::now() -
                                                              dropping_since_)
                                    .count();
            }
        }

        if (dropped > 0)
        {
            write_internal(Level::L_WARNING,
                           make_buffer("Log queue overflow: dropped {} line(s) over {:.2f}s",
                                       dropped, dropped_for_s));
        }
        drain_batch(batch);

        if (stopping)
        {
            write_internal(Level::L_SYSTEM, make_buffer("Logger is shutting down."));
            sink_->flush();
            return;
        }
    }
}

void Logger::Impl::stop()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_requested_)
            return;
        stop_requested_ = true;
    }
    cv_.notify_one();
    if (worker_.joinable())
        worker_.join();
}

Logger::Logger() : pImpl(std::make_unique<Impl>()) {}
Logger::~Logger() = default;

Logger &Logger::instance()
{
    static Logger instance;
    return instance;
}

bool Logger::lifecycle_initialized() noexcept
{
    return g_logger_state.load(std::memory_order_acquire) != LoggerState::Uninitialized;
}

std::optional<Logger::Level> Logger::level_from_string(std::string_view name) noexcept
{
    static constexpr std::pair<std::string_view, Level> kNames[] = {
        {"trace", Level::L_TRACE},   {"debug", Level::L_DEBUG}, {"info", Level::L_INFO},
        {"warning", Level::L_WARNING}, {"warn", Level::L_WARNING}, {"error", Level::L_ERROR},
        {"system", Level::L_SYSTEM}};
    for (const auto &[text, lvl] : kNames)
    {
        if (text == name)
            return lvl;
    }
    return std::nullopt;
}

bool Logger::set_logfile(const std::string &utf8_path)
{
    if (!logger_accepts_control("Logger::set_logfile"))
        return false;
    std::unique_ptr<Sink> sink;
    try
    {
        sink = std::make_unique<FileSink>(utf8_path);
    }
    catch (const std::runtime_error &e)
    {
        log_fmt<Level::L_ERROR>("{}", e.what());
        return false;
    }
    auto done = std::make_shared<std::promise<bool>>();
    auto answer = done->get_future();
    return pImpl->call(SwitchSink{std::move(sink), std::move(done)}, std::move(answer));
}

void Logger::flush()
{
    if (!logger_accepts_control("Logger::flush"))
        return;
    auto done = std::make_shared<std::promise<bool>>();
    auto answer = done->get_future();
    (void)pImpl->call(Flush{std::move(done)}, std::move(answer));
}

void Logger::shutdown()
{
    if (lifecycle_initialized())
        do_logger_shutdown(nullptr);
}

void Logger::set_level(Level lvl)
{
    if (logger_accepts_control("Logger::set_level"))
        pImpl->level_.store(lvl, std::memory_order_relaxed);
}

Logger::Level Logger::level() const
{
    return pImpl->level_.load(std::memory_order_relaxed);
}

void Logger::set_max_queue_size(size_t max_size)
{
    if (!logger_accepts_control("Logger::set_max_queue_size"))
        return;
    std::lock_guard<std::mutex> lock(pImpl->mutex_);
    pImpl->max_queue_size_ = std::max<size_t>(max_size, 1);
}

void Logger::set_log_sink_messages_enabled(bool enabled)
{
    if (!logger_accepts_control("Logger::set_log_sink_messages_enabled"))
        return;
    auto done = std::make_shared<std::promise<bool>>();
    auto answer = done->get_future();
    (void)pImpl->call(AnnounceSinkSwitch{enabled, std::move(done)}, std::move(answer));
}

bool Logger::should_log(Level lvl) const noexcept
{
    return g_logger_state.load(std::memory_order_acquire) == LoggerState::Running &&
           static_cast<int>(lvl) >= static_cast<int>(pImpl->level_.load(std::memory_order_relaxed));
}

void Logger::enqueue_log(Level lvl, fmt::memory_buffer &&body) noexcept
{
    try
    {
        pImpl->push(make_message(lvl, std::move(body)));
    }
    catch (const std::exception &)
    {
        // Out of memory while queueing; the line is lost.
    }
}

void Logger::enqueue_format_error(Level lvl, const char *what) noexcept
{
    try
    {
        enqueue_log(lvl, make_buffer("[FORMAT ERROR] {}", what));
    }
    catch (const std::exception &)
    {
        // Out of memory while reporting the format error.
    }
}

void do_logger_startup(const char *)
{
    auto &impl = *Logger::instance().pImpl;
    if (!impl.worker_.joinable())
        impl.worker_ = std::thread(&Logger::Impl::run, &impl);
    g_logger_state.store(LoggerState::Running, std::memory_order_release);
}

void do_logger_shutdown(const char *)
{
    LoggerState expected = LoggerState::Running;
    if (!g_logger_state.compare_exchange_strong(expected, LoggerState::Stopping,
                                                std::memory_order_acq_rel))
        return;
    Logger::instance().pImpl->stop();
    g_logger_state.store(LoggerState::Stopped, std::memory_order_release);
}

ModuleDef Logger::GetLifecycleModule()
{
    ModuleDef module("testpipe::utils::Logger");
    module.set_startup(&do_logger_startup);
    module.set_shutdown(&do_logger_shutdown, std::chrono::milliseconds(5000));
    return module;
}

} // namespace testpipe::utils
