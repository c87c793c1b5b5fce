/*******************************************************************************
 * @file logger.hpp
 * @brief Asynchronous logger shared by the testpipe front end and the engines it runs.
 *
 * Callers format on their own thread and push the line onto a bounded queue; one
 * worker thread owns the active Sink and writes batches. Sink switches and flushes
 * travel through the same queue, so they take effect in order with the lines
 * around them, and the caller blocks until the worker has handled them.
 *
 * When the queue is full new lines are dropped and counted. The worker writes one
 * summary line per overflow episode. Control commands are refused only at twice
 * the limit.
 *
 * The LifecycleManager starts and stops the worker (`Logger::GetLifecycleModule()`).
 * Lines logged before start or after stop are dropped silently. Configuring the
 * logger before start panics.
 *
 * ```cpp
 * testpipe::utils::LifecycleGuard guard(
 *     testpipe::utils::MakeModDefList(testpipe::utils::Logger::GetLifecycleModule()));
 * testpipe::utils::Logger::instance().set_logfile("/tmp/testpipe.log");
 * LOGGER_INFO("collected {} tests", n);
 * ```
 ******************************************************************************/

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include "tp_base.hpp"

// Default initial reserve for fmt::memory_buffer used by Logger::log_fmt.
#ifndef LOGGER_FMT_BUFFER_RESERVE
#define LOGGER_FMT_BUFFER_RESERVE (1024u)
#endif

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace testpipe::utils
{

void do_logger_startup(const char *arg);
void do_logger_shutdown(const char *arg);

class TESTPIPE_UTILS_EXPORT Logger
{
  public:
    enum class Level : int
    {
        L_TRACE = 0,
        L_DEBUG = 1,
        L_INFO = 2,
        L_WARNING = 3,
        L_ERROR = 4,
        L_SYSTEM = 5,
    };

    static Logger &instance();

    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;

    ~Logger();

    /// Module definition for the LifecycleManager ("testpipe::utils::Logger").
    static ModuleDef GetLifecycleModule();
    /// True once the lifecycle has started the logger (stays true after shutdown).
    static bool lifecycle_initialized() noexcept;

    /// Accepts "trace", "debug", "info", "warning" or "warn", "error", "system".
    static std::optional<Level> level_from_string(std::string_view name) noexcept;

    /**
     * @brief Switches to a FileSink appending to @p utf8_path.
     * @return false when the file cannot be opened; the previous sink stays active.
     */
    bool set_logfile(const std::string &utf8_path);

    /// Blocks until every line queued before the call has reached the sink.
    void flush();

    /// Drains the queue and stops the worker. Idempotent.
    void shutdown();

    void set_level(Level lvl);
    Level level() const;

    void set_max_queue_size(size_t max_size);

    /// Controls the lines announcing a sink switch in the old and the new sink.
    void set_log_sink_messages_enabled(bool enabled);

    template <Level lvl, typename... Args>
    void log_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept;

    /// Runtime format string; a bad string logs "[FORMAT ERROR] ..." instead of throwing.
    template <typename... Args>
    void log_fmt_runtime(Level lvl, fmt::string_view fmt_str, Args &&...args) noexcept;

  private:
    Logger();

    struct Impl;
    std::unique_ptr<Impl> pImpl;

    friend void do_logger_startup(const char *arg);
    friend void do_logger_shutdown(const char *arg);

    void enqueue_log(Level lvl, fmt::memory_buffer &&body) noexcept;
    void enqueue_format_error(Level lvl, const char *what) noexcept;
    bool should_log(Level lvl) const noexcept;
};

// --- Compile-Time Log Level ---
#ifndef LOGGER_COMPILE_LEVEL
#define LOGGER_COMPILE_LEVEL 0 // 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error
#endif

template <Logger::Level lvl, typename... Args>
void Logger::log_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    if constexpr (static_cast<int>(lvl) >= LOGGER_COMPILE_LEVEL)
    {
        if (!should_log(lvl))
            return;
        try
        {
            fmt::memory_buffer mb;
            mb.reserve(LOGGER_FMT_BUFFER_RESERVE);
            fmt::format_to(std::back_inserter(mb), fmt_str, std::forward<Args>(args)...);
            enqueue_log(lvl, std::move(mb));
        }
        catch (const std::exception &ex)
        {
            enqueue_format_error(lvl, ex.what());
        }
    }
}

template <typename... Args>
void Logger::log_fmt_runtime(Level lvl, fmt::string_view fmt_str, Args &&...args) noexcept
{
    if (!should_log(lvl))
        return;
    try
    {
        fmt::memory_buffer mb;
        mb.reserve(LOGGER_FMT_BUFFER_RESERVE);
        fmt::format_to(std::back_inserter(mb), fmt::runtime(fmt_str), std::forward<Args>(args)...);
        enqueue_log(lvl, std::move(mb));
    }
    catch (const std::exception &ex)
    {
        enqueue_format_error(lvl, ex.what());
    }
}

} // namespace testpipe::utils

#if defined(_MSC_VER)
#pragma warning(pop)
#endif

#define TP_LOGGER_LOG(level, fmt, ...)                                                             \
    ::testpipe::utils::Logger::instance().log_fmt<::testpipe::utils::Logger::Level::level>(       \
        FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define TP_LOGGER_LOG_RT(level, fmt, ...)                                                          \
    ::testpipe::utils::Logger::instance().log_fmt_runtime(                                         \
        ::testpipe::utils::Logger::Level::level, fmt __VA_OPT__(, ) __VA_ARGS__)

#define LOGGER_TRACE(fmt, ...) TP_LOGGER_LOG(L_TRACE, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_DEBUG(fmt, ...) TP_LOGGER_LOG(L_DEBUG, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_INFO(fmt, ...) TP_LOGGER_LOG(L_INFO, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_WARN(fmt, ...) TP_LOGGER_LOG(L_WARNING, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_ERROR(fmt, ...) TP_LOGGER_LOG(L_ERROR, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_SYSTEM(fmt, ...) TP_LOGGER_LOG(L_SYSTEM, fmt __VA_OPT__(, ) __VA_ARGS__)

#define LOGGER_DEBUG_RT(fmt, ...) TP_LOGGER_LOG_RT(L_DEBUG, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_INFO_RT(fmt, ...) TP_LOGGER_LOG_RT(L_INFO, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_WARN_RT(fmt, ...) TP_LOGGER_LOG_RT(L_WARNING, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_ERROR_RT(fmt, ...) TP_LOGGER_LOG_RT(L_ERROR, fmt __VA_OPT__(, ) __VA_ARGS__)
