#pragma once

#include "tp_base.hpp"

#include <chrono>
#include <string>

namespace testpipe::utils
{

// One queued log line. `level` is the integer value of Logger::Level.
struct LogMessage
{
    std::chrono::system_clock::time_point timestamp;
    uint64_t process_id;
    uint64_t thread_id;
    int level;
    fmt::memory_buffer body;
};

// Destination for formatted log lines. Only the Logger worker thread calls into a sink.
class Sink
{
  public:
    virtual ~Sink() = default;

    /// @throws std::system_error when the line could not be written.
    virtual void write(const LogMessage &msg) = 0;
    virtual void flush() = 0;
    virtual std::string description() const = 0;

    static const char *level_name(int lvl) noexcept;

    /**
     * @brief `[LOGGER] [LEVEL ] [time] [exe PID:n TID:n] body\n`
     * @details The executable name tells the front end's lines from the engine's
     *          when both processes append to the same file.
     */
    static std::string format_logmsg(const LogMessage &msg);
};

} // namespace testpipe::utils
