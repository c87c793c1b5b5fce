#include "utils/logger_sinks/sink.hpp"

#include <iterator>

namespace testpipe::utils
{

const char *Sink::level_name(int lvl) noexcept
{
    static constexpr const char *kNames[] = {"TRACE", "DEBUG", "INFO", "WARN", "ERROR", "SYSTEM"};
    if (lvl < 0 || lvl >= static_cast<int>(std::size(kNames)))
        return "UNK";
    return kNames[lvl];
}

std::string Sink::format_logmsg(const LogMessage &msg)
{
    static const std::string exe_name = platform::get_executable_name();
    return fmt::format("[LOGGER] [{:<6}] [{}] [{} PID:{:5} TID:{:5}] {}\n", level_name(msg.level),
                       format_tools::formatted_time(msg.timestamp), exe_name, msg.process_id,
                       msg.thread_id, std::string_view(msg.body.data(), msg.body.size()));
}

} // namespace testpipe::utils
