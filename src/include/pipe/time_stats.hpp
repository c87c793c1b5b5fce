#pragma once

/*******************************************************************************
 * @file time_stats.hpp
 * @brief Named wall-clock timers for the phases of a run.
 ******************************************************************************/

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace testpipe::pipe
{

class TimeStatsCollector
{
  public:
    using clock = std::chrono::steady_clock;

    /// (Re)starts the timer @p name; a restarted timer keeps its original position.
    void start(std::string_view name);
    /// Stops a running timer; stopping an unknown or stopped timer does nothing.
    void stop(std::string_view name);
    /// Stops every running timer.
    void stop_all();

    bool running(std::string_view name) const;

    /// (name, seconds) for every stopped timer, in the order they were first started.
    std::vector<std::pair<std::string, double>> entries() const;

    void clear() { m_timers.clear(); }

  private:
    struct Timer
    {
        std::string name;
        clock::time_point start;
        std::optional<clock::time_point> stop;
    };

    Timer *find(std::string_view name);
    const Timer *find(std::string_view name) const;

    std::vector<Timer> m_timers;
};

} // namespace testpipe::pipe
