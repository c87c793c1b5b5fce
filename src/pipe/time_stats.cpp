/*******************************************************************************
 * @file time_stats.cpp
 * @brief Named wall-clock timers for the phases of a run.
 ******************************************************************************/

#include "pipe/time_stats.hpp"

namespace testpipe::pipe
{

TimeStatsCollector::Timer *TimeStatsCollector::find(std::string_view name)
{
    for (auto &t : m_timers)
    {
        if (t.name == name)
            return &t;
    }
    return nullptr;
}

const TimeStatsCollector::Timer *TimeStatsCollector::find(std::string_view name) const
{
    for (const auto &t : m_timers)
    {
        if (t.name == name)
            return &t;
    }
    return nullptr;
}

void TimeStatsCollector::start(std::string_view name)
{
    if (auto *t = find(name))
    {
        t->start = clock::now();
        t->stop.reset();
        return;
    }
    m_timers.push_back(Timer{std::string(name), clock::now(), std::nullopt});
}

void TimeStatsCollector::stop(std::string_view name)
{
    if (auto *t = find(name); t && !t->stop)
        t->stop = clock::now();
}

void TimeStatsCollector::stop_all()
{
    const auto now = clock::now();
    for (auto &t : m_timers)
    {
        if (!t.stop)
            t.stop = now;
    }
}

bool TimeStatsCollector::running(std::string_view name) const
{
    const auto *t = find(name);
    return t && !t->stop;
}

std::vector<std::pair<std::string, double>> TimeStatsCollector::entries() const
{
    std::vector<std::pair<std::string, double>> out;
    for (const auto &t : m_timers)
    {
        if (t.stop)
        {
            out.emplace_back(t.name,
                             std::chrono::duration<double>(*t.stop - t.start).count());
        }
    }
    return out;
}

} // namespace testpipe::pipe
