/*******************************************************************************
 * @file progress_grouping.cpp
 * @brief Grouping of collected tests into progress lines.
 ******************************************************************************/

#include "pipe/progress_grouping.hpp"

#include "tp_service.hpp"

#include <algorithm>
#include <map>
#include <regex>
#include <tuple>

namespace testpipe::pipe
{

namespace
{

std::string file_key(const TestRecord &rec)
{
    return rec.node_id().file_path();
}

std::string directory_key(const TestRecord &rec)
{
    auto parts = rec.node_id().components().path_parts;
    if (!parts.empty())
        parts.pop_back();
    if (parts.empty())
        return ".";
    return fmt::format("{}", fmt::join(parts, "/"));
}

// "name[3]" sorts as ("name", 3); a plain name as (name, 0).
std::tuple<std::string, long> sort_key(const std::string &name)
{
    static const std::regex suffix(R"((.*)\[(\d+)\]$)");
    std::smatch m;
    if (std::regex_match(name, m, suffix))
        return {m[1].str(), std::stol(m[2].str())};
    return {name, 0};
}

const std::vector<std::string> kNoMembers;

} // namespace

ProgressMapper::ProgressMapper(Surface surface, const TestState &state)
{
    const auto records = state.query_results();
    build(records, &file_key, surface.width);
    if (static_cast<int>(m_groups.size()) > surface.height - kHeightChrome)
    {
        LOGGER_DEBUG("{} file groups do not fit {} rows; grouping by directory", m_groups.size(),
                     surface.height);
        build(records, &directory_key, surface.width);
        m_by_directory = true;
    }
}

void ProgressMapper::build(const TestState::RecordList &records, KeyFn key, int width)
{
    m_groups.clear();
    m_group_index.clear();

    // Group in first-seen order.
    std::vector<ProgressGroup> raw;
    std::map<std::string, std::size_t> by_name;
    for (const auto *rec : records)
    {
        const std::string name = key(*rec);
        auto [it, inserted] = by_name.try_emplace(name, raw.size());
        if (inserted)
            raw.push_back(ProgressGroup{name, name, {}});
        raw[it->second].members.push_back(rec->node_id().str());
    }

    std::size_t name_width = 0;
    for (const auto &g : raw)
        name_width = std::max(name_width, g.name.size());
    if (raw.empty())
        name_width = kDefaultNameWidth;
    const auto slots = static_cast<std::size_t>(
        std::max(kMinSlots, width - static_cast<int>(name_width) - kLabelChrome));

    for (auto &g : raw)
    {
        if (g.members.size() <= slots)
        {
            m_groups.push_back(std::move(g));
            continue;
        }
        std::size_t chunk = 1;
        for (std::size_t pos = 0; pos < g.members.size(); pos += slots, ++chunk)
        {
            ProgressGroup part;
            part.name = chunk == 1 ? g.name : fmt::format("{}[{}]", g.name, chunk);
            part.label = chunk == 1 ? g.name : std::string();
            const auto end = std::min(g.members.size(), pos + slots);
            part.members.assign(g.members.begin() + static_cast<std::ptrdiff_t>(pos),
                                g.members.begin() + static_cast<std::ptrdiff_t>(end));
            m_groups.push_back(std::move(part));
        }
    }

    std::stable_sort(m_groups.begin(), m_groups.end(),
                     [](const ProgressGroup &a, const ProgressGroup &b)
                     { return sort_key(a.name) < sort_key(b.name); });

    for (std::size_t i = 0; i < m_groups.size(); ++i)
    {
        for (const auto &id : m_groups[i].members)
            m_group_index[id] = i;
    }
}

const std::string *ProgressMapper::group_of(const std::string &node_id) const
{
    auto it = m_group_index.find(node_id);
    return it == m_group_index.end() ? nullptr : &m_groups[it->second].name;
}

const std::vector<std::string> &ProgressMapper::members_of_group(const std::string &node_id) const
{
    auto it = m_group_index.find(node_id);
    return it == m_group_index.end() ? kNoMembers : m_groups[it->second].members;
}

std::string ProgressMapper::render_indicators(const ProgressGroup &group, const TestState &state,
                                              bool std_symbols)
{
    std::string out;
    for (const auto &id : group.members)
    {
        const auto *rec = state.lookup(id);
        out += rec ? indicator(rec->outcome(), std_symbols) : "?";
    }
    return out;
}

} // namespace testpipe::pipe
