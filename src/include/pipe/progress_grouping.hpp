#pragma once

/*******************************************************************************
 * @file progress_grouping.hpp
 * @brief Lays the collected tests out as progress lines that fit a display surface.
 ******************************************************************************/

#include "pipe/test_state.hpp"

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace testpipe::pipe
{

/// Nominal display size in character cells.
struct Surface
{
    int width{80};
    int height{24};
};

struct ProgressGroup
{
    std::string name;                 ///< Unique; continuation chunks are "name[2]", "name[3]", ...
    std::string label;                ///< Shown beside the line; empty for continuation chunks.
    std::vector<std::string> members; ///< Node ids in collection order.
};

/**
 * @class ProgressMapper
 * @brief Maps every test to one progress line.
 *
 * Tests are grouped by file. A group longer than the line can hold is split into
 * chunks. If there are then more groups than the surface has rows for, the tests
 * are regrouped by parent directory instead. Groups are ordered by name, with the
 * chunks of one group kept together in order.
 */
class ProgressMapper
{
  public:
    static constexpr int kMinSlots = 30;     ///< A line always holds at least this many tests.
    static constexpr int kLabelChrome = 9;   ///< Cells taken by the percentage and spacing.
    static constexpr int kHeightChrome = 6;  ///< Rows reserved for headers and summary.
    static constexpr std::size_t kDefaultNameWidth = 10;

    ProgressMapper(Surface surface, const TestState &state);

    const std::vector<ProgressGroup> &groups() const noexcept { return m_groups; }
    bool grouped_by_directory() const noexcept { return m_by_directory; }

    /// Name of the group holding @p node_id, or nullptr when the test is unknown.
    const std::string *group_of(const std::string &node_id) const;
    /// Members of the group holding @p node_id; empty when the test is unknown.
    const std::vector<std::string> &members_of_group(const std::string &node_id) const;

    /// One indicator per member of @p group, in member order.
    static std::string render_indicators(const ProgressGroup &group, const TestState &state,
                                         bool std_symbols);

  private:
    using KeyFn = std::string (*)(const TestRecord &);

    void build(const TestState::RecordList &records, KeyFn key, int width);

    std::vector<ProgressGroup> m_groups;
    std::unordered_map<std::string, std::size_t> m_group_index; ///< node id -> index in m_groups
    bool m_by_directory{false};
};

} // namespace testpipe::pipe
