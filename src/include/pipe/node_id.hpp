#pragma once

/*******************************************************************************
 * @file node_id.hpp
 * @brief NodeID: the identifier of one test, with path-aware structure.
 ******************************************************************************/

#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace testpipe::pipe
{

/**
 * @class NodeID
 * @brief An engine node id such as `tests/test_x.py::TestA::test_b[1]`.
 *
 * Equality, ordering and hashing use the text only; the root path is carried so
 * the file part can be shown relative to the project root.
 */
class NodeID
{
  public:
    struct Components
    {
        std::vector<std::string> path_parts; ///< File path, relative to the root when under it.
        std::vector<std::string> qual_parts; ///< Qualifying names (classes), may be empty.
        std::string name;                    ///< Final part of the id.
    };

    NodeID() = default;
    explicit NodeID(std::string value, std::filesystem::path rootpath = {});

    const std::string &str() const noexcept { return m_value; }
    const std::filesystem::path &rootpath() const noexcept { return m_rootpath; }
    bool empty() const noexcept { return m_value.empty(); }

    Components components() const;
    /// path_parts + qual_parts + name.
    std::vector<std::string> parts() const;
    /// The path parts joined with '/'.
    std::string file_path() const;

    friend bool operator==(const NodeID &a, const NodeID &b) noexcept
    {
        return a.m_value == b.m_value;
    }
    friend bool operator<(const NodeID &a, const NodeID &b) noexcept
    {
        return a.m_value < b.m_value;
    }

  private:
    std::string m_value;
    std::filesystem::path m_rootpath;
};

/**
 * @brief Strips a trailing `@group` added by grouped parallel runs.
 * @details The text after the last '@' is kept when it ends with ']' because the
 *          '@' then belongs to a parametrization id.
 */
std::string clean_nodeid(std::string_view reported_id);

} // namespace testpipe::pipe

template <> struct std::hash<testpipe::pipe::NodeID>
{
    std::size_t operator()(const testpipe::pipe::NodeID &id) const noexcept
    {
        return std::hash<std::string>{}(id.str());
    }
};
