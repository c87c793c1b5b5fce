/*******************************************************************************
 * @file node_id.cpp
 * @brief Node id parsing into path and name components.
 ******************************************************************************/

#include "pipe/node_id.hpp"

namespace testpipe::pipe
{

namespace fs = std::filesystem;

NodeID::NodeID(std::string value, fs::path rootpath)
    : m_value(std::move(value)), m_rootpath(std::move(rootpath))
{
}

NodeID::Components NodeID::components() const
{
    Components out;
    const auto sep = m_value.find("::");
    const std::string path_name = m_value.substr(0, sep);
    const std::string cname = sep == std::string::npos ? std::string() : m_value.substr(sep + 2);

    fs::path path(path_name);
    if (!m_rootpath.empty() && path.is_absolute() == m_rootpath.is_absolute())
    {
        fs::path rel = path.lexically_relative(m_rootpath);
        if (!rel.empty() && *rel.begin() != "..")
            path = rel;
    }
    for (const auto &element : path)
    {
        const std::string part = element.string();
        if (!part.empty() && part != ".")
            out.path_parts.push_back(part);
    }

    std::size_t start = 0;
    for (;;)
    {
        const auto pos = cname.find("::", start);
        if (pos == std::string::npos)
        {
            out.name = cname.substr(start);
            break;
        }
        out.qual_parts.push_back(cname.substr(start, pos - start));
        start = pos + 2;
    }
    return out;
}

std::vector<std::string> NodeID::parts() const
{
    auto c = components();
    std::vector<std::string> out = std::move(c.path_parts);
    out.insert(out.end(), c.qual_parts.begin(), c.qual_parts.end());
    out.push_back(std::move(c.name));
    return out;
}

std::string NodeID::file_path() const
{
    const auto c = components();
    std::string out;
    for (const auto &p : c.path_parts)
    {
        if (!out.empty() && out.back() != '/')
            out += '/';
        out += p;
    }
    return out;
}

std::string clean_nodeid(std::string_view reported_id)
{
    const auto at = reported_id.rfind('@');
    if (at == std::string_view::npos || at == 0)
        return std::string(reported_id);
    const std::string_view group = reported_id.substr(at + 1);
    if (!group.empty() && group.back() == ']')
        return std::string(reported_id);
    return std::string(reported_id.substr(0, at));
}

} // namespace testpipe::pipe
