/*******************************************************************************
 * @file line_assembler.cpp
 * @brief Line reassembly from byte chunks.
 ******************************************************************************/

#include "pipe/line_assembler.hpp"

#include "utils/format_tools.hpp"

namespace testpipe::pipe
{

std::vector<std::string> LineAssembler::feed(std::string_view chunk)
{
    std::vector<std::string> lines;
    std::size_t start = 0;
    for (;;)
    {
        const auto nl = chunk.find('\n', start);
        if (nl == std::string_view::npos)
            break;
        m_partial.append(chunk.substr(start, nl - start));
        lines.emplace_back(format_tools::trim_trailing_whitespace(m_partial));
        m_partial.clear();
        start = nl + 1;
    }
    m_partial.append(chunk.substr(start));
    return lines;
}

std::optional<std::string> LineAssembler::finish()
{
    if (m_partial.empty())
        return std::nullopt;
    std::string last(format_tools::trim_trailing_whitespace(m_partial));
    m_partial.clear();
    return last;
}

} // namespace testpipe::pipe
